#pragma once
// Shared declarations for the pcapstat bindings

#include <nanobind/nanobind.h>

#include <span>

#include <cstdint>

namespace nb = nanobind;

namespace pcapstat_python {

// Exception type pointers (set during module init)
extern PyObject* invalid_address_error_type;
extern PyObject* format_error_type;

/**
 * @brief View the contents of a Python bytes object without copying
 */
inline std::span<const uint8_t> as_span(const nb::bytes& data) {
    return {reinterpret_cast<const uint8_t*>(data.c_str()), data.size()};
}

} // namespace pcapstat_python
