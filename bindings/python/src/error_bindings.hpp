#pragma once
// Error bindings: FormatErrorKind, InvalidAddressError, FormatError

#include <nanobind/nanobind.h>

#include <pcapstat/detail/capture_error.hpp>

#include <stdexcept>
#include <string>
#include <variant>

#include "py_types.hpp"

namespace nb = nanobind;

namespace pcapstat_python {

/**
 * @brief Raise the Python exception matching an analysis error
 */
[[noreturn]] inline void raise_analysis_error(const pcapstat::AnalysisError& error) {
    PyObject* type = pcapstat::is_invalid_address(error) ? invalid_address_error_type
                                                         : format_error_type;
    PyErr_SetString(type, pcapstat::describe(error).c_str());
    throw nb::python_error();
}

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // FormatErrorKind enum
    // =========================================================================

    using Kind = pcapstat::FormatError::Kind;
    nb::enum_<Kind>(m, "FormatErrorKind", "Defects detected in a capture container")
        .value("short_input", Kind::short_input, "Fewer than 4 bytes")
        .value("bad_magic", Kind::bad_magic, "Unknown file or byte-order magic")
        .value("unsupported_version", Kind::unsupported_version,
               "Container major version not understood")
        .value("truncated_header", Kind::truncated_header, "File/section header cut short")
        .value("truncated_record", Kind::truncated_record, "Record or block cut short")
        .value("invalid_record", Kind::invalid_record,
               "Record lengths contradict the file header")
        .value("malformed_block", Kind::malformed_block, "Inconsistent pcapng block")
        .def("__str__",
             [](Kind kind) { return std::string(pcapstat::FormatError{kind, 0}.message()); });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // Both inherit from ValueError: the caller passed bad input
    auto invalid_address =
        nb::exception<std::invalid_argument>(m, "InvalidAddressError", PyExc_ValueError);
    invalid_address_error_type = invalid_address.ptr();

    auto format_error = nb::exception<std::runtime_error>(m, "FormatError", PyExc_ValueError);
    format_error_type = format_error.ptr();
}

} // namespace pcapstat_python
