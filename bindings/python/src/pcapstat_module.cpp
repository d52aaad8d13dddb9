// PCAPSTAT Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "analysis_bindings.hpp"
#include "error_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace pcapstat_python {
PyObject* invalid_address_error_type = nullptr;
PyObject* format_error_type = nullptr;
} // namespace pcapstat_python

NB_MODULE(pcapstat, m) {
    m.doc() = "pcapstat - per-target traffic counters for pcap/pcapng captures";

    // 1. Error types (sets the exception pointers used by the analysis bindings)
    pcapstat_python::bind_errors(m);

    // 2. analyze, detect_format, top_peers
    pcapstat_python::bind_analysis(m);
}
