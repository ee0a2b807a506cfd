// UNIXTS Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "error_bindings.hpp"
#include "timestamp_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointer (declared extern in py_types.hpp)
namespace unixts_python {
PyObject* parse_error_type = nullptr;
} // namespace unixts_python

NB_MODULE(unixts, m) {
    m.doc() = "UNIXTS - Unix timestamps with nanosecond precision";

    // 1. Error types (sets parse_error_type) - no dependencies
    unixts_python::bind_errors(m);

    // 2. Duration, Timestamp, parse functions - need parse_error_type
    unixts_python::bind_timestamp(m);
}
