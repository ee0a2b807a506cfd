#pragma once
// Error bindings: ParseErrorCode, CivilError, ParseError exception

#include <nanobind/nanobind.h>

#include <unixts/civil.hpp>
#include <unixts/parse_error.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;

namespace unixts_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // ParseErrorCode enum
    // =========================================================================

    nb::enum_<unixts::ParseErrorCode>(m, "ParseErrorCode",
                                      "Reasons a timestamp numeral can be rejected")
        .value("empty_input", unixts::ParseErrorCode::empty_input, "Nothing but whitespace")
        .value("multiple_decimal_points", unixts::ParseErrorCode::multiple_decimal_points,
               "More than one decimal point")
        .value("invalid_digit", unixts::ParseErrorCode::invalid_digit,
               "Non-digit where a digit was expected")
        .value("out_of_range", unixts::ParseErrorCode::out_of_range,
               "Whole seconds do not fit in 64 bits")
        .def("__str__", [](unixts::ParseErrorCode c) {
            return std::string(unixts::parse_error_string(c));
        });

    // =========================================================================
    // CivilError enum
    // =========================================================================

    nb::enum_<unixts::CivilError>(m, "CivilError", "Reasons a civil time conversion can fail")
        .value("out_of_range", unixts::CivilError::out_of_range, "Date out of supported range")
        .value("invalid_date", unixts::CivilError::invalid_date, "No such calendar day")
        .value("invalid_time", unixts::CivilError::invalid_time, "Time of day out of range")
        .value("invalid_offset", unixts::CivilError::invalid_offset,
               "UTC offset malformed or not within +/-24h")
        .def("__str__", [](unixts::CivilError e) {
            return std::string(unixts::civil_error_string(e));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // ParseError - malformed timestamp numerals
    auto parse_error = nb::exception<std::runtime_error>(m, "ParseError", PyExc_ValueError);
    parse_error_type = parse_error.ptr();
}

} // namespace unixts_python
