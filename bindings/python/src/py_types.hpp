#pragma once
// Python conversion helpers for UNIXTS bindings

#include <nanobind/nanobind.h>

#include <unixts/civil.hpp>
#include <unixts/detail/time_math.hpp>
#include <unixts/literal.hpp>

#include <string>
#include <string_view>

namespace nb = nanobind;

namespace unixts_python {

// Exception type pointer (set during module init)
extern PyObject* parse_error_type;

/**
 * @brief Convert a 128-bit intermediate to a Python int
 *
 * at_precision(9) of an extreme timestamp exceeds 64 bits, so the value is
 * passed through its decimal text.
 */
inline nb::int_ to_pyint(unixts::detail::wide_int value) {
    bool negative = value < 0;
    std::string digits;
    do {
        auto digit = static_cast<int>(value % 10);
        digits.insert(digits.begin(), static_cast<char>('0' + (negative ? -digit : digit)));
        value /= 10;
    } while (value != 0);
    if (negative) {
        digits.insert(digits.begin(), '-');
    }
    PyObject* result = PyLong_FromString(digits.c_str(), nullptr, 10);
    if (result == nullptr) {
        throw nb::python_error();
    }
    return nb::steal<nb::int_>(result);
}

/**
 * @brief Convert a Python int of any size to a 128-bit count
 *
 * Values beyond 128 bits clamp to the nearest bound; the timestamp
 * factories saturate them anyway.
 */
inline unixts::detail::wide_int from_pyint(const nb::int_& value) {
    nb::str text = nb::str(value);
    std::string_view digits = text.c_str();
    bool negative = !digits.empty() && digits.front() == '-';
    if (negative) {
        digits.remove_prefix(1);
    }

    constexpr auto wide_max = static_cast<unixts::detail::wide_int>(
        (static_cast<unsigned __int128>(1) << 127) - 1);
    unixts::detail::wide_int magnitude = 0;
    for (char c : digits) {
        int digit = c - '0';
        if (magnitude > (wide_max - digit) / 10) {
            magnitude = wide_max;
            break;
        }
        magnitude = magnitude * 10 + digit;
    }
    return negative ? -magnitude : magnitude;
}

/**
 * @brief Raise a ValueError carrying a civil conversion error's text
 */
[[noreturn]] inline void raise_civil_error(unixts::CivilError e) {
    throw nb::value_error(unixts::civil_error_string(e));
}

/**
 * @brief Parse a numeral, raising ParseError on failure
 */
inline unixts::Timestamp parse_or_raise(std::string_view text) {
    auto parsed = unixts::parse_timestamp(text);
    if (!parsed.has_value()) {
        std::string msg = std::string(parsed.error().message()) + " at offset " +
                          std::to_string(parsed.error().offset);
        PyErr_SetString(parse_error_type, msg.c_str());
        throw nb::python_error();
    }
    return *parsed;
}

} // namespace unixts_python
