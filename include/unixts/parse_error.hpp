#pragma once

#include "unixts/expected.hpp"

#include <cstddef>
#include <cstdint>

namespace unixts {

/**
 * @brief Reasons a timestamp numeral can be rejected
 */
enum class ParseErrorCode : uint8_t {
    empty_input,             ///< Nothing but whitespace
    multiple_decimal_points, ///< More than one '.'
    invalid_digit,           ///< Non-digit where a digit was expected
    out_of_range             ///< Whole seconds do not fit in int64_t
};

/**
 * @brief Get a human-readable description of a parse error code
 * @return Static string describing the error
 */
constexpr const char* parse_error_string(ParseErrorCode code) noexcept {
    switch (code) {
        case ParseErrorCode::empty_input:
            return "Empty timestamp literal";
        case ParseErrorCode::multiple_decimal_points:
            return "More than one decimal point";
        case ParseErrorCode::invalid_digit:
            return "Expected a decimal digit";
        case ParseErrorCode::out_of_range:
            return "Seconds out of range";
    }
    return "Unknown parse error";
}

/**
 * @brief Error information from a failed timestamp parse
 *
 * Trivially copyable; the offset indexes into the caller's input.
 */
struct ParseError {
    ParseErrorCode code;  ///< What went wrong
    std::size_t offset{}; ///< Byte offset into the input where it went wrong

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the error
     */
    [[nodiscard]] constexpr const char* message() const noexcept {
        return parse_error_string(code);
    }

    constexpr bool operator==(const ParseError&) const noexcept = default;
};

/**
 * @brief Result type for parsing operations
 *
 * Holds either the parsed value or a ParseError.
 */
template <typename T>
using ParseResult = expected<T, ParseError>;

/**
 * @brief Factory function for creating parse errors
 *
 * Usage:
 * @code
 *   return make_parse_error(ParseErrorCode::invalid_digit, offset);
 * @endcode
 */
constexpr auto make_parse_error(ParseErrorCode code, std::size_t offset) noexcept {
    return unexpected<ParseError>(ParseError{.code = code, .offset = offset});
}

} // namespace unixts
