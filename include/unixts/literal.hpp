#pragma once

#include "unixts/parse_error.hpp"
#include "unixts/timestamp.hpp"

#include <limits>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace unixts {

namespace detail {

constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

constexpr std::string_view trim_front(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    return s;
}

constexpr std::string_view trim(std::string_view s) noexcept {
    s = trim_front(s);
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

/// Largest whole-second magnitude a negative literal may carry (2^63)
inline constexpr uint64_t MAX_NEGATIVE_MAGNITUDE =
    static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;

/**
 * Parse an unsigned run of decimal digits as a whole-second magnitude.
 *
 * @param digits Digits to parse; must be non-empty
 * @param limit Largest accepted magnitude
 * @param offset Offset of `digits` in the caller's input (for error reports)
 */
constexpr ParseResult<uint64_t> parse_magnitude(std::string_view digits, uint64_t limit,
                                                std::size_t offset) noexcept {
    if (digits.empty()) {
        return make_parse_error(ParseErrorCode::invalid_digit, offset);
    }
    uint64_t value = 0;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (!is_digit(digits[i])) {
            return make_parse_error(ParseErrorCode::invalid_digit, offset + i);
        }
        auto digit = static_cast<uint64_t>(digits[i] - '0');
        if (value > (limit - digit) / 10) {
            return make_parse_error(ParseErrorCode::out_of_range, offset);
        }
        value = value * 10 + digit;
    }
    return value;
}

/**
 * Parse fractional digits as nanoseconds.
 *
 * The digits are right-padded with zeros to nine places and anything past
 * the ninth digit is dropped, so ".5" is 500'000'000 and ".1234567891" is
 * 123'456'789. All digits are validated, including dropped ones.
 */
constexpr ParseResult<uint32_t> parse_fraction(std::string_view digits,
                                               std::size_t offset) noexcept {
    uint32_t nanos = 0;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (!is_digit(digits[i])) {
            return make_parse_error(ParseErrorCode::invalid_digit, offset + i);
        }
    }
    for (std::size_t i = 0; i < MAX_PRECISION; ++i) {
        nanos *= 10;
        if (i < digits.size()) {
            nanos += static_cast<uint32_t>(digits[i] - '0');
        }
    }
    return nanos;
}

} // namespace detail

/**
 * @brief Parse a signed decimal numeral of seconds into a Timestamp
 *
 * Accepted forms: `1335020400`, `1335020400.50`, `-1000`, `-10000.25`,
 * `.5`, `-.5`, with optional surrounding whitespace and optional whitespace
 * between the sign and the digits.
 *
 * Fraction digits are kept to nanosecond precision (extra digits are
 * truncated). They always become the non-negative sub-second offset: for a
 * negative numeral with a non-zero fraction the whole seconds are pushed one
 * further from zero, so `-0.5` is `Timestamp(-1, 500'000'000)` and
 * `-10000.25` is `Timestamp(-10001, 250'000'000)`.
 *
 * Usage:
 * @code
 *   auto result = unixts::parse_timestamp(text);
 *   if (!result) {
 *       std::cerr << result.error().message() << " at " << result.error().offset << "\n";
 *   }
 * @endcode
 *
 * @param text Numeral to parse
 * @return Parsed timestamp, or a ParseError with the offending offset
 */
constexpr ParseResult<Timestamp> parse_timestamp(std::string_view text) noexcept {
    std::string_view src = detail::trim(text);
    if (src.empty()) {
        return make_parse_error(ParseErrorCode::empty_input, 0);
    }

    // Offsets reported back are relative to the caller's text
    auto offset_of = [&text](std::string_view part) {
        return static_cast<std::size_t>(part.data() - text.data());
    };

    bool negative = false;
    if (src.front() == '-') {
        negative = true;
        src = detail::trim_front(src.substr(1));
    }
    const uint64_t limit = negative ? detail::MAX_NEGATIVE_MAGNITUDE
                                    : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

    std::size_t dot = src.find('.');
    uint64_t magnitude = 0;
    uint32_t nanos = 0;

    if (dot == std::string_view::npos) {
        auto whole = detail::parse_magnitude(src, limit, offset_of(src));
        if (!whole) {
            return make_unexpected(whole.error());
        }
        magnitude = *whole;
    } else {
        std::string_view whole_digits = src.substr(0, dot);
        std::string_view frac_digits = src.substr(dot + 1);

        std::size_t second_dot = frac_digits.find('.');
        if (second_dot != std::string_view::npos) {
            return make_parse_error(ParseErrorCode::multiple_decimal_points,
                                    offset_of(frac_digits) + second_dot);
        }
        // A lone "." has no digits on either side
        if (whole_digits.empty() && frac_digits.empty()) {
            return make_parse_error(ParseErrorCode::invalid_digit, offset_of(src) + dot);
        }

        // Leading '.' means an implied zero whole part
        if (!whole_digits.empty()) {
            auto whole = detail::parse_magnitude(whole_digits, limit, offset_of(whole_digits));
            if (!whole) {
                return make_unexpected(whole.error());
            }
            magnitude = *whole;
        }

        auto frac = detail::parse_fraction(frac_digits, offset_of(frac_digits));
        if (!frac) {
            return make_unexpected(frac.error());
        }
        nanos = *frac;

        // nanos is an offset added to the seconds, so a negative value with a
        // fraction needs one more whole second before the sign is applied
        if (negative && nanos != 0) {
            if (magnitude == limit) {
                return make_parse_error(ParseErrorCode::out_of_range, offset_of(src));
            }
            ++magnitude;
        }
    }

    // Two's complement wrap yields INT64_MIN for a magnitude of 2^63
    int64_t seconds =
        negative ? static_cast<int64_t>(0ULL - magnitude) : static_cast<int64_t>(magnitude);
    return Timestamp(seconds, nanos);
}

namespace literals {

/**
 * @brief Compile-time timestamp literal
 *
 * Runs parse_timestamp() during compilation; a malformed literal does not
 * compile.
 *
 * @code
 *   using namespace unixts::literals;
 *   constexpr auto t = "-10000.25"_ts; // Timestamp(-10001, 250'000'000)
 * @endcode
 */
consteval Timestamp operator""_ts(const char* text, std::size_t len) {
    auto result = parse_timestamp(std::string_view(text, len));
    if (!result) {
        throw "malformed timestamp literal";
    }
    return *result;
}

} // namespace literals

} // namespace unixts
