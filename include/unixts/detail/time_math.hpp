// include/unixts/detail/time_math.hpp
#pragma once

#include <chrono>
#include <limits>
#include <type_traits>
#include <utility>

#include <cstdint>

namespace unixts::detail {

/**
 * Centralized time arithmetic for Duration and Timestamp.
 *
 * - One normalize() owns every carry and borrow across the second boundary
 * - Intermediate values are 128-bit so no step overflows before clamping
 * - Results are clamped to the storage range afterwards (saturation)
 */

/// Wide intermediate type for seconds arithmetic
using wide_int = __int128_t;

/// Nanoseconds per second (10^9)
inline constexpr uint32_t NANOS_PER_SEC = 1'000'000'000U;

/// Maximum valid nanoseconds value (one less than a full second)
inline constexpr uint32_t MAX_NANOS = NANOS_PER_SEC - 1;

/// Largest supported precision exponent (nanoseconds)
inline constexpr unsigned MAX_PRECISION = 9;

/// 10^e for e in [0, 19]
constexpr uint64_t pow10(unsigned e) noexcept {
    uint64_t result = 1;
    while (e-- > 0) {
        result *= 10;
    }
    return result;
}

/**
 * Normalize (seconds, nanoseconds) to canonical form with floor semantics.
 *
 * - nanos >= 10^9 carries whole seconds up
 * - nanos < 0 borrows whole seconds down
 * - -0.25s with sec = 0 becomes {-1, 750'000'000}
 *
 * @return Pair of (seconds, nanos) where nanos is in [0, 10^9). Seconds are
 *         NOT clamped.
 */
constexpr auto normalize(wide_int sec, wide_int nanos) noexcept -> std::pair<wide_int, uint32_t> {
    wide_int carry = nanos / NANOS_PER_SEC;
    wide_int rem = nanos % NANOS_PER_SEC;
    if (rem < 0) {
        rem += NANOS_PER_SEC;
        --carry;
    }
    return {sec + carry, static_cast<uint32_t>(rem)};
}

/**
 * Split a signed count of sub-second units into (seconds, nanos).
 *
 * Uses floor division so the remainder is never negative:
 * -1750 ms -> {-2, 250'000'000}. The count is 128-bit so that
 * Timestamp::at_precision() output of any timestamp splits back exactly.
 *
 * @param value Count of units since the epoch
 * @param units_per_sec 10^3 for milliseconds, 10^6 for microseconds, ...
 */
constexpr auto split_units(wide_int value,
                           uint32_t units_per_sec) noexcept -> std::pair<wide_int, uint32_t> {
    wide_int sec = value / units_per_sec;
    wide_int rem = value % units_per_sec;
    if (rem < 0) {
        rem += units_per_sec;
        --sec;
    }
    return normalize(sec, rem * (NANOS_PER_SEC / units_per_sec));
}

/**
 * Split an integral std::chrono::duration into (seconds, nanos) with floor
 * semantics, without going through std::chrono::nanoseconds.
 *
 * count * Period::num is below 2^127 for any 64-bit count and ratio
 * numerator, so spans far beyond the +/-292 year range of nanoseconds
 * (e.g. std::chrono::seconds(INT64_MAX)) split exactly. Sub-nanosecond
 * remainders are truncated.
 */
template <typename Rep, typename Period>
    requires std::is_integral_v<Rep>
constexpr auto split_chrono(std::chrono::duration<Rep, Period> d) noexcept
    -> std::pair<wide_int, uint32_t> {
    wide_int scaled = static_cast<wide_int>(d.count()) * Period::num;
    wide_int sec = scaled / Period::den;
    wide_int rem = scaled % Period::den;
    if (rem < 0) {
        rem += Period::den;
        --sec;
    }
    return {sec, static_cast<uint32_t>(rem * NANOS_PER_SEC / Period::den)};
}

/**
 * Add two time values: (sec_a, nanos_a) + (sec_b, nanos_b).
 *
 * Both nanos are in [0, 10^9), so at most one carry step happens.
 */
constexpr auto add_time(wide_int sec_a, uint32_t nanos_a, wide_int sec_b,
                        uint32_t nanos_b) noexcept -> std::pair<wide_int, uint32_t> {
    return normalize(sec_a + sec_b, static_cast<wide_int>(nanos_a) + nanos_b);
}

/**
 * Subtract two time values: (sec_a, nanos_a) - (sec_b, nanos_b).
 *
 * When the subtrahend's nanos exceed the minuend's, one whole second is
 * borrowed.
 */
constexpr auto sub_time(wide_int sec_a, uint32_t nanos_a, wide_int sec_b,
                        uint32_t nanos_b) noexcept -> std::pair<wide_int, uint32_t> {
    if (nanos_b > nanos_a) {
        return normalize(sec_a - sec_b - 1,
                         static_cast<wide_int>(nanos_a) + NANOS_PER_SEC - nanos_b);
    }
    return normalize(sec_a - sec_b, static_cast<wide_int>(nanos_a) - nanos_b);
}

/**
 * Clamp seconds to int64_t range for Timestamp storage.
 *
 * On overflow/underflow, also sets nanos to the boundary value so that
 * Timestamp::max() and Timestamp::min() are well-defined sentinels.
 */
constexpr int64_t clamp_to_timestamp(wide_int sec, uint32_t& nanos) noexcept {
    if (sec > std::numeric_limits<int64_t>::max()) {
        nanos = MAX_NANOS;
        return std::numeric_limits<int64_t>::max();
    }
    if (sec < std::numeric_limits<int64_t>::min()) {
        nanos = 0;
        return std::numeric_limits<int64_t>::min();
    }
    return static_cast<int64_t>(sec);
}

/**
 * Clamp seconds to uint64_t range for Duration storage.
 *
 * Negative results saturate to zero, large ones to (UINT64_MAX, MAX_NANOS).
 */
constexpr uint64_t clamp_to_duration(wide_int sec, uint32_t& nanos) noexcept {
    if (sec > static_cast<wide_int>(std::numeric_limits<uint64_t>::max())) {
        nanos = MAX_NANOS;
        return std::numeric_limits<uint64_t>::max();
    }
    if (sec < 0) {
        nanos = 0;
        return 0;
    }
    return static_cast<uint64_t>(sec);
}

/**
 * Scale (seconds, nanos) to an integer count of 10^-e second units.
 *
 * The sub-second part is truncated, which for floor-normalized values means
 * the result is rounded toward negative infinity.
 */
constexpr wide_int scale_to_precision(int64_t sec, uint32_t nanos, unsigned e) noexcept {
    if (e > MAX_PRECISION) {
        e = MAX_PRECISION;
    }
    return static_cast<wide_int>(sec) * static_cast<wide_int>(pow10(e)) +
           nanos / pow10(MAX_PRECISION - e);
}

} // namespace unixts::detail
