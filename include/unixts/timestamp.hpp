#pragma once

#include "unixts/detail/time_math.hpp"
#include "unixts/duration.hpp"

#include <chrono>
#include <compare>
#include <functional>
#include <limits>
#include <optional>
#include <type_traits>

#include <cstddef>
#include <cstdint>
#include <ctime>

namespace unixts {

/**
 * Unix timestamp: signed seconds since the epoch plus a sub-second offset.
 *
 * ## Storage
 * 12 bytes of state: int64_t seconds + uint32_t nanoseconds.
 *
 * ## Negative Value Representation (Floor Semantics)
 * The nanoseconds field is always a non-negative offset ADDED to seconds,
 * whatever the sign of seconds:
 * - `-0.25 seconds` = `{seconds: -1, nanos: 750,000,000}`
 * - `-1.5 seconds`  = `{seconds: -2, nanos: 500,000,000}`
 *
 * Ordering is therefore plain lexicographic (seconds, nanos) and matches
 * real time.
 *
 * ## Overflow Policy
 * All arithmetic saturates on overflow/underflow:
 * - Overflow saturates to max() (INT64_MAX, 999'999'999)
 * - Underflow saturates to min() (INT64_MIN, 0)
 * - Use `saturated(timestamp)` helper to detect overflow when needed
 *
 * Intermediate results are computed in 128-bit integers and clamped once,
 * so no operation has undefined behavior.
 *
 * This is a core library type: noexcept, no allocation.
 */
class Timestamp {
public:
    static constexpr uint32_t NANOSECONDS_PER_SECOND = detail::NANOS_PER_SEC;
    static constexpr uint32_t MAX_NANOSECONDS = detail::MAX_NANOS;
    static constexpr unsigned MAX_PRECISION = detail::MAX_PRECISION;

    // Named constants
    static constexpr Timestamp min() noexcept {
        return Timestamp(std::numeric_limits<int64_t>::min(), 0);
    }

    static constexpr Timestamp max() noexcept {
        return Timestamp(std::numeric_limits<int64_t>::max(), MAX_NANOSECONDS);
    }

    static constexpr Timestamp epoch() noexcept { return Timestamp(); }

    // Default construction - the epoch
    constexpr Timestamp() noexcept = default;

    /**
     * Construct from seconds and a non-negative nanosecond offset.
     *
     * Nanoseconds may exceed one second; whole seconds are carried into
     * `sec`. For negative timestamps the offset still counts forward, so
     * -0.25s is `Timestamp(-1, 750'000'000)`.
     */
    constexpr Timestamp(int64_t sec, uint64_t nanos) noexcept {
        auto [s, ns] = detail::normalize(sec, nanos);
        store(s, ns);
    }

    // Whole seconds since the epoch
    constexpr explicit Timestamp(int64_t sec) noexcept : seconds_(sec) {}

    // Factories
    static constexpr Timestamp from_seconds(int64_t sec) noexcept { return Timestamp(sec); }

    /**
     * Counts of 10^-3, 10^-6 and 10^-9 seconds since the epoch.
     *
     * The count is 128-bit, so at_precision() output of any timestamp feeds
     * straight back in; counts past the int64_t seconds range saturate.
     */
    static constexpr Timestamp from_milliseconds(detail::wide_int ms) noexcept {
        return from_units(ms, 1'000U);
    }

    static constexpr Timestamp from_microseconds(detail::wide_int us) noexcept {
        return from_units(us, 1'000'000U);
    }

    static constexpr Timestamp from_nanoseconds(detail::wide_int ns) noexcept {
        return from_units(ns, NANOSECONDS_PER_SECOND);
    }

    /// The instant `since_epoch` after the epoch (saturates at max())
    static constexpr Timestamp from_duration(Duration since_epoch) noexcept {
        Timestamp ts;
        ts.store(since_epoch.seconds(), since_epoch.subsec_nanos());
        return ts;
    }

    static constexpr Timestamp from_chrono(std::chrono::system_clock::time_point tp) noexcept {
        Timestamp ts;
        auto [s, ns] = detail::split_chrono(tp.time_since_epoch());
        ts.store(s, ns);
        return ts;
    }

    /**
     * Current wall-clock time.
     *
     * system_clock's time_since_epoch() is signed, so a clock set before
     * 1970 produces a negative timestamp rather than an error.
     */
    static Timestamp now() noexcept { return from_chrono(std::chrono::system_clock::now()); }

    // Accessors

    /// Whole seconds, rounded toward negative infinity (-0.25s -> -1)
    constexpr int64_t seconds() const noexcept { return seconds_; }

    /// Sub-second offset in nanoseconds, always in [0, 10^9)
    constexpr uint32_t subsec_nanos() const noexcept { return nanos_; }

    /**
     * Time since the epoch as an integer count of 10^-e second units.
     *
     * @param e Precision exponent (3 = milliseconds, 6 = microseconds,
     *          9 = nanoseconds). Values above 9 are treated as 9.
     */
    constexpr detail::wide_int at_precision(unsigned e) const noexcept {
        return detail::scale_to_precision(seconds_, nanos_, e);
    }

    /**
     * Sub-second part at 10^-e second units; never negative.
     *
     * @param e Precision exponent in [0, 9]. Values above 9 are treated as 9.
     */
    constexpr uint32_t subsec(unsigned e) const noexcept {
        if (e > MAX_PRECISION) {
            e = MAX_PRECISION;
        }
        return static_cast<uint32_t>(nanos_ / detail::pow10(MAX_PRECISION - e));
    }

    // Conversions

    /// Floating-point seconds (loses precision beyond ~2^53 nanoseconds)
    constexpr double to_seconds() const noexcept {
        return static_cast<double>(seconds_) +
               static_cast<double>(nanos_) / static_cast<double>(NANOSECONDS_PER_SECOND);
    }

    /// Time since the epoch as a span; nullopt for pre-epoch timestamps
    constexpr std::optional<Duration> to_duration() const noexcept {
        if (seconds_ < 0) {
            return std::nullopt;
        }
        return Duration(static_cast<uint64_t>(seconds_), nanos_);
    }

    // Saturates to time_point::min()/max() outside the clock's ~292 year range
    std::chrono::system_clock::time_point to_chrono() const noexcept {
        using std::chrono::system_clock;
        constexpr int64_t max_safe_sec = std::numeric_limits<int64_t>::max() / NANOSECONDS_PER_SECOND;
        if (seconds_ >= max_safe_sec) {
            return system_clock::time_point::max();
        }
        if (seconds_ <= -max_safe_sec) {
            return system_clock::time_point::min();
        }
        std::chrono::nanoseconds since_epoch(seconds_ * NANOSECONDS_PER_SECOND + nanos_);
        return system_clock::time_point(std::chrono::floor<system_clock::duration>(since_epoch));
    }

    std::time_t to_time_t() const noexcept { return static_cast<std::time_t>(seconds_); }

    // Comparison - lexicographic on (seconds, nanos)
    constexpr auto operator<=>(const Timestamp&) const noexcept = default;

    // Arithmetic with whole seconds (nanos untouched)
    constexpr Timestamp& operator+=(int64_t sec) noexcept {
        auto [s, ns] = detail::add_time(seconds_, nanos_, sec, 0);
        store(s, ns);
        return *this;
    }

    constexpr Timestamp& operator-=(int64_t sec) noexcept {
        auto [s, ns] = detail::sub_time(seconds_, nanos_, sec, 0);
        store(s, ns);
        return *this;
    }

    friend constexpr Timestamp operator+(Timestamp ts, int64_t sec) noexcept {
        ts += sec;
        return ts;
    }

    friend constexpr Timestamp operator-(Timestamp ts, int64_t sec) noexcept {
        ts -= sec;
        return ts;
    }

    /**
     * Seconds-only remainder; the sub-second offset is carried over as is.
     *
     * The remainder truncates toward zero (sign follows the dividend).
     * A zero divisor leaves the timestamp unchanged.
     */
    friend constexpr Timestamp operator%(Timestamp ts, int64_t divisor) noexcept {
        if (divisor == 0) {
            return ts;
        }
        auto rem = static_cast<detail::wide_int>(ts.seconds_) % divisor;
        return Timestamp(static_cast<int64_t>(rem), ts.nanos_);
    }

    // Arithmetic with Duration (saturates on overflow/underflow)
    constexpr Timestamp& operator+=(Duration d) noexcept {
        auto [s, ns] = detail::add_time(seconds_, nanos_, d.seconds(), d.subsec_nanos());
        store(s, ns);
        return *this;
    }

    constexpr Timestamp& operator-=(Duration d) noexcept {
        auto [s, ns] = detail::sub_time(seconds_, nanos_, d.seconds(), d.subsec_nanos());
        store(s, ns);
        return *this;
    }

    friend constexpr Timestamp operator+(Timestamp ts, Duration d) noexcept {
        ts += d;
        return ts;
    }

    friend constexpr Timestamp operator-(Timestamp ts, Duration d) noexcept {
        ts -= d;
        return ts;
    }

    // Arithmetic with signed integral std::chrono durations of any length
    // (saturates like every other operator)
    template <typename Rep, typename Period>
        requires std::is_integral_v<Rep>
    constexpr Timestamp& operator+=(std::chrono::duration<Rep, Period> d) noexcept {
        auto [sec, nanos] = detail::split_chrono(d);
        auto [s, ns] = detail::add_time(seconds_, nanos_, sec, nanos);
        store(s, ns);
        return *this;
    }

    template <typename Rep, typename Period>
        requires std::is_integral_v<Rep>
    constexpr Timestamp& operator-=(std::chrono::duration<Rep, Period> d) noexcept {
        auto [sec, nanos] = detail::split_chrono(d);
        auto [s, ns] = detail::sub_time(seconds_, nanos_, sec, nanos);
        store(s, ns);
        return *this;
    }

    template <typename Rep, typename Period>
        requires std::is_integral_v<Rep>
    friend constexpr Timestamp operator+(Timestamp ts,
                                         std::chrono::duration<Rep, Period> d) noexcept {
        ts += d;
        return ts;
    }

    template <typename Rep, typename Period>
        requires std::is_integral_v<Rep>
    friend constexpr Timestamp operator-(Timestamp ts,
                                         std::chrono::duration<Rep, Period> d) noexcept {
        ts -= d;
        return ts;
    }

    // Timestamp with timestamp
    friend constexpr Timestamp operator+(Timestamp lhs, Timestamp rhs) noexcept {
        auto [s, ns] = detail::add_time(lhs.seconds_, lhs.nanos_, rhs.seconds_, rhs.nanos_);
        lhs.store(s, ns);
        return lhs;
    }

    friend constexpr Timestamp operator-(Timestamp lhs, Timestamp rhs) noexcept {
        auto [s, ns] = detail::sub_time(lhs.seconds_, lhs.nanos_, rhs.seconds_, rhs.nanos_);
        lhs.store(s, ns);
        return lhs;
    }

private:
    int64_t seconds_{0};
    uint32_t nanos_{0}; // Always in [0, NANOSECONDS_PER_SECOND)

    static constexpr Timestamp from_units(detail::wide_int value,
                                          uint32_t units_per_sec) noexcept {
        Timestamp ts;
        auto [s, ns] = detail::split_units(value, units_per_sec);
        ts.store(s, ns);
        return ts;
    }

    // Single exit point for every normalized result: clamp, then assign
    constexpr void store(detail::wide_int sec, uint32_t nanos) noexcept {
        seconds_ = detail::clamp_to_timestamp(sec, nanos);
        nanos_ = nanos;
    }
};

/**
 * Check if a Timestamp has saturated to min() or max().
 *
 * ```cpp
 * auto ts = start + offset;
 * if (saturated(ts)) {
 *     // Handle overflow - timestamp is at a range boundary
 * }
 * ```
 */
constexpr bool saturated(const Timestamp& ts) noexcept {
    return ts == Timestamp::max() || ts == Timestamp::min();
}

} // namespace unixts

namespace std {

template <>
struct hash<unixts::Timestamp> {
    std::size_t operator()(const unixts::Timestamp& ts) const noexcept {
        std::size_t h = std::hash<int64_t>{}(ts.seconds());
        return h ^ (std::hash<uint32_t>{}(ts.subsec_nanos()) + 0x9e3779b97f4a7c15ULL + (h << 6) +
                    (h >> 2));
    }
};

} // namespace std
