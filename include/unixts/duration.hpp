#pragma once

#include "unixts/detail/time_math.hpp"

#include <chrono>
#include <compare>
#include <functional>
#include <limits>
#include <optional>
#include <type_traits>

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace unixts {

/**
 * Non-negative time span with exact nanosecond precision.
 *
 * ## Storage
 * uint64_t seconds + uint32_t nanoseconds, nanoseconds always in [0, 10^9).
 *
 * ## Overflow Policy
 * All arithmetic saturates:
 * - Addition saturates to max() (UINT64_MAX, 999'999'999)
 * - Subtraction saturates to zero()
 * - Use `saturated(duration)` helper to detect overflow when needed
 *
 * Signed inputs (std::chrono durations, doubles) go through checked
 * factories returning std::optional, since a negative span does not exist.
 *
 * This is a core library type: noexcept, no allocation.
 */
class Duration {
public:
    static constexpr uint32_t NANOSECONDS_PER_SECOND = detail::NANOS_PER_SEC;
    static constexpr uint32_t NANOSECONDS_PER_MILLISECOND = 1'000'000U;
    static constexpr uint32_t NANOSECONDS_PER_MICROSECOND = 1'000U;

    /// Maximum valid nanoseconds value (one less than a full second)
    static constexpr uint32_t MAX_NANOSECONDS = detail::MAX_NANOS;

    static constexpr Duration zero() noexcept { return Duration(); }

    static constexpr Duration max() noexcept {
        return Duration(std::numeric_limits<uint64_t>::max(), MAX_NANOSECONDS);
    }

    // Default construction - zero duration
    constexpr Duration() noexcept = default;

    // Carries whole seconds out of nanos; saturates at max()
    constexpr Duration(uint64_t sec, uint64_t nanos) noexcept {
        auto [s, ns] = detail::normalize(sec, nanos);
        seconds_ = detail::clamp_to_duration(s, ns);
        nanos_ = ns;
    }

    // Direct factories
    static constexpr Duration from_seconds(uint64_t s) noexcept { return Duration(s, 0); }

    static constexpr Duration from_milliseconds(uint64_t ms) noexcept {
        return Duration(ms / 1'000, (ms % 1'000) * NANOSECONDS_PER_MILLISECOND);
    }

    static constexpr Duration from_microseconds(uint64_t us) noexcept {
        return Duration(us / 1'000'000, (us % 1'000'000) * NANOSECONDS_PER_MICROSECOND);
    }

    static constexpr Duration from_nanoseconds(uint64_t ns) noexcept { return Duration(0, ns); }

    // Checked factory from double - returns nullopt for negative, non-finite or huge input
    static std::optional<Duration> try_from_seconds(double s) noexcept {
        if (!std::isfinite(s) || s < 0.0) {
            return std::nullopt;
        }

        double int_part;
        double frac_part = std::modf(s, &int_part);

        // 2^64 is exactly representable; anything at or above it does not fit
        constexpr double limit = 18446744073709551616.0;
        if (int_part >= limit) {
            return std::nullopt;
        }

        auto sec = static_cast<uint64_t>(int_part);
        auto nanos = static_cast<uint64_t>(
            std::llround(frac_part * static_cast<double>(NANOSECONDS_PER_SECOND)));

        // Rounding may produce a full second; the constructor carries it
        if (nanos >= NANOSECONDS_PER_SECOND && sec == std::numeric_limits<uint64_t>::max()) {
            return std::nullopt;
        }
        return Duration(sec, nanos);
    }

    // Checked factory from std::chrono - returns nullopt for negative spans.
    // Split in 128 bits, so hours/seconds beyond the range of nanoseconds
    // convert exactly; spans past max() saturate.
    template <typename Rep, typename Period>
        requires std::is_integral_v<Rep>
    static constexpr std::optional<Duration>
    from_chrono(std::chrono::duration<Rep, Period> d) noexcept {
        if constexpr (std::is_signed_v<Rep>) {
            if (d.count() < 0) {
                return std::nullopt;
            }
        }
        auto [sec, nanos] = detail::split_chrono(d);
        Duration result;
        result.seconds_ = detail::clamp_to_duration(sec, nanos);
        result.nanos_ = nanos;
        return result;
    }

    // Primary accessors
    constexpr uint64_t seconds() const noexcept { return seconds_; }
    constexpr uint32_t subsec_nanos() const noexcept { return nanos_; }

    // Sub-second part at 10^e units (e clamped to 9)
    constexpr uint32_t subsec(unsigned e) const noexcept {
        if (e > detail::MAX_PRECISION) {
            e = detail::MAX_PRECISION;
        }
        return static_cast<uint32_t>(nanos_ / detail::pow10(detail::MAX_PRECISION - e));
    }

    // Conversion to std::chrono (SATURATES above ~292 years)
    constexpr std::chrono::nanoseconds to_chrono() const noexcept {
        constexpr uint64_t max_safe_sec =
            static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) / NANOSECONDS_PER_SECOND;
        if (seconds_ >= max_safe_sec) {
            return std::chrono::nanoseconds::max();
        }
        return std::chrono::nanoseconds(static_cast<int64_t>(seconds_) * NANOSECONDS_PER_SECOND +
                                        nanos_);
    }

    // Full range conversion to double (loses precision for large values)
    constexpr double to_seconds() const noexcept {
        return static_cast<double>(seconds_) +
               static_cast<double>(nanos_) / static_cast<double>(NANOSECONDS_PER_SECOND);
    }

    constexpr bool is_zero() const noexcept { return seconds_ == 0 && nanos_ == 0; }

    // Arithmetic operators (saturate on overflow/underflow)
    constexpr Duration& operator+=(Duration other) noexcept {
        auto [sec, nanos] = detail::add_time(seconds_, nanos_, other.seconds_, other.nanos_);
        seconds_ = detail::clamp_to_duration(sec, nanos);
        nanos_ = nanos;
        return *this;
    }

    constexpr Duration& operator-=(Duration other) noexcept {
        auto [sec, nanos] = detail::sub_time(seconds_, nanos_, other.seconds_, other.nanos_);
        seconds_ = detail::clamp_to_duration(sec, nanos);
        nanos_ = nanos;
        return *this;
    }

    friend constexpr Duration operator+(Duration lhs, Duration rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    friend constexpr Duration operator-(Duration lhs, Duration rhs) noexcept {
        lhs -= rhs;
        return lhs;
    }

    constexpr auto operator<=>(const Duration&) const noexcept = default;

private:
    uint64_t seconds_{0};
    uint32_t nanos_{0}; // Always in [0, NANOSECONDS_PER_SECOND)
};

/**
 * Check if a Duration has saturated to max().
 *
 * Underflow saturates to zero(), which is also a legitimate value and cannot
 * be told apart.
 */
constexpr bool saturated(const Duration& d) noexcept {
    return d == Duration::max();
}

} // namespace unixts

namespace std {

template <>
struct hash<unixts::Duration> {
    std::size_t operator()(const unixts::Duration& d) const noexcept {
        std::size_t h = std::hash<uint64_t>{}(d.seconds());
        return h ^ (std::hash<uint32_t>{}(d.subsec_nanos()) + 0x9e3779b97f4a7c15ULL + (h << 6) +
                    (h >> 2));
    }
};

} // namespace std
