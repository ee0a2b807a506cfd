#pragma once

#include "unixts/detail/time_math.hpp"
#include "unixts/expected.hpp"
#include "unixts/timestamp.hpp"

#include <chrono>
#include <string_view>

#include <cstdint>

namespace unixts {

/**
 * Broken-down civil (calendar) time at a fixed UTC offset.
 *
 * Proleptic Gregorian calendar, no leap seconds. `utc_offset` is the local
 * time minus UTC, e.g. -4h for US Eastern daylight time.
 */
struct CivilTime {
    int32_t year{1970};
    uint32_t month{1};      ///< [1, 12]
    uint32_t day{1};        ///< [1, 31], further limited by month and year
    uint32_t hour{0};       ///< [0, 23]
    uint32_t minute{0};     ///< [0, 59]
    uint32_t second{0};     ///< [0, 59]
    uint32_t nanosecond{0}; ///< [0, 999'999'999]
    std::chrono::seconds utc_offset{0};

    constexpr bool operator==(const CivilTime&) const noexcept = default;
};

/**
 * @brief Reasons a civil time conversion can fail
 */
enum class CivilError : uint8_t {
    out_of_range,  ///< Year outside std::chrono::year's range
    invalid_date,  ///< No such calendar day (e.g. February 30)
    invalid_time,  ///< Hour, minute, second or nanosecond out of range
    invalid_offset ///< UTC offset malformed or not within +/-24h
};

constexpr const char* civil_error_string(CivilError e) noexcept {
    switch (e) {
        case CivilError::out_of_range:
            return "Date out of supported range";
        case CivilError::invalid_date:
            return "Invalid calendar date";
        case CivilError::invalid_time:
            return "Invalid time of day";
        case CivilError::invalid_offset:
            return "Invalid UTC offset";
    }
    return "Unknown civil time error";
}

namespace detail {

inline constexpr int64_t SECS_PER_DAY = 86'400;

/// Offsets must stay strictly within one day of UTC
inline constexpr std::chrono::seconds MAX_UTC_OFFSET =
    std::chrono::hours(24) - std::chrono::seconds(1);

/// Day numbers (since 1970-01-01) covered by std::chrono::year
inline constexpr int64_t MIN_CIVIL_DAY =
    std::chrono::sys_days{std::chrono::year::min() / std::chrono::January / 1}
        .time_since_epoch()
        .count();
inline constexpr int64_t MAX_CIVIL_DAY =
    std::chrono::sys_days{std::chrono::year::max() / std::chrono::December / 31}
        .time_since_epoch()
        .count();

constexpr bool valid_utc_offset(std::chrono::seconds offset) noexcept {
    return offset >= -MAX_UTC_OFFSET && offset <= MAX_UTC_OFFSET;
}

constexpr bool parse_two_digits(std::string_view s, uint32_t& out) noexcept {
    if (s.size() != 2 || s[0] < '0' || s[0] > '9' || s[1] < '0' || s[1] > '9') {
        return false;
    }
    out = static_cast<uint32_t>((s[0] - '0') * 10 + (s[1] - '0'));
    return true;
}

} // namespace detail

/**
 * Convert a timestamp to civil time at a fixed UTC offset.
 *
 * @param ts Timestamp to convert
 * @param utc_offset Local time minus UTC, within +/-23:59:59
 * @return Civil time; CivilError::invalid_offset for an offset outside
 *         +/-23:59:59, CivilError::out_of_range if the date falls outside
 *         std::chrono::year's range (about +/-32767 years)
 */
inline expected<CivilTime, CivilError> to_civil(Timestamp ts,
                                                std::chrono::seconds utc_offset = {}) noexcept {
    if (!detail::valid_utc_offset(utc_offset)) {
        return make_unexpected(CivilError::invalid_offset);
    }

    // Widen first: seconds near INT64_MAX plus an offset must not overflow
    detail::wide_int local = static_cast<detail::wide_int>(ts.seconds()) + utc_offset.count();
    detail::wide_int day_number = local / detail::SECS_PER_DAY;
    detail::wide_int second_of_day = local % detail::SECS_PER_DAY;
    if (second_of_day < 0) {
        second_of_day += detail::SECS_PER_DAY;
        --day_number;
    }
    if (day_number < detail::MIN_CIVIL_DAY || day_number > detail::MAX_CIVIL_DAY) {
        return make_unexpected(CivilError::out_of_range);
    }

    std::chrono::sys_days days{
        std::chrono::days{static_cast<std::chrono::days::rep>(day_number)}};
    std::chrono::year_month_day ymd{days};
    auto sod = static_cast<uint32_t>(second_of_day);

    CivilTime ct;
    ct.year = static_cast<int32_t>(static_cast<int>(ymd.year()));
    ct.month = static_cast<unsigned>(ymd.month());
    ct.day = static_cast<unsigned>(ymd.day());
    ct.hour = sod / 3'600;
    ct.minute = (sod % 3'600) / 60;
    ct.second = sod % 60;
    ct.nanosecond = ts.subsec_nanos();
    ct.utc_offset = utc_offset;
    return ct;
}

/// Convert a timestamp to civil time in UTC
inline expected<CivilTime, CivilError> to_utc_civil(Timestamp ts) noexcept {
    return to_civil(ts, std::chrono::seconds{0});
}

/**
 * Convert civil time back to a timestamp.
 *
 * Every field is validated; nothing is silently rolled over (no February 30,
 * no 24:00, no leap second 60).
 */
inline expected<Timestamp, CivilError> from_civil(const CivilTime& ct) noexcept {
    if (!detail::valid_utc_offset(ct.utc_offset)) {
        return make_unexpected(CivilError::invalid_offset);
    }
    if (ct.hour > 23 || ct.minute > 59 || ct.second > 59 ||
        ct.nanosecond > detail::MAX_NANOS) {
        return make_unexpected(CivilError::invalid_time);
    }
    if (ct.year < static_cast<int>(std::chrono::year::min()) ||
        ct.year > static_cast<int>(std::chrono::year::max())) {
        return make_unexpected(CivilError::out_of_range);
    }
    // Check before narrowing into std::chrono::month/day, which keep only 8 bits
    if (ct.month < 1 || ct.month > 12 || ct.day < 1 || ct.day > 31) {
        return make_unexpected(CivilError::invalid_date);
    }

    std::chrono::year_month_day ymd{std::chrono::year{ct.year}, std::chrono::month{ct.month},
                                    std::chrono::day{ct.day}};
    if (!ymd.ok()) {
        return make_unexpected(CivilError::invalid_date);
    }

    int64_t day_number = std::chrono::sys_days{ymd}.time_since_epoch().count();
    int64_t local = day_number * detail::SECS_PER_DAY + ct.hour * 3'600 + ct.minute * 60 +
                    ct.second;
    return Timestamp(local - ct.utc_offset.count(), ct.nanosecond);
}

/**
 * Parse a fixed UTC offset designator.
 *
 * Accepted: "Z", "UTC", "+HH", "-HH", "+HHMM", "+HH:MM" (hours <= 23,
 * minutes <= 59). Named zones ("America/New_York") need a time-zone
 * database and are not supported.
 */
constexpr expected<std::chrono::seconds, CivilError> parse_utc_offset(std::string_view s) noexcept {
    if (s == "Z" || s == "z" || s == "UTC") {
        return std::chrono::seconds{0};
    }
    if (s.size() < 3 || (s[0] != '+' && s[0] != '-')) {
        return make_unexpected(CivilError::invalid_offset);
    }
    bool negative = s[0] == '-';
    s.remove_prefix(1);

    uint32_t hours = 0;
    uint32_t minutes = 0;
    if (!detail::parse_two_digits(s.substr(0, 2), hours)) {
        return make_unexpected(CivilError::invalid_offset);
    }
    s.remove_prefix(2);
    if (!s.empty() && s.front() == ':') {
        s.remove_prefix(1);
        if (s.empty()) {
            return make_unexpected(CivilError::invalid_offset);
        }
    }
    if (!s.empty() && !detail::parse_two_digits(s, minutes)) {
        return make_unexpected(CivilError::invalid_offset);
    }
    if (hours > 23 || minutes > 59) {
        return make_unexpected(CivilError::invalid_offset);
    }

    std::chrono::seconds offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
    return negative ? -offset : offset;
}

} // namespace unixts
