#pragma once
// Core bindings: Duration, Timestamp, CivilTime, parsing and constants

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>

#include <unixts.hpp>

#include "py_types.hpp"

#include <chrono>
#include <functional>
#include <sstream>

namespace nb = nanobind;
using namespace nb::literals;

namespace unixts_python {

inline void bind_timestamp(nb::module_& m) {
    using unixts::CivilTime;
    using unixts::Duration;
    using unixts::Timestamp;

    // Constants
    m.attr("NANOSECONDS_PER_SECOND") = Timestamp::NANOSECONDS_PER_SECOND;
    m.attr("MAX_PRECISION") = Timestamp::MAX_PRECISION;

    // =========================================================================
    // Duration
    // =========================================================================

    nb::class_<Duration>(m, "Duration", "Non-negative time span with nanosecond precision")
        .def(nb::init<uint64_t, uint64_t>(),
             "Create a span from seconds and nanoseconds (nanoseconds may exceed one second)",
             "seconds"_a = 0, "nanos"_a = 0)
        .def_static("from_milliseconds", &Duration::from_milliseconds, "ms"_a)
        .def_static("from_microseconds", &Duration::from_microseconds, "us"_a)
        .def_static("from_nanoseconds", &Duration::from_nanoseconds, "ns"_a)
        .def_static("from_float", &Duration::try_from_seconds,
                    "Span from float seconds; None if negative or not finite", "seconds"_a)
        .def_prop_ro("seconds", &Duration::seconds, "Whole seconds")
        .def_prop_ro("subsec_nanos", &Duration::subsec_nanos, "Sub-second nanoseconds")
        .def("subsec", &Duration::subsec, "Sub-second part at 10^-e second units", "e"_a)
        .def("__float__", &Duration::to_seconds)
        .def("__bool__", [](const Duration& d) { return !d.is_zero(); })
        .def("__add__", [](const Duration& a, const Duration& b) { return a + b; })
        .def("__sub__", [](const Duration& a, const Duration& b) { return a - b; })
        .def("__eq__", [](const Duration& a, const Duration& b) { return a == b; })
        .def("__lt__", [](const Duration& a, const Duration& b) { return a < b; })
        .def("__le__", [](const Duration& a, const Duration& b) { return a <= b; })
        .def("__hash__", [](const Duration& d) { return std::hash<Duration>{}(d); })
        .def("__str__", [](const Duration& d) { return unixts::to_string(d); })
        .def("__repr__", [](const Duration& d) {
            std::ostringstream oss;
            oss << "Duration(seconds=" << d.seconds() << ", nanos=" << d.subsec_nanos() << ")";
            return oss.str();
        });

    // =========================================================================
    // Timestamp
    // =========================================================================

    nb::class_<Timestamp>(m, "Timestamp", "Unix timestamp with a non-negative nanosecond offset")
        .def(nb::init<int64_t, uint64_t>(),
             "Create a timestamp; nanos is added to seconds, so -0.25s is Timestamp(-1, 750000000)",
             "seconds"_a = 0, "nanos"_a = 0)
        .def_static("now", &Timestamp::now, "Current wall-clock time")
        .def_static("epoch", &Timestamp::epoch)
        .def_static("min", &Timestamp::min)
        .def_static("max", &Timestamp::max)
        .def_static(
            "from_milliseconds",
            [](const nb::int_& ms) { return Timestamp::from_milliseconds(from_pyint(ms)); },
            "Timestamp from a millisecond count (saturates outside the range)", "ms"_a)
        .def_static(
            "from_microseconds",
            [](const nb::int_& us) { return Timestamp::from_microseconds(from_pyint(us)); },
            "Timestamp from a microsecond count (saturates outside the range)", "us"_a)
        .def_static(
            "from_nanoseconds",
            [](const nb::int_& ns) { return Timestamp::from_nanoseconds(from_pyint(ns)); },
            "Timestamp from a nanosecond count (saturates outside the range)", "ns"_a)
        .def_static("parse", &parse_or_raise,
                    "Parse a decimal numeral of seconds, e.g. '-10000.25'", "text"_a)
        .def_prop_ro("seconds", &Timestamp::seconds, "Whole seconds, rounded toward -infinity")
        .def_prop_ro("subsec_nanos", &Timestamp::subsec_nanos, "Sub-second nanoseconds")
        .def(
            "at_precision",
            [](const Timestamp& ts, unsigned e) { return to_pyint(ts.at_precision(e)); },
            "Time since the epoch in 10^-e second units", "e"_a)
        .def("subsec", &Timestamp::subsec, "Sub-second part at 10^-e second units", "e"_a)
        .def("to_duration", &Timestamp::to_duration,
             "Time since the epoch as a Duration; None before the epoch")
        .def_prop_ro("saturated", [](const Timestamp& ts) { return unixts::saturated(ts); })
        .def("__float__", &Timestamp::to_seconds)
        .def("__add__", [](const Timestamp& ts, int64_t sec) { return ts + sec; })
        .def("__add__", [](const Timestamp& ts, const Duration& d) { return ts + d; })
        .def("__add__", [](const Timestamp& a, const Timestamp& b) { return a + b; })
        .def("__sub__", [](const Timestamp& ts, int64_t sec) { return ts - sec; })
        .def("__sub__", [](const Timestamp& ts, const Duration& d) { return ts - d; })
        .def("__sub__", [](const Timestamp& a, const Timestamp& b) { return a - b; })
        .def("__mod__", [](const Timestamp& ts, int64_t divisor) { return ts % divisor; })
        .def("__eq__", [](const Timestamp& a, const Timestamp& b) { return a == b; })
        .def("__lt__", [](const Timestamp& a, const Timestamp& b) { return a < b; })
        .def("__le__", [](const Timestamp& a, const Timestamp& b) { return a <= b; })
        .def("__hash__", [](const Timestamp& ts) { return std::hash<Timestamp>{}(ts); })
        .def(
            "format", [](const Timestamp& ts, unsigned precision) {
                return unixts::to_string(ts, precision);
            },
            "Decimal seconds with a fixed number of places", "precision"_a)
        .def("__str__", [](const Timestamp& ts) { return unixts::to_string(ts); })
        .def("__repr__", [](const Timestamp& ts) {
            std::ostringstream oss;
            oss << "Timestamp(seconds=" << ts.seconds() << ", nanos=" << ts.subsec_nanos()
                << ")";
            return oss.str();
        });

    // =========================================================================
    // CivilTime
    // =========================================================================

    nb::class_<CivilTime>(m, "CivilTime", "Calendar date and time at a fixed UTC offset")
        .def(nb::init<>())
        .def_rw("year", &CivilTime::year)
        .def_rw("month", &CivilTime::month)
        .def_rw("day", &CivilTime::day)
        .def_rw("hour", &CivilTime::hour)
        .def_rw("minute", &CivilTime::minute)
        .def_rw("second", &CivilTime::second)
        .def_rw("nanosecond", &CivilTime::nanosecond)
        .def_prop_rw(
            "utc_offset",
            [](const CivilTime& ct) { return static_cast<int64_t>(ct.utc_offset.count()); },
            [](CivilTime& ct, int64_t seconds) { ct.utc_offset = std::chrono::seconds{seconds}; },
            "Local time minus UTC, in seconds")
        .def("__eq__", [](const CivilTime& a, const CivilTime& b) { return a == b; })
        .def("__repr__", [](const CivilTime& ct) {
            std::ostringstream oss;
            oss << "CivilTime(" << ct.year << "-" << ct.month << "-" << ct.day << " "
                << ct.hour << ":" << ct.minute << ":" << ct.second << "." << ct.nanosecond
                << ", utc_offset=" << ct.utc_offset.count() << ")";
            return oss.str();
        });

    // Free functions
    m.def("parse_timestamp", &parse_or_raise,
          "Parse a decimal numeral of seconds; raises ParseError", "text"_a);

    m.def(
        "to_civil",
        [](const Timestamp& ts, int64_t utc_offset) {
            auto ct = unixts::to_civil(ts, std::chrono::seconds{utc_offset});
            if (!ct.has_value()) {
                raise_civil_error(ct.error());
            }
            return *ct;
        },
        "Calendar time at a UTC offset in seconds; raises ValueError if out of range",
        "ts"_a, "utc_offset"_a = 0);

    m.def(
        "from_civil",
        [](const CivilTime& ct) {
            auto ts = unixts::from_civil(ct);
            if (!ts.has_value()) {
                raise_civil_error(ts.error());
            }
            return *ts;
        },
        "Timestamp for a calendar time; raises ValueError if a field is invalid", "ct"_a);

    m.def(
        "parse_utc_offset",
        [](std::string_view text) {
            auto offset = unixts::parse_utc_offset(text);
            if (!offset.has_value()) {
                raise_civil_error(offset.error());
            }
            return static_cast<int64_t>(offset->count());
        },
        "Seconds east of UTC for 'Z', 'UTC', '+HH', '+HHMM' or '+HH:MM'", "text"_a);
}

} // namespace unixts_python
