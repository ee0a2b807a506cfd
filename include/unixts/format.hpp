#pragma once

#include "unixts/duration.hpp"
#include "unixts/timestamp.hpp"

#include <iomanip>
#include <ios>
#include <ostream>
#include <sstream>
#include <string>

namespace unixts {

/**
 * Render a timestamp as whole seconds since the epoch, e.g. "1335020400".
 *
 * The sub-second part is discarded; negative timestamps render their floor
 * second ("-1" for -0.25s).
 */
inline std::string to_string(Timestamp ts) {
    return std::to_string(ts.seconds());
}

/**
 * Render a timestamp as decimal seconds with a fixed number of places,
 * e.g. "1335020400.00" at precision 2.
 *
 * The value goes through a double, so digits beyond roughly 16 significant
 * places are not exact and the last place is rounded.
 */
inline std::string to_string(Timestamp ts, unsigned precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(static_cast<int>(precision)) << ts.to_seconds();
    return oss.str();
}

/**
 * Stream a timestamp.
 *
 * Prints whole seconds, unless the stream is in std::fixed mode, in which
 * case the stream's precision selects the number of decimal places:
 * @code
 *   os << ts;                                      // "1335020400"
 *   os << std::fixed << std::setprecision(2) << ts; // "1335020400.00"
 * @endcode
 */
inline std::ostream& operator<<(std::ostream& os, const Timestamp& ts) {
    if ((os.flags() & std::ios_base::floatfield) == std::ios_base::fixed) {
        return os << to_string(ts, static_cast<unsigned>(os.precision()));
    }
    return os << to_string(ts);
}

/**
 * Render a span as seconds with all nine decimal places, e.g. "1.500000000s".
 *
 * Exact: built from the integer fields, not from a double.
 */
inline std::string to_string(Duration d) {
    std::ostringstream oss;
    oss << d.seconds() << '.' << std::setfill('0') << std::setw(9) << d.subsec_nanos() << 's';
    return oss.str();
}

inline std::ostream& operator<<(std::ostream& os, const Duration& d) {
    return os << to_string(d);
}

} // namespace unixts
