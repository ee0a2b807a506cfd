#pragma once

/**
 * @file unixts.hpp
 * @brief Convenience header for the whole library
 *
 * Types provided:
 * - Timestamp - signed seconds + non-negative nanosecond offset since the Unix epoch
 * - Duration - non-negative span of seconds + nanoseconds
 * - CivilTime - broken-down calendar time at a fixed UTC offset
 *
 * Functions provided:
 * - parse_timestamp(): decimal numeral -> ParseResult<Timestamp>
 * - to_string() / operator<<: text rendering
 * - to_civil() / from_civil() / parse_utc_offset(): calendar conversion
 *
 * Literals (using namespace unixts::literals):
 * - "1335020400.50"_ts - parsed at compile time
 */

#include "unixts/civil.hpp"
#include "unixts/duration.hpp"
#include "unixts/expected.hpp"
#include "unixts/format.hpp"
#include "unixts/literal.hpp"
#include "unixts/parse_error.hpp"
#include "unixts/timestamp.hpp"
