#pragma once

/// @file include/quantcore/dates.hpp
/// @brief ISO-8601 calendar dates ↔ Unix epoch seconds.
///
/// Timestamps throughout quantcore are doubles. Providers that know real
/// dates use Unix epoch seconds at 00:00 UTC; synthetic series use bar
/// indices. `format_timestamp` prints the former as dates and the latter as
/// plain integers.

#include <string>
#include <string_view>

namespace quantcore {

/// Parse "YYYY-MM-DD" into Unix epoch seconds (UTC midnight).
/// Throws `InvalidParameterError` on malformed input or impossible dates.
[[nodiscard]] double parse_iso_date(std::string_view text);

/// "YYYY-MM-DD" for epoch timestamps (≥ one day), the bar index otherwise.
[[nodiscard]] std::string format_timestamp(double timestamp);

}  // namespace quantcore
