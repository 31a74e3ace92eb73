/// @file src/core/dates.cpp
/// @brief Civil-calendar conversions (proleptic Gregorian, UTC).

#include "quantcore/dates.hpp"
#include "quantcore/errors.hpp"

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cmath>

namespace quantcore {

namespace {

constexpr double SECONDS_PER_DAY = 86400.0;

// 10000-01-01T00:00:00Z; later timestamps do not fit a four-digit year.
constexpr double MAX_FORMATTED_TIMESTAMP = 253402300800.0;

template <typename T>
bool parse_field(std::string_view text, T& out) noexcept {
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

}  // namespace

double parse_iso_date(std::string_view text) {
    // YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw InvalidParameterError(fmt::format(
            "expected a YYYY-MM-DD date, got '{}'", text));
    }

    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    if (!parse_field(text.substr(0, 4), year) ||
        !parse_field(text.substr(5, 2), month) ||
        !parse_field(text.substr(8, 2), day)) {
        throw InvalidParameterError(fmt::format(
            "expected a YYYY-MM-DD date, got '{}'", text));
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!ymd.ok()) {
        throw InvalidParameterError(fmt::format("no such calendar date '{}'", text));
    }

    const std::chrono::sys_days days{ymd};
    return static_cast<double>(days.time_since_epoch().count()) * SECONDS_PER_DAY;
}

std::string format_timestamp(double timestamp) {
    if (!std::isfinite(timestamp)) {
        return fmt::format("{}", timestamp);
    }
    if (timestamp < SECONDS_PER_DAY || timestamp >= MAX_FORMATTED_TIMESTAMP) {
        return fmt::format("{:.0f}", timestamp);
    }
    const auto days = static_cast<int>(std::floor(timestamp / SECONDS_PER_DAY));
    const std::chrono::year_month_day ymd{
        std::chrono::sys_days{std::chrono::days{days}}};
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

}  // namespace quantcore
