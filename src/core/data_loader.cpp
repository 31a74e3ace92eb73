/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for OHLCV market data.

#include "quantcore/data_loader.hpp"
#include "quantcore/dates.hpp"
#include "quantcore/errors.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace quantcore::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<double> parse_number(std::string_view token) noexcept {
    double val = 0.0;
    const auto* end = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), end, val);
    if (ec != std::errc{} || ptr != end || !std::isfinite(val)) {
        return std::nullopt;
    }
    return val;
}

std::optional<double> parse_timestamp(std::string_view token) noexcept {
    if (token.size() == 10 && token[4] == '-' && token[7] == '-') {
        try {
            return parse_iso_date(token);
        } catch (const InvalidParameterError&) {
            return std::nullopt;
        }
    }
    return parse_number(token);
}

}  // namespace

// ─── DataLoader::validate_bar ─────────────────────────────────────────────────

bool DataLoader::validate_bar(const OHLCV& bar) noexcept {
    if (!std::isfinite(bar.timestamp) ||
        !std::isfinite(bar.open)      ||
        !std::isfinite(bar.high)      ||
        !std::isfinite(bar.low)       ||
        !std::isfinite(bar.close)     ||
        !std::isfinite(bar.volume)) {
        return false;
    }

    if (bar.high < bar.low)   return false;
    if (bar.open  > bar.high) return false;
    if (bar.open  < bar.low)  return false;
    if (bar.close > bar.high) return false;
    if (bar.close < bar.low)  return false;

    // Returns are undefined on a non-positive close.
    if (bar.close <= 0.0) return false;

    if (bar.volume < 0.0) return false;

    return true;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<OHLCV> DataLoader::parse_row(std::string_view line) noexcept {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    std::vector<std::string_view> tokens;
    tokens.reserve(6);
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        const auto token = trim(line.substr(start, comma - start));
        if (token.empty()) return std::nullopt;
        tokens.push_back(token);
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    if (tokens.size() != 6 && tokens.size() != 2) {
        return std::nullopt;
    }

    const auto ts = parse_timestamp(tokens[0]);
    if (!ts) return std::nullopt;

    OHLCV bar{};
    if (tokens.size() == 2) {
        const auto close = parse_number(tokens[1]);
        if (!close) return std::nullopt;
        bar = OHLCV{
            .timestamp = *ts,
            .open      = *close,
            .high      = *close,
            .low       = *close,
            .close     = *close,
            .volume    = 0.0,
        };
    } else {
        std::array<double, 5> fields{};
        for (std::size_t i = 0; i < fields.size(); ++i) {
            const auto v = parse_number(tokens[i + 1]);
            if (!v) return std::nullopt;
            fields[i] = *v;
        }
        bar = OHLCV{
            .timestamp = *ts,
            .open      = fields[0],
            .high      = fields[1],
            .low       = fields[2],
            .close     = fields[3],
            .volume    = fields[4],
        };
    }

    if (!validate_bar(bar)) {
        return std::nullopt;
    }
    return bar;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

std::vector<OHLCV>
DataLoader::parse_csv_string(std::string_view csv_content) noexcept {
    std::vector<OHLCV> bars;
    bool header_skipped = false;

    std::size_t start = 0;
    while (start < csv_content.size()) {
        auto newline = csv_content.find('\n', start);
        if (newline == std::string_view::npos) newline = csv_content.size();
        const auto line = trim(csv_content.substr(start, newline - start));
        start = newline + 1;

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line.front() != '#') {
                header_skipped = true;
            }
            continue;
        }

        if (auto bar = parse_row(line)) {
            bars.push_back(*bar);
        }
    }

    return bars;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<std::vector<OHLCV>>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace quantcore::core
