/// @file src/core/price_provider.cpp
/// @brief In-memory and CSV-directory price providers.

#include "quantcore/price_provider.hpp"
#include "quantcore/data_loader.hpp"
#include "quantcore/dates.hpp"
#include "quantcore/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <utility>

namespace quantcore::core {

// ─── DateRange ────────────────────────────────────────────────────────────────

DateRange DateRange::parse(std::string_view start_iso, std::string_view end_iso) {
    DateRange range{
        .start = parse_iso_date(start_iso),
        .end   = parse_iso_date(end_iso),
    };
    if (range.start > range.end) {
        throw InvalidParameterError(fmt::format(
            "start date {} is after end date {}", start_iso, end_iso));
    }
    return range;
}

// ─── Conversion ───────────────────────────────────────────────────────────────

PriceSeries to_price_series(std::vector<OHLCV> bars, const DateRange& range) {
    std::erase_if(bars, [&](const OHLCV& b) { return !range.contains(b.timestamp); });

    // Stable sort keeps arrival order among equal timestamps, so the last
    // arrival of each timestamp is the one kept below.
    std::stable_sort(bars.begin(), bars.end(), [](const OHLCV& a, const OHLCV& b) {
        return a.timestamp < b.timestamp;
    });

    std::vector<double> timestamps;
    std::vector<double> closes;
    timestamps.reserve(bars.size());
    closes.reserve(bars.size());
    for (const auto& bar : bars) {
        if (!timestamps.empty() && timestamps.back() == bar.timestamp) {
            closes.back() = bar.close;
            continue;
        }
        timestamps.push_back(bar.timestamp);
        closes.push_back(bar.close);
    }
    return PriceSeries(std::move(timestamps), std::move(closes));
}

// ─── InMemoryPriceProvider ────────────────────────────────────────────────────

void InMemoryPriceProvider::add(const std::string& symbol, std::vector<OHLCV> bars) {
    bars_[symbol] = std::move(bars);
}

void InMemoryPriceProvider::add_closes(const std::string& symbol,
                                       const std::vector<double>& closes) {
    std::vector<OHLCV> bars;
    bars.reserve(closes.size());
    for (std::size_t i = 0; i < closes.size(); ++i) {
        const double c = closes[i];
        bars.push_back(OHLCV{
            .timestamp = static_cast<double>(i),
            .open      = c,
            .high      = c,
            .low       = c,
            .close     = c,
            .volume    = 0.0,
        });
    }
    add(symbol, std::move(bars));
}

PriceSeries InMemoryPriceProvider::fetch(const std::string& symbol,
                                         const DateRange& range) const {
    const auto it = bars_.find(symbol);
    if (it == bars_.end()) return PriceSeries{};
    return to_price_series(it->second, range);
}

// ─── CsvPriceProvider ─────────────────────────────────────────────────────────

CsvPriceProvider::CsvPriceProvider(std::string directory, bool verbose)
    : directory_(std::move(directory)), verbose_(verbose) {}

std::string CsvPriceProvider::path_for(const std::string& symbol) const {
    return (std::filesystem::path(directory_) / (symbol + ".csv")).string();
}

PriceSeries CsvPriceProvider::fetch(const std::string& symbol,
                                    const DateRange& range) const {
    const std::string path = path_for(symbol);
    auto bars = DataLoader::load_csv(path);
    if (!bars) {
        if (verbose_) {
            fmt::print(stderr, "[data] cannot open {}\n", path);
        }
        return PriceSeries{};
    }
    if (verbose_) {
        fmt::print(stderr, "[data] {}: {} valid bars from {}\n",
                   symbol, bars->size(), path);
    }
    return to_price_series(std::move(*bars), range);
}

}  // namespace quantcore::core
