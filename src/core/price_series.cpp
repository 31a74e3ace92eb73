/// @file src/core/price_series.cpp
/// @brief PriceSeries construction and slicing.

#include "quantcore/types.hpp"
#include "quantcore/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace quantcore {

PriceSeries::PriceSeries(std::vector<double> timestamps, std::vector<double> closes)
    : timestamps_(std::move(timestamps))
    , closes_(std::move(closes)) {
    if (timestamps_.size() != closes_.size()) {
        throw InvalidParameterError(fmt::format(
            "PriceSeries: {} timestamps for {} closes",
            timestamps_.size(), closes_.size()));
    }
    for (std::size_t i = 1; i < timestamps_.size(); ++i) {
        if (!(timestamps_[i] > timestamps_[i - 1])) {
            throw InvalidParameterError(fmt::format(
                "PriceSeries: timestamp {} at index {} does not follow {}",
                timestamps_[i], i, timestamps_[i - 1]));
        }
    }
}

PriceSeries PriceSeries::from_bars(std::span<const OHLCV> bars) {
    std::vector<double> ts;
    std::vector<double> closes;
    ts.reserve(bars.size());
    closes.reserve(bars.size());
    for (const auto& bar : bars) {
        ts.push_back(bar.timestamp);
        closes.push_back(bar.close);
    }
    return PriceSeries(std::move(ts), std::move(closes));
}

PriceSeries PriceSeries::from_closes(std::vector<double> closes) {
    std::vector<double> ts(closes.size());
    for (std::size_t i = 0; i < ts.size(); ++i) {
        ts[i] = static_cast<double>(i);
    }
    return PriceSeries(std::move(ts), std::move(closes));
}

PriceSeries PriceSeries::slice(std::size_t begin, std::size_t count) const {
    const std::size_t first = std::min(begin, closes_.size());
    const std::size_t last  = first + std::min(count, closes_.size() - first);
    const auto offset_first = static_cast<std::ptrdiff_t>(first);
    const auto offset_last  = static_cast<std::ptrdiff_t>(last);
    return PriceSeries(
        std::vector<double>(timestamps_.begin() + offset_first,
                            timestamps_.begin() + offset_last),
        std::vector<double>(closes_.begin() + offset_first,
                            closes_.begin() + offset_last));
}

}  // namespace quantcore
