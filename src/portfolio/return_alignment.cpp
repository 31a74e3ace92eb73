/// @file src/portfolio/return_alignment.cpp
/// @brief Timestamp inner join of several price series into a return matrix.

#include "quantcore/errors.hpp"
#include "quantcore/portfolio.hpp"
#include "quantcore/series.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace quantcore::portfolio {

ReturnMatrix align_returns(std::span<const std::string> symbols,
                           std::span<const PriceSeries> histories) {
    if (symbols.empty()) {
        throw InvalidParameterError("align_returns: no symbols given");
    }
    if (symbols.size() != histories.size()) {
        throw InvalidParameterError(fmt::format(
            "align_returns: {} symbols for {} price series",
            symbols.size(), histories.size()));
    }

    // Timestamps are strictly ascending in every series, so membership is a
    // binary search.
    std::vector<double> common;
    for (double ts : histories.front().timestamps()) {
        const bool everywhere = std::all_of(
            histories.begin() + 1, histories.end(), [ts](const PriceSeries& s) {
                const auto t = s.timestamps();
                return std::binary_search(t.begin(), t.end(), ts);
            });
        if (everywhere) common.push_back(ts);
    }

    if (common.size() < constants::MIN_PRICE_OBSERVATIONS) {
        throw InsufficientDataError("aligned prices", constants::MIN_PRICE_OBSERVATIONS,
                                    common.size());
    }

    const auto rows = static_cast<Eigen::Index>(common.size() - 1);
    const auto cols = static_cast<Eigen::Index>(histories.size());
    Matrix returns(rows, cols);

    std::vector<double> prices(common.size());
    for (Eigen::Index j = 0; j < cols; ++j) {
        const auto& s  = histories[static_cast<std::size_t>(j)];
        const auto  ts = s.timestamps();
        std::size_t cursor = 0;
        for (std::size_t i = 0; i < common.size(); ++i) {
            while (ts[cursor] < common[i]) ++cursor;
            prices[i] = s.close_at(cursor);
        }
        const ReturnSeries r = series::returns(prices);
        for (Eigen::Index i = 0; i < rows; ++i) {
            returns(i, j) = r[static_cast<std::size_t>(i)];
        }
    }

    return ReturnMatrix{
        .symbols = std::vector<std::string>(symbols.begin(), symbols.end()),
        .returns = std::move(returns),
    };
}

}  // namespace quantcore::portfolio
