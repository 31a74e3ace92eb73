/// @file src/series/return_series.cpp
/// @brief Returns, equity curve and drawdown derivations.

#include "quantcore/series.hpp"
#include "quantcore/constants.hpp"
#include "quantcore/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace quantcore::series {

namespace {

void require_observations(const char* context, std::size_t observations) {
    if (observations < constants::MIN_PRICE_OBSERVATIONS) {
        throw InsufficientDataError(context, constants::MIN_PRICE_OBSERVATIONS,
                                    observations);
    }
}

}  // namespace

// ─── returns ──────────────────────────────────────────────────────────────────

ReturnSeries returns(std::span<const double> prices) {
    require_observations("returns", prices.size());

    for (std::size_t i = 0; i < prices.size(); ++i) {
        if (!std::isfinite(prices[i]) || prices[i] <= 0.0) {
            throw DegenerateInputError(fmt::format(
                "returns: price {} at index {} is not a positive finite value",
                prices[i], i));
        }
    }

    ReturnSeries out(prices.size() - 1);
    for (std::size_t i = 0; i + 1 < prices.size(); ++i) {
        out[i] = prices[i + 1] / prices[i] - 1.0;
    }
    return out;
}

// ─── equity_curve ─────────────────────────────────────────────────────────────

EquityCurve equity_curve(std::span<const double> returns) {
    // n returns describe n + 1 observations.
    require_observations("equity_curve", returns.size() + 1);

    EquityCurve equity;
    equity.reserve(returns.size() + 1);
    equity.push_back(1.0);

    double value = 1.0;
    for (std::size_t i = 0; i < returns.size(); ++i) {
        if (!std::isfinite(returns[i])) {
            throw DegenerateInputError(fmt::format(
                "equity_curve: non-finite return at index {}", i));
        }
        value *= (1.0 + returns[i]);
        equity.push_back(value);
    }
    return equity;
}

// ─── drawdown ─────────────────────────────────────────────────────────────────

std::vector<double> drawdown(std::span<const double> equity) {
    require_observations("drawdown", equity.size());

    std::vector<double> out(equity.size());
    double peak = equity.front();
    for (std::size_t t = 0; t < equity.size(); ++t) {
        if (!std::isfinite(equity[t])) {
            throw DegenerateInputError(fmt::format(
                "drawdown: non-finite equity at index {}", t));
        }
        peak = std::max(peak, equity[t]);
        if (peak <= 0.0) {
            throw DegenerateInputError(fmt::format(
                "drawdown: running peak {} at index {} is not positive", peak, t));
        }
        out[t] = equity[t] / peak - 1.0;
    }
    return out;
}

double max_drawdown(std::span<const double> equity) {
    const auto dd = drawdown(equity);
    // drawdown[0] is always 0, so the minimum is ≤ 0.
    return *std::min_element(dd.begin(), dd.end());
}

}  // namespace quantcore::series
