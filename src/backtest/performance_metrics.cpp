/// @file src/backtest/performance_metrics.cpp
/// @brief PerformanceCalculator and BacktestResult formatting.

#include "quantcore/backtest.hpp"
#include "quantcore/constants.hpp"
#include "quantcore/errors.hpp"
#include "quantcore/series.hpp"

#include <fmt/format.h>

#include <cmath>
#include <numeric>

namespace quantcore::backtest {

namespace {

void require_finite(const char* context, std::span<const double> v) {
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (!std::isfinite(v[i])) {
            throw DegenerateInputError(fmt::format(
                "{}: non-finite return at index {}", context, i));
        }
    }
}

}  // namespace

// ─── Statistics helpers ───────────────────────────────────────────────────────

double PerformanceCalculator::mean(std::span<const double> v) noexcept {
    const double sum = std::accumulate(v.begin(), v.end(), 0.0);
    return sum / static_cast<double>(v.size());
}

double PerformanceCalculator::stddev(std::span<const double> v,
                                     double mean_val) noexcept {
    // Bessel-corrected, matching the mean taken over the same series.
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mean_val;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / static_cast<double>(v.size() - 1));
}

// ─── Metrics ──────────────────────────────────────────────────────────────────

double PerformanceCalculator::total_return(std::span<const double> returns) {
    const auto equity = series::equity_curve(returns);
    return equity.back() - 1.0;
}

double PerformanceCalculator::sharpe(std::span<const double> returns,
                                     double annualisation) {
    if (returns.size() < constants::MIN_METRIC_RETURNS) {
        throw InsufficientDataError("sharpe", constants::MIN_METRIC_RETURNS,
                                    returns.size());
    }
    if (!std::isfinite(annualisation) || annualisation <= 0.0) {
        throw InvalidParameterError(fmt::format(
            "sharpe: annualisation factor must be positive, got {}", annualisation));
    }
    require_finite("sharpe", returns);

    const double mu = mean(returns);
    const double sd = stddev(returns, mu);

    if (sd <= constants::ZERO_VARIANCE_EPSILON) return 0.0;

    return mu / sd * std::sqrt(annualisation);
}

double PerformanceCalculator::max_drawdown(std::span<const double> returns) {
    const auto equity = series::equity_curve(returns);
    return series::max_drawdown(equity);
}

BacktestResult metrics(std::span<const double> strategy_returns,
                       double annualisation) {
    if (strategy_returns.size() < constants::MIN_METRIC_RETURNS) {
        throw InsufficientDataError("metrics", constants::MIN_METRIC_RETURNS,
                                    strategy_returns.size());
    }

    return BacktestResult{
        .total_return = PerformanceCalculator::total_return(strategy_returns),
        .sharpe_ratio = PerformanceCalculator::sharpe(strategy_returns, annualisation),
        .max_drawdown = PerformanceCalculator::max_drawdown(strategy_returns),
        .periods      = strategy_returns.size(),
    };
}

// ─── BacktestResult ───────────────────────────────────────────────────────────

std::string BacktestResult::to_string() const {
    return fmt::format(
        "Total Return: {:.2f}%  Sharpe Ratio: {:.2f}  Max Drawdown: {:.2f}%",
        total_return * 100.0, sharpe_ratio, max_drawdown * 100.0);
}

}  // namespace quantcore::backtest
