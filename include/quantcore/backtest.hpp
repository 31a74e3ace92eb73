#pragma once

/// @file include/quantcore/backtest.hpp
/// @brief Performance Metrics and single-run Backtester public API.
///
/// # Module: Performance Metrics
///
/// ## Responsibility
/// Reduce a strategy's per-period return series to total return, annualised
/// Sharpe ratio and maximum drawdown, and run a single crossover backtest
/// over a price series.
///
/// ## Formulas
///   total_return = Π(1 + r) − 1
///   sharpe       = mean(r) / σ(r) × √ann       σ: sample std-dev (n − 1)
///   max_drawdown = min_t ( equity[t] / peak[t] − 1 )   on the strategy equity
///
/// A zero-variance return series has no defined Sharpe ratio; it is reported
/// as 0.0 rather than raised. This is the only substituted value.
///
/// ## NOT Responsible For
/// - Signal generation (see quantcore/strategy.hpp)
/// - Parameter search (see quantcore/walk_forward.hpp)

#include "quantcore/constants.hpp"
#include "quantcore/strategy.hpp"
#include "quantcore/types.hpp"

#include <cstddef>
#include <span>
#include <string>

namespace quantcore::backtest {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Risk/return profile of one strategy return series.
struct BacktestResult {
    double      total_return;  ///< Compounded return over the whole series
    double      sharpe_ratio;  ///< Annualised; 0.0 for zero variance
    double      max_drawdown;  ///< Most negative drawdown (≤ 0)
    std::size_t periods;       ///< Number of strategy returns evaluated

    /// "Total Return: 12.27%  Sharpe Ratio: 1.23  Max Drawdown: -3.10%"
    [[nodiscard]] std::string to_string() const;
};

/// Configuration for a backtest run.
struct BacktestConfig {
    double cost_rate     = constants::DEFAULT_COST_RATE;
    double annualisation = constants::ANNUALISATION_FACTOR;
    bool   verbose       = false;
};

/// Simulation trace together with its metrics.
struct BacktestRun {
    strategy::StrategyParams   params;
    strategy::SimulationResult simulation;
    BacktestResult             metrics;
};

// ─── PerformanceCalculator ────────────────────────────────────────────────────

/// Stateless metric computations over `std::span<const double>`.
class PerformanceCalculator {
public:
    /// Π(1 + r) − 1. Throws `InsufficientDataError` on an empty series.
    [[nodiscard]] static double total_return(std::span<const double> returns);

    /// Annualised Sharpe ratio, 0.0 when σ is numerically zero.
    ///
    /// # Throws
    /// `InsufficientDataError` for fewer than two returns,
    /// `DegenerateInputError` for non-finite returns,
    /// `InvalidParameterError` for a non-positive annualisation factor.
    [[nodiscard]] static double
    sharpe(std::span<const double> returns,
           double annualisation = constants::ANNUALISATION_FACTOR);

    /// Maximum drawdown of the equity curve built from `returns`.
    [[nodiscard]] static double max_drawdown(std::span<const double> returns);

    /// Arithmetic mean. Caller guarantees a non-empty span.
    [[nodiscard]] static double mean(std::span<const double> v) noexcept;

    /// Sample std-dev around `mean_val`. Caller guarantees `v.size() >= 2`.
    [[nodiscard]] static double stddev(std::span<const double> v,
                                       double mean_val) noexcept;
};

/// All three metrics at once.
///
/// # Throws
/// `InsufficientDataError` when fewer than two returns are supplied.
[[nodiscard]] BacktestResult
metrics(std::span<const double> strategy_returns,
        double annualisation = constants::ANNUALISATION_FACTOR);

// ─── Backtester ───────────────────────────────────────────────────────────────

/// Runs the crossover simulator over a price series and scores it.
class Backtester {
public:
    explicit Backtester(BacktestConfig config = BacktestConfig{});

    /// Simulate `params` on `prices` and compute metrics.
    ///
    /// # Throws
    /// `InvalidParameterError` for invalid windows or cost rate,
    /// `InsufficientDataError` when the series yields fewer than two returns.
    [[nodiscard]] BacktestRun run(const PriceSeries& prices,
                                  strategy::StrategyParams params) const;

    [[nodiscard]] const BacktestConfig& config() const noexcept { return config_; }

private:
    BacktestConfig config_;
};

}  // namespace quantcore::backtest
