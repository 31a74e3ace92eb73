#pragma once

/// @file include/quantcore/strategy.hpp
/// @brief Moving-average crossover Strategy Simulator public API.
///
/// # Module: Strategy Simulator
///
/// ## Responsibility
/// Apply a long/flat moving-average crossover rule to a close-price series
/// and produce the position series and per-period strategy returns, net of a
/// per-flip transaction cost.
///
/// ## The Rule
///   fast_MA[t], slow_MA[t]  simple moving averages, undefined for the first
///                           window − 1 observations (no signal → flat)
///   signal[t]   = 1  if both averages are defined and fast_MA[t] > slow_MA[t]
///               = 0  otherwise
///   position[t] = signal[t−1],  position[0] = 0
///   strat[t]    = market_return[t] · position[t]
///                 − cost_rate · |signal[t] − signal[t−1]|
///
/// A signal computed from the close at t can only change the position held
/// over period t+1: `position[t]` depends on prices[0..t−1] only.
///
/// ## Alignment
/// `signal`, `position`, `fast_ma` and `slow_ma` have one entry per price.
/// `market_returns` and `strategy_returns` have one entry per period t = 1..n−1
/// (element i describes period i + 1).

#include "quantcore/types.hpp"
#include "quantcore/constants.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace quantcore::strategy {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Crossover windows; invariant 1 ≤ fast_window < slow_window.
struct StrategyParams {
    int fast_window;
    int slow_window;

    /// Throws `InvalidParameterError` when the invariant does not hold.
    void validate() const;

    /// "(fast, slow)"
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const StrategyParams&, const StrategyParams&) = default;
};

/// Simulation settings.
struct SimulationConfig {
    /// Charged per unit change of the signal (0.001 = 10 bps per flip).
    double cost_rate = constants::DEFAULT_COST_RATE;
};

/// Full trace of one simulation.
struct SimulationResult {
    std::vector<double> fast_ma;           ///< NaN during warm-up
    std::vector<double> slow_ma;           ///< NaN during warm-up
    PositionSeries      signal;            ///< Raw crossover signal per price
    PositionSeries      position;          ///< signal lagged by one period
    ReturnSeries        market_returns;    ///< prices[t]/prices[t−1] − 1
    ReturnSeries        strategy_returns;  ///< Net of transaction costs
    std::size_t         flips = 0;         ///< Number of signal changes charged

    /// Sum of the per-period strategy returns.
    [[nodiscard]] double return_sum() const noexcept;
};

// ─── Indicators ───────────────────────────────────────────────────────────────

/// Simple moving average over `window` observations.
///
/// Output has the same length as `values`; the first `window − 1` entries are
/// NaN. Throws `InvalidParameterError` for `window < 1`.
[[nodiscard]] std::vector<double>
simple_moving_average(std::span<const double> values, int window);

// ─── MovingAverageCrossover ───────────────────────────────────────────────────

/// Long/flat crossover simulator bound to one parameter pair.
///
/// ```cpp
/// MovingAverageCrossover rule({.fast_window = 10, .slow_window = 50});
/// auto sim = rule.simulate(prices.closes());
/// auto metrics = backtest::metrics(sim.strategy_returns);
/// ```
class MovingAverageCrossover {
public:
    /// Validates `params` and `config.cost_rate` (finite, ≥ 0).
    explicit MovingAverageCrossover(StrategyParams params,
                                    SimulationConfig config = SimulationConfig{});

    /// Run the rule over a close series.
    ///
    /// # Returns
    /// The full simulation trace. When `slow_window ≥ closes.size()` the slow
    /// average never forms and the strategy stays flat with zero returns.
    ///
    /// # Throws
    /// `InsufficientDataError` for fewer than two closes,
    /// `DegenerateInputError` for non-positive or non-finite closes.
    [[nodiscard]] SimulationResult simulate(std::span<const double> closes) const;

    [[nodiscard]] const StrategyParams&   params() const noexcept { return params_; }
    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }

private:
    StrategyParams   params_;
    SimulationConfig config_;
};

/// Convenience wrapper: `MovingAverageCrossover({fast, slow}, config).simulate(closes)`.
[[nodiscard]] SimulationResult simulate(std::span<const double> closes,
                                        int fast_window,
                                        int slow_window,
                                        SimulationConfig config = SimulationConfig{});

}  // namespace quantcore::strategy
