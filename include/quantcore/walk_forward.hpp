#pragma once

/// @file include/quantcore/walk_forward.hpp
/// @brief Walk-Forward Optimizer public API.
///
/// # Module: Walk-Forward Optimizer
///
/// ## Responsibility
/// Partition a price history into sequential train/test windows, grid-search
/// the crossover parameters on each train slice, apply the winner to the
/// adjacent test slice and aggregate the out-of-sample returns.
///
/// ## Window Layout
/// ```
///   start = 0, test, 2·test, ...
///   train = [start, start + train_periods)
///   test  = [start + train_periods, start + train_periods + test_periods)
///   stop when start + train_periods + test_periods > len(prices)
/// ```
/// The train window rolls with a fixed length (it never expands) and test
/// windows never overlap.
///
/// ## Selection
/// Candidates are scored by the sum of their in-sample period returns. A
/// candidate replaces the incumbent only with a strictly higher score, so ties
/// go to the earlier grid entry. The test slice is simulated on its own: its
/// moving averages warm up inside the slice.
///
/// ## Aggregation
/// `Aggregation::Additive` (default) sums the per-window test returns without
/// compounding. `Aggregation::Compounded` multiplies (1 + test_return) instead.

#include "quantcore/constants.hpp"
#include "quantcore/strategy.hpp"
#include "quantcore/types.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace quantcore::walkforward {

using strategy::StrategyParams;

// ─── ParameterGrid ────────────────────────────────────────────────────────────

/// Finite, validated set of crossover candidates in evaluation order.
class ParameterGrid {
public:
    /// Throws `InvalidParameterError` if the list is empty or any entry
    /// violates 1 ≤ fast < slow.
    explicit ParameterGrid(std::vector<StrategyParams> candidates);

    /// Cartesian product of `fasts` × `slows` (fast-major order), skipping
    /// pairs with fast ≥ slow. Throws if no valid pair remains.
    [[nodiscard]] static ParameterGrid cartesian(std::span<const int> fasts,
                                                 std::span<const int> slows);

    /// {10, 20, 50} × {50, 100, 200}.
    [[nodiscard]] static ParameterGrid default_grid();

    [[nodiscard]] std::span<const StrategyParams> candidates() const noexcept {
        return candidates_;
    }
    [[nodiscard]] std::size_t size() const noexcept { return candidates_.size(); }

    [[nodiscard]] auto begin() const noexcept { return candidates_.begin(); }
    [[nodiscard]] auto end()   const noexcept { return candidates_.end(); }

private:
    std::vector<StrategyParams> candidates_;
};

// ─── Types ────────────────────────────────────────────────────────────────────

/// Half-open index range [begin, end) into the price series.
struct IndexRange {
    std::size_t begin;
    std::size_t end;

    [[nodiscard]] std::size_t size() const noexcept { return end - begin; }
};

enum class Aggregation {
    Additive,    ///< Σ test_return
    Compounded,  ///< Π(1 + test_return) − 1
};

[[nodiscard]] std::string to_string(Aggregation mode);

/// One train/test step.
struct WalkForwardWindow {
    IndexRange     train_range;
    IndexRange     test_range;
    StrategyParams chosen_params;
    double         train_score;      ///< In-sample return sum of the winner
    double         test_return;      ///< Out-of-sample return sum
    double         test_start_time;  ///< Timestamp of the first test price
    double         test_end_time;    ///< Timestamp of the last test price
};

struct WalkForwardResult {
    std::vector<WalkForwardWindow> windows;
    double                         total_return = 0.0;
    Aggregation                    aggregation  = Aggregation::Additive;

    /// One line per window plus the aggregate.
    [[nodiscard]] std::string to_string() const;
};

/// Walk-forward settings.
struct WalkForwardConfig {
    std::size_t train_periods =
        constants::DEFAULT_TRAIN_MONTHS * constants::TRADING_DAYS_PER_MONTH;
    std::size_t test_periods  =
        constants::DEFAULT_TEST_MONTHS * constants::TRADING_DAYS_PER_MONTH;

    /// Cost applied while scoring and testing candidates.
    double      cost_rate     = constants::DEFAULT_WALK_FORWARD_COST_RATE;
    Aggregation aggregation   = Aggregation::Additive;
    bool        verbose       = false;
};

// ─── WalkForwardOptimizer ─────────────────────────────────────────────────────

class WalkForwardOptimizer {
public:
    /// Throws `InvalidParameterError` for `train_periods < 2`,
    /// `test_periods < 1` or a negative / non-finite cost rate.
    explicit WalkForwardOptimizer(WalkForwardConfig config = WalkForwardConfig{});

    /// Run the full walk-forward analysis.
    ///
    /// # Returns
    /// Ordered windows and the aggregate out-of-sample return. A history too
    /// short for a single window yields no windows and a zero aggregate.
    [[nodiscard]] WalkForwardResult run(const PriceSeries& prices,
                                        const ParameterGrid& grid) const;

    /// Sum of the net strategy returns of `params` on `closes`.
    /// A slice with fewer than two closes has no periods and scores 0.
    [[nodiscard]] double score(std::span<const double> closes,
                               const StrategyParams& params) const;

    [[nodiscard]] const WalkForwardConfig& config() const noexcept { return config_; }

private:
    WalkForwardConfig config_;
};

/// `WalkForwardOptimizer` with the given window sizes and default settings
/// otherwise.
[[nodiscard]] WalkForwardResult walk_forward(const PriceSeries& prices,
                                             std::size_t train_periods,
                                             std::size_t test_periods,
                                             const ParameterGrid& grid);

/// Convert month counts to daily periods (21 trading days per month).
[[nodiscard]] std::size_t months_to_periods(
    int months,
    std::size_t trading_days_per_month = constants::TRADING_DAYS_PER_MONTH);

}  // namespace quantcore::walkforward
