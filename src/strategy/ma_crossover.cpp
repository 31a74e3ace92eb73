/// @file src/strategy/ma_crossover.cpp
/// @brief Moving-average crossover simulation.

#include "quantcore/strategy.hpp"
#include "quantcore/errors.hpp"
#include "quantcore/series.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <numeric>

namespace quantcore::strategy {

// ─── StrategyParams ───────────────────────────────────────────────────────────

void StrategyParams::validate() const {
    if (fast_window < 1 || slow_window < 1) {
        throw InvalidParameterError(fmt::format(
            "moving-average windows must be >= 1, got {}", to_string()));
    }
    if (fast_window >= slow_window) {
        throw InvalidParameterError(fmt::format(
            "fast window must be shorter than slow window, got {}", to_string()));
    }
}

std::string StrategyParams::to_string() const {
    return fmt::format("({}, {})", fast_window, slow_window);
}

double SimulationResult::return_sum() const noexcept {
    return std::accumulate(strategy_returns.begin(), strategy_returns.end(), 0.0);
}

// ─── simple_moving_average ────────────────────────────────────────────────────

std::vector<double>
simple_moving_average(std::span<const double> values, int window) {
    if (window < 1) {
        throw InvalidParameterError(fmt::format(
            "moving-average window must be >= 1, got {}", window));
    }

    const auto w = static_cast<std::size_t>(window);
    std::vector<double> out(values.size(), std::numeric_limits<double>::quiet_NaN());

    // Compensated sliding sum; entry t covers values[t − w + 1 .. t]. A window
    // holding one repeated value yields that value exactly, so equal inputs
    // give equal averages for every window length.
    double sum  = 0.0;
    double comp = 0.0;
    const auto add = [&](double x) {
        const double y = x - comp;
        const double s = sum + y;
        comp = (s - sum) - y;
        sum  = s;
    };

    std::size_t run = 0;
    for (std::size_t t = 0; t < values.size(); ++t) {
        add(values[t]);
        if (t >= w) {
            add(-values[t - w]);
        }
        run = (t > 0 && values[t] == values[t - 1]) ? run + 1 : 1;
        if (t + 1 >= w) {
            out[t] = (run >= w) ? values[t] : sum / static_cast<double>(w);
        }
    }
    return out;
}

// ─── MovingAverageCrossover ───────────────────────────────────────────────────

MovingAverageCrossover::MovingAverageCrossover(StrategyParams params,
                                               SimulationConfig config)
    : params_(params)
    , config_(config) {
    params_.validate();
    if (!std::isfinite(config_.cost_rate) || config_.cost_rate < 0.0) {
        throw InvalidParameterError(fmt::format(
            "cost rate must be a finite non-negative value, got {}",
            config_.cost_rate));
    }
}

SimulationResult
MovingAverageCrossover::simulate(std::span<const double> closes) const {
    SimulationResult out;

    // Validates length and price positivity before any indicator work.
    out.market_returns = series::returns(closes);

    const std::size_t n = closes.size();
    out.fast_ma = simple_moving_average(closes, params_.fast_window);
    out.slow_ma = simple_moving_average(closes, params_.slow_window);

    // ── Raw signal: NaN comparisons are false, so warm-up stays flat ─────────
    out.signal.assign(n, 0);
    for (std::size_t t = 0; t < n; ++t) {
        out.signal[t] = (out.fast_ma[t] > out.slow_ma[t]) ? 1 : 0;
    }

    // ── Lag by one period: position[t] only sees prices[0..t−1] ──────────────
    out.position.assign(n, 0);
    for (std::size_t t = 1; t < n; ++t) {
        out.position[t] = out.signal[t - 1];
    }

    // ── Strategy returns for periods 1..n−1, net of flip costs ──────────────
    out.strategy_returns.resize(n - 1);
    for (std::size_t t = 1; t < n; ++t) {
        const int change = std::abs(out.signal[t] - out.signal[t - 1]);
        if (change != 0) {
            ++out.flips;
        }
        out.strategy_returns[t - 1] =
            out.market_returns[t - 1] * static_cast<double>(out.position[t])
            - config_.cost_rate * static_cast<double>(change);
    }

    return out;
}

SimulationResult simulate(std::span<const double> closes,
                          int fast_window,
                          int slow_window,
                          SimulationConfig config) {
    const MovingAverageCrossover rule(
        StrategyParams{.fast_window = fast_window, .slow_window = slow_window},
        config);
    return rule.simulate(closes);
}

}  // namespace quantcore::strategy
