/// @file src/backtest/backtester.cpp
/// @brief Implementation of the Backtester class.
///
/// The Backtester orchestrates:
///   1. Crossover simulation via MovingAverageCrossover
///   2. Metric evaluation of the net strategy returns

#include "quantcore/backtest.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <utility>

namespace quantcore::backtest {

Backtester::Backtester(BacktestConfig config)
    : config_(config) {}

BacktestRun Backtester::run(const PriceSeries& prices,
                            strategy::StrategyParams params) const {
    const strategy::MovingAverageCrossover rule(
        params, strategy::SimulationConfig{.cost_rate = config_.cost_rate});

    auto simulation = rule.simulate(prices.closes());
    auto result     = metrics(simulation.strategy_returns, config_.annualisation);

    if (config_.verbose) {
        fmt::print(stderr, "[backtest] params={} bars={} flips={} {}\n",
                   params.to_string(), prices.size(), simulation.flips,
                   result.to_string());
    }

    return BacktestRun{
        .params     = params,
        .simulation = std::move(simulation),
        .metrics    = result,
    };
}

}  // namespace quantcore::backtest
