/// @file src/core/engine.cpp
/// @brief Caller-facing engine and report formatting.

#include "quantcore/engine.hpp"
#include "quantcore/errors.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <utility>

namespace quantcore::core {

// ─── Reports ──────────────────────────────────────────────────────────────────

std::string BacktestReport::to_string() const {
    const auto& m = run.metrics;
    return fmt::format(
        "Backtest Results ({} {}/{}){}:\n"
        "Total Return: {:.2f}%\n"
        "Sharpe Ratio: {:.2f}\n"
        "Max Drawdown: {:.2f}%\n"
        "Trades: {}",
        symbol, params.fast_window, params.slow_window,
        cost_rate > 0.0 ? " w/ Costs" : "",
        m.total_return * 100.0,
        m.sharpe_ratio,
        m.max_drawdown * 100.0,
        run.simulation.flips);
}

std::string WalkForwardReport::to_string() const {
    return fmt::format("{} (train {} / test {} periods)\n{}",
                       symbol, train_periods, test_periods, result.to_string());
}

std::string to_string(AllocationScheme scheme) {
    switch (scheme) {
        case AllocationScheme::MaxSharpe:  return "Max Sharpe";
        case AllocationScheme::RiskParity: return "Risk Parity";
    }
    return "Unknown";
}

std::string AllocationReport::to_string() const {
    const std::string header = (scheme == AllocationScheme::MaxSharpe)
        ? fmt::format("Optimal Weights ({}): {}", core::to_string(scheme),
                      weights.to_string(constants::WEIGHT_DISPLAY_THRESHOLD))
        : fmt::format("{} Weights: {}", core::to_string(scheme), weights.to_string());
    return fmt::format(
        "{}\nExpected Return: {:.2f}%  Volatility: {:.2f}%  Sharpe Ratio: {:.2f}",
        header,
        stats.expected_return * 100.0,
        stats.volatility * 100.0,
        stats.sharpe_ratio);
}

// ─── Engine ───────────────────────────────────────────────────────────────────

Engine::Engine(const PriceProvider& provider, EngineConfig config)
    : provider_(provider), config_(std::move(config)) {}

PriceSeries Engine::fetch(const std::string& symbol, const DateRange& range) const {
    PriceSeries prices = provider_.fetch(symbol, range);
    if (prices.empty()) {
        throw InsufficientDataError(fmt::format("no data for '{}'", symbol),
                                    constants::MIN_PRICE_OBSERVATIONS, 0);
    }
    if (config_.verbose) {
        fmt::print(stderr, "[engine] {}: {} observations\n", symbol, prices.size());
    }
    return prices;
}

BacktestReport Engine::backtest(const std::string& symbol,
                                const DateRange& range,
                                strategy::StrategyParams params) const {
    const PriceSeries prices = fetch(symbol, range);
    const backtest::Backtester backtester(config_.backtest);
    return BacktestReport{
        .symbol    = symbol,
        .params    = params,
        .cost_rate = config_.backtest.cost_rate,
        .run       = backtester.run(prices, params),
    };
}

WalkForwardReport Engine::walk_forward(const std::string& symbol,
                                       const DateRange& range,
                                       std::size_t train_periods,
                                       std::size_t test_periods,
                                       const walkforward::ParameterGrid& grid) const {
    const PriceSeries prices = fetch(symbol, range);

    walkforward::WalkForwardConfig wf = config_.walk_forward;
    wf.train_periods = train_periods;
    wf.test_periods  = test_periods;
    const walkforward::WalkForwardOptimizer optimizer(wf);

    return WalkForwardReport{
        .symbol        = symbol,
        .train_periods = train_periods,
        .test_periods  = test_periods,
        .result        = optimizer.run(prices, grid),
    };
}

WalkForwardReport Engine::walk_forward_months(const std::string& symbol,
                                              const DateRange& range,
                                              int train_months,
                                              int test_months,
                                              const walkforward::ParameterGrid& grid) const {
    return walk_forward(
        symbol, range,
        walkforward::months_to_periods(train_months, config_.trading_days_per_month),
        walkforward::months_to_periods(test_months, config_.trading_days_per_month),
        grid);
}

portfolio::ReturnMatrix Engine::load_returns(std::span<const std::string> symbols,
                                             const DateRange& range) const {
    if (symbols.empty()) {
        throw InvalidParameterError("at least one symbol is required");
    }
    std::vector<PriceSeries> series;
    series.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        series.push_back(fetch(symbol, range));
    }
    return portfolio::align_returns(symbols, series);
}

AllocationReport Engine::max_sharpe(std::span<const std::string> symbols,
                                    const DateRange& range) const {
    const auto matrix = load_returns(symbols, range);
    const portfolio::PortfolioOptimizer optimizer(config_.portfolio);
    auto weights = optimizer.max_sharpe_weights(matrix);
    const auto stats = optimizer.evaluate(matrix, weights);
    return AllocationReport{
        .scheme  = AllocationScheme::MaxSharpe,
        .weights = std::move(weights),
        .stats   = stats,
        .periods = static_cast<std::size_t>(matrix.periods()),
    };
}

AllocationReport Engine::risk_parity(std::span<const std::string> symbols,
                                     const DateRange& range) const {
    const auto matrix = load_returns(symbols, range);
    const portfolio::PortfolioOptimizer optimizer(config_.portfolio);
    auto weights = optimizer.risk_parity_weights(matrix);
    const auto stats = optimizer.evaluate(matrix, weights);
    return AllocationReport{
        .scheme  = AllocationScheme::RiskParity,
        .weights = std::move(weights),
        .stats   = stats,
        .periods = static_cast<std::size_t>(matrix.periods()),
    };
}

}  // namespace quantcore::core
