/**
 * @file  bench/bench_walk_forward.cpp
 * @brief Google Benchmark suite for the quantcore hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_SimpleMovingAverage    sliding-window SMA over n closes
 *   BM_Simulate               full crossover simulation
 *   BM_WalkForward            default grid, 12/3-month windows
 *   BM_MaxSharpe              constrained solver over k assets
 *   BM_RiskParity             closed-form inverse volatility
 *
 * Build (CMake):
 *   cmake -DQUANTCORE_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_walk_forward
 *   ./build/bench_walk_forward --benchmark_format=json
 *
 * Throughput units: items/second (prices or return rows processed).
 */

#include "benchmark/benchmark.h"

#include "quantcore/portfolio.hpp"
#include "quantcore/strategy.hpp"
#include "quantcore/walk_forward.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Deterministic trending zig-zag, strictly positive.
static std::vector<double> make_prices(std::size_t n) {
    std::vector<double> p(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        p[i] = 100.0 + 0.05 * t + 8.0 * std::sin(t / 17.0) + 3.0 * std::sin(t / 3.0);
    }
    return p;
}

static quantcore::portfolio::ReturnMatrix make_returns(Eigen::Index periods,
                                                       Eigen::Index assets) {
    quantcore::portfolio::ReturnMatrix m;
    m.returns.resize(periods, assets);
    for (Eigen::Index j = 0; j < assets; ++j) {
        m.symbols.push_back("S" + std::to_string(j));
        for (Eigen::Index i = 0; i < periods; ++i) {
            const double t = static_cast<double>(i);
            const double a = static_cast<double>(j + 1);
            m.returns(i, j) = 0.0004 * a + 0.01 * std::sin(t * (0.7 + 0.13 * a) + a);
        }
    }
    return m;
}

// ── Strategy ───────────────────────────────────────────────────────────────────

static void BM_SimpleMovingAverage(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto prices = make_prices(n);
    for (auto _ : state) {
        auto ma = quantcore::strategy::simple_moving_average(prices, 50);
        benchmark::DoNotOptimize(ma.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_SimpleMovingAverage)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Simulate(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto prices = make_prices(n);
    const quantcore::strategy::MovingAverageCrossover rule({.fast_window = 10,
                                                            .slow_window = 50});
    for (auto _ : state) {
        auto sim = rule.simulate(prices);
        benchmark::DoNotOptimize(sim.strategy_returns.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Simulate)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Walk-forward ───────────────────────────────────────────────────────────────

static void BM_WalkForward(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto prices = quantcore::PriceSeries::from_closes(make_prices(n));
    const auto grid = quantcore::walkforward::ParameterGrid::default_grid();
    const quantcore::walkforward::WalkForwardOptimizer optimizer;
    for (auto _ : state) {
        auto result = optimizer.run(prices, grid);
        benchmark::DoNotOptimize(result.total_return);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_WalkForward)->Arg(1008)->Arg(2520)->Arg(5040)->Unit(benchmark::kMillisecond);

// ── Portfolio ──────────────────────────────────────────────────────────────────

static void BM_MaxSharpe(benchmark::State& state) {
    const auto m = make_returns(1008, state.range(0));
    const quantcore::portfolio::PortfolioOptimizer optimizer;
    for (auto _ : state) {
        auto w = optimizer.max_sharpe_weights(m);
        benchmark::DoNotOptimize(w.size());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * 1008);
}
BENCHMARK(BM_MaxSharpe)->Arg(2)->Arg(5)->Arg(20)->Unit(benchmark::kMicrosecond);

static void BM_RiskParity(benchmark::State& state) {
    const auto m = make_returns(1008, state.range(0));
    const quantcore::portfolio::PortfolioOptimizer optimizer;
    for (auto _ : state) {
        auto w = optimizer.risk_parity_weights(m);
        benchmark::DoNotOptimize(w.size());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * 1008);
}
BENCHMARK(BM_RiskParity)->Arg(2)->Arg(5)->Arg(20)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
