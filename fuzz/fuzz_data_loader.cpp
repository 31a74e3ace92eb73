/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for CSV loading followed by a crossover backtest
 *
 * Build:
 *   cmake -DQUANTCORE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed bar passes DataLoader::validate_bar.
 *   3. The provider conversion yields strictly ascending timestamps.
 *   4. When a backtest runs:
 *      a. max_drawdown ≤ 0
 *      b. sharpe_ratio is finite
 *      c. one strategy return per price change
 *   Only typed QuantError failures may escape the analysis layer.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "quantcore/backtest.hpp"
#include "quantcore/data_loader.hpp"
#include "quantcore/errors.hpp"
#include "quantcore/price_provider.hpp"

using namespace quantcore;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto bars = core::DataLoader::parse_csv_string(input);
    for (const auto& bar : bars) {
        assert(core::DataLoader::validate_bar(bar));
    }

    const auto prices = core::to_price_series(bars, core::DateRange::all());
    for (std::size_t i = 1; i < prices.size(); ++i) {
        assert(prices.timestamp_at(i) > prices.timestamp_at(i - 1));
    }

    try {
        const backtest::Backtester backtester;
        const auto run = backtester.run(prices, {.fast_window = 2, .slow_window = 5});

        assert(run.metrics.max_drawdown <= 0.0);
        assert(std::isfinite(run.metrics.sharpe_ratio));
        assert(run.simulation.strategy_returns.size() == prices.size() - 1);
    } catch (const QuantError&) {
        // Short or degenerate inputs are rejected with a typed error.
    }

    return 0;
}
