#pragma once

/// @file include/quantcore/engine.hpp
/// @brief Caller-facing engine over an injected price provider.
///
/// # Module: Engine
///
/// ## Responsibility
/// Fetch price series for symbols and a date range from a `PriceProvider`,
/// run one of the analyses and return a structured report:
///   backtest → BacktestReport
///   walk_forward / walk_forward_months → WalkForwardReport
///   max_sharpe / risk_parity → AllocationReport
///
/// Each report renders itself with `to_string()`; the text is derived from
/// the structured fields and never parsed back.
///
/// ## Usage
/// ```cpp
/// CsvPriceProvider provider("data");
/// Engine engine(provider);
/// auto report = engine.backtest("AAPL", DateRange::parse("2020-01-01", "2023-12-31"),
///                               {.fast_window = 10, .slow_window = 50});
/// fmt::print("{}\n", report.to_string());
/// ```
///
/// ## Failure Modes
/// An empty series from the provider raises `InsufficientDataError`; all
/// other failures propagate from the analysis modules unchanged.

#include "quantcore/backtest.hpp"
#include "quantcore/constants.hpp"
#include "quantcore/portfolio.hpp"
#include "quantcore/price_provider.hpp"
#include "quantcore/strategy.hpp"
#include "quantcore/walk_forward.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace quantcore::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    backtest::BacktestConfig       backtest{};
    walkforward::WalkForwardConfig walk_forward{};
    portfolio::PortfolioConfig     portfolio{};

    /// Month → period conversion for `walk_forward_months`.
    std::size_t trading_days_per_month = constants::TRADING_DAYS_PER_MONTH;

    bool verbose = false;
};

// ─── Reports ──────────────────────────────────────────────────────────────────

struct BacktestReport {
    std::string              symbol;
    strategy::StrategyParams params;
    double                   cost_rate;
    backtest::BacktestRun    run;

    /// "Backtest Results (AAPL 10/50) w/ Costs:\nTotal Return: ..."
    [[nodiscard]] std::string to_string() const;
};

struct WalkForwardReport {
    std::string                    symbol;
    std::size_t                    train_periods;
    std::size_t                    test_periods;
    walkforward::WalkForwardResult result;

    [[nodiscard]] std::string to_string() const;
};

enum class AllocationScheme {
    MaxSharpe,
    RiskParity,
};

[[nodiscard]] std::string to_string(AllocationScheme scheme);

struct AllocationReport {
    AllocationScheme         scheme;
    portfolio::WeightVector  weights;
    portfolio::PortfolioStats stats;
    std::size_t              periods;  ///< Aligned return rows used

    /// Max-Sharpe output hides weights ≤ WEIGHT_DISPLAY_THRESHOLD; risk
    /// parity prints every weight.
    [[nodiscard]] std::string to_string() const;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    /// The provider must outlive the engine.
    explicit Engine(const PriceProvider& provider, EngineConfig config = EngineConfig{});

    [[nodiscard]] BacktestReport backtest(const std::string& symbol,
                                          const DateRange& range,
                                          strategy::StrategyParams params) const;

    [[nodiscard]] WalkForwardReport
    walk_forward(const std::string& symbol,
                 const DateRange& range,
                 std::size_t train_periods,
                 std::size_t test_periods,
                 const walkforward::ParameterGrid& grid =
                     walkforward::ParameterGrid::default_grid()) const;

    /// `walk_forward` with window lengths given in months.
    [[nodiscard]] WalkForwardReport
    walk_forward_months(const std::string& symbol,
                        const DateRange& range,
                        int train_months = constants::DEFAULT_TRAIN_MONTHS,
                        int test_months  = constants::DEFAULT_TEST_MONTHS,
                        const walkforward::ParameterGrid& grid =
                            walkforward::ParameterGrid::default_grid()) const;

    [[nodiscard]] AllocationReport max_sharpe(std::span<const std::string> symbols,
                                              const DateRange& range) const;

    [[nodiscard]] AllocationReport risk_parity(std::span<const std::string> symbols,
                                               const DateRange& range) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /// Provider fetch that refuses an empty series.
    [[nodiscard]] PriceSeries fetch(const std::string& symbol,
                                    const DateRange& range) const;

    [[nodiscard]] portfolio::ReturnMatrix
    load_returns(std::span<const std::string> symbols, const DateRange& range) const;

    const PriceProvider& provider_;
    EngineConfig         config_;
};

}  // namespace quantcore::core
