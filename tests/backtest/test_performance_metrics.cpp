#include <gtest/gtest.h>
#include "quantcore/backtest.hpp"
#include "quantcore/constants.hpp"
#include "quantcore/errors.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace quantcore;
using namespace quantcore::backtest;
using namespace quantcore::constants;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static std::vector<double> make_constant_returns(std::size_t n, double val) {
    return std::vector<double>(n, val);
}

static std::vector<double> make_alternating_returns(
        double target_mean, double amplitude, std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = (i % 2 == 0) ? target_mean + amplitude
                              : target_mean - amplitude;
    }
    return v;
}

// ─── Sharpe ───────────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_Sharpe, ConstantReturns_ZeroVariance_ReturnsZero) {
    auto returns = make_constant_returns(50, 0.01);
    EXPECT_DOUBLE_EQ(PerformanceCalculator::sharpe(returns), 0.0);
}

TEST(PerformanceCalculator_Sharpe, AllZeroReturns_ReturnsZero) {
    auto returns = make_constant_returns(100, 0.0);
    EXPECT_DOUBLE_EQ(PerformanceCalculator::sharpe(returns), 0.0);
}

TEST(PerformanceCalculator_Sharpe, KnownValues_SampleStdDev) {
    // Even-length alternating series: mean = 0.001, Σ(x−μ)² = n·0.01²
    // → sample σ = 0.01·√(n/(n−1))
    constexpr std::size_t n = 500;
    auto returns = make_alternating_returns(0.001, 0.01, n);
    const double sd = 0.01 * std::sqrt(static_cast<double>(n) / (n - 1));
    EXPECT_NEAR(PerformanceCalculator::sharpe(returns),
                0.001 / sd * std::sqrt(ANNUALISATION_FACTOR), 1e-9);
}

TEST(PerformanceCalculator_Sharpe, TwoReturns_HandComputed) {
    const std::vector<double> returns = {0.02, 0.0};
    // mean 0.01, sample σ = √(2·0.0001/1) = 0.0141421...
    EXPECT_NEAR(PerformanceCalculator::sharpe(returns, 1.0),
                0.01 / std::sqrt(0.0002), 1e-12);
}

TEST(PerformanceCalculator_Sharpe, SignInversion) {
    std::vector<double> pos = {0.01, -0.005, 0.008, -0.003, 0.012,
                               -0.002, 0.009, -0.004, 0.011, -0.001};
    std::vector<double> neg(pos.size());
    for (std::size_t i = 0; i < pos.size(); ++i) neg[i] = -pos[i];
    EXPECT_NEAR(PerformanceCalculator::sharpe(pos),
                -PerformanceCalculator::sharpe(neg), 1e-10);
}

TEST(PerformanceCalculator_Sharpe, ScaleInvariant) {
    std::vector<double> base = {0.01, -0.005, 0.008, -0.002, 0.007,
                                -0.003, 0.006, -0.001, 0.009, -0.004};
    std::vector<double> scaled(base.size());
    for (std::size_t i = 0; i < base.size(); ++i) scaled[i] = base[i] * 3.0;
    EXPECT_NEAR(PerformanceCalculator::sharpe(base),
                PerformanceCalculator::sharpe(scaled), 1e-10);
}

TEST(PerformanceCalculator_Sharpe, TooFewReturns_Throws) {
    EXPECT_THROW((void)PerformanceCalculator::sharpe(std::span<const double>{}),
                 InsufficientDataError);
    const std::vector<double> one = {0.01};
    EXPECT_THROW((void)PerformanceCalculator::sharpe(one), InsufficientDataError);
}

TEST(PerformanceCalculator_Sharpe, NaNInput_Throws) {
    std::vector<double> returns = {0.01, std::numeric_limits<double>::quiet_NaN(), 0.02};
    EXPECT_THROW((void)PerformanceCalculator::sharpe(returns), DegenerateInputError);
}

TEST(PerformanceCalculator_Sharpe, NonPositiveAnnualisation_Throws) {
    const std::vector<double> returns = {0.01, 0.02, -0.01};
    EXPECT_THROW((void)PerformanceCalculator::sharpe(returns, 0.0), InvalidParameterError);
}

// ─── Total return & drawdown ──────────────────────────────────────────────────

TEST(PerformanceCalculator_TotalReturn, CompoundsReturns) {
    const std::vector<double> returns = {0.10, -0.10};
    EXPECT_NEAR(PerformanceCalculator::total_return(returns), 1.1 * 0.9 - 1.0, 1e-12);
}

TEST(PerformanceCalculator_MaxDrawdown, FromReturns) {
    // Equity 1.0 → 1.1 → 0.9 → 1.05
    const std::vector<double> returns = {0.1, 0.9 / 1.1 - 1.0, 1.05 / 0.9 - 1.0};
    EXPECT_NEAR(PerformanceCalculator::max_drawdown(returns), -0.181818, 1e-6);
}

TEST(PerformanceCalculator_MaxDrawdown, RisingOnly_Zero) {
    const std::vector<double> returns = {0.01, 0.02, 0.0, 0.03};
    EXPECT_DOUBLE_EQ(PerformanceCalculator::max_drawdown(returns), 0.0);
}

// ─── metrics ──────────────────────────────────────────────────────────────────

TEST(Metrics, CombinesAllThree) {
    const std::vector<double> returns = {0.02, -0.01, 0.03, -0.02, 0.01};
    const auto m = metrics(returns);
    EXPECT_DOUBLE_EQ(m.total_return, PerformanceCalculator::total_return(returns));
    EXPECT_DOUBLE_EQ(m.sharpe_ratio, PerformanceCalculator::sharpe(returns));
    EXPECT_DOUBLE_EQ(m.max_drawdown, PerformanceCalculator::max_drawdown(returns));
    EXPECT_EQ(m.periods, returns.size());
    EXPECT_LE(m.max_drawdown, 0.0);
}

TEST(Metrics, SingleReturn_Throws) {
    const std::vector<double> returns = {0.05};
    EXPECT_THROW((void)metrics(returns), InsufficientDataError);
}

TEST(BacktestResult, ToString) {
    const BacktestResult r{
        .total_return = 0.1227, .sharpe_ratio = 1.234,
        .max_drawdown = -0.031, .periods = 10};
    EXPECT_EQ(r.to_string(),
              "Total Return: 12.27%  Sharpe Ratio: 1.23  Max Drawdown: -3.10%");
}
