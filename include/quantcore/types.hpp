#pragma once

/// @file include/quantcore/types.hpp
/// @brief Shared value types for the quantcore backtesting and allocation
///        engines.
///
/// Every module includes this file. It defines the bar and price-series types
/// handed over by price providers, the derived series aliases, and the Eigen
/// aliases used by the portfolio code.

#include <Eigen/Dense>

#include <cstddef>
#include <span>
#include <vector>

namespace quantcore {

// ─── Bars ─────────────────────────────────────────────────────────────────────

/// A single OHLCV bar of market data.
struct OHLCV {
    double timestamp;  ///< Unix epoch seconds or bar index
    double open;       ///< Opening price
    double high;       ///< High price
    double low;        ///< Low price
    double close;      ///< Closing price
    double volume;     ///< Traded volume
};

// ─── Derived Series ───────────────────────────────────────────────────────────

/// Period-over-period fractional returns; one shorter than the source prices.
using ReturnSeries = std::vector<double>;

/// Cumulative equity, starting at 1.0 one period before the first return.
using EquityCurve = std::vector<double>;

/// Flat (0) / long (1) exposure per price observation.
using PositionSeries = std::vector<int>;

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Periods × assets matrix of simple returns.
using Matrix = Eigen::MatrixXd;

/// Per-asset vector (weights, means, volatilities).
using Vector = Eigen::VectorXd;

// ─── PriceSeries ──────────────────────────────────────────────────────────────

/// Ordered (timestamp, close) observations, strictly ascending in time.
///
/// Immutable once constructed. The constructor rejects mismatched lengths and
/// non-increasing timestamps with `InvalidParameterError`.
class PriceSeries {
public:
    PriceSeries() = default;

    PriceSeries(std::vector<double> timestamps, std::vector<double> closes);

    /// Build from bars, keeping each bar's timestamp and close.
    [[nodiscard]] static PriceSeries from_bars(std::span<const OHLCV> bars);

    /// Build from closes only; timestamps become the bar indices 0..n-1.
    [[nodiscard]] static PriceSeries from_closes(std::vector<double> closes);

    [[nodiscard]] std::size_t size()  const noexcept { return closes_.size(); }
    [[nodiscard]] bool        empty() const noexcept { return closes_.empty(); }

    [[nodiscard]] std::span<const double> closes() const noexcept {
        return closes_;
    }
    [[nodiscard]] std::span<const double> timestamps() const noexcept {
        return timestamps_;
    }

    [[nodiscard]] double close_at(std::size_t i)     const { return closes_.at(i); }
    [[nodiscard]] double timestamp_at(std::size_t i) const { return timestamps_.at(i); }

    /// Copy of `count` observations starting at `begin` (clamped to the end).
    [[nodiscard]] PriceSeries slice(std::size_t begin, std::size_t count) const;

private:
    std::vector<double> timestamps_;
    std::vector<double> closes_;
};

} // namespace quantcore
