#pragma once

/// @file include/quantcore/series.hpp
/// @brief Return Series Utilities public API.
///
/// # Module: Return Series Utilities
///
/// ## Responsibility
/// Derive percentage returns, cumulative equity curves and drawdown series
/// from a price series. Every function returns a new vector; inputs are never
/// modified.
///
/// ## Conventions
///   returns[i]  = prices[i+1] / prices[i] − 1
///   equity[0]   = 1.0,  equity[i+1] = equity[i] · (1 + returns[i])
///   drawdown[t] = equity[t] / max(equity[0..t]) − 1     (≤ 0)
///
/// ## Failure Modes
/// - `InsufficientDataError` when the input represents fewer than two price
///   observations (a return series needs at least one element).
/// - `DegenerateInputError` for non-finite or non-positive prices and for
///   non-finite returns or equity values.

#include "quantcore/types.hpp"

#include <span>
#include <vector>

namespace quantcore::series {

/// Simple period-over-period returns. Length is `prices.size() − 1`.
[[nodiscard]] ReturnSeries returns(std::span<const double> prices);

/// Cumulative product of (1 + r), prefixed with the starting value 1.0.
/// Length is `returns.size() + 1`.
[[nodiscard]] EquityCurve equity_curve(std::span<const double> returns);

/// Running drawdown of an equity curve, same length as the input.
[[nodiscard]] std::vector<double> drawdown(std::span<const double> equity);

/// Most negative drawdown value; 0.0 for a non-decreasing curve.
[[nodiscard]] double max_drawdown(std::span<const double> equity);

}  // namespace quantcore::series
