#pragma once

#include <cstddef>

/// @file include/quantcore/constants.hpp
/// @brief Numerical and financial constants shared by every quantcore module.

namespace quantcore::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// A return series whose sample standard deviation does not exceed this value
/// is treated as zero-variance (Sharpe reported as 0.0).
static constexpr double ZERO_VARIANCE_EPSILON = 1e-12;

/// Annualised portfolio volatility below which the max-Sharpe objective is
/// flat (returns 0.0 instead of dividing by ~0).
static constexpr double MIN_PORTFOLIO_VOLATILITY = 1e-6;

/// Tolerance on Σw = 1 for any produced weight vector.
static constexpr double WEIGHT_SUM_TOLERANCE = 1e-6;

// ─── Series Requirements ──────────────────────────────────────────────────────

/// Fewest price observations any return-based computation accepts.
static constexpr std::size_t MIN_PRICE_OBSERVATIONS = 2;

/// Fewest strategy returns the metrics accept (sample std-dev needs two).
static constexpr std::size_t MIN_METRIC_RETURNS = 2;

// ─── Backtester Defaults ──────────────────────────────────────────────────────

/// Default annualisation factor: 252 trading days per year.
static constexpr double ANNUALISATION_FACTOR = 252.0;

/// Transaction cost charged per unit change of the signal (10 bps per flip).
static constexpr double DEFAULT_COST_RATE = 0.001;

/// Default crossover windows used by the CLI.
static constexpr int DEFAULT_FAST_WINDOW = 10;
static constexpr int DEFAULT_SLOW_WINDOW = 50;

// ─── Walk-Forward Defaults ────────────────────────────────────────────────────

/// Daily bars per calendar month used to size month-based windows.
static constexpr std::size_t TRADING_DAYS_PER_MONTH = 21;

static constexpr int DEFAULT_TRAIN_MONTHS = 12;
static constexpr int DEFAULT_TEST_MONTHS  = 3;

/// In-sample scoring ignores transaction costs unless configured otherwise.
static constexpr double DEFAULT_WALK_FORWARD_COST_RATE = 0.0;

// ─── Portfolio Defaults ───────────────────────────────────────────────────────

/// Weights below this value are left out of printed allocations.
static constexpr double WEIGHT_DISPLAY_THRESHOLD = 0.01;

static constexpr int    SOLVER_MAX_ITERATIONS = 1000;
static constexpr double SOLVER_TOLERANCE      = 1e-10;

/// Forward-difference step used when no analytic gradient is supplied
/// (√ machine epsilon).
static constexpr double SOLVER_FD_STEP = 1.4901161193847656e-08;

} // namespace quantcore::constants
