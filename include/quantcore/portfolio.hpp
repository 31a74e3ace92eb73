#pragma once

/// @file include/quantcore/portfolio.hpp
/// @brief Portfolio Optimizer public API.
///
/// # Module: Portfolio Optimizer
///
/// ## Responsibility
/// Compute capital-allocation weights over a basket of return series:
///   - maximum-Sharpe weights under Σw = 1, 0 ≤ w ≤ 1 (SimplexSolver)
///   - inverse-volatility ("risk parity") weights in closed form
///
/// ## Max-Sharpe Objective
///   f(w) = −(w·μ · ann) / √(w·Σ·w · ann)
/// with μ the per-period mean returns and Σ the sample covariance. When the
/// annualised volatility falls below MIN_PORTFOLIO_VOLATILITY the objective
/// is 0.0 (flat), so a near-singular candidate neither attracts nor repels
/// the solver. The solver starts from equal weights.
///
/// ## Risk Parity
///   w_i = (1/σ_i) / Σ_j (1/σ_j)
/// Invariant to a uniform rescaling of all volatilities.
///
/// ## NOT Responsible For
/// - Fetching prices (see quantcore/price_provider.hpp)
/// - Correlation-aware schemes other than the two above

#include "quantcore/constants.hpp"
#include "quantcore/simplex_solver.hpp"
#include "quantcore/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace quantcore::portfolio {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Date-aligned simple returns of several assets.
struct ReturnMatrix {
    std::vector<std::string> symbols;  ///< One per column
    Matrix                   returns;  ///< periods × assets

    [[nodiscard]] Eigen::Index periods() const noexcept { return returns.rows(); }
    [[nodiscard]] Eigen::Index assets()  const noexcept { return returns.cols(); }
};

struct AssetWeight {
    std::string symbol;
    double      weight;
};

/// Symbol → weight mapping in input order. Weights are non-negative and sum
/// to one; the printed form may hide small entries, the structure never does.
class WeightVector {
public:
    WeightVector(std::vector<std::string> symbols, const Vector& weights);

    [[nodiscard]] std::span<const AssetWeight> entries() const noexcept {
        return entries_;
    }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] std::optional<double> weight_of(std::string_view symbol) const;

    [[nodiscard]] double sum() const noexcept;

    [[nodiscard]] Vector as_vector() const;

    /// "{AAPL: 0.6123, MSFT: 0.3877}", omitting weights ≤ `display_threshold`.
    [[nodiscard]] std::string
    to_string(double display_threshold = 0.0) const;

private:
    std::vector<AssetWeight> entries_;
};

/// Annualised profile of a weighted portfolio.
struct PortfolioStats {
    double expected_return;  ///< w·μ · ann
    double volatility;       ///< √(w·Σ·w · ann)
    double sharpe_ratio;     ///< expected_return / volatility, 0.0 when flat
};

struct PortfolioConfig {
    double               annualisation  = constants::ANNUALISATION_FACTOR;
    double               min_volatility = constants::MIN_PORTFOLIO_VOLATILITY;
    optim::SolverOptions solver{};
    bool                 verbose        = false;
};

// ─── Return Alignment ─────────────────────────────────────────────────────────

/// Inner-join the series on timestamp and compute per-asset simple returns.
///
/// # Throws
/// `InvalidParameterError` when `symbols` and `histories` differ in length or are
/// empty; `InsufficientDataError` when fewer than two common timestamps exist;
/// `DegenerateInputError` for non-positive prices.
[[nodiscard]] ReturnMatrix align_returns(std::span<const std::string> symbols,
                                         std::span<const PriceSeries> histories);

// ─── PortfolioOptimizer ───────────────────────────────────────────────────────

class PortfolioOptimizer {
public:
    explicit PortfolioOptimizer(PortfolioConfig config = PortfolioConfig{});

    /// Maximum-Sharpe weights.
    ///
    /// # Throws
    /// `InsufficientDataError` for fewer than two return rows,
    /// `InvalidParameterError` for a matrix without assets,
    /// `OptimizationFailure` when the solver does not converge.
    [[nodiscard]] WeightVector max_sharpe_weights(const ReturnMatrix& matrix) const;

    /// Inverse-volatility weights.
    ///
    /// # Throws
    /// `DegenerateInputError` when any asset has zero return variance.
    [[nodiscard]] WeightVector risk_parity_weights(const ReturnMatrix& matrix) const;

    /// Annualised return, volatility and Sharpe of `weights` on `matrix`.
    [[nodiscard]] PortfolioStats evaluate(const ReturnMatrix& matrix,
                                          const WeightVector& weights) const;

    /// The max-Sharpe objective for explicit moments.
    [[nodiscard]] double negative_sharpe(const Vector& weights,
                                         const Vector& mean_returns,
                                         const Matrix& covariance) const noexcept;

    /// Sample covariance (n − 1 denominator) of the columns of `returns`.
    [[nodiscard]] static Matrix sample_covariance(const Matrix& returns);

    [[nodiscard]] const PortfolioConfig& config() const noexcept { return config_; }

private:
    void validate(const ReturnMatrix& matrix) const;

    PortfolioConfig config_;
};

}  // namespace quantcore::portfolio
