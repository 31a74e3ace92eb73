/// @file src/portfolio/portfolio_optimizer.cpp
/// @brief Max-Sharpe and inverse-volatility allocation.

#include "quantcore/portfolio.hpp"
#include "quantcore/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace quantcore::portfolio {

// ─── WeightVector ─────────────────────────────────────────────────────────────

WeightVector::WeightVector(std::vector<std::string> symbols, const Vector& weights) {
    if (static_cast<Eigen::Index>(symbols.size()) != weights.size()) {
        throw InvalidParameterError(fmt::format(
            "WeightVector: {} symbols for {} weights", symbols.size(), weights.size()));
    }
    entries_.reserve(symbols.size());
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        entries_.push_back(AssetWeight{
            .symbol = std::move(symbols[i]),
            .weight = weights[static_cast<Eigen::Index>(i)],
        });
    }
}

std::optional<double> WeightVector::weight_of(std::string_view symbol) const {
    for (const auto& e : entries_) {
        if (e.symbol == symbol) return e.weight;
    }
    return std::nullopt;
}

double WeightVector::sum() const noexcept {
    double total = 0.0;
    for (const auto& e : entries_) total += e.weight;
    return total;
}

Vector WeightVector::as_vector() const {
    Vector w(static_cast<Eigen::Index>(entries_.size()));
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        w[static_cast<Eigen::Index>(i)] = entries_[i].weight;
    }
    return w;
}

std::string WeightVector::to_string(double display_threshold) const {
    std::string out = "{";
    bool first = true;
    for (const auto& e : entries_) {
        if (e.weight <= display_threshold) continue;
        if (!first) out += ", ";
        out += fmt::format("{}: {:.4f}", e.symbol, e.weight);
        first = false;
    }
    out += "}";
    return out;
}

// ─── PortfolioOptimizer ───────────────────────────────────────────────────────

PortfolioOptimizer::PortfolioOptimizer(PortfolioConfig config)
    : config_(std::move(config)) {
    if (!std::isfinite(config_.annualisation) || config_.annualisation <= 0.0) {
        throw InvalidParameterError(fmt::format(
            "annualisation factor must be positive, got {}", config_.annualisation));
    }
}

void PortfolioOptimizer::validate(const ReturnMatrix& matrix) const {
    if (matrix.assets() == 0) {
        throw InvalidParameterError("return matrix has no assets");
    }
    if (static_cast<Eigen::Index>(matrix.symbols.size()) != matrix.assets()) {
        throw InvalidParameterError(fmt::format(
            "return matrix has {} symbols for {} columns",
            matrix.symbols.size(), matrix.assets()));
    }
    if (matrix.periods() < 2) {
        throw InsufficientDataError("portfolio returns", 2,
                                    static_cast<std::size_t>(matrix.periods()));
    }
    if (!matrix.returns.allFinite()) {
        throw DegenerateInputError("return matrix contains non-finite values");
    }
}

Matrix PortfolioOptimizer::sample_covariance(const Matrix& returns) {
    const Matrix centered = returns.rowwise() - returns.colwise().mean();
    return (centered.transpose() * centered) /
           static_cast<double>(returns.rows() - 1);
}

double PortfolioOptimizer::negative_sharpe(const Vector& weights,
                                           const Vector& mean_returns,
                                           const Matrix& covariance) const noexcept {
    const double p_ret = weights.dot(mean_returns) * config_.annualisation;
    const double p_var = weights.dot(covariance * weights);
    const double p_vol = std::sqrt(std::max(p_var, 0.0) * config_.annualisation);
    if (p_vol < config_.min_volatility) return 0.0;
    return -p_ret / p_vol;
}

WeightVector PortfolioOptimizer::max_sharpe_weights(const ReturnMatrix& matrix) const {
    validate(matrix);

    const Vector mu  = matrix.returns.colwise().mean().transpose();
    const Matrix cov = sample_covariance(matrix.returns);
    const Eigen::Index n = matrix.assets();
    const double root_ann = std::sqrt(config_.annualisation);

    const optim::ObjectiveFn objective = [&](const Vector& w) {
        return negative_sharpe(w, mu, cov);
    };

    // ∇f = −√ann · ( μ/s − (w·μ) Σw / s³ ),  s = √(w·Σ·w)
    const optim::GradientFn gradient = [&](const Vector& w) -> Vector {
        const Vector cov_w = cov * w;
        const double var   = std::max(w.dot(cov_w), 0.0);
        if (std::sqrt(var * config_.annualisation) < config_.min_volatility) {
            return Vector::Zero(n);
        }
        const double s = std::sqrt(var);
        return -root_ann * (mu / s - w.dot(mu) * cov_w / (s * s * s));
    };

    const Vector x0 = Vector::Constant(n, 1.0 / static_cast<double>(n));
    const optim::SimplexSolver solver(config_.solver);
    auto result = solver.minimize(objective, x0, gradient);

    if (!result.success) {
        throw OptimizationFailure(result.message, result.iterations);
    }

    if (config_.verbose) {
        fmt::print(stderr, "[portfolio] max-sharpe converged in {} iterations, "
                           "sharpe={:.4f}\n",
                   result.iterations, -result.fun);
    }

    return WeightVector(matrix.symbols, result.x);
}

WeightVector PortfolioOptimizer::risk_parity_weights(const ReturnMatrix& matrix) const {
    validate(matrix);

    const Matrix cov   = sample_covariance(matrix.returns);
    const Vector sigma = cov.diagonal().cwiseMax(0.0).cwiseSqrt();

    for (Eigen::Index i = 0; i < sigma.size(); ++i) {
        if (sigma[i] <= constants::ZERO_VARIANCE_EPSILON) {
            throw DegenerateInputError(fmt::format(
                "risk parity: '{}' has zero return variance",
                matrix.symbols[static_cast<std::size_t>(i)]));
        }
    }

    const Vector inv_vol = sigma.cwiseInverse();
    const Vector weights = inv_vol / inv_vol.sum();

    if (config_.verbose) {
        fmt::print(stderr, "[portfolio] risk parity over {} assets\n", sigma.size());
    }

    return WeightVector(matrix.symbols, weights);
}

PortfolioStats PortfolioOptimizer::evaluate(const ReturnMatrix& matrix,
                                            const WeightVector& weights) const {
    validate(matrix);
    const Vector w = weights.as_vector();
    if (w.size() != matrix.assets()) {
        throw InvalidParameterError(fmt::format(
            "evaluate: {} weights for {} assets", w.size(), matrix.assets()));
    }

    const Vector mu  = matrix.returns.colwise().mean().transpose();
    const Matrix cov = sample_covariance(matrix.returns);

    const double expected = w.dot(mu) * config_.annualisation;
    const double vol = std::sqrt(std::max(w.dot(cov * w), 0.0) * config_.annualisation);

    return PortfolioStats{
        .expected_return = expected,
        .volatility      = vol,
        .sharpe_ratio    = (vol < config_.min_volatility) ? 0.0 : expected / vol,
    };
}

}  // namespace quantcore::portfolio
