/// @file src/optim/simplex_solver.cpp
/// @brief Spectral projected gradient over the bounded simplex.

#include "quantcore/simplex_solver.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace quantcore::optim {

namespace {

constexpr double ARMIJO_SUFFICIENT_DECREASE = 1e-4;
constexpr int    MAX_BACKTRACKS             = 60;
constexpr double STEP_MIN                   = 1e-10;
constexpr double STEP_MAX                   = 1e10;
constexpr int    MAX_BISECTIONS             = 200;

SolverResult failure(Vector x, double fx, int iterations, std::string message) {
    return SolverResult{
        .x          = std::move(x),
        .fun        = fx,
        .iterations = iterations,
        .success    = false,
        .message    = std::move(message),
    };
}

SolverResult converged(Vector x, double fx, int iterations) {
    return SolverResult{
        .x          = std::move(x),
        .fun        = fx,
        .iterations = iterations,
        .success    = true,
        .message    = "Optimization terminated successfully",
    };
}

}  // namespace

SimplexSolver::SimplexSolver(SolverOptions options)
    : options_(options) {}

// ─── Projection ───────────────────────────────────────────────────────────────

Vector SimplexSolver::project(const Vector& v) const {
    const double lo = options_.lower_bound;
    const double hi = options_.upper_bound;

    const auto clamped_sum = [&](double tau) {
        return (v.array() - tau).max(lo).min(hi).sum();
    };

    // Σ clamp(v − τ) is non-increasing in τ: all at hi for τ_low, all at lo
    // for τ_high.
    double tau_low  = v.minCoeff() - hi;
    double tau_high = v.maxCoeff() - lo;
    for (int i = 0; i < MAX_BISECTIONS; ++i) {
        const double mid = 0.5 * (tau_low + tau_high);
        if (mid <= tau_low || mid >= tau_high) break;
        if (clamped_sum(mid) > 1.0) {
            tau_low = mid;
        } else {
            tau_high = mid;
        }
    }
    const double tau = 0.5 * (tau_low + tau_high);
    return (v.array() - tau).max(lo).min(hi).matrix();
}

Vector SimplexSolver::finite_difference(const ObjectiveFn& objective,
                                        const Vector& x,
                                        double fx) const {
    const double h = options_.finite_difference_step;
    Vector grad(x.size());
    Vector probe = x;
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        probe[i] = x[i] + h;
        grad[i]  = (objective(probe) - fx) / h;
        probe[i] = x[i];
    }
    return grad;
}

// ─── minimize ─────────────────────────────────────────────────────────────────

SolverResult SimplexSolver::minimize(const ObjectiveFn& objective,
                                     const Vector& x0,
                                     const GradientFn& gradient) const {
    const auto n = static_cast<double>(x0.size());
    if (x0.size() == 0) {
        return failure(x0, 0.0, 0, "Empty decision vector");
    }
    if (!(options_.lower_bound <= options_.upper_bound) ||
        n * options_.lower_bound > 1.0 || n * options_.upper_bound < 1.0) {
        return failure(x0, 0.0, 0, "Inequality constraints incompatible");
    }

    const auto eval_gradient = [&](const Vector& x, double fx) {
        return gradient ? gradient(x) : finite_difference(objective, x, fx);
    };

    Vector x  = project(x0);
    double fx = objective(x);
    if (!std::isfinite(fx)) {
        return failure(x, fx, 0, "Objective function returned a non-finite value");
    }
    Vector g = eval_gradient(x, fx);
    if (!g.allFinite()) {
        return failure(x, fx, 0, "Gradient evaluation returned a non-finite value");
    }

    double alpha = 1.0;
    {
        const double pg0 = (project(x - g) - x).lpNorm<Eigen::Infinity>();
        if (pg0 > 0.0) alpha = std::clamp(1.0 / pg0, STEP_MIN, STEP_MAX);
    }

    for (int k = 0; k < options_.max_iterations; ++k) {
        const double pg_norm = (project(x - g) - x).lpNorm<Eigen::Infinity>();
        if (options_.verbose) {
            fmt::print(stderr, "[solver] iter {:4d}  f={:+.12f}  |pg|={:.3e}  step={:.3e}\n",
                       k, fx, pg_norm, alpha);
        }
        if (pg_norm <= options_.tolerance) {
            return converged(std::move(x), fx, k);
        }

        const Vector d   = project(x - alpha * g) - x;
        const double gtd = g.dot(d);

        // ── Armijo backtracking along the feasible direction ─────────────────
        double lambda   = 1.0;
        bool   accepted = false;
        Vector x_new;
        double f_new = fx;
        for (int ls = 0; ls < MAX_BACKTRACKS; ++ls) {
            x_new = x + lambda * d;
            f_new = objective(x_new);
            if (std::isfinite(f_new) &&
                f_new <= fx + ARMIJO_SUFFICIENT_DECREASE * lambda * gtd) {
                accepted = true;
                break;
            }
            lambda *= 0.5;
        }

        const double step_norm = d.lpNorm<Eigen::Infinity>();
        const bool   near_stationary = step_norm <= std::sqrt(options_.tolerance);

        if (!accepted) {
            // No decrease left to find along a vanishing direction.
            if (near_stationary) return converged(std::move(x), fx, k);
            return failure(std::move(x), fx, k,
                           "Positive directional derivative for linesearch");
        }

        if (near_stationary &&
            std::abs(fx - f_new) <= constants::FLOAT_EPSILON * (1.0 + std::abs(fx))) {
            return converged(std::move(x_new), f_new, k + 1);
        }

        Vector g_new = eval_gradient(x_new, f_new);
        if (!g_new.allFinite()) {
            return failure(std::move(x_new), f_new, k + 1,
                           "Gradient evaluation returned a non-finite value");
        }

        // ── Barzilai–Borwein step for the next iteration ─────────────────────
        const Vector s   = x_new - x;
        const Vector y   = g_new - g;
        const double sty = s.dot(y);
        alpha = (sty <= 0.0) ? STEP_MAX : std::clamp(s.dot(s) / sty, STEP_MIN, STEP_MAX);

        x  = std::move(x_new);
        fx = f_new;
        g  = std::move(g_new);
    }

    return failure(std::move(x), fx, options_.max_iterations, "Iteration limit reached");
}

}  // namespace quantcore::optim
