#pragma once

/// @file include/quantcore/simplex_solver.hpp
/// @brief Constrained nonlinear minimiser over the bounded simplex.
///
/// # Module: SimplexSolver
///
/// ## Problem
///   minimise f(x)   subject to   Σ x_i = 1,   lo ≤ x_i ≤ hi
///
/// ## Method
/// Spectral projected gradient (Birgin, Martínez & Raydan):
///   1. d_k = P(x_k − α_k ∇f(x_k)) − x_k, with α_k the Barzilai–Borwein step
///   2. Armijo backtracking along d_k
///   3. stop when ‖P(x_k − ∇f(x_k)) − x_k‖∞ ≤ tolerance
///
/// P is the Euclidean projection onto the feasible set, computed by bisection
/// on the shift τ in x_i = clamp(v_i − τ, lo, hi). Every iterate is feasible.
///
/// When no gradient is supplied, forward differences with step
/// `finite_difference_step` are used.
///
/// ## Guarantees
/// - Deterministic: no random restarts.
/// - Always terminates: at most `max_iterations` outer steps.
/// - Never throws for numerical reasons; failures are reported through
///   `SolverResult::success` and `SolverResult::message`.

#include "quantcore/constants.hpp"
#include "quantcore/types.hpp"

#include <functional>
#include <string>

namespace quantcore::optim {

/// Solver settings.
struct SolverOptions {
    int    max_iterations         = constants::SOLVER_MAX_ITERATIONS;
    double tolerance              = constants::SOLVER_TOLERANCE;
    double lower_bound            = 0.0;
    double upper_bound            = 1.0;
    double finite_difference_step = constants::SOLVER_FD_STEP;
    bool   verbose                = false;
};

/// Outcome of a minimisation.
struct SolverResult {
    Vector      x;           ///< Final (feasible) iterate
    double      fun;         ///< f(x)
    int         iterations;  ///< Outer iterations performed
    bool        success;     ///< Converged within tolerance
    std::string message;     ///< Diagnostic, e.g. "Iteration limit reached"
};

using ObjectiveFn = std::function<double(const Vector&)>;
using GradientFn  = std::function<Vector(const Vector&)>;

class SimplexSolver {
public:
    explicit SimplexSolver(SolverOptions options = SolverOptions{});

    /// Minimise `objective` starting from `x0` (projected first if infeasible).
    ///
    /// # Returns
    /// `success == false` with a diagnostic when the bounds cannot sum to one,
    /// the objective is non-finite, the line search stalls away from a
    /// stationary point, or the iteration limit is reached.
    [[nodiscard]] SolverResult minimize(const ObjectiveFn& objective,
                                        const Vector& x0,
                                        const GradientFn& gradient = {}) const;

    /// Euclidean projection of `v` onto {Σx = 1, lo ≤ x ≤ hi}.
    /// Caller guarantees the set is non-empty (n·lo ≤ 1 ≤ n·hi).
    [[nodiscard]] Vector project(const Vector& v) const;

    [[nodiscard]] const SolverOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] Vector finite_difference(const ObjectiveFn& objective,
                                           const Vector& x,
                                           double fx) const;

    SolverOptions options_;
};

}  // namespace quantcore::optim
