#include <gtest/gtest.h>
#include "quantcore/simplex_solver.hpp"

#include <cmath>

using namespace quantcore;
using namespace quantcore::optim;

namespace {

Vector vec(std::initializer_list<double> values) {
    Vector v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double x : values) v[i++] = x;
    return v;
}

}  // namespace

// ─── project ──────────────────────────────────────────────────────────────────

TEST(SimplexSolver_Project, FeasiblePointUnchanged) {
    const SimplexSolver solver;
    const Vector x = vec({0.2, 0.3, 0.5});
    EXPECT_TRUE(solver.project(x).isApprox(x, 1e-12));
}

TEST(SimplexSolver_Project, UniformShift) {
    const SimplexSolver solver;
    const Vector p = solver.project(vec({1.0, 1.0}));
    EXPECT_NEAR(p[0], 0.5, 1e-12);
    EXPECT_NEAR(p[1], 0.5, 1e-12);
}

TEST(SimplexSolver_Project, ClipsNegativeCoordinates) {
    const SimplexSolver solver;
    const Vector p = solver.project(vec({2.0, -1.0, 0.0}));
    EXPECT_NEAR(p[0], 1.0, 1e-12);
    EXPECT_NEAR(p[1], 0.0, 1e-12);
    EXPECT_NEAR(p[2], 0.0, 1e-12);
}

TEST(SimplexSolver_Project, RespectsUpperBound) {
    const SimplexSolver solver(SolverOptions{.upper_bound = 0.4});
    const Vector p = solver.project(vec({5.0, 0.0, 0.0}));
    EXPECT_NEAR(p.sum(), 1.0, 1e-12);
    EXPECT_LE(p.maxCoeff(), 0.4 + 1e-12);
    EXPECT_NEAR(p[0], 0.4, 1e-12);
    EXPECT_NEAR(p[1], 0.3, 1e-12);
}

// ─── minimize ─────────────────────────────────────────────────────────────────

TEST(SimplexSolver_Minimize, QuadraticWithInteriorMinimum) {
    // min Σ (x_i − c_i)² on the simplex; c already sums to one.
    const Vector c = vec({0.1, 0.6, 0.3});
    const SimplexSolver solver;
    const auto result = solver.minimize(
        [&](const Vector& x) { return (x - c).squaredNorm(); },
        Vector::Constant(3, 1.0 / 3.0),
        [&](const Vector& x) -> Vector { return 2.0 * (x - c); });

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(result.x.isApprox(c, 1e-8));
    EXPECT_NEAR(result.x.sum(), 1.0, 1e-12);
}

TEST(SimplexSolver_Minimize, LinearObjectiveGoesToVertex) {
    const Vector cost = vec({0.5, -1.0, 0.2});
    const SimplexSolver solver;
    const auto result = solver.minimize(
        [&](const Vector& x) { return cost.dot(x); },
        Vector::Constant(3, 1.0 / 3.0),
        [&](const Vector&) -> Vector { return cost; });

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_NEAR(result.x[1], 1.0, 1e-9);
    EXPECT_NEAR(result.fun, -1.0, 1e-9);
}

TEST(SimplexSolver_Minimize, FiniteDifferenceGradient) {
    const Vector c = vec({0.7, 0.2, 0.1});
    const SimplexSolver solver;
    const auto result = solver.minimize(
        [&](const Vector& x) { return (x - c).squaredNorm(); },
        Vector::Constant(3, 1.0 / 3.0));

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(result.x.isApprox(c, 1e-5));
    EXPECT_GE(result.x.minCoeff(), 0.0);
}

TEST(SimplexSolver_Minimize, IncompatibleBounds_Fails) {
    const SimplexSolver solver(SolverOptions{.upper_bound = 0.2});
    const auto result = solver.minimize(
        [](const Vector& x) { return x.squaredNorm(); },
        Vector::Constant(3, 1.0 / 3.0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Inequality constraints incompatible");
}

TEST(SimplexSolver_Minimize, IterationLimit_Fails) {
    const Vector c = vec({0.1, 0.6, 0.3});
    const SimplexSolver solver(SolverOptions{.max_iterations = 0});
    const auto result = solver.minimize(
        [&](const Vector& x) { return (x - c).squaredNorm(); },
        Vector::Constant(3, 1.0 / 3.0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Iteration limit reached");
}

TEST(SimplexSolver_Minimize, EmptyStart_Fails) {
    const SimplexSolver solver;
    const auto result = solver.minimize([](const Vector&) { return 0.0; }, Vector{});
    EXPECT_FALSE(result.success);
}
