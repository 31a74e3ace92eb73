/**
 * @file  prop_portfolio_weights.cpp
 * @brief Property: allocation weights lie on the simplex
 *
 * Run with 1,000 random inputs:
 *   RC_PARAMS="max_success=1000" ./prop_portfolio_weights
 *
 * For random return matrices:
 *   - risk parity weights are positive, sum to 1 and are unchanged when all
 *     returns are scaled by the same positive factor
 *   - max-Sharpe weights lie in [0, 1] and sum to 1 within 1e-6
 */

#include <rapidcheck.h>
#include <cmath>
#include <string>

#include "quantcore/errors.hpp"
#include "quantcore/portfolio.hpp"

using namespace quantcore;
using namespace quantcore::portfolio;

namespace {

/// periods × assets returns on a 1e-4 grid in [−0.05, 0.05].
ReturnMatrix gen_matrix() {
    const auto assets  = *rc::gen::inRange<Eigen::Index>(1, 6);
    const auto periods = *rc::gen::inRange<Eigen::Index>(4, 80);
    ReturnMatrix m;
    m.returns.resize(periods, assets);
    for (Eigen::Index j = 0; j < assets; ++j) {
        m.symbols.push_back("S" + std::to_string(j));
        for (Eigen::Index i = 0; i < periods; ++i) {
            m.returns(i, j) = *rc::gen::inRange(-500, 501) * 1e-4;
        }
    }
    return m;
}

bool has_flat_column(const ReturnMatrix& m) {
    const Matrix cov = PortfolioOptimizer::sample_covariance(m.returns);
    return (cov.diagonal().array() <= 1e-12).any();
}

}  // namespace

int main() {
    bool ok = true;

    ok &= rc::check(
        "portfolio_weights: risk parity is positive, sums to 1, scale invariant",
        [] {
            auto m = gen_matrix();
            RC_PRE(!has_flat_column(m));

            const PortfolioOptimizer opt;
            const Vector w = opt.risk_parity_weights(m).as_vector();
            RC_ASSERT(std::abs(w.sum() - 1.0) <= 1e-12);
            RC_ASSERT((w.array() > 0.0).all());

            const double k = *rc::gen::inRange(1, 100) * 0.1;
            m.returns *= k;
            const Vector scaled = opt.risk_parity_weights(m).as_vector();
            RC_ASSERT((w - scaled).cwiseAbs().maxCoeff() <= 1e-9);
        });

    ok &= rc::check(
        "portfolio_weights: max-Sharpe weights lie on the simplex",
        [] {
            const auto m = gen_matrix();
            const PortfolioOptimizer opt;
            try {
                const Vector w = opt.max_sharpe_weights(m).as_vector();
                RC_ASSERT(std::abs(w.sum() - 1.0) <= 1e-6);
                RC_ASSERT((w.array() >= 0.0).all());
                RC_ASSERT((w.array() <= 1.0).all());
            } catch (const OptimizationFailure&) {
                RC_DISCARD("solver did not converge");
            }
        });

    return ok ? 0 : 1;
}
