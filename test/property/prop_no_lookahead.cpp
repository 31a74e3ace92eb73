/**
 * @file  prop_no_lookahead.cpp
 * @brief Property: position[t] depends only on prices[0..t−1]
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_no_lookahead
 *
 * For a random price path, random windows and a random cut k, rewriting
 * every price from index k onwards must leave position[0..k] unchanged.
 * The position held over period k is decided at the close of k − 1.
 */

#include <rapidcheck.h>
#include <cstddef>
#include <vector>

#include "quantcore/strategy.hpp"

using namespace quantcore;

namespace {

std::vector<double> price_path(const std::vector<int>& ticks) {
    std::vector<double> p{100.0};
    for (int t : ticks) p.push_back(p.back() * (1.0 + t * 1e-4));
    return p;
}

}  // namespace

int main() {
    bool ok = true;

    ok &= rc::check(
        "no_lookahead: rewriting prices from k leaves position[0..k] unchanged",
        [] {
            const auto ticks = *rc::gen::container<std::vector<int>>(
                *rc::gen::inRange<std::size_t>(2, 120), rc::gen::inRange(-300, 301));
            const auto prices = price_path(ticks);

            const int fast = *rc::gen::inRange(1, 10);
            const int slow = *rc::gen::inRange(fast + 1, 30);
            const auto k = *rc::gen::inRange<std::size_t>(1, prices.size());

            auto altered = prices;
            for (std::size_t i = k; i < altered.size(); ++i) {
                altered[i] = *rc::gen::inRange(1, 1000) * 1.0;
            }

            const auto base = strategy::simulate(prices, fast, slow, {});
            const auto alt  = strategy::simulate(altered, fast, slow, {});
            for (std::size_t t = 0; t <= k; ++t) {
                RC_ASSERT(base.position[t] == alt.position[t]);
            }
        });

    ok &= rc::check(
        "no_lookahead: position[0] is flat and positions are 0 or 1",
        [] {
            const auto ticks = *rc::gen::container<std::vector<int>>(
                *rc::gen::inRange<std::size_t>(2, 120), rc::gen::inRange(-300, 301));
            const auto prices = price_path(ticks);
            const int fast = *rc::gen::inRange(1, 10);
            const int slow = *rc::gen::inRange(fast + 1, 30);

            const auto sim = strategy::simulate(prices, fast, slow, {});
            RC_ASSERT(sim.position.front() == 0);
            for (int p : sim.position) RC_ASSERT(p == 0 || p == 1);
            RC_ASSERT(sim.strategy_returns.size() == prices.size() - 1);
        });

    return ok ? 0 : 1;
}
