/// @file src/walk_forward/walk_forward.cpp
/// @brief Rolling train/test optimisation of the crossover parameters.

#include "quantcore/walk_forward.hpp"
#include "quantcore/dates.hpp"
#include "quantcore/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdio>

namespace quantcore::walkforward {

std::string to_string(Aggregation mode) {
    switch (mode) {
        case Aggregation::Additive:   return "additive";
        case Aggregation::Compounded: return "compounded";
    }
    return "unknown";
}

std::size_t months_to_periods(int months, std::size_t trading_days_per_month) {
    if (months < 1) {
        throw InvalidParameterError(fmt::format(
            "window length must be at least one month, got {}", months));
    }
    return static_cast<std::size_t>(months) * trading_days_per_month;
}

// ─── WalkForwardOptimizer ─────────────────────────────────────────────────────

WalkForwardOptimizer::WalkForwardOptimizer(WalkForwardConfig config)
    : config_(config) {
    if (config_.train_periods < 2) {
        throw InvalidParameterError(fmt::format(
            "train window needs at least 2 periods, got {}", config_.train_periods));
    }
    if (config_.test_periods < 1) {
        throw InvalidParameterError("test window needs at least 1 period");
    }
    if (!std::isfinite(config_.cost_rate) || config_.cost_rate < 0.0) {
        throw InvalidParameterError(fmt::format(
            "cost rate must be a finite non-negative value, got {}",
            config_.cost_rate));
    }
}

double WalkForwardOptimizer::score(std::span<const double> closes,
                                   const StrategyParams& params) const {
    if (closes.size() < constants::MIN_PRICE_OBSERVATIONS) return 0.0;

    const strategy::MovingAverageCrossover rule(
        params, strategy::SimulationConfig{.cost_rate = config_.cost_rate});
    return rule.simulate(closes).return_sum();
}

WalkForwardResult WalkForwardOptimizer::run(const PriceSeries& prices,
                                            const ParameterGrid& grid) const {
    WalkForwardResult result;
    result.aggregation = config_.aggregation;

    const std::size_t n     = prices.size();
    const std::size_t train = config_.train_periods;
    const std::size_t test  = config_.test_periods;

    double additive   = 0.0;
    double compounded = 1.0;

    // Written as differences so huge window sizes cannot wrap the bound.
    const auto fits = [&](std::size_t start) {
        return train <= n - start && test <= n - start - train;
    };

    for (std::size_t start = 0; fits(start); start += test) {
        const PriceSeries train_slice = prices.slice(start, train);
        const PriceSeries test_slice  = prices.slice(start + train, test);

        // ── In-sample grid search; strict > keeps the first-seen on ties ────
        auto   best       = grid.begin();
        double best_score = score(train_slice.closes(), *best);
        for (auto it = grid.begin() + 1; it != grid.end(); ++it) {
            const double s = score(train_slice.closes(), *it);
            if (s > best_score) {
                best_score = s;
                best       = it;
            }
        }

        // ── Out-of-sample: fresh simulation, own warm-up ─────────────────────
        const double test_return = score(test_slice.closes(), *best);

        result.windows.push_back(WalkForwardWindow{
            .train_range     = IndexRange{start, start + train},
            .test_range      = IndexRange{start + train, start + train + test},
            .chosen_params   = *best,
            .train_score     = best_score,
            .test_return     = test_return,
            .test_start_time = test_slice.timestamp_at(0),
            .test_end_time   = test_slice.timestamp_at(test_slice.size() - 1),
        });

        additive   += test_return;
        compounded *= (1.0 + test_return);

        if (config_.verbose) {
            fmt::print(stderr,
                "[walk_forward] window {:3d}: train=[{}, {}) best={} "
                "score={:.6f} test={:.6f}\n",
                result.windows.size(), start, start + train,
                best->to_string(), best_score, test_return);
        }
    }

    if (result.windows.empty()) {
        if (config_.verbose) {
            fmt::print(stderr,
                "[walk_forward] {} prices cannot fit train={} + test={}\n",
                n, train, test);
        }
        return result;
    }

    result.total_return = (config_.aggregation == Aggregation::Additive)
        ? additive
        : compounded - 1.0;
    return result;
}

WalkForwardResult walk_forward(const PriceSeries& prices,
                               std::size_t train_periods,
                               std::size_t test_periods,
                               const ParameterGrid& grid) {
    WalkForwardConfig cfg;
    cfg.train_periods = train_periods;
    cfg.test_periods  = test_periods;
    return WalkForwardOptimizer(cfg).run(prices, grid);
}

// ─── WalkForwardResult ────────────────────────────────────────────────────────

std::string WalkForwardResult::to_string() const {
    std::string out = "Walk Forward Analysis Results:\n";
    for (const auto& w : windows) {
        out += fmt::format("[{} to {}] Params: {}, Return: {:.2f}%\n",
                           format_timestamp(w.test_start_time),
                           format_timestamp(w.test_end_time),
                           w.chosen_params.to_string(),
                           w.test_return * 100.0);
    }
    out += fmt::format("Total Walk Forward Return ({}): {:.2f}%",
                       walkforward::to_string(aggregation), total_return * 100.0);
    return out;
}

}  // namespace quantcore::walkforward
