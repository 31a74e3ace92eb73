/// @file src/walk_forward/parameter_grid.cpp
/// @brief Candidate list construction and eager validation.

#include "quantcore/walk_forward.hpp"
#include "quantcore/errors.hpp"

#include <array>
#include <utility>

namespace quantcore::walkforward {

ParameterGrid::ParameterGrid(std::vector<StrategyParams> candidates)
    : candidates_(std::move(candidates)) {
    if (candidates_.empty()) {
        throw InvalidParameterError("parameter grid has no candidates");
    }
    for (const auto& p : candidates_) {
        p.validate();
    }
}

ParameterGrid ParameterGrid::cartesian(std::span<const int> fasts,
                                       std::span<const int> slows) {
    std::vector<StrategyParams> out;
    out.reserve(fasts.size() * slows.size());
    for (int f : fasts) {
        for (int s : slows) {
            if (f >= s) continue;
            out.push_back(StrategyParams{.fast_window = f, .slow_window = s});
        }
    }
    return ParameterGrid(std::move(out));
}

ParameterGrid ParameterGrid::default_grid() {
    static constexpr std::array<int, 3> fasts{10, 20, 50};
    static constexpr std::array<int, 3> slows{50, 100, 200};
    return cartesian(fasts, slows);
}

}  // namespace quantcore::walkforward
