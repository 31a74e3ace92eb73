/// @file src/core/errors.cpp
/// @brief Message construction for the typed quantcore failures.

#include "quantcore/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace quantcore {

InsufficientDataError::InsufficientDataError(const std::string& context,
                                             std::size_t required,
                                             std::size_t actual)
    : QuantError(fmt::format("{}: need at least {} observations, got {}",
                             context, required, actual))
    , required_(required)
    , actual_(actual) {}

OptimizationFailure::OptimizationFailure(std::string diagnostic, int iterations)
    : QuantError(fmt::format("Optimization failed: {} (after {} iterations)",
                             diagnostic, iterations))
    , diagnostic_(std::move(diagnostic))
    , iterations_(iterations) {}

}  // namespace quantcore
