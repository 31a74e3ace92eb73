#pragma once

/// @file include/quantcore/errors.hpp
/// @brief Typed failures raised by the quantcore engines.
///
/// Only two situations substitute a value instead of failing: the Sharpe ratio
/// of a zero-variance return series (0.0) and the max-Sharpe objective of a
/// zero-volatility portfolio (0.0). Everything else surfaces as one of the
/// exceptions below; formatting them as text is left to the caller.

#include <cstddef>
#include <stdexcept>
#include <string>

namespace quantcore {

/// Root of the quantcore error hierarchy.
class QuantError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A series is shorter than the computation requires.
class InsufficientDataError : public QuantError {
public:
    InsufficientDataError(const std::string& context,
                          std::size_t required,
                          std::size_t actual);

    [[nodiscard]] std::size_t required() const noexcept { return required_; }
    [[nodiscard]] std::size_t actual()   const noexcept { return actual_; }

private:
    std::size_t required_;
    std::size_t actual_;
};

/// An input makes a ratio undefined (zero variance, non-positive price).
class DegenerateInputError : public QuantError {
public:
    using QuantError::QuantError;
};

/// A parameter violates its documented domain.
class InvalidParameterError : public QuantError {
public:
    using QuantError::QuantError;
};

/// The constrained solver did not converge.
class OptimizationFailure : public QuantError {
public:
    OptimizationFailure(std::string diagnostic, int iterations);

    /// Solver's own message, e.g. "Iteration limit reached".
    [[nodiscard]] const std::string& diagnostic() const noexcept { return diagnostic_; }
    [[nodiscard]] int iterations() const noexcept { return iterations_; }

private:
    std::string diagnostic_;
    int         iterations_;
};

} // namespace quantcore
