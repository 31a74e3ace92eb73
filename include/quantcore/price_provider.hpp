#pragma once

/// @file include/quantcore/price_provider.hpp
/// @brief Price-history capability consumed by the engine.
///
/// # Module: PriceProvider
///
/// ## Responsibility
/// Hand a `PriceSeries` of closes for (symbol, date range) to the engine.
/// The engine holds a reference to a provider and never reaches for a global
/// data client.
///
/// ## Implementations
/// - `InMemoryPriceProvider`: bars registered in code (tests, embedding)
/// - `CsvPriceProvider`: one `<SYMBOL>.csv` per symbol in a directory
///
/// ## Contract
/// `fetch` returns the observations with `start ≤ timestamp ≤ end`, strictly
/// ascending. An unknown symbol yields an empty series; deciding whether
/// that is an error is the caller's concern.

#include "quantcore/types.hpp"

#include <functional>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace quantcore::core {

/// Closed timestamp interval [start, end].
struct DateRange {
    double start = -std::numeric_limits<double>::infinity();
    double end   =  std::numeric_limits<double>::infinity();

    [[nodiscard]] bool contains(double timestamp) const noexcept {
        return timestamp >= start && timestamp <= end;
    }

    /// Range from two `YYYY-MM-DD` dates, both inclusive.
    ///
    /// # Throws
    /// `InvalidParameterError` for malformed dates or `start > end`.
    [[nodiscard]] static DateRange parse(std::string_view start_iso,
                                         std::string_view end_iso);

    /// The unbounded range.
    [[nodiscard]] static DateRange all() noexcept { return DateRange{}; }
};

class PriceProvider {
public:
    virtual ~PriceProvider() = default;

    [[nodiscard]] virtual PriceSeries fetch(const std::string& symbol,
                                            const DateRange& range) const = 0;
};

/// Bars held in memory, keyed by symbol.
class InMemoryPriceProvider final : public PriceProvider {
public:
    /// Register (or replace) the bars for `symbol`. Bars may arrive in any
    /// order; duplicates by timestamp keep the last one added.
    void add(const std::string& symbol, std::vector<OHLCV> bars);

    /// Register closes at bar-index timestamps 0..n-1.
    void add_closes(const std::string& symbol, const std::vector<double>& closes);

    [[nodiscard]] PriceSeries fetch(const std::string& symbol,
                                    const DateRange& range) const override;

private:
    std::map<std::string, std::vector<OHLCV>, std::less<>> bars_;
};

/// Reads `<directory>/<SYMBOL>.csv` through `DataLoader` on every fetch.
class CsvPriceProvider final : public PriceProvider {
public:
    explicit CsvPriceProvider(std::string directory, bool verbose = false);

    [[nodiscard]] PriceSeries fetch(const std::string& symbol,
                                    const DateRange& range) const override;

    [[nodiscard]] std::string path_for(const std::string& symbol) const;

private:
    std::string directory_;
    bool        verbose_;
};

/// Sort bars by timestamp, keep the last bar per timestamp, restrict to
/// `range` and convert to a `PriceSeries`.
[[nodiscard]] PriceSeries to_price_series(std::vector<OHLCV> bars,
                                          const DateRange& range);

}  // namespace quantcore::core
