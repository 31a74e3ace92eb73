#pragma once

/// @file include/quantcore/data_loader.hpp
/// @brief CSV data loader for OHLCV market data.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files containing daily market data into `std::vector<OHLCV>`.
/// Malformed or non-finite rows are skipped; the loader never throws on bad
/// input.
///
/// ## Accepted CSV Layouts
/// ```
/// timestamp,open,high,low,close,volume
/// 2021-01-04,100.0,105.0,99.0,103.0,1000000
/// 1609804800,103.0,107.0,102.0,106.5,1200000
/// ```
/// or the close-only form
/// ```
/// date,close
/// 2021-01-04,103.0
/// ```
/// The timestamp column holds either Unix epoch seconds or a `YYYY-MM-DD`
/// date (converted to midnight UTC). For close-only rows open, high and low
/// equal the close and volume is 0. The first line is treated as a header.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` when the file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Row order is preserved; sorting is the caller's concern

#include "quantcore/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quantcore::core {

class DataLoader {
public:
    /// Load bars from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid data rows
    [[nodiscard]] static std::optional<std::vector<OHLCV>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse bars from CSV text. Same format as `load_csv`.
    [[nodiscard]] static std::vector<OHLCV>
    parse_csv_string(std::string_view csv_content) noexcept;

    /// A bar is valid if every field is finite, low ≤ open, close ≤ high,
    /// the close is positive and the volume is non-negative.
    [[nodiscard]] static bool validate_bar(const OHLCV& bar) noexcept;

private:
    [[nodiscard]] static std::optional<OHLCV>
    parse_row(std::string_view line) noexcept;
};

}  // namespace quantcore::core
