#pragma once

/// @file include/healthtrend/data_loader.hpp
/// @brief CSV loader for health measurements.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files of timestamped health readings into
/// `std::vector<Measurement>`. Malformed rows are skipped; the loader never
/// fails on bad input.
///
/// ## Expected CSV Format
/// ```
/// timestamp,metric,value
/// 1717200000,weight,70.4
/// 1717286400,weight,70.1
/// ```
/// `timestamp` is Unix epoch seconds; `metric` is a stable metric name
/// (`weight`, `steps`, `calories`, `heartRate`, `bloodGlucose`). The first
/// non-comment line is treated as a header and skipped.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include "healthtrend/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace healthtrend::core {

/// Loads measurements from CSV files and strings.
class DataLoader {
public:
    DataLoader() = delete;

    /// Load measurements from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid data rows
    /// - Parsed measurements in file order, skipping malformed rows
    [[nodiscard]] static std::optional<std::vector<Measurement>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse measurements from CSV text (same format as `load_csv`).
    [[nodiscard]] static std::vector<Measurement>
    parse_csv_string(std::string_view csv_content) noexcept;

    /// Parse one data row.
    ///
    /// Returns `nullopt` for blank or comment lines, a field count other than
    /// 3, an unparsable timestamp or value, a non-finite value, or an unknown
    /// metric name.
    [[nodiscard]] static std::optional<Measurement>
    parse_row(std::string_view line) noexcept;
};

}  // namespace healthtrend::core
