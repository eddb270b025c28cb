#pragma once

/// @file include/healthtrend/quality.hpp
/// @brief Data quality scoring and gap detection.
///
/// # Module: Data Quality Assessor
///
/// ## Scores (each ∈ [0, 1])
///   - completeness: 1.0 (only present records are considered)
///   - consistency:  1 − z-score outliers / n
///   - accuracy:     1 − implausible values / n   (see `plausible_range`)
///   - timeliness:   clamp(1 − days since latest record / 30, 0, 1)
///   - overall:      unweighted mean of the four
///
/// ## Issues
///   - InconsistentData (medium): outliers exceed 10% of records
///   - OutlierData (high):        any implausible value
///   - StaleData (medium):        latest record older than 7 days
///
/// ## NOT Responsible For
/// - Estimating missing records (completeness is definitional)
/// - Repairing or filtering data

#include "healthtrend/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace healthtrend::quality {

// ─── Types ────────────────────────────────────────────────────────────────────

enum class IssueType {
    MissingData,
    DuplicateData,
    InconsistentData,
    OutlierData,
    StaleData,
};

enum class IssueSeverity {
    Low,
    Medium,
    High,
    Critical,
};

[[nodiscard]] std::string_view to_string(IssueType type) noexcept;
[[nodiscard]] std::string_view to_string(IssueSeverity severity) noexcept;

struct DataQualityIssue {
    IssueType     type;
    std::string   description;
    IssueSeverity severity;
    std::size_t   affected_records;
    std::string   suggested_action;
};

struct DataQualityAssessment {
    double completeness  = 0.0;
    double consistency   = 0.0;
    double accuracy      = 0.0;
    double timeliness    = 0.0;
    double overall_score = 0.0;
    std::vector<DataQualityIssue> issues;
};

/// Expected sampling cadence for gap detection.
enum class DataFrequency {
    Daily,
    Weekly,
    Monthly,
    Irregular,
};

[[nodiscard]] std::string_view to_string(DataFrequency frequency) noexcept;
[[nodiscard]] std::optional<DataFrequency>
data_frequency_from_string(std::string_view name) noexcept;

// ─── DataQualityAssessor ──────────────────────────────────────────────────────

class DataQualityAssessor {
public:
    DataQualityAssessor() = delete;

    /// Score `records` as of `now`.
    ///
    /// # Returns
    /// All-zero scores and no issues for empty input.
    [[nodiscard]] static DataQualityAssessment
    assess(std::span<const Measurement> records, Timestamp now);

    /// Intervals between consecutive records that exceed 1.5× the expected
    /// interval (daily = 1 day, weekly = 7, monthly = 30).
    ///
    /// Each gap is reported as [earlier + 1 day, later − 1 day]; gaps too
    /// short to hold such a range are skipped.
    ///
    /// # Returns
    /// Empty for fewer than 2 records or `DataFrequency::Irregular`.
    [[nodiscard]] static std::vector<DateRange>
    identify_gaps(std::span<const Measurement> records,
                  DataFrequency expected_frequency);

    /// Expected spacing in days, or 0 for `Irregular`.
    [[nodiscard]] static int expected_interval_days(DataFrequency frequency) noexcept;
};

}  // namespace healthtrend::quality
