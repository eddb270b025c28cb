/// @file src/quality/data_quality.cpp
/// @brief Implementation of DataQualityAssessor.

#include "healthtrend/quality.hpp"
#include "healthtrend/anomaly.hpp"
#include "healthtrend/constants.hpp"

#include <algorithm>

namespace healthtrend::quality {

// ─── Names ────────────────────────────────────────────────────────────────────

std::string_view to_string(IssueType type) noexcept {
    switch (type) {
        case IssueType::MissingData:      return "missing_data";
        case IssueType::DuplicateData:    return "duplicate_data";
        case IssueType::InconsistentData: return "inconsistent_data";
        case IssueType::OutlierData:      return "outlier_data";
        case IssueType::StaleData:        return "stale_data";
    }
    return "unknown";
}

std::string_view to_string(IssueSeverity severity) noexcept {
    switch (severity) {
        case IssueSeverity::Low:      return "low";
        case IssueSeverity::Medium:   return "medium";
        case IssueSeverity::High:     return "high";
        case IssueSeverity::Critical: return "critical";
    }
    return "unknown";
}

std::string_view to_string(DataFrequency frequency) noexcept {
    switch (frequency) {
        case DataFrequency::Daily:     return "daily";
        case DataFrequency::Weekly:    return "weekly";
        case DataFrequency::Monthly:   return "monthly";
        case DataFrequency::Irregular: return "irregular";
    }
    return "unknown";
}

std::optional<DataFrequency>
data_frequency_from_string(std::string_view name) noexcept {
    if (name == "daily")     return DataFrequency::Daily;
    if (name == "weekly")    return DataFrequency::Weekly;
    if (name == "monthly")   return DataFrequency::Monthly;
    if (name == "irregular") return DataFrequency::Irregular;
    return std::nullopt;
}

// ─── assess ───────────────────────────────────────────────────────────────────

DataQualityAssessment
DataQualityAssessor::assess(std::span<const Measurement> records, Timestamp now) {
    if (records.empty()) return DataQualityAssessment{};

    const std::size_t n = records.size();
    const double      total = static_cast<double>(n);

    DataQualityAssessment out;

    // Only present records are considered.
    out.completeness = 1.0;

    // ── Consistency: share of z-score outliers ────────────────────────────────
    std::vector<double> values;
    values.reserve(n);
    for (const auto& r : records) {
        values.push_back(r.value);
    }
    const auto outliers = anomaly::AnomalyDetector::detect_outliers(
        values, anomaly::OutlierMethod::ZScore);
    out.consistency = 1.0 - static_cast<double>(outliers.size()) / total;

    if (outliers.size() > n / 10) {
        out.issues.push_back(DataQualityIssue{
            .type             = IssueType::InconsistentData,
            .description      = "High number of outliers detected",
            .severity         = IssueSeverity::Medium,
            .affected_records = outliers.size(),
            .suggested_action = "Review data collection process",
        });
    }

    // ── Accuracy: values inside the metric's plausible range ──────────────────
    const auto implausible = static_cast<std::size_t>(std::count_if(
        records.begin(), records.end(), [](const Measurement& r) {
            return !plausible_range(r.metric).contains(r.value);
        }));
    out.accuracy = 1.0 - static_cast<double>(implausible) / total;

    if (implausible > 0) {
        out.issues.push_back(DataQualityIssue{
            .type             = IssueType::OutlierData,
            .description      = "Values outside reasonable range detected",
            .severity         = IssueSeverity::High,
            .affected_records = implausible,
            .suggested_action = "Verify sensor calibration and data entry",
        });
    }

    // ── Timeliness: age of the newest record ──────────────────────────────────
    const auto latest = std::max_element(
        records.begin(), records.end(),
        [](const Measurement& a, const Measurement& b) {
            return a.timestamp < b.timestamp;
        });
    const double age_days = days_between(latest->timestamp, now);
    out.timeliness = std::clamp(
        1.0 - age_days / constants::TIMELINESS_HORIZON_DAYS, 0.0, 1.0);

    if (age_days > constants::STALE_DATA_DAYS) {
        out.issues.push_back(DataQualityIssue{
            .type             = IssueType::StaleData,
            .description      = "Latest data is more than a week old",
            .severity         = IssueSeverity::Medium,
            .affected_records = 1,
            .suggested_action = "Update data collection frequency",
        });
    }

    out.overall_score =
        (out.completeness + out.consistency + out.accuracy + out.timeliness) / 4.0;
    return out;
}

// ─── identify_gaps ────────────────────────────────────────────────────────────

int DataQualityAssessor::expected_interval_days(DataFrequency frequency) noexcept {
    switch (frequency) {
        case DataFrequency::Daily:     return 1;
        case DataFrequency::Weekly:    return 7;
        case DataFrequency::Monthly:   return 30;
        case DataFrequency::Irregular: return 0;
    }
    return 0;
}

std::vector<DateRange>
DataQualityAssessor::identify_gaps(std::span<const Measurement> records,
                                   DataFrequency expected_frequency) {
    const int interval_days = expected_interval_days(expected_frequency);
    if (records.size() < 2 || interval_days <= 0) return {};

    std::vector<Timestamp> stamps;
    stamps.reserve(records.size());
    for (const auto& r : records) {
        stamps.push_back(r.timestamp);
    }
    std::sort(stamps.begin(), stamps.end());

    const double tolerance_days =
        static_cast<double>(interval_days) * constants::GAP_TOLERANCE_FACTOR;

    std::vector<DateRange> gaps;
    for (std::size_t i = 0; i + 1 < stamps.size(); ++i) {
        if (days_between(stamps[i], stamps[i + 1]) <= tolerance_days) continue;

        const auto gap_start = add_days(stamps[i], 1);
        const auto gap_end   = add_days(stamps[i + 1], -1);
        if (!gap_start || !gap_end) continue;

        // Bounds cross when the gap is under two days; nothing lies strictly
        // between the records at day resolution.
        if (auto range = DateRange::make(*gap_start, *gap_end)) {
            gaps.push_back(*range);
        }
    }
    return gaps;
}

}  // namespace healthtrend::quality
