/// @file src/anomaly/anomaly_detector.cpp
/// @brief Implementation of AnomalyDetector.

#include "healthtrend/anomaly.hpp"
#include "healthtrend/statistics.hpp"

#include <cmath>

namespace healthtrend::anomaly {

using stats::Statistics;

// ─── Names ────────────────────────────────────────────────────────────────────

std::string_view to_string(AnomalySeverity severity) noexcept {
    switch (severity) {
        case AnomalySeverity::Low:      return "low";
        case AnomalySeverity::Medium:   return "medium";
        case AnomalySeverity::High:     return "high";
        case AnomalySeverity::Critical: return "critical";
    }
    return "unknown";
}

std::string_view to_string(OutlierMethod method) noexcept {
    switch (method) {
        case OutlierMethod::ZScore:         return "z_score";
        case OutlierMethod::Iqr:            return "iqr";
        case OutlierMethod::ModifiedZScore: return "modified_z_score";
        case OutlierMethod::Isolation:      return "isolation";
    }
    return "unknown";
}

// ─── Severity ─────────────────────────────────────────────────────────────────

double AnomalyDetector::severity_threshold(AnomalySeverity severity) noexcept {
    switch (severity) {
        case AnomalySeverity::Low:      return constants::SEVERITY_LOW_THRESHOLD;
        case AnomalySeverity::Medium:   return constants::SEVERITY_MEDIUM_THRESHOLD;
        case AnomalySeverity::High:     return constants::SEVERITY_HIGH_THRESHOLD;
        case AnomalySeverity::Critical: return constants::SEVERITY_CRITICAL_THRESHOLD;
    }
    return constants::SEVERITY_LOW_THRESHOLD;
}

AnomalySeverity AnomalyDetector::severity_for(double z_score) noexcept {
    if (z_score >= severity_threshold(AnomalySeverity::Critical)) return AnomalySeverity::Critical;
    if (z_score >= severity_threshold(AnomalySeverity::High))     return AnomalySeverity::High;
    if (z_score >= severity_threshold(AnomalySeverity::Medium))   return AnomalySeverity::Medium;
    return AnomalySeverity::Low;
}

// ─── detect_anomalies ─────────────────────────────────────────────────────────

std::vector<AnomalyPoint>
AnomalyDetector::detect_anomalies(std::span<const Measurement> records,
                                  double sensitivity) {
    if (records.size() < constants::MIN_ANOMALY_POINTS) return {};

    std::vector<double> values;
    values.reserve(records.size());
    for (const auto& r : records) {
        values.push_back(r.value);
    }

    const double mu = Statistics::mean(values);
    const double sd = Statistics::sample_stddev(values);
    if (sd <= 0.0) return {};  // flat series: nothing deviates

    std::vector<AnomalyPoint> anomalies;
    for (const auto& r : records) {
        const double z = std::abs(r.value - mu) / sd;
        if (z >= sensitivity) {
            anomalies.push_back(AnomalyPoint{
                .timestamp       = r.timestamp,
                .value           = r.value,
                .expected_value  = mu,
                .deviation_score = z,
                .severity        = severity_for(z),
            });
        }
    }
    return anomalies;
}

// ─── detect_outliers ──────────────────────────────────────────────────────────

std::vector<std::size_t>
AnomalyDetector::detect_outliers(std::span<const double> values,
                                 OutlierMethod method) {
    if (values.size() < constants::MIN_ANOMALY_POINTS) return {};

    switch (method) {
        case OutlierMethod::ZScore:         return zscore_outliers(values);
        case OutlierMethod::Iqr:            return iqr_outliers(values);
        case OutlierMethod::ModifiedZScore: return modified_zscore_outliers(values);
        case OutlierMethod::Isolation:
            // Baseline: isolation scoring is approximated by the z-score test.
            return zscore_outliers(values);
    }
    return {};
}

std::vector<std::size_t>
AnomalyDetector::zscore_outliers(std::span<const double> values) {
    const double mu = Statistics::mean(values);
    const double sd = Statistics::sample_stddev(values);
    if (sd <= 0.0) return {};

    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (std::abs(values[i] - mu) / sd >= constants::ZSCORE_OUTLIER_THRESHOLD) {
            out.push_back(i);
        }
    }
    return out;
}

std::vector<std::size_t>
AnomalyDetector::iqr_outliers(std::span<const double> values) {
    const auto q = Statistics::quartiles(values);
    if (!q) return {};

    const double iqr   = q->q3 - q->q1;
    const double lower = q->q1 - constants::IQR_FENCE_MULTIPLIER * iqr;
    const double upper = q->q3 + constants::IQR_FENCE_MULTIPLIER * iqr;

    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (values[i] < lower || values[i] > upper) {
            out.push_back(i);
        }
    }
    return out;
}

std::vector<std::size_t>
AnomalyDetector::modified_zscore_outliers(std::span<const double> values) {
    const double med = Statistics::median(values);

    std::vector<double> abs_dev;
    abs_dev.reserve(values.size());
    for (double v : values) {
        abs_dev.push_back(std::abs(v - med));
    }
    const double mad = Statistics::median(abs_dev);

    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (mad <= 0.0) {
            // Score is infinite for anything off the median, zero otherwise.
            if (abs_dev[i] > 0.0) out.push_back(i);
            continue;
        }
        const double score = constants::MODIFIED_ZSCORE_SCALE * (values[i] - med) / mad;
        if (std::abs(score) >= constants::MODIFIED_ZSCORE_THRESHOLD) {
            out.push_back(i);
        }
    }
    return out;
}

}  // namespace healthtrend::anomaly
