#pragma once

/// @file include/healthtrend/anomaly.hpp
/// @brief Outlier / anomaly detection over a measurement series.
///
/// # Module: Anomaly Detector
///
/// ## Responsibility
/// Flag measurements whose deviation from the series centre exceeds a
/// threshold, and classify how severe each deviation is.
///
/// ## Methods
/// `detect_anomalies` uses the z-score against the population mean and the
/// sample standard deviation:
///
///     z = |x − mean| / σ
///
/// `detect_outliers` offers four interchangeable index-returning methods:
///   - ZScore:         |z| ≥ 2.0
///   - Iqr:            x ∉ [Q1 − 1.5·IQR, Q3 + 1.5·IQR]
///   - ModifiedZScore: |0.6745·(x − median) / MAD| ≥ 3.5
///   - Isolation:      z-score baseline (no isolation forest)
///
/// ## Severity Bands (z-score floors)
///   Low < 2.0 ≤ Medium < 2.5 ≤ High < 3.0 ≤ Critical
///
/// A larger z-score never maps to a lower severity.
///
/// ## Edge Cases
/// - Fewer than 3 points: no anomalies / outliers
/// - Zero standard deviation (flat series): nothing deviates, empty result
/// - MAD of zero: every value that differs from the median is an outlier

#include "healthtrend/constants.hpp"
#include "healthtrend/types.hpp"

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace healthtrend::anomaly {

// ─── Types ────────────────────────────────────────────────────────────────────

enum class AnomalySeverity {
    Low,
    Medium,
    High,
    Critical,
};

[[nodiscard]] std::string_view to_string(AnomalySeverity severity) noexcept;

/// A measurement flagged as anomalous.
struct AnomalyPoint {
    Timestamp       timestamp;
    double          value;
    double          expected_value;   ///< Series mean
    double          deviation_score;  ///< |z| ≥ 0
    AnomalySeverity severity;
};

/// Selectable outlier-detection method.
enum class OutlierMethod {
    ZScore,
    Iqr,
    ModifiedZScore,
    Isolation,
};

[[nodiscard]] std::string_view to_string(OutlierMethod method) noexcept;

// ─── AnomalyDetector ──────────────────────────────────────────────────────────

/// Stateless anomaly and outlier detection.
class AnomalyDetector {
public:
    AnomalyDetector() = delete;

    /// Flag records whose z-score is at least `sensitivity`.
    ///
    /// # Arguments
    /// * `records`     : Measurements in any order; output preserves it
    /// * `sensitivity` : Minimum |z| to flag (default 2.0)
    ///
    /// # Returns
    /// One `AnomalyPoint` per flagged record. Empty for fewer than 3 records
    /// or a zero-variance series.
    [[nodiscard]] static std::vector<AnomalyPoint>
    detect_anomalies(std::span<const Measurement> records,
                     double sensitivity = constants::DEFAULT_ANOMALY_SENSITIVITY);

    /// Index positions (ascending) of outliers in `values`.
    ///
    /// Empty for fewer than 3 values.
    [[nodiscard]] static std::vector<std::size_t>
    detect_outliers(std::span<const double> values, OutlierMethod method);

    /// Severity band for a z-score.
    [[nodiscard]] static AnomalySeverity severity_for(double z_score) noexcept;

    /// Nominal z-score floor of a severity band (1.5 / 2.0 / 2.5 / 3.0).
    [[nodiscard]] static double severity_threshold(AnomalySeverity severity) noexcept;

private:
    static std::vector<std::size_t> zscore_outliers(std::span<const double> values);
    static std::vector<std::size_t> iqr_outliers(std::span<const double> values);
    static std::vector<std::size_t> modified_zscore_outliers(std::span<const double> values);
};

}  // namespace healthtrend::anomaly
