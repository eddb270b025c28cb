#pragma once

/// @file include/healthtrend/trend_types.hpp
/// @brief Result aggregates produced by the trend analysis engine.
///
/// Every type here is a plain value snapshot: produced fresh per call,
/// copyable, and carrying no identity or shared state.

#include "healthtrend/anomaly.hpp"
#include "healthtrend/quality.hpp"
#include "healthtrend/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace healthtrend {

// ─── Direction ────────────────────────────────────────────────────────────────

enum class TrendDirection {
    Increasing,
    Decreasing,
    Stable,
    Volatile,
};

[[nodiscard]] std::string_view to_string(TrendDirection direction) noexcept;

// ─── Points ───────────────────────────────────────────────────────────────────

/// One sorted measurement with its trailing moving average.
struct TrendPoint {
    Timestamp             timestamp;
    double                value;
    std::optional<double> moving_average;  ///< Set from index window−1 onward
    bool                  is_anomaly = false;
};

/// Moving-average sample over a newest-first record window.
struct MovingAveragePoint {
    Timestamp timestamp;       ///< Newest record in the window
    double    value;           ///< Window mean
    double    original_value;  ///< Value of the newest record
};

// ─── TrendSummary ─────────────────────────────────────────────────────────────

/// Descriptive statistics over the analysed window.
///
/// change_percentage = (last − first) / first × 100, or 0 when first is 0.
struct TrendSummary {
    std::size_t total_data_points  = 0;
    double      average_value      = 0.0;
    double      minimum_value      = 0.0;
    double      maximum_value      = 0.0;
    double      standard_deviation = 0.0;
    double      change_percentage  = 0.0;
    double      first_value        = 0.0;
    double      last_value         = 0.0;
};

// ─── TrendAnalysis ────────────────────────────────────────────────────────────

/// Full characterisation of one metric over one window.
struct TrendAnalysis {
    MetricType                         metric;
    DateRange                          time_range;
    std::vector<TrendPoint>            trend_points;
    TrendDirection                     direction;
    double                             slope;
    double                             correlation;
    std::vector<anomaly::AnomalyPoint> anomalies;
    TrendSummary                       summary;
    double                             confidence;  ///< ∈ [0, 1]
    quality::DataQualityAssessment     data_quality;  ///< Over the windowed records
};

// ─── Prediction ───────────────────────────────────────────────────────────────

/// Forecast points produced from a completed analysis.
struct TrendPrediction {
    MetricType              metric;
    std::vector<TrendPoint> predicted_points;  ///< Future-dated, values ≥ 0
    double                  confidence;
    std::string             methodology;
    Timestamp               valid_until;
};

/// Point-forecast method for `predict_value`.
enum class PredictionMethod {
    LinearRegression,
    ExponentialSmoothing,
    MovingAverage,
    SeasonalDecomposition,
};

[[nodiscard]] std::string_view to_string(PredictionMethod method) noexcept;

// ─── Timeframe reports ────────────────────────────────────────────────────────

/// Reporting horizon for `detect_trend` / `generate_report`.
enum class Timeframe {
    Day,
    Week,
    Month,
    Year,
};

[[nodiscard]] int days(Timeframe timeframe) noexcept;
[[nodiscard]] std::string_view to_string(Timeframe timeframe) noexcept;

/// Direction, strength and confidence of a series plus a one-line summary.
struct TrendResult {
    TrendDirection direction;
    double         strength;    ///< |r|
    double         confidence;  ///< R²
    double         slope;
    std::string    analysis;
};

struct AnalysisReport {
    std::vector<TrendPoint>                        data_points;
    TrendResult                                    trend;
    std::optional<std::vector<MovingAveragePoint>> moving_average;
    double                                         variance;
    std::string                                    summary;
    Timeframe                                      timeframe;
    Timestamp                                      generated_at;
};

}  // namespace healthtrend
