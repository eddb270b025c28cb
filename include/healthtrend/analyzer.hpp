#pragma once

/// @file include/healthtrend/analyzer.hpp
/// @brief Trend analysis orchestrator: public API.
///
/// # Module: Trend Analyzer
///
/// ## Responsibility
/// Turn a caller-supplied measurement series into a complete trend
/// characterisation:
///   records → window filter + sort → moving average → regression →
///   classification → anomalies → summary → quality-weighted confidence
///
/// ## Usage
/// ```cpp
/// TrendAnalyzer analyzer;
/// auto records = DataLoader::load_csv("weight.csv");
/// if (records) {
///     auto analysis = analyzer.analyze_trends(*records, to_window(TimeRange::Month));
///     fmt::print("{} ({:.2f})\n", to_string(analysis.direction), analysis.confidence);
/// }
/// ```
///
/// ## Guarantees
/// - Public entry points throw `AnalysisError`; nothing is swallowed
/// - All methods are const; concurrent calls on one analyzer are safe
/// - Results are fresh value snapshots, never shared with the analyzer
///
/// ## NOT Responsible For
/// - Fetching or persisting records
/// - Multivariate or model-based forecasting

#include "healthtrend/anomaly.hpp"
#include "healthtrend/constants.hpp"
#include "healthtrend/quality.hpp"
#include "healthtrend/statistics.hpp"
#include "healthtrend/trend_types.hpp"
#include "healthtrend/types.hpp"

#include <cstddef>
#include <functional>
#include <span>
#include <vector>

namespace healthtrend {

// ─── AnalyzerConfig ───────────────────────────────────────────────────────────

/// Tunables for the analyzer.
struct AnalyzerConfig {
    /// Minimum |z| for a record to be reported as an anomaly.
    double anomaly_sensitivity = constants::DEFAULT_ANOMALY_SENSITIVITY;

    /// |slope / mean| below which a series classifies as Stable.
    double classification_threshold = constants::DEFAULT_CLASSIFICATION_THRESHOLD;

    /// Source of "now" for relative windows, timeliness and prediction expiry.
    std::function<Timestamp()> clock = [] { return Clock::now(); };

    /// If true, print one diagnostic line per operation to stderr.
    bool verbose = false;
};

// ─── ITrendAnalyzer ───────────────────────────────────────────────────────────

/// Operations of the analysis engine, substitutable by test doubles.
class ITrendAnalyzer {
public:
    virtual ~ITrendAnalyzer() = default;

    // ── Orchestration ────────────────────────────────────────────────────────

    /// Analyse `records` inside `window`.
    ///
    /// # Errors
    /// - `InsufficientData` for empty input or fewer than 2 records in window
    /// - `InvalidPeriod` for a relative window with non-positive fields
    /// - `CalculationFailed` if the window start cannot be represented
    [[nodiscard]] virtual TrendAnalysis
    analyze_trends(std::span<const Measurement> records, const TimeWindow& window) const = 0;

    /// Extrapolate the analysis slope `days_ahead` days past its last point.
    ///
    /// # Errors
    /// - `InvalidPeriod` for `days_ahead <= 0`
    /// - `InsufficientData` for an analysis without points
    /// - `CalculationFailed` on date overflow
    [[nodiscard]] virtual TrendPrediction
    predict_trend(const TrendAnalysis& analysis, int days_ahead) const = 0;

    /// Single-value forecast `days_ahead` steps past the last record.
    [[nodiscard]] virtual double
    predict_value(std::span<const Measurement> records, int days_ahead,
                  PredictionMethod method) const = 0;

    /// Direction, strength and confidence over a reporting horizon.
    [[nodiscard]] virtual TrendResult
    detect_trend(std::span<const Measurement> records, Timeframe timeframe) const = 0;

    /// Moving-average points over records ordered newest first.
    [[nodiscard]] virtual std::vector<MovingAveragePoint>
    moving_average_points(std::span<const Measurement> records, int period) const = 0;

    [[nodiscard]] virtual AnalysisReport
    generate_report(std::span<const Measurement> records, Timeframe timeframe,
                    bool include_moving_average, int period) const = 0;

    // ── Statistics ───────────────────────────────────────────────────────────

    [[nodiscard]] virtual std::vector<double>
    moving_average(std::span<const double> values, int window) const = 0;

    [[nodiscard]] virtual std::vector<double>
    weighted_moving_average(std::span<const double> values,
                            std::span<const double> weights) const = 0;

    [[nodiscard]] virtual std::vector<double>
    exponential_moving_average(std::span<const double> values, double alpha) const = 0;

    [[nodiscard]] virtual double
    correlation(std::span<const double> a, std::span<const double> b) const = 0;

    [[nodiscard]] virtual stats::LinearRegressionResult
    linear_regression(std::span<const stats::Point2D> points) const = 0;

    [[nodiscard]] virtual stats::VariabilityMetrics
    variability(std::span<const double> values) const = 0;

    // ── Detection & classification ───────────────────────────────────────────

    [[nodiscard]] virtual std::vector<anomaly::AnomalyPoint>
    detect_anomalies(std::span<const Measurement> records, double sensitivity) const = 0;

    [[nodiscard]] virtual std::vector<std::size_t>
    detect_outliers(std::span<const double> values, anomaly::OutlierMethod method) const = 0;

    [[nodiscard]] virtual TrendDirection
    classify_trend(std::span<const double> values, double threshold) const = 0;

    [[nodiscard]] virtual double
    trend_strength(const TrendAnalysis& analysis) const = 0;

    // ── Data quality ─────────────────────────────────────────────────────────

    [[nodiscard]] virtual quality::DataQualityAssessment
    assess_data_quality(std::span<const Measurement> records) const = 0;

    [[nodiscard]] virtual std::vector<DateRange>
    identify_data_gaps(std::span<const Measurement> records,
                       quality::DataFrequency expected_frequency) const = 0;
};

// ─── TrendAnalyzer ────────────────────────────────────────────────────────────

/// Default engine built on the stateless statistics, anomaly, classifier and
/// quality modules.
class TrendAnalyzer final : public ITrendAnalyzer {
public:
    explicit TrendAnalyzer(AnalyzerConfig config = AnalyzerConfig{});

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

    [[nodiscard]] TrendAnalysis
    analyze_trends(std::span<const Measurement> records,
                   const TimeWindow& window) const override;

    [[nodiscard]] TrendPrediction
    predict_trend(const TrendAnalysis& analysis, int days_ahead) const override;

    /// # Methods
    /// - LinearRegression:      index regression evaluated at n + days_ahead − 1
    /// - ExponentialSmoothing:  last EMA value, α = 0.3
    /// - MovingAverage:         last moving average, window min(7, n)
    /// - SeasonalDecomposition: last value
    ///
    /// # Errors
    /// `InsufficientData` for empty input.
    [[nodiscard]] double
    predict_value(std::span<const Measurement> records, int days_ahead,
                  PredictionMethod method) const override;

    /// # Errors
    /// `InsufficientData` for fewer than 2 records.
    [[nodiscard]] TrendResult
    detect_trend(std::span<const Measurement> records,
                 Timeframe timeframe) const override;

    /// # Errors
    /// `InsufficientData` for empty input or `period` outside [1, n].
    [[nodiscard]] std::vector<MovingAveragePoint>
    moving_average_points(std::span<const Measurement> records,
                          int period) const override;

    /// # Errors
    /// `InsufficientData` for empty input (or fewer than 2 records).
    [[nodiscard]] AnalysisReport
    generate_report(std::span<const Measurement> records, Timeframe timeframe,
                    bool include_moving_average, int period) const override;

    [[nodiscard]] std::vector<double>
    moving_average(std::span<const double> values, int window) const override;

    [[nodiscard]] std::vector<double>
    weighted_moving_average(std::span<const double> values,
                            std::span<const double> weights) const override;

    [[nodiscard]] std::vector<double>
    exponential_moving_average(std::span<const double> values,
                               double alpha) const override;

    [[nodiscard]] double
    correlation(std::span<const double> a, std::span<const double> b) const override;

    [[nodiscard]] stats::LinearRegressionResult
    linear_regression(std::span<const stats::Point2D> points) const override;

    [[nodiscard]] stats::VariabilityMetrics
    variability(std::span<const double> values) const override;

    [[nodiscard]] std::vector<anomaly::AnomalyPoint>
    detect_anomalies(std::span<const Measurement> records,
                     double sensitivity) const override;

    [[nodiscard]] std::vector<std::size_t>
    detect_outliers(std::span<const double> values,
                    anomaly::OutlierMethod method) const override;

    [[nodiscard]] TrendDirection
    classify_trend(std::span<const double> values, double threshold) const override;

    [[nodiscard]] double trend_strength(const TrendAnalysis& analysis) const override;

    /// Assessed as of `config().clock()`.
    [[nodiscard]] quality::DataQualityAssessment
    assess_data_quality(std::span<const Measurement> records) const override;

    [[nodiscard]] std::vector<DateRange>
    identify_data_gaps(std::span<const Measurement> records,
                       quality::DataFrequency expected_frequency) const override;

    /// Moving-average window for an explicit range holding `point_count`
    /// records: ≤7 → max(3, n/3), ≤30 → 7, ≤90 → 14, else 30.
    [[nodiscard]] static int window_for_count(std::size_t point_count) noexcept;

    /// Descriptive statistics of an ascending series.
    [[nodiscard]] static TrendSummary
    summarize(std::span<const Measurement> sorted) noexcept;

private:
    /// Resolve a time window to concrete bounds and a moving-average window.
    struct ResolvedWindow {
        DateRange range;
        int       moving_average_window;  ///< 0 → choose by record count
    };

    [[nodiscard]] ResolvedWindow resolve(const TimeWindow& window) const;

    /// Copy, filter to `range` (inclusive) and sort ascending by timestamp.
    [[nodiscard]] static std::vector<Measurement>
    select(std::span<const Measurement> records, const DateRange& range);

    /// Stable direction/strength/confidence text for `detect_trend`.
    [[nodiscard]] static std::string
    describe(const TrendResult& result, Timeframe timeframe);

    [[nodiscard]] static std::string
    report_summary(const TrendSummary& summary, const TrendResult& trend,
                   double variance, Timeframe timeframe);

    AnalyzerConfig config_;
};

}  // namespace healthtrend
