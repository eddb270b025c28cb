/// @file src/analyzer/trend_analyzer.cpp
/// @brief TrendAnalyzer: window resolution, analyze_trends and delegation to
///        the stateless modules.

#include "healthtrend/analyzer.hpp"
#include "healthtrend/classifier.hpp"
#include "healthtrend/error.hpp"

#include "diagnostics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <utility>
#include <variant>

namespace healthtrend {

using stats::Statistics;

// ─── TrendAnalyzer constructor ────────────────────────────────────────────────

TrendAnalyzer::TrendAnalyzer(AnalyzerConfig config)
    : config_(std::move(config))
{}

// ─── Window resolution ────────────────────────────────────────────────────────

TrendAnalyzer::ResolvedWindow
TrendAnalyzer::resolve(const TimeWindow& window) const {
    return std::visit([this](const auto& w) -> ResolvedWindow {
        using W = std::decay_t<decltype(w)>;
        if constexpr (std::is_same_v<W, DateRange>) {
            return ResolvedWindow{.range = w, .moving_average_window = 0};
        } else {
            if (w.days <= 0 || w.moving_average_window <= 0) {
                throw AnalysisError(
                    ErrorKind::InvalidPeriod,
                    fmt::format("relative window needs positive days and moving "
                                "average window (got {} and {})",
                                w.days, w.moving_average_window));
            }
            const Timestamp now   = config_.clock();
            const auto      start = add_days(now, -static_cast<long long>(w.days));
            if (!start) {
                throw AnalysisError(ErrorKind::CalculationFailed,
                                    fmt::format("cannot step back {} days from now", w.days));
            }
            return ResolvedWindow{
                .range                 = DateRange::checked(*start, now),
                .moving_average_window = w.moving_average_window,
            };
        }
    }, window);
}

std::vector<Measurement>
TrendAnalyzer::select(std::span<const Measurement> records, const DateRange& range) {
    std::vector<Measurement> out;
    out.reserve(records.size());
    std::copy_if(records.begin(), records.end(), std::back_inserter(out),
                 [&range](const Measurement& r) { return range.contains(r.timestamp); });
    std::stable_sort(out.begin(), out.end(),
                     [](const Measurement& a, const Measurement& b) {
                         return a.timestamp < b.timestamp;
                     });
    return out;
}

int TrendAnalyzer::window_for_count(std::size_t point_count) noexcept {
    if (point_count <= 7) {
        return std::max(3, static_cast<int>(point_count / 3));
    }
    if (point_count <= 30) return 7;
    if (point_count <= 90) return 14;
    return 30;
}

// ─── Summary ──────────────────────────────────────────────────────────────────

TrendSummary TrendAnalyzer::summarize(std::span<const Measurement> sorted) noexcept {
    if (sorted.empty()) return TrendSummary{};

    std::vector<double> values;
    values.reserve(sorted.size());
    for (const auto& r : sorted) {
        values.push_back(r.value);
    }
    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());

    const double first = values.front();
    const double last  = values.back();

    return TrendSummary{
        .total_data_points  = values.size(),
        .average_value      = Statistics::mean(values),
        .minimum_value      = *lo,
        .maximum_value      = *hi,
        .standard_deviation = Statistics::sample_stddev(values),
        .change_percentage  = first == 0.0 ? 0.0 : (last - first) / first * 100.0,
        .first_value        = first,
        .last_value         = last,
    };
}

// ─── TrendAnalyzer::analyze_trends ────────────────────────────────────────────

TrendAnalysis
TrendAnalyzer::analyze_trends(std::span<const Measurement> records,
                              const TimeWindow& window) const {
    detail::OperationTrace trace(config_.verbose, "analyze_trends", records.size());

    if (records.empty()) {
        throw AnalysisError(ErrorKind::InsufficientData, "no records to analyse");
    }

    // ── Step 1: Resolve window, filter and sort ──────────────────────────────
    const auto resolved = resolve(window);
    const auto sorted   = select(records, resolved.range);
    if (sorted.size() < constants::MIN_TREND_POINTS) {
        throw AnalysisError(
            ErrorKind::InsufficientData,
            fmt::format("{} record(s) inside the analysis window, need at least {}",
                        sorted.size(), constants::MIN_TREND_POINTS));
    }

    std::vector<double> values;
    values.reserve(sorted.size());
    for (const auto& r : sorted) {
        values.push_back(r.value);
    }

    // ── Step 2: Moving average over the window ───────────────────────────────
    const int ma_window = resolved.moving_average_window > 0
        ? resolved.moving_average_window
        : window_for_count(sorted.size());
    const auto averages = Statistics::moving_average(values, ma_window);

    // ── Step 3: Anomalies, flagged back onto their points ────────────────────
    auto anomalies = anomaly::AnomalyDetector::detect_anomalies(
        sorted, config_.anomaly_sensitivity);

    std::vector<TrendPoint> points;
    points.reserve(sorted.size());
    const auto lag = static_cast<std::size_t>(ma_window - 1);
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        TrendPoint p{
            .timestamp      = sorted[i].timestamp,
            .value          = sorted[i].value,
            .moving_average = std::nullopt,
            .is_anomaly     = false,
        };
        if (!averages.empty() && i >= lag) {
            p.moving_average = averages[i - lag];
        }
        p.is_anomaly = std::any_of(
            anomalies.begin(), anomalies.end(), [&p](const anomaly::AnomalyPoint& a) {
                return a.timestamp == p.timestamp && a.value == p.value;
            });
        points.push_back(p);
    }

    // ── Step 4: Regression and classification ────────────────────────────────
    const auto regression = Statistics::linear_regression_over_index(values);
    const auto direction  = trend::TrendClassifier::classify(
        values, config_.classification_threshold);

    // ── Step 5: Summary and quality-weighted confidence ──────────────────────
    const auto summary = summarize(sorted);
    const auto assessment = quality::DataQualityAssessor::assess(sorted, config_.clock());
    const double confidence = std::clamp(
        (regression.r_squared + assessment.overall_score) / 2.0, 0.0, 1.0);

    TrendAnalysis analysis{
        .metric       = sorted.front().metric,
        .time_range   = resolved.range,
        .trend_points = std::move(points),
        .direction    = direction,
        .slope        = regression.slope,
        .correlation  = regression.correlation,
        .anomalies    = std::move(anomalies),
        .summary      = summary,
        .confidence   = confidence,
        .data_quality = assessment,
    };

    trace.finish(fmt::format("{} {}, {} anomalies, confidence {:.3f}",
                             to_string(analysis.metric), to_string(direction),
                             analysis.anomalies.size(), confidence));
    return analysis;
}

// ─── Delegation: statistics ───────────────────────────────────────────────────

std::vector<double>
TrendAnalyzer::moving_average(std::span<const double> values, int window) const {
    return Statistics::moving_average(values, window);
}

std::vector<double>
TrendAnalyzer::weighted_moving_average(std::span<const double> values,
                                       std::span<const double> weights) const {
    return Statistics::weighted_moving_average(values, weights);
}

std::vector<double>
TrendAnalyzer::exponential_moving_average(std::span<const double> values,
                                          double alpha) const {
    return Statistics::exponential_moving_average(values, alpha);
}

double TrendAnalyzer::correlation(std::span<const double> a,
                                  std::span<const double> b) const {
    return Statistics::correlation(a, b);
}

stats::LinearRegressionResult
TrendAnalyzer::linear_regression(std::span<const stats::Point2D> points) const {
    return Statistics::linear_regression(points);
}

stats::VariabilityMetrics
TrendAnalyzer::variability(std::span<const double> values) const {
    return Statistics::variability(values);
}

// ─── Delegation: detection, classification, quality ───────────────────────────

std::vector<anomaly::AnomalyPoint>
TrendAnalyzer::detect_anomalies(std::span<const Measurement> records,
                                double sensitivity) const {
    return anomaly::AnomalyDetector::detect_anomalies(records, sensitivity);
}

std::vector<std::size_t>
TrendAnalyzer::detect_outliers(std::span<const double> values,
                               anomaly::OutlierMethod method) const {
    return anomaly::AnomalyDetector::detect_outliers(values, method);
}

TrendDirection TrendAnalyzer::classify_trend(std::span<const double> values,
                                             double threshold) const {
    return trend::TrendClassifier::classify(values, threshold);
}

double TrendAnalyzer::trend_strength(const TrendAnalysis& analysis) const {
    return trend::TrendClassifier::trend_strength(analysis);
}

quality::DataQualityAssessment
TrendAnalyzer::assess_data_quality(std::span<const Measurement> records) const {
    detail::OperationTrace trace(config_.verbose, "assess_data_quality", records.size());
    auto assessment = quality::DataQualityAssessor::assess(records, config_.clock());
    trace.finish(fmt::format("overall {:.3f}, {} issue(s)",
                             assessment.overall_score, assessment.issues.size()));
    return assessment;
}

std::vector<DateRange>
TrendAnalyzer::identify_data_gaps(std::span<const Measurement> records,
                                  quality::DataFrequency expected_frequency) const {
    return quality::DataQualityAssessor::identify_gaps(records, expected_frequency);
}

}  // namespace healthtrend
