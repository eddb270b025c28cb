/// @file src/analyzer/report.cpp
/// @brief TrendAnalyzer timeframe reporting: detect_trend,
///        moving_average_points and generate_report.

#include "healthtrend/analyzer.hpp"
#include "healthtrend/classifier.hpp"
#include "healthtrend/error.hpp"

#include "diagnostics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace healthtrend {

using stats::Statistics;

namespace {

std::vector<Measurement> sorted_copy(std::span<const Measurement> records, bool newest_first) {
    std::vector<Measurement> out(records.begin(), records.end());
    std::stable_sort(out.begin(), out.end(),
                     [newest_first](const Measurement& a, const Measurement& b) {
                         return newest_first ? a.timestamp > b.timestamp
                                             : a.timestamp < b.timestamp;
                     });
    return out;
}

std::vector<double> values_of(std::span<const Measurement> records) {
    std::vector<double> out;
    out.reserve(records.size());
    for (const auto& r : records) {
        out.push_back(r.value);
    }
    return out;
}

std::string_view direction_word(TrendDirection direction) noexcept {
    switch (direction) {
        case TrendDirection::Increasing: return "upward";
        case TrendDirection::Decreasing: return "downward";
        case TrendDirection::Stable:     return "stable";
        case TrendDirection::Volatile:   return "volatile";
    }
    return "unknown";
}

/// "strong" / "moderate" / "weak" style banding at 0.8 and 0.5.
std::string_view band(double score, std::string_view high, std::string_view mid,
                      std::string_view low) noexcept {
    if (score > 0.8) return high;
    if (score > 0.5) return mid;
    return low;
}

}  // anonymous namespace

// ─── TrendAnalyzer::moving_average_points ─────────────────────────────────────

std::vector<MovingAveragePoint>
TrendAnalyzer::moving_average_points(std::span<const Measurement> records,
                                     int period) const {
    if (records.empty()) {
        throw AnalysisError(ErrorKind::InsufficientData,
                            "no records for moving average");
    }
    if (period <= 0 || static_cast<std::size_t>(period) > records.size()) {
        throw AnalysisError(
            ErrorKind::InsufficientData,
            fmt::format("moving average period {} needs between 1 and {} records",
                        period, records.size()));
    }

    const auto newest_first = sorted_copy(records, true);
    const auto values       = values_of(newest_first);
    const auto means        = Statistics::moving_average(values, period);

    std::vector<MovingAveragePoint> out;
    out.reserve(means.size());
    for (std::size_t i = 0; i < means.size(); ++i) {
        out.push_back(MovingAveragePoint{
            .timestamp      = newest_first[i].timestamp,
            .value          = means[i],
            .original_value = newest_first[i].value,
        });
    }
    return out;
}

// ─── TrendAnalyzer::detect_trend ──────────────────────────────────────────────

std::string TrendAnalyzer::describe(const TrendResult& result, Timeframe timeframe) {
    return fmt::format("A {} {} trend detected over {} with {} confidence.",
                       band(result.strength, "strong", "moderate", "weak"),
                       direction_word(result.direction),
                       to_string(timeframe),
                       band(result.confidence, "high", "moderate", "low"));
}

TrendResult TrendAnalyzer::detect_trend(std::span<const Measurement> records,
                                        Timeframe timeframe) const {
    detail::OperationTrace trace(config_.verbose, "detect_trend", records.size());

    if (records.size() < constants::MIN_TREND_POINTS) {
        throw AnalysisError(
            ErrorKind::InsufficientData,
            fmt::format("trend detection needs at least {} records (got {})",
                        constants::MIN_TREND_POINTS, records.size()));
    }

    const auto values     = values_of(sorted_copy(records, false));
    const auto regression = Statistics::linear_regression_over_index(values);

    TrendResult result{
        .direction  = trend::TrendClassifier::classify(
                          values, constants::DETECT_TREND_THRESHOLD),
        .strength   = std::abs(regression.correlation),
        .confidence = regression.r_squared,
        .slope      = regression.slope,
        .analysis   = {},
    };
    result.analysis = describe(result, timeframe);

    trace.finish(fmt::format("{}, strength {:.3f}", to_string(result.direction),
                             result.strength));
    return result;
}

// ─── TrendAnalyzer::generate_report ───────────────────────────────────────────

std::string TrendAnalyzer::report_summary(const TrendSummary& summary,
                                          const TrendResult& trend,
                                          double variance, Timeframe timeframe) {
    return fmt::format(
        "Analysis Summary:\n"
        "• Time Period: {}\n"
        "• Data Points: {}\n"
        "• Average Value: {:.1f}\n"
        "• Range: {:.1f} - {:.1f}\n"
        "• Variance: {:.2f}\n"
        "• Trend: {}",
        to_string(timeframe), summary.total_data_points, summary.average_value,
        summary.minimum_value, summary.maximum_value, variance, trend.analysis);
}

AnalysisReport TrendAnalyzer::generate_report(std::span<const Measurement> records,
                                              Timeframe timeframe,
                                              bool include_moving_average,
                                              int period) const {
    if (records.empty()) {
        throw AnalysisError(ErrorKind::InsufficientData, "no records to report on");
    }

    const auto sorted = sorted_copy(records, false);

    std::vector<TrendPoint> points;
    points.reserve(sorted.size());
    std::transform(sorted.begin(), sorted.end(), std::back_inserter(points),
                   [](const Measurement& r) {
                       return TrendPoint{
                           .timestamp      = r.timestamp,
                           .value          = r.value,
                           .moving_average = std::nullopt,
                           .is_anomaly     = false,
                       };
                   });

    auto trend = detect_trend(records, timeframe);

    std::optional<std::vector<MovingAveragePoint>> averages;
    if (include_moving_average && period > 0
        && static_cast<std::size_t>(period) <= records.size()) {
        averages = moving_average_points(records, period);
    }

    const double variance = Statistics::variability(values_of(sorted)).variance;
    auto         summary  = report_summary(summarize(sorted), trend, variance, timeframe);

    return AnalysisReport{
        .data_points    = std::move(points),
        .trend          = std::move(trend),
        .moving_average = std::move(averages),
        .variance       = variance,
        .summary        = std::move(summary),
        .timeframe      = timeframe,
        .generated_at   = config_.clock(),
    };
}

}  // namespace healthtrend
