/// @file tests/analyzer/test_prediction.cpp
/// @brief Unit tests for forecasting and timeframe reporting.
///
/// Test categories:
///   - predict_trend: horizon validation, point dates and values,
///     non-negative clamp, confidence bounds, expiry
///   - predict_value for every PredictionMethod
///   - moving_average_points ordering and validation
///   - detect_trend classification and summary text
///   - generate_report contents

#include <gtest/gtest.h>
#include "healthtrend/analyzer.hpp"
#include "healthtrend/error.hpp"

#include <chrono>
#include <vector>

using namespace healthtrend;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static const Timestamp NOW{std::chrono::seconds{1'750'000'000}};

static Timestamp day_offset(int days) {
    return NOW + std::chrono::hours{24 * days};
}

static TrendAnalyzer pinned_analyzer() {
    return TrendAnalyzer(AnalyzerConfig{.clock = [] { return NOW; }});
}

static std::vector<Measurement> daily_until_now(const std::vector<double>& values) {
    std::vector<Measurement> out;
    const int n = static_cast<int>(values.size());
    for (int i = 0; i < n; ++i) {
        out.push_back(Measurement{
            .timestamp = day_offset(i - (n - 1)),
            .value     = values[static_cast<std::size_t>(i)],
            .metric    = MetricType::Weight,
        });
    }
    return out;
}

// ─── predict_trend ───────────────────────────────────────────────────────────

TEST(PredictTrend, Scenario_ZeroDaysIsInvalidPeriod) {
    const auto analyzer = pinned_analyzer();
    const auto analysis = analyzer.analyze_trends(daily_until_now({70, 71, 72}),
                                                  to_window(TimeRange::Week));
    try {
        (void)analyzer.predict_trend(analysis, 0);
        FAIL() << "expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidPeriod);
    }
    EXPECT_THROW((void)analyzer.predict_trend(analysis, -3), AnalysisError);
}

TEST(PredictTrend, EmptyAnalysisIsInsufficientData) {
    const auto analyzer = pinned_analyzer();
    auto analysis = analyzer.analyze_trends(daily_until_now({70, 71, 72}),
                                            to_window(TimeRange::Week));
    analysis.trend_points.clear();
    try {
        (void)analyzer.predict_trend(analysis, 5);
        FAIL() << "expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InsufficientData);
    }
}

TEST(PredictTrend, ExtrapolatesSlopeFromLastPoint) {
    const auto analyzer = pinned_analyzer();
    const auto analysis = analyzer.analyze_trends(daily_until_now({70, 71, 72, 73}),
                                                  to_window(TimeRange::Week));
    const auto p = analyzer.predict_trend(analysis, 3);

    ASSERT_EQ(p.predicted_points.size(), 3u);
    for (int d = 1; d <= 3; ++d) {
        const auto& point = p.predicted_points[static_cast<std::size_t>(d - 1)];
        EXPECT_EQ(point.timestamp, day_offset(d));
        EXPECT_NEAR(point.value, 73.0 + d, 1e-9);
        EXPECT_FALSE(point.moving_average.has_value());
        EXPECT_FALSE(point.is_anomaly);
    }
    EXPECT_EQ(p.metric, MetricType::Weight);
    EXPECT_EQ(p.methodology, "Linear Regression");
    EXPECT_EQ(p.valid_until, day_offset(3));
}

TEST(PredictTrend, ValuesNeverGoNegative) {
    const auto analyzer = pinned_analyzer();
    std::vector<Measurement> records = daily_until_now({30, 20, 10});
    for (auto& r : records) r.metric = MetricType::Calories;
    const auto analysis = analyzer.analyze_trends(records, to_window(TimeRange::Week));
    const auto p = analyzer.predict_trend(analysis, 10);
    for (const auto& point : p.predicted_points) {
        EXPECT_GE(point.value, 0.0);
    }
    EXPECT_DOUBLE_EQ(p.predicted_points.back().value, 0.0);
}

TEST(PredictTrend, ConfidenceIsDecayedAndClamped) {
    const auto analyzer = pinned_analyzer();
    auto analysis = analyzer.analyze_trends(daily_until_now({70, 71, 72}),
                                            to_window(TimeRange::Week));
    analysis.confidence = 0.5;
    EXPECT_NEAR(analyzer.predict_trend(analysis, 1).confidence, 0.4, 1e-12);
    analysis.confidence = 1.0;
    EXPECT_NEAR(analyzer.predict_trend(analysis, 1).confidence, 0.8, 1e-12);
    analysis.confidence = 0.0;
    EXPECT_DOUBLE_EQ(analyzer.predict_trend(analysis, 1).confidence, 0.1);
}

// ─── predict_value ───────────────────────────────────────────────────────────

TEST(PredictValue, EveryMethod) {
    const auto analyzer = pinned_analyzer();
    const auto records  = daily_until_now({10, 12, 14, 16});

    // Line y = 10 + 2x evaluated at x = 4 + 2 − 1.
    EXPECT_NEAR(analyzer.predict_value(records, 2, PredictionMethod::LinearRegression),
                20.0, 1e-9);

    // EMA α = 0.3: 10, 10.6, 11.62, 12.934
    EXPECT_NEAR(analyzer.predict_value(records, 2, PredictionMethod::ExponentialSmoothing),
                12.934, 1e-9);

    // Window min(7, 4) = 4 → mean of all
    EXPECT_NEAR(analyzer.predict_value(records, 2, PredictionMethod::MovingAverage),
                13.0, 1e-12);

    EXPECT_DOUBLE_EQ(analyzer.predict_value(records, 2, PredictionMethod::SeasonalDecomposition),
                     16.0);
}

TEST(PredictValue, SortsRecordsFirst) {
    const auto analyzer = pinned_analyzer();
    auto records = daily_until_now({10, 12, 14, 16});
    std::swap(records[0], records[3]);
    EXPECT_DOUBLE_EQ(analyzer.predict_value(records, 1, PredictionMethod::SeasonalDecomposition),
                     16.0);
}

TEST(PredictValue, EmptyInputIsInsufficientData) {
    const auto analyzer = pinned_analyzer();
    EXPECT_THROW((void)analyzer.predict_value({}, 1, PredictionMethod::MovingAverage),
                 AnalysisError);
}

// ─── moving_average_points ───────────────────────────────────────────────────

TEST(MovingAveragePoints, NewestFirstWindows) {
    const auto analyzer = pinned_analyzer();
    const auto records  = daily_until_now({70, 71, 69, 72, 68});
    const auto points   = analyzer.moving_average_points(records, 3);

    ASSERT_EQ(points.size(), 3u);
    // Newest first: 68, 72, 69, 71, 70
    EXPECT_EQ(points[0].timestamp, NOW);
    EXPECT_DOUBLE_EQ(points[0].original_value, 68.0);
    EXPECT_NEAR(points[0].value, (68.0 + 72.0 + 69.0) / 3.0, 1e-12);
    EXPECT_EQ(points[2].timestamp, day_offset(-2));
    EXPECT_NEAR(points[2].value, 70.0, 1e-12);
}

TEST(MovingAveragePoints, PeriodOutsideRangeIsInsufficientData) {
    const auto analyzer = pinned_analyzer();
    const auto records  = daily_until_now({70, 71, 69});
    EXPECT_THROW((void)analyzer.moving_average_points(records, 0), AnalysisError);
    EXPECT_THROW((void)analyzer.moving_average_points(records, 4), AnalysisError);
    EXPECT_THROW((void)analyzer.moving_average_points({}, 1), AnalysisError);
    EXPECT_EQ(analyzer.moving_average_points(records, 3).size(), 1u);
}

// ─── detect_trend ────────────────────────────────────────────────────────────

TEST(DetectTrend, StrongUpwardTrend) {
    const auto analyzer = pinned_analyzer();
    const auto t = analyzer.detect_trend(daily_until_now({70, 71, 72, 73, 74, 75, 76}),
                                         Timeframe::Week);
    EXPECT_EQ(t.direction, TrendDirection::Increasing);
    EXPECT_GT(t.strength, 0.8);
    EXPECT_GT(t.slope, 0.0);
    EXPECT_EQ(t.analysis,
              "A strong upward trend detected over week with high confidence.");
}

TEST(DetectTrend, StrongDownwardTrend) {
    const auto analyzer = pinned_analyzer();
    const auto t = analyzer.detect_trend(daily_until_now({80, 79, 78, 77, 76, 75, 74}),
                                         Timeframe::Month);
    EXPECT_EQ(t.direction, TrendDirection::Decreasing);
    EXPECT_GT(t.strength, 0.8);
    EXPECT_NEAR(t.confidence, t.strength * t.strength, 1e-12);
}

TEST(DetectTrend, StableSeriesIsWeak) {
    const auto analyzer = pinned_analyzer();
    const auto t = analyzer.detect_trend(daily_until_now({70, 70.1, 69.9, 70, 70.1, 69.9, 70}),
                                         Timeframe::Week);
    EXPECT_EQ(t.direction, TrendDirection::Stable);
    EXPECT_LE(t.strength, 0.31);
    EXPECT_EQ(t.analysis, "A weak stable trend detected over week with low confidence.");
}

TEST(DetectTrend, NeedsTwoRecords) {
    const auto analyzer = pinned_analyzer();
    EXPECT_THROW((void)analyzer.detect_trend(daily_until_now({70}), Timeframe::Day),
                 AnalysisError);
}

// ─── generate_report ─────────────────────────────────────────────────────────

TEST(GenerateReport, BundlesTrendAveragesAndSummary) {
    const auto analyzer = pinned_analyzer();
    const auto records  = daily_until_now({70, 71, 72, 73, 74});
    const auto report   = analyzer.generate_report(records, Timeframe::Week, true, 3);

    EXPECT_EQ(report.data_points.size(), 5u);
    EXPECT_EQ(report.trend.direction, TrendDirection::Increasing);
    ASSERT_TRUE(report.moving_average.has_value());
    EXPECT_EQ(report.moving_average->size(), 3u);
    EXPECT_DOUBLE_EQ(report.variance, 2.5);
    EXPECT_EQ(report.timeframe, Timeframe::Week);
    EXPECT_EQ(report.generated_at, NOW);
    EXPECT_EQ(report.summary,
              "Analysis Summary:\n"
              "• Time Period: week\n"
              "• Data Points: 5\n"
              "• Average Value: 72.0\n"
              "• Range: 70.0 - 74.0\n"
              "• Variance: 2.50\n"
              "• Trend: " + report.trend.analysis);
}

TEST(GenerateReport, MovingAverageOmittedWhenNotRequestedOrTooLong) {
    const auto analyzer = pinned_analyzer();
    const auto records  = daily_until_now({70, 71, 72});
    EXPECT_FALSE(analyzer.generate_report(records, Timeframe::Day, false, 2)
                     .moving_average.has_value());
    EXPECT_FALSE(analyzer.generate_report(records, Timeframe::Day, true, 7)
                     .moving_average.has_value());
}

TEST(GenerateReport, EmptyInputIsInsufficientData) {
    const auto analyzer = pinned_analyzer();
    EXPECT_THROW((void)analyzer.generate_report({}, Timeframe::Year, true, 3), AnalysisError);
}
