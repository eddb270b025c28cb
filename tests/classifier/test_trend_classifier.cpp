/// @file tests/classifier/test_trend_classifier.cpp
/// @brief Unit tests for TrendClassifier.
///
/// Test categories:
///   - Increasing / decreasing / stable / volatile on synthetic series
///   - Threshold sensitivity (default 0.1 vs 0.01)
///   - Zero-mean series keep their raw slope
///   - trend_strength formula, clamping and degenerate summaries

#include <gtest/gtest.h>
#include "healthtrend/classifier.hpp"

#include <chrono>
#include <vector>

using namespace healthtrend;
using namespace healthtrend::trend;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// Analysis with only the fields trend_strength reads filled in.
static TrendAnalysis make_analysis(double correlation, double average, double stddev,
                                   std::size_t points, std::size_t anomaly_count) {
    const Timestamp t{std::chrono::seconds{1'700'000'000}};
    TrendAnalysis a{
        .metric       = MetricType::Weight,
        .time_range   = DateRange::make(t, t).value(),
        .trend_points = {},
        .direction    = TrendDirection::Stable,
        .slope        = 0.0,
        .correlation  = correlation,
        .anomalies    = {},
        .summary      = TrendSummary{
            .total_data_points  = points,
            .average_value      = average,
            .standard_deviation = stddev,
        },
        .confidence   = 0.5,
    };
    for (std::size_t i = 0; i < anomaly_count; ++i) {
        a.anomalies.push_back(anomaly::AnomalyPoint{
            .timestamp       = t,
            .value           = average,
            .expected_value  = average,
            .deviation_score = 2.0,
            .severity        = anomaly::AnomalySeverity::Medium,
        });
    }
    return a;
}

// ─── classify ────────────────────────────────────────────────────────────────

TEST(TrendClassifier, IncreasingSeries) {
    const std::vector<double> v{20, 23, 26, 29};
    EXPECT_EQ(TrendClassifier::classify(v), TrendDirection::Increasing);
}

TEST(TrendClassifier, DecreasingSeries) {
    const std::vector<double> v{29, 26, 23, 20};
    EXPECT_EQ(TrendClassifier::classify(v), TrendDirection::Decreasing);
}

TEST(TrendClassifier, Scenario_FlatSeriesIsStable) {
    const std::vector<double> v(10, 70.0);
    EXPECT_EQ(TrendClassifier::classify(v), TrendDirection::Stable);
}

TEST(TrendClassifier, HighCoefficientOfVariationIsVolatile) {
    const std::vector<double> v{10, 50, 5, 60, 8};
    EXPECT_EQ(TrendClassifier::classify(v), TrendDirection::Volatile);
}

TEST(TrendClassifier, FewerThanTwoValuesIsStable) {
    const std::vector<double> one{42.0};
    EXPECT_EQ(TrendClassifier::classify(one), TrendDirection::Stable);
    EXPECT_EQ(TrendClassifier::classify({}), TrendDirection::Stable);
}

TEST(TrendClassifier, Scenario_GentleRiseDependsOnThreshold) {
    // slope / mean = 1 / 70 ≈ 0.0143
    const std::vector<double> v{68, 69, 70, 71, 72};
    EXPECT_EQ(TrendClassifier::classify(v, 0.01), TrendDirection::Increasing);
    EXPECT_EQ(TrendClassifier::classify(v, 0.1), TrendDirection::Stable);
}

TEST(TrendClassifier, ZeroMeanUsesRawSlope) {
    const std::vector<double> v{-2, -1, 0, 1, 2};
    EXPECT_DOUBLE_EQ(TrendClassifier::normalized_slope(1.0, 0.0), 1.0);
    EXPECT_EQ(TrendClassifier::classify(v), TrendDirection::Increasing);
}

TEST(TrendClassifier, NormalizedSlope) {
    EXPECT_DOUBLE_EQ(TrendClassifier::normalized_slope(2.0, 100.0), 0.02);
    EXPECT_DOUBLE_EQ(TrendClassifier::normalized_slope(-5.0, 50.0), -0.1);
}

// ─── trend_strength ──────────────────────────────────────────────────────────

TEST(TrendStrength, BlendsCorrelationConsistencyAndPenalty) {
    // (0.9 + (1 − 5/100)) / 2 − (1/10)·0.1 = 0.915
    const auto a = make_analysis(0.9, 100.0, 5.0, 10, 1);
    EXPECT_NEAR(TrendClassifier::trend_strength(a), 0.915, 1e-12);
}

TEST(TrendStrength, NegativeCorrelationCountsByMagnitude) {
    const auto pos = make_analysis(0.7, 100.0, 10.0, 10, 0);
    const auto neg = make_analysis(-0.7, 100.0, 10.0, 10, 0);
    EXPECT_DOUBLE_EQ(TrendClassifier::trend_strength(pos),
                     TrendClassifier::trend_strength(neg));
}

TEST(TrendStrength, ZeroMeanDropsConsistency) {
    const auto a = make_analysis(0.6, 0.0, 1.0, 10, 0);
    EXPECT_NEAR(TrendClassifier::trend_strength(a), 0.3, 1e-12);
}

TEST(TrendStrength, ClampedToZero) {
    const auto a = make_analysis(0.0, 10.0, 50.0, 4, 4);
    EXPECT_DOUBLE_EQ(TrendClassifier::trend_strength(a), 0.0);
}

TEST(TrendStrength, NoPointsMeansNoPenalty) {
    const auto a = make_analysis(1.0, 100.0, 0.0, 0, 3);
    EXPECT_DOUBLE_EQ(TrendClassifier::trend_strength(a), 1.0);
}
