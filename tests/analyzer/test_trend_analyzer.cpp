/// @file tests/analyzer/test_trend_analyzer.cpp
/// @brief Unit tests for TrendAnalyzer::analyze_trends and its helpers.
///
/// Test categories:
///   - Error kinds for empty input, invalid windows and sparse windows
///   - Window filtering (inclusive bounds) and ascending sort
///   - Trend points: moving average placement and anomaly flags
///   - Summary statistics and confidence bounds
///   - Moving-average window heuristic (record count) for explicit ranges
///   - Delegation through the ITrendAnalyzer interface

#include <gtest/gtest.h>
#include "healthtrend/analyzer.hpp"
#include "healthtrend/error.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <vector>

using namespace healthtrend;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static const Timestamp NOW{std::chrono::seconds{1'750'000'000}};

static Timestamp day_offset(int days) {
    return NOW + std::chrono::hours{24 * days};
}

/// Analyzer whose clock is pinned to NOW.
static TrendAnalyzer pinned_analyzer() {
    return TrendAnalyzer(AnalyzerConfig{.clock = [] { return NOW; }});
}

/// One weight record per day, the last stamped NOW.
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

static ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const AnalysisError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected AnalysisError";
    return ErrorKind::CalculationFailed;
}

// ─── Errors ──────────────────────────────────────────────────────────────────

TEST(AnalyzeTrends, Scenario_EmptyInputIsInsufficientData) {
    const auto analyzer = pinned_analyzer();
    EXPECT_EQ(kind_of([&] {
        (void)analyzer.analyze_trends({}, to_window(TimeRange::Month));
    }), ErrorKind::InsufficientData);
}

TEST(AnalyzeTrends, SingleRecordInWindowIsInsufficientData) {
    const auto analyzer = pinned_analyzer();
    auto records = daily_until_now({70, 71, 72});
    records[0].timestamp = day_offset(-400);
    records[1].timestamp = day_offset(-300);
    EXPECT_EQ(kind_of([&] {
        (void)analyzer.analyze_trends(records, to_window(TimeRange::Week));
    }), ErrorKind::InsufficientData);
}

TEST(AnalyzeTrends, NonPositiveRelativeWindowIsInvalidPeriod) {
    const auto analyzer = pinned_analyzer();
    const auto records  = daily_until_now({70, 71, 72});
    EXPECT_EQ(kind_of([&] {
        (void)analyzer.analyze_trends(records, RelativeWindow{.days = 0, .moving_average_window = 3});
    }), ErrorKind::InvalidPeriod);
    EXPECT_EQ(kind_of([&] {
        (void)analyzer.analyze_trends(records, RelativeWindow{.days = 7, .moving_average_window = -1});
    }), ErrorKind::InvalidPeriod);
}

TEST(DateRangeChecked, InvertedBoundsAreInvalidTimeframe) {
    EXPECT_FALSE(DateRange::make(NOW, day_offset(-1)).has_value());
    EXPECT_EQ(kind_of([] { (void)DateRange::checked(NOW, day_offset(-1)); }),
              ErrorKind::InvalidTimeframe);
}

TEST(TimeRange, PresetsAndNames) {
    EXPECT_EQ(to_window(TimeRange::Week).days, 7);
    EXPECT_EQ(to_window(TimeRange::Week).moving_average_window, 7);
    EXPECT_EQ(to_window(TimeRange::Quarter).moving_average_window, 14);
    EXPECT_EQ(to_window(TimeRange::Year).days, 365);
    EXPECT_EQ(time_range_from_string("quarter"), TimeRange::Quarter);
    EXPECT_FALSE(time_range_from_string("fortnight").has_value());
}

// ─── Filtering and points ────────────────────────────────────────────────────

TEST(AnalyzeTrends, FiltersToWindowAndSortsAscending) {
    const auto analyzer = pinned_analyzer();
    auto records = daily_until_now({60, 61, 62, 63, 64, 65, 66, 67, 68, 69});
    std::reverse(records.begin(), records.end());

    const auto range = DateRange::checked(day_offset(-4), NOW);
    const auto a     = analyzer.analyze_trends(records, range);

    ASSERT_EQ(a.trend_points.size(), 5u);  // inclusive at both ends
    EXPECT_TRUE(std::is_sorted(a.trend_points.begin(), a.trend_points.end(),
                               [](const TrendPoint& x, const TrendPoint& y) {
                                   return x.timestamp < y.timestamp;
                               }));
    EXPECT_DOUBLE_EQ(a.trend_points.front().value, 65.0);
    EXPECT_DOUBLE_EQ(a.trend_points.back().value, 69.0);
    EXPECT_EQ(a.time_range, range);
    EXPECT_EQ(a.metric, MetricType::Weight);
}

TEST(AnalyzeTrends, RelativeWindowUsesItsMovingAverageWindow) {
    const auto analyzer = pinned_analyzer();
    const auto records  = daily_until_now({70, 71, 69, 72, 68});
    const auto a = analyzer.analyze_trends(
        records, RelativeWindow{.days = 10, .moving_average_window = 3});

    ASSERT_EQ(a.trend_points.size(), 5u);
    EXPECT_FALSE(a.trend_points[0].moving_average.has_value());
    EXPECT_FALSE(a.trend_points[1].moving_average.has_value());
    ASSERT_TRUE(a.trend_points[2].moving_average.has_value());
    EXPECT_NEAR(*a.trend_points[2].moving_average, 70.0, 1e-12);
    EXPECT_NEAR(*a.trend_points[4].moving_average, 209.0 / 3.0, 1e-12);
}

TEST(AnalyzeTrends, WindowLongerThanSeriesLeavesNoAverages) {
    const auto analyzer = pinned_analyzer();
    const auto a = analyzer.analyze_trends(daily_until_now({70, 71, 72}),
                                           to_window(TimeRange::Month));
    for (const auto& p : a.trend_points) {
        EXPECT_FALSE(p.moving_average.has_value());
    }
}

TEST(AnalyzeTrends, AnomalousPointsAreFlagged) {
    const auto analyzer = pinned_analyzer();
    const auto a = analyzer.analyze_trends(daily_until_now({70, 70, 70, 75, 70, 70, 70}),
                                           to_window(TimeRange::Month));
    ASSERT_EQ(a.anomalies.size(), 1u);
    for (std::size_t i = 0; i < a.trend_points.size(); ++i) {
        EXPECT_EQ(a.trend_points[i].is_anomaly, i == 3) << "point " << i;
    }
}

TEST(AnalyzeTrends, SummaryStatistics) {
    const auto analyzer = pinned_analyzer();
    const auto a = analyzer.analyze_trends(daily_until_now({80, 78, 79, 76, 75}),
                                           to_window(TimeRange::Month));
    const auto& s = a.summary;
    EXPECT_EQ(s.total_data_points, 5u);
    EXPECT_DOUBLE_EQ(s.average_value, 77.6);
    EXPECT_DOUBLE_EQ(s.minimum_value, 75.0);
    EXPECT_DOUBLE_EQ(s.maximum_value, 80.0);
    EXPECT_DOUBLE_EQ(s.first_value, 80.0);
    EXPECT_DOUBLE_EQ(s.last_value, 75.0);
    EXPECT_NEAR(s.change_percentage, -6.25, 1e-12);
    EXPECT_LT(a.slope, 0.0);
    EXPECT_LT(a.correlation, 0.0);
}

TEST(AnalyzeTrends, ZeroFirstValueGivesZeroChange) {
    const auto analyzer = pinned_analyzer();
    std::vector<Measurement> records = daily_until_now({0, 100, 200});
    for (auto& r : records) r.metric = MetricType::Steps;
    const auto a = analyzer.analyze_trends(records, to_window(TimeRange::Month));
    EXPECT_DOUBLE_EQ(a.summary.change_percentage, 0.0);
    EXPECT_EQ(a.metric, MetricType::Steps);
}

TEST(AnalyzeTrends, ConfidenceBlendsFitAndQuality) {
    const auto analyzer = pinned_analyzer();
    // Perfect line, fresh, plausible, no outliers: R² = 1 and quality = 1.
    const auto a = analyzer.analyze_trends(daily_until_now({70, 70.5, 71, 71.5, 72}),
                                           to_window(TimeRange::Month));
    EXPECT_NEAR(a.confidence, 1.0, 1e-9);
}

TEST(AnalyzeTrends, ClassificationUsesConfiguredThreshold) {
    const auto records = daily_until_now({68, 69, 70, 71, 72});

    const auto strict = pinned_analyzer().analyze_trends(records, to_window(TimeRange::Week));
    EXPECT_EQ(strict.direction, TrendDirection::Stable);

    TrendAnalyzer sensitive(AnalyzerConfig{
        .classification_threshold = 0.01,
        .clock                    = [] { return NOW; },
    });
    const auto a = sensitive.analyze_trends(records, to_window(TimeRange::Week));
    EXPECT_EQ(a.direction, TrendDirection::Increasing);
    EXPECT_GT(a.slope, 0.0);
    EXPECT_NEAR(a.correlation, 1.0, 1e-9);
}

// ─── Heuristic ───────────────────────────────────────────────────────────────

TEST(WindowForCount, Bands) {
    EXPECT_EQ(TrendAnalyzer::window_for_count(2), 3);
    EXPECT_EQ(TrendAnalyzer::window_for_count(7), 3);
    EXPECT_EQ(TrendAnalyzer::window_for_count(8), 7);
    EXPECT_EQ(TrendAnalyzer::window_for_count(30), 7);
    EXPECT_EQ(TrendAnalyzer::window_for_count(31), 14);
    EXPECT_EQ(TrendAnalyzer::window_for_count(90), 14);
    EXPECT_EQ(TrendAnalyzer::window_for_count(91), 30);
}

TEST(AnalyzeTrends, ExplicitShortRangeUsesHeuristicWindow) {
    const auto analyzer = pinned_analyzer();
    const auto records  = daily_until_now({70, 71, 72, 73, 74, 75});
    const auto a = analyzer.analyze_trends(records, DateRange::checked(day_offset(-5), NOW));
    // 6 points → window max(3, 2) = 3
    EXPECT_FALSE(a.trend_points[1].moving_average.has_value());
    EXPECT_TRUE(a.trend_points[2].moving_average.has_value());
}

TEST(AnalyzeTrends, SparseRecordsOverLongRangeStillGetMovingAverages) {
    std::vector<Measurement> records;
    for (int i = 0; i < 10; ++i) {
        records.push_back(Measurement{
            .timestamp = day_offset(-7 * (9 - i)),
            .value     = 70.0 + 0.1 * i,
            .metric    = MetricType::Weight,
        });
    }
    const auto a = pinned_analyzer().analyze_trends(
        records, DateRange::checked(day_offset(-365), NOW));

    // 10 records → window 7, whatever the range length.
    const auto with_ma = std::count_if(
        a.trend_points.begin(), a.trend_points.end(),
        [](const TrendPoint& p) { return p.moving_average.has_value(); });
    EXPECT_EQ(with_ma, 4);
    EXPECT_TRUE(a.trend_points[6].moving_average.has_value());
}

TEST(AnalyzeTrends, DenseRecordsOverShortRangeUseCountBand) {
    std::vector<Measurement> records;
    for (int i = 0; i < 20; ++i) {
        records.push_back(Measurement{
            .timestamp = NOW - std::chrono::hours{6 * (19 - i)},
            .value     = 70.0 + 0.1 * i,
            .metric    = MetricType::Weight,
        });
    }
    const auto a = pinned_analyzer().analyze_trends(
        records, DateRange::checked(day_offset(-5), NOW));

    ASSERT_EQ(a.trend_points.size(), 20u);
    // 20 records → window 7: first average at index 6.
    EXPECT_FALSE(a.trend_points[5].moving_average.has_value());
    EXPECT_TRUE(a.trend_points[6].moving_average.has_value());
}

// ─── Interface ───────────────────────────────────────────────────────────────

TEST(ITrendAnalyzer, DelegatesToStatelessModules) {
    const std::unique_ptr<ITrendAnalyzer> engine =
        std::make_unique<TrendAnalyzer>(AnalyzerConfig{.clock = [] { return NOW; }});

    const std::vector<double> v{70, 71, 69, 72, 68};
    EXPECT_EQ(engine->moving_average(v, 3).size(), 3u);
    EXPECT_EQ(engine->exponential_moving_average(v, 0.3).front(), 70.0);
    EXPECT_EQ(engine->classify_trend(std::vector<double>(5, 70.0), 0.1),
              TrendDirection::Stable);
    EXPECT_DOUBLE_EQ(engine->assess_data_quality(daily_until_now({70, 71, 70})).timeliness, 1.0);
    EXPECT_TRUE(engine->identify_data_gaps(daily_until_now({70, 71}),
                                           quality::DataFrequency::Daily).empty());
}
