/**
 * @file  bench/bench_statistics.cpp
 * @brief Google Benchmark suite for the statistics primitives and the
 *        end-to-end analysis.
 *
 * Benchmarks
 * ----------
 *   BM_LinearRegression:    index regression over n values
 *   BM_MovingAverage:       7-point window over n values
 *   BM_DetectOutliers/<m>:  each outlier method
 *   BM_AnalyzeTrends:       full analyze_trends over n daily records
 *
 * Build (CMake):
 *   cmake -DHEALTHTREND_BENCH=ON ..
 *   cmake --build build --target bench_statistics
 *   ./build/bench_statistics --benchmark_format=json
 *
 * Throughput units: items/second (records processed).
 */

#include "benchmark/benchmark.h"

#include "healthtrend/analyzer.hpp"
#include "healthtrend/anomaly.hpp"
#include "healthtrend/statistics.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

using namespace healthtrend;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// n weight-like values drifting downward with a periodic wobble.
static std::vector<double> make_values(std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = 85.0 - 0.01 * static_cast<double>(i) + 0.5 * std::sin(0.7 * static_cast<double>(i));
    }
    return v;
}

static const Timestamp BENCH_NOW{std::chrono::seconds{1'750'000'000}};

static std::vector<Measurement> make_records(std::size_t n) {
    const auto values = make_values(n);
    std::vector<Measurement> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(Measurement{
            .timestamp = BENCH_NOW - std::chrono::hours{static_cast<long>(n - 1 - i)},
            .value     = values[i],
            .metric    = MetricType::Weight,
        });
    }
    return out;
}

// ── Benchmarks ─────────────────────────────────────────────────────────────────

static void BM_LinearRegression(benchmark::State& state) {
    const auto values = make_values(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(stats::Statistics::linear_regression_over_index(values));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_LinearRegression)->RangeMultiplier(4)->Range(64, 65536);

static void BM_MovingAverage(benchmark::State& state) {
    const auto values = make_values(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(stats::Statistics::moving_average(values, 7));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_MovingAverage)->RangeMultiplier(4)->Range(64, 65536);

static void BM_DetectOutliers(benchmark::State& state) {
    const auto values = make_values(4096);
    const auto method = static_cast<anomaly::OutlierMethod>(state.range(0));
    state.SetLabel(std::string(anomaly::to_string(method)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(anomaly::AnomalyDetector::detect_outliers(values, method));
    }
    state.SetItemsProcessed(state.iterations() * 4096);
}
BENCHMARK(BM_DetectOutliers)->DenseRange(0, 3);

static void BM_AnalyzeTrends(benchmark::State& state) {
    const auto records = make_records(static_cast<std::size_t>(state.range(0)));
    const TrendAnalyzer analyzer(AnalyzerConfig{.clock = [] { return BENCH_NOW; }});
    for (auto _ : state) {
        benchmark::DoNotOptimize(analyzer.analyze_trends(records, to_window(TimeRange::Year)));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_AnalyzeTrends)->RangeMultiplier(4)->Range(64, 8192);

BENCHMARK_MAIN();
