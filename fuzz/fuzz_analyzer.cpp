/**
 * @file  fuzz_analyzer.cpp
 * @brief libFuzzer target for the TrendAnalyzer pipeline (end-to-end).
 *
 * Build:
 *   cmake -DHEALTHTREND_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_analyzer
 *
 * Safety invariants verified on every input:
 *   1. analyze_trends either returns or throws AnalysisError; nothing else.
 *   2. If an analysis is returned:
 *      a. confidence ∈ [0, 1]
 *      b. trend points are sorted ascending
 *      c. every anomaly's deviation score is ≥ the configured sensitivity
 *   3. Quality scores always lie in [0, 1].
 *
 * Fuzzer strategy:
 *   The input is consumed as a stream of (int16 day offset, int32 centi-value)
 *   pairs, giving finite values with arbitrary ordering and duplicates.
 */

#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "healthtrend/analyzer.hpp"
#include "healthtrend/error.hpp"

using namespace healthtrend;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const Timestamp now{std::chrono::seconds{1'750'000'000}};

    constexpr std::size_t RECORD_BYTES = sizeof(int16_t) + sizeof(int32_t);
    std::vector<Measurement> records;
    for (std::size_t off = 0; off + RECORD_BYTES <= size; off += RECORD_BYTES) {
        int16_t day   = 0;
        int32_t centi = 0;
        std::memcpy(&day, data + off, sizeof(day));
        std::memcpy(&centi, data + off + sizeof(day), sizeof(centi));
        records.push_back(Measurement{
            .timestamp = now - std::chrono::hours{24 * (day % 400)},
            .value     = centi / 100.0,
            .metric    = MetricType::Weight,
        });
    }

    const TrendAnalyzer analyzer(AnalyzerConfig{.clock = [now] { return now; }});

    const auto quality = analyzer.assess_data_quality(records);
    assert(quality.overall_score >= 0.0 && quality.overall_score <= 1.0);

    try {
        const auto a = analyzer.analyze_trends(records, to_window(TimeRange::Year));
        assert(a.confidence >= 0.0 && a.confidence <= 1.0);
        for (std::size_t i = 1; i < a.trend_points.size(); ++i) {
            assert(a.trend_points[i - 1].timestamp <= a.trend_points[i].timestamp);
        }
        for (const auto& an : a.anomalies) {
            assert(an.deviation_score >= analyzer.config().anomaly_sensitivity);
        }
        (void)analyzer.predict_trend(a, 7);
    } catch (const AnalysisError&) {
        // Sparse windows are an expected outcome for arbitrary input.
    }

    return 0;
}
