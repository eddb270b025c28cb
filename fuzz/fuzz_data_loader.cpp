/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader::parse_csv_string.
 *
 * Build:
 *   cmake -DHEALTHTREND_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed measurement has a finite value.
 *   3. Every parsed measurement names a known metric.
 *   4. Parsing is deterministic.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "healthtrend/data_loader.hpp"

using namespace healthtrend;
using namespace healthtrend::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    const auto records = DataLoader::parse_csv_string(input);
    for (const auto& r : records) {
        assert(std::isfinite(r.value));
        assert(metric_type_from_string(to_string(r.metric)).has_value());
    }

    const auto again = DataLoader::parse_csv_string(input);
    assert(again.size() == records.size());

    return 0;
}
