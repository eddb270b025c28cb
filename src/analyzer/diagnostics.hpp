#pragma once

/// @file src/analyzer/diagnostics.hpp
/// @brief Verbose stderr diagnostics for analyzer operations (private).

#include <fmt/core.h>

#include <chrono>
#include <cstddef>
#include <string_view>

namespace healthtrend::detail {

/// Measures one analyzer operation and, when enabled, prints a single line:
///
///     [healthtrend] analyze_trends: 42 records, increasing, confidence 0.812 (0.31 ms)
class OperationTrace {
public:
    OperationTrace(bool enabled, std::string_view operation, std::size_t records) noexcept
        : enabled_(enabled)
        , operation_(operation)
        , records_(records)
        , started_(std::chrono::steady_clock::now())
    {}

    /// Print the trace line with an operation-specific outcome.
    void finish(std::string_view outcome) const {
        if (!enabled_) return;
        const std::chrono::duration<double, std::milli> elapsed =
            std::chrono::steady_clock::now() - started_;
        fmt::print(stderr, "[healthtrend] {}: {} records, {} ({:.2f} ms)\n",
                   operation_, records_, outcome, elapsed.count());
    }

private:
    bool                                  enabled_;
    std::string_view                      operation_;
    std::size_t                           records_;
    std::chrono::steady_clock::time_point started_;
};

}  // namespace healthtrend::detail
