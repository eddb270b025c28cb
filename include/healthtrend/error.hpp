#pragma once

/// @file include/healthtrend/error.hpp
/// @brief Typed failure for the public analysis entry points.
///
/// Statistics primitives never throw: they return zero or empty results for
/// degenerate input. The orchestrator (`ITrendAnalyzer`) throws
/// `AnalysisError` when the input cannot satisfy its contract. Every kind is
/// recoverable by the caller.

#include <stdexcept>
#include <string>
#include <string_view>

namespace healthtrend {

/// Failure categories reported by the orchestrator.
enum class ErrorKind {
    InsufficientData,   ///< Fewer points than the operation requires
    InvalidPeriod,      ///< Malformed relative window or horizon
    InvalidTimeframe,   ///< Explicit date range with start > end
    CalculationFailed,  ///< Arithmetic (e.g. date overflow) had no result
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace healthtrend
