/// @file src/core/error.cpp

#include "healthtrend/error.hpp"

namespace healthtrend {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InsufficientData:  return "insufficient_data";
        case ErrorKind::InvalidPeriod:     return "invalid_period";
        case ErrorKind::InvalidTimeframe:  return "invalid_timeframe";
        case ErrorKind::CalculationFailed: return "calculation_failed";
    }
    return "unknown";
}

AnalysisError::AnalysisError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

}  // namespace healthtrend
