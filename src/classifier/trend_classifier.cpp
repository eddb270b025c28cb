/// @file src/classifier/trend_classifier.cpp
/// @brief Implementation of TrendClassifier.

#include "healthtrend/classifier.hpp"
#include "healthtrend/statistics.hpp"

#include <algorithm>
#include <cmath>

namespace healthtrend::trend {

using stats::Statistics;

double TrendClassifier::normalized_slope(double slope, double mean) noexcept {
    if (mean == 0.0) return slope;
    return slope / mean;
}

TrendDirection TrendClassifier::classify(std::span<const double> values,
                                         double threshold) noexcept {
    if (values.size() < constants::MIN_TREND_POINTS) {
        return TrendDirection::Stable;
    }

    const auto   regression  = Statistics::linear_regression_over_index(values);
    const double normalized  = normalized_slope(regression.slope, Statistics::mean(values));
    const auto   variability = Statistics::variability(values);

    if (variability.coefficient_of_variation > constants::VOLATILITY_CV_THRESHOLD) {
        return TrendDirection::Volatile;
    }
    if (std::abs(normalized) < threshold) {
        return TrendDirection::Stable;
    }
    return normalized > 0.0 ? TrendDirection::Increasing
                            : TrendDirection::Decreasing;
}

double TrendClassifier::trend_strength(const TrendAnalysis& analysis) noexcept {
    const auto&  s           = analysis.summary;
    const double correlation = std::abs(analysis.correlation);

    const double consistency = s.average_value == 0.0
        ? 0.0
        : std::max(0.0, 1.0 - s.standard_deviation / s.average_value);

    const double anomaly_ratio = s.total_data_points == 0
        ? 0.0
        : static_cast<double>(analysis.anomalies.size())
              / static_cast<double>(s.total_data_points);

    const double strength = (correlation + consistency) / 2.0
                          - anomaly_ratio * constants::ANOMALY_STRENGTH_PENALTY;
    return std::clamp(strength, 0.0, 1.0);
}

}  // namespace healthtrend::trend
