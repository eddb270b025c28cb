#pragma once

/// @file include/healthtrend/classifier.hpp
/// @brief Trend direction classification and trend strength.
///
/// # Module: Trend Classifier
///
/// ## Rule
/// Regress the series on its index, normalise the slope by the series mean,
/// and measure volatility with the coefficient of variation (CV):
///
///     CV > 0.3                      → Volatile   (volatility dominates)
///     |slope / mean| < threshold    → Stable
///     slope / mean > 0              → Increasing
///     otherwise                     → Decreasing
///
/// A series with zero mean keeps its raw slope.

#include "healthtrend/constants.hpp"
#include "healthtrend/trend_types.hpp"

#include <span>

namespace healthtrend::trend {

class TrendClassifier {
public:
    TrendClassifier() = delete;

    /// Classify the direction of `values`.
    ///
    /// # Returns
    /// `Stable` for fewer than 2 values.
    [[nodiscard]] static TrendDirection
    classify(std::span<const double> values,
             double threshold = constants::DEFAULT_CLASSIFICATION_THRESHOLD) noexcept;

    /// Slope divided by the series mean (raw slope if the mean is 0).
    [[nodiscard]] static double
    normalized_slope(double slope, double mean) noexcept;

    /// Blend of correlation strength and consistency, penalised by anomalies.
    ///
    /// # Formula
    ///   consistency = max(0, 1 − σ / mean)      (0 when mean is 0)
    ///   penalty     = anomalies / points × 0.1  (0 when there are no points)
    ///   strength    = clamp((|r| + consistency) / 2 − penalty, 0, 1)
    [[nodiscard]] static double
    trend_strength(const TrendAnalysis& analysis) noexcept;
};

}  // namespace healthtrend::trend
