#pragma once

/// @file include/healthtrend/statistics.hpp
/// @brief Statistics primitives: pure functions over value series.
///
/// # Module: Statistics
///
/// ## Responsibility
/// Descriptive statistics, least-squares regression, correlation and the
/// moving-average family used by every higher-level healthtrend module.
///
/// ## Degenerate Input Policy
/// Every function is total. Input that is too short for a meaningful result
/// yields a zero or empty result rather than an error:
///   - regression on fewer than 2 points → all-zero result
///   - correlation of mismatched / empty / zero-variance series → 0
///   - variability of an empty series → all-zero metrics
///   - moving averages with an out-of-range window or alpha → empty
///
/// ## Guarantees
/// - All methods are noexcept static pure functions
/// - Inputs are read through `std::span`; nothing is retained
/// - Vector arithmetic is done with Eigen maps over the caller's storage
///
/// ## NOT Responsible For
/// - Outlier flagging (see anomaly.hpp)
/// - Direction classification (see classifier.hpp)

#include <optional>
#include <span>
#include <vector>

namespace healthtrend::stats {

// ─── Types ────────────────────────────────────────────────────────────────────

/// One (x, y) observation for regression.
struct Point2D {
    double x;
    double y;
};

/// Ordinary-least-squares fit y = slope·x + intercept.
struct LinearRegressionResult {
    double slope          = 0.0;
    double intercept      = 0.0;
    double correlation    = 0.0;  ///< Pearson r ∈ [−1, 1]
    double r_squared      = 0.0;  ///< r² ∈ [0, 1]
    double standard_error = 0.0;  ///< √(SSR / (n − 2))

    /// Fitted value at x.
    [[nodiscard]] double predict(double x) const noexcept {
        return slope * x + intercept;
    }
};

/// Dispersion summary of a series.
struct VariabilityMetrics {
    double variance                 = 0.0;  ///< Sample variance (n − 1)
    double standard_deviation       = 0.0;
    double coefficient_of_variation = 0.0;  ///< σ / |mean|, 0 if mean is 0
    double range                    = 0.0;  ///< max − min
    double interquartile_range      = 0.0;  ///< Q3 − Q1 (index convention)
};

/// First and third quartile by the floor(0.25n) / floor(0.75n) index
/// convention on the sorted series.
struct Quartiles {
    double q1;
    double q3;
};

// ─── Statistics ───────────────────────────────────────────────────────────────

/// Stateless statistics utility. A transformation namespace in class form.
class Statistics {
public:
    Statistics() = delete;

    // ── Descriptive ──────────────────────────────────────────────────────────

    /// Arithmetic mean. Returns 0.0 for an empty series.
    [[nodiscard]] static double mean(std::span<const double> values) noexcept;

    /// Bessel-corrected standard deviation. Returns 0.0 if fewer than 2 values.
    [[nodiscard]] static double
    sample_stddev(std::span<const double> values) noexcept;

    /// Median: middle element for odd counts, mean of the two middle
    /// elements for even counts. Returns 0.0 for an empty series.
    [[nodiscard]] static double median(std::span<const double> values) noexcept;

    /// Quartiles by the floor index convention. `nullopt` on empty input.
    [[nodiscard]] static std::optional<Quartiles>
    quartiles(std::span<const double> values) noexcept;

    /// Variance, standard deviation, coefficient of variation, range and IQR.
    ///
    /// # Returns
    /// All-zero metrics on empty input. A single value has zero variance.
    [[nodiscard]] static VariabilityMetrics
    variability(std::span<const double> values) noexcept;

    // ── Regression / Correlation ─────────────────────────────────────────────

    /// Least-squares line through `points`.
    ///
    /// # Formula
    ///   slope     = (nΣxy − ΣxΣy) / (nΣx² − (Σx)²)
    ///   intercept = (Σy − slope·Σx) / n
    ///   r         = (nΣxy − ΣxΣy) / √((nΣx² − (Σx)²)(nΣy² − (Σy)²))
    ///   SE        = √(Σ(y − ŷ)² / (n − 2))
    ///
    /// # Returns
    /// - All-zero result for fewer than 2 points
    /// - Zero slope and correlation, intercept = mean(y) when every x is equal
    /// - `standard_error` = 0 for exactly 2 points (the line is exact)
    [[nodiscard]] static LinearRegressionResult
    linear_regression(std::span<const Point2D> points) noexcept;

    /// Regression of `values` against their index (x = 0, 1, 2, ...).
    [[nodiscard]] static LinearRegressionResult
    linear_regression_over_index(std::span<const double> values) noexcept;

    /// Pearson correlation coefficient.
    ///
    /// # Returns
    /// 0.0 if lengths differ, either series is empty, or either series has
    /// zero variance.
    [[nodiscard]] static double
    correlation(std::span<const double> a, std::span<const double> b) noexcept;

    // ── Moving Averages ──────────────────────────────────────────────────────

    /// Simple moving average over a trailing window.
    ///
    /// # Returns
    /// `values.size() − window + 1` means, element i covering
    /// values[i .. i + window − 1]. Empty if `window <= 0` or
    /// `window > values.size()`.
    [[nodiscard]] static std::vector<double>
    moving_average(std::span<const double> values, int window) noexcept;

    /// Weighted mean Σ(v·w) / Σw as a single-element vector.
    ///
    /// # Returns
    /// Empty if the spans differ in length, are empty, or Σw <= 0.
    [[nodiscard]] static std::vector<double>
    weighted_moving_average(std::span<const double> values,
                            std::span<const double> weights) noexcept;

    /// Exponential moving average.
    ///
    /// # Formula
    ///   ema[0] = v[0]
    ///   ema[i] = α·v[i] + (1 − α)·ema[i − 1]
    ///
    /// # Returns
    /// Same length as `values`. Empty if `values` is empty or α ∉ (0, 1].
    [[nodiscard]] static std::vector<double>
    exponential_moving_average(std::span<const double> values,
                               double alpha) noexcept;
};

}  // namespace healthtrend::stats
