/// @file src/statistics/statistics.cpp
/// @brief Implementation of the Statistics primitives.
///
/// Every function is total: degenerate input returns zero / empty results,
/// never NaN, and nothing throws.

#include "healthtrend/statistics.hpp"

#include "series_detail.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace healthtrend::stats {

// ─── Descriptive ──────────────────────────────────────────────────────────────

double Statistics::mean(std::span<const double> values) noexcept {
    if (values.empty()) return 0.0;
    return detail::as_vector(values).mean();
}

double Statistics::sample_stddev(std::span<const double> values) noexcept {
    if (values.size() < 2) return 0.0;
    const auto v = detail::as_vector(values);
    const double mu = v.mean();
    // Bessel-corrected (n−1) sample standard deviation.
    const double sq_sum = (v.array() - mu).square().sum();
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

double Statistics::median(std::span<const double> values) noexcept {
    if (values.empty()) return 0.0;
    const auto sorted = detail::sorted_copy(values);
    const std::size_t n = sorted.size();
    if (n % 2 == 0) {
        return (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
    }
    return sorted[n / 2];
}

std::optional<Quartiles>
Statistics::quartiles(std::span<const double> values) noexcept {
    if (values.empty()) return std::nullopt;
    const auto sorted = detail::sorted_copy(values);
    const std::size_t n = sorted.size();
    // floor(0.25n) and floor(0.75n); both are < n for n ≥ 1.
    const std::size_t q1_index = n / 4;
    const std::size_t q3_index = (3 * n) / 4;
    return Quartiles{.q1 = sorted[q1_index], .q3 = sorted[q3_index]};
}

VariabilityMetrics
Statistics::variability(std::span<const double> values) noexcept {
    if (values.empty()) return VariabilityMetrics{};

    const double mu       = mean(values);
    const double sd       = sample_stddev(values);
    const auto   v        = detail::as_vector(values);
    const auto   q        = quartiles(values);

    return VariabilityMetrics{
        .variance                 = sd * sd,
        .standard_deviation       = sd,
        .coefficient_of_variation = mu == 0.0 ? 0.0 : sd / std::abs(mu),
        .range                    = v.maxCoeff() - v.minCoeff(),
        .interquartile_range      = q ? q->q3 - q->q1 : 0.0,
    };
}

// ─── Regression / Correlation ─────────────────────────────────────────────────

LinearRegressionResult
Statistics::linear_regression(std::span<const Point2D> points) noexcept {
    const std::size_t count = points.size();
    if (count < 2) return LinearRegressionResult{};

    Eigen::VectorXd x(static_cast<Eigen::Index>(count));
    Eigen::VectorXd y(static_cast<Eigen::Index>(count));
    for (std::size_t i = 0; i < count; ++i) {
        x(static_cast<Eigen::Index>(i)) = points[i].x;
        y(static_cast<Eigen::Index>(i)) = points[i].y;
    }

    const double n      = static_cast<double>(count);
    const double mean_x = x.mean();
    const double mean_y = y.mean();

    // Centred sums: Sxx = Σ(x−x̄)², Sxy = Σ(x−x̄)(y−ȳ), Syy = Σ(y−ȳ)².
    // Algebraically identical to the raw-sum OLS formulas, but stable for
    // large timestamps / values.
    const Eigen::ArrayXd dx = x.array() - mean_x;
    const Eigen::ArrayXd dy = y.array() - mean_y;
    const double sxx = dx.square().sum();
    const double syy = dy.square().sum();
    const double sxy = (dx * dy).sum();

    LinearRegressionResult out;

    // Degenerate only when every x is identical. A tolerance scaled by |x|
    // would reject epoch-second abscissae with a spread of minutes.
    if (x.maxCoeff() == x.minCoeff() || sxx <= 0.0) {
        out.intercept = mean_y;
    } else {
        out.slope     = sxy / sxx;
        out.intercept = mean_y - out.slope * mean_x;

        const double denom = std::sqrt(sxx * syy);
        if (denom > 0.0) {
            out.correlation = std::clamp(sxy / denom, -1.0, 1.0);
        }
    }
    out.r_squared = out.correlation * out.correlation;

    if (count > 2) {
        const Eigen::ArrayXd residuals =
            y.array() - (out.slope * x.array() + out.intercept);
        out.standard_error = std::sqrt(residuals.square().sum() / (n - 2.0));
    }
    return out;
}

LinearRegressionResult
Statistics::linear_regression_over_index(std::span<const double> values) noexcept {
    std::vector<Point2D> points;
    points.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        points.push_back(Point2D{.x = static_cast<double>(i), .y = values[i]});
    }
    return linear_regression(points);
}

double Statistics::correlation(std::span<const double> a,
                               std::span<const double> b) noexcept {
    if (a.size() != b.size() || a.empty()) return 0.0;

    const auto va = detail::as_vector(a);
    const auto vb = detail::as_vector(b);
    if (va.maxCoeff() == va.minCoeff() || vb.maxCoeff() == vb.minCoeff()) return 0.0;

    const Eigen::ArrayXd da = va.array() - va.mean();
    const Eigen::ArrayXd db = vb.array() - vb.mean();

    const double denom = std::sqrt(da.square().sum() * db.square().sum());
    if (denom == 0.0) return 0.0;  // zero variance in either series

    return std::clamp((da * db).sum() / denom, -1.0, 1.0);
}

// ─── Moving Averages ──────────────────────────────────────────────────────────

std::vector<double>
Statistics::moving_average(std::span<const double> values, int window) noexcept {
    if (window <= 0) return {};
    const auto w = static_cast<std::size_t>(window);
    if (w > values.size()) return {};

    const auto v = detail::as_vector(values);
    std::vector<double> out;
    out.reserve(values.size() - w + 1);
    for (std::size_t end = w; end <= values.size(); ++end) {
        const auto start = static_cast<Eigen::Index>(end - w);
        out.push_back(v.segment(start, static_cast<Eigen::Index>(w)).mean());
    }
    return out;
}

std::vector<double>
Statistics::weighted_moving_average(std::span<const double> values,
                                    std::span<const double> weights) noexcept {
    if (values.size() != weights.size() || values.empty()) return {};

    const auto v = detail::as_vector(values);
    const auto w = detail::as_vector(weights);
    const double weight_sum = w.sum();
    if (weight_sum <= 0.0) return {};

    return {v.dot(w) / weight_sum};
}

std::vector<double>
Statistics::exponential_moving_average(std::span<const double> values,
                                       double alpha) noexcept {
    if (values.empty() || !(alpha > 0.0 && alpha <= 1.0)) return {};

    std::vector<double> ema;
    ema.reserve(values.size());
    ema.push_back(values[0]);
    for (std::size_t i = 1; i < values.size(); ++i) {
        ema.push_back(alpha * values[i] + (1.0 - alpha) * ema[i - 1]);
    }
    return ema;
}

}  // namespace healthtrend::stats
