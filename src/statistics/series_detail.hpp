#pragma once

/// @file src/statistics/series_detail.hpp
/// @brief Internal Eigen helpers for the statistics translation unit.
///        Not part of the public API.

#include <Eigen/Dense>

#include <algorithm>
#include <span>
#include <vector>

namespace healthtrend::detail {

/// Read-only Eigen view over a contiguous series. No copy.
using ConstSeriesMap = Eigen::Map<const Eigen::VectorXd>;

[[nodiscard]] inline ConstSeriesMap as_vector(std::span<const double> v) noexcept {
    return ConstSeriesMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

/// Ascending copy of `v`.
[[nodiscard]] inline std::vector<double> sorted_copy(std::span<const double> v) {
    std::vector<double> out(v.begin(), v.end());
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace healthtrend::detail
