#pragma once

#include <cstddef>

/// @file include/healthtrend/constants.hpp
/// @brief Numeric thresholds and defaults for the healthtrend engine.

namespace healthtrend::constants {

// ─── Minimum Series Lengths ───────────────────────────────────────────────────

/// Regression, classification and trend analysis need at least two points.
static constexpr std::size_t MIN_TREND_POINTS = 2;

/// Anomaly and outlier detection need at least three points.
static constexpr std::size_t MIN_ANOMALY_POINTS = 3;

// ─── Anomaly Detection ────────────────────────────────────────────────────────

/// Default z-score sensitivity for anomaly detection.
static constexpr double DEFAULT_ANOMALY_SENSITIVITY = 2.0;

/// Nominal z-score floor of each severity band. A score is assigned the
/// highest band whose threshold it reaches; anything below MEDIUM is LOW.
static constexpr double SEVERITY_LOW_THRESHOLD      = 1.5;
static constexpr double SEVERITY_MEDIUM_THRESHOLD   = 2.0;
static constexpr double SEVERITY_HIGH_THRESHOLD     = 2.5;
static constexpr double SEVERITY_CRITICAL_THRESHOLD = 3.0;

/// |z| at or above this is an outlier for the z-score method.
static constexpr double ZSCORE_OUTLIER_THRESHOLD = 2.0;

/// Tukey fence multiplier for the IQR method.
static constexpr double IQR_FENCE_MULTIPLIER = 1.5;

/// Modified z-score: 0.6745 · (x − median) / MAD, outlier at |score| ≥ 3.5.
static constexpr double MODIFIED_ZSCORE_SCALE     = 0.6745;
static constexpr double MODIFIED_ZSCORE_THRESHOLD = 3.5;

// ─── Trend Classification ─────────────────────────────────────────────────────

/// Default |slope / mean| below which a series is stable.
static constexpr double DEFAULT_CLASSIFICATION_THRESHOLD = 0.1;

/// Threshold used by timeframe trend detection (more sensitive).
static constexpr double DETECT_TREND_THRESHOLD = 0.01;

/// Coefficient of variation above which a series is volatile.
static constexpr double VOLATILITY_CV_THRESHOLD = 0.3;

/// Weight of the anomaly ratio subtracted from trend strength.
static constexpr double ANOMALY_STRENGTH_PENALTY = 0.1;

// ─── Data Quality ─────────────────────────────────────────────────────────────

/// Records older than this many days score zero timeliness.
static constexpr double TIMELINESS_HORIZON_DAYS = 30.0;

/// Latest record older than this many days raises a stale-data issue.
static constexpr double STALE_DATA_DAYS = 7.0;

/// Gap tolerance: an interval longer than this multiple of the expected
/// interval is a gap.
static constexpr double GAP_TOLERANCE_FACTOR = 1.5;

// ─── Prediction ───────────────────────────────────────────────────────────────

/// Prediction confidence = clamp(analysis confidence × DECAY, MIN, MAX).
static constexpr double PREDICTION_CONFIDENCE_DECAY = 0.8;
static constexpr double PREDICTION_CONFIDENCE_MIN   = 0.1;
static constexpr double PREDICTION_CONFIDENCE_MAX   = 0.9;

/// Smoothing factor for exponential-smoothing point prediction.
static constexpr double PREDICTION_EMA_ALPHA = 0.3;

/// Largest moving-average window used for point prediction.
static constexpr int PREDICTION_MA_WINDOW = 7;

}  // namespace healthtrend::constants
