/// @file src/analyzer/prediction.cpp
/// @brief TrendAnalyzer forecasting: predict_trend and predict_value.

#include "healthtrend/analyzer.hpp"
#include "healthtrend/error.hpp"

#include "diagnostics.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace healthtrend {

using stats::Statistics;

// ─── TrendAnalyzer::predict_trend ─────────────────────────────────────────────

TrendPrediction
TrendAnalyzer::predict_trend(const TrendAnalysis& analysis, int days_ahead) const {
    detail::OperationTrace trace(config_.verbose, "predict_trend",
                                 analysis.trend_points.size());

    if (days_ahead <= 0) {
        throw AnalysisError(ErrorKind::InvalidPeriod,
                            fmt::format("prediction horizon must be positive (got {})",
                                        days_ahead));
    }
    if (analysis.trend_points.empty()) {
        throw AnalysisError(ErrorKind::InsufficientData,
                            "cannot predict from an analysis without trend points");
    }

    const TrendPoint& last = analysis.trend_points.back();

    std::vector<TrendPoint> predicted;
    predicted.reserve(static_cast<std::size_t>(days_ahead));
    for (int day = 1; day <= days_ahead; ++day) {
        const auto when = add_days(last.timestamp, day);
        if (!when) {
            throw AnalysisError(ErrorKind::CalculationFailed,
                                fmt::format("prediction date {} days ahead overflows", day));
        }
        predicted.push_back(TrendPoint{
            .timestamp      = *when,
            .value          = std::max(0.0, last.value + analysis.slope * day),
            .moving_average = std::nullopt,
            .is_anomaly     = false,
        });
    }

    const auto valid_until = add_days(config_.clock(), days_ahead);
    if (!valid_until) {
        throw AnalysisError(ErrorKind::CalculationFailed,
                            "prediction expiry date overflows");
    }

    const double confidence = std::clamp(
        analysis.confidence * constants::PREDICTION_CONFIDENCE_DECAY,
        constants::PREDICTION_CONFIDENCE_MIN,
        constants::PREDICTION_CONFIDENCE_MAX);

    trace.finish(fmt::format("{} day(s) ahead, confidence {:.3f}", days_ahead, confidence));

    return TrendPrediction{
        .metric           = analysis.metric,
        .predicted_points = std::move(predicted),
        .confidence       = confidence,
        .methodology      = "Linear Regression",
        .valid_until      = *valid_until,
    };
}

// ─── TrendAnalyzer::predict_value ─────────────────────────────────────────────

double TrendAnalyzer::predict_value(std::span<const Measurement> records, int days_ahead,
                                    PredictionMethod method) const {
    if (records.empty()) {
        throw AnalysisError(ErrorKind::InsufficientData,
                            "cannot predict a value from no records");
    }

    std::vector<Measurement> sorted(records.begin(), records.end());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Measurement& a, const Measurement& b) {
                         return a.timestamp < b.timestamp;
                     });

    std::vector<double> values;
    values.reserve(sorted.size());
    for (const auto& r : sorted) {
        values.push_back(r.value);
    }
    const double last_value = values.back();

    switch (method) {
        case PredictionMethod::LinearRegression: {
            const auto fit = Statistics::linear_regression_over_index(values);
            return fit.predict(static_cast<double>(values.size()) + days_ahead - 1.0);
        }
        case PredictionMethod::ExponentialSmoothing: {
            const auto ema = Statistics::exponential_moving_average(
                values, constants::PREDICTION_EMA_ALPHA);
            return ema.empty() ? last_value : ema.back();
        }
        case PredictionMethod::MovingAverage: {
            const int window = std::min(constants::PREDICTION_MA_WINDOW,
                                        static_cast<int>(values.size()));
            const auto ma = Statistics::moving_average(values, window);
            return ma.empty() ? last_value : ma.back();
        }
        case PredictionMethod::SeasonalDecomposition:
            // No seasonal model; persistence forecast.
            return last_value;
    }
    return last_value;
}

}  // namespace healthtrend
