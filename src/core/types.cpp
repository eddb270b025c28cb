/// @file src/core/types.cpp
/// @brief Metric names, plausible ranges, windows and date arithmetic.

#include "healthtrend/types.hpp"
#include "healthtrend/error.hpp"
#include "healthtrend/trend_types.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <limits>

namespace healthtrend {

namespace {

using Seconds = std::chrono::seconds;

constexpr long long SECONDS_PER_DAY = 86'400;

}  // anonymous namespace

// ─── MetricType ───────────────────────────────────────────────────────────────

std::string_view to_string(MetricType type) noexcept {
    switch (type) {
        case MetricType::Weight:       return "weight";
        case MetricType::Steps:        return "steps";
        case MetricType::Calories:     return "calories";
        case MetricType::HeartRate:    return "heartRate";
        case MetricType::BloodGlucose: return "bloodGlucose";
    }
    return "unknown";
}

std::string_view unit(MetricType type) noexcept {
    switch (type) {
        case MetricType::Weight:       return "kg";
        case MetricType::Steps:        return "steps";
        case MetricType::Calories:     return "kcal";
        case MetricType::HeartRate:    return "bpm";
        case MetricType::BloodGlucose: return "mg/dL";
    }
    return "";
}

std::optional<MetricType> metric_type_from_string(std::string_view name) noexcept {
    if (name == "weight")       return MetricType::Weight;
    if (name == "steps")        return MetricType::Steps;
    if (name == "calories")     return MetricType::Calories;
    if (name == "heartRate")    return MetricType::HeartRate;
    if (name == "bloodGlucose") return MetricType::BloodGlucose;
    return std::nullopt;
}

bool PlausibleRange::contains(double value) const noexcept {
    const bool above_lower = lower_exclusive ? value > lower : value >= lower;
    return above_lower && value <= upper;
}

PlausibleRange plausible_range(MetricType type) noexcept {
    switch (type) {
        case MetricType::Weight:       return {0.0, 500.0, true};
        case MetricType::Steps:        return {0.0, 100'000.0, false};
        case MetricType::Calories:     return {0.0, 10'000.0, false};
        case MetricType::HeartRate:    return {30.0, 220.0, false};
        case MetricType::BloodGlucose: return {0.0, 600.0, false};
    }
    return {0.0, std::numeric_limits<double>::infinity(), false};
}

// ─── DateRange ────────────────────────────────────────────────────────────────

std::optional<DateRange> DateRange::make(Timestamp start, Timestamp end) noexcept {
    if (start > end) return std::nullopt;
    return DateRange{start, end};
}

DateRange DateRange::checked(Timestamp start, Timestamp end) {
    auto range = make(start, end);
    if (!range) {
        throw AnalysisError(
            ErrorKind::InvalidTimeframe,
            fmt::format("date range start {:%Y-%m-%d %H:%M:%S} is after end "
                        "{:%Y-%m-%d %H:%M:%S} (UTC)",
                        fmt::gmtime(Clock::to_time_t(start)),
                        fmt::gmtime(Clock::to_time_t(end))));
    }
    return *range;
}

bool DateRange::contains(Timestamp t) const noexcept {
    return t >= start_ && t <= end_;
}

// ─── TimeRange ────────────────────────────────────────────────────────────────

RelativeWindow to_window(TimeRange range) noexcept {
    switch (range) {
        case TimeRange::Week:    return {.days = 7,   .moving_average_window = 7};
        case TimeRange::Month:   return {.days = 30,  .moving_average_window = 7};
        case TimeRange::Quarter: return {.days = 90,  .moving_average_window = 14};
        case TimeRange::Year:    return {.days = 365, .moving_average_window = 30};
    }
    return {.days = 30, .moving_average_window = 7};
}

std::string_view to_string(TimeRange range) noexcept {
    switch (range) {
        case TimeRange::Week:    return "week";
        case TimeRange::Month:   return "month";
        case TimeRange::Quarter: return "quarter";
        case TimeRange::Year:    return "year";
    }
    return "unknown";
}

std::optional<TimeRange> time_range_from_string(std::string_view name) noexcept {
    if (name == "week")    return TimeRange::Week;
    if (name == "month")   return TimeRange::Month;
    if (name == "quarter") return TimeRange::Quarter;
    if (name == "year")    return TimeRange::Year;
    return std::nullopt;
}

// ─── Date arithmetic ──────────────────────────────────────────────────────────

std::optional<Timestamp> add_days(Timestamp t, long long days) noexcept {
    using Rep = Timestamp::duration::rep;
    constexpr Rep ticks_per_day =
        std::chrono::duration_cast<Timestamp::duration>(Seconds{SECONDS_PER_DAY}).count();

    constexpr Rep max_rep = std::numeric_limits<Rep>::max();
    constexpr Rep min_rep = std::numeric_limits<Rep>::min();

    if (days > 0 && days > max_rep / ticks_per_day) return std::nullopt;
    if (days < 0 && days < min_rep / ticks_per_day) return std::nullopt;

    const Rep delta = static_cast<Rep>(days) * ticks_per_day;
    const Rep base  = t.time_since_epoch().count();
    if (delta > 0 && base > max_rep - delta) return std::nullopt;
    if (delta < 0 && base < min_rep - delta) return std::nullopt;

    return Timestamp{Timestamp::duration{base + delta}};
}

double days_between(Timestamp from, Timestamp to) noexcept {
    const std::chrono::duration<double> elapsed = to - from;
    return elapsed.count() / static_cast<double>(SECONDS_PER_DAY);
}

std::optional<Timestamp> from_epoch_seconds(long long seconds) noexcept {
    constexpr long long max_seconds =
        std::chrono::duration_cast<Seconds>(Timestamp::duration::max()).count();
    constexpr long long min_seconds =
        std::chrono::duration_cast<Seconds>(Timestamp::duration::min()).count();
    if (seconds > max_seconds || seconds < min_seconds) return std::nullopt;

    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(Seconds{seconds})};
}

// ─── Grouping ─────────────────────────────────────────────────────────────────

std::map<MetricType, std::vector<Measurement>>
group_by_metric(std::span<const Measurement> records) {
    std::map<MetricType, std::vector<Measurement>> groups;
    for (const auto& r : records) {
        groups[r.metric].push_back(r);
    }
    return groups;
}

// ─── Trend enums ──────────────────────────────────────────────────────────────

std::string_view to_string(TrendDirection direction) noexcept {
    switch (direction) {
        case TrendDirection::Increasing: return "increasing";
        case TrendDirection::Decreasing: return "decreasing";
        case TrendDirection::Stable:     return "stable";
        case TrendDirection::Volatile:   return "volatile";
    }
    return "unknown";
}

std::string_view to_string(PredictionMethod method) noexcept {
    switch (method) {
        case PredictionMethod::LinearRegression:      return "linear_regression";
        case PredictionMethod::ExponentialSmoothing:  return "exponential_smoothing";
        case PredictionMethod::MovingAverage:         return "moving_average";
        case PredictionMethod::SeasonalDecomposition: return "seasonal_decomposition";
    }
    return "unknown";
}

int days(Timeframe timeframe) noexcept {
    switch (timeframe) {
        case Timeframe::Day:   return 1;
        case Timeframe::Week:  return 7;
        case Timeframe::Month: return 30;
        case Timeframe::Year:  return 365;
    }
    return 0;
}

std::string_view to_string(Timeframe timeframe) noexcept {
    switch (timeframe) {
        case Timeframe::Day:   return "day";
        case Timeframe::Week:  return "week";
        case Timeframe::Month: return "month";
        case Timeframe::Year:  return "year";
    }
    return "unknown";
}

}  // namespace healthtrend
