#pragma once

/// @file include/healthtrend/types.hpp
/// @brief Record model and time-window types shared by every healthtrend
///        module.
///
/// A `Measurement` is one timestamped scalar reading of a single health
/// metric. The engine never owns or mutates measurements; every analysis
/// call receives them as a read-only span.

#include <chrono>
#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace healthtrend {

/// Wall-clock instant used for every timestamp in the engine.
using Timestamp = std::chrono::system_clock::time_point;

/// Source of "now" for window filtering and timeliness scoring.
using Clock = std::chrono::system_clock;

// ─── Metric Type ──────────────────────────────────────────────────────────────

/// The health metrics the engine understands.
enum class MetricType {
    Weight,
    Steps,
    Calories,
    HeartRate,
    BloodGlucose,
};

/// Stable identifier ("weight", "steps", "calories", "heartRate",
/// "bloodGlucose"). Used in CSV input and CLI output.
[[nodiscard]] std::string_view to_string(MetricType type) noexcept;

/// Display unit ("kg", "steps", "kcal", "bpm", "mg/dL").
[[nodiscard]] std::string_view unit(MetricType type) noexcept;

/// Inverse of `to_string(MetricType)`. Case-sensitive.
[[nodiscard]] std::optional<MetricType>
metric_type_from_string(std::string_view name) noexcept;

/// Domain-plausible value range for a metric (inclusive bounds unless noted).
///
/// Weight excludes its lower bound: a weight of exactly 0 kg is implausible.
struct PlausibleRange {
    double lower;
    double upper;
    bool   lower_exclusive;

    [[nodiscard]] bool contains(double value) const noexcept;
};

[[nodiscard]] PlausibleRange plausible_range(MetricType type) noexcept;

// ─── Measurement ──────────────────────────────────────────────────────────────

/// One timestamped reading. Values are assumed finite.
struct Measurement {
    Timestamp  timestamp;
    double     value;
    MetricType metric;
};

// ─── Windows ──────────────────────────────────────────────────────────────────

/// Closed interval [start, end] of instants with start <= end.
///
/// Only constructible through `make` / `checked`, so a DateRange value
/// always satisfies its invariant.
class DateRange {
public:
    /// Returns `nullopt` if `start > end`.
    [[nodiscard]] static std::optional<DateRange>
    make(Timestamp start, Timestamp end) noexcept;

    /// Throws `AnalysisError{InvalidTimeframe}` if `start > end`.
    [[nodiscard]] static DateRange checked(Timestamp start, Timestamp end);

    [[nodiscard]] Timestamp start() const noexcept { return start_; }
    [[nodiscard]] Timestamp end()   const noexcept { return end_; }

    /// Inclusive at both ends.
    [[nodiscard]] bool contains(Timestamp t) const noexcept;

    friend bool operator==(const DateRange&, const DateRange&) = default;

private:
    DateRange(Timestamp start, Timestamp end) noexcept
        : start_(start), end_(end) {}

    Timestamp start_;
    Timestamp end_;
};

/// "Last N days" window ending at the analyzer's current time.
struct RelativeWindow {
    int days;                   ///< Look-back length, must be > 0
    int moving_average_window;  ///< Points per moving-average window, > 0
};

/// Named relative windows.
enum class TimeRange {
    Week,
    Month,
    Quarter,
    Year,
};

/// Week → {7, 7}, Month → {30, 7}, Quarter → {90, 14}, Year → {365, 30}.
[[nodiscard]] RelativeWindow to_window(TimeRange range) noexcept;

[[nodiscard]] std::string_view to_string(TimeRange range) noexcept;

/// Parses "week", "month", "quarter" or "year".
[[nodiscard]] std::optional<TimeRange>
time_range_from_string(std::string_view name) noexcept;

/// Either a relative look-back or an explicit date interval.
using TimeWindow = std::variant<RelativeWindow, DateRange>;

// ─── Date arithmetic ──────────────────────────────────────────────────────────

/// `t + days` whole days. Returns `nullopt` if the result is not
/// representable by `Timestamp`.
[[nodiscard]] std::optional<Timestamp>
add_days(Timestamp t, long long days) noexcept;

/// Fractional days elapsed from `from` to `to` (negative if `to < from`).
[[nodiscard]] double days_between(Timestamp from, Timestamp to) noexcept;

/// Instant `seconds` after the Unix epoch. Returns `nullopt` if it is not
/// representable by `Timestamp`.
[[nodiscard]] std::optional<Timestamp> from_epoch_seconds(long long seconds) noexcept;

// ─── Grouping ─────────────────────────────────────────────────────────────────

/// Split a mixed series into one series per metric, input order preserved
/// within each group.
[[nodiscard]] std::map<MetricType, std::vector<Measurement>>
group_by_metric(std::span<const Measurement> records);

}  // namespace healthtrend
