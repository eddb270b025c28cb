/// @file src/main.cpp
/// @brief healthtrend CLI entry point.
///
/// Usage:
///   healthtrend --analyze <csv> [options]   Analyse a measurement CSV
///   healthtrend --help                      Print usage

#include "healthtrend/analyzer.hpp"
#include "healthtrend/data_loader.hpp"
#include "healthtrend/error.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using namespace healthtrend;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  healthtrend --analyze <csv_file> [options]\n"
        "  healthtrend --help\n"
        "\n"
        "Options:\n"
        "  --range week|month|quarter|year   Relative window ending now (default month)\n"
        "  --from <epoch> --to <epoch>       Explicit window in epoch seconds\n"
        "  --metric <name>                   Only analyse this metric\n"
        "  --predict <days>                  Forecast the trend N days ahead\n"
        "  --gaps daily|weekly|monthly       Report gaps against a cadence\n"
        "  --verbose                         Print diagnostics to stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  timestamp,metric,value\n"
    );
}

// ─── CLI Args ─────────────────────────────────────────────────────────────────

struct Args {
    std::string                           input_path;
    std::optional<TimeRange>              range;
    std::optional<Timestamp>              from;
    std::optional<Timestamp>              to;
    std::optional<MetricType>             metric;
    std::optional<int>                    predict_days;
    std::optional<quality::DataFrequency> gap_frequency;
    bool                                  verbose = false;
};

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

/// Returns `nullopt` (after printing why) on any unusable argument.
std::optional<Args> parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string_view key(argv[i]);

        if (key == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", key);
            return std::nullopt;
        }
        const std::string_view val(argv[++i]);

        if (key == "--analyze") {
            args.input_path = std::string(val);
        } else if (key == "--range") {
            args.range = time_range_from_string(val);
            if (!args.range) {
                fmt::print(stderr, "Error: unknown range '{}'\n", val);
                return std::nullopt;
            }
        } else if (key == "--from" || key == "--to") {
            const auto epoch = parse_number<long long>(val);
            const auto stamp = epoch ? from_epoch_seconds(*epoch) : std::nullopt;
            if (!stamp) {
                fmt::print(stderr, "Error: {} expects epoch seconds, got '{}'\n", key, val);
                return std::nullopt;
            }
            (key == "--from" ? args.from : args.to) = stamp;
        } else if (key == "--metric") {
            args.metric = metric_type_from_string(val);
            if (!args.metric) {
                fmt::print(stderr, "Error: unknown metric '{}'\n", val);
                return std::nullopt;
            }
        } else if (key == "--predict") {
            args.predict_days = parse_number<int>(val);
            if (!args.predict_days) {
                fmt::print(stderr, "Error: --predict expects a day count, got '{}'\n", val);
                return std::nullopt;
            }
        } else if (key == "--gaps") {
            args.gap_frequency = quality::data_frequency_from_string(val);
            if (!args.gap_frequency) {
                fmt::print(stderr, "Error: unknown frequency '{}'\n", val);
                return std::nullopt;
            }
        } else {
            fmt::print(stderr, "Unknown option: {}\n", key);
            return std::nullopt;
        }
    }

    if (args.input_path.empty()) {
        fmt::print(stderr, "Error: --analyze <csv_file> is required\n");
        return std::nullopt;
    }
    if (args.from.has_value() != args.to.has_value()) {
        fmt::print(stderr, "Error: --from and --to must be given together\n");
        return std::nullopt;
    }
    if (args.from && args.range) {
        fmt::print(stderr, "Error: --range cannot be combined with --from/--to\n");
        return std::nullopt;
    }
    return args;
}

/// UTC calendar day of `t`.
std::string format_day(Timestamp t) {
    return fmt::format("{:%Y-%m-%d}", fmt::gmtime(Clock::to_time_t(t)));
}

// ─── Reporting ────────────────────────────────────────────────────────────────

void print_analysis(const TrendAnalysis& a) {
    const auto& s = a.summary;
    fmt::print("Metric:      {} ({})\n", to_string(a.metric), unit(a.metric));
    fmt::print("Window:      {} .. {}\n", format_day(a.time_range.start()),
               format_day(a.time_range.end()));
    fmt::print("Direction:   {}\n", to_string(a.direction));
    fmt::print("Slope:       {:+.4f} per point\n", a.slope);
    fmt::print("Correlation: {:+.4f}\n", a.correlation);
    fmt::print("Confidence:  {:.3f}\n", a.confidence);
    fmt::print("Points:      {}  mean {:.2f}  sd {:.2f}  range {:.2f}..{:.2f}  change {:+.1f}%\n",
               s.total_data_points, s.average_value, s.standard_deviation,
               s.minimum_value, s.maximum_value, s.change_percentage);

    fmt::print("Anomalies:   {}\n", a.anomalies.size());
    for (const auto& an : a.anomalies) {
        fmt::print("  {}  value {:.2f}  expected {:.2f}  z {:.2f}  {}\n",
                   format_day(an.timestamp), an.value, an.expected_value,
                   an.deviation_score, anomaly::to_string(an.severity));
    }
}

void print_quality(const quality::DataQualityAssessment& q) {
    fmt::print("Quality:     window overall {:.3f} (completeness {:.2f}, consistency {:.2f}, "
               "accuracy {:.2f}, timeliness {:.2f})\n",
               q.overall_score, q.completeness, q.consistency, q.accuracy, q.timeliness);
    for (const auto& issue : q.issues) {
        fmt::print("  [{}] {}: {} ({} record(s)) -> {}\n",
                   quality::to_string(issue.severity), quality::to_string(issue.type),
                   issue.description, issue.affected_records, issue.suggested_action);
    }
}

void print_prediction(const TrendPrediction& p) {
    fmt::print("Prediction:  {} (confidence {:.3f}, valid until {})\n",
               p.methodology, p.confidence, format_day(p.valid_until));
    for (const auto& point : p.predicted_points) {
        fmt::print("  {}  {:.2f}\n", format_day(point.timestamp), point.value);
    }
}

/// Analyse one metric's records. Returns false after printing the error.
bool analyze_metric(const TrendAnalyzer& analyzer, const Args& args,
                    MetricType metric, std::span<const Measurement> records) {
    try {
        const TimeWindow window = args.from
            ? TimeWindow{DateRange::checked(*args.from, *args.to)}
            : TimeWindow{to_window(args.range.value_or(TimeRange::Month))};

        const auto analysis = analyzer.analyze_trends(records, window);
        print_analysis(analysis);
        fmt::print("Strength:    {:.3f}\n", analyzer.trend_strength(analysis));
        print_quality(analysis.data_quality);

        if (args.predict_days) {
            print_prediction(analyzer.predict_trend(analysis, *args.predict_days));
        }

        if (args.gap_frequency) {
            const auto gaps = analyzer.identify_data_gaps(records, *args.gap_frequency);
            fmt::print("Gaps:        {} ({} cadence)\n", gaps.size(),
                       quality::to_string(*args.gap_frequency));
            for (const auto& gap : gaps) {
                fmt::print("  {} .. {}\n", format_day(gap.start()), format_day(gap.end()));
            }
        }
    } catch (const AnalysisError& ex) {
        fmt::print(stderr, "Error ({}) for {}: {}\n",
                   to_string(ex.kind()), to_string(metric), ex.what());
        return false;
    }
    return true;
}

/// Run the full analysis, one pass per metric. Returns 0 on success, 1 on error.
int run_analyze(const Args& args) {
    auto loaded = core::DataLoader::load_csv(args.input_path);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", args.input_path);
        return 1;
    }

    std::vector<Measurement> records = std::move(*loaded);
    if (args.metric) {
        std::erase_if(records, [&](const Measurement& r) { return r.metric != *args.metric; });
    }
    if (records.empty()) {
        fmt::print(stderr, "Error: no valid measurements loaded from '{}'\n", args.input_path);
        return 1;
    }

    fmt::print("Loaded {} measurements from '{}'\n", records.size(), args.input_path);

    TrendAnalyzer analyzer(AnalyzerConfig{.verbose = args.verbose});

    bool ok = true;
    bool first = true;
    for (const auto& [metric, series] : group_by_metric(records)) {
        if (!first) fmt::print("\n");
        first = false;
        ok = analyze_metric(analyzer, args, metric, series) && ok;
    }
    return ok ? 0 : 1;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }
    return run_analyze(*args);
}
