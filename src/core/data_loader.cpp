/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for health measurements.

#include "healthtrend/data_loader.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <system_error>

namespace healthtrend::core {

namespace {

constexpr std::size_t FIELD_COUNT = 3;

std::string_view trim(std::string_view token) noexcept {
    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
}

/// Parse the whole token as a number; trailing garbage fails.
template <typename T>
std::optional<T> parse_number(std::string_view token) noexcept {
    T value{};
    const auto* begin = token.data();
    const auto* end   = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

}  // anonymous namespace

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<Measurement> DataLoader::parse_row(std::string_view line) noexcept {
    // Skip blank lines and comment lines.
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    std::array<std::string_view, FIELD_COUNT> fields;
    std::size_t count = 0;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (count == FIELD_COUNT) return std::nullopt;  // too many fields
        fields[count++] = trim(line.substr(start, comma - start));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    if (count != FIELD_COUNT) {
        return std::nullopt;
    }

    const auto seconds = parse_number<long long>(fields[0]);
    const auto metric  = metric_type_from_string(fields[1]);
    const auto value   = parse_number<double>(fields[2]);
    if (!seconds || !metric || !value || !std::isfinite(*value)) {
        return std::nullopt;
    }

    const auto timestamp = from_epoch_seconds(*seconds);
    if (!timestamp) {
        return std::nullopt;
    }

    return Measurement{
        .timestamp = *timestamp,
        .value     = *value,
        .metric    = *metric,
    };
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

std::vector<Measurement>
DataLoader::parse_csv_string(std::string_view csv_content) noexcept {
    std::vector<Measurement> records;
    bool header_skipped = false;

    std::size_t start = 0;
    while (start < csv_content.size()) {
        auto newline = csv_content.find('\n', start);
        if (newline == std::string_view::npos) newline = csv_content.size();
        const auto line = trim(csv_content.substr(start, newline - start));
        start = newline + 1;

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line.front() != '#') {
                header_skipped = true;
            }
            continue;
        }

        if (auto record = parse_row(line)) {
            records.push_back(*record);
        }
    }

    return records;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<std::vector<Measurement>>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace healthtrend::core
