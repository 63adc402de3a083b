/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for summaries, streams and history.

#include "tsig/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tsig::core {

namespace {

/// Header name → column index, lowercased.
using HeaderMap = std::map<std::string, std::size_t>;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Lines without trailing CR, skipping blank and comment lines.
std::vector<std::string> content_lines(const std::string& csv_content) {
    std::vector<std::string> lines;
    std::istringstream stream(csv_content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos || line[0] == '#') {
            continue;
        }
        lines.push_back(line);
    }
    return lines;
}

std::optional<std::string> cell(const std::vector<std::string>& row, const HeaderMap& header,
                                const char* name) {
    const auto it = header.find(name);
    if (it == header.end() || it->second >= row.size() || row[it->second].empty()) {
        return std::nullopt;
    }
    return row[it->second];
}

bool parse_bool(const std::string& s) {
    const std::string v = lower(s);
    return v == "1" || v == "true" || v == "yes" || v == "y";
}

}  // namespace

// ─── Cell parsing ─────────────────────────────────────────────────────────────

std::optional<double> DataLoader::parse_number(std::string_view cell) noexcept {
    if (cell.empty()) {
        return std::nullopt;
    }
    try {
        const std::string token(cell);
        std::size_t pos = 0;
        const double val = std::stod(token, &pos);
        if (pos != token.size() || !std::isfinite(val)) {
            return std::nullopt;  // trailing garbage or inf/nan
        }
        return val;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<std::string> DataLoader::split_row(const std::string& line) {
    std::vector<std::string> cells;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        const auto first = token.find_first_not_of(" \t");
        const auto last  = token.find_last_not_of(" \t");
        cells.push_back(first == std::string::npos ? std::string{}
                                                   : token.substr(first, last - first + 1));
    }
    // "a,b," has three cells.
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

std::optional<std::string> DataLoader::read_file(const std::string& filepath) noexcept {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            return std::nullopt;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        return contents.str();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ─── Summary ──────────────────────────────────────────────────────────────────

std::optional<ActivitySummary>
DataLoader::parse_summary_csv(const std::string& csv_content) noexcept {
    try {
        const auto lines = content_lines(csv_content);
        if (lines.size() < 2) {
            return std::nullopt;
        }
        HeaderMap header;
        const auto names = split_row(lines[0]);
        for (std::size_t i = 0; i < names.size(); ++i) {
            header.emplace(lower(names[i]), i);
        }
        const auto row = split_row(lines[1]);

        auto number = [&](const char* name) -> std::optional<double> {
            const auto c = cell(row, header, name);
            return c ? parse_number(*c) : std::nullopt;
        };

        const auto moving = number("moving_time_s");
        if (!moving) {
            return std::nullopt;
        }

        ActivitySummary s;
        s.moving_time_s    = *moving;
        s.distance_m       = number("distance_m").value_or(0.0);
        s.elapsed_time_s   = number("elapsed_time_s").value_or(s.moving_time_s);
        s.elevation_gain_m = number("elevation_gain_m").value_or(0.0);
        s.avg_hr           = number("avg_hr");
        s.max_hr           = number("max_hr");
        s.avg_cadence      = number("avg_cadence");
        s.avg_speed_mps    = number("avg_speed_mps");
        s.start_time       = number("start_time").value_or(0.0);
        if (const auto type = cell(row, header, "type")) {
            s.type = parse_sport_type(*type);
        }
        if (const auto intent = cell(row, header, "user_intent")) {
            s.user_intent = parse_activity_class(*intent);
        }
        return s;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<ActivitySummary> DataLoader::load_summary(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_summary_csv(*contents);
}

// ─── Streams ──────────────────────────────────────────────────────────────────

std::optional<StreamSet>
DataLoader::parse_streams_csv(const std::string& csv_content) noexcept {
    try {
        const auto lines = content_lines(csv_content);
        if (lines.empty()) {
            return std::nullopt;
        }

        const auto names = split_row(lines[0]);
        std::vector<std::optional<Channel>> columns;
        bool any = false;
        for (const auto& n : names) {
            const auto c = parse_channel(lower(n));
            columns.push_back(c);
            any = any || c.has_value();
        }
        if (!any) {
            return std::nullopt;
        }

        std::map<Channel, Series> series;
        for (const auto& c : columns) {
            if (c) series.emplace(*c, Series{});
        }
        for (std::size_t li = 1; li < lines.size(); ++li) {
            const auto row = split_row(lines[li]);
            if (row.size() != columns.size()) {
                continue;  // misaligned row
            }
            for (std::size_t i = 0; i < row.size(); ++i) {
                if (columns[i]) {
                    series[*columns[i]].push_back(parse_number(row[i]));
                }
            }
        }

        StreamSet set;
        for (auto& [channel, samples] : series) {
            set.set(channel, std::move(samples));
        }
        return set;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<StreamSet> DataLoader::load_streams(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_streams_csv(*contents);
}

// ─── History ──────────────────────────────────────────────────────────────────

std::vector<baseline::HistoryEntry>
DataLoader::parse_history_csv(const std::string& csv_content) noexcept {
    std::vector<baseline::HistoryEntry> entries;
    try {
        const auto lines = content_lines(csv_content);
        if (lines.empty()) {
            return entries;
        }
        HeaderMap header;
        const auto names = split_row(lines[0]);
        for (std::size_t i = 0; i < names.size(); ++i) {
            header.emplace(lower(names[i]), i);
        }

        for (std::size_t li = 1; li < lines.size(); ++li) {
            const auto row = split_row(lines[li]);
            if (row.size() != names.size()) {
                continue;
            }
            auto number = [&](const char* name) -> std::optional<double> {
                const auto c = cell(row, header, name);
                return c ? parse_number(*c) : std::nullopt;
            };
            const auto start    = number("start_time");
            const auto distance = number("distance_m");
            const auto moving   = number("moving_time_s");
            if (!start || !distance || !moving) {
                continue;
            }
            const auto hard = cell(row, header, "hard");
            entries.push_back(baseline::HistoryEntry{
                .start_time    = *start,
                .distance_m    = *distance,
                .moving_time_s = *moving,
                .effort_score  = number("effort_score"),
                .hard          = hard && parse_bool(*hard),
            });
        }
    } catch (const std::exception&) {
        entries.clear();
    }
    return entries;
}

std::optional<std::vector<baseline::HistoryEntry>>
DataLoader::load_history(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_history_csv(*contents);
}

}  // namespace tsig::core
