#pragma once

/// @file include/tsig/data_loader.hpp
/// @brief CSV loader for activity summaries, streams and history.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse the CSV files the `tsig` CLI consumes into engine input types.
/// Columns are matched by header name, in any order; unknown columns are
/// ignored. An empty cell is a null value.
///
/// ## Expected CSV Formats
/// Summary (first data row is used):
/// ```
/// type,distance_m,moving_time_s,elapsed_time_s,elevation_gain_m,avg_hr,max_hr,avg_cadence,avg_speed_mps,start_time,user_intent
/// Run,10000,3000,3100,45,150,172,86,3.33,1700000000,Easy Run
/// ```
/// Streams (one row per sample, channel names or their aliases as headers):
/// ```
/// time,distance,heart_rate,cadence
/// 0,0,120,84
/// 1,3.1,,85
/// ```
/// History (one row per past activity):
/// ```
/// start_time,distance_m,moving_time_s,effort_score,hard
/// 1699900000,8000,2700,110,0
/// ```
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Stream and history rows with the wrong column count are skipped
/// - An unparseable stream cell becomes a null sample
/// - Does not modify any file or external state

#include "tsig/baseline.hpp"
#include "tsig/streams.hpp"
#include "tsig/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsig::core {

class DataLoader {
public:
    /// # Returns
    /// `nullopt` if the file cannot be opened or holds no valid summary row
    /// (a summary needs at least `moving_time_s`).
    [[nodiscard]] static std::optional<ActivitySummary>
    load_summary(const std::string& filepath) noexcept;

    [[nodiscard]] static std::optional<ActivitySummary>
    parse_summary_csv(const std::string& csv_content) noexcept;

    /// # Returns
    /// `nullopt` if the file cannot be opened or no header names a channel.
    [[nodiscard]] static std::optional<StreamSet>
    load_streams(const std::string& filepath) noexcept;

    [[nodiscard]] static std::optional<StreamSet>
    parse_streams_csv(const std::string& csv_content) noexcept;

    /// # Returns
    /// `nullopt` if the file cannot be opened; otherwise the parsed entries,
    /// skipping rows without a finite start time, distance and moving time.
    [[nodiscard]] static std::optional<std::vector<baseline::HistoryEntry>>
    load_history(const std::string& filepath) noexcept;

    [[nodiscard]] static std::vector<baseline::HistoryEntry>
    parse_history_csv(const std::string& csv_content) noexcept;

    /// Parse one numeric cell. Empty, malformed or non-finite → `nullopt`.
    [[nodiscard]] static std::optional<double> parse_number(std::string_view cell) noexcept;

private:
    /// Split a CSV line on commas and trim each cell.
    [[nodiscard]] static std::vector<std::string> split_row(const std::string& line);

    [[nodiscard]] static std::optional<std::string> read_file(const std::string& filepath) noexcept;
};

}  // namespace tsig::core
