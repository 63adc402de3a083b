#pragma once

/// @file include/tsig/baseline.hpp
/// @brief BaselineAggregator: rolling history statistics.
///
/// # Module: Baseline Aggregator
///
/// ## Responsibility
/// Reduce the caller's activity history into an immutable `HistoryBaseline`
/// as of a point in time. The engine never stores history; the caller
/// either builds the baseline here or supplies one directly.
///
/// ## Windows
/// The 28-day window is `(as_of − 28 d, as_of]`, the 7-day window
/// `(as_of − 7 d, as_of]`. Entries after `as_of` are ignored.
///
/// ## Statistics
/// - Duration and distance p50 / p80 over the 28-day window (linear
///   interpolation)
/// - Distance and moving-time sums over both windows
/// - Effort mean and sample standard deviation over entries with a score
/// - Threshold pace: the 20th percentile of pace (s/km), i.e. the fastest 20 %
/// - Hard sessions in the 7-day window and days since the last hard session
///
/// ## Guarantees
/// - Pure: same entries and `as_of` give the same baseline, in any order
/// - Entries with non-finite fields are skipped
/// - Never throws

#include "tsig/types.hpp"

#include <optional>
#include <span>

namespace tsig::baseline {

/// One past activity as the caller's persistence layer holds it.
struct HistoryEntry {
    double                start_time    = 0.0;  ///< Unix epoch seconds
    double                distance_m    = 0.0;
    double                moving_time_s = 0.0;
    std::optional<double> effort_score;
    bool                  hard = false;         ///< Tempo / intervals / race marker

    bool operator==(const HistoryEntry&) const = default;
};

class BaselineAggregator {
public:
    [[nodiscard]] static HistoryBaseline
    aggregate(std::span<const HistoryEntry> history, double as_of) noexcept;

    /// Pace in s/km, `nullopt` for a zero distance or time.
    [[nodiscard]] static std::optional<double>
    pace_s_per_km(const HistoryEntry& e) noexcept;
};

}  // namespace tsig::baseline
