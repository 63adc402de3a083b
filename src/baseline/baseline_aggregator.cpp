/// @file src/baseline/baseline_aggregator.cpp
/// @brief BaselineAggregator implementation.

#include "tsig/baseline.hpp"
#include "../core/stats.hpp"

#include <cmath>
#include <vector>

namespace tsig::baseline {

namespace {

constexpr double WINDOW_28D_S = 28.0 * constants::SECONDS_PER_DAY;
constexpr double WINDOW_7D_S  = 7.0 * constants::SECONDS_PER_DAY;

bool usable(const HistoryEntry& e) noexcept {
    return std::isfinite(e.start_time) && std::isfinite(e.distance_m) &&
           std::isfinite(e.moving_time_s) && e.distance_m >= 0.0 && e.moving_time_s >= 0.0;
}

}  // namespace

std::optional<double> BaselineAggregator::pace_s_per_km(const HistoryEntry& e) noexcept {
    if (!(e.distance_m > 0.0) || !(e.moving_time_s > 0.0)) {
        return std::nullopt;
    }
    return e.moving_time_s / (e.distance_m / 1000.0);
}

HistoryBaseline
BaselineAggregator::aggregate(std::span<const HistoryEntry> history, double as_of) noexcept {
    HistoryBaseline out;

    std::vector<double> durations, distances, efforts, paces;
    double dist_7d = 0.0, dist_28d = 0.0, time_7d = 0.0, time_28d = 0.0;
    int    hard_7d = 0;
    std::optional<double> last_hard;

    for (const HistoryEntry& e : history) {
        if (!usable(e) || e.start_time > as_of) {
            continue;
        }
        const double age = as_of - e.start_time;

        if (e.hard && (!last_hard || e.start_time > *last_hard)) {
            last_hard = e.start_time;
        }
        if (age >= WINDOW_28D_S) {
            continue;
        }

        durations.push_back(e.moving_time_s);
        distances.push_back(e.distance_m);
        dist_28d += e.distance_m;
        time_28d += e.moving_time_s;
        if (e.effort_score && std::isfinite(*e.effort_score)) {
            efforts.push_back(*e.effort_score);
        }
        if (const auto pace = pace_s_per_km(e)) {
            paces.push_back(*pace);
        }

        if (age < WINDOW_7D_S) {
            dist_7d += e.distance_m;
            time_7d += e.moving_time_s;
            if (e.hard) {
                ++hard_7d;
            }
        }
    }

    out.sample_count      = durations.size();
    out.duration_p50_s    = stats::percentile(durations, 0.5);
    out.duration_p80_s    = stats::percentile(durations, 0.8);
    out.distance_p50_m    = stats::percentile(distances, 0.5);
    out.distance_p80_m    = stats::percentile(distances, 0.8);
    out.distance_7d_m     = dist_7d;
    out.distance_28d_m    = dist_28d;
    out.moving_time_7d_s  = time_7d;
    out.moving_time_28d_s = time_28d;
    out.effort_mean       = stats::mean(efforts);
    out.effort_stddev     = stats::sample_stddev(efforts);
    out.threshold_pace_s_per_km = stats::percentile(paces, 0.2);
    out.hard_sessions_7d  = hard_7d;
    if (last_hard) {
        out.days_since_last_hard = (as_of - *last_hard) / constants::SECONDS_PER_DAY;
    }
    return out;
}

}  // namespace tsig::baseline
