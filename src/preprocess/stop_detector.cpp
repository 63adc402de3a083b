/// @file src/preprocess/stop_detector.cpp
/// @brief StopDetector implementation.

#include "tsig/preprocess.hpp"

#include <algorithm>
#include <utility>

namespace tsig::preprocess {

namespace {

struct Window {
    std::size_t first;    ///< Index of the first stopped sample
    double      start_s;
    double      end_s;    ///< Time the athlete resumed (or last sample)
};

/// Most recent non-null sample at or before `idx`.
Sample latest_at(const Series& s, std::size_t idx) noexcept {
    if (s.empty()) {
        return std::nullopt;
    }
    for (std::size_t i = std::min(idx, s.size() - 1) + 1; i-- > 0;) {
        if (s[i]) {
            return s[i];
        }
    }
    return std::nullopt;
}

}  // namespace

Nullable<StopsAnalysis>
StopDetector::detect(const PreparedStreams& streams, const Thresholds& th) noexcept {
    if (!streams.has_data(Channel::Velocity)) {
        return Nullable<StopsAnalysis>::missing(DataGap::NoVelocity);
    }

    const auto&       t = streams.time;
    const auto&       v = streams.velocity;
    const std::size_t n = std::min(t.size(), v.size());

    auto stopped = [&](std::size_t i) {
        return v[i].has_value() && *v[i] < th.stop_velocity_epsilon;
    };

    // ── Contiguous raw windows ───────────────────────────────────────────────
    std::vector<Window> raw;
    std::size_t i = 0;
    while (i < n) {
        if (!stopped(i)) {
            ++i;
            continue;
        }
        const std::size_t first = i;
        while (i < n && stopped(i)) {
            ++i;
        }
        const double end = (i < n) ? t[i] : t[n - 1];
        raw.push_back(Window{first, t[first], end});
    }

    // ── Merge windows separated by short gaps ────────────────────────────────
    std::vector<Window> merged;
    for (const Window& w : raw) {
        if (!merged.empty() && w.start_s - merged.back().end_s <= th.stop_merge_gap_s) {
            merged.back().end_s = w.end_s;
        } else {
            merged.push_back(w);
        }
    }

    // ── Keep windows of sufficient duration ──────────────────────────────────
    StopsAnalysis out;
    for (const Window& w : merged) {
        const double duration = w.end_s - w.start_s;
        if (duration < th.stop_min_duration_s) {
            continue;
        }
        out.stops.push_back(Stop{
            .start_s    = w.start_s,
            .duration_s = duration,
            .distance_m = latest_at(streams.distance, w.first),
            .latitude   = latest_at(streams.latitude, w.first),
            .longitude  = latest_at(streams.longitude, w.first),
        });
        out.total_stopped_s += duration;
        out.longest_stop_s = std::max(out.longest_stop_s, duration);
    }
    out.stop_count = out.stops.size();

    return Nullable<StopsAnalysis>::of(std::move(out));
}

}  // namespace tsig::preprocess
