/// @file src/splits/split_builder.cpp
/// @brief SplitBuilder implementation.

#include "tsig/splits.hpp"
#include "../core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tsig::splits {

using preprocess::PreparedStreams;

namespace {

/// Inclusive index range [first, last] of one split.
using Range = std::pair<std::size_t, std::size_t>;

std::optional<std::size_t> first_present(const Series& s, std::size_t a, std::size_t b) noexcept {
    for (std::size_t i = a; i <= b && i < s.size(); ++i) {
        if (s[i]) return i;
    }
    return std::nullopt;
}

std::optional<std::size_t> last_present(const Series& s, std::size_t a, std::size_t b) noexcept {
    if (s.empty()) return std::nullopt;
    for (std::size_t i = std::min(b, s.size() - 1) + 1; i-- > a;) {
        if (s[i]) return i;
    }
    return std::nullopt;
}

std::optional<double> mean_of(const Series& s, std::size_t a, std::size_t end) noexcept {
    const auto xs = stats::present(s, a, end);
    return stats::mean(xs);
}

/// Sum of positive altitude deltas between consecutive non-null samples.
std::optional<double> elevation_gain(const Series& alt, std::size_t a, std::size_t b) noexcept {
    if (alt.empty()) return std::nullopt;
    std::optional<double> prev;
    double gain = 0.0;
    bool   any  = false;
    for (std::size_t i = a; i <= b && i < alt.size(); ++i) {
        if (!alt[i]) continue;
        if (prev) {
            gain += std::max(0.0, *alt[i] - *prev);
            any = true;
        }
        prev = alt[i];
    }
    return any ? std::optional<double>(gain) : std::nullopt;
}

std::optional<double> pace_from(std::optional<double> speed) noexcept {
    if (!speed || *speed <= 0.0) return std::nullopt;
    return 1000.0 / *speed;
}

Split aggregate(const PreparedStreams& s, Range r, bool last_split,
                SplitKind kind, std::size_t index) noexcept {
    const auto [a, b] = r;
    // Sample averages use [a, b); the final split also owns sample b.
    const std::size_t end = last_split ? b + 1 : b;

    Split out;
    out.index      = index;
    out.kind       = kind;
    out.start_s    = s.time[a];
    out.end_s      = s.time[b];
    out.duration_s = s.time[b] - s.time[a];

    const auto d0 = first_present(s.distance, a, b);
    const auto d1 = last_present(s.distance, a, b);
    if (d0 && d1 && *d1 > *d0) {
        out.distance_m = *s.distance[*d1] - *s.distance[*d0];
    } else if (d0 && d1) {
        out.distance_m = 0.0;
    }

    if (out.distance_m && out.duration_s > 0.0) {
        out.avg_speed_mps = *out.distance_m / out.duration_s;
    } else {
        out.avg_speed_mps = mean_of(s.velocity, a, end);
    }
    out.pace_s_per_km    = pace_from(out.avg_speed_mps);
    out.avg_hr           = mean_of(s.heart_rate, a, end);
    out.avg_cadence      = mean_of(s.cadence, a, end);
    out.avg_grade        = mean_of(s.grade, a, end);
    out.avg_power        = mean_of(s.power, a, end);
    out.elevation_gain_m = elevation_gain(s.altitude, a, b);
    return out;
}

}  // namespace

// ─── SplitBuilder::has_reliable_distance ──────────────────────────────────────

bool SplitBuilder::has_reliable_distance(const PreparedStreams& streams,
                                         const Thresholds& th) noexcept {
    const auto& d = streams.distance;
    if (d.empty() || d.size() != streams.size()) {
        return false;
    }
    std::size_t present = 0;
    std::optional<double> first;
    std::optional<double> prev;
    for (const auto& x : d) {
        if (!x) continue;
        if (prev && *x < *prev) {
            return false;
        }
        if (!first) first = x;
        prev = x;
        ++present;
    }
    const double coverage = static_cast<double>(present) / static_cast<double>(d.size());
    if (coverage < th.reliable_distance_coverage || !first || !prev) {
        return false;
    }
    return (*prev - *first) >= th.split_distance_m;
}

// ─── SplitBuilder::from_streams ───────────────────────────────────────────────

std::vector<Split>
SplitBuilder::from_streams(const PreparedStreams& streams, const Thresholds& th) noexcept {
    const std::size_t n = streams.size();
    if (n < 2) {
        return {};
    }

    const bool   by_distance = has_reliable_distance(streams, th);
    const double nominal     = by_distance ? th.split_distance_m : th.split_time_s;
    const auto   kind        = by_distance ? SplitKind::Distance : SplitKind::Time;
    if (!(nominal > 0.0)) {
        return {};
    }

    // Position of sample i along the split axis; nullopt for a null distance.
    const auto d_origin = by_distance ? first_present(streams.distance, 0, n - 1) : std::nullopt;
    auto position = [&](std::size_t i) -> std::optional<double> {
        if (!by_distance) {
            return streams.time[i] - streams.time[0];
        }
        if (!streams.distance[i] || !d_origin) {
            return std::nullopt;
        }
        return *streams.distance[i] - *streams.distance[*d_origin];
    };

    // ── Boundaries ───────────────────────────────────────────────────────────
    std::vector<Range> ranges;
    std::size_t a    = 0;
    double      next = nominal;
    for (std::size_t i = 1; i < n; ++i) {
        const auto pos = position(i);
        if (pos && *pos >= next) {
            ranges.emplace_back(a, i);
            a    = i;
            next = (std::floor(*pos / nominal) + 1.0) * nominal;
        }
    }

    // ── Tail ─────────────────────────────────────────────────────────────────
    if (a < n - 1) {
        std::optional<double> tail;
        if (by_distance) {
            const auto p0 = last_present(streams.distance, 0, a);
            const auto p1 = last_present(streams.distance, a, n - 1);
            if (p0 && p1) tail = *streams.distance[*p1] - *streams.distance[*p0];
        } else {
            tail = streams.time[n - 1] - streams.time[a];
        }
        const bool short_tail = !tail || *tail < th.split_tail_merge_fraction * nominal;
        if (short_tail && !ranges.empty()) {
            ranges.back().second = n - 1;
        } else {
            ranges.emplace_back(a, n - 1);
        }
    }

    std::vector<Split> out;
    out.reserve(ranges.size());
    for (std::size_t r = 0; r < ranges.size(); ++r) {
        out.push_back(aggregate(streams, ranges[r], r + 1 == ranges.size(), kind, r + 1));
    }
    return out;
}

// ─── SplitBuilder::from_summary ───────────────────────────────────────────────

std::vector<Split>
SplitBuilder::from_summary(const ActivitySummary& summary, const Thresholds& th) noexcept {
    const double total   = summary.moving_time_s;
    const double nominal = th.split_time_s;
    if (!std::isfinite(total) || total <= 0.0 || !(nominal > 0.0)) {
        return {};
    }

    const auto count = static_cast<std::size_t>(std::ceil(total / nominal));
    std::vector<double> durations(count, nominal);
    durations.back() = total - static_cast<double>(count - 1) * nominal;
    if (durations.size() > 1 && durations.back() < th.split_tail_merge_fraction * nominal) {
        const double tail = durations.back();
        durations.pop_back();
        durations.back() += tail;
    }

    std::optional<double> speed = summary.avg_speed_mps;
    if (!speed && summary.distance_m > 0.0) {
        speed = summary.distance_m / total;
    }

    std::vector<Split> out;
    out.reserve(durations.size());
    double start = 0.0;
    for (std::size_t i = 0; i < durations.size(); ++i) {
        Split s;
        s.index         = i + 1;
        s.kind          = SplitKind::Summary;
        s.start_s       = start;
        s.duration_s    = durations[i];
        s.end_s         = start + durations[i];
        s.avg_speed_mps = speed;
        s.pace_s_per_km = pace_from(speed);
        if (speed) {
            s.distance_m = *speed * durations[i];
        }
        s.avg_hr      = summary.avg_hr;
        s.avg_cadence = summary.avg_cadence;
        out.push_back(s);
        start += durations[i];
    }
    return out;
}

// ─── SplitBuilder::build ──────────────────────────────────────────────────────

std::vector<Split>
SplitBuilder::build(const std::optional<PreparedStreams>& streams,
                    const ActivitySummary& summary,
                    const Thresholds& th) noexcept {
    if (streams && streams->size() >= 2) {
        auto out = from_streams(*streams, th);
        if (!out.empty()) {
            return out;
        }
    }
    return from_summary(summary, th);
}

}  // namespace tsig::splits
