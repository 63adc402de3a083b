/// @file src/intervals/interval_detector.cpp
/// @brief IntervalDetector implementation.

#include "tsig/intervals.hpp"
#include "../core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tsig::intervals {

namespace {

/// Smoothed speed below this (m/s) is a stop, not a rest.
constexpr double ACTIVE_SPEED_MIN = 0.5;

/// Minimum samples for a structure search.
constexpr std::size_t MIN_SAMPLES = 60;

/// Work / rest bands around the bimodal threshold.
constexpr double WORK_BAND = 1.05;
constexpr double REST_BAND = 0.95;

constexpr int          MAX_TWO_MEANS_ITERATIONS = 20;
constexpr double       TWO_MEANS_TOLERANCE      = 0.01;
constexpr std::size_t  MIN_CLUSTER_VALUES       = 10;
constexpr std::size_t  MIN_REPS                 = 2;

enum class Label { Work, Rest, Transition };

/// Contiguous run of one label over sample indices [first, end).
struct Run {
    Label       label;
    std::size_t first;
    std::size_t end;
};

std::pair<double, double> cluster_means(std::span<const double> xs, double threshold,
                                        std::size_t& n_low, std::size_t& n_high) noexcept {
    double low = 0.0, high = 0.0;
    n_low = n_high = 0;
    for (const double x : xs) {
        if (x <= threshold) { low += x; ++n_low; }
        else                { high += x; ++n_high; }
    }
    return {n_low ? low / static_cast<double>(n_low) : 0.0,
            n_high ? high / static_cast<double>(n_high) : 0.0};
}

std::optional<double> max_of(const Series& s, std::size_t a, std::size_t b) noexcept {
    const auto xs = stats::present(s, a, b);
    if (xs.empty()) return std::nullopt;
    return *std::max_element(xs.begin(), xs.end());
}

}  // namespace

// ─── IntervalDetector::smooth ─────────────────────────────────────────────────

Series IntervalDetector::smooth(const std::vector<double>& time, const Series& velocity,
                                double window_s) {
    const std::size_t n    = std::min(time.size(), velocity.size());
    const double      half = window_s / 2.0;

    // Prefix sums over non-null samples.
    std::vector<double>      sum(n + 1, 0.0);
    std::vector<std::size_t> cnt(n + 1, 0);
    for (std::size_t i = 0; i < n; ++i) {
        sum[i + 1] = sum[i] + (velocity[i] ? *velocity[i] : 0.0);
        cnt[i + 1] = cnt[i] + (velocity[i] ? 1 : 0);
    }

    Series out(n);
    std::size_t lo = 0, hi = 0;
    for (std::size_t i = 0; i < n; ++i) {
        while (lo < i && time[lo] < time[i] - half) ++lo;
        if (hi < i) hi = i;
        while (hi + 1 < n && time[hi + 1] <= time[i] + half) ++hi;
        const std::size_t c = cnt[hi + 1] - cnt[lo];
        if (c > 0) {
            out[i] = (sum[hi + 1] - sum[lo]) / static_cast<double>(c);
        }
    }
    return out;
}

// ─── IntervalDetector::bimodal_threshold ──────────────────────────────────────

std::optional<double>
IntervalDetector::bimodal_threshold(std::span<const double> speeds, double min_ratio) noexcept {
    if (speeds.size() < MIN_CLUSTER_VALUES) {
        return std::nullopt;
    }
    const auto start = stats::mean(speeds);
    if (!start) {
        return std::nullopt;
    }

    double threshold = *start;
    std::size_t n_low = 0, n_high = 0;
    for (int it = 0; it < MAX_TWO_MEANS_ITERATIONS; ++it) {
        const auto [low, high] = cluster_means(speeds, threshold, n_low, n_high);
        if (n_low == 0 || n_high == 0) {
            return std::nullopt;
        }
        const double next = (low + high) / 2.0;
        if (std::abs(next - threshold) < TWO_MEANS_TOLERANCE) {
            break;
        }
        threshold = next;
    }

    const auto [low, high] = cluster_means(speeds, threshold, n_low, n_high);
    if (n_low == 0 || n_high == 0 || high < low * min_ratio) {
        return std::nullopt;
    }
    return threshold;
}

// ─── IntervalDetector::consistency ────────────────────────────────────────────

RepConsistency IntervalDetector::consistency(std::optional<double> duration_cv,
                                             std::optional<double> speed_cv) noexcept {
    if (!duration_cv && !speed_cv) {
        return RepConsistency::Unknown;
    }
    const double worst = std::max(duration_cv.value_or(0.0), speed_cv.value_or(0.0));
    if (worst < 10.0) return RepConsistency::High;
    if (worst < 20.0) return RepConsistency::Medium;
    return RepConsistency::Low;
}

// ─── IntervalDetector::detect ─────────────────────────────────────────────────

Nullable<IntervalStructure>
IntervalDetector::detect(const std::optional<preprocess::PreparedStreams>& streams,
                         const Thresholds& th) noexcept {
    using Result = Nullable<IntervalStructure>;

    if (!streams) {
        return Result::missing(DataGap::NoStreams);
    }
    if (!streams->has_data(Channel::Velocity)) {
        return Result::missing(DataGap::NoVelocity);
    }
    const auto&       t = streams->time;
    const std::size_t n = t.size();
    if (n < MIN_SAMPLES) {
        return Result::missing(DataGap::InsufficientSamples);
    }

    // ── Step 1: smoothing and threshold ──────────────────────────────────────
    const Series smoothed = smooth(t, streams->velocity, th.interval_smoothing_s);
    std::vector<double> active;
    for (const auto& s : smoothed) {
        if (s && *s > ACTIVE_SPEED_MIN) active.push_back(*s);
    }
    if (active.size() < MIN_SAMPLES) {
        return Result::missing(DataGap::InsufficientSamples);
    }
    const auto threshold = bimodal_threshold(active, th.interval_cluster_split);
    if (!threshold) {
        return Result::missing(DataGap::NoIntervalStructure);
    }

    // ── Step 2: label and segment ────────────────────────────────────────────
    auto label_of = [&](std::size_t i) {
        if (!smoothed[i]) return Label::Transition;
        if (*smoothed[i] >= *threshold * WORK_BAND) return Label::Work;
        if (*smoothed[i] <= *threshold * REST_BAND) return Label::Rest;
        return Label::Transition;
    };
    std::vector<Run> runs;
    for (std::size_t i = 0; i < n; ++i) {
        const Label l = label_of(i);
        if (runs.empty() || runs.back().label != l) {
            runs.push_back(Run{l, i, i + 1});
        } else {
            runs.back().end = i + 1;
        }
    }
    auto duration = [&](const Run& r) { return t[std::min(r.end, n - 1)] - t[r.first]; };

    std::vector<Run> work, rest;
    for (const Run& r : runs) {
        if (r.label == Label::Work && duration(r) >= th.interval_min_work_s) work.push_back(r);
        if (r.label == Label::Rest && duration(r) >= th.interval_min_rest_s) rest.push_back(r);
    }
    if (work.size() < MIN_REPS) {
        return Result::missing(DataGap::NoIntervalStructure);
    }

    // ── Step 3: describe reps ────────────────────────────────────────────────
    IntervalStructure out;
    const double first_work_t = t[work.front().first];
    const double last_work_t  = t[std::min(work.back().end, n - 1)];
    if (first_work_t - t.front() >= th.interval_warmup_min_s) {
        out.warmup_s = first_work_t - t.front();
    }
    if (t.back() - last_work_t >= th.interval_warmup_min_s) {
        out.cooldown_s = t.back() - last_work_t;
    }

    const auto& d  = streams->distance;
    const auto& hr = streams->heart_rate;
    for (const Run& r : work) {
        WorkSegment w;
        w.number     = out.work.size() + 1;
        w.start_s    = t[r.first];
        w.duration_s = duration(r);
        const auto dist = stats::present(d, r.first, std::min(r.end + 1, n));
        if (dist.size() >= 2) {
            w.distance_m = dist.back() - dist.front();
        }
        w.avg_speed_mps = stats::mean(stats::present(streams->velocity, r.first, r.end)).value_or(0.0);
        w.avg_hr        = stats::mean(stats::present(hr, r.first, r.end));
        w.peak_hr       = max_of(hr, r.first, r.end);
        out.work.push_back(w);
        out.total_work_s += w.duration_s;
    }

    // Rests between the first and the last rep.
    for (const Run& r : rest) {
        const double start = t[r.first];
        if (start < first_work_t || start >= last_work_t) {
            continue;
        }
        RestSegment rs;
        rs.start_s    = start;
        rs.duration_s = duration(r);
        rs.avg_hr     = stats::mean(stats::present(hr, r.first, r.end));
        for (auto it = out.work.rbegin(); it != out.work.rend(); ++it) {
            if (it->start_s + it->duration_s <= start) {
                rs.number = it->number;
                if (it->peak_hr && rs.avg_hr) {
                    rs.hr_recovery_bpm = *it->peak_hr - *rs.avg_hr;
                }
                break;
            }
        }
        out.rest.push_back(rs);
        out.total_rest_s += rs.duration_s;
    }

    // ── Step 4: summary ──────────────────────────────────────────────────────
    if (out.total_rest_s > 0.0) {
        out.work_to_rest_ratio = out.total_work_s / out.total_rest_s;
    }
    std::vector<double> durations, speeds, recoveries;
    for (const auto& w : out.work) {
        durations.push_back(w.duration_s);
        speeds.push_back(w.avg_speed_mps);
    }
    for (const auto& r : out.rest) {
        if (r.hr_recovery_bpm) recoveries.push_back(*r.hr_recovery_bpm);
    }
    out.work_duration_cv    = stats::cv_percent(durations, true);
    out.work_speed_cv       = stats::cv_percent(speeds, true);
    out.avg_hr_recovery_bpm = stats::mean(recoveries);
    out.consistency         = consistency(out.work_duration_cv, out.work_speed_cv);

    return Result::of(std::move(out));
}

}  // namespace tsig::intervals
