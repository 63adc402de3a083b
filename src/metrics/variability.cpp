/// @file src/metrics/variability.cpp
/// @brief Pace, heart-rate and grade variability.

#include "tsig/metrics.hpp"
#include "../core/stats.hpp"

#include <vector>

namespace tsig::metrics {

namespace {

constexpr std::size_t MIN_SPLITS_FOR_PACE_CV  = 2;
constexpr std::size_t MIN_SPLITS_FOR_GRADE_SD = 3;

}  // namespace

Nullable<double>
MetricsCalculator::pace_variability(std::span<const Split> splits,
                                    const std::optional<preprocess::PreparedStreams>& streams,
                                    const Thresholds& th) noexcept {
    // ── Per-split pace (stream-derived splits only) ──────────────────────────
    std::vector<double> paces;
    for (const Split& s : splits) {
        if (s.kind != SplitKind::Summary && s.pace_s_per_km) {
            paces.push_back(*s.pace_s_per_km);
        }
    }
    if (paces.size() >= MIN_SPLITS_FOR_PACE_CV) {
        if (const auto cv = stats::cv_percent(paces)) {
            return Nullable<double>::of(*cv);
        }
    }

    // ── Fallback: moving velocity samples ────────────────────────────────────
    if (!streams) {
        return Nullable<double>::missing(DataGap::NoStreams);
    }
    if (!streams->has_data(Channel::Velocity)) {
        return Nullable<double>::missing(DataGap::NoVelocity);
    }
    std::vector<double> moving;
    for (const double v : stats::present(streams->velocity)) {
        if (v >= th.stop_velocity_epsilon) {
            moving.push_back(v);
        }
    }
    if (const auto cv = stats::cv_percent(moving, false, th.min_velocity_samples)) {
        return Nullable<double>::of(*cv);
    }
    return Nullable<double>::missing(DataGap::InsufficientSamples);
}

Nullable<double>
MetricsCalculator::heart_rate_variability(const std::optional<preprocess::PreparedStreams>& streams,
                                          const Thresholds& th) noexcept {
    if (!streams) {
        return Nullable<double>::missing(DataGap::NoStreams);
    }
    if (!streams->has_data(Channel::HeartRate)) {
        return Nullable<double>::missing(DataGap::NoHeartRate);
    }
    const auto hr = stats::present(streams->heart_rate);
    if (const auto cv = stats::cv_percent(hr, false, th.hr_quality_min_samples)) {
        return Nullable<double>::of(*cv);
    }
    return Nullable<double>::missing(DataGap::InsufficientSamples);
}

Nullable<double>
MetricsCalculator::grade_variability(std::span<const Split> splits,
                                     const std::optional<preprocess::PreparedStreams>& streams,
                                     const Thresholds& th) noexcept {
    if (!streams) {
        return Nullable<double>::missing(DataGap::NoStreams);
    }
    const auto grade = stats::present(streams->grade);
    if (grade.size() >= th.min_velocity_samples) {
        if (const auto sd = stats::stddev(grade)) {
            return Nullable<double>::of(*sd);
        }
    }

    std::vector<double> split_grades;
    for (const Split& s : splits) {
        if (s.kind != SplitKind::Summary && s.avg_grade) {
            split_grades.push_back(*s.avg_grade);
        }
    }
    if (split_grades.size() >= MIN_SPLITS_FOR_GRADE_SD) {
        if (const auto sd = stats::stddev(split_grades)) {
            return Nullable<double>::of(*sd);
        }
    }
    return Nullable<double>::missing(DataGap::NoGrade);
}

}  // namespace tsig::metrics
