/// @file src/metrics/efficiency.cpp
/// @brief Rolling speed-to-heart-rate efficiency.

#include "tsig/metrics.hpp"
#include "../core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace tsig::metrics {

Nullable<EfficiencyAnalysis>
MetricsCalculator::efficiency(const std::optional<preprocess::PreparedStreams>& streams,
                              const Thresholds& th) noexcept {
    using Result = Nullable<EfficiencyAnalysis>;

    if (!streams) {
        return Result::missing(DataGap::NoStreams);
    }
    if (!streams->has_data(Channel::Velocity)) {
        return Result::missing(DataGap::NoVelocity);
    }
    if (!streams->has_data(Channel::HeartRate)) {
        return Result::missing(DataGap::NoHeartRate);
    }

    const auto&       t  = streams->time;
    const auto&       v  = streams->velocity;
    const auto&       hr = streams->heart_rate;
    const std::size_t n  = t.size();

    // ── Density and span ─────────────────────────────────────────────────────
    std::size_t paired = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if (v[i] && hr[i]) ++paired;
    }
    const double density = n ? static_cast<double>(paired) / static_cast<double>(n) : 0.0;
    if (density < th.efficiency_min_paired || streams->span_s() < th.efficiency_window_s) {
        return Result::missing(DataGap::InsufficientSamples);
    }

    // ── Per-sample efficiency (moving samples only), m/min per bpm ───────────
    std::vector<std::optional<double>> eff(n);
    std::vector<double> valid;
    valid.reserve(paired);
    for (std::size_t i = 0; i < n; ++i) {
        if (v[i] && hr[i] && *v[i] >= th.stop_velocity_epsilon && *hr[i] > 0.0) {
            eff[i] = *v[i] * 60.0 / *hr[i];
            valid.push_back(*eff[i]);
        }
    }
    const auto average = stats::mean(valid);
    if (!average) {
        return Result::missing(DataGap::InsufficientSamples);
    }

    // ── Rolling window ───────────────────────────────────────────────────────
    EfficiencyAnalysis out;
    out.average = *average;

    double      sum     = 0.0;
    std::size_t count   = 0;
    std::size_t lo      = 0;
    bool        sampled = false;
    double      next_t  = 0.0;
    bool        any_window = false;

    for (std::size_t j = 0; j < n; ++j) {
        if (eff[j]) {
            sum += *eff[j];
            ++count;
        }
        while (lo < j && t[lo] < t[j] - th.efficiency_window_s) {
            if (eff[lo]) {
                sum -= *eff[lo];
                --count;
            }
            ++lo;
        }
        if (t[j] - t[0] < th.efficiency_window_s || count == 0) {
            continue;
        }
        const double value = sum / static_cast<double>(count);
        out.best_sustained = any_window ? std::max(out.best_sustained, value) : value;
        any_window = true;
        if (!sampled || t[j] >= next_t) {
            out.curve.push_back(EfficiencyPoint{.t_s = t[j], .value = value});
            next_t  = t[j] + th.efficiency_curve_step_s;
            sampled = true;
        }
    }

    if (!any_window) {
        return Result::missing(DataGap::InsufficientSamples);
    }
    return Result::of(std::move(out));
}

}  // namespace tsig::metrics
