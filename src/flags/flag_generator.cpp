/// @file src/flags/flag_generator.cpp
/// @brief FlagGenerator checks, table and stream quality counters.

#include "tsig/flags.hpp"
#include "../core/stats.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace tsig::flags {

bool FlagReport::has(Flag f) const noexcept {
    return std::find(raised.begin(), raised.end(), f) != raised.end();
}

// ─── Checks ───────────────────────────────────────────────────────────────────

namespace checks {

std::optional<bool>
hr_low_confidence(const FlagContext& ctx, const Thresholds& th, double widen) noexcept {
    if (!ctx.hr_quality) {
        return std::nullopt;
    }
    const HrQuality&  q     = *ctx.hr_quality;
    const std::size_t total = q.samples + q.excluded;
    if (total < th.hr_quality_min_samples) {
        return std::nullopt;
    }
    const double excluded_frac = static_cast<double>(q.excluded) / static_cast<double>(total);
    const double jump_frac = q.samples
        ? static_cast<double>(q.jumps) / static_cast<double>(q.samples)
        : 0.0;
    return jump_frac > th.hr_jump_fraction * widen ||
           excluded_frac > th.hr_excluded_fraction * widen ||
           q.longest_flat_s >= th.hr_flatline_s * widen;
}

std::optional<bool>
gps_low_confidence(const FlagContext& ctx, const Thresholds& th, double widen) noexcept {
    if (!ctx.gps_quality || ctx.gps_quality->samples < th.min_velocity_samples) {
        return std::nullopt;
    }
    const double frac = static_cast<double>(ctx.gps_quality->spikes) /
                        static_cast<double>(ctx.gps_quality->samples);
    return frac > th.gps_spike_fraction * widen;
}

std::optional<bool>
intensity_too_high_for_easy(const FlagContext& ctx, const Thresholds& th, double) noexcept {
    auto is_easy = [](ActivityClass c) {
        return c == ActivityClass::Easy || c == ActivityClass::Recovery;
    };
    const bool easy = is_easy(ctx.activity_class) || (ctx.user_intent && is_easy(*ctx.user_intent));
    if (!easy) {
        return false;
    }
    if (!ctx.zones || !(ctx.zones->below_z1_minutes + ctx.zones->total() > 0.0)) {
        return std::nullopt;
    }
    return ctx.zones->share_at_or_above(3) >= th.easy_high_zone_share;
}

std::optional<bool>
pace_unstable(const FlagContext& ctx, const Thresholds& th, double widen) noexcept {
    const bool tempo = ctx.activity_class == ActivityClass::Tempo ||
                       (ctx.user_intent && *ctx.user_intent == ActivityClass::Tempo);
    if (!tempo) {
        return false;
    }
    if (!ctx.pace_cv) {
        return std::nullopt;
    }
    return *ctx.pace_cv > th.pace_unstable_cv * widen;
}

std::optional<bool>
fatigue_possible(const FlagContext& ctx, const Thresholds& th, double widen) noexcept {
    bool evaluated = false;
    bool raised    = false;

    if (ctx.hr_drift) {
        evaluated = true;
        raised = raised || *ctx.hr_drift > th.fatigue_drift_pct * widen;
    }

    const auto& b = ctx.baseline;
    if (b && !b->is_thin() && b->effort_mean && b->effort_stddev && *b->effort_stddev > 0.0) {
        evaluated = true;
        const double z = (ctx.effort_score - *b->effort_mean) / *b->effort_stddev;
        raised = raised || z > th.fatigue_effort_z * widen;
    }

    if (!evaluated) {
        return std::nullopt;
    }
    return raised;
}

std::optional<bool>
load_spike(const FlagContext& ctx, const Thresholds& th, double) noexcept {
    const auto ratio = ctx.baseline ? ctx.baseline->weekly_load_ratio() : std::nullopt;
    if (!ratio) {
        return std::nullopt;
    }
    return *ratio > th.load_spike_ratio;
}

std::optional<bool>
pain_reported(const FlagContext& ctx, const Thresholds& th, double) noexcept {
    if (!ctx.check_in || !ctx.check_in->pain_score) {
        return std::nullopt;
    }
    return *ctx.check_in->pain_score >= th.pain_reported_min;
}

std::optional<bool>
pain_severe(const FlagContext& ctx, const Thresholds& th, double) noexcept {
    if (!ctx.check_in || !ctx.check_in->pain_score) {
        return std::nullopt;
    }
    return *ctx.check_in->pain_score >= th.pain_severe_min;
}

std::optional<bool>
illness_or_extreme_fatigue(const FlagContext& ctx, const Thresholds& th, double) noexcept {
    if (!ctx.check_in) {
        return std::nullopt;
    }
    const CheckIn& c = *ctx.check_in;
    const bool combination = c.rpe && c.sleep_quality && c.pain_score &&
                             *c.rpe >= th.illness_rpe_min &&
                             *c.sleep_quality <= th.illness_sleep_max &&
                             *c.pain_score >= th.illness_pain_min;
    return c.illness || c.extreme_fatigue || combination;
}

}  // namespace checks

// ─── Table ────────────────────────────────────────────────────────────────────

namespace {

const std::array<FlagRule, 9> FLAG_TABLE = {{
    {Flag::DataLowConfidenceHr,     &checks::hr_low_confidence,          true},
    {Flag::GpsLowConfidence,        &checks::gps_low_confidence,         true},
    {Flag::IntensityTooHighForEasy, &checks::intensity_too_high_for_easy, false},
    {Flag::PaceUnstable,            &checks::pace_unstable,              true},
    {Flag::FatiguePossible,         &checks::fatigue_possible,           true},
    {Flag::LoadSpike,               &checks::load_spike,                 false},
    {Flag::PainReported,            &checks::pain_reported,              false},
    {Flag::PainSevere,              &checks::pain_severe,                false},
    {Flag::IllnessOrExtremeFatigue, &checks::illness_or_extreme_fatigue, false},
}};

}  // namespace

std::span<const FlagRule> FlagGenerator::table() noexcept {
    return FLAG_TABLE;
}

FlagReport FlagGenerator::evaluate(const FlagContext& ctx, const Thresholds& th) {
    const double widen =
        ctx.preliminary == Confidence::Low ? th.low_confidence_widening : 1.0;

    FlagReport report;
    for (const FlagRule& rule : FLAG_TABLE) {
        const auto result = rule.check(ctx, th, rule.widened ? widen : 1.0);
        if (!result) {
            report.not_evaluated.push_back(rule.flag);
        } else if (*result) {
            report.raised.push_back(rule.flag);
        }
    }
    return report;
}

// ─── Stream quality counters ──────────────────────────────────────────────────

std::optional<HrQuality>
FlagGenerator::hr_quality(const preprocess::PreparedStreams& streams,
                          const Thresholds& th) noexcept {
    const auto& t  = streams.time;
    const auto& hr = streams.heart_rate;
    if (hr.size() != t.size() || (hr.empty() && streams.hr_excluded == 0)) {
        return std::nullopt;
    }

    HrQuality q;
    q.excluded = streams.hr_excluded;

    std::optional<std::size_t> prev;
    std::size_t flat_start = 0;
    for (std::size_t i = 0; i < hr.size(); ++i) {
        if (!hr[i]) {
            continue;
        }
        ++q.samples;
        if (prev) {
            const double dt = t[i] - t[*prev];
            if (dt <= th.hr_jump_max_dt_s && std::abs(*hr[i] - *hr[*prev]) > th.hr_jump_bpm) {
                ++q.jumps;
            }
            if (*hr[i] != *hr[*prev] || dt > th.max_sample_gap_s) {
                flat_start = i;
            }
            q.longest_flat_s = std::max(q.longest_flat_s, t[i] - t[flat_start]);
        } else {
            flat_start = i;
        }
        prev = i;
    }
    return q;
}

std::optional<GpsQuality>
FlagGenerator::gps_quality(const preprocess::PreparedStreams& streams,
                           const Thresholds& th) noexcept {
    const auto v = stats::present(streams.velocity);
    if (v.empty()) {
        return std::nullopt;
    }

    GpsQuality q;
    q.samples = v.size();
    const std::size_t half = th.gps_median_window / 2;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const std::size_t lo = i >= half ? i - half : 0;
        const std::size_t hi = std::min(v.size(), i + half + 1);
        const auto med = stats::median(std::vector<double>(v.begin() + static_cast<std::ptrdiff_t>(lo),
                                                           v.begin() + static_cast<std::ptrdiff_t>(hi)));
        if (!med || *med < th.stop_velocity_epsilon) {
            continue;
        }
        if (v[i] > *med * th.gps_spike_ratio && v[i] - *med > th.gps_spike_min_delta) {
            ++q.spikes;
        }
    }
    return q;
}

}  // namespace tsig::flags
