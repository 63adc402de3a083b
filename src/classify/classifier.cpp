/// @file src/classify/classifier.cpp
/// @brief Classifier rule table and predicates.

#include "tsig/classifier.hpp"

#include <algorithm>
#include <array>

namespace tsig::classify {

namespace {

Match all_of(Match a, Match b) noexcept { return std::min(a, b); }
Match any_of(Match a, Match b) noexcept { return std::max(a, b); }

Match yes_if(bool b) noexcept { return b ? Match::Yes : Match::No; }

}  // namespace

// ─── Threshold comparisons ────────────────────────────────────────────────────

namespace rules {

Match above(std::optional<double> value, double threshold, double margin) noexcept {
    if (!value) return Match::No;
    if (*value > threshold * (1.0 + margin)) return Match::Yes;
    if (*value > threshold) return Match::Borderline;
    return Match::No;
}

Match at_least(std::optional<double> value, double threshold, double margin) noexcept {
    if (!value) return Match::No;
    if (*value >= threshold * (1.0 + margin)) return Match::Yes;
    if (*value >= threshold) return Match::Borderline;
    return Match::No;
}

Match below(std::optional<double> value, double threshold, double margin) noexcept {
    if (!value) return Match::No;
    if (*value < threshold * (1.0 - margin)) return Match::Yes;
    if (*value < threshold) return Match::Borderline;
    return Match::No;
}

// ─── Rule predicates ──────────────────────────────────────────────────────────

Match intervals(const ClassificationContext& ctx, const Thresholds& th) noexcept {
    const Match variable = any_of(above(ctx.pace_cv, th.interval_pace_cv, th.borderline_margin),
                                  above(ctx.hr_cv, th.interval_hr_cv, th.borderline_margin));
    const Match reps = yes_if(ctx.interval_reps && *ctx.interval_reps >= th.interval_min_reps);
    return all_of(variable, reps);
}

Match tempo(const ClassificationContext& ctx, const Thresholds& th) noexcept {
    std::optional<double> zone3_plus_s;
    if (ctx.zones) {
        const auto& m = ctx.zones->minutes;
        zone3_plus_s = (m[2] + m[3] + m[4]) * 60.0;
    }
    const Match sustained =
        any_of(at_least(zone3_plus_s, th.tempo_min_s, th.borderline_margin),
               at_least(ctx.time_at_threshold_pace_s, th.tempo_min_s, th.borderline_margin));

    // Unknown pacing cannot confirm a steady effort on its own.
    const Match paced = ctx.pace_cv
        ? below(ctx.pace_cv, th.interval_pace_cv, th.borderline_margin)
        : Match::Borderline;
    return all_of(sustained, paced);
}

Match long_run(const ClassificationContext& ctx, const Thresholds& th) noexcept {
    const bool usable = ctx.baseline && !ctx.baseline->is_thin() && ctx.baseline->duration_p80_s;
    if (usable) {
        return at_least(ctx.moving_time_s, *ctx.baseline->duration_p80_s, th.borderline_margin);
    }
    return above(ctx.moving_time_s, th.long_run_fallback_s, th.borderline_margin);
}

Match hills(const ClassificationContext& ctx, const Thresholds& th) noexcept {
    if (!(ctx.distance_m > 0.0)) {
        return Match::No;
    }
    const double gain_per_km = ctx.elevation_gain_m / (ctx.distance_m / 1000.0);
    return all_of(above(gain_per_km, th.hills_gain_per_km, th.borderline_margin),
                  above(ctx.grade_stddev, th.hills_grade_stddev, th.borderline_margin));
}

Match easy(const ClassificationContext& ctx, const Thresholds& th) noexcept {
    std::optional<double> low_share;
    if (ctx.zones) {
        const auto&  m     = ctx.zones->minutes;
        const double low   = ctx.zones->below_z1_minutes + m[0] + m[1];
        const double total = ctx.zones->below_z1_minutes + ctx.zones->total();
        if (total > 0.0) {
            low_share = low / total;
        }
    }
    const Match steady_low =
        all_of(below(ctx.pace_cv, th.easy_pace_cv_max, th.borderline_margin),
               at_least(low_share, th.easy_low_zone_share, 0.0));
    const Match reported = yes_if(ctx.rpe && *ctx.rpe <= th.easy_rpe_max);
    return any_of(steady_low, reported);
}

Match recovery(const ClassificationContext& ctx, const Thresholds& th) noexcept {
    const Match short_session = yes_if(ctx.moving_time_s <= th.recovery_max_s);
    const auto  load_ratio = ctx.baseline ? ctx.baseline->weekly_load_ratio() : std::nullopt;
    return all_of(easy(ctx, th),
                  all_of(short_session, at_least(load_ratio, th.recovery_load_ratio, 0.0)));
}

}  // namespace rules

// ─── Classifier ───────────────────────────────────────────────────────────────

namespace {

const std::array<Rule, 6> RULE_TABLE = {{
    {"intervals", ActivityClass::Intervals, &rules::intervals, true,  ActivityClass::Unknown},
    {"tempo",     ActivityClass::Tempo,     &rules::tempo,     true,  ActivityClass::Steady},
    {"long",      ActivityClass::Long,      &rules::long_run,  false, std::nullopt},
    {"hills",     ActivityClass::Hills,     &rules::hills,     true,  std::nullopt},
    {"recovery",  ActivityClass::Recovery,  &rules::recovery,  false, std::nullopt},
    {"easy",      ActivityClass::Easy,      &rules::easy,      false, std::nullopt},
}};

}  // namespace

std::span<const Rule> Classifier::table() noexcept {
    return RULE_TABLE;
}

ClassificationResult
Classifier::classify(const ClassificationContext& ctx, const Thresholds& th) {
    if (ctx.race_declared) {
        return ClassificationResult{.activity_class = ActivityClass::Race, .rule = "race_declared"};
    }

    bool forced_low = false;
    for (const Rule& rule : RULE_TABLE) {
        const Match m = rule.predicate(ctx, th);
        if (m == Match::No) {
            continue;
        }
        const bool summary_only = rule.needs_streams && !ctx.has_streams;
        const bool shaky = m == Match::Borderline && ctx.preliminary == Confidence::Low;
        if (summary_only || shaky) {
            forced_low = true;
            if (rule.neighbour) {
                return ClassificationResult{
                    .activity_class        = *rule.neighbour,
                    .rule                  = rule.name,
                    .conservative_fallback = true,
                    .force_low_confidence  = true,
                };
            }
            continue;
        }
        return ClassificationResult{
            .activity_class       = rule.activity_class,
            .rule                 = rule.name,
            .force_low_confidence = forced_low,
        };
    }
    return ClassificationResult{.rule = "default", .force_low_confidence = forced_low};
}

}  // namespace tsig::classify
