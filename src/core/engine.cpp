/// @file src/core/engine.cpp
/// @brief Analysis Engine orchestration.

#include "tsig/engine.hpp"
#include "tsig/cadence.hpp"
#include "tsig/classifier.hpp"
#include "tsig/confidence.hpp"
#include "tsig/flags.hpp"
#include "tsig/intervals.hpp"
#include "tsig/metrics.hpp"
#include "tsig/preprocess.hpp"
#include "tsig/risk.hpp"
#include "tsig/splits.hpp"

#include <fmt/format.h>

#include <cmath>
#include <string>
#include <utility>

namespace tsig::core {

namespace {

void require(bool ok, const char* field, const std::string& detail) {
    if (!ok) {
        throw ValidationError(fmt::format("{}: {}", field, detail));
    }
}

void require_range(const std::optional<int>& v, int lo, int hi, const char* field) {
    if (v) {
        require(*v >= lo && *v <= hi, field,
                fmt::format("{} outside [{}, {}]", *v, lo, hi));
    }
}

void require_finite(const std::optional<double>& v, const char* field) {
    if (v) {
        require(std::isfinite(*v), field, "must be finite");
    }
}

template <typename T>
void note_gap(std::vector<MetricWarning>& out, const char* metric, const Nullable<T>& n) {
    if (!n) {
        out.push_back(MetricWarning{.metric = metric, .gap = n.gap()});
    }
}

}  // namespace

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

// ─── Engine::validate ─────────────────────────────────────────────────────────

void Engine::validate(const AnalysisRequest& request, const Thresholds& th) {
    const ActivitySummary& s = request.summary;

    require(std::isfinite(s.moving_time_s) && s.moving_time_s > 0.0, "moving_time_s",
            fmt::format("must be finite and > 0, got {}", s.moving_time_s));
    require(s.moving_time_s <= constants::MAX_MOVING_TIME_S, "moving_time_s",
            fmt::format("{} exceeds {} s", s.moving_time_s, constants::MAX_MOVING_TIME_S));
    require(std::isfinite(s.distance_m) && s.distance_m >= 0.0, "distance_m",
            fmt::format("must be finite and >= 0, got {}", s.distance_m));
    require(std::isfinite(s.elapsed_time_s) && s.elapsed_time_s >= 0.0, "elapsed_time_s",
            fmt::format("must be finite and >= 0, got {}", s.elapsed_time_s));
    require(std::isfinite(s.elevation_gain_m) && s.elevation_gain_m >= 0.0, "elevation_gain_m",
            fmt::format("must be finite and >= 0, got {}", s.elevation_gain_m));
    require_finite(s.avg_hr, "avg_hr");
    require_finite(s.max_hr, "max_hr");
    require_finite(s.avg_cadence, "avg_cadence");
    require_finite(s.avg_speed_mps, "avg_speed_mps");

    if (request.profile.max_hr) {
        const double m = *request.profile.max_hr;
        require(std::isfinite(m) && m >= constants::PROFILE_MAX_HR_MIN &&
                    m <= constants::PROFILE_MAX_HR_MAX,
                "profile.max_hr",
                fmt::format("{} outside [{}, {}]", m, constants::PROFILE_MAX_HR_MIN,
                            constants::PROFILE_MAX_HR_MAX));
    }
    require(th.default_max_hr > 0.0, "thresholds.default_max_hr", "must be > 0");

    if (request.check_in) {
        require_range(request.check_in->rpe, 1, 10, "check_in.rpe");
        require_range(request.check_in->pain_score, 0, 10, "check_in.pain_score");
        require_range(request.check_in->sleep_quality, 1, 5, "check_in.sleep_quality");
    }

    if (request.streams) {
        preprocess::StreamPreprocessor::validate(*request.streams);
    }
}

// ─── Engine::time_at_threshold_pace ──────────────────────────────────────────

std::optional<double>
Engine::time_at_threshold_pace(std::span<const Split> splits,
                               const std::optional<HistoryBaseline>& baseline) noexcept {
    if (!baseline || baseline->is_thin() || !baseline->threshold_pace_s_per_km) {
        return std::nullopt;
    }
    double total = 0.0;
    bool   any   = false;
    for (const Split& s : splits) {
        if (s.kind == SplitKind::Summary || !s.pace_s_per_km) {
            continue;
        }
        any = true;
        if (*s.pace_s_per_km <= *baseline->threshold_pace_s_per_km) {
            total += s.duration_s;
        }
    }
    if (!any) {
        return std::nullopt;
    }
    return total;
}

// ─── Engine::analyze ──────────────────────────────────────────────────────────

DerivedMetrics Engine::analyze(const AnalysisRequest& request) const {
    const Thresholds& th = config_.thresholds;
    validate(request, th);

    using metrics::MetricsCalculator;

    // ── Step 1: Normalize the summary and prepare streams ────────────────────
    ActivitySummary summary = request.summary;
    summary.avg_cadence = units::CadenceNormalizer::normalize(
        summary.avg_cadence, summary.type, th.run_cadence_doubling);

    std::optional<preprocess::PreparedStreams> streams;
    if (request.streams && !request.streams->empty()) {
        auto prepared = preprocess::StreamPreprocessor::prepare(*request.streams, summary.type, th);
        if (prepared.size() >= 2) {
            streams = std::move(prepared);
        }
    }
    if (config_.verbose) {
        if (streams) {
            fmt::print(stderr,
                       "[tsig] streams: {} samples, {} dropped, {} hr excluded, "
                       "{} cadence excluded, {} cadence dropouts{}{}\n",
                       streams->size(), streams->dropped_samples, streams->hr_excluded,
                       streams->cadence_excluded, streams->cadence_dropouts,
                       streams->velocity_derived ? ", velocity derived" : "",
                       streams->cadence_doubled ? ", cadence doubled" : "");
        } else {
            fmt::print(stderr, "[tsig] streams: none, summary-only evaluation\n");
        }
    }

    DerivedMetrics out;

    // ── Step 2: Splits and metrics ───────────────────────────────────────────
    out.splits = splits::SplitBuilder::build(streams, summary, th);

    const double max_hr = request.profile.max_hr.value_or(th.default_max_hr);
    out.time_in_zones       = MetricsCalculator::time_in_zones(streams, out.splits, summary, max_hr, th);
    out.pace_variability    = MetricsCalculator::pace_variability(out.splits, streams, th);
    out.hr_drift            = MetricsCalculator::hr_drift(streams, th);
    out.efficiency_analysis = MetricsCalculator::efficiency(streams, th);
    out.stops_analysis      = streams
        ? preprocess::StopDetector::detect(*streams, th)
        : Nullable<StopsAnalysis>::missing(DataGap::NoStreams);
    out.interval_structure  = intervals::IntervalDetector::detect(streams, th);

    const auto hr_var    = MetricsCalculator::heart_rate_variability(streams, th);
    const auto grade_var = MetricsCalculator::grade_variability(out.splits, streams, th);

    if (config_.verbose) {
        fmt::print(stderr, "[tsig] splits: {}  zones: {}  pace_cv: {}  drift: {}\n",
                   out.splits.size(),
                   out.time_in_zones ? to_string(out.time_in_zones->source)
                                     : to_string(out.time_in_zones.gap()),
                   out.pace_variability ? fmt::format("{:.2f}", *out.pace_variability)
                                        : std::string{to_string(out.pace_variability.gap())},
                   out.hr_drift ? fmt::format("{:.2f}", *out.hr_drift)
                                : std::string{to_string(out.hr_drift.gap())});
    }

    // ── Step 3: Preliminary confidence ───────────────────────────────────────
    const auto coverage = confidence::ConfidenceEstimator::coverage(
        streams, summary, request.baseline, request.check_in);
    const Confidence preliminary = confidence::ConfidenceEstimator::preliminary(coverage);

    // ── Step 4: Classification and effort ────────────────────────────────────
    classify::ClassificationContext cctx{
        .has_streams      = streams.has_value(),
        .moving_time_s    = summary.moving_time_s,
        .distance_m       = summary.distance_m,
        .elevation_gain_m = summary.elevation_gain_m,
        .pace_cv          = out.pace_variability.as_optional(),
        .hr_cv            = hr_var.as_optional(),
        .interval_reps    = out.interval_structure
                                ? std::optional<std::size_t>(out.interval_structure->rep_count())
                                : std::nullopt,
        .zones            = out.time_in_zones.as_optional(),
        .time_at_threshold_pace_s = time_at_threshold_pace(out.splits, request.baseline),
        .grade_stddev     = grade_var.as_optional(),
        .baseline         = request.baseline,
        .rpe              = request.check_in ? request.check_in->rpe : std::nullopt,
        .preliminary      = preliminary,
        .race_declared    = request.race_declared,
    };
    const auto classification = classify::Classifier::classify(cctx, th);
    out.activity_class      = classification.activity_class;
    out.classification_rule = classification.rule;
    out.effort_score = MetricsCalculator::effort_score(
        out.time_in_zones, summary.moving_time_s, out.activity_class, th);

    if (config_.verbose) {
        fmt::print(stderr, "[tsig] class: {} (rule {}{})  effort: {:.1f}  preliminary: {}\n",
                   to_string(out.activity_class), out.classification_rule,
                   classification.conservative_fallback ? ", conservative" : "",
                   out.effort_score, to_string(preliminary));
    }

    // ── Step 5: Flags ────────────────────────────────────────────────────────
    flags::FlagContext fctx{
        .hr_quality     = streams ? flags::FlagGenerator::hr_quality(*streams, th) : std::nullopt,
        .gps_quality    = streams ? flags::FlagGenerator::gps_quality(*streams, th) : std::nullopt,
        .activity_class = out.activity_class,
        .user_intent    = summary.user_intent,
        .zones          = out.time_in_zones.as_optional(),
        .pace_cv        = out.pace_variability.as_optional(),
        .hr_drift       = out.hr_drift.as_optional(),
        .effort_score   = out.effort_score,
        .baseline       = request.baseline,
        .check_in       = request.check_in,
        .preliminary    = preliminary,
    };
    auto report = flags::FlagGenerator::evaluate(fctx, th);
    out.flags               = std::move(report.raised);
    out.flags_not_evaluated = std::move(report.not_evaluated);

    // ── Step 6: Final confidence and risk ────────────────────────────────────
    auto assessment = confidence::ConfidenceEstimator::finalize(coverage, classification, out.flags);
    out.confidence         = assessment.level;
    out.confidence_reasons = std::move(assessment.reasons);
    out.risk = risk::RiskScorer::score(out.flags, request.check_in, request.baseline, th);

    // ── Step 7: Data-gap warnings ────────────────────────────────────────────
    note_gap(out.warnings, "time_in_zones", out.time_in_zones);
    note_gap(out.warnings, "pace_variability", out.pace_variability);
    note_gap(out.warnings, "hr_drift", out.hr_drift);
    note_gap(out.warnings, "efficiency_analysis", out.efficiency_analysis);
    note_gap(out.warnings, "stops_analysis", out.stops_analysis);
    note_gap(out.warnings, "interval_structure", out.interval_structure);
    if (out.splits.empty()) {
        out.warnings.push_back(MetricWarning{.metric = "splits", .gap = DataGap::NoSplits});
    }
    if (!request.baseline) {
        out.warnings.push_back(MetricWarning{.metric = "baseline", .gap = DataGap::NoBaseline});
    } else if (request.baseline->is_thin()) {
        out.warnings.push_back(MetricWarning{.metric = "baseline", .gap = DataGap::ThinBaseline});
    }
    if (!request.check_in) {
        out.warnings.push_back(MetricWarning{.metric = "check_in", .gap = DataGap::NoCheckIn});
    }

    if (config_.verbose) {
        fmt::print(stderr, "[tsig] flags: {} raised, {} not evaluated  confidence: {}  risk: {}\n",
                   out.flags.size(), out.flags_not_evaluated.size(),
                   to_string(out.confidence), to_string(out.risk.level));
    }
    return out;
}

}  // namespace tsig::core
