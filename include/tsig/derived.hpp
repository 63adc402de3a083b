#pragma once

/// @file include/tsig/derived.hpp
/// @brief Output value types: splits, per-metric results and DerivedMetrics.
///
/// # Module: Derived Metrics
///
/// ## Responsibility
/// Define the single output record of one evaluation and every component
/// value it carries.
///
/// ## Guarantees
/// - Every optional metric is a `Nullable<T>`: a value or a `DataGap` reason
/// - All types are regular values with defaulted equality
/// - `DerivedMetrics::to_string()` is deterministic (fixed field order,
///   fixed precision), so equal records always format identically

#include "tsig/errors.hpp"
#include "tsig/types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tsig {

// ─── Split ────────────────────────────────────────────────────────────────────

enum class SplitKind {
    Distance,  ///< Fixed-distance split from a reliable distance stream
    Time,      ///< Fixed-time split from the stream time index
    Summary,   ///< Summary-only split; carries summary averages only
};

[[nodiscard]] const char* to_string(SplitKind k) noexcept;

/// One ordered aggregate segment of an activity.
struct Split {
    std::size_t           index      = 0;  ///< 1-based
    SplitKind             kind       = SplitKind::Time;
    double                start_s    = 0.0;
    double                end_s      = 0.0;
    double                duration_s = 0.0;
    std::optional<double> distance_m;
    std::optional<double> avg_speed_mps;
    std::optional<double> pace_s_per_km;
    std::optional<double> avg_hr;
    std::optional<double> avg_cadence;
    std::optional<double> avg_grade;
    std::optional<double> avg_power;
    std::optional<double> elevation_gain_m;

    bool operator==(const Split&) const = default;
};

// ─── StopsAnalysis ────────────────────────────────────────────────────────────

/// One detected stop window.
struct Stop {
    double                start_s    = 0.0;
    double                duration_s = 0.0;
    std::optional<double> distance_m;   ///< Cumulative distance at stop start
    std::optional<double> latitude;
    std::optional<double> longitude;

    bool operator==(const Stop&) const = default;
};

struct StopsAnalysis {
    double            total_stopped_s = 0.0;
    std::size_t       stop_count      = 0;
    double            longest_stop_s  = 0.0;
    std::vector<Stop> stops;

    bool operator==(const StopsAnalysis&) const = default;
};

// ─── ZoneMinutes ──────────────────────────────────────────────────────────────

enum class ZoneSource {
    Samples,  ///< Bucketed from the heart-rate stream
    Splits,   ///< Approximated from per-split average heart rate
    Summary,  ///< Approximated from the summary average heart rate
};

[[nodiscard]] const char* to_string(ZoneSource s) noexcept;

/// Minutes per heart-rate zone Z1..Z5 plus time below Z1.
struct ZoneMinutes {
    std::array<double, 5> minutes{};  ///< minutes[0] = Z1 … minutes[4] = Z5
    double                below_z1_minutes = 0.0;
    ZoneSource            source = ZoneSource::Samples;

    /// Minutes in Z1..Z5 (excludes time below Z1).
    [[nodiscard]] double total() const noexcept;

    /// Share of all heart-rate time (below Z1 included) spent at or above
    /// `zone` (1-based). 0 if empty.
    [[nodiscard]] double share_at_or_above(int zone) const noexcept;

    bool operator==(const ZoneMinutes&) const = default;
};

// ─── EfficiencyAnalysis ───────────────────────────────────────────────────────

struct EfficiencyPoint {
    double t_s   = 0.0;  ///< Window end time
    double value = 0.0;  ///< m/min per bpm

    bool operator==(const EfficiencyPoint&) const = default;
};

/// Speed-to-heart-rate efficiency (metres per minute per beat).
struct EfficiencyAnalysis {
    double                       average        = 0.0;
    double                       best_sustained = 0.0;
    std::vector<EfficiencyPoint> curve;

    bool operator==(const EfficiencyAnalysis&) const = default;
};

// ─── IntervalStructure ────────────────────────────────────────────────────────

struct WorkSegment {
    std::size_t           number     = 0;  ///< 1-based rep number
    double                start_s    = 0.0;
    double                duration_s = 0.0;
    std::optional<double> distance_m;
    double                avg_speed_mps = 0.0;
    std::optional<double> avg_hr;
    std::optional<double> peak_hr;

    bool operator==(const WorkSegment&) const = default;
};

struct RestSegment {
    std::size_t           number     = 0;  ///< Rest after rep `number`
    double                start_s    = 0.0;
    double                duration_s = 0.0;
    std::optional<double> avg_hr;
    std::optional<double> hr_recovery_bpm;  ///< Peak HR of the previous rep − avg HR of the rest

    bool operator==(const RestSegment&) const = default;
};

enum class RepConsistency {
    High,
    Medium,
    Low,
    Unknown,  ///< Fewer than two reps with a usable CV
};

[[nodiscard]] const char* to_string(RepConsistency c) noexcept;

/// Work/rest structure of an interval session.
struct IntervalStructure {
    std::vector<WorkSegment> work;
    std::vector<RestSegment> rest;
    std::optional<double>    warmup_s;
    std::optional<double>    cooldown_s;
    double                   total_work_s = 0.0;
    double                   total_rest_s = 0.0;
    std::optional<double>    work_to_rest_ratio;
    std::optional<double>    work_duration_cv;   ///< %
    std::optional<double>    work_speed_cv;      ///< %
    std::optional<double>    avg_hr_recovery_bpm;
    RepConsistency           consistency = RepConsistency::Unknown;

    [[nodiscard]] std::size_t rep_count() const noexcept { return work.size(); }

    bool operator==(const IntervalStructure&) const = default;
};

// ─── Flag ─────────────────────────────────────────────────────────────────────

enum class Flag {
    DataLowConfidenceHr,
    GpsLowConfidence,
    IntensityTooHighForEasy,
    PaceUnstable,
    FatiguePossible,
    LoadSpike,
    PainReported,
    PainSevere,
    IllnessOrExtremeFatigue,
};

/// Stable snake_case flag name ("pain_severe", ...).
[[nodiscard]] const char* to_string(Flag f) noexcept;

// ─── RiskAssessment ───────────────────────────────────────────────────────────

enum class RiskLevel {
    Green,
    Amber,
    Red,
};

[[nodiscard]] const char* to_string(RiskLevel l) noexcept;

struct RiskAssessment {
    RiskLevel                level = RiskLevel::Green;
    int                      score = 0;
    std::vector<std::string> reasons;  ///< "load_spike (+3)", ...

    bool operator==(const RiskAssessment&) const = default;
};

// ─── MetricWarning ────────────────────────────────────────────────────────────

/// A non-fatal data gap recorded against one named metric.
struct MetricWarning {
    std::string metric;
    DataGap     gap = DataGap::NotApplicable;

    bool operator==(const MetricWarning&) const = default;
};

// ─── DerivedMetrics ───────────────────────────────────────────────────────────

/// The engine's sole output for one activity.
struct DerivedMetrics {
    ActivityClass activity_class = ActivityClass::Unknown;
    std::string   classification_rule;  ///< Name of the rule that matched
    double        effort_score = 0.0;

    Nullable<double>             pace_variability    = Nullable<double>::missing(DataGap::NotApplicable);
    Nullable<double>             hr_drift            = Nullable<double>::missing(DataGap::NotApplicable);
    Nullable<ZoneMinutes>        time_in_zones       = Nullable<ZoneMinutes>::missing(DataGap::NotApplicable);
    Nullable<EfficiencyAnalysis> efficiency_analysis = Nullable<EfficiencyAnalysis>::missing(DataGap::NotApplicable);
    Nullable<StopsAnalysis>      stops_analysis      = Nullable<StopsAnalysis>::missing(DataGap::NotApplicable);
    Nullable<IntervalStructure>  interval_structure  = Nullable<IntervalStructure>::missing(DataGap::NotApplicable);

    std::vector<Split> splits;

    std::vector<Flag> flags;                ///< Raised, in evaluation order
    std::vector<Flag> flags_not_evaluated;  ///< Required inputs were missing

    Confidence               confidence = Confidence::Low;
    std::vector<std::string> confidence_reasons;
    std::vector<MetricWarning> warnings;

    RiskAssessment risk;

    /// True if `f` was raised.
    [[nodiscard]] bool has_flag(Flag f) const noexcept;

    /// Human-readable multi-line report.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const DerivedMetrics&) const = default;
};

}  // namespace tsig
