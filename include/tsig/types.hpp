#pragma once

/// @file include/tsig/types.hpp
/// @brief Shared input value types for the tsig analysis engine.
///
/// Everything the caller hands to the engine is defined here: the activity
/// summary, the athlete's check-in and profile, and the history baseline.
/// Outputs live in derived.hpp; sensor streams in streams.hpp.

#include "tsig/constants.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tsig {

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Sport type as reported by the recording platform.
enum class SportType {
    Run,
    TrailRun,
    VirtualRun,
    Ride,
    VirtualRide,
    Walk,
    Hike,
    Swim,
    Workout,
    Other,
};

/// True for the running family (cadence normalization applies).
[[nodiscard]] bool is_running(SportType t) noexcept;

[[nodiscard]] const char* to_string(SportType t) noexcept;

/// Parse a platform sport-type string ("Run", "TrailRun", "Ride", ...).
/// Unrecognised strings map to SportType::Other.
[[nodiscard]] SportType parse_sport_type(std::string_view s) noexcept;

/// Training class of an activity.
enum class ActivityClass {
    Intervals,
    Tempo,
    Long,
    Hills,
    Easy,
    Recovery,
    Steady,   ///< Conservative landing class for borderline tempo efforts
    Race,     ///< Only ever set by an explicit external declaration
    Unknown,
};

[[nodiscard]] const char* to_string(ActivityClass c) noexcept;

/// Parse a class or user-intent label ("Easy Run", "tempo", "Long Run", ...).
[[nodiscard]] std::optional<ActivityClass> parse_activity_class(std::string_view s) noexcept;

/// Overall reliability of one evaluation.
enum class Confidence {
    Low,
    Medium,
    High,
};

[[nodiscard]] const char* to_string(Confidence c) noexcept;

enum class ExperienceLevel {
    New,
    Intermediate,
    Advanced,
};

// ─── ActivitySummary ──────────────────────────────────────────────────────────

/// Summary fields of one activity. Required input.
///
/// `moving_time_s` must be finite and strictly positive; everything else is
/// either defaulted to a neutral zero (distance, elevation) or nullable.
struct ActivitySummary {
    SportType             type             = SportType::Run;
    double                distance_m       = 0.0;
    double                moving_time_s    = 0.0;
    double                elapsed_time_s   = 0.0;
    double                elevation_gain_m = 0.0;
    std::optional<double> avg_hr;
    std::optional<double> max_hr;
    std::optional<double> avg_cadence;
    std::optional<double> avg_speed_mps;
    double                start_time       = 0.0;  ///< Unix epoch seconds
    std::optional<ActivityClass> user_intent;       ///< Class the athlete tagged

    bool operator==(const ActivitySummary&) const = default;
};

// ─── CheckIn ──────────────────────────────────────────────────────────────────

/// Post-activity self report. Every field is optional.
struct CheckIn {
    std::optional<int>         rpe;            ///< 1–10
    std::optional<int>         pain_score;     ///< 0–10
    std::optional<std::string> pain_location;
    std::optional<int>         sleep_quality;  ///< 1–5
    bool                       illness         = false;
    bool                       extreme_fatigue = false;

    bool operator==(const CheckIn&) const = default;
};

// ─── UserProfile ──────────────────────────────────────────────────────────────

struct UserProfile {
    std::optional<double> max_hr;  ///< bpm; Thresholds::default_max_hr when absent
    ExperienceLevel       experience = ExperienceLevel::Intermediate;
    std::string           goal;

    bool operator==(const UserProfile&) const = default;
};

// ─── HistoryBaseline ──────────────────────────────────────────────────────────

/// Rolling historical statistics for one athlete, supplied by the caller.
///
/// Immutable once built (see baseline.hpp for the aggregator). Every
/// statistic is nullable: a baseline built from a handful of activities
/// simply has fewer fields.
struct HistoryBaseline {
    std::size_t           sample_count = 0;        ///< Activities in the 28-day window
    std::optional<double> duration_p50_s;
    std::optional<double> duration_p80_s;
    std::optional<double> distance_p50_m;
    std::optional<double> distance_p80_m;
    std::optional<double> distance_7d_m;
    std::optional<double> distance_28d_m;
    std::optional<double> moving_time_7d_s;
    std::optional<double> moving_time_28d_s;
    std::optional<double> effort_mean;
    std::optional<double> effort_stddev;
    std::optional<double> threshold_pace_s_per_km;  ///< Fastest-20% pace
    std::optional<int>    hard_sessions_7d;
    std::optional<double> days_since_last_hard;

    /// True when too few activities back the statistics.
    [[nodiscard]] bool is_thin() const noexcept {
        return sample_count < constants::MIN_BASELINE_ACTIVITIES;
    }

    /// 7-day distance over the 28-day weekly average (28-day / 4).
    /// `nullopt` if either window is missing or the 28-day load is zero.
    [[nodiscard]] std::optional<double> weekly_load_ratio() const noexcept;

    bool operator==(const HistoryBaseline&) const = default;
};

}  // namespace tsig
