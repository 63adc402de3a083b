#pragma once

#include <array>
#include <cstddef>

/// @file include/tsig/constants.hpp
/// @brief Named thresholds for the tsig analysis engine.
///
/// Every heuristic in the engine reads its threshold from here (through
/// `Thresholds` in engine.hpp). Values are fixed per engine instance and
/// are never tuned per activity.

namespace tsig::constants {

// ─── Physiology ───────────────────────────────────────────────────────────────

/// Max heart rate assumed when the user profile does not provide one.
static constexpr double DEFAULT_MAX_HR = 190.0;

/// Accepted range for a user-supplied max heart rate.
static constexpr double PROFILE_MAX_HR_MIN = 100.0;
static constexpr double PROFILE_MAX_HR_MAX = 240.0;

/// Heart-rate samples outside [MIN, MAX] bpm are excluded, not corrected.
static constexpr double HR_PLAUSIBLE_MIN = 30.0;
static constexpr double HR_PLAUSIBLE_MAX = 230.0;

/// Lower bound of each zone as a fraction of max HR (Z1..Z5).
static constexpr std::array<double, 5> ZONE_LOWER_BOUNDS = {0.5, 0.6, 0.7, 0.8, 0.9};

/// Impulse weight per zone (Z1..Z5). Strictly increasing.
static constexpr std::array<double, 5> ZONE_WEIGHTS = {1.0, 2.0, 3.0, 4.0, 5.0};

/// Moving time above this (seconds, one week) is structurally implausible.
static constexpr double MAX_MOVING_TIME_S = 7.0 * 86400.0;

// ─── Cadence ──────────────────────────────────────────────────────────────────

/// Running cadence below this (spm) is taken to be per-leg and doubled.
static constexpr double RUN_CADENCE_DOUBLING_THRESHOLD = 100.0;

/// Cadence samples above this (spm or rpm) are sensor spikes and excluded.
static constexpr double CADENCE_PLAUSIBLE_MAX = 220.0;

// ─── Stream preprocessing ─────────────────────────────────────────────────────

/// Per-sample time delta cap when integrating time (seconds). Larger gaps
/// are recording pauses and only contribute this much.
static constexpr double MAX_SAMPLE_GAP_S = 10.0;

/// Below this velocity (m/s) the athlete is considered stopped.
static constexpr double STOP_VELOCITY_EPSILON = 0.3;

/// Minimum duration (s) of a stop window.
static constexpr double STOP_MIN_DURATION_S = 10.0;

/// Stop windows separated by at most this gap (s) are merged.
static constexpr double STOP_MERGE_GAP_S = 5.0;

// ─── Splits ───────────────────────────────────────────────────────────────────

static constexpr double SPLIT_DISTANCE_M = 1000.0;
static constexpr double SPLIT_TIME_S     = 300.0;

/// A trailing split shorter than this fraction of nominal size is merged
/// into the previous split.
static constexpr double SPLIT_TAIL_MERGE_FRACTION = 0.2;

/// Fraction of non-null samples a distance stream needs to drive splits.
static constexpr double RELIABLE_DISTANCE_COVERAGE = 0.95;

// ─── Metrics ──────────────────────────────────────────────────────────────────

/// Minimum moving velocity samples for a stream-level pace CV.
static constexpr std::size_t MIN_VELOCITY_SAMPLES = 60;

/// Steady-state segment: block-speed CV ceiling (%) and minimum length.
static constexpr double STEADY_STATE_CV_MAX       = 8.0;
static constexpr double STEADY_STATE_MIN_S        = 20.0 * 60.0;
static constexpr double STEADY_STATE_BLOCK_S      = 60.0;

/// Efficiency rolling window, curve sampling step and pairing density.
static constexpr double EFFICIENCY_WINDOW_S       = 180.0;
static constexpr double EFFICIENCY_CURVE_STEP_S  = 30.0;
static constexpr double EFFICIENCY_MIN_PAIRED    = 0.8;

/// Per-class effort multipliers used when no heart-rate data exists.
static constexpr double INTENSITY_EASY      = 1.0;
static constexpr double INTENSITY_RECOVERY  = 1.0;
static constexpr double INTENSITY_STEADY    = 1.0;
static constexpr double INTENSITY_TEMPO     = 2.0;
static constexpr double INTENSITY_INTERVALS = 2.5;
static constexpr double INTENSITY_RACE      = 3.0;
static constexpr double INTENSITY_HILLS     = 1.5;
static constexpr double INTENSITY_LONG      = 1.2;
static constexpr double INTENSITY_UNKNOWN   = 1.0;

// ─── Interval structure ───────────────────────────────────────────────────────

static constexpr double INTERVAL_SMOOTHING_S      = 30.0;
static constexpr double INTERVAL_MIN_WORK_S       = 30.0;
static constexpr double INTERVAL_MIN_REST_S       = 15.0;
static constexpr double INTERVAL_CLUSTER_SPLIT    = 1.3;  ///< fast mean ≥ 1.3 × slow mean
static constexpr double INTERVAL_WARMUP_MIN_S     = 120.0;

// ─── Classifier ───────────────────────────────────────────────────────────────

/// Pace CV (%) above which pacing is considered interval-like.
static constexpr double INTERVAL_PACE_CV    = 15.0;
/// Heart-rate CV (%) above which effort is considered interval-like.
static constexpr double INTERVAL_HR_CV      = 10.0;
/// Work reps needed for an interval verdict.
static constexpr std::size_t INTERVAL_MIN_REPS = 3;

/// Sustained zone ≥ 3 time for a tempo verdict.
static constexpr double TEMPO_MIN_S = 20.0 * 60.0;

/// Long run fallback when the baseline is thin.
static constexpr double LONG_RUN_FALLBACK_S = 75.0 * 60.0;

/// Hills: elevation gain per km and grade stddev (%).
static constexpr double HILLS_GAIN_PER_KM   = 15.0;
static constexpr double HILLS_GRADE_STDDEV  = 3.0;

/// Easy: pace CV ceiling (%), zone 1–2 share floor, RPE ceiling.
static constexpr double EASY_PACE_CV_MAX    = 10.0;
static constexpr double EASY_LOW_ZONE_SHARE = 0.7;
static constexpr int    EASY_RPE_MAX        = 3;

/// Recovery: short activity after high recent load.
static constexpr double RECOVERY_MAX_S      = 40.0 * 60.0;
static constexpr double RECOVERY_LOAD_RATIO = 1.2;

/// A predicate within this relative distance of its threshold is borderline.
static constexpr double BORDERLINE_MARGIN = 0.1;

// ─── Flags ────────────────────────────────────────────────────────────────────

/// HR quality: a jump larger than this (bpm) between samples ≤ 2 s apart.
static constexpr double HR_JUMP_BPM          = 25.0;
static constexpr double HR_JUMP_MAX_DT_S     = 2.0;
/// Fraction of jumps or excluded samples that marks the HR stream suspect.
static constexpr double HR_JUMP_FRACTION     = 0.02;
static constexpr double HR_EXCLUDED_FRACTION = 0.05;
/// Identical HR readings for at least this long form a flatline.
static constexpr double HR_FLATLINE_S        = 90.0;
static constexpr std::size_t HR_QUALITY_MIN_SAMPLES = 60;

/// GPS quality: velocity above SPIKE_RATIO × local median (and at least
/// SPIKE_MIN_DELTA above it) is a spike; SPIKE_FRACTION of them flags.
static constexpr std::size_t GPS_MEDIAN_WINDOW   = 15;
static constexpr double GPS_SPIKE_RATIO          = 2.0;
static constexpr double GPS_SPIKE_MIN_DELTA      = 2.0;
static constexpr double GPS_SPIKE_FRACTION       = 0.01;

/// Share of zone time above zone 2 that is too much for an easy run.
static constexpr double EASY_HIGH_ZONE_SHARE = 0.25;

/// Pace CV (%) above which a tempo effort is not held steadily.
static constexpr double PACE_UNSTABLE_CV = 15.0;

/// Fatigue: HR drift (%) or effort z-score.
static constexpr double FATIGUE_DRIFT_PCT  = 5.0;
static constexpr double FATIGUE_EFFORT_Z   = 2.0;

/// Load spike: 7-day load over the 28-day weekly average.
static constexpr double LOAD_SPIKE_RATIO = 1.5;

/// Check-in pain thresholds.
static constexpr int PAIN_REPORTED_MIN = 4;
static constexpr int PAIN_SEVERE_MIN   = 7;

/// Check-in combination that counts as an explicit extreme-fatigue signal.
static constexpr int ILLNESS_RPE_MIN   = 8;
static constexpr int ILLNESS_SLEEP_MAX = 2;
static constexpr int ILLNESS_PAIN_MIN  = 5;

/// Threshold multiplier applied to stream-derived flags under low confidence.
static constexpr double LOW_CONFIDENCE_WIDENING = 1.25;

// ─── Baseline ─────────────────────────────────────────────────────────────────

/// Entries in the 28-day window below which a baseline is thin.
static constexpr std::size_t MIN_BASELINE_ACTIVITIES = 6;

static constexpr double SECONDS_PER_DAY = 86400.0;

// ─── Risk ─────────────────────────────────────────────────────────────────────

static constexpr int RISK_AMBER_MIN = 2;
static constexpr int RISK_RED_MIN   = 4;

}  // namespace tsig::constants
