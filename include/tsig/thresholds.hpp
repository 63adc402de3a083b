#pragma once

/// @file include/tsig/thresholds.hpp
/// @brief Per-engine heuristic thresholds.
///
/// Every member defaults to its named constant in constants.hpp. An engine
/// instance carries one `Thresholds` value for its whole lifetime; nothing
/// in the pipeline adjusts a threshold for an individual activity except
/// the documented low-confidence widening of stream-derived flags.

#include "tsig/constants.hpp"

#include <array>
#include <cstddef>

namespace tsig {

struct Thresholds {
    // Physiology
    double default_max_hr   = constants::DEFAULT_MAX_HR;
    double hr_plausible_min = constants::HR_PLAUSIBLE_MIN;
    double hr_plausible_max = constants::HR_PLAUSIBLE_MAX;
    std::array<double, 5> zone_lower_bounds = constants::ZONE_LOWER_BOUNDS;
    std::array<double, 5> zone_weights      = constants::ZONE_WEIGHTS;

    // Cadence
    double run_cadence_doubling  = constants::RUN_CADENCE_DOUBLING_THRESHOLD;
    double cadence_plausible_max = constants::CADENCE_PLAUSIBLE_MAX;

    // Preprocessing
    double max_sample_gap_s      = constants::MAX_SAMPLE_GAP_S;
    double stop_velocity_epsilon = constants::STOP_VELOCITY_EPSILON;
    double stop_min_duration_s   = constants::STOP_MIN_DURATION_S;
    double stop_merge_gap_s      = constants::STOP_MERGE_GAP_S;

    // Splits
    double split_distance_m           = constants::SPLIT_DISTANCE_M;
    double split_time_s               = constants::SPLIT_TIME_S;
    double split_tail_merge_fraction  = constants::SPLIT_TAIL_MERGE_FRACTION;
    double reliable_distance_coverage = constants::RELIABLE_DISTANCE_COVERAGE;

    // Metrics
    std::size_t min_velocity_samples = constants::MIN_VELOCITY_SAMPLES;
    double steady_state_cv_max       = constants::STEADY_STATE_CV_MAX;
    double steady_state_min_s        = constants::STEADY_STATE_MIN_S;
    double steady_state_block_s      = constants::STEADY_STATE_BLOCK_S;
    double efficiency_window_s       = constants::EFFICIENCY_WINDOW_S;
    double efficiency_curve_step_s   = constants::EFFICIENCY_CURVE_STEP_S;
    double efficiency_min_paired     = constants::EFFICIENCY_MIN_PAIRED;

    // Interval structure
    double interval_smoothing_s   = constants::INTERVAL_SMOOTHING_S;
    double interval_min_work_s    = constants::INTERVAL_MIN_WORK_S;
    double interval_min_rest_s    = constants::INTERVAL_MIN_REST_S;
    double interval_cluster_split = constants::INTERVAL_CLUSTER_SPLIT;
    double interval_warmup_min_s  = constants::INTERVAL_WARMUP_MIN_S;

    // Classifier
    double      interval_pace_cv    = constants::INTERVAL_PACE_CV;
    double      interval_hr_cv      = constants::INTERVAL_HR_CV;
    std::size_t interval_min_reps   = constants::INTERVAL_MIN_REPS;
    double      tempo_min_s         = constants::TEMPO_MIN_S;
    double      long_run_fallback_s = constants::LONG_RUN_FALLBACK_S;
    double      hills_gain_per_km   = constants::HILLS_GAIN_PER_KM;
    double      hills_grade_stddev  = constants::HILLS_GRADE_STDDEV;
    double      easy_pace_cv_max    = constants::EASY_PACE_CV_MAX;
    double      easy_low_zone_share = constants::EASY_LOW_ZONE_SHARE;
    int         easy_rpe_max        = constants::EASY_RPE_MAX;
    double      recovery_max_s      = constants::RECOVERY_MAX_S;
    double      recovery_load_ratio = constants::RECOVERY_LOAD_RATIO;
    double      borderline_margin   = constants::BORDERLINE_MARGIN;

    // Flags
    double      hr_jump_bpm            = constants::HR_JUMP_BPM;
    double      hr_jump_max_dt_s       = constants::HR_JUMP_MAX_DT_S;
    double      hr_jump_fraction       = constants::HR_JUMP_FRACTION;
    double      hr_excluded_fraction   = constants::HR_EXCLUDED_FRACTION;
    double      hr_flatline_s          = constants::HR_FLATLINE_S;
    std::size_t hr_quality_min_samples = constants::HR_QUALITY_MIN_SAMPLES;
    std::size_t gps_median_window      = constants::GPS_MEDIAN_WINDOW;
    double      gps_spike_ratio        = constants::GPS_SPIKE_RATIO;
    double      gps_spike_min_delta    = constants::GPS_SPIKE_MIN_DELTA;
    double      gps_spike_fraction     = constants::GPS_SPIKE_FRACTION;
    double      easy_high_zone_share   = constants::EASY_HIGH_ZONE_SHARE;
    double      pace_unstable_cv       = constants::PACE_UNSTABLE_CV;
    double      fatigue_drift_pct      = constants::FATIGUE_DRIFT_PCT;
    double      fatigue_effort_z       = constants::FATIGUE_EFFORT_Z;
    double      load_spike_ratio       = constants::LOAD_SPIKE_RATIO;
    int         pain_reported_min      = constants::PAIN_REPORTED_MIN;
    int         pain_severe_min        = constants::PAIN_SEVERE_MIN;
    int         illness_rpe_min        = constants::ILLNESS_RPE_MIN;
    int         illness_sleep_max      = constants::ILLNESS_SLEEP_MAX;
    int         illness_pain_min       = constants::ILLNESS_PAIN_MIN;
    double      low_confidence_widening = constants::LOW_CONFIDENCE_WIDENING;

    // Risk
    int risk_amber_min = constants::RISK_AMBER_MIN;
    int risk_red_min   = constants::RISK_RED_MIN;
};

}  // namespace tsig
