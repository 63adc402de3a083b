#pragma once

/// @file include/tsig/metrics.hpp
/// @brief MetricsCalculator: per-activity derived metrics.
///
/// # Module: Metrics Calculator
///
/// ## Responsibility
/// Compute every derived number the classifier, the flag generator and the
/// caller consume: time in heart-rate zones, effort score, pace and heart
/// rate variability, grade variability, heart-rate drift and the
/// speed-to-heart-rate efficiency curve.
///
/// ## Zones
/// Zone k (1..5) starts at `zone_lower_bounds[k-1] × max_hr`. A heart rate
/// below Z1 is "below zone" and reported separately. From the HR stream each
/// sample i ≥ 1 contributes `min(t[i] − t[i-1], max_sample_gap_s)` to the
/// zone of hr[i]. Without a stream, each split's duration goes to the zone
/// of its average HR; with summary data only, the moving time goes to the
/// zone of the summary average HR.
///
/// ## Effort score
/// ```
///   with zones:    Σ minutes[k] × zone_weights[k]        (k = Z1..Z5)
///   without:       moving_minutes × intensity_multiplier(class)
/// ```
///
/// ## HR drift
/// The activity is cut into fixed blocks (`steady_state_block_s`). A block
/// is usable when every velocity sample in it is moving and at least one
/// sample pairs velocity with heart rate. The longest run of consecutive
/// usable blocks whose block-speed CV stays ≤ `steady_state_cv_max` is the
/// steady-state segment. Below `steady_state_min_s` there is no drift.
/// Otherwise:
/// ```
///   drift% = ((HR/v)_second_half / (HR/v)_first_half − 1) × 100
/// ```
///
/// ## Guarantees
/// - Every metric is independently nullable; a missing one never blocks
///   another
/// - CVs are population CVs in percent; identical values give exactly 0
/// - Never throws

#include "tsig/derived.hpp"
#include "tsig/errors.hpp"
#include "tsig/preprocess.hpp"
#include "tsig/thresholds.hpp"
#include "tsig/types.hpp"

#include <cstddef>
#include <optional>
#include <span>

namespace tsig::metrics {

/// Longest steady-state run of blocks.
struct SteadySegment {
    double      start_s     = 0.0;
    double      duration_s  = 0.0;
    std::size_t block_count = 0;
    double      speed_cv    = 0.0;  ///< %

    bool operator==(const SteadySegment&) const = default;
};

class MetricsCalculator {
public:
    // ── Zones and effort ─────────────────────────────────────────────────────

    /// Zone of one heart rate: 0 below Z1, else 1..5.
    [[nodiscard]] static int
    zone_of(double hr, double max_hr, const Thresholds& th = Thresholds{}) noexcept;

    [[nodiscard]] static std::optional<ZoneMinutes>
    zones_from_samples(const preprocess::PreparedStreams& streams,
                       double max_hr,
                       const Thresholds& th = Thresholds{}) noexcept;

    /// Zones from split averages. `nullopt` if no split carries an avg HR.
    [[nodiscard]] static std::optional<ZoneMinutes>
    zones_from_splits(std::span<const Split> splits,
                      double max_hr,
                      const Thresholds& th = Thresholds{}) noexcept;

    /// Samples, then splits, then summary average; `missing(NoHeartRate)`
    /// when no heart-rate data exists at all.
    [[nodiscard]] static Nullable<ZoneMinutes>
    time_in_zones(const std::optional<preprocess::PreparedStreams>& streams,
                  std::span<const Split> splits,
                  const ActivitySummary& summary,
                  double max_hr,
                  const Thresholds& th = Thresholds{}) noexcept;

    /// Σ minutes × weight over Z1..Z5.
    [[nodiscard]] static double
    effort_from_zones(const ZoneMinutes& zones, const Thresholds& th = Thresholds{}) noexcept;

    /// Per-class multiplier used when no heart-rate data exists.
    [[nodiscard]] static double intensity_multiplier(ActivityClass c) noexcept;

    [[nodiscard]] static double
    effort_score(const Nullable<ZoneMinutes>& zones,
                 double moving_time_s,
                 ActivityClass activity_class,
                 const Thresholds& th = Thresholds{}) noexcept;

    // ── Variability ──────────────────────────────────────────────────────────

    /// Pace CV (%) over stream-derived splits (≥ 2 with pace); else speed CV
    /// over moving velocity samples (≥ `min_velocity_samples`).
    [[nodiscard]] static Nullable<double>
    pace_variability(std::span<const Split> splits,
                     const std::optional<preprocess::PreparedStreams>& streams,
                     const Thresholds& th = Thresholds{}) noexcept;

    /// Heart-rate CV (%) over the HR stream.
    [[nodiscard]] static Nullable<double>
    heart_rate_variability(const std::optional<preprocess::PreparedStreams>& streams,
                           const Thresholds& th = Thresholds{}) noexcept;

    /// Grade standard deviation (percentage points) from the grade stream,
    /// else from ≥ 3 stream-derived split average grades.
    [[nodiscard]] static Nullable<double>
    grade_variability(std::span<const Split> splits,
                      const std::optional<preprocess::PreparedStreams>& streams,
                      const Thresholds& th = Thresholds{}) noexcept;

    // ── Drift ────────────────────────────────────────────────────────────────

    [[nodiscard]] static std::optional<SteadySegment>
    longest_steady_segment(const preprocess::PreparedStreams& streams,
                           const Thresholds& th = Thresholds{}) noexcept;

    [[nodiscard]] static Nullable<double>
    hr_drift(const std::optional<preprocess::PreparedStreams>& streams,
             const Thresholds& th = Thresholds{}) noexcept;

    // ── Efficiency ───────────────────────────────────────────────────────────

    /// Speed (m/min) ÷ HR over a rolling window sampled every
    /// `efficiency_curve_step_s`, with the overall average and the best
    /// full-window value.
    [[nodiscard]] static Nullable<EfficiencyAnalysis>
    efficiency(const std::optional<preprocess::PreparedStreams>& streams,
               const Thresholds& th = Thresholds{}) noexcept;
};

}  // namespace tsig::metrics
