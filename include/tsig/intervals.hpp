#pragma once

/// @file include/tsig/intervals.hpp
/// @brief IntervalDetector: work/rest structure of an interval session.
///
/// # Module: Interval Structure Detector
///
/// ## Algorithm
/// 1. Smooth velocity with a centred moving average of `interval_smoothing_s`.
/// 2. Over moving samples (smoothed speed > 0.5 m/s), find a bimodal speed
///    threshold by iterative two-means. The fast cluster's mean must be at
///    least `interval_cluster_split` × the slow cluster's mean.
/// 3. Label each sample work (≥ 1.05 × threshold), rest (≤ 0.95 ×
///    threshold) or transition.
/// 4. Keep work runs ≥ `interval_min_work_s` and rest runs ≥
///    `interval_min_rest_s`; rests only count between the first and the last
///    rep.
/// 5. Report reps, rests, warm-up / cool-down (≥ `interval_warmup_min_s`),
///    work:rest ratio, rep duration and speed CVs and a consistency label
///    (worst CV < 10 % high, < 20 % medium, else low).
///
/// ## Guarantees
/// - At least two reps, or `missing(NoIntervalStructure)`
/// - Never throws

#include "tsig/derived.hpp"
#include "tsig/errors.hpp"
#include "tsig/preprocess.hpp"
#include "tsig/thresholds.hpp"

#include <optional>
#include <span>
#include <vector>

namespace tsig::intervals {

class IntervalDetector {
public:
    [[nodiscard]] static Nullable<IntervalStructure>
    detect(const std::optional<preprocess::PreparedStreams>& streams,
           const Thresholds& th = Thresholds{}) noexcept;

    /// Centred moving average over a time window. A sample with no non-null
    /// velocity inside its window is null.
    [[nodiscard]] static Series
    smooth(const std::vector<double>& time, const Series& velocity, double window_s);

    /// Iterative two-means threshold between slow and fast speeds.
    /// `nullopt` if fewer than 10 values or the clusters are not separated
    /// by at least `min_ratio`.
    [[nodiscard]] static std::optional<double>
    bimodal_threshold(std::span<const double> speeds, double min_ratio) noexcept;

    [[nodiscard]] static RepConsistency
    consistency(std::optional<double> duration_cv, std::optional<double> speed_cv) noexcept;
};

}  // namespace tsig::intervals
