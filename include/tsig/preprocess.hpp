#pragma once

/// @file include/tsig/preprocess.hpp
/// @brief StreamPreprocessor and StopDetector: the stream cleaning boundary.
///
/// # Module: Stream Preprocessor
///
/// ## Responsibility
/// Turn a raw, caller-supplied `StreamSet` into `PreparedStreams`: one
/// strictly increasing time index with every other channel aligned to it,
/// implausible heart rate and cadence excluded, cadence normalized, and
/// velocity derived from distance when the device did not record it.
///
/// ## Pipeline
/// 1. Validate alignment: a non-empty set needs a Time channel and every
///    channel must match its length (`ValidationError` otherwise).
/// 2. Drop samples whose time is null, non-finite, or not strictly greater
///    than the last kept time. The drop applies to every channel.
/// 3. Null heart-rate samples outside [hr_plausible_min, hr_plausible_max];
///    they are counted, never corrected.
/// 4. Null cadence samples above `cadence_plausible_max`, then normalize
///    cadence (see cadence.hpp) and null any doubled value that lands above
///    the limit. Both are counted in `cadence_excluded`.
/// 5. Derive velocity from consecutive distance/time deltas when no
///    velocity channel has data.
/// 6. For running types, a zero cadence while velocity is above
///    `stop_velocity_epsilon` is a sensor dropout and becomes null. Without
///    velocity a zero is kept.
///
/// # Module: Stop Detector
///
/// Scans velocity for windows below `stop_velocity_epsilon`, merges windows
/// separated by at most `stop_merge_gap_s`, and keeps those lasting at least
/// `stop_min_duration_s`. Null velocity samples never count as stopped.

#include "tsig/derived.hpp"
#include "tsig/errors.hpp"
#include "tsig/streams.hpp"
#include "tsig/thresholds.hpp"
#include "tsig/types.hpp"

#include <cstddef>
#include <vector>

namespace tsig::preprocess {

// ─── PreparedStreams ──────────────────────────────────────────────────────────

/// Cleaned, aligned streams.
///
/// Every non-empty series has exactly `time.size()` samples; an empty
/// series means the channel is absent.
struct PreparedStreams {
    std::vector<double> time;  ///< Strictly increasing seconds
    Series distance;
    Series velocity;
    Series heart_rate;
    Series cadence;
    Series altitude;
    Series grade;
    Series power;
    Series latitude;
    Series longitude;

    bool        velocity_derived   = false;  ///< Velocity computed from distance
    bool        cadence_doubled    = false;
    std::size_t dropped_samples    = 0;      ///< Null or non-monotonic time
    std::size_t hr_excluded        = 0;      ///< Implausible HR samples nulled
    std::size_t cadence_excluded   = 0;      ///< Cadence spikes nulled
    std::size_t cadence_dropouts   = 0;      ///< Zero run cadence while moving, nulled

    [[nodiscard]] std::size_t size() const noexcept { return time.size(); }

    /// Duration from the first to the last kept sample.
    [[nodiscard]] double span_s() const noexcept {
        return time.size() < 2 ? 0.0 : time.back() - time.front();
    }

    /// Borrow a channel's series (empty if absent). Time is not a Series
    /// and yields an empty one.
    [[nodiscard]] const Series& channel(Channel c) const noexcept;

    /// True if the channel is present with at least one non-null sample.
    [[nodiscard]] bool has_data(Channel c) const noexcept;

    bool operator==(const PreparedStreams&) const = default;
};

// ─── StreamPreprocessor ───────────────────────────────────────────────────────

class StreamPreprocessor {
public:
    /// Check structural alignment only.
    ///
    /// # Throws
    /// `ValidationError` if `raw` is non-empty without a Time channel, or if
    /// any channel's length differs from the Time channel's.
    static void validate(const StreamSet& raw);

    /// Clean and align `raw`.
    ///
    /// # Throws
    /// `ValidationError` as `validate`.
    [[nodiscard]] static PreparedStreams
    prepare(const StreamSet& raw, SportType type, const Thresholds& th = Thresholds{});

    /// Velocity from consecutive distance/time deltas. The first sample
    /// takes the second's value; a null distance on either side yields null;
    /// negative deltas yield null.
    [[nodiscard]] static Series
    derive_velocity(const std::vector<double>& time, const Series& distance);
};

// ─── StopDetector ─────────────────────────────────────────────────────────────

class StopDetector {
public:
    /// Detect stop windows.
    ///
    /// # Returns
    /// `missing(NoVelocity)` if the velocity series has no data;
    /// otherwise a (possibly empty) StopsAnalysis.
    [[nodiscard]] static Nullable<StopsAnalysis>
    detect(const PreparedStreams& streams, const Thresholds& th = Thresholds{}) noexcept;
};

}  // namespace tsig::preprocess
