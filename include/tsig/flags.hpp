#pragma once

/// @file include/tsig/flags.hpp
/// @brief FlagGenerator: independent conservative safety / quality flags.
///
/// # Module: Flag Generator
///
/// ## Responsibility
/// Evaluate an ordered table of independent, non-exclusive checks. Each
/// check answers raised, not raised, or not evaluated (`nullopt`) when the
/// inputs it needs are missing. A missing input never defaults a flag.
///
/// ## Checks
/// | Flag                        | Needs                         | Widened |
/// |-----------------------------|-------------------------------|---------|
/// | data_low_confidence_hr      | HR stream ≥ min samples       | yes     |
/// | gps_low_confidence          | velocity stream ≥ min samples | yes     |
/// | intensity_too_high_for_easy | zones (when easy)             | no      |
/// | pace_unstable               | pace CV (when tempo)          | yes     |
/// | fatigue_possible            | hr_drift or baseline effort   | yes     |
/// | load_spike                  | baseline 7d and 28d distance  | no      |
/// | pain_reported               | check-in pain score           | no      |
/// | pain_severe                 | check-in pain score           | no      |
/// | illness_or_extreme_fatigue  | check-in                      | no      |
///
/// Under Low preliminary confidence the widened checks multiply their
/// thresholds by `low_confidence_widening`, so weak data raises fewer
/// stream-derived flags.

#include "tsig/derived.hpp"
#include "tsig/errors.hpp"
#include "tsig/preprocess.hpp"
#include "tsig/thresholds.hpp"
#include "tsig/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace tsig::flags {

/// Heart-rate stream quality counters.
struct HrQuality {
    std::size_t samples       = 0;  ///< Plausible samples kept
    std::size_t excluded      = 0;  ///< Implausible samples nulled
    std::size_t jumps         = 0;  ///< Large jumps between close samples
    double      longest_flat_s = 0.0;

    bool operator==(const HrQuality&) const = default;
};

/// Velocity spike counters against a local median.
struct GpsQuality {
    std::size_t samples = 0;
    std::size_t spikes  = 0;

    bool operator==(const GpsQuality&) const = default;
};

/// Everything the checks look at.
struct FlagContext {
    std::optional<HrQuality>       hr_quality;
    std::optional<GpsQuality>      gps_quality;
    ActivityClass                  activity_class = ActivityClass::Unknown;
    std::optional<ActivityClass>   user_intent;
    std::optional<ZoneMinutes>     zones;
    std::optional<double>          pace_cv;  ///< Pace variability, %
    std::optional<double>          hr_drift;
    double                         effort_score = 0.0;
    std::optional<HistoryBaseline> baseline;
    std::optional<CheckIn>         check_in;
    Confidence                     preliminary = Confidence::Low;
};

/// `nullopt` = not evaluated. `widen` is 1 or `low_confidence_widening`.
using Check = std::optional<bool> (*)(const FlagContext&, const Thresholds&, double widen) noexcept;

struct FlagRule {
    Flag  flag;
    Check check;
    bool  widened;
};

struct FlagReport {
    std::vector<Flag> raised;
    std::vector<Flag> not_evaluated;

    [[nodiscard]] bool has(Flag f) const noexcept;

    bool operator==(const FlagReport&) const = default;
};

namespace checks {

[[nodiscard]] std::optional<bool> hr_low_confidence(const FlagContext&, const Thresholds&, double) noexcept;
[[nodiscard]] std::optional<bool> gps_low_confidence(const FlagContext&, const Thresholds&, double) noexcept;
[[nodiscard]] std::optional<bool> intensity_too_high_for_easy(const FlagContext&, const Thresholds&, double) noexcept;
[[nodiscard]] std::optional<bool> pace_unstable(const FlagContext&, const Thresholds&, double) noexcept;
[[nodiscard]] std::optional<bool> fatigue_possible(const FlagContext&, const Thresholds&, double) noexcept;
[[nodiscard]] std::optional<bool> load_spike(const FlagContext&, const Thresholds&, double) noexcept;
[[nodiscard]] std::optional<bool> pain_reported(const FlagContext&, const Thresholds&, double) noexcept;
[[nodiscard]] std::optional<bool> pain_severe(const FlagContext&, const Thresholds&, double) noexcept;
[[nodiscard]] std::optional<bool> illness_or_extreme_fatigue(const FlagContext&, const Thresholds&, double) noexcept;

}  // namespace checks

class FlagGenerator {
public:
    [[nodiscard]] static std::span<const FlagRule> table() noexcept;

    [[nodiscard]] static FlagReport
    evaluate(const FlagContext& ctx, const Thresholds& th = Thresholds{});

    /// Jump / flatline / exclusion counters, or `nullopt` without an HR stream.
    [[nodiscard]] static std::optional<HrQuality>
    hr_quality(const preprocess::PreparedStreams& streams,
               const Thresholds& th = Thresholds{}) noexcept;

    /// Spike counters, or `nullopt` without a velocity stream.
    [[nodiscard]] static std::optional<GpsQuality>
    gps_quality(const preprocess::PreparedStreams& streams,
                const Thresholds& th = Thresholds{}) noexcept;
};

}  // namespace tsig::flags
