#pragma once

/// @file include/tsig/classifier.hpp
/// @brief Classifier: ordered rule table assigning an ActivityClass.
///
/// # Module: Classifier
///
/// ## Rule table (first match wins)
/// | # | Rule      | Class     | Needs streams | Conservative neighbour |
/// |---|-----------|-----------|---------------|------------------------|
/// | 1 | intervals | Intervals | yes           | Unknown                |
/// | 2 | tempo     | Tempo     | yes           | Steady                 |
/// | 3 | long      | Long      | no            | -                      |
/// | 4 | hills     | Hills     | yes           | (rule skipped)         |
/// | 5 | recovery  | Recovery  | no            | -                      |
/// | 6 | easy      | Easy      | no            | -                      |
///
/// An explicit race declaration is applied before the table. Race is never
/// inferred. With no match the class is Unknown.
///
/// ## Conservatism
/// Each predicate answers No, Borderline or Yes. A value within
/// `borderline_margin` (relative) of its threshold is Borderline. When a
/// stream-dependent rule matches but the activity has no streams, or any
/// rule's match is Borderline under Low preliminary confidence, the rule
/// yields to its conservative neighbour (or is skipped when it has none) and
/// the final confidence is forced to Low.
///
/// ## Guarantees
/// - Pure: the result depends only on the context and thresholds
/// - Every predicate is a free function, testable on its own

#include "tsig/derived.hpp"
#include "tsig/thresholds.hpp"
#include "tsig/types.hpp"

#include <optional>
#include <span>
#include <string>

namespace tsig::classify {

/// Three-valued predicate result, ordered so that AND is min and OR is max.
enum class Match {
    No,
    Borderline,
    Yes,
};

/// Everything the rules look at, computed upstream.
struct ClassificationContext {
    bool                           has_streams = false;
    double                         moving_time_s = 0.0;
    double                         distance_m = 0.0;
    double                         elevation_gain_m = 0.0;
    std::optional<double>          pace_cv;           ///< %
    std::optional<double>          hr_cv;             ///< %
    std::optional<std::size_t>     interval_reps;
    std::optional<ZoneMinutes>     zones;
    std::optional<double>          time_at_threshold_pace_s;  ///< Split time at or faster than baseline threshold pace
    std::optional<double>          grade_stddev;
    std::optional<HistoryBaseline> baseline;
    std::optional<int>             rpe;
    Confidence                     preliminary = Confidence::Low;
    bool                           race_declared = false;
};

struct ClassificationResult {
    ActivityClass activity_class = ActivityClass::Unknown;
    std::string   rule;                          ///< Rule name that decided
    bool          conservative_fallback = false; ///< A neighbour replaced the rule's class
    bool          force_low_confidence  = false;

    bool operator==(const ClassificationResult&) const = default;
};

using Predicate = Match (*)(const ClassificationContext&, const Thresholds&) noexcept;

struct Rule {
    const char*                  name;
    ActivityClass                activity_class;
    Predicate                    predicate;
    bool                         needs_streams;
    std::optional<ActivityClass> neighbour;  ///< nullopt: skip the rule instead
};

// ─── Predicates ───────────────────────────────────────────────────────────────

namespace rules {

/// value > threshold, Borderline within the margin above it.
[[nodiscard]] Match above(std::optional<double> value, double threshold, double margin) noexcept;

/// value ≥ threshold, Borderline within the margin above it.
[[nodiscard]] Match at_least(std::optional<double> value, double threshold, double margin) noexcept;

/// value < threshold, Borderline within the margin below it.
[[nodiscard]] Match below(std::optional<double> value, double threshold, double margin) noexcept;

[[nodiscard]] Match intervals(const ClassificationContext& ctx, const Thresholds& th) noexcept;
[[nodiscard]] Match tempo(const ClassificationContext& ctx, const Thresholds& th) noexcept;
[[nodiscard]] Match long_run(const ClassificationContext& ctx, const Thresholds& th) noexcept;
[[nodiscard]] Match hills(const ClassificationContext& ctx, const Thresholds& th) noexcept;
[[nodiscard]] Match easy(const ClassificationContext& ctx, const Thresholds& th) noexcept;
[[nodiscard]] Match recovery(const ClassificationContext& ctx, const Thresholds& th) noexcept;

}  // namespace rules

// ─── Classifier ───────────────────────────────────────────────────────────────

class Classifier {
public:
    /// The ordered rule table.
    [[nodiscard]] static std::span<const Rule> table() noexcept;

    [[nodiscard]] static ClassificationResult
    classify(const ClassificationContext& ctx, const Thresholds& th = Thresholds{});
};

}  // namespace tsig::classify
