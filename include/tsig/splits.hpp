#pragma once

/// @file include/tsig/splits.hpp
/// @brief SplitBuilder: fixed distance or time segments.
///
/// # Module: Split Builder
///
/// ## Responsibility
/// Aggregate prepared streams (or, without streams, the activity summary)
/// into an ordered list of `Split`s.
///
/// ## Strategy
/// | Input                          | Kind       | Nominal size       |
/// |--------------------------------|------------|--------------------|
/// | Reliable distance stream       | Distance   | `split_distance_m` |
/// | Streams, no reliable distance  | Time       | `split_time_s`     |
/// | No streams                     | Summary    | `split_time_s`     |
///
/// A distance stream is reliable when at least `reliable_distance_coverage`
/// of its samples are non-null, its non-null samples never decrease, and it
/// covers at least one full split.
///
/// A trailing split smaller than `split_tail_merge_fraction` of the nominal
/// size is merged into the previous split.
///
/// ## Guarantees
/// - Splits are contiguous, ordered, and 1-indexed
/// - Summary splits carry only summary averages (never stream values)
/// - Never throws

#include "tsig/derived.hpp"
#include "tsig/preprocess.hpp"
#include "tsig/thresholds.hpp"
#include "tsig/types.hpp"

#include <optional>
#include <vector>

namespace tsig::splits {

class SplitBuilder {
public:
    /// Build splits from streams when available, otherwise from the summary.
    [[nodiscard]] static std::vector<Split>
    build(const std::optional<preprocess::PreparedStreams>& streams,
          const ActivitySummary& summary,
          const Thresholds& th = Thresholds{}) noexcept;

    /// Distance- or time-based splits from prepared streams.
    /// Empty if the streams hold fewer than two samples.
    [[nodiscard]] static std::vector<Split>
    from_streams(const preprocess::PreparedStreams& streams,
                 const Thresholds& th = Thresholds{}) noexcept;

    /// Summary-only time splits covering `summary.moving_time_s`.
    [[nodiscard]] static std::vector<Split>
    from_summary(const ActivitySummary& summary,
                 const Thresholds& th = Thresholds{}) noexcept;

    [[nodiscard]] static bool
    has_reliable_distance(const preprocess::PreparedStreams& streams,
                          const Thresholds& th = Thresholds{}) noexcept;
};

}  // namespace tsig::splits
