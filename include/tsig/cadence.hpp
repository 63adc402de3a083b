#pragma once

/// @file include/tsig/cadence.hpp
/// @brief CadenceNormalizer: corrects per-leg running cadence.
///
/// # Module: Cadence Normalizer
///
/// ## Responsibility
/// Many running devices report cadence per leg (≈ 80–95) rather than per
/// step (≈ 160–190). For running sport types, a cadence below the doubling
/// threshold is doubled; everything else passes through.
///
/// ## Edge Cases
/// - Non-running sport types: unchanged (cycling rpm is already correct)
/// - Null, zero, negative or non-finite values: unchanged
/// - Streams: the decision is taken once, on the mean of the positive
///   samples, so a single stream is never half-doubled
///
/// ## Guarantees
/// - Idempotent for values at or above the threshold
/// - Never throws

#include "tsig/constants.hpp"
#include "tsig/streams.hpp"
#include "tsig/types.hpp"

#include <optional>

namespace tsig::units {

class CadenceNormalizer {
public:
    /// Normalize one cadence value.
    ///
    /// # Example
    /// `normalize(85.0, SportType::Run)` → `170.0`;
    /// `normalize(170.0, SportType::Run)` → `170.0`;
    /// `normalize(85.0, SportType::Ride)` → `85.0`.
    [[nodiscard]] static std::optional<double>
    normalize(std::optional<double> cadence,
              SportType type,
              double threshold = constants::RUN_CADENCE_DOUBLING_THRESHOLD) noexcept;

    /// Normalize a whole cadence stream.
    ///
    /// Returns a copy of `cadence` where every positive sample is doubled if
    /// the mean of the positive samples is below `threshold` and `type` is a
    /// running type; otherwise an unchanged copy.
    [[nodiscard]] static Series
    normalize_stream(const Series& cadence,
                     SportType type,
                     double threshold = constants::RUN_CADENCE_DOUBLING_THRESHOLD);

    /// True if `normalize_stream` would double this stream.
    [[nodiscard]] static bool
    stream_needs_doubling(const Series& cadence,
                          SportType type,
                          double threshold = constants::RUN_CADENCE_DOUBLING_THRESHOLD) noexcept;
};

}  // namespace tsig::units
