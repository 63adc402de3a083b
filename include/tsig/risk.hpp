#pragma once

/// @file include/tsig/risk.hpp
/// @brief RiskScorer: additive injury / overload risk traffic light.
///
/// # Module: Risk Scorer
///
/// ## Points
/// | Contributor                          | Points |
/// |--------------------------------------|--------|
/// | load_spike                           | 3      |
/// | fatigue_possible                     | 1      |
/// | pain_reported                        | 2      |
/// | pain_severe                          | 4      |
/// | illness_or_extreme_fatigue           | 4      |
/// | poor sleep (≤ 2) and high RPE (≥ 8)  | 2      |
/// | ≥ 2 hard sessions in 7 d, last ≤ 3 d | 1      |
///
/// Score below `risk_amber_min` is green, below `risk_red_min` amber, else
/// red. Each contributor adds a reason `"name (+n)"` in table order.

#include "tsig/derived.hpp"
#include "tsig/thresholds.hpp"
#include "tsig/types.hpp"

#include <optional>
#include <span>

namespace tsig::risk {

class RiskScorer {
public:
    [[nodiscard]] static RiskAssessment
    score(std::span<const Flag> raised,
          const std::optional<CheckIn>& check_in,
          const std::optional<HistoryBaseline>& baseline,
          const Thresholds& th = Thresholds{});

    /// Points a raised flag contributes (0 for quality flags).
    [[nodiscard]] static int points(Flag f) noexcept;

    [[nodiscard]] static RiskLevel level_of(int score, const Thresholds& th = Thresholds{}) noexcept;
};

}  // namespace tsig::risk
