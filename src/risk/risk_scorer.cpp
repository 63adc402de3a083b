/// @file src/risk/risk_scorer.cpp
/// @brief RiskScorer implementation.

#include "tsig/risk.hpp"

#include <fmt/format.h>

namespace tsig::risk {

namespace {

constexpr int POOR_SLEEP_MAX        = 2;
constexpr int HIGH_RPE_MIN          = 8;
constexpr int POOR_SLEEP_HIGH_RPE   = 2;
constexpr int HARD_SESSIONS_MIN     = 2;
constexpr double HARD_RECENT_DAYS   = 3.0;
constexpr int CONSECUTIVE_HARD      = 1;

void add(RiskAssessment& r, const char* name, int pts) {
    r.score += pts;
    r.reasons.push_back(fmt::format("{} (+{})", name, pts));
}

}  // namespace

int RiskScorer::points(Flag f) noexcept {
    switch (f) {
        case Flag::LoadSpike:               return 3;
        case Flag::FatiguePossible:         return 1;
        case Flag::PainReported:            return 2;
        case Flag::PainSevere:              return 4;
        case Flag::IllnessOrExtremeFatigue: return 4;
        case Flag::DataLowConfidenceHr:
        case Flag::GpsLowConfidence:
        case Flag::IntensityTooHighForEasy:
        case Flag::PaceUnstable:            return 0;
    }
    return 0;
}

RiskLevel RiskScorer::level_of(int score, const Thresholds& th) noexcept {
    if (score >= th.risk_red_min)   return RiskLevel::Red;
    if (score >= th.risk_amber_min) return RiskLevel::Amber;
    return RiskLevel::Green;
}

RiskAssessment
RiskScorer::score(std::span<const Flag> raised,
                  const std::optional<CheckIn>& check_in,
                  const std::optional<HistoryBaseline>& baseline,
                  const Thresholds& th) {
    RiskAssessment r;
    for (const Flag f : raised) {
        if (const int pts = points(f); pts > 0) {
            add(r, to_string(f), pts);
        }
    }

    if (check_in && check_in->sleep_quality && check_in->rpe &&
        *check_in->sleep_quality <= POOR_SLEEP_MAX && *check_in->rpe >= HIGH_RPE_MIN) {
        add(r, "poor_sleep_high_rpe", POOR_SLEEP_HIGH_RPE);
    }

    if (baseline && baseline->hard_sessions_7d && baseline->days_since_last_hard &&
        *baseline->hard_sessions_7d >= HARD_SESSIONS_MIN &&
        *baseline->days_since_last_hard <= HARD_RECENT_DAYS) {
        add(r, "consecutive_hard_sessions", CONSECUTIVE_HARD);
    }

    r.level = level_of(r.score, th);
    return r;
}

}  // namespace tsig::risk
