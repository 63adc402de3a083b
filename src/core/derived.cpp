/// @file src/core/derived.cpp
/// @brief Output enum names, ZoneMinutes helpers and the DerivedMetrics report.

#include "tsig/derived.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <iterator>
#include <numeric>
#include <utility>

namespace tsig {

// ─── Enum names ───────────────────────────────────────────────────────────────

const char* to_string(SplitKind k) noexcept {
    switch (k) {
        case SplitKind::Distance: return "distance";
        case SplitKind::Time:     return "time";
        case SplitKind::Summary:  return "summary";
    }
    return "unknown";
}

const char* to_string(ZoneSource s) noexcept {
    switch (s) {
        case ZoneSource::Samples: return "samples";
        case ZoneSource::Splits:  return "splits";
        case ZoneSource::Summary: return "summary";
    }
    return "unknown";
}

const char* to_string(RepConsistency c) noexcept {
    switch (c) {
        case RepConsistency::High:    return "high";
        case RepConsistency::Medium:  return "medium";
        case RepConsistency::Low:     return "low";
        case RepConsistency::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(Flag f) noexcept {
    switch (f) {
        case Flag::DataLowConfidenceHr:     return "data_low_confidence_hr";
        case Flag::GpsLowConfidence:        return "gps_low_confidence";
        case Flag::IntensityTooHighForEasy: return "intensity_too_high_for_easy";
        case Flag::PaceUnstable:            return "pace_unstable";
        case Flag::FatiguePossible:         return "fatigue_possible";
        case Flag::LoadSpike:               return "load_spike";
        case Flag::PainReported:            return "pain_reported";
        case Flag::PainSevere:              return "pain_severe";
        case Flag::IllnessOrExtremeFatigue: return "illness_or_extreme_fatigue";
    }
    return "unknown";
}

const char* to_string(RiskLevel l) noexcept {
    switch (l) {
        case RiskLevel::Green: return "green";
        case RiskLevel::Amber: return "amber";
        case RiskLevel::Red:   return "red";
    }
    return "unknown";
}

// ─── ZoneMinutes ──────────────────────────────────────────────────────────────

double ZoneMinutes::total() const noexcept {
    return std::accumulate(minutes.begin(), minutes.end(), 0.0);
}

double ZoneMinutes::share_at_or_above(int zone) const noexcept {
    const double all = below_z1_minutes + total();
    if (!(all > 0.0)) {
        return 0.0;
    }
    const int first = std::clamp(zone, 1, 6) - 1;
    double above = 0.0;
    for (int k = first; k < static_cast<int>(minutes.size()); ++k) {
        above += minutes[static_cast<std::size_t>(k)];
    }
    return above / all;
}

// ─── DerivedMetrics ───────────────────────────────────────────────────────────

bool DerivedMetrics::has_flag(Flag f) const noexcept {
    return std::find(flags.begin(), flags.end(), f) != flags.end();
}

namespace {

std::string opt(const std::optional<double>& v, const char* unit = "") {
    return v ? fmt::format("{:.2f}{}", *v, unit) : std::string{"-"};
}

template <typename T, typename Fn>
std::string nullable(const Nullable<T>& n, Fn&& present) {
    if (!n) {
        return fmt::format("null ({})", to_string(n.gap()));
    }
    return present(*n);
}

template <typename... Args>
void line(fmt::memory_buffer& out, fmt::format_string<Args...> f, Args&&... args) {
    fmt::format_to(std::back_inserter(out), f, std::forward<Args>(args)...);
    out.push_back('\n');
}

std::string flag_list(const std::vector<Flag>& flags) {
    std::vector<const char*> names;
    names.reserve(flags.size());
    for (const Flag f : flags) {
        names.push_back(to_string(f));
    }
    return names.empty() ? std::string{"none"} : fmt::format("{}", fmt::join(names, ", "));
}

}  // namespace

std::string DerivedMetrics::to_string() const {
    fmt::memory_buffer out;

    line(out, "activity_class     : {} (rule: {})", tsig::to_string(activity_class), classification_rule);
    line(out, "effort_score       : {:.1f}", effort_score);
    line(out, "confidence         : {} [{}]", tsig::to_string(confidence),
         fmt::join(confidence_reasons, ", "));

    line(out, "pace_variability   : {}",
         nullable(pace_variability, [](double v) { return fmt::format("{:.2f} %", v); }));
    line(out, "hr_drift           : {}",
         nullable(hr_drift, [](double v) { return fmt::format("{:+.2f} %", v); }));
    line(out, "time_in_zones      : {}", nullable(time_in_zones, [](const ZoneMinutes& z) {
        return fmt::format("Z1 {:.1f}  Z2 {:.1f}  Z3 {:.1f}  Z4 {:.1f}  Z5 {:.1f}  <Z1 {:.1f} min ({})",
                           z.minutes[0], z.minutes[1], z.minutes[2], z.minutes[3], z.minutes[4],
                           z.below_z1_minutes, tsig::to_string(z.source));
    }));
    line(out, "efficiency         : {}", nullable(efficiency_analysis, [](const EfficiencyAnalysis& e) {
        return fmt::format("avg {:.3f}  best {:.3f}  ({} points)",
                           e.average, e.best_sustained, e.curve.size());
    }));
    line(out, "stops              : {}", nullable(stops_analysis, [](const StopsAnalysis& s) {
        return fmt::format("{} stops, {:.0f} s stopped, longest {:.0f} s",
                           s.stop_count, s.total_stopped_s, s.longest_stop_s);
    }));
    line(out, "interval_structure : {}", nullable(interval_structure, [](const IntervalStructure& s) {
        return fmt::format("{} reps, work {:.0f} s, rest {:.0f} s, w:r {}, consistency {}",
                           s.rep_count(), s.total_work_s, s.total_rest_s,
                           opt(s.work_to_rest_ratio), tsig::to_string(s.consistency));
    }));

    line(out, "splits             : {}", splits.size());
    for (const Split& s : splits) {
        line(out, "  #{:<3} {:<8} {:>7.0f}-{:<7.0f} dist {:>9}  pace {:>8}  hr {:>7}",
             s.index, tsig::to_string(s.kind), s.start_s, s.end_s,
             opt(s.distance_m, " m"), opt(s.pace_s_per_km), opt(s.avg_hr));
    }

    line(out, "flags              : {}", flag_list(flags));
    line(out, "not_evaluated      : {}", flag_list(flags_not_evaluated));
    line(out, "risk               : {} (score {}) [{}]", tsig::to_string(risk.level), risk.score,
         fmt::join(risk.reasons, ", "));
    for (const MetricWarning& w : warnings) {
        line(out, "warning            : {}: {}", w.metric, tsig::to_string(w.gap));
    }
    return fmt::to_string(out);
}

}  // namespace tsig
