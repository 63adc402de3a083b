/// @file src/core/types.cpp
/// @brief Enum names, label parsing and small helpers on input types.

#include "tsig/errors.hpp"
#include "tsig/types.hpp"

#include <algorithm>
#include <cctype>
#include <new>
#include <string>

namespace tsig {

namespace {

/// Lowercase, drop spaces/underscores/hyphens and a trailing "run".
std::string canonical_label(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        if (c == ' ' || c == '_' || c == '-' || c == '\t') {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (out.size() > 3 && out.ends_with("run")) {
        out.resize(out.size() - 3);
    }
    return out;
}

}  // namespace

// ─── DataGap ──────────────────────────────────────────────────────────────────

const char* to_string(DataGap gap) noexcept {
    switch (gap) {
        case DataGap::NoStreams:           return "no_streams";
        case DataGap::NoHeartRate:         return "no_heart_rate";
        case DataGap::NoVelocity:          return "no_velocity";
        case DataGap::NoDistance:          return "no_distance";
        case DataGap::NoGrade:             return "no_grade";
        case DataGap::InsufficientSamples: return "insufficient_samples";
        case DataGap::NoSteadyState:       return "no_steady_state";
        case DataGap::NoSplits:            return "no_splits";
        case DataGap::NoIntervalStructure: return "no_interval_structure";
        case DataGap::NoBaseline:          return "no_baseline";
        case DataGap::ThinBaseline:        return "thin_baseline";
        case DataGap::NoCheckIn:           return "no_checkin";
        case DataGap::NotApplicable:       return "not_applicable";
    }
    return "unknown";
}

// ─── SportType ────────────────────────────────────────────────────────────────

bool is_running(SportType t) noexcept {
    return t == SportType::Run || t == SportType::TrailRun || t == SportType::VirtualRun;
}

const char* to_string(SportType t) noexcept {
    switch (t) {
        case SportType::Run:         return "Run";
        case SportType::TrailRun:    return "TrailRun";
        case SportType::VirtualRun:  return "VirtualRun";
        case SportType::Ride:        return "Ride";
        case SportType::VirtualRide: return "VirtualRide";
        case SportType::Walk:        return "Walk";
        case SportType::Hike:        return "Hike";
        case SportType::Swim:        return "Swim";
        case SportType::Workout:     return "Workout";
        case SportType::Other:       return "Other";
    }
    return "Other";
}

SportType parse_sport_type(std::string_view s) noexcept {
    constexpr SportType all[] = {
        SportType::Run,  SportType::TrailRun, SportType::VirtualRun, SportType::Ride,
        SportType::VirtualRide, SportType::Walk, SportType::Hike, SportType::Swim,
        SportType::Workout,
    };
    for (const SportType t : all) {
        const std::string_view name = to_string(t);
        if (name.size() == s.size() &&
            std::equal(name.begin(), name.end(), s.begin(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            })) {
            return t;
        }
    }
    return SportType::Other;
}

// ─── ActivityClass ────────────────────────────────────────────────────────────

const char* to_string(ActivityClass c) noexcept {
    switch (c) {
        case ActivityClass::Intervals: return "intervals";
        case ActivityClass::Tempo:     return "tempo";
        case ActivityClass::Long:      return "long";
        case ActivityClass::Hills:     return "hills";
        case ActivityClass::Easy:      return "easy";
        case ActivityClass::Recovery:  return "recovery";
        case ActivityClass::Steady:    return "steady";
        case ActivityClass::Race:      return "race";
        case ActivityClass::Unknown:   return "unknown";
    }
    return "unknown";
}

std::optional<ActivityClass> parse_activity_class(std::string_view s) noexcept {
    std::string key;
    try {
        key = canonical_label(s);
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }

    if (key == "intervals" || key == "interval")                     return ActivityClass::Intervals;
    if (key == "tempo" || key == "threshold")                        return ActivityClass::Tempo;
    if (key == "long")                                               return ActivityClass::Long;
    if (key == "hills" || key == "hill" || key == "hillrepeats")     return ActivityClass::Hills;
    if (key == "easy")                                               return ActivityClass::Easy;
    if (key == "recovery")                                           return ActivityClass::Recovery;
    if (key == "steady")                                             return ActivityClass::Steady;
    if (key == "race")                                               return ActivityClass::Race;
    if (key == "unknown")                                            return ActivityClass::Unknown;
    return std::nullopt;
}

// ─── Confidence ───────────────────────────────────────────────────────────────

const char* to_string(Confidence c) noexcept {
    switch (c) {
        case Confidence::Low:    return "low";
        case Confidence::Medium: return "medium";
        case Confidence::High:   return "high";
    }
    return "low";
}

// ─── HistoryBaseline ──────────────────────────────────────────────────────────

std::optional<double> HistoryBaseline::weekly_load_ratio() const noexcept {
    if (!distance_7d_m || !distance_28d_m) {
        return std::nullopt;
    }
    const double weekly_avg = *distance_28d_m / 4.0;
    if (weekly_avg <= 0.0) {
        return std::nullopt;
    }
    return *distance_7d_m / weekly_avg;
}

}  // namespace tsig
