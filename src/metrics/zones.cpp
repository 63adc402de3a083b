/// @file src/metrics/zones.cpp
/// @brief Time in zones and effort score.

#include "tsig/metrics.hpp"

#include <algorithm>
#include <cmath>

namespace tsig::metrics {

int MetricsCalculator::zone_of(double hr, double max_hr, const Thresholds& th) noexcept {
    if (!std::isfinite(hr) || !(max_hr > 0.0)) {
        return 0;
    }
    const double ratio = hr / max_hr;
    int zone = 0;
    for (const double lower : th.zone_lower_bounds) {
        if (ratio >= lower) {
            ++zone;
        }
    }
    return zone;
}

namespace {

void add_minutes(ZoneMinutes& z, int zone, double minutes) noexcept {
    if (zone <= 0) {
        z.below_z1_minutes += minutes;
    } else {
        z.minutes[static_cast<std::size_t>(std::min(zone, 5) - 1)] += minutes;
    }
}

}  // namespace

std::optional<ZoneMinutes>
MetricsCalculator::zones_from_samples(const preprocess::PreparedStreams& streams,
                                      double max_hr,
                                      const Thresholds& th) noexcept {
    const auto& t  = streams.time;
    const auto& hr = streams.heart_rate;
    if (hr.size() != t.size() || t.size() < 2) {
        return std::nullopt;
    }

    ZoneMinutes z;
    z.source = ZoneSource::Samples;
    bool any = false;
    for (std::size_t i = 1; i < t.size(); ++i) {
        if (!hr[i]) {
            continue;
        }
        const double dt = std::min(t[i] - t[i - 1], th.max_sample_gap_s);
        add_minutes(z, zone_of(*hr[i], max_hr, th), dt / 60.0);
        any = true;
    }
    if (!any) {
        return std::nullopt;
    }
    return z;
}

std::optional<ZoneMinutes>
MetricsCalculator::zones_from_splits(std::span<const Split> splits,
                                     double max_hr,
                                     const Thresholds& th) noexcept {
    ZoneMinutes z;
    z.source = ZoneSource::Summary;
    bool any = false;
    for (const Split& s : splits) {
        if (!s.avg_hr) {
            continue;
        }
        if (s.kind != SplitKind::Summary) {
            z.source = ZoneSource::Splits;
        }
        add_minutes(z, zone_of(*s.avg_hr, max_hr, th), s.duration_s / 60.0);
        any = true;
    }
    if (!any) {
        return std::nullopt;
    }
    return z;
}

Nullable<ZoneMinutes>
MetricsCalculator::time_in_zones(const std::optional<preprocess::PreparedStreams>& streams,
                                 std::span<const Split> splits,
                                 const ActivitySummary& summary,
                                 double max_hr,
                                 const Thresholds& th) noexcept {
    if (streams && streams->has_data(Channel::HeartRate)) {
        if (auto z = zones_from_samples(*streams, max_hr, th)) {
            return Nullable<ZoneMinutes>::of(*z);
        }
    }
    if (auto z = zones_from_splits(splits, max_hr, th)) {
        return Nullable<ZoneMinutes>::of(*z);
    }
    if (summary.avg_hr && summary.moving_time_s > 0.0) {
        ZoneMinutes z;
        z.source = ZoneSource::Summary;
        add_minutes(z, zone_of(*summary.avg_hr, max_hr, th), summary.moving_time_s / 60.0);
        return Nullable<ZoneMinutes>::of(z);
    }
    return Nullable<ZoneMinutes>::missing(DataGap::NoHeartRate);
}

double MetricsCalculator::effort_from_zones(const ZoneMinutes& zones,
                                            const Thresholds& th) noexcept {
    double total = 0.0;
    for (std::size_t k = 0; k < zones.minutes.size(); ++k) {
        total += zones.minutes[k] * th.zone_weights[k];
    }
    return total;
}

double MetricsCalculator::intensity_multiplier(ActivityClass c) noexcept {
    switch (c) {
        case ActivityClass::Easy:      return constants::INTENSITY_EASY;
        case ActivityClass::Recovery:  return constants::INTENSITY_RECOVERY;
        case ActivityClass::Steady:    return constants::INTENSITY_STEADY;
        case ActivityClass::Tempo:     return constants::INTENSITY_TEMPO;
        case ActivityClass::Intervals: return constants::INTENSITY_INTERVALS;
        case ActivityClass::Race:      return constants::INTENSITY_RACE;
        case ActivityClass::Hills:     return constants::INTENSITY_HILLS;
        case ActivityClass::Long:      return constants::INTENSITY_LONG;
        case ActivityClass::Unknown:   return constants::INTENSITY_UNKNOWN;
    }
    return constants::INTENSITY_UNKNOWN;
}

double MetricsCalculator::effort_score(const Nullable<ZoneMinutes>& zones,
                                       double moving_time_s,
                                       ActivityClass activity_class,
                                       const Thresholds& th) noexcept {
    if (zones) {
        return effort_from_zones(*zones, th);
    }
    return std::max(0.0, moving_time_s) / 60.0 * intensity_multiplier(activity_class);
}

}  // namespace tsig::metrics
