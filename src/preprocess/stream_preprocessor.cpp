/// @file src/preprocess/stream_preprocessor.cpp
/// @brief StreamPreprocessor implementation.

#include "tsig/preprocess.hpp"
#include "tsig/cadence.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace tsig::preprocess {

namespace {

const Series EMPTY_SERIES{};

/// Gather the kept indices of one raw channel; non-finite values become null.
Series gather(const StreamSet& raw, Channel c, const std::vector<std::size_t>& keep) {
    const Series* src = raw.find(c);
    if (!src) {
        return {};
    }
    Series out;
    out.reserve(keep.size());
    for (const std::size_t idx : keep) {
        const Sample& s = (*src)[idx];
        out.push_back(s && std::isfinite(*s) ? s : Sample{});
    }
    return out;
}

/// Null every sample above `max`; returns how many were nulled.
std::size_t exclude_above(Series& s, double max) noexcept {
    std::size_t n = 0;
    for (auto& x : s) {
        if (x && *x > max) {
            x.reset();
            ++n;
        }
    }
    return n;
}

bool series_has_data(const Series& s) noexcept {
    for (const auto& x : s) {
        if (x) return true;
    }
    return false;
}

}  // namespace

// ─── PreparedStreams ──────────────────────────────────────────────────────────

const Series& PreparedStreams::channel(Channel c) const noexcept {
    switch (c) {
        case Channel::Distance:  return distance;
        case Channel::Velocity:  return velocity;
        case Channel::HeartRate: return heart_rate;
        case Channel::Cadence:   return cadence;
        case Channel::Altitude:  return altitude;
        case Channel::Grade:     return grade;
        case Channel::Power:     return power;
        case Channel::Latitude:  return latitude;
        case Channel::Longitude: return longitude;
        case Channel::Time:      break;
    }
    return EMPTY_SERIES;
}

bool PreparedStreams::has_data(Channel c) const noexcept {
    if (c == Channel::Time) {
        return !time.empty();
    }
    return series_has_data(channel(c));
}

// ─── StreamPreprocessor::validate ─────────────────────────────────────────────

void StreamPreprocessor::validate(const StreamSet& raw) {
    if (raw.empty()) {
        return;
    }
    if (!raw.has(Channel::Time)) {
        throw ValidationError("stream set has channels but no time channel");
    }
    const std::size_t n = raw.length();
    for (const Channel c : ALL_CHANNELS) {
        const Series* s = raw.find(c);
        if (s && s->size() != n) {
            throw ValidationError(fmt::format(
                "stream channel '{}' has {} samples, time channel has {}",
                to_string(c), s->size(), n));
        }
    }
}

// ─── StreamPreprocessor::derive_velocity ──────────────────────────────────────

Series StreamPreprocessor::derive_velocity(const std::vector<double>& time,
                                           const Series& distance) {
    const std::size_t n = std::min(time.size(), distance.size());
    Series v(n);
    for (std::size_t i = 1; i < n; ++i) {
        if (!distance[i] || !distance[i - 1]) {
            continue;
        }
        const double dd = *distance[i] - *distance[i - 1];
        const double dt = time[i] - time[i - 1];
        if (dd >= 0.0 && dt > 0.0) {
            v[i] = dd / dt;
        }
    }
    if (n >= 2) {
        v[0] = v[1];
    }
    return v;
}

// ─── StreamPreprocessor::prepare ──────────────────────────────────────────────

PreparedStreams
StreamPreprocessor::prepare(const StreamSet& raw, SportType type, const Thresholds& th) {
    validate(raw);

    PreparedStreams out;
    if (raw.empty()) {
        return out;
    }

    // ── Step 1: strictly increasing time index ────────────────────────────────
    const Series& t = *raw.find(Channel::Time);
    std::vector<std::size_t> keep;
    keep.reserve(t.size());
    double last = -std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < t.size(); ++i) {
        if (t[i] && std::isfinite(*t[i]) && *t[i] > last) {
            keep.push_back(i);
            last = *t[i];
        }
    }
    out.dropped_samples = t.size() - keep.size();
    out.time.reserve(keep.size());
    for (const std::size_t idx : keep) {
        out.time.push_back(*t[idx]);
    }

    // ── Step 2: align every other channel to the kept indices ─────────────────
    out.distance   = gather(raw, Channel::Distance, keep);
    out.velocity   = gather(raw, Channel::Velocity, keep);
    out.heart_rate = gather(raw, Channel::HeartRate, keep);
    out.cadence    = gather(raw, Channel::Cadence, keep);
    out.altitude   = gather(raw, Channel::Altitude, keep);
    out.grade      = gather(raw, Channel::Grade, keep);
    out.power      = gather(raw, Channel::Power, keep);
    out.latitude   = gather(raw, Channel::Latitude, keep);
    out.longitude  = gather(raw, Channel::Longitude, keep);

    // ── Step 3: exclude implausible heart rate ────────────────────────────────
    for (auto& hr : out.heart_rate) {
        if (hr && (*hr < th.hr_plausible_min || *hr > th.hr_plausible_max)) {
            hr.reset();
            ++out.hr_excluded;
        }
    }

    // ── Step 4: cadence spikes and convention ─────────────────────────────────
    out.cadence_excluded = exclude_above(out.cadence, th.cadence_plausible_max);
    out.cadence_doubled =
        units::CadenceNormalizer::stream_needs_doubling(out.cadence, type, th.run_cadence_doubling);
    out.cadence = units::CadenceNormalizer::normalize_stream(out.cadence, type,
                                                             th.run_cadence_doubling);
    out.cadence_excluded += exclude_above(out.cadence, th.cadence_plausible_max);

    // ── Step 5: velocity from distance when not recorded ──────────────────────
    if (!series_has_data(out.velocity) && series_has_data(out.distance)) {
        out.velocity         = derive_velocity(out.time, out.distance);
        out.velocity_derived = true;
    }

    // ── Step 6: zero cadence while moving is a dropout ────────────────────────
    if (is_running(type) && out.velocity.size() == out.cadence.size()) {
        for (std::size_t i = 0; i < out.cadence.size(); ++i) {
            auto&       c = out.cadence[i];
            const auto& v = out.velocity[i];
            if (c && *c == 0.0 && v && *v > th.stop_velocity_epsilon) {
                c.reset();
                ++out.cadence_dropouts;
            }
        }
    }

    return out;
}

}  // namespace tsig::preprocess
