/// @file src/core/streams.cpp
/// @brief Channel names and StreamSet accessors.

#include "tsig/streams.hpp"

#include <algorithm>
#include <utility>

namespace tsig {

const char* to_string(Channel c) noexcept {
    switch (c) {
        case Channel::Time:      return "time";
        case Channel::Distance:  return "distance";
        case Channel::Velocity:  return "velocity";
        case Channel::HeartRate: return "heart_rate";
        case Channel::Cadence:   return "cadence";
        case Channel::Altitude:  return "altitude";
        case Channel::Grade:     return "grade";
        case Channel::Power:     return "power";
        case Channel::Latitude:  return "latitude";
        case Channel::Longitude: return "longitude";
    }
    return "time";
}

std::optional<Channel> parse_channel(std::string_view name) noexcept {
    for (const Channel c : ALL_CHANNELS) {
        if (name == to_string(c)) {
            return c;
        }
    }
    if (name == "heartrate")       return Channel::HeartRate;
    if (name == "velocity_smooth") return Channel::Velocity;
    if (name == "watts")           return Channel::Power;
    if (name == "grade_smooth")    return Channel::Grade;
    if (name == "lat")             return Channel::Latitude;
    if (name == "lng")             return Channel::Longitude;
    return std::nullopt;
}

// ─── StreamSet ────────────────────────────────────────────────────────────────

void StreamSet::set(Channel channel, Series samples) {
    channels_[channel] = std::move(samples);
}

const Series* StreamSet::find(Channel channel) const noexcept {
    const auto it = channels_.find(channel);
    return it == channels_.end() ? nullptr : &it->second;
}

bool StreamSet::has(Channel channel) const noexcept {
    return channels_.count(channel) != 0;
}

bool StreamSet::has_data(Channel channel) const noexcept {
    return count_present(channel) > 0;
}

std::size_t StreamSet::length() const noexcept {
    const Series* t = find(Channel::Time);
    return t ? t->size() : 0;
}

std::size_t StreamSet::count_present(Channel channel) const noexcept {
    const Series* s = find(channel);
    if (!s) {
        return 0;
    }
    return static_cast<std::size_t>(
        std::count_if(s->begin(), s->end(), [](const Sample& x) { return x.has_value(); }));
}

}  // namespace tsig
