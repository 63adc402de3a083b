#pragma once

/// @file include/tsig/streams.hpp
/// @brief Channel-keyed sensor time series.
///
/// # Module: Streams
///
/// A `StreamSet` is a fixed set of typed channels (`Channel`), each a series
/// of nullable samples. There is no untyped payload: a channel either exists
/// with one sample slot per time index, or it does not exist.
///
/// ## Alignment
/// Every channel present must have exactly as many samples as the `Time`
/// channel. Alignment is checked at the preprocessing boundary; a mismatch is
/// a `ValidationError`.

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace tsig {

/// One nullable sample.
using Sample = std::optional<double>;

/// One channel's samples, index-aligned with the Time channel.
using Series = std::vector<Sample>;

// ─── Channel ──────────────────────────────────────────────────────────────────

/// Every stream channel the engine understands.
enum class Channel {
    Time,       ///< Seconds from activity start
    Distance,   ///< Cumulative metres
    Velocity,   ///< m/s (smoothed by the device or platform)
    HeartRate,  ///< bpm
    Cadence,    ///< spm (run) or rpm (ride); raw device convention
    Altitude,   ///< metres
    Grade,      ///< percent
    Power,      ///< watts
    Latitude,   ///< degrees
    Longitude,  ///< degrees
};

/// All channels in declaration order.
inline constexpr std::array<Channel, 10> ALL_CHANNELS = {
    Channel::Time,     Channel::Distance, Channel::Velocity, Channel::HeartRate,
    Channel::Cadence,  Channel::Altitude, Channel::Grade,    Channel::Power,
    Channel::Latitude, Channel::Longitude,
};

/// Stable lowercase name (also the CSV column header).
[[nodiscard]] const char* to_string(Channel c) noexcept;

/// Parse a column header into a channel. Accepts the canonical names plus
/// the common platform aliases ("heartrate", "velocity_smooth", "watts",
/// "grade_smooth", "lat", "lng").
[[nodiscard]] std::optional<Channel> parse_channel(std::string_view name) noexcept;

// ─── StreamSet ────────────────────────────────────────────────────────────────

/// Channel-keyed collection of sample series.
class StreamSet {
public:
    StreamSet() = default;

    /// Insert or replace a channel.
    void set(Channel channel, Series samples);

    /// Borrow a channel, or nullptr if absent.
    [[nodiscard]] const Series* find(Channel channel) const noexcept;

    /// True if the channel exists (it may still hold only nulls).
    [[nodiscard]] bool has(Channel channel) const noexcept;

    /// True if the channel exists and holds at least one non-null sample.
    [[nodiscard]] bool has_data(Channel channel) const noexcept;

    /// True if no channel is present.
    [[nodiscard]] bool empty() const noexcept { return channels_.empty(); }

    /// Number of samples in the Time channel (0 if absent).
    [[nodiscard]] std::size_t length() const noexcept;

    /// Count of non-null samples in a channel (0 if absent).
    [[nodiscard]] std::size_t count_present(Channel channel) const noexcept;

    bool operator==(const StreamSet&) const = default;

private:
    std::map<Channel, Series> channels_;
};

}  // namespace tsig
