/// @file src/metrics/drift.cpp
/// @brief Steady-state segment search and heart-rate drift.

#include "tsig/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace tsig::metrics {

namespace {

constexpr double MAX_BLOCK_INDEX = 1e12;

struct Block {
    std::size_t index  = 0;  ///< Block number counted from the first sample
    double      v_sum  = 0.0;
    double      hr_sum = 0.0;
    std::size_t paired = 0;
    bool        moving = true;

    [[nodiscard]] bool usable() const noexcept { return paired > 0 && moving; }
    [[nodiscard]] double speed() const noexcept { return v_sum / static_cast<double>(paired); }
};

/// Consecutive usable blocks [first, first + len) with their speed CV.
struct Run {
    std::size_t first = 0;
    std::size_t len   = 0;
    double      cv    = 0.0;
};

/// Blocks that hold at least one sample, in time order.
std::vector<Block> build_blocks(const preprocess::PreparedStreams& s, const Thresholds& th) {
    std::vector<Block> blocks;
    const auto& t  = s.time;
    const auto& v  = s.velocity;
    const auto& hr = s.heart_rate;
    if (t.empty() || v.size() != t.size() || hr.size() != t.size() ||
        !(th.steady_state_block_s > 0.0)) {
        return blocks;
    }

    for (std::size_t i = 0; i < t.size(); ++i) {
        const double pos = (t[i] - t[0]) / th.steady_state_block_s;
        if (!(pos < MAX_BLOCK_INDEX)) {
            break;
        }
        const auto idx = static_cast<std::size_t>(pos);
        if (blocks.empty() || blocks.back().index != idx) {
            blocks.push_back(Block{.index = idx});
        }
        Block& b = blocks.back();
        if (v[i] && *v[i] < th.stop_velocity_epsilon) {
            b.moving = false;
        }
        if (v[i] && hr[i]) {
            b.v_sum  += *v[i];
            b.hr_sum += *hr[i];
            ++b.paired;
        }
    }
    return blocks;
}

/// Greedy longest run: from every start, extend while the block-speed CV
/// of the run stays within the ceiling.
Run longest_run(const std::vector<Block>& blocks, const Thresholds& th) noexcept {
    Run best;
    for (std::size_t first = 0; first < blocks.size(); ++first) {
        if (blocks.size() - first <= best.len) {
            break;
        }
        double sum = 0.0, sum_sq = 0.0, cv = 0.0;
        std::size_t len = 0;
        for (std::size_t j = first; j < blocks.size(); ++j) {
            const Block& b = blocks[j];
            if (!b.usable() || (j > first && b.index != blocks[j - 1].index + 1)) {
                break;
            }
            const double sp  = b.speed();
            const double k   = static_cast<double>(len + 1);
            const double m   = (sum + sp) / k;
            const double var = std::max(0.0, (sum_sq + sp * sp) / k - m * m);
            const double next_cv = m > 0.0 ? std::sqrt(var) / m * 100.0
                                           : std::numeric_limits<double>::infinity();
            if (next_cv > th.steady_state_cv_max) {
                break;
            }
            sum    += sp;
            sum_sq += sp * sp;
            cv      = next_cv;
            ++len;
        }
        if (len > best.len) {
            best = Run{first, len, cv};
        }
    }
    return best;
}

}  // namespace

std::optional<SteadySegment>
MetricsCalculator::longest_steady_segment(const preprocess::PreparedStreams& streams,
                                          const Thresholds& th) noexcept {
    const auto blocks = build_blocks(streams, th);
    const Run  run    = longest_run(blocks, th);
    if (run.len == 0) {
        return std::nullopt;
    }
    return SteadySegment{
        .start_s     = streams.time.front() +
                       static_cast<double>(blocks[run.first].index) * th.steady_state_block_s,
        .duration_s  = static_cast<double>(run.len) * th.steady_state_block_s,
        .block_count = run.len,
        .speed_cv    = run.cv,
    };
}

Nullable<double>
MetricsCalculator::hr_drift(const std::optional<preprocess::PreparedStreams>& streams,
                            const Thresholds& th) noexcept {
    if (!streams) {
        return Nullable<double>::missing(DataGap::NoStreams);
    }
    if (!streams->has_data(Channel::HeartRate)) {
        return Nullable<double>::missing(DataGap::NoHeartRate);
    }
    if (!streams->has_data(Channel::Velocity)) {
        return Nullable<double>::missing(DataGap::NoVelocity);
    }

    const auto blocks = build_blocks(*streams, th);
    const Run  run    = longest_run(blocks, th);
    if (static_cast<double>(run.len) * th.steady_state_block_s < th.steady_state_min_s ||
        run.len < 2) {
        return Nullable<double>::missing(DataGap::NoSteadyState);
    }

    // HR/v of a half, pooled over its paired samples.
    auto pooled_ratio = [&](std::size_t a, std::size_t b) {
        double v = 0.0, hr = 0.0;
        for (std::size_t j = a; j < b; ++j) {
            v  += blocks[j].v_sum;
            hr += blocks[j].hr_sum;
        }
        return v > 0.0 ? hr / v : 0.0;
    };
    const std::size_t mid = run.first + run.len / 2;
    const double r1 = pooled_ratio(run.first, mid);
    const double r2 = pooled_ratio(mid, run.first + run.len);
    if (!(r1 > 0.0) || !std::isfinite(r2)) {
        return Nullable<double>::missing(DataGap::InsufficientSamples);
    }
    return Nullable<double>::of((r2 / r1 - 1.0) * 100.0);
}

}  // namespace tsig::metrics
