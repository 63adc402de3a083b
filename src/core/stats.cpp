/// @file src/core/stats.cpp
/// @brief Eigen-backed series reductions.

#include "stats.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <utility>

namespace tsig::stats {

namespace {

Eigen::Map<const Eigen::ArrayXd> as_array(std::span<const double> xs) noexcept {
    return Eigen::Map<const Eigen::ArrayXd>(xs.data(),
                                            static_cast<Eigen::Index>(xs.size()));
}

}  // namespace

std::optional<double> mean(std::span<const double> xs) noexcept {
    if (xs.empty()) {
        return std::nullopt;
    }
    return as_array(xs).mean();
}

std::optional<double> stddev(std::span<const double> xs) noexcept {
    if (xs.empty()) {
        return std::nullopt;
    }
    const auto a = as_array(xs);
    const double m = a.mean();
    return std::sqrt((a - m).square().mean());
}

std::optional<double> sample_stddev(std::span<const double> xs) noexcept {
    if (xs.size() < 2) {
        return std::nullopt;
    }
    const auto a = as_array(xs);
    const double m = a.mean();
    return std::sqrt((a - m).square().sum() / static_cast<double>(xs.size() - 1));
}

std::optional<double>
cv_percent(std::span<const double> xs, bool bessel, std::size_t min_count) noexcept {
    if (xs.size() < std::max<std::size_t>(min_count, 1)) {
        return std::nullopt;
    }
    const auto a = as_array(xs);
    const double m = a.mean();
    if (!std::isfinite(m) || m <= 0.0) {
        return std::nullopt;
    }
    // Identical values: report an exact zero rather than rounding noise.
    if (a.maxCoeff() == a.minCoeff()) {
        return 0.0;
    }
    const auto sd = bessel ? sample_stddev(xs) : stddev(xs);
    if (!sd) {
        return std::nullopt;
    }
    return *sd / m * 100.0;
}

std::optional<double> percentile(std::vector<double> xs, double p) noexcept {
    if (xs.empty() || !std::isfinite(p)) {
        return std::nullopt;
    }
    std::sort(xs.begin(), xs.end());
    const double clamped = std::clamp(p, 0.0, 1.0);
    const double rank    = clamped * static_cast<double>(xs.size() - 1);
    const auto   lo      = static_cast<std::size_t>(std::floor(rank));
    const auto   hi      = static_cast<std::size_t>(std::ceil(rank));
    const double frac    = rank - static_cast<double>(lo);
    return xs[lo] + (xs[hi] - xs[lo]) * frac;
}

std::optional<double> median(std::vector<double> xs) noexcept {
    return percentile(std::move(xs), 0.5);
}

std::vector<double> present(const Series& s) noexcept {
    return present(s, 0, s.size());
}

std::vector<double>
present(const Series& s, std::size_t first, std::size_t last) noexcept {
    std::vector<double> out;
    last = std::min(last, s.size());
    if (first >= last) {
        return out;
    }
    out.reserve(last - first);
    for (std::size_t i = first; i < last; ++i) {
        if (s[i] && std::isfinite(*s[i])) {
            out.push_back(*s[i]);
        }
    }
    return out;
}

}  // namespace tsig::stats
