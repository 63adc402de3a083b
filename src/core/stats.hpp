#pragma once

/// @file src/core/stats.hpp
/// @brief Internal series reductions shared by the analysis modules.
///
/// Thin wrappers over `Eigen::Map<const Eigen::ArrayXd>` so no module
/// re-implements mean / stddev / CV by hand. All functions return
/// `nullopt` instead of dividing by zero or reducing an empty range.

#include "tsig/streams.hpp"

#include <optional>
#include <span>
#include <vector>

namespace tsig::stats {

[[nodiscard]] std::optional<double> mean(std::span<const double> xs) noexcept;

/// Population standard deviation (ddof = 0).
[[nodiscard]] std::optional<double> stddev(std::span<const double> xs) noexcept;

/// Bessel-corrected standard deviation (ddof = 1). Needs ≥ 2 values.
[[nodiscard]] std::optional<double> sample_stddev(std::span<const double> xs) noexcept;

/// Coefficient of variation as a percentage.
///
/// Returns exactly 0.0 when every value is identical, `nullopt` when the
/// range has fewer than `min_count` values or a non-positive mean.
[[nodiscard]] std::optional<double>
cv_percent(std::span<const double> xs, bool bessel = false, std::size_t min_count = 2) noexcept;

/// Linear-interpolation percentile, `p` in [0, 1]. Takes its input by value.
[[nodiscard]] std::optional<double> percentile(std::vector<double> xs, double p) noexcept;

[[nodiscard]] std::optional<double> median(std::vector<double> xs) noexcept;

/// Non-null, finite samples of a series in order.
[[nodiscard]] std::vector<double> present(const Series& s) noexcept;

/// Non-null, finite samples of `s` in the index range [first, last).
[[nodiscard]] std::vector<double>
present(const Series& s, std::size_t first, std::size_t last) noexcept;

}  // namespace tsig::stats
