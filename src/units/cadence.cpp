/// @file src/units/cadence.cpp
/// @brief CadenceNormalizer implementation.

#include "tsig/cadence.hpp"

#include <cmath>

namespace tsig::units {

namespace {

bool is_positive(const Sample& s) noexcept {
    return s && std::isfinite(*s) && *s > 0.0;
}

}  // namespace

std::optional<double>
CadenceNormalizer::normalize(std::optional<double> cadence,
                             SportType type,
                             double threshold) noexcept {
    if (!is_running(type) || !is_positive(cadence)) {
        return cadence;
    }
    if (*cadence < threshold) {
        return *cadence * 2.0;
    }
    return cadence;
}

bool CadenceNormalizer::stream_needs_doubling(const Series& cadence,
                                              SportType type,
                                              double threshold) noexcept {
    if (!is_running(type)) {
        return false;
    }
    double      sum   = 0.0;
    std::size_t count = 0;
    for (const auto& s : cadence) {
        if (is_positive(s)) {
            sum += *s;
            ++count;
        }
    }
    return count > 0 && (sum / static_cast<double>(count)) < threshold;
}

Series CadenceNormalizer::normalize_stream(const Series& cadence,
                                           SportType type,
                                           double threshold) {
    Series out = cadence;
    if (!stream_needs_doubling(cadence, type, threshold)) {
        return out;
    }
    for (auto& s : out) {
        if (is_positive(s)) {
            *s *= 2.0;
        }
    }
    return out;
}

}  // namespace tsig::units
