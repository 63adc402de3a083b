/// @file tests/metrics/test_efficiency.cpp
/// @brief Unit tests for the rolling efficiency analysis.
///
/// Test categories:
///   - Constant effort: average, best and curve sampling
///   - Best sustained window after a speed increase
///   - Density and span requirements

#include <gtest/gtest.h>
#include "tsig/metrics.hpp"

using namespace tsig;
using namespace tsig::metrics;
using preprocess::PreparedStreams;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// 1 Hz stream: `v1` m/s before `switch_s`, `v2` after, HR constant.
static PreparedStreams paired(std::size_t n, double v1, double v2, double switch_s, double hr) {
    PreparedStreams p;
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        p.time.push_back(t);
        p.velocity.push_back(t < switch_s ? v1 : v2);
        p.heart_rate.push_back(hr);
    }
    return p;
}

// ─── Values ───────────────────────────────────────────────────────────────────

TEST(Efficiency, ConstantEffort) {
    const auto e = MetricsCalculator::efficiency(paired(600, 3.0, 3.0, 0.0, 150.0));
    ASSERT_TRUE(e.has_value());
    EXPECT_NEAR(e->average, 1.2, 1e-9);
    EXPECT_NEAR(e->best_sustained, 1.2, 1e-9);
}

TEST(Efficiency, CurveSampledEveryThirtySeconds) {
    const auto e = MetricsCalculator::efficiency(paired(600, 3.0, 3.0, 0.0, 150.0));
    ASSERT_TRUE(e.has_value());
    // Full windows start at t = 180; points at 180, 210, ..., 570.
    ASSERT_EQ(e->curve.size(), 14u);
    EXPECT_DOUBLE_EQ(e->curve.front().t_s, 180.0);
    EXPECT_DOUBLE_EQ(e->curve.back().t_s, 570.0);
    for (std::size_t i = 1; i < e->curve.size(); ++i) {
        EXPECT_DOUBLE_EQ(e->curve[i].t_s - e->curve[i - 1].t_s, 30.0);
    }
}

TEST(Efficiency, BestSustainedAfterSpeedIncrease) {
    const auto e = MetricsCalculator::efficiency(paired(600, 3.0, 4.0, 300.0, 150.0));
    ASSERT_TRUE(e.has_value());
    EXPECT_NEAR(e->best_sustained, 1.6, 1e-9);
    EXPECT_NEAR(e->average, 1.4, 1e-9);
}

TEST(Efficiency, StoppedSamplesIgnored) {
    auto p = paired(600, 3.0, 3.0, 0.0, 150.0);
    for (std::size_t i = 100; i < 120; ++i) p.velocity[i] = 0.0;
    const auto e = MetricsCalculator::efficiency(p);
    ASSERT_TRUE(e.has_value());
    EXPECT_NEAR(e->average, 1.2, 1e-9);
}

// ─── Requirements ─────────────────────────────────────────────────────────────

TEST(Efficiency, ShortSpanIsInsufficient) {
    const auto e = MetricsCalculator::efficiency(paired(120, 3.0, 3.0, 0.0, 150.0));
    ASSERT_FALSE(e.has_value());
    EXPECT_EQ(e.gap(), DataGap::InsufficientSamples);
}

TEST(Efficiency, SparsePairingIsInsufficient) {
    auto p = paired(600, 3.0, 3.0, 0.0, 150.0);
    for (std::size_t i = 0; i < p.size(); i += 3) p.heart_rate[i] = std::nullopt;
    const auto e = MetricsCalculator::efficiency(p);
    ASSERT_FALSE(e.has_value());
    EXPECT_EQ(e.gap(), DataGap::InsufficientSamples);
}

TEST(Efficiency, MissingChannels) {
    EXPECT_EQ(MetricsCalculator::efficiency(std::nullopt).gap(), DataGap::NoStreams);

    auto no_hr = paired(600, 3.0, 3.0, 0.0, 150.0);
    no_hr.heart_rate.clear();
    EXPECT_EQ(MetricsCalculator::efficiency(no_hr).gap(), DataGap::NoHeartRate);

    auto no_v = paired(600, 3.0, 3.0, 0.0, 150.0);
    no_v.velocity.clear();
    EXPECT_EQ(MetricsCalculator::efficiency(no_v).gap(), DataGap::NoVelocity);
}
