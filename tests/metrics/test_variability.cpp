/// @file tests/metrics/test_variability.cpp
/// @brief Unit tests for pace, heart-rate and grade variability.
///
/// Test categories:
///   - Pace CV from stream splits, velocity-sample fallback, data gaps
///   - Heart-rate CV sample minimum
///   - Grade standard deviation from stream and from splits

#include <gtest/gtest.h>
#include "tsig/metrics.hpp"

#include <cmath>
#include <vector>

using namespace tsig;
using namespace tsig::metrics;
using preprocess::PreparedStreams;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Split paced_split(SplitKind kind, double pace) {
    Split s;
    s.kind          = kind;
    s.duration_s    = 300.0;
    s.pace_s_per_km = pace;
    return s;
}

static Split graded_split(double grade) {
    Split s;
    s.kind      = SplitKind::Distance;
    s.avg_grade = grade;
    return s;
}

/// `n` samples alternating between `a` and `b` on the given channel.
static PreparedStreams alternating(std::size_t n, Channel c, double a, double b) {
    PreparedStreams p;
    Series values;
    for (std::size_t i = 0; i < n; ++i) {
        p.time.push_back(static_cast<double>(i));
        values.push_back(i % 2 == 0 ? a : b);
    }
    switch (c) {
        case Channel::Velocity:  p.velocity   = values; break;
        case Channel::HeartRate: p.heart_rate = values; break;
        case Channel::Grade:     p.grade      = values; break;
        default: break;
    }
    return p;
}

// ─── Pace ─────────────────────────────────────────────────────────────────────

TEST(PaceVariability, FromStreamSplits) {
    const std::vector<Split> splits = {
        paced_split(SplitKind::Distance, 300.0),
        paced_split(SplitKind::Distance, 360.0),
    };
    const auto cv = MetricsCalculator::pace_variability(splits, std::nullopt);
    ASSERT_TRUE(cv.has_value());
    EXPECT_NEAR(*cv, 30.0 / 330.0 * 100.0, 1e-9);
}

TEST(PaceVariability, EvenPacingIsZero) {
    const std::vector<Split> splits(5, paced_split(SplitKind::Time, 300.0));
    const auto cv = MetricsCalculator::pace_variability(splits, std::nullopt);
    ASSERT_TRUE(cv.has_value());
    EXPECT_DOUBLE_EQ(*cv, 0.0);
}

TEST(PaceVariability, SummarySplitsIgnored) {
    const std::vector<Split> splits(5, paced_split(SplitKind::Summary, 300.0));
    const auto cv = MetricsCalculator::pace_variability(splits, std::nullopt);
    ASSERT_FALSE(cv.has_value());
    EXPECT_EQ(cv.gap(), DataGap::NoStreams);
}

TEST(PaceVariability, VelocitySampleFallback) {
    const auto p  = alternating(100, Channel::Velocity, 2.0, 4.0);
    const auto cv = MetricsCalculator::pace_variability({}, p);
    ASSERT_TRUE(cv.has_value());
    EXPECT_NEAR(*cv, 100.0 / 3.0, 1e-9);
}

TEST(PaceVariability, StoppedSamplesExcluded) {
    auto p = alternating(100, Channel::Velocity, 3.0, 3.0);
    for (std::size_t i = 0; i < 20; ++i) p.velocity[i] = 0.0;
    const auto cv = MetricsCalculator::pace_variability({}, p);
    ASSERT_TRUE(cv.has_value());
    EXPECT_DOUBLE_EQ(*cv, 0.0);
}

TEST(PaceVariability, TooFewSamples) {
    const auto cv = MetricsCalculator::pace_variability({}, alternating(30, Channel::Velocity, 3.0, 3.0));
    ASSERT_FALSE(cv.has_value());
    EXPECT_EQ(cv.gap(), DataGap::InsufficientSamples);
}

TEST(PaceVariability, NoVelocity) {
    const auto cv = MetricsCalculator::pace_variability({}, alternating(100, Channel::HeartRate, 140.0, 150.0));
    ASSERT_FALSE(cv.has_value());
    EXPECT_EQ(cv.gap(), DataGap::NoVelocity);
}

// ─── Heart rate ───────────────────────────────────────────────────────────────

TEST(HeartRateVariability, ConstantIsZero) {
    const auto cv = MetricsCalculator::heart_rate_variability(
        alternating(100, Channel::HeartRate, 150.0, 150.0));
    ASSERT_TRUE(cv.has_value());
    EXPECT_DOUBLE_EQ(*cv, 0.0);
}

TEST(HeartRateVariability, Alternating) {
    const auto cv = MetricsCalculator::heart_rate_variability(
        alternating(100, Channel::HeartRate, 140.0, 160.0));
    ASSERT_TRUE(cv.has_value());
    EXPECT_NEAR(*cv, 10.0 / 150.0 * 100.0, 1e-9);
}

TEST(HeartRateVariability, Gaps) {
    EXPECT_EQ(MetricsCalculator::heart_rate_variability(std::nullopt).gap(), DataGap::NoStreams);
    EXPECT_EQ(MetricsCalculator::heart_rate_variability(
                  alternating(100, Channel::Velocity, 3.0, 3.0)).gap(),
              DataGap::NoHeartRate);
    EXPECT_EQ(MetricsCalculator::heart_rate_variability(
                  alternating(10, Channel::HeartRate, 150.0, 150.0)).gap(),
              DataGap::InsufficientSamples);
}

// ─── Grade ────────────────────────────────────────────────────────────────────

TEST(GradeVariability, FromGradeStream) {
    const auto sd = MetricsCalculator::grade_variability(
        {}, alternating(100, Channel::Grade, -5.0, 5.0));
    ASSERT_TRUE(sd.has_value());
    EXPECT_DOUBLE_EQ(*sd, 5.0);
}

TEST(GradeVariability, FromSplitGrades) {
    const std::vector<Split> splits = {graded_split(0.0), graded_split(3.0), graded_split(6.0)};
    const auto sd = MetricsCalculator::grade_variability(
        splits, alternating(100, Channel::Velocity, 3.0, 3.0));
    ASSERT_TRUE(sd.has_value());
    EXPECT_NEAR(*sd, std::sqrt(6.0), 1e-9);
}

TEST(GradeVariability, Gaps) {
    EXPECT_EQ(MetricsCalculator::grade_variability({}, std::nullopt).gap(), DataGap::NoStreams);
    EXPECT_EQ(MetricsCalculator::grade_variability(
                  {}, alternating(100, Channel::Velocity, 3.0, 3.0)).gap(),
              DataGap::NoGrade);
}
