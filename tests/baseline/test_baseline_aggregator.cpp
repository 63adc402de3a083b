/// @file tests/baseline/test_baseline_aggregator.cpp
/// @brief Unit tests for BaselineAggregator.
///
/// Test categories:
///   - 28-day percentiles and 7-day / 28-day totals
///   - Load ratio, effort statistics, threshold pace
///   - Hard-session counting and recency
///   - Future, invalid and empty history

#include <gtest/gtest.h>
#include "tsig/baseline.hpp"

#include <limits>
#include <vector>

using namespace tsig;
using namespace tsig::baseline;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static constexpr double DAY   = 86400.0;
static constexpr double AS_OF = 100.0 * DAY;

static HistoryEntry entry(double age_days, double km, double moving_s,
                          std::optional<double> effort, bool hard = false) {
    return HistoryEntry{
        .start_time    = AS_OF - age_days * DAY,
        .distance_m    = km * 1000.0,
        .moving_time_s = moving_s,
        .effort_score  = effort,
        .hard          = hard,
    };
}

static std::vector<HistoryEntry> month_of_training() {
    return {
        entry(1.0, 10.0, 3000.0, 100.0, true),
        entry(2.0, 5.0, 1800.0, 60.0),
        entry(5.0, 8.0, 2400.0, 80.0, true),
        entry(10.0, 12.0, 4200.0, 120.0),
        entry(20.0, 6.0, 2000.0, 70.0),
        entry(27.0, 15.0, 5400.0, 150.0),
        entry(30.0, 20.0, 7200.0, 200.0, true),  // outside 28 days
        entry(-1.0, 50.0, 9000.0, 300.0, true),  // after as_of
    };
}

// ─── Windows ──────────────────────────────────────────────────────────────────

TEST(BaselineAggregator, SampleCountUsesTwentyEightDays) {
    const auto b = BaselineAggregator::aggregate(month_of_training(), AS_OF);
    EXPECT_EQ(b.sample_count, 6u);
    EXPECT_FALSE(b.is_thin());
}

TEST(BaselineAggregator, DurationAndDistancePercentiles) {
    const auto b = BaselineAggregator::aggregate(month_of_training(), AS_OF);
    EXPECT_DOUBLE_EQ(*b.duration_p50_s, 2700.0);
    EXPECT_DOUBLE_EQ(*b.duration_p80_s, 4200.0);
    EXPECT_DOUBLE_EQ(*b.distance_p50_m, 9000.0);
    EXPECT_DOUBLE_EQ(*b.distance_p80_m, 12000.0);
}

TEST(BaselineAggregator, WindowTotals) {
    const auto b = BaselineAggregator::aggregate(month_of_training(), AS_OF);
    EXPECT_DOUBLE_EQ(*b.distance_28d_m, 56000.0);
    EXPECT_DOUBLE_EQ(*b.distance_7d_m, 23000.0);
    EXPECT_DOUBLE_EQ(*b.moving_time_7d_s, 7200.0);
    EXPECT_DOUBLE_EQ(*b.moving_time_28d_s, 18800.0);
    EXPECT_NEAR(*b.weekly_load_ratio(), 23000.0 / 14000.0, 1e-12);
}

TEST(BaselineAggregator, SevenDayBoundaryIsExclusive) {
    const std::vector<HistoryEntry> h = {entry(7.0, 10.0, 3000.0, std::nullopt)};
    const auto b = BaselineAggregator::aggregate(h, AS_OF);
    EXPECT_DOUBLE_EQ(*b.distance_7d_m, 0.0);
    EXPECT_DOUBLE_EQ(*b.distance_28d_m, 10000.0);
}

// ─── Statistics ───────────────────────────────────────────────────────────────

TEST(BaselineAggregator, EffortStatistics) {
    const auto b = BaselineAggregator::aggregate(month_of_training(), AS_OF);
    ASSERT_TRUE(b.effort_mean.has_value());
    EXPECT_NEAR(*b.effort_mean, 580.0 / 6.0, 1e-9);
    ASSERT_TRUE(b.effort_stddev.has_value());
    EXPECT_GT(*b.effort_stddev, 0.0);
}

TEST(BaselineAggregator, ThresholdPaceIsFastestFifth) {
    const auto b = BaselineAggregator::aggregate(month_of_training(), AS_OF);
    ASSERT_TRUE(b.threshold_pace_s_per_km.has_value());
    EXPECT_DOUBLE_EQ(*b.threshold_pace_s_per_km, 300.0);
}

TEST(BaselineAggregator, HardSessions) {
    const auto b = BaselineAggregator::aggregate(month_of_training(), AS_OF);
    EXPECT_EQ(*b.hard_sessions_7d, 2);
    EXPECT_DOUBLE_EQ(*b.days_since_last_hard, 1.0);
}

TEST(BaselineAggregator, LastHardMayPredateWindow) {
    const std::vector<HistoryEntry> h = {
        entry(2.0, 5.0, 1800.0, std::nullopt),
        entry(40.0, 10.0, 3000.0, std::nullopt, true),
    };
    const auto b = BaselineAggregator::aggregate(h, AS_OF);
    EXPECT_EQ(*b.hard_sessions_7d, 0);
    EXPECT_DOUBLE_EQ(*b.days_since_last_hard, 40.0);
}

// ─── Edge cases ───────────────────────────────────────────────────────────────

TEST(BaselineAggregator, EmptyHistory) {
    const auto b = BaselineAggregator::aggregate({}, AS_OF);
    EXPECT_EQ(b.sample_count, 0u);
    EXPECT_TRUE(b.is_thin());
    EXPECT_FALSE(b.duration_p50_s.has_value());
    EXPECT_FALSE(b.effort_mean.has_value());
    EXPECT_DOUBLE_EQ(*b.distance_28d_m, 0.0);
    EXPECT_FALSE(b.weekly_load_ratio().has_value());
    EXPECT_FALSE(b.days_since_last_hard.has_value());
}

TEST(BaselineAggregator, InvalidEntriesSkipped) {
    std::vector<HistoryEntry> h = {entry(1.0, 10.0, 3000.0, 100.0)};
    h.push_back(entry(2.0, -5.0, 1800.0, 50.0));
    h.push_back(entry(3.0, std::numeric_limits<double>::quiet_NaN(), 1800.0, 50.0));
    const auto b = BaselineAggregator::aggregate(h, AS_OF);
    EXPECT_EQ(b.sample_count, 1u);
    EXPECT_DOUBLE_EQ(*b.effort_mean, 100.0);
}

TEST(BaselineAggregator, PaceOfEntry) {
    EXPECT_DOUBLE_EQ(*BaselineAggregator::pace_s_per_km(entry(1.0, 10.0, 3000.0, std::nullopt)), 300.0);
    EXPECT_FALSE(BaselineAggregator::pace_s_per_km(entry(1.0, 0.0, 3000.0, std::nullopt)).has_value());
}
