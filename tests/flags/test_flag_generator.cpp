/// @file tests/flags/test_flag_generator.cpp
/// @brief Unit tests for FlagGenerator.
///
/// Test categories:
///   - Heart-rate and GPS quality counters from prepared streams
///   - Each flag check: raised, not raised, not evaluated
///   - Threshold widening under low preliminary confidence
///   - Evaluation order and the not-evaluated list

#include <gtest/gtest.h>
#include "tsig/flags.hpp"

#include <algorithm>
#include <vector>

using namespace tsig;
using namespace tsig::flags;
using preprocess::PreparedStreams;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static PreparedStreams hr_stream(const std::vector<double>& hr) {
    PreparedStreams p;
    for (std::size_t i = 0; i < hr.size(); ++i) {
        p.time.push_back(static_cast<double>(i));
        p.heart_rate.push_back(hr[i]);
    }
    return p;
}

static PreparedStreams velocity_stream(const std::vector<double>& v) {
    PreparedStreams p;
    for (std::size_t i = 0; i < v.size(); ++i) {
        p.time.push_back(static_cast<double>(i));
        p.velocity.push_back(v[i]);
    }
    return p;
}

static FlagContext medium_context() {
    FlagContext ctx;
    ctx.preliminary = Confidence::Medium;
    return ctx;
}

static CheckIn check_in_with_pain(int pain) {
    CheckIn c;
    c.pain_score = pain;
    return c;
}

// ─── Heart-rate quality ───────────────────────────────────────────────────────

TEST(HrQualityCounters, Flatline) {
    const auto q = FlagGenerator::hr_quality(hr_stream(std::vector<double>(120, 150.0)));
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->samples, 120u);
    EXPECT_EQ(q->jumps, 0u);
    EXPECT_DOUBLE_EQ(q->longest_flat_s, 119.0);
}

TEST(HrQualityCounters, Jumps) {
    std::vector<double> hr;
    for (int i = 0; i < 120; ++i) hr.push_back(i % 2 == 0 ? 120.0 : 160.0);
    const auto q = FlagGenerator::hr_quality(hr_stream(hr));
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->jumps, 119u);
    EXPECT_DOUBLE_EQ(q->longest_flat_s, 0.0);
}

TEST(HrQualityCounters, FlatlineRestartsAfterDropout) {
    PreparedStreams p;
    for (int i = 0; i < 190; ++i) {
        p.time.push_back(static_cast<double>(i));
        const bool dropout = i >= 80 && i < 110;
        p.heart_rate.push_back(dropout ? Sample{} : Sample{150.0});
    }
    const auto q = FlagGenerator::hr_quality(p);
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->samples, 160u);
    EXPECT_DOUBLE_EQ(q->longest_flat_s, 79.0);

    auto ctx = medium_context();
    ctx.hr_quality = q;
    EXPECT_FALSE(FlagGenerator::evaluate(ctx).has(Flag::DataLowConfidenceHr));
}

TEST(HrQualityCounters, ExcludedCarriedOver) {
    auto p = hr_stream(std::vector<double>(10, 150.0));
    p.hr_excluded = 3;
    const auto q = FlagGenerator::hr_quality(p);
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->excluded, 3u);
}

TEST(HrQualityCounters, NoHeartRateStream) {
    EXPECT_FALSE(FlagGenerator::hr_quality(velocity_stream({3.0, 3.0})).has_value());
}

// ─── GPS quality ──────────────────────────────────────────────────────────────

TEST(GpsQualityCounters, SpikesAgainstLocalMedian) {
    std::vector<double> v(100, 3.0);
    for (std::size_t i : {10u, 30u, 50u, 70u, 90u}) v[i] = 20.0;
    const auto q = FlagGenerator::gps_quality(velocity_stream(v));
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->samples, 100u);
    EXPECT_EQ(q->spikes, 5u);
}

TEST(GpsQualityCounters, SmallExcursionIsNotSpike) {
    std::vector<double> v(100, 3.0);
    v[50] = 4.5;
    const auto q = FlagGenerator::gps_quality(velocity_stream(v));
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->spikes, 0u);
}

TEST(GpsQualityCounters, NoVelocity) {
    EXPECT_FALSE(FlagGenerator::gps_quality(hr_stream({150.0})).has_value());
}

// ─── Data quality checks ──────────────────────────────────────────────────────

TEST(FlagChecks, HrFlatlineRaised) {
    auto ctx = medium_context();
    ctx.hr_quality = FlagGenerator::hr_quality(hr_stream(std::vector<double>(120, 150.0)));
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::DataLowConfidenceHr));
}

TEST(FlagChecks, HrFlatlineWidenedAtLowConfidence) {
    // 99 s flat: over 90 s, under the widened 112.5 s.
    auto ctx = medium_context();
    ctx.hr_quality = FlagGenerator::hr_quality(hr_stream(std::vector<double>(100, 150.0)));
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::DataLowConfidenceHr));

    ctx.preliminary = Confidence::Low;
    EXPECT_FALSE(FlagGenerator::evaluate(ctx).has(Flag::DataLowConfidenceHr));
}

TEST(FlagChecks, HrJumpsRaised) {
    std::vector<double> hr;
    for (int i = 0; i < 120; ++i) hr.push_back(i % 2 == 0 ? 120.0 : 160.0);
    auto ctx = medium_context();
    ctx.hr_quality = FlagGenerator::hr_quality(hr_stream(hr));
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::DataLowConfidenceHr));
}

TEST(FlagChecks, CleanHeartRateNotRaised) {
    std::vector<double> hr;
    for (int i = 0; i < 300; ++i) hr.push_back(140.0 + static_cast<double>(i % 10));
    auto ctx = medium_context();
    ctx.hr_quality = FlagGenerator::hr_quality(hr_stream(hr));
    const auto report = FlagGenerator::evaluate(ctx);
    EXPECT_FALSE(report.has(Flag::DataLowConfidenceHr));
}

TEST(FlagChecks, HrExcludedFraction) {
    auto ctx = medium_context();
    ctx.hr_quality = HrQuality{.samples = 100, .excluded = 10};
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::DataLowConfidenceHr));
}

TEST(FlagChecks, ShortHrStreamNotEvaluated) {
    auto ctx = medium_context();
    ctx.hr_quality = HrQuality{.samples = 30};
    const auto report = FlagGenerator::evaluate(ctx);
    ASSERT_FALSE(report.not_evaluated.empty());
    EXPECT_EQ(report.not_evaluated.front(), Flag::DataLowConfidenceHr);
}

TEST(FlagChecks, GpsSpikesRaised) {
    std::vector<double> v(100, 3.0);
    for (std::size_t i : {10u, 30u, 50u, 70u, 90u}) v[i] = 20.0;
    auto ctx = medium_context();
    ctx.gps_quality = FlagGenerator::gps_quality(velocity_stream(v));
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::GpsLowConfidence));
}

// ─── Training checks ──────────────────────────────────────────────────────────

TEST(FlagChecks, IntensityTooHighForEasy) {
    auto ctx = medium_context();
    ctx.activity_class = ActivityClass::Easy;
    ctx.zones = ZoneMinutes{.minutes = {10.0, 10.0, 5.0, 5.0, 0.0}};
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::IntensityTooHighForEasy));

    ctx.zones = ZoneMinutes{.minutes = {20.0, 20.0, 5.0, 0.0, 0.0}};
    EXPECT_FALSE(FlagGenerator::evaluate(ctx).has(Flag::IntensityTooHighForEasy));
}

TEST(FlagChecks, IntensityCountsTimeBelowZoneOne) {
    auto ctx = medium_context();
    ctx.activity_class = ActivityClass::Unknown;
    ctx.user_intent    = ActivityClass::Easy;
    ctx.zones = ZoneMinutes{.minutes = {0.0, 0.0, 10.0, 0.0, 0.0}, .below_z1_minutes = 60.0};
    auto report = FlagGenerator::evaluate(ctx);
    EXPECT_FALSE(report.has(Flag::IntensityTooHighForEasy));

    ctx.zones = ZoneMinutes{.minutes = {0.0, 0.0, 30.0, 0.0, 0.0}, .below_z1_minutes = 60.0};
    report = FlagGenerator::evaluate(ctx);
    EXPECT_TRUE(report.has(Flag::IntensityTooHighForEasy));
}

TEST(FlagChecks, IntensityAllBelowZoneOneIsEvaluated) {
    auto ctx = medium_context();
    ctx.activity_class = ActivityClass::Easy;
    ctx.zones = ZoneMinutes{.below_z1_minutes = 45.0};
    const auto report = FlagGenerator::evaluate(ctx);
    EXPECT_FALSE(report.has(Flag::IntensityTooHighForEasy));
    for (const Flag f : report.not_evaluated) {
        EXPECT_NE(f, Flag::IntensityTooHighForEasy);
    }
}

TEST(FlagChecks, IntensityUsesUserIntent) {
    auto ctx = medium_context();
    ctx.activity_class = ActivityClass::Unknown;
    ctx.user_intent    = ActivityClass::Easy;
    ctx.zones = ZoneMinutes{.minutes = {0.0, 10.0, 30.0, 0.0, 0.0}};
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::IntensityTooHighForEasy));
}

TEST(FlagChecks, IntensityNotApplicableToHardSessions) {
    auto ctx = medium_context();
    ctx.activity_class = ActivityClass::Tempo;
    ctx.zones = ZoneMinutes{.minutes = {0.0, 0.0, 30.0, 10.0, 0.0}};
    const auto report = FlagGenerator::evaluate(ctx);
    EXPECT_FALSE(report.has(Flag::IntensityTooHighForEasy));
    for (const Flag f : report.not_evaluated) {
        EXPECT_NE(f, Flag::IntensityTooHighForEasy);
    }
}

TEST(FlagChecks, PaceUnstableOnTempo) {
    auto ctx = medium_context();
    ctx.activity_class = ActivityClass::Tempo;
    ctx.pace_cv = 18.0;
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::PaceUnstable));

    ctx.pace_cv = 12.0;
    EXPECT_FALSE(FlagGenerator::evaluate(ctx).has(Flag::PaceUnstable));
}

TEST(FlagChecks, PaceUnstableUsesUserIntent) {
    auto ctx = medium_context();
    ctx.activity_class = ActivityClass::Unknown;
    ctx.user_intent    = ActivityClass::Tempo;
    ctx.pace_cv = 22.0;
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::PaceUnstable));
}

TEST(FlagChecks, PaceUnstableOnlyForTempo) {
    auto ctx = medium_context();
    ctx.activity_class = ActivityClass::Easy;
    ctx.pace_cv = 30.0;
    const auto report = FlagGenerator::evaluate(ctx);
    EXPECT_FALSE(report.has(Flag::PaceUnstable));
    for (const Flag f : report.not_evaluated) {
        EXPECT_NE(f, Flag::PaceUnstable);
    }
}

TEST(FlagChecks, PaceUnstableNeedsPaceVariability) {
    auto ctx = medium_context();
    ctx.activity_class = ActivityClass::Tempo;
    const auto report = FlagGenerator::evaluate(ctx);
    EXPECT_FALSE(report.has(Flag::PaceUnstable));
    EXPECT_NE(std::find(report.not_evaluated.begin(), report.not_evaluated.end(),
                        Flag::PaceUnstable),
              report.not_evaluated.end());
}

TEST(FlagChecks, PaceUnstableWidenedAtLowConfidence) {
    auto ctx = medium_context();
    ctx.activity_class = ActivityClass::Tempo;
    ctx.pace_cv = 18.0;
    ctx.preliminary = Confidence::Low;
    EXPECT_FALSE(FlagGenerator::evaluate(ctx).has(Flag::PaceUnstable));
}

TEST(FlagChecks, FatigueFromDrift) {
    auto ctx = medium_context();
    ctx.hr_drift = 6.0;
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::FatiguePossible));

    ctx.preliminary = Confidence::Low;
    EXPECT_FALSE(FlagGenerator::evaluate(ctx).has(Flag::FatiguePossible));
}

TEST(FlagChecks, FatigueFromEffortOutlier) {
    auto ctx = medium_context();
    HistoryBaseline b;
    b.sample_count  = 10;
    b.effort_mean   = 100.0;
    b.effort_stddev = 20.0;
    ctx.baseline     = b;
    ctx.effort_score = 150.0;
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::FatiguePossible));

    ctx.effort_score = 130.0;
    EXPECT_FALSE(FlagGenerator::evaluate(ctx).has(Flag::FatiguePossible));
}

TEST(FlagChecks, LoadSpike) {
    auto ctx = medium_context();
    HistoryBaseline b;
    b.distance_7d_m  = 16000.0;
    b.distance_28d_m = 40000.0;
    ctx.baseline = b;
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::LoadSpike));

    b.distance_7d_m = 12000.0;
    ctx.baseline = b;
    EXPECT_FALSE(FlagGenerator::evaluate(ctx).has(Flag::LoadSpike));
}

// ─── Check-in checks ──────────────────────────────────────────────────────────

TEST(FlagChecks, PainLevels) {
    auto ctx = medium_context();

    ctx.check_in = check_in_with_pain(8);
    auto report = FlagGenerator::evaluate(ctx);
    EXPECT_TRUE(report.has(Flag::PainReported));
    EXPECT_TRUE(report.has(Flag::PainSevere));

    ctx.check_in = check_in_with_pain(5);
    report = FlagGenerator::evaluate(ctx);
    EXPECT_TRUE(report.has(Flag::PainReported));
    EXPECT_FALSE(report.has(Flag::PainSevere));

    ctx.check_in = check_in_with_pain(2);
    report = FlagGenerator::evaluate(ctx);
    EXPECT_FALSE(report.has(Flag::PainReported));
}

TEST(FlagChecks, IllnessOrExtremeFatigue) {
    auto ctx = medium_context();
    CheckIn c;
    c.illness    = true;
    ctx.check_in = c;
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::IllnessOrExtremeFatigue));

    CheckIn combo;
    combo.rpe           = 9;
    combo.sleep_quality = 1;
    combo.pain_score    = 5;
    ctx.check_in = combo;
    EXPECT_TRUE(FlagGenerator::evaluate(ctx).has(Flag::IllnessOrExtremeFatigue));

    combo.sleep_quality = 4;
    ctx.check_in = combo;
    EXPECT_FALSE(FlagGenerator::evaluate(ctx).has(Flag::IllnessOrExtremeFatigue));
}

// ─── Evaluation ───────────────────────────────────────────────────────────────

TEST(FlagEvaluate, EmptyContextNotEvaluated) {
    const auto report = FlagGenerator::evaluate(medium_context());
    EXPECT_TRUE(report.raised.empty());
    const std::vector<Flag> expected = {
        Flag::DataLowConfidenceHr, Flag::GpsLowConfidence, Flag::FatiguePossible,
        Flag::LoadSpike,           Flag::PainReported,     Flag::PainSevere,
        Flag::IllnessOrExtremeFatigue,
    };
    EXPECT_EQ(report.not_evaluated, expected);
}

TEST(FlagEvaluate, RaisedInTableOrder) {
    auto ctx = medium_context();
    ctx.check_in = check_in_with_pain(9);
    ctx.hr_drift = 8.0;
    const auto report = FlagGenerator::evaluate(ctx);
    const std::vector<Flag> expected = {Flag::FatiguePossible, Flag::PainReported, Flag::PainSevere};
    EXPECT_EQ(report.raised, expected);
}

TEST(FlagEvaluate, TableOrder) {
    const auto table = FlagGenerator::table();
    ASSERT_EQ(table.size(), 9u);
    EXPECT_EQ(table.front().flag, Flag::DataLowConfidenceHr);
    EXPECT_EQ(table.back().flag, Flag::IllnessOrExtremeFatigue);
}
