/// @file tests/confidence/test_confidence.cpp
/// @brief Unit tests for ConfidenceEstimator.
///
/// Test categories:
///   - Coverage from streams, summary, baseline and check-in
///   - Preliminary level
///   - Reason list order
///   - Finalization with quality flags and forced-low classifications

#include <gtest/gtest.h>
#include "tsig/confidence.hpp"

#include <string>
#include <vector>

using namespace tsig;
using namespace tsig::confidence;
using preprocess::PreparedStreams;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static PreparedStreams full_streams() {
    PreparedStreams p;
    p.time       = {0.0, 1.0, 2.0};
    p.velocity   = {3.0, 3.0, 3.0};
    p.heart_rate = {140.0, 141.0, 142.0};
    p.latitude   = {51.5, 51.5, 51.5};
    p.longitude  = {-0.1, -0.1, -0.1};
    return p;
}

static HistoryBaseline baseline_of(std::size_t n) {
    HistoryBaseline b;
    b.sample_count = n;
    return b;
}

static Coverage full_coverage() {
    return Coverage{
        .has_streams   = true,
        .has_hr_stream = true,
        .has_any_hr    = true,
        .has_gps       = true,
        .baseline      = BaselineState::Sufficient,
        .has_check_in  = true,
    };
}

// ─── Coverage ─────────────────────────────────────────────────────────────────

TEST(ConfidenceCoverage, FullInputs) {
    const auto cov = ConfidenceEstimator::coverage(full_streams(), ActivitySummary{},
                                                   baseline_of(10), CheckIn{});
    EXPECT_EQ(cov, full_coverage());
}

TEST(ConfidenceCoverage, SummaryOnly) {
    ActivitySummary s;
    s.avg_hr = 150.0;
    const auto cov = ConfidenceEstimator::coverage(std::nullopt, s, std::nullopt, std::nullopt);
    EXPECT_FALSE(cov.has_streams);
    EXPECT_FALSE(cov.has_hr_stream);
    EXPECT_TRUE(cov.has_any_hr);
    EXPECT_FALSE(cov.has_gps);
    EXPECT_EQ(cov.baseline, BaselineState::Absent);
    EXPECT_FALSE(cov.has_check_in);
}

TEST(ConfidenceCoverage, GpsNeedsBothCoordinates) {
    auto p = full_streams();
    p.longitude.clear();
    const auto cov = ConfidenceEstimator::coverage(p, ActivitySummary{}, std::nullopt, std::nullopt);
    EXPECT_FALSE(cov.has_gps);
}

TEST(ConfidenceCoverage, ThinBaseline) {
    const auto cov = ConfidenceEstimator::coverage(std::nullopt, ActivitySummary{},
                                                   baseline_of(3), std::nullopt);
    EXPECT_EQ(cov.baseline, BaselineState::Thin);
}

// ─── Preliminary ──────────────────────────────────────────────────────────────

TEST(ConfidencePreliminary, Levels) {
    auto cov = full_coverage();
    EXPECT_EQ(ConfidenceEstimator::preliminary(cov), Confidence::High);

    cov.has_hr_stream = false;
    EXPECT_EQ(ConfidenceEstimator::preliminary(cov), Confidence::Medium);

    cov = full_coverage();
    cov.baseline = BaselineState::Thin;
    EXPECT_EQ(ConfidenceEstimator::preliminary(cov), Confidence::Low);

    cov = full_coverage();
    cov.has_streams = false;
    EXPECT_EQ(ConfidenceEstimator::preliminary(cov), Confidence::Low);
}

// ─── Reasons ──────────────────────────────────────────────────────────────────

TEST(ConfidenceReasons, FullCoverageHasNone) {
    EXPECT_TRUE(ConfidenceEstimator::coverage_reasons(full_coverage()).empty());
}

TEST(ConfidenceReasons, NothingAvailable) {
    const std::vector<std::string> expected = {
        "no_stream_data", "no_heart_rate_data", "no_baseline", "no_user_checkin",
    };
    EXPECT_EQ(ConfidenceEstimator::coverage_reasons(Coverage{}), expected);
}

TEST(ConfidenceReasons, StreamsWithoutHeartRateOrGps) {
    auto cov = full_coverage();
    cov.has_hr_stream = false;
    cov.has_gps       = false;
    cov.baseline      = BaselineState::Thin;
    const std::vector<std::string> expected = {
        "no_heart_rate_stream", "no_gps_data", "thin_baseline",
    };
    EXPECT_EQ(ConfidenceEstimator::coverage_reasons(cov), expected);
}

// ─── Finalize ─────────────────────────────────────────────────────────────────

TEST(ConfidenceFinalize, QualityFlagCapsAtMedium) {
    const std::vector<Flag> raised = {Flag::DataLowConfidenceHr};
    const auto a = ConfidenceEstimator::finalize(full_coverage(), {}, raised);
    EXPECT_EQ(a.level, Confidence::Medium);
    ASSERT_EQ(a.reasons.size(), 1u);
    EXPECT_EQ(a.reasons[0], "data_low_confidence_hr");
}

TEST(ConfidenceFinalize, OtherFlagsDoNotAffectConfidence) {
    const std::vector<Flag> raised = {Flag::LoadSpike, Flag::PainSevere};
    const auto a = ConfidenceEstimator::finalize(full_coverage(), {}, raised);
    EXPECT_EQ(a.level, Confidence::High);
    EXPECT_TRUE(a.reasons.empty());
}

TEST(ConfidenceFinalize, ForcedLowWithStreams) {
    classify::ClassificationResult c;
    c.force_low_confidence = true;
    const auto a = ConfidenceEstimator::finalize(full_coverage(), c, {});
    EXPECT_EQ(a.level, Confidence::Low);
    ASSERT_FALSE(a.reasons.empty());
    EXPECT_EQ(a.reasons.back(), "borderline_classification");
}

TEST(ConfidenceFinalize, ForcedLowSummaryOnly) {
    classify::ClassificationResult c;
    c.force_low_confidence = true;
    const auto a = ConfidenceEstimator::finalize(Coverage{}, c, {});
    EXPECT_EQ(a.level, Confidence::Low);
    EXPECT_EQ(a.reasons.front(), "no_stream_data");
    EXPECT_EQ(a.reasons.back(), "summary_only_classification");
}
