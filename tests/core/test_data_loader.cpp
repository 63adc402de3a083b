/// @file tests/core/test_data_loader.cpp
/// @brief Unit tests for the CSV DataLoader.
///
/// Test categories:
///   - Numeric cell parsing
///   - Summary rows: required and defaulted columns, enum parsing
///   - Stream files: channel aliases, null cells, misaligned rows
///   - History files: required columns and the hard marker
///   - Missing files

#include <gtest/gtest.h>
#include "tsig/data_loader.hpp"

using namespace tsig;
using namespace tsig::core;

// ─── parse_number ─────────────────────────────────────────────────────────────

TEST(DataLoaderParseNumber, Valid) {
    EXPECT_DOUBLE_EQ(*DataLoader::parse_number("3.5"), 3.5);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_number("-12"), -12.0);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_number("1e3"), 1000.0);
}

TEST(DataLoaderParseNumber, Invalid) {
    EXPECT_FALSE(DataLoader::parse_number("").has_value());
    EXPECT_FALSE(DataLoader::parse_number("abc").has_value());
    EXPECT_FALSE(DataLoader::parse_number("3.5x").has_value());
    EXPECT_FALSE(DataLoader::parse_number("inf").has_value());
    EXPECT_FALSE(DataLoader::parse_number("nan").has_value());
}

// ─── Summary ──────────────────────────────────────────────────────────────────

TEST(DataLoaderSummary, FullRow) {
    const std::string csv =
        "type,distance_m,moving_time_s,elapsed_time_s,elevation_gain_m,avg_hr,max_hr,"
        "avg_cadence,avg_speed_mps,start_time,user_intent\n"
        "Run,10000,3000,3100,45,150,172,86,3.33,1700000000,Easy Run\n";
    const auto s = DataLoader::parse_summary_csv(csv);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->type, SportType::Run);
    EXPECT_DOUBLE_EQ(s->distance_m, 10000.0);
    EXPECT_DOUBLE_EQ(s->moving_time_s, 3000.0);
    EXPECT_DOUBLE_EQ(s->elapsed_time_s, 3100.0);
    EXPECT_DOUBLE_EQ(s->elevation_gain_m, 45.0);
    EXPECT_DOUBLE_EQ(*s->avg_hr, 150.0);
    EXPECT_DOUBLE_EQ(*s->max_hr, 172.0);
    EXPECT_DOUBLE_EQ(*s->avg_cadence, 86.0);
    EXPECT_DOUBLE_EQ(*s->avg_speed_mps, 3.33);
    EXPECT_DOUBLE_EQ(s->start_time, 1700000000.0);
    ASSERT_TRUE(s->user_intent.has_value());
    EXPECT_EQ(*s->user_intent, ActivityClass::Easy);
}

TEST(DataLoaderSummary, ColumnsInAnyOrderWithDefaults) {
    const std::string csv =
        "# exported summary\n"
        "Moving_Time_S,Type\n"
        "1800,TrailRun\n";
    const auto s = DataLoader::parse_summary_csv(csv);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->type, SportType::TrailRun);
    EXPECT_DOUBLE_EQ(s->moving_time_s, 1800.0);
    EXPECT_DOUBLE_EQ(s->elapsed_time_s, 1800.0);
    EXPECT_DOUBLE_EQ(s->distance_m, 0.0);
    EXPECT_FALSE(s->avg_hr.has_value());
    EXPECT_FALSE(s->user_intent.has_value());
}

TEST(DataLoaderSummary, EmptyCellsAreNull) {
    const std::string csv =
        "moving_time_s,avg_hr,max_hr\n"
        "1800,,\n";
    const auto s = DataLoader::parse_summary_csv(csv);
    ASSERT_TRUE(s.has_value());
    EXPECT_FALSE(s->avg_hr.has_value());
    EXPECT_FALSE(s->max_hr.has_value());
}

TEST(DataLoaderSummary, MovingTimeRequired) {
    EXPECT_FALSE(DataLoader::parse_summary_csv("distance_m\n10000\n").has_value());
    EXPECT_FALSE(DataLoader::parse_summary_csv("moving_time_s\n").has_value());
    EXPECT_FALSE(DataLoader::parse_summary_csv("").has_value());
}

// ─── Streams ──────────────────────────────────────────────────────────────────

TEST(DataLoaderStreams, ChannelsAndNullCells) {
    const std::string csv =
        "time,distance,heartrate,cadence\r\n"
        "0,0,120,84\r\n"
        "1,3.1,,85\r\n"
        "2,6.2,122,bad\r\n";
    const auto s = DataLoader::parse_streams_csv(csv);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->length(), 3u);
    ASSERT_TRUE(s->has(Channel::HeartRate));
    const Series& hr = *s->find(Channel::HeartRate);
    EXPECT_DOUBLE_EQ(*hr[0], 120.0);
    EXPECT_FALSE(hr[1].has_value());
    const Series& cad = *s->find(Channel::Cadence);
    EXPECT_FALSE(cad[2].has_value());
    EXPECT_DOUBLE_EQ(*s->find(Channel::Distance)->at(2), 6.2);
}

TEST(DataLoaderStreams, UnknownColumnsIgnored) {
    const std::string csv =
        "time,temperature,velocity_smooth\n"
        "0,21,3.0\n"
        "1,21,3.1\n";
    const auto s = DataLoader::parse_streams_csv(csv);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->has(Channel::Velocity));
    EXPECT_EQ(s->count_present(Channel::Velocity), 2u);
}

TEST(DataLoaderStreams, MisalignedRowSkipped) {
    const std::string csv =
        "time,heart_rate\n"
        "0,120\n"
        "1\n"
        "2,122\n";
    const auto s = DataLoader::parse_streams_csv(csv);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->length(), 2u);
}

TEST(DataLoaderStreams, NoChannelHeader) {
    EXPECT_FALSE(DataLoader::parse_streams_csv("foo,bar\n1,2\n").has_value());
}

// ─── History ──────────────────────────────────────────────────────────────────

TEST(DataLoaderHistory, Rows) {
    const std::string csv =
        "start_time,distance_m,moving_time_s,effort_score,hard\n"
        "1699900000,8000,2700,110,0\n"
        "1699990000,10000,3000,,yes\n"
        "1700000000,,3000,90,1\n";
    const auto h = DataLoader::parse_history_csv(csv);
    ASSERT_EQ(h.size(), 2u);
    EXPECT_DOUBLE_EQ(h[0].distance_m, 8000.0);
    EXPECT_DOUBLE_EQ(*h[0].effort_score, 110.0);
    EXPECT_FALSE(h[0].hard);
    EXPECT_FALSE(h[1].effort_score.has_value());
    EXPECT_TRUE(h[1].hard);
}

TEST(DataLoaderHistory, EmptyContent) {
    EXPECT_TRUE(DataLoader::parse_history_csv("").empty());
}

// ─── Files ────────────────────────────────────────────────────────────────────

TEST(DataLoaderFiles, MissingFiles) {
    EXPECT_FALSE(DataLoader::load_summary("/nonexistent/summary.csv").has_value());
    EXPECT_FALSE(DataLoader::load_streams("/nonexistent/streams.csv").has_value());
    EXPECT_FALSE(DataLoader::load_history("/nonexistent/history.csv").has_value());
}
