/**
 * @file test_stats.cpp
 * @brief Capture and replay counter tests
 */

#include "stats.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace glos;

TEST(CaptureStatsTest, DerivedRates) {
    CaptureStats stats;
    stats.add_samples_recorded(3000000);
    stats.record_drop(1000000);
    stats.add_bytes_written(12000000);
    stats.increment_blocks_written();
    stats.increment_blocks_written();

    EXPECT_DOUBLE_EQ(stats.drop_rate_pct(), 25.0);
    EXPECT_DOUBLE_EQ(stats.throughput_msps(1.5), 2.0);
    EXPECT_DOUBLE_EQ(stats.write_speed_mbps(2.0), 6.0);
    EXPECT_DOUBLE_EQ(stats.throughput_msps(0.0), 0.0);

    CaptureSummary s = stats.summary(1.5);
    EXPECT_EQ(s.samples_recorded, 3000000u);
    EXPECT_EQ(s.blocks_written, 2u);
    EXPECT_EQ(s.dropped_samples, 1000000u);
    EXPECT_EQ(s.dropped_chunks, 1u);
    EXPECT_DOUBLE_EQ(s.duration_sec, 1.5);
}

TEST(CaptureStatsTest, NoSamplesMeansNoDrops) {
    CaptureStats stats;
    EXPECT_DOUBLE_EQ(stats.drop_rate_pct(), 0.0);
}

TEST(CaptureStatsTest, JsonAndPrint) {
    CaptureStats stats;
    stats.add_samples_recorded(500);
    stats.increment_write_errors();

    nlohmann::json j = stats.to_json();
    EXPECT_EQ(j["samples_recorded"].get<uint64_t>(), 500u);
    EXPECT_EQ(j["write_errors"].get<uint64_t>(), 1u);
    EXPECT_TRUE(j.contains("dropped"));

    std::ostringstream os;
    os.precision(4);
    stats.summary(1.0).print(os);
    EXPECT_NE(os.str().find("Write errors  : 1"), std::string::npos);
    EXPECT_EQ(os.precision(), 4);

    stats.reset();
    EXPECT_EQ(stats.samples_recorded(), 0u);
    EXPECT_EQ(stats.write_errors(), 0u);
}

TEST(ReplayStatsTest, AverageTimingError) {
    ReplayStats stats;
    EXPECT_DOUBLE_EQ(stats.avg_timing_error_us(), 0.0);

    stats.increment_packets_sent();
    stats.increment_packets_sent();
    stats.add_timing_error_ns(3000);
    stats.add_timing_error_ns(1000);
    EXPECT_DOUBLE_EQ(stats.avg_timing_error_us(), 2.0);

    stats.add_samples_sent(4000000);
    EXPECT_DOUBLE_EQ(stats.throughput_msps(2.0), 2.0);
}

TEST(ReplayStatsTest, Json) {
    ReplayStats stats;
    stats.increment_packets_sent();
    stats.add_bytes_sent(410);
    stats.increment_underruns();
    stats.increment_send_errors();
    stats.increment_loops();

    nlohmann::json j = stats.to_json();
    EXPECT_EQ(j["packets_sent"].get<uint64_t>(), 1u);
    EXPECT_EQ(j["bytes_sent"].get<uint64_t>(), 410u);
    EXPECT_EQ(j["underruns"].get<uint64_t>(), 1u);
    EXPECT_EQ(j["send_errors"].get<uint64_t>(), 1u);
    EXPECT_EQ(j["loops"].get<uint64_t>(), 1u);
    EXPECT_TRUE(j["timing"].contains("avg_error_us"));

    std::ostringstream os;
    stats.print_summary(os);
    EXPECT_NE(os.str().find("Underruns     : 1"), std::string::npos);
}
