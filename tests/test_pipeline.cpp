/**
 * @file test_pipeline.cpp
 * @brief Capture pipeline tests with the simulated device
 */

#include "capture_pipeline.hpp"
#include "device.hpp"
#include "stream_reader.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <thread>

using namespace glos;

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "glos_test_pipeline";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        config_.output_path = (test_dir_ / "capture.glos").string();
        config_.block_samples = 10000;
        config_.channel_capacity = 32;
        config_.quiet = true;
    }

    void TearDown() override { std::filesystem::remove_all(test_dir_); }

    /**
     * @brief Non-realtime device producing chunks of 1000 samples
     */
    SimulatedDevice finite_device(uint64_t chunks) const {
        SimulatedDevice device(config_.sample_rate_hz, config_.center_freq_hz,
                               config_.gain_db, config_.sample_format);
        device.set_chunk_samples(1000);
        device.set_realtime(false);
        device.set_max_chunks(chunks);
        return device;
    }

    void read_back(std::vector<SampleBlock>& blocks, Header& header, ReadStats& stats) {
        ASSERT_EQ(read_all_blocks(config_.output_path, header, blocks, &stats), Status::Ok);
    }

    std::filesystem::path test_dir_;
    RecorderConfig config_;
};

TEST_F(PipelineTest, FiniteCaptureFlushesPartialBlock) {
    SimulatedDevice device = finite_device(25);
    CapturePipeline pipeline(config_);
    ASSERT_TRUE(pipeline.run(device));
    EXPECT_FALSE(pipeline.device_failed());

    EXPECT_EQ(pipeline.stats().samples_recorded(), 25000u);
    EXPECT_EQ(pipeline.stats().blocks_written(), 3u);
    EXPECT_EQ(pipeline.stats().dropped_chunks(), 0u);
    EXPECT_EQ(pipeline.stats().write_errors(), 0u);

    Header header;
    std::vector<SampleBlock> blocks;
    ReadStats stats;
    read_back(blocks, header, stats);

    EXPECT_TRUE(header.is_finalized());
    EXPECT_EQ(header.total_samples, 25000u);
    EXPECT_EQ(header.device_type, DeviceType::Unknown);
    EXPECT_EQ(header.center_freq, config_.center_freq_hz);
    EXPECT_EQ(stats.blocks_corrupted, 0u);

    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].sample_count, 10000u);
    EXPECT_EQ(blocks[1].sample_count, 10000u);
    EXPECT_EQ(blocks[2].sample_count, 5000u);
    for (const auto& b : blocks) {
        EXPECT_EQ(validate_sample_count(b, header.sample_format), Status::Ok);
    }

    // 10000 samples at 2 Msps
    EXPECT_EQ(blocks[1].timestamp_ns - blocks[0].timestamp_ns, 5000000u);
    EXPECT_EQ(blocks[2].timestamp_ns - blocks[1].timestamp_ns, 5000000u);

    EXPECT_EQ(pipeline.stats().bytes_written() + GLOS_HEADER_SIZE,
              std::filesystem::file_size(config_.output_path));
}

TEST_F(PipelineTest, BlockTakesFirstChunkTimestampAfterFlush) {
    config_.block_samples = 1000;
    SimulatedDevice device = finite_device(5);
    device.set_chunk_samples(600);
    CapturePipeline pipeline(config_);
    ASSERT_TRUE(pipeline.run(device));

    Header header;
    std::vector<SampleBlock> blocks;
    ReadStats stats;
    read_back(blocks, header, stats);

    // 3000 samples: blocks start at chunks 0, 2 and 4 (600 samples = 300 us)
    ASSERT_EQ(blocks.size(), 3u);
    for (const auto& b : blocks) {
        EXPECT_EQ(b.sample_count, 1000u);
    }
    EXPECT_EQ(blocks[1].timestamp_ns - blocks[0].timestamp_ns, 2 * 300000u);
    EXPECT_EQ(blocks[2].timestamp_ns - blocks[0].timestamp_ns, 4 * 300000u);
}

TEST_F(PipelineTest, RunCanBeRepeated) {
    SimulatedDevice device = finite_device(10);
    CapturePipeline pipeline(config_);
    ASSERT_TRUE(pipeline.run(device));
    EXPECT_EQ(pipeline.stats().samples_recorded(), 10000u);

    ASSERT_TRUE(pipeline.run(device));
    EXPECT_EQ(pipeline.stats().samples_recorded(), 10000u);

    Header header;
    std::vector<SampleBlock> blocks;
    ReadStats stats;
    read_back(blocks, header, stats);
    EXPECT_EQ(header.total_samples, 10000u);
    ASSERT_EQ(blocks.size(), 1u);
}

TEST_F(PipelineTest, StopFlagFinalizesFile) {
    SimulatedDevice device(config_.sample_rate_hz, config_.center_freq_hz, config_.gain_db);
    CapturePipeline pipeline(config_);

    std::thread stopper([&pipeline]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        pipeline.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(pipeline.run(device));
    stopper.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));

    Header header;
    std::vector<SampleBlock> blocks;
    ReadStats stats;
    read_back(blocks, header, stats);

    EXPECT_TRUE(header.is_finalized());
    EXPECT_GT(blocks.size(), 0u);
    EXPECT_EQ(stats.blocks_corrupted, 0u);
    EXPECT_EQ(header.total_samples, stats.samples_recovered);
}

TEST_F(PipelineTest, DurationLimit) {
    config_.duration_sec = 1;
    SimulatedDevice device(config_.sample_rate_hz, config_.center_freq_hz, config_.gain_db);
    CapturePipeline pipeline(config_);

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(pipeline.run(device));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, std::chrono::milliseconds(950));
    EXPECT_LT(elapsed, std::chrono::seconds(3));

    StreamReader reader;
    ASSERT_EQ(reader.open(config_.output_path), Status::Ok);
    SampleBlock block;
    while (reader.next_block(block)) {
        EXPECT_EQ(validate_sample_count(block, SampleFormat::Int16), Status::Ok);
    }
    EXPECT_EQ(reader.stats().blocks_corrupted, 0u);
    EXPECT_EQ(reader.validate_totals(), Status::Ok);
    // About 2 M samples in one second
    EXPECT_GT(reader.stats().samples_recovered, 1000000u);
}

TEST_F(PipelineTest, Lz4CaptureReadsBackRaw) {
    config_.compression = Compression::Lz4;
    SimulatedDevice device = finite_device(20);
    CapturePipeline pipeline(config_);
    ASSERT_TRUE(pipeline.run(device));

    Header header;
    std::vector<SampleBlock> blocks;
    ReadStats stats;
    read_back(blocks, header, stats);

    EXPECT_EQ(header.compression, Compression::Lz4);
    ASSERT_EQ(blocks.size(), 2u);
    for (const auto& b : blocks) {
        EXPECT_FALSE(b.is_compressed);
        EXPECT_EQ(b.data.size(), 10000u * 4);
    }
    // The tone repeats every 2000 samples
    EXPECT_LT(pipeline.stats().bytes_written(), 2u * 10000u * 4u);
}

TEST_F(PipelineTest, DropsAreAccounted) {
    config_.channel_capacity = 1;
    const uint64_t chunks = 200;
    SimulatedDevice device = finite_device(chunks);
    CapturePipeline pipeline(config_);
    ASSERT_TRUE(pipeline.run(device));

    const CaptureStats& stats = pipeline.stats();
    EXPECT_EQ(stats.samples_recorded() + stats.dropped_samples(), chunks * 1000);
    EXPECT_EQ(stats.dropped_samples(), stats.dropped_chunks() * 1000);

    Header header;
    std::vector<SampleBlock> blocks;
    ReadStats read_stats;
    read_back(blocks, header, read_stats);
    EXPECT_EQ(header.total_samples, stats.samples_recorded());
}

TEST_F(PipelineTest, Int8Format) {
    config_.sample_format = SampleFormat::Int8;
    SimulatedDevice device = finite_device(10);
    CapturePipeline pipeline(config_);
    ASSERT_TRUE(pipeline.run(device));

    Header header;
    std::vector<SampleBlock> blocks;
    ReadStats stats;
    read_back(blocks, header, stats);
    EXPECT_EQ(header.sample_format, SampleFormat::Int8);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].data.size(), 20000u);
}

TEST_F(PipelineTest, UnwritableOutputFails) {
    config_.output_path = (test_dir_ / "no_such_dir" / "x.glos").string();
    SimulatedDevice device = finite_device(5);
    CapturePipeline pipeline(config_);
    EXPECT_FALSE(pipeline.run(device));
    EXPECT_EQ(device.chunks_generated(), 0u);
}

TEST(DeviceTest, FactoryOnlyBuildsSimulated) {
    RecorderConfig config;
    EXPECT_NE(create_device(config), nullptr);

    config.device = DeviceKind::HackRf;
    EXPECT_EQ(create_device(config), nullptr);

    config.device = DeviceKind::PlutoSdr;
    EXPECT_EQ(create_device(config), nullptr);
}

TEST(DeviceTest, SimulatedToneIsBigEndianInt16) {
    SimulatedDevice device(2000000, 1602000000ULL, 40.0f);
    device.set_chunk_samples(16);
    device.set_realtime(false);
    device.set_max_chunks(1);

    ChunkQueue queue(4);
    CaptureStats stats;
    std::atomic<bool> stop{false};
    ASSERT_TRUE(device.run(queue, stats, stop));

    IqChunk chunk;
    ASSERT_TRUE(queue.try_pop(chunk));
    EXPECT_EQ(chunk.sample_count, 16u);
    ASSERT_EQ(chunk.data.size(), 64u);
    // Sample 0: I = sin(0) = 0, Q = cos(0) = full scale
    EXPECT_EQ(read_be16(chunk.data.data()), 0);
    EXPECT_EQ(read_be16(chunk.data.data() + 2), 32767);
    EXPECT_EQ(device.info().sample_format, SampleFormat::Int16);
}
