/**
 * @file test_compression.cpp
 * @brief LZ4 block compression tests
 */

#include "common.hpp"
#include "compression.hpp"

#include <gtest/gtest.h>
#include <random>

using namespace glos;

namespace {

SampleBlock tone_block(uint32_t samples) {
    SampleBlock b;
    b.timestamp_ns = 1704067200000000000ULL;
    b.sample_count = samples;
    b.data.resize(static_cast<size_t>(samples) * 4);
    for (size_t i = 0; i < b.data.size(); ++i) {
        b.data[i] = static_cast<uint8_t>((i / 4) % 16);
    }
    return b;
}

} // anonymous namespace

TEST(CompressionTest, FactoryByMode) {
    EXPECT_EQ(make_compressor(Compression::None), nullptr);
    auto lz4 = make_compressor(Compression::Lz4);
    ASSERT_NE(lz4, nullptr);
    EXPECT_STREQ(lz4->name(), "lz4");
}

TEST(CompressionTest, RoundTripRestoresPayload) {
    SampleBlock b = tone_block(5000);
    std::vector<uint8_t> original = b.data;

    ASSERT_EQ(compress_block(b), Status::Ok);
    EXPECT_TRUE(b.is_compressed);
    EXPECT_LT(b.data.size(), original.size());
    EXPECT_EQ(read_le32(b.data.data()), original.size());

    ASSERT_EQ(decompress_block(b), Status::Ok);
    EXPECT_FALSE(b.is_compressed);
    EXPECT_EQ(b.data, original);
    EXPECT_EQ(b.sample_count, 5000u);
}

TEST(CompressionTest, Idempotent) {
    SampleBlock b = tone_block(100);
    std::vector<uint8_t> raw = b.data;

    // Decompressing a raw block is a no-op
    ASSERT_EQ(decompress_block(b), Status::Ok);
    EXPECT_EQ(b.data, raw);

    ASSERT_EQ(compress_block(b), Status::Ok);
    std::vector<uint8_t> packed = b.data;
    ASSERT_EQ(compress_block(b), Status::Ok);
    EXPECT_EQ(b.data, packed);
}

TEST(CompressionTest, RandomDataSurvives) {
    std::mt19937 rng(1234);
    SampleBlock b;
    b.sample_count = 2048;
    b.data.resize(2048 * 4);
    for (auto& byte : b.data) {
        byte = static_cast<uint8_t>(rng() & 0xFF);
    }
    std::vector<uint8_t> original = b.data;

    ASSERT_EQ(compress_block(b), Status::Ok);
    ASSERT_EQ(decompress_block(b), Status::Ok);
    EXPECT_EQ(b.data, original);
}

TEST(CompressionTest, EmptyPayload) {
    SampleBlock b;
    ASSERT_EQ(compress_block(b), Status::Ok);
    EXPECT_EQ(b.data.size(), GLOS_LZ4_SIZE_PREFIX + 1);
    ASSERT_EQ(decompress_block(b), Status::Ok);
    EXPECT_TRUE(b.data.empty());
}

TEST(CompressionTest, GarbageFailsCleanly) {
    Lz4Compressor lz4;
    std::vector<uint8_t> out;

    EXPECT_EQ(lz4.decompress({0x01, 0x02}, out), Status::CompressionError);

    // Claims 1 GiB from a few bytes
    std::vector<uint8_t> bogus(8, 0xFF);
    write_le32(bogus.data(), 0x40000000);
    EXPECT_EQ(lz4.decompress(bogus, out), Status::CompressionError);

    SampleBlock b = tone_block(100);
    ASSERT_EQ(compress_block(b), Status::Ok);
    write_le32(b.data.data(), 123);  // wrong size prefix
    SampleBlock copy = b;
    EXPECT_EQ(decompress_block(copy), Status::CompressionError);
    EXPECT_TRUE(copy.is_compressed);
}
