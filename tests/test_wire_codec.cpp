/**
 * @file test_wire_codec.cpp
 * @brief UDP datagram framing tests
 */

#include "common.hpp"
#include "wire_codec.hpp"

#include <gtest/gtest.h>

using namespace glos;

TEST(WireCodecTest, Layout) {
    SampleBlock block;
    block.timestamp_ns = 0x0102030405060708ULL;
    block.sample_count = 3;
    block.data = {0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66};

    std::vector<uint8_t> out;
    ASSERT_EQ(encode_datagram(block, out), Status::Ok);
    ASSERT_EQ(out.size(), UDP_HEADER_SIZE + 12);
    EXPECT_EQ(out[0], 0x01);
    EXPECT_EQ(out[7], 0x08);
    EXPECT_EQ(out[8], 0x00);
    EXPECT_EQ(out[9], 0x03);
    EXPECT_EQ(out[10], 0xAA);
    EXPECT_EQ(out.back(), 0x66);
}

TEST(WireCodecTest, DecodeSlicesFields) {
    SampleBlock block;
    block.timestamp_ns = 1704067200000000000ULL;
    block.sample_count = 100;
    block.data.assign(400, 0x42);

    std::vector<uint8_t> out;
    ASSERT_EQ(encode_datagram(block, out), Status::Ok);

    uint64_t ts = 0;
    uint16_t count = 0;
    const uint8_t* data = nullptr;
    size_t data_len = 0;
    ASSERT_EQ(decode_datagram(out.data(), out.size(), ts, count, data, data_len), Status::Ok);
    EXPECT_EQ(ts, block.timestamp_ns);
    EXPECT_EQ(count, 100);
    EXPECT_EQ(data_len, 400u);
    EXPECT_EQ(data, out.data() + UDP_HEADER_SIZE);
    EXPECT_EQ(data[399], 0x42);
}

TEST(WireCodecTest, ShortDatagram) {
    uint8_t buf[9] = {};
    uint64_t ts = 0;
    uint16_t count = 0;
    const uint8_t* data = nullptr;
    size_t data_len = 0;
    EXPECT_EQ(decode_datagram(buf, sizeof(buf), ts, count, data, data_len), Status::Incomplete);
    EXPECT_EQ(decode_datagram(buf, 0, ts, count, data, data_len), Status::Incomplete);
}

TEST(WireCodecTest, HeaderOnlyDatagram) {
    uint8_t buf[UDP_HEADER_SIZE] = {};
    write_be16(buf + 8, 0);
    uint64_t ts = 1;
    uint16_t count = 1;
    const uint8_t* data = nullptr;
    size_t data_len = 1;
    ASSERT_EQ(decode_datagram(buf, sizeof(buf), ts, count, data, data_len), Status::Ok);
    EXPECT_EQ(ts, 0u);
    EXPECT_EQ(count, 0);
    EXPECT_EQ(data_len, 0u);
}

TEST(WireCodecTest, SizeLimits) {
    SampleBlock block;
    block.data.assign(UDP_MAX_DATA, 0);
    block.sample_count = static_cast<uint32_t>(UDP_MAX_DATA / 2);

    std::vector<uint8_t> out;
    ASSERT_EQ(encode_datagram(block, out), Status::Ok);
    EXPECT_EQ(out.size(), UDP_MAX_PAYLOAD);

    block.data.push_back(0);
    EXPECT_EQ(encode_datagram(block, out), Status::InvalidBlockSize);
}

TEST(WireCodecTest, SampleCountMustFit16Bits) {
    SampleBlock block;
    block.sample_count = 65536;
    block.data.assign(16, 0);

    std::vector<uint8_t> out;
    EXPECT_EQ(encode_datagram(block, out), Status::InvalidBlockSize);

    block.sample_count = 65535;
    EXPECT_EQ(encode_datagram(block, out), Status::Ok);
}

TEST(WireCodecTest, CompressedBlockIsRejected) {
    SampleBlock block;
    block.is_compressed = true;
    block.data.assign(10, 0);
    std::vector<uint8_t> out;
    EXPECT_EQ(encode_datagram(block, out), Status::CompressionError);
}
