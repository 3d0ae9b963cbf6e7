/**
 * @file common.hpp
 * @brief Common constants, byte-order helpers and clock utilities for GLOS
 */

#ifndef GLOS_COMMON_HPP
#define GLOS_COMMON_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <chrono>

namespace glos {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* GLOS_TOOLS_VERSION = "1.0.0";
constexpr const char* GLOS_RECORDER_NAME = "glos-recorder";
constexpr const char* GLOS_REPLAYER_NAME = "glos-replayer";

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Current wall-clock time in nanoseconds since the Unix epoch
 */
inline uint64_t get_epoch_ns() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()).count());
}

/**
 * @brief Current wall-clock time in whole seconds since the Unix epoch
 */
inline uint64_t get_epoch_sec() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count());
}

/**
 * @brief Seconds elapsed since a steady-clock instant (floating point)
 */
inline double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

// Fixed big-endian accessors. Block framing, wire datagrams and the header
// checksum always use these regardless of any header flag.

inline uint16_t read_be16(const uint8_t* data) {
    return static_cast<uint16_t>((data[0] << 8) | data[1]);
}

inline uint32_t read_be32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

inline uint64_t read_be64(const uint8_t* data) {
    return (static_cast<uint64_t>(data[0]) << 56) |
           (static_cast<uint64_t>(data[1]) << 48) |
           (static_cast<uint64_t>(data[2]) << 40) |
           (static_cast<uint64_t>(data[3]) << 32) |
           (static_cast<uint64_t>(data[4]) << 24) |
           (static_cast<uint64_t>(data[5]) << 16) |
           (static_cast<uint64_t>(data[6]) << 8) |
           static_cast<uint64_t>(data[7]);
}

inline void write_be16(uint8_t* data, uint16_t value) {
    data[0] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[1] = static_cast<uint8_t>(value & 0xFF);
}

inline void write_be32(uint8_t* data, uint32_t value) {
    data[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    data[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[3] = static_cast<uint8_t>(value & 0xFF);
}

inline void write_be64(uint8_t* data, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        data[i] = static_cast<uint8_t>((value >> (56 - 8 * i)) & 0xFF);
    }
}

inline uint32_t read_le32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[3]) << 24) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[1]) << 8) |
           static_cast<uint32_t>(data[0]);
}

inline uint64_t read_le64(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | data[i];
    }
    return value;
}

inline void write_le32(uint8_t* data, uint32_t value) {
    data[0] = static_cast<uint8_t>(value & 0xFF);
    data[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

inline void write_le64(uint8_t* data, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        data[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

// Flag-selected accessors for the header's payload fields (flags bit 0).

inline uint32_t read_u32(const uint8_t* data, bool little_endian) {
    return little_endian ? read_le32(data) : read_be32(data);
}

inline uint64_t read_u64(const uint8_t* data, bool little_endian) {
    return little_endian ? read_le64(data) : read_be64(data);
}

inline void write_u32(uint8_t* data, uint32_t value, bool little_endian) {
    if (little_endian) {
        write_le32(data, value);
    } else {
        write_be32(data, value);
    }
}

inline void write_u64(uint8_t* data, uint64_t value, bool little_endian) {
    if (little_endian) {
        write_le64(data, value);
    } else {
        write_be64(data, value);
    }
}

// ============================================================================
// Default Configuration Values
// ============================================================================

constexpr uint64_t DEFAULT_CENTER_FREQ_HZ = 1602000000ULL;
constexpr uint32_t DEFAULT_SAMPLE_RATE_HZ = 2000000;
constexpr float DEFAULT_GAIN_DB = 40.0f;
constexpr const char* DEFAULT_OUTPUT_FILE = "recording.glos";
constexpr uint32_t DEFAULT_BLOCK_SAMPLES = 50000;
constexpr size_t DEFAULT_CHANNEL_CAPACITY = 256;
constexpr uint64_t DEFAULT_STATS_INTERVAL_SEC = 5;
constexpr uint32_t DEFAULT_CHUNK_SAMPLES = 4096;

constexpr const char* DEFAULT_REPLAY_TARGET = "127.0.0.1:5555";
constexpr const char* DEFAULT_REPLAY_BIND = "0.0.0.0:0";

} // namespace glos

#endif // GLOS_COMMON_HPP
