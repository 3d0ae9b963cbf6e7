/**
 * @file format.hpp
 * @brief GLOS container format: header and sample block codec
 *
 * A GLOS file is a fixed 128-byte header followed by zero or more
 * variable-length, CRC-protected sample blocks. There is no trailer
 * and no index; files are read strictly sequentially.
 */

#ifndef GLOS_FORMAT_HPP
#define GLOS_FORMAT_HPP

#include "common.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <vector>

namespace glos {

// ============================================================================
// Format Constants
// ============================================================================

constexpr uint8_t GLOS_MAGIC[4] = {'G', 'L', 'O', 'S'};
constexpr uint8_t GLOS_VERSION = 1;

constexpr size_t GLOS_HEADER_SIZE = 128;
constexpr size_t GLOS_HEADER_CRC_OFFSET = 72;      // CRC covers [0, 72)

constexpr uint8_t GLOS_FLAG_LITTLE_ENDIAN = 0x01;

constexpr size_t GLOS_BLOCK_CONTENT_FIXED = 12;    // sample count + timestamp
constexpr size_t GLOS_BLOCK_OVERHEAD = 20;         // length + count + ts + crc
constexpr size_t GLOS_MAX_BLOCK_SIZE = 1024 * 1024;

// Advisory only. Never checked against real blocks.
constexpr size_t GLOS_MIN_BLOCK_SIZE = 32;

// ============================================================================
// Status Codes
// ============================================================================

enum class Status {
    Ok,
    InvalidMagic,
    UnsupportedVersion,
    ChecksumMismatch,
    Incomplete,          // more bytes needed, not a permanent failure
    Corrupted,           // structural violation at this byte offset
    InvalidBlockSize,
    FormatViolation,
    IoError,
    CompressionError
};

const char* status_str(Status status);

// ============================================================================
// Enumerations
// ============================================================================

enum class DeviceType : uint8_t {
    HackRf   = 0,
    PlutoSdr = 1,
    UsrpB200 = 2,
    Unknown  = 255
};

enum class SampleFormat : uint8_t {
    Int8    = 0,
    Int16   = 1,
    Float32 = 2
};

enum class Compression : uint8_t {
    None = 0,
    Lz4  = 1
};

/**
 * @brief Bytes per complex (I/Q) sample pair
 */
size_t sample_size(SampleFormat format);

const char* device_type_str(DeviceType type);
const char* sample_format_str(SampleFormat format);
const char* compression_str(Compression compression);

/**
 * @brief Map a raw device byte to DeviceType (unlisted values become Unknown)
 */
DeviceType device_type_from_u8(uint8_t value);

bool sample_format_from_u8(uint8_t value, SampleFormat& out);
bool compression_from_u8(uint8_t value, Compression& out);

// ============================================================================
// Records
// ============================================================================

/**
 * @brief Session metadata stored at the start of every GLOS file
 */
struct Header {
    uint8_t version = GLOS_VERSION;
    uint8_t flags = 0;
    DeviceType device_type = DeviceType::Unknown;
    SampleFormat sample_format = SampleFormat::Int16;
    Compression compression = Compression::None;
    uint32_t sample_rate = 0;
    uint64_t center_freq = 0;
    float gain_db = 0.0f;
    uint64_t timestamp_start = 0;   // epoch seconds
    uint64_t timestamp_end = 0;     // 0 while the recording is open
    uint64_t total_samples = 0;

    /**
     * @brief New session header with defaults and start time set to now
     */
    static Header create(DeviceType device, uint32_t sample_rate, uint64_t center_freq);

    bool is_little_endian() const { return (flags & GLOS_FLAG_LITTLE_ENDIAN) != 0; }
    bool is_finalized() const { return timestamp_end != 0; }

    nlohmann::json to_json() const;
};

// Field-for-field; gain compared by bit pattern.
bool operator==(const Header& a, const Header& b);
bool operator!=(const Header& a, const Header& b);

/**
 * @brief One timestamped run of samples
 *
 * is_compressed is never inferred from the bytes; it always comes from the
 * file-level compression mode.
 */
struct SampleBlock {
    uint64_t timestamp_ns = 0;
    uint32_t sample_count = 0;
    std::vector<uint8_t> data;
    bool is_compressed = false;
};

using HeaderBytes = std::array<uint8_t, GLOS_HEADER_SIZE>;

// ============================================================================
// Codec
// ============================================================================

/**
 * @brief IEEE 802.3 CRC-32 of a byte range
 */
uint32_t crc32_ieee(const uint8_t* data, size_t len);

/**
 * @brief Serialize header, computing the CRC over bytes [0, 72)
 */
HeaderBytes encode_header(const Header& header);

/**
 * @brief Parse and validate a header
 * @param data Buffer holding at least GLOS_HEADER_SIZE bytes
 * @param len Buffer length
 * @param out Decoded header (valid only on Status::Ok)
 */
Status decode_header(const uint8_t* data, size_t len, Header& out);

/**
 * @brief Frame a block: [len][count][ts][payload][crc]
 * @param block Block to encode
 * @param out Replaced with the framed bytes
 * @return Status::InvalidBlockSize if the framed size exceeds 1 MiB
 */
Status encode_block(const SampleBlock& block, std::vector<uint8_t>& out);

/**
 * @brief Parse one block from the front of a buffer
 * @param data Buffer start
 * @param len Bytes available
 * @param mode File compression mode (sets is_compressed)
 * @param out Decoded block
 * @param consumed Framed size of the decoded block
 * @return Ok, Incomplete (need more bytes), Corrupted (bad length field)
 *         or ChecksumMismatch
 */
Status decode_block(const uint8_t* data, size_t len, Compression mode,
                    SampleBlock& out, size_t& consumed);

/**
 * @brief Check sample_count * sample_size == payload length
 *
 * Compressed blocks are exempt until they are decompressed.
 */
Status validate_sample_count(const SampleBlock& block, SampleFormat format);

} // namespace glos

#endif // GLOS_FORMAT_HPP
