/**
 * @file format.cpp
 * @brief GLOS header and block codec implementation
 */

#include "format.hpp"

#include <zlib.h>

#include <cstring>

namespace glos {

// Header field offsets
namespace {
constexpr size_t OFF_VERSION      = 4;
constexpr size_t OFF_FLAGS        = 5;
constexpr size_t OFF_DEVICE       = 12;
constexpr size_t OFF_FORMAT       = 13;
constexpr size_t OFF_COMPRESSION  = 14;
constexpr size_t OFF_SAMPLE_RATE  = 16;
constexpr size_t OFF_CENTER_FREQ  = 20;
constexpr size_t OFF_GAIN         = 28;
constexpr size_t OFF_TS_START     = 32;
constexpr size_t OFF_TS_END       = 40;
constexpr size_t OFF_TOTAL        = 48;

uint32_t float_bits(float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

float bits_to_float(uint32_t bits) {
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}
} // namespace

// ============================================================================
// Names
// ============================================================================

const char* status_str(Status status) {
    switch (status) {
        case Status::Ok:                 return "ok";
        case Status::InvalidMagic:       return "invalid magic";
        case Status::UnsupportedVersion: return "unsupported version";
        case Status::ChecksumMismatch:   return "checksum mismatch";
        case Status::Incomplete:         return "incomplete data";
        case Status::Corrupted:          return "corrupted data";
        case Status::InvalidBlockSize:   return "invalid block size";
        case Status::FormatViolation:    return "format violation";
        case Status::IoError:            return "I/O error";
        case Status::CompressionError:   return "compression error";
    }
    return "unknown";
}

size_t sample_size(SampleFormat format) {
    switch (format) {
        case SampleFormat::Int8:    return 2;
        case SampleFormat::Int16:   return 4;
        case SampleFormat::Float32: return 8;
    }
    return 0;
}

const char* device_type_str(DeviceType type) {
    switch (type) {
        case DeviceType::HackRf:   return "HackRF";
        case DeviceType::PlutoSdr: return "PlutoSDR";
        case DeviceType::UsrpB200: return "USRP B200";
        case DeviceType::Unknown:  return "Unknown";
    }
    return "Unknown";
}

const char* sample_format_str(SampleFormat format) {
    switch (format) {
        case SampleFormat::Int8:    return "int8";
        case SampleFormat::Int16:   return "int16";
        case SampleFormat::Float32: return "float32";
    }
    return "?";
}

const char* compression_str(Compression compression) {
    switch (compression) {
        case Compression::None: return "none";
        case Compression::Lz4:  return "lz4";
    }
    return "?";
}

DeviceType device_type_from_u8(uint8_t value) {
    switch (value) {
        case 0: return DeviceType::HackRf;
        case 1: return DeviceType::PlutoSdr;
        case 2: return DeviceType::UsrpB200;
        default: return DeviceType::Unknown;
    }
}

bool sample_format_from_u8(uint8_t value, SampleFormat& out) {
    switch (value) {
        case 0: out = SampleFormat::Int8; return true;
        case 1: out = SampleFormat::Int16; return true;
        case 2: out = SampleFormat::Float32; return true;
        default: return false;
    }
}

bool compression_from_u8(uint8_t value, Compression& out) {
    switch (value) {
        case 0: out = Compression::None; return true;
        case 1: out = Compression::Lz4; return true;
        default: return false;
    }
}

// ============================================================================
// Header
// ============================================================================

Header Header::create(DeviceType device, uint32_t sample_rate, uint64_t center_freq) {
    Header h;
    h.device_type = device;
    h.sample_rate = sample_rate;
    h.center_freq = center_freq;
    h.timestamp_start = get_epoch_sec();
    return h;
}

nlohmann::json Header::to_json() const {
    return {
        {"version", version},
        {"little_endian", is_little_endian()},
        {"device", device_type_str(device_type)},
        {"sample_format", sample_format_str(sample_format)},
        {"compression", compression_str(compression)},
        {"sample_rate_hz", sample_rate},
        {"center_freq_hz", center_freq},
        {"gain_db", gain_db},
        {"timestamp_start", timestamp_start},
        {"timestamp_end", timestamp_end},
        {"total_samples", total_samples},
        {"finalized", is_finalized()}
    };
}

bool operator==(const Header& a, const Header& b) {
    return a.version == b.version &&
           a.flags == b.flags &&
           a.device_type == b.device_type &&
           a.sample_format == b.sample_format &&
           a.compression == b.compression &&
           a.sample_rate == b.sample_rate &&
           a.center_freq == b.center_freq &&
           float_bits(a.gain_db) == float_bits(b.gain_db) &&
           a.timestamp_start == b.timestamp_start &&
           a.timestamp_end == b.timestamp_end &&
           a.total_samples == b.total_samples;
}

bool operator!=(const Header& a, const Header& b) {
    return !(a == b);
}

// ============================================================================
// Codec
// ============================================================================

uint32_t crc32_ieee(const uint8_t* data, size_t len) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large ranges in pieces
    while (len > 0) {
        uInt piece = len > 0x40000000u ? 0x40000000u : static_cast<uInt>(len);
        crc = crc32(crc, data, piece);
        data += piece;
        len -= piece;
    }
    return static_cast<uint32_t>(crc);
}

HeaderBytes encode_header(const Header& header) {
    HeaderBytes buf{};
    uint8_t* p = buf.data();
    bool le = header.is_little_endian();

    std::memcpy(p, GLOS_MAGIC, sizeof(GLOS_MAGIC));
    p[OFF_VERSION] = header.version;
    p[OFF_FLAGS] = header.flags;
    p[OFF_DEVICE] = static_cast<uint8_t>(header.device_type);
    p[OFF_FORMAT] = static_cast<uint8_t>(header.sample_format);
    p[OFF_COMPRESSION] = static_cast<uint8_t>(header.compression);

    write_u32(p + OFF_SAMPLE_RATE, header.sample_rate, le);
    write_u64(p + OFF_CENTER_FREQ, header.center_freq, le);
    write_u32(p + OFF_GAIN, float_bits(header.gain_db), le);
    write_u64(p + OFF_TS_START, header.timestamp_start, le);
    write_u64(p + OFF_TS_END, header.timestamp_end, le);
    write_u64(p + OFF_TOTAL, header.total_samples, le);

    // Checksum is big-endian whatever the flags say
    write_be32(p + GLOS_HEADER_CRC_OFFSET, crc32_ieee(p, GLOS_HEADER_CRC_OFFSET));
    return buf;
}

Status decode_header(const uint8_t* data, size_t len, Header& out) {
    if (len < GLOS_HEADER_SIZE) {
        return Status::Incomplete;
    }
    if (std::memcmp(data, GLOS_MAGIC, sizeof(GLOS_MAGIC)) != 0) {
        return Status::InvalidMagic;
    }
    if (data[OFF_VERSION] != GLOS_VERSION) {
        return Status::UnsupportedVersion;
    }

    uint32_t stored = read_be32(data + GLOS_HEADER_CRC_OFFSET);
    if (stored != crc32_ieee(data, GLOS_HEADER_CRC_OFFSET)) {
        return Status::ChecksumMismatch;
    }

    Header h;
    h.version = data[OFF_VERSION];
    h.flags = data[OFF_FLAGS];
    h.device_type = device_type_from_u8(data[OFF_DEVICE]);
    if (!sample_format_from_u8(data[OFF_FORMAT], h.sample_format) ||
        !compression_from_u8(data[OFF_COMPRESSION], h.compression)) {
        return Status::FormatViolation;
    }

    bool le = h.is_little_endian();
    h.sample_rate = read_u32(data + OFF_SAMPLE_RATE, le);
    h.center_freq = read_u64(data + OFF_CENTER_FREQ, le);
    h.gain_db = bits_to_float(read_u32(data + OFF_GAIN, le));
    h.timestamp_start = read_u64(data + OFF_TS_START, le);
    h.timestamp_end = read_u64(data + OFF_TS_END, le);
    h.total_samples = read_u64(data + OFF_TOTAL, le);

    out = h;
    return Status::Ok;
}

Status encode_block(const SampleBlock& block, std::vector<uint8_t>& out) {
    size_t framed = GLOS_BLOCK_OVERHEAD + block.data.size();
    if (framed > GLOS_MAX_BLOCK_SIZE) {
        return Status::InvalidBlockSize;
    }

    uint32_t content_len = static_cast<uint32_t>(GLOS_BLOCK_CONTENT_FIXED + block.data.size());

    out.resize(framed);
    uint8_t* p = out.data();
    write_be32(p, content_len);
    write_be32(p + 4, block.sample_count);
    write_be64(p + 8, block.timestamp_ns);
    if (!block.data.empty()) {
        std::memcpy(p + 16, block.data.data(), block.data.size());
    }
    write_be32(p + 4 + content_len, crc32_ieee(p + 4, content_len));
    return Status::Ok;
}

Status decode_block(const uint8_t* data, size_t len, Compression mode,
                    SampleBlock& out, size_t& consumed) {
    if (len < GLOS_BLOCK_OVERHEAD) {
        return Status::Incomplete;
    }

    uint32_t content_len = read_be32(data);
    if (content_len < GLOS_BLOCK_CONTENT_FIXED ||
        static_cast<size_t>(content_len) + 8 > GLOS_MAX_BLOCK_SIZE) {
        return Status::Corrupted;
    }

    size_t framed = static_cast<size_t>(content_len) + 8;
    if (len < framed) {
        return Status::Incomplete;
    }

    uint32_t stored = read_be32(data + 4 + content_len);
    if (stored != crc32_ieee(data + 4, content_len)) {
        return Status::ChecksumMismatch;
    }

    out.sample_count = read_be32(data + 4);
    out.timestamp_ns = read_be64(data + 8);
    out.data.assign(data + 16, data + 4 + content_len);
    out.is_compressed = (mode == Compression::Lz4);
    consumed = framed;
    return Status::Ok;
}

Status validate_sample_count(const SampleBlock& block, SampleFormat format) {
    if (block.is_compressed) {
        return Status::Ok;
    }
    uint64_t expected = static_cast<uint64_t>(block.sample_count) * sample_size(format);
    if (expected != block.data.size()) {
        return Status::FormatViolation;
    }
    return Status::Ok;
}

} // namespace glos
