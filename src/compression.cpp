/**
 * @file compression.cpp
 * @brief LZ4 payload compression
 */

#include "compression.hpp"

#include <lz4.h>

namespace glos {

// LZ4 cannot expand a block by more than this ratio
constexpr uint64_t LZ4_MAX_RATIO = 255;

Status Lz4Compressor::compress(const std::vector<uint8_t>& raw, std::vector<uint8_t>& out) const {
    if (raw.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        return Status::CompressionError;
    }

    int src_size = static_cast<int>(raw.size());
    int bound = LZ4_compressBound(src_size);

    out.resize(GLOS_LZ4_SIZE_PREFIX + static_cast<size_t>(bound));
    write_le32(out.data(), static_cast<uint32_t>(raw.size()));

    int written = LZ4_compress_default(reinterpret_cast<const char*>(raw.data()),
                                       reinterpret_cast<char*>(out.data() + GLOS_LZ4_SIZE_PREFIX),
                                       src_size, bound);
    if (written <= 0) {
        out.clear();
        return Status::CompressionError;
    }

    out.resize(GLOS_LZ4_SIZE_PREFIX + static_cast<size_t>(written));
    return Status::Ok;
}

Status Lz4Compressor::decompress(const std::vector<uint8_t>& packed, std::vector<uint8_t>& out) const {
    if (packed.size() < GLOS_LZ4_SIZE_PREFIX) {
        return Status::CompressionError;
    }

    uint32_t raw_size = read_le32(packed.data());
    size_t src_size = packed.size() - GLOS_LZ4_SIZE_PREFIX;

    // Reject a length prefix the compressed bytes could never expand to
    if (raw_size > static_cast<uint32_t>(LZ4_MAX_INPUT_SIZE) ||
        static_cast<uint64_t>(raw_size) > src_size * LZ4_MAX_RATIO + 16) {
        return Status::CompressionError;
    }

    out.resize(raw_size);
    if (raw_size == 0) {
        return Status::Ok;
    }

    int got = LZ4_decompress_safe(reinterpret_cast<const char*>(packed.data() + GLOS_LZ4_SIZE_PREFIX),
                                  reinterpret_cast<char*>(out.data()),
                                  static_cast<int>(src_size), static_cast<int>(raw_size));
    if (got < 0 || static_cast<uint32_t>(got) != raw_size) {
        out.clear();
        return Status::CompressionError;
    }
    return Status::Ok;
}

std::unique_ptr<BlockCompressor> make_compressor(Compression mode) {
    switch (mode) {
        case Compression::Lz4:
            return std::unique_ptr<BlockCompressor>(new Lz4Compressor());
        case Compression::None:
            break;
    }
    return nullptr;
}

Status compress_block(SampleBlock& block, const BlockCompressor& compressor) {
    if (block.is_compressed) {
        return Status::Ok;
    }

    std::vector<uint8_t> packed;
    Status st = compressor.compress(block.data, packed);
    if (st != Status::Ok) {
        return st;
    }

    block.data.swap(packed);
    block.is_compressed = true;
    return Status::Ok;
}

Status decompress_block(SampleBlock& block, const BlockCompressor& compressor) {
    if (!block.is_compressed) {
        return Status::Ok;
    }

    std::vector<uint8_t> raw;
    Status st = compressor.decompress(block.data, raw);
    if (st != Status::Ok) {
        return st;
    }

    block.data.swap(raw);
    block.is_compressed = false;
    return Status::Ok;
}

Status compress_block(SampleBlock& block) {
    static const Lz4Compressor lz4;
    return compress_block(block, lz4);
}

Status decompress_block(SampleBlock& block) {
    static const Lz4Compressor lz4;
    return decompress_block(block, lz4);
}

} // namespace glos
