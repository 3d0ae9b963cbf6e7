/**
 * @file compression.hpp
 * @brief Block payload compression
 *
 * Compressed payloads carry the original length as a 4-byte little-endian
 * prefix followed by an LZ4 raw block, so decompression recovers the
 * exact size.
 */

#ifndef GLOS_COMPRESSION_HPP
#define GLOS_COMPRESSION_HPP

#include "format.hpp"

#include <memory>
#include <vector>

namespace glos {

constexpr size_t GLOS_LZ4_SIZE_PREFIX = 4;

/**
 * @brief Payload compressor capability
 */
class BlockCompressor {
public:
    virtual ~BlockCompressor() = default;

    virtual const char* name() const = 0;

    /**
     * @brief Compress raw bytes into out (replaces contents)
     */
    virtual Status compress(const std::vector<uint8_t>& raw, std::vector<uint8_t>& out) const = 0;

    /**
     * @brief Recover raw bytes from a compressed payload (replaces contents)
     */
    virtual Status decompress(const std::vector<uint8_t>& packed, std::vector<uint8_t>& out) const = 0;
};

/**
 * @brief LZ4 block compressor with length prefix
 */
class Lz4Compressor : public BlockCompressor {
public:
    const char* name() const override { return "lz4"; }
    Status compress(const std::vector<uint8_t>& raw, std::vector<uint8_t>& out) const override;
    Status decompress(const std::vector<uint8_t>& packed, std::vector<uint8_t>& out) const override;
};

/**
 * @brief Compressor for a file compression mode
 * @return nullptr for Compression::None
 */
std::unique_ptr<BlockCompressor> make_compressor(Compression mode);

/**
 * @brief Compress a block's payload in place
 *
 * No-op if the block is already compressed.
 */
Status compress_block(SampleBlock& block, const BlockCompressor& compressor);

/**
 * @brief Decompress a block's payload in place
 *
 * No-op if the block is not compressed.
 */
Status decompress_block(SampleBlock& block, const BlockCompressor& compressor);

// LZ4 shorthands, the only compressed representation a GLOS file can carry
Status compress_block(SampleBlock& block);
Status decompress_block(SampleBlock& block);

} // namespace glos

#endif // GLOS_COMPRESSION_HPP
