/**
 * @file wire_codec.hpp
 * @brief UDP datagram framing for replayed sample blocks
 *
 * Datagram layout (big-endian):
 *   [0..8)   timestamp_ns  uint64
 *   [8..10)  sample_count  uint16
 *   [10..)   sample data (decompressed)
 */

#ifndef GLOS_WIRE_CODEC_HPP
#define GLOS_WIRE_CODEC_HPP

#include "format.hpp"

#include <cstdint>
#include <vector>

namespace glos {

constexpr size_t UDP_MAX_PAYLOAD = 65507;
constexpr size_t UDP_HEADER_SIZE = 10;
constexpr size_t UDP_MAX_DATA = UDP_MAX_PAYLOAD - UDP_HEADER_SIZE;

/**
 * @brief Frame a block as one datagram
 * @return InvalidBlockSize if the data exceeds UDP_MAX_DATA or the sample
 *         count does not fit in 16 bits; CompressionError if the block is
 *         still compressed
 */
Status encode_datagram(const SampleBlock& block, std::vector<uint8_t>& out);

/**
 * @brief Split a received datagram into its fields
 *
 * data points into the input buffer.
 * @return Incomplete if shorter than the datagram header
 */
Status decode_datagram(const uint8_t* buf, size_t len, uint64_t& timestamp_ns,
                       uint16_t& sample_count, const uint8_t*& data, size_t& data_len);

} // namespace glos

#endif // GLOS_WIRE_CODEC_HPP
