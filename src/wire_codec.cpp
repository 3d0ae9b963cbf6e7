/**
 * @file wire_codec.cpp
 * @brief UDP datagram framing implementation
 */

#include "wire_codec.hpp"
#include "common.hpp"

#include <algorithm>

namespace glos {

Status encode_datagram(const SampleBlock& block, std::vector<uint8_t>& out) {
    if (block.is_compressed) {
        return Status::CompressionError;
    }
    if (block.data.size() > UDP_MAX_DATA || block.sample_count > 0xFFFF) {
        return Status::InvalidBlockSize;
    }

    out.resize(UDP_HEADER_SIZE + block.data.size());
    write_be64(out.data(), block.timestamp_ns);
    write_be16(out.data() + 8, static_cast<uint16_t>(block.sample_count));
    if (!block.data.empty()) {
        std::copy(block.data.begin(), block.data.end(), out.begin() + UDP_HEADER_SIZE);
    }
    return Status::Ok;
}

Status decode_datagram(const uint8_t* buf, size_t len, uint64_t& timestamp_ns,
                       uint16_t& sample_count, const uint8_t*& data, size_t& data_len) {
    if (len < UDP_HEADER_SIZE) {
        return Status::Incomplete;
    }
    timestamp_ns = read_be64(buf);
    sample_count = read_be16(buf + 8);
    data = buf + UDP_HEADER_SIZE;
    data_len = len - UDP_HEADER_SIZE;
    return Status::Ok;
}

} // namespace glos
