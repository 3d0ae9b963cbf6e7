/**
 * @file stream_reader.hpp
 * @brief Sequential GLOS file reader with corruption resynchronization
 *
 * The header is validated once on open; any header error is fatal.
 * Blocks are then parsed from a growing byte window. A checksum failure
 * advances the window by one byte and rescans, so a damaged region costs
 * only the blocks it touches. Corrupted blocks are never returned; they
 * show up only in ReadStats.
 */

#ifndef GLOS_STREAM_READER_HPP
#define GLOS_STREAM_READER_HPP

#include "format.hpp"
#include "compression.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace glos {

constexpr size_t GLOS_READ_CHUNK_SIZE = 2 * 1024 * 1024;

struct ReadStats {
    uint64_t blocks_ok = 0;
    uint64_t blocks_corrupted = 0;
    uint64_t samples_recovered = 0;
    uint64_t bytes_processed = 0;   // framed bytes of returned blocks
    uint64_t bytes_skipped = 0;     // bytes discarded while resynchronizing

    nlohmann::json to_json() const;
};

class StreamReader {
public:
    StreamReader();
    ~StreamReader();

    // Non-copyable
    StreamReader(const StreamReader&) = delete;
    StreamReader& operator=(const StreamReader&) = delete;

    /**
     * @brief Open a file and validate its header
     * @return Status::Ok, Status::IoError, or the header decode failure
     */
    Status open(const std::string& filename);

    /**
     * @brief Read from a caller-owned source (must outlive the reader)
     */
    Status open(std::istream& source);

    bool is_open() const { return in_ != nullptr; }

    const Header& header() const { return header_; }

    /**
     * @brief Pull the next valid block
     * @param out Receives the block, decompressed
     * @return false once the source is exhausted (or failed, see error())
     */
    bool next_block(SampleBlock& out);

    /**
     * @brief Status::IoError if the source failed mid-stream, else Ok
     */
    Status error() const { return error_; }

    bool is_exhausted() const { return exhausted_ && available() < GLOS_BLOCK_OVERHEAD; }

    const ReadStats& stats() const { return stats_; }

    /**
     * @brief Compare the header's declared total with recovered samples
     *
     * A mismatch is a FormatViolation only when the header total is
     * non-zero. The result is advisory.
     */
    Status validate_totals() const;

private:
    Status read_header();
    bool refill();
    size_t available() const { return window_.size() - pos_; }

    std::unique_ptr<std::ifstream> file_;
    std::istream* in_ = nullptr;

    Header header_;
    std::unique_ptr<BlockCompressor> compressor_;

    std::vector<uint8_t> window_;
    size_t pos_ = 0;
    bool exhausted_ = false;
    bool resyncing_ = false;
    Status error_ = Status::Ok;

    ReadStats stats_;
};

/**
 * @brief Read every recoverable block of a file
 * @param filename Input file
 * @param header Receives the header
 * @param blocks Receives the blocks in file order
 * @param stats Optional, receives the reader statistics
 */
Status read_all_blocks(const std::string& filename, Header& header,
                       std::vector<SampleBlock>& blocks, ReadStats* stats = nullptr);

} // namespace glos

#endif // GLOS_STREAM_READER_HPP
