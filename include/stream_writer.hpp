/**
 * @file stream_writer.hpp
 * @brief Sequential GLOS file writer
 *
 * The header is written on open with total_samples = 0 and
 * timestamp_end = 0, and rewritten in place by finish(). A writer
 * abandoned without finish() leaves an unterminated recording.
 */

#ifndef GLOS_STREAM_WRITER_HPP
#define GLOS_STREAM_WRITER_HPP

#include "format.hpp"
#include "compression.hpp"

#include <fstream>
#include <memory>
#include <ostream>
#include <string>

namespace glos {

class StreamWriter {
public:
    StreamWriter();
    ~StreamWriter();

    // Non-copyable
    StreamWriter(const StreamWriter&) = delete;
    StreamWriter& operator=(const StreamWriter&) = delete;

    /**
     * @brief Create (truncate) a file and write the header
     * @param filename Output file path
     * @param header Session header
     * @return true on success
     */
    bool open(const std::string& filename, const Header& header);

    /**
     * @brief Write to a caller-owned seekable sink
     *
     * The sink must outlive the writer.
     */
    bool open(std::ostream& sink, const Header& header);

    bool is_open() const { return out_ != nullptr; }

    /**
     * @brief Append one block
     *
     * The payload is compressed first when the file mode is LZ4 and the
     * block is still raw.
     */
    Status write_block(SampleBlock block);

    /**
     * @brief Flush, then rewrite the header with totals and end time
     */
    Status finish();

    /**
     * @brief Release the sink without finalizing the header
     */
    void close();

    const Header& header() const { return header_; }
    uint64_t total_samples() const { return total_samples_; }
    uint64_t block_count() const { return block_count_; }
    uint64_t bytes_written() const { return bytes_written_; }
    const std::string& filename() const { return filename_; }

private:
    bool attach(std::ostream& sink, const Header& header);
    bool write_header();

    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_ = nullptr;
    std::string filename_;

    Header header_;
    std::unique_ptr<BlockCompressor> compressor_;
    std::vector<uint8_t> frame_;

    uint64_t total_samples_ = 0;
    uint64_t block_count_ = 0;
    uint64_t bytes_written_ = 0;
};

} // namespace glos

#endif // GLOS_STREAM_WRITER_HPP
