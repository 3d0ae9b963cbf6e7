/**
 * @file stream_reader.cpp
 * @brief GLOS file reader implementation
 */

#include "stream_reader.hpp"

#include <iostream>

namespace glos {

nlohmann::json ReadStats::to_json() const {
    return {
        {"blocks_ok", blocks_ok},
        {"blocks_corrupted", blocks_corrupted},
        {"samples_recovered", samples_recovered},
        {"bytes_processed", bytes_processed},
        {"bytes_skipped", bytes_skipped}
    };
}

StreamReader::StreamReader() = default;

StreamReader::~StreamReader() = default;

Status StreamReader::open(const std::string& filename) {
    std::unique_ptr<std::ifstream> file(new std::ifstream(filename, std::ios::binary));
    if (!file->is_open()) {
        return Status::IoError;
    }

    file_ = std::move(file);
    in_ = file_.get();
    Status st = read_header();
    if (st != Status::Ok) {
        in_ = nullptr;
        file_.reset();
    }
    return st;
}

Status StreamReader::open(std::istream& source) {
    file_.reset();
    in_ = &source;
    Status st = read_header();
    if (st != Status::Ok) {
        in_ = nullptr;
    }
    return st;
}

Status StreamReader::read_header() {
    window_.clear();
    pos_ = 0;
    exhausted_ = false;
    resyncing_ = false;
    error_ = Status::Ok;
    stats_ = ReadStats();

    HeaderBytes bytes{};
    in_->read(reinterpret_cast<char*>(bytes.data()), bytes.size());
    size_t got = static_cast<size_t>(in_->gcount());
    if (in_->bad()) {
        return Status::IoError;
    }

    Status st = decode_header(bytes.data(), got, header_);
    if (st != Status::Ok) {
        return st;
    }

    compressor_ = make_compressor(header_.compression);
    window_.reserve(GLOS_READ_CHUNK_SIZE);
    return Status::Ok;
}

bool StreamReader::refill() {
    if (exhausted_ || !in_) {
        return false;
    }

    // Drop consumed bytes before growing the window
    if (pos_ > 0) {
        window_.erase(window_.begin(), window_.begin() + static_cast<std::ptrdiff_t>(pos_));
        pos_ = 0;
    }

    size_t old_size = window_.size();
    window_.resize(old_size + GLOS_READ_CHUNK_SIZE);
    in_->read(reinterpret_cast<char*>(window_.data() + old_size), GLOS_READ_CHUNK_SIZE);
    size_t got = static_cast<size_t>(in_->gcount());
    window_.resize(old_size + got);

    if (in_->bad()) {
        std::cerr << "Error: Read failed on input stream\n";
        error_ = Status::IoError;
        exhausted_ = true;
    } else if (got < GLOS_READ_CHUNK_SIZE) {
        exhausted_ = true;
    }
    return got > 0;
}

bool StreamReader::next_block(SampleBlock& out) {
    if (!in_) {
        return false;
    }

    while (true) {
        if (available() < GLOS_BLOCK_OVERHEAD) {
            if (exhausted_) {
                return false;   // truncated tail, discarded silently
            }
            refill();
            continue;
        }

        size_t consumed = 0;
        Status st = decode_block(window_.data() + pos_, available(),
                                 header_.compression, out, consumed);

        if (st == Status::Ok) {
            pos_ += consumed;
            resyncing_ = false;

            Status vs = Status::Ok;
            if (out.is_compressed && compressor_) {
                vs = decompress_block(out, *compressor_);
            }
            if (vs == Status::Ok) {
                vs = validate_sample_count(out, header_.sample_format);
            }
            if (vs != Status::Ok) {
                stats_.blocks_corrupted++;
                stats_.bytes_skipped += consumed;
                continue;
            }

            stats_.blocks_ok++;
            stats_.samples_recovered += out.sample_count;
            stats_.bytes_processed += consumed;
            return true;
        }

        if (st == Status::Incomplete && !exhausted_) {
            refill();
            continue;
        }

        // One damaged block is counted once, not at every offset of the scan
        if (st == Status::ChecksumMismatch && !resyncing_) {
            stats_.blocks_corrupted++;
            resyncing_ = true;
        }

        // Declared length cannot be trusted here; rescan from the next byte
        pos_++;
        stats_.bytes_skipped++;
    }
}

Status StreamReader::validate_totals() const {
    if (header_.total_samples != 0 && header_.total_samples != stats_.samples_recovered) {
        return Status::FormatViolation;
    }
    return Status::Ok;
}

// ============================================================================
// Convenience
// ============================================================================

Status read_all_blocks(const std::string& filename, Header& header,
                       std::vector<SampleBlock>& blocks, ReadStats* stats) {
    StreamReader reader;
    Status st = reader.open(filename);
    if (st != Status::Ok) {
        return st;
    }

    header = reader.header();
    blocks.clear();

    SampleBlock block;
    while (reader.next_block(block)) {
        blocks.push_back(std::move(block));
        block = SampleBlock();
    }

    if (stats) {
        *stats = reader.stats();
    }
    return reader.error();
}

} // namespace glos
