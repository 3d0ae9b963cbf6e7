/**
 * @file stream_writer.cpp
 * @brief GLOS file writer implementation
 */

#include "stream_writer.hpp"

#include <iostream>

namespace glos {

StreamWriter::StreamWriter() = default;

StreamWriter::~StreamWriter() {
    close();
}

bool StreamWriter::open(const std::string& filename, const Header& header) {
    close();

    std::unique_ptr<std::ofstream> file(
        new std::ofstream(filename, std::ios::binary | std::ios::out | std::ios::trunc));
    if (!file->is_open()) {
        std::cerr << "Error: Cannot open output file: " << filename << "\n";
        return false;
    }

    file_ = std::move(file);
    filename_ = filename;
    if (!attach(*file_, header)) {
        file_.reset();
        return false;
    }
    return true;
}

bool StreamWriter::open(std::ostream& sink, const Header& header) {
    close();
    return attach(sink, header);
}

bool StreamWriter::attach(std::ostream& sink, const Header& header) {
    out_ = &sink;
    header_ = header;
    header_.total_samples = 0;
    header_.timestamp_end = 0;
    compressor_ = make_compressor(header_.compression);
    total_samples_ = 0;
    block_count_ = 0;
    bytes_written_ = 0;

    if (!write_header()) {
        out_ = nullptr;
        return false;
    }
    bytes_written_ = GLOS_HEADER_SIZE;
    return true;
}

bool StreamWriter::write_header() {
    HeaderBytes bytes = encode_header(header_);
    out_->write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    if (!out_->good()) {
        std::cerr << "Error: Failed to write file header\n";
        return false;
    }
    return true;
}

Status StreamWriter::write_block(SampleBlock block) {
    if (!out_) {
        return Status::IoError;
    }

    if (compressor_ && !block.is_compressed) {
        Status st = compress_block(block, *compressor_);
        if (st != Status::Ok) {
            return st;
        }
    }

    Status st = encode_block(block, frame_);
    if (st != Status::Ok) {
        return st;
    }

    out_->write(reinterpret_cast<const char*>(frame_.data()), frame_.size());
    if (!out_->good()) {
        return Status::IoError;
    }

    total_samples_ += block.sample_count;
    block_count_++;
    bytes_written_ += frame_.size();
    return Status::Ok;
}

Status StreamWriter::finish() {
    if (!out_) {
        return Status::IoError;
    }

    out_->flush();
    if (!out_->good()) {
        return Status::IoError;
    }

    header_.total_samples = total_samples_;
    header_.timestamp_end = get_epoch_sec();

    // Only the header is rewritten, the body stays as appended
    out_->seekp(0, std::ios::beg);
    if (!out_->good() || !write_header()) {
        return Status::IoError;
    }
    out_->seekp(0, std::ios::end);
    out_->flush();
    return out_->good() ? Status::Ok : Status::IoError;
}

void StreamWriter::close() {
    if (out_) {
        out_->flush();
        out_ = nullptr;
    }
    if (file_) {
        file_->close();
        file_.reset();
    }
}

} // namespace glos
