/**
 * @file capture_pipeline.cpp
 * @brief Recording pipeline implementation
 */

#include "capture_pipeline.hpp"

#include <iomanip>
#include <iostream>
#include <thread>

namespace glos {

CapturePipeline::CapturePipeline(const RecorderConfig& config)
    : config_(config)
    , session_start_(std::chrono::steady_clock::now())
{
}

bool CapturePipeline::run(Device& device) {
    DeviceInfo info = device.info();
    if (info.sample_format != config_.sample_format) {
        std::cerr << "Warning: Device produces " << sample_format_str(info.sample_format)
                  << " but the file is " << sample_format_str(config_.sample_format) << "\n";
    }

    Header header = Header::create(config_.device_type(), config_.sample_rate_hz,
                                   config_.center_freq_hz);
    header.gain_db = config_.gain_db;
    header.sample_format = config_.sample_format;
    header.compression = config_.compression;

    StreamWriter writer;
    if (!writer.open(config_.output_path, header)) {
        return false;
    }

    if (!config_.quiet) {
        std::cout << "[recorder] Starting: " << info.name << " @ " << info.sample_rate_hz
                  << " Hz, center=" << info.center_freq_hz << " Hz, gain="
                  << info.gain_db << " dB\n";
    }

    ChunkQueue queue(config_.channel_capacity);
    stats_.reset();
    stop_.store(false, std::memory_order_relaxed);
    device_failed_.store(false, std::memory_order_relaxed);
    session_start_ = std::chrono::steady_clock::now();

    std::thread capture_thread([this, &device, &queue]() {
        if (!device.run(queue, stats_, stop_)) {
            device_failed_.store(true, std::memory_order_relaxed);
            std::cerr << "Warning: Capture thread finished with error\n";
        }
        // Lets the writer drain what is left and exit
        queue.close();
    });

    writer_loop(queue, writer);

    stop_.store(true, std::memory_order_relaxed);
    if (capture_thread.joinable()) {
        capture_thread.join();
    }
    queue_high_water_ = queue.high_water_mark();

    Status st = writer.finish();
    if (st != Status::Ok) {
        std::cerr << "Error: Failed to finalize " << config_.output_path
                  << ": " << status_str(st) << "\n";
        return false;
    }

    if (!config_.quiet) {
        std::cout << "[recorder] File finalized: " << config_.output_path << " ("
                  << writer.block_count() << " blocks, "
                  << writer.total_samples() << " samples)\n";
    }
    return true;
}

void CapturePipeline::writer_loop(ChunkQueue& queue, StreamWriter& writer) {
    const size_t size = sample_size(config_.sample_format);
    const uint32_t block_samples = config_.block_samples;
    const auto stats_interval = std::chrono::seconds(config_.stats_interval_sec);

    std::vector<uint8_t> acc;
    acc.reserve(static_cast<size_t>(block_samples) * size);
    uint32_t acc_samples = 0;
    uint64_t block_ts = 0;
    bool have_ts = false;

    auto last_stats = std::chrono::steady_clock::now();

    while (true) {
        if (config_.duration_sec > 0 &&
            seconds_since(session_start_) >= static_cast<double>(config_.duration_sec)) {
            if (!config_.quiet) {
                std::cout << "[recorder] Duration limit reached (" << config_.duration_sec
                          << "s), finalizing\n";
            }
            break;
        }

        if (stop_.load(std::memory_order_relaxed)) {
            if (!config_.quiet) {
                std::cout << "[recorder] Stop requested, finalizing\n";
            }
            break;
        }

        IqChunk chunk;
        ChunkQueue::PopResult r = queue.pop(chunk, CAPTURE_POP_TIMEOUT);
        if (r == ChunkQueue::PopResult::Timeout) {
            continue;
        }
        if (r == ChunkQueue::PopResult::Closed) {
            if (!config_.quiet) {
                std::cout << "[recorder] Capture ended, flushing\n";
            }
            break;
        }

        if (chunk.data.size() != static_cast<size_t>(chunk.sample_count) * size) {
            std::cerr << "Warning: Discarding chunk with " << chunk.data.size()
                      << " bytes for " << chunk.sample_count << " samples\n";
            continue;
        }

        stats_.add_samples_recorded(chunk.sample_count);

        if (!have_ts) {
            block_ts = chunk.timestamp_ns;
            have_ts = true;
        }
        acc.insert(acc.end(), chunk.data.begin(), chunk.data.end());
        acc_samples += chunk.sample_count;

        while (acc_samples >= block_samples) {
            size_t n_bytes = static_cast<size_t>(block_samples) * size;

            SampleBlock block;
            block.timestamp_ns = have_ts ? block_ts : 0;
            block.sample_count = block_samples;
            block.data.assign(acc.begin(), acc.begin() + static_cast<std::ptrdiff_t>(n_bytes));
            acc.erase(acc.begin(), acc.begin() + static_cast<std::ptrdiff_t>(n_bytes));
            acc_samples -= block_samples;

            write_block(writer, std::move(block));

            // The next block takes the timestamp of the next chunk received
            have_ts = false;
        }

        if (!config_.quiet && std::chrono::steady_clock::now() - last_stats >= stats_interval) {
            log_progress(queue);
            last_stats = std::chrono::steady_clock::now();
        }
    }

    if (acc_samples > 0) {
        SampleBlock block;
        block.timestamp_ns = have_ts ? block_ts : 0;
        block.sample_count = acc_samples;
        block.data.swap(acc);
        write_block(writer, std::move(block));
        if (!config_.quiet) {
            std::cout << "[recorder] Flushed partial block (" << acc_samples << " samples)\n";
        }
    }
}

void CapturePipeline::write_block(StreamWriter& writer, SampleBlock block) {
    uint64_t before = writer.bytes_written();
    Status st = writer.write_block(std::move(block));
    if (st != Status::Ok) {
        stats_.increment_write_errors();
        std::cerr << "Warning: Write error: " << status_str(st) << "\n";
        return;
    }
    stats_.increment_blocks_written();
    stats_.add_bytes_written(writer.bytes_written() - before);
}

void CapturePipeline::log_progress(const ChunkQueue& queue) const {
    double elapsed = seconds_since(session_start_);

    std::ios::fmtflags saved = std::cout.flags();
    std::streamsize precision = std::cout.precision();
    std::cout << std::fixed << std::setprecision(0)
              << "[recorder] [ " << elapsed << "s ] samples=" << stats_.samples_recorded()
              << " blocks=" << stats_.blocks_written()
              << " dropped=" << stats_.dropped_samples()
              << " (" << std::setprecision(2) << stats_.drop_rate_pct() << "%)"
              << " speed=" << std::setprecision(1) << stats_.write_speed_mbps(elapsed) << "MB/s";
    if (config_.verbose) {
        std::cout << " queue=" << queue.size() << "/" << queue.capacity()
                  << " high_water=" << queue.high_water_mark()
                  << " write_errors=" << stats_.write_errors();
    }
    std::cout << "\n";
    std::cout.flags(saved);
    std::cout.precision(precision);
}

} // namespace glos
