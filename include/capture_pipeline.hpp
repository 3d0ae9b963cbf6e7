/**
 * @file capture_pipeline.hpp
 * @brief Two-thread recording pipeline: device -> chunk queue -> file
 *
 * The device runs on a capture thread and never blocks on a full queue
 * (chunks are dropped and counted instead). The calling thread runs the
 * writer loop, which accumulates chunks into fixed-size blocks. Whatever
 * ends the session (stop flag, duration limit, device exit), the writer
 * flushes the final partial block and finalizes the header.
 */

#ifndef GLOS_CAPTURE_PIPELINE_HPP
#define GLOS_CAPTURE_PIPELINE_HPP

#include "chunk_queue.hpp"
#include "config.hpp"
#include "device.hpp"
#include "stats.hpp"
#include "stream_writer.hpp"

#include <atomic>
#include <chrono>

namespace glos {

constexpr auto CAPTURE_POP_TIMEOUT = std::chrono::milliseconds(100);

class CapturePipeline {
public:
    explicit CapturePipeline(const RecorderConfig& config);

    // Non-copyable
    CapturePipeline(const CapturePipeline&) = delete;
    CapturePipeline& operator=(const CapturePipeline&) = delete;

    /**
     * @brief Record until stopped, the duration elapses or the device ends
     * @param device Source to capture from
     * @return false if the output could not be created or finalized
     */
    bool run(Device& device);

    /**
     * @brief Ask both threads to finish (safe from any thread)
     */
    void request_stop() { stop_.store(true, std::memory_order_relaxed); }

    std::atomic<bool>& stop_flag() { return stop_; }

    CaptureStats& stats() { return stats_; }
    const CaptureStats& stats() const { return stats_; }

    /**
     * @brief Whether the device thread reported a failure
     */
    bool device_failed() const { return device_failed_.load(std::memory_order_relaxed); }

    size_t queue_high_water() const { return queue_high_water_; }

private:
    void writer_loop(ChunkQueue& queue, StreamWriter& writer);
    void write_block(StreamWriter& writer, SampleBlock block);
    void log_progress(const ChunkQueue& queue) const;

    RecorderConfig config_;
    CaptureStats stats_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> device_failed_{false};

    std::chrono::steady_clock::time_point session_start_;
    size_t queue_high_water_ = 0;
};

} // namespace glos

#endif // GLOS_CAPTURE_PIPELINE_HPP
