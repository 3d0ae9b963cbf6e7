/**
 * @file device.hpp
 * @brief I/Q source capability and the built-in simulated receiver
 */

#ifndef GLOS_DEVICE_HPP
#define GLOS_DEVICE_HPP

#include "chunk_queue.hpp"
#include "config.hpp"
#include "format.hpp"
#include "stats.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace glos {

struct DeviceInfo {
    std::string name;
    std::string serial;
    uint32_t sample_rate_hz = 0;
    uint64_t center_freq_hz = 0;
    float gain_db = 0.0f;
    SampleFormat sample_format = SampleFormat::Int16;
};

/**
 * @brief Source of timestamped I/Q chunks
 *
 * run() blocks on the calling thread, offering chunks to the queue until
 * the stop flag is set or the source ends. It must never block on a full
 * queue; use publish_chunk().
 */
class Device {
public:
    virtual ~Device() = default;

    virtual DeviceInfo info() const = 0;

    /**
     * @brief Stream chunks until stopped
     * @return false if the device failed
     */
    virtual bool run(ChunkQueue& queue, CaptureStats& stats, const std::atomic<bool>& stop) = 0;
};

/**
 * @brief Offer a chunk without blocking; count it as dropped if the queue is full
 * @return true if queued
 */
bool publish_chunk(ChunkQueue& queue, CaptureStats& stats, IqChunk& chunk);

/**
 * @brief Synthetic receiver producing a 1 kHz complex tone
 *
 * I = sin, Q = cos at full scale, big-endian in the requested format.
 * Timestamps are session-start epoch ns plus sample index times the
 * sample period. Output is paced to real time unless disabled.
 */
class SimulatedDevice : public Device {
public:
    SimulatedDevice(uint32_t sample_rate_hz, uint64_t center_freq_hz, float gain_db,
                    SampleFormat format = SampleFormat::Int16);

    DeviceInfo info() const override;

    bool run(ChunkQueue& queue, CaptureStats& stats, const std::atomic<bool>& stop) override;

    void set_chunk_samples(uint32_t samples) { chunk_samples_ = samples; }
    void set_tone_hz(double hz) { tone_hz_ = hz; }

    /**
     * @brief Produce as fast as possible instead of at the sample rate
     */
    void set_realtime(bool realtime) { realtime_ = realtime; }

    /**
     * @brief Return from run() after this many chunks (0 = unlimited)
     */
    void set_max_chunks(uint64_t chunks) { max_chunks_ = chunks; }

    uint64_t chunks_generated() const { return chunks_generated_; }

private:
    void fill_chunk(uint64_t first_sample, std::vector<uint8_t>& data) const;

    uint32_t sample_rate_hz_;
    uint64_t center_freq_hz_;
    float gain_db_;
    SampleFormat format_;

    uint32_t chunk_samples_ = DEFAULT_CHUNK_SAMPLES;
    double tone_hz_ = 1000.0;
    bool realtime_ = true;
    uint64_t max_chunks_ = 0;
    uint64_t chunks_generated_ = 0;
};

/**
 * @brief Open the device selected by the configuration
 * @return nullptr (with a message on stderr) if unavailable
 */
std::unique_ptr<Device> create_device(const RecorderConfig& config);

} // namespace glos

#endif // GLOS_DEVICE_HPP
