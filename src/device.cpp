/**
 * @file device.cpp
 * @brief Device implementations
 */

#include "device.hpp"

#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>
#include <thread>

namespace glos {

bool publish_chunk(ChunkQueue& queue, CaptureStats& stats, IqChunk& chunk) {
    if (queue.try_push(chunk)) {
        return true;
    }
    stats.record_drop(chunk.sample_count);
    return false;
}

// ============================================================================
// SimulatedDevice
// ============================================================================

SimulatedDevice::SimulatedDevice(uint32_t sample_rate_hz, uint64_t center_freq_hz,
                                 float gain_db, SampleFormat format)
    : sample_rate_hz_(sample_rate_hz)
    , center_freq_hz_(center_freq_hz)
    , gain_db_(gain_db)
    , format_(format)
{
}

DeviceInfo SimulatedDevice::info() const {
    DeviceInfo info;
    info.name = "Simulated SDR";
    info.serial = "SIM-0001";
    info.sample_rate_hz = sample_rate_hz_;
    info.center_freq_hz = center_freq_hz_;
    info.gain_db = gain_db_;
    info.sample_format = format_;
    return info;
}

void SimulatedDevice::fill_chunk(uint64_t first_sample, std::vector<uint8_t>& data) const {
    const double two_pi = 2.0 * 3.14159265358979323846;
    const size_t size = sample_size(format_);
    data.resize(static_cast<size_t>(chunk_samples_) * size);

    uint8_t* p = data.data();
    for (uint32_t i = 0; i < chunk_samples_; ++i) {
        double t = static_cast<double>(first_sample + i) / sample_rate_hz_;
        double phase = two_pi * tone_hz_ * t;
        double si = std::sin(phase);
        double sq = std::cos(phase);

        switch (format_) {
            case SampleFormat::Int8:
                p[0] = static_cast<uint8_t>(static_cast<int8_t>(127.0 * si));
                p[1] = static_cast<uint8_t>(static_cast<int8_t>(127.0 * sq));
                break;
            case SampleFormat::Int16:
                write_be16(p, static_cast<uint16_t>(static_cast<int16_t>(32767.0 * si)));
                write_be16(p + 2, static_cast<uint16_t>(static_cast<int16_t>(32767.0 * sq)));
                break;
            case SampleFormat::Float32: {
                float fi = static_cast<float>(si);
                float fq = static_cast<float>(sq);
                uint32_t bi, bq;
                std::memcpy(&bi, &fi, sizeof(bi));
                std::memcpy(&bq, &fq, sizeof(bq));
                write_be32(p, bi);
                write_be32(p + 4, bq);
                break;
            }
        }
        p += size;
    }
}

bool SimulatedDevice::run(ChunkQueue& queue, CaptureStats& stats, const std::atomic<bool>& stop) {
    if (sample_rate_hz_ == 0 || chunk_samples_ == 0) {
        std::cerr << "Error: Simulated device needs a non-zero sample rate and chunk size\n";
        return false;
    }

    const double sample_period_ns = 1e9 / sample_rate_hz_;
    const auto start_mono = std::chrono::steady_clock::now();
    const uint64_t start_epoch_ns = get_epoch_ns();

    uint64_t global_sample = 0;
    chunks_generated_ = 0;

    while (!stop.load(std::memory_order_relaxed)) {
        if (max_chunks_ != 0 && chunks_generated_ >= max_chunks_) {
            break;
        }

        IqChunk chunk;
        chunk.timestamp_ns = start_epoch_ns +
            static_cast<uint64_t>(static_cast<double>(global_sample) * sample_period_ns);
        chunk.sample_count = chunk_samples_;
        fill_chunk(global_sample, chunk.data);

        publish_chunk(queue, stats, chunk);

        global_sample += chunk_samples_;
        chunks_generated_++;

        if (realtime_) {
            auto expected = std::chrono::nanoseconds(
                static_cast<int64_t>(static_cast<double>(global_sample) * sample_period_ns));
            auto elapsed = std::chrono::steady_clock::now() - start_mono;
            if (expected > elapsed) {
                std::this_thread::sleep_for(expected - elapsed);
            }
        }
    }

    return true;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<Device> create_device(const RecorderConfig& config) {
    switch (config.device) {
        case DeviceKind::Simulated:
            return std::unique_ptr<Device>(new SimulatedDevice(
                config.sample_rate_hz, config.center_freq_hz, config.gain_db,
                config.sample_format));
        case DeviceKind::HackRf:
            std::cerr << "Error: HackRF device not found (not supported in this build)\n";
            break;
        case DeviceKind::PlutoSdr:
            std::cerr << "Error: PlutoSDR device not found (not supported in this build)\n";
            break;
    }
    return nullptr;
}

} // namespace glos
