/**
 * @file stats.hpp
 * @brief Session statistics for recording and replay
 */

#ifndef GLOS_STATS_HPP
#define GLOS_STATS_HPP

#include "common.hpp"

#include <atomic>
#include <chrono>
#include <ostream>
#include <nlohmann/json.hpp>

namespace glos {

/**
 * @brief Point-in-time copy of recorder counters plus derived rates
 */
struct CaptureSummary {
    double duration_sec = 0.0;
    uint64_t samples_recorded = 0;
    uint64_t blocks_written = 0;
    uint64_t dropped_samples = 0;
    uint64_t dropped_chunks = 0;
    uint64_t write_errors = 0;
    uint64_t bytes_written = 0;
    double throughput_msps = 0.0;
    double write_speed_mbps = 0.0;
    double drop_rate_pct = 0.0;

    nlohmann::json to_json() const;
    void print(std::ostream& os) const;
};

/**
 * @brief Recorder counters
 *
 * Each counter has exactly one writer thread: the capture thread owns the
 * drop counters, the writer thread owns everything else. Relaxed atomics
 * are enough for the readers (progress lines, final summary).
 */
class CaptureStats {
public:
    CaptureStats();

    // ========================================================================
    // Capture Thread
    // ========================================================================

    void record_drop(uint32_t samples);

    uint64_t dropped_samples() const;
    uint64_t dropped_chunks() const;

    // ========================================================================
    // Writer Thread
    // ========================================================================

    void add_samples_recorded(uint64_t samples);
    void increment_blocks_written();
    void add_bytes_written(uint64_t bytes);
    void increment_write_errors();

    uint64_t samples_recorded() const;
    uint64_t blocks_written() const;
    uint64_t bytes_written() const;
    uint64_t write_errors() const;

    // ========================================================================
    // Derived Rates
    // ========================================================================

    double elapsed_seconds() const;

    double throughput_msps(double elapsed_sec) const;
    double write_speed_mbps(double elapsed_sec) const;

    /**
     * @brief Dropped / (recorded + dropped), in percent
     */
    double drop_rate_pct() const;

    CaptureSummary summary() const;
    CaptureSummary summary(double elapsed_sec) const;

    nlohmann::json to_json() const;

    void reset();

private:
    std::chrono::steady_clock::time_point start_time_;

    std::atomic<uint64_t> samples_recorded_{0};
    std::atomic<uint64_t> blocks_written_{0};
    std::atomic<uint64_t> dropped_samples_{0};
    std::atomic<uint64_t> dropped_chunks_{0};
    std::atomic<uint64_t> write_errors_{0};
    std::atomic<uint64_t> bytes_written_{0};
};

/**
 * @brief Replay counters
 *
 * Updated by the single replay thread, read by the control server.
 */
class ReplayStats {
public:
    ReplayStats();

    void increment_packets_sent();
    void add_samples_sent(uint64_t samples);
    void add_bytes_sent(uint64_t bytes);
    void increment_underruns();
    void increment_send_errors();
    void add_timing_error_ns(uint64_t ns);
    void increment_loops();

    uint64_t packets_sent() const;
    uint64_t samples_sent() const;
    uint64_t bytes_sent() const;
    uint64_t underruns() const;
    uint64_t send_errors() const;
    uint64_t timing_error_ns_total() const;
    uint64_t loops() const;

    /**
     * @brief Mean timing error per sent packet in microseconds
     */
    double avg_timing_error_us() const;

    double elapsed_seconds() const;
    double throughput_msps(double elapsed_sec) const;

    nlohmann::json to_json() const;
    void print_summary(std::ostream& os) const;

    void reset();

private:
    std::chrono::steady_clock::time_point start_time_;

    std::atomic<uint64_t> packets_sent_{0};
    std::atomic<uint64_t> samples_sent_{0};
    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> underruns_{0};
    std::atomic<uint64_t> send_errors_{0};
    std::atomic<uint64_t> timing_error_ns_total_{0};
    std::atomic<uint64_t> loops_{0};
};

} // namespace glos

#endif // GLOS_STATS_HPP
