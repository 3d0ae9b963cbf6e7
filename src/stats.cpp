/**
 * @file stats.cpp
 * @brief Session statistics implementation
 */

#include "stats.hpp"

#include <iomanip>

namespace glos {

namespace {
const char* RULE = "-------------------------------------------";

double per_second_millions(uint64_t count, double elapsed_sec) {
    if (elapsed_sec < 1e-9) {
        return 0.0;
    }
    return static_cast<double>(count) / elapsed_sec / 1e6;
}
} // namespace

// ============================================================================
// CaptureSummary
// ============================================================================

nlohmann::json CaptureSummary::to_json() const {
    nlohmann::json j;
    j["duration_sec"] = duration_sec;
    j["samples_recorded"] = samples_recorded;
    j["blocks_written"] = blocks_written;
    j["dropped"]["samples"] = dropped_samples;
    j["dropped"]["chunks"] = dropped_chunks;
    j["dropped"]["rate_pct"] = drop_rate_pct;
    j["write_errors"] = write_errors;
    j["bytes_written"] = bytes_written;
    j["throughput_msps"] = throughput_msps;
    j["write_speed_mbps"] = write_speed_mbps;
    return j;
}

void CaptureSummary::print(std::ostream& os) const {
    std::ios::fmtflags saved = os.flags();
    std::streamsize precision = os.precision();
    os << std::fixed;
    os << RULE << "\n";
    os << "  Duration      : " << std::setprecision(1) << duration_sec << "s\n";
    os << "  Samples       : " << samples_recorded << "\n";
    os << "  Blocks        : " << blocks_written << "\n";
    os << "  Dropped       : " << dropped_samples << " (" << std::setprecision(2)
       << drop_rate_pct << "%, " << dropped_chunks << " chunks)\n";
    os << "  Write errors  : " << write_errors << "\n";
    os << "  Bytes written : " << std::setprecision(1) << bytes_written / 1e6 << " MB\n";
    os << "  Throughput    : " << std::setprecision(3) << throughput_msps << " Msps\n";
    os << "  Write speed   : " << std::setprecision(1) << write_speed_mbps << " MB/s\n";
    os << RULE << "\n";
    os.flags(saved);
    os.precision(precision);
}

// ============================================================================
// CaptureStats
// ============================================================================

CaptureStats::CaptureStats()
    : start_time_(std::chrono::steady_clock::now())
{
}

void CaptureStats::record_drop(uint32_t samples) {
    dropped_samples_.fetch_add(samples, std::memory_order_relaxed);
    dropped_chunks_.fetch_add(1, std::memory_order_relaxed);
}

uint64_t CaptureStats::dropped_samples() const {
    return dropped_samples_.load(std::memory_order_relaxed);
}

uint64_t CaptureStats::dropped_chunks() const {
    return dropped_chunks_.load(std::memory_order_relaxed);
}

void CaptureStats::add_samples_recorded(uint64_t samples) {
    samples_recorded_.fetch_add(samples, std::memory_order_relaxed);
}

void CaptureStats::increment_blocks_written() {
    blocks_written_.fetch_add(1, std::memory_order_relaxed);
}

void CaptureStats::add_bytes_written(uint64_t bytes) {
    bytes_written_.fetch_add(bytes, std::memory_order_relaxed);
}

void CaptureStats::increment_write_errors() {
    write_errors_.fetch_add(1, std::memory_order_relaxed);
}

uint64_t CaptureStats::samples_recorded() const {
    return samples_recorded_.load(std::memory_order_relaxed);
}

uint64_t CaptureStats::blocks_written() const {
    return blocks_written_.load(std::memory_order_relaxed);
}

uint64_t CaptureStats::bytes_written() const {
    return bytes_written_.load(std::memory_order_relaxed);
}

uint64_t CaptureStats::write_errors() const {
    return write_errors_.load(std::memory_order_relaxed);
}

double CaptureStats::elapsed_seconds() const {
    return seconds_since(start_time_);
}

double CaptureStats::throughput_msps(double elapsed_sec) const {
    return per_second_millions(samples_recorded(), elapsed_sec);
}

double CaptureStats::write_speed_mbps(double elapsed_sec) const {
    return per_second_millions(bytes_written(), elapsed_sec);
}

double CaptureStats::drop_rate_pct() const {
    uint64_t recorded = samples_recorded();
    uint64_t dropped = dropped_samples();
    uint64_t total = recorded + dropped;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(dropped) / static_cast<double>(total) * 100.0;
}

CaptureSummary CaptureStats::summary() const {
    return summary(elapsed_seconds());
}

CaptureSummary CaptureStats::summary(double elapsed_sec) const {
    CaptureSummary s;
    s.duration_sec = elapsed_sec;
    s.samples_recorded = samples_recorded();
    s.blocks_written = blocks_written();
    s.dropped_samples = dropped_samples();
    s.dropped_chunks = dropped_chunks();
    s.write_errors = write_errors();
    s.bytes_written = bytes_written();
    s.throughput_msps = throughput_msps(elapsed_sec);
    s.write_speed_mbps = write_speed_mbps(elapsed_sec);
    s.drop_rate_pct = drop_rate_pct();
    return s;
}

nlohmann::json CaptureStats::to_json() const {
    return summary().to_json();
}

void CaptureStats::reset() {
    samples_recorded_.store(0, std::memory_order_relaxed);
    blocks_written_.store(0, std::memory_order_relaxed);
    dropped_samples_.store(0, std::memory_order_relaxed);
    dropped_chunks_.store(0, std::memory_order_relaxed);
    write_errors_.store(0, std::memory_order_relaxed);
    bytes_written_.store(0, std::memory_order_relaxed);
    start_time_ = std::chrono::steady_clock::now();
}

// ============================================================================
// ReplayStats
// ============================================================================

ReplayStats::ReplayStats()
    : start_time_(std::chrono::steady_clock::now())
{
}

void ReplayStats::increment_packets_sent() {
    packets_sent_.fetch_add(1, std::memory_order_relaxed);
}

void ReplayStats::add_samples_sent(uint64_t samples) {
    samples_sent_.fetch_add(samples, std::memory_order_relaxed);
}

void ReplayStats::add_bytes_sent(uint64_t bytes) {
    bytes_sent_.fetch_add(bytes, std::memory_order_relaxed);
}

void ReplayStats::increment_underruns() {
    underruns_.fetch_add(1, std::memory_order_relaxed);
}

void ReplayStats::increment_send_errors() {
    send_errors_.fetch_add(1, std::memory_order_relaxed);
}

void ReplayStats::add_timing_error_ns(uint64_t ns) {
    timing_error_ns_total_.fetch_add(ns, std::memory_order_relaxed);
}

void ReplayStats::increment_loops() {
    loops_.fetch_add(1, std::memory_order_relaxed);
}

uint64_t ReplayStats::packets_sent() const {
    return packets_sent_.load(std::memory_order_relaxed);
}

uint64_t ReplayStats::samples_sent() const {
    return samples_sent_.load(std::memory_order_relaxed);
}

uint64_t ReplayStats::bytes_sent() const {
    return bytes_sent_.load(std::memory_order_relaxed);
}

uint64_t ReplayStats::underruns() const {
    return underruns_.load(std::memory_order_relaxed);
}

uint64_t ReplayStats::send_errors() const {
    return send_errors_.load(std::memory_order_relaxed);
}

uint64_t ReplayStats::timing_error_ns_total() const {
    return timing_error_ns_total_.load(std::memory_order_relaxed);
}

uint64_t ReplayStats::loops() const {
    return loops_.load(std::memory_order_relaxed);
}

double ReplayStats::avg_timing_error_us() const {
    uint64_t packets = packets_sent();
    if (packets == 0) {
        return 0.0;
    }
    return static_cast<double>(timing_error_ns_total()) / static_cast<double>(packets) / 1000.0;
}

double ReplayStats::elapsed_seconds() const {
    return seconds_since(start_time_);
}

double ReplayStats::throughput_msps(double elapsed_sec) const {
    return per_second_millions(samples_sent(), elapsed_sec);
}

nlohmann::json ReplayStats::to_json() const {
    double elapsed = elapsed_seconds();

    nlohmann::json j;
    j["uptime_sec"] = elapsed;
    j["packets_sent"] = packets_sent();
    j["samples_sent"] = samples_sent();
    j["bytes_sent"] = bytes_sent();
    j["underruns"] = underruns();
    j["send_errors"] = send_errors();
    j["timing"]["error_ns_total"] = timing_error_ns_total();
    j["timing"]["avg_error_us"] = avg_timing_error_us();
    j["throughput_msps"] = throughput_msps(elapsed);
    j["loops"] = loops();
    return j;
}

void ReplayStats::print_summary(std::ostream& os) const {
    double elapsed = elapsed_seconds();

    std::ios::fmtflags saved = os.flags();
    std::streamsize precision = os.precision();
    os << std::fixed;
    os << RULE << "\n";
    os << "  Duration      : " << std::setprecision(1) << elapsed << "s\n";
    os << "  Packets sent  : " << packets_sent() << "\n";
    os << "  Samples sent  : " << samples_sent() << "\n";
    os << "  Bytes sent    : " << std::setprecision(1) << bytes_sent() / 1e6 << " MB\n";
    os << "  Underruns     : " << underruns() << "\n";
    os << "  Send errors   : " << send_errors() << "\n";
    os << "  Throughput    : " << std::setprecision(3) << throughput_msps(elapsed) << " Msps\n";
    os << "  Timing error  : " << std::setprecision(1) << avg_timing_error_us() << " us avg\n";
    os << RULE << "\n";
    os.flags(saved);
    os.precision(precision);
}

void ReplayStats::reset() {
    packets_sent_.store(0, std::memory_order_relaxed);
    samples_sent_.store(0, std::memory_order_relaxed);
    bytes_sent_.store(0, std::memory_order_relaxed);
    underruns_.store(0, std::memory_order_relaxed);
    send_errors_.store(0, std::memory_order_relaxed);
    timing_error_ns_total_.store(0, std::memory_order_relaxed);
    loops_.store(0, std::memory_order_relaxed);
    start_time_ = std::chrono::steady_clock::now();
}

} // namespace glos
