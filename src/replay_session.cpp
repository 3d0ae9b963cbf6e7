/**
 * @file replay_session.cpp
 * @brief Replay loop implementation
 */

#include "replay_session.hpp"
#include "stream_reader.hpp"
#include "wire_codec.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace glos {

namespace {

bool make_sockaddr(const std::string& text, struct sockaddr_in& addr) {
    std::string host;
    uint16_t port = 0;
    if (!parse_socket_addr(text, host, port)) {
        return false;
    }
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    return inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1;
}

} // anonymous namespace

ReplaySession::ReplaySession(const ReplayConfig& config)
    : config_(config)
    , last_progress_(std::chrono::steady_clock::now())
{
}

ReplaySession::~ReplaySession() {
    close_socket();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool ReplaySession::init() {
    if (!(config_.speed > 0.0) || !std::isfinite(config_.speed)) {
        std::cerr << "Error: Replay speed must be > 0 (got " << config_.speed << ")\n";
        return false;
    }

    std::string target;
    if (!parse_udp_target(config_.target_addr, target)) {
        std::cerr << "Error: Invalid target address: " << config_.target_addr << "\n";
        return false;
    }
    config_.target_addr = target;

    StreamReader reader;
    Status st = reader.open(config_.input_path);
    if (st != Status::Ok) {
        std::cerr << "Error: Cannot open " << config_.input_path << ": "
                  << status_str(st) << "\n";
        return false;
    }
    header_ = reader.header();

    if (!open_socket()) {
        return false;
    }

    stats_.reset();
    initialized_ = true;
    return true;
}

bool ReplaySession::open_socket() {
    struct sockaddr_in bind_addr;
    if (!make_sockaddr(config_.bind_addr, bind_addr)) {
        std::cerr << "Error: Invalid bind address: " << config_.bind_addr << "\n";
        return false;
    }
    struct sockaddr_in target_addr;
    if (!make_sockaddr(config_.target_addr, target_addr)) {
        std::cerr << "Error: Invalid target address: " << config_.target_addr << "\n";
        return false;
    }

    sock_fd_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_fd_ < 0) {
        std::cerr << "Error: Cannot create UDP socket: " << strerror(errno) << "\n";
        return false;
    }

    if (bind(sock_fd_, reinterpret_cast<struct sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        std::cerr << "Error: Cannot bind UDP socket to " << config_.bind_addr
                  << ": " << strerror(errno) << "\n";
        close_socket();
        return false;
    }

    if (connect(sock_fd_, reinterpret_cast<struct sockaddr*>(&target_addr),
                sizeof(target_addr)) < 0) {
        std::cerr << "Error: Cannot connect UDP socket to " << config_.target_addr
                  << ": " << strerror(errno) << "\n";
        close_socket();
        return false;
    }

    return true;
}

void ReplaySession::close_socket() {
    if (sock_fd_ >= 0) {
        ::close(sock_fd_);
        sock_fd_ = -1;
    }
}

uint16_t ReplaySession::local_port() const {
    if (sock_fd_ < 0) {
        return 0;
    }
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (getsockname(sock_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

// ============================================================================
// Replay Loop
// ============================================================================

bool ReplaySession::run() {
    if (!initialized_) {
        std::cerr << "Error: Replay session not initialized\n";
        return false;
    }

    if (!config_.quiet) {
        std::cout << "[replayer] " << config_.input_path << ": "
                  << device_type_str(header_.device_type) << ", "
                  << header_.sample_rate << " Hz, center=" << header_.center_freq
                  << " Hz, " << sample_format_str(header_.sample_format) << ", "
                  << compression_str(header_.compression) << "\n";
        std::cout << "[replayer] Sending to udp://" << config_.target_addr
                  << " at " << config_.speed << "x"
                  << (config_.loop_playback ? " (looping)" : "") << "\n";
    }

    running_.store(true, std::memory_order_relaxed);
    last_progress_ = std::chrono::steady_clock::now();

    TimingController timing(config_.speed, paused_);
    bool ok = true;
    uint64_t loop_count = 0;

    while (!stop_.load(std::memory_order_relaxed)) {
        loop_count++;
        if (loop_count > 1) {
            if (!config_.quiet) {
                std::cout << "[replayer] Loop #" << loop_count << "\n";
            }
            timing.reset();
        }

        int64_t blocks = play_pass(timing);
        if (blocks < 0) {
            ok = false;
            break;
        }
        stats_.increment_loops();

        if (!config_.loop_playback) {
            break;
        }
        if (blocks == 0) {
            std::cerr << "Warning: No blocks in " << config_.input_path << ", not looping\n";
            break;
        }
    }

    running_.store(false, std::memory_order_relaxed);

    if (!config_.quiet) {
        std::cout << "[replayer] Replay finished\n";
        stats_.print_summary(std::cout);
    }
    return ok;
}

int64_t ReplaySession::play_pass(TimingController& timing) {
    StreamReader reader;
    Status st = reader.open(config_.input_path);
    if (st != Status::Ok) {
        std::cerr << "Error: Cannot reopen " << config_.input_path << ": "
                  << status_str(st) << "\n";
        return -1;
    }

    int64_t blocks = 0;
    uint64_t samples = 0;
    SampleBlock block;

    while (!stop_.load(std::memory_order_relaxed) && reader.next_block(block)) {
        uint64_t error_ns = timing.wait_for(block.timestamp_ns, stats_);
        stats_.add_timing_error_ns(error_ns);

        // A stop requested while paused or sleeping skips the send
        if (stop_.load(std::memory_order_relaxed)) {
            break;
        }

        send_block(block);
        blocks++;
        samples += block.sample_count;

        if (!config_.quiet && std::chrono::steady_clock::now() - last_progress_ >=
                std::chrono::seconds(config_.stats_interval_sec)) {
            log_progress();
            last_progress_ = std::chrono::steady_clock::now();
        }
    }

    if (reader.error() != Status::Ok) {
        std::cerr << "Warning: Read error in " << config_.input_path << ": "
                  << status_str(reader.error()) << "\n";
    }
    if (reader.stats().blocks_corrupted > 0) {
        std::cerr << "Warning: Skipped " << reader.stats().blocks_corrupted
                  << " corrupted blocks\n";
    }

    if (!config_.quiet && !stop_.load(std::memory_order_relaxed)) {
        std::cout << "[replayer] EOF: " << blocks << " blocks, " << samples << " samples\n";
    }
    return blocks;
}

void ReplaySession::send_block(const SampleBlock& block) {
    Status st = encode_datagram(block, datagram_);
    if (st != Status::Ok) {
        stats_.increment_send_errors();
        if (config_.verbose) {
            std::cerr << "Warning: Cannot frame block at " << block.timestamp_ns
                      << " (" << block.data.size() << " bytes): " << status_str(st) << "\n";
        }
        return;
    }

    ssize_t n = send(sock_fd_, datagram_.data(), datagram_.size(), 0);
    if (n < 0) {
        stats_.increment_send_errors();
        if (config_.verbose) {
            std::cerr << "Warning: send failed: " << strerror(errno) << "\n";
        }
        return;
    }

    stats_.increment_packets_sent();
    stats_.add_samples_sent(block.sample_count);
    stats_.add_bytes_sent(static_cast<uint64_t>(n));
}

void ReplaySession::log_progress() const {
    double elapsed = stats_.elapsed_seconds();

    std::ios::fmtflags saved = std::cout.flags();
    std::streamsize precision = std::cout.precision();
    std::cout << std::fixed << std::setprecision(0)
              << "[replayer] [ " << elapsed << "s ] packets=" << stats_.packets_sent()
              << " samples=" << stats_.samples_sent()
              << " underruns=" << stats_.underruns()
              << " timing_err=" << std::setprecision(1) << stats_.avg_timing_error_us() << "us";
    if (config_.verbose) {
        std::cout << " send_errors=" << stats_.send_errors()
                  << " rate=" << std::setprecision(3) << stats_.throughput_msps(elapsed) << "Msps";
    }
    std::cout << "\n";
    std::cout.flags(saved);
    std::cout.precision(precision);
}

nlohmann::json ReplaySession::status_json() const {
    nlohmann::json j;
    j["replayer"] = GLOS_REPLAYER_NAME;
    j["version"] = GLOS_TOOLS_VERSION;
    j["running"] = is_running();
    j["paused"] = is_paused();
    j["stopping"] = is_stopping();
    j["input"] = config_.input_path;
    j["target"] = config_.target_addr;
    j["speed"] = config_.speed;
    j["loop"] = config_.loop_playback;
    j["loops_completed"] = stats_.loops();
    j["packets_sent"] = stats_.packets_sent();
    j["header"] = header_.to_json();
    return j;
}

} // namespace glos
