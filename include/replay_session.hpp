/**
 * @file replay_session.hpp
 * @brief Replays a GLOS file as timed UDP datagrams
 */

#ifndef GLOS_REPLAY_SESSION_HPP
#define GLOS_REPLAY_SESSION_HPP

#include "config.hpp"
#include "format.hpp"
#include "stats.hpp"
#include "timing_controller.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace glos {

/**
 * @brief Single-threaded replay loop
 *
 * reader -> timing controller -> wire codec -> connected UDP socket.
 * The stop and pause flags may be set from any thread (signal handler,
 * control server) while run() executes.
 */
class ReplaySession {
public:
    explicit ReplaySession(const ReplayConfig& config);
    ~ReplaySession();

    // Non-copyable
    ReplaySession(const ReplaySession&) = delete;
    ReplaySession& operator=(const ReplaySession&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Validate the configuration, read the file header and open the socket
     * @return false on error (message printed)
     */
    bool init();

    /**
     * @brief Play the file (repeatedly when looping) until done or stopped
     * @return false if the session was not initialized or the file vanished
     */
    bool run();

    /**
     * @brief Stop after the current block; also releases a pause
     */
    void request_stop() {
        stop_.store(true, std::memory_order_relaxed);
        paused_.store(false, std::memory_order_relaxed);
    }

    void pause() { paused_.store(true, std::memory_order_relaxed); }
    void resume() { paused_.store(false, std::memory_order_relaxed); }

    std::atomic<bool>& stop_flag() { return stop_; }

    bool is_running() const { return running_.load(std::memory_order_relaxed); }
    bool is_paused() const { return paused_.load(std::memory_order_relaxed); }
    bool is_stopping() const { return stop_.load(std::memory_order_relaxed); }

    // ========================================================================
    // Accessors
    // ========================================================================

    const ReplayConfig& config() const { return config_; }

    /**
     * @brief File header, valid after init()
     */
    const Header& header() const { return header_; }

    ReplayStats& stats() { return stats_; }
    const ReplayStats& stats() const { return stats_; }

    /**
     * @brief Local UDP port after init() (useful when binding port 0)
     */
    uint16_t local_port() const;

    nlohmann::json status_json() const;

private:
    bool open_socket();
    void close_socket();

    /**
     * @brief One pass over the file
     * @return Number of blocks sent or attempted, or -1 if the file could not be opened
     */
    int64_t play_pass(TimingController& timing);

    void send_block(const SampleBlock& block);
    void log_progress() const;

    ReplayConfig config_;
    Header header_;
    ReplayStats stats_;

    int sock_fd_ = -1;
    bool initialized_ = false;

    std::atomic<bool> stop_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> running_{false};

    std::chrono::steady_clock::time_point last_progress_;
    std::vector<uint8_t> datagram_;
};

} // namespace glos

#endif // GLOS_REPLAY_SESSION_HPP
