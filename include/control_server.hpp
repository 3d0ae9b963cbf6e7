/**
 * @file control_server.hpp
 * @brief TCP control port for a running replay (glos-ctl)
 *
 * Protocol: one JSON object per line in each direction.
 * Request {"cmd": "status" | "stats" | "pause" | "resume" | "stop"},
 * response always carries "status": "ok" or "error".
 */

#ifndef GLOS_CONTROL_SERVER_HPP
#define GLOS_CONTROL_SERVER_HPP

#include "replay_session.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace glos {

constexpr size_t CONTROL_MAX_LINE = 4096;

class ControlServer {
public:
    explicit ControlServer(ReplaySession& session);
    ~ControlServer();

    // Non-copyable
    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // ========================================================================
    // Server Control
    // ========================================================================

    /**
     * @brief Start listening
     * @param port TCP port (0 picks a free one, see port())
     * @return true on success
     */
    bool start(int port);

    void stop();

    bool is_running() const;

    /**
     * @brief Port actually bound
     */
    int port() const { return port_; }

    int clients() const { return clients_.load(std::memory_order_relaxed); }

    /**
     * @brief Handler threads not yet joined (live clients plus finished ones
     *        awaiting the next accept)
     */
    size_t handler_threads() const;

    /**
     * @brief Dispatch one parsed request
     */
    nlohmann::json handle_command(const nlohmann::json& cmd);

private:
    void accept_loop();
    void client_handler(int fd, std::shared_ptr<std::atomic<bool>> done);

    // Joins handlers whose client has disconnected; threads_mutex_ held
    void reap_finished_clients();

    nlohmann::json cmd_status();
    nlohmann::json cmd_stats();
    nlohmann::json cmd_pause();
    nlohmann::json cmd_resume();
    nlohmann::json cmd_stop();

    void send_json(int fd, const nlohmann::json& j);
    bool recv_line(int fd, std::string& line);

    ReplaySession& session_;

    int server_fd_ = -1;
    int port_ = 0;

    struct ClientThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::thread accept_thread_;
    mutable std::mutex threads_mutex_;
    std::vector<ClientThread> client_threads_;

    std::atomic<bool> running_{false};
    std::atomic<int> clients_{0};
};

} // namespace glos

#endif // GLOS_CONTROL_SERVER_HPP
