/**
 * @file control_server.cpp
 * @brief Control server implementation
 */

#include "control_server.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>

namespace glos {

ControlServer::ControlServer(ReplaySession& session)
    : session_(session)
{
}

ControlServer::~ControlServer() {
    stop();
}

// ============================================================================
// Server Control
// ============================================================================

bool ControlServer::start(int port) {
    if (running_.load(std::memory_order_relaxed)) {
        return true;
    }

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        std::cerr << "Error: Cannot create control socket: " << strerror(errno) << "\n";
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "Error: Cannot bind control socket to port " << port
                  << ": " << strerror(errno) << "\n";
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 8) < 0) {
        std::cerr << "Error: listen failed: " << strerror(errno) << "\n";
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    } else {
        port_ = port;
    }

    running_.store(true, std::memory_order_relaxed);
    accept_thread_ = std::thread(&ControlServer::accept_loop, this);

    if (!session_.config().quiet) {
        std::cout << "[replayer] Control server listening on TCP port: " << port_ << "\n";
    }
    return true;
}

void ControlServer::stop() {
    running_.store(false, std::memory_order_relaxed);

    if (server_fd_ >= 0) {
        // Wakes up accept()
        shutdown(server_fd_, SHUT_RDWR);
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    std::lock_guard<std::mutex> lock(threads_mutex_);
    for (auto& c : client_threads_) {
        if (c.thread.joinable()) {
            c.thread.join();
        }
    }
    client_threads_.clear();
}

bool ControlServer::is_running() const {
    return running_.load(std::memory_order_relaxed);
}

size_t ControlServer::handler_threads() const {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    return client_threads_.size();
}

// ============================================================================
// Accept Loop
// ============================================================================

void ControlServer::accept_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        struct sockaddr_in client_addr;
        socklen_t addr_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, reinterpret_cast<struct sockaddr*>(&client_addr),
                               &addr_len);
        if (client_fd < 0) {
            if (errno == EINTR || !running_.load(std::memory_order_relaxed)) {
                break;
            }
            continue;
        }

        clients_.fetch_add(1, std::memory_order_relaxed);

        std::lock_guard<std::mutex> lock(threads_mutex_);
        reap_finished_clients();

        ClientThread client;
        client.done = std::make_shared<std::atomic<bool>>(false);
        client.thread = std::thread(&ControlServer::client_handler, this, client_fd, client.done);
        client_threads_.push_back(std::move(client));
    }
}

// ============================================================================
// Client Handler
// ============================================================================

void ControlServer::reap_finished_clients() {
    auto it = client_threads_.begin();
    while (it != client_threads_.end()) {
        if (it->done->load(std::memory_order_acquire)) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = client_threads_.erase(it);
        } else {
            ++it;
        }
    }
}

void ControlServer::client_handler(int fd, std::shared_ptr<std::atomic<bool>> done) {
    int opt = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    // Read timeout so running_ is rechecked periodically
    struct timeval tv;
    tv.tv_sec = 1;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string line;
    while (running_.load(std::memory_order_relaxed)) {
        if (!recv_line(fd, line)) {
            break;
        }
        if (line.empty()) {
            continue;
        }

        nlohmann::json response;
        try {
            response = handle_command(nlohmann::json::parse(line));
        } catch (const nlohmann::json::exception& e) {
            response["status"] = "error";
            response["error"] = std::string("Invalid request: ") + e.what();
        }
        send_json(fd, response);
    }

    clients_.fetch_sub(1, std::memory_order_relaxed);
    ::close(fd);
    done->store(true, std::memory_order_release);
}

nlohmann::json ControlServer::handle_command(const nlohmann::json& cmd) {
    std::string cmd_type;
    if (cmd.is_object()) {
        cmd_type = cmd.value("cmd", "");
    }

    if (cmd_type == "status") {
        return cmd_status();
    } else if (cmd_type == "stats") {
        return cmd_stats();
    } else if (cmd_type == "pause") {
        return cmd_pause();
    } else if (cmd_type == "resume") {
        return cmd_resume();
    } else if (cmd_type == "stop") {
        return cmd_stop();
    }

    nlohmann::json resp;
    resp["status"] = "error";
    resp["error"] = "Unknown command: " + cmd_type;
    return resp;
}

// ============================================================================
// Command Handlers
// ============================================================================

nlohmann::json ControlServer::cmd_status() {
    nlohmann::json resp = session_.status_json();
    resp["status"] = "ok";
    resp["control_clients"] = clients();
    return resp;
}

nlohmann::json ControlServer::cmd_stats() {
    nlohmann::json resp = session_.stats().to_json();
    resp["status"] = "ok";
    return resp;
}

nlohmann::json ControlServer::cmd_pause() {
    nlohmann::json resp;
    if (session_.is_paused()) {
        resp["message"] = "Already paused";
    }
    session_.pause();
    resp["status"] = "ok";
    resp["paused"] = true;
    return resp;
}

nlohmann::json ControlServer::cmd_resume() {
    nlohmann::json resp;
    if (!session_.is_paused()) {
        resp["message"] = "Not paused";
    }
    session_.resume();
    resp["status"] = "ok";
    resp["paused"] = false;
    return resp;
}

nlohmann::json ControlServer::cmd_stop() {
    nlohmann::json resp;
    session_.request_stop();
    resp["status"] = "ok";
    return resp;
}

// ============================================================================
// I/O Helpers
// ============================================================================

void ControlServer::send_json(int fd, const nlohmann::json& j) {
    std::string data = j.dump() + "\n";
    ssize_t total = 0;
    ssize_t len = static_cast<ssize_t>(data.size());

    while (total < len) {
        ssize_t n = write(fd, data.c_str() + total, len - total);
        if (n <= 0) break;
        total += n;
    }
}

bool ControlServer::recv_line(int fd, std::string& line) {
    line.clear();
    char c;

    while (true) {
        ssize_t n = read(fd, &c, 1);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                if (!running_.load(std::memory_order_relaxed)) {
                    return false;
                }
                continue;
            }
            return false;
        }
        if (n == 0) return false;  // Connection closed
        if (c == '\n') break;
        if (c != '\r') line += c;
        if (line.size() > CONTROL_MAX_LINE) return false;
    }
    return true;
}

} // namespace glos
