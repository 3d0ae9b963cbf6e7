/**
 * @file glos_ctl.cpp
 * @brief glos-replayer control client
 *
 * Usage:
 *   glos-ctl [OPTIONS] COMMAND
 *
 * Commands:
 *   status          Show replay status
 *   stats           Show replay statistics
 *   pause           Pause playback
 *   resume          Resume playback
 *   stop            Stop the replay
 */

#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>
#include <cstdint>
#include <cstdlib>
#include <getopt.h>

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>

#include <nlohmann/json.hpp>

namespace {

constexpr const char* DEFAULT_HOST = "localhost";
constexpr int DEFAULT_PORT = 5556;

struct Options {
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_PORT;
    bool json_output = false;
    std::string command;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS] COMMAND\n\n"
        "Control client for glos-replayer (started with --control-port)\n\n"
        "Options:\n"
        "  -H, --host HOST     Replayer host (default: localhost)\n"
        "  -P, --port PORT     Control port (default: " << DEFAULT_PORT << ")\n"
        "  -j, --json          Output raw JSON\n"
        "  -h, --help          Show this help\n"
        "\n"
        "Commands:\n"
        "  status              Show replay status\n"
        "  stats               Show replay statistics\n"
        "  pause               Pause playback\n"
        "  resume              Resume playback\n"
        "  stop                Stop the replay\n"
        "\n"
        "Examples:\n"
        "  " << program << " -P 5556 status\n"
        "  " << program << " -H 192.168.1.100 -P 5556 pause\n"
        "  " << program << " -j stats\n"
        "\n";
}

bool is_known_command(const std::string& cmd) {
    return cmd == "status" || cmd == "stats" || cmd == "pause" ||
           cmd == "resume" || cmd == "stop";
}

bool parse_args(int argc, char* argv[], Options& opts) {
    static struct option long_options[] = {
        {"host",  required_argument, nullptr, 'H'},
        {"port",  required_argument, nullptr, 'P'},
        {"json",  no_argument,       nullptr, 'j'},
        {"help",  no_argument,       nullptr, 'h'},
        {nullptr, 0,                 nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "H:P:jh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'H':
                opts.host = optarg;
                break;
            case 'P': {
                char* end = nullptr;
                long port = std::strtol(optarg, &end, 10);
                if (end == optarg || *end != '\0' || port <= 0 || port > 65535) {
                    std::cerr << "Error: Invalid port: " << optarg << "\n";
                    return false;
                }
                opts.port = static_cast<int>(port);
                break;
            }
            case 'j':
                opts.json_output = true;
                break;
            case 'h':
                print_usage(argv[0]);
                exit(0);
            default:
                return false;
        }
    }

    if (optind >= argc) {
        std::cerr << "Error: No command specified\n";
        return false;
    }

    opts.command = argv[optind++];
    if (optind < argc) {
        std::cerr << "Error: Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    if (!is_known_command(opts.command)) {
        std::cerr << "Error: Unknown command: " << opts.command << "\n";
        return false;
    }

    return true;
}

int connect_to_replayer(const std::string& host, int port) {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        std::cerr << "Error: Cannot create socket\n";
        return -1;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        if (host == "localhost") {
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        } else {
            std::cerr << "Error: Invalid address: " << host << "\n";
            close(sock);
            return -1;
        }
    }

    if (connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "Error: Cannot connect to " << host << ":" << port
                  << " - " << strerror(errno) << "\n";
        close(sock);
        return -1;
    }

    int opt = 1;
    setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    return sock;
}

bool send_json(int sock, const nlohmann::json& j) {
    std::string data = j.dump() + "\n";
    ssize_t total = 0;
    ssize_t len = static_cast<ssize_t>(data.size());

    while (total < len) {
        ssize_t n = write(sock, data.c_str() + total, len - total);
        if (n <= 0) return false;
        total += n;
    }
    return true;
}

bool recv_json(int sock, nlohmann::json& j) {
    std::string line;
    char c;

    while (true) {
        ssize_t n = read(sock, &c, 1);
        if (n <= 0) return false;
        if (c == '\n') break;
        line += c;
        if (line.size() > 65536) return false;
    }

    try {
        j = nlohmann::json::parse(line);
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: Malformed response: " << e.what() << "\n";
        return false;
    }
}

void print_status(const nlohmann::json& resp) {
    std::cout << "GLOS Replay Status\n";
    std::cout << "==================\n";
    std::cout << "Version:          " << resp.value("version", "unknown") << "\n";
    std::cout << "Input:            " << resp.value("input", "?") << "\n";
    std::cout << "Target:           udp://" << resp.value("target", "?") << "\n";
    std::cout << "Speed:            " << resp.value("speed", 1.0) << "x\n";
    std::cout << "Loop:             " << (resp.value("loop", false) ? "yes" : "no") << "\n";
    std::cout << "Running:          " << (resp.value("running", false) ? "yes" : "no") << "\n";
    std::cout << "Paused:           " << (resp.value("paused", false) ? "yes" : "no") << "\n";
    std::cout << "Loops completed:  " << resp.value("loops_completed", 0) << "\n";
    std::cout << "Packets sent:     " << resp.value("packets_sent", 0) << "\n";

    if (resp.contains("header")) {
        auto& h = resp["header"];
        std::cout << "\nRecording:\n";
        std::cout << "  Device:         " << h.value("device", "?") << "\n";
        std::cout << "  Sample rate:    " << h.value("sample_rate_hz", 0) << " Hz\n";
        std::cout << "  Center freq:    " << h.value("center_freq_hz", static_cast<uint64_t>(0)) << " Hz\n";
        std::cout << "  Format:         " << h.value("sample_format", "?") << "\n";
        std::cout << "  Compression:    " << h.value("compression", "?") << "\n";
        std::cout << "  Total samples:  " << h.value("total_samples", static_cast<uint64_t>(0)) << "\n";
    }
}

void print_stats(const nlohmann::json& resp) {
    std::cout << "GLOS Replay Statistics\n";
    std::cout << "======================\n\n";

    std::cout << "Uptime:       " << std::fixed << std::setprecision(1)
              << resp.value("uptime_sec", 0.0) << " seconds\n";
    std::cout << "Packets sent: " << resp.value("packets_sent", 0) << "\n";
    std::cout << "Samples sent: " << resp.value("samples_sent", static_cast<uint64_t>(0)) << "\n";
    std::cout << "Bytes sent:   " << resp.value("bytes_sent", static_cast<uint64_t>(0)) << "\n";
    std::cout << "Underruns:    " << resp.value("underruns", 0) << "\n";
    std::cout << "Send errors:  " << resp.value("send_errors", 0) << "\n";
    std::cout << "Loops:        " << resp.value("loops", 0) << "\n";
    std::cout << "Throughput:   " << std::setprecision(3)
              << resp.value("throughput_msps", 0.0) << " Msps\n";

    if (resp.contains("timing")) {
        auto& t = resp["timing"];
        std::cout << "\nTiming:\n";
        std::cout << "  Avg error:  " << std::setprecision(1)
                  << t.value("avg_error_us", 0.0) << " us\n";
        std::cout << "  Total:      " << t.value("error_ns_total", static_cast<uint64_t>(0))
                  << " ns\n";
    }
}

void print_formatted(const Options& opts, const nlohmann::json& resp) {
    if (resp.value("status", "") != "ok") {
        std::cerr << "Error: " << resp.value("error", "Unknown error") << "\n";
        return;
    }

    if (opts.command == "status") {
        print_status(resp);
    } else if (opts.command == "stats") {
        print_stats(resp);
    } else if (opts.command == "pause") {
        std::cout << resp.value("message", "Playback paused") << "\n";
    } else if (opts.command == "resume") {
        std::cout << resp.value("message", "Playback resumed") << "\n";
    } else if (opts.command == "stop") {
        std::cout << "Replay stopping\n";
    } else {
        std::cout << "OK\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    int sock = connect_to_replayer(opts.host, opts.port);
    if (sock < 0) {
        return 1;
    }

    nlohmann::json request;
    request["cmd"] = opts.command;
    if (!send_json(sock, request)) {
        std::cerr << "Error: Failed to send request\n";
        close(sock);
        return 1;
    }

    nlohmann::json response;
    if (!recv_json(sock, response)) {
        std::cerr << "Error: Failed to receive response\n";
        close(sock);
        return 1;
    }

    close(sock);

    if (opts.json_output) {
        std::cout << response.dump(2) << "\n";
    } else {
        print_formatted(opts, response);
    }

    return (response.value("status", "") == "ok") ? 0 : 1;
}
