/**
 * @file replayer_main.cpp
 * @brief glos-replayer entry point
 */

#include "common.hpp"
#include "config.hpp"
#include "control_server.hpp"
#include "replay_session.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

#include <unistd.h>

namespace {

glos::ReplaySession* g_session = nullptr;
volatile sig_atomic_t g_signal_count = 0;

void signal_handler(int sig) {
    if (sig != SIGINT && sig != SIGTERM) {
        return;
    }
    g_signal_count = g_signal_count + 1;
    if (g_signal_count > 1) {
        _exit(130);
    }
    const char msg[] = "\nStopping replay...\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    if (g_session) {
        g_session->request_stop();
    }
}

void setup_signal_handlers() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Control clients may disconnect mid-reply
    signal(SIGPIPE, SIG_IGN);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace glos;

    ReplayConfig config;
    if (!config.parse_args(argc, argv)) {
        ReplayConfig::print_usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        ReplayConfig::print_usage(argv[0]);
        return 0;
    }

    if (config.show_version) {
        ReplayConfig::print_version();
        return 0;
    }

    ReplaySession session(config);
    if (!session.init()) {
        return 1;
    }

    if (!config.quiet) {
        std::cout << "========================================\n";
        std::cout << GLOS_REPLAYER_NAME << " v" << GLOS_TOOLS_VERSION << "\n";
        std::cout << "========================================\n";
        std::cout << "Input:          " << config.input_path << "\n";
        std::cout << "Target:         udp://" << session.config().target_addr << "\n";
        std::cout << "Bind:           " << config.bind_addr << " (port "
                  << session.local_port() << ")\n";
        std::cout << "Speed:          " << config.speed << "x\n";
        std::cout << "Loop:           " << (config.loop_playback ? "yes" : "no") << "\n";
        if (config.control_port > 0) {
            std::cout << "Control port:   " << config.control_port << "\n";
        }
        std::cout << "========================================\n\n";
    }

    g_session = &session;
    setup_signal_handlers();

    ControlServer control_server(session);
    if (config.control_port > 0 && !control_server.start(config.control_port)) {
        g_session = nullptr;
        return 1;
    }

    bool ok = session.run();

    control_server.stop();
    g_session = nullptr;

    return ok ? 0 : 1;
}
