/**
 * @file recorder_main.cpp
 * @brief glos-recorder entry point
 */

#include "common.hpp"
#include "config.hpp"
#include "device.hpp"
#include "capture_pipeline.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

#include <unistd.h>

namespace {

std::atomic<bool>* g_stop_flag = nullptr;
volatile sig_atomic_t g_signal_count = 0;

void signal_handler(int sig) {
    if (sig != SIGINT && sig != SIGTERM) {
        return;
    }
    g_signal_count = g_signal_count + 1;
    if (g_signal_count > 1) {
        // Second signal: give up on finalizing
        const char msg[] = "\nForced exit, file header not finalized\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(130);
    }
    const char msg[] = "\nStopping, finalizing file (Ctrl+C again to force)...\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    if (g_stop_flag) {
        g_stop_flag->store(true, std::memory_order_relaxed);
    }
}

void setup_signal_handlers() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace glos;

    RecorderConfig config;
    if (!config.parse_args(argc, argv)) {
        RecorderConfig::print_usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        RecorderConfig::print_usage(argv[0]);
        return 0;
    }

    if (config.show_version) {
        RecorderConfig::print_version();
        return 0;
    }

    std::unique_ptr<Device> device = create_device(config);
    if (!device) {
        return 1;
    }

    if (!config.quiet) {
        std::cout << "========================================\n";
        std::cout << GLOS_RECORDER_NAME << " v" << GLOS_TOOLS_VERSION << "\n";
        std::cout << "========================================\n";
        std::cout << "Device:         " << device->info().name << "\n";
        std::cout << "Center freq:    " << config.center_freq_hz / 1e6 << " MHz\n";
        std::cout << "Sample rate:    " << config.sample_rate_hz / 1e6 << " Msps\n";
        std::cout << "Gain:           " << config.gain_db << " dB\n";
        std::cout << "Format:         " << sample_format_str(config.sample_format) << "\n";
        std::cout << "Compression:    " << compression_str(config.compression) << "\n";
        std::cout << "Block samples:  " << config.block_samples << "\n";
        std::cout << "Output:         " << config.output_path << "\n";
        if (config.duration_sec > 0) {
            std::cout << "Duration:       " << config.duration_sec << " s\n";
        } else {
            std::cout << "Duration:       until Ctrl+C\n";
        }
        std::cout << "========================================\n\n";
    }

    CapturePipeline pipeline(config);
    g_stop_flag = &pipeline.stop_flag();
    setup_signal_handlers();

    bool ok = pipeline.run(*device);
    g_stop_flag = nullptr;

    CaptureSummary summary = pipeline.stats().summary();
    if (!config.quiet) {
        std::cout << "\nRecording summary:\n";
        summary.print(std::cout);
    }

    if (!ok) {
        return 1;
    }
    if (summary.write_errors > 0) {
        std::cerr << "Error: " << summary.write_errors << " blocks failed to write\n";
        return 1;
    }
    if (pipeline.device_failed()) {
        return 1;
    }
    return 0;
}
