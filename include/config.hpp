/**
 * @file config.hpp
 * @brief Recorder and replayer configuration
 *
 * Options come from an optional JSON file (--config) whose keys match the
 * long option names, then from the command line, which overrides the file.
 */

#ifndef GLOS_CONFIG_HPP
#define GLOS_CONFIG_HPP

#include "common.hpp"
#include "format.hpp"

#include <string>
#include <nlohmann/json.hpp>

namespace glos {

enum class DeviceKind {
    Simulated,
    HackRf,
    PlutoSdr
};

const char* device_kind_str(DeviceKind kind);

// ============================================================================
// Value Parsing
// ============================================================================

/**
 * @brief Parse a frequency such as "1602MHz", "1.602 GHz" or "2000000"
 *
 * Suffixes GHz/MHz/kHz/Hz are case-insensitive and allow fractional
 * values, rounded to the nearest Hz. Without a suffix the value must be
 * a whole number of Hz.
 */
bool parse_freq_hz(const std::string& text, uint64_t& hz);

bool parse_device_kind(const std::string& text, DeviceKind& kind);
bool parse_sample_format(const std::string& text, SampleFormat& format);
bool parse_compression(const std::string& text, Compression& compression);

/**
 * @brief Split an IPv4 "host:port" literal
 */
bool parse_socket_addr(const std::string& text, std::string& host, uint16_t& port);

/**
 * @brief Normalize "udp://host:port" or "host:port" to "host:port"
 */
bool parse_udp_target(const std::string& text, std::string& target);

// ============================================================================
// Recorder
// ============================================================================

struct RecorderConfig {
    DeviceKind device = DeviceKind::Simulated;
    uint64_t center_freq_hz = DEFAULT_CENTER_FREQ_HZ;
    uint32_t sample_rate_hz = DEFAULT_SAMPLE_RATE_HZ;
    float gain_db = DEFAULT_GAIN_DB;
    SampleFormat sample_format = SampleFormat::Int16;
    Compression compression = Compression::None;
    std::string output_path = DEFAULT_OUTPUT_FILE;
    uint64_t duration_sec = 0;              // 0 = until interrupted
    uint32_t block_samples = DEFAULT_BLOCK_SAMPLES;
    size_t channel_capacity = DEFAULT_CHANNEL_CAPACITY;
    uint64_t stats_interval_sec = DEFAULT_STATS_INTERVAL_SEC;
    bool quiet = false;
    bool verbose = false;

    std::string config_file;
    bool show_help = false;
    bool show_version = false;

    /**
     * @brief Device tag written to the file header
     */
    DeviceType device_type() const;

    /**
     * @brief Parse command line arguments
     * @return true on success, false on error (message printed)
     */
    bool parse_args(int argc, char* argv[]);

    bool load_file(const std::string& path);
    bool load_json(const nlohmann::json& j);

    /**
     * @brief Check value ranges
     * @param error Receives the reason on failure
     */
    bool validate(std::string& error) const;

    nlohmann::json to_json() const;

    static void print_usage(const char* program_name);
    static void print_version();
};

// ============================================================================
// Replayer
// ============================================================================

struct ReplayConfig {
    std::string input_path = DEFAULT_OUTPUT_FILE;
    std::string target_addr = DEFAULT_REPLAY_TARGET;
    std::string bind_addr = DEFAULT_REPLAY_BIND;
    double speed = 1.0;
    bool loop_playback = false;
    uint64_t stats_interval_sec = DEFAULT_STATS_INTERVAL_SEC;
    int control_port = 0;                   // 0 = disabled
    bool quiet = false;
    bool verbose = false;

    std::string config_file;
    bool show_help = false;
    bool show_version = false;

    bool parse_args(int argc, char* argv[]);

    bool load_file(const std::string& path);
    bool load_json(const nlohmann::json& j);

    bool validate(std::string& error) const;

    nlohmann::json to_json() const;

    static void print_usage(const char* program_name);
    static void print_version();
};

} // namespace glos

#endif // GLOS_CONFIG_HPP
