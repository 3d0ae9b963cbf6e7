/**
 * @file config.cpp
 * @brief Configuration parsing implementation
 */

#include "config.hpp"

#include <arpa/inet.h>
#include <getopt.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace glos {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool parse_u64(const std::string& text, uint64_t& value) {
    std::string s = trim(text);
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') {
        return false;
    }
    value = static_cast<uint64_t>(v);
    return true;
}

bool parse_double(const std::string& text, double& value) {
    std::string s = trim(text);
    if (s.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(v)) {
        return false;
    }
    value = v;
    return true;
}

// Locate --config/-c before the main pass so the file can be overridden
std::string find_config_arg(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.compare(0, 9, "--config=") == 0) {
            return arg.substr(9);
        }
        if (arg.size() > 2 && arg.compare(0, 2, "-c") == 0) {
            return arg.substr(2);
        }
    }
    return "";
}

bool read_json_file(const std::string& path, nlohmann::json& j) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open config file: " << path << "\n";
        return false;
    }

    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Error: Invalid JSON in config file: " << e.what() << "\n";
        return false;
    }

    if (!j.is_object()) {
        std::cerr << "Error: Config file must contain a JSON object: " << path << "\n";
        return false;
    }
    return true;
}

// Frequency keys accept either a number of Hz or a suffixed string
bool json_freq(const nlohmann::json& value, uint64_t& hz) {
    if (value.is_number_unsigned()) {
        hz = value.get<uint64_t>();
        return true;
    }
    if (value.is_number_integer()) {
        int64_t v = value.get<int64_t>();
        if (v < 0) {
            return false;
        }
        hz = static_cast<uint64_t>(v);
        return true;
    }
    if (value.is_string()) {
        return parse_freq_hz(value.get<std::string>(), hz);
    }
    return false;
}

} // namespace

// ============================================================================
// Value Parsing
// ============================================================================

const char* device_kind_str(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Simulated: return "sim";
        case DeviceKind::HackRf:    return "hackrf";
        case DeviceKind::PlutoSdr:  return "pluto";
    }
    return "?";
}

bool parse_freq_hz(const std::string& text, uint64_t& hz) {
    std::string lower = to_lower(trim(text));

    double mult = 0.0;
    std::string number;
    if (ends_with(lower, "ghz")) {
        mult = 1e9;
        number = lower.substr(0, lower.size() - 3);
    } else if (ends_with(lower, "mhz")) {
        mult = 1e6;
        number = lower.substr(0, lower.size() - 3);
    } else if (ends_with(lower, "khz")) {
        mult = 1e3;
        number = lower.substr(0, lower.size() - 3);
    } else if (ends_with(lower, "hz")) {
        mult = 1.0;
        number = lower.substr(0, lower.size() - 2);
    } else {
        return parse_u64(lower, hz);
    }

    double value = 0.0;
    if (!parse_double(number, value) || value < 0.0) {
        return false;
    }

    double result = std::round(value * mult);
    if (result > static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        return false;
    }
    hz = static_cast<uint64_t>(result);
    return true;
}

bool parse_device_kind(const std::string& text, DeviceKind& kind) {
    std::string s = to_lower(trim(text));
    if (s == "sim" || s == "simulated") {
        kind = DeviceKind::Simulated;
    } else if (s == "hackrf" || s == "hackrf_one") {
        kind = DeviceKind::HackRf;
    } else if (s == "pluto" || s == "plutosdr" || s == "adalm-pluto") {
        kind = DeviceKind::PlutoSdr;
    } else {
        return false;
    }
    return true;
}

bool parse_sample_format(const std::string& text, SampleFormat& format) {
    std::string s = to_lower(trim(text));
    if (s == "int8" || s == "i8") {
        format = SampleFormat::Int8;
    } else if (s == "int16" || s == "i16") {
        format = SampleFormat::Int16;
    } else if (s == "float32" || s == "f32") {
        format = SampleFormat::Float32;
    } else {
        return false;
    }
    return true;
}

bool parse_compression(const std::string& text, Compression& compression) {
    std::string s = to_lower(trim(text));
    if (s == "none" || s == "no" || s == "off") {
        compression = Compression::None;
    } else if (s == "lz4") {
        compression = Compression::Lz4;
    } else {
        return false;
    }
    return true;
}

bool parse_socket_addr(const std::string& text, std::string& host, uint16_t& port) {
    size_t colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        return false;
    }

    std::string h = text.substr(0, colon);
    uint64_t p = 0;
    if (!parse_u64(text.substr(colon + 1), p) || p > 65535) {
        return false;
    }

    struct in_addr addr;
    if (inet_pton(AF_INET, h.c_str(), &addr) != 1) {
        return false;
    }

    host = h;
    port = static_cast<uint16_t>(p);
    return true;
}

bool parse_udp_target(const std::string& text, std::string& target) {
    std::string s = trim(text);
    const std::string scheme = "udp://";
    if (s.compare(0, scheme.size(), scheme) == 0) {
        s = s.substr(scheme.size());
    }

    std::string host;
    uint16_t port = 0;
    if (!parse_socket_addr(s, host, port)) {
        return false;
    }

    target = host + ":" + std::to_string(port);
    return true;
}

// ============================================================================
// Recorder
// ============================================================================

DeviceType RecorderConfig::device_type() const {
    switch (device) {
        case DeviceKind::HackRf:   return DeviceType::HackRf;
        case DeviceKind::PlutoSdr: return DeviceType::PlutoSdr;
        case DeviceKind::Simulated: break;
    }
    return DeviceType::Unknown;
}

bool RecorderConfig::load_file(const std::string& path) {
    nlohmann::json j;
    if (!read_json_file(path, j)) {
        return false;
    }
    config_file = path;
    return load_json(j);
}

bool RecorderConfig::load_json(const nlohmann::json& j) {
    try {
        if (j.contains("device") &&
            !parse_device_kind(j["device"].get<std::string>(), device)) {
            std::cerr << "Error: Unknown device in config: " << j["device"] << "\n";
            return false;
        }
        if (j.contains("freq") && !json_freq(j["freq"], center_freq_hz)) {
            std::cerr << "Error: Invalid freq in config: " << j["freq"] << "\n";
            return false;
        }
        if (j.contains("rate")) {
            uint64_t rate = 0;
            if (!json_freq(j["rate"], rate) || rate > std::numeric_limits<uint32_t>::max()) {
                std::cerr << "Error: Invalid rate in config: " << j["rate"] << "\n";
                return false;
            }
            sample_rate_hz = static_cast<uint32_t>(rate);
        }
        if (j.contains("gain")) {
            gain_db = j["gain"].get<float>();
        }
        if (j.contains("output")) {
            output_path = j["output"].get<std::string>();
        }
        if (j.contains("duration")) {
            duration_sec = j["duration"].get<uint64_t>();
        }
        if (j.contains("format") &&
            !parse_sample_format(j["format"].get<std::string>(), sample_format)) {
            std::cerr << "Error: Unknown format in config: " << j["format"] << "\n";
            return false;
        }
        if (j.contains("compress") &&
            !parse_compression(j["compress"].get<std::string>(), compression)) {
            std::cerr << "Error: Unknown compression in config: " << j["compress"] << "\n";
            return false;
        }
        if (j.contains("block-samples")) {
            block_samples = j["block-samples"].get<uint32_t>();
        }
        if (j.contains("ring-capacity")) {
            channel_capacity = j["ring-capacity"].get<size_t>();
        }
        if (j.contains("stats-interval")) {
            stats_interval_sec = j["stats-interval"].get<uint64_t>();
        }
        if (j.contains("quiet")) {
            quiet = j["quiet"].get<bool>();
        }
        if (j.contains("verbose")) {
            verbose = j["verbose"].get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: Invalid value in config file: " << e.what() << "\n";
        return false;
    }
    return true;
}

bool RecorderConfig::parse_args(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"device",         required_argument, nullptr, 'd'},
        {"freq",           required_argument, nullptr, 'f'},
        {"rate",           required_argument, nullptr, 'r'},
        {"gain",           required_argument, nullptr, 'g'},
        {"output",         required_argument, nullptr, 'o'},
        {"duration",       required_argument, nullptr, 't'},
        {"format",         required_argument, nullptr, 'F'},
        {"compress",       required_argument, nullptr, 'z'},
        {"block-samples",  required_argument, nullptr, 'b'},
        {"ring-capacity",  required_argument, nullptr, 'R'},
        {"stats-interval", required_argument, nullptr, 's'},
        {"config",         required_argument, nullptr, 'c'},
        {"quiet",          no_argument,       nullptr, 'q'},
        {"verbose",        no_argument,       nullptr, 'v'},
        {"help",           no_argument,       nullptr, 'h'},
        {"version",        no_argument,       nullptr, 'V'},
        {nullptr,          0,                 nullptr, 0}
    };

    std::string file = find_config_arg(argc, argv);
    if (!file.empty() && !load_file(file)) {
        return false;
    }

    int opt;
    int option_index = 0;
    optind = 0;

    while ((opt = getopt_long(argc, argv, "d:f:r:g:o:t:F:z:b:R:s:c:qvhV",
                              long_options, &option_index)) != -1) {
        uint64_t value = 0;
        double real = 0.0;
        switch (opt) {
            case 'd':
                if (!parse_device_kind(optarg, device)) {
                    std::cerr << "Error: Unknown device: " << optarg
                              << " (use sim, hackrf, pluto)\n";
                    return false;
                }
                break;
            case 'f':
                if (!parse_freq_hz(optarg, center_freq_hz)) {
                    std::cerr << "Error: Invalid frequency: " << optarg << "\n";
                    return false;
                }
                break;
            case 'r':
                if (!parse_freq_hz(optarg, value) || value > std::numeric_limits<uint32_t>::max()) {
                    std::cerr << "Error: Invalid sample rate: " << optarg << "\n";
                    return false;
                }
                sample_rate_hz = static_cast<uint32_t>(value);
                break;
            case 'g':
                if (!parse_double(optarg, real)) {
                    std::cerr << "Error: Invalid gain: " << optarg << "\n";
                    return false;
                }
                gain_db = static_cast<float>(real);
                break;
            case 'o':
                output_path = optarg;
                break;
            case 't':
                if (!parse_u64(optarg, duration_sec)) {
                    std::cerr << "Error: Invalid duration: " << optarg << "\n";
                    return false;
                }
                break;
            case 'F':
                if (!parse_sample_format(optarg, sample_format)) {
                    std::cerr << "Error: Unknown format: " << optarg
                              << " (use int8, int16, float32)\n";
                    return false;
                }
                break;
            case 'z':
                if (!parse_compression(optarg, compression)) {
                    std::cerr << "Error: Unknown compression: " << optarg
                              << " (use none, lz4)\n";
                    return false;
                }
                break;
            case 'b':
                if (!parse_u64(optarg, value) || value > std::numeric_limits<uint32_t>::max()) {
                    std::cerr << "Error: Invalid block samples: " << optarg << "\n";
                    return false;
                }
                block_samples = static_cast<uint32_t>(value);
                break;
            case 'R':
                if (!parse_u64(optarg, value)) {
                    std::cerr << "Error: Invalid ring capacity: " << optarg << "\n";
                    return false;
                }
                channel_capacity = static_cast<size_t>(value);
                break;
            case 's':
                if (!parse_u64(optarg, stats_interval_sec)) {
                    std::cerr << "Error: Invalid stats interval: " << optarg << "\n";
                    return false;
                }
                break;
            case 'c':
                // Loaded before option parsing
                break;
            case 'q':
                quiet = true;
                break;
            case 'v':
                verbose = true;
                break;
            case 'h':
                show_help = true;
                return true;
            case 'V':
                show_version = true;
                return true;
            default:
                return false;
        }
    }

    if (optind < argc) {
        std::cerr << "Error: Unexpected argument: " << argv[optind] << "\n";
        return false;
    }

    std::string error;
    if (!validate(error)) {
        std::cerr << "Error: " << error << "\n";
        return false;
    }
    return true;
}

bool RecorderConfig::validate(std::string& error) const {
    if (sample_rate_hz == 0) {
        error = "Sample rate must be > 0";
        return false;
    }
    if (block_samples == 0) {
        error = "Block samples must be > 0";
        return false;
    }
    uint64_t block_bytes = static_cast<uint64_t>(block_samples) * sample_size(sample_format);
    if (block_bytes + GLOS_BLOCK_OVERHEAD > GLOS_MAX_BLOCK_SIZE) {
        error = "Block samples too large: " + std::to_string(block_samples) +
                " samples exceed the " + std::to_string(GLOS_MAX_BLOCK_SIZE) + " byte block limit";
        return false;
    }
    if (channel_capacity == 0) {
        error = "Ring capacity must be > 0";
        return false;
    }
    if (stats_interval_sec == 0) {
        error = "Stats interval must be > 0";
        return false;
    }
    if (output_path.empty()) {
        error = "Output path is empty";
        return false;
    }
    return true;
}

nlohmann::json RecorderConfig::to_json() const {
    return {
        {"device", device_kind_str(device)},
        {"freq", center_freq_hz},
        {"rate", sample_rate_hz},
        {"gain", gain_db},
        {"output", output_path},
        {"duration", duration_sec},
        {"format", sample_format_str(sample_format)},
        {"compress", compression_str(compression)},
        {"block-samples", block_samples},
        {"ring-capacity", channel_capacity},
        {"stats-interval", stats_interval_sec},
        {"quiet", quiet},
        {"verbose", verbose}
    };
}

void RecorderConfig::print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
        "Record I/Q samples from an SDR device into a GLOS file\n\n"
        "Device:\n"
        "  -d, --device NAME         sim, hackrf, pluto (default: sim)\n"
        "  -f, --freq FREQ           Center frequency, e.g. 1602MHz (default: 1602MHz)\n"
        "  -r, --rate RATE           Sample rate, e.g. 2MHz (default: 2MHz)\n"
        "  -g, --gain DB             Receiver gain in dB (default: " << DEFAULT_GAIN_DB << ")\n"
        "\n"
        "Output:\n"
        "  -o, --output FILE         Output file (default: " << DEFAULT_OUTPUT_FILE << ")\n"
        "  -t, --duration SEC        Stop after SEC seconds (default: until Ctrl+C)\n"
        "  -F, --format FMT          int8, int16, float32 (default: int16)\n"
        "  -z, --compress MODE       none, lz4 (default: none)\n"
        "  -b, --block-samples N     Samples per block (default: " << DEFAULT_BLOCK_SAMPLES << ")\n"
        "  -R, --ring-capacity N     Capture queue size in chunks (default: "
        << DEFAULT_CHANNEL_CAPACITY << ")\n"
        "\n"
        "Misc:\n"
        "  -c, --config FILE         JSON config file (options override it)\n"
        "  -s, --stats-interval SEC  Progress interval (default: " << DEFAULT_STATS_INTERVAL_SEC << ")\n"
        "  -q, --quiet               Errors only\n"
        "  -v, --verbose             Detailed progress lines\n"
        "  -h, --help                Show this help\n"
        "  -V, --version             Show version\n"
        "\n"
        "Examples:\n"
        "  " << program_name << " -t 10 -o test.glos\n"
        "  " << program_name << " -f 1.602GHz -r 2MHz -z lz4 -o capture.glos\n"
        "\n";
}

void RecorderConfig::print_version() {
    std::cout << GLOS_RECORDER_NAME << " version " << GLOS_TOOLS_VERSION << "\n"
        "GLOS I/Q sample recorder\n";
}

// ============================================================================
// Replayer
// ============================================================================

bool ReplayConfig::load_file(const std::string& path) {
    nlohmann::json j;
    if (!read_json_file(path, j)) {
        return false;
    }
    config_file = path;
    return load_json(j);
}

bool ReplayConfig::load_json(const nlohmann::json& j) {
    try {
        if (j.contains("input")) {
            input_path = j["input"].get<std::string>();
        }
        if (j.contains("target") &&
            !parse_udp_target(j["target"].get<std::string>(), target_addr)) {
            std::cerr << "Error: Invalid target in config: " << j["target"] << "\n";
            return false;
        }
        if (j.contains("bind")) {
            bind_addr = j["bind"].get<std::string>();
        }
        if (j.contains("speed")) {
            speed = j["speed"].get<double>();
        }
        if (j.contains("loop")) {
            loop_playback = j["loop"].get<bool>();
        }
        if (j.contains("stats-interval")) {
            stats_interval_sec = j["stats-interval"].get<uint64_t>();
        }
        if (j.contains("control-port")) {
            control_port = j["control-port"].get<int>();
        }
        if (j.contains("quiet")) {
            quiet = j["quiet"].get<bool>();
        }
        if (j.contains("verbose")) {
            verbose = j["verbose"].get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: Invalid value in config file: " << e.what() << "\n";
        return false;
    }
    return true;
}

bool ReplayConfig::parse_args(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"input",          required_argument, nullptr, 'i'},
        {"target",         required_argument, nullptr, 't'},
        {"bind",           required_argument, nullptr, 'B'},
        {"speed",          required_argument, nullptr, 's'},
        {"loop",           no_argument,       nullptr, 'l'},
        {"stats-interval", required_argument, nullptr, 'S'},
        {"control-port",   required_argument, nullptr, 'C'},
        {"config",         required_argument, nullptr, 'c'},
        {"quiet",          no_argument,       nullptr, 'q'},
        {"verbose",        no_argument,       nullptr, 'v'},
        {"help",           no_argument,       nullptr, 'h'},
        {"version",        no_argument,       nullptr, 'V'},
        {nullptr,          0,                 nullptr, 0}
    };

    std::string file = find_config_arg(argc, argv);
    if (!file.empty() && !load_file(file)) {
        return false;
    }

    int opt;
    int option_index = 0;
    optind = 0;

    while ((opt = getopt_long(argc, argv, "i:t:B:s:lS:C:c:qvhV",
                              long_options, &option_index)) != -1) {
        uint64_t value = 0;
        switch (opt) {
            case 'i':
                input_path = optarg;
                break;
            case 't':
                if (!parse_udp_target(optarg, target_addr)) {
                    std::cerr << "Error: Invalid UDP target: " << optarg << "\n";
                    return false;
                }
                break;
            case 'B':
                bind_addr = optarg;
                break;
            case 's':
                if (!parse_double(optarg, speed)) {
                    std::cerr << "Error: Invalid speed: " << optarg << "\n";
                    return false;
                }
                break;
            case 'l':
                loop_playback = true;
                break;
            case 'S':
                if (!parse_u64(optarg, stats_interval_sec)) {
                    std::cerr << "Error: Invalid stats interval: " << optarg << "\n";
                    return false;
                }
                break;
            case 'C':
                if (!parse_u64(optarg, value) || value == 0 || value > 65535) {
                    std::cerr << "Error: Invalid control port: " << optarg << "\n";
                    return false;
                }
                control_port = static_cast<int>(value);
                break;
            case 'c':
                // Loaded before option parsing
                break;
            case 'q':
                quiet = true;
                break;
            case 'v':
                verbose = true;
                break;
            case 'h':
                show_help = true;
                return true;
            case 'V':
                show_version = true;
                return true;
            default:
                return false;
        }
    }

    // Positional input file
    if (optind < argc) {
        input_path = argv[optind++];
    }
    if (optind < argc) {
        std::cerr << "Error: Unexpected argument: " << argv[optind] << "\n";
        return false;
    }

    std::string error;
    if (!validate(error)) {
        std::cerr << "Error: " << error << "\n";
        return false;
    }
    return true;
}

bool ReplayConfig::validate(std::string& error) const {
    if (!(speed > 0.0)) {
        error = "Speed must be > 0";
        return false;
    }
    if (input_path.empty()) {
        error = "Input path is empty";
        return false;
    }

    std::string host;
    uint16_t port = 0;
    if (!parse_socket_addr(target_addr, host, port)) {
        error = "Invalid UDP target: " + target_addr;
        return false;
    }
    if (!parse_socket_addr(bind_addr, host, port)) {
        error = "Invalid bind address: " + bind_addr;
        return false;
    }
    if (control_port < 0 || control_port > 65535) {
        error = "Invalid control port: " + std::to_string(control_port);
        return false;
    }
    if (stats_interval_sec == 0) {
        error = "Stats interval must be > 0";
        return false;
    }
    return true;
}

nlohmann::json ReplayConfig::to_json() const {
    return {
        {"input", input_path},
        {"target", target_addr},
        {"bind", bind_addr},
        {"speed", speed},
        {"loop", loop_playback},
        {"stats-interval", stats_interval_sec},
        {"control-port", control_port},
        {"quiet", quiet},
        {"verbose", verbose}
    };
}

void ReplayConfig::print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] [FILE]\n\n"
        "Replay a GLOS recording as UDP datagrams with original timing\n\n"
        "Playback:\n"
        "  -i, --input FILE          Input file (default: " << DEFAULT_OUTPUT_FILE << ")\n"
        "  -t, --target ADDR         udp://host:port or host:port (default: "
        << DEFAULT_REPLAY_TARGET << ")\n"
        "  -B, --bind ADDR           Local bind address (default: " << DEFAULT_REPLAY_BIND << ")\n"
        "  -s, --speed N             Playback speed factor, > 0 (default: 1.0)\n"
        "  -l, --loop                Restart from the beginning at end of file\n"
        "\n"
        "Control:\n"
        "  -C, --control-port PORT   TCP control port (disabled by default)\n"
        "\n"
        "Misc:\n"
        "  -c, --config FILE         JSON config file (options override it)\n"
        "  -S, --stats-interval SEC  Progress interval (default: " << DEFAULT_STATS_INTERVAL_SEC << ")\n"
        "  -q, --quiet               Errors only\n"
        "  -v, --verbose             Detailed progress lines\n"
        "  -h, --help                Show this help\n"
        "  -V, --version             Show version\n"
        "\n"
        "Examples:\n"
        "  " << program_name << " recording.glos\n"
        "  " << program_name << " -t udp://192.168.1.20:5555 -s 2 --loop capture.glos\n"
        "\n";
}

void ReplayConfig::print_version() {
    std::cout << GLOS_REPLAYER_NAME << " version " << GLOS_TOOLS_VERSION << "\n"
        "GLOS I/Q sample replayer\n";
}

} // namespace glos
