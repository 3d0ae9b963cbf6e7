/**
 * @file info_main.cpp
 * @brief glos-info: inspect and verify a GLOS file
 */

#include "common.hpp"
#include "format.hpp"
#include "stream_reader.hpp"

#include <iomanip>
#include <iostream>
#include <string>

#include <getopt.h>
#include <nlohmann/json.hpp>

namespace {

constexpr size_t PREVIEW_BLOCKS = 3;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] FILE\n\n"
        "Validate a GLOS file and print its header and block statistics\n\n"
        "Options:\n"
        "  -j, --json      Machine-readable output\n"
        "  -h, --help      Show this help\n"
        "  -V, --version   Show version\n"
        "\n";
}

nlohmann::json block_json(const glos::SampleBlock& block) {
    return {
        {"timestamp_ns", block.timestamp_ns},
        {"sample_count", block.sample_count},
        {"data_bytes", block.data.size()}
    };
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace glos;

    static struct option long_options[] = {
        {"json",    no_argument, nullptr, 'j'},
        {"help",    no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr,   0,           nullptr, 0}
    };

    bool json_output = false;
    int opt;
    while ((opt = getopt_long(argc, argv, "jhV", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'j':
                json_output = true;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            case 'V':
                std::cout << "glos-info version " << GLOS_TOOLS_VERSION << "\n";
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    if (optind != argc - 1) {
        print_usage(argv[0]);
        return 1;
    }
    std::string filename = argv[optind];

    StreamReader reader;
    Status st = reader.open(filename);
    if (st != Status::Ok) {
        std::cerr << "Error: " << filename << ": " << status_str(st) << "\n";
        return 1;
    }

    std::vector<SampleBlock> preview;
    uint64_t first_ts = 0;
    uint64_t last_ts = 0;
    SampleBlock block;
    while (reader.next_block(block)) {
        if (reader.stats().blocks_ok == 1) {
            first_ts = block.timestamp_ns;
        }
        last_ts = block.timestamp_ns;
        if (preview.size() < PREVIEW_BLOCKS) {
            preview.push_back(block);
        }
    }

    const Header& header = reader.header();
    const ReadStats& stats = reader.stats();
    Status totals = reader.validate_totals();

    if (json_output) {
        nlohmann::json j;
        j["file"] = filename;
        j["header"] = header.to_json();
        j["read_stats"] = stats.to_json();
        j["totals_check"] = status_str(totals);
        j["read_error"] = status_str(reader.error());
        j["first_timestamp_ns"] = first_ts;
        j["last_timestamp_ns"] = last_ts;
        j["blocks"] = nlohmann::json::array();
        for (const auto& b : preview) {
            j["blocks"].push_back(block_json(b));
        }
        std::cout << j.dump(2) << "\n";
    } else {
        std::cout << "File:           " << filename << "\n";
        std::cout << "Version:        " << static_cast<int>(header.version) << "\n";
        std::cout << "Byte order:     "
                  << (header.is_little_endian() ? "little-endian" : "big-endian") << "\n";
        std::cout << "Device:         " << device_type_str(header.device_type) << "\n";
        std::cout << "Sample format:  " << sample_format_str(header.sample_format) << "\n";
        std::cout << "Compression:    " << compression_str(header.compression) << "\n";
        std::cout << "Sample rate:    " << header.sample_rate << " Hz\n";
        std::cout << "Center freq:    " << header.center_freq << " Hz\n";
        std::cout << "Gain:           " << header.gain_db << " dB\n";
        std::cout << "Session start:  " << header.timestamp_start << "\n";
        std::cout << "Session end:    " << header.timestamp_end
                  << (header.is_finalized() ? "" : " (not finalized)") << "\n";
        std::cout << "Total samples:  " << header.total_samples << "\n";
        std::cout << "\n";
        std::cout << "Blocks ok:      " << stats.blocks_ok << "\n";
        std::cout << "Corrupted:      " << stats.blocks_corrupted << "\n";
        std::cout << "Samples read:   " << stats.samples_recovered << "\n";
        std::cout << "Bytes read:     " << stats.bytes_processed << "\n";
        std::cout << "Bytes skipped:  " << stats.bytes_skipped << "\n";
        std::cout << "Totals check:   " << status_str(totals) << "\n";
        if (reader.error() != Status::Ok) {
            std::cout << "Read error:     " << status_str(reader.error()) << "\n";
        }
        if (stats.blocks_ok > 1 && header.sample_rate > 0) {
            double span = static_cast<double>(last_ts - first_ts) / 1e9;
            std::cout << "Time span:      " << std::fixed << std::setprecision(3)
                      << span << " s\n";
            std::cout.unsetf(std::ios::fixed);
        }

        for (size_t i = 0; i < preview.size(); ++i) {
            std::cout << "Block " << i << ": ts=" << preview[i].timestamp_ns
                      << " samples=" << preview[i].sample_count
                      << " bytes=" << preview[i].data.size() << "\n";
        }
    }

    return reader.error() == Status::Ok ? 0 : 1;
}
