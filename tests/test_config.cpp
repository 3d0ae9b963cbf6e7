/**
 * @file test_config.cpp
 * @brief Option parsing and config file tests
 */

#include "config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace glos;

namespace {

// getopt wants mutable argv
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& s : storage_) {
            argv_.push_back(&s[0]);
        }
        argv_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

} // anonymous namespace

TEST(ConfigTest, FrequencySuffixes) {
    uint64_t hz = 0;
    ASSERT_TRUE(parse_freq_hz("1602MHz", hz));
    EXPECT_EQ(hz, 1602000000ULL);
    ASSERT_TRUE(parse_freq_hz("1.602 GHz", hz));
    EXPECT_EQ(hz, 1602000000ULL);
    ASSERT_TRUE(parse_freq_hz("2mhz", hz));
    EXPECT_EQ(hz, 2000000ULL);
    ASSERT_TRUE(parse_freq_hz("12.5kHz", hz));
    EXPECT_EQ(hz, 12500ULL);
    ASSERT_TRUE(parse_freq_hz("100Hz", hz));
    EXPECT_EQ(hz, 100ULL);
    ASSERT_TRUE(parse_freq_hz("2000000", hz));
    EXPECT_EQ(hz, 2000000ULL);
    ASSERT_TRUE(parse_freq_hz("0.0000015MHz", hz));
    EXPECT_EQ(hz, 2ULL);

    EXPECT_FALSE(parse_freq_hz("", hz));
    EXPECT_FALSE(parse_freq_hz("MHz", hz));
    EXPECT_FALSE(parse_freq_hz("1.5", hz));
    EXPECT_FALSE(parse_freq_hz("-5MHz", hz));
    EXPECT_FALSE(parse_freq_hz("abc", hz));
}

TEST(ConfigTest, EnumNames) {
    SampleFormat format = SampleFormat::Int16;
    ASSERT_TRUE(parse_sample_format("i8", format));
    EXPECT_EQ(format, SampleFormat::Int8);
    ASSERT_TRUE(parse_sample_format("FLOAT32", format));
    EXPECT_EQ(format, SampleFormat::Float32);
    EXPECT_FALSE(parse_sample_format("int32", format));

    Compression compression = Compression::None;
    ASSERT_TRUE(parse_compression("lz4", compression));
    EXPECT_EQ(compression, Compression::Lz4);
    ASSERT_TRUE(parse_compression("off", compression));
    EXPECT_EQ(compression, Compression::None);
    EXPECT_FALSE(parse_compression("zstd", compression));

    DeviceKind kind = DeviceKind::Simulated;
    ASSERT_TRUE(parse_device_kind("ADALM-PLUTO", kind));
    EXPECT_EQ(kind, DeviceKind::PlutoSdr);
    ASSERT_TRUE(parse_device_kind("hackrf_one", kind));
    EXPECT_EQ(kind, DeviceKind::HackRf);
    EXPECT_FALSE(parse_device_kind("rtlsdr", kind));
}

TEST(ConfigTest, UdpTargets) {
    std::string target;
    ASSERT_TRUE(parse_udp_target("udp://192.168.1.20:5555", target));
    EXPECT_EQ(target, "192.168.1.20:5555");
    ASSERT_TRUE(parse_udp_target("127.0.0.1:9000", target));
    EXPECT_EQ(target, "127.0.0.1:9000");

    EXPECT_FALSE(parse_udp_target("udp://host", target));
    EXPECT_FALSE(parse_udp_target("127.0.0.1:70000", target));
    EXPECT_FALSE(parse_udp_target("tcp://127.0.0.1:80", target));

    std::string host;
    uint16_t port = 0;
    ASSERT_TRUE(parse_socket_addr("0.0.0.0:0", host, port));
    EXPECT_EQ(host, "0.0.0.0");
    EXPECT_EQ(port, 0);
}

TEST(ConfigTest, RecorderDefaults) {
    Args args{"glos-recorder"};
    RecorderConfig config;
    ASSERT_TRUE(config.parse_args(args.argc(), args.argv()));
    EXPECT_EQ(config.device, DeviceKind::Simulated);
    EXPECT_EQ(config.center_freq_hz, 1602000000ULL);
    EXPECT_EQ(config.sample_rate_hz, 2000000u);
    EXPECT_EQ(config.block_samples, 50000u);
    EXPECT_EQ(config.channel_capacity, 256u);
    EXPECT_EQ(config.duration_sec, 0u);
    EXPECT_EQ(config.device_type(), DeviceType::Unknown);
}

TEST(ConfigTest, RecorderOptions) {
    Args args{"glos-recorder", "-d", "hackrf", "-f", "1575.42MHz", "--rate", "4MHz",
              "-g", "20.5", "-o", "out.glos", "-t", "10", "-F", "int8",
              "--compress", "lz4", "-b", "1000", "-R", "32", "-q"};
    RecorderConfig config;
    ASSERT_TRUE(config.parse_args(args.argc(), args.argv()));
    EXPECT_EQ(config.device, DeviceKind::HackRf);
    EXPECT_EQ(config.device_type(), DeviceType::HackRf);
    EXPECT_EQ(config.center_freq_hz, 1575420000ULL);
    EXPECT_EQ(config.sample_rate_hz, 4000000u);
    EXPECT_FLOAT_EQ(config.gain_db, 20.5f);
    EXPECT_EQ(config.output_path, "out.glos");
    EXPECT_EQ(config.duration_sec, 10u);
    EXPECT_EQ(config.sample_format, SampleFormat::Int8);
    EXPECT_EQ(config.compression, Compression::Lz4);
    EXPECT_EQ(config.block_samples, 1000u);
    EXPECT_EQ(config.channel_capacity, 32u);
    EXPECT_TRUE(config.quiet);
}

TEST(ConfigTest, RecorderRejectsBadValues) {
    {
        Args args{"glos-recorder", "-f", "fast"};
        RecorderConfig config;
        EXPECT_FALSE(config.parse_args(args.argc(), args.argv()));
    }
    {
        // 300000 Int16 samples do not fit in a 1 MiB block
        Args args{"glos-recorder", "-b", "300000"};
        RecorderConfig config;
        EXPECT_FALSE(config.parse_args(args.argc(), args.argv()));
    }
    {
        Args args{"glos-recorder", "-R", "0"};
        RecorderConfig config;
        EXPECT_FALSE(config.parse_args(args.argc(), args.argv()));
    }
    {
        Args args{"glos-recorder", "stray"};
        RecorderConfig config;
        EXPECT_FALSE(config.parse_args(args.argc(), args.argv()));
    }
}

TEST(ConfigTest, HelpAndVersion) {
    Args help{"glos-recorder", "--help"};
    RecorderConfig config;
    ASSERT_TRUE(config.parse_args(help.argc(), help.argv()));
    EXPECT_TRUE(config.show_help);

    Args version{"glos-replayer", "-V"};
    ReplayConfig replay;
    ASSERT_TRUE(replay.parse_args(version.argc(), version.argv()));
    EXPECT_TRUE(replay.show_version);
}

TEST(ConfigTest, ReplayOptions) {
    Args args{"glos-replayer", "-t", "udp://10.0.0.5:6000", "-s", "2.5", "--loop",
              "-C", "5556", "capture.glos"};
    ReplayConfig config;
    ASSERT_TRUE(config.parse_args(args.argc(), args.argv()));
    EXPECT_EQ(config.input_path, "capture.glos");
    EXPECT_EQ(config.target_addr, "10.0.0.5:6000");
    EXPECT_EQ(config.bind_addr, "0.0.0.0:0");
    EXPECT_DOUBLE_EQ(config.speed, 2.5);
    EXPECT_TRUE(config.loop_playback);
    EXPECT_EQ(config.control_port, 5556);
}

TEST(ConfigTest, ReplayRejectsNonPositiveSpeed) {
    for (const char* speed : {"0", "-1", "0.0"}) {
        Args args{"glos-replayer", "-s", speed, "in.glos"};
        ReplayConfig config;
        EXPECT_FALSE(config.parse_args(args.argc(), args.argv())) << speed;
    }

    ReplayConfig config;
    config.speed = 0.0;
    std::string error;
    EXPECT_FALSE(config.validate(error));
    EXPECT_FALSE(error.empty());
}

TEST(ConfigTest, JsonValues) {
    RecorderConfig config;
    nlohmann::json j = {
        {"device", "pluto"},
        {"freq", "915MHz"},
        {"rate", 1000000},
        {"compress", "lz4"},
        {"block-samples", 2048}
    };
    ASSERT_TRUE(config.load_json(j));
    EXPECT_EQ(config.device, DeviceKind::PlutoSdr);
    EXPECT_EQ(config.center_freq_hz, 915000000ULL);
    EXPECT_EQ(config.sample_rate_hz, 1000000u);
    EXPECT_EQ(config.compression, Compression::Lz4);
    EXPECT_EQ(config.block_samples, 2048u);

    nlohmann::json bad = {{"block-samples", "many"}};
    EXPECT_FALSE(config.load_json(bad));
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "glos_test_config";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir_); }

    std::string write_config(const std::string& name, const std::string& text) {
        std::string path = (test_dir_ / name).string();
        std::ofstream f(path);
        f << text;
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ConfigFileTest, CommandLineOverridesFile) {
    std::string file = write_config("replay.json",
        R"({"target": "udp://127.0.0.1:7000", "speed": 4.0, "loop": true, "input": "a.glos"})");

    Args args{"glos-replayer", "-c", file, "-s", "0.5"};
    ReplayConfig config;
    ASSERT_TRUE(config.parse_args(args.argc(), args.argv()));
    EXPECT_EQ(config.target_addr, "127.0.0.1:7000");
    EXPECT_DOUBLE_EQ(config.speed, 0.5);
    EXPECT_TRUE(config.loop_playback);
    EXPECT_EQ(config.input_path, "a.glos");
}

TEST_F(ConfigFileTest, MalformedFileIsRejected) {
    std::string file = write_config("broken.json", "{ not json");
    Args args{"glos-recorder", "--config", file};
    RecorderConfig config;
    EXPECT_FALSE(config.parse_args(args.argc(), args.argv()));

    EXPECT_FALSE(config.load_file((test_dir_ / "missing.json").string()));
}
