/**
 * @file test_control_server.cpp
 * @brief Control server command and socket tests
 */

#include "control_server.hpp"
#include "stream_writer.hpp"

#include <gtest/gtest.h>
#include <cstring>
#include <functional>
#include <filesystem>
#include <thread>

#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>

using namespace glos;

namespace {

int connect_local(int port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }
    return fd;
}

bool wait_until(const std::function<bool()>& cond) {
    for (int i = 0; i < 200; i++) {
        if (cond()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

} // anonymous namespace

class ControlServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "glos_test_control";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        config_.input_path = (test_dir_ / "input.glos").string();
        config_.target_addr = "udp://127.0.0.1:9";
        config_.bind_addr = "127.0.0.1:0";
        config_.quiet = true;

        Header header = Header::create(DeviceType::PlutoSdr, 2000000, 1602000000ULL);
        StreamWriter writer;
        ASSERT_TRUE(writer.open(config_.input_path, header));
        SampleBlock block;
        block.timestamp_ns = 1704067200000000000ULL;
        block.sample_count = 10;
        block.data.assign(40, 0);
        ASSERT_EQ(writer.write_block(std::move(block)), Status::Ok);
        ASSERT_EQ(writer.finish(), Status::Ok);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir_); }

    std::filesystem::path test_dir_;
    ReplayConfig config_;
};

TEST_F(ControlServerTest, StatusCommand) {
    ReplaySession session(config_);
    ASSERT_TRUE(session.init());
    ControlServer server(session);

    nlohmann::json resp = server.handle_command({{"cmd", "status"}});
    EXPECT_EQ(resp["status"].get<std::string>(), "ok");
    EXPECT_EQ(resp["replayer"].get<std::string>(), GLOS_REPLAYER_NAME);
    EXPECT_EQ(resp["target"].get<std::string>(), "127.0.0.1:9");
    EXPECT_EQ(resp["header"]["device"].get<std::string>(), "PlutoSDR");
    EXPECT_EQ(resp["control_clients"].get<int>(), 0);
}

TEST_F(ControlServerTest, StatsCommand) {
    ReplaySession session(config_);
    ASSERT_TRUE(session.init());
    ControlServer server(session);

    nlohmann::json resp = server.handle_command({{"cmd", "stats"}});
    EXPECT_EQ(resp["status"].get<std::string>(), "ok");
    EXPECT_EQ(resp["packets_sent"].get<uint64_t>(), 0u);
    EXPECT_TRUE(resp.contains("timing"));
}

TEST_F(ControlServerTest, PauseResumeStop) {
    ReplaySession session(config_);
    ASSERT_TRUE(session.init());
    ControlServer server(session);

    nlohmann::json resp = server.handle_command({{"cmd", "pause"}});
    EXPECT_EQ(resp["status"].get<std::string>(), "ok");
    EXPECT_TRUE(resp["paused"].get<bool>());
    EXPECT_TRUE(session.is_paused());

    resp = server.handle_command({{"cmd", "pause"}});
    EXPECT_EQ(resp["message"].get<std::string>(), "Already paused");

    resp = server.handle_command({{"cmd", "resume"}});
    EXPECT_FALSE(resp["paused"].get<bool>());
    EXPECT_FALSE(session.is_paused());

    resp = server.handle_command({{"cmd", "resume"}});
    EXPECT_EQ(resp["message"].get<std::string>(), "Not paused");

    server.handle_command({{"cmd", "pause"}});
    resp = server.handle_command({{"cmd", "stop"}});
    EXPECT_EQ(resp["status"].get<std::string>(), "ok");
    EXPECT_TRUE(session.is_stopping());
    EXPECT_FALSE(session.is_paused());
}

TEST_F(ControlServerTest, UnknownCommand) {
    ReplaySession session(config_);
    ControlServer server(session);

    nlohmann::json resp = server.handle_command({{"cmd", "rewind"}});
    EXPECT_EQ(resp["status"].get<std::string>(), "error");
    EXPECT_EQ(resp["error"].get<std::string>(), "Unknown command: rewind");

    resp = server.handle_command(nlohmann::json::array());
    EXPECT_EQ(resp["status"].get<std::string>(), "error");
}

TEST_F(ControlServerTest, TcpRoundTrip) {
    ReplaySession session(config_);
    ASSERT_TRUE(session.init());
    ControlServer server(session);
    ASSERT_TRUE(server.start(0));
    ASSERT_TRUE(server.is_running());
    ASSERT_GT(server.port(), 0);

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);

    struct timeval tv;
    tv.tv_sec = 2;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(server.port()));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    ASSERT_EQ(connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);

    auto round_trip = [fd](const std::string& request) {
        std::string out = request + "\n";
        EXPECT_EQ(write(fd, out.data(), out.size()), static_cast<ssize_t>(out.size()));

        std::string line;
        char c;
        while (read(fd, &c, 1) == 1 && c != '\n') {
            line += c;
        }
        return nlohmann::json::parse(line);
    };

    nlohmann::json resp = round_trip(R"({"cmd":"pause"})");
    EXPECT_EQ(resp["status"].get<std::string>(), "ok");
    EXPECT_TRUE(session.is_paused());

    resp = round_trip(R"({"cmd":"status"})");
    EXPECT_TRUE(resp["paused"].get<bool>());
    EXPECT_EQ(resp["control_clients"].get<int>(), 1);

    resp = round_trip("not json");
    EXPECT_EQ(resp["status"].get<std::string>(), "error");

    close(fd);
    server.stop();
    EXPECT_FALSE(server.is_running());
}

TEST_F(ControlServerTest, FinishedClientsAreJoined) {
    ReplaySession session(config_);
    ASSERT_TRUE(session.init());
    ControlServer server(session);
    ASSERT_TRUE(server.start(0));

    for (int i = 0; i < 5; i++) {
        int fd = connect_local(server.port());
        ASSERT_GE(fd, 0);
        ASSERT_TRUE(wait_until([&server]() { return server.clients() == 1; }));
        close(fd);
        ASSERT_TRUE(wait_until([&server]() { return server.clients() == 0; }));
    }
    // Handlers mark themselves done right after the client count drops
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_LE(server.handler_threads(), 5u);

    // The next accept joins every finished handler
    int fd = connect_local(server.port());
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(wait_until([&server]() { return server.clients() == 1; }));
    EXPECT_TRUE(wait_until([&server]() { return server.handler_threads() == 1; }));

    close(fd);
    server.stop();
    EXPECT_EQ(server.handler_threads(), 0u);
}
