#include <gtest/gtest.h>
#include "mcpguard/message_log.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <regex>
#include <string>
#include <vector>

using namespace mcpguard;
namespace fs = std::filesystem;

namespace {

class MessageLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("mcpguard-msglog-" + std::to_string(rd()));
        fs::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::vector<std::string> read_lines(const fs::path& path) {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }

    size_t count_archives(const fs::path& log_path) {
        size_t n = 0;
        const std::string prefix = log_path.filename().string() + ".";
        for (const auto& e : fs::directory_iterator(dir_)) {
            if (e.path().filename().string().rfind(prefix, 0) == 0) ++n;
        }
        return n;
    }

    fs::path dir_;
};

} // anonymous namespace

TEST_F(MessageLogTest, LineFormat) {
    auto path = dir_ / "proxy.log";
    {
        MessageLog log(path, "echo");
        log.write(direction::ClientToServer, R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
        log.write(direction::ProxyToClient, "blocked");
    }

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 2u);
    std::regex pattern(R"(^\[\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z\] \[echo\] \[CLIENT->SERVER\] \{.*\}$)");
    EXPECT_TRUE(std::regex_match(lines[0], pattern)) << lines[0];
    EXPECT_NE(lines[1].find("[PROXY->CLIENT] blocked"), std::string::npos);
}

TEST_F(MessageLogTest, AppendsAcrossInstances) {
    auto path = dir_ / "proxy.log";
    { MessageLog(path, "a").write(direction::Error, "one"); }
    { MessageLog(path, "a").write(direction::Error, "two"); }
    EXPECT_EQ(read_lines(path).size(), 2u);
}

TEST_F(MessageLogTest, CreatesParentDirectories) {
    auto path = dir_ / "nested" / "deeper" / "proxy.log";
    MessageLog log(path, "x");
    log.write(direction::ServerToClient, "hello");
    EXPECT_TRUE(fs::exists(path));
}

TEST_F(MessageLogTest, RotatesPastMaxBytes) {
    auto path = dir_ / "proxy.log";
    MessageLog log(path, "srv", 200, 5);
    const std::string payload(120, 'p');
    log.write(direction::ClientToServer, payload);
    EXPECT_EQ(count_archives(path), 0u);
    log.write(direction::ClientToServer, payload);

    EXPECT_EQ(count_archives(path), 1u);
    EXPECT_TRUE(read_lines(path).empty());

    log.write(direction::ClientToServer, "after rotation");
    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("after rotation"), std::string::npos);
}

TEST_F(MessageLogTest, RotationsInOneSecondKeepEveryArchive) {
    auto path = dir_ / "proxy.log";
    MessageLog log(path, "srv", 10, 10);
    for (const char* text : {"first", "second", "third"}) {
        log.write(direction::ClientToServer, text);
    }
    ASSERT_EQ(count_archives(path), 3u);

    std::vector<std::string> seen;
    for (const auto& e : fs::directory_iterator(dir_)) {
        if (e.path() == path) continue;
        for (const auto& line : read_lines(e.path())) seen.push_back(line);
    }
    ASSERT_EQ(seen.size(), 3u);
    for (const char* text : {"first", "second", "third"}) {
        EXPECT_EQ(std::count_if(seen.begin(), seen.end(),
                                [&](const std::string& l) { return l.find(text) != std::string::npos; }),
                  1) << text;
    }
}

TEST_F(MessageLogTest, PrunesOldArchives) {
    auto path = dir_ / "proxy.log";
    for (const char* stamp : {"20240101-000000", "20240102-000000", "20240103-000000"}) {
        std::ofstream(dir_ / ("proxy.log." + std::string(stamp))) << "old\n";
    }
    MessageLog log(path, "srv", 10, 2);
    log.write(direction::ClientToServer, "enough to rotate");

    EXPECT_EQ(count_archives(path), 2u);
    EXPECT_FALSE(fs::exists(dir_ / "proxy.log.20240101-000000"));
    EXPECT_FALSE(fs::exists(dir_ / "proxy.log.20240102-000000"));
    EXPECT_TRUE(fs::exists(dir_ / "proxy.log.20240103-000000"));
}

TEST_F(MessageLogTest, UnwritablePathIsNotFatal) {
    MessageLog log("/proc/mcpguard-cannot-write/proxy.log", "x");
    log.write(direction::Error, "dropped");
    SUCCEED();
}
