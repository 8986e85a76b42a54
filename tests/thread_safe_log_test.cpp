/**
 * @file thread_safe_log_test.cpp
 * @brief Unit tests for the diagnostics log sessions and concurrent writers
 */

#include "peerdrop/ErrorCodes.h"
#include "peerdrop/ThreadSafeLog.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace PeerDrop;

namespace {

std::vector<std::string> readLines(const std::filesystem::path& path)
{
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool endsWith(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

class ThreadSafeLogTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        ThreadSafeLog::shutdown();
        dir = std::filesystem::temp_directory_path() /
            (std::string("peerdrop_log_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void TearDown() override {
        ThreadSafeLog::shutdown();
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

}  // namespace

TEST_F(ThreadSafeLogTest, LogOutsideSessionIsIgnored)
{
    EXPECT_TRUE(ThreadSafeLog::logPath().empty());
    ThreadSafeLog::log("nobody reads this");
    EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(ThreadSafeLogTest, SessionHasHeaderLinesAndFooter)
{
    const auto path = dir / "nested" / "peerdrop.log";
    std::string error;
    ASSERT_TRUE(ThreadSafeLog::initialize(path, "Kitchen Laptop", error)) << error;
    EXPECT_EQ(ThreadSafeLog::logPath(), path);

    ThreadSafeLog::log("Peer connected: Bob (peer_1)");
    ThreadSafeLog::log(static_cast<const char*>(nullptr));
    ThreadSafeLog::shutdown();
    ThreadSafeLog::log("after shutdown");

    EXPECT_TRUE(ThreadSafeLog::logPath().empty());

    const std::vector<std::string> lines = readLines(path);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_TRUE(endsWith(lines[0], "] ==== Kitchen Laptop session started ====")) << lines[0];
    EXPECT_TRUE(endsWith(lines[1], "] Peer connected: Bob (peer_1)")) << lines[1];
    EXPECT_TRUE(endsWith(lines[2], "] ")) << lines[2];
    EXPECT_TRUE(endsWith(lines[3], "] ==== session ended ====")) << lines[3];

    // "YYYY-MM-DD HH:MM:SS.mmm [thread] message"
    EXPECT_EQ(lines[1][4], '-');
    EXPECT_EQ(lines[1][19], '.');
    EXPECT_EQ(lines[1][24], '[');
}

TEST_F(ThreadSafeLogTest, SessionsAppendToExistingFile)
{
    const auto path = dir / "peerdrop.log";
    std::string error;
    ASSERT_TRUE(ThreadSafeLog::initialize(path, "first", error)) << error;
    ThreadSafeLog::shutdown();
    ASSERT_TRUE(ThreadSafeLog::initialize(path, "second", error)) << error;
    ThreadSafeLog::shutdown();

    const std::vector<std::string> lines = readLines(path);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_TRUE(endsWith(lines[0], "first session started ===="));
    EXPECT_TRUE(endsWith(lines[2], "second session started ===="));
}

TEST_F(ThreadSafeLogTest, UnwritablePathStartsNoSession)
{
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "occupied") << "a regular file";

    std::string error;
    EXPECT_FALSE(ThreadSafeLog::initialize(dir / "occupied" / "peerdrop.log", "x", error));
    EXPECT_TRUE(hasErrorCode(error, ErrorCodes::CONFIG_ERROR)) << error;
    EXPECT_TRUE(ThreadSafeLog::logPath().empty());
}

TEST_F(ThreadSafeLogTest, ConcurrentWritersKeepLinesWhole)
{
    const auto path = dir / "peerdrop.log";
    std::string error;
    ASSERT_TRUE(ThreadSafeLog::initialize(path, "threads", error)) << error;

    constexpr int kThreads = 4;
    constexpr int kLines = 50;
    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([t]() {
            for (int i = 0; i < kLines; ++i) {
                ThreadSafeLog::log("writer " + std::to_string(t) + " line " + std::to_string(i) + " end");
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    ThreadSafeLog::shutdown();

    const std::vector<std::string> lines = readLines(path);
    ASSERT_EQ(lines.size(), static_cast<size_t>(kThreads * kLines + 2));
    int writerLines = 0;
    for (const auto& line : lines) {
        if (line.find("] writer ") != std::string::npos) {
            EXPECT_TRUE(endsWith(line, " end")) << line;
            ++writerLines;
        }
    }
    EXPECT_EQ(writerLines, kThreads * kLines);
}
