/**
 * @file received_file_saver_test.cpp
 * @brief Unit tests for the background writer of received files
 */

#include "peerdrop/ErrorCodes.h"
#include "peerdrop/OfflineStore.h"
#include "peerdrop/ReceivedFileSaver.h"
#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace PeerDrop;

namespace {

FileReceivedEvent makeEvent(const std::string& name, const std::string& content)
{
    FileReceivedEvent event;
    event.file.name = name;
    event.file.mimeType = "text/plain";
    event.file.data.assign(content.begin(), content.end());
    event.fromPeerId = "peer_sender";
    event.fromPeerDisplayName = "Sender";
    event.sha256Hex = "00";
    return event;
}

std::string readAll(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

//=============================================================================
// Test Fixture
//=============================================================================

class ReceivedFileSaverTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    std::mutex doneMutex;
    std::condition_variable doneCv;
    std::vector<SaveResult> results;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
            (std::string("peerdrop_saver_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void collect(ReceivedFileSaver& saver) {
        saver.setCompletionCallback([this](const SaveResult& result) {
            std::lock_guard<std::mutex> lock(doneMutex);
            results.push_back(result);
            doneCv.notify_all();
        });
    }

    bool waitForResults(size_t count) {
        std::unique_lock<std::mutex> lock(doneMutex);
        return doneCv.wait_for(lock, std::chrono::seconds(10), [&] { return results.size() >= count; });
    }
};

TEST_F(ReceivedFileSaverTest, EnqueueRequiresRunningWorker)
{
    ReceivedFileSaver saver(dir / "downloads");
    EXPECT_FALSE(saver.enqueue(makeEvent("early.txt", "x")));

    ASSERT_TRUE(saver.start());
    EXPECT_FALSE(saver.start());
    saver.stop();
    EXPECT_FALSE(saver.enqueue(makeEvent("late.txt", "x")));
    EXPECT_FALSE(std::filesystem::exists(dir / "downloads"));
}

TEST_F(ReceivedFileSaverTest, SavesOnWorkerThread)
{
    ReceivedFileSaver saver(dir / "downloads");
    std::thread::id workerId;
    saver.setCompletionCallback([&](const SaveResult& result) {
        std::lock_guard<std::mutex> lock(doneMutex);
        workerId = std::this_thread::get_id();
        results.push_back(result);
        doneCv.notify_all();
    });
    ASSERT_TRUE(saver.start());

    ASSERT_TRUE(saver.enqueue(makeEvent("notes.txt", "hello from the other laptop")));
    ASSERT_TRUE(waitForResults(1));
    saver.stop();

    ASSERT_EQ(results.size(), 1u);
    const SaveResult& result = results[0];
    EXPECT_TRUE(result.success) << result.errorMsg;
    EXPECT_NE(workerId, std::this_thread::get_id());
    EXPECT_EQ(result.filename, "notes.txt");
    EXPECT_EQ(result.fromPeerDisplayName, "Sender");
    EXPECT_EQ(result.size, 27u);
    EXPECT_EQ(result.savedPath, dir / "downloads" / "notes.txt");
    EXPECT_EQ(readAll(result.savedPath), "hello from the other laptop");
    EXPECT_FALSE(result.cached);
}

TEST_F(ReceivedFileSaverTest, EnqueueDoesNotWaitForSlowSave)
{
    ReceivedFileSaver saver(dir);

    std::mutex gateMutex;
    std::condition_variable gateCv;
    bool released = false;
    bool firstInCallback = false;

    saver.setCompletionCallback([&](const SaveResult& result) {
        std::unique_lock<std::mutex> lock(gateMutex);
        if (!firstInCallback) {
            firstInCallback = true;
            gateCv.notify_all();
            gateCv.wait(lock, [&] { return released; });
        }
        std::lock_guard<std::mutex> doneLock(doneMutex);
        results.push_back(result);
        doneCv.notify_all();
    });
    ASSERT_TRUE(saver.start());

    ASSERT_TRUE(saver.enqueue(makeEvent("first.txt", "1")));
    {
        std::unique_lock<std::mutex> lock(gateMutex);
        ASSERT_TRUE(gateCv.wait_for(lock, std::chrono::seconds(10), [&] { return firstInCallback; }));
    }

    // The worker is stuck on the first file; queueing more still returns at once
    ASSERT_TRUE(saver.enqueue(makeEvent("second.txt", "2")));
    ASSERT_TRUE(saver.enqueue(makeEvent("third.txt", "3")));
    EXPECT_EQ(saver.pendingCount(), 2u);

    {
        std::lock_guard<std::mutex> lock(gateMutex);
        released = true;
    }
    gateCv.notify_all();

    ASSERT_TRUE(waitForResults(3));
    saver.stop();
    EXPECT_EQ(saver.pendingCount(), 0u);
    EXPECT_EQ(results[1].filename, "second.txt");
    EXPECT_EQ(results[2].filename, "third.txt");
}

TEST_F(ReceivedFileSaverTest, StopSavesEverythingQueued)
{
    ReceivedFileSaver saver(dir);
    collect(saver);
    ASSERT_TRUE(saver.start());

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(saver.enqueue(makeEvent("batch" + std::to_string(i) + ".txt", std::to_string(i))));
    }
    saver.stop();

    ASSERT_EQ(results.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(readAll(dir / ("batch" + std::to_string(i) + ".txt")), std::to_string(i));
    }
}

TEST_F(ReceivedFileSaverTest, NamesNeverOverwriteOrEscape)
{
    ReceivedFileSaver saver(dir);
    collect(saver);
    ASSERT_TRUE(saver.start());

    ASSERT_TRUE(saver.enqueue(makeEvent("photo.jpg", "one")));
    ASSERT_TRUE(saver.enqueue(makeEvent("photo.jpg", "two")));
    ASSERT_TRUE(saver.enqueue(makeEvent("../../outside.txt", "three")));
    ASSERT_TRUE(saver.enqueue(makeEvent("..", "four")));
    saver.stop();

    ASSERT_EQ(results.size(), 4u);
    for (const auto& result : results) {
        ASSERT_TRUE(result.success) << result.errorMsg;
        EXPECT_EQ(result.savedPath.parent_path(), dir);
    }
    EXPECT_NE(results[0].savedPath, results[1].savedPath);
    EXPECT_EQ(readAll(results[0].savedPath), "one");
    EXPECT_EQ(readAll(results[1].savedPath), "two");
    EXPECT_EQ(results[2].savedPath.filename(), "outside.txt");
    EXPECT_EQ(results[3].savedPath.filename(), "received.bin");
}

TEST_F(ReceivedFileSaverTest, KeepsOfflineCopy)
{
    OfflineStore store(dir / "offline");
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;

    ReceivedFileSaver saver(dir / "downloads", &store);
    collect(saver);
    ASSERT_TRUE(saver.start());
    ASSERT_TRUE(saver.enqueue(makeEvent("report.pdf", "%PDF")));
    saver.stop();

    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].cached) << results[0].cacheError;

    std::vector<OfflineFile> cached;
    ASSERT_TRUE(store.getAllOfflineFiles(cached, error)) << error;
    ASSERT_EQ(cached.size(), 1u);
    EXPECT_EQ(cached[0].filename, "report.pdf");
    EXPECT_EQ(cached[0].data, std::vector<uint8_t>({'%', 'P', 'D', 'F'}));
}

TEST_F(ReceivedFileSaverTest, WriteFailureIsReported)
{
    std::ofstream(dir / "not-a-dir") << "occupied";

    ReceivedFileSaver saver(dir / "not-a-dir");
    collect(saver);
    ASSERT_TRUE(saver.start());
    ASSERT_TRUE(saver.enqueue(makeEvent("lost.txt", "x")));
    saver.stop();

    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].success);
    EXPECT_TRUE(hasErrorCode(results[0].errorMsg, ErrorCodes::FILE_WRITE_ERROR)) << results[0].errorMsg;
    EXPECT_FALSE(results[0].cached);
}
