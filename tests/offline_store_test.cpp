/**
 * @file offline_store_test.cpp
 * @brief Unit tests for the offline file cache and upload queue
 */

#include "peerdrop/ErrorCodes.h"
#include "peerdrop/OfflineStore.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace PeerDrop;

class OfflineStoreTest : public ::testing::Test {
protected:
    std::filesystem::path root;

    void SetUp() override {
        root = std::filesystem::temp_directory_path() /
            (std::string("peerdrop_offline_store_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    static OfflineFile makeFile(const std::string& id, const std::string& name, std::vector<uint8_t> data) {
        OfflineFile f;
        f.id = id;
        f.filename = name;
        f.data = std::move(data);
        f.downloadedAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
        f.shareToken = "tok-" + id;
        return f;
    }

    static QueuedUpload makeUpload(const std::string& id, int64_t queuedAtMs) {
        QueuedUpload u;
        u.id = id;
        u.filename = id + ".txt";
        u.data = {1, 2, 3};
        u.queuedAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(queuedAtMs));
        return u;
    }
};

TEST_F(OfflineStoreTest, OperationsFailBeforeInitialize)
{
    OfflineStore store(root);
    std::string error;
    EXPECT_FALSE(store.saveOfflineFile(makeFile("a", "a.txt", {1}), error));
    EXPECT_TRUE(hasErrorCode(error, ErrorCodes::OFFLINE_STORE_ERROR)) << error;
}

TEST_F(OfflineStoreTest, SaveAndGetOfflineFile)
{
    OfflineStore store(root);
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;

    const OfflineFile saved = makeFile("file-1", "photo.jpg", {9, 8, 7, 6});
    ASSERT_TRUE(store.saveOfflineFile(saved, error)) << error;

    OfflineFile loaded;
    ASSERT_TRUE(store.getOfflineFile("file-1", loaded, error)) << error;
    EXPECT_EQ(loaded.id, "file-1");
    EXPECT_EQ(loaded.filename, "photo.jpg");
    EXPECT_EQ(loaded.data, saved.data);
    EXPECT_EQ(loaded.size, 4u);
    EXPECT_EQ(loaded.shareToken, "tok-file-1");
    EXPECT_EQ(loaded.downloadedAt, saved.downloadedAt);

    EXPECT_TRUE(std::filesystem::exists(root / OFFLINE_FILES_DIR / OFFLINE_INDEX_FILE));
    EXPECT_TRUE(std::filesystem::exists(root / OFFLINE_FILES_DIR / "file-1.bin"));
}

TEST_F(OfflineStoreTest, PutWithExistingIdReplaces)
{
    OfflineStore store(root);
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;

    ASSERT_TRUE(store.saveOfflineFile(makeFile("same", "old.txt", {1}), error)) << error;
    ASSERT_TRUE(store.saveOfflineFile(makeFile("same", "new.txt", {2, 2}), error)) << error;

    std::vector<OfflineFile> all;
    ASSERT_TRUE(store.getAllOfflineFiles(all, error)) << error;
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].filename, "new.txt");
    EXPECT_EQ(all[0].data, std::vector<uint8_t>({2, 2}));
}

TEST_F(OfflineStoreTest, DeleteRemovesFileAndUnknownIdIsFine)
{
    OfflineStore store(root);
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;
    ASSERT_TRUE(store.saveOfflineFile(makeFile("gone", "x.bin", {1, 2}), error)) << error;

    ASSERT_TRUE(store.deleteOfflineFile("gone", error)) << error;
    OfflineFile loaded;
    EXPECT_FALSE(store.getOfflineFile("gone", loaded, error));
    EXPECT_FALSE(std::filesystem::exists(root / OFFLINE_FILES_DIR / "gone.bin"));

    EXPECT_TRUE(store.deleteOfflineFile("never-existed", error)) << error;
}

TEST_F(OfflineStoreTest, RejectsIdsThatEscapeTheDirectory)
{
    OfflineStore store(root);
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;

    EXPECT_FALSE(store.saveOfflineFile(makeFile("../evil", "x", {1}), error));
    EXPECT_TRUE(hasErrorCode(error, ErrorCodes::OFFLINE_STORE_ERROR)) << error;
    EXPECT_FALSE(store.saveOfflineFile(makeFile("", "x", {1}), error));

    EXPECT_TRUE(OfflineStore::isValidId("3f2a-uuid_1.v2"));
    EXPECT_FALSE(OfflineStore::isValidId(".."));
    EXPECT_FALSE(OfflineStore::isValidId("a/b"));
}

TEST_F(OfflineStoreTest, ContentSurvivesReopen)
{
    std::string error;
    {
        OfflineStore store(root);
        ASSERT_TRUE(store.initialize(error)) << error;
        ASSERT_TRUE(store.saveOfflineFile(makeFile("keep", "keep.txt", {4, 5}), error)) << error;
        ASSERT_TRUE(store.queueUpload(makeUpload("up", 10), error)) << error;
    }

    OfflineStore reopened(root);
    ASSERT_TRUE(reopened.initialize(error)) << error;

    OfflineFile loaded;
    ASSERT_TRUE(reopened.getOfflineFile("keep", loaded, error)) << error;
    EXPECT_EQ(loaded.data, std::vector<uint8_t>({4, 5}));

    std::vector<QueuedUpload> queue;
    ASSERT_TRUE(reopened.getUploadQueue(queue, error)) << error;
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue[0].id, "up");
}

TEST_F(OfflineStoreTest, TamperedPayloadFailsToLoad)
{
    OfflineStore store(root);
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;
    ASSERT_TRUE(store.saveOfflineFile(makeFile("doc", "doc.txt", {1, 2, 3, 4}), error)) << error;
    ASSERT_TRUE(store.queueUpload(makeUpload("up", 10), error)) << error;

    // Same length, different bytes
    std::ofstream(root / OFFLINE_FILES_DIR / "doc.bin", std::ios::binary) << "abcd";
    std::ofstream(root / UPLOAD_QUEUE_DIR / "up.bin", std::ios::binary) << "xyz";

    OfflineFile loaded;
    EXPECT_FALSE(store.getOfflineFile("doc", loaded, error));
    EXPECT_TRUE(hasErrorCode(error, ErrorCodes::OFFLINE_STORE_ERROR)) << error;
    EXPECT_NE(error.find("corrupt"), std::string::npos) << error;

    std::vector<QueuedUpload> queue;
    EXPECT_FALSE(store.getUploadQueue(queue, error));
    EXPECT_TRUE(hasErrorCode(error, ErrorCodes::OFFLINE_STORE_ERROR)) << error;
}

TEST_F(OfflineStoreTest, RecordWithoutDigestIsReturnedUnchecked)
{
    std::filesystem::create_directories(root / OFFLINE_FILES_DIR);
    std::ofstream(root / OFFLINE_FILES_DIR / OFFLINE_INDEX_FILE)
        << R"({"old": {"filename": "old.txt", "downloadedAt": 5, "shareToken": "", "size": 2}})";
    std::ofstream(root / OFFLINE_FILES_DIR / "old.bin", std::ios::binary) << "hi";

    OfflineStore store(root);
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;

    OfflineFile loaded;
    ASSERT_TRUE(store.getOfflineFile("old", loaded, error)) << error;
    EXPECT_EQ(loaded.data, std::vector<uint8_t>({'h', 'i'}));
}

TEST_F(OfflineStoreTest, CorruptIndexFailsInitialize)
{
    std::filesystem::create_directories(root / OFFLINE_FILES_DIR);
    std::ofstream(root / OFFLINE_FILES_DIR / OFFLINE_INDEX_FILE) << "{ not json";

    OfflineStore store(root);
    std::string error;
    EXPECT_FALSE(store.initialize(error));
    EXPECT_TRUE(hasErrorCode(error, ErrorCodes::OFFLINE_STORE_ERROR)) << error;
}

TEST_F(OfflineStoreTest, UploadQueueIsOldestFirst)
{
    OfflineStore store(root);
    std::string error;
    ASSERT_TRUE(store.initialize(error)) << error;

    ASSERT_TRUE(store.queueUpload(makeUpload("late", 3000), error)) << error;
    ASSERT_TRUE(store.queueUpload(makeUpload("early", 1000), error)) << error;
    ASSERT_TRUE(store.queueUpload(makeUpload("middle", 2000), error)) << error;

    std::vector<QueuedUpload> queue;
    ASSERT_TRUE(store.getUploadQueue(queue, error)) << error;
    ASSERT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue[0].id, "early");
    EXPECT_EQ(queue[1].id, "middle");
    EXPECT_EQ(queue[2].id, "late");
    EXPECT_EQ(queue[0].size, 3u);

    ASSERT_TRUE(store.removeFromUploadQueue("middle", error)) << error;
    ASSERT_TRUE(store.getUploadQueue(queue, error)) << error;
    ASSERT_EQ(queue.size(), 2u);

    ASSERT_TRUE(store.clearUploadQueue(error)) << error;
    ASSERT_TRUE(store.getUploadQueue(queue, error)) << error;
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(std::filesystem::exists(root / UPLOAD_QUEUE_DIR / "early.bin"));
}
