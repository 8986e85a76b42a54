/**
 * @file chunked_transfer_test.cpp
 * @brief Unit tests for the metadata + binary frame protocol
 *
 * FileSender writes into a recording channel; the recorded frames are fed
 * to a FileReassembler the way the engine would.
 */

#include "peerdrop/ErrorCodes.h"
#include "peerdrop/FileTransfer.h"
#include "peerdrop/HashUtils.h"
#include "peerdrop/config.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <deque>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace PeerDrop;

namespace {

/**
 * @brief Channel that records what is sent and reports a scripted buffer level
 */
class RecordingChannel : public DataChannel {
public:
    struct Frame {
        bool binary = false;
        std::string text;
        std::vector<uint8_t> data;
    };

    bool open = true;
    std::vector<Frame> frames;

    // Buffer levels returned by successive bufferedAmount() calls (0 once empty)
    mutable std::deque<size_t> levels;
    mutable std::vector<std::string> trace;

    // Close the channel after this many polls (0 = never)
    mutable size_t closeAfterPolls = 0;

    bool sendText(const std::string& text, std::string& errorMsg) override {
        if (!open) {
            errorMsg = "closed";
            return false;
        }
        Frame f;
        f.text = text;
        frames.push_back(f);
        trace.push_back("text");
        return true;
    }

    bool sendBinary(const uint8_t* data, size_t size, std::string& errorMsg) override {
        if (!open) {
            errorMsg = "closed";
            return false;
        }
        Frame f;
        f.binary = true;
        f.data.assign(data, data + size);
        frames.push_back(f);
        trace.push_back("binary:" + std::to_string(size));
        return true;
    }

    size_t bufferedAmount() const override {
        size_t level = 0;
        if (!levels.empty()) {
            level = levels.front();
            levels.pop_front();
        }
        trace.push_back("poll:" + std::to_string(level));
        if (closeAfterPolls > 0 && --closeAfterPolls == 0) {
            const_cast<RecordingChannel*>(this)->open = false;
        }
        return level;
    }

    bool isOpen() const override { return open; }
    void close() override { open = false; }

    void onOpen(OpenHandler) override {}
    void onClosed(ClosedHandler) override {}
    void onText(TextHandler) override {}
    void onBinary(BinaryHandler) override {}

    std::vector<size_t> binarySizes() const {
        std::vector<size_t> sizes;
        for (const auto& f : frames) {
            if (f.binary) {
                sizes.push_back(f.data.size());
            }
        }
        return sizes;
    }
};

TransferFile makeFile(const std::string& name, size_t size, uint8_t seed = 0)
{
    TransferFile file;
    file.name = name;
    file.mimeType = "application/octet-stream";
    file.data.resize(size);
    for (size_t i = 0; i < size; ++i) {
        file.data[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
    }
    return file;
}

/**
 * @brief Feed recorded frames to the reassembler, return every result
 */
std::vector<FrameResult> replay(FileReassembler& reassembler,
                                const std::string& peerId,
                                const std::vector<RecordingChannel::Frame>& frames)
{
    std::vector<FrameResult> results;
    for (const auto& f : frames) {
        if (f.binary) {
            results.push_back(reassembler.onBinary(peerId, f.data.data(), f.data.size()));
        } else {
            results.push_back(reassembler.onText(peerId, f.text));
        }
    }
    return results;
}

}  // namespace

//=============================================================================
// Test Fixture
//=============================================================================

class ChunkedTransferTest : public ::testing::Test {
protected:
    RecordingChannel channel;
    FileReassembler reassembler;
    SendOptions options;
    std::vector<uint64_t> progress;

    void SetUp() override {
        options.frameSize = FRAME_SIZE;
        options.highWaterMark = HIGH_WATER_MARK;
        options.pollInterval = std::chrono::milliseconds(1);
    }

    SendProgressCallback recordProgress() {
        return [this](uint64_t sent, uint64_t total) {
            (void)total;
            progress.push_back(sent);
        };
    }
};

//=============================================================================
// Frame layout
//=============================================================================

TEST_F(ChunkedTransferTest, MetadataFrameCarriesNameSizeAndType)
{
    FileSender sender(options);
    TransferFile file = makeFile("report.pdf", 100);
    file.mimeType = "application/pdf";

    std::string error;
    ASSERT_TRUE(sender.sendBuffer(channel, file, error)) << error;
    ASSERT_FALSE(channel.frames.empty());
    ASSERT_FALSE(channel.frames[0].binary);

    nlohmann::json j = nlohmann::json::parse(channel.frames[0].text);
    EXPECT_EQ(j["name"], "report.pdf");
    EXPECT_EQ(j["size"], 100);
    EXPECT_EQ(j["type"], "application/pdf");
}

TEST_F(ChunkedTransferTest, ZeroByteFileIsMetadataOnly)
{
    FileSender sender(options);
    std::string error;
    ASSERT_TRUE(sender.sendBuffer(channel, makeFile("empty.txt", 0), error, recordProgress())) << error;

    ASSERT_EQ(channel.frames.size(), 1u);
    EXPECT_FALSE(channel.frames[0].binary);
    EXPECT_TRUE(progress.empty());

    std::vector<FrameResult> results = replay(reassembler, "peer_a", channel.frames);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, FrameOutcome::TransferCompleted);
    EXPECT_EQ(results[0].file.name, "empty.txt");
    EXPECT_TRUE(results[0].file.data.empty());
    EXPECT_EQ(results[0].sha256Hex, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_FALSE(reassembler.hasTransfer("peer_a"));
}

TEST_F(ChunkedTransferTest, FileSmallerThanFrameIsOneChunk)
{
    FileSender sender(options);
    TransferFile file = makeFile("note.txt", 1000);
    std::string error;
    ASSERT_TRUE(sender.sendBuffer(channel, file, error, recordProgress())) << error;

    EXPECT_EQ(channel.binarySizes(), std::vector<size_t>({1000}));
    EXPECT_EQ(progress, std::vector<uint64_t>({1000}));

    std::vector<FrameResult> results = replay(reassembler, "peer_a", channel.frames);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].outcome, FrameOutcome::MetadataStarted);
    EXPECT_EQ(results[1].outcome, FrameOutcome::TransferCompleted);
    EXPECT_EQ(results[1].file.data, file.data);
}

TEST_F(ChunkedTransferTest, ExactMultipleOfFrameSizeHasNoEmptyTail)
{
    FileSender sender(options);
    TransferFile file = makeFile("two.bin", 2 * FRAME_SIZE);
    std::string error;
    ASSERT_TRUE(sender.sendBuffer(channel, file, error)) << error;

    EXPECT_EQ(channel.binarySizes(), std::vector<size_t>({FRAME_SIZE, FRAME_SIZE}));
    EXPECT_EQ(sender.getFramesSent(), 2u);
    EXPECT_EQ(sender.getBytesSent(), 2u * FRAME_SIZE);
}

TEST_F(ChunkedTransferTest, FortyKilobyteFileSplitsIntoThreeFrames)
{
    FileSender sender(options);
    TransferFile file = makeFile("photo.jpg", 40000);
    std::string error;
    ASSERT_TRUE(sender.sendBuffer(channel, file, error, recordProgress())) << error;

    EXPECT_EQ(channel.binarySizes(), std::vector<size_t>({16384, 16384, 7232}));
    EXPECT_EQ(progress, std::vector<uint64_t>({16384, 32768, 40000}));

    std::vector<FrameResult> results = replay(reassembler, "peer_a", channel.frames);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].outcome, FrameOutcome::MetadataStarted);
    EXPECT_EQ(results[1].outcome, FrameOutcome::ChunkAccepted);
    EXPECT_EQ(results[1].bytesReceived, 16384u);
    EXPECT_EQ(results[2].outcome, FrameOutcome::ChunkAccepted);
    EXPECT_EQ(results[2].bytesReceived, 32768u);
    EXPECT_EQ(results[3].outcome, FrameOutcome::TransferCompleted);
    EXPECT_EQ(results[3].bytesReceived, 40000u);
    EXPECT_EQ(results[3].totalBytes, 40000u);

    EXPECT_EQ(results[3].file.name, "photo.jpg");
    EXPECT_EQ(results[3].file.data, file.data);
    EXPECT_EQ(results[3].sha256Hex, sender.getSha256Hash());
}

TEST_F(ChunkedTransferTest, ConsecutiveFilesDoNotShareBuffers)
{
    FileSender sender(options);
    TransferFile first = makeFile("a.bin", 20000, 1);
    TransferFile second = makeFile("b.bin", 5000, 2);
    std::string error;
    ASSERT_TRUE(sender.sendBuffer(channel, first, error)) << error;
    ASSERT_TRUE(sender.sendBuffer(channel, second, error)) << error;

    std::vector<FrameResult> results = replay(reassembler, "peer_a", channel.frames);

    std::vector<TransferFile> completed;
    for (auto& r : results) {
        if (r.outcome == FrameOutcome::TransferCompleted) {
            completed.push_back(r.file);
        }
    }
    ASSERT_EQ(completed.size(), 2u);
    EXPECT_EQ(completed[0].name, "a.bin");
    EXPECT_EQ(completed[0].data, first.data);
    EXPECT_EQ(completed[1].name, "b.bin");
    EXPECT_EQ(completed[1].data, second.data);
    EXPECT_EQ(reassembler.activeCount(), 0u);
}

TEST_F(ChunkedTransferTest, TransfersFromDifferentPeersAreIndependent)
{
    TransferFile fromA = makeFile("a.bin", 30000, 1);
    TransferFile fromB = makeFile("b.bin", 30000, 2);

    RecordingChannel channelB;
    FileSender sender(options);
    std::string error;
    ASSERT_TRUE(sender.sendBuffer(channel, fromA, error)) << error;
    ASSERT_TRUE(sender.sendBuffer(channelB, fromB, error)) << error;

    // Interleave: metadata A, metadata B, chunks A, chunks B
    EXPECT_EQ(reassembler.onText("peer_a", channel.frames[0].text).outcome, FrameOutcome::MetadataStarted);
    EXPECT_EQ(reassembler.onText("peer_b", channelB.frames[0].text).outcome, FrameOutcome::MetadataStarted);
    EXPECT_EQ(reassembler.activeCount(), 2u);

    FrameResult lastA;
    for (size_t i = 1; i < channel.frames.size(); ++i) {
        lastA = reassembler.onBinary("peer_a", channel.frames[i].data.data(), channel.frames[i].data.size());
    }
    FrameResult lastB;
    for (size_t i = 1; i < channelB.frames.size(); ++i) {
        lastB = reassembler.onBinary("peer_b", channelB.frames[i].data.data(), channelB.frames[i].data.size());
    }

    ASSERT_EQ(lastA.outcome, FrameOutcome::TransferCompleted);
    ASSERT_EQ(lastB.outcome, FrameOutcome::TransferCompleted);
    EXPECT_EQ(lastA.file.data, fromA.data);
    EXPECT_EQ(lastB.file.data, fromB.data);
}

//=============================================================================
// Receiver edge cases
//=============================================================================

TEST_F(ChunkedTransferTest, BinaryWithoutMetadataIsDropped)
{
    const std::vector<uint8_t> stray(512, 0xEE);
    FrameResult result = reassembler.onBinary("peer_a", stray.data(), stray.size());

    EXPECT_EQ(result.outcome, FrameOutcome::OrphanDropped);
    EXPECT_FALSE(reassembler.hasTransfer("peer_a"));
}

TEST_F(ChunkedTransferTest, NewMetadataReplacesIncompleteTransfer)
{
    FileMetadata first{"first.bin", 1000, "application/octet-stream"};
    FileMetadata second{"second.bin", 4, "application/octet-stream"};
    const std::vector<uint8_t> partial(600, 0x11);
    const std::vector<uint8_t> full = {1, 2, 3, 4};

    reassembler.onText("peer_a", first.toJson());
    reassembler.onBinary("peer_a", partial.data(), partial.size());
    EXPECT_EQ(reassembler.receivedBytes("peer_a"), 600u);

    EXPECT_EQ(reassembler.onText("peer_a", second.toJson()).outcome, FrameOutcome::MetadataStarted);
    EXPECT_EQ(reassembler.receivedBytes("peer_a"), 0u);

    FrameResult done = reassembler.onBinary("peer_a", full.data(), full.size());
    ASSERT_EQ(done.outcome, FrameOutcome::TransferCompleted);
    EXPECT_EQ(done.file.name, "second.bin");
    EXPECT_EQ(done.file.data, full);
}

TEST_F(ChunkedTransferTest, InvalidMetadataDiscardsTransfer)
{
    FileMetadata meta{"doc.txt", 100, "text/plain"};
    const std::vector<uint8_t> chunk(50, 0x22);
    reassembler.onText("peer_a", meta.toJson());
    reassembler.onBinary("peer_a", chunk.data(), chunk.size());

    FrameResult bad = reassembler.onText("peer_a", "not json at all");
    EXPECT_EQ(bad.outcome, FrameOutcome::MetadataInvalid);
    EXPECT_FALSE(bad.errorMsg.empty());
    EXPECT_FALSE(reassembler.hasTransfer("peer_a"));

    // Remaining chunks of the old transfer are orphans now
    EXPECT_EQ(reassembler.onBinary("peer_a", chunk.data(), chunk.size()).outcome,
              FrameOutcome::OrphanDropped);
}

TEST_F(ChunkedTransferTest, OverrunBeyondDeclaredSizeKeepsAllBytes)
{
    FileMetadata meta{"short.bin", 10, "application/octet-stream"};
    const std::vector<uint8_t> frame(16, 0x33);
    reassembler.onText("peer_a", meta.toJson());

    FrameResult done = reassembler.onBinary("peer_a", frame.data(), frame.size());
    ASSERT_EQ(done.outcome, FrameOutcome::TransferCompleted);
    EXPECT_EQ(done.file.data.size(), 16u);
    EXPECT_EQ(done.totalBytes, 10u);
}

TEST_F(ChunkedTransferTest, RekeyMovesInFlightTransfer)
{
    FileMetadata meta{"x.bin", 8, "application/octet-stream"};
    const std::vector<uint8_t> half(4, 0x44);
    reassembler.onText("peer_local", meta.toJson());
    reassembler.onBinary("peer_local", half.data(), half.size());

    ASSERT_TRUE(reassembler.rekey("peer_local", "peer_remote"));
    EXPECT_FALSE(reassembler.hasTransfer("peer_local"));

    FrameResult done = reassembler.onBinary("peer_remote", half.data(), half.size());
    EXPECT_EQ(done.outcome, FrameOutcome::TransferCompleted);
    EXPECT_EQ(done.file.data.size(), 8u);
}

TEST(FileMetadataTest, ParseRejectsWrongTypes)
{
    FileMetadata out;
    std::string error;
    EXPECT_FALSE(FileMetadata::parse(R"({"name":"a","size":-1,"type":"t"})", out, error));
    EXPECT_FALSE(FileMetadata::parse(R"({"name":"a","size":"10","type":"t"})", out, error));
    EXPECT_FALSE(FileMetadata::parse(R"({"name":"a","size":1.5,"type":"t"})", out, error));
    EXPECT_FALSE(FileMetadata::parse(R"({"name":7,"size":1,"type":"t"})", out, error));
    EXPECT_FALSE(FileMetadata::parse(R"({"name":"a","size":1})", out, error));
    EXPECT_FALSE(FileMetadata::parse(R"(["a",1,"t"])", out, error));

    const std::string longName(MAX_FILENAME_LENGTH + 1, 'n');
    EXPECT_FALSE(FileMetadata::parse("{\"name\":\"" + longName + "\",\"size\":1,\"type\":\"t\"}", out, error));

    ASSERT_TRUE(FileMetadata::parse(R"({"name":"a.txt","size":12,"type":"text/plain"})", out, error)) << error;
    EXPECT_EQ(out.name, "a.txt");
    EXPECT_EQ(out.size, 12u);
    EXPECT_EQ(out.mimeType, "text/plain");
}

TEST(FileMetadataTest, GuessMimeTypeFromExtension)
{
    EXPECT_EQ(guessMimeType("photo.JPG"), "image/jpeg");
    EXPECT_EQ(guessMimeType("notes.txt"), "text/plain");
    EXPECT_EQ(guessMimeType("archive.tar.gz"), "application/gzip");
    EXPECT_EQ(guessMimeType("Makefile"), DEFAULT_MIME_TYPE);
    EXPECT_EQ(guessMimeType("trailingdot."), DEFAULT_MIME_TYPE);
}

//=============================================================================
// Sender flow control and failures
//=============================================================================

TEST_F(ChunkedTransferTest, SenderWaitsWhileAboveHighWaterMark)
{
    options.frameSize = 4;
    options.highWaterMark = 10;

    // First frame: three polls above the mark, then one below
    channel.levels = {50, 40, 11, 10};

    FileSender sender(options);
    std::string error;
    ASSERT_TRUE(sender.sendBuffer(channel, makeFile("bp.bin", 8), error)) << error;

    const std::vector<std::string> expected = {
        "text",
        "poll:50", "poll:40", "poll:11", "poll:10", "binary:4",
        "poll:0", "binary:4",
    };
    EXPECT_EQ(channel.trace, expected);
}

TEST_F(ChunkedTransferTest, ChannelClosingDuringBackpressureFailsSend)
{
    options.frameSize = 4;
    options.highWaterMark = 10;
    channel.levels = {100, 100, 100, 100, 100};
    channel.closeAfterPolls = 2;

    FileSender sender(options);
    std::string error;
    EXPECT_FALSE(sender.sendBuffer(channel, makeFile("bp.bin", 8), error));
    EXPECT_TRUE(hasErrorCode(error, ErrorCodes::SEND_FAILED)) << error;
    EXPECT_TRUE(channel.binarySizes().empty());
}

TEST_F(ChunkedTransferTest, ClosedChannelFailsBeforeAnyFrame)
{
    channel.open = false;
    FileSender sender(options);
    std::string error;
    EXPECT_FALSE(sender.sendBuffer(channel, makeFile("x.bin", 10), error));
    EXPECT_TRUE(hasErrorCode(error, ErrorCodes::PEER_NOT_CONNECTED)) << error;
    EXPECT_TRUE(channel.frames.empty());
}

//=============================================================================
// Streaming from disk
//=============================================================================

class FileSenderDiskTest : public ChunkedTransferTest {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        ChunkedTransferTest::SetUp();
        dir = std::filesystem::temp_directory_path() /
            (std::string("peerdrop_chunked_transfer_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

TEST_F(FileSenderDiskTest, SendFileUsesBasenameAndGuessedType)
{
    TransferFile source = makeFile("ignored", 40000, 7);
    const auto path = dir / "holiday.png";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(source.data.data()),
                  static_cast<std::streamsize>(source.data.size()));
    }

    FileSender sender(options);
    std::string error;
    ASSERT_TRUE(sender.sendFile(channel, path.string(), error, recordProgress())) << error;
    EXPECT_EQ(progress, std::vector<uint64_t>({16384, 32768, 40000}));

    std::vector<FrameResult> results = replay(reassembler, "peer_a", channel.frames);
    ASSERT_EQ(results.back().outcome, FrameOutcome::TransferCompleted);
    EXPECT_EQ(results.back().file.name, "holiday.png");
    EXPECT_EQ(results.back().file.mimeType, "image/png");
    EXPECT_EQ(results.back().file.data, source.data);
}

TEST_F(FileSenderDiskTest, SendFileRejectsMissingFileAndDirectory)
{
    FileSender sender(options);
    std::string error;

    EXPECT_FALSE(sender.sendFile(channel, (dir / "missing.bin").string(), error));
    EXPECT_TRUE(hasErrorCode(error, ErrorCodes::FILE_READ_ERROR)) << error;

    error.clear();
    EXPECT_FALSE(sender.sendFile(channel, dir.string(), error));
    EXPECT_TRUE(hasErrorCode(error, ErrorCodes::FILE_READ_ERROR)) << error;

    EXPECT_TRUE(channel.frames.empty());
}
