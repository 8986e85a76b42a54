/**
 * @file FileTransfer.h
 * @brief Chunked file transfer protocol over a data channel
 *
 * Wire format (per file, in channel order):
 * - One UTF-8 JSON text message: {"name": ..., "size": <bytes>, "type": <MIME>}
 * - Zero or more binary messages of at most FRAME_SIZE bytes, summing to size
 *
 * There is no terminator and no sequence numbering: the receiver infers
 * completion from the accumulated byte count and relies on the channel's
 * ordering and reliability.
 */

#pragma once

#include "config.h"
#include "HashUtils.h"
#include "Transport.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace PeerDrop {

/**
 * @brief Direction of a transfer relative to the local engine
 */
enum class TransferDirection : uint8_t {
    Incoming,  ///< Receiving a file from a peer
    Outgoing   ///< Sending a file to a peer
};

/**
 * @brief An in-memory file: name, MIME type and exact bytes
 */
struct TransferFile {
    std::string name;
    std::string mimeType;
    std::vector<uint8_t> data;

    uint64_t size() const { return static_cast<uint64_t>(data.size()); }
};

/**
 * @brief Metadata frame declaring the next file on a channel
 */
struct FileMetadata {
    std::string name;
    uint64_t size = 0;
    std::string mimeType;

    /**
     * @brief Serialize to the JSON text frame
     */
    std::string toJson() const;

    /**
     * @brief Parse a JSON text frame
     * @return false if the text is not an object with string "name",
     *         unsigned integer "size" and string "type"
     */
    static bool parse(const std::string& text, FileMetadata& out, std::string& errorMsg);
};

/**
 * @brief Guess a MIME type from a filename extension
 * @return DEFAULT_MIME_TYPE when the extension is unknown
 */
std::string guessMimeType(const std::string& filename);

//=============================================================================
// FileSender Class
//=============================================================================

/**
 * @brief Send-side tuning
 */
struct SendOptions {
    size_t frameSize = FRAME_SIZE;
    size_t highWaterMark = HIGH_WATER_MARK;
    std::chrono::milliseconds pollInterval{BACKPRESSURE_POLL_INTERVAL_MS};
};

/**
 * @brief Progress callback function type
 *
 * Called after each binary frame with cumulative bytes sent.
 */
using SendProgressCallback = std::function<void(uint64_t bytesSent, uint64_t totalBytes)>;

/**
 * @class FileSender
 * @brief Sends one file as a metadata frame followed by fixed-size binary frames
 *
 * Backpressure: before each frame, while the channel's buffered amount
 * exceeds the high-water mark, the sender sleeps for the poll interval.
 * Nothing is sent while the buffer is above the mark, which bounds memory
 * growth in the transport. If the channel closes during the wait the send
 * fails with SEND_FAILED.
 *
 * Usage:
 * @code
 * FileSender sender(options);
 * std::string error;
 * if (!sender.sendFile(*channel, "/tmp/photo.jpg", error)) {
 *     std::cout << "Error: " << error << "\n";
 * }
 * @endcode
 */
class FileSender {
public:
    explicit FileSender(const SendOptions& options = SendOptions());

    FileSender(const FileSender&) = delete;
    FileSender& operator=(const FileSender&) = delete;

    /**
     * @brief Send an in-memory file
     */
    bool sendBuffer(DataChannel& channel,
                    const TransferFile& file,
                    std::string& errorMsg,
                    SendProgressCallback progress = nullptr);

    /**
     * @brief Stream a file from disk (name = basename, MIME guessed from extension)
     */
    bool sendFile(DataChannel& channel,
                  const std::string& filePath,
                  std::string& errorMsg,
                  SendProgressCallback progress = nullptr);

    uint64_t getBytesSent() const { return m_bytesSent; }
    size_t getFramesSent() const { return m_framesSent; }

    /**
     * @brief SHA-256 of the payload sent (valid after a successful send)
     */
    const std::string& getSha256Hash() const { return m_sha256HashString; }

    const SendOptions& options() const { return m_options; }

private:
    bool begin(DataChannel& channel, const FileMetadata& metadata, std::string& errorMsg);
    bool waitForDrain(DataChannel& channel, std::string& errorMsg);
    bool sendFrame(DataChannel& channel, const uint8_t* data, size_t size,
                   uint64_t totalBytes, std::string& errorMsg,
                   const SendProgressCallback& progress);
    bool finish(const FileMetadata& metadata, std::string& errorMsg);

    SendOptions m_options;
    uint64_t m_bytesSent;
    size_t m_framesSent;
    std::string m_sha256HashString;
    HashUtils::IncrementalHash m_incrementalHash;
};

//=============================================================================
// FileReassembler Class
//=============================================================================

/**
 * @brief What a received frame did to the peer's transfer state
 */
enum class FrameOutcome {
    MetadataStarted,    ///< Text frame started a new transfer (replacing any incomplete one)
    MetadataInvalid,    ///< Text frame was not valid metadata; prior transfer discarded
    ChunkAccepted,      ///< Binary frame appended, transfer still incomplete
    TransferCompleted,  ///< Declared size reached; file is in FrameResult::file
    OrphanDropped       ///< Binary frame with no active metadata, dropped
};

/**
 * @brief Result of feeding one frame to the reassembler
 */
struct FrameResult {
    FrameOutcome outcome = FrameOutcome::OrphanDropped;
    std::string filename;
    uint64_t bytesReceived = 0;
    uint64_t totalBytes = 0;
    TransferFile file;          ///< Only set for TransferCompleted
    std::string sha256Hex;      ///< Only set for TransferCompleted
    std::string errorMsg;       ///< Only set for MetadataInvalid
};

/**
 * @class FileReassembler
 * @brief Receiver-side reassembly state keyed by peer id
 *
 * - A text frame always starts a new transfer for that peer; any incomplete
 *   transfer is discarded (last metadata wins).
 * - A binary frame is the next chunk of the peer's active transfer.
 * - When received bytes >= declared size the buffers are concatenated in
 *   order into the final file and the transfer is cleared.
 * - A binary frame without active metadata is dropped.
 *
 * Thread Safety:
 * - Not thread-safe; the engine serializes access with its state mutex.
 */
class FileReassembler {
public:
    FileReassembler() = default;

    FileReassembler(const FileReassembler&) = delete;
    FileReassembler& operator=(const FileReassembler&) = delete;

    FrameResult onText(const std::string& peerId, const std::string& text);
    FrameResult onBinary(const std::string& peerId, const uint8_t* data, size_t size);

    /**
     * @brief Drop the peer's incomplete transfer without completing it
     * @return true if a transfer was discarded
     */
    bool discard(const std::string& peerId);

    /**
     * @brief Move a transfer to a new peer id (initiator identity resolution)
     */
    bool rekey(const std::string& oldId, const std::string& newId);

    void clear();

    bool hasTransfer(const std::string& peerId) const;
    size_t activeCount() const { return m_transfers.size(); }

    /**
     * @brief Bytes received so far for the peer's active transfer (0 if none)
     */
    uint64_t receivedBytes(const std::string& peerId) const;

private:
    struct InFlightTransfer {
        FileMetadata metadata;
        uint64_t receivedBytes = 0;
        std::vector<std::vector<uint8_t>> buffers;
        HashUtils::IncrementalHash hash;
    };

    static FrameResult complete(InFlightTransfer& transfer);

    std::unordered_map<std::string, InFlightTransfer> m_transfers;
};

}  // namespace PeerDrop
