/**
 * @file CloudChunkPipeline.h
 * @brief Chunked upload / download against an object-storage service
 *
 * Separate from the peer-to-peer path: files are split into large named
 * blobs ("{fileRecordId}/chunk_{n}"), each tracked by a status record, and
 * the parent record expires CLOUD_EXPIRY_DAYS after creation.
 */

#pragma once

#include "config.h"
#include "FileTransfer.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace PeerDrop {

/**
 * @brief Parent record of a shared file
 */
struct SharedFileRecord {
    std::string id;
    std::string filename;
    uint64_t fileSize = 0;
    uint32_t totalChunks = 0;
    std::string mimeType;
    std::string uploadStatus = CLOUD_STATUS_PENDING;
    std::string shareToken;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point expiresAt;
};

/**
 * @brief Status record of one stored chunk
 */
struct CloudChunkRecord {
    std::string fileRecordId;
    uint32_t chunkNumber = 0;
    uint64_t chunkSize = 0;
    std::string storagePath;
    std::string uploadStatus = CLOUD_STATUS_PENDING;
};

/**
 * @brief Storage service seam: blob bucket plus the two record tables
 *
 * Implementations report failures through errorMsg; the pipeline decides
 * whether to retry.
 */
class ObjectStorageBackend {
public:
    virtual ~ObjectStorageBackend() = default;

    virtual bool insertFileRecord(const SharedFileRecord& record, std::string& errorMsg) = 0;
    virtual bool getFileRecord(const std::string& fileRecordId, SharedFileRecord& out, std::string& errorMsg) = 0;
    virtual bool updateFileStatus(const std::string& fileRecordId, const std::string& status, std::string& errorMsg) = 0;

    /// Insert or replace the record for (fileRecordId, chunkNumber)
    virtual bool putChunkRecord(const CloudChunkRecord& record, std::string& errorMsg) = 0;
    virtual bool listChunkRecords(const std::string& fileRecordId,
                                  std::vector<CloudChunkRecord>& out,
                                  std::string& errorMsg) = 0;

    virtual bool uploadBlob(const std::string& storagePath, const uint8_t* data, size_t size,
                            std::string& errorMsg) = 0;
    virtual bool downloadBlob(const std::string& storagePath, std::vector<uint8_t>& out,
                              std::string& errorMsg) = 0;
};

/**
 * @brief Pipeline tuning (defaults from config.h)
 */
struct CloudPipelineOptions {
    uint64_t chunkSize = CLOUD_CHUNK_SIZE;
    int maxAttempts = CLOUD_MAX_ATTEMPTS;
    std::chrono::milliseconds retryBackoff{CLOUD_RETRY_BACKOFF_MS};

    /// Sleeps between attempts; tests replace it to avoid real delays
    std::function<void(std::chrono::milliseconds)> sleeper;
};

/**
 * @brief Called after each chunk with completed / total chunk counts
 */
using ChunkProgressCallback = std::function<void(uint32_t completedChunks, uint32_t totalChunks)>;

/**
 * @class CloudChunkPipeline
 * @brief Sequential chunk upload with per-chunk retry, ordered download
 *
 * Upload:
 * 1. Insert the parent record (status "uploading", expiry now + 7 days)
 * 2. For each chunk in order: record "pending", then "uploading", then
 *    upload the blob up to maxAttempts times with a fixed backoff
 * 3. Record the chunk "completed", or "failed" and mark the parent failed
 * 4. Mark the parent "completed" once every chunk succeeded
 *
 * Download lists the chunk records, orders them by chunk number and
 * concatenates the blobs.
 */
class CloudChunkPipeline {
public:
    explicit CloudChunkPipeline(ObjectStorageBackend& backend,
                                CloudPipelineOptions options = CloudPipelineOptions());

    CloudChunkPipeline(const CloudChunkPipeline&) = delete;
    CloudChunkPipeline& operator=(const CloudChunkPipeline&) = delete;

    bool upload(const TransferFile& file,
                SharedFileRecord& outRecord,
                std::string& errorMsg,
                ChunkProgressCallback progress = nullptr);

    bool download(const std::string& fileRecordId,
                  TransferFile& out,
                  std::string& errorMsg,
                  ChunkProgressCallback progress = nullptr);

    /**
     * @brief Number of chunks a file of fileSize bytes is split into
     */
    static uint32_t chunkCount(uint64_t fileSize, uint64_t chunkSize);

    /**
     * @brief Storage path of one chunk: "{fileRecordId}/chunk_{n}"
     */
    static std::string chunkPath(const std::string& fileRecordId, uint32_t chunkNumber);

    /**
     * @brief True once now has reached the record's expiry time
     */
    static bool isExpired(const SharedFileRecord& record,
                          std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    bool uploadChunkWithRetry(const CloudChunkRecord& record, const uint8_t* data, size_t size,
                              std::string& errorMsg);
    void markFailed(const std::string& fileRecordId, CloudChunkRecord* chunk);

    ObjectStorageBackend& m_backend;
    CloudPipelineOptions m_options;
};

}  // namespace PeerDrop
