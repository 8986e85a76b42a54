/**
 * @file CloudChunkPipeline.cpp
 * @brief Chunked upload / download against an object-storage service
 */

#include "peerdrop/CloudChunkPipeline.h"
#include "peerdrop/Debug.h"
#include "peerdrop/ErrorCodes.h"
#include "peerdrop/ThreadSafeLog.h"
#include "peerdrop/UuidGenerator.h"

#include <algorithm>
#include <thread>
#include <utility>

namespace PeerDrop {

CloudChunkPipeline::CloudChunkPipeline(ObjectStorageBackend& backend, CloudPipelineOptions options)
    : m_backend(backend)
    , m_options(std::move(options))
{
    if (m_options.chunkSize == 0) {
        m_options.chunkSize = CLOUD_CHUNK_SIZE;
    }
    if (m_options.maxAttempts < 1) {
        m_options.maxAttempts = 1;
    }
    if (!m_options.sleeper) {
        m_options.sleeper = [](std::chrono::milliseconds delay) {
            std::this_thread::sleep_for(delay);
        };
    }
}

uint32_t CloudChunkPipeline::chunkCount(uint64_t fileSize, uint64_t chunkSize)
{
    if (chunkSize == 0) {
        return 0;
    }
    return static_cast<uint32_t>((fileSize + chunkSize - 1) / chunkSize);
}

std::string CloudChunkPipeline::chunkPath(const std::string& fileRecordId, uint32_t chunkNumber)
{
    return fileRecordId + "/chunk_" + std::to_string(chunkNumber);
}

bool CloudChunkPipeline::isExpired(const SharedFileRecord& record,
                                   std::chrono::system_clock::time_point now)
{
    return now >= record.expiresAt;
}

//=============================================================================
// Upload
//=============================================================================

bool CloudChunkPipeline::upload(const TransferFile& file,
                                SharedFileRecord& outRecord,
                                std::string& errorMsg,
                                ChunkProgressCallback progress)
{
    SharedFileRecord record;
    record.id = UuidGenerator::generate();
    record.shareToken = UuidGenerator::generateToken();
    if (record.id.empty() || record.shareToken.empty()) {
        errorMsg = formatError(ErrorCodes::CLOUD_UPLOAD_FAILED, "Failed to generate record identifiers");
        return false;
    }
    record.filename = file.name;
    record.fileSize = file.size();
    record.totalChunks = chunkCount(record.fileSize, m_options.chunkSize);
    record.mimeType = file.mimeType.empty() ? std::string(DEFAULT_MIME_TYPE) : file.mimeType;
    record.uploadStatus = CLOUD_STATUS_UPLOADING;
    record.createdAt = std::chrono::system_clock::now();
    record.expiresAt = record.createdAt + std::chrono::hours(24 * CLOUD_EXPIRY_DAYS);

    std::string backendError;
    if (!m_backend.insertFileRecord(record, backendError)) {
        errorMsg = formatError(ErrorCodes::CLOUD_UPLOAD_FAILED,
                               "Failed to create file record: " + backendError);
        return false;
    }

    LOG_INFO("Uploading '" << record.filename << "' as " << record.id << " in "
             << record.totalChunks << " chunk(s)");

    for (uint32_t i = 0; i < record.totalChunks; ++i) {
        const uint64_t offset = static_cast<uint64_t>(i) * m_options.chunkSize;
        const size_t size = static_cast<size_t>(std::min<uint64_t>(m_options.chunkSize,
                                                                   record.fileSize - offset));

        CloudChunkRecord chunk;
        chunk.fileRecordId = record.id;
        chunk.chunkNumber = i;
        chunk.chunkSize = size;
        chunk.storagePath = chunkPath(record.id, i);
        chunk.uploadStatus = CLOUD_STATUS_PENDING;

        if (!m_backend.putChunkRecord(chunk, backendError)) {
            errorMsg = formatError(ErrorCodes::CLOUD_UPLOAD_FAILED,
                                   "Failed to record chunk " + std::to_string(i) + ": " + backendError);
            markFailed(record.id, nullptr);
            return false;
        }

        if (!uploadChunkWithRetry(chunk, file.data.data() + offset, size, errorMsg)) {
            markFailed(record.id, &chunk);
            ThreadSafeLog::log("Cloud upload of " + record.id + " failed: " + errorMsg);
            return false;
        }

        chunk.uploadStatus = CLOUD_STATUS_COMPLETED;
        if (!m_backend.putChunkRecord(chunk, backendError)) {
            errorMsg = formatError(ErrorCodes::CLOUD_UPLOAD_FAILED,
                                   "Failed to record chunk " + std::to_string(i) + ": " + backendError);
            markFailed(record.id, nullptr);
            return false;
        }

        if (progress) {
            progress(i + 1, record.totalChunks);
        }
    }

    if (!m_backend.updateFileStatus(record.id, CLOUD_STATUS_COMPLETED, backendError)) {
        errorMsg = formatError(ErrorCodes::CLOUD_UPLOAD_FAILED,
                               "Failed to complete file record: " + backendError);
        return false;
    }
    record.uploadStatus = CLOUD_STATUS_COMPLETED;

    outRecord = std::move(record);
    return true;
}

bool CloudChunkPipeline::uploadChunkWithRetry(const CloudChunkRecord& record,
                                              const uint8_t* data,
                                              size_t size,
                                              std::string& errorMsg)
{
    CloudChunkRecord uploading = record;
    uploading.uploadStatus = CLOUD_STATUS_UPLOADING;

    std::string lastError;
    for (int attempt = 1; attempt <= m_options.maxAttempts; ++attempt) {
        if (!m_backend.putChunkRecord(uploading, lastError)) {
            LOG_WARNING("Chunk " << record.storagePath << " status update failed: " << lastError);
        } else if (m_backend.uploadBlob(record.storagePath, data, size, lastError)) {
            return true;
        } else {
            LOG_WARNING("Chunk " << record.storagePath << " attempt " << attempt << "/"
                        << m_options.maxAttempts << " failed: " << lastError);
        }

        if (attempt < m_options.maxAttempts) {
            m_options.sleeper(m_options.retryBackoff);
        }
    }

    errorMsg = formatError(ErrorCodes::CLOUD_UPLOAD_FAILED,
                           "Chunk " + record.storagePath + " failed after " +
                           std::to_string(m_options.maxAttempts) + " attempts: " + lastError);
    return false;
}

void CloudChunkPipeline::markFailed(const std::string& fileRecordId, CloudChunkRecord* chunk)
{
    std::string backendError;
    if (chunk) {
        chunk->uploadStatus = CLOUD_STATUS_FAILED;
        if (!m_backend.putChunkRecord(*chunk, backendError)) {
            LOG_WARNING("Failed to mark chunk " << chunk->storagePath << " failed: " << backendError);
        }
    }
    if (!m_backend.updateFileStatus(fileRecordId, CLOUD_STATUS_FAILED, backendError)) {
        LOG_WARNING("Failed to mark record " << fileRecordId << " failed: " << backendError);
    }
}

//=============================================================================
// Download
//=============================================================================

bool CloudChunkPipeline::download(const std::string& fileRecordId,
                                  TransferFile& out,
                                  std::string& errorMsg,
                                  ChunkProgressCallback progress)
{
    std::string backendError;
    SharedFileRecord record;
    if (!m_backend.getFileRecord(fileRecordId, record, backendError)) {
        errorMsg = formatError(ErrorCodes::CLOUD_DOWNLOAD_FAILED,
                               "Unknown file record " + fileRecordId + ": " + backendError);
        return false;
    }
    if (record.uploadStatus != CLOUD_STATUS_COMPLETED) {
        errorMsg = formatError(ErrorCodes::CLOUD_DOWNLOAD_FAILED,
                               "File " + fileRecordId + " is not available (status " +
                               record.uploadStatus + ")");
        return false;
    }
    if (isExpired(record)) {
        errorMsg = formatError(ErrorCodes::CLOUD_DOWNLOAD_FAILED, "File " + fileRecordId + " has expired");
        return false;
    }

    std::vector<CloudChunkRecord> chunks;
    if (!m_backend.listChunkRecords(fileRecordId, chunks, backendError)) {
        errorMsg = formatError(ErrorCodes::CLOUD_DOWNLOAD_FAILED,
                               "Failed to list chunks: " + backendError);
        return false;
    }

    std::sort(chunks.begin(), chunks.end(), [](const CloudChunkRecord& a, const CloudChunkRecord& b) {
        return a.chunkNumber < b.chunkNumber;
    });

    if (chunks.size() != record.totalChunks) {
        errorMsg = formatError(ErrorCodes::CLOUD_DOWNLOAD_FAILED,
                               "Expected " + std::to_string(record.totalChunks) + " chunks, found " +
                               std::to_string(chunks.size()));
        return false;
    }

    TransferFile file;
    file.name = record.filename;
    file.mimeType = record.mimeType;
    file.data.reserve(static_cast<size_t>(record.fileSize));

    const uint32_t total = static_cast<uint32_t>(chunks.size());
    for (uint32_t i = 0; i < total; ++i) {
        std::vector<uint8_t> blob;
        if (!m_backend.downloadBlob(chunks[i].storagePath, blob, backendError)) {
            errorMsg = formatError(ErrorCodes::CLOUD_DOWNLOAD_FAILED,
                                   "Failed to download " + chunks[i].storagePath + ": " + backendError);
            return false;
        }
        file.data.insert(file.data.end(), blob.begin(), blob.end());

        if (progress) {
            progress(i + 1, total);
        }
    }

    if (file.size() != record.fileSize) {
        errorMsg = formatError(ErrorCodes::CLOUD_DOWNLOAD_FAILED,
                               "Size mismatch: assembled " + std::to_string(file.size()) +
                               " bytes, expected " + std::to_string(record.fileSize));
        return false;
    }

    out = std::move(file);
    return true;
}

}  // namespace PeerDrop
