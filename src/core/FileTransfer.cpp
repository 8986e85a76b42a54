/**
 * @file FileTransfer.cpp
 * @brief Chunked file transfer protocol implementation
 */

#include "peerdrop/FileTransfer.h"
#include "peerdrop/Debug.h"
#include "peerdrop/ErrorCodes.h"
#include "peerdrop/ThreadSafeLog.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <thread>
#include <utility>

namespace PeerDrop {

using json = nlohmann::json;

//=============================================================================
// FileMetadata
//=============================================================================

std::string FileMetadata::toJson() const
{
    json j;
    j["name"] = name;
    j["size"] = size;
    j["type"] = mimeType;
    return j.dump();
}

bool FileMetadata::parse(const std::string& text, FileMetadata& out, std::string& errorMsg)
{
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        errorMsg = "Metadata frame is not a JSON object";
        return false;
    }

    auto nameIt = j.find("name");
    auto sizeIt = j.find("size");
    auto typeIt = j.find("type");

    if (nameIt == j.end() || !nameIt->is_string()) {
        errorMsg = "Metadata frame is missing string field 'name'";
        return false;
    }
    if (sizeIt == j.end() || !sizeIt->is_number_unsigned()) {
        errorMsg = "Metadata frame is missing unsigned field 'size'";
        return false;
    }
    if (typeIt == j.end() || !typeIt->is_string()) {
        errorMsg = "Metadata frame is missing string field 'type'";
        return false;
    }

    FileMetadata parsed;
    parsed.name = nameIt->get<std::string>();
    parsed.size = sizeIt->get<uint64_t>();
    parsed.mimeType = typeIt->get<std::string>();

    if (parsed.name.length() > MAX_FILENAME_LENGTH) {
        errorMsg = "Filename too long (max " +
                   std::to_string(MAX_FILENAME_LENGTH) + " characters)";
        return false;
    }

    out = std::move(parsed);
    return true;
}

std::string guessMimeType(const std::string& filename)
{
    static const std::pair<const char*, const char*> kTypes[] = {
        {"txt", "text/plain"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"csv", "text/csv"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
    };

    size_t dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= filename.size()) {
        return DEFAULT_MIME_TYPE;
    }

    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : kTypes) {
        if (ext == entry.first) {
            return entry.second;
        }
    }
    return DEFAULT_MIME_TYPE;
}

//=============================================================================
// FileSender Implementation
//=============================================================================

FileSender::FileSender(const SendOptions& options)
    : m_options(options)
    , m_bytesSent(0)
    , m_framesSent(0)
{
    if (m_options.frameSize == 0) {
        m_options.frameSize = FRAME_SIZE;
    }
}

bool FileSender::sendBuffer(DataChannel& channel,
                            const TransferFile& file,
                            std::string& errorMsg,
                            SendProgressCallback progress)
{
    FileMetadata metadata;
    metadata.name = file.name;
    metadata.size = file.size();
    metadata.mimeType = file.mimeType.empty() ? std::string(DEFAULT_MIME_TYPE) : file.mimeType;

    if (!begin(channel, metadata, errorMsg)) {
        return false;
    }

    const uint8_t* data = file.data.data();
    uint64_t offset = 0;
    while (offset < metadata.size) {
        size_t frameLen = static_cast<size_t>(
            std::min<uint64_t>(m_options.frameSize, metadata.size - offset));
        if (!sendFrame(channel, data + offset, frameLen, metadata.size, errorMsg, progress)) {
            return false;
        }
        offset += frameLen;
    }

    return finish(metadata, errorMsg);
}

bool FileSender::sendFile(DataChannel& channel,
                          const std::string& filePath,
                          std::string& errorMsg,
                          SendProgressCallback progress)
{
    std::error_code ec;
    const std::filesystem::path path(filePath);
    if (!std::filesystem::is_regular_file(path, ec)) {
        errorMsg = formatError(ErrorCodes::FILE_READ_ERROR, "Not a regular file: " + filePath);
        return false;
    }

    uint64_t fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        errorMsg = formatError(ErrorCodes::FILE_READ_ERROR,
                               "Failed to stat file: " + filePath + " (" + ec.message() + ")");
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        errorMsg = formatError(ErrorCodes::FILE_READ_ERROR, "Failed to open file: " + filePath);
        return false;
    }

    // Increase file stream buffering for large sequential reads
    std::vector<char> fileIoBuffer(FILE_READ_BUFFER_SIZE);
    (void)file.rdbuf()->pubsetbuf(fileIoBuffer.data(), static_cast<std::streamsize>(fileIoBuffer.size()));

    FileMetadata metadata;
    metadata.name = path.filename().string();
    metadata.size = fileSize;
    metadata.mimeType = guessMimeType(metadata.name);

    if (!begin(channel, metadata, errorMsg)) {
        return false;
    }

    std::vector<uint8_t> buffer(m_options.frameSize);
    uint64_t totalRead = 0;

    while (totalRead < fileSize) {
        size_t want = static_cast<size_t>(
            std::min<uint64_t>(m_options.frameSize, fileSize - totalRead));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        std::streamsize bytesRead = file.gcount();

        if (bytesRead <= 0) {
            break;
        }

        if (!sendFrame(channel, buffer.data(), static_cast<size_t>(bytesRead),
                       fileSize, errorMsg, progress)) {
            return false;
        }
        totalRead += static_cast<uint64_t>(bytesRead);
    }

    if (file.bad()) {
        errorMsg = formatError(ErrorCodes::FILE_READ_ERROR, "Error reading file: " + filePath);
        return false;
    }

    // The receiver completes on byte count, so a short read would leave it waiting
    if (totalRead != fileSize) {
        errorMsg = formatError(ErrorCodes::FILE_READ_ERROR,
                               "Size mismatch: read " + std::to_string(totalRead) +
                               " but file size is " + std::to_string(fileSize));
        return false;
    }

    return finish(metadata, errorMsg);
}

bool FileSender::begin(DataChannel& channel, const FileMetadata& metadata, std::string& errorMsg)
{
    m_bytesSent = 0;
    m_framesSent = 0;
    m_sha256HashString.clear();

    if (metadata.name.length() > MAX_FILENAME_LENGTH) {
        errorMsg = formatError(ErrorCodes::SEND_FAILED,
                               "Filename too long (max " +
                               std::to_string(MAX_FILENAME_LENGTH) + " characters)");
        return false;
    }

    if (!m_incrementalHash.reset()) {
        errorMsg = formatError(ErrorCodes::SEND_FAILED, "Failed to initialize hash context");
        return false;
    }

    if (!channel.isOpen()) {
        errorMsg = formatError(ErrorCodes::PEER_NOT_CONNECTED, "Data channel is not open");
        return false;
    }

    std::string sendError;
    if (!channel.sendText(metadata.toJson(), sendError)) {
        errorMsg = formatError(ErrorCodes::SEND_FAILED, "Failed to send metadata frame: " + sendError);
        return false;
    }

    LOG_DEBUG("Sent metadata for '" << metadata.name << "' (" << metadata.size
              << " bytes, " << metadata.mimeType << ")");
    return true;
}

bool FileSender::waitForDrain(DataChannel& channel, std::string& errorMsg)
{
    while (channel.bufferedAmount() > m_options.highWaterMark) {
        if (!channel.isOpen()) {
            errorMsg = formatError(ErrorCodes::SEND_FAILED,
                                   "Data channel closed while waiting for buffer to drain");
            return false;
        }
        std::this_thread::sleep_for(m_options.pollInterval);
    }
    return true;
}

bool FileSender::sendFrame(DataChannel& channel, const uint8_t* data, size_t size,
                           uint64_t totalBytes, std::string& errorMsg,
                           const SendProgressCallback& progress)
{
    if (!waitForDrain(channel, errorMsg)) {
        return false;
    }

    std::string sendError;
    if (!channel.sendBinary(data, size, sendError)) {
        errorMsg = formatError(ErrorCodes::SEND_FAILED,
                               "Failed to send frame " + std::to_string(m_framesSent) +
                               " at offset " + std::to_string(m_bytesSent) + ": " + sendError);
        return false;
    }

    if (!m_incrementalHash.update(data, size)) {
        errorMsg = formatError(ErrorCodes::SEND_FAILED, "Failed to update hash");
        return false;
    }

    m_bytesSent += size;
    ++m_framesSent;

    if (progress) {
        progress(m_bytesSent, totalBytes);
    }
    return true;
}

bool FileSender::finish(const FileMetadata& metadata, std::string& errorMsg)
{
    m_sha256HashString = m_incrementalHash.finalizeHex();
    if (m_sha256HashString.empty()) {
        errorMsg = formatError(ErrorCodes::SEND_FAILED, "Failed to finalize hash");
        return false;
    }

    LOG_INFO("Sent '" << metadata.name << "' in " << m_framesSent << " frames, sha256="
             << m_sha256HashString);
    return true;
}

//=============================================================================
// FileReassembler Implementation
//=============================================================================

FrameResult FileReassembler::onText(const std::string& peerId, const std::string& text)
{
    FrameResult result;

    auto existing = m_transfers.find(peerId);
    if (existing != m_transfers.end()) {
        LOG_WARNING("Discarding incomplete transfer '" << existing->second.metadata.name
                    << "' from " << peerId << " (" << existing->second.receivedBytes
                    << "/" << existing->second.metadata.size << " bytes)");
        m_transfers.erase(existing);
    }

    FileMetadata metadata;
    if (!FileMetadata::parse(text, metadata, result.errorMsg)) {
        result.outcome = FrameOutcome::MetadataInvalid;
        LOG_WARNING("Invalid metadata frame from " << peerId << ": " << result.errorMsg);
        ThreadSafeLog::log("Invalid metadata frame from " + peerId + ": " + result.errorMsg);
        return result;
    }

    InFlightTransfer transfer;
    transfer.metadata = metadata;

    result.filename = metadata.name;
    result.totalBytes = metadata.size;

    // Zero-byte file: nothing will follow, complete now
    if (metadata.size == 0) {
        return complete(transfer);
    }

    result.outcome = FrameOutcome::MetadataStarted;
    m_transfers.emplace(peerId, std::move(transfer));
    LOG_DEBUG("Receiving '" << metadata.name << "' (" << metadata.size << " bytes) from " << peerId);
    return result;
}

FrameResult FileReassembler::onBinary(const std::string& peerId, const uint8_t* data, size_t size)
{
    FrameResult result;

    auto it = m_transfers.find(peerId);
    if (it == m_transfers.end()) {
        result.outcome = FrameOutcome::OrphanDropped;
        result.bytesReceived = size;
        LOG_WARNING("Dropping " << size << "-byte frame from " << peerId
                    << ": no active transfer");
        ThreadSafeLog::log("Dropped orphaned frame from " + peerId +
                           " (" + std::to_string(size) + " bytes)");
        return result;
    }

    InFlightTransfer& transfer = it->second;
    transfer.buffers.emplace_back(data, data + size);
    transfer.receivedBytes += size;
    if (!transfer.hash.update(data, size)) {
        LOG_WARNING("Failed to update digest for '" << transfer.metadata.name << "'");
    }

    if (transfer.receivedBytes >= transfer.metadata.size) {
        FrameResult done = complete(transfer);
        m_transfers.erase(it);
        return done;
    }

    result.outcome = FrameOutcome::ChunkAccepted;
    result.filename = transfer.metadata.name;
    result.bytesReceived = transfer.receivedBytes;
    result.totalBytes = transfer.metadata.size;
    return result;
}

FrameResult FileReassembler::complete(InFlightTransfer& transfer)
{
    FrameResult result;
    result.outcome = FrameOutcome::TransferCompleted;
    result.filename = transfer.metadata.name;
    result.bytesReceived = transfer.receivedBytes;
    result.totalBytes = transfer.metadata.size;

    if (transfer.receivedBytes > transfer.metadata.size) {
        LOG_WARNING("'" << transfer.metadata.name << "' overran its declared size ("
                    << transfer.receivedBytes << " > " << transfer.metadata.size << ")");
    }

    result.file.name = transfer.metadata.name;
    result.file.mimeType = transfer.metadata.mimeType;
    result.file.data.reserve(static_cast<size_t>(transfer.receivedBytes));
    for (const auto& buffer : transfer.buffers) {
        result.file.data.insert(result.file.data.end(), buffer.begin(), buffer.end());
    }
    transfer.buffers.clear();

    result.sha256Hex = transfer.hash.finalizeHex();
    return result;
}

bool FileReassembler::discard(const std::string& peerId)
{
    auto it = m_transfers.find(peerId);
    if (it == m_transfers.end()) {
        return false;
    }
    LOG_INFO("Discarding incomplete transfer '" << it->second.metadata.name
             << "' from " << peerId);
    m_transfers.erase(it);
    return true;
}

bool FileReassembler::rekey(const std::string& oldId, const std::string& newId)
{
    if (oldId == newId) {
        return m_transfers.count(oldId) != 0;
    }
    auto it = m_transfers.find(oldId);
    if (it == m_transfers.end()) {
        return false;
    }
    InFlightTransfer moved = std::move(it->second);
    m_transfers.erase(it);
    m_transfers[newId] = std::move(moved);
    return true;
}

void FileReassembler::clear()
{
    m_transfers.clear();
}

bool FileReassembler::hasTransfer(const std::string& peerId) const
{
    return m_transfers.count(peerId) != 0;
}

uint64_t FileReassembler::receivedBytes(const std::string& peerId) const
{
    auto it = m_transfers.find(peerId);
    return it == m_transfers.end() ? 0 : it->second.receivedBytes;
}

}  // namespace PeerDrop
