/**
 * @file OfflineStore.cpp
 * @brief Local cache of downloaded files and uploads captured while offline
 */

#include "peerdrop/OfflineStore.h"
#include "peerdrop/AtomicFile.h"
#include "peerdrop/Debug.h"
#include "peerdrop/ErrorCodes.h"
#include "peerdrop/HashUtils.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <utility>

namespace PeerDrop {

namespace {

int64_t toMillis(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromMillis(int64_t ms)
{
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

std::filesystem::path blobPath(const std::filesystem::path& dir, const std::string& id)
{
    return dir / (id + ".bin");
}

std::string stringField(const nlohmann::json& j, const char* key)
{
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

int64_t intField(const nlohmann::json& j, const char* key)
{
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<int64_t>();
    }
    return 0;
}

std::string payloadDigest(const std::vector<uint8_t>& data)
{
    const std::vector<unsigned char> hash = HashUtils::computeBufferHash(data.data(), data.size());
    return HashUtils::hashToString(hash.data());
}

}  // namespace

OfflineStore::OfflineStore(std::filesystem::path rootDir)
    : m_rootDir(std::move(rootDir))
    , m_filesDir(m_rootDir / OFFLINE_FILES_DIR)
    , m_queueDir(m_rootDir / UPLOAD_QUEUE_DIR)
    , m_initialized(false)
    , m_filesIndex(nlohmann::json::object())
    , m_queueIndex(nlohmann::json::object())
{
}

bool OfflineStore::isValidId(const std::string& id)
{
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.';
    });
}

bool OfflineStore::initialize(std::string& errorMsg)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code ec;
    std::filesystem::create_directories(m_filesDir, ec);
    if (ec) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR,
                               "Failed to create " + m_filesDir.string() + ": " + ec.message());
        return false;
    }
    std::filesystem::create_directories(m_queueDir, ec);
    if (ec) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR,
                               "Failed to create " + m_queueDir.string() + ": " + ec.message());
        return false;
    }

    if (!loadIndex(m_filesDir, m_filesIndex, errorMsg) ||
        !loadIndex(m_queueDir, m_queueIndex, errorMsg)) {
        return false;
    }

    m_initialized = true;
    LOG_DEBUG("Offline store ready at " << m_rootDir.string() << " ("
              << m_filesIndex.size() << " files, " << m_queueIndex.size() << " queued)");
    return true;
}

bool OfflineStore::ensureInitialized(std::string& errorMsg) const
{
    if (!m_initialized) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR, "Offline store is not initialized");
        return false;
    }
    return true;
}

//=============================================================================
// Offline files
//=============================================================================

bool OfflineStore::saveOfflineFile(const OfflineFile& file, std::string& errorMsg)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureInitialized(errorMsg)) {
        return false;
    }

    nlohmann::json record;
    record["filename"] = file.filename;
    record["downloadedAt"] = toMillis(file.downloadedAt);
    record["shareToken"] = file.shareToken;
    record["size"] = static_cast<uint64_t>(file.data.size());

    return putBlob(m_filesDir, m_filesIndex, file.id, std::move(record), file.data, errorMsg);
}

bool OfflineStore::getOfflineFile(const std::string& id, OfflineFile& out, std::string& errorMsg) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureInitialized(errorMsg)) {
        return false;
    }

    auto it = m_filesIndex.find(id);
    if (it == m_filesIndex.end()) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR, "No offline file with id " + id);
        return false;
    }

    OfflineFile file;
    file.id = id;
    file.filename = stringField(*it, "filename");
    file.downloadedAt = fromMillis(intField(*it, "downloadedAt"));
    file.shareToken = stringField(*it, "shareToken");
    if (!readBlob(m_filesDir, id, stringField(*it, "sha256"), file.data, errorMsg)) {
        return false;
    }
    file.size = file.data.size();

    out = std::move(file);
    return true;
}

bool OfflineStore::getAllOfflineFiles(std::vector<OfflineFile>& out, std::string& errorMsg) const
{
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!ensureInitialized(errorMsg)) {
            return false;
        }
        for (auto it = m_filesIndex.begin(); it != m_filesIndex.end(); ++it) {
            ids.push_back(it.key());
        }
    }

    std::vector<OfflineFile> files;
    files.reserve(ids.size());
    for (const auto& id : ids) {
        OfflineFile file;
        if (!getOfflineFile(id, file, errorMsg)) {
            return false;
        }
        files.push_back(std::move(file));
    }

    out = std::move(files);
    return true;
}

bool OfflineStore::deleteOfflineFile(const std::string& id, std::string& errorMsg)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureInitialized(errorMsg)) {
        return false;
    }
    return eraseBlob(m_filesDir, m_filesIndex, id, errorMsg);
}

//=============================================================================
// Upload queue
//=============================================================================

bool OfflineStore::queueUpload(const QueuedUpload& upload, std::string& errorMsg)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureInitialized(errorMsg)) {
        return false;
    }

    nlohmann::json record;
    record["filename"] = upload.filename;
    record["queuedAt"] = toMillis(upload.queuedAt);
    record["size"] = static_cast<uint64_t>(upload.data.size());

    return putBlob(m_queueDir, m_queueIndex, upload.id, std::move(record), upload.data, errorMsg);
}

bool OfflineStore::getUploadQueue(std::vector<QueuedUpload>& out, std::string& errorMsg) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureInitialized(errorMsg)) {
        return false;
    }

    std::vector<QueuedUpload> queue;
    for (auto it = m_queueIndex.begin(); it != m_queueIndex.end(); ++it) {
        QueuedUpload upload;
        upload.id = it.key();
        upload.filename = stringField(it.value(), "filename");
        upload.queuedAt = fromMillis(intField(it.value(), "queuedAt"));
        if (!readBlob(m_queueDir, upload.id, stringField(it.value(), "sha256"), upload.data, errorMsg)) {
            return false;
        }
        upload.size = upload.data.size();
        queue.push_back(std::move(upload));
    }

    std::stable_sort(queue.begin(), queue.end(), [](const QueuedUpload& a, const QueuedUpload& b) {
        return a.queuedAt < b.queuedAt;
    });

    out = std::move(queue);
    return true;
}

bool OfflineStore::removeFromUploadQueue(const std::string& id, std::string& errorMsg)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureInitialized(errorMsg)) {
        return false;
    }
    return eraseBlob(m_queueDir, m_queueIndex, id, errorMsg);
}

bool OfflineStore::clearUploadQueue(std::string& errorMsg)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureInitialized(errorMsg)) {
        return false;
    }

    if (!saveIndex(m_queueDir, nlohmann::json::object(), errorMsg)) {
        return false;
    }

    std::error_code ec;
    for (auto it = m_queueIndex.begin(); it != m_queueIndex.end(); ++it) {
        std::filesystem::remove(blobPath(m_queueDir, it.key()), ec);
        if (ec) {
            LOG_WARNING("Failed to remove queued upload " << it.key() << ": " << ec.message());
        }
    }
    m_queueIndex = nlohmann::json::object();
    return true;
}

//=============================================================================
// Storage helpers (m_mutex held)
//=============================================================================

bool OfflineStore::putBlob(const std::filesystem::path& dir, nlohmann::json& index,
                           const std::string& id, nlohmann::json record,
                           const std::vector<uint8_t>& data, std::string& errorMsg)
{
    if (!isValidId(id)) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR, "Invalid record id: '" + id + "'");
        return false;
    }

    record["sha256"] = payloadDigest(data);

    std::string writeError;
    if (!writeFileAtomically(blobPath(dir, id), data.data(), data.size(), true, writeError)) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR, "Failed to store " + id + ": " + writeError);
        return false;
    }

    nlohmann::json updated = index;
    updated[id] = std::move(record);
    if (!saveIndex(dir, updated, errorMsg)) {
        return false;
    }
    index = std::move(updated);
    return true;
}

bool OfflineStore::readBlob(const std::filesystem::path& dir, const std::string& id,
                            const std::string& expectedDigest,
                            std::vector<uint8_t>& out, std::string& errorMsg) const
{
    const std::filesystem::path path = blobPath(dir, id);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR, "Missing payload for " + id);
        return false;
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR, "Failed to read payload for " + id);
        return false;
    }

    // Records written without a digest are returned unchecked
    if (!expectedDigest.empty() && payloadDigest(data) != expectedDigest) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR, "Payload for " + id + " is corrupt");
        return false;
    }
    out = std::move(data);
    return true;
}

bool OfflineStore::eraseBlob(const std::filesystem::path& dir, nlohmann::json& index,
                             const std::string& id, std::string& errorMsg)
{
    if (!index.contains(id)) {
        return true;
    }

    nlohmann::json updated = index;
    updated.erase(id);
    if (!saveIndex(dir, updated, errorMsg)) {
        return false;
    }
    index = std::move(updated);

    std::error_code ec;
    std::filesystem::remove(blobPath(dir, id), ec);
    if (ec) {
        LOG_WARNING("Failed to remove payload " << id << ": " << ec.message());
    }
    return true;
}

bool OfflineStore::loadIndex(const std::filesystem::path& dir, nlohmann::json& index, std::string& errorMsg)
{
    const std::filesystem::path path = dir / OFFLINE_INDEX_FILE;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        index = nlohmann::json::object();
        return true;
    }

    std::ifstream in(path);
    if (!in) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR, "Failed to open " + path.string());
        return false;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR, "Corrupt index " + path.string());
        return false;
    }

    // Drop entries that could not have been written by this store
    for (auto it = j.begin(); it != j.end();) {
        if (!isValidId(it.key()) || !it.value().is_object()) {
            LOG_WARNING("Ignoring invalid offline store entry '" << it.key() << "'");
            it = j.erase(it);
        } else {
            ++it;
        }
    }

    index = std::move(j);
    return true;
}

bool OfflineStore::saveIndex(const std::filesystem::path& dir, const nlohmann::json& index, std::string& errorMsg)
{
    std::string writeError;
    if (!writeFileAtomically(dir / OFFLINE_INDEX_FILE, index.dump(2), true, writeError)) {
        errorMsg = formatError(ErrorCodes::OFFLINE_STORE_ERROR, "Failed to write index: " + writeError);
        return false;
    }
    return true;
}

}  // namespace PeerDrop
