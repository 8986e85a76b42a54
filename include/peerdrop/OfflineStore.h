/**
 * @file OfflineStore.h
 * @brief Local cache of downloaded files and uploads captured while offline
 */

#pragma once

#include "config.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace PeerDrop {

/**
 * @brief A downloaded file kept for offline access
 */
struct OfflineFile {
    std::string id;
    std::string filename;
    std::vector<uint8_t> data;
    std::chrono::system_clock::time_point downloadedAt;
    std::string shareToken;     ///< Cloud share token the file came from (may be empty)
    uint64_t size = 0;
};

/**
 * @brief An upload captured while disconnected, waiting to be sent
 */
struct QueuedUpload {
    std::string id;
    std::string filename;
    std::vector<uint8_t> data;
    std::chrono::system_clock::time_point queuedAt;
    uint64_t size = 0;
};

/**
 * @class OfflineStore
 * @brief Directory-backed keyed blob store plus upload queue
 *
 * Layout under the root directory:
 * - offlineFiles/index.json  record metadata keyed by id
 * - offlineFiles/<id>.bin    payload
 * - uploadQueue/index.json
 * - uploadQueue/<id>.bin
 *
 * Index files are rewritten atomically (temp file then rename). Putting a
 * record with an existing id replaces it. Each record keeps the SHA-256 of
 * its payload; a payload that no longer matches fails to load.
 *
 * Thread Safety:
 * - All public methods are thread-safe (one internal mutex)
 */
class OfflineStore {
public:
    explicit OfflineStore(std::filesystem::path rootDir);

    OfflineStore(const OfflineStore&) = delete;
    OfflineStore& operator=(const OfflineStore&) = delete;

    /**
     * @brief Create the directories and load both indexes
     */
    bool initialize(std::string& errorMsg);

    //=========================================================================
    // Offline files
    //=========================================================================

    bool saveOfflineFile(const OfflineFile& file, std::string& errorMsg);

    /**
     * @return false if no file has this id or its payload cannot be read
     */
    bool getOfflineFile(const std::string& id, OfflineFile& out, std::string& errorMsg) const;

    bool getAllOfflineFiles(std::vector<OfflineFile>& out, std::string& errorMsg) const;

    /**
     * @brief Delete a file (deleting an unknown id succeeds)
     */
    bool deleteOfflineFile(const std::string& id, std::string& errorMsg);

    //=========================================================================
    // Upload queue
    //=========================================================================

    bool queueUpload(const QueuedUpload& upload, std::string& errorMsg);

    /**
     * @brief All queued uploads, oldest first
     */
    bool getUploadQueue(std::vector<QueuedUpload>& out, std::string& errorMsg) const;

    bool removeFromUploadQueue(const std::string& id, std::string& errorMsg);
    bool clearUploadQueue(std::string& errorMsg);

    const std::filesystem::path& rootDir() const { return m_rootDir; }

    /**
     * @brief Ids may only contain letters, digits, '-', '_' and '.'
     */
    static bool isValidId(const std::string& id);

private:
    bool ensureInitialized(std::string& errorMsg) const;

    bool putBlob(const std::filesystem::path& dir, nlohmann::json& index,
                 const std::string& id, nlohmann::json record,
                 const std::vector<uint8_t>& data, std::string& errorMsg);
    bool readBlob(const std::filesystem::path& dir, const std::string& id,
                  const std::string& expectedDigest,
                  std::vector<uint8_t>& out, std::string& errorMsg) const;
    bool eraseBlob(const std::filesystem::path& dir, nlohmann::json& index,
                   const std::string& id, std::string& errorMsg);

    static bool loadIndex(const std::filesystem::path& dir, nlohmann::json& index, std::string& errorMsg);
    static bool saveIndex(const std::filesystem::path& dir, const nlohmann::json& index, std::string& errorMsg);

    std::filesystem::path m_rootDir;
    std::filesystem::path m_filesDir;
    std::filesystem::path m_queueDir;

    mutable std::mutex m_mutex;
    bool m_initialized;
    nlohmann::json m_filesIndex;
    nlohmann::json m_queueIndex;
};

}  // namespace PeerDrop
