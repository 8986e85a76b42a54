/**
 * @file ReceivedFileSaver.h
 * @brief Background writer for files delivered by the transfer engine
 */

#pragma once

#include "OfflineStore.h"
#include "TransferEventBus.h"
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace PeerDrop {

/**
 * @brief Outcome of saving one received file
 */
struct SaveResult {
    std::string filename;          ///< Name the sender used
    std::string fromPeerId;
    std::string fromPeerDisplayName;
    std::string sha256Hex;
    uint64_t size = 0;
    bool success = false;
    std::filesystem::path savedPath;
    std::string errorMsg;
    bool cached = false;           ///< Also copied into the offline store
    std::string cacheError;        ///< Set when the offline copy failed
};

/**
 * @class ReceivedFileSaver
 * @brief Moves disk writes off the transport thread
 *
 * FileReceived handlers run on the transport's callback thread. They call
 * enqueue(), which only takes the queue lock; a single worker then writes
 * each file into the download directory (never overwriting) and, when an
 * offline store is configured, keeps a copy there.
 *
 * stop() saves everything already queued before the worker exits.
 *
 * Thread Safety:
 * - enqueue() and pendingCount() are thread-safe
 * - start(), stop() and setCompletionCallback() are NOT thread-safe
 */
class ReceivedFileSaver {
public:
    using CompletionCallback = std::function<void(const SaveResult& result)>;

    /**
     * @param downloadDir Directory received files are written to
     * @param store Optional offline cache (not owned, may be null)
     */
    explicit ReceivedFileSaver(std::filesystem::path downloadDir, OfflineStore* store = nullptr);

    /**
     * @brief Destructor - stops the worker, saving what is queued
     */
    ~ReceivedFileSaver();

    ReceivedFileSaver(const ReceivedFileSaver&) = delete;
    ReceivedFileSaver& operator=(const ReceivedFileSaver&) = delete;

    /**
     * @brief Called on the worker thread after each file
     */
    void setCompletionCallback(CompletionCallback callback) { m_completionCallback = std::move(callback); }

    /**
     * @return false if already running
     */
    bool start();

    /**
     * @brief Save the remaining queue, then join the worker
     */
    void stop();

    /**
     * @brief Queue a received file for saving
     * @return false if the saver is not running (the file is not queued)
     */
    bool enqueue(FileReceivedEvent event);

    /**
     * @brief Files queued or being written
     */
    size_t pendingCount() const;

    const std::filesystem::path& downloadDir() const { return m_downloadDir; }

    /**
     * @brief Write one file into a directory under a collision-free name
     *
     * Only the final component of the peer-supplied name is used; an empty
     * or dot name becomes "received.bin".
     */
    static bool saveToDirectory(const std::filesystem::path& downloadDir,
                                const TransferFile& file,
                                std::filesystem::path& savedPath,
                                std::string& errorMsg);

private:
    void workerThreadFunc();
    SaveResult save(const FileReceivedEvent& event);

    std::filesystem::path m_downloadDir;
    OfflineStore* m_store;
    CompletionCallback m_completionCallback;

    mutable std::mutex m_queueMutex;
    std::condition_variable m_queueCV;
    std::queue<FileReceivedEvent> m_queue;
    size_t m_active;
    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
    std::thread m_workerThread;
};

}  // namespace PeerDrop
