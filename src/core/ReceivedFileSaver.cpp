/**
 * @file ReceivedFileSaver.cpp
 * @brief Background writer for files delivered by the transfer engine
 */

#include "peerdrop/ReceivedFileSaver.h"
#include "peerdrop/AtomicFile.h"
#include "peerdrop/Debug.h"
#include "peerdrop/ErrorCodes.h"
#include "peerdrop/ThreadSafeLog.h"
#include "peerdrop/UuidGenerator.h"

#include <chrono>
#include <utility>

namespace PeerDrop {

ReceivedFileSaver::ReceivedFileSaver(std::filesystem::path downloadDir, OfflineStore* store)
    : m_downloadDir(std::move(downloadDir))
    , m_store(store)
    , m_active(0)
    , m_running(false)
    , m_stopRequested(false)
{
}

ReceivedFileSaver::~ReceivedFileSaver()
{
    if (m_running.load()) {
        stop();
    }
}

//=============================================================================
// Lifecycle
//=============================================================================

bool ReceivedFileSaver::start()
{
    if (m_running.load()) {
        return false;
    }

    m_stopRequested.store(false);
    m_running.store(true);
    m_workerThread = std::thread(&ReceivedFileSaver::workerThreadFunc, this);
    return true;
}

void ReceivedFileSaver::stop()
{
    if (!m_running.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_stopRequested.store(true);
    }
    m_queueCV.notify_all();

    if (m_workerThread.joinable()) {
        m_workerThread.join();
    }
    m_running.store(false);
}

bool ReceivedFileSaver::enqueue(FileReceivedEvent event)
{
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (!m_running.load() || m_stopRequested.load()) {
            return false;
        }
        m_queue.push(std::move(event));
    }
    m_queueCV.notify_one();
    return true;
}

size_t ReceivedFileSaver::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_queue.size() + m_active;
}

//=============================================================================
// Worker
//=============================================================================

void ReceivedFileSaver::workerThreadFunc()
{
    while (true) {
        FileReceivedEvent event;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_queueCV.wait(lock, [&] {
                return !m_queue.empty() || m_stopRequested.load();
            });

            // Drain before exiting: these files were already delivered
            if (m_queue.empty()) {
                break;
            }

            event = std::move(m_queue.front());
            m_queue.pop();
            ++m_active;
        }

        SaveResult result = save(event);

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            --m_active;
        }

        if (m_completionCallback) {
            m_completionCallback(result);
        }
    }
}

SaveResult ReceivedFileSaver::save(const FileReceivedEvent& event)
{
    SaveResult result;
    result.filename = event.file.name;
    result.fromPeerId = event.fromPeerId;
    result.fromPeerDisplayName = event.fromPeerDisplayName;
    result.sha256Hex = event.sha256Hex;
    result.size = event.file.size();

    result.success = saveToDirectory(m_downloadDir, event.file, result.savedPath, result.errorMsg);
    if (!result.success) {
        LOG_ERROR("Failed to save '" << event.file.name << "': " << result.errorMsg);
        ThreadSafeLog::log("Save failed for '" + event.file.name + "': " + result.errorMsg);
        return result;
    }
    ThreadSafeLog::log("Saved '" + event.file.name + "' from " + event.fromPeerId +
                       " to " + result.savedPath.string());

    if (m_store) {
        OfflineFile cached;
        cached.id = UuidGenerator::generate();
        cached.filename = event.file.name;
        cached.data = event.file.data;
        cached.downloadedAt = std::chrono::system_clock::now();
        cached.size = event.file.size();
        result.cached = m_store->saveOfflineFile(cached, result.cacheError);
        if (!result.cached) {
            LOG_WARNING("Offline copy of '" << event.file.name << "' failed: " << result.cacheError);
        }
    }
    return result;
}

bool ReceivedFileSaver::saveToDirectory(const std::filesystem::path& downloadDir,
                                        const TransferFile& file,
                                        std::filesystem::path& savedPath,
                                        std::string& errorMsg)
{
    std::error_code ec;
    std::filesystem::create_directories(downloadDir, ec);
    if (ec) {
        errorMsg = formatError(ErrorCodes::FILE_WRITE_ERROR,
                               "Failed to create " + downloadDir.string() + ": " + ec.message());
        return false;
    }

    // Only the final path component of a peer-supplied name is used
    std::string name = std::filesystem::path(file.name).filename().string();
    if (name.empty() || name == "." || name == "..") {
        name = "received.bin";
    }

    savedPath = uniqueFilePath(downloadDir, name);
    std::string writeError;
    if (!writeFileAtomically(savedPath, file.data.data(), file.data.size(), false, writeError)) {
        errorMsg = formatError(ErrorCodes::FILE_WRITE_ERROR,
                               "Failed to write " + savedPath.string() + ": " + writeError);
        return false;
    }
    return true;
}

}  // namespace PeerDrop
