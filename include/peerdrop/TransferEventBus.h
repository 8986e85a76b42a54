/**
 * @file TransferEventBus.h
 * @brief Typed event channels for peer and transfer notifications
 */

#pragma once

#include "FileTransfer.h"
#include "PeerInfo.h"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace PeerDrop {

//=============================================================================
// Event Types
//=============================================================================

/**
 * @brief A peer's channel opened and its identity is known
 */
struct PeerConnectedEvent {
    PeerInfo peer;
};

/**
 * @brief A registered peer's channel closed (local, remote or network loss)
 */
struct PeerDisconnectedEvent {
    std::string peerId;
    std::string displayName;
};

/**
 * @brief A file was reassembled completely
 */
struct FileReceivedEvent {
    TransferFile file;
    std::string fromPeerId;
    std::string fromPeerDisplayName;
    std::string sha256Hex;   ///< Digest of the reassembled payload
};

/**
 * @brief Cumulative progress of one transfer, after each frame
 *
 * percentage() is for display only; completion is decided by byte count.
 */
struct TransferProgressEvent {
    std::string peerId;
    TransferDirection direction = TransferDirection::Incoming;
    std::string filename;
    uint64_t bytesTransferred = 0;
    uint64_t totalBytes = 0;

    double percentage() const {
        if (totalBytes == 0) {
            return 100.0;
        }
        return (static_cast<double>(bytesTransferred) /
                static_cast<double>(totalBytes)) * 100.0;
    }
};

//=============================================================================
// EventChannel
//=============================================================================

/**
 * @class EventChannel
 * @brief Single-consumer channel for one event type
 *
 * publish() invokes the connected handler synchronously on the publishing
 * thread. Nothing is buffered: events published while no handler is
 * connected are dropped, so a late consumer never sees earlier events.
 * Handlers must not block.
 *
 * Thread Safety:
 * - connect(), disconnect() and publish() are thread-safe
 * - The handler is invoked without the channel lock held, so it may call
 *   connect()/disconnect() itself
 */
template <typename Event>
class EventChannel {
public:
    using Handler = std::function<void(const Event& event)>;

    /**
     * @brief Set the consumer, replacing any previous one
     */
    void connect(Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handler = std::move(handler);
    }

    void disconnect() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handler = nullptr;
    }

    bool isConnected() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<bool>(m_handler);
    }

    /**
     * @brief Deliver an event to the consumer
     * @return true if a handler received it
     */
    bool publish(const Event& event) const {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            handler = m_handler;
        }
        if (!handler) {
            return false;
        }
        handler(event);
        return true;
    }

private:
    mutable std::mutex m_mutex;
    Handler m_handler;
};

//=============================================================================
// TransferEventBus
//=============================================================================

/**
 * @class TransferEventBus
 * @brief Fan-out of the four engine event kinds to external listeners
 *
 * Usage:
 * @code
 * engine.events().fileReceived().connect([](const FileReceivedEvent& e) {
 *     std::cout << e.file.name << " from " << e.fromPeerDisplayName << "\n";
 * });
 * @endcode
 */
class TransferEventBus {
public:
    EventChannel<PeerConnectedEvent>& peerConnected() { return m_peerConnected; }
    EventChannel<PeerDisconnectedEvent>& peerDisconnected() { return m_peerDisconnected; }
    EventChannel<FileReceivedEvent>& fileReceived() { return m_fileReceived; }
    EventChannel<TransferProgressEvent>& transferProgress() { return m_transferProgress; }

    const EventChannel<PeerConnectedEvent>& peerConnected() const { return m_peerConnected; }
    const EventChannel<PeerDisconnectedEvent>& peerDisconnected() const { return m_peerDisconnected; }
    const EventChannel<FileReceivedEvent>& fileReceived() const { return m_fileReceived; }
    const EventChannel<TransferProgressEvent>& transferProgress() const { return m_transferProgress; }

    /**
     * @brief Disconnect every consumer
     */
    void disconnectAll() {
        m_peerConnected.disconnect();
        m_peerDisconnected.disconnect();
        m_fileReceived.disconnect();
        m_transferProgress.disconnect();
    }

private:
    EventChannel<PeerConnectedEvent> m_peerConnected;
    EventChannel<PeerDisconnectedEvent> m_peerDisconnected;
    EventChannel<FileReceivedEvent> m_fileReceived;
    EventChannel<TransferProgressEvent> m_transferProgress;
};

}  // namespace PeerDrop
