/**
 * @file PeerConnection.h
 * @brief One negotiated transport to one remote peer
 */

#pragma once

#include "PeerInfo.h"
#include "Transport.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace PeerDrop {

/**
 * @class PeerConnection
 * @brief Owns the transport and the single ordered channel to one peer
 *
 * Channel events are forwarded to the owner through Callbacks. The callbacks
 * receive a shared_ptr to this connection so the owner can find out which
 * registry entry the event belongs to even after the peer id changed
 * (initiator placeholder id -> real remote id).
 *
 * Thread Safety:
 * - Identity, state and announcement flags are guarded by the engine state
 *   mutex; callers must hold it when using them.
 * - channel(), attachChannel(), isChannelOpen() and close() are thread-safe.
 */
class PeerConnection : public std::enable_shared_from_this<PeerConnection> {
public:
    using Ptr = std::shared_ptr<PeerConnection>;

    struct Callbacks {
        std::function<void(const Ptr& peer)> onChannelOpen;
        std::function<void(const Ptr& peer)> onChannelClosed;
        std::function<void(const Ptr& peer, const std::string& text)> onText;
        std::function<void(const Ptr& peer, const uint8_t* data, size_t size)> onBinary;
    };

    /**
     * @brief Constructor
     * @param id Registry key (local placeholder id for the initiator)
     * @param displayName Display name of the remote peer (local name as placeholder)
     * @param transport Transport endpoint, exclusively owned from now on
     */
    PeerConnection(std::string id,
                   std::string displayName,
                   std::unique_ptr<PeerTransport> transport);

    /**
     * @brief Destructor - closes channel and transport
     */
    ~PeerConnection();

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    //=========================================================================
    // Identity (engine state mutex required)
    //=========================================================================

    const std::string& id() const { return m_id; }
    const std::string& displayName() const { return m_displayName; }
    PeerState state() const { return m_state; }
    void setState(PeerState state) { m_state = state; }
    PeerInfo info() const { return PeerInfo(m_id, m_displayName, m_state); }

    /**
     * @brief Replace the placeholder identity with the remote peer's identity
     * @return true if PeerConnected should be emitted now (channel already open)
     */
    bool resolveIdentity(const std::string& id, const std::string& displayName);

    /**
     * @brief Record the channel-open event
     * @return true if PeerConnected should be emitted now (identity already known)
     */
    bool markChannelOpen();

    /**
     * @brief Mark the identity as still provisional (initiator before the answer)
     */
    void setIdentityPending(bool pending) { m_identityPending = pending; }

    bool isIdentityPending() const { return m_identityPending; }
    bool isAnnounced() const { return m_announced; }

    //=========================================================================
    // Channel and transport
    //=========================================================================

    PeerTransport& transport() { return *m_transport; }

    /**
     * @brief Attach the peer's channel and route its events to callbacks
     *
     * A peer has at most one active channel: a previously attached channel
     * is closed after its handlers are detached.
     */
    void attachChannel(std::shared_ptr<DataChannel> channel, const Callbacks& callbacks);

    std::shared_ptr<DataChannel> channel() const;
    bool isChannelOpen() const;

    /**
     * @brief Close the channel, then the transport (idempotent)
     */
    void close();

    bool isClosed() const { return m_closed.load(); }

private:
    static void detachHandlers(DataChannel& channel);

    std::string m_id;
    std::string m_displayName;
    PeerState m_state;
    bool m_identityPending;
    bool m_channelOpened;
    bool m_announced;

    std::unique_ptr<PeerTransport> m_transport;

    mutable std::mutex m_channelMutex;
    std::shared_ptr<DataChannel> m_channel;
    std::atomic<bool> m_closed;
};

}  // namespace PeerDrop
