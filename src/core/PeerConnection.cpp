/**
 * @file PeerConnection.cpp
 * @brief One negotiated transport to one remote peer
 */

#include "peerdrop/PeerConnection.h"
#include "peerdrop/Debug.h"

namespace PeerDrop {

PeerConnection::PeerConnection(std::string id,
                               std::string displayName,
                               std::unique_ptr<PeerTransport> transport)
    : m_id(std::move(id))
    , m_displayName(std::move(displayName))
    , m_state(PeerState::Connecting)
    , m_identityPending(false)
    , m_channelOpened(false)
    , m_announced(false)
    , m_transport(std::move(transport))
    , m_closed(false)
{
}

PeerConnection::~PeerConnection()
{
    // Destructors must never throw; close() only calls into the transport
    close();
}

bool PeerConnection::resolveIdentity(const std::string& id, const std::string& displayName)
{
    m_id = id;
    m_displayName = displayName;
    m_identityPending = false;

    if (m_channelOpened && !m_announced) {
        m_announced = true;
        return true;
    }
    return false;
}

bool PeerConnection::markChannelOpen()
{
    m_channelOpened = true;
    m_state = PeerState::Connected;

    if (!m_identityPending && !m_announced) {
        m_announced = true;
        return true;
    }
    return false;
}

void PeerConnection::attachChannel(std::shared_ptr<DataChannel> channel, const Callbacks& callbacks)
{
    if (!channel) {
        return;
    }

    std::weak_ptr<PeerConnection> weakSelf = weak_from_this();

    channel->onOpen([weakSelf, cb = callbacks.onChannelOpen]() {
        auto self = weakSelf.lock();
        if (self && cb) {
            cb(self);
        }
    });

    channel->onClosed([weakSelf, cb = callbacks.onChannelClosed]() {
        auto self = weakSelf.lock();
        if (self && cb) {
            cb(self);
        }
    });

    channel->onText([weakSelf, cb = callbacks.onText](const std::string& text) {
        auto self = weakSelf.lock();
        if (self && cb) {
            cb(self, text);
        }
    });

    channel->onBinary([weakSelf, cb = callbacks.onBinary](const uint8_t* data, size_t size) {
        auto self = weakSelf.lock();
        if (self && cb) {
            cb(self, data, size);
        }
    });

    std::shared_ptr<DataChannel> previous;
    {
        std::lock_guard<std::mutex> lock(m_channelMutex);
        previous = std::move(m_channel);
        m_channel = std::move(channel);
    }

    if (previous) {
        LOG_WARNING("Replacing existing channel for peer " << m_id);
        detachHandlers(*previous);
        previous->close();
    }
}

std::shared_ptr<DataChannel> PeerConnection::channel() const
{
    std::lock_guard<std::mutex> lock(m_channelMutex);
    return m_channel;
}

bool PeerConnection::isChannelOpen() const
{
    auto ch = channel();
    return ch && ch->isOpen();
}

void PeerConnection::close()
{
    if (m_closed.exchange(true)) {
        return;
    }

    // Channel first: its close event is what observers react to
    auto ch = channel();
    if (ch) {
        ch->close();
    }

    if (m_transport) {
        m_transport->close();
    }
}

void PeerConnection::detachHandlers(DataChannel& channel)
{
    channel.onOpen(nullptr);
    channel.onClosed(nullptr);
    channel.onText(nullptr);
    channel.onBinary(nullptr);
}

}  // namespace PeerDrop
