/**
 * @file TransferEngine.cpp
 * @brief Peer-to-peer file transfer engine
 */

#include "peerdrop/TransferEngine.h"
#include "peerdrop/Debug.h"
#include "peerdrop/ErrorCodes.h"
#include "peerdrop/ThreadSafeLog.h"
#include "peerdrop/UuidGenerator.h"

#include <filesystem>
#include <utility>

namespace PeerDrop {

TransferEngine::TransferEngine(std::shared_ptr<TransportFactory> factory,
                               const EngineSettings& settings,
                               std::shared_ptr<Signaling> signaling)
    : m_settings(settings)
    , m_localPeerId(UuidGenerator::generateWithPrefix(PEER_ID_PREFIX))
    , m_factory(std::move(factory))
    , m_signaling(signaling ? std::move(signaling) : std::make_shared<ManualSignaling>())
{
    if (m_settings.displayName.empty()) {
        m_settings.displayName = DEFAULT_DISPLAY_NAME;
    }

    SignalingStateMachine::Hooks hooks;
    hooks.channel.onChannelOpen = [this](const PeerConnection::Ptr& peer) {
        handleChannelOpen(peer);
    };
    hooks.channel.onChannelClosed = [this](const PeerConnection::Ptr& peer) {
        handleChannelClosed(peer);
    };
    hooks.channel.onText = [this](const PeerConnection::Ptr& peer, const std::string& text) {
        handleText(peer, text);
    };
    hooks.channel.onBinary = [this](const PeerConnection::Ptr& peer, const uint8_t* data, size_t size) {
        handleBinary(peer, data, size);
    };
    hooks.onPeerRekeyed = [this](const std::string& oldId, const std::string& newId) {
        m_reassembler.rekey(oldId, newId);
    };
    hooks.onPeerReplaced = [this](const PeerConnection::Ptr& replaced) {
        PeerDisconnectedEvent event;
        retire(replaced, event);
        m_replacedEvents.push_back(std::move(event));
    };

    m_signalingMachine = std::make_unique<SignalingStateMachine>(
        *m_factory, *m_signaling, m_registry, m_stateMutex, std::move(hooks),
        m_localPeerId, m_settings.displayName, m_settings.negotiationTimeout());

    LOG_INFO("Engine started as " << m_settings.displayName << " (" << m_localPeerId << ")");
}

TransferEngine::~TransferEngine()
{
    m_events.disconnectAll();
    disconnect();
}

//=============================================================================
// Negotiation
//=============================================================================

bool TransferEngine::createOffer(std::string& outCode, std::string& errorMsg)
{
    return m_signalingMachine->createOffer(outCode, errorMsg);
}

bool TransferEngine::acceptOffer(const std::string& offerCode,
                                 std::string& outAnswerCode,
                                 std::string& errorMsg)
{
    const bool accepted = m_signalingMachine->acceptOffer(offerCode, outAnswerCode, errorMsg);
    publishReplaced();
    return accepted;
}

bool TransferEngine::completeConnection(const std::string& answerCode, std::string& errorMsg)
{
    CompletionResult result;
    const bool completed = m_signalingMachine->completeConnection(answerCode, result, errorMsg);
    publishReplaced();
    if (!completed) {
        return false;
    }
    if (result.announce) {
        announce(result.peer);
    }
    return true;
}

SignalingState TransferEngine::signalingState() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_signalingMachine->state();
}

//=============================================================================
// Transfer
//=============================================================================

bool TransferEngine::resolveChannel(const std::string& peerId,
                                    std::shared_ptr<DataChannel>& channel,
                                    std::string& errorMsg) const
{
    PeerConnection::Ptr peer;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        peer = m_registry.find(peerId);
    }
    if (!peer) {
        errorMsg = formatError(ErrorCodes::PEER_NOT_CONNECTED, "Unknown peer: " + peerId);
        return false;
    }

    channel = peer->channel();
    if (!channel || !channel->isOpen()) {
        errorMsg = formatError(ErrorCodes::PEER_NOT_CONNECTED, "Channel to " + peerId + " is not open");
        return false;
    }
    return true;
}

bool TransferEngine::sendBuffer(const std::string& peerId, const TransferFile& file, std::string& errorMsg)
{
    std::shared_ptr<DataChannel> channel;
    if (!resolveChannel(peerId, channel, errorMsg)) {
        return false;
    }

    FileSender sender(m_settings.sendOptions());
    const std::string filename = file.name;
    bool ok = sender.sendBuffer(*channel, file, errorMsg,
        [this, &peerId, &filename](uint64_t sent, uint64_t total) {
            TransferProgressEvent event;
            event.peerId = peerId;
            event.direction = TransferDirection::Outgoing;
            event.filename = filename;
            event.bytesTransferred = sent;
            event.totalBytes = total;
            m_events.transferProgress().publish(event);
        });

    if (!ok) {
        LOG_ERROR("Send of '" << file.name << "' to " << peerId << " failed: " << errorMsg);
        ThreadSafeLog::log("Send failed: " + errorMsg);
    }
    return ok;
}

bool TransferEngine::sendFile(const std::string& peerId, const std::string& filePath, std::string& errorMsg)
{
    std::shared_ptr<DataChannel> channel;
    if (!resolveChannel(peerId, channel, errorMsg)) {
        return false;
    }

    FileSender sender(m_settings.sendOptions());
    const std::string filename = std::filesystem::path(filePath).filename().string();
    bool ok = sender.sendFile(*channel, filePath, errorMsg,
        [this, &peerId, &filename](uint64_t sent, uint64_t total) {
            TransferProgressEvent event;
            event.peerId = peerId;
            event.direction = TransferDirection::Outgoing;
            event.filename = filename;
            event.bytesTransferred = sent;
            event.totalBytes = total;
            m_events.transferProgress().publish(event);
        });

    if (!ok) {
        LOG_ERROR("Send of '" << filePath << "' to " << peerId << " failed: " << errorMsg);
        ThreadSafeLog::log("Send failed: " + errorMsg);
    }
    return ok;
}

bool TransferEngine::sendFiles(const std::string& peerId,
                               const std::vector<std::string>& filePaths,
                               size_t& sentCount,
                               std::string& errorMsg)
{
    sentCount = 0;
    for (const auto& path : filePaths) {
        if (!sendFile(peerId, path, errorMsg)) {
            LOG_WARNING("Aborting batch after " << sentCount << " of " << filePaths.size() << " files");
            return false;
        }
        ++sentCount;
    }
    return true;
}

//=============================================================================
// Peers
//=============================================================================

std::vector<PeerInfo> TransferEngine::getPeers() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_registry.list();
}

uint64_t TransferEngine::incomingBytes(const std::string& peerId) const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_reassembler.receivedBytes(peerId);
}

bool TransferEngine::disconnectPeer(const std::string& peerId, std::string& errorMsg)
{
    PeerConnection::Ptr peer;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        peer = m_registry.find(peerId);
    }
    if (!peer) {
        errorMsg = formatError(ErrorCodes::PEER_NOT_CONNECTED, "Unknown peer: " + peerId);
        return false;
    }

    // The close handler removes the entry and publishes PeerDisconnected
    peer->close();

    // Transports that do not report a local close still lose their entry
    handleChannelClosed(peer);
    return true;
}

void TransferEngine::disconnect()
{
    PeerConnection::Ptr pending;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        pending = m_signalingMachine->reset();
        m_reassembler.clear();
    }

    // Close handlers that fire synchronously retire their own entries
    std::vector<PeerConnection::Ptr> closed = m_registry.disconnectAll();
    for (const auto& peer : closed) {
        PeerDisconnectedEvent event;
        bool retired = false;
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (peer->state() != PeerState::Closed) {
                retire(peer, event);
                retired = true;
            }
        }
        if (retired) {
            publishDisconnected(event);
        }
    }

    if (pending) {
        pending->close();
    }

    LOG_INFO("Disconnected " << closed.size() << " peer(s)");
}

//=============================================================================
// Channel events
//=============================================================================

void TransferEngine::announce(const PeerInfo& peer)
{
    LOG_INFO("Peer connected: " << peer.displayName << " (" << peer.id << ")");
    ThreadSafeLog::log("Peer connected: " + peer.displayName + " (" + peer.id + ")");

    PeerConnectedEvent event;
    event.peer = peer;
    m_events.peerConnected().publish(event);
}

void TransferEngine::handleChannelOpen(const PeerConnection::Ptr& peer)
{
    bool shouldAnnounce = false;
    PeerInfo info;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_registry.find(peer->id()) != peer) {
            return;
        }
        shouldAnnounce = peer->markChannelOpen();
        info = peer->info();
        if (shouldAnnounce) {
            m_signalingMachine->markConnected();
        }
    }

    if (shouldAnnounce) {
        announce(info);
    }
}

void TransferEngine::handleChannelClosed(const PeerConnection::Ptr& peer)
{
    PeerDisconnectedEvent event;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        // A superseded or abandoned connection no longer owns its entry
        if (!m_registry.remove(peer->id(), peer.get())) {
            return;
        }
        retire(peer, event);
    }
    publishDisconnected(event);
}

void TransferEngine::retire(const PeerConnection::Ptr& peer, PeerDisconnectedEvent& event)
{
    event.peerId = peer->id();
    event.displayName = peer->displayName();
    if (m_reassembler.discard(event.peerId)) {
        ThreadSafeLog::log("Discarded incomplete transfer from " + event.peerId);
    }
    if (!peer->isAnnounced()) {
        LOG_DEBUG("Peer " << event.peerId << " closed before its channel opened");
    }
    peer->setState(PeerState::Closed);
}

void TransferEngine::publishReplaced()
{
    std::vector<PeerDisconnectedEvent> replaced;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        replaced.swap(m_replacedEvents);
    }
    for (const auto& event : replaced) {
        publishDisconnected(event);
    }
}

void TransferEngine::publishDisconnected(const PeerDisconnectedEvent& event)
{
    LOG_INFO("Peer disconnected: " << event.displayName << " (" << event.peerId << ")");
    ThreadSafeLog::log("Peer disconnected: " + event.displayName + " (" + event.peerId + ")");
    m_events.peerDisconnected().publish(event);
}

void TransferEngine::handleText(const PeerConnection::Ptr& peer, const std::string& text)
{
    FrameResult result;
    std::string peerId;
    std::string displayName;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_registry.find(peer->id()) != peer) {
            return;
        }
        peerId = peer->id();
        displayName = peer->displayName();
        result = m_reassembler.onText(peerId, text);
    }
    publishFrameResult(peerId, displayName, result, false);
}

void TransferEngine::handleBinary(const PeerConnection::Ptr& peer, const uint8_t* data, size_t size)
{
    FrameResult result;
    std::string peerId;
    std::string displayName;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_registry.find(peer->id()) != peer) {
            return;
        }
        peerId = peer->id();
        displayName = peer->displayName();
        result = m_reassembler.onBinary(peerId, data, size);
    }
    publishFrameResult(peerId, displayName, result, true);
}

void TransferEngine::publishFrameResult(const std::string& peerId,
                                        const std::string& displayName,
                                        FrameResult& result,
                                        bool fromBinary)
{
    const bool progressed = fromBinary &&
        (result.outcome == FrameOutcome::ChunkAccepted ||
         result.outcome == FrameOutcome::TransferCompleted);

    if (progressed) {
        TransferProgressEvent progress;
        progress.peerId = peerId;
        progress.direction = TransferDirection::Incoming;
        progress.filename = result.filename;
        progress.bytesTransferred = result.bytesReceived;
        progress.totalBytes = result.totalBytes;
        m_events.transferProgress().publish(progress);
    }

    if (result.outcome != FrameOutcome::TransferCompleted) {
        return;
    }

    LOG_INFO("Received '" << result.file.name << "' (" << result.file.size() << " bytes) from "
             << displayName << ", sha256=" << result.sha256Hex);
    ThreadSafeLog::log("Received '" + result.file.name + "' from " + peerId +
                       " sha256=" + result.sha256Hex);

    FileReceivedEvent event;
    event.file = std::move(result.file);
    event.fromPeerId = peerId;
    event.fromPeerDisplayName = displayName;
    event.sha256Hex = std::move(result.sha256Hex);
    m_events.fileReceived().publish(event);
}

}  // namespace PeerDrop
