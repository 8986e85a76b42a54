/**
 * @file SignalingStateMachine.cpp
 * @brief Offer / answer handshake driving PeerConnection creation
 */

#include "peerdrop/SignalingStateMachine.h"
#include "peerdrop/Debug.h"
#include "peerdrop/ErrorCodes.h"
#include "peerdrop/ThreadSafeLog.h"

#include <memory>
#include <utility>

namespace PeerDrop {

const char* signalingStateToString(SignalingState state)
{
    switch (state) {
        case SignalingState::Idle:           return "Idle";
        case SignalingState::OfferCreated:   return "OfferCreated";
        case SignalingState::OfferReceived:  return "OfferReceived";
        case SignalingState::AnswerCreated:  return "AnswerCreated";
        case SignalingState::AnswerReceived: return "AnswerReceived";
        case SignalingState::Connected:      return "Connected";
        case SignalingState::Closed:         return "Closed";
        default:                             return "Unknown";
    }
}

SignalingStateMachine::SignalingStateMachine(TransportFactory& factory,
                                             Signaling& signaling,
                                             PeerRegistry& registry,
                                             std::mutex& stateMutex,
                                             Hooks hooks,
                                             std::string localPeerId,
                                             std::string localDisplayName,
                                             std::chrono::milliseconds negotiationTimeout)
    : m_factory(factory)
    , m_signaling(signaling)
    , m_registry(registry)
    , m_stateMutex(stateMutex)
    , m_hooks(std::move(hooks))
    , m_localPeerId(std::move(localPeerId))
    , m_localDisplayName(std::move(localDisplayName))
    , m_negotiationTimeout(negotiationTimeout)
    , m_state(SignalingState::Idle)
{
}

//=============================================================================
// Initiator
//=============================================================================

bool SignalingStateMachine::createOffer(std::string& outCode, std::string& errorMsg)
{
    std::string transportError;
    std::unique_ptr<PeerTransport> transport = m_factory.createTransport(transportError);
    if (!transport) {
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                               "Failed to create transport: " + transportError);
        return false;
    }

    auto peer = std::make_shared<PeerConnection>(m_localPeerId, m_localDisplayName,
                                                 std::move(transport));
    peer->setIdentityPending(true);

    // The channel must exist before the offer: it is part of the negotiated session
    std::shared_ptr<DataChannel> channel =
        peer->transport().createDataChannel(DATA_CHANNEL_LABEL, transportError);
    if (!channel) {
        peer->close();
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                               "Failed to create data channel: " + transportError);
        return false;
    }
    peer->attachChannel(channel, m_hooks.channel);

    if (!peer->transport().setLocalDescription(SessionDescriptionType::Offer, transportError)) {
        peer->close();
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                               "Failed to create offer: " + transportError);
        return false;
    }

    std::string code;
    if (!gatherLocalDescription(peer->transport(), errorMsg) ||
        !publishLocal(peer->transport(), DescriptorRole::Offer, code, errorMsg)) {
        peer->close();
        ThreadSafeLog::log("createOffer failed: " + errorMsg);
        return false;
    }

    PeerConnection::Ptr displaced;
    PeerConnection::Ptr superseded;
    bool registered = false;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        registered = m_registry.add(m_localPeerId, peer, displaced);
        if (registered) {
            superseded = std::move(m_pending);
            m_pending = peer;
            m_state = SignalingState::OfferCreated;
        }
    }

    if (!registered) {
        peer->close();
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR, "Connection already registered");
        return false;
    }

    if (superseded) {
        LOG_WARNING("Previous pending offer superseded by a new one");
    }
    closeQuietly(displaced, peer);
    closeQuietly(superseded, displaced);

    outCode = std::move(code);
    LOG_INFO("Offer created by " << m_localPeerId);
    return true;
}

bool SignalingStateMachine::completeConnection(const std::string& code,
                                               CompletionResult& result,
                                               std::string& errorMsg)
{
    ConnectionDescriptor answer;
    if (!m_signaling.receive(code, answer, errorMsg)) {
        return false;
    }
    if (answer.role != DescriptorRole::Answer) {
        errorMsg = formatError(ErrorCodes::MALFORMED_DESCRIPTOR,
                               std::string("Expected an answer descriptor, got ") +
                               descriptorRoleToString(answer.role));
        return false;
    }
    if (answer.peerId == m_localPeerId) {
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                               "Answer was produced by this device");
        return false;
    }

    PeerConnection::Ptr pending;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        pending = m_pending;
    }
    if (!pending) {
        errorMsg = formatError(ErrorCodes::NO_PENDING_CONNECTION, "No offer is outstanding");
        return false;
    }

    // May synchronously open the channel; the open handler takes the state mutex
    std::string transportError;
    if (!pending->transport().setRemoteDescription(answer.transportDescription,
                                                   SessionDescriptionType::Answer,
                                                   transportError)) {
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                               "Remote answer rejected: " + transportError);
        abandon(pending);
        ThreadSafeLog::log("completeConnection failed: " + errorMsg);
        return false;
    }

    PeerConnection::Ptr displaced;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_pending != pending) {
            errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                                   "Offer was superseded while the answer was applied");
            return false;
        }
        m_pending.reset();

        const std::string placeholderId = pending->id();
        if (m_registry.find(placeholderId) != pending ||
            !m_registry.rekey(placeholderId, answer.peerId, displaced)) {
            errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                                   "Connection closed during negotiation");
            m_state = SignalingState::Closed;
            return false;
        }
        // Retire the replaced connection before its id is reused
        if (displaced && displaced != pending) {
            notifyReplaced(displaced);
        }
        if (m_hooks.onPeerRekeyed) {
            m_hooks.onPeerRekeyed(placeholderId, answer.peerId);
        }

        result.announce = pending->resolveIdentity(answer.peerId, answer.peerDisplayName);
        result.peer = pending->info();
        m_state = result.announce ? SignalingState::Connected : SignalingState::AnswerReceived;
    }

    closeQuietly(displaced, pending);

    LOG_INFO("Answer from " << answer.peerDisplayName << " (" << answer.peerId << ") applied");
    return true;
}

//=============================================================================
// Responder
//=============================================================================

bool SignalingStateMachine::acceptOffer(const std::string& code,
                                        std::string& outCode,
                                        std::string& errorMsg)
{
    ConnectionDescriptor offer;
    if (!m_signaling.receive(code, offer, errorMsg)) {
        return false;
    }
    if (offer.role != DescriptorRole::Offer) {
        errorMsg = formatError(ErrorCodes::MALFORMED_DESCRIPTOR,
                               std::string("Expected an offer descriptor, got ") +
                               descriptorRoleToString(offer.role));
        return false;
    }
    if (offer.peerId == m_localPeerId) {
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                               "Offer was produced by this device");
        return false;
    }

    std::string transportError;
    std::unique_ptr<PeerTransport> transport = m_factory.createTransport(transportError);
    if (!transport) {
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                               "Failed to create transport: " + transportError);
        return false;
    }

    auto peer = std::make_shared<PeerConnection>(offer.peerId, offer.peerDisplayName,
                                                 std::move(transport));

    std::weak_ptr<PeerConnection> weakPeer = peer;
    PeerConnection::Callbacks callbacks = m_hooks.channel;
    peer->transport().onDataChannel([weakPeer, callbacks](std::shared_ptr<DataChannel> channel) {
        auto self = weakPeer.lock();
        if (!self || !channel) {
            return;
        }
        self->attachChannel(channel, callbacks);
        // Channels can arrive already open; the open handler ignores repeats
        if (channel->isOpen() && callbacks.onChannelOpen) {
            callbacks.onChannelOpen(self);
        }
    });

    // Optimistic registration: promoted to connected by the channel-open event
    PeerConnection::Ptr displaced;
    bool registered = false;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        registered = m_registry.add(offer.peerId, peer, displaced);
        if (registered) {
            m_state = SignalingState::OfferReceived;
            if (displaced) {
                notifyReplaced(displaced);
            }
        }
    }
    if (!registered) {
        peer->close();
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR, "Connection already registered");
        return false;
    }
    closeQuietly(displaced, peer);

    if (!peer->transport().setRemoteDescription(offer.transportDescription,
                                                SessionDescriptionType::Offer,
                                                transportError)) {
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                               "Remote offer rejected: " + transportError);
        abandon(peer);
        ThreadSafeLog::log("acceptOffer failed: " + errorMsg);
        return false;
    }

    if (!peer->transport().setLocalDescription(SessionDescriptionType::Answer, transportError)) {
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                               "Failed to create answer: " + transportError);
        abandon(peer);
        return false;
    }

    std::string answerCode;
    if (!gatherLocalDescription(peer->transport(), errorMsg) ||
        !publishLocal(peer->transport(), DescriptorRole::Answer, answerCode, errorMsg)) {
        abandon(peer);
        ThreadSafeLog::log("acceptOffer failed: " + errorMsg);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_state == SignalingState::OfferReceived) {
            m_state = SignalingState::AnswerCreated;
        }
    }

    outCode = std::move(answerCode);
    LOG_INFO("Answer created for " << offer.peerDisplayName << " (" << offer.peerId << ")");
    return true;
}

//=============================================================================
// Helpers
//=============================================================================

PeerConnection::Ptr SignalingStateMachine::reset()
{
    m_state = SignalingState::Closed;
    return std::move(m_pending);
}

bool SignalingStateMachine::gatherLocalDescription(PeerTransport& transport, std::string& errorMsg)
{
    if (!transport.waitForGatheringComplete(m_negotiationTimeout)) {
        errorMsg = formatError(ErrorCodes::NEGOTIATION_TIMEOUT,
                               "Network path discovery did not finish within " +
                               std::to_string(m_negotiationTimeout.count()) + " ms");
        return false;
    }

    if (transport.localCandidateCount() == 0) {
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                               "No usable local network paths found");
        return false;
    }
    return true;
}

bool SignalingStateMachine::publishLocal(PeerTransport& transport,
                                         DescriptorRole role,
                                         std::string& outCode,
                                         std::string& errorMsg)
{
    ConnectionDescriptor descriptor;
    descriptor.role = role;
    descriptor.transportDescription = transport.localDescription();
    descriptor.peerId = m_localPeerId;
    descriptor.peerDisplayName = m_localDisplayName;

    if (descriptor.transportDescription.empty()) {
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR, "Local description is empty");
        return false;
    }

    std::string publishError;
    if (!m_signaling.publish(descriptor, outCode, publishError)) {
        errorMsg = formatError(ErrorCodes::NEGOTIATION_ERROR,
                               "Failed to publish descriptor: " + publishError);
        return false;
    }
    return true;
}

void SignalingStateMachine::abandon(const PeerConnection::Ptr& peer)
{
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_registry.remove(peer->id(), peer.get());
        if (m_pending == peer) {
            m_pending.reset();
        }
        m_state = SignalingState::Closed;
    }
    peer->close();
}

void SignalingStateMachine::notifyReplaced(const PeerConnection::Ptr& replaced)
{
    LOG_INFO("Connection to " << replaced->id() << " replaced by a new negotiation");
    if (m_hooks.onPeerReplaced) {
        m_hooks.onPeerReplaced(replaced);
    }
}

void SignalingStateMachine::closeQuietly(const PeerConnection::Ptr& peer,
                                         const PeerConnection::Ptr& except)
{
    if (peer && peer != except) {
        peer->close();
    }
}

}  // namespace PeerDrop
