/**
 * @file SignalingStateMachine.h
 * @brief Offer / answer handshake driving PeerConnection creation
 */

#pragma once

#include "config.h"
#include "PeerConnection.h"
#include "PeerInfo.h"
#include "PeerRegistry.h"
#include "Signaling.h"
#include "Transport.h"
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace PeerDrop {

/**
 * @brief Handshake state of the most recent negotiation
 */
enum class SignalingState {
    Idle,
    OfferCreated,     ///< Initiator: offer published, waiting for the answer
    OfferReceived,    ///< Responder: offer decoded, remote description being applied
    AnswerCreated,    ///< Responder: answer published, waiting for the channel
    AnswerReceived,   ///< Initiator: answer applied, waiting for the channel
    Connected,
    Closed
};

const char* signalingStateToString(SignalingState state);

/**
 * @brief Outcome of completeConnection()
 */
struct CompletionResult {
    PeerInfo peer;          ///< Entry after promotion to the remote identity
    bool announce = false;  ///< Channel was already open: PeerConnected is due now
};

/**
 * @class SignalingStateMachine
 * @brief Drives offer -> answer -> connected for both roles
 *
 * Initiator: createOffer() then completeConnection(answer).
 * Responder: acceptOffer(offer).
 *
 * There is at most one outstanding initiator context. The answer carries
 * no negotiation id, so completeConnection() always resolves against the
 * latest offer: a second createOffer() before completion closes the first
 * context's transport and replaces it.
 *
 * The initiator's entry is registered under the local peer id as a
 * placeholder and promoted to the remote id when the answer is applied.
 * The responder's entry is registered under the remote id before its
 * channel opens. Reconnecting to a peer that is still registered replaces
 * its entry; the replaced connection is reported through onPeerReplaced.
 *
 * Thread Safety:
 * - Negotiation calls block the caller (path discovery, bounded timeout)
 * - Shared state is guarded by the engine state mutex passed in; it is
 *   never held across transport calls that can fire channel callbacks
 */
class SignalingStateMachine {
public:
    /**
     * @brief Engine integration points
     */
    struct Hooks {
        /// Attached to every channel this machine creates or accepts
        PeerConnection::Callbacks channel;

        /// Called with the state mutex held when an entry moves to a new id
        std::function<void(const std::string& oldId, const std::string& newId)> onPeerRekeyed;

        /// Called with the state mutex held when a new connection takes over
        /// the registry entry of an older connection to the same peer. The
        /// older connection is closed after the lock is released.
        std::function<void(const PeerConnection::Ptr& replaced)> onPeerReplaced;
    };

    SignalingStateMachine(TransportFactory& factory,
                          Signaling& signaling,
                          PeerRegistry& registry,
                          std::mutex& stateMutex,
                          Hooks hooks,
                          std::string localPeerId,
                          std::string localDisplayName,
                          std::chrono::milliseconds negotiationTimeout =
                              std::chrono::milliseconds(NEGOTIATION_TIMEOUT_MS));

    SignalingStateMachine(const SignalingStateMachine&) = delete;
    SignalingStateMachine& operator=(const SignalingStateMachine&) = delete;

    /**
     * @brief Start an initiator negotiation
     * @param outCode Output: encoded offer descriptor
     * @param errorMsg Output: NegotiationTimeout / NegotiationError on failure
     */
    bool createOffer(std::string& outCode, std::string& errorMsg);

    /**
     * @brief Answer a remote offer
     * @param code Offer code obtained out-of-band
     * @param outCode Output: encoded answer descriptor
     * @param errorMsg Output: MalformedDescriptor / NegotiationTimeout / NegotiationError
     */
    bool acceptOffer(const std::string& code, std::string& outCode, std::string& errorMsg);

    /**
     * @brief Apply the remote answer to the outstanding offer
     * @param errorMsg Output: MalformedDescriptor / NoPendingConnection / NegotiationError
     */
    bool completeConnection(const std::string& code,
                            CompletionResult& result,
                            std::string& errorMsg);

    //=========================================================================
    // State (state mutex required)
    //=========================================================================

    SignalingState state() const { return m_state; }
    bool hasPendingOffer() const { return static_cast<bool>(m_pending); }

    /**
     * @brief Record that a negotiated channel opened
     */
    void markConnected() { m_state = SignalingState::Connected; }

    /**
     * @brief Drop the pending initiator context
     * @return The dropped connection (caller closes it outside the lock)
     */
    PeerConnection::Ptr reset();

    const std::string& localPeerId() const { return m_localPeerId; }
    const std::string& localDisplayName() const { return m_localDisplayName; }

private:
    bool gatherLocalDescription(PeerTransport& transport, std::string& errorMsg);
    bool publishLocal(PeerTransport& transport, DescriptorRole role,
                      std::string& outCode, std::string& errorMsg);
    void abandon(const PeerConnection::Ptr& peer);
    void notifyReplaced(const PeerConnection::Ptr& replaced);

    static void closeQuietly(const PeerConnection::Ptr& peer, const PeerConnection::Ptr& except);

    TransportFactory& m_factory;
    Signaling& m_signaling;
    PeerRegistry& m_registry;
    std::mutex& m_stateMutex;
    Hooks m_hooks;

    std::string m_localPeerId;
    std::string m_localDisplayName;
    std::chrono::milliseconds m_negotiationTimeout;

    SignalingState m_state;
    PeerConnection::Ptr m_pending;
};

}  // namespace PeerDrop
