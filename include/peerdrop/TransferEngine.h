/**
 * @file TransferEngine.h
 * @brief Peer-to-peer file transfer engine
 *
 * The engine exclusively owns the peer registry, the per-peer reassembly
 * state, the single pending-offer context and the event bus. There is no
 * process-wide instance: create one engine per local identity.
 */

#pragma once

#include "EngineSettings.h"
#include "FileTransfer.h"
#include "PeerConnection.h"
#include "PeerInfo.h"
#include "PeerRegistry.h"
#include "Signaling.h"
#include "SignalingStateMachine.h"
#include "TransferEventBus.h"
#include "Transport.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace PeerDrop {

/**
 * @class TransferEngine
 * @brief Negotiates direct connections and moves files over them
 *
 * Usage:
 * @code
 * TransferEngine engine(std::make_shared<RtcTransportFactory>(), settings);
 * engine.events().fileReceived().connect([](const FileReceivedEvent& e) { ... });
 *
 * std::string offer, error;
 * if (!engine.createOffer(offer, error)) { ... }
 * // hand `offer` to the other device, obtain its answer
 * if (!engine.completeConnection(answer, error)) { ... }
 * @endcode
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Negotiation calls block until path discovery finishes (bounded)
 * - Send calls block while the channel is above its high-water mark
 * - Events are published synchronously on the thread that produced them,
 *   never with internal locks held
 */
class TransferEngine {
public:
    /**
     * @brief Constructor
     * @param factory Transport implementation (libdatachannel, or a fake in tests)
     * @param settings Runtime settings (expected to be validated)
     * @param signaling Descriptor exchange (manual base64 codes when null)
     */
    explicit TransferEngine(std::shared_ptr<TransportFactory> factory,
                            const EngineSettings& settings = EngineSettings(),
                            std::shared_ptr<Signaling> signaling = nullptr);

    /**
     * @brief Destructor - disconnects every peer without publishing events
     */
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    //=========================================================================
    // Negotiation
    //=========================================================================

    bool createOffer(std::string& outCode, std::string& errorMsg);
    bool acceptOffer(const std::string& offerCode, std::string& outAnswerCode, std::string& errorMsg);
    bool completeConnection(const std::string& answerCode, std::string& errorMsg);

    SignalingState signalingState() const;

    //=========================================================================
    // Transfer
    //=========================================================================

    /**
     * @brief Send an in-memory file to a connected peer
     *
     * At most one file may be in flight per peer: the receiver treats every
     * metadata frame as the start of a new file.
     */
    bool sendBuffer(const std::string& peerId, const TransferFile& file, std::string& errorMsg);

    /**
     * @brief Stream a file from disk to a connected peer
     */
    bool sendFile(const std::string& peerId, const std::string& filePath, std::string& errorMsg);

    /**
     * @brief Send several files in order
     * @param sentCount Output: number of files fully sent
     * @return false at the first failure; remaining files are not attempted
     *         and files already sent stay sent
     */
    bool sendFiles(const std::string& peerId,
                   const std::vector<std::string>& filePaths,
                   size_t& sentCount,
                   std::string& errorMsg);

    //=========================================================================
    // Peers
    //=========================================================================

    std::vector<PeerInfo> getPeers() const;

    /**
     * @brief Bytes received so far of the file a peer is currently sending
     * @return 0 when no file from that peer is in flight
     */
    uint64_t incomingBytes(const std::string& peerId) const;

    /**
     * @brief Close one peer's channel and transport
     */
    bool disconnectPeer(const std::string& peerId, std::string& errorMsg);

    /**
     * @brief Close every channel and transport
     *
     * Aborts in-flight sends and receives. Partial transfers never produce
     * FileReceived.
     */
    void disconnect();

    const std::string& localPeerId() const { return m_localPeerId; }
    const std::string& localDisplayName() const { return m_settings.displayName; }
    const EngineSettings& settings() const { return m_settings; }

    TransferEventBus& events() { return m_events; }

private:
    void handleChannelOpen(const PeerConnection::Ptr& peer);
    void handleChannelClosed(const PeerConnection::Ptr& peer);
    void handleText(const PeerConnection::Ptr& peer, const std::string& text);
    void handleBinary(const PeerConnection::Ptr& peer, const uint8_t* data, size_t size);

    void publishFrameResult(const std::string& peerId,
                            const std::string& displayName,
                            FrameResult& result,
                            bool fromBinary);

    void announce(const PeerInfo& peer);
    void retire(const PeerConnection::Ptr& peer, PeerDisconnectedEvent& event);
    void publishDisconnected(const PeerDisconnectedEvent& event);
    void publishReplaced();

    bool resolveChannel(const std::string& peerId,
                        std::shared_ptr<DataChannel>& channel,
                        std::string& errorMsg) const;

    EngineSettings m_settings;
    std::string m_localPeerId;

    std::shared_ptr<TransportFactory> m_factory;
    std::shared_ptr<Signaling> m_signaling;

    // Guards registry composites, reassembler and the pending offer
    mutable std::mutex m_stateMutex;
    PeerRegistry m_registry;
    FileReassembler m_reassembler;
    // Retired by a reconnect, published once the negotiation call returns
    std::vector<PeerDisconnectedEvent> m_replacedEvents;
    TransferEventBus m_events;
    std::unique_ptr<SignalingStateMachine> m_signalingMachine;
};

}  // namespace PeerDrop
