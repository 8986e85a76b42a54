/**
 * @file Transport.h
 * @brief Minimal transport abstraction for negotiated peer sessions
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace PeerDrop {

/**
 * @brief Type of a session description applied to a transport
 */
enum class SessionDescriptionType {
    Offer,
    Answer
};

/**
 * @brief Ordered, reliable, bidirectional message channel to one peer.
 *
 * Text and binary messages are delivered in send order, exactly once.
 * Handlers may be invoked on a transport-owned thread; they must not block.
 */
class DataChannel {
public:
    using OpenHandler = std::function<void()>;
    using ClosedHandler = std::function<void()>;
    using TextHandler = std::function<void(const std::string& text)>;
    using BinaryHandler = std::function<void(const uint8_t* data, size_t size)>;

    virtual ~DataChannel() = default;

    virtual bool sendText(const std::string& text, std::string& errorMsg) = 0;
    virtual bool sendBinary(const uint8_t* data, size_t size, std::string& errorMsg) = 0;

    /// Bytes queued by send calls that the transport has not yet handed to the network
    virtual size_t bufferedAmount() const = 0;

    virtual bool isOpen() const = 0;
    virtual void close() = 0;

    virtual void onOpen(OpenHandler handler) = 0;
    virtual void onClosed(ClosedHandler handler) = 0;
    virtual void onText(TextHandler handler) = 0;
    virtual void onBinary(BinaryHandler handler) = 0;
};

/**
 * @brief One local endpoint of a negotiated peer-to-peer session.
 *
 * The negotiation sequence is driven by SignalingStateMachine:
 * - Initiator: createDataChannel() -> setLocalDescription(Offer) ->
 *   waitForGatheringComplete() -> localDescription() ... setRemoteDescription(answer)
 * - Responder: onDataChannel() -> setRemoteDescription(offer) ->
 *   setLocalDescription(Answer) -> waitForGatheringComplete() -> localDescription()
 */
class PeerTransport {
public:
    using DataChannelHandler = std::function<void(std::shared_ptr<DataChannel> channel)>;

    virtual ~PeerTransport() = default;

    virtual std::shared_ptr<DataChannel> createDataChannel(const std::string& label,
                                                           std::string& errorMsg) = 0;

    /// Register the passive accept handler for channels opened by the remote side
    virtual void onDataChannel(DataChannelHandler handler) = 0;

    virtual bool setLocalDescription(SessionDescriptionType type, std::string& errorMsg) = 0;
    virtual bool setRemoteDescription(const std::string& description,
                                      SessionDescriptionType type,
                                      std::string& errorMsg) = 0;

    /**
     * @brief Block until local network-path discovery finishes
     * @return false if the timeout elapsed first
     */
    virtual bool waitForGatheringComplete(std::chrono::milliseconds timeout) = 0;

    /// Number of usable local network paths (ICE candidates) discovered so far
    virtual size_t localCandidateCount() const = 0;

    /// Local session description including gathered candidates (empty before setLocalDescription)
    virtual std::string localDescription() const = 0;

    virtual void close() = 0;
};

/**
 * @brief Creates one PeerTransport per negotiation.
 */
class TransportFactory {
public:
    virtual ~TransportFactory() = default;
    virtual std::unique_ptr<PeerTransport> createTransport(std::string& errorMsg) = 0;
};

}  // namespace PeerDrop
