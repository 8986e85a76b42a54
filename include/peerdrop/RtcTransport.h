/**
 * @file RtcTransport.h
 * @brief PeerTransport implementation on libdatachannel
 *
 * Local network only: no STUN/TURN servers are configured, so only host
 * candidates are gathered. Negotiation is driven explicitly
 * (auto-negotiation disabled) and candidates are not trickled: the local
 * description is read once gathering is complete and carries them all.
 */

#pragma once

#include "Transport.h"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include <rtc/rtc.hpp>

namespace PeerDrop {

/**
 * @class RtcDataChannel
 * @brief DataChannel over rtc::DataChannel (ordered, reliable)
 */
class RtcDataChannel final : public DataChannel {
public:
    explicit RtcDataChannel(std::shared_ptr<rtc::DataChannel> channel);
    ~RtcDataChannel() override;

    RtcDataChannel(const RtcDataChannel&) = delete;
    RtcDataChannel& operator=(const RtcDataChannel&) = delete;

    bool sendText(const std::string& text, std::string& errorMsg) override;
    bool sendBinary(const uint8_t* data, size_t size, std::string& errorMsg) override;
    size_t bufferedAmount() const override;
    bool isOpen() const override;
    void close() override;

    void onOpen(OpenHandler handler) override;
    void onClosed(ClosedHandler handler) override;
    void onText(TextHandler handler) override;
    void onBinary(BinaryHandler handler) override;

private:
    void dispatchMessage(rtc::message_variant message);

    std::shared_ptr<rtc::DataChannel> m_channel;

    // Handlers may be replaced while libdatachannel threads deliver messages
    mutable std::mutex m_handlerMutex;
    OpenHandler m_openHandler;
    ClosedHandler m_closedHandler;
    TextHandler m_textHandler;
    BinaryHandler m_binaryHandler;
};

/**
 * @class RtcPeerTransport
 * @brief PeerTransport over rtc::PeerConnection
 */
class RtcPeerTransport final : public PeerTransport {
public:
    RtcPeerTransport();
    ~RtcPeerTransport() override;

    RtcPeerTransport(const RtcPeerTransport&) = delete;
    RtcPeerTransport& operator=(const RtcPeerTransport&) = delete;

    std::shared_ptr<DataChannel> createDataChannel(const std::string& label,
                                                   std::string& errorMsg) override;
    void onDataChannel(DataChannelHandler handler) override;

    bool setLocalDescription(SessionDescriptionType type, std::string& errorMsg) override;
    bool setRemoteDescription(const std::string& description,
                              SessionDescriptionType type,
                              std::string& errorMsg) override;

    bool waitForGatheringComplete(std::chrono::milliseconds timeout) override;
    size_t localCandidateCount() const override;
    std::string localDescription() const override;

    void close() override;

private:
    std::shared_ptr<rtc::PeerConnection> m_pc;

    mutable std::mutex m_mutex;
    std::condition_variable m_gatheringCv;
    bool m_gatheringComplete;
    size_t m_candidateCount;
    DataChannelHandler m_dataChannelHandler;
};

/**
 * @class RtcTransportFactory
 * @brief Creates one RtcPeerTransport per negotiation
 */
class RtcTransportFactory final : public TransportFactory {
public:
    RtcTransportFactory();

    std::unique_ptr<PeerTransport> createTransport(std::string& errorMsg) override;
};

}  // namespace PeerDrop
