/**
 * @file RtcTransport.cpp
 * @brief PeerTransport implementation on libdatachannel
 */

#include "peerdrop/RtcTransport.h"
#include "peerdrop/Debug.h"

#include <exception>
#include <utility>
#include <variant>

namespace PeerDrop {

//=============================================================================
// RtcDataChannel
//=============================================================================

RtcDataChannel::RtcDataChannel(std::shared_ptr<rtc::DataChannel> channel)
    : m_channel(std::move(channel))
{
    m_channel->onOpen([this]() {
        OpenHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_handlerMutex);
            handler = m_openHandler;
        }
        if (handler) {
            handler();
        }
    });

    m_channel->onClosed([this]() {
        ClosedHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_handlerMutex);
            handler = m_closedHandler;
        }
        if (handler) {
            handler();
        }
    });

    m_channel->onMessage([this](rtc::message_variant message) {
        dispatchMessage(std::move(message));
    });
}

RtcDataChannel::~RtcDataChannel()
{
    // No callback may reach this object once it is gone
    m_channel->resetCallbacks();
}

void RtcDataChannel::dispatchMessage(rtc::message_variant message)
{
    if (std::holds_alternative<rtc::string>(message)) {
        TextHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_handlerMutex);
            handler = m_textHandler;
        }
        if (handler) {
            handler(std::get<rtc::string>(message));
        }
        return;
    }

    const rtc::binary& bin = std::get<rtc::binary>(message);
    BinaryHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_binaryHandler;
    }
    if (handler) {
        handler(reinterpret_cast<const uint8_t*>(bin.data()), bin.size());
    }
}

bool RtcDataChannel::sendText(const std::string& text, std::string& errorMsg)
{
    try {
        if (!m_channel->send(text)) {
            // false means queued above the library's own buffer: still accepted
            LOG_DEBUG("Text message queued (buffered " << m_channel->bufferedAmount() << ")");
        }
        return true;
    } catch (const std::exception& e) {
        errorMsg = e.what();
        return false;
    }
}

bool RtcDataChannel::sendBinary(const uint8_t* data, size_t size, std::string& errorMsg)
{
    try {
        m_channel->send(reinterpret_cast<const rtc::byte*>(data), size);
        return true;
    } catch (const std::exception& e) {
        errorMsg = e.what();
        return false;
    }
}

size_t RtcDataChannel::bufferedAmount() const
{
    return m_channel->bufferedAmount();
}

bool RtcDataChannel::isOpen() const
{
    return m_channel->isOpen();
}

void RtcDataChannel::close()
{
    m_channel->close();
}

void RtcDataChannel::onOpen(OpenHandler handler)
{
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_openHandler = std::move(handler);
}

void RtcDataChannel::onClosed(ClosedHandler handler)
{
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_closedHandler = std::move(handler);
}

void RtcDataChannel::onText(TextHandler handler)
{
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_textHandler = std::move(handler);
}

void RtcDataChannel::onBinary(BinaryHandler handler)
{
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_binaryHandler = std::move(handler);
}

//=============================================================================
// RtcPeerTransport
//=============================================================================

RtcPeerTransport::RtcPeerTransport()
    : m_gatheringComplete(false)
    , m_candidateCount(0)
{
    rtc::Configuration config;
    config.disableAutoNegotiation = true;

    m_pc = std::make_shared<rtc::PeerConnection>(config);

    m_pc->onLocalCandidate([this](rtc::Candidate candidate) {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_candidateCount;
        LOG_DEBUG("Local candidate: " << std::string(candidate));
    });

    m_pc->onGatheringStateChange([this](rtc::PeerConnection::GatheringState state) {
        if (state != rtc::PeerConnection::GatheringState::Complete) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_gatheringComplete = true;
        }
        m_gatheringCv.notify_all();
    });

    m_pc->onDataChannel([this](std::shared_ptr<rtc::DataChannel> channel) {
        DataChannelHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            handler = m_dataChannelHandler;
        }
        if (handler) {
            handler(std::make_shared<RtcDataChannel>(std::move(channel)));
        }
    });
}

RtcPeerTransport::~RtcPeerTransport()
{
    close();
    m_pc->resetCallbacks();
}

std::shared_ptr<DataChannel> RtcPeerTransport::createDataChannel(const std::string& label,
                                                                 std::string& errorMsg)
{
    try {
        // Default init: ordered and reliable
        return std::make_shared<RtcDataChannel>(m_pc->createDataChannel(label));
    } catch (const std::exception& e) {
        errorMsg = e.what();
        return nullptr;
    }
}

void RtcPeerTransport::onDataChannel(DataChannelHandler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_dataChannelHandler = std::move(handler);
}

bool RtcPeerTransport::setLocalDescription(SessionDescriptionType type, std::string& errorMsg)
{
    try {
        m_pc->setLocalDescription(type == SessionDescriptionType::Offer
                                      ? rtc::Description::Type::Offer
                                      : rtc::Description::Type::Answer);
        return true;
    } catch (const std::exception& e) {
        errorMsg = e.what();
        return false;
    }
}

bool RtcPeerTransport::setRemoteDescription(const std::string& description,
                                            SessionDescriptionType type,
                                            std::string& errorMsg)
{
    try {
        m_pc->setRemoteDescription(rtc::Description(
            description, type == SessionDescriptionType::Offer ? "offer" : "answer"));
        return true;
    } catch (const std::exception& e) {
        errorMsg = e.what();
        return false;
    }
}

bool RtcPeerTransport::waitForGatheringComplete(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_gatheringCv.wait_for(lock, timeout, [this]() { return m_gatheringComplete; });
}

size_t RtcPeerTransport::localCandidateCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_candidateCount;
}

std::string RtcPeerTransport::localDescription() const
{
    auto description = m_pc->localDescription();
    if (!description) {
        return {};
    }
    return std::string(*description);
}

void RtcPeerTransport::close()
{
    m_pc->close();
}

//=============================================================================
// RtcTransportFactory
//=============================================================================

RtcTransportFactory::RtcTransportFactory()
{
    rtc::InitLogger(rtc::LogLevel::Warning);
}

std::unique_ptr<PeerTransport> RtcTransportFactory::createTransport(std::string& errorMsg)
{
    try {
        return std::make_unique<RtcPeerTransport>();
    } catch (const std::exception& e) {
        errorMsg = e.what();
        return nullptr;
    }
}

}  // namespace PeerDrop
