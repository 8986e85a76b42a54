/**
 * @file Signaling.h
 * @brief Exchange of connection descriptors between peers
 */

#pragma once

#include "ConnectionCodec.h"
#include "ConnectionDescriptor.h"
#include <string>

namespace PeerDrop {

/**
 * @brief How descriptors travel between the two devices.
 *
 * SignalingStateMachine only turns descriptors into codes and back through
 * this interface, so a networked signaling service can replace the manual
 * copy/QR exchange without touching PeerConnection or the transfer protocol.
 */
class Signaling {
public:
    virtual ~Signaling() = default;

    /**
     * @brief Make a local descriptor available to the remote peer
     * @param descriptor Descriptor produced by the local side
     * @param outCode Text the user hands to the remote peer (may be empty for
     *                implementations that deliver the descriptor themselves)
     */
    virtual bool publish(const ConnectionDescriptor& descriptor,
                         std::string& outCode,
                         std::string& errorMsg) = 0;

    /**
     * @brief Turn a code obtained from the remote peer into a descriptor
     */
    virtual bool receive(const std::string& code,
                         ConnectionDescriptor& out,
                         std::string& errorMsg) = 0;
};

/**
 * @brief Manual out-of-band exchange: codes are copied or scanned by the user.
 */
class ManualSignaling final : public Signaling {
public:
    bool publish(const ConnectionDescriptor& descriptor,
                 std::string& outCode,
                 std::string& errorMsg) override {
        (void)errorMsg;
        outCode = ConnectionCodec::encode(descriptor);
        return true;
    }

    bool receive(const std::string& code,
                 ConnectionDescriptor& out,
                 std::string& errorMsg) override {
        return ConnectionCodec::decode(code, out, errorMsg);
    }
};

}  // namespace PeerDrop
