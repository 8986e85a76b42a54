/**
 * @file ConnectionDescriptor.h
 * @brief Out-of-band signaling descriptor exchanged between two peers
 */

#pragma once

#include <string>

namespace PeerDrop {

/**
 * @brief Role of a descriptor in the offer/answer handshake
 */
enum class DescriptorRole {
    Offer,   ///< Produced by the initiator
    Answer   ///< Produced by the responder in reply to an offer
};

/**
 * @brief Convert DescriptorRole to its wire string ("offer" / "answer")
 */
const char* descriptorRoleToString(DescriptorRole role);

/**
 * @brief Signaling payload copied or scanned between devices
 *
 * Immutable once produced and single-use: an offer code can be accepted
 * once and an answer code can complete exactly one pending negotiation.
 *
 * Wire form: base64( JSON{ type, sdp: { type, sdp }, peerId, peerName } ),
 * where the inner object is the session description as a browser's
 * RTCSessionDescription serializes it. Decoding also accepts a bare SDP
 * string in place of the object.
 */
struct ConnectionDescriptor {
    DescriptorRole role = DescriptorRole::Offer;
    std::string transportDescription;   ///< Opaque session description (SDP text)
    std::string peerId;                 ///< Id of the peer that produced the descriptor
    std::string peerDisplayName;        ///< Self-reported display name of that peer

    bool operator==(const ConnectionDescriptor& other) const {
        return role == other.role &&
               transportDescription == other.transportDescription &&
               peerId == other.peerId &&
               peerDisplayName == other.peerDisplayName;
    }

    bool operator!=(const ConnectionDescriptor& other) const {
        return !(*this == other);
    }
};

}  // namespace PeerDrop
