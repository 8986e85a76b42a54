/**
 * @file PeerInfo.h
 * @brief Peer information structure for negotiated devices
 */

#pragma once
#include <string>

namespace PeerDrop {

    /**
     * @brief Connection state of a peer entry
     */
    enum class PeerState {
        Connecting,  ///< Registered, channel not open yet (negotiation in progress)
        Connected,   ///< Channel open, transfers possible
        Closed       ///< Channel closed, entry about to be removed
    };

    /**
     * @brief Convert PeerState to string
     */
    inline const char* peerStateToString(PeerState state) {
        switch (state) {
            case PeerState::Connecting: return "Connecting";
            case PeerState::Connected:  return "Connected";
            case PeerState::Closed:     return "Closed";
            default:                    return "Unknown";
        }
    }

    /**
     * @brief Snapshot of one registry entry
     *
     * Returned by value from PeerRegistry::list() so callers never touch
     * the live PeerConnection objects.
     */
    struct PeerInfo {
        std::string id;            ///< Peer id (placeholder local id until the answer is applied)
        std::string displayName;   ///< Self-reported display name
        PeerState state = PeerState::Connecting;

        PeerInfo() = default;

        PeerInfo(const std::string& id_, const std::string& name, PeerState state_)
            : id(id_), displayName(name), state(state_) {}
    };
}  // namespace PeerDrop
