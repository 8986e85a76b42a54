/**
 * @file ConnectionCodec.h
 * @brief Encoding and decoding of out-of-band connection descriptors
 */

#pragma once

#include "ConnectionDescriptor.h"
#include <cstdint>
#include <string>
#include <vector>

namespace PeerDrop {

/**
 * @class ConnectionCodec
 * @brief base64(JSON) codec for ConnectionDescriptor
 *
 * JSON layout:
 * @code
 * {
 *   "type": "offer" | "answer",
 *   "sdp": "<session description>",
 *   "peerId": "peer_...",
 *   "peerName": "Alex's laptop"
 * }
 * @endcode
 *
 * Any structural problem while decoding (bad base64, invalid JSON, missing
 * or mistyped fields, unknown type) fails with ErrorCodes::MALFORMED_DESCRIPTOR.
 *
 * Thread Safety:
 * - All methods are thread-safe (no shared state)
 */
class ConnectionCodec {
public:
    /**
     * @brief Encode a descriptor to its printable out-of-band code
     */
    static std::string encode(const ConnectionDescriptor& descriptor);

    /**
     * @brief Decode a printable code into a descriptor
     * @param code Base64 text (surrounding whitespace is ignored)
     * @param out Output descriptor (untouched on failure)
     * @param errorMsg Output error message ("[PD-SIG-1001] ...") on failure
     * @return true if the code is a well-formed descriptor
     */
    static bool decode(const std::string& code,
                       ConnectionDescriptor& out,
                       std::string& errorMsg);

    /**
     * @brief Standard base64 (RFC 4648, padded, no line breaks)
     */
    static std::string base64Encode(const uint8_t* data, size_t size);

    /**
     * @brief Strict base64 decode
     * @return false on characters outside the alphabet, bad length or misplaced padding
     */
    static bool base64Decode(const std::string& text, std::vector<uint8_t>& out);

private:
    ConnectionCodec() = delete;
};

}  // namespace PeerDrop
