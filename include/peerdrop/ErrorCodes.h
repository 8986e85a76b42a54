/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message, as "[CODE] message"
 */

#pragma once

#include <string>

namespace PeerDrop {
namespace ErrorCodes {

// Signaling (offer / answer handshake)
inline constexpr const char* MALFORMED_DESCRIPTOR = "PD-SIG-1001";
inline constexpr const char* NEGOTIATION_TIMEOUT = "PD-SIG-1002";
inline constexpr const char* NEGOTIATION_ERROR = "PD-SIG-1003";
inline constexpr const char* NO_PENDING_CONNECTION = "PD-SIG-1004";

// Transfer
inline constexpr const char* PEER_NOT_CONNECTED = "PD-XFR-2001";
inline constexpr const char* SEND_FAILED = "PD-XFR-2002";
inline constexpr const char* FILE_READ_ERROR = "PD-XFR-2003";
inline constexpr const char* FILE_WRITE_ERROR = "PD-XFR-2004";

// Cloud pipeline
inline constexpr const char* CLOUD_UPLOAD_FAILED = "PD-CLD-3001";
inline constexpr const char* CLOUD_DOWNLOAD_FAILED = "PD-CLD-3002";

// Configuration
inline constexpr const char* CONFIG_ERROR = "PD-CFG-4001";

// Offline store
inline constexpr const char* OFFLINE_STORE_ERROR = "PD-OFF-5001";

}  // namespace ErrorCodes

/**
 * @brief Build a user-visible error message "[CODE] text".
 */
inline std::string formatError(const char* code, const std::string& text) {
    return std::string("[") + code + "] " + text;
}

/**
 * @brief Check whether an error message carries the given code.
 */
inline bool hasErrorCode(const std::string& message, const char* code) {
    return message.find(std::string("[") + code + "]") != std::string::npos;
}

}  // namespace PeerDrop
