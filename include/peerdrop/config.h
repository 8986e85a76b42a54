/**
 * @file config.h
 * @brief Configuration constants for PeerDrop
 *
 * This file contains the compile-time configuration constants used throughout
 * PeerDrop: negotiation timing, frame and buffer sizes, descriptor and wire
 * protocol identifiers, and the limits of the cloud and offline collaborators.
 *
 * Runtime-tunable values (display name, frame size, high-water mark, ...)
 * live in EngineSettings and default to the values defined here.
 *
 * @note Changes to the wire constants affect protocol compatibility.
 *       Ensure all peers use compatible configurations.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace PeerDrop
 * @brief PeerDrop namespace containing all public APIs
 */
namespace PeerDrop {

//=========================================================================
// Negotiation
//=========================================================================

/** @defgroup Negotiation Negotiation Configuration
 * @brief Timing and identifiers for the out-of-band offer/answer handshake
 * @{
 */

/**
 * @brief Upper bound on local network-path discovery (ICE gathering).
 *
 * createOffer() and acceptOffer() block until gathering completes.
 * Exceeding this bound fails the negotiation with NegotiationTimeout.
 */
constexpr uint32_t NEGOTIATION_TIMEOUT_MS = 10000;

/**
 * @brief Descriptor role values carried in the "type" field.
 */
constexpr const char* DESCRIPTOR_TYPE_OFFER = "offer";
constexpr const char* DESCRIPTOR_TYPE_ANSWER = "answer";

/**
 * @brief Prefix for locally generated peer identifiers ("peer_xxxx-xxxx-...").
 */
constexpr const char* PEER_ID_PREFIX = "peer_";

/**
 * @brief Label of the single ordered, reliable data channel per peer.
 */
constexpr const char* DATA_CHANNEL_LABEL = "fileTransfer";

/**
 * @brief Display name used when none is configured.
 */
constexpr const char* DEFAULT_DISPLAY_NAME = "PeerDrop Device";

/** @} */ // end of Negotiation

//=========================================================================
// Transfer
//=========================================================================

/** @defgroup TransferConfig Transfer Configuration
 * @brief Frame sizes and flow control
 * @{
 */

/**
 * @brief Payload frame size (16 KB)
 *
 * Files are split into binary frames of at most this size. SCTP-based data
 * channels fragment larger messages poorly across implementations, so this
 * is also the upper bound accepted by EngineSettings.
 */
constexpr size_t FRAME_SIZE = 16384;

/**
 * @brief Maximum frame size accepted from configuration.
 */
constexpr size_t MAX_FRAME_SIZE = 16384;

/**
 * @brief Outstanding-buffer threshold for send-side backpressure
 *
 * Before each frame, the sender waits while the channel's buffered amount
 * exceeds this value.
 */
constexpr size_t HIGH_WATER_MARK = FRAME_SIZE * 10;

/**
 * @brief Poll interval while waiting for the channel buffer to drain.
 */
constexpr uint32_t BACKPRESSURE_POLL_INTERVAL_MS = 100;

/**
 * @brief Read buffer used when streaming a file from disk.
 */
constexpr size_t FILE_READ_BUFFER_SIZE = 1024 * 1024;  // 1 MB

/**
 * @brief SHA-256 digest size in bytes.
 */
constexpr size_t HASH_SIZE = 32;

/**
 * @brief MIME type used when none can be determined.
 */
constexpr const char* DEFAULT_MIME_TYPE = "application/octet-stream";

/**
 * @brief Maximum filename length accepted in a metadata frame.
 */
constexpr size_t MAX_FILENAME_LENGTH = 255;

/** @} */ // end of TransferConfig

//=========================================================================
// Cloud Pipeline
//=========================================================================

/** @defgroup CloudConfig Cloud Pipeline Configuration
 * @brief Limits for the chunked object-storage pipeline
 * @{
 */

/**
 * @brief Size of one stored blob (5 GB).
 */
constexpr uint64_t CLOUD_CHUNK_SIZE = 5ULL * 1024ULL * 1024ULL * 1024ULL;

/**
 * @brief Attempts per chunk before the upload is marked failed.
 */
constexpr int CLOUD_MAX_ATTEMPTS = 3;

/**
 * @brief Fixed delay between chunk attempts.
 */
constexpr uint32_t CLOUD_RETRY_BACKOFF_MS = 1000;

/**
 * @brief Shared files expire this many days after creation.
 */
constexpr int CLOUD_EXPIRY_DAYS = 7;

/**
 * @brief Record status values shared with the storage backend.
 */
constexpr const char* CLOUD_STATUS_PENDING = "pending";
constexpr const char* CLOUD_STATUS_UPLOADING = "uploading";
constexpr const char* CLOUD_STATUS_COMPLETED = "completed";
constexpr const char* CLOUD_STATUS_FAILED = "failed";

/** @} */ // end of CloudConfig

//=========================================================================
// Offline Store
//=========================================================================

/** @defgroup OfflineConfig Offline Store Configuration
 * @{
 */

constexpr const char* OFFLINE_FILES_DIR = "offlineFiles";
constexpr const char* UPLOAD_QUEUE_DIR = "uploadQueue";
constexpr const char* OFFLINE_INDEX_FILE = "index.json";

/** @} */ // end of OfflineConfig

}  // namespace PeerDrop
