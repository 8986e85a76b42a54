/**
 * @file HashUtils.h
 * @brief SHA-256 hash computation utilities
 */

#pragma once

#include "config.h"
#include <string>
#include <vector>
#include <cstdint>

namespace PeerDrop {

/**
 * @class HashUtils
 * @brief SHA-256 digests of transferred payloads
 *
 * The sender digests the frames it sends and the reassembler digests the
 * frames it accepts, so both sides can log a comparable fingerprint of
 * every transfer.
 *
 * Thread Safety:
 * - Static methods are thread-safe (no shared state)
 * - An IncrementalHash instance must not be shared between threads
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 hash of a memory buffer
     * @param data Pointer to the data to hash (may be null when size is 0)
     * @param size Size of the data in bytes
     * @return Vector containing the 32-byte hash
     */
    static std::vector<unsigned char> computeBufferHash(const uint8_t* data,
                                                        size_t size);

    /**
     * @brief Convert binary hash to hexadecimal string
     * @param hash Binary hash (must be HASH_SIZE bytes)
     * @return Lowercase hexadecimal string (64 characters)
     */
    static std::string hashToString(const unsigned char* hash);

    /**
     * @brief Incremental SHA-256 over streamed frames
     */
    class IncrementalHash {
    public:
        /**
         * @brief Constructor - initializes OpenSSL EVP digest context
         */
        IncrementalHash();

        /**
         * @brief Destructor - cleans up OpenSSL EVP context
         */
        ~IncrementalHash();

        // Prevent copying (context cannot be copied)
        IncrementalHash(const IncrementalHash&) = delete;
        IncrementalHash& operator=(const IncrementalHash&) = delete;

        // Allow moving (transfers ownership of EVP_MD_CTX)
        IncrementalHash(IncrementalHash&& other) noexcept;
        IncrementalHash& operator=(IncrementalHash&& other) noexcept;

        /**
         * @brief Add data to the hash computation
         * @return true if successful
         */
        bool update(const uint8_t* data, size_t size);

        /**
         * @brief Finalize and get the hash result
         * @param hash Output buffer (must be at least HASH_SIZE bytes)
         * @return true if successful
         *
         * After calling finalize(), you can no longer call update().
         */
        bool finalize(unsigned char* hash);

        /**
         * @brief Finalize and return the digest as hex (empty on failure)
         */
        std::string finalizeHex();

        /**
         * @brief Reset the hash context to start a new hash
         * @return true if successful
         */
        bool reset();

    private:
        void* m_ctx;  ///< Opaque pointer to EVP_MD_CTX
        bool m_finalized;
    };
};

}  // namespace PeerDrop
