/**
 * @file HashUtils.cpp
 * @brief SHA-256 hash computation utilities using OpenSSL EVP API
 *
 * Uses the EVP API instead of deprecated SHA256_* functions
 * for compatibility with OpenSSL 3.0+.
 */

#include "peerdrop/HashUtils.h"

#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

namespace PeerDrop {

//=============================================================================
// Static Methods
//=============================================================================

std::vector<unsigned char> HashUtils::computeBufferHash(const uint8_t* data,
                                                         size_t size)
{
    std::vector<unsigned char> hash(HASH_SIZE);

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return hash;  // Return zeroed hash on error
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1) {
        if (data && size > 0) {
            EVP_DigestUpdate(ctx, data, size);
        }
        unsigned int hashLen = 0;
        EVP_DigestFinal_ex(ctx, hash.data(), &hashLen);
    }

    EVP_MD_CTX_free(ctx);
    return hash;
}

std::string HashUtils::hashToString(const unsigned char* hash)
{
    if (!hash) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(hash[i]);
    }
    return oss.str();
}

//=============================================================================
// IncrementalHash Class (using EVP API)
//=============================================================================

HashUtils::IncrementalHash::IncrementalHash()
    : m_ctx(nullptr), m_finalized(false)
{
    m_ctx = EVP_MD_CTX_new();
    reset();
}

HashUtils::IncrementalHash::~IncrementalHash()
{
    if (m_ctx) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        m_ctx = nullptr;
    }
}

HashUtils::IncrementalHash::IncrementalHash(IncrementalHash&& other) noexcept
    : m_ctx(other.m_ctx)
    , m_finalized(other.m_finalized)
{
    other.m_ctx = nullptr;
    other.m_finalized = false;
}

HashUtils::IncrementalHash& HashUtils::IncrementalHash::operator=(IncrementalHash&& other) noexcept {
    if (this != &other) {
        if (m_ctx) {
            EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        }

        m_ctx = other.m_ctx;
        m_finalized = other.m_finalized;

        other.m_ctx = nullptr;
        other.m_finalized = false;
    }
    return *this;
}

bool HashUtils::IncrementalHash::update(const uint8_t* data, size_t size)
{
    if (m_finalized || !m_ctx) {
        return false;  // Cannot update after finalize
    }

    if (!data || size == 0) {
        return true;  // Nothing to update
    }

    EVP_MD_CTX* ctx = static_cast<EVP_MD_CTX*>(m_ctx);
    return EVP_DigestUpdate(ctx, data, size) == 1;
}

bool HashUtils::IncrementalHash::finalize(unsigned char* hash)
{
    if (m_finalized || !hash || !m_ctx) {
        return false;
    }

    EVP_MD_CTX* ctx = static_cast<EVP_MD_CTX*>(m_ctx);
    unsigned int hashLen = 0;
    bool success = (EVP_DigestFinal_ex(ctx, hash, &hashLen) == 1);
    m_finalized = true;
    return success;
}

std::string HashUtils::IncrementalHash::finalizeHex()
{
    unsigned char hash[HASH_SIZE] = {};
    if (!finalize(hash)) {
        return {};
    }
    return hashToString(hash);
}

bool HashUtils::IncrementalHash::reset()
{
    if (!m_ctx) {
        return false;
    }
    EVP_MD_CTX* ctx = static_cast<EVP_MD_CTX*>(m_ctx);
    bool success = (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1);
    m_finalized = false;
    return success;
}

}  // namespace PeerDrop
