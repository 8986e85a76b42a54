/**
 * @file PeerRegistry.h
 * @brief Authoritative set of peer connections keyed by peer id
 */

#pragma once

#include "PeerConnection.h"
#include "PeerInfo.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace PeerDrop {

/**
 * @class PeerRegistry
 * @brief Sole owner of the set of PeerConnections
 *
 * Invariants:
 * - At most one entry per peer id.
 * - Never two entries backed by the same PeerConnection (and therefore
 *   the same transport).
 *
 * Thread Safety:
 * - All public methods are thread-safe (map access is protected by an
 *   internal mutex that is never held while calling into a transport).
 * - Composite updates that must stay consistent with other engine state
 *   are serialized by the engine state mutex.
 */
class PeerRegistry {
public:
    PeerRegistry() = default;
    ~PeerRegistry() = default;

    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

    /**
     * @brief Register a connection under the given id
     * @param id Registry key
     * @param peer Connection to register
     * @param displaced Output: the connection previously stored under id, if any
     * @return false if the same connection is already registered under another id
     */
    bool add(const std::string& id,
             const PeerConnection::Ptr& peer,
             PeerConnection::Ptr& displaced);

    /**
     * @brief Look up a connection by id (nullptr if absent)
     */
    PeerConnection::Ptr find(const std::string& id) const;

    bool contains(const std::string& id) const;

    /**
     * @brief Remove the entry for id
     * @param expected If non-null, remove only when the entry is this connection
     * @return The removed connection, or nullptr if nothing was removed
     */
    PeerConnection::Ptr remove(const std::string& id, const PeerConnection* expected = nullptr);

    /**
     * @brief Move an entry to a new key
     * @param displaced Output: a different connection previously stored under newId
     * @return false if oldId is not registered
     */
    bool rekey(const std::string& oldId,
               const std::string& newId,
               PeerConnection::Ptr& displaced);

    /**
     * @brief Snapshot of all entries
     *
     * Identity fields are read without the engine state mutex; callers that
     * need a consistent view must hold it.
     */
    std::vector<PeerInfo> list() const;

    std::vector<PeerConnection::Ptr> connections() const;

    size_t size() const;

    /**
     * @brief Close every owned channel and transport, then clear the registry
     * @return The connections that were registered
     *
     * Must be called without the engine state mutex held: closing a channel
     * may synchronously fire its close handler.
     */
    std::vector<PeerConnection::Ptr> disconnectAll();

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, PeerConnection::Ptr> m_peers;
};

}  // namespace PeerDrop
