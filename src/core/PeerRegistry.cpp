/**
 * @file PeerRegistry.cpp
 * @brief Authoritative set of peer connections keyed by peer id
 */

#include "peerdrop/PeerRegistry.h"

namespace PeerDrop {

bool PeerRegistry::add(const std::string& id,
                       const PeerConnection::Ptr& peer,
                       PeerConnection::Ptr& displaced)
{
    displaced.reset();
    if (!peer || id.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    for (const auto& entry : m_peers) {
        if (entry.second == peer && entry.first != id) {
            return false;
        }
    }

    auto it = m_peers.find(id);
    if (it != m_peers.end()) {
        if (it->second != peer) {
            displaced = std::move(it->second);
        }
        it->second = peer;
    } else {
        m_peers.emplace(id, peer);
    }
    return true;
}

PeerConnection::Ptr PeerRegistry::find(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(id);
    return it != m_peers.end() ? it->second : nullptr;
}

bool PeerRegistry::contains(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peers.count(id) > 0;
}

PeerConnection::Ptr PeerRegistry::remove(const std::string& id, const PeerConnection* expected)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(id);
    if (it == m_peers.end()) {
        return nullptr;
    }
    if (expected && it->second.get() != expected) {
        return nullptr;
    }

    PeerConnection::Ptr removed = std::move(it->second);
    m_peers.erase(it);
    return removed;
}

bool PeerRegistry::rekey(const std::string& oldId,
                         const std::string& newId,
                         PeerConnection::Ptr& displaced)
{
    displaced.reset();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(oldId);
    if (it == m_peers.end()) {
        return false;
    }
    if (oldId == newId) {
        return true;
    }

    PeerConnection::Ptr peer = std::move(it->second);
    m_peers.erase(it);

    auto existing = m_peers.find(newId);
    if (existing != m_peers.end()) {
        displaced = std::move(existing->second);
        existing->second = std::move(peer);
    } else {
        m_peers.emplace(newId, std::move(peer));
    }
    return true;
}

std::vector<PeerInfo> PeerRegistry::list() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<PeerInfo> out;
    out.reserve(m_peers.size());
    for (const auto& entry : m_peers) {
        PeerInfo info = entry.second->info();
        info.id = entry.first;
        out.push_back(std::move(info));
    }
    return out;
}

std::vector<PeerConnection::Ptr> PeerRegistry::connections() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<PeerConnection::Ptr> out;
    out.reserve(m_peers.size());
    for (const auto& entry : m_peers) {
        out.push_back(entry.second);
    }
    return out;
}

size_t PeerRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peers.size();
}

std::vector<PeerConnection::Ptr> PeerRegistry::disconnectAll()
{
    // Snapshot first; close() may re-enter remove() through a close handler
    std::vector<PeerConnection::Ptr> peers = connections();

    for (const auto& peer : peers) {
        peer->close();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_peers.clear();
    return peers;
}

}  // namespace PeerDrop
