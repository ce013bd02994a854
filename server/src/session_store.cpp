#include "peerdrop/server/session_store.hpp"

#include <algorithm>

namespace peerdrop::server
{

    bool Session::has_peer(const std::string &peer_id) const
    {
        return std::any_of(peers.begin(), peers.end(), [&](const PeerInfo &peer)
                           { return peer.id == peer_id; });
    }

    const PeerInfo *Session::other_peer(const std::string &peer_id) const
    {
        auto it = std::find_if(peers.begin(), peers.end(), [&](const PeerInfo &peer)
                               { return peer.id != peer_id; });
        return it == peers.end() ? nullptr : &*it;
    }

    void Session::add_peer(PeerInfo peer)
    {
        mailbox.try_emplace(peer.id);
        peers.push_back(std::move(peer));
        is_locked = peers.size() >= kCapacity;
    }

    std::optional<Session> InMemorySessionStore::get(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<Session> InMemorySessionStore::find_by_code(const std::string &code) const
    {
        std::lock_guard lock(mutex_);
        auto code_it = code_index_.find(code);
        if (code_it == code_index_.end())
        {
            return std::nullopt;
        }
        auto it = sessions_.find(code_it->second);
        if (it == sessions_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool InMemorySessionStore::contains_code(const std::string &code) const
    {
        std::lock_guard lock(mutex_);
        return code_index_.contains(code);
    }

    void InMemorySessionStore::put(Session session)
    {
        std::lock_guard lock(mutex_);
        auto existing = sessions_.find(session.session_id);
        if (existing != sessions_.end() && existing->second.code != session.code)
        {
            code_index_.erase(existing->second.code);
        }
        code_index_[session.code] = session.session_id;
        const auto id = session.session_id;
        sessions_.insert_or_assign(id, std::move(session));
    }

    void InMemorySessionStore::erase(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        erase_locked(session_id);
    }

    std::vector<Session> InMemorySessionStore::erase_if(const std::function<bool(const Session &)> &predicate)
    {
        std::lock_guard lock(mutex_);
        std::vector<Session> removed;
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            if (predicate(it->second))
            {
                code_index_.erase(it->second.code);
                removed.push_back(std::move(it->second));
                it = sessions_.erase(it);
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    std::size_t InMemorySessionStore::size() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    void InMemorySessionStore::erase_locked(const std::string &session_id)
    {
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            return;
        }
        code_index_.erase(it->second.code);
        sessions_.erase(it);
    }

} // namespace peerdrop::server
