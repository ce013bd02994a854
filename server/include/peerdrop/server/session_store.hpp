#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "peerdrop/signaling.hpp"

namespace peerdrop::server
{

    struct PeerInfo
    {
        std::string id;
        Timestamp joined_at{};
    };

    struct Session
    {
        static constexpr std::size_t kCapacity = 2;

        std::string session_id;
        std::string code;
        Timestamp created_at{};
        std::vector<PeerInfo> peers;
        bool is_locked{false};
        // One queue per registered peer, in arrival order.
        std::map<std::string, std::vector<std::string>> mailbox;

        bool has_peer(const std::string &peer_id) const;

        // The registered peer that is not `peer_id`, if one has joined.
        const PeerInfo *other_peer(const std::string &peer_id) const;

        // Appends the peer with an empty mailbox and updates is_locked. The caller checks capacity.
        void add_peer(PeerInfo peer);
    };

    /**
     * Keyed storage for sessions with a secondary index by code. Implementations keep both
     * indices consistent on every put and erase.
     */
    class SessionStore
    {
    public:
        virtual ~SessionStore() = default;

        virtual std::optional<Session> get(const std::string &session_id) const = 0;

        virtual std::optional<Session> find_by_code(const std::string &code) const = 0;

        virtual bool contains_code(const std::string &code) const = 0;

        // Inserts or replaces the session under its id and code.
        virtual void put(Session session) = 0;

        virtual void erase(const std::string &session_id) = 0;

        // Removes every session matching `predicate` and returns the removed sessions.
        virtual std::vector<Session> erase_if(const std::function<bool(const Session &)> &predicate) = 0;

        virtual std::size_t size() const = 0;
    };

    class InMemorySessionStore : public SessionStore
    {
    public:
        std::optional<Session> get(const std::string &session_id) const override;
        std::optional<Session> find_by_code(const std::string &code) const override;
        bool contains_code(const std::string &code) const override;
        void put(Session session) override;
        void erase(const std::string &session_id) override;
        std::vector<Session> erase_if(const std::function<bool(const Session &)> &predicate) override;
        std::size_t size() const override;

    private:
        void erase_locked(const std::string &session_id);

        mutable std::mutex mutex_;
        std::unordered_map<std::string, Session> sessions_;
        std::unordered_map<std::string, std::string> code_index_;
    };

} // namespace peerdrop::server
