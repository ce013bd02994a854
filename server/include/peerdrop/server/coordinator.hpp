#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "peerdrop/server/code_generator.hpp"
#include "peerdrop/server/session_store.hpp"
#include "peerdrop/signaling.hpp"

namespace peerdrop::server
{

    struct CoordinatorConfig
    {
        std::chrono::seconds session_ttl{std::chrono::seconds{600}};
        std::size_t max_code_attempts{100};
    };

    using Clock = std::function<Timestamp()>;

    /**
     * Rendezvous coordinator: pairs two peers under a short code and relays their
     * connection-setup signals through per-peer mailboxes.
     *
     * Mutating calls are serialized by one writer lock and begin with a sweep of expired
     * sessions. Queries read snapshots from the store and never delete anything.
     */
    class Coordinator : public SignalingService
    {
    public:
        explicit Coordinator(std::unique_ptr<SessionStore> store, CoordinatorConfig config = {},
                             Clock clock = [] { return std::chrono::system_clock::now(); });

        // Throws CodeSpaceExhausted once max_code_attempts codes in a row collide.
        SessionTicket create_session() override;

        Result<std::string> register_peer(const std::string &code, const std::string &peer_id) override;

        Status send_signal(const std::string &session_id, const std::string &from_peer_id,
                           const std::string &payload) override;

        Result<std::vector<std::string>> poll_signals(const std::string &session_id,
                                                      const std::string &peer_id) override;

        Status clear_signals(const std::string &session_id, const std::string &peer_id) override;

        std::optional<SessionInfo> get_session_info(const std::string &code) override;

        // Removes expired sessions now; returns how many were removed.
        std::size_t sweep_expired();

        std::size_t session_count() const;

        const CoordinatorConfig &config() const noexcept { return config_; }

    private:
        bool is_expired(const Session &session, Timestamp now) const;

        // Requires mutex_. Returns the removed sessions so callers can report Expired for them.
        std::vector<Session> sweep_expired_locked(Timestamp now);

        std::string generate_session_id() const;

        std::unique_ptr<SessionStore> store_;
        CoordinatorConfig config_;
        Clock clock_;
        CodeGenerator codes_;
        mutable std::mutex mutex_;
    };

} // namespace peerdrop::server
