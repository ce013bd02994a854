#include "peerdrop/server/coordinator.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "peerdrop/crypto.hpp"

namespace peerdrop::server
{

    namespace
    {

        bool removed_contains(const std::vector<Session> &removed, const std::function<bool(const Session &)> &match)
        {
            return std::any_of(removed.begin(), removed.end(), match);
        }

        Status session_not_found(const std::string &session_id)
        {
            return Status::failure(ErrorCode::NotFound, "Session not found: " + session_id);
        }

        Status session_expired(const std::string &session_id)
        {
            return Status::failure(ErrorCode::Expired, "Session expired: " + session_id);
        }

    } // namespace

    Coordinator::Coordinator(std::unique_ptr<SessionStore> store, CoordinatorConfig config, Clock clock)
        : store_(std::move(store)),
          config_(config),
          clock_(std::move(clock)),
          codes_(crypto::random_u64())
    {
        if (!store_)
        {
            throw std::invalid_argument("Coordinator requires a session store");
        }
    }

    SessionTicket Coordinator::create_session()
    {
        std::lock_guard lock(mutex_);
        const auto now = clock_();
        sweep_expired_locked(now);

        std::optional<std::string> code;
        for (std::size_t attempt = 0; attempt < config_.max_code_attempts; ++attempt)
        {
            auto candidate = codes_.next(now, attempt);
            if (!store_->contains_code(candidate))
            {
                code = std::move(candidate);
                break;
            }
            spdlog::debug("Code collision on attempt {}", attempt + 1);
        }
        if (!code)
        {
            spdlog::critical("Session code space exhausted after {} attempts ({} live sessions)",
                             config_.max_code_attempts, store_->size());
            throw CodeSpaceExhausted("Unable to allocate a unique session code");
        }

        Session session;
        session.session_id = generate_session_id();
        session.code = *code;
        session.created_at = now;
        SessionTicket ticket{.session_id = session.session_id, .code = session.code};
        store_->put(std::move(session));

        spdlog::info("Created session {} with code {}", ticket.session_id, ticket.code);
        return ticket;
    }

    Result<std::string> Coordinator::register_peer(const std::string &code, const std::string &peer_id)
    {
        std::lock_guard lock(mutex_);
        const auto now = clock_();
        const auto removed = sweep_expired_locked(now);
        if (removed_contains(removed, [&](const Session &s)
                             { return s.code == code; }))
        {
            spdlog::info("Registration for expired code {} rejected", code);
            return Status::failure(ErrorCode::Expired, "Session expired");
        }

        auto session = store_->find_by_code(code);
        if (!session)
        {
            return Status::failure(ErrorCode::NotFound, "Session not found");
        }
        if (session->has_peer(peer_id))
        {
            return session->session_id;
        }
        if (session->is_locked || session->peers.size() >= Session::kCapacity)
        {
            spdlog::warn("Peer {} rejected: session {} is full", peer_id, session->session_id);
            return Status::failure(ErrorCode::Full, "Session is full");
        }

        session->add_peer(PeerInfo{.id = peer_id, .joined_at = now});
        const auto session_id = session->session_id;
        const auto peer_count = session->peers.size();
        store_->put(std::move(*session));

        spdlog::info("Peer {} joined session {} ({}/{})", peer_id, session_id, peer_count, Session::kCapacity);
        return session_id;
    }

    Status Coordinator::send_signal(const std::string &session_id, const std::string &from_peer_id,
                                    const std::string &payload)
    {
        std::lock_guard lock(mutex_);
        const auto now = clock_();
        const auto removed = sweep_expired_locked(now);
        if (removed_contains(removed, [&](const Session &s)
                             { return s.session_id == session_id; }))
        {
            return session_expired(session_id);
        }

        auto session = store_->get(session_id);
        if (!session)
        {
            return session_not_found(session_id);
        }
        if (!session->has_peer(from_peer_id))
        {
            return Status::failure(ErrorCode::PeerNotRegistered, "Peer not registered: " + from_peer_id);
        }
        const auto *target = session->other_peer(from_peer_id);
        if (target == nullptr)
        {
            return Status::failure(ErrorCode::NoPeer, "No peer has joined yet");
        }

        const auto target_id = target->id;
        session->mailbox[target_id].push_back(payload);
        spdlog::debug("Signal {} -> {} in session {} ({} queued)", from_peer_id, target_id, session_id,
                      session->mailbox[target_id].size());
        store_->put(std::move(*session));
        return Status::success();
    }

    Result<std::vector<std::string>> Coordinator::poll_signals(const std::string &session_id,
                                                               const std::string &peer_id)
    {
        const auto session = store_->get(session_id);
        if (!session)
        {
            return session_not_found(session_id);
        }
        if (is_expired(*session, clock_()))
        {
            return session_expired(session_id);
        }
        if (!session->has_peer(peer_id))
        {
            return Status::failure(ErrorCode::PeerNotRegistered, "Peer not registered: " + peer_id);
        }
        auto it = session->mailbox.find(peer_id);
        if (it == session->mailbox.end())
        {
            return std::vector<std::string>{};
        }
        return it->second;
    }

    Status Coordinator::clear_signals(const std::string &session_id, const std::string &peer_id)
    {
        std::lock_guard lock(mutex_);
        const auto now = clock_();
        const auto removed = sweep_expired_locked(now);
        if (removed_contains(removed, [&](const Session &s)
                             { return s.session_id == session_id; }))
        {
            return session_expired(session_id);
        }

        auto session = store_->get(session_id);
        if (!session)
        {
            return session_not_found(session_id);
        }
        if (!session->has_peer(peer_id))
        {
            return Status::failure(ErrorCode::PeerNotRegistered, "Peer not registered: " + peer_id);
        }
        auto &queue = session->mailbox[peer_id];
        if (queue.empty())
        {
            return Status::success();
        }
        queue.clear();
        store_->put(std::move(*session));
        return Status::success();
    }

    std::optional<SessionInfo> Coordinator::get_session_info(const std::string &code)
    {
        const auto session = store_->find_by_code(code);
        if (!session)
        {
            return std::nullopt;
        }
        return SessionInfo{
            .session_id = session->session_id,
            .created_at = session->created_at,
            .peer_count = session->peers.size(),
            .is_locked = session->is_locked,
            .is_expired = is_expired(*session, clock_()),
        };
    }

    std::size_t Coordinator::sweep_expired()
    {
        std::lock_guard lock(mutex_);
        return sweep_expired_locked(clock_()).size();
    }

    std::size_t Coordinator::session_count() const
    {
        return store_->size();
    }

    bool Coordinator::is_expired(const Session &session, Timestamp now) const
    {
        return now - session.created_at > config_.session_ttl;
    }

    std::vector<Session> Coordinator::sweep_expired_locked(Timestamp now)
    {
        auto removed = store_->erase_if([&](const Session &session)
                                        { return is_expired(session, now); });
        if (!removed.empty())
        {
            spdlog::info("Expired {} session(s)", removed.size());
        }
        return removed;
    }

    std::string Coordinator::generate_session_id() const
    {
        for (;;)
        {
            auto id = "session_" + crypto::random_hex(12);
            if (!store_->get(id))
            {
                return id;
            }
        }
    }

} // namespace peerdrop::server
