#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstdint>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "peerdrop/client/logger.hpp"
#include "peerdrop/protocol.hpp"
#include "peerdrop/signaling.hpp"

namespace peerdrop::client
{

    /**
     * SignalingService backed by a peerdrop-server over the framed JSON RPC.
     *
     * Calls are blocking and serialized. A socket error closes the connection and propagates as
     * std::system_error; the next call reconnects.
     */
    class RemoteCoordinator : public SignalingService
    {
    public:
        RemoteCoordinator(std::string host, std::uint16_t port, Logger logger);

        void connect();

        void ping();

        SessionTicket create_session() override;
        Result<std::string> register_peer(const std::string &code, const std::string &peer_id) override;
        Status send_signal(const std::string &session_id, const std::string &from_peer_id,
                           const std::string &payload) override;
        Result<std::vector<std::string>> poll_signals(const std::string &session_id,
                                                      const std::string &peer_id) override;
        Status clear_signals(const std::string &session_id, const std::string &peer_id) override;
        std::optional<SessionInfo> get_session_info(const std::string &code) override;

    private:
        peerdrop::protocol::ResponseEnvelope rpc(peerdrop::protocol::Command command,
                                                 const nlohmann::json &payload = nlohmann::json::object());
        void connect_locked();
        std::string next_request_id();

        std::string host_;
        std::uint16_t port_;
        Logger logger_;

        std::mutex mutex_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::uint64_t request_counter_{0};
    };

} // namespace peerdrop::client
