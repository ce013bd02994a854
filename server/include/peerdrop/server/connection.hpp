#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "peerdrop/error_codes.hpp"
#include "peerdrop/protocol.hpp"
#include "peerdrop/server/coordinator.hpp"

namespace peerdrop::server
{

    /**
     * One client socket speaking the framed JSON coordinator RPC.
     */
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, Coordinator &coordinator);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const peerdrop::protocol::ResponseEnvelope &envelope);
        void send_ok(nlohmann::json payload, const std::optional<std::string> &request_id);
        void send_error(peerdrop::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);
        void send_status(const Status &status, const std::optional<std::string> &request_id);

        void handle_create_session(const peerdrop::protocol::RequestEnvelope &envelope);
        void handle_register_peer(const peerdrop::protocol::RequestEnvelope &envelope);
        void handle_send_signal(const peerdrop::protocol::RequestEnvelope &envelope);
        void handle_poll_signals(const peerdrop::protocol::RequestEnvelope &envelope);
        void handle_clear_signals(const peerdrop::protocol::RequestEnvelope &envelope);
        void handle_get_session_info(const peerdrop::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        Coordinator &coordinator_;

        std::array<std::uint8_t, 4> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool stopped_{false};
    };

} // namespace peerdrop::server
