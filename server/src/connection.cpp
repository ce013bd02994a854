#include "peerdrop/server/connection.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <span>
#include <string>

#include "peerdrop/framing.hpp"

#include <spdlog/spdlog.h>

namespace peerdrop::server
{

    using peerdrop::protocol::Command;
    using peerdrop::protocol::RequestEnvelope;
    using peerdrop::protocol::ResponseEnvelope;
    using peerdrop::protocol::ResponseKind;

    Connection::Connection(asio::ip::tcp::socket socket, Coordinator &coordinator)
        : socket_(std::move(socket)), coordinator_(coordinator) {}

    void Connection::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Connection::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::debug("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Connection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const std::uint32_t payload_size = peerdrop::protocol::read_u32_be(header_buffer_);
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             if (payload_size > peerdrop::protocol::kMaxFrameSize)
                             {
                                 spdlog::warn("Oversized frame ({} bytes) from {}", payload_size, remote_endpoint());
                                 stop();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Connection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 const auto json = nlohmann::json::parse(payload);
                                 process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(peerdrop::ErrorCode::InvalidPayload, ex.what());
                             }
                             read_frame_header();
                         });
    }

    void Connection::process_message(const nlohmann::json &json)
    {
        RequestEnvelope envelope;
        try
        {
            envelope = json.get<RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(peerdrop::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), peerdrop::protocol::to_string(envelope.command));

        try
        {
            switch (envelope.command)
            {
            case Command::CreateSession:
                handle_create_session(envelope);
                break;
            case Command::RegisterPeer:
                handle_register_peer(envelope);
                break;
            case Command::SendSignal:
                handle_send_signal(envelope);
                break;
            case Command::PollSignals:
                handle_poll_signals(envelope);
                break;
            case Command::ClearSignals:
                handle_clear_signals(envelope);
                break;
            case Command::GetSessionInfo:
                handle_get_session_info(envelope);
                break;
            case Command::Ping:
                send_ok(nlohmann::json::object(), envelope.request_id);
                break;
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(peerdrop::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} failed: {}", peerdrop::protocol::to_string(envelope.command), ex.what());
            send_error(peerdrop::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Connection::send_response(const ResponseEnvelope &envelope)
    {
        try
        {
            const auto json = nlohmann::json(envelope);
            auto frame = std::make_shared<std::vector<std::uint8_t>>(peerdrop::protocol::encode_frame(json));
            auto self = shared_from_this();
            asio::async_write(socket_, asio::buffer(*frame),
                              [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                              {
                                  if (ec)
                                  {
                                      stop();
                                  }
                              });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", remote_endpoint(), ex.what());
            stop();
        }
    }

    void Connection::send_ok(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Ok;
        envelope.error = peerdrop::ErrorCode::Ok;
        envelope.payload = std::move(payload);
        envelope.request_id = request_id;
        send_response(envelope);
    }

    void Connection::send_error(peerdrop::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    void Connection::send_status(const Status &status, const std::optional<std::string> &request_id)
    {
        if (status.ok())
        {
            send_ok(nlohmann::json::object(), request_id);
            return;
        }
        send_error(status.code, status.message, request_id);
    }

    void Connection::handle_create_session(const RequestEnvelope &envelope)
    {
        const auto ticket = coordinator_.create_session();
        send_ok(ticket, envelope.request_id);
    }

    void Connection::handle_register_peer(const RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<peerdrop::protocol::RegisterPeerRequest>();
        const auto result = coordinator_.register_peer(request.code, request.peer_id);
        if (!result)
        {
            send_status(result.status(), envelope.request_id);
            return;
        }
        send_ok({{"session_id", result.value()}}, envelope.request_id);
    }

    void Connection::handle_send_signal(const RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<peerdrop::protocol::SendSignalRequest>();
        send_status(coordinator_.send_signal(request.session_id, request.peer_id, request.signal), envelope.request_id);
    }

    void Connection::handle_poll_signals(const RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<peerdrop::protocol::MailboxRequest>();
        const auto result = coordinator_.poll_signals(request.session_id, request.peer_id);
        if (!result)
        {
            send_status(result.status(), envelope.request_id);
            return;
        }
        send_ok({{"signals", result.value()}}, envelope.request_id);
    }

    void Connection::handle_clear_signals(const RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<peerdrop::protocol::MailboxRequest>();
        send_status(coordinator_.clear_signals(request.session_id, request.peer_id), envelope.request_id);
    }

    void Connection::handle_get_session_info(const RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<peerdrop::protocol::SessionInfoRequest>();
        send_ok(peerdrop::protocol::session_info_payload(coordinator_.get_session_info(request.code)),
                envelope.request_id);
    }

    std::string Connection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "<unknown>";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace peerdrop::server
