#include "peerdrop/client/remote_coordinator.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "peerdrop/error_codes.hpp"
#include "peerdrop/framing.hpp"

namespace peerdrop::client
{

    using peerdrop::protocol::Command;
    using peerdrop::protocol::ResponseEnvelope;
    using peerdrop::protocol::ResponseKind;

    namespace
    {

        Status to_status(const ResponseEnvelope &response)
        {
            if (response.kind == ResponseKind::Ok)
            {
                return Status::success();
            }
            // An error response must never read as success.
            const auto code = response.error == ErrorCode::Ok ? ErrorCode::InternalError : response.error;
            return Status::failure(code, response.message);
        }

    } // namespace

    RemoteCoordinator::RemoteCoordinator(std::string host, std::uint16_t port, Logger logger)
        : host_(std::move(host)), port_(port), logger_(std::move(logger)), socket_(io_context_) {}

    void RemoteCoordinator::connect()
    {
        std::lock_guard lock(mutex_);
        connect_locked();
    }

    void RemoteCoordinator::ping()
    {
        const auto response = rpc(Command::Ping);
        if (response.kind != ResponseKind::Ok)
        {
            throw std::runtime_error("Coordinator ping failed: " + response.message);
        }
    }

    SessionTicket RemoteCoordinator::create_session()
    {
        const auto response = rpc(Command::CreateSession);
        if (response.kind != ResponseKind::Ok)
        {
            throw std::runtime_error("Coordinator could not create a session: " + response.message);
        }
        return response.payload.get<SessionTicket>();
    }

    Result<std::string> RemoteCoordinator::register_peer(const std::string &code, const std::string &peer_id)
    {
        const auto response = rpc(Command::RegisterPeer, peerdrop::protocol::RegisterPeerRequest{code, peer_id});
        auto status = to_status(response);
        if (!status.ok())
        {
            return status;
        }
        return response.payload.at("session_id").get<std::string>();
    }

    Status RemoteCoordinator::send_signal(const std::string &session_id, const std::string &from_peer_id,
                                          const std::string &payload)
    {
        return to_status(
            rpc(Command::SendSignal, peerdrop::protocol::SendSignalRequest{session_id, from_peer_id, payload}));
    }

    Result<std::vector<std::string>> RemoteCoordinator::poll_signals(const std::string &session_id,
                                                                     const std::string &peer_id)
    {
        const auto response = rpc(Command::PollSignals, peerdrop::protocol::MailboxRequest{session_id, peer_id});
        auto status = to_status(response);
        if (!status.ok())
        {
            return status;
        }
        return response.payload.at("signals").get<std::vector<std::string>>();
    }

    Status RemoteCoordinator::clear_signals(const std::string &session_id, const std::string &peer_id)
    {
        return to_status(rpc(Command::ClearSignals, peerdrop::protocol::MailboxRequest{session_id, peer_id}));
    }

    std::optional<SessionInfo> RemoteCoordinator::get_session_info(const std::string &code)
    {
        const auto response = rpc(Command::GetSessionInfo, peerdrop::protocol::SessionInfoRequest{code});
        if (response.kind != ResponseKind::Ok)
        {
            throw std::runtime_error("Session lookup failed: " + response.message);
        }
        return peerdrop::protocol::session_info_from_payload(response.payload);
    }

    ResponseEnvelope RemoteCoordinator::rpc(Command command, const nlohmann::json &payload)
    {
        std::lock_guard lock(mutex_);
        connect_locked();

        peerdrop::protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        std::vector<char> buffer;
        try
        {
            const auto frame = peerdrop::protocol::encode_frame(nlohmann::json(envelope));
            asio::write(socket_, asio::buffer(frame));

            std::array<std::uint8_t, 4> header{};
            asio::read(socket_, asio::buffer(header));
            const auto size = peerdrop::protocol::read_u32_be(header);
            if (size > peerdrop::protocol::kMaxFrameSize)
            {
                throw std::runtime_error("Oversized coordinator response");
            }
            buffer.resize(size);
            asio::read(socket_, asio::buffer(buffer.data(), buffer.size()));
        }
        catch (const std::exception &ex)
        {
            logger_.warn("rpc", "transport error cmd=", peerdrop::protocol::to_string(command), " msg=", ex.what());
            std::error_code ignored;
            socket_.close(ignored);
            throw;
        }

        ResponseEnvelope response;
        try
        {
            response = nlohmann::json::parse(std::string(buffer.begin(), buffer.end())).get<ResponseEnvelope>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.log("rpc", "parse_error size=", buffer.size(), " msg=", ex.what());
            throw std::runtime_error("Failed to decode coordinator response");
        }
        if (response.request_id && *response.request_id != *envelope.request_id)
        {
            std::error_code ignored;
            socket_.close(ignored);
            throw std::runtime_error("Coordinator response out of sequence");
        }

        if (response.kind == ResponseKind::Error)
        {
            logger_.log("rpc", "cmd=", peerdrop::protocol::to_string(command), " error=", peerdrop::to_string(response.error),
                        " msg=", response.message);
        }
        return response;
    }

    void RemoteCoordinator::connect_locked()
    {
        if (socket_.is_open())
        {
            return;
        }
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(host_, std::to_string(port_));
        asio::connect(socket_, results);
        logger_.log("rpc", "connected to ", host_, ':', port_);
    }

    std::string RemoteCoordinator::next_request_id()
    {
        return "req-" + std::to_string(++request_counter_);
    }

} // namespace peerdrop::client
