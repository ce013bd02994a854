/**
 * PeerDrop - Coordinator RPC schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "peerdrop/error_codes.hpp"
#include "peerdrop/signaling.hpp"

namespace peerdrop::protocol
{

    enum class Command : std::uint8_t
    {
        CreateSession,
        RegisterPeer,
        SendSignal,
        PollSignals,
        ClearSignals,
        GetSessionInfo,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct RegisterPeerRequest
    {
        std::string code;
        std::string peer_id;
    };

    void to_json(nlohmann::json &json, const RegisterPeerRequest &request);
    void from_json(const nlohmann::json &json, RegisterPeerRequest &request);

    struct SendSignalRequest
    {
        std::string session_id;
        std::string peer_id;
        std::string signal;
    };

    void to_json(nlohmann::json &json, const SendSignalRequest &request);
    void from_json(const nlohmann::json &json, SendSignalRequest &request);

    // Shared by POLL_SIGNALS and CLEAR_SIGNALS.
    struct MailboxRequest
    {
        std::string session_id;
        std::string peer_id;
    };

    void to_json(nlohmann::json &json, const MailboxRequest &request);
    void from_json(const nlohmann::json &json, MailboxRequest &request);

    struct SessionInfoRequest
    {
        std::string code;
    };

    void to_json(nlohmann::json &json, const SessionInfoRequest &request);
    void from_json(const nlohmann::json &json, SessionInfoRequest &request);

    // GET_SESSION_INFO answers with {"found": false} or {"found": true, "info": {...}}.
    nlohmann::json session_info_payload(const std::optional<SessionInfo> &info);
    std::optional<SessionInfo> session_info_from_payload(const nlohmann::json &payload);

} // namespace peerdrop::protocol
