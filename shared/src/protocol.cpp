#include "peerdrop/protocol.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace peerdrop::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 7> kCommandMappings{{
            {Command::CreateSession, "CREATE_SESSION"},
            {Command::RegisterPeer, "REGISTER_PEER"},
            {Command::SendSignal, "SEND_SIGNAL"},
            {Command::PollSignals, "POLL_SIGNALS"},
            {Command::ClearSignals, "CLEAR_SIGNALS"},
            {Command::GetSessionInfo, "GET_SESSION_INFO"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};
    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        if (auto it = json.find("id"); it != json.end())
        {
            envelope.request_id = it->get<std::string>();
        }
        else
        {
            envelope.request_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        if (auto it = json.find("id"); it != json.end())
        {
            envelope.request_id = it->get<std::string>();
        }
        else
        {
            envelope.request_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const RegisterPeerRequest &request)
    {
        json = {
            {"code", request.code},
            {"peer_id", request.peer_id},
        };
    }

    void from_json(const nlohmann::json &json, RegisterPeerRequest &request)
    {
        request.code = json.at("code").get<std::string>();
        request.peer_id = json.at("peer_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const SendSignalRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"peer_id", request.peer_id},
            {"signal", request.signal},
        };
    }

    void from_json(const nlohmann::json &json, SendSignalRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.peer_id = json.at("peer_id").get<std::string>();
        request.signal = json.at("signal").get<std::string>();
    }

    void to_json(nlohmann::json &json, const MailboxRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"peer_id", request.peer_id},
        };
    }

    void from_json(const nlohmann::json &json, MailboxRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.peer_id = json.at("peer_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const SessionInfoRequest &request)
    {
        json = {{"code", request.code}};
    }

    void from_json(const nlohmann::json &json, SessionInfoRequest &request)
    {
        request.code = json.at("code").get<std::string>();
    }

    nlohmann::json session_info_payload(const std::optional<SessionInfo> &info)
    {
        nlohmann::json payload = {{"found", info.has_value()}};
        if (info)
        {
            payload["info"] = *info;
        }
        return payload;
    }

    std::optional<SessionInfo> session_info_from_payload(const nlohmann::json &payload)
    {
        if (!payload.value("found", false))
        {
            return std::nullopt;
        }
        return payload.at("info").get<SessionInfo>();
    }

} // namespace peerdrop::protocol
