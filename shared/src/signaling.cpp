#include "peerdrop/signaling.hpp"

#include <algorithm>

namespace peerdrop
{

    namespace
    {
        template <class... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        Overloaded(Ts...) -> Overloaded<Ts...>;

        std::string prefix_of(const std::string &value)
        {
            return value.substr(0, std::min(value.size(), kFingerprintPrefix));
        }
    } // namespace

    std::int64_t to_unix_millis(Timestamp time) noexcept
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }

    Timestamp from_unix_millis(std::int64_t millis) noexcept
    {
        return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds{millis})};
    }

    void to_json(nlohmann::json &json, const SessionTicket &ticket)
    {
        json = {
            {"session_id", ticket.session_id},
            {"code", ticket.code},
        };
    }

    void from_json(const nlohmann::json &json, SessionTicket &ticket)
    {
        ticket.session_id = json.at("session_id").get<std::string>();
        ticket.code = json.at("code").get<std::string>();
    }

    void to_json(nlohmann::json &json, const SessionInfo &info)
    {
        json = {
            {"session_id", info.session_id},
            {"created_at", to_unix_millis(info.created_at)},
            {"peer_count", info.peer_count},
            {"is_locked", info.is_locked},
            {"is_expired", info.is_expired},
        };
    }

    void from_json(const nlohmann::json &json, SessionInfo &info)
    {
        info.session_id = json.at("session_id").get<std::string>();
        info.created_at = from_unix_millis(json.value("created_at", std::int64_t{0}));
        info.peer_count = json.value("peer_count", std::size_t{0});
        info.is_locked = json.value("is_locked", false);
        info.is_expired = json.value("is_expired", false);
    }

    std::string_view signal_type(const Signal &signal) noexcept
    {
        return std::visit(Overloaded{
                              [](const OfferSignal &) -> std::string_view
                              { return "offer"; },
                              [](const AnswerSignal &) -> std::string_view
                              { return "answer"; },
                              [](const IceCandidateSignal &) -> std::string_view
                              { return "ice-candidate"; },
                          },
                          signal);
    }

    std::string encode_signal(const Signal &signal)
    {
        nlohmann::json json = {{"type", signal_type(signal)}};
        std::visit(Overloaded{
                       [&](const OfferSignal &offer)
                       { json["sdp"] = offer.sdp; },
                       [&](const AnswerSignal &answer)
                       { json["sdp"] = answer.sdp; },
                       [&](const IceCandidateSignal &candidate)
                       { json["candidate"] = candidate.candidate; },
                   },
                   signal);
        return json.dump();
    }

    std::optional<Signal> decode_signal(std::string_view text)
    {
        const auto json = nlohmann::json::parse(text, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            return std::nullopt;
        }
        const auto type_it = json.find("type");
        if (type_it == json.end() || !type_it->is_string())
        {
            return std::nullopt;
        }
        const auto type = type_it->get<std::string>();
        if (type == "offer" || type == "answer")
        {
            const auto sdp_it = json.find("sdp");
            if (sdp_it == json.end() || !sdp_it->is_string())
            {
                return std::nullopt;
            }
            if (type == "offer")
            {
                return Signal{OfferSignal{sdp_it->get<std::string>()}};
            }
            return Signal{AnswerSignal{sdp_it->get<std::string>()}};
        }
        if (type == "ice-candidate")
        {
            const auto candidate_it = json.find("candidate");
            if (candidate_it == json.end() || !candidate_it->is_string())
            {
                return std::nullopt;
            }
            return Signal{IceCandidateSignal{candidate_it->get<std::string>()}};
        }
        return std::nullopt;
    }

    std::string fingerprint(const Signal &signal)
    {
        std::string result(signal_type(signal));
        result.push_back(':');
        std::visit(Overloaded{
                       [&](const OfferSignal &offer)
                       { result += prefix_of(offer.sdp); },
                       [&](const AnswerSignal &answer)
                       { result += prefix_of(answer.sdp); },
                       [&](const IceCandidateSignal &candidate)
                       { result += prefix_of(candidate.candidate); },
                   },
                   signal);
        return result;
    }

} // namespace peerdrop
