/**
 * PeerDrop - Rendezvous types, connection-setup signals and the coordinator service interface.
 *
 * The coordinator relays signals as opaque text. Only peers interpret them, through the
 * closed Signal union below.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "peerdrop/status.hpp"

namespace peerdrop
{

    using Timestamp = std::chrono::system_clock::time_point;

    std::int64_t to_unix_millis(Timestamp time) noexcept;
    Timestamp from_unix_millis(std::int64_t millis) noexcept;

    struct SessionTicket
    {
        std::string session_id;
        std::string code;
    };

    void to_json(nlohmann::json &json, const SessionTicket &ticket);
    void from_json(const nlohmann::json &json, SessionTicket &ticket);

    struct SessionInfo
    {
        std::string session_id;
        Timestamp created_at{};
        std::size_t peer_count{};
        bool is_locked{};
        bool is_expired{};
    };

    void to_json(nlohmann::json &json, const SessionInfo &info);
    void from_json(const nlohmann::json &json, SessionInfo &info);

    struct OfferSignal
    {
        std::string sdp;
    };

    struct AnswerSignal
    {
        std::string sdp;
    };

    struct IceCandidateSignal
    {
        std::string candidate;
    };

    using Signal = std::variant<OfferSignal, AnswerSignal, IceCandidateSignal>;

    // Number of payload characters that take part in a signal fingerprint.
    constexpr std::size_t kFingerprintPrefix = 64;

    std::string_view signal_type(const Signal &signal) noexcept;

    std::string encode_signal(const Signal &signal);

    // Returns nullopt for malformed JSON or an unknown "type" tag.
    std::optional<Signal> decode_signal(std::string_view text);

    // Identity used to skip redelivered signals: tag plus a prefix of the payload.
    std::string fingerprint(const Signal &signal);

    /**
     * Rendezvous operations shared by the in-process coordinator and the remote RPC client.
     */
    class SignalingService
    {
    public:
        virtual ~SignalingService() = default;

        virtual SessionTicket create_session() = 0;

        virtual Result<std::string> register_peer(const std::string &code, const std::string &peer_id) = 0;

        virtual Status send_signal(const std::string &session_id, const std::string &from_peer_id,
                                   const std::string &payload) = 0;

        // Read only: the mailbox is left intact.
        virtual Result<std::vector<std::string>> poll_signals(const std::string &session_id,
                                                              const std::string &peer_id) = 0;

        virtual Status clear_signals(const std::string &session_id, const std::string &peer_id) = 0;

        // Read only: an expired session is reported with is_expired set, never removed.
        virtual std::optional<SessionInfo> get_session_info(const std::string &code) = 0;
    };

} // namespace peerdrop
