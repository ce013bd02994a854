#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace peerdrop::client
{

    enum class LinkState
    {
        New,
        Connecting,
        Connected,
        Failed,
        Closed
    };

    std::string_view to_string(LinkState state) noexcept;

    // Raised by send/receive once the link is failed or closed.
    class LinkError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct CandidateDiscovered
    {
        std::string candidate;
    };

    struct StateChanged
    {
        LinkState state{LinkState::New};
        std::string detail{};
    };

    using LinkEvent = std::variant<CandidateDiscovered, StateChanged>;

    struct TextMessage
    {
        std::string text;
    };

    struct BinaryMessage
    {
        std::vector<std::uint8_t> data;
    };

    using LinkMessage = std::variant<TextMessage, BinaryMessage>;

    /**
     * Ordered, message-oriented duplex channel negotiated through exchanged descriptions.
     *
     * The offering side calls create_offer(); the answering side calls set_remote_description()
     * followed by create_answer(). Candidates and state changes are queued as events and
     * collected with drain_events(), so the owning state machine decides when to act on them.
     */
    class DirectLink
    {
    public:
        virtual ~DirectLink() = default;

        // Sets and returns the local description of the offering side.
        virtual std::string create_offer() = 0;

        // Sets and returns the local description of the answering side. Requires a remote
        // description.
        virtual std::string create_answer() = 0;

        virtual void set_remote_description(const std::string &description) = 0;

        // Only valid once a remote description is set.
        virtual void add_remote_candidate(const std::string &candidate) = 0;

        virtual std::vector<LinkEvent> drain_events() = 0;

        virtual LinkState state() const = 0;

        virtual void send_text(std::string_view text) = 0;

        virtual void send_binary(std::span<const std::uint8_t> data) = 0;

        // Bytes handed to send_text/send_binary that the transport has not written yet.
        virtual std::uint64_t buffered_amount() const = 0;

        // Waits up to `timeout` for the next message. Throws LinkError once the link has failed
        // or closed and nothing is left to read.
        virtual std::optional<LinkMessage> receive(std::chrono::milliseconds timeout) = 0;

        virtual void close() = 0;
    };

} // namespace peerdrop::client
