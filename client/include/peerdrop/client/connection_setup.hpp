#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "peerdrop/client/cancellation.hpp"
#include "peerdrop/client/transfer_options.hpp"
#include "peerdrop/client/direct_link.hpp"
#include "peerdrop/client/logger.hpp"
#include "peerdrop/signaling.hpp"

namespace peerdrop::client
{

    enum class SetupState
    {
        Idle,
        AwaitingPeer,
        Offering,
        Answering,
        DescriptionExchanged,
        LinkOpen,
        Failed
    };

    std::string_view to_string(SetupState state) noexcept;

    enum class SetupRole
    {
        // Created the session; sends the offer once the joiner registers.
        Initiator,
        // Joined with a code; answers the first offer.
        Joiner
    };

    struct SetupContext
    {
        SetupRole role{SetupRole::Initiator};
        std::string session_id;
        std::string code;
        std::string peer_id;
    };

    /**
     * Turns coordinator-relayed signals into an open DirectLink.
     *
     * Idle -> AwaitingPeer -> (Offering | Answering) -> DescriptionExchanged -> LinkOpen, with
     * Failed reachable from every non-terminal state. Each tick() performs one poll round; run()
     * repeats it at the poll interval until the link opens, setup fails, the timeout elapses or
     * the token is cancelled.
     */
    class ConnectionSetup
    {
    public:
        ConnectionSetup(SignalingService &signaling, DirectLink &link, Logger logger, SetupContext context);

        void start();

        SetupState tick();

        Status run(const CancellationToken &cancel, const TransferOptions &options);

        SetupState state() const noexcept { return state_; }

        const Status &failure() const noexcept { return failure_; }

        bool remote_description_set() const noexcept { return remote_description_set_; }

        std::size_t buffered_candidates() const noexcept { return pending_candidates_.size(); }

        std::size_t signals_handled() const noexcept { return seen_.size(); }

    private:
        bool terminal() const noexcept { return state_ == SetupState::LinkOpen || state_ == SetupState::Failed; }

        void check_peer_joined();
        void poll_mailbox();
        void process_link_events();

        void handle(const Signal &signal);
        void handle_offer(const OfferSignal &offer);
        void handle_answer(const AnswerSignal &answer);
        void handle_candidate(const IceCandidateSignal &candidate);

        void apply_remote_description(const std::string &description);
        bool send(const Signal &signal);
        void transition(SetupState next);
        void fail(Status status);

        SignalingService &signaling_;
        DirectLink &link_;
        Logger logger_;
        SetupContext context_;

        SetupState state_{SetupState::Idle};
        Status failure_{};
        bool offer_sent_{false};
        bool answer_applied_{false};
        bool remote_description_set_{false};
        std::vector<std::string> pending_candidates_;
        std::unordered_set<std::string> seen_;
    };

} // namespace peerdrop::client
