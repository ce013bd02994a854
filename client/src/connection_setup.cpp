#include "peerdrop/client/connection_setup.hpp"

#include <stdexcept>

namespace peerdrop::client
{

    namespace
    {

        bool is_terminal_coordinator_error(ErrorCode code) noexcept
        {
            return code == ErrorCode::NotFound || code == ErrorCode::Expired || code == ErrorCode::PeerNotRegistered;
        }

    } // namespace

    std::string_view to_string(SetupState state) noexcept
    {
        switch (state)
        {
        case SetupState::Idle:
            return "idle";
        case SetupState::AwaitingPeer:
            return "awaiting_peer";
        case SetupState::Offering:
            return "offering";
        case SetupState::Answering:
            return "answering";
        case SetupState::DescriptionExchanged:
            return "description_exchanged";
        case SetupState::LinkOpen:
            return "link_open";
        case SetupState::Failed:
            return "failed";
        }
        return "unknown";
    }

    ConnectionSetup::ConnectionSetup(SignalingService &signaling, DirectLink &link, Logger logger, SetupContext context)
        : signaling_(signaling), link_(link), logger_(std::move(logger)), context_(std::move(context)) {}

    void ConnectionSetup::start()
    {
        if (state_ != SetupState::Idle)
        {
            return;
        }
        logger_.log("setup", "session ", context_.session_id, " peer ", context_.peer_id, " role ",
                    context_.role == SetupRole::Initiator ? "initiator" : "joiner");
        transition(SetupState::AwaitingPeer);
    }

    SetupState ConnectionSetup::tick()
    {
        if (state_ == SetupState::Idle || terminal())
        {
            return state_;
        }

        const bool waiting_for_joiner = context_.role == SetupRole::Initiator && state_ == SetupState::AwaitingPeer;
        if (waiting_for_joiner)
        {
            check_peer_joined();
        }
        if (!terminal() && !(context_.role == SetupRole::Initiator && state_ == SetupState::AwaitingPeer))
        {
            poll_mailbox();
        }
        if (!terminal())
        {
            process_link_events();
        }
        return state_;
    }

    Status ConnectionSetup::run(const CancellationToken &cancel, const TransferOptions &options)
    {
        start();
        const auto deadline = std::chrono::steady_clock::now() + options.setup_timeout;
        while (!terminal())
        {
            tick();
            if (terminal())
            {
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                fail(Status::failure(ErrorCode::Timeout, "Timed out establishing the direct link"));
                break;
            }
            if (cancel.wait_for(options.poll_interval))
            {
                fail(Status::failure(ErrorCode::Cancelled, "Connection setup cancelled"));
                break;
            }
        }
        return state_ == SetupState::LinkOpen ? Status::success() : failure_;
    }

    void ConnectionSetup::check_peer_joined()
    {
        std::optional<SessionInfo> info;
        try
        {
            info = signaling_.get_session_info(context_.code);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("signal", "session lookup failed, retrying: ", ex.what());
            return;
        }
        if (!info)
        {
            fail(Status::failure(ErrorCode::NotFound, "Session not found"));
            return;
        }
        if (info->is_expired)
        {
            fail(Status::failure(ErrorCode::Expired, "Session expired"));
            return;
        }
        if (info->peer_count < 2)
        {
            return;
        }

        logger_.log("setup", "peer joined session ", context_.session_id);
        transition(SetupState::Offering);
        std::string offer;
        try
        {
            offer = link_.create_offer();
        }
        catch (const std::exception &ex)
        {
            fail(Status::failure(ErrorCode::LinkFailed, std::string("Unable to create offer: ") + ex.what()));
            return;
        }
        if (!send(OfferSignal{offer}))
        {
            return;
        }
        offer_sent_ = true;
        transition(SetupState::DescriptionExchanged);
    }

    void ConnectionSetup::poll_mailbox()
    {
        std::vector<std::string> payloads;
        try
        {
            auto result = signaling_.poll_signals(context_.session_id, context_.peer_id);
            if (!result)
            {
                if (is_terminal_coordinator_error(result.error()))
                {
                    fail(result.status());
                    return;
                }
                logger_.warn("signal", "poll failed, retrying: ", result.message());
                return;
            }
            payloads = std::move(result).value();
        }
        catch (const std::exception &ex)
        {
            logger_.warn("signal", "poll failed, retrying: ", ex.what());
            return;
        }

        bool consumed = false;
        for (const auto &payload : payloads)
        {
            const auto signal = decode_signal(payload);
            if (!signal)
            {
                if (seen_.insert("malformed:" + payload.substr(0, kFingerprintPrefix)).second)
                {
                    logger_.warn("signal", "skipping malformed signal");
                    consumed = true;
                }
                continue;
            }
            if (!seen_.insert(fingerprint(*signal)).second)
            {
                continue;
            }
            consumed = true;
            handle(*signal);
            if (state_ == SetupState::Failed)
            {
                return;
            }
        }

        if (!consumed)
        {
            return;
        }
        try
        {
            const auto status = signaling_.clear_signals(context_.session_id, context_.peer_id);
            if (!status.ok())
            {
                logger_.warn("signal", "clear failed: ", status.message);
            }
        }
        catch (const std::exception &ex)
        {
            logger_.warn("signal", "clear failed: ", ex.what());
        }
    }

    void ConnectionSetup::process_link_events()
    {
        for (auto &event : link_.drain_events())
        {
            if (const auto *discovered = std::get_if<CandidateDiscovered>(&event))
            {
                logger_.log("setup", "local candidate ", discovered->candidate);
                if (!send(IceCandidateSignal{discovered->candidate}))
                {
                    return;
                }
                continue;
            }

            const auto &changed = std::get<StateChanged>(event);
            if (changed.state == LinkState::Connected)
            {
                logger_.log("setup", "direct link open (", changed.detail, ")");
                transition(SetupState::LinkOpen);
                return;
            }
            if (changed.state == LinkState::Failed)
            {
                fail(Status::failure(ErrorCode::LinkFailed, "Direct link failed: " + changed.detail));
                return;
            }
        }
    }

    void ConnectionSetup::handle(const Signal &signal)
    {
        logger_.log("signal", "received ", signal_type(signal));
        if (const auto *offer = std::get_if<OfferSignal>(&signal))
        {
            handle_offer(*offer);
        }
        else if (const auto *answer = std::get_if<AnswerSignal>(&signal))
        {
            handle_answer(*answer);
        }
        else
        {
            handle_candidate(std::get<IceCandidateSignal>(signal));
        }
    }

    void ConnectionSetup::handle_offer(const OfferSignal &offer)
    {
        if (context_.role != SetupRole::Joiner || state_ != SetupState::AwaitingPeer)
        {
            logger_.log("signal", "ignoring offer in state ", to_string(state_));
            return;
        }
        transition(SetupState::Answering);
        apply_remote_description(offer.sdp);
        if (state_ == SetupState::Failed)
        {
            return;
        }

        std::string answer;
        try
        {
            answer = link_.create_answer();
        }
        catch (const std::exception &ex)
        {
            fail(Status::failure(ErrorCode::LinkFailed, std::string("Unable to create answer: ") + ex.what()));
            return;
        }
        if (!send(AnswerSignal{answer}))
        {
            return;
        }
        transition(SetupState::DescriptionExchanged);
    }

    void ConnectionSetup::handle_answer(const AnswerSignal &answer)
    {
        if (context_.role != SetupRole::Initiator || !offer_sent_)
        {
            logger_.log("signal", "ignoring unexpected answer");
            return;
        }
        if (answer_applied_)
        {
            logger_.log("signal", "ignoring repeated answer");
            return;
        }
        answer_applied_ = true;
        apply_remote_description(answer.sdp);
    }

    void ConnectionSetup::handle_candidate(const IceCandidateSignal &candidate)
    {
        if (!remote_description_set_)
        {
            pending_candidates_.push_back(candidate.candidate);
            logger_.log("signal", "buffered candidate (", pending_candidates_.size(), " pending)");
            return;
        }
        try
        {
            link_.add_remote_candidate(candidate.candidate);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("signal", "candidate rejected: ", ex.what());
        }
    }

    void ConnectionSetup::apply_remote_description(const std::string &description)
    {
        try
        {
            link_.set_remote_description(description);
        }
        catch (const std::exception &ex)
        {
            fail(Status::failure(ErrorCode::LinkFailed, std::string("Remote description rejected: ") + ex.what()));
            return;
        }
        remote_description_set_ = true;

        // Candidates that arrived early are applied in arrival order.
        auto pending = std::move(pending_candidates_);
        pending_candidates_.clear();
        for (const auto &candidate : pending)
        {
            handle_candidate(IceCandidateSignal{candidate});
        }
    }

    bool ConnectionSetup::send(const Signal &signal)
    {
        Status status;
        try
        {
            status = signaling_.send_signal(context_.session_id, context_.peer_id, encode_signal(signal));
        }
        catch (const std::exception &ex)
        {
            status = Status::failure(ErrorCode::InternalError, ex.what());
        }
        if (!status.ok())
        {
            fail(Status::failure(status.code, "Failed to send " + std::string(signal_type(signal)) + ": " + status.message));
            return false;
        }
        logger_.log("signal", "sent ", signal_type(signal));
        return true;
    }

    void ConnectionSetup::transition(SetupState next)
    {
        logger_.log("setup", to_string(state_), " -> ", to_string(next));
        state_ = next;
    }

    void ConnectionSetup::fail(Status status)
    {
        if (terminal())
        {
            return;
        }
        logger_.error("setup failed in state ", to_string(state_), ": ", status.message);
        failure_ = std::move(status);
        state_ = SetupState::Failed;
    }

} // namespace peerdrop::client
