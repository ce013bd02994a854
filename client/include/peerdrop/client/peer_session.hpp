#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "peerdrop/client/cancellation.hpp"
#include "peerdrop/client/checkpoint_store.hpp"
#include "peerdrop/client/config.hpp"
#include "peerdrop/client/connection_setup.hpp"
#include "peerdrop/client/direct_link.hpp"
#include "peerdrop/client/file_io.hpp"
#include "peerdrop/client/logger.hpp"
#include "peerdrop/client/transfer_options.hpp"
#include "peerdrop/client/transfer_receiver.hpp"
#include "peerdrop/client/transfer_sender.hpp"
#include "peerdrop/signaling.hpp"
#include "peerdrop/status.hpp"

namespace peerdrop::client
{

    using LinkFactory = std::function<std::unique_ptr<DirectLink>()>;

    /**
     * One peer's end of a file exchange: the send and receive command flows.
     *
     * A flow owns its link, setup machine and transfer machine for its whole duration and
     * tears them down before returning, whatever the outcome. Flows and abandon() must run on
     * the same thread; other threads (or a signal handler) stop a running flow through
     * cancellation().cancel().
     */
    class PeerSession
    {
    public:
        PeerSession(ClientConfig config, SignalingService &signaling, Logger logger, LinkFactory make_link = {});

        // Runs the flow selected by the config against disk files; returns the process exit code.
        int run();

        Status send(FileSource &source);

        Status receive(const std::string &code, FileSink &sink, CheckpointStore &checkpoints);

        // Stops polling, closes the direct link, then clears transfer state.
        void abandon();

        CancellationToken &cancellation() noexcept { return cancel_; }

        const std::string &peer_id() const noexcept { return peer_id_; }
        const TransferOptions &options() const noexcept { return options_; }

        // Called once the sender's session exists, with the code to share.
        void on_ticket(std::function<void(const SessionTicket &)> callback) { on_ticket_ = std::move(callback); }

    private:
        bool confirm(const std::string &question) const;
        void print_progress(std::uint64_t done, std::uint64_t total);
        Status connect(SetupRole role);
        void drain_link();
        Status finish(Status status);
        void teardown();

        ClientConfig config_;
        SignalingService &signaling_;
        Logger logger_;
        LinkFactory make_link_;
        TransferOptions options_;
        std::string peer_id_;
        CancellationToken cancel_;
        std::function<void(const SessionTicket &)> on_ticket_;

        std::optional<std::string> session_id_;
        std::optional<std::string> code_;
        std::unique_ptr<DirectLink> link_;
        std::unique_ptr<ConnectionSetup> setup_;
        std::unique_ptr<TransferSender> sender_;
        std::unique_ptr<TransferReceiver> receiver_;
        int last_percent_{-1};
    };

    // peer_<9 base36 chars>_<unix millis>
    std::string generate_peer_id();

} // namespace peerdrop::client
