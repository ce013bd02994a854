#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "peerdrop/client/cancellation.hpp"
#include "peerdrop/client/checkpoint_store.hpp"
#include "peerdrop/client/direct_link.hpp"
#include "peerdrop/client/file_io.hpp"
#include "peerdrop/client/logger.hpp"
#include "peerdrop/client/transfer_options.hpp"
#include "peerdrop/signaling.hpp"
#include "peerdrop/status.hpp"
#include "peerdrop/transfer_frames.hpp"

namespace peerdrop::client
{

    enum class ReceiverState
    {
        Idle,
        AwaitingMetadata,
        AwaitingAcceptance,
        ReceivingChunks,
        Reassembling,
        Complete,
        Rejected,
        Failed
    };

    std::string_view to_string(ReceiverState state) noexcept;

    struct ReceiverProgress
    {
        std::uint64_t chunk_size{};
        std::uint64_t chunks_received{};
        std::uint64_t total_chunks{};
        std::uint64_t bytes_received{};
    };

    struct ReceiverCallbacks
    {
        // Preview of the offered file; false rejects it. Accepts when unset.
        std::function<bool(const peerdrop::transfer::FileMetadata &)> accept_file;
        // Offered when a live checkpoint matches the file name; false discards it. Resumes when unset.
        std::function<bool(const peerdrop::transfer::FileMetadata &, const ResumeCheckpoint &)> accept_resume;
        std::function<void(const ReceiverProgress &)> on_progress;
    };

    /**
     * Receiving half of the transfer engine.
     *
     * Idle -> AwaitingMetadata -> AwaitingAcceptance -> ReceivingChunks -> Reassembling -> Complete,
     * with Rejected when the user declines and Failed on protocol, integrity or link errors.
     * Messages are fed through on_message(); run() pulls them from the link.
     */
    class TransferReceiver
    {
    public:
        using Clock = std::function<Timestamp()>;

        TransferReceiver(DirectLink &link, FileSink &sink, CheckpointStore &checkpoints, Logger logger,
                         std::string code, TransferOptions options, ReceiverCallbacks callbacks = {},
                         Clock clock = [] { return std::chrono::system_clock::now(); });

        void start();

        Status on_message(const LinkMessage &message);

        Status run(const CancellationToken &cancel);

        ReceiverState state() const noexcept { return state_; }
        const ReceiverProgress &progress() const noexcept { return progress_; }
        const std::optional<peerdrop::transfer::FileMetadata> &metadata() const noexcept { return metadata_; }
        const std::optional<std::string> &delivered_to() const noexcept { return delivered_to_; }
        bool expecting_payload() const noexcept { return pending_chunk_.has_value(); }
        std::vector<std::uint64_t> received_indices() const;

    private:
        bool terminal() const noexcept;

        Status on_text(const std::string &text);
        Status on_binary(std::vector<std::uint8_t> data);
        Status on_metadata(const peerdrop::transfer::FileMetadata &metadata);
        Status on_chunk_header(const peerdrop::transfer::ChunkHeaderFrame &header);
        Status on_complete();

        std::optional<ResumeCheckpoint> live_checkpoint(const peerdrop::transfer::FileMetadata &metadata);
        void save_checkpoint();
        void respond(const peerdrop::transfer::Frame &frame);
        void transition(ReceiverState next);
        Status fail(Status status);

        DirectLink &link_;
        FileSink &sink_;
        CheckpointStore &checkpoints_;
        Logger logger_;
        std::string code_;
        TransferOptions options_;
        ReceiverCallbacks callbacks_;
        Clock clock_;

        ReceiverState state_{ReceiverState::Idle};
        Status failure_{};
        ReceiverProgress progress_{};
        std::optional<peerdrop::transfer::FileMetadata> metadata_;
        std::map<std::uint64_t, std::vector<std::uint8_t>> chunks_;
        std::optional<peerdrop::transfer::ChunkHeaderFrame> pending_chunk_;
        std::uint64_t chunks_since_checkpoint_{0};
        std::optional<std::string> delivered_to_;
    };

} // namespace peerdrop::client
