#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

#include "peerdrop/client/cancellation.hpp"
#include "peerdrop/client/direct_link.hpp"
#include "peerdrop/client/file_io.hpp"
#include "peerdrop/client/logger.hpp"
#include "peerdrop/client/transfer_options.hpp"
#include "peerdrop/status.hpp"
#include "peerdrop/transfer_frames.hpp"

namespace peerdrop::client
{

    enum class SenderState
    {
        Idle,
        Calibrating,
        SendingMetadata,
        SendingChunks,
        Complete,
        Aborted
    };

    std::string_view to_string(SenderState state) noexcept;

    struct SenderProgress
    {
        std::uint64_t chunk_size{};
        std::uint64_t chunks_delivered{};
        std::uint64_t total_chunks{};
        std::uint64_t bytes_transferred{};
        double bytes_per_second{};
        std::uint64_t stalls{};
    };

    /**
     * Sending half of the transfer engine.
     *
     * Idle -> Calibrating -> SendingMetadata -> SendingChunks -> Complete, or Aborted on
     * rejection, timeout, link failure or cancellation. The whole payload is prepared (and
     * compressed when eligible) before metadata goes out; chunking then works on those bytes.
     */
    class TransferSender
    {
    public:
        using ProgressCallback = std::function<void(const SenderProgress &)>;

        TransferSender(DirectLink &link, FileSource &source, Logger logger, TransferOptions options,
                       ProgressCallback on_progress = {});

        Status run(const CancellationToken &cancel);

        // Individual steps; run() calls them in order.
        void calibrate();
        Status prepare();
        Result<std::uint64_t> send_metadata(const CancellationToken &cancel);
        Status send_chunks(std::uint64_t from_chunk, const CancellationToken &cancel);

        SenderState state() const noexcept { return state_; }
        const SenderProgress &progress() const noexcept { return progress_; }
        const peerdrop::transfer::FileMetadata &metadata() const noexcept { return metadata_; }

    private:
        void wait_for_drain(const CancellationToken &cancel);
        void update_speed();
        Status abort(Status status);
        void transition(SenderState next);

        DirectLink &link_;
        FileSource &source_;
        Logger logger_;
        TransferOptions options_;
        ProgressCallback on_progress_;

        SenderState state_{SenderState::Idle};
        SenderProgress progress_{};
        peerdrop::transfer::FileMetadata metadata_{};
        std::vector<std::uint8_t> payload_;

        std::chrono::steady_clock::time_point started_at_{};
        std::chrono::steady_clock::time_point speed_sampled_at_{};
    };

} // namespace peerdrop::client
