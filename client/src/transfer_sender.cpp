#include "peerdrop/client/transfer_sender.hpp"

#include <algorithm>
#include <span>
#include <stdexcept>
#include <thread>

#include "peerdrop/client/progress.hpp"
#include "peerdrop/compression.hpp"
#include "peerdrop/crypto.hpp"

namespace peerdrop::client
{

    namespace
    {

        constexpr std::chrono::milliseconds kReceiveSlice{200};
        constexpr std::chrono::seconds kSpeedWindow{1};

        using Clock = std::chrono::steady_clock;

    } // namespace

    std::string_view to_string(SenderState state) noexcept
    {
        switch (state)
        {
        case SenderState::Idle:
            return "idle";
        case SenderState::Calibrating:
            return "calibrating";
        case SenderState::SendingMetadata:
            return "sending_metadata";
        case SenderState::SendingChunks:
            return "sending_chunks";
        case SenderState::Complete:
            return "complete";
        case SenderState::Aborted:
            return "aborted";
        }
        return "unknown";
    }

    TransferSender::TransferSender(DirectLink &link, FileSource &source, Logger logger, TransferOptions options,
                                   ProgressCallback on_progress)
        : link_(link),
          source_(source),
          logger_(std::move(logger)),
          options_(std::move(options)),
          on_progress_(std::move(on_progress)) {}

    Status TransferSender::run(const CancellationToken &cancel)
    {
        if (state_ != SenderState::Idle)
        {
            return Status::failure(ErrorCode::InternalError, "Sender already started");
        }
        calibrate();
        if (cancel.cancelled())
        {
            return abort(Status::failure(ErrorCode::Cancelled, "Transfer cancelled"));
        }
        if (auto status = prepare(); !status.ok())
        {
            return abort(std::move(status));
        }
        auto decision = send_metadata(cancel);
        if (!decision)
        {
            return decision.status();
        }
        return send_chunks(decision.value(), cancel);
    }

    void TransferSender::calibrate()
    {
        transition(SenderState::Calibrating);
        if (options_.fixed_chunk_size)
        {
            progress_.chunk_size = *options_.fixed_chunk_size;
            logger_.log("calibrate", "skipped, fixed chunk size ", progress_.chunk_size);
            return;
        }

        try
        {
            const std::vector<std::uint8_t> probe(static_cast<std::size_t>(options_.probe_size), 0);
            const auto started = Clock::now();
            const auto deadline = started + options_.probe_drain_cap;
            link_.send_binary(probe);
            while (link_.buffered_amount() > 0 && Clock::now() < deadline)
            {
                std::this_thread::sleep_for(options_.drain_poll);
            }
            const auto elapsed = Clock::now() - started;
            progress_.chunk_size = select_chunk_size(probe.size(), elapsed, options_.profile);
            logger_.log("calibrate", "probe ", probe.size(), " bytes in ",
                        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count(), " us, profile ",
                        to_string(options_.profile), ", chunk size ", progress_.chunk_size);
        }
        catch (const LinkError &ex)
        {
            progress_.chunk_size = kMinChunkSize;
            logger_.warn("calibrate", "probe failed (", ex.what(), "), using ", kMinChunkSize);
        }
    }

    Status TransferSender::prepare()
    {
        if (progress_.chunk_size == 0)
        {
            progress_.chunk_size = kMinChunkSize;
        }

        const auto size = source_.size();
        auto bytes = source_.read(0, size);
        if (bytes.size() != size)
        {
            return Status::failure(ErrorCode::InternalError, "Short read from " + source_.name());
        }

        metadata_ = {};
        metadata_.file_name = source_.name();
        metadata_.mime_type = source_.mime_type().empty() ? peerdrop::compression::guess_mime_type(metadata_.file_name)
                                                          : source_.mime_type();
        metadata_.original_size = size;

        if (options_.compress && peerdrop::compression::should_compress(metadata_.mime_type, metadata_.file_name, size))
        {
            try
            {
                auto compressed = peerdrop::compression::deflate_bytes(bytes);
                if (compressed.size() < bytes.size())
                {
                    logger_.log("send", "compressed ", format_file_size(size), " to ", format_file_size(compressed.size()));
                    bytes = std::move(compressed);
                    metadata_.is_compressed = true;
                }
                else
                {
                    logger_.log("send", "compression did not shrink ", metadata_.file_name, ", sending as is");
                }
            }
            catch (const std::runtime_error &ex)
            {
                logger_.warn("send", "compression failed, sending as is: ", ex.what());
            }
        }

        payload_ = std::move(bytes);
        metadata_.declared_size = payload_.size();
        metadata_.chunk_size = progress_.chunk_size;
        metadata_.total_chunks = peerdrop::transfer::chunk_count(metadata_.declared_size, metadata_.chunk_size);
        metadata_.content_hash = peerdrop::crypto::hash_bytes(payload_);
        progress_.total_chunks = metadata_.total_chunks;
        return Status::success();
    }

    Result<std::uint64_t> TransferSender::send_metadata(const CancellationToken &cancel)
    {
        using namespace peerdrop::transfer;

        transition(SenderState::SendingMetadata);
        try
        {
            link_.send_text(encode_frame(MetadataFrame{metadata_}));
        }
        catch (const LinkError &ex)
        {
            return abort(Status::failure(ErrorCode::LinkFailed, ex.what()));
        }
        logger_.log("send", "metadata ", metadata_.file_name, " ", metadata_.declared_size, " bytes in ",
                    metadata_.total_chunks, " chunks, compressed=", metadata_.is_compressed);

        const auto deadline = Clock::now() + options_.acceptance_timeout;
        while (true)
        {
            if (cancel.cancelled())
            {
                return abort(Status::failure(ErrorCode::Cancelled, "Transfer cancelled"));
            }
            const auto now = Clock::now();
            if (now >= deadline)
            {
                return abort(Status::failure(ErrorCode::Timeout, "Receiver did not answer the file offer"));
            }

            std::optional<LinkMessage> message;
            try
            {
                message = link_.receive(
                    std::min(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now), kReceiveSlice));
            }
            catch (const LinkError &ex)
            {
                return abort(Status::failure(ErrorCode::LinkFailed, ex.what()));
            }
            if (!message)
            {
                continue;
            }
            const auto *text = std::get_if<TextMessage>(&*message);
            if (text == nullptr)
            {
                continue;
            }
            const auto frame = decode_frame(text->text);
            if (!frame)
            {
                logger_.warn("send", "ignoring malformed control frame");
                continue;
            }
            if (std::holds_alternative<AcceptFrame>(*frame))
            {
                logger_.log("send", "receiver accepted");
                return std::uint64_t{0};
            }
            if (const auto *resume = std::get_if<ResumeFrame>(&*frame))
            {
                const auto from = std::min(resume->from_chunk, metadata_.total_chunks);
                logger_.log("send", "receiver resumes from chunk ", from);
                return from;
            }
            if (std::holds_alternative<RejectFrame>(*frame))
            {
                return abort(Status::failure(ErrorCode::Rejected, "File transfer rejected"));
            }
            logger_.log("send", "ignoring ", frame_type(*frame), " while awaiting acceptance");
        }
    }

    Status TransferSender::send_chunks(std::uint64_t from_chunk, const CancellationToken &cancel)
    {
        using namespace peerdrop::transfer;

        transition(SenderState::SendingChunks);
        started_at_ = speed_sampled_at_ = Clock::now();
        progress_.chunks_delivered = from_chunk;

        const auto threshold = buffered_threshold(options_.profile);
        const auto delay = inter_chunk_delay(options_.profile);
        try
        {
            for (auto index = from_chunk; index < metadata_.total_chunks; ++index)
            {
                if (link_.buffered_amount() > threshold)
                {
                    wait_for_drain(cancel);
                }
                if (cancel.cancelled())
                {
                    return abort(Status::failure(ErrorCode::Cancelled, "Transfer cancelled"));
                }

                const auto offset = index * metadata_.chunk_size;
                const auto size = std::min(metadata_.chunk_size, metadata_.declared_size - offset);
                const std::span<const std::uint8_t> chunk(payload_.data() + offset, static_cast<std::size_t>(size));
                link_.send_text(encode_frame(ChunkHeaderFrame{index, size}));
                link_.send_binary(chunk);

                progress_.chunks_delivered = index + 1;
                progress_.bytes_transferred += size;
                update_speed();
                if (on_progress_)
                {
                    on_progress_(progress_);
                }
                if (delay.count() > 0)
                {
                    std::this_thread::sleep_for(delay);
                }
            }
            link_.send_text(encode_frame(CompleteFrame{}));
        }
        catch (const LinkError &ex)
        {
            return abort(Status::failure(ErrorCode::LinkFailed, ex.what()));
        }

        transition(SenderState::Complete);
        logger_.log("send", "complete: ", progress_.chunks_delivered, " chunks, ",
                    format_file_size(progress_.bytes_transferred), " this run, ", progress_.stalls, " stall(s)");
        return Status::success();
    }

    void TransferSender::wait_for_drain(const CancellationToken &cancel)
    {
        const auto threshold = buffered_threshold(options_.profile);
        const auto deadline = Clock::now() + options_.drain_cap;
        while (link_.buffered_amount() > threshold)
        {
            if (Clock::now() >= deadline)
            {
                ++progress_.stalls;
                logger_.warn("send", "stall: ", link_.buffered_amount(), " bytes still queued after ",
                             options_.drain_cap.count(), " ms, continuing");
                return;
            }
            if (cancel.wait_for(options_.drain_poll))
            {
                return;
            }
        }
    }

    void TransferSender::update_speed()
    {
        const auto now = Clock::now();
        if (now - speed_sampled_at_ < kSpeedWindow)
        {
            return;
        }
        speed_sampled_at_ = now;
        const double elapsed = std::chrono::duration<double>(now - started_at_).count();
        if (elapsed > 0.0)
        {
            progress_.bytes_per_second = static_cast<double>(progress_.bytes_transferred) / elapsed;
            logger_.log("send", "throughput ", format_file_size(static_cast<std::uint64_t>(progress_.bytes_per_second)), "/s");
        }
    }

    Status TransferSender::abort(Status status)
    {
        if (state_ != SenderState::Complete && state_ != SenderState::Aborted)
        {
            logger_.error("send aborted in state ", to_string(state_), ": ", status.message);
            state_ = SenderState::Aborted;
        }
        return status;
    }

    void TransferSender::transition(SenderState next)
    {
        logger_.log("send", to_string(state_), " -> ", to_string(next));
        state_ = next;
    }

} // namespace peerdrop::client
