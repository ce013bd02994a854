#include "peerdrop/client/transfer_receiver.hpp"

#include <chrono>

#include "peerdrop/client/progress.hpp"
#include "peerdrop/compression.hpp"
#include "peerdrop/crypto.hpp"

namespace peerdrop::client
{

    using peerdrop::transfer::FileMetadata;

    namespace
    {
        constexpr std::chrono::milliseconds kReceiveSlice{200};
    } // namespace

    std::string_view to_string(ReceiverState state) noexcept
    {
        switch (state)
        {
        case ReceiverState::Idle:
            return "idle";
        case ReceiverState::AwaitingMetadata:
            return "awaiting_metadata";
        case ReceiverState::AwaitingAcceptance:
            return "awaiting_acceptance";
        case ReceiverState::ReceivingChunks:
            return "receiving_chunks";
        case ReceiverState::Reassembling:
            return "reassembling";
        case ReceiverState::Complete:
            return "complete";
        case ReceiverState::Rejected:
            return "rejected";
        case ReceiverState::Failed:
            return "failed";
        }
        return "unknown";
    }

    TransferReceiver::TransferReceiver(DirectLink &link, FileSink &sink, CheckpointStore &checkpoints, Logger logger,
                                       std::string code, TransferOptions options, ReceiverCallbacks callbacks,
                                       Clock clock)
        : link_(link),
          sink_(sink),
          checkpoints_(checkpoints),
          logger_(std::move(logger)),
          code_(std::move(code)),
          options_(std::move(options)),
          callbacks_(std::move(callbacks)),
          clock_(std::move(clock)) {}

    void TransferReceiver::start()
    {
        if (state_ == ReceiverState::Idle)
        {
            transition(ReceiverState::AwaitingMetadata);
        }
    }

    Status TransferReceiver::on_message(const LinkMessage &message)
    {
        start();
        if (terminal())
        {
            return state_ == ReceiverState::Complete ? Status::success() : failure_;
        }
        try
        {
            if (const auto *text = std::get_if<TextMessage>(&message))
            {
                return on_text(text->text);
            }
            return on_binary(std::get<BinaryMessage>(message).data);
        }
        catch (const LinkError &ex)
        {
            return fail(Status::failure(ErrorCode::LinkFailed, ex.what()));
        }
    }

    Status TransferReceiver::run(const CancellationToken &cancel)
    {
        start();
        auto last_activity = std::chrono::steady_clock::now();
        while (!terminal())
        {
            if (cancel.cancelled())
            {
                return fail(Status::failure(ErrorCode::Cancelled, "Transfer cancelled"));
            }
            std::optional<LinkMessage> message;
            try
            {
                message = link_.receive(kReceiveSlice);
            }
            catch (const LinkError &ex)
            {
                return fail(Status::failure(ErrorCode::LinkFailed, ex.what()));
            }
            const auto now = std::chrono::steady_clock::now();
            if (!message)
            {
                if (now - last_activity > options_.idle_timeout)
                {
                    return fail(Status::failure(ErrorCode::Timeout, "Sender went silent"));
                }
                continue;
            }
            last_activity = now;
            if (auto status = on_message(*message); !status.ok())
            {
                return status;
            }
        }
        return state_ == ReceiverState::Complete ? Status::success() : failure_;
    }

    std::vector<std::uint64_t> TransferReceiver::received_indices() const
    {
        std::vector<std::uint64_t> indices;
        indices.reserve(chunks_.size());
        for (const auto &[index, data] : chunks_)
        {
            indices.push_back(index);
        }
        return indices;
    }

    bool TransferReceiver::terminal() const noexcept
    {
        return state_ == ReceiverState::Complete || state_ == ReceiverState::Rejected ||
               state_ == ReceiverState::Failed;
    }

    Status TransferReceiver::on_text(const std::string &text)
    {
        using namespace peerdrop::transfer;

        const auto frame = decode_frame(text);
        if (!frame)
        {
            logger_.warn("recv", "ignoring malformed frame");
            return Status::success();
        }
        if (pending_chunk_ && !std::holds_alternative<CompleteFrame>(*frame))
        {
            logger_.warn("recv", "chunk ", pending_chunk_->index, " header was not followed by its payload");
            pending_chunk_.reset();
        }

        if (const auto *metadata = std::get_if<MetadataFrame>(&*frame))
        {
            return on_metadata(metadata->metadata);
        }
        if (const auto *header = std::get_if<ChunkHeaderFrame>(&*frame))
        {
            return on_chunk_header(*header);
        }
        if (std::holds_alternative<CompleteFrame>(*frame))
        {
            return on_complete();
        }
        logger_.log("recv", "ignoring ", frame_type(*frame), " frame");
        return Status::success();
    }

    Status TransferReceiver::on_binary(std::vector<std::uint8_t> data)
    {
        if (!pending_chunk_)
        {
            // e.g. the calibration probe
            logger_.log("recv", "discarding unexpected binary message (", data.size(), " bytes)");
            return Status::success();
        }
        const auto header = *pending_chunk_;
        pending_chunk_.reset();
        if (data.size() != header.size)
        {
            return fail(Status::failure(ErrorCode::InvalidPayload,
                                        "Chunk " + std::to_string(header.index) + " announced " +
                                            std::to_string(header.size) + " bytes, got " + std::to_string(data.size())));
        }

        auto [it, fresh] = chunks_.try_emplace(header.index);
        if (!fresh)
        {
            progress_.bytes_received -= it->second.size();
        }
        progress_.bytes_received += data.size();
        it->second = std::move(data);
        progress_.chunks_received = chunks_.size();

        if (fresh && options_.checkpoint_every > 0 && ++chunks_since_checkpoint_ >= options_.checkpoint_every)
        {
            chunks_since_checkpoint_ = 0;
            save_checkpoint();
        }
        if (callbacks_.on_progress)
        {
            callbacks_.on_progress(progress_);
        }
        return Status::success();
    }

    Status TransferReceiver::on_metadata(const FileMetadata &metadata)
    {
        using namespace peerdrop::transfer;

        if (state_ != ReceiverState::AwaitingMetadata)
        {
            logger_.log("recv", "ignoring repeated metadata");
            return Status::success();
        }
        if (metadata.total_chunks != chunk_count(metadata.declared_size, metadata.chunk_size))
        {
            return fail(Status::failure(ErrorCode::InvalidPayload, "Metadata chunk count does not match its size"));
        }

        metadata_ = metadata;
        progress_.chunk_size = metadata.chunk_size;
        progress_.total_chunks = metadata.total_chunks;
        logger_.log("recv", "offer ", metadata.file_name, " (", metadata.mime_type, ", ",
                    format_file_size(metadata.original_size), ", ", metadata.total_chunks, " chunks, compressed=",
                    metadata.is_compressed, ")");
        transition(ReceiverState::AwaitingAcceptance);

        if (auto checkpoint = live_checkpoint(metadata))
        {
            const bool resume = !callbacks_.accept_resume || callbacks_.accept_resume(metadata, *checkpoint);
            if (resume)
            {
                const auto from = checkpoint->first_missing_chunk();
                chunks_ = std::move(checkpoint->chunks);
                progress_.chunks_received = chunks_.size();
                progress_.bytes_received = 0;
                for (const auto &[index, data] : chunks_)
                {
                    progress_.bytes_received += data.size();
                }
                logger_.log("checkpoint", "resuming ", metadata.file_name, " from chunk ", from);
                respond(ResumeFrame{from});
                transition(ReceiverState::ReceivingChunks);
                return Status::success();
            }
            checkpoints_.erase(code_);
            logger_.log("checkpoint", "resume declined, checkpoint for ", code_, " discarded");
        }

        const bool accepted = !callbacks_.accept_file || callbacks_.accept_file(metadata);
        if (!accepted)
        {
            respond(RejectFrame{});
            transition(ReceiverState::Rejected);
            failure_ = Status::failure(ErrorCode::Rejected, "File transfer rejected");
            return failure_;
        }
        respond(AcceptFrame{});
        transition(ReceiverState::ReceivingChunks);
        return Status::success();
    }

    Status TransferReceiver::on_chunk_header(const peerdrop::transfer::ChunkHeaderFrame &header)
    {
        if (state_ != ReceiverState::ReceivingChunks)
        {
            logger_.warn("recv", "ignoring chunk ", header.index, " in state ", to_string(state_));
            return Status::success();
        }
        if (header.index >= metadata_->total_chunks || header.size > metadata_->chunk_size)
        {
            return fail(Status::failure(ErrorCode::InvalidPayload,
                                        "Chunk header out of range: index " + std::to_string(header.index)));
        }
        pending_chunk_ = header;
        return Status::success();
    }

    Status TransferReceiver::on_complete()
    {
        if (state_ != ReceiverState::ReceivingChunks)
        {
            logger_.warn("recv", "ignoring complete in state ", to_string(state_));
            return Status::success();
        }
        if (pending_chunk_)
        {
            return fail(Status::failure(ErrorCode::InvalidPayload, "Transfer completed before the last chunk payload"));
        }
        transition(ReceiverState::Reassembling);

        const auto &metadata = *metadata_;
        if (chunks_.size() != metadata.total_chunks)
        {
            return fail(Status::failure(ErrorCode::InvalidPayload,
                                        "Missing " + std::to_string(metadata.total_chunks - chunks_.size()) +
                                            " chunk(s)"));
        }

        std::vector<std::uint8_t> assembled;
        assembled.reserve(static_cast<std::size_t>(metadata.declared_size));
        for (const auto &[index, data] : chunks_)
        {
            assembled.insert(assembled.end(), data.begin(), data.end());
        }
        if (assembled.size() != metadata.declared_size)
        {
            return fail(Status::failure(ErrorCode::InvalidPayload,
                                        "Reassembled " + std::to_string(assembled.size()) + " bytes, expected " +
                                            std::to_string(metadata.declared_size)));
        }
        if (metadata.content_hash && peerdrop::crypto::hash_bytes(assembled) != *metadata.content_hash)
        {
            return fail(Status::failure(ErrorCode::InvalidPayload, "Content hash mismatch"));
        }
        if (metadata.is_compressed)
        {
            try
            {
                assembled = peerdrop::compression::inflate_bytes(assembled, metadata.original_size);
            }
            catch (const peerdrop::compression::DecompressionError &ex)
            {
                return fail(Status::failure(ErrorCode::DecompressionFailed, ex.what()));
            }
        }

        try
        {
            delivered_to_ = sink_.deliver(metadata.file_name, metadata.mime_type, assembled);
        }
        catch (const std::exception &ex)
        {
            return fail(Status::failure(ErrorCode::InternalError, std::string("Unable to save file: ") + ex.what()));
        }

        try
        {
            checkpoints_.erase(code_);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("checkpoint", "cleanup failed: ", ex.what());
        }
        chunks_.clear();
        transition(ReceiverState::Complete);
        logger_.log("recv", "delivered ", metadata.file_name, " to ", *delivered_to_);
        return Status::success();
    }

    std::optional<ResumeCheckpoint> TransferReceiver::live_checkpoint(const FileMetadata &metadata)
    {
        std::optional<ResumeCheckpoint> checkpoint;
        try
        {
            checkpoint = checkpoints_.get(code_);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("checkpoint", "lookup failed: ", ex.what());
            return std::nullopt;
        }
        if (!checkpoint)
        {
            return std::nullopt;
        }
        if (is_checkpoint_expired(*checkpoint, clock_(), options_.checkpoint_retention))
        {
            logger_.log("checkpoint", "discarding expired checkpoint for ", code_);
            checkpoints_.erase(code_);
            return std::nullopt;
        }
        if (checkpoint->metadata.file_name != metadata.file_name)
        {
            logger_.log("checkpoint", "discarding checkpoint for another file (", checkpoint->metadata.file_name, ")");
            checkpoints_.erase(code_);
            return std::nullopt;
        }
        const auto &saved = checkpoint->metadata;
        const bool hashes_differ =
            saved.content_hash && metadata.content_hash && *saved.content_hash != *metadata.content_hash;
        if (saved.declared_size != metadata.declared_size || saved.is_compressed != metadata.is_compressed ||
            hashes_differ || metadata.chunk_size == 0)
        {
            logger_.log("checkpoint", "checkpoint for ", metadata.file_name, " describes other content, starting over");
            checkpoints_.erase(code_);
            return std::nullopt;
        }
        if (saved.chunk_size != metadata.chunk_size)
        {
            // The sender calibrated differently this time; keep the bytes, not the old chunk layout.
            auto rechunked = rechunk_checkpoint(*checkpoint, metadata.chunk_size);
            logger_.log("checkpoint", "re-split ", checkpoint->bytes_received, " bytes from chunk size ",
                        saved.chunk_size, " to ", metadata.chunk_size, ", ", rechunked.chunks.size(), " chunk(s) kept");
            if (rechunked.chunks.empty())
            {
                checkpoints_.erase(code_);
                return std::nullopt;
            }
            return rechunked;
        }
        return checkpoint;
    }

    void TransferReceiver::save_checkpoint()
    {
        if (!metadata_)
        {
            return;
        }
        ResumeCheckpoint checkpoint;
        checkpoint.metadata = *metadata_;
        checkpoint.chunks = chunks_;
        checkpoint.bytes_received = progress_.bytes_received;
        checkpoint.saved_at = clock_();
        try
        {
            checkpoints_.put(code_, checkpoint);
            logger_.log("checkpoint", "saved ", chunks_.size(), "/", metadata_->total_chunks, " chunks for ", code_);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("checkpoint", "save failed: ", ex.what());
        }
    }

    void TransferReceiver::respond(const peerdrop::transfer::Frame &frame)
    {
        link_.send_text(peerdrop::transfer::encode_frame(frame));
        logger_.log("recv", "sent ", peerdrop::transfer::frame_type(frame));
    }

    void TransferReceiver::transition(ReceiverState next)
    {
        logger_.log("recv", to_string(state_), " -> ", to_string(next));
        state_ = next;
    }

    Status TransferReceiver::fail(Status status)
    {
        if (terminal())
        {
            return status;
        }
        if (state_ == ReceiverState::ReceivingChunks && !chunks_.empty() &&
            (status.code == ErrorCode::LinkFailed || status.code == ErrorCode::Cancelled ||
             status.code == ErrorCode::Timeout))
        {
            save_checkpoint();
        }
        logger_.error("receive failed in state ", to_string(state_), ": ", status.message);
        pending_chunk_.reset();
        state_ = ReceiverState::Failed;
        failure_ = std::move(status);
        return failure_;
    }

} // namespace peerdrop::client
