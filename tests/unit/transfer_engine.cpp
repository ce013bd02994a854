#include <cassert>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "loopback_link.hpp"
#include "peerdrop/client/checkpoint_store.hpp"
#include "peerdrop/client/connection_setup.hpp"
#include "peerdrop/client/file_io.hpp"
#include "peerdrop/client/peer_session.hpp"
#include "peerdrop/client/transfer_receiver.hpp"
#include "peerdrop/client/transfer_sender.hpp"
#include "peerdrop/server/coordinator.hpp"
#include "peerdrop/server/session_store.hpp"
#include "peerdrop/transfer_frames.hpp"

using namespace peerdrop;
using namespace peerdrop::client;
using peerdrop::client::testing::LoopbackLink;
using peerdrop::client::testing::make_loopback_pair;
using peerdrop::server::Coordinator;
using peerdrop::server::InMemorySessionStore;
using peerdrop::transfer::FileMetadata;

namespace
{

    constexpr std::uint64_t kMiB = 1024 * 1024;

    std::vector<std::uint8_t> noise(std::size_t size)
    {
        std::vector<std::uint8_t> bytes(size);
        std::uint32_t state = 0x12345678;
        for (auto &byte : bytes)
        {
            state = state * 1664525u + 1013904223u;
            byte = static_cast<std::uint8_t>(state >> 24);
        }
        return bytes;
    }

    std::vector<std::uint8_t> text_bytes(std::size_t size)
    {
        const std::string line = "the quick brown fox jumps over the lazy dog\n";
        std::vector<std::uint8_t> bytes;
        bytes.reserve(size);
        while (bytes.size() < size)
        {
            bytes.push_back(static_cast<std::uint8_t>(line[bytes.size() % line.size()]));
        }
        return bytes;
    }

    LinkMessage text(const peerdrop::transfer::Frame &frame)
    {
        return TextMessage{peerdrop::transfer::encode_frame(frame)};
    }

    std::optional<peerdrop::transfer::Frame> next_frame(LoopbackLink &link)
    {
        const auto message = link.receive(std::chrono::seconds(5));
        assert(message);
        const auto *text_message = std::get_if<TextMessage>(&*message);
        assert(text_message != nullptr);
        return peerdrop::transfer::decode_frame(text_message->text);
    }

    bool receiver_finished(ReceiverState state)
    {
        return state == ReceiverState::Complete || state == ReceiverState::Rejected || state == ReceiverState::Failed;
    }

    struct FrameTally
    {
        std::size_t headers{0};
        std::size_t payloads{0};
        std::size_t completes{0};
        std::size_t strays{0};
        bool awaiting_payload{false};
        bool ordered{true};

        void record(const LinkMessage &message)
        {
            if (const auto *binary = std::get_if<BinaryMessage>(&message))
            {
                if (awaiting_payload)
                {
                    ++payloads;
                    awaiting_payload = false;
                }
                else
                {
                    ++strays;
                }
                (void)binary;
                return;
            }
            const auto frame = peerdrop::transfer::decode_frame(std::get<TextMessage>(message).text);
            assert(frame);
            if (std::holds_alternative<peerdrop::transfer::ChunkHeaderFrame>(*frame))
            {
                ordered = ordered && !awaiting_payload;
                awaiting_payload = true;
                ++headers;
            }
            else if (std::holds_alternative<peerdrop::transfer::CompleteFrame>(*frame))
            {
                ordered = ordered && !awaiting_payload;
                ++completes;
            }
        }
    };

    // Feeds the receiver from its link on this thread until it reaches a terminal state.
    void drive_receiver(LoopbackLink &link, TransferReceiver &receiver, FrameTally &tally)
    {
        receiver.start();
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(60);
        while (!receiver_finished(receiver.state()))
        {
            assert(std::chrono::steady_clock::now() < deadline);
            const auto message = link.receive(std::chrono::milliseconds(100));
            if (!message)
            {
                continue;
            }
            tally.record(*message);
            receiver.on_message(*message);
        }
    }

    struct SessionFixture
    {
        Coordinator coordinator{std::make_unique<InMemorySessionStore>()};
        SessionTicket ticket{coordinator.create_session()};

        SetupContext context(SetupRole role, const std::string &peer_id) const
        {
            return SetupContext{
                .role = role,
                .session_id = ticket.session_id,
                .code = ticket.code,
                .peer_id = peer_id,
            };
        }

        void send_from_initiator(const Signal &signal)
        {
            assert(coordinator.send_signal(ticket.session_id, "peer_a", encode_signal(signal)).ok());
        }

        std::vector<std::string> mailbox(const std::string &peer_id)
        {
            return coordinator.poll_signals(ticket.session_id, peer_id).value();
        }
    };

    void test_setup_exchange_opens_link()
    {
        SessionFixture fixture;
        assert(fixture.coordinator.register_peer(fixture.ticket.code, "peer_a"));
        assert(fixture.coordinator.register_peer(fixture.ticket.code, "peer_b"));

        auto [offerer, answerer] = make_loopback_pair();
        ConnectionSetup initiator(fixture.coordinator, *offerer, Logger(), fixture.context(SetupRole::Initiator, "peer_a"));
        ConnectionSetup joiner(fixture.coordinator, *answerer, Logger(), fixture.context(SetupRole::Joiner, "peer_b"));
        initiator.start();
        joiner.start();
        assert(initiator.state() == SetupState::AwaitingPeer);

        for (int round = 0; round < 5; ++round)
        {
            initiator.tick();
            joiner.tick();
        }
        assert(initiator.state() == SetupState::LinkOpen);
        assert(joiner.state() == SetupState::LinkOpen);
        assert((offerer->remote_descriptions() == std::vector<std::string>{"loopback-answer"}));
        assert((answerer->remote_descriptions() == std::vector<std::string>{"loopback-offer"}));
        assert((answerer->applied_candidates() == std::vector<std::string>{"loopback:0"}));
        assert(fixture.mailbox("peer_a").empty());
        assert(fixture.mailbox("peer_b").empty());
    }

    void test_candidates_buffered_until_offer()
    {
        SessionFixture fixture;
        assert(fixture.coordinator.register_peer(fixture.ticket.code, "peer_a"));
        assert(fixture.coordinator.register_peer(fixture.ticket.code, "peer_b"));

        auto [offerer, answerer] = make_loopback_pair();
        ConnectionSetup joiner(fixture.coordinator, *answerer, Logger(), fixture.context(SetupRole::Joiner, "peer_b"));
        joiner.start();

        fixture.send_from_initiator(IceCandidateSignal{"10.0.0.5:4100"});
        fixture.send_from_initiator(IceCandidateSignal{"127.0.0.1:4100"});
        joiner.tick();
        assert(joiner.state() == SetupState::AwaitingPeer);
        assert(joiner.buffered_candidates() == 2);
        assert(!joiner.remote_description_set());
        assert(answerer->applied_candidates().empty());
        assert(fixture.mailbox("peer_b").empty());

        fixture.send_from_initiator(OfferSignal{"loopback-offer"});
        joiner.tick();
        assert(joiner.remote_description_set());
        assert(joiner.buffered_candidates() == 0);
        assert((answerer->applied_candidates() == std::vector<std::string>{"10.0.0.5:4100", "127.0.0.1:4100"}));
        assert(joiner.state() == SetupState::LinkOpen);

        const auto answers = fixture.mailbox("peer_a");
        assert(answers.size() == 1);
        assert(std::holds_alternative<AnswerSignal>(*decode_signal(answers.front())));
    }

    void test_duplicate_and_malformed_signals()
    {
        SessionFixture fixture;
        assert(fixture.coordinator.register_peer(fixture.ticket.code, "peer_a"));
        assert(fixture.coordinator.register_peer(fixture.ticket.code, "peer_b"));

        auto [offerer, answerer] = make_loopback_pair();
        ConnectionSetup joiner(fixture.coordinator, *answerer, Logger(), fixture.context(SetupRole::Joiner, "peer_b"));
        joiner.start();

        fixture.send_from_initiator(OfferSignal{"loopback-offer"});
        assert(fixture.coordinator.send_signal(fixture.ticket.session_id, "peer_a", "{not a signal").ok());
        fixture.send_from_initiator(OfferSignal{"loopback-offer"});
        joiner.tick();

        assert(joiner.state() == SetupState::DescriptionExchanged);
        assert(joiner.signals_handled() == 2);
        assert(answerer->remote_descriptions().size() == 1);
        assert(fixture.mailbox("peer_a").size() == 1);
        assert(fixture.mailbox("peer_b").empty());

        // Redelivery after a clear is recognised and left alone.
        fixture.send_from_initiator(OfferSignal{"loopback-offer"});
        joiner.tick();
        assert(answerer->remote_descriptions().size() == 1);
        assert(fixture.mailbox("peer_a").size() == 1);
        assert(fixture.mailbox("peer_b").size() == 1);
    }

    void test_answer_applied_once()
    {
        SessionFixture fixture;
        assert(fixture.coordinator.register_peer(fixture.ticket.code, "peer_a"));
        assert(fixture.coordinator.register_peer(fixture.ticket.code, "peer_b"));

        auto [offerer, answerer] = make_loopback_pair();
        ConnectionSetup initiator(fixture.coordinator, *offerer, Logger(), fixture.context(SetupRole::Initiator, "peer_a"));
        initiator.start();
        initiator.tick();
        assert(initiator.state() == SetupState::DescriptionExchanged);
        assert(!initiator.remote_description_set());

        const auto to_initiator = [&](const Signal &signal)
        { assert(fixture.coordinator.send_signal(fixture.ticket.session_id, "peer_b", encode_signal(signal)).ok()); };
        to_initiator(AnswerSignal{"answer-one"});
        to_initiator(AnswerSignal{"answer-two"});
        initiator.tick();

        assert(initiator.remote_description_set());
        assert((offerer->remote_descriptions() == std::vector<std::string>{"answer-one"}));
    }

    void test_setup_failures()
    {
        SessionFixture fixture;
        auto [offerer, answerer] = make_loopback_pair();

        SetupContext missing = fixture.context(SetupRole::Initiator, "peer_a");
        missing.code = "ZZZZZZ";
        ConnectionSetup lost(fixture.coordinator, *offerer, Logger(), missing);
        lost.start();
        assert(lost.tick() == SetupState::Failed);
        assert(lost.failure().code == ErrorCode::NotFound);

        assert(fixture.coordinator.register_peer(fixture.ticket.code, "peer_a"));
        TransferOptions quick;
        quick.poll_interval = std::chrono::milliseconds(10);
        quick.setup_timeout = std::chrono::milliseconds(0);
        ConnectionSetup lonely(fixture.coordinator, *offerer, Logger(), fixture.context(SetupRole::Initiator, "peer_a"));
        assert(lonely.run(CancellationToken{}, quick).code == ErrorCode::Timeout);
        assert(lonely.state() == SetupState::Failed);

        CancellationToken cancel;
        cancel.cancel();
        quick.setup_timeout = std::chrono::seconds(30);
        ConnectionSetup abandoned(fixture.coordinator, *offerer, Logger(), fixture.context(SetupRole::Initiator, "peer_a"));
        assert(abandoned.run(cancel, quick).code == ErrorCode::Cancelled);

        ConnectionSetup stranger(fixture.coordinator, *answerer, Logger(), fixture.context(SetupRole::Joiner, "peer_x"));
        stranger.start();
        assert(stranger.tick() == SetupState::Failed);
        assert(stranger.failure().code == ErrorCode::PeerNotRegistered);
    }

    void test_ten_megabyte_transfer()
    {
        auto [sending, receiving] = make_loopback_pair();
        sending->open();

        const auto original = noise(10 * kMiB);
        MemoryFileSource source("video.bin", "application/octet-stream", original);
        MemoryFileSink sink;
        InMemoryCheckpointStore checkpoints;

        TransferOptions options;
        options.fixed_chunk_size = kMiB;
        TransferSender sender(*sending, source, Logger(), options);
        TransferReceiver receiver(*receiving, sink, checkpoints, Logger(), "X7K2P9", options);

        Status send_status;
        std::thread sender_thread([&]
                                  { send_status = sender.run(CancellationToken{}); });
        FrameTally tally;
        drive_receiver(*receiving, receiver, tally);
        sender_thread.join();

        assert(send_status.ok());
        assert(sender.state() == SenderState::Complete);
        assert(!sender.metadata().is_compressed);
        assert(sender.metadata().total_chunks == 10);

        assert(receiver.state() == ReceiverState::Complete);
        assert(tally.headers == 10);
        assert(tally.payloads == 10);
        assert(tally.completes == 1);
        assert(tally.strays == 0);
        assert(tally.ordered);

        assert(sink.deliveries().size() == 1);
        assert(sink.deliveries().front().bytes.size() == 10485760);
        assert(sink.deliveries().front().bytes == original);
        assert(receiver.delivered_to() == std::string("memory:video.bin"));
        assert(checkpoints.size() == 0);
    }

    void test_compressed_transfer()
    {
        auto [sending, receiving] = make_loopback_pair();
        sending->open();

        const auto original = text_bytes(200 * 1024);
        MemoryFileSource source("notes.txt", "", original);
        MemoryFileSink sink;
        InMemoryCheckpointStore checkpoints;

        TransferOptions options;
        options.fixed_chunk_size = 4096;
        TransferSender sender(*sending, source, Logger(), options);
        TransferReceiver receiver(*receiving, sink, checkpoints, Logger(), "Q1W2E3", options);

        Status send_status;
        std::thread sender_thread([&]
                                  { send_status = sender.run(CancellationToken{}); });
        FrameTally tally;
        drive_receiver(*receiving, receiver, tally);
        sender_thread.join();

        assert(send_status.ok());
        const auto &metadata = *receiver.metadata();
        assert(metadata.is_compressed);
        assert(metadata.mime_type == "text/plain");
        assert(metadata.original_size == original.size());
        assert(metadata.declared_size < original.size());
        assert(tally.headers == metadata.total_chunks);
        assert(sink.deliveries().front().bytes == original);
        assert(sink.deliveries().front().mime_type == "text/plain");
    }

    void test_sender_without_compression()
    {
        auto [sending, receiving] = make_loopback_pair();
        sending->open();

        const auto original = text_bytes(8 * 1024);
        MemoryFileSource source("notes.txt", "text/plain", original);
        TransferOptions options;
        options.compress = false;
        options.fixed_chunk_size = 1024;
        TransferSender sender(*sending, source, Logger(), options);
        sender.calibrate();
        assert(sender.prepare().ok());
        assert(!sender.metadata().is_compressed);
        assert(sender.metadata().declared_size == original.size());
        assert(sender.metadata().total_chunks == 8);
        assert(sender.metadata().content_hash);
    }

    void test_calibration_falls_back_on_closed_link()
    {
        auto [sending, receiving] = make_loopback_pair();
        MemoryFileSource source("notes.txt", "text/plain", text_bytes(4096));
        TransferSender sender(*sending, source, Logger(), TransferOptions{});
        sender.calibrate();
        assert(sender.progress().chunk_size == kMinChunkSize);
        assert(sender.prepare().ok());
        assert(sender.metadata().chunk_size == kMinChunkSize);
    }

    void test_sender_proceeds_after_stall()
    {
        auto [sending, receiving] = make_loopback_pair();
        sending->open();
        sending->set_buffered_amount(buffered_threshold(DeviceProfile::Standard) + 1);
        receiving->send_text(peerdrop::transfer::encode_frame(peerdrop::transfer::AcceptFrame{}));

        MemoryFileSource source("blob.bin", "application/octet-stream", noise(3 * 1024));
        TransferOptions options;
        options.fixed_chunk_size = 1024;
        options.drain_poll = std::chrono::milliseconds(2);
        options.drain_cap = std::chrono::milliseconds(30);
        TransferSender sender(*sending, source, Logger(), options);

        assert(sender.run(CancellationToken{}).ok());
        assert(sender.state() == SenderState::Complete);
        assert(sender.progress().stalls == 3);
        assert(sender.progress().chunks_delivered == 3);

        FrameTally tally;
        (void)next_frame(*receiving);
        while (tally.completes == 0)
        {
            const auto message = receiving->receive(std::chrono::seconds(5));
            assert(message);
            tally.record(*message);
        }
        assert(tally.headers == 3 && tally.payloads == 3 && tally.ordered);
    }

    void test_sender_waits_for_drain()
    {
        auto [sending, receiving] = make_loopback_pair();
        sending->open();
        sending->set_buffered_amount(buffered_threshold(DeviceProfile::Standard) * 2);
        receiving->send_text(peerdrop::transfer::encode_frame(peerdrop::transfer::AcceptFrame{}));

        MemoryFileSource source("blob.bin", "application/octet-stream", noise(2 * 1024));
        TransferOptions options;
        options.fixed_chunk_size = 1024;
        options.drain_poll = std::chrono::milliseconds(2);
        options.drain_cap = std::chrono::seconds(10);
        TransferSender sender(*sending, source, Logger(), options);

        LoopbackLink &queued = *sending;
        std::thread drainer([&queued]
                            {
                                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                                queued.set_buffered_amount(0); });
        const auto started = std::chrono::steady_clock::now();
        const auto status = sender.run(CancellationToken{});
        const auto elapsed = std::chrono::steady_clock::now() - started;
        drainer.join();

        assert(status.ok());
        assert(sender.progress().stalls == 0);
        assert(elapsed >= std::chrono::milliseconds(50));
        assert(elapsed < std::chrono::seconds(10));
    }

    void test_rejected_offer()
    {
        auto [sending, receiving] = make_loopback_pair();
        sending->open();

        MemoryFileSource source("secret.bin", "application/octet-stream", noise(4096));
        MemoryFileSink sink;
        InMemoryCheckpointStore checkpoints;
        TransferOptions options;
        options.fixed_chunk_size = 1024;

        ReceiverCallbacks callbacks;
        std::optional<FileMetadata> previewed;
        callbacks.accept_file = [&](const FileMetadata &metadata)
        {
            previewed = metadata;
            return false;
        };
        TransferSender sender(*sending, source, Logger(), options);
        TransferReceiver receiver(*receiving, sink, checkpoints, Logger(), "REJECT", options, callbacks);

        Status send_status;
        std::thread sender_thread([&]
                                  { send_status = sender.run(CancellationToken{}); });
        FrameTally tally;
        drive_receiver(*receiving, receiver, tally);
        sender_thread.join();

        assert(previewed && previewed->file_name == "secret.bin");
        assert(receiver.state() == ReceiverState::Rejected);
        assert(send_status.code == ErrorCode::Rejected);
        assert(send_status.message == "File transfer rejected");
        assert(sender.state() == SenderState::Aborted);
        assert(tally.headers == 0);
        assert(sink.deliveries().empty());
    }

    void test_resume_from_checkpoint()
    {
        auto [sending, receiving] = make_loopback_pair();
        sending->open();

        constexpr std::uint64_t kChunk = 64 * 1024;
        const auto original = noise(10 * kChunk);
        MemoryFileSource source("backup.bin", "application/octet-stream", original);
        MemoryFileSink sink;
        InMemoryCheckpointStore checkpoints;

        ResumeCheckpoint checkpoint;
        checkpoint.metadata = FileMetadata{
            .file_name = "backup.bin",
            .declared_size = original.size(),
            .original_size = original.size(),
            .mime_type = "application/octet-stream",
            .total_chunks = 10,
            .chunk_size = kChunk,
            .is_compressed = false,
        };
        for (std::uint64_t index = 0; index < 4; ++index)
        {
            const auto begin = original.begin() + static_cast<std::ptrdiff_t>(index * kChunk);
            checkpoint.chunks[index] = std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(kChunk));
        }
        checkpoint.bytes_received = 4 * kChunk;
        checkpoint.saved_at = std::chrono::system_clock::now();
        checkpoints.put("RESUME", checkpoint);

        TransferOptions options;
        options.fixed_chunk_size = kChunk;
        bool resume_offered = false;
        ReceiverCallbacks callbacks;
        callbacks.accept_resume = [&](const FileMetadata &, const ResumeCheckpoint &saved)
        {
            resume_offered = saved.chunks.size() == 4;
            return true;
        };
        TransferSender sender(*sending, source, Logger(), options);
        TransferReceiver receiver(*receiving, sink, checkpoints, Logger(), "RESUME", options, callbacks);

        Status send_status;
        std::thread sender_thread([&]
                                  { send_status = sender.run(CancellationToken{}); });
        FrameTally tally;
        drive_receiver(*receiving, receiver, tally);
        sender_thread.join();

        assert(resume_offered);
        assert(send_status.ok());
        assert(tally.headers == 6);
        assert(sender.progress().chunks_delivered == 10);
        assert(sender.progress().bytes_transferred == 6 * kChunk);
        assert(sink.deliveries().front().bytes == original);
        assert(!checkpoints.get("RESUME"));
    }

    void test_declined_resume_discards_checkpoint()
    {
        auto [sending, receiving] = make_loopback_pair();
        sending->open();

        const FileMetadata metadata{
            .file_name = "report.txt",
            .declared_size = 10240,
            .original_size = 10240,
            .mime_type = "text/plain",
            .total_chunks = 10,
            .chunk_size = 1024,
            .is_compressed = false,
        };
        InMemoryCheckpointStore checkpoints;
        ResumeCheckpoint checkpoint;
        checkpoint.metadata = metadata;
        for (std::uint64_t index = 0; index < 4; ++index)
        {
            checkpoint.chunks[index] = std::vector<std::uint8_t>(1024, 0x41);
        }
        checkpoint.bytes_received = 4096;
        checkpoint.saved_at = std::chrono::system_clock::now();
        checkpoints.put("X7K2P9", checkpoint);

        bool asked_resume = false;
        bool asked_accept = false;
        ReceiverCallbacks callbacks;
        callbacks.accept_resume = [&](const FileMetadata &, const ResumeCheckpoint &)
        {
            asked_resume = true;
            return false;
        };
        callbacks.accept_file = [&](const FileMetadata &)
        {
            asked_accept = true;
            return true;
        };

        MemoryFileSink sink;
        TransferReceiver receiver(*receiving, sink, checkpoints, Logger(), "X7K2P9", TransferOptions{}, callbacks);
        assert(receiver.on_message(text(peerdrop::transfer::MetadataFrame{metadata})).ok());

        assert(asked_resume);
        assert(asked_accept);
        assert(!checkpoints.get("X7K2P9"));
        assert(receiver.state() == ReceiverState::ReceivingChunks);
        assert(receiver.received_indices().empty());

        const auto reply = next_frame(*sending);
        assert(reply && std::holds_alternative<peerdrop::transfer::AcceptFrame>(*reply));
    }

    void test_stale_checkpoints_ignored()
    {
        auto [sending, receiving] = make_loopback_pair();
        sending->open();

        const FileMetadata metadata{
            .file_name = "report.txt",
            .declared_size = 2048,
            .original_size = 2048,
            .mime_type = "text/plain",
            .total_chunks = 2,
            .chunk_size = 1024,
        };
        const auto now = std::chrono::system_clock::now();
        InMemoryCheckpointStore checkpoints;

        ResumeCheckpoint expired;
        expired.metadata = metadata;
        expired.chunks[0] = std::vector<std::uint8_t>(1024, 0x41);
        expired.saved_at = now - std::chrono::hours(25);
        checkpoints.put("OLDONE", expired);

        ResumeCheckpoint relaid = expired;
        relaid.metadata.declared_size = 4096;
        relaid.metadata.total_chunks = 4;
        relaid.saved_at = now;
        checkpoints.put("LAYOUT", relaid);

        bool asked_resume = false;
        ReceiverCallbacks callbacks;
        callbacks.accept_resume = [&](const FileMetadata &, const ResumeCheckpoint &)
        {
            asked_resume = true;
            return true;
        };
        const auto fixed_clock = [now]
        { return now; };

        MemoryFileSink sink;
        TransferReceiver old_receiver(*receiving, sink, checkpoints, Logger(), "OLDONE", TransferOptions{}, callbacks,
                                      fixed_clock);
        assert(old_receiver.on_message(text(peerdrop::transfer::MetadataFrame{metadata})).ok());
        assert(!checkpoints.get("OLDONE"));

        TransferReceiver relaid_receiver(*receiving, sink, checkpoints, Logger(), "LAYOUT", TransferOptions{},
                                         callbacks, fixed_clock);
        assert(relaid_receiver.on_message(text(peerdrop::transfer::MetadataFrame{metadata})).ok());
        assert(!checkpoints.get("LAYOUT"));

        assert(!asked_resume);
        assert(old_receiver.state() == ReceiverState::ReceivingChunks);
        assert(relaid_receiver.state() == ReceiverState::ReceivingChunks);
    }

    void test_resume_across_chunk_sizes()
    {
        using namespace peerdrop::transfer;

        auto [sending, receiving] = make_loopback_pair();
        sending->open();

        const auto original = noise(2048);
        ResumeCheckpoint saved;
        saved.metadata = FileMetadata{
            .file_name = "photo.raw",
            .declared_size = 2048,
            .original_size = 2048,
            .mime_type = "application/octet-stream",
            .total_chunks = 4,
            .chunk_size = 512,
        };
        for (std::uint64_t index = 0; index < 3; ++index)
        {
            saved.chunks[index].assign(original.begin() + static_cast<std::ptrdiff_t>(index * 512),
                                       original.begin() + static_cast<std::ptrdiff_t>((index + 1) * 512));
        }
        saved.bytes_received = 1536;
        saved.saved_at = std::chrono::system_clock::now();
        InMemoryCheckpointStore checkpoints;
        checkpoints.put("RESIZE", saved);

        FileMetadata offered = saved.metadata;
        offered.chunk_size = 1024;
        offered.total_chunks = 2;

        MemoryFileSink sink;
        TransferReceiver receiver(*receiving, sink, checkpoints, Logger(), "RESIZE", TransferOptions{});
        assert(receiver.on_message(text(MetadataFrame{offered})).ok());
        assert(receiver.state() == ReceiverState::ReceivingChunks);

        const auto reply = next_frame(*sending);
        assert(reply);
        const auto *resume = std::get_if<ResumeFrame>(&*reply);
        assert(resume != nullptr && resume->from_chunk == 1);
        assert((receiver.received_indices() == std::vector<std::uint64_t>{0}));

        assert(receiver.on_message(text(ChunkHeaderFrame{1, 1024})).ok());
        assert(receiver.on_message(BinaryMessage{std::vector<std::uint8_t>(original.begin() + 1024, original.end())}).ok());
        assert(receiver.on_message(text(CompleteFrame{})).ok());
        assert(receiver.state() == ReceiverState::Complete);
        assert(sink.deliveries().size() == 1);
        assert(sink.deliveries().front().bytes == original);
        assert(!checkpoints.get("RESIZE"));
    }

    void test_receiver_integrity_checks()
    {
        using namespace peerdrop::transfer;

        auto [sending, receiving] = make_loopback_pair();
        sending->open();
        InMemoryCheckpointStore checkpoints;
        MemoryFileSink sink;
        const std::vector<std::uint8_t> payload = {1, 2, 3, 4};

        FileMetadata tampered{
            .file_name = "a.bin",
            .declared_size = 4,
            .original_size = 4,
            .total_chunks = 1,
            .chunk_size = 4,
            .content_hash = std::string("00"),
        };
        TransferReceiver hashed(*receiving, sink, checkpoints, Logger(), "HASHED", TransferOptions{});
        assert(hashed.on_message(text(MetadataFrame{tampered})).ok());
        assert(hashed.on_message(text(ChunkHeaderFrame{0, 4})).ok());
        assert(hashed.expecting_payload());
        assert(hashed.on_message(BinaryMessage{payload}).ok());
        assert(hashed.on_message(text(CompleteFrame{})).code == ErrorCode::InvalidPayload);
        assert(hashed.state() == ReceiverState::Failed);

        FileMetadata garbled{
            .file_name = "b.txt",
            .declared_size = 4,
            .original_size = 100,
            .total_chunks = 1,
            .chunk_size = 4,
            .is_compressed = true,
        };
        TransferReceiver inflating(*receiving, sink, checkpoints, Logger(), "GARBLE", TransferOptions{});
        assert(inflating.on_message(text(MetadataFrame{garbled})).ok());
        assert(inflating.on_message(text(ChunkHeaderFrame{0, 4})).ok());
        assert(inflating.on_message(BinaryMessage{payload}).ok());
        assert(inflating.on_message(text(CompleteFrame{})).code == ErrorCode::DecompressionFailed);
        assert(inflating.state() == ReceiverState::Failed);

        FileMetadata short_file{
            .file_name = "c.bin",
            .declared_size = 8,
            .original_size = 8,
            .total_chunks = 2,
            .chunk_size = 4,
        };
        TransferReceiver incomplete(*receiving, sink, checkpoints, Logger(), "SHORTF", TransferOptions{});
        assert(incomplete.on_message(text(MetadataFrame{short_file})).ok());
        assert(incomplete.on_message(text(ChunkHeaderFrame{1, 4})).ok());
        assert(incomplete.on_message(BinaryMessage{payload}).ok());
        assert(incomplete.on_message(text(CompleteFrame{})).code == ErrorCode::InvalidPayload);

        TransferReceiver wrong_size(*receiving, sink, checkpoints, Logger(), "WRONGS", TransferOptions{});
        assert(wrong_size.on_message(text(MetadataFrame{short_file})).ok());
        assert(wrong_size.on_message(text(ChunkHeaderFrame{0, 4})).ok());
        assert(wrong_size.on_message(BinaryMessage{{1, 2}}).code == ErrorCode::InvalidPayload);

        TransferReceiver out_of_range(*receiving, sink, checkpoints, Logger(), "RANGES", TransferOptions{});
        assert(out_of_range.on_message(text(MetadataFrame{short_file})).ok());
        assert(out_of_range.on_message(text(ChunkHeaderFrame{2, 4})).code == ErrorCode::InvalidPayload);

        assert(sink.deliveries().empty());
    }

    void test_stray_binary_is_discarded()
    {
        using namespace peerdrop::transfer;

        auto [sending, receiving] = make_loopback_pair();
        sending->open();
        InMemoryCheckpointStore checkpoints;
        MemoryFileSink sink;

        TransferReceiver receiver(*receiving, sink, checkpoints, Logger(), "STRAYS", TransferOptions{});
        assert(receiver.on_message(BinaryMessage{std::vector<std::uint8_t>(256 * 1024, 0)}).ok());
        assert(receiver.state() == ReceiverState::AwaitingMetadata);

        const FileMetadata metadata{
            .file_name = "d.bin",
            .declared_size = 3,
            .original_size = 3,
            .total_chunks = 1,
            .chunk_size = 4,
        };
        assert(receiver.on_message(text(MetadataFrame{metadata})).ok());
        assert(receiver.on_message(BinaryMessage{{9, 9, 9}}).ok());
        assert(receiver.received_indices().empty());
        assert(receiver.on_message(text(ChunkHeaderFrame{0, 3})).ok());
        assert(receiver.on_message(BinaryMessage{{7, 8, 9}}).ok());
        assert(receiver.on_message(text(CompleteFrame{})).ok());
        assert(receiver.state() == ReceiverState::Complete);
        assert((sink.deliveries().front().bytes == std::vector<std::uint8_t>{7, 8, 9}));
    }

    void test_link_loss_keeps_checkpoint()
    {
        using namespace peerdrop::transfer;

        auto [sending, receiving] = make_loopback_pair();
        sending->open();
        InMemoryCheckpointStore checkpoints;
        MemoryFileSink sink;
        TransferOptions options;
        options.checkpoint_every = 2;

        const FileMetadata metadata{
            .file_name = "e.bin",
            .declared_size = 10,
            .original_size = 10,
            .total_chunks = 5,
            .chunk_size = 2,
        };
        TransferReceiver receiver(*receiving, sink, checkpoints, Logger(), "LOSSES", options);
        assert(receiver.on_message(text(MetadataFrame{metadata})).ok());
        for (std::uint64_t index = 0; index < 3; ++index)
        {
            assert(receiver.on_message(text(ChunkHeaderFrame{index, 2})).ok());
            assert(receiver.on_message(BinaryMessage{{static_cast<std::uint8_t>(index), 0}}).ok());
            if (index == 1)
            {
                assert(checkpoints.get("LOSSES")->chunks.size() == 2);
            }
        }

        sending->fail("peer vanished");
        assert(receiver.run(CancellationToken{}).code == ErrorCode::LinkFailed);
        assert(receiver.state() == ReceiverState::Failed);

        const auto saved = checkpoints.get("LOSSES");
        assert(saved);
        assert(saved->chunks.size() == 3);
        assert(saved->bytes_received == 6);
        assert(saved->first_missing_chunk() == 3);
    }

    void test_peer_sessions_end_to_end()
    {
        Coordinator coordinator(std::make_unique<InMemorySessionStore>());
        auto [offerer, answerer] = make_loopback_pair();
        auto offerer_slot = std::make_shared<std::unique_ptr<LoopbackLink>>(std::move(offerer));
        auto answerer_slot = std::make_shared<std::unique_ptr<LoopbackLink>>(std::move(answerer));

        ClientConfig send_config;
        send_config.mode = Mode::Send;
        PeerSession sender(send_config, coordinator, Logger(), [offerer_slot]() -> std::unique_ptr<DirectLink>
                           { return std::move(*offerer_slot); });

        ClientConfig receive_config;
        receive_config.mode = Mode::Receive;
        receive_config.assume_yes = true;
        PeerSession receiver(receive_config, coordinator, Logger(), [answerer_slot]() -> std::unique_ptr<DirectLink>
                             { return std::move(*answerer_slot); });
        assert(sender.peer_id() != receiver.peer_id());

        std::promise<std::string> code_promise;
        auto code_future = code_promise.get_future();
        sender.on_ticket([&](const SessionTicket &ticket)
                         { code_promise.set_value(ticket.code); });

        const auto original = text_bytes(5000);
        MemoryFileSource source("greeting.txt", "", original);
        Status send_status;
        std::thread sender_thread([&]
                                  { send_status = sender.send(source); });

        const auto code = code_future.get();
        MemoryFileSink sink;
        InMemoryCheckpointStore checkpoints;
        const auto receive_status = receiver.receive(code, sink, checkpoints);
        sender_thread.join();

        assert(send_status.ok());
        assert(receive_status.ok());
        assert(sink.deliveries().size() == 1);
        assert(sink.deliveries().front().file_name == "greeting.txt");
        assert(sink.deliveries().front().bytes == original);

        const auto info = coordinator.get_session_info(code);
        assert(info && info->peer_count == 2 && info->is_locked);
    }

    void test_receive_unknown_code()
    {
        Coordinator coordinator(std::make_unique<InMemorySessionStore>());
        ClientConfig config;
        config.mode = Mode::Receive;
        PeerSession receiver(config, coordinator, Logger());
        MemoryFileSink sink;
        InMemoryCheckpointStore checkpoints;
        assert(receiver.receive("NOSUCH", sink, checkpoints).code == ErrorCode::NotFound);
    }

} // namespace

void run_transfer_engine_tests()
{
    test_setup_exchange_opens_link();
    test_candidates_buffered_until_offer();
    test_duplicate_and_malformed_signals();
    test_answer_applied_once();
    test_setup_failures();
    test_ten_megabyte_transfer();
    test_compressed_transfer();
    test_sender_without_compression();
    test_calibration_falls_back_on_closed_link();
    test_sender_proceeds_after_stall();
    test_sender_waits_for_drain();
    test_rejected_offer();
    test_resume_from_checkpoint();
    test_declined_resume_discards_checkpoint();
    test_stale_checkpoints_ignored();
    test_resume_across_chunk_sizes();
    test_receiver_integrity_checks();
    test_stray_binary_is_discarded();
    test_link_loss_keeps_checkpoint();
    test_peer_sessions_end_to_end();
    test_receive_unknown_code();
}
