#include "peerdrop/client/peer_session.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

#include "peerdrop/client/progress.hpp"
#include "peerdrop/client/tcp_direct_link.hpp"
#include "peerdrop/crypto.hpp"

namespace peerdrop::client
{

    namespace
    {
        std::string trim_upper(std::string value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
            {
                return {};
            }
            value = value.substr(first, value.find_last_not_of(" \t\r\n") - first + 1);
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::toupper(ch)); });
            return value;
        }

        TransferOptions options_from(const ClientConfig &config)
        {
            TransferOptions options;
            options.profile = detect_device_profile(config.constrained);
            options.compress = config.compress;
            options.fixed_chunk_size = config.chunk_size;
            return options;
        }
    } // namespace

    std::string generate_peer_id()
    {
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();
        return "peer_" + peerdrop::crypto::random_base36(9) + "_" + std::to_string(millis);
    }

    PeerSession::PeerSession(ClientConfig config, SignalingService &signaling, Logger logger, LinkFactory make_link)
        : config_(std::move(config)),
          signaling_(signaling),
          logger_(std::move(logger)),
          make_link_(std::move(make_link)),
          options_(options_from(config_)),
          peer_id_(generate_peer_id())
    {
        if (!make_link_)
        {
            make_link_ = [logger = logger_]()
            { return std::make_unique<TcpDirectLink>(logger); };
        }
        logger_.log("info", "peer ", peer_id_, " using ", to_string(options_.profile), " profile");
    }

    int PeerSession::run()
    {
        Status status;
        if (config_.mode == Mode::Send)
        {
            DiskFileSource source(config_.file);
            status = send(source);
        }
        else
        {
            std::filesystem::create_directories(config_.output_dir);
            DiskFileSink sink(config_.output_dir);
            FileCheckpointStore checkpoints(config_.checkpoint_dir);
            status = receive(config_.code, sink, checkpoints);
        }

        if (status.ok())
        {
            return 0;
        }
        switch (status.code)
        {
        case ErrorCode::Rejected:
            std::cout << "File transfer rejected" << std::endl;
            break;
        case ErrorCode::Cancelled:
            std::cout << "Transfer abandoned" << std::endl;
            break;
        default:
            std::cerr << "ERROR: " << status.message << " (" << to_string(status.code) << ")" << std::endl;
            break;
        }
        return 1;
    }

    Status PeerSession::send(FileSource &source)
    {
        const auto ticket = signaling_.create_session();
        session_id_ = ticket.session_id;
        code_ = ticket.code;
        logger_.log("rpc", "created session ", ticket.session_id, " code ", ticket.code);
        std::cout << "Share this code with the receiver: " << ticket.code << std::endl;
        if (on_ticket_)
        {
            on_ticket_(ticket);
        }

        const auto registered = signaling_.register_peer(ticket.code, peer_id_);
        if (!registered)
        {
            return finish(registered.status());
        }

        std::cout << "Waiting for the receiver to join..." << std::endl;
        if (auto status = connect(SetupRole::Initiator); !status.ok())
        {
            return finish(std::move(status));
        }

        std::cout << "Connected. Sending " << source.name() << " (" << format_file_size(source.size()) << ")"
                  << std::endl;
        last_percent_ = -1;
        sender_ = std::make_unique<TransferSender>(*link_, source, logger_, options_,
                                                   [this](const SenderProgress &progress)
                                                   { print_progress(progress.chunks_delivered, progress.total_chunks); });
        auto status = sender_->run(cancel_);
        if (status.ok())
        {
            drain_link();
            const auto &progress = sender_->progress();
            std::cout << "Sent " << source.name() << ": " << format_file_size(progress.bytes_transferred) << " in "
                      << progress.total_chunks << " chunk(s)" << std::endl;
        }
        return finish(std::move(status));
    }

    Status PeerSession::receive(const std::string &code, FileSink &sink, CheckpointStore &checkpoints)
    {
        const auto info = signaling_.get_session_info(code);
        if (!info)
        {
            return finish(Status::failure(ErrorCode::NotFound, "No session found for code " + code));
        }
        if (info->is_expired)
        {
            return finish(Status::failure(ErrorCode::Expired, "Session " + code + " has expired"));
        }

        const auto registered = signaling_.register_peer(code, peer_id_);
        if (!registered)
        {
            return finish(registered.status());
        }
        session_id_ = registered.value();
        code_ = code;

        std::cout << "Joined session " << code << ", connecting to the sender..." << std::endl;
        if (auto status = connect(SetupRole::Joiner); !status.ok())
        {
            return finish(std::move(status));
        }
        std::cout << "Connected. Waiting for the file offer..." << std::endl;

        ReceiverCallbacks callbacks;
        callbacks.accept_file = [this](const peerdrop::transfer::FileMetadata &metadata)
        {
            return confirm("Accept " + metadata.file_name + " (" + format_file_size(metadata.original_size) + ", " +
                           metadata.mime_type + ")?");
        };
        callbacks.accept_resume = [this](const peerdrop::transfer::FileMetadata &metadata,
                                         const ResumeCheckpoint &checkpoint)
        {
            return confirm("Resume " + metadata.file_name + " from " +
                           format_chunk_progress(checkpoint.chunks.size(), metadata.total_chunks) + "?");
        };
        callbacks.on_progress = [this](const ReceiverProgress &progress)
        { print_progress(progress.chunks_received, progress.total_chunks); };

        last_percent_ = -1;
        receiver_ = std::make_unique<TransferReceiver>(*link_, sink, checkpoints, logger_, code, options_,
                                                       std::move(callbacks));
        auto status = receiver_->run(cancel_);
        if (status.ok() && receiver_->delivered_to())
        {
            std::cout << "Saved " << *receiver_->delivered_to() << std::endl;
        }
        return finish(std::move(status));
    }

    void PeerSession::abandon()
    {
        logger_.log("info", "abandoning session ", code_.value_or("<none>"));
        cancel_.cancel();
        teardown();
    }

    bool PeerSession::confirm(const std::string &question) const
    {
        if (config_.assume_yes)
        {
            std::cout << question << " (y/n): y" << std::endl;
            return true;
        }
        while (true)
        {
            std::cout << question << " (y/n): " << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer))
            {
                return false;
            }
            answer = trim_upper(answer);
            if (answer == "Y" || answer == "YES")
            {
                return true;
            }
            if (answer == "N" || answer == "NO")
            {
                return false;
            }
            std::cout << "Please answer y or n." << std::endl;
        }
    }

    void PeerSession::print_progress(std::uint64_t done, std::uint64_t total)
    {
        const int percent = total == 0 ? 100 : static_cast<int>(done * 100 / total);
        if (percent == last_percent_ && done != total)
        {
            return;
        }
        last_percent_ = percent;
        std::cout << '\r' << format_chunk_progress(done, total) << std::flush;
        if (done == total)
        {
            std::cout << std::endl;
        }
    }

    Status PeerSession::connect(SetupRole role)
    {
        link_ = make_link_();
        setup_ = std::make_unique<ConnectionSetup>(signaling_, *link_, logger_,
                                                   SetupContext{
                                                       .role = role,
                                                       .session_id = *session_id_,
                                                       .code = *code_,
                                                       .peer_id = peer_id_,
                                                   });
        return setup_->run(cancel_, options_);
    }

    void PeerSession::drain_link()
    {
        const auto deadline = std::chrono::steady_clock::now() + options_.drain_cap;
        try
        {
            while (link_->buffered_amount() > 0 && std::chrono::steady_clock::now() < deadline)
            {
                if (cancel_.wait_for(options_.drain_poll))
                {
                    return;
                }
            }
        }
        catch (const LinkError &ex)
        {
            logger_.warn("link", "drain interrupted: ", ex.what());
        }
    }

    Status PeerSession::finish(Status status)
    {
        if (status.code == ErrorCode::Cancelled)
        {
            abandon();
        }
        else
        {
            if (!status.ok())
            {
                logger_.error(to_string(status.code), ": ", status.message);
            }
            teardown();
        }
        return status;
    }

    void PeerSession::teardown()
    {
        // Polling has stopped by now: setup and transfer loops only run inside send()/receive().
        if (link_)
        {
            link_->close();
        }
        sender_.reset();
        receiver_.reset();
        setup_.reset();
        link_.reset();
        session_id_.reset();
        code_.reset();
    }

} // namespace peerdrop::client
