#include "peerdrop/client/tcp_direct_link.hpp"

#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <charconv>

#include <nlohmann/json.hpp>

#include "peerdrop/crypto.hpp"

namespace peerdrop::client
{

    namespace
    {

        constexpr std::string_view kProtocolTag = "peerdrop-tcp/1";
        constexpr std::size_t kTokenBytes = 16;
        constexpr std::uint32_t kMaxHelloSize = 1024;

        using peerdrop::protocol::LinkFrameKind;

        struct Description
        {
            std::string protocol;
            std::string token;
        };

        std::string describe(const std::string &token)
        {
            return nlohmann::json{{"protocol", kProtocolTag}, {"token", token}}.dump();
        }

        Description parse_description(const std::string &text)
        {
            try
            {
                const auto json = nlohmann::json::parse(text);
                return Description{json.at("protocol").get<std::string>(), json.at("token").get<std::string>()};
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw LinkError(std::string("Malformed link description: ") + ex.what());
            }
        }

        std::optional<asio::ip::tcp::endpoint> parse_candidate(const std::string &candidate)
        {
            const auto colon = candidate.rfind(':');
            if (colon == std::string::npos || colon == 0)
            {
                return std::nullopt;
            }
            std::error_code ec;
            const auto address = asio::ip::make_address(candidate.substr(0, colon), ec);
            if (ec)
            {
                return std::nullopt;
            }
            unsigned short port = 0;
            const auto *first = candidate.data() + colon + 1;
            const auto *last = candidate.data() + candidate.size();
            const auto [ptr, err] = std::from_chars(first, last, port);
            if (err != std::errc{} || ptr != last || port == 0)
            {
                return std::nullopt;
            }
            return asio::ip::tcp::endpoint(address, port);
        }

        std::span<const std::uint8_t> as_bytes(std::string_view text)
        {
            return {reinterpret_cast<const std::uint8_t *>(text.data()), text.size()};
        }

    } // namespace

    TcpDirectLink::TcpDirectLink(Logger logger, TcpLinkOptions options)
        : logger_(std::move(logger)),
          options_(std::move(options)),
          io_context_(1),
          work_(asio::make_work_guard(io_context_)),
          acceptor_(io_context_),
          socket_(io_context_),
          connect_timer_(io_context_)
    {
        io_thread_ = std::thread([this]
                                 {
            try
            {
                io_context_.run();
            }
            catch (const std::exception &ex)
            {
                fail(std::string("io loop stopped: ") + ex.what());
            } });
    }

    TcpDirectLink::~TcpDirectLink()
    {
        close();
    }

    std::string TcpDirectLink::create_offer()
    {
        std::string token;
        {
            std::lock_guard lock(mutex_);
            if (role_ != Role::Unset)
            {
                throw LinkError("Local description already created");
            }
            role_ = Role::Offerer;
            token_ = peerdrop::crypto::random_hex(kTokenBytes);
            token = token_;
        }

        const asio::ip::tcp::endpoint endpoint(asio::ip::make_address(options_.bind_address), 0);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        const auto port = acceptor_.local_endpoint().port();
        const auto candidates = local_candidates(port);

        {
            std::lock_guard lock(mutex_);
            state_ = LinkState::Connecting;
            events_.emplace_back(StateChanged{LinkState::Connecting, "listening"});
            for (const auto &candidate : candidates)
            {
                events_.emplace_back(CandidateDiscovered{candidate});
            }
        }
        asio::post(io_context_, [this]
                   { start_accept(); });

        logger_.log("link", "listening on port ", port, " with ", candidates.size(), " candidate(s)");
        return describe(token);
    }

    std::string TcpDirectLink::create_answer()
    {
        std::string token;
        {
            std::lock_guard lock(mutex_);
            if (!remote_description_set_)
            {
                throw LinkError("Remote description required before answering");
            }
            if (role_ != Role::Unset)
            {
                throw LinkError("Local description already created");
            }
            role_ = Role::Answerer;
            state_ = LinkState::Connecting;
            events_.emplace_back(StateChanged{LinkState::Connecting, "dialing"});
            token = token_;
        }
        asio::post(io_context_, [this]
                   { try_next_candidate(); });
        return describe(token);
    }

    void TcpDirectLink::set_remote_description(const std::string &description)
    {
        const auto parsed = parse_description(description);
        if (parsed.protocol != kProtocolTag)
        {
            throw LinkError("Unsupported link protocol: " + parsed.protocol);
        }

        std::lock_guard lock(mutex_);
        if (remote_description_set_)
        {
            throw LinkError("Remote description already set");
        }
        if (role_ == Role::Offerer)
        {
            if (parsed.token != token_)
            {
                throw LinkError("Answer does not match the offer token");
            }
        }
        else
        {
            token_ = parsed.token;
        }
        remote_description_set_ = true;
    }

    void TcpDirectLink::add_remote_candidate(const std::string &candidate)
    {
        {
            std::lock_guard lock(mutex_);
            if (!remote_description_set_)
            {
                throw LinkError("Candidate received before the remote description");
            }
            if (role_ == Role::Offerer)
            {
                // The listening side never dials out.
                return;
            }
        }
        asio::post(io_context_, [this, candidate]
                   {
            pending_candidates_.push_back(candidate);
            try_next_candidate(); });
    }

    std::vector<LinkEvent> TcpDirectLink::drain_events()
    {
        std::lock_guard lock(mutex_);
        std::vector<LinkEvent> events;
        events.swap(events_);
        return events;
    }

    LinkState TcpDirectLink::state() const
    {
        std::lock_guard lock(mutex_);
        return state_;
    }

    void TcpDirectLink::send_text(std::string_view text)
    {
        enqueue(LinkFrameKind::Text, as_bytes(text));
    }

    void TcpDirectLink::send_binary(std::span<const std::uint8_t> data)
    {
        enqueue(LinkFrameKind::Binary, data);
    }

    std::uint64_t TcpDirectLink::buffered_amount() const
    {
        return buffered_.load();
    }

    std::optional<LinkMessage> TcpDirectLink::receive(std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mutex_);
        inbox_cv_.wait_for(lock, timeout, [this]
                           { return !inbox_.empty() || state_ == LinkState::Failed || state_ == LinkState::Closed; });
        if (!inbox_.empty())
        {
            auto message = std::move(inbox_.front());
            inbox_.pop_front();
            return message;
        }
        if (state_ == LinkState::Failed || state_ == LinkState::Closed)
        {
            throw LinkError("Link " + std::string(to_string(state_)));
        }
        return std::nullopt;
    }

    void TcpDirectLink::close()
    {
        {
            std::lock_guard lock(mutex_);
            if (closing_)
            {
                return;
            }
            closing_ = true;
            if (state_ != LinkState::Failed)
            {
                state_ = LinkState::Closed;
            }
        }
        inbox_cv_.notify_all();

        asio::post(io_context_, [this]
                   {
            std::error_code ignored;
            connect_timer_.cancel();
            acceptor_.close(ignored);
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            socket_.close(ignored); });
        work_.reset();
        if (io_thread_.joinable())
        {
            if (io_thread_.get_id() == std::this_thread::get_id())
            {
                io_thread_.detach();
            }
            else
            {
                io_thread_.join();
            }
        }
    }

    std::vector<std::string> TcpDirectLink::local_candidates(unsigned short port)
    {
        std::vector<std::string> hosts;
        if (options_.advertise_host)
        {
            hosts.push_back(*options_.advertise_host);
        }
        else
        {
            std::error_code ec;
            const auto bound = asio::ip::make_address(options_.bind_address, ec);
            if (!ec && !bound.is_unspecified())
            {
                hosts.push_back(bound.to_string());
            }
            else
            {
                asio::ip::tcp::resolver resolver(io_context_);
                const auto results = resolver.resolve(asio::ip::host_name(ec), "", ec);
                if (ec)
                {
                    logger_.warn("link", "address discovery failed: ", ec.message());
                }
                else
                {
                    for (const auto &entry : results)
                    {
                        const auto address = entry.endpoint().address();
                        const auto text = address.to_string();
                        if (address.is_v4() && !address.is_loopback() &&
                            std::find(hosts.begin(), hosts.end(), text) == hosts.end())
                        {
                            hosts.push_back(text);
                        }
                    }
                }
                hosts.emplace_back("127.0.0.1");
            }
        }

        std::vector<std::string> candidates;
        candidates.reserve(hosts.size());
        for (const auto &host : hosts)
        {
            candidates.push_back(host + ":" + std::to_string(port));
        }
        return candidates;
    }

    void TcpDirectLink::start_accept()
    {
        auto peer = std::make_shared<asio::ip::tcp::socket>(io_context_);
        acceptor_.async_accept(*peer, [this, peer](const std::error_code &ec)
                               {
            if (ec)
            {
                if (ec != asio::error::operation_aborted)
                {
                    fail("accept failed: " + ec.message());
                }
                return;
            }
            read_hello(peer);
            start_accept(); });
    }

    void TcpDirectLink::read_hello(std::shared_ptr<asio::ip::tcp::socket> peer)
    {
        auto header = std::make_shared<std::array<std::uint8_t, peerdrop::protocol::kLinkHeaderSize>>();
        asio::async_read(*peer, asio::buffer(*header), [this, peer, header](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
            if (ec)
            {
                return;
            }
            std::error_code ignored;
            peerdrop::protocol::LinkFrameHeader decoded;
            try
            {
                decoded = peerdrop::protocol::decode_link_header(*header);
            }
            catch (const std::runtime_error &ex)
            {
                logger_.warn("link", "dropping connection: ", ex.what());
                peer->close(ignored);
                return;
            }
            if (decoded.kind != LinkFrameKind::Text || decoded.length > kMaxHelloSize)
            {
                logger_.warn("link", "dropping connection without a hello frame");
                peer->close(ignored);
                return;
            }

            auto body = std::make_shared<std::vector<std::uint8_t>>(decoded.length);
            asio::async_read(*peer, asio::buffer(*body), [this, peer, body](const std::error_code &read_ec, std::size_t /*bytes_transferred*/)
                             {
                if (read_ec)
                {
                    return;
                }
                std::string token;
                try
                {
                    const auto json = nlohmann::json::parse(std::string(body->begin(), body->end()));
                    token = json.at("hello").get<std::string>();
                }
                catch (const nlohmann::json::exception &)
                {
                    token.clear();
                }

                bool accepted = false;
                {
                    std::lock_guard lock(mutex_);
                    accepted = !token.empty() && token == token_ && state_ == LinkState::Connecting && !closing_;
                }
                std::error_code ignored;
                if (!accepted)
                {
                    logger_.warn("link", "dropping connection with an invalid hello");
                    peer->close(ignored);
                    return;
                }
                acceptor_.close(ignored);
                socket_ = std::move(*peer);
                on_connected(); }); });
    }

    void TcpDirectLink::try_next_candidate()
    {
        if (connecting_)
        {
            return;
        }
        {
            std::lock_guard lock(mutex_);
            if (role_ != Role::Answerer || state_ != LinkState::Connecting || closing_)
            {
                return;
            }
        }

        while (!pending_candidates_.empty())
        {
            const auto candidate = pending_candidates_.front();
            pending_candidates_.pop_front();
            const auto endpoint = parse_candidate(candidate);
            if (!endpoint)
            {
                logger_.warn("link", "skipping malformed candidate ", candidate);
                continue;
            }

            connecting_ = true;
            logger_.log("link", "connecting to ", candidate);
            connect_timer_.expires_after(options_.connect_timeout);
            connect_timer_.async_wait([this](const std::error_code &ec)
                                      {
                if (!ec)
                {
                    std::error_code ignored;
                    socket_.close(ignored);
                } });
            socket_.async_connect(*endpoint, [this, candidate](const std::error_code &ec)
                                  {
                connect_timer_.cancel();
                connecting_ = false;
                if (ec)
                {
                    std::error_code ignored;
                    socket_.close(ignored);
                    if (ec != asio::error::operation_aborted || state() == LinkState::Connecting)
                    {
                        logger_.warn("link", "candidate ", candidate, " unreachable: ", ec.message());
                    }
                    try_next_candidate();
                    return;
                }
                send_hello(); });
            return;
        }
    }

    void TcpDirectLink::send_hello()
    {
        std::string token;
        {
            std::lock_guard lock(mutex_);
            token = token_;
        }
        const auto text = nlohmann::json{{"hello", token}}.dump();
        auto frame = std::make_shared<std::vector<std::uint8_t>>(
            peerdrop::protocol::encode_link_frame(LinkFrameKind::Text, as_bytes(text)));
        asio::async_write(socket_, asio::buffer(*frame), [this, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
            if (ec)
            {
                fail("hello failed: " + ec.message());
                return;
            }
            on_connected(); });
    }

    void TcpDirectLink::on_connected()
    {
        std::error_code ec;
        const auto remote = socket_.remote_endpoint(ec);
        const auto peer = ec ? std::string("<unknown>") : remote.address().to_string() + ":" + std::to_string(remote.port());
        {
            std::lock_guard lock(mutex_);
            if (closing_ || state_ != LinkState::Connecting)
            {
                return;
            }
            state_ = LinkState::Connected;
            events_.emplace_back(StateChanged{LinkState::Connected, peer});
        }
        logger_.log("link", "connected to ", peer);
        read_header();
    }

    void TcpDirectLink::read_header()
    {
        asio::async_read(socket_, asio::buffer(header_), [this](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
            if (ec)
            {
                fail(ec == asio::error::eof ? std::string("connection closed by peer") : ec.message());
                return;
            }
            peerdrop::protocol::LinkFrameHeader header;
            try
            {
                header = peerdrop::protocol::decode_link_header(header_);
            }
            catch (const std::runtime_error &ex)
            {
                fail(ex.what());
                return;
            }
            read_payload(header); });
    }

    void TcpDirectLink::read_payload(peerdrop::protocol::LinkFrameHeader header)
    {
        payload_.resize(header.length);
        asio::async_read(socket_, asio::buffer(payload_), [this, kind = header.kind](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
            if (ec)
            {
                fail(ec.message());
                return;
            }
            LinkMessage message;
            if (kind == LinkFrameKind::Text)
            {
                message = TextMessage{std::string(payload_.begin(), payload_.end())};
            }
            else
            {
                message = BinaryMessage{std::move(payload_)};
            }
            payload_ = {};
            {
                std::lock_guard lock(mutex_);
                inbox_.push_back(std::move(message));
            }
            inbox_cv_.notify_one();
            read_header(); });
    }

    void TcpDirectLink::enqueue(LinkFrameKind kind, std::span<const std::uint8_t> payload)
    {
        {
            std::lock_guard lock(mutex_);
            if (state_ != LinkState::Connected)
            {
                throw LinkError("Link is not open (" + std::string(to_string(state_)) + ")");
            }
        }
        auto frame = peerdrop::protocol::encode_link_frame(kind, payload);
        buffered_ += frame.size();
        asio::post(io_context_, [this, frame = std::move(frame)]() mutable
                   {
            write_queue_.push_back(std::move(frame));
            if (!writing_)
            {
                write_next();
            } });
    }

    void TcpDirectLink::write_next()
    {
        writing_ = true;
        asio::async_write(socket_, asio::buffer(write_queue_.front()), [this](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
            buffered_ -= write_queue_.front().size();
            write_queue_.pop_front();
            if (ec)
            {
                for (const auto &pending : write_queue_)
                {
                    buffered_ -= pending.size();
                }
                write_queue_.clear();
                writing_ = false;
                fail("write failed: " + ec.message());
                return;
            }
            if (write_queue_.empty())
            {
                writing_ = false;
                return;
            }
            write_next(); });
    }

    void TcpDirectLink::fail(const std::string &reason)
    {
        {
            std::lock_guard lock(mutex_);
            if (closing_ || state_ == LinkState::Failed || state_ == LinkState::Closed)
            {
                return;
            }
            state_ = LinkState::Failed;
            events_.emplace_back(StateChanged{LinkState::Failed, reason});
        }
        inbox_cv_.notify_all();
        logger_.error("link failed: ", reason);
        std::error_code ignored;
        acceptor_.close(ignored);
        socket_.close(ignored);
    }

} // namespace peerdrop::client
