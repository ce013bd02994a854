#pragma once

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "peerdrop/client/direct_link.hpp"
#include "peerdrop/client/logger.hpp"
#include "peerdrop/framing.hpp"

namespace peerdrop::client
{

    struct TcpLinkOptions
    {
        std::string bind_address{"0.0.0.0"};
        // Announced instead of the enumerated interface addresses when set.
        std::optional<std::string> advertise_host{};
        std::chrono::milliseconds connect_timeout{std::chrono::seconds(3)};
    };

    /**
     * DirectLink over a plain TCP connection.
     *
     * The offering side listens on an ephemeral port and announces one "host:port" candidate per
     * local address. The answering side connects to the candidates in arrival order and opens
     * with a hello frame echoing the token from the offer; the listener drops any connection
     * that does not. Messages use the link framing from peerdrop/framing.hpp.
     *
     * All socket work runs on one internal io thread.
     */
    class TcpDirectLink : public DirectLink
    {
    public:
        explicit TcpDirectLink(Logger logger, TcpLinkOptions options = {});
        ~TcpDirectLink() override;

        TcpDirectLink(const TcpDirectLink &) = delete;
        TcpDirectLink &operator=(const TcpDirectLink &) = delete;

        std::string create_offer() override;
        std::string create_answer() override;
        void set_remote_description(const std::string &description) override;
        void add_remote_candidate(const std::string &candidate) override;
        std::vector<LinkEvent> drain_events() override;
        LinkState state() const override;
        void send_text(std::string_view text) override;
        void send_binary(std::span<const std::uint8_t> data) override;
        std::uint64_t buffered_amount() const override;
        std::optional<LinkMessage> receive(std::chrono::milliseconds timeout) override;
        void close() override;

    private:
        enum class Role
        {
            Unset,
            Offerer,
            Answerer
        };

        std::vector<std::string> local_candidates(unsigned short port);

        void start_accept();
        void read_hello(std::shared_ptr<asio::ip::tcp::socket> peer);
        void try_next_candidate();
        void send_hello();
        void on_connected();

        void read_header();
        void read_payload(peerdrop::protocol::LinkFrameHeader header);

        void enqueue(peerdrop::protocol::LinkFrameKind kind, std::span<const std::uint8_t> payload);
        void write_next();

        void fail(const std::string &reason);

        Logger logger_;
        TcpLinkOptions options_;

        asio::io_context io_context_;
        asio::executor_work_guard<asio::io_context::executor_type> work_;
        asio::ip::tcp::acceptor acceptor_;
        asio::ip::tcp::socket socket_;
        asio::steady_timer connect_timer_;
        std::thread io_thread_;

        // Guarded by mutex_.
        mutable std::mutex mutex_;
        std::condition_variable inbox_cv_;
        std::deque<LinkMessage> inbox_;
        std::vector<LinkEvent> events_;
        LinkState state_{LinkState::New};
        Role role_{Role::Unset};
        std::string token_;
        bool remote_description_set_{false};
        bool closing_{false};

        std::atomic<std::uint64_t> buffered_{0};

        // io thread only.
        std::deque<std::string> pending_candidates_;
        bool connecting_{false};
        std::deque<std::vector<std::uint8_t>> write_queue_;
        bool writing_{false};
        std::array<std::uint8_t, peerdrop::protocol::kLinkHeaderSize> header_{};
        std::vector<std::uint8_t> payload_;
    };

} // namespace peerdrop::client
