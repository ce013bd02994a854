#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "peerdrop/server/config.hpp"
#include "peerdrop/server/coordinator.hpp"

namespace peerdrop::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

        // Closes the acceptor and stops run(); safe to call from any thread.
        void stop();

        // Bound port; differs from config().port when it was 0.
        unsigned short port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();
        void shutdown();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        Coordinator coordinator_;

        std::vector<std::thread> workers_;
    };

} // namespace peerdrop::server
