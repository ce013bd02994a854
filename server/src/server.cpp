#include "peerdrop/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "peerdrop/server/connection.hpp"

namespace peerdrop::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        CoordinatorConfig coordinator_config(const ServerConfig &config)
        {
            CoordinatorConfig result;
            result.session_ttl = config.session_ttl;
            return result;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          coordinator_(std::make_unique<InMemorySessionStore>(), coordinator_config(config_))
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} (session ttl {}s)", config_.address, port(), config_.session_ttl.count());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Coordinator running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        spdlog::info("Coordinator stopped with {} live session(s)", coordinator_.session_count());
    }

    unsigned short Server::port() const
    {
        std::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? config_.port : endpoint.port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto connection = std::make_shared<Connection>(std::move(socket), coordinator_);
            connection->start();
        }
        if (!ec)
        {
            accept_next();
            return;
        }
        if (ec == asio::error::operation_aborted)
        {
            return;
        }
        spdlog::error("Accept error: {}", ec.message());
        if (acceptor_.is_open())
        {
            accept_next();
        }
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   { shutdown(); });
    }

    void Server::handle_signal()
    {
        spdlog::info("Signal received, shutting down");
        shutdown();
    }

    void Server::shutdown()
    {
        std::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        io_context_.stop();
    }

} // namespace peerdrop::server
