#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>

#include "peerdrop/client/config.hpp"
#include "peerdrop/client/logger.hpp"
#include "peerdrop/client/peer_session.hpp"
#include "peerdrop/client/remote_coordinator.hpp"
#include "peerdrop/version.hpp"

namespace
{

    std::atomic<peerdrop::client::CancellationToken *> g_cancel{nullptr};

    void handle_interrupt(int /*signal*/)
    {
        if (auto *token = g_cancel.load())
        {
            token->cancel();
        }
    }

    // Routes SIGINT to a running session for as long as it is in scope.
    class InterruptGuard
    {
    public:
        explicit InterruptGuard(peerdrop::client::CancellationToken &token)
        {
            g_cancel.store(&token);
            std::signal(SIGINT, handle_interrupt);
        }

        ~InterruptGuard()
        {
            std::signal(SIGINT, SIG_DFL);
            g_cancel.store(nullptr);
        }

        InterruptGuard(const InterruptGuard &) = delete;
        InterruptGuard &operator=(const InterruptGuard &) = delete;
    };

} // namespace

int main(int argc, char *argv[])
{
    using namespace peerdrop::client;
    try
    {
        const auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path);
        logger.log("info", "peerdrop-client ", peerdrop::version(), " -> ", config.host, ':', config.port);

        RemoteCoordinator coordinator(config.host, config.port, logger);
        coordinator.connect();
        coordinator.ping();

        PeerSession session(config, coordinator, logger);
        InterruptGuard interrupt(session.cancellation());
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
