#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace peerdrop::client
{

    /**
     * Cooperative stop flag shared by the polling, setup and transfer loops.
     *
     * cancel() only stores to a lock-free atomic, so it may be called from a signal handler.
     */
    class CancellationToken
    {
    public:
        void cancel() noexcept { cancelled_.store(true); }

        bool cancelled() const noexcept { return cancelled_.load(); }

        void reset() noexcept { cancelled_.store(false); }

        // Sleeps up to `duration`; returns true as soon as cancellation is observed.
        template <typename Rep, typename Period>
        bool wait_for(std::chrono::duration<Rep, Period> duration) const
        {
            constexpr auto kSlice = std::chrono::milliseconds(20);
            const auto deadline = std::chrono::steady_clock::now() + duration;
            while (!cancelled())
            {
                const auto now = std::chrono::steady_clock::now();
                if (now >= deadline)
                {
                    return false;
                }
                std::this_thread::sleep_for(
                    std::min<std::chrono::steady_clock::duration>(kSlice, deadline - now));
            }
            return true;
        }

    private:
        std::atomic<bool> cancelled_{false};
    };

} // namespace peerdrop::client
