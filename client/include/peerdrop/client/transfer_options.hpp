#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "peerdrop/client/device_profile.hpp"

namespace peerdrop::client
{

    /**
     * Tunables for connection setup and the transfer engine.
     */
    struct TransferOptions
    {
        DeviceProfile profile{DeviceProfile::Standard};
        bool compress{true};
        // Skips calibration when set.
        std::optional<std::uint64_t> fixed_chunk_size{};

        std::chrono::milliseconds poll_interval{std::chrono::seconds(1)};
        std::chrono::milliseconds setup_timeout{std::chrono::seconds(120)};
        std::chrono::milliseconds acceptance_timeout{std::chrono::seconds(120)};
        // Longest silence tolerated by the receiver between messages.
        std::chrono::milliseconds idle_timeout{std::chrono::seconds(120)};

        std::uint64_t probe_size{256 * 1024};
        std::chrono::milliseconds probe_drain_cap{std::chrono::seconds(5)};
        std::chrono::milliseconds drain_poll{10};
        std::chrono::milliseconds drain_cap{std::chrono::seconds(5)};

        std::uint64_t checkpoint_every{10};
        std::chrono::hours checkpoint_retention{24};
    };

} // namespace peerdrop::client
