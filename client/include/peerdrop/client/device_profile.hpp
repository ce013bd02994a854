#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace peerdrop::client
{

    enum class DeviceProfile
    {
        Standard,
        Constrained
    };

    std::string_view to_string(DeviceProfile profile) noexcept;

    // Constrained when forced, or when the machine reports two or fewer hardware threads.
    DeviceProfile detect_device_profile(bool force_constrained);

    // Smallest chunk size; also used when calibration cannot run.
    constexpr std::uint64_t kMinChunkSize = 64 * 1024;

    /**
     * Maps an observed probe throughput to a chunk-size tier.
     *
     * Standard:    64 KiB, 256 KiB (>= 1 MiB/s), 512 KiB (>= 4 MiB/s), 1 MiB (>= 8 MiB/s).
     * Constrained: 64 KiB, 128 KiB (>= 1 MiB/s), 256 KiB (>= 4 MiB/s).
     */
    std::uint64_t select_chunk_size(std::uint64_t probe_bytes, std::chrono::nanoseconds elapsed,
                                    DeviceProfile profile);

    // Outstanding send-buffer level above which the sender waits for the link to drain.
    std::uint64_t buffered_threshold(DeviceProfile profile) noexcept;

    std::chrono::milliseconds inter_chunk_delay(DeviceProfile profile) noexcept;

} // namespace peerdrop::client
