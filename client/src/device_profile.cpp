#include "peerdrop/client/device_profile.hpp"

#include <array>
#include <thread>

namespace peerdrop::client
{

    namespace
    {

        constexpr std::uint64_t kMiB = 1024 * 1024;

        struct ChunkTier
        {
            std::uint64_t min_bytes_per_second;
            std::uint64_t chunk_size;
        };

        // Fastest tier first.
        constexpr std::array<ChunkTier, 4> kStandardTiers{{
            {8 * kMiB, 1024 * 1024},
            {4 * kMiB, 512 * 1024},
            {1 * kMiB, 256 * 1024},
            {0, kMinChunkSize},
        }};

        constexpr std::array<ChunkTier, 3> kConstrainedTiers{{
            {4 * kMiB, 256 * 1024},
            {1 * kMiB, 128 * 1024},
            {0, kMinChunkSize},
        }};

        template <std::size_t N>
        std::uint64_t pick_tier(const std::array<ChunkTier, N> &tiers, double bytes_per_second)
        {
            for (const auto &tier : tiers)
            {
                if (bytes_per_second >= static_cast<double>(tier.min_bytes_per_second))
                {
                    return tier.chunk_size;
                }
            }
            return kMinChunkSize;
        }

    } // namespace

    std::string_view to_string(DeviceProfile profile) noexcept
    {
        return profile == DeviceProfile::Constrained ? "constrained" : "standard";
    }

    DeviceProfile detect_device_profile(bool force_constrained)
    {
        if (force_constrained)
        {
            return DeviceProfile::Constrained;
        }
        const auto threads = std::thread::hardware_concurrency();
        return (threads != 0 && threads <= 2) ? DeviceProfile::Constrained : DeviceProfile::Standard;
    }

    std::uint64_t select_chunk_size(std::uint64_t probe_bytes, std::chrono::nanoseconds elapsed,
                                    DeviceProfile profile)
    {
        if (probe_bytes == 0)
        {
            return kMinChunkSize;
        }
        // A probe that drained instantly counts as the fastest tier.
        const double seconds = elapsed.count() > 0 ? std::chrono::duration<double>(elapsed).count() : 1e-9;
        const double bytes_per_second = static_cast<double>(probe_bytes) / seconds;
        if (profile == DeviceProfile::Constrained)
        {
            return pick_tier(kConstrainedTiers, bytes_per_second);
        }
        return pick_tier(kStandardTiers, bytes_per_second);
    }

    std::uint64_t buffered_threshold(DeviceProfile profile) noexcept
    {
        return profile == DeviceProfile::Constrained ? 8 * kMiB : 16 * kMiB;
    }

    std::chrono::milliseconds inter_chunk_delay(DeviceProfile profile) noexcept
    {
        return profile == DeviceProfile::Constrained ? std::chrono::milliseconds(5) : std::chrono::milliseconds(0);
    }

} // namespace peerdrop::client
