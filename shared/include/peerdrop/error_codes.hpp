/**
 * PeerDrop - Shared error codes used across coordinator and peer layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace peerdrop
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        NotFound = 3,
        Expired = 4,
        Full = 5,
        PeerNotRegistered = 6,
        NoPeer = 7,
        LinkFailed = 8,
        DecompressionFailed = 9,
        Rejected = 10,
        Timeout = 11,
        Unsupported = 12,
        InternalError = 13,
        Cancelled = 14
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace peerdrop
