#include "peerdrop/error_codes.hpp"

#include <array>

namespace peerdrop
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 15> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::Expired, "expired"},
            {ErrorCode::Full, "full"},
            {ErrorCode::PeerNotRegistered, "peer_not_registered"},
            {ErrorCode::NoPeer, "no_peer"},
            {ErrorCode::LinkFailed, "link_failed"},
            {ErrorCode::DecompressionFailed, "decompression_failed"},
            {ErrorCode::Rejected, "rejected"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
            {ErrorCode::Cancelled, "cancelled"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace peerdrop
