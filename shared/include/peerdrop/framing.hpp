/**
 * PeerDrop - Length-prefixed framing for coordinator RPC and direct-link messages.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace peerdrop::protocol
{

    // Upper bound on any single frame; larger headers are treated as corruption.
    constexpr std::size_t kMaxFrameSize = 64u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

    enum class LinkFrameKind : std::uint8_t
    {
        Text = 0x01,
        Binary = 0x02
    };

    constexpr std::size_t kLinkHeaderSize = 1 + sizeof(std::uint32_t);

    struct LinkFrameHeader
    {
        LinkFrameKind kind{LinkFrameKind::Text};
        std::uint32_t length{};
    };

    std::vector<std::uint8_t> encode_link_frame(LinkFrameKind kind, std::span<const std::uint8_t> payload);

    // Throws std::runtime_error for an unknown kind or an oversized length.
    LinkFrameHeader decode_link_header(std::span<const std::uint8_t, kLinkHeaderSize> header);

    std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer);

    void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer);

} // namespace peerdrop::protocol
