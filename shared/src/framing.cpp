#include "peerdrop/framing.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace peerdrop::protocol
{

    namespace
    {
        constexpr std::size_t kHeaderSize = sizeof(std::uint32_t);
    } // namespace

    std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer)
    {
        return (static_cast<std::uint32_t>(buffer[0]) << 24) |
               (static_cast<std::uint32_t>(buffer[1]) << 16) |
               (static_cast<std::uint32_t>(buffer[2]) << 8) |
               static_cast<std::uint32_t>(buffer[3]);
    }

    void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer)
    {
        buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
        buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
        buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
        buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
    }

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        if (text.size() > kMaxFrameSize)
        {
            throw std::length_error("JSON message too large to frame");
        }
        std::vector<std::uint8_t> frame(kHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()), std::span<std::uint8_t>(frame).first<kHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kHeaderSize));
        return frame;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = read_u32_be(buffer.first<kHeaderSize>());
        if (payload_size > kMaxFrameSize)
        {
            throw std::runtime_error("Frame length " + std::to_string(payload_size) + " exceeds limit");
        }
        if (buffer.size() < kHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kHeaderSize);
        const std::string payload(payload_begin, payload_begin + payload_size);
        DecodedFrame result{
            .message = nlohmann::json::parse(payload),
            .bytes_consumed = kHeaderSize + payload_size,
        };
        return result;
    }

    std::vector<std::uint8_t> encode_link_frame(LinkFrameKind kind, std::span<const std::uint8_t> payload)
    {
        if (payload.size() > kMaxFrameSize)
        {
            throw std::length_error("Link message too large to frame");
        }
        std::vector<std::uint8_t> frame(kLinkHeaderSize + payload.size());
        frame[0] = static_cast<std::uint8_t>(kind);
        write_u32_be(static_cast<std::uint32_t>(payload.size()), std::span<std::uint8_t>(frame).subspan(1, kHeaderSize));
        std::copy(payload.begin(), payload.end(), frame.begin() + static_cast<std::ptrdiff_t>(kLinkHeaderSize));
        return frame;
    }

    LinkFrameHeader decode_link_header(std::span<const std::uint8_t, kLinkHeaderSize> header)
    {
        LinkFrameHeader result{};
        switch (header[0])
        {
        case static_cast<std::uint8_t>(LinkFrameKind::Text):
            result.kind = LinkFrameKind::Text;
            break;
        case static_cast<std::uint8_t>(LinkFrameKind::Binary):
            result.kind = LinkFrameKind::Binary;
            break;
        default:
            throw std::runtime_error("Unknown link frame kind " + std::to_string(header[0]));
        }
        result.length = read_u32_be(std::span<const std::uint8_t>(header).subspan(1, kHeaderSize));
        if (result.length > kMaxFrameSize)
        {
            throw std::runtime_error("Link frame length " + std::to_string(result.length) + " exceeds limit");
        }
        return result;
    }

} // namespace peerdrop::protocol
