/**
 * PeerDrop - Whole-file deflate helpers built on zlib.
 */
#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace peerdrop::compression
{

    // Files below this size are never compressed.
    constexpr std::uint64_t kMinCompressSize = 1024;

    class DecompressionError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    std::vector<std::uint8_t> deflate_bytes(std::span<const std::uint8_t> input);

    // Throws DecompressionError for corrupt or truncated input, or when the output size differs
    // from expected_size.
    std::vector<std::uint8_t> inflate_bytes(std::span<const std::uint8_t> input, std::uint64_t expected_size);

    // MIME prefix or file extension on the allow-list, and at least kMinCompressSize bytes.
    bool should_compress(std::string_view mime_type, std::string_view file_name, std::uint64_t size);

    // Best-effort MIME type from the extension, application/octet-stream when unknown.
    std::string guess_mime_type(std::string_view file_name);

} // namespace peerdrop::compression
