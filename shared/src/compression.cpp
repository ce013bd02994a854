#include "peerdrop/compression.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>

#include <zlib.h>

namespace peerdrop::compression
{

    namespace
    {

        constexpr std::array<std::string_view, 6> kCompressibleMimePrefixes{
            "text/",
            "application/json",
            "application/xml",
            "application/javascript",
            "image/svg+xml",
            "image/bmp",
        };

        constexpr std::array<std::string_view, 18> kCompressibleExtensions{
            "txt", "csv", "json", "xml", "html", "htm", "css", "js", "md",
            "log", "svg", "bmp", "tsv", "yaml", "yml", "ini", "sql", "tar",
        };

        struct MimeMapping
        {
            std::string_view extension;
            std::string_view mime;
        };

        constexpr std::array<MimeMapping, 24> kMimeTypes{{
            {"txt", "text/plain"},
            {"log", "text/plain"},
            {"md", "text/markdown"},
            {"csv", "text/csv"},
            {"tsv", "text/tab-separated-values"},
            {"html", "text/html"},
            {"htm", "text/html"},
            {"css", "text/css"},
            {"js", "application/javascript"},
            {"json", "application/json"},
            {"xml", "application/xml"},
            {"yaml", "application/yaml"},
            {"yml", "application/yaml"},
            {"svg", "image/svg+xml"},
            {"bmp", "image/bmp"},
            {"png", "image/png"},
            {"jpg", "image/jpeg"},
            {"jpeg", "image/jpeg"},
            {"gif", "image/gif"},
            {"pdf", "application/pdf"},
            {"zip", "application/zip"},
            {"gz", "application/gzip"},
            {"mp4", "video/mp4"},
            {"mp3", "audio/mpeg"},
        }};

        std::string lowercase_extension(std::string_view file_name)
        {
            const auto dot = file_name.find_last_of('.');
            if (dot == std::string_view::npos || dot + 1 >= file_name.size())
            {
                return {};
            }
            std::string ext(file_name.substr(dot + 1));
            for (auto &ch : ext)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return ext;
        }

        constexpr std::size_t kInflateWindow = 256 * 1024;
        // Up-front reservation limit; the declared size comes off the wire.
        constexpr std::uint64_t kInflateReserveCap = 64ull * 1024 * 1024;

        struct InflateGuard
        {
            z_stream &stream;
            ~InflateGuard() { inflateEnd(&stream); }
        };

    } // namespace

    std::vector<std::uint8_t> deflate_bytes(std::span<const std::uint8_t> input)
    {
        if (input.size() > std::numeric_limits<uLong>::max())
        {
            throw std::length_error("Input too large to compress");
        }
        uLongf out_len = compressBound(static_cast<uLong>(input.size()));
        std::vector<std::uint8_t> output(out_len);
        const int status = compress2(output.data(), &out_len, input.data(), static_cast<uLong>(input.size()),
                                     Z_DEFAULT_COMPRESSION);
        if (status != Z_OK)
        {
            throw std::runtime_error("compress2 failed with status " + std::to_string(status));
        }
        output.resize(out_len);
        return output;
    }

    std::vector<std::uint8_t> inflate_bytes(std::span<const std::uint8_t> input, std::uint64_t expected_size)
    {
        z_stream stream{};
        if (inflateInit(&stream) != Z_OK)
        {
            throw DecompressionError("inflateInit failed");
        }
        InflateGuard guard{stream};

        // zlib counts in uInt, so both sides are fed through windows of at most uInt::max bytes.
        constexpr std::size_t kMaxWindow = std::numeric_limits<uInt>::max();
        std::vector<std::uint8_t> window(kInflateWindow);
        std::vector<std::uint8_t> output;
        output.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(expected_size, kInflateReserveCap)));

        std::size_t offset = 0;
        int status = Z_OK;
        while (status != Z_STREAM_END)
        {
            if (stream.avail_in == 0 && offset < input.size())
            {
                const auto slice = std::min(input.size() - offset, kMaxWindow);
                stream.next_in = const_cast<Bytef *>(input.data() + offset);
                stream.avail_in = static_cast<uInt>(slice);
                offset += slice;
            }
            stream.next_out = window.data();
            stream.avail_out = static_cast<uInt>(window.size());

            status = inflate(&stream, Z_NO_FLUSH);
            if (status == Z_BUF_ERROR)
            {
                throw DecompressionError("Compressed payload truncated");
            }
            if (status != Z_OK && status != Z_STREAM_END)
            {
                throw DecompressionError("Compressed payload is corrupt");
            }

            const auto produced = window.size() - stream.avail_out;
            if (output.size() + produced > expected_size)
            {
                throw DecompressionError("Compressed payload larger than declared " + std::to_string(expected_size));
            }
            output.insert(output.end(), window.begin(), window.begin() + static_cast<std::ptrdiff_t>(produced));
        }

        if (output.size() != expected_size)
        {
            throw DecompressionError("Decompressed size " + std::to_string(output.size()) +
                                     " does not match declared " + std::to_string(expected_size));
        }
        return output;
    }

    bool should_compress(std::string_view mime_type, std::string_view file_name, std::uint64_t size)
    {
        if (size < kMinCompressSize)
        {
            return false;
        }
        const bool mime_match = std::any_of(kCompressibleMimePrefixes.begin(), kCompressibleMimePrefixes.end(),
                                            [&](std::string_view prefix)
                                            { return mime_type.starts_with(prefix); });
        if (mime_match)
        {
            return true;
        }
        const auto ext = lowercase_extension(file_name);
        return std::find(kCompressibleExtensions.begin(), kCompressibleExtensions.end(), ext) !=
               kCompressibleExtensions.end();
    }

    std::string guess_mime_type(std::string_view file_name)
    {
        const auto ext = lowercase_extension(file_name);
        for (const auto &mapping : kMimeTypes)
        {
            if (mapping.extension == ext)
            {
                return std::string(mapping.mime);
            }
        }
        return "application/octet-stream";
    }

} // namespace peerdrop::compression
