/**
 * PeerDrop - Text frames exchanged over the direct link during a file transfer.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace peerdrop::transfer
{

    struct FileMetadata
    {
        std::string file_name;
        // Bytes actually transmitted (after compression when is_compressed is set).
        std::uint64_t declared_size{};
        std::uint64_t original_size{};
        std::string mime_type{"application/octet-stream"};
        std::uint64_t total_chunks{};
        std::uint64_t chunk_size{};
        bool is_compressed{};
        std::optional<std::string> content_hash{};
    };

    void to_json(nlohmann::json &json, const FileMetadata &metadata);
    void from_json(const nlohmann::json &json, FileMetadata &metadata);

    struct MetadataFrame
    {
        FileMetadata metadata;
    };

    // Always followed by exactly one binary message of `size` bytes.
    struct ChunkHeaderFrame
    {
        std::uint64_t index{};
        std::uint64_t size{};
    };

    struct CompleteFrame
    {
    };

    struct AcceptFrame
    {
    };

    struct ResumeFrame
    {
        std::uint64_t from_chunk{};
    };

    struct RejectFrame
    {
    };

    using Frame = std::variant<MetadataFrame, ChunkHeaderFrame, CompleteFrame, AcceptFrame, ResumeFrame, RejectFrame>;

    std::string_view frame_type(const Frame &frame) noexcept;

    std::string encode_frame(const Frame &frame);

    // Returns nullopt for malformed JSON, unknown tags or missing fields.
    std::optional<Frame> decode_frame(std::string_view text);

    std::uint64_t chunk_count(std::uint64_t size, std::uint64_t chunk_size) noexcept;

} // namespace peerdrop::transfer
