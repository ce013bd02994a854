#include "peerdrop/transfer_frames.hpp"

#include <array>

namespace peerdrop::transfer
{

    namespace
    {
        template <class... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        Overloaded(Ts...) -> Overloaded<Ts...>;

        // Indexed by Frame alternative.
        constexpr std::array<std::string_view, 6> kFrameLabels{
            "metadata", "chunk", "complete", "accept", "resume", "reject"};
    } // namespace

    void to_json(nlohmann::json &json, const FileMetadata &metadata)
    {
        json = {
            {"fileName", metadata.file_name},
            {"fileSize", metadata.declared_size},
            {"originalSize", metadata.original_size},
            {"fileType", metadata.mime_type},
            {"totalChunks", metadata.total_chunks},
            {"chunkSize", metadata.chunk_size},
            {"isCompressed", metadata.is_compressed},
        };
        if (metadata.content_hash)
        {
            json["contentHash"] = *metadata.content_hash;
        }
    }

    void from_json(const nlohmann::json &json, FileMetadata &metadata)
    {
        metadata.file_name = json.at("fileName").get<std::string>();
        metadata.declared_size = json.at("fileSize").get<std::uint64_t>();
        metadata.original_size = json.value("originalSize", metadata.declared_size);
        metadata.mime_type = json.value("fileType", std::string{"application/octet-stream"});
        metadata.total_chunks = json.at("totalChunks").get<std::uint64_t>();
        metadata.chunk_size = json.value("chunkSize", std::uint64_t{0});
        metadata.is_compressed = json.value("isCompressed", false);
        if (auto it = json.find("contentHash"); it != json.end() && it->is_string())
        {
            metadata.content_hash = it->get<std::string>();
        }
        else
        {
            metadata.content_hash.reset();
        }
    }

    std::string_view frame_type(const Frame &frame) noexcept
    {
        return kFrameLabels[frame.index()];
    }

    std::string encode_frame(const Frame &frame)
    {
        nlohmann::json json = nlohmann::json::object();
        std::visit(Overloaded{
                       [&](const MetadataFrame &value)
                       { json = value.metadata; },
                       [&](const ChunkHeaderFrame &value)
                       {
                           json["index"] = value.index;
                           json["size"] = value.size;
                       },
                       [](const CompleteFrame &) {},
                       [](const AcceptFrame &) {},
                       [&](const ResumeFrame &value)
                       { json["fromChunk"] = value.from_chunk; },
                       [](const RejectFrame &) {},
                   },
                   frame);
        json["type"] = frame_type(frame);
        return json.dump();
    }

    std::optional<Frame> decode_frame(std::string_view text)
    {
        const auto json = nlohmann::json::parse(text, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            return std::nullopt;
        }
        try
        {
            const auto type = json.value("type", std::string{});
            if (type == "metadata")
            {
                return Frame{MetadataFrame{json.get<FileMetadata>()}};
            }
            if (type == "chunk")
            {
                return Frame{ChunkHeaderFrame{
                    .index = json.at("index").get<std::uint64_t>(),
                    .size = json.at("size").get<std::uint64_t>(),
                }};
            }
            if (type == "complete")
            {
                return Frame{CompleteFrame{}};
            }
            if (type == "accept")
            {
                return Frame{AcceptFrame{}};
            }
            if (type == "resume")
            {
                return Frame{ResumeFrame{.from_chunk = json.at("fromChunk").get<std::uint64_t>()}};
            }
            if (type == "reject")
            {
                return Frame{RejectFrame{}};
            }
        }
        catch (const nlohmann::json::exception &)
        {
            return std::nullopt;
        }
        return std::nullopt;
    }

    std::uint64_t chunk_count(std::uint64_t size, std::uint64_t chunk_size) noexcept
    {
        if (chunk_size == 0)
        {
            return 0;
        }
        return (size + chunk_size - 1) / chunk_size;
    }

} // namespace peerdrop::transfer
