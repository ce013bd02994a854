#include "peerdrop/client/checkpoint_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include "peerdrop/encoding/base64.hpp"

namespace peerdrop::client
{

    std::vector<std::uint64_t> ResumeCheckpoint::received_indices() const
    {
        std::vector<std::uint64_t> indices;
        indices.reserve(chunks.size());
        for (const auto &[index, data] : chunks)
        {
            indices.push_back(index);
        }
        return indices;
    }

    std::uint64_t ResumeCheckpoint::first_missing_chunk() const
    {
        std::uint64_t expected = 0;
        for (const auto &[index, data] : chunks)
        {
            if (index != expected)
            {
                break;
            }
            ++expected;
        }
        return expected;
    }

    void to_json(nlohmann::json &json, const ResumeCheckpoint &checkpoint)
    {
        auto chunks = nlohmann::json::array();
        for (const auto &[index, data] : checkpoint.chunks)
        {
            chunks.push_back({{"index", index}, {"data", peerdrop::encoding::encode_base64(data)}});
        }
        json = nlohmann::json{{"metadata", checkpoint.metadata},
                              {"chunks", std::move(chunks)},
                              {"receivedChunks", checkpoint.received_indices()},
                              {"bytesReceived", checkpoint.bytes_received},
                              {"savedAt", to_unix_millis(checkpoint.saved_at)}};
    }

    void from_json(const nlohmann::json &json, ResumeCheckpoint &checkpoint)
    {
        checkpoint.metadata = json.at("metadata").get<peerdrop::transfer::FileMetadata>();
        checkpoint.chunks.clear();
        for (const auto &item : json.at("chunks"))
        {
            const auto index = item.at("index").get<std::uint64_t>();
            checkpoint.chunks[index] = peerdrop::encoding::decode_base64(item.at("data").get<std::string>());
        }
        checkpoint.bytes_received = json.at("bytesReceived").get<std::uint64_t>();
        checkpoint.saved_at = from_unix_millis(json.at("savedAt").get<std::int64_t>());
    }

    bool is_checkpoint_expired(const ResumeCheckpoint &checkpoint, Timestamp now, std::chrono::hours retention)
    {
        return now - checkpoint.saved_at > retention;
    }

    ResumeCheckpoint rechunk_checkpoint(const ResumeCheckpoint &checkpoint, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
        std::vector<std::uint8_t> prefix;
        std::uint64_t expected = 0;
        for (const auto &[index, data] : checkpoint.chunks)
        {
            if (index != expected)
            {
                break;
            }
            prefix.insert(prefix.end(), data.begin(), data.end());
            ++expected;
        }

        ResumeCheckpoint result;
        result.metadata = checkpoint.metadata;
        result.metadata.chunk_size = chunk_size;
        result.metadata.total_chunks = peerdrop::transfer::chunk_count(result.metadata.declared_size, chunk_size);
        result.saved_at = checkpoint.saved_at;

        const bool whole = prefix.size() >= result.metadata.declared_size;
        std::uint64_t index = 0;
        for (std::size_t offset = 0; offset < prefix.size(); offset += chunk_size, ++index)
        {
            const auto size = std::min<std::size_t>(chunk_size, prefix.size() - offset);
            if (size < chunk_size && !whole)
            {
                break;
            }
            const auto first = prefix.begin() + static_cast<std::ptrdiff_t>(offset);
            result.chunks[index].assign(first, first + static_cast<std::ptrdiff_t>(size));
            result.bytes_received += size;
        }
        return result;
    }

    void InMemoryCheckpointStore::put(const std::string &code, const ResumeCheckpoint &checkpoint)
    {
        std::lock_guard lock(mutex_);
        checkpoints_[code] = checkpoint;
    }

    std::optional<ResumeCheckpoint> InMemoryCheckpointStore::get(const std::string &code)
    {
        std::lock_guard lock(mutex_);
        auto it = checkpoints_.find(code);
        if (it == checkpoints_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void InMemoryCheckpointStore::erase(const std::string &code)
    {
        std::lock_guard lock(mutex_);
        checkpoints_.erase(code);
    }

    std::size_t InMemoryCheckpointStore::size() const
    {
        std::lock_guard lock(mutex_);
        return checkpoints_.size();
    }

    FileCheckpointStore::FileCheckpointStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

    void FileCheckpointStore::put(const std::string &code, const ResumeCheckpoint &checkpoint)
    {
        std::filesystem::create_directories(directory_);
        const auto target = path_for(code);
        auto temp = target;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Unable to write checkpoint " + temp.string());
            }
            out << nlohmann::json(checkpoint).dump();
            if (!out)
            {
                throw std::runtime_error("Failed to write checkpoint " + temp.string());
            }
        }
        std::filesystem::rename(temp, target);
    }

    std::optional<ResumeCheckpoint> FileCheckpointStore::get(const std::string &code)
    {
        const auto path = path_for(code);
        if (!std::filesystem::exists(path))
        {
            return std::nullopt;
        }
        std::ifstream in(path);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        try
        {
            nlohmann::json json;
            in >> json;
            return json.get<ResumeCheckpoint>();
        }
        catch (const nlohmann::json::exception &)
        {
            return std::nullopt;
        }
        catch (const std::invalid_argument &)
        {
            // corrupt base64
            return std::nullopt;
        }
    }

    void FileCheckpointStore::erase(const std::string &code)
    {
        std::error_code ec;
        std::filesystem::remove(path_for(code), ec);
    }

    std::filesystem::path FileCheckpointStore::path_for(const std::string &code) const
    {
        std::string name;
        name.reserve(code.size());
        for (const char ch : code)
        {
            if (std::isalnum(static_cast<unsigned char>(ch)) != 0)
            {
                name.push_back(ch);
            }
        }
        if (name.empty())
        {
            throw std::invalid_argument("Checkpoint code has no usable characters");
        }
        return directory_ / (name + ".json");
    }

} // namespace peerdrop::client
