#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "peerdrop/signaling.hpp"
#include "peerdrop/transfer_frames.hpp"

namespace peerdrop::client
{

    /**
     * Partial receive state for one session code.
     */
    struct ResumeCheckpoint
    {
        peerdrop::transfer::FileMetadata metadata;
        // Received chunk buffers keyed (and therefore ordered) by chunk index.
        std::map<std::uint64_t, std::vector<std::uint8_t>> chunks;
        std::uint64_t bytes_received{};
        Timestamp saved_at{};

        std::vector<std::uint64_t> received_indices() const;

        // Lowest chunk index not yet received.
        std::uint64_t first_missing_chunk() const;
    };

    void to_json(nlohmann::json &json, const ResumeCheckpoint &checkpoint);
    void from_json(const nlohmann::json &json, ResumeCheckpoint &checkpoint);

    bool is_checkpoint_expired(const ResumeCheckpoint &checkpoint, Timestamp now, std::chrono::hours retention);

    // Re-splits the contiguous prefix received from chunk 0 into chunks of `chunk_size`. A trailing
    // short chunk is kept only when the prefix covers the whole payload.
    ResumeCheckpoint rechunk_checkpoint(const ResumeCheckpoint &checkpoint, std::uint64_t chunk_size);

    /**
     * Key-value store of resume checkpoints keyed by session code. Expiry is the caller's call.
     */
    class CheckpointStore
    {
    public:
        virtual ~CheckpointStore() = default;

        virtual void put(const std::string &code, const ResumeCheckpoint &checkpoint) = 0;
        virtual std::optional<ResumeCheckpoint> get(const std::string &code) = 0;
        virtual void erase(const std::string &code) = 0;
    };

    class InMemoryCheckpointStore : public CheckpointStore
    {
    public:
        void put(const std::string &code, const ResumeCheckpoint &checkpoint) override;
        std::optional<ResumeCheckpoint> get(const std::string &code) override;
        void erase(const std::string &code) override;

        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, ResumeCheckpoint> checkpoints_;
    };

    /**
     * One JSON document per code under a directory; chunk buffers are base64 encoded.
     * Unreadable documents are treated as absent.
     */
    class FileCheckpointStore : public CheckpointStore
    {
    public:
        explicit FileCheckpointStore(std::filesystem::path directory);

        void put(const std::string &code, const ResumeCheckpoint &checkpoint) override;
        std::optional<ResumeCheckpoint> get(const std::string &code) override;
        void erase(const std::string &code) override;

        const std::filesystem::path &directory() const noexcept { return directory_; }

    private:
        std::filesystem::path path_for(const std::string &code) const;

        std::filesystem::path directory_;
    };

} // namespace peerdrop::client
