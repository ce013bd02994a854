#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop::client
{

    /**
     * Range-readable bytes to send, with the name and type shown to the receiver.
     */
    class FileSource
    {
    public:
        virtual ~FileSource() = default;

        virtual std::string name() const = 0;
        // Empty when unknown; the sender then guesses from the name.
        virtual std::string mime_type() const = 0;
        virtual std::uint64_t size() const = 0;
        virtual std::vector<std::uint8_t> read(std::uint64_t offset, std::uint64_t length) = 0;
    };

    /**
     * Destination for a fully reassembled file.
     */
    class FileSink
    {
    public:
        virtual ~FileSink() = default;

        // Returns a description of where the bytes went.
        virtual std::string deliver(const std::string &file_name, const std::string &mime_type,
                                    const std::vector<std::uint8_t> &bytes) = 0;
    };

    class DiskFileSource : public FileSource
    {
    public:
        // Throws std::runtime_error when the path is missing or not a regular file.
        explicit DiskFileSource(std::filesystem::path path);

        std::string name() const override;
        std::string mime_type() const override;
        std::uint64_t size() const override;
        std::vector<std::uint8_t> read(std::uint64_t offset, std::uint64_t length) override;

    private:
        std::filesystem::path path_;
        std::uint64_t size_{};
        std::ifstream stream_;
    };

    /**
     * Writes delivered files into a directory. Only the last path component of the sender's name
     * is used, and an existing file is never overwritten: "name (1).ext" and so on are tried.
     */
    class DiskFileSink : public FileSink
    {
    public:
        explicit DiskFileSink(std::filesystem::path directory);

        std::string deliver(const std::string &file_name, const std::string &mime_type,
                            const std::vector<std::uint8_t> &bytes) override;

        const std::optional<std::filesystem::path> &last_path() const noexcept { return last_path_; }

    private:
        std::filesystem::path directory_;
        std::optional<std::filesystem::path> last_path_;
    };

    class MemoryFileSource : public FileSource
    {
    public:
        MemoryFileSource(std::string name, std::string mime_type, std::vector<std::uint8_t> bytes);

        std::string name() const override { return name_; }
        std::string mime_type() const override { return mime_type_; }
        std::uint64_t size() const override { return bytes_.size(); }
        std::vector<std::uint8_t> read(std::uint64_t offset, std::uint64_t length) override;

    private:
        std::string name_;
        std::string mime_type_;
        std::vector<std::uint8_t> bytes_;
    };

    class MemoryFileSink : public FileSink
    {
    public:
        struct Delivery
        {
            std::string file_name;
            std::string mime_type;
            std::vector<std::uint8_t> bytes;
        };

        std::string deliver(const std::string &file_name, const std::string &mime_type,
                            const std::vector<std::uint8_t> &bytes) override;

        const std::vector<Delivery> &deliveries() const noexcept { return deliveries_; }

    private:
        std::vector<Delivery> deliveries_;
    };

    // Strips directories and characters that are unsafe in a local file name.
    std::string sanitize_file_name(const std::string &name);

} // namespace peerdrop::client
