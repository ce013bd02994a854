#include "peerdrop/client/file_io.hpp"

#include <algorithm>
#include <stdexcept>

namespace peerdrop::client
{

    DiskFileSource::DiskFileSource(std::filesystem::path path) : path_(std::move(path))
    {
        if (!std::filesystem::is_regular_file(path_))
        {
            throw std::runtime_error("Not a regular file: " + path_.string());
        }
        size_ = std::filesystem::file_size(path_);
        stream_.open(path_, std::ios::binary);
        if (!stream_.is_open())
        {
            throw std::runtime_error("Unable to open " + path_.string());
        }
    }

    std::string DiskFileSource::name() const
    {
        return path_.filename().string();
    }

    std::string DiskFileSource::mime_type() const
    {
        return {};
    }

    std::uint64_t DiskFileSource::size() const
    {
        return size_;
    }

    std::vector<std::uint8_t> DiskFileSource::read(std::uint64_t offset, std::uint64_t length)
    {
        if (offset >= size_)
        {
            return {};
        }
        length = std::min(length, size_ - offset);
        std::vector<std::uint8_t> buffer(static_cast<std::size_t>(length));
        stream_.clear();
        stream_.seekg(static_cast<std::streamoff>(offset));
        stream_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (stream_.gcount() != static_cast<std::streamsize>(buffer.size()))
        {
            throw std::runtime_error("Short read from " + path_.string());
        }
        return buffer;
    }

    DiskFileSink::DiskFileSink(std::filesystem::path directory) : directory_(std::move(directory)) {}

    std::string DiskFileSink::deliver(const std::string &file_name, const std::string & /*mime_type*/,
                                      const std::vector<std::uint8_t> &bytes)
    {
        std::filesystem::create_directories(directory_);
        const std::filesystem::path base(sanitize_file_name(file_name));
        auto target = directory_ / base;
        for (int attempt = 1; std::filesystem::exists(target); ++attempt)
        {
            target = directory_ / (base.stem().string() + " (" + std::to_string(attempt) + ")" + base.extension().string());
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Unable to create " + target.string());
        }
        out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out)
        {
            throw std::runtime_error("Failed to write " + target.string());
        }
        last_path_ = target;
        return target.string();
    }

    MemoryFileSource::MemoryFileSource(std::string name, std::string mime_type, std::vector<std::uint8_t> bytes)
        : name_(std::move(name)), mime_type_(std::move(mime_type)), bytes_(std::move(bytes)) {}

    std::vector<std::uint8_t> MemoryFileSource::read(std::uint64_t offset, std::uint64_t length)
    {
        if (offset >= bytes_.size())
        {
            return {};
        }
        const auto end = std::min<std::uint64_t>(bytes_.size(), offset + length);
        return {bytes_.begin() + static_cast<std::ptrdiff_t>(offset), bytes_.begin() + static_cast<std::ptrdiff_t>(end)};
    }

    std::string MemoryFileSink::deliver(const std::string &file_name, const std::string &mime_type,
                                        const std::vector<std::uint8_t> &bytes)
    {
        deliveries_.push_back(Delivery{file_name, mime_type, bytes});
        return "memory:" + file_name;
    }

    std::string sanitize_file_name(const std::string &name)
    {
        std::string result = name;
        const auto slash = result.find_last_of("/\\");
        if (slash != std::string::npos)
        {
            result = result.substr(slash + 1);
        }
        result.erase(std::remove_if(result.begin(), result.end(), [](char ch)
                                    { return static_cast<unsigned char>(ch) < 0x20 || ch == ':'; }),
                     result.end());
        if (result.empty() || result == "." || result == "..")
        {
            return "received.bin";
        }
        return result;
    }

} // namespace peerdrop::client
