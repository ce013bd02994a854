#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace peerdrop::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::size_t worker_threads{0};
        std::chrono::seconds session_ttl{std::chrono::seconds{600}};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
    };

} // namespace peerdrop::server
