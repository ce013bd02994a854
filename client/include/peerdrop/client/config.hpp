#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace peerdrop::client
{

    enum class Mode
    {
        Send,
        Receive
    };

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        Mode mode{Mode::Send};
        std::filesystem::path file;
        std::string code;
        std::filesystem::path output_dir{"."};
        std::optional<std::filesystem::path> log_path;
        bool compress{true};
        bool constrained{false};
        std::optional<std::uint64_t> chunk_size;
        bool assume_yes{false};
        std::filesystem::path checkpoint_dir;
    };

    // Throws std::runtime_error with a usage message on bad input.
    ClientConfig parse_arguments(int argc, char *argv[]);

    // Trims and upper-cases a typed code; nullopt unless exactly six characters remain.
    std::optional<std::string> normalize_code(std::string_view input);

    std::filesystem::path default_checkpoint_dir();

} // namespace peerdrop::client
