#include "peerdrop/client/config.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace peerdrop::client
{

    namespace
    {

        constexpr const char *kUsage =
            "Usage: peerdrop-client <server>:<port> send <file> | receive <CODE> [--out <dir>] [--log <file>] "
            "[--no-compress] [--constrained] [--chunk-size <bytes>] [--yes] [--checkpoint-dir <dir>]";

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 4)
        {
            throw std::runtime_error(kUsage);
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port = std::stoi(endpoint.substr(colon_pos + 1));
        if (port <= 0 || port > 65535)
        {
            throw std::runtime_error("Port out of range: " + endpoint.substr(colon_pos + 1));
        }
        config.port = static_cast<std::uint16_t>(port);

        const std::string command = argv[index++];
        const std::string operand = argv[index++];
        if (command == "send")
        {
            config.mode = Mode::Send;
            config.file = std::filesystem::path(operand);
        }
        else if (command == "receive")
        {
            config.mode = Mode::Receive;
            auto code = normalize_code(operand);
            if (!code)
            {
                throw std::runtime_error("Invalid code '" + operand + "': expected 6 characters");
            }
            config.code = *code;
        }
        else
        {
            throw std::runtime_error("Unknown command: " + command + "\n" + kUsage);
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--out")
            {
                config.output_dir = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--no-compress")
            {
                config.compress = false;
            }
            else if (arg == "--constrained")
            {
                config.constrained = true;
            }
            else if (arg == "--chunk-size")
            {
                const auto value = std::stoull(require_value(index, argc, argv, arg));
                if (value == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
                config.chunk_size = value;
            }
            else if (arg == "--yes" || arg == "-y")
            {
                config.assume_yes = true;
            }
            else if (arg == "--checkpoint-dir")
            {
                config.checkpoint_dir = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.checkpoint_dir.empty())
        {
            config.checkpoint_dir = default_checkpoint_dir();
        }
        return config;
    }

    std::optional<std::string> normalize_code(std::string_view input)
    {
        const auto begin = input.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto end = input.find_last_not_of(" \t\r\n");
        std::string code(input.substr(begin, end - begin + 1));
        for (auto &ch : code)
        {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        if (code.size() != 6)
        {
            return std::nullopt;
        }
        return code;
    }

    std::filesystem::path default_checkpoint_dir()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".peerdrop" / "checkpoints";
        }
        return std::filesystem::path(".peerdrop") / "checkpoints";
    }

} // namespace peerdrop::client
