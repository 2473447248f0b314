#include "chunkdrop/client/config.hpp"

#include <charconv>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace chunkdrop::client
{

    std::string usage(const char *program_name)
    {
        return std::string("Usage: ") + program_name +
               " <server>:<port> <PATH>... [--chunk-size <bytes>] [--relpath <DIR>] [--no-hash] [--log <FILE>]\n";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error("Expected a server endpoint and at least one path");
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
        const auto port_string = endpoint.substr(colon_pos + 1);
        const auto [port_end, port_ec] =
            std::from_chars(port_string.data(), port_string.data() + port_string.size(), config.port);
        if (port_ec != std::errc{} || port_end != port_string.data() + port_string.size() || config.port == 0)
        {
            throw std::runtime_error("Invalid port: " + port_string);
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--chunk-size")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--chunk-size requires a value (bytes)");
                }
                const std::string value = argv[index++];
                const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), config.chunk_size);
                if (ec != std::errc{} || end != value.data() + value.size() || config.chunk_size == 0)
                {
                    throw std::runtime_error("Invalid chunk size: " + value);
                }
            }
            else if (arg == "--relpath")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--relpath requires a directory");
                }
                config.relpath = argv[index++];
            }
            else if (arg == "--no-hash")
            {
                config.send_hash = false;
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.sources.emplace_back(arg);
            }
        }

        if (config.sources.empty())
        {
            throw std::runtime_error("Nothing to upload");
        }
        return config;
    }

} // namespace chunkdrop::client
