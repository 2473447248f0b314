#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkdrop::client
{

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::vector<std::filesystem::path> sources;
        std::size_t chunk_size{8 * 1024 * 1024};
        // Remote directory prefix prepended to every upload.
        std::string relpath;
        bool send_hash{true};
        std::optional<std::filesystem::path> log_path;
    };

    std::string usage(const char *program_name);

    // Throws std::runtime_error on a malformed endpoint, unknown flags or missing sources.
    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace chunkdrop::client
