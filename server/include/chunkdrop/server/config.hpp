#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "chunkdrop/server/storage_layout.hpp"

namespace chunkdrop::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{5000};
        std::filesystem::path root;
        std::string staging_dir_name{kDefaultStagingDirName};
        std::size_t worker_threads{0};
        std::chrono::seconds idle_timeout{std::chrono::seconds{300}};
        std::size_t read_buffer_size{1024 * 1024};
        std::size_t max_header_bytes{16 * 1024};
        std::uint64_t max_form_bytes{512ULL * 1024 * 1024};
        // Bodies of refused chunks up to this size are read and dropped to keep the connection usable.
        std::uint64_t max_drain_bytes{64ULL * 1024 * 1024};
        std::size_t move_attempts{10};
        std::chrono::milliseconds move_backoff{200};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
        bool show_help{false};
    };

    std::string usage(const char *program_name);

    // Throws std::runtime_error on unknown flags, missing values or a missing --root.
    ServerConfig parse_arguments(int argc, char *argv[]);

} // namespace chunkdrop::server
