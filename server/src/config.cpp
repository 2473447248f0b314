#include "chunkdrop/server/config.hpp"

#include <charconv>
#include <stdexcept>
#include <string_view>

namespace chunkdrop::server
{

    namespace
    {

        std::string read_value(int &index, int argc, char *argv[], std::string_view flag)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error("Missing value for " + std::string(flag));
            }
            ++index;
            return std::string(argv[index]);
        }

        template <typename Integer>
        Integer read_number(int &index, int argc, char *argv[], std::string_view flag)
        {
            const auto value = read_value(index, argc, argv, flag);
            Integer result{};
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
            if (ec != std::errc{} || ptr != value.data() + value.size())
            {
                throw std::runtime_error("Invalid value for " + std::string(flag) + ": " + value);
            }
            return result;
        }

    } // namespace

    std::string usage(const char *program_name)
    {
        return std::string("Usage: ") + program_name +
               " --root <DIR> [--port <PORT>] [--address <ADDRESS>] [--threads <N>]\n"
               "       [--staging-dir <NAME>] [--idle-timeout <seconds>] [--read-buffer <bytes>]\n"
               "       [--max-form-bytes <bytes>] [--move-attempts <N>] [--move-backoff-ms <ms>]\n"
               "       [--log <FILE>] [--verbose]\n";
    }

    ServerConfig parse_arguments(int argc, char *argv[])
    {
        ServerConfig config;
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--port")
            {
                config.port = read_number<std::uint16_t>(i, argc, argv, arg);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(read_value(i, argc, argv, arg));
            }
            else if (arg == "--address")
            {
                config.address = read_value(i, argc, argv, arg);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = read_number<std::size_t>(i, argc, argv, arg);
            }
            else if (arg == "--staging-dir")
            {
                config.staging_dir_name = read_value(i, argc, argv, arg);
            }
            else if (arg == "--idle-timeout")
            {
                config.idle_timeout = std::chrono::seconds(read_number<std::uint32_t>(i, argc, argv, arg));
            }
            else if (arg == "--read-buffer")
            {
                config.read_buffer_size = read_number<std::size_t>(i, argc, argv, arg);
                if (config.read_buffer_size == 0)
                {
                    throw std::runtime_error("--read-buffer must be positive");
                }
            }
            else if (arg == "--max-form-bytes")
            {
                config.max_form_bytes = read_number<std::uint64_t>(i, argc, argv, arg);
            }
            else if (arg == "--move-attempts")
            {
                config.move_attempts = read_number<std::size_t>(i, argc, argv, arg);
            }
            else if (arg == "--move-backoff-ms")
            {
                config.move_backoff = std::chrono::milliseconds(read_number<std::uint32_t>(i, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(read_value(i, argc, argv, arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
                return config;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.root.empty())
        {
            throw std::runtime_error("--root is required");
        }
        return config;
    }

} // namespace chunkdrop::server
