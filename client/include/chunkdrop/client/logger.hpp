#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace chunkdrop::client
{

    // Summary of one local file's trip through the upload protocol.
    struct TransferRecord
    {
        std::string file;
        std::string outcome;
        std::uint64_t size{};
        std::uint64_t resumed_from{};
        std::size_t realignments{};
        std::size_t restarts{};
        std::string remote_path;
        std::string detail;
        std::chrono::milliseconds elapsed{};
    };

    /**
     * Optional transfer log written with `--log`. Protocol events are plain lines; every finished file
     * adds one `transfer {...}` line carrying a JSON object. Without a path nothing is recorded.
     */
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path);

        bool enabled() const noexcept { return logger_ != nullptr; }

        template <typename... Args>
        void event(std::string_view topic, spdlog::format_string_t<Args...> format, Args &&...args)
        {
            if (!logger_)
            {
                return;
            }
            logger_->info("{:<8} {}", topic, spdlog::fmt_lib::format(format, std::forward<Args>(args)...));
        }

        void transfer(const TransferRecord &record);

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace chunkdrop::client
