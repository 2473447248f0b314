#include "chunkdrop/server/stats_counter.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace chunkdrop::server
{

    StatsCounter::StatsCounter(const StorageLayout &layout) : layout_(layout) {}

    std::uint64_t StatsCounter::count_files() const
    {
        std::error_code ec;
        std::filesystem::recursive_directory_iterator it(
            layout_.destination_root(), std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec)
        {
            spdlog::warn("Cannot walk {}: {}", layout_.destination_root().string(), ec.message());
            return 0;
        }

        std::uint64_t total = 0;
        for (const std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec))
        {
            if (ec)
            {
                spdlog::warn("Stats walk stopped early: {}", ec.message());
                break;
            }
            const auto &entry = *it;
            const auto name = entry.path().filename().string();
            std::error_code status_ec;
            if (entry.is_directory(status_ec))
            {
                if (name == layout_.staging_dir_name())
                {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (entry.is_regular_file(status_ec) && !name.ends_with(kPartialSuffix))
            {
                ++total;
            }
        }
        return total;
    }

} // namespace chunkdrop::server
