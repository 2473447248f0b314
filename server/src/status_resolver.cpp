#include "chunkdrop/server/status_resolver.hpp"

#include <filesystem>
#include <system_error>

namespace chunkdrop::server
{

    StatusResolver::StatusResolver(const StorageLayout &layout) : layout_(layout) {}

    UploadStatus StatusResolver::resolve(const UploadTarget &target) const
    {
        std::error_code ec;
        const auto partial = layout_.partial_path(target);
        if (std::filesystem::is_regular_file(partial, ec))
        {
            const auto size = std::filesystem::file_size(partial, ec);
            if (!ec)
            {
                return UploadStatus{.received = size, .complete = false, .collision = false};
            }
        }

        const auto final_path = layout_.final_path(target);
        if (std::filesystem::is_regular_file(final_path, ec))
        {
            const auto size = std::filesystem::file_size(final_path, ec);
            if (!ec)
            {
                if (!target.has_declared_size() || size == target.declared_size)
                {
                    return UploadStatus{.received = size, .complete = true, .collision = false};
                }
                return UploadStatus{.received = size, .complete = false, .collision = true};
            }
        }

        return UploadStatus{};
    }

} // namespace chunkdrop::server
