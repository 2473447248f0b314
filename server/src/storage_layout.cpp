#include "chunkdrop/server/storage_layout.hpp"

#include <system_error>

#include "chunkdrop/server/path_sanitizer.hpp"

namespace chunkdrop::server
{

    namespace
    {

        // Directories named like the staging root are invisible to stats, so uploads never create them.
        std::filesystem::path relative_directory(const UploadTarget &target, const std::string &staging_dir_name)
        {
            std::filesystem::path result;
            for (const auto &segment : paths::sanitize_relative_path(target.relpath))
            {
                if (segment == staging_dir_name)
                {
                    result /= std::string(paths::kPlaceholderSegment);
                }
                else
                {
                    result /= segment;
                }
            }
            return result;
        }

    } // namespace

    StorageError::StorageError(chunkdrop::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    StorageLayout::StorageLayout(std::filesystem::path destination_root, std::string staging_dir_name)
        : destination_root_(std::move(destination_root)),
          staging_dir_name_(std::move(staging_dir_name))
    {
        if (destination_root_.empty())
        {
            throw StorageError(chunkdrop::ErrorCode::InvalidParameter, "Destination root must not be empty");
        }
        if (!paths::is_safe_segment(staging_dir_name_) || staging_dir_name_ == "." || staging_dir_name_ == "..")
        {
            throw StorageError(chunkdrop::ErrorCode::InvalidParameter,
                               "Invalid staging directory name: " + staging_dir_name_);
        }
        destination_root_ = destination_root_.lexically_normal();
        staging_root_ = destination_root_ / staging_dir_name_;
    }

    std::filesystem::path StorageLayout::partial_path(const UploadTarget &target) const
    {
        auto file_name = paths::sanitize_file_name(target.name);
        file_name += kPartialSuffix;
        return staging_root_ / relative_directory(target, staging_dir_name_) / file_name;
    }

    std::filesystem::path StorageLayout::final_path(const UploadTarget &target) const
    {
        return destination_root_ / relative_directory(target, staging_dir_name_) / paths::sanitize_file_name(target.name);
    }

    void StorageLayout::ensure_roots() const
    {
        std::error_code ec;
        std::filesystem::create_directories(staging_root_, ec);
        if (ec)
        {
            throw StorageError(chunkdrop::ErrorCode::InternalError,
                               "Cannot create " + staging_root_.string() + ": " + ec.message());
        }
    }

} // namespace chunkdrop::server
