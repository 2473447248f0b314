#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include "chunkdrop/error_codes.hpp"

namespace chunkdrop::server
{

    constexpr std::string_view kPartialSuffix = ".part";
    constexpr std::string_view kDefaultStagingDirName = ".incoming";

    class StorageError : public std::runtime_error
    {
    public:
        StorageError(chunkdrop::ErrorCode code, std::string message);

        chunkdrop::ErrorCode code() const noexcept { return code_; }

    private:
        chunkdrop::ErrorCode code_;
    };

    // Identity of one upload as the client names it. declared_size == 0 means "not declared".
    struct UploadTarget
    {
        std::string name;
        std::string relpath;
        std::uint64_t declared_size{};

        bool has_declared_size() const noexcept { return declared_size > 0; }
    };

    /**
     * Destination root plus the staging root nested inside it. Every component receives the
     * layout by reference; partial and final locations of a target are derived here only.
     */
    class StorageLayout
    {
    public:
        explicit StorageLayout(std::filesystem::path destination_root,
                               std::string staging_dir_name = std::string(kDefaultStagingDirName));

        const std::filesystem::path &destination_root() const noexcept { return destination_root_; }
        const std::filesystem::path &staging_root() const noexcept { return staging_root_; }
        const std::string &staging_dir_name() const noexcept { return staging_dir_name_; }

        std::filesystem::path partial_path(const UploadTarget &target) const;
        std::filesystem::path final_path(const UploadTarget &target) const;

        // Creates both roots. Throws StorageError when they cannot be created.
        void ensure_roots() const;

    private:
        std::filesystem::path destination_root_;
        std::string staging_dir_name_;
        std::filesystem::path staging_root_;
    };

} // namespace chunkdrop::server
