#pragma once

#include <cstdint>

#include "chunkdrop/server/storage_layout.hpp"

namespace chunkdrop::server
{

    struct UploadStatus
    {
        std::uint64_t received{};
        bool complete{};
        // A final file occupies the name but its size disagrees with the declared one.
        bool collision{};
    };

    class StatusResolver
    {
    public:
        explicit StatusResolver(const StorageLayout &layout);

        UploadStatus resolve(const UploadTarget &target) const;

    private:
        const StorageLayout &layout_;
    };

} // namespace chunkdrop::server
