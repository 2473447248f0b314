#pragma once

#include <cstdint>

#include "chunkdrop/server/storage_layout.hpp"

namespace chunkdrop::server
{

    // Counts finished files under the destination root; staging directories and .part files are skipped.
    class StatsCounter
    {
    public:
        explicit StatsCounter(const StorageLayout &layout);

        std::uint64_t count_files() const;

    private:
        const StorageLayout &layout_;
    };

} // namespace chunkdrop::server
