#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <span>

#include "chunkdrop/server/storage_layout.hpp"

namespace chunkdrop::server
{

    enum class ChunkOutcome
    {
        Appended,
        OffsetConflict,
        SizeExceeded
    };

    struct ChunkResult
    {
        ChunkOutcome outcome{ChunkOutcome::Appended};
        // Authoritative byte count of the partial file after this call.
        std::uint64_t received{};
    };

    // Append handle for one chunk body. Obtained from ChunkReceiver::begin, consumed by finish().
    class ChunkWriter
    {
    public:
        ChunkWriter(std::filesystem::path path, std::uint64_t previous_length, std::uint64_t declared_size);

        ChunkWriter(ChunkWriter &&) = default;
        ChunkWriter &operator=(ChunkWriter &&) = default;

        void write(std::span<const std::byte> data);

        ChunkResult finish();

        std::uint64_t bytes_written() const noexcept { return bytes_written_; }
        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
        std::ofstream out_;
        std::uint64_t previous_length_{};
        std::uint64_t declared_size_{};
        std::uint64_t bytes_written_{};
    };

    class ChunkReceiver
    {
    public:
        static constexpr std::size_t kDefaultReadSize = 8 * 1024 * 1024;

        explicit ChunkReceiver(const StorageLayout &layout);

        std::uint64_t current_length(const UploadTarget &target) const;

        /**
         * Opens the partial file of `target` for appending when `offset` equals its current length.
         * On mismatch nothing is touched, std::nullopt is returned and `current` holds the real length.
         */
        std::optional<ChunkWriter> begin(const UploadTarget &target, std::uint64_t offset,
                                         std::uint64_t &current) const;

        // Convenience for callers that hold the whole body as a stream.
        ChunkResult receive(const UploadTarget &target, std::uint64_t offset, std::istream &body,
                            std::size_t read_size = kDefaultReadSize) const;

    private:
        const StorageLayout &layout_;
    };

} // namespace chunkdrop::server
