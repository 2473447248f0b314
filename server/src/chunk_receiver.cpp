#include "chunkdrop/server/chunk_receiver.hpp"

#include <algorithm>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace chunkdrop::server
{

    ChunkWriter::ChunkWriter(std::filesystem::path path, std::uint64_t previous_length, std::uint64_t declared_size)
        : path_(std::move(path)), previous_length_(previous_length), declared_size_(declared_size)
    {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec)
        {
            throw StorageError(chunkdrop::ErrorCode::InternalError,
                               "Cannot create directory " + path_.parent_path().string() + ": " + ec.message());
        }
        out_.open(path_, std::ios::binary | std::ios::app);
        if (!out_.is_open())
        {
            throw StorageError(chunkdrop::ErrorCode::InternalError, "Cannot open partial file " + path_.string());
        }
    }

    void ChunkWriter::write(std::span<const std::byte> data)
    {
        if (data.empty())
        {
            return;
        }
        out_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out_)
        {
            throw StorageError(chunkdrop::ErrorCode::InternalError, "Write failed on " + path_.string());
        }
        bytes_written_ += data.size();
    }

    ChunkResult ChunkWriter::finish()
    {
        out_.flush();
        const bool flushed = static_cast<bool>(out_);
        out_.close();
        if (!flushed)
        {
            throw StorageError(chunkdrop::ErrorCode::InternalError, "Flush failed on " + path_.string());
        }

        ChunkResult result;
        result.received = previous_length_ + bytes_written_;
        if (declared_size_ > 0 && result.received > declared_size_)
        {
            spdlog::warn("{} grew to {} bytes, declared {}", path_.string(), result.received, declared_size_);
            result.outcome = ChunkOutcome::SizeExceeded;
        }
        return result;
    }

    ChunkReceiver::ChunkReceiver(const StorageLayout &layout) : layout_(layout) {}

    std::uint64_t ChunkReceiver::current_length(const UploadTarget &target) const
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(layout_.partial_path(target), ec);
        return ec ? 0 : size;
    }

    std::optional<ChunkWriter> ChunkReceiver::begin(const UploadTarget &target, std::uint64_t offset,
                                                    std::uint64_t &current) const
    {
        current = current_length(target);
        if (offset != current)
        {
            return std::nullopt;
        }
        return ChunkWriter(layout_.partial_path(target), current, target.declared_size);
    }

    ChunkResult ChunkReceiver::receive(const UploadTarget &target, std::uint64_t offset, std::istream &body,
                                       std::size_t read_size) const
    {
        std::uint64_t current = 0;
        auto writer = begin(target, offset, current);
        if (!writer)
        {
            return ChunkResult{ChunkOutcome::OffsetConflict, current};
        }

        std::vector<std::byte> buffer(std::max<std::size_t>(read_size, 1));
        while (body)
        {
            body.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto count = static_cast<std::size_t>(body.gcount());
            writer->write(std::span<const std::byte>(buffer.data(), count));
        }
        if (body.bad())
        {
            throw StorageError(chunkdrop::ErrorCode::InternalError, "Read error on chunk body");
        }
        return writer->finish();
    }

} // namespace chunkdrop::server
