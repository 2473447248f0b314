#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "chunkdrop/server/storage_layout.hpp"

namespace chunkdrop::server
{

    enum class FinalizeOutcome
    {
        Renamed,
        Collided,
        AlreadyFinalized,
        ConcurrentWinner,
        RecoveredAfterError,
        NotFound,
        Incomplete,
        SizeExceeded,
        IntegrityMismatch,
        Failed
    };

    std::string_view to_string(FinalizeOutcome outcome) noexcept;

    struct FinalizeResult
    {
        FinalizeOutcome outcome{FinalizeOutcome::Failed};
        std::filesystem::path final_path;
        std::string message;
        // Partial length, meaningful for Incomplete and SizeExceeded.
        std::uint64_t received{};

        bool ok() const noexcept;

        // Short note reported to clients alongside a successful result, empty for a plain rename.
        std::string_view note() const noexcept;
    };

    struct MoveRetryPolicy
    {
        std::size_t attempts{10};
        std::chrono::milliseconds backoff{200};
    };

    enum class MoveStatus
    {
        Moved,
        SourceVanished,
        Failed
    };

    /**
     * Picks `stem (N).ext` for the first N that does not exist yet, or `preferred` itself when free.
     * The check is not synchronized against other writers.
     */
    std::filesystem::path next_free_path(const std::filesystem::path &preferred);

    class Finalizer
    {
    public:
        explicit Finalizer(const StorageLayout &layout, MoveRetryPolicy policy = {});

        /**
         * Promotes the partial file of `target` to its final location. Safe to call again after a
         * success; concurrent calls for the same target resolve to a single final file.
         * `expected_hash`, when given, must match the partial content before anything moves.
         */
        FinalizeResult finalize(const UploadTarget &target,
                                const std::optional<std::string> &expected_hash = std::nullopt) const;

        /**
         * Renames `from` onto `to`, retrying with linear backoff, then falls back to copy and delete.
         * `last_error` receives the last failure when the result is not Moved.
         */
        MoveStatus move_with_retry(const std::filesystem::path &from, const std::filesystem::path &to,
                                   std::error_code &last_error) const;

        /**
         * Settles a finalize whose partial disappeared before it could be moved. `destination` is where
         * this call meant to put the file; `collided` says the preferred name already held another file,
         * in which case the winner can only sit at one of its `stem (N).ext` siblings.
         */
        FinalizeResult settle_vanished(const UploadTarget &target, const std::filesystem::path &destination,
                                       bool collided) const;

    private:
        bool matches_declared_size(const std::filesystem::path &path, const UploadTarget &target) const;

        const StorageLayout &layout_;
        MoveRetryPolicy policy_;
    };

} // namespace chunkdrop::server
