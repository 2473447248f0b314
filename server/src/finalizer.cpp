#include "chunkdrop/server/finalizer.hpp"

#include <array>
#include <exception>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkdrop/crypto.hpp"

namespace chunkdrop::server
{

    namespace
    {

        struct OutcomeMapping
        {
            FinalizeOutcome outcome;
            std::string_view label;
            std::string_view note;
        };

        constexpr std::array<OutcomeMapping, 10> kOutcomeMappings{{
            {FinalizeOutcome::Renamed, "renamed", ""},
            {FinalizeOutcome::Collided, "collided", "renamed to avoid collision"},
            {FinalizeOutcome::AlreadyFinalized, "already_finalized", "already finalized"},
            {FinalizeOutcome::ConcurrentWinner, "concurrent_winner", "finalized concurrently"},
            {FinalizeOutcome::RecoveredAfterError, "recovered_after_error", "final existed after error"},
            {FinalizeOutcome::NotFound, "not_found", ""},
            {FinalizeOutcome::Incomplete, "incomplete", ""},
            {FinalizeOutcome::SizeExceeded, "size_exceeded", ""},
            {FinalizeOutcome::IntegrityMismatch, "integrity_mismatch", ""},
            {FinalizeOutcome::Failed, "failed", ""},
        }};

        const OutcomeMapping *find_mapping(FinalizeOutcome outcome) noexcept
        {
            for (const auto &mapping : kOutcomeMappings)
            {
                if (mapping.outcome == outcome)
                {
                    return &mapping;
                }
            }
            return nullptr;
        }

        // Dangling symlinks count as occupied so a rename never replaces them.
        bool occupied(const std::filesystem::path &path)
        {
            std::error_code ec;
            return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
        }

        FinalizeResult make_result(FinalizeOutcome outcome, std::filesystem::path path, std::string message = {})
        {
            FinalizeResult result;
            result.outcome = outcome;
            result.final_path = std::move(path);
            result.message = std::move(message);
            return result;
        }

    } // namespace

    std::string_view to_string(FinalizeOutcome outcome) noexcept
    {
        const auto *mapping = find_mapping(outcome);
        return mapping ? mapping->label : "unknown";
    }

    bool FinalizeResult::ok() const noexcept
    {
        switch (outcome)
        {
        case FinalizeOutcome::Renamed:
        case FinalizeOutcome::Collided:
        case FinalizeOutcome::AlreadyFinalized:
        case FinalizeOutcome::ConcurrentWinner:
        case FinalizeOutcome::RecoveredAfterError:
            return true;
        default:
            return false;
        }
    }

    std::string_view FinalizeResult::note() const noexcept
    {
        const auto *mapping = find_mapping(outcome);
        return mapping ? mapping->note : "";
    }

    std::filesystem::path next_free_path(const std::filesystem::path &preferred)
    {
        if (!occupied(preferred))
        {
            return preferred;
        }
        const auto stem = preferred.stem().string();
        const auto extension = preferred.extension().string();
        for (std::uint64_t i = 1;; ++i)
        {
            auto candidate = preferred.parent_path() / (stem + " (" + std::to_string(i) + ")" + extension);
            if (!occupied(candidate))
            {
                return candidate;
            }
        }
    }

    Finalizer::Finalizer(const StorageLayout &layout, MoveRetryPolicy policy)
        : layout_(layout), policy_(policy) {}

    FinalizeResult Finalizer::finalize(const UploadTarget &target, const std::optional<std::string> &expected_hash) const
    {
        const auto partial = layout_.partial_path(target);
        const auto preferred = layout_.final_path(target);
        auto destination = preferred;
        bool collided = false;
        const auto vanished = [&]()
        { return settle_vanished(target, destination, collided); };

        if (occupied(preferred))
        {
            if (!occupied(partial))
            {
                if (matches_declared_size(preferred, target))
                {
                    return make_result(FinalizeOutcome::AlreadyFinalized, preferred);
                }
                return make_result(FinalizeOutcome::NotFound, preferred,
                                   "no partial upload found; an unrelated file occupies the name");
            }
            destination = next_free_path(preferred);
            collided = true;
        }
        else if (!occupied(partial))
        {
            // A concurrent finalize may have renamed it between the two checks.
            if (occupied(preferred) && matches_declared_size(preferred, target))
            {
                return make_result(FinalizeOutcome::ConcurrentWinner, preferred);
            }
            return make_result(FinalizeOutcome::NotFound, preferred, "no partial upload found");
        }

        std::error_code ec;
        const auto partial_size = std::filesystem::file_size(partial, ec);
        if (ec)
        {
            return occupied(partial) ? make_result(FinalizeOutcome::Failed, destination,
                                                   "finalize failed: " + ec.message())
                                     : vanished();
        }
        if (target.has_declared_size() && partial_size > target.declared_size)
        {
            // Nothing can ever append to an overrun partial, so it goes and the client starts over.
            std::error_code remove_ec;
            std::filesystem::remove(partial, remove_ec);
            if (remove_ec)
            {
                spdlog::error("Cannot discard oversized partial {}: {}", partial.string(), remove_ec.message());
                return make_result(FinalizeOutcome::Failed, destination, "finalize failed: " + remove_ec.message());
            }
            spdlog::warn("Discarded partial {} holding {} bytes, {} declared", partial.string(), partial_size,
                         target.declared_size);
            auto result = make_result(FinalizeOutcome::SizeExceeded, destination,
                                      "partial holds " + std::to_string(partial_size) + " bytes, more than the " +
                                          std::to_string(target.declared_size) +
                                          " declared; it was discarded, restart from 0");
            result.received = partial_size;
            return result;
        }
        if (target.has_declared_size() && partial_size < target.declared_size)
        {
            auto result = make_result(FinalizeOutcome::Incomplete, destination,
                                      "partial holds " + std::to_string(partial_size) + " of " +
                                          std::to_string(target.declared_size) + " declared bytes");
            result.received = partial_size;
            return result;
        }

        if (expected_hash)
        {
            std::string actual;
            try
            {
                actual = crypto::hash_file(partial);
            }
            catch (const std::exception &ex)
            {
                return occupied(partial) ? make_result(FinalizeOutcome::Failed, destination,
                                                       std::string("finalize failed: ") + ex.what())
                                         : vanished();
            }
            if (!crypto::digests_match(*expected_hash, actual))
            {
                return make_result(FinalizeOutcome::IntegrityMismatch, destination,
                                   "content hash mismatch, expected " + *expected_hash + " got " + actual);
            }
        }

        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec)
        {
            return make_result(FinalizeOutcome::Failed, destination, "finalize failed: " + ec.message());
        }

        std::error_code move_error;
        switch (move_with_retry(partial, destination, move_error))
        {
        case MoveStatus::Moved:
            spdlog::info("Finalized {} -> {}", partial.string(), destination.string());
            return make_result(collided ? FinalizeOutcome::Collided : FinalizeOutcome::Renamed, destination);
        case MoveStatus::SourceVanished:
            return vanished();
        case MoveStatus::Failed:
            break;
        }

        if (occupied(destination) && matches_declared_size(destination, target))
        {
            std::error_code remove_ec;
            std::filesystem::remove(partial, remove_ec);
            if (remove_ec)
            {
                spdlog::warn("Stray partial {} left behind: {}", partial.string(), remove_ec.message());
            }
            return make_result(FinalizeOutcome::RecoveredAfterError, destination);
        }
        spdlog::error("Finalize of {} failed: {}", partial.string(), move_error.message());
        return make_result(FinalizeOutcome::Failed, destination, "finalize failed: " + move_error.message());
    }

    FinalizeResult Finalizer::settle_vanished(const UploadTarget &target, const std::filesystem::path &destination,
                                              bool collided) const
    {
        if (!collided)
        {
            if (occupied(destination))
            {
                return make_result(FinalizeOutcome::ConcurrentWinner, destination);
            }
            return make_result(FinalizeOutcome::NotFound, destination, "partial vanished during finalize");
        }

        // The preferred name belongs to an unrelated file; only a numbered sibling can be ours.
        if (target.has_declared_size())
        {
            const auto preferred = layout_.final_path(target);
            const auto stem = preferred.stem().string();
            const auto extension = preferred.extension().string();
            for (std::uint64_t i = 1;; ++i)
            {
                const auto candidate = preferred.parent_path() / (stem + " (" + std::to_string(i) + ")" + extension);
                if (!occupied(candidate))
                {
                    break;
                }
                if (matches_declared_size(candidate, target))
                {
                    return make_result(FinalizeOutcome::ConcurrentWinner, candidate);
                }
            }
        }
        return make_result(FinalizeOutcome::NotFound, destination, "partial vanished during finalize");
    }

    MoveStatus Finalizer::move_with_retry(const std::filesystem::path &from, const std::filesystem::path &to,
                                          std::error_code &last_error) const
    {
        for (std::size_t attempt = 0; attempt < policy_.attempts; ++attempt)
        {
            std::error_code ec;
            std::filesystem::rename(from, to, ec);
            if (!ec)
            {
                return MoveStatus::Moved;
            }
            last_error = ec;
            if (!occupied(from))
            {
                return MoveStatus::SourceVanished;
            }
            spdlog::warn("Rename {} -> {} failed (attempt {}/{}): {}", from.string(), to.string(), attempt + 1,
                         policy_.attempts, ec.message());
            if (attempt + 1 < policy_.attempts)
            {
                std::this_thread::sleep_for(policy_.backoff * static_cast<long>(attempt + 1));
            }
        }

        // Not atomic, but works across filesystems.
        std::error_code ec;
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::none, ec);
        if (ec)
        {
            last_error = ec;
            if (!occupied(from))
            {
                return MoveStatus::SourceVanished;
            }
            if (ec != std::errc::file_exists)
            {
                std::error_code cleanup_ec;
                std::filesystem::remove(to, cleanup_ec);
            }
            return MoveStatus::Failed;
        }
        std::filesystem::remove(from, ec);
        if (ec)
        {
            last_error = ec;
            return MoveStatus::Failed;
        }
        return MoveStatus::Moved;
    }

    bool Finalizer::matches_declared_size(const std::filesystem::path &path, const UploadTarget &target) const
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            return false;
        }
        if (!target.has_declared_size())
        {
            return true;
        }
        const auto size = std::filesystem::file_size(path, ec);
        return !ec && size == target.declared_size;
    }

} // namespace chunkdrop::server
