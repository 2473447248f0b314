#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace chunkdrop::server
{

    class TargetClaims;

    // Held while a body is appended to one partial file. Releases the key on destruction.
    class TargetClaim
    {
    public:
        TargetClaim(TargetClaims &owner, std::string key);
        ~TargetClaim();

        TargetClaim(const TargetClaim &) = delete;
        TargetClaim &operator=(const TargetClaim &) = delete;
        TargetClaim(TargetClaim &&other) noexcept;
        TargetClaim &operator=(TargetClaim &&other) noexcept;

        const std::string &key() const noexcept { return key_; }

    private:
        void release() noexcept;

        TargetClaims *owner_;
        std::string key_;
    };

    /**
     * In-process single-writer guard keyed by partial path. Clients are expected to send chunks
     * for one target sequentially; this turns a violation into a refusal instead of a corrupted
     * partial file. It does not coordinate separate server processes.
     */
    class TargetClaims
    {
    public:
        std::optional<TargetClaim> try_claim(const std::string &key);

        bool is_claimed(const std::string &key) const;

    private:
        friend class TargetClaim;

        void release(const std::string &key) noexcept;

        mutable std::mutex mutex_;
        std::unordered_set<std::string> active_;
    };

} // namespace chunkdrop::server
