#include "chunkdrop/server/target_claims.hpp"

#include <utility>

namespace chunkdrop::server
{

    TargetClaim::TargetClaim(TargetClaims &owner, std::string key) : owner_(&owner), key_(std::move(key)) {}

    TargetClaim::~TargetClaim()
    {
        release();
    }

    TargetClaim::TargetClaim(TargetClaim &&other) noexcept
        : owner_(std::exchange(other.owner_, nullptr)), key_(std::move(other.key_)) {}

    TargetClaim &TargetClaim::operator=(TargetClaim &&other) noexcept
    {
        if (this != &other)
        {
            release();
            owner_ = std::exchange(other.owner_, nullptr);
            key_ = std::move(other.key_);
        }
        return *this;
    }

    void TargetClaim::release() noexcept
    {
        if (owner_)
        {
            owner_->release(key_);
            owner_ = nullptr;
        }
    }

    std::optional<TargetClaim> TargetClaims::try_claim(const std::string &key)
    {
        std::lock_guard lock(mutex_);
        if (!active_.insert(key).second)
        {
            return std::nullopt;
        }
        return std::optional<TargetClaim>(std::in_place, *this, key);
    }

    bool TargetClaims::is_claimed(const std::string &key) const
    {
        std::lock_guard lock(mutex_);
        return active_.contains(key);
    }

    void TargetClaims::release(const std::string &key) noexcept
    {
        std::lock_guard lock(mutex_);
        active_.erase(key);
    }

} // namespace chunkdrop::server
