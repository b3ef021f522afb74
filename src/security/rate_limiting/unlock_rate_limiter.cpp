#include "witnesschain/security/rate_limiting/unlock_rate_limiter.hpp"
#include "witnesschain/debug/audit_log.hpp"
#include <algorithm>
#include <functional>

namespace witnesschain::vault::security {
    namespace {
        // 2^31 minutes overflows any sane cap; the cap is reached long before.
        constexpr uint32_t MAX_BACKOFF_EXPONENT = 30;
    }

    UnlockRateLimiter::UnlockRateLimiter(
        configuration::RateLimitSettings settings,
        Clock clock)
        : settings_(settings)
          , clock_(std::move(clock)) {
        const size_t shard_count = std::max<size_t>(settings_.shard_count, 1);
        shards_.reserve(shard_count);
        for (size_t i = 0; i < shard_count; ++i) {
            shards_.push_back(std::make_unique<Shard>());
        }
    }

    UnlockRateLimiter::Shard &UnlockRateLimiter::ShardFor(const std::string_view did) const {
        const size_t index = std::hash<std::string_view>{}(did) % shards_.size();
        return *shards_[index];
    }

    std::chrono::seconds UnlockRateLimiter::LockoutForFailures(const uint32_t failed_attempts) const noexcept {
        if (failed_attempts < settings_.LockoutThreshold()) {
            return std::chrono::seconds::zero();
        }
        const uint32_t exponent = std::min(
            failed_attempts - settings_.LockoutThreshold(),
            MAX_BACKOFF_EXPONENT);
        const auto backoff = settings_.base_lockout * (int64_t{1} << exponent);
        return std::min<std::chrono::seconds>(backoff, settings_.max_lockout);
    }

    uint32_t UnlockRateLimiter::RemainingSecondsLocked(
        const Shard &shard,
        const std::string_view did,
        const TimePoint now) const {
        const auto it = shard.states.find(std::string(did));
        if (it == shard.states.end() || now >= it->second.locked_until) {
            return 0;
        }
        const auto remaining = std::chrono::ceil<std::chrono::seconds>(it->second.locked_until - now);
        return static_cast<uint32_t>(remaining.count());
    }

    Result<Unit, KeyStoreFailure> UnlockRateLimiter::CheckAllowed(const std::string_view did) const {
        const uint32_t remaining = GetRemainingLockoutSeconds(did);
        if (remaining > 0) {
            WC_LOG_SUBJECT(debug::Component::RateLimiter, "LOCKED_OUT", did);
            return Result<Unit, KeyStoreFailure>::Err(KeyStoreFailure::RateLimited(remaining));
        }
        return Result<Unit, KeyStoreFailure>::Ok(unit);
    }

    uint32_t UnlockRateLimiter::RecordFailedAttempt(const std::string_view did) {
        Shard &shard = ShardFor(did);
        const auto now = clock_();
        std::lock_guard guard(shard.lock);
        RateLimitState &state = shard.states[std::string(did)];
        state.failed_attempts++;
        state.last_attempt = now;
        const auto lockout = LockoutForFailures(state.failed_attempts);
        if (lockout > std::chrono::seconds::zero()) {
            state.locked_until = now + lockout;
        }
        const auto lockout_seconds = static_cast<uint32_t>(lockout.count());
        debug::LogUnlockFailure(did, state.failed_attempts, lockout_seconds);
        return lockout_seconds;
    }

    void UnlockRateLimiter::RecordSuccess(const std::string_view did) {
        Shard &shard = ShardFor(did);
        std::lock_guard guard(shard.lock);
        shard.states.erase(std::string(did));
    }

    uint32_t UnlockRateLimiter::GetRemainingLockoutSeconds(const std::string_view did) const {
        const Shard &shard = ShardFor(did);
        const auto now = clock_();
        std::lock_guard guard(shard.lock);
        return RemainingSecondsLocked(shard, did, now);
    }

    std::optional<RateLimitState> UnlockRateLimiter::GetState(const std::string_view did) const {
        const Shard &shard = ShardFor(did);
        std::lock_guard guard(shard.lock);
        const auto it = shard.states.find(std::string(did));
        if (it == shard.states.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t UnlockRateLimiter::GetTrackedCount() const {
        size_t total = 0;
        for (const auto &shard: shards_) {
            std::lock_guard guard(shard->lock);
            total += shard->states.size();
        }
        return total;
    }

    void UnlockRateLimiter::Reset() {
        for (const auto &shard: shards_) {
            std::lock_guard guard(shard->lock);
            shard->states.clear();
        }
    }
}
