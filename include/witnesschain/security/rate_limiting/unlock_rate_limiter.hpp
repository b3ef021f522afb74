#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/core/clock.hpp"
#include "witnesschain/configuration/vault_config.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace witnesschain::vault::security {

struct RateLimitState {
    uint32_t failed_attempts = 0;
    TimePoint locked_until{};
    TimePoint last_attempt{};
};

/**
 * Per-DID brute-force protection for password unlocks.
 *
 * State lives in a fixed number of mutex-protected shards selected by a
 * hash of the DID, so attempts on different DIDs rarely contend. Each
 * instance is owned by whoever constructs it; there is no process-wide
 * table.
 */
class UnlockRateLimiter {
public:
    explicit UnlockRateLimiter(
        configuration::RateLimitSettings settings = configuration::RateLimitSettings::Default(),
        Clock clock = SystemClock());

    UnlockRateLimiter(const UnlockRateLimiter&) = delete;
    UnlockRateLimiter& operator=(const UnlockRateLimiter&) = delete;
    UnlockRateLimiter(UnlockRateLimiter&&) = delete;
    UnlockRateLimiter& operator=(UnlockRateLimiter&&) = delete;
    ~UnlockRateLimiter() = default;

    /// Err(RateLimited{remaining}) while the DID is locked out.
    Result<Unit, KeyStoreFailure> CheckAllowed(std::string_view did) const;

    /// Counts a failure and returns the lockout it started, in seconds (0 if none).
    uint32_t RecordFailedAttempt(std::string_view did);

    void RecordSuccess(std::string_view did);

    /// Seconds until the DID may try again, rounded up. Never mutates state.
    [[nodiscard]] uint32_t GetRemainingLockoutSeconds(std::string_view did) const;

    [[nodiscard]] std::optional<RateLimitState> GetState(std::string_view did) const;

    [[nodiscard]] std::chrono::seconds LockoutForFailures(uint32_t failed_attempts) const noexcept;

    [[nodiscard]] size_t GetTrackedCount() const;

    void Reset();

private:
    struct Shard {
        mutable std::mutex lock;
        std::unordered_map<std::string, RateLimitState> states;
    };

    Shard& ShardFor(std::string_view did) const;
    uint32_t RemainingSecondsLocked(const Shard& shard, std::string_view did, TimePoint now) const;

    configuration::RateLimitSettings settings_;
    Clock clock_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

}
