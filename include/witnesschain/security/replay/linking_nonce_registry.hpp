#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/core/clock.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace witnesschain::vault::security {

/**
 * Remembers wallet-linking nonces so a captured signature cannot be
 * replayed. Entries older than the TTL are purged lazily.
 */
class LinkingNonceRegistry {
public:
    LinkingNonceRegistry();
    explicit LinkingNonceRegistry(std::chrono::seconds nonce_ttl, Clock clock = SystemClock());
    LinkingNonceRegistry(const LinkingNonceRegistry&) = delete;
    LinkingNonceRegistry& operator=(const LinkingNonceRegistry&) = delete;
    LinkingNonceRegistry(LinkingNonceRegistry&&) = delete;
    LinkingNonceRegistry& operator=(LinkingNonceRegistry&&) = delete;
    ~LinkingNonceRegistry() = default;
    Result<Unit, SessionFailure> CheckAndRecord(std::string_view nonce);
    [[nodiscard]] bool Contains(std::string_view nonce) const;
    void CleanupExpiredNonces();
    size_t GetTrackedNonceCount() const;
    void Reset();
private:
    void CleanupExpiredNoncesInternal(TimePoint now);
    bool ShouldCleanup(TimePoint now) const;
    std::chrono::seconds nonce_ttl_;
    Clock clock_;
    mutable std::mutex lock_;
    std::unordered_map<std::string, TimePoint> seen_nonces_;
    TimePoint last_cleanup_;
};

}
