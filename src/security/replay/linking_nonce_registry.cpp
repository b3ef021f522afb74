#include "witnesschain/security/replay/linking_nonce_registry.hpp"
#include "witnesschain/configuration/vault_config.hpp"
#include "witnesschain/debug/audit_log.hpp"

namespace witnesschain::vault::security {
    LinkingNonceRegistry::LinkingNonceRegistry()
        : LinkingNonceRegistry(configuration::SessionSettings::Default().nonce_ttl) {
    }

    LinkingNonceRegistry::LinkingNonceRegistry(
        const std::chrono::seconds nonce_ttl,
        Clock clock)
        : nonce_ttl_(nonce_ttl)
          , clock_(std::move(clock))
          , last_cleanup_(clock_()) {
    }

    Result<Unit, SessionFailure> LinkingNonceRegistry::CheckAndRecord(const std::string_view nonce) {
        const auto now = clock_();
        std::lock_guard guard(lock_);
        if (ShouldCleanup(now)) {
            last_cleanup_ = now;
            CleanupExpiredNoncesInternal(now);
        }
        const std::string key(nonce);
        if (const auto it = seen_nonces_.find(key);
            it != seen_nonces_.end() && now - it->second < nonce_ttl_) {
            WC_LOG_EVENT(debug::Component::Session, "REPLAY", "linking nonce reused");
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::ReplayDetected("Nonce has already been used"));
        }
        seen_nonces_[key] = now;
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    bool LinkingNonceRegistry::Contains(const std::string_view nonce) const {
        const auto now = clock_();
        std::lock_guard guard(lock_);
        const auto it = seen_nonces_.find(std::string(nonce));
        return it != seen_nonces_.end() && now - it->second < nonce_ttl_;
    }

    void LinkingNonceRegistry::CleanupExpiredNonces() {
        const auto now = clock_();
        std::lock_guard guard(lock_);
        CleanupExpiredNoncesInternal(now);
    }

    void LinkingNonceRegistry::CleanupExpiredNoncesInternal(const TimePoint now) {
        auto it = seen_nonces_.begin();
        while (it != seen_nonces_.end()) {
            if (now - it->second >= nonce_ttl_) {
                it = seen_nonces_.erase(it);
            } else {
                ++it;
            }
        }
    }

    bool LinkingNonceRegistry::ShouldCleanup(const TimePoint now) const {
        return now - last_cleanup_ >= nonce_ttl_;
    }

    size_t LinkingNonceRegistry::GetTrackedNonceCount() const {
        std::lock_guard guard(lock_);
        return seen_nonces_.size();
    }

    void LinkingNonceRegistry::Reset() {
        const auto now = clock_();
        std::lock_guard guard(lock_);
        seen_nonces_.clear();
        last_cleanup_ = now;
    }
}
