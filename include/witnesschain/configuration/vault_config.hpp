#pragma once

#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/core/constants.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace witnesschain::vault::configuration {

/// Password-based key derivation for key records at rest
///
/// PBKDF2-HMAC-SHA256 feeding AES-256-GCM. Salt and IV sizes are part of
/// the persisted record format and are not configurable; only the work
/// factor is, and never below 100000 iterations.
struct KeyDerivationSettings {
    uint32_t iterations = Constants::PBKDF2_MIN_ITERATIONS;

    static constexpr size_t SALT_BYTES = Constants::PBKDF2_SALT_SIZE;
    static constexpr size_t IV_BYTES = Constants::AES_GCM_NONCE_SIZE;
    static constexpr size_t KEY_BYTES = Constants::AES_KEY_SIZE;

    static constexpr KeyDerivationSettings Default() noexcept { return {}; }
};

/// Brute-force protection for unlock attempts
///
/// The first `free_attempts` failures are free. Failure number
/// `free_attempts + 1` and every later one locks the DID for
/// min(base_lockout * 2^(failures - free_attempts - 1), max_lockout).
struct RateLimitSettings {
    uint32_t free_attempts = 4;
    std::chrono::seconds base_lockout{60};
    std::chrono::seconds max_lockout{3600};
    size_t shard_count = 16;

    [[nodiscard]] constexpr uint32_t LockoutThreshold() const noexcept {
        return free_attempts + 1;
    }

    static constexpr RateLimitSettings Default() noexcept { return {}; }
};

/// Default lifetimes of issued capability tokens
struct CapabilitySettings {
    std::chrono::seconds default_ttl{std::chrono::hours(24)};
    std::chrono::seconds upload_ttl{std::chrono::hours(1)};
    std::chrono::seconds read_ttl{std::chrono::hours(24)};

    static constexpr CapabilitySettings Default() noexcept { return {}; }
};

/// Session lifetime and wallet-linking freshness windows
struct SessionSettings {
    std::chrono::seconds session_duration{std::chrono::minutes(30)};
    std::chrono::seconds expiring_soon_threshold{std::chrono::minutes(5)};
    std::chrono::seconds signature_max_age{300};
    std::chrono::seconds signature_max_future_skew{60};
    std::chrono::seconds nonce_ttl{std::chrono::minutes(10)};

    static constexpr SessionSettings Default() noexcept { return {}; }
};

/// Complete vault configuration
///
/// @example
/// ```cpp
/// auto config = VaultConfig::FromEnvironment();
/// if (auto valid = config.Validate(); valid.IsErr()) {
///     // refuse to start
/// }
/// SecureKeyStore store(backend, limiter, config.KeyDerivation());
/// ```
class VaultConfig {
public:
    static VaultConfig Default() {
        return VaultConfig(
            KeyDerivationSettings::Default(),
            RateLimitSettings::Default(),
            CapabilitySettings::Default(),
            SessionSettings::Default());
    }

    /// Six times the default work factor and lockout from the third failure.
    static VaultConfig HighSecurity() {
        VaultConfig config = Default();
        config.key_derivation_.iterations = 600000;
        config.rate_limit_.free_attempts = 2;
        return config;
    }

    /// Default() overridden by WITNESSCHAIN_KDF_ITERATIONS,
    /// WITNESSCHAIN_SESSION_MINUTES, WITNESSCHAIN_KEYSTORE_DIR and
    /// WITNESSCHAIN_API_URL. Unparseable numbers are ignored.
    static VaultConfig FromEnvironment();

    /// Rejects configurations that weaken the at-rest guarantees.
    [[nodiscard]] Result<Unit, ConfigurationFailure> Validate() const;

    [[nodiscard]] const KeyDerivationSettings& KeyDerivation() const noexcept { return key_derivation_; }
    [[nodiscard]] const RateLimitSettings& RateLimit() const noexcept { return rate_limit_; }
    [[nodiscard]] const CapabilitySettings& Capability() const noexcept { return capability_; }
    [[nodiscard]] const SessionSettings& Session() const noexcept { return session_; }
    [[nodiscard]] const std::string& KeyStoreDirectory() const noexcept { return keystore_directory_; }
    [[nodiscard]] const std::string& ApiUrl() const noexcept { return api_url_; }

    VaultConfig& WithKdfIterations(uint32_t iterations) noexcept {
        key_derivation_.iterations = iterations;
        return *this;
    }
    VaultConfig& WithKeyStoreDirectory(std::string directory) {
        keystore_directory_ = std::move(directory);
        return *this;
    }

private:
    VaultConfig(
        KeyDerivationSettings key_derivation,
        RateLimitSettings rate_limit,
        CapabilitySettings capability,
        SessionSettings session)
        : key_derivation_(key_derivation)
        , rate_limit_(rate_limit)
        , capability_(capability)
        , session_(session)
        , keystore_directory_(".witnesschain/keys")
        , api_url_("http://localhost:3001") {}

    KeyDerivationSettings key_derivation_;
    RateLimitSettings rate_limit_;
    CapabilitySettings capability_;
    SessionSettings session_;
    std::string keystore_directory_;
    std::string api_url_;
};

}
