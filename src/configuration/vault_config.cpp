#include "witnesschain/configuration/vault_config.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>

namespace witnesschain::vault::configuration {

namespace {
std::optional<std::string> ReadVariable(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<uint32_t> ParseUnsigned(std::string_view text) {
    uint32_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}
}

VaultConfig VaultConfig::FromEnvironment() {
    VaultConfig config = Default();
    if (auto iterations = ReadVariable("WITNESSCHAIN_KDF_ITERATIONS")) {
        if (auto parsed = ParseUnsigned(*iterations)) {
            config.key_derivation_.iterations = *parsed;
        }
    }
    if (auto minutes = ReadVariable("WITNESSCHAIN_SESSION_MINUTES")) {
        if (auto parsed = ParseUnsigned(*minutes)) {
            config.session_.session_duration = std::chrono::minutes(*parsed);
        }
    }
    if (auto directory = ReadVariable("WITNESSCHAIN_KEYSTORE_DIR")) {
        config.keystore_directory_ = std::move(*directory);
    }
    if (auto url = ReadVariable("WITNESSCHAIN_API_URL")) {
        config.api_url_ = std::move(*url);
    }
    return config;
}

Result<Unit, ConfigurationFailure> VaultConfig::Validate() const {
    using ValidationResult = Result<Unit, ConfigurationFailure>;
    if (key_derivation_.iterations < Constants::PBKDF2_MIN_ITERATIONS) {
        return ValidationResult::Err(ConfigurationFailure(
            "key_derivation.iterations",
            "PBKDF2 iterations must be at least " +
                std::to_string(Constants::PBKDF2_MIN_ITERATIONS)));
    }
    if (rate_limit_.base_lockout.count() <= 0 || rate_limit_.max_lockout < rate_limit_.base_lockout) {
        return ValidationResult::Err(ConfigurationFailure(
            "rate_limit.lockout", "Lockout durations must be positive and max >= base"));
    }
    if (rate_limit_.shard_count == 0) {
        return ValidationResult::Err(ConfigurationFailure(
            "rate_limit.shard_count", "Rate limiter needs at least one shard"));
    }
    if (capability_.upload_ttl.count() <= 0 || capability_.read_ttl.count() <= 0 ||
        capability_.default_ttl.count() <= 0) {
        return ValidationResult::Err(ConfigurationFailure(
            "capability.ttl", "Capability lifetimes must be positive"));
    }
    if (session_.session_duration.count() <= 0 ||
        session_.expiring_soon_threshold >= session_.session_duration) {
        return ValidationResult::Err(ConfigurationFailure(
            "session.session_duration",
            "Session duration must be positive and longer than the expiry warning"));
    }
    if (session_.nonce_ttl < session_.signature_max_age) {
        return ValidationResult::Err(ConfigurationFailure(
            "session.nonce_ttl", "Nonces must be remembered at least as long as signatures stay valid"));
    }
    if (keystore_directory_.empty()) {
        return ValidationResult::Err(ConfigurationFailure(
            "keystore_directory", "Key store directory must not be empty"));
    }
    return ValidationResult::Ok(unit);
}

}
