#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/core/clock.hpp"
#include "witnesschain/core/constants.hpp"
#include "witnesschain/configuration/vault_config.hpp"
#include "witnesschain/crypto/secure_memory_handle.hpp"
#include "witnesschain/interfaces/i_key_record_store.hpp"
#include "witnesschain/keystore/encrypted_key_record.hpp"
#include "witnesschain/security/rate_limiting/unlock_rate_limiter.hpp"
#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace witnesschain::vault::keystore {

/**
 * @brief Password-protected storage of signing keys, one per DID
 *
 * Store derives a wrapping key with PBKDF2-HMAC-SHA256 from the password
 * and a fresh 16-byte salt, seals the secret key with AES-256-GCM under a
 * fresh 12-byte IV and persists the record through the backend, replacing
 * any earlier record for the DID.
 *
 * Retrieve consults the rate limiter before touching the backend. A tag
 * mismatch on decryption counts as a failed attempt and is reported as
 * InvalidPassword; a successful unlock clears the DID's limiter state.
 * Attempts on the same DID are serialized so concurrent guesses cannot
 * slip past the lockout threshold.
 *
 * @code
 * auto limiter = std::make_shared<security::UnlockRateLimiter>();
 * SecureKeyStore store(std::make_shared<InMemoryKeyRecordStore>(), limiter);
 * store.Store(identity.GetSecretKeyHandle(), "p1", identity.GetDid());
 * auto secret = store.Retrieve(identity.GetDid(), "p1");
 * @endcode
 */
class SecureKeyStore {
public:
    SecureKeyStore(
        std::shared_ptr<interfaces::IKeyRecordStore> backend,
        std::shared_ptr<security::UnlockRateLimiter> rate_limiter,
        configuration::KeyDerivationSettings settings = configuration::KeyDerivationSettings::Default(),
        Clock clock = SystemClock());

    SecureKeyStore(const SecureKeyStore&) = delete;
    SecureKeyStore& operator=(const SecureKeyStore&) = delete;

    [[nodiscard]] static Result<crypto::SecureMemoryHandle, KeyStoreFailure> DerivePasswordKey(
        std::string_view password,
        std::span<const uint8_t> salt,
        uint32_t iterations);

    Result<Unit, KeyStoreFailure> Store(
        std::span<const uint8_t> secret_key,
        std::string_view password,
        std::string_view did);

    Result<Unit, KeyStoreFailure> Store(
        const crypto::SecureMemoryHandle& secret_key,
        std::string_view password,
        std::string_view did);

    [[nodiscard]] Result<crypto::SecureMemoryHandle, KeyStoreFailure> Retrieve(
        std::string_view did,
        std::string_view password);

    /// Ok(false) for a wrong password or an unknown DID; lockouts stay errors.
    [[nodiscard]] Result<bool, KeyStoreFailure> VerifyPassword(
        std::string_view did,
        std::string_view password);

    [[nodiscard]] Result<bool, KeyStoreFailure> Exists(std::string_view did);

    Result<Unit, KeyStoreFailure> Delete(std::string_view did);

    [[nodiscard]] Result<std::vector<std::string>, KeyStoreFailure> List();

    Result<Unit, KeyStoreFailure> ClearAll();

    [[nodiscard]] Result<std::optional<KeyMetadata>, KeyStoreFailure> GetMetadata(std::string_view did);

    [[nodiscard]] uint32_t GetRateLimitStatus(std::string_view did) const;

    [[nodiscard]] security::UnlockRateLimiter& RateLimiter() const noexcept { return *rate_limiter_; }

private:
    std::mutex& AttemptLockFor(std::string_view did);

    Result<crypto::SecureMemoryHandle, KeyStoreFailure> OpenRecord(
        const EncryptedKeyRecord& record,
        std::string_view password) const;

    std::shared_ptr<interfaces::IKeyRecordStore> backend_;
    std::shared_ptr<security::UnlockRateLimiter> rate_limiter_;
    configuration::KeyDerivationSettings settings_;
    Clock clock_;
    std::array<std::mutex, KeyStoreConstants::ATTEMPT_LOCK_STRIPES> attempt_locks_;
};

}
