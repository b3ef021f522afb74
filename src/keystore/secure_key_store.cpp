#include "witnesschain/keystore/secure_key_store.hpp"
#include "witnesschain/crypto/aes_gcm.hpp"
#include "witnesschain/crypto/pbkdf2.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/debug/audit_log.hpp"

#include <functional>
#include <stdexcept>

namespace witnesschain::vault::keystore {

using crypto::AesGcm;
using crypto::Pbkdf2;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;

namespace {
using HandleResult = Result<SecureMemoryHandle, KeyStoreFailure>;
using UnitResult = Result<Unit, KeyStoreFailure>;

constexpr std::string_view kWrongPassword = "Incorrect password";
}

SecureKeyStore::SecureKeyStore(
    std::shared_ptr<interfaces::IKeyRecordStore> backend,
    std::shared_ptr<security::UnlockRateLimiter> rate_limiter,
    configuration::KeyDerivationSettings settings,
    Clock clock)
    : backend_(std::move(backend))
    , rate_limiter_(std::move(rate_limiter))
    , settings_(settings)
    , clock_(std::move(clock)) {
    if (!backend_) {
        throw std::invalid_argument("SecureKeyStore requires a record backend");
    }
    if (!rate_limiter_) {
        rate_limiter_ = std::make_shared<security::UnlockRateLimiter>();
    }
}

std::mutex& SecureKeyStore::AttemptLockFor(std::string_view did) {
    return attempt_locks_[std::hash<std::string_view>{}(did) % attempt_locks_.size()];
}

HandleResult SecureKeyStore::DerivePasswordKey(
    std::string_view password,
    std::span<const uint8_t> salt,
    uint32_t iterations) {
    return Pbkdf2::DeriveKey(password, salt, iterations, configuration::KeyDerivationSettings::KEY_BYTES)
        .MapErr([](CryptoFailure failure) { return KeyStoreFailure::FromCryptoFailure(failure); });
}

UnitResult SecureKeyStore::Store(
    std::span<const uint8_t> secret_key,
    std::string_view password,
    std::string_view did) {
    if (did.empty()) {
        return UnitResult::Err(KeyStoreFailure::InvalidInput("DID is required"));
    }
    if (secret_key.empty()) {
        return UnitResult::Err(KeyStoreFailure::InvalidInput("Secret key is required"));
    }
    if (password.empty()) {
        return UnitResult::Err(KeyStoreFailure::InvalidInput("Password is required"));
    }
    if (settings_.iterations < Constants::PBKDF2_MIN_ITERATIONS) {
        return UnitResult::Err(KeyStoreFailure::Crypto(
            "PBKDF2 iteration count below " + std::to_string(Constants::PBKDF2_MIN_ITERATIONS)));
    }

    EncryptedKeyRecord record;
    record.did = std::string(did);
    record.salt = SodiumInterop::GetRandomBytes(configuration::KeyDerivationSettings::SALT_BYTES);
    record.iv = SodiumInterop::GetRandomBytes(configuration::KeyDerivationSettings::IV_BYTES);
    record.kdf_iterations = settings_.iterations;
    record.created_at = ToUnixMillis(clock_());

    auto wrapping_key_result = DerivePasswordKey(password, record.salt, record.kdf_iterations);
    if (wrapping_key_result.IsErr()) {
        return UnitResult::Err(std::move(wrapping_key_result).UnwrapErr());
    }
    SecureMemoryHandle wrapping_key = std::move(wrapping_key_result).Unwrap();
    auto sealed = wrapping_key.WithReadAccess([&](std::span<const uint8_t> key) {
        return AesGcm::Encrypt(key, record.iv, secret_key);
    });
    wrapping_key.Reset();
    if (sealed.IsErr()) {
        return UnitResult::Err(KeyStoreFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    auto ciphertext = std::move(sealed).Unwrap();
    if (ciphertext.IsErr()) {
        return UnitResult::Err(KeyStoreFailure::FromCryptoFailure(ciphertext.UnwrapErr()));
    }
    record.ciphertext = std::move(ciphertext).Unwrap();

    auto put = backend_->Put(record);
    if (put.IsErr()) {
        return put;
    }
    WC_LOG_SUBJECT(debug::Component::KeyStore, "STORED", did);
    return UnitResult::Ok(unit);
}

UnitResult SecureKeyStore::Store(
    const SecureMemoryHandle& secret_key,
    std::string_view password,
    std::string_view did) {
    auto stored = secret_key.WithReadAccess([&](std::span<const uint8_t> bytes) {
        return Store(bytes, password, did);
    });
    if (stored.IsErr()) {
        return UnitResult::Err(KeyStoreFailure::FromSodiumFailure(stored.UnwrapErr()));
    }
    return std::move(stored).Unwrap();
}

HandleResult SecureKeyStore::OpenRecord(
    const EncryptedKeyRecord& record,
    std::string_view password) const {
    if (record.kdf_iterations < Constants::PBKDF2_MIN_ITERATIONS) {
        return HandleResult::Err(KeyStoreFailure::Crypto(
            "Key record uses " + std::to_string(record.kdf_iterations) +
            " PBKDF2 iterations, below the minimum"));
    }
    if (record.salt.size() != configuration::KeyDerivationSettings::SALT_BYTES ||
        record.iv.size() != configuration::KeyDerivationSettings::IV_BYTES) {
        return HandleResult::Err(KeyStoreFailure::Storage("Key record is corrupted"));
    }
    auto wrapping_key_result = DerivePasswordKey(password, record.salt, record.kdf_iterations);
    if (wrapping_key_result.IsErr()) {
        return wrapping_key_result;
    }
    const SecureMemoryHandle wrapping_key = std::move(wrapping_key_result).Unwrap();
    auto opened = wrapping_key.WithReadAccess([&](std::span<const uint8_t> key) {
        return AesGcm::Decrypt(key, record.iv, record.ciphertext);
    });
    if (opened.IsErr()) {
        return HandleResult::Err(KeyStoreFailure::FromSodiumFailure(opened.UnwrapErr()));
    }
    auto plaintext = std::move(opened).Unwrap();
    if (plaintext.IsErr()) {
        const CryptoFailure& failure = plaintext.UnwrapErr();
        if (failure.type == CryptoFailureType::AuthenticationFailed ||
            failure.type == CryptoFailureType::InvalidInput) {
            return HandleResult::Err(KeyStoreFailure::InvalidPassword(std::string(kWrongPassword)));
        }
        return HandleResult::Err(KeyStoreFailure::FromCryptoFailure(failure));
    }
    return HandleResult::Ok(std::move(plaintext).Unwrap());
}

HandleResult SecureKeyStore::Retrieve(
    std::string_view did,
    std::string_view password) {
    if (did.empty()) {
        return HandleResult::Err(KeyStoreFailure::InvalidInput("DID is required"));
    }
    std::lock_guard attempt_guard(AttemptLockFor(did));

    if (auto allowed = rate_limiter_->CheckAllowed(did); allowed.IsErr()) {
        return HandleResult::Err(std::move(allowed).UnwrapErr());
    }

    auto lookup = backend_->Get(did);
    if (lookup.IsErr()) {
        return HandleResult::Err(std::move(lookup).UnwrapErr());
    }
    const std::optional<EncryptedKeyRecord>& record = lookup.Unwrap();
    if (!record.has_value()) {
        return HandleResult::Err(KeyStoreFailure::KeyNotFound("No key stored for this identity"));
    }

    auto secret = OpenRecord(*record, password);
    if (secret.IsErr()) {
        if (secret.UnwrapErr().type == KeyStoreFailureType::InvalidPassword) {
            (void)rate_limiter_->RecordFailedAttempt(did);
        }
        debug::LogFailureCode(debug::Component::KeyStore, "RETRIEVE", secret.UnwrapErr().message);
        return secret;
    }
    rate_limiter_->RecordSuccess(did);
    WC_LOG_SUBJECT(debug::Component::KeyStore, "UNLOCKED", did);
    return secret;
}

Result<bool, KeyStoreFailure> SecureKeyStore::VerifyPassword(
    std::string_view did,
    std::string_view password) {
    auto secret = Retrieve(did, password);
    if (secret.IsOk()) {
        secret.Unwrap().Reset();
        return Result<bool, KeyStoreFailure>::Ok(true);
    }
    const KeyStoreFailureType type = secret.UnwrapErr().type;
    if (type == KeyStoreFailureType::InvalidPassword || type == KeyStoreFailureType::KeyNotFound) {
        return Result<bool, KeyStoreFailure>::Ok(false);
    }
    return Result<bool, KeyStoreFailure>::Err(std::move(secret).UnwrapErr());
}

Result<bool, KeyStoreFailure> SecureKeyStore::Exists(std::string_view did) {
    return backend_->Get(did).Map([](std::optional<EncryptedKeyRecord> record) {
        return record.has_value();
    });
}

UnitResult SecureKeyStore::Delete(std::string_view did) {
    auto removed = backend_->Delete(did);
    if (removed.IsOk()) {
        WC_LOG_SUBJECT(debug::Component::KeyStore, "DELETED", did);
    }
    return removed;
}

Result<std::vector<std::string>, KeyStoreFailure> SecureKeyStore::List() {
    return backend_->GetAllKeys();
}

UnitResult SecureKeyStore::ClearAll() {
    return backend_->Clear();
}

Result<std::optional<KeyMetadata>, KeyStoreFailure> SecureKeyStore::GetMetadata(std::string_view did) {
    return backend_->Get(did).Map([](std::optional<EncryptedKeyRecord> record) -> std::optional<KeyMetadata> {
        if (!record.has_value()) {
            return std::nullopt;
        }
        return KeyMetadata{record->created_at, record->kdf_iterations};
    });
}

uint32_t SecureKeyStore::GetRateLimitStatus(std::string_view did) const {
    return rate_limiter_->GetRemainingLockoutSeconds(did);
}

}
