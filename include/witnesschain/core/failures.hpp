#pragma once
#include <cstdint>
#include <string>
#include <string_view>
namespace witnesschain::vault {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    KeyGenerationFailed,
    InvalidOperation
};
enum class CryptoFailureType {
    InvalidInput,
    Backend,
    AuthenticationFailed,
    DeriveKey
};
enum class IdentityFailureType {
    InvalidDid,
    InvalidKeyLength,
    KeyGeneration,
    Signing,
    Derivation,
    Memory
};
enum class EncryptionFailureType {
    EmptyFile,
    NoKey,
    InvalidKey,
    EmptyData,
    InvalidSecretKey,
    InvalidFormat,
    InvalidNonce,
    KeyUnwrapFailed,
    ContentDecryptFailed,
    Internal
};
enum class KeyStoreFailureType {
    InvalidInput,
    KeyNotFound,
    InvalidPassword,
    RateLimited,
    Storage,
    Crypto
};
enum class CapabilityFailureType {
    DelegationFailed,
    ParseFailed
};
enum class SessionFailureType {
    InvalidPassword,
    NoSession,
    SignatureRejected,
    RegistrationFailed,
    WalletNotConnected,
    RateLimited,
    ReplayDetected,
    StaleSignature,
    Storage,
    Identity
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure KeyGenerationFailed(std::string msg) {
        return {SodiumFailureType::KeyGenerationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class CryptoFailure {
public:
    CryptoFailureType type;
    std::string message;
    CryptoFailure(const CryptoFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CryptoFailure InvalidInput(std::string msg) {
        return {CryptoFailureType::InvalidInput, std::move(msg)};
    }
    static CryptoFailure Backend(std::string msg) {
        return {CryptoFailureType::Backend, std::move(msg)};
    }
    static CryptoFailure AuthenticationFailed(std::string msg) {
        return {CryptoFailureType::AuthenticationFailed, std::move(msg)};
    }
    static CryptoFailure DeriveKey(std::string msg) {
        return {CryptoFailureType::DeriveKey, std::move(msg)};
    }
    static CryptoFailure FromSodiumFailure(const SodiumFailure& failure) {
        return Backend(failure.message);
    }
};
class IdentityFailure {
public:
    IdentityFailureType type;
    std::string message;
    IdentityFailure(const IdentityFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static IdentityFailure InvalidDid(std::string msg) {
        return {IdentityFailureType::InvalidDid, std::move(msg)};
    }
    static IdentityFailure InvalidKeyLength(std::string msg) {
        return {IdentityFailureType::InvalidKeyLength, std::move(msg)};
    }
    static IdentityFailure KeyGeneration(std::string msg) {
        return {IdentityFailureType::KeyGeneration, std::move(msg)};
    }
    static IdentityFailure Signing(std::string msg) {
        return {IdentityFailureType::Signing, std::move(msg)};
    }
    static IdentityFailure Derivation(std::string msg) {
        return {IdentityFailureType::Derivation, std::move(msg)};
    }
    static IdentityFailure FromSodiumFailure(const SodiumFailure& failure) {
        return {IdentityFailureType::Memory, failure.message};
    }
};
class EncryptionFailure {
public:
    EncryptionFailureType type;
    std::string message;
    EncryptionFailure(const EncryptionFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static EncryptionFailure EmptyFile(std::string msg) {
        return {EncryptionFailureType::EmptyFile, std::move(msg)};
    }
    static EncryptionFailure NoKey(std::string msg) {
        return {EncryptionFailureType::NoKey, std::move(msg)};
    }
    static EncryptionFailure InvalidKey(std::string msg) {
        return {EncryptionFailureType::InvalidKey, std::move(msg)};
    }
    static EncryptionFailure EmptyData(std::string msg) {
        return {EncryptionFailureType::EmptyData, std::move(msg)};
    }
    static EncryptionFailure InvalidSecretKey(std::string msg) {
        return {EncryptionFailureType::InvalidSecretKey, std::move(msg)};
    }
    static EncryptionFailure InvalidFormat(std::string msg) {
        return {EncryptionFailureType::InvalidFormat, std::move(msg)};
    }
    static EncryptionFailure InvalidNonce(std::string msg) {
        return {EncryptionFailureType::InvalidNonce, std::move(msg)};
    }
    static EncryptionFailure KeyUnwrapFailed(std::string msg) {
        return {EncryptionFailureType::KeyUnwrapFailed, std::move(msg)};
    }
    static EncryptionFailure ContentDecryptFailed(std::string msg) {
        return {EncryptionFailureType::ContentDecryptFailed, std::move(msg)};
    }
    static EncryptionFailure Internal(std::string msg) {
        return {EncryptionFailureType::Internal, std::move(msg)};
    }
    static EncryptionFailure FromSodiumFailure(const SodiumFailure& failure) {
        return Internal(failure.message);
    }
    [[nodiscard]] std::string_view Code() const noexcept {
        switch (type) {
            case EncryptionFailureType::EmptyFile: return "ENCRYPT_EMPTY_FILE";
            case EncryptionFailureType::NoKey: return "ENCRYPT_NO_KEY";
            case EncryptionFailureType::InvalidKey: return "ENCRYPT_INVALID_KEY";
            case EncryptionFailureType::EmptyData: return "DECRYPT_EMPTY_DATA";
            case EncryptionFailureType::InvalidSecretKey: return "DECRYPT_INVALID_KEY";
            case EncryptionFailureType::InvalidFormat: return "DECRYPT_INVALID_FORMAT";
            case EncryptionFailureType::InvalidNonce: return "DECRYPT_INVALID_NONCE";
            case EncryptionFailureType::KeyUnwrapFailed: return "DECRYPT_KEY_FAILED";
            case EncryptionFailureType::ContentDecryptFailed: return "DECRYPT_FILE_FAILED";
            case EncryptionFailureType::Internal: return "ENCRYPTION_INTERNAL";
        }
        return "ENCRYPTION_INTERNAL";
    }
    [[nodiscard]] std::string_view UserMessage() const noexcept {
        switch (type) {
            case EncryptionFailureType::EmptyFile:
                return "Cannot encrypt an empty file.";
            case EncryptionFailureType::NoKey:
                return "No encryption key available. Please sign in again.";
            case EncryptionFailureType::InvalidKey:
                return "Invalid encryption key. Please sign in again.";
            case EncryptionFailureType::EmptyData:
                return "No data to decrypt.";
            case EncryptionFailureType::InvalidSecretKey:
                return "Invalid decryption key. Please sign in again.";
            case EncryptionFailureType::InvalidFormat:
                return "The encrypted file format is invalid or corrupted.";
            case EncryptionFailureType::InvalidNonce:
                return "The encrypted file metadata is corrupted.";
            case EncryptionFailureType::KeyUnwrapFailed:
                return "Access denied. You may not have permission to decrypt this file.";
            case EncryptionFailureType::ContentDecryptFailed:
                return "Failed to decrypt file. The file may be corrupted.";
            case EncryptionFailureType::Internal:
                return "An unexpected encryption error occurred.";
        }
        return "An unexpected encryption error occurred.";
    }
    [[nodiscard]] bool IsAccessDenied() const noexcept {
        return type == EncryptionFailureType::KeyUnwrapFailed;
    }
};
class KeyStoreFailure {
public:
    KeyStoreFailureType type;
    std::string message;
    uint32_t remaining_seconds = 0;
    KeyStoreFailure(const KeyStoreFailureType t, std::string msg, const uint32_t remaining = 0)
        : type(t), message(std::move(msg)), remaining_seconds(remaining) {}
    static KeyStoreFailure InvalidInput(std::string msg) {
        return {KeyStoreFailureType::InvalidInput, std::move(msg)};
    }
    static KeyStoreFailure KeyNotFound(std::string msg) {
        return {KeyStoreFailureType::KeyNotFound, std::move(msg)};
    }
    static KeyStoreFailure InvalidPassword(std::string msg) {
        return {KeyStoreFailureType::InvalidPassword, std::move(msg)};
    }
    static KeyStoreFailure RateLimited(const uint32_t remaining) {
        return {KeyStoreFailureType::RateLimited,
                "Too many failed attempts. Please wait " + std::to_string(remaining) +
                    " seconds before trying again.",
                remaining};
    }
    static KeyStoreFailure Storage(std::string msg) {
        return {KeyStoreFailureType::Storage, std::move(msg)};
    }
    static KeyStoreFailure Crypto(std::string msg) {
        return {KeyStoreFailureType::Crypto, std::move(msg)};
    }
    static KeyStoreFailure FromSodiumFailure(const SodiumFailure& failure) {
        return Crypto(failure.message);
    }
    static KeyStoreFailure FromCryptoFailure(const CryptoFailure& failure) {
        return Crypto(failure.message);
    }
    [[nodiscard]] bool IsRateLimited() const noexcept {
        return type == KeyStoreFailureType::RateLimited;
    }
};
class CapabilityFailure {
public:
    CapabilityFailureType type;
    std::string message;
    CapabilityFailure(const CapabilityFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CapabilityFailure DelegationFailed(std::string msg) {
        return {CapabilityFailureType::DelegationFailed, std::move(msg)};
    }
    static CapabilityFailure ParseFailed(std::string msg) {
        return {CapabilityFailureType::ParseFailed, std::move(msg)};
    }
    [[nodiscard]] std::string_view Code() const noexcept {
        return type == CapabilityFailureType::DelegationFailed
            ? std::string_view("UCAN_DELEGATION_FAILED")
            : std::string_view("UCAN_PARSE_FAILED");
    }
};
class SessionFailure {
public:
    SessionFailureType type;
    std::string message;
    uint32_t remaining_seconds = 0;
    SessionFailure(const SessionFailureType t, std::string msg, const uint32_t remaining = 0)
        : type(t), message(std::move(msg)), remaining_seconds(remaining) {}
    static SessionFailure InvalidPassword(std::string msg) {
        return {SessionFailureType::InvalidPassword, std::move(msg)};
    }
    static SessionFailure NoSession(std::string msg) {
        return {SessionFailureType::NoSession, std::move(msg)};
    }
    static SessionFailure SignatureRejected(std::string msg) {
        return {SessionFailureType::SignatureRejected, std::move(msg)};
    }
    static SessionFailure RegistrationFailed(std::string msg) {
        return {SessionFailureType::RegistrationFailed, std::move(msg)};
    }
    static SessionFailure WalletNotConnected(std::string msg) {
        return {SessionFailureType::WalletNotConnected, std::move(msg)};
    }
    static SessionFailure ReplayDetected(std::string msg) {
        return {SessionFailureType::ReplayDetected, std::move(msg)};
    }
    static SessionFailure StaleSignature(std::string msg) {
        return {SessionFailureType::StaleSignature, std::move(msg)};
    }
    static SessionFailure Storage(std::string msg) {
        return {SessionFailureType::Storage, std::move(msg)};
    }
    static SessionFailure Identity(std::string msg) {
        return {SessionFailureType::Identity, std::move(msg)};
    }
    static SessionFailure FromIdentityFailure(const IdentityFailure& failure) {
        return Identity(failure.message);
    }
    static SessionFailure FromKeyStoreFailure(const KeyStoreFailure& failure) {
        switch (failure.type) {
            case KeyStoreFailureType::InvalidPassword:
                return InvalidPassword("Incorrect password. Please try again.");
            case KeyStoreFailureType::RateLimited:
                return {SessionFailureType::RateLimited, failure.message, failure.remaining_seconds};
            case KeyStoreFailureType::KeyNotFound:
                return NoSession(failure.message);
            case KeyStoreFailureType::InvalidInput:
            case KeyStoreFailureType::Storage:
            case KeyStoreFailureType::Crypto:
                break;
        }
        return Storage(failure.message);
    }
    [[nodiscard]] std::string_view Code() const noexcept {
        switch (type) {
            case SessionFailureType::InvalidPassword: return "AUTH_INVALID_PASSWORD";
            case SessionFailureType::NoSession: return "AUTH_NO_SESSION";
            case SessionFailureType::SignatureRejected: return "AUTH_SIGNATURE_REJECTED";
            case SessionFailureType::RegistrationFailed: return "AUTH_REGISTRATION_FAILED";
            case SessionFailureType::WalletNotConnected: return "AUTH_WALLET_NOT_CONNECTED";
            case SessionFailureType::RateLimited: return "AUTH_RATE_LIMITED";
            case SessionFailureType::ReplayDetected: return "AUTH_REPLAY_DETECTED";
            case SessionFailureType::StaleSignature: return "AUTH_STALE_SIGNATURE";
            case SessionFailureType::Storage: return "AUTH_STORAGE";
            case SessionFailureType::Identity: return "AUTH_IDENTITY";
        }
        return "AUTH_STORAGE";
    }
};
class ConfigurationFailure {
public:
    std::string field;
    std::string message;
    ConfigurationFailure(std::string f, std::string msg)
        : field(std::move(f)), message(std::move(msg)) {}
};
}
