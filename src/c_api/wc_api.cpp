/**
 * @file wc_api.cpp
 * @brief C ABI over identities, file encryption, the key store and capabilities
 */

#include "witnesschain/c_api/wc_api.h"
#include "wc_internal.hpp"
#include "witnesschain/core/constants.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "witnesschain/encryption/hybrid_file_cipher.hpp"
#include "witnesschain/identity/did_key.hpp"
#include "witnesschain/keystore/file_key_record_store.hpp"
#include "witnesschain/keystore/in_memory_key_record_store.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <memory>
#include <mutex>
#include <new>
#include <span>
#include <string>

using namespace witnesschain::vault;
using namespace witnesschain::vault::crypto;
using witnesschain::vault::capability::CapabilityAction;
using witnesschain::vault::capability::CapabilityAuthority;
using witnesschain::vault::capability::CapabilitySigner;
using witnesschain::vault::encryption::DecryptionParams;
using witnesschain::vault::encryption::EncryptedUpload;
using witnesschain::vault::encryption::HybridFileCipher;
using witnesschain::vault::identity::DidIdentity;
using witnesschain::vault::identity::DidKey;

// ============================================================================
// Internal Helper Implementations
// ============================================================================

namespace wc::internal {

WcErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto result = SodiumInterop::Initialize();
        init_success.store(result.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? WC_SUCCESS
               : WC_ERROR_SODIUM_FAILURE;
}

void fill_error(WcError* out_error, const WcErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
#ifdef _WIN32
        out_error->message = _strdup(message.c_str());
#else
        out_error->message = strdup(message.c_str());
#endif
    }
}

WcErrorCode fill_error_from_failure(WcError* out_error, const IdentityFailure& failure) {
    WcErrorCode code = WC_ERROR_GENERIC;
    switch (failure.type) {
        case IdentityFailureType::InvalidDid:
            code = WC_ERROR_INVALID_DID;
            break;
        case IdentityFailureType::InvalidKeyLength:
        case IdentityFailureType::Derivation:
            code = WC_ERROR_INVALID_INPUT;
            break;
        case IdentityFailureType::KeyGeneration:
            code = WC_ERROR_KEY_GENERATION;
            break;
        case IdentityFailureType::Memory:
            code = WC_ERROR_SODIUM_FAILURE;
            break;
        case IdentityFailureType::Signing:
            code = WC_ERROR_GENERIC;
            break;
    }
    fill_error(out_error, code, failure.message);
    return code;
}

WcErrorCode fill_error_from_failure(WcError* out_error, const EncryptionFailure& failure) {
    WcErrorCode code = WC_ERROR_GENERIC;
    switch (failure.type) {
        case EncryptionFailureType::EmptyFile:
        case EncryptionFailureType::NoKey:
        case EncryptionFailureType::InvalidKey:
        case EncryptionFailureType::EmptyData:
        case EncryptionFailureType::InvalidSecretKey:
            code = WC_ERROR_INVALID_INPUT;
            break;
        case EncryptionFailureType::InvalidFormat:
        case EncryptionFailureType::InvalidNonce:
            code = WC_ERROR_DECODE;
            break;
        case EncryptionFailureType::KeyUnwrapFailed:
            code = WC_ERROR_ACCESS_DENIED;
            break;
        case EncryptionFailureType::ContentDecryptFailed:
            code = WC_ERROR_DECRYPTION;
            break;
        case EncryptionFailureType::Internal:
            code = WC_ERROR_ENCRYPTION;
            break;
    }
    fill_error(out_error, code, std::string(failure.Code()) + ": " + failure.message);
    return code;
}

WcErrorCode fill_error_from_failure(WcError* out_error, const KeyStoreFailure& failure) {
    WcErrorCode code = WC_ERROR_GENERIC;
    switch (failure.type) {
        case KeyStoreFailureType::InvalidInput:
            code = WC_ERROR_INVALID_INPUT;
            break;
        case KeyStoreFailureType::KeyNotFound:
            code = WC_ERROR_KEY_NOT_FOUND;
            break;
        case KeyStoreFailureType::InvalidPassword:
            code = WC_ERROR_INVALID_PASSWORD;
            break;
        case KeyStoreFailureType::RateLimited:
            code = WC_ERROR_RATE_LIMITED;
            break;
        case KeyStoreFailureType::Storage:
            code = WC_ERROR_STORAGE;
            break;
        case KeyStoreFailureType::Crypto:
            code = WC_ERROR_GENERIC;
            break;
    }
    fill_error(out_error, code, failure.message);
    return code;
}

WcErrorCode fill_error_from_failure(WcError* out_error, const CapabilityFailure& failure) {
    fill_error(out_error, WC_ERROR_CAPABILITY, std::string(failure.Code()) + ": " + failure.message);
    return WC_ERROR_CAPABILITY;
}

WcErrorCode fill_error_from_failure(WcError* out_error, const SodiumFailure& failure) {
    const WcErrorCode code = failure.type == SodiumFailureType::AllocationFailed
        ? WC_ERROR_OUT_OF_MEMORY
        : WC_ERROR_SODIUM_FAILURE;
    fill_error(out_error, code, failure.message);
    return code;
}

bool validate_buffer_param(const uint8_t* data, const size_t length, WcError* out_error) {
    if (!data && length > 0) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Buffer data is null but length is non-zero");
        return false;
    }
    return true;
}

bool validate_output_handle(const void* handle, WcError* out_error) {
    if (!handle) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Output handle pointer is null");
        return false;
    }
    return true;
}

bool validate_text_param(const char* text, const char* name, WcError* out_error) {
    if (!text) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, std::string(name) + " is null");
        return false;
    }
    if (text[0] == '\0') {
        fill_error(out_error, WC_ERROR_INVALID_INPUT, std::string(name) + " must not be empty");
        return false;
    }
    return true;
}

bool validate_identity_handle(const WcIdentityHandle* handle, WcError* out_error) {
    if (!handle || !handle->identity) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Identity handle is null");
        return false;
    }
    return true;
}

bool copy_to_buffer(const std::span<const uint8_t> input, WcBuffer* out_buffer, WcError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }

    auto* data = new(std::nothrow) uint8_t[input.empty() ? 1 : input.size()];
    if (!data) {
        fill_error(out_error, WC_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    if (!input.empty()) {
        std::memcpy(data, input.data(), input.size());
    }
    out_buffer->data = data;
    out_buffer->length = input.size();
    return true;
}

bool copy_text_to_buffer(const std::string_view text, WcBuffer* out_buffer, WcError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }

    auto* data = new(std::nothrow) uint8_t[text.size() + 1];
    if (!data) {
        fill_error(out_error, WC_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    std::memcpy(data, text.data(), text.size());
    data[text.size()] = 0;
    out_buffer->data = data;
    out_buffer->length = text.size();
    return true;
}

const CapabilityAuthority& DefaultAuthority() {
    static const CapabilityAuthority authority;
    return authority;
}

} // namespace wc::internal

using namespace wc::internal;

namespace {

WcErrorCode CreateIdentityHandle(DidIdentity identity, WcIdentityHandle** out_handle, WcError* out_error) {
    auto* handle = new(std::nothrow) WcIdentityHandle{
        std::make_unique<DidIdentity>(std::move(identity))
    };
    if (!handle) {
        fill_error(out_error, WC_ERROR_OUT_OF_MEMORY, "Failed to allocate identity handle");
        return WC_ERROR_OUT_OF_MEMORY;
    }
    *out_handle = handle;
    return WC_SUCCESS;
}

WcErrorCode SignerFor(const WcIdentityHandle* issuer, std::unique_ptr<CapabilitySigner>& out_signer,
                      WcError* out_error) {
    auto signer = CapabilitySigner::FromIdentity(*issuer->identity);
    if (signer.IsErr()) {
        return fill_error_from_failure(out_error, signer.UnwrapErr());
    }
    out_signer = std::make_unique<CapabilitySigner>(std::move(signer).Unwrap());
    return WC_SUCCESS;
}

WcErrorCode DecryptEnvelope(const uint8_t* envelope, const size_t envelope_length,
                            std::span<const uint8_t> recipient_secret_key,
                            WcBuffer* out_plaintext, WcError* out_error) {
    auto upload = EncryptedUpload::Parse(std::span(envelope, envelope_length));
    if (upload.IsErr()) {
        return fill_error_from_failure(out_error, upload.UnwrapErr());
    }
    auto plaintext = HybridFileCipher::Decrypt(
        DecryptionParams::FromPayload(upload.Unwrap().payload, recipient_secret_key));
    if (plaintext.IsErr()) {
        return fill_error_from_failure(out_error, plaintext.UnwrapErr());
    }
    auto& bytes = plaintext.Unwrap();
    const bool copied = copy_to_buffer(bytes, out_plaintext, out_error);
    SodiumInterop::SecureWipe(bytes);
    if (!copied) {
        return out_error ? out_error->code : WC_ERROR_OUT_OF_MEMORY;
    }
    return WC_SUCCESS;
}

WcErrorCode CopyToken(const Result<capability::UcanDelegation, CapabilityFailure>& issued,
                      WcBuffer* out_token, WcError* out_error) {
    if (issued.IsErr()) {
        return fill_error_from_failure(out_error, issued.UnwrapErr());
    }
    if (!copy_text_to_buffer(issued.Unwrap().token, out_token, out_error)) {
        return out_error ? out_error->code : WC_ERROR_OUT_OF_MEMORY;
    }
    return WC_SUCCESS;
}

} // namespace

extern "C" {

// ----------------------------------------------------------------------------
// Version & Initialization
// ----------------------------------------------------------------------------

const char* wc_version(void) {
    return "1.0.0";
}

WcErrorCode wc_init(void) {
    return EnsureInitialized();
}

// ----------------------------------------------------------------------------
// Identity
// ----------------------------------------------------------------------------

WcErrorCode wc_identity_generate(
    WcIdentityHandle** out_handle,
    WcError* out_error) {
    if (const auto err = EnsureInitialized(); err != WC_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return WC_ERROR_NULL_POINTER;
    }

    auto result = DidIdentity::Generate();
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    return CreateIdentityHandle(std::move(result).Unwrap(), out_handle, out_error);
}

WcErrorCode wc_identity_restore(
    const uint8_t* secret_key,
    const size_t secret_key_length,
    WcIdentityHandle** out_handle,
    WcError* out_error) {
    if (const auto err = EnsureInitialized(); err != WC_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_output_handle(out_handle, out_error) ||
        !validate_buffer_param(secret_key, secret_key_length, out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }
    if (secret_key_length != Constants::ED_25519_SECRET_KEY_SIZE) {
        fill_error(out_error, WC_ERROR_INVALID_INPUT,
                   "Secret key length must be " + std::to_string(Constants::ED_25519_SECRET_KEY_SIZE) + " bytes");
        return WC_ERROR_INVALID_INPUT;
    }

    auto result = DidIdentity::FromSecretKey(std::span(secret_key, secret_key_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    return CreateIdentityHandle(std::move(result).Unwrap(), out_handle, out_error);
}

WcErrorCode wc_identity_get_did(
    const WcIdentityHandle* handle,
    WcBuffer* out_did,
    WcError* out_error) {
    if (!validate_identity_handle(handle, out_error)) {
        return WC_ERROR_NULL_POINTER;
    }
    if (!copy_text_to_buffer(handle->identity->GetDid(), out_did, out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }
    return WC_SUCCESS;
}

WcErrorCode wc_identity_get_public_key(
    const WcIdentityHandle* handle,
    uint8_t* out_key,
    const size_t out_key_length,
    WcError* out_error) {
    if (!validate_identity_handle(handle, out_error)) {
        return WC_ERROR_NULL_POINTER;
    }
    if (!out_key) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Output key buffer is null");
        return WC_ERROR_NULL_POINTER;
    }
    if (out_key_length != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        fill_error(out_error, WC_ERROR_BUFFER_TOO_SMALL,
                   "Output buffer must be " + std::to_string(Constants::ED_25519_PUBLIC_KEY_SIZE) + " bytes");
        return WC_ERROR_BUFFER_TOO_SMALL;
    }

    const auto& key = handle->identity->GetPublicKey();
    std::memcpy(out_key, key.data(), key.size());
    return WC_SUCCESS;
}

WcErrorCode wc_identity_get_encryption_public_key(
    const WcIdentityHandle* handle,
    uint8_t* out_key,
    const size_t out_key_length,
    WcError* out_error) {
    if (!validate_identity_handle(handle, out_error)) {
        return WC_ERROR_NULL_POINTER;
    }
    if (!out_key) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Output key buffer is null");
        return WC_ERROR_NULL_POINTER;
    }
    if (out_key_length != Constants::X_25519_PUBLIC_KEY_SIZE) {
        fill_error(out_error, WC_ERROR_BUFFER_TOO_SMALL,
                   "Output buffer must be " + std::to_string(Constants::X_25519_PUBLIC_KEY_SIZE) + " bytes");
        return WC_ERROR_BUFFER_TOO_SMALL;
    }

    auto key_pair = handle->identity->DeriveEncryptionKeyPair();
    if (key_pair.IsErr()) {
        return fill_error_from_failure(out_error, key_pair.UnwrapErr());
    }
    const auto& key = key_pair.Unwrap().GetPublicKey();
    std::memcpy(out_key, key.data(), key.size());
    return WC_SUCCESS;
}

WcErrorCode wc_identity_sign(
    const WcIdentityHandle* handle,
    const uint8_t* message,
    const size_t message_length,
    WcBuffer* out_signature,
    WcError* out_error) {
    if (!validate_identity_handle(handle, out_error)) {
        return WC_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(message, message_length, out_error)) {
        return WC_ERROR_NULL_POINTER;
    }

    auto signature = handle->identity->Sign(std::span(message, message_length));
    if (signature.IsErr()) {
        return fill_error_from_failure(out_error, signature.UnwrapErr());
    }
    if (!copy_text_to_buffer(signature.Unwrap(), out_signature, out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }
    return WC_SUCCESS;
}

WcErrorCode wc_identity_verify(
    const char* did,
    const char* signature_base64,
    const uint8_t* message,
    const size_t message_length,
    bool* out_valid,
    WcError* out_error) {
    if (const auto err = EnsureInitialized(); err != WC_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!did || !signature_base64 || !out_valid) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "DID, signature and result pointers must not be null");
        return WC_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(message, message_length, out_error)) {
        return WC_ERROR_NULL_POINTER;
    }

    *out_valid = DidIdentity::Verify(did, signature_base64, std::span(message, message_length));
    return WC_SUCCESS;
}

bool wc_did_is_valid(const char* did) {
    return did != nullptr && DidKey::IsValid(did);
}

void wc_identity_destroy(WcIdentityHandle* handle) {
    delete handle;
}

// ----------------------------------------------------------------------------
// File encryption
// ----------------------------------------------------------------------------

WcErrorCode wc_file_encrypt(
    const uint8_t* plaintext,
    const size_t plaintext_length,
    const uint8_t* recipient_public_key,
    const size_t recipient_public_key_length,
    const char* mime_type,
    const char* file_name,
    WcBuffer* out_envelope,
    WcError* out_error) {
    if (const auto err = EnsureInitialized(); err != WC_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_buffer_param(plaintext, plaintext_length, out_error) ||
        !validate_buffer_param(recipient_public_key, recipient_public_key_length, out_error) ||
        !validate_output_handle(out_envelope, out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    const std::string recipient = recipient_public_key_length > 0
        ? encoding::Base64::Encode(std::span(recipient_public_key, recipient_public_key_length))
        : std::string();
    auto upload = HybridFileCipher::EncryptForUpload(
        std::span(plaintext, plaintext_length),
        recipient,
        mime_type ? mime_type : "",
        file_name ? file_name : "");
    if (upload.IsErr()) {
        return fill_error_from_failure(out_error, upload.UnwrapErr());
    }

    const std::string serialized = upload.Unwrap().Serialize();
    const auto* bytes = reinterpret_cast<const uint8_t*>(serialized.data());
    if (!copy_to_buffer(std::span(bytes, serialized.size()), out_envelope, out_error)) {
        return out_error ? out_error->code : WC_ERROR_OUT_OF_MEMORY;
    }
    return WC_SUCCESS;
}

WcErrorCode wc_file_decrypt(
    const uint8_t* envelope,
    const size_t envelope_length,
    const uint8_t* recipient_secret_key,
    const size_t recipient_secret_key_length,
    WcBuffer* out_plaintext,
    WcError* out_error) {
    if (const auto err = EnsureInitialized(); err != WC_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_buffer_param(envelope, envelope_length, out_error) ||
        !validate_buffer_param(recipient_secret_key, recipient_secret_key_length, out_error) ||
        !validate_output_handle(out_plaintext, out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    return DecryptEnvelope(envelope, envelope_length,
                           std::span(recipient_secret_key, recipient_secret_key_length),
                           out_plaintext, out_error);
}

WcErrorCode wc_file_decrypt_with_identity(
    const uint8_t* envelope,
    const size_t envelope_length,
    const WcIdentityHandle* identity,
    WcBuffer* out_plaintext,
    WcError* out_error) {
    if (!validate_identity_handle(identity, out_error)) {
        return WC_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(envelope, envelope_length, out_error) ||
        !validate_output_handle(out_plaintext, out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    auto key_pair = identity->identity->DeriveEncryptionKeyPair();
    if (key_pair.IsErr()) {
        return fill_error_from_failure(out_error, key_pair.UnwrapErr());
    }
    auto outcome = key_pair.Unwrap().GetSecretKeyHandle().WithReadAccess(
        [&](std::span<const uint8_t> secret) {
            return DecryptEnvelope(envelope, envelope_length, secret, out_plaintext, out_error);
        });
    if (outcome.IsErr()) {
        return fill_error_from_failure(out_error, outcome.UnwrapErr());
    }
    return outcome.Unwrap();
}

WcErrorCode wc_content_hash_verify(
    const uint8_t* plaintext,
    const size_t plaintext_length,
    const char* expected_hash,
    bool* out_matches,
    WcError* out_error) {
    if (!expected_hash || !out_matches) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Expected hash and result pointers must not be null");
        return WC_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(plaintext, plaintext_length, out_error)) {
        return WC_ERROR_NULL_POINTER;
    }

    *out_matches = HybridFileCipher::VerifyContentHash(std::span(plaintext, plaintext_length), expected_hash);
    return WC_SUCCESS;
}

// ----------------------------------------------------------------------------
// Key store
// ----------------------------------------------------------------------------

WcErrorCode wc_keystore_open(
    const char* directory,
    const uint32_t kdf_iterations,
    WcKeyStoreHandle** out_handle,
    WcError* out_error) {
    if (const auto err = EnsureInitialized(); err != WC_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return WC_ERROR_NULL_POINTER;
    }

    auto settings = configuration::KeyDerivationSettings::Default();
    if (kdf_iterations != 0) {
        if (kdf_iterations < Constants::PBKDF2_MIN_ITERATIONS) {
            fill_error(out_error, WC_ERROR_INVALID_INPUT,
                       "KDF iterations must be at least " + std::to_string(Constants::PBKDF2_MIN_ITERATIONS));
            return WC_ERROR_INVALID_INPUT;
        }
        settings.iterations = kdf_iterations;
    }

    std::shared_ptr<interfaces::IKeyRecordStore> backend;
    if (directory) {
        auto opened = keystore::FileKeyRecordStore::Open(directory);
        if (opened.IsErr()) {
            return fill_error_from_failure(out_error, opened.UnwrapErr());
        }
        backend = std::move(opened).Unwrap();
    } else {
        backend = std::make_shared<keystore::InMemoryKeyRecordStore>();
    }

    auto* handle = new(std::nothrow) WcKeyStoreHandle{
        std::make_unique<keystore::SecureKeyStore>(
            std::move(backend),
            std::make_shared<security::UnlockRateLimiter>(),
            settings)
    };
    if (!handle) {
        fill_error(out_error, WC_ERROR_OUT_OF_MEMORY, "Failed to allocate key store handle");
        return WC_ERROR_OUT_OF_MEMORY;
    }
    *out_handle = handle;
    return WC_SUCCESS;
}

WcErrorCode wc_keystore_store(
    WcKeyStoreHandle* handle,
    const WcIdentityHandle* identity,
    const char* password,
    WcError* out_error) {
    if (!handle || !handle->key_store) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Key store handle is null");
        return WC_ERROR_NULL_POINTER;
    }
    if (!validate_identity_handle(identity, out_error) ||
        !validate_text_param(password, "Password", out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    auto stored = handle->key_store->Store(
        identity->identity->GetSecretKeyHandle(), password, identity->identity->GetDid());
    if (stored.IsErr()) {
        return fill_error_from_failure(out_error, stored.UnwrapErr());
    }
    return WC_SUCCESS;
}

WcErrorCode wc_keystore_unlock(
    WcKeyStoreHandle* handle,
    const char* did,
    const char* password,
    WcIdentityHandle** out_identity,
    WcError* out_error) {
    if (!handle || !handle->key_store) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Key store handle is null");
        return WC_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_identity, out_error) ||
        !validate_text_param(did, "DID", out_error) ||
        !validate_text_param(password, "Password", out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    auto secret = handle->key_store->Retrieve(did, password);
    if (secret.IsErr()) {
        return fill_error_from_failure(out_error, secret.UnwrapErr());
    }
    auto identity = DidIdentity::FromSecretKey(std::move(secret).Unwrap());
    if (identity.IsErr()) {
        return fill_error_from_failure(out_error, identity.UnwrapErr());
    }
    return CreateIdentityHandle(std::move(identity).Unwrap(), out_identity, out_error);
}

WcErrorCode wc_keystore_exists(
    WcKeyStoreHandle* handle,
    const char* did,
    bool* out_exists,
    WcError* out_error) {
    if (!handle || !handle->key_store) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Key store handle is null");
        return WC_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_exists, out_error) ||
        !validate_text_param(did, "DID", out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    auto exists = handle->key_store->Exists(did);
    if (exists.IsErr()) {
        return fill_error_from_failure(out_error, exists.UnwrapErr());
    }
    *out_exists = exists.Unwrap();
    return WC_SUCCESS;
}

WcErrorCode wc_keystore_delete(
    WcKeyStoreHandle* handle,
    const char* did,
    WcError* out_error) {
    if (!handle || !handle->key_store) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Key store handle is null");
        return WC_ERROR_NULL_POINTER;
    }
    if (!validate_text_param(did, "DID", out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    auto deleted = handle->key_store->Delete(did);
    if (deleted.IsErr()) {
        return fill_error_from_failure(out_error, deleted.UnwrapErr());
    }
    return WC_SUCCESS;
}

WcErrorCode wc_keystore_rate_limit_status(
    const WcKeyStoreHandle* handle,
    const char* did,
    uint32_t* out_remaining_seconds,
    WcError* out_error) {
    if (!handle || !handle->key_store) {
        fill_error(out_error, WC_ERROR_NULL_POINTER, "Key store handle is null");
        return WC_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_remaining_seconds, out_error) ||
        !validate_text_param(did, "DID", out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    *out_remaining_seconds = handle->key_store->GetRateLimitStatus(did);
    return WC_SUCCESS;
}

void wc_keystore_close(WcKeyStoreHandle* handle) {
    delete handle;
}

// ----------------------------------------------------------------------------
// Capabilities
// ----------------------------------------------------------------------------

WcErrorCode wc_capability_issue_upload(
    const WcIdentityHandle* issuer,
    WcBuffer* out_token,
    WcError* out_error) {
    if (!validate_identity_handle(issuer, out_error) ||
        !validate_output_handle(out_token, out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    std::unique_ptr<CapabilitySigner> signer;
    if (const auto err = SignerFor(issuer, signer, out_error); err != WC_SUCCESS) {
        return err;
    }
    return CopyToken(DefaultAuthority().CreateUploadCapability(*signer), out_token, out_error);
}

WcErrorCode wc_capability_issue_read(
    const WcIdentityHandle* issuer,
    const char* evidence_id,
    WcBuffer* out_token,
    WcError* out_error) {
    if (!validate_identity_handle(issuer, out_error) ||
        !validate_text_param(evidence_id, "Evidence id", out_error) ||
        !validate_output_handle(out_token, out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    std::unique_ptr<CapabilitySigner> signer;
    if (const auto err = SignerFor(issuer, signer, out_error); err != WC_SUCCESS) {
        return err;
    }
    return CopyToken(DefaultAuthority().CreateReadCapability(*signer, evidence_id), out_token, out_error);
}

WcErrorCode wc_capability_delegate_read(
    const WcIdentityHandle* issuer,
    const char* audience_did,
    const char* evidence_id,
    const uint64_t ttl_seconds,
    WcBuffer* out_token,
    WcError* out_error) {
    if (!validate_identity_handle(issuer, out_error) ||
        !validate_text_param(audience_did, "Audience DID", out_error) ||
        !validate_text_param(evidence_id, "Evidence id", out_error) ||
        !validate_output_handle(out_token, out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    if (ttl_seconds > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        fill_error(out_error, WC_ERROR_INVALID_INPUT, "Capability lifetime is out of range");
        return WC_ERROR_INVALID_INPUT;
    }

    std::unique_ptr<CapabilitySigner> signer;
    if (const auto err = SignerFor(issuer, signer, out_error); err != WC_SUCCESS) {
        return err;
    }
    const auto& authority = DefaultAuthority();
    const std::chrono::seconds ttl = ttl_seconds == 0
        ? authority.Settings().read_ttl
        : std::chrono::seconds(static_cast<std::chrono::seconds::rep>(ttl_seconds));
    return CopyToken(
        authority.DelegateCapability(*signer, audience_did, CapabilityAction::EvidenceRead, evidence_id, ttl),
        out_token, out_error);
}

WcErrorCode wc_capability_check(
    const char* token,
    const char* action,
    const char* resource_id,
    const char* requester_did,
    bool* out_allowed,
    WcBuffer* out_reason,
    WcError* out_error) {
    if (const auto err = EnsureInitialized(); err != WC_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_text_param(token, "Token", out_error) ||
        !validate_text_param(action, "Action", out_error) ||
        !validate_output_handle(out_allowed, out_error)) {
        return out_error ? out_error->code : WC_ERROR_NULL_POINTER;
    }

    const auto required = capability::ParseAction(action);
    if (!required) {
        fill_error(out_error, WC_ERROR_INVALID_INPUT, std::string("Unknown capability action: ") + action);
        return WC_ERROR_INVALID_INPUT;
    }

    std::optional<std::string_view> resource;
    if (resource_id) {
        resource = resource_id;
    }
    std::optional<std::string_view> requester;
    if (requester_did) {
        requester = requester_did;
    }

    const auto check = DefaultAuthority().CheckCapability(token, *required, resource, requester);
    *out_allowed = check.allowed;
    if (out_reason && !check.allowed &&
        !copy_text_to_buffer(check.reason, out_reason, out_error)) {
        return out_error ? out_error->code : WC_ERROR_OUT_OF_MEMORY;
    }
    return WC_SUCCESS;
}

// ----------------------------------------------------------------------------
// Memory & Error Management
// ----------------------------------------------------------------------------

void wc_buffer_free(WcBuffer* buffer) {
    if (buffer && buffer->data) {
        SodiumInterop::SecureWipe(std::span(buffer->data, buffer->length));
        delete[] buffer->data;
        buffer->data = nullptr;
        buffer->length = 0;
    }
}

void wc_error_free(WcError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

const char* wc_error_string(const WcErrorCode code) {
    switch (code) {
        case WC_SUCCESS: return "Success";
        case WC_ERROR_GENERIC: return "Generic error";
        case WC_ERROR_INVALID_INPUT: return "Invalid input";
        case WC_ERROR_KEY_GENERATION: return "Key generation failed";
        case WC_ERROR_INVALID_DID: return "Invalid DID";
        case WC_ERROR_ENCRYPTION: return "Encryption failed";
        case WC_ERROR_DECRYPTION: return "Decryption failed";
        case WC_ERROR_ACCESS_DENIED: return "Access denied";
        case WC_ERROR_DECODE: return "Decoding failed";
        case WC_ERROR_BUFFER_TOO_SMALL: return "Buffer too small";
        case WC_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case WC_ERROR_SODIUM_FAILURE: return "Sodium library failure";
        case WC_ERROR_NULL_POINTER: return "Null pointer";
        case WC_ERROR_KEY_NOT_FOUND: return "Key not found";
        case WC_ERROR_INVALID_PASSWORD: return "Invalid password";
        case WC_ERROR_RATE_LIMITED: return "Rate limited";
        case WC_ERROR_STORAGE: return "Storage failure";
        case WC_ERROR_CAPABILITY: return "Capability failure";
        default: return "Unknown error";
    }
}

WcErrorCode wc_secure_wipe(uint8_t* data, const size_t length) {
    if (!data && length > 0) {
        return WC_ERROR_NULL_POINTER;
    }

    if (length > 0) {
        SodiumInterop::SecureWipe(std::span(data, length));
    }

    return WC_SUCCESS;
}

} // extern "C"
