#include "witnesschain/encryption/hybrid_file_cipher.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/crypto/secure_memory_handle.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "witnesschain/core/constants.hpp"
#include "witnesschain/debug/audit_log.hpp"

#include <sodium.h>
#include <optional>

namespace witnesschain::vault::encryption {

using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;
using encoding::Base64;

namespace {
using PayloadResult = Result<EncryptedFilePayload, EncryptionFailure>;
using PlaintextResult = Result<std::vector<uint8_t>, EncryptionFailure>;

PlaintextResult Fail(EncryptionFailure failure) {
    debug::LogFailureCode(debug::Component::Encryption, "DECRYPT", failure.Code());
    return PlaintextResult::Err(std::move(failure));
}
}

PayloadResult HybridFileCipher::Encrypt(
    std::span<const uint8_t> plaintext,
    std::string_view recipient_public_key_base64) {
    if (plaintext.empty()) {
        return PayloadResult::Err(EncryptionFailure::EmptyFile("Cannot encrypt empty file"));
    }
    if (recipient_public_key_base64.empty()) {
        return PayloadResult::Err(EncryptionFailure::NoKey("Recipient public key is required"));
    }
    auto recipient_public_key = Base64::Decode(recipient_public_key_base64);
    if (!recipient_public_key.has_value()) {
        return PayloadResult::Err(
            EncryptionFailure::InvalidKey("Invalid recipient public key format"));
    }
    if (recipient_public_key->size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return PayloadResult::Err(EncryptionFailure::InvalidKey(
            "Invalid recipient public key length: expected " +
            std::to_string(Constants::X_25519_PUBLIC_KEY_SIZE) + ", got " +
            std::to_string(recipient_public_key->size())));
    }

    EncryptedFilePayload payload;
    payload.content_hash = HashContent(plaintext);
    payload.original_size = plaintext.size();

    std::vector<uint8_t> file_nonce = SodiumInterop::GetRandomBytes(crypto_secretbox_NONCEBYTES);
    std::vector<uint8_t> key_nonce = SodiumInterop::GetRandomBytes(crypto_box_NONCEBYTES);
    {
        auto file_key_result = SecureMemoryHandle::Allocate(Constants::SYMMETRIC_KEY_SIZE);
        if (file_key_result.IsErr()) {
            return PayloadResult::Err(EncryptionFailure::FromSodiumFailure(file_key_result.UnwrapErr()));
        }
        SecureMemoryHandle file_key = std::move(file_key_result).Unwrap();
        auto generated = file_key.WithWriteAccess([](std::span<uint8_t> key) {
            crypto_secretbox_keygen(key.data());
            return unit;
        });
        if (generated.IsErr()) {
            return PayloadResult::Err(EncryptionFailure::FromSodiumFailure(generated.UnwrapErr()));
        }

        payload.encrypted_data.resize(plaintext.size() + crypto_secretbox_MACBYTES);
        auto sealed = file_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return crypto_secretbox_easy(payload.encrypted_data.data(), plaintext.data(),
                                         plaintext.size(), file_nonce.data(), key.data());
        });
        if (sealed.IsErr() || sealed.Unwrap() != SodiumConstants::SUCCESS) {
            return PayloadResult::Err(EncryptionFailure::Internal("File encryption failed"));
        }

        auto ephemeral_result = SodiumInterop::GenerateX25519KeyPair("ephemeral");
        if (ephemeral_result.IsErr()) {
            return PayloadResult::Err(EncryptionFailure::FromSodiumFailure(ephemeral_result.UnwrapErr()));
        }
        auto ephemeral = std::move(ephemeral_result).Unwrap();
        SecureMemoryHandle& ephemeral_secret = ephemeral.first;
        const std::vector<uint8_t>& ephemeral_public = ephemeral.second;

        std::vector<uint8_t> wrapped_key(Constants::SYMMETRIC_KEY_SIZE + crypto_box_MACBYTES);
        auto wrapped = file_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return ephemeral_secret.WithReadAccess([&](std::span<const uint8_t> esk) {
                return crypto_box_easy(wrapped_key.data(), key.data(), key.size(), key_nonce.data(),
                                       recipient_public_key->data(), esk.data());
            });
        });
        if (wrapped.IsErr() || wrapped.Unwrap().IsErr() ||
            wrapped.Unwrap().Unwrap() != SodiumConstants::SUCCESS) {
            return PayloadResult::Err(EncryptionFailure::Internal("File key wrapping failed"));
        }
        // File key and ephemeral secret are wiped here, before the payload leaves.
        ephemeral_secret.Reset();
        file_key.Reset();

        payload.encrypted_key = Base64::Encode(wrapped_key);
        payload.ephemeral_public_key = Base64::Encode(ephemeral_public);
    }
    payload.file_nonce = Base64::Encode(file_nonce);
    payload.key_nonce = Base64::Encode(key_nonce);
    WC_LOG_VALUE(debug::Component::Encryption, "ENCRYPT", "original_size", payload.original_size);
    return PayloadResult::Ok(std::move(payload));
}

Result<EncryptedUpload, EncryptionFailure> HybridFileCipher::EncryptForUpload(
    std::span<const uint8_t> plaintext,
    std::string_view recipient_public_key_base64,
    std::string mime_type,
    std::string file_name) {
    return Encrypt(plaintext, recipient_public_key_base64).Map(
        [&mime_type, &file_name](EncryptedFilePayload payload) {
            return EncryptedUpload{std::move(payload), std::move(mime_type), std::move(file_name)};
        });
}

PlaintextResult HybridFileCipher::Decrypt(const DecryptionParams& params) {
    if (params.encrypted_data.empty()) {
        return Fail(EncryptionFailure::EmptyData("No encrypted data provided"));
    }
    if (params.recipient_secret_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
        return Fail(EncryptionFailure::InvalidSecretKey(
            "Invalid secret key length: expected " +
            std::to_string(Constants::X_25519_PRIVATE_KEY_SIZE) + ", got " +
            std::to_string(params.recipient_secret_key.size())));
    }
    auto encrypted_key = Base64::Decode(params.encrypted_key);
    auto ephemeral_public_key = Base64::Decode(params.ephemeral_public_key);
    auto file_nonce = Base64::Decode(params.file_nonce);
    auto key_nonce = Base64::Decode(params.key_nonce);
    if (!encrypted_key || !ephemeral_public_key || !file_nonce || !key_nonce) {
        return Fail(EncryptionFailure::InvalidFormat("Invalid encrypted data format"));
    }
    if (file_nonce->size() != crypto_secretbox_NONCEBYTES) {
        return Fail(EncryptionFailure::InvalidNonce("Invalid file nonce length"));
    }
    if (key_nonce->size() != crypto_box_NONCEBYTES) {
        return Fail(EncryptionFailure::InvalidNonce("Invalid key nonce length"));
    }
    if (ephemeral_public_key->size() != crypto_box_PUBLICKEYBYTES ||
        encrypted_key->size() != Constants::SYMMETRIC_KEY_SIZE + crypto_box_MACBYTES) {
        return Fail(EncryptionFailure::KeyUnwrapFailed(
            "Failed to decrypt file key. Access denied or data corrupted."));
    }

    auto file_key_result = SecureMemoryHandle::Allocate(Constants::SYMMETRIC_KEY_SIZE);
    if (file_key_result.IsErr()) {
        return Fail(EncryptionFailure::FromSodiumFailure(file_key_result.UnwrapErr()));
    }
    SecureMemoryHandle file_key = std::move(file_key_result).Unwrap();
    auto unwrapped = file_key.WithWriteAccess([&](std::span<uint8_t> key) {
        return crypto_box_open_easy(key.data(), encrypted_key->data(), encrypted_key->size(),
                                    key_nonce->data(), ephemeral_public_key->data(),
                                    params.recipient_secret_key.data());
    });
    if (unwrapped.IsErr() || unwrapped.Unwrap() != SodiumConstants::SUCCESS) {
        return Fail(EncryptionFailure::KeyUnwrapFailed(
            "Failed to decrypt file key. Access denied or data corrupted."));
    }

    if (params.encrypted_data.size() <= crypto_secretbox_MACBYTES) {
        return Fail(EncryptionFailure::ContentDecryptFailed(
            "Failed to decrypt file. Data may be corrupted."));
    }
    std::vector<uint8_t> plaintext(params.encrypted_data.size() - crypto_secretbox_MACBYTES);
    auto opened = file_key.WithReadAccess([&](std::span<const uint8_t> key) {
        return crypto_secretbox_open_easy(plaintext.data(), params.encrypted_data.data(),
                                          params.encrypted_data.size(), file_nonce->data(),
                                          key.data());
    });
    if (opened.IsErr() || opened.Unwrap() != SodiumConstants::SUCCESS) {
        return Fail(EncryptionFailure::ContentDecryptFailed(
            "Failed to decrypt file. Data may be corrupted."));
    }
    WC_LOG_VALUE(debug::Component::Encryption, "DECRYPT", "plaintext_size", plaintext.size());
    return PlaintextResult::Ok(std::move(plaintext));
}

std::string HybridFileCipher::HashContent(std::span<const uint8_t> data) {
    return "0x" + encoding::Hex::Encode(SodiumInterop::Sha256(data));
}

bool HybridFileCipher::VerifyContentHash(
    std::span<const uint8_t> plaintext,
    std::string_view expected_hash) {
    return encoding::Hex::EqualsIgnoreCase(HashContent(plaintext), expected_hash);
}

}
