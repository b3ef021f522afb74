#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/crypto/secure_memory_handle.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace witnesschain::vault::crypto {

/**
 * AES-256-GCM for key records at rest.
 *
 * Stateless primitive: the caller supplies a unique (key, nonce) pair. The
 * key store satisfies this by deriving a fresh wrapping key from a fresh
 * 16-byte salt on every store, so each wrapping key seals exactly one
 * plaintext under one random 12-byte IV.
 *
 * Decrypt writes the plaintext straight into secure memory and reports a
 * tag mismatch as CryptoFailureType::AuthenticationFailed, separate from
 * OpenSSL backend errors.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<SecureMemoryHandle, CryptoFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
