#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/encryption/encrypted_file_payload.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace witnesschain::vault::encryption {

/**
 * End-to-end file encryption for a single X25519 recipient.
 *
 * Each file gets a fresh 32-byte key and 24-byte nonce for
 * XSalsa20-Poly1305 (crypto_secretbox). The file key is then sealed with
 * crypto_box between a fresh ephemeral X25519 key and the recipient's
 * public key under a second fresh nonce. The file key and the ephemeral
 * secret live only in secure memory and are released before Encrypt
 * returns.
 *
 * Decryption failures are distinct: a failed key unwrap means the caller
 * is not the recipient (or the wrapping metadata is corrupted); a failed
 * content decrypt means the file body or its nonce is corrupted.
 */
class HybridFileCipher {
public:
    [[nodiscard]] static Result<EncryptedFilePayload, EncryptionFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        std::string_view recipient_public_key_base64);

    [[nodiscard]] static Result<EncryptedUpload, EncryptionFailure> EncryptForUpload(
        std::span<const uint8_t> plaintext,
        std::string_view recipient_public_key_base64,
        std::string mime_type,
        std::string file_name);

    [[nodiscard]] static Result<std::vector<uint8_t>, EncryptionFailure> Decrypt(
        const DecryptionParams& params);

    /// "0x" + lower-hex SHA-256.
    [[nodiscard]] static std::string HashContent(std::span<const uint8_t> data);

    /// Case-insensitive comparison against HashContent(plaintext).
    [[nodiscard]] static bool VerifyContentHash(
        std::span<const uint8_t> plaintext,
        std::string_view expected_hash);

private:
    HybridFileCipher() = delete;
};

}
