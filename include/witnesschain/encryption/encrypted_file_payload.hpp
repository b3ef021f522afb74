#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace witnesschain::vault::encryption {

/**
 * Output of hybrid file encryption. Everything except encrypted_data is
 * text so it can travel as metadata alongside the ciphertext.
 */
struct EncryptedFilePayload {
    std::vector<uint8_t> encrypted_data;
    std::string encrypted_key;
    std::string ephemeral_public_key;
    std::string file_nonce;
    std::string key_nonce;
    /// "0x" + lower-hex SHA-256 of the plaintext.
    std::string content_hash;
    uint64_t original_size = 0;
};

struct EncryptedUpload {
    EncryptedFilePayload payload;
    std::string mime_type;
    std::string file_name;

    /// EncryptedFileEnvelope protobuf bytes.
    [[nodiscard]] std::string Serialize() const;

    static Result<EncryptedUpload, EncryptionFailure> Parse(std::span<const uint8_t> bytes);
};

/**
 * Inputs to decryption. Borrowed views: the referenced storage must outlive
 * the Decrypt call.
 */
struct DecryptionParams {
    std::span<const uint8_t> encrypted_data;
    std::string_view encrypted_key;
    std::string_view ephemeral_public_key;
    std::string_view file_nonce;
    std::string_view key_nonce;
    std::span<const uint8_t> recipient_secret_key;

    static DecryptionParams FromPayload(
        const EncryptedFilePayload& payload,
        std::span<const uint8_t> recipient_secret_key) noexcept {
        return DecryptionParams{
            payload.encrypted_data,
            payload.encrypted_key,
            payload.ephemeral_public_key,
            payload.file_nonce,
            payload.key_nonce,
            recipient_secret_key};
    }
};

}
