#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/core/constants.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace witnesschain::vault::keystore {

/**
 * A signing key sealed under a password, as persisted. One record per DID.
 *
 * ciphertext is AES-256-GCM output with the 16-byte tag appended, so a
 * 64-byte Ed25519 secret key produces 80 bytes.
 */
struct EncryptedKeyRecord {
    uint32_t version = KeyStoreConstants::RECORD_VERSION;
    std::string did;
    std::vector<uint8_t> salt;
    std::vector<uint8_t> iv;
    std::vector<uint8_t> ciphertext;
    /// Unix milliseconds.
    int64_t created_at = 0;
    uint32_t kdf_iterations = Constants::PBKDF2_MIN_ITERATIONS;

    [[nodiscard]] std::string Serialize() const;

    static Result<EncryptedKeyRecord, KeyStoreFailure> Parse(std::span<const uint8_t> bytes);
};

struct KeyMetadata {
    int64_t created_at = 0;
    uint32_t kdf_iterations = 0;
};

}
