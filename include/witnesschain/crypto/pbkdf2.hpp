#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/crypto/secure_memory_handle.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace witnesschain::vault::crypto {

/**
 * @brief PBKDF2-HMAC-SHA256 via OpenSSL EVP_KDF
 *
 * Produces the AES-256-GCM wrapping key for a password-protected key record.
 * The derived key is written directly into secure memory.
 */
class Pbkdf2 {
public:
    static constexpr size_t MAX_OUTPUT_LEN = 64;

    [[nodiscard]] static Result<SecureMemoryHandle, CryptoFailure> DeriveKey(
        std::string_view password,
        std::span<const uint8_t> salt,
        uint32_t iterations,
        size_t output_size);

private:
    Pbkdf2() = delete;
};

}
