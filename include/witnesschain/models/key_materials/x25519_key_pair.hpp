#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/crypto/secure_memory_handle.hpp"
#include <vector>
#include <cstdint>
namespace witnesschain::vault::models {
/**
 * X25519 encryption pair, either derived from a signing seed or random.
 */
class X25519KeyPair {
public:
    X25519KeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key);
    X25519KeyPair(X25519KeyPair&&) noexcept = default;
    X25519KeyPair& operator=(X25519KeyPair&&) noexcept = default;
    X25519KeyPair(const X25519KeyPair&) = delete;
    X25519KeyPair& operator=(const X25519KeyPair&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    /// Copies the secret out of secure memory; the caller must wipe it.
    [[nodiscard]] Result<std::vector<uint8_t>, SodiumFailure> ExportSecretKey() const;
    [[nodiscard]] crypto::SecureMemoryHandle TakeSecretKeyHandle() && {
        return std::move(secret_key_handle_);
    }
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
