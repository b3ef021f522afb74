#pragma once
#include "witnesschain/crypto/secure_memory_handle.hpp"
#include <vector>
#include <cstdint>
namespace witnesschain::vault::models {
/**
 * Ed25519 signing pair. The 64-byte secret (seed || public key) stays in
 * secure memory; the 32-byte public key is ordinary data.
 */
class Ed25519KeyPair {
public:
    Ed25519KeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key);
    Ed25519KeyPair(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair& operator=(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair(const Ed25519KeyPair&) = delete;
    Ed25519KeyPair& operator=(const Ed25519KeyPair&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] crypto::SecureMemoryHandle TakeSecretKeyHandle() && {
        return std::move(secret_key_handle_);
    }
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
