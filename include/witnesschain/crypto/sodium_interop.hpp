#pragma once

#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace witnesschain::vault::crypto {

class SecureMemoryHandle;

/**
 * @brief Thin, checked entry point into libsodium
 *
 * Every component goes through this class for library initialization,
 * random bytes, hashing, wiping and key-pair generation so that
 * secret halves always land in a SecureMemoryHandle.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Zero a buffer with sodium_memzero (never optimized away)
     */
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Constant-time comparison; buffers of different length are unequal
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    /**
     * @brief Generate a random X25519 key pair
     *
     * @param key_purpose Used only in failure messages
     * @return (secret key handle, public key bytes)
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Generate a random Ed25519 key pair
     *
     * @return (64-byte secret key handle, 32-byte public key)
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
    GenerateEd25519KeyPair();

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void FillRandom(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief SHA-256 digest of data
     */
    static std::vector<uint8_t> Sha256(std::span<const uint8_t> data);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
