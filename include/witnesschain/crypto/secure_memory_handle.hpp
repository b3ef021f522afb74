#pragma once

#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace witnesschain::vault::crypto {

/**
 * @brief Single owner of a secret byte buffer held in libsodium secure memory
 *
 * Backed by sodium_malloc: guard pages around the buffer, locked in RAM,
 * zeroed by sodium_free when the handle is destroyed or reassigned.
 *
 * The handle is move-only. Secret keys (signing keys, symmetric file keys,
 * password-derived wrapping keys) travel through the library as handles so
 * that every exit path, including early returns and stack unwinding, wipes
 * them. There is deliberately no Clone(): a second owner would have to be
 * created explicitly through ReadBytes/FromBytes.
 *
 * @code
 * auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
 * handle.WithWriteAccess([](std::span<uint8_t> out) {
 *     randombytes_buf(out.data(), out.size());
 *     return unit;
 * });
 * @endcode
 */
class SecureMemoryHandle {
public:
    /**
     * @brief Allocate a zero-filled secure buffer
     *
     * @param size Number of bytes, must be non-zero
     */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /**
     * @brief Allocate a buffer of exactly bytes.size() and copy bytes in
     *
     * The caller stays responsible for wiping its own copy of bytes.
     */
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> bytes);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Copy data into the buffer, zero-filling any remainder
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Copy the whole buffer into output (output.size() >= Size())
     */
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    /**
     * @brief Copy the first size bytes out into a new vector
     *
     * The returned vector is ordinary heap memory; wipe it after use.
     */
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Secure memory handle has been released"));
        }
        std::span<const uint8_t> secure_span(static_cast<const uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Secure memory handle has been released"));
        }
        std::span<uint8_t> secure_span(static_cast<uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    /**
     * @brief Wipe and free the buffer now; the handle becomes invalid
     */
    void Reset() noexcept;

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void* ptr_;
    size_t size_;
};

}
