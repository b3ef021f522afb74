#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/crypto/secure_memory_handle.hpp"

namespace witnesschain::vault::crypto {

using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>;

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });
    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("sodium_init() failed"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

KeyPairResult SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    auto sk_result = SecureMemoryHandle::Allocate(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (sk_result.IsErr()) {
        return KeyPairResult::Err(sk_result.UnwrapErr());
    }
    SecureMemoryHandle sk_handle = std::move(sk_result).Unwrap();
    std::vector<uint8_t> pk_bytes(Constants::X_25519_PUBLIC_KEY_SIZE);

    auto generated = sk_handle.WithWriteAccess([&pk_bytes](std::span<uint8_t> sk) {
        return crypto_box_keypair(pk_bytes.data(), sk.data()) == SodiumConstants::SUCCESS;
    });
    if (generated.IsErr()) {
        return KeyPairResult::Err(generated.UnwrapErr());
    }
    if (!generated.Unwrap()) {
        return KeyPairResult::Err(SodiumFailure::KeyGenerationFailed(
            "Failed to generate " + std::string(key_purpose) + " X25519 key pair"));
    }
    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

KeyPairResult SodiumInterop::GenerateEd25519KeyPair() {
    auto sk_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (sk_result.IsErr()) {
        return KeyPairResult::Err(sk_result.UnwrapErr());
    }
    SecureMemoryHandle sk_handle = std::move(sk_result).Unwrap();
    std::vector<uint8_t> pk_bytes(Constants::ED_25519_PUBLIC_KEY_SIZE);

    auto generated = sk_handle.WithWriteAccess([&pk_bytes](std::span<uint8_t> sk) {
        return crypto_sign_keypair(pk_bytes.data(), sk.data()) == SodiumConstants::SUCCESS;
    });
    if (generated.IsErr()) {
        return KeyPairResult::Err(generated.UnwrapErr());
    }
    if (!generated.Unwrap()) {
        return KeyPairResult::Err(
            SodiumFailure::KeyGenerationFailed("Failed to generate Ed25519 key pair"));
    }
    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    FillRandom(buffer);
    return buffer;
}

void SodiumInterop::FillRandom(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        randombytes_buf(buffer.data(), buffer.size());
    }
}

std::vector<uint8_t> SodiumInterop::Sha256(std::span<const uint8_t> data) {
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
