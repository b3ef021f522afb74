#include "witnesschain/crypto/pbkdf2.hpp"
#include "witnesschain/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <optional>

namespace witnesschain::vault::crypto {

namespace {
struct EVP_KDF_Deleter {
    void operator()(EVP_KDF* kdf) const {
        if (kdf) {
            EVP_KDF_free(kdf);
        }
    }
};
struct EVP_KDF_CTX_Deleter {
    void operator()(EVP_KDF_CTX* ctx) const {
        if (ctx) {
            EVP_KDF_CTX_free(ctx);
        }
    }
};
using EVP_KDF_ptr = std::unique_ptr<EVP_KDF, EVP_KDF_Deleter>;
using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
}

Result<SecureMemoryHandle, CryptoFailure> Pbkdf2::DeriveKey(
    std::string_view password,
    std::span<const uint8_t> salt,
    const uint32_t iterations,
    const size_t output_size) {

    if (output_size == 0 || output_size > MAX_OUTPUT_LEN) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                "PBKDF2 output size must be between 1 and " + std::to_string(MAX_OUTPUT_LEN) +
                ", got " + std::to_string(output_size)));
    }
    if (salt.empty()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::InvalidInput("PBKDF2 salt cannot be empty"));
    }
    if (iterations < Constants::PBKDF2_MIN_ITERATIONS) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                "PBKDF2 requires at least " + std::to_string(Constants::PBKDF2_MIN_ITERATIONS) +
                " iterations, got " + std::to_string(iterations)));
    }

    EVP_KDF_ptr kdf(EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_PBKDF2.data(), nullptr));
    if (!kdf) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::DeriveKey("Failed to fetch PBKDF2 algorithm"));
    }
    EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf.get()));
    if (!kctx) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::DeriveKey("Failed to create PBKDF2 context"));
    }

    auto output_result = SecureMemoryHandle::Allocate(output_size);
    if (output_result.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(output_result.UnwrapErr()));
    }
    auto output = std::move(output_result).Unwrap();

    unsigned int iteration_count = iterations;
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(
            OpenSSLConstants::PARAM_DIGEST.data(),
            const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0),
        OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_PASSWORD.data(),
            const_cast<char*>(password.data()), password.size()),
        OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_SALT.data(),
            const_cast<uint8_t*>(salt.data()), salt.size()),
        OSSL_PARAM_construct_uint(
            OpenSSLConstants::PARAM_ITERATIONS.data(), &iteration_count),
        OSSL_PARAM_construct_end()
    };

    auto derived = output.WithWriteAccess([&](std::span<uint8_t> key) {
        return EVP_KDF_derive(kctx.get(), key.data(), key.size(), params);
    });
    if (derived.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(derived.UnwrapErr()));
    }
    if (derived.Unwrap() != OpenSSLConstants::SUCCESS) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::DeriveKey("PBKDF2 key derivation failed"));
    }
    return Result<SecureMemoryHandle, CryptoFailure>::Ok(std::move(output));
}

}
