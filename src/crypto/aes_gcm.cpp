#include "witnesschain/crypto/aes_gcm.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/core/constants.hpp"
#include "witnesschain/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <optional>
namespace witnesschain::vault::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    std::optional<CryptoFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return CryptoFailure::InvalidInput(
                compat::format("AES-256-GCM key must be {} bytes, got {}",
                    Constants::AES_KEY_SIZE, key.size()));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return CryptoFailure::InvalidInput(
                compat::format("AES-GCM IV must be {} bytes, got {}",
                    Constants::AES_GCM_NONCE_SIZE, nonce.size()));
        }
        return std::nullopt;
    }
    template<typename InitFn, typename UpdateFn>
    std::optional<CryptoFailure> InitializeContext(
        EVP_CIPHER_CTX* ctx,
        InitFn init,
        UpdateFn update,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data) {
        if (init(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
            return CryptoFailure::Backend(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError()));
        }
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN,
                               static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
            return CryptoFailure::Backend(
                compat::format("Failed to set IV length: {}", GetOpenSSLError()));
        }
        if (init(ctx, nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
            return CryptoFailure::Backend(
                compat::format("Failed to set key and IV: {}", GetOpenSSLError()));
        }
        if (!associated_data.empty()) {
            int outlen = 0;
            if (update(ctx, nullptr, &outlen, associated_data.data(),
                       static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
                return CryptoFailure::Backend(
                    compat::format("Failed to add associated data: {}", GetOpenSSLError()));
            }
        }
        return std::nullopt;
    }
}
Result<std::vector<uint8_t>, CryptoFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = ValidateKeyAndNonce(key, nonce)) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(*invalid));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Backend(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (auto failure = InitializeContext(ctx.get(), EVP_EncryptInit_ex, EVP_EncryptUpdate,
                                         key, nonce, associated_data)) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(*failure));
    }
    std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Backend(
                compat::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Backend(
                compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Backend(
                compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + Constants::AES_GCM_TAG_SIZE);
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(output));
}
Result<SecureMemoryHandle, CryptoFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = ValidateKeyAndNonce(key, nonce)) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(*invalid));
    }
    if (ciphertext_with_tag.size() <= Constants::AES_GCM_TAG_SIZE) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("Ciphertext too small: {} bytes (must exceed the {}-byte tag)",
                    ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::Backend(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (auto failure = InitializeContext(ctx.get(), EVP_DecryptInit_ex, EVP_DecryptUpdate,
                                         key, nonce, associated_data)) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(*failure));
    }
    auto output_result = SecureMemoryHandle::Allocate(ciphertext_len);
    if (output_result.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(output_result.UnwrapErr()));
    }
    auto output = std::move(output_result).Unwrap();
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    auto decrypted = output.WithWriteAccess([&](std::span<uint8_t> plaintext) -> std::optional<CryptoFailure> {
        int plaintext_len = 0;
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &plaintext_len,
                             ciphertext.data(),
                             static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
            return CryptoFailure::Backend(
                compat::format("Decryption failed: {}", GetOpenSSLError()));
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                               static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                               tag_copy.data()) != OpenSSL::SUCCESS) {
            return CryptoFailure::Backend(
                compat::format("Failed to set authentication tag: {}", GetOpenSSLError()));
        }
        int final_len = 0;
        if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
            SodiumInterop::SecureWipe(plaintext);
            return CryptoFailure::AuthenticationFailed(
                "Authentication tag verification failed");
        }
        return std::nullopt;
    });
    if (decrypted.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(decrypted.UnwrapErr()));
    }
    if (auto failure = std::move(decrypted).Unwrap()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(*failure));
    }
    return Result<SecureMemoryHandle, CryptoFailure>::Ok(std::move(output));
}
}
