#include <catch2/catch_test_macros.hpp>
#include "witnesschain/crypto/aes_gcm.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/core/constants.hpp"
#include <vector>
using namespace witnesschain::vault;
using namespace witnesschain::vault::crypto;
TEST_CASE("AES-GCM - Sealing key records", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0xAA);
    const std::vector<uint8_t> iv(Constants::AES_GCM_NONCE_SIZE, 0xBB);
    const std::vector<uint8_t> secret(Constants::ED_25519_SECRET_KEY_SIZE, 0x5C);
    SECTION("Ciphertext carries a 16-byte tag and opens into secure memory") {
        auto sealed = AesGcm::Encrypt(key, iv, secret);
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == secret.size() + Constants::AES_GCM_TAG_SIZE);
        auto opened = AesGcm::Decrypt(key, iv, sealed.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap().Size() == secret.size());
        REQUIRE(opened.Unwrap().ReadBytes(secret.size()).Unwrap() == secret);
    }
    SECTION("Associated data must match") {
        const std::vector<uint8_t> ad = {'d', 'i', 'd'};
        auto sealed = AesGcm::Encrypt(key, iv, secret, ad).Unwrap();
        REQUIRE(AesGcm::Decrypt(key, iv, sealed, ad).IsOk());
        const std::vector<uint8_t> other = {'x'};
        auto result = AesGcm::Decrypt(key, iv, sealed, other);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::AuthenticationFailed);
    }
}
TEST_CASE("AES-GCM - Authentication failures", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0x66);
    const std::vector<uint8_t> iv(Constants::AES_GCM_NONCE_SIZE, 0x77);
    const std::vector<uint8_t> plaintext = {'s', 'e', 'c', 'r', 'e', 't'};
    const auto ciphertext = AesGcm::Encrypt(key, iv, plaintext).Unwrap();
    SECTION("Wrong key") {
        const std::vector<uint8_t> wrong_key(Constants::AES_KEY_SIZE, 0x99);
        auto result = AesGcm::Decrypt(wrong_key, iv, ciphertext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::AuthenticationFailed);
    }
    SECTION("Wrong IV") {
        const std::vector<uint8_t> wrong_iv(Constants::AES_GCM_NONCE_SIZE, 0x88);
        REQUIRE(AesGcm::Decrypt(key, wrong_iv, ciphertext).IsErr());
    }
    SECTION("Tampered ciphertext and tag") {
        auto tampered = ciphertext;
        tampered[0] ^= 0x01;
        REQUIRE(AesGcm::Decrypt(key, iv, tampered).IsErr());
        tampered = ciphertext;
        tampered.back() ^= 0x01;
        REQUIRE(AesGcm::Decrypt(key, iv, tampered).IsErr());
    }
}
TEST_CASE("AES-GCM - Input validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0x11);
    const std::vector<uint8_t> iv(Constants::AES_GCM_NONCE_SIZE, 0x22);
    const std::vector<uint8_t> plaintext = {1, 2, 3};
    SECTION("Key must be 32 bytes") {
        const std::vector<uint8_t> short_key(16, 0x11);
        auto result = AesGcm::Encrypt(short_key, iv, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidInput);
    }
    SECTION("IV must be 12 bytes") {
        const std::vector<uint8_t> long_iv(24, 0x22);
        REQUIRE(AesGcm::Encrypt(key, long_iv, plaintext).UnwrapErr().type == CryptoFailureType::InvalidInput);
    }
    SECTION("Ciphertext shorter than a tag is rejected") {
        const std::vector<uint8_t> truncated(Constants::AES_GCM_TAG_SIZE, 0x00);
        REQUIRE(AesGcm::Decrypt(key, iv, truncated).UnwrapErr().type == CryptoFailureType::InvalidInput);
    }
}
