#include <catch2/catch_test_macros.hpp>
#include "witnesschain/encryption/hybrid_file_cipher.hpp"
#include "witnesschain/identity/did_identity.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "witnesschain/core/constants.hpp"
#include <sodium.h>
#include <string>
#include <vector>
using namespace witnesschain::vault;
using namespace witnesschain::vault::encryption;
using witnesschain::vault::crypto::SodiumInterop;
using witnesschain::vault::encoding::AsBytes;
using witnesschain::vault::encoding::Base64;
using witnesschain::vault::identity::DidIdentity;
namespace {
struct Recipient {
    models::X25519KeyPair key_pair;
    std::vector<uint8_t> secret;
    std::string public_key_base64;
};
Recipient MakeRecipient() {
    auto key_pair = DidIdentity::GenerateEncryptionKeyPair().Unwrap();
    auto secret = key_pair.GetSecretKeyHandle().ReadBytes(Constants::X_25519_PRIVATE_KEY_SIZE).Unwrap();
    auto public_key = Base64::Encode(key_pair.GetPublicKey());
    return Recipient{std::move(key_pair), std::move(secret), std::move(public_key)};
}
std::vector<uint8_t> UnwrapFileKey(const EncryptedFilePayload& payload, const std::vector<uint8_t>& secret) {
    const auto wrapped = Base64::Decode(payload.encrypted_key).value();
    const auto ephemeral = Base64::Decode(payload.ephemeral_public_key).value();
    const auto nonce = Base64::Decode(payload.key_nonce).value();
    std::vector<uint8_t> file_key(wrapped.size() - crypto_box_MACBYTES);
    REQUIRE(crypto_box_open_easy(file_key.data(), wrapped.data(), wrapped.size(), nonce.data(),
                                 ephemeral.data(), secret.data()) == 0);
    return file_key;
}
}
TEST_CASE("HybridFileCipher - Encrypt and decrypt", "[encryption]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto recipient = MakeRecipient();
    const std::vector<uint8_t> file = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};
    SECTION("Payload layout") {
        const auto payload = HybridFileCipher::Encrypt(file, recipient.public_key_base64).Unwrap();
        REQUIRE(payload.encrypted_data.size() == file.size() + Constants::POLY1305_TAG_SIZE);
        REQUIRE(Base64::Decode(payload.encrypted_key)->size() ==
                Constants::SYMMETRIC_KEY_SIZE + Constants::POLY1305_TAG_SIZE);
        REQUIRE(Base64::Decode(payload.ephemeral_public_key)->size() == Constants::X_25519_PUBLIC_KEY_SIZE);
        REQUIRE(Base64::Decode(payload.file_nonce)->size() == Constants::XSALSA20_NONCE_SIZE);
        REQUIRE(Base64::Decode(payload.key_nonce)->size() == Constants::XSALSA20_NONCE_SIZE);
        REQUIRE(payload.original_size == file.size());
        REQUIRE(payload.content_hash == HybridFileCipher::HashContent(file));
    }
    SECTION("Recipient recovers the plaintext and the hash matches") {
        const auto payload = HybridFileCipher::Encrypt(file, recipient.public_key_base64).Unwrap();
        const auto plaintext = HybridFileCipher::Decrypt(
            DecryptionParams::FromPayload(payload, recipient.secret)).Unwrap();
        REQUIRE(plaintext == file);
        REQUIRE(HybridFileCipher::VerifyContentHash(plaintext, payload.content_hash));
    }
    SECTION("Every encryption uses fresh keys and nonces") {
        const auto first = HybridFileCipher::Encrypt(file, recipient.public_key_base64).Unwrap();
        const auto second = HybridFileCipher::Encrypt(file, recipient.public_key_base64).Unwrap();
        REQUIRE(first.encrypted_data != second.encrypted_data);
        REQUIRE(first.ephemeral_public_key != second.ephemeral_public_key);
        REQUIRE(first.file_nonce != second.file_nonce);
        REQUIRE(first.key_nonce != second.key_nonce);
        REQUIRE(first.content_hash == second.content_hash);
    }
    SECTION("File key is freshly generated for each file") {
        const auto first = HybridFileCipher::Encrypt(file, recipient.public_key_base64).Unwrap();
        const auto second = HybridFileCipher::Encrypt(file, recipient.public_key_base64).Unwrap();
        const auto first_key = UnwrapFileKey(first, recipient.secret);
        const auto second_key = UnwrapFileKey(second, recipient.secret);
        REQUIRE(first_key.size() == Constants::SYMMETRIC_KEY_SIZE);
        REQUIRE(first_key != std::vector<uint8_t>(Constants::SYMMETRIC_KEY_SIZE, 0));
        REQUIRE(first_key != second_key);
    }
    SECTION("Key derived from a signing identity works as a recipient") {
        auto identity = DidIdentity::Generate().Unwrap();
        auto pair = identity.DeriveEncryptionKeyPair().Unwrap();
        const auto payload = HybridFileCipher::Encrypt(file, Base64::Encode(pair.GetPublicKey())).Unwrap();
        const auto secret = pair.GetSecretKeyHandle().ReadBytes(Constants::X_25519_PRIVATE_KEY_SIZE).Unwrap();
        REQUIRE(HybridFileCipher::Decrypt(DecryptionParams::FromPayload(payload, secret)).Unwrap() == file);
    }
}
TEST_CASE("HybridFileCipher - Encryption input errors", "[encryption]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto recipient = MakeRecipient();
    const std::vector<uint8_t> file = {1, 2, 3};
    SECTION("Empty file") {
        const std::vector<uint8_t> empty;
        auto result = HybridFileCipher::Encrypt(empty, recipient.public_key_base64);
        REQUIRE(result.UnwrapErr().Code() == "ENCRYPT_EMPTY_FILE");
    }
    SECTION("Missing key") {
        REQUIRE(HybridFileCipher::Encrypt(file, "").UnwrapErr().Code() == "ENCRYPT_NO_KEY");
    }
    SECTION("Malformed or wrong-length key") {
        REQUIRE(HybridFileCipher::Encrypt(file, "%%%").UnwrapErr().Code() == "ENCRYPT_INVALID_KEY");
        const auto short_key = Base64::Encode(std::vector<uint8_t>(16, 0x01));
        REQUIRE(HybridFileCipher::Encrypt(file, short_key).UnwrapErr().Code() == "ENCRYPT_INVALID_KEY");
    }
}
TEST_CASE("HybridFileCipher - Decryption errors", "[encryption]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto recipient = MakeRecipient();
    const std::vector<uint8_t> file(64, 0x42);
    const auto payload = HybridFileCipher::Encrypt(file, recipient.public_key_base64).Unwrap();
    auto params = DecryptionParams::FromPayload(payload, recipient.secret);
    SECTION("Empty data") {
        params.encrypted_data = {};
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().Code() == "DECRYPT_EMPTY_DATA");
    }
    SECTION("Secret key of the wrong length") {
        const std::vector<uint8_t> short_secret(31, 0x01);
        params.recipient_secret_key = short_secret;
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().Code() == "DECRYPT_INVALID_KEY");
    }
    SECTION("Fields that are not base64") {
        params.file_nonce = "***";
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().Code() == "DECRYPT_INVALID_FORMAT");
    }
    SECTION("Nonce of the wrong length") {
        const auto short_nonce = Base64::Encode(std::vector<uint8_t>(12, 0x00));
        params.key_nonce = short_nonce;
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().Code() == "DECRYPT_INVALID_NONCE");
    }
    SECTION("Another recipient is denied access") {
        const auto stranger = MakeRecipient();
        params.recipient_secret_key = stranger.secret;
        auto result = HybridFileCipher::Decrypt(params);
        REQUIRE(result.UnwrapErr().Code() == "DECRYPT_KEY_FAILED");
        REQUIRE(result.UnwrapErr().IsAccessDenied());
        REQUIRE(result.UnwrapErr().message == "Failed to decrypt file key. Access denied or data corrupted.");
    }
    SECTION("Corrupted body after a successful unwrap") {
        auto corrupted = payload.encrypted_data;
        corrupted[5] ^= 0x01;
        params.encrypted_data = corrupted;
        auto result = HybridFileCipher::Decrypt(params);
        REQUIRE(result.UnwrapErr().Code() == "DECRYPT_FILE_FAILED");
        REQUIRE(result.UnwrapErr().message == "Failed to decrypt file. Data may be corrupted.");
    }
}
TEST_CASE("HybridFileCipher - Content hash", "[encryption][hash]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("0x-prefixed lower-hex SHA-256") {
        REQUIRE(HybridFileCipher::HashContent(AsBytes("abc")) ==
                "0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }
    SECTION("Verification ignores case but not content") {
        const auto data = AsBytes("abc");
        REQUIRE(HybridFileCipher::VerifyContentHash(
            data, "0xBA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
        REQUIRE_FALSE(HybridFileCipher::VerifyContentHash(AsBytes("abd"), HybridFileCipher::HashContent(data)));
        REQUIRE_FALSE(HybridFileCipher::VerifyContentHash(
            data, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    }
}
TEST_CASE("EncryptedUpload - Envelope serialization", "[encryption][envelope]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto recipient = MakeRecipient();
    const std::vector<uint8_t> file(100, 0x07);
    SECTION("Parsed envelope decrypts") {
        const auto upload = HybridFileCipher::EncryptForUpload(
            file, recipient.public_key_base64, "image/jpeg", "photo.jpg").Unwrap();
        const auto bytes = upload.Serialize();
        const auto parsed = EncryptedUpload::Parse(AsBytes(bytes)).Unwrap();
        REQUIRE(parsed.mime_type == "image/jpeg");
        REQUIRE(parsed.file_name == "photo.jpg");
        REQUIRE(parsed.payload.content_hash == upload.payload.content_hash);
        REQUIRE(HybridFileCipher::Decrypt(
            DecryptionParams::FromPayload(parsed.payload, recipient.secret)).Unwrap() == file);
    }
    SECTION("Garbage is an invalid format") {
        const std::vector<uint8_t> garbage = {0xFF, 0xFF};
        REQUIRE(EncryptedUpload::Parse(garbage).UnwrapErr().Code() == "DECRYPT_INVALID_FORMAT");
        REQUIRE(EncryptedUpload::Parse({}).IsErr());
    }
}
