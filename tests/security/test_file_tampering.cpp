#include <catch2/catch_test_macros.hpp>
#include "witnesschain/encryption/hybrid_file_cipher.hpp"
#include "witnesschain/identity/did_identity.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "witnesschain/core/constants.hpp"
#include <string>
#include <vector>

using namespace witnesschain::vault;
using namespace witnesschain::vault::encryption;
using witnesschain::vault::crypto::SodiumInterop;
using witnesschain::vault::encoding::Base64;
using witnesschain::vault::identity::DidIdentity;

namespace {
std::string FlipBase64Byte(const std::string& field, const size_t index) {
    auto bytes = Base64::Decode(field).value();
    bytes[index % bytes.size()] ^= 0x01;
    return Base64::Encode(bytes);
}
}

TEST_CASE("File Security - Every tampered field is detected", "[security][encryption][critical]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto identity = DidIdentity::Generate().Unwrap();
    auto key_pair = identity.DeriveEncryptionKeyPair().Unwrap();
    const auto secret = key_pair.ExportSecretKey().Unwrap();
    const std::vector<uint8_t> file(4096, 0x5C);
    const auto payload = HybridFileCipher::Encrypt(file, Base64::Encode(key_pair.GetPublicKey())).Unwrap();

    SECTION("Every single-bit flip in the body is rejected") {
        for (size_t i = 0; i < payload.encrypted_data.size(); i += 97) {
            auto corrupted = payload.encrypted_data;
            corrupted[i] ^= 0x80;
            auto params = DecryptionParams::FromPayload(payload, secret);
            params.encrypted_data = corrupted;
            REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().type ==
                    EncryptionFailureType::ContentDecryptFailed);
        }
    }

    SECTION("Truncated body") {
        const std::vector<uint8_t> truncated(payload.encrypted_data.begin(), payload.encrypted_data.end() - 1);
        auto params = DecryptionParams::FromPayload(payload, secret);
        params.encrypted_data = truncated;
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().type == EncryptionFailureType::ContentDecryptFailed);

        const std::vector<uint8_t> tag_only(payload.encrypted_data.begin(),
                                            payload.encrypted_data.begin() + Constants::POLY1305_TAG_SIZE);
        params.encrypted_data = tag_only;
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().type == EncryptionFailureType::ContentDecryptFailed);
    }

    SECTION("Wrapped key, ephemeral key and key nonce protect the file key") {
        for (size_t i = 0; i < 48; i += 7) {
            const auto wrapped = FlipBase64Byte(payload.encrypted_key, i);
            auto params = DecryptionParams::FromPayload(payload, secret);
            params.encrypted_key = wrapped;
            REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().type == EncryptionFailureType::KeyUnwrapFailed);
        }

        const auto ephemeral = FlipBase64Byte(payload.ephemeral_public_key, 3);
        auto params = DecryptionParams::FromPayload(payload, secret);
        params.ephemeral_public_key = ephemeral;
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().type == EncryptionFailureType::KeyUnwrapFailed);

        const auto key_nonce = FlipBase64Byte(payload.key_nonce, 11);
        params = DecryptionParams::FromPayload(payload, secret);
        params.key_nonce = key_nonce;
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().type == EncryptionFailureType::KeyUnwrapFailed);
    }

    SECTION("File nonce binds the body") {
        const auto file_nonce = FlipBase64Byte(payload.file_nonce, 0);
        auto params = DecryptionParams::FromPayload(payload, secret);
        params.file_nonce = file_nonce;
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().type == EncryptionFailureType::ContentDecryptFailed);
    }

    SECTION("Swapping the nonces is detected") {
        auto params = DecryptionParams::FromPayload(payload, secret);
        params.file_nonce = payload.key_nonce;
        params.key_nonce = payload.file_nonce;
        REQUIRE(HybridFileCipher::Decrypt(params).IsErr());
    }

    SECTION("Wrapped key with a wrong length") {
        auto bytes = Base64::Decode(payload.encrypted_key).value();
        bytes.push_back(0x00);
        const auto longer = Base64::Encode(bytes);
        auto params = DecryptionParams::FromPayload(payload, secret);
        params.encrypted_key = longer;
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().type == EncryptionFailureType::KeyUnwrapFailed);
    }
}

TEST_CASE("File Security - Metadata cannot be mixed between files", "[security][encryption]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto identity = DidIdentity::Generate().Unwrap();
    auto key_pair = identity.DeriveEncryptionKeyPair().Unwrap();
    const auto secret = key_pair.ExportSecretKey().Unwrap();
    const auto recipient = Base64::Encode(key_pair.GetPublicKey());

    const auto first = HybridFileCipher::Encrypt(std::vector<uint8_t>(256, 0x01), recipient).Unwrap();
    const auto second = HybridFileCipher::Encrypt(std::vector<uint8_t>(256, 0x02), recipient).Unwrap();

    SECTION("Body of one file with the key material of another") {
        auto params = DecryptionParams::FromPayload(first, secret);
        params.encrypted_data = second.encrypted_data;
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().type == EncryptionFailureType::ContentDecryptFailed);
    }

    SECTION("Wrapped key of one file with the ephemeral key of another") {
        auto params = DecryptionParams::FromPayload(first, secret);
        params.ephemeral_public_key = second.ephemeral_public_key;
        REQUIRE(HybridFileCipher::Decrypt(params).UnwrapErr().type == EncryptionFailureType::KeyUnwrapFailed);
    }

    SECTION("Content hash detects a substituted plaintext") {
        const auto plaintext = HybridFileCipher::Decrypt(DecryptionParams::FromPayload(second, secret)).Unwrap();
        REQUIRE_FALSE(HybridFileCipher::VerifyContentHash(plaintext, first.content_hash));
        REQUIRE(HybridFileCipher::VerifyContentHash(plaintext, second.content_hash));
    }
}

TEST_CASE("File Security - Only the recipient can open a file", "[security][encryption][critical]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto alice = DidIdentity::Generate().Unwrap();
    auto bob = DidIdentity::Generate().Unwrap();
    auto alice_pair = alice.DeriveEncryptionKeyPair().Unwrap();
    auto bob_pair = bob.DeriveEncryptionKeyPair().Unwrap();
    const auto bob_secret = bob_pair.ExportSecretKey().Unwrap();

    const std::vector<uint8_t> file(512, 0x33);
    const auto payload = HybridFileCipher::Encrypt(file, Base64::Encode(alice_pair.GetPublicKey())).Unwrap();

    SECTION("Another identity's derived key") {
        auto result = HybridFileCipher::Decrypt(DecryptionParams::FromPayload(payload, bob_secret));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().IsAccessDenied());
    }

    SECTION("Alice's signing seed is not her decryption key") {
        const auto signing = alice.GetSecretKeyHandle().ReadBytes(Constants::ED_25519_SEED_SIZE).Unwrap();
        auto result = HybridFileCipher::Decrypt(DecryptionParams::FromPayload(payload, signing));
        REQUIRE(result.UnwrapErr().type == EncryptionFailureType::KeyUnwrapFailed);
    }

    SECTION("Tampered envelope bytes never decrypt to the original file") {
        auto upload = HybridFileCipher::EncryptForUpload(
            file, Base64::Encode(alice_pair.GetPublicKey()), "application/pdf", "report.pdf").Unwrap();
        auto bytes = upload.Serialize();
        const auto alice_secret = alice_pair.ExportSecretKey().Unwrap();
        for (size_t i = 0; i < bytes.size(); i += 31) {
            auto corrupted = bytes;
            corrupted[i] = static_cast<char>(corrupted[i] ^ 0x04);
            auto parsed = EncryptedUpload::Parse(
                std::span(reinterpret_cast<const uint8_t*>(corrupted.data()), corrupted.size()));
            if (parsed.IsErr()) {
                continue;
            }
            auto decrypted = HybridFileCipher::Decrypt(
                DecryptionParams::FromPayload(parsed.Unwrap().payload, alice_secret));
            if (decrypted.IsOk()) {
                REQUIRE(decrypted.Unwrap() == file);
            }
        }
    }
}
