#include <catch2/catch_test_macros.hpp>
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/crypto/secure_memory_handle.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "witnesschain/core/constants.hpp"
#include <algorithm>
#include <string>
#include <vector>
using namespace witnesschain::vault;
using namespace witnesschain::vault::crypto;
using witnesschain::vault::encoding::Hex;
using witnesschain::vault::encoding::AsBytes;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds and is idempotent") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
}
TEST_CASE("SodiumInterop - Wiping and comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("SecureWipe zeroes the buffer") {
        std::vector<uint8_t> buffer(100, 0xFF);
        SodiumInterop::SecureWipe(buffer);
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("ConstantTimeEquals") {
        const std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        const std::vector<uint8_t> same = {1, 2, 3, 4, 5};
        const std::vector<uint8_t> different = {1, 2, 3, 4, 6};
        const std::vector<uint8_t> shorter = {1, 2, 3, 4};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, same));
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, different));
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, shorter));
    }
}
TEST_CASE("SodiumInterop - Hashing and randomness", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("SHA-256 of \"abc\"") {
        const std::string input = "abc";
        const auto digest = SodiumInterop::Sha256(AsBytes(input));
        REQUIRE(digest.size() == Constants::SHA_256_DIGEST_SIZE);
        REQUIRE(Hex::Encode(digest) ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }
    SECTION("Random bytes differ between calls") {
        const auto a = SodiumInterop::GetRandomBytes(32);
        const auto b = SodiumInterop::GetRandomBytes(32);
        REQUIRE(a.size() == 32);
        REQUIRE(a != b);
    }
}
TEST_CASE("SodiumInterop - Key pair generation", "[sodium][crypto][keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("X25519 pair") {
        auto result = SodiumInterop::GenerateX25519KeyPair("test");
        REQUIRE(result.IsOk());
        auto& [secret, public_key] = result.Unwrap();
        REQUIRE(secret.Size() == Constants::X_25519_PRIVATE_KEY_SIZE);
        REQUIRE(public_key.size() == Constants::X_25519_PUBLIC_KEY_SIZE);
    }
    SECTION("Ed25519 pair embeds the public key in the secret key") {
        auto result = SodiumInterop::GenerateEd25519KeyPair();
        REQUIRE(result.IsOk());
        auto& [secret, public_key] = result.Unwrap();
        REQUIRE(secret.Size() == Constants::ED_25519_SECRET_KEY_SIZE);
        auto bytes = secret.ReadBytes(Constants::ED_25519_SECRET_KEY_SIZE).Unwrap();
        REQUIRE(std::equal(public_key.begin(), public_key.end(), bytes.begin() + 32));
    }
}
