#include <catch2/catch_test_macros.hpp>
#include "witnesschain/crypto/pbkdf2.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/core/constants.hpp"
#include <vector>
using namespace witnesschain::vault;
using namespace witnesschain::vault::crypto;
TEST_CASE("PBKDF2 - Password key derivation", "[pbkdf2][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> salt(Constants::PBKDF2_SALT_SIZE, 0x01);
    constexpr uint32_t iterations = Constants::PBKDF2_MIN_ITERATIONS;
    auto derive = [&](std::string_view password, std::span<const uint8_t> s) {
        return Pbkdf2::DeriveKey(password, s, iterations, Constants::AES_KEY_SIZE)
            .Unwrap()
            .ReadBytes(Constants::AES_KEY_SIZE)
            .Unwrap();
    };
    SECTION("Deterministic for the same inputs") {
        REQUIRE(derive("p1", salt) == derive("p1", salt));
    }
    SECTION("Password and salt both change the key") {
        const std::vector<uint8_t> other_salt(Constants::PBKDF2_SALT_SIZE, 0x02);
        const auto base = derive("p1", salt);
        REQUIRE(base != derive("p2", salt));
        REQUIRE(base != derive("p1", other_salt));
    }
}
TEST_CASE("PBKDF2 - Parameter validation", "[pbkdf2][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> salt(Constants::PBKDF2_SALT_SIZE, 0x01);
    SECTION("Fewer than 100000 iterations is refused") {
        auto result = Pbkdf2::DeriveKey("p1", salt, Constants::PBKDF2_MIN_ITERATIONS - 1, 32);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidInput);
    }
    SECTION("Empty salt is refused") {
        REQUIRE(Pbkdf2::DeriveKey("p1", {}, Constants::PBKDF2_MIN_ITERATIONS, 32).IsErr());
    }
    SECTION("Output size bounds") {
        REQUIRE(Pbkdf2::DeriveKey("p1", salt, Constants::PBKDF2_MIN_ITERATIONS, 0).IsErr());
        REQUIRE(Pbkdf2::DeriveKey("p1", salt, Constants::PBKDF2_MIN_ITERATIONS, Pbkdf2::MAX_OUTPUT_LEN + 1).IsErr());
    }
}
