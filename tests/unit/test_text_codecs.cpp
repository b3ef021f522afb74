#include <catch2/catch_test_macros.hpp>
#include "witnesschain/encoding/text_codecs.hpp"
#include <string>
#include <vector>
using namespace witnesschain::vault::encoding;
TEST_CASE("Text codecs - Base58", "[encoding]") {
    SECTION("Known vector") {
        REQUIRE(Base58::Encode(AsBytes("Hello World!")) == "2NEpo7TZRRrLZSi2U");
        const auto decoded = Base58::Decode("2NEpo7TZRRrLZSi2U");
        REQUIRE(decoded.has_value());
        REQUIRE(std::string(decoded->begin(), decoded->end()) == "Hello World!");
    }
    SECTION("Leading zero bytes become '1'") {
        const std::vector<uint8_t> data = {0x00, 0x00, 0x01};
        REQUIRE(Base58::Encode(data) == "112");
        REQUIRE(Base58::Decode("112") == std::optional<std::vector<uint8_t>>(data));
    }
    SECTION("Characters outside the alphabet are rejected") {
        REQUIRE_FALSE(Base58::Decode("0OIl").has_value());
        REQUIRE_FALSE(Base58::Decode("").has_value());
        REQUIRE_FALSE(Base58::Decode("2NEpo 7TZ").has_value());
    }
}
TEST_CASE("Text codecs - Base64, Base32 and hex", "[encoding]") {
    SECTION("Base64 standard alphabet with padding") {
        REQUIRE(Base64::Encode(AsBytes("foobar")) == "Zm9vYmFy");
        REQUIRE(Base64::Encode(AsBytes("fo")) == "Zm8=");
        const auto decoded = Base64::Decode("Zm8=");
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->size() == 2);
    }
    SECTION("Base64 rejects foreign characters") {
        REQUIRE_FALSE(Base64::Decode("Zm9v!mFy").has_value());
        REQUIRE_FALSE(Base64::Decode("Zm9vYmFy-_").has_value());
    }
    SECTION("Base32 lower-case, unpadded") {
        REQUIRE(Base32::EncodeLower(AsBytes("foobar")) == "mzxw6ytboi");
        REQUIRE(Base32::EncodeLower(AsBytes("f")) == "my");
    }
    SECTION("Hex") {
        const std::vector<uint8_t> data = {0xDE, 0xAD, 0xBE, 0xEF};
        REQUIRE(Hex::Encode(data) == "deadbeef");
        REQUIRE(Hex::Decode("DEADbeef") == std::optional<std::vector<uint8_t>>(data));
        REQUIRE_FALSE(Hex::Decode("abc").has_value());
        REQUIRE_FALSE(Hex::Decode("zz").has_value());
        REQUIRE(Hex::EqualsIgnoreCase("0xABcd", "0xabCD"));
        REQUIRE_FALSE(Hex::EqualsIgnoreCase("0xab", "0xabc"));
    }
}
