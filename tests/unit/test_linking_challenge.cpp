#include <catch2/catch_test_macros.hpp>
#include "witnesschain/session/linking_challenge.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include <set>
#include <string>
using namespace witnesschain::vault;
using witnesschain::vault::crypto::SodiumInterop;
using witnesschain::vault::session::LinkingChallenge;
TEST_CASE("LinkingChallenge - Message text", "[session]") {
    SECTION("Challenge with nonce") {
        const auto message = LinkingChallenge::Create(
            "0xAbCdEf0123456789aBcDeF0123456789AbCdEf01", "did:key:z6MkTest", 1700000000,
            "6f1c2a9e-4b7d-4c1e-9a3f-0d2b5e8c7a61");
        REQUIRE(message ==
                "WitnessChain Identity Verification\n"
                "\n"
                "This signature links your wallet to your WitnessChain identity.\n"
                "\n"
                "Wallet: 0xabcdef0123456789abcdef0123456789abcdef01\n"
                "Identity: did:key:z6MkTest\n"
                "Timestamp: 1700000000\n"
                "Nonce: 6f1c2a9e-4b7d-4c1e-9a3f-0d2b5e8c7a61\n"
                "\n"
                "This request will not trigger a blockchain transaction or cost any gas fees.");
    }
    SECTION("Nonce line is omitted when absent or empty") {
        const auto without = LinkingChallenge::Create("0xab", "did:key:z6MkTest", 5);
        REQUIRE(without.find("Nonce:") == std::string::npos);
        REQUIRE(LinkingChallenge::Create("0xab", "did:key:z6MkTest", 5, "") == without);
        REQUIRE(without.find("Timestamp: 5\n\nThis request") != std::string::npos);
    }
    SECTION("API request message") {
        REQUIRE(LinkingChallenge::CreateAuthMessage("POST", "/evidence", 42, "did:key:z6MkTest") ==
                "WitnessChain API Request\n"
                "\n"
                "Method: POST\n"
                "Path: /evidence\n"
                "Timestamp: 42\n"
                "Identity: did:key:z6MkTest\n"
                "\n"
                "This signature authorizes this API request.");
    }
}
TEST_CASE("LinkingChallenge - Nonces", "[session]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        const auto nonce = LinkingChallenge::GenerateNonce();
        REQUIRE(nonce.size() == 36);
        REQUIRE(nonce[8] == '-');
        REQUIRE(nonce[13] == '-');
        REQUIRE(nonce[14] == '4');
        REQUIRE(nonce[18] == '-');
        REQUIRE(std::string("89ab").find(nonce[19]) != std::string::npos);
        REQUIRE(nonce[23] == '-');
        seen.insert(nonce);
    }
    REQUIRE(seen.size() == 64);
}
TEST_CASE("LinkingChallenge - Timestamp window", "[session]") {
    const int64_t now = 1700000000;
    REQUIRE(LinkingChallenge::IsValidSignatureTimestamp(now, now));
    REQUIRE(LinkingChallenge::IsValidSignatureTimestamp(now - 300, now));
    REQUIRE_FALSE(LinkingChallenge::IsValidSignatureTimestamp(now - 301, now));
    REQUIRE(LinkingChallenge::IsValidSignatureTimestamp(now + 60, now));
    REQUIRE_FALSE(LinkingChallenge::IsValidSignatureTimestamp(now + 61, now));
    configuration::SessionSettings strict;
    strict.signature_max_age = std::chrono::seconds(10);
    strict.signature_max_future_skew = std::chrono::seconds(0);
    REQUIRE_FALSE(LinkingChallenge::IsValidSignatureTimestamp(now - 11, now, strict));
    REQUIRE_FALSE(LinkingChallenge::IsValidSignatureTimestamp(now + 1, now, strict));
}
TEST_CASE("LinkingChallenge - Wallet addresses", "[session]") {
    REQUIRE(LinkingChallenge::IsValidWalletAddress("0xabcdef0123456789abcdef0123456789abcdef01"));
    REQUIRE(LinkingChallenge::IsValidWalletAddress("0xABCDEF0123456789ABCDEF0123456789ABCDEF01"));
    REQUIRE_FALSE(LinkingChallenge::IsValidWalletAddress("abcdef0123456789abcdef0123456789abcdef0123"));
    REQUIRE_FALSE(LinkingChallenge::IsValidWalletAddress("0xabcdef0123456789abcdef0123456789abcdef0"));
    REQUIRE_FALSE(LinkingChallenge::IsValidWalletAddress("0xgbcdef0123456789abcdef0123456789abcdef01"));
    REQUIRE_FALSE(LinkingChallenge::IsValidWalletAddress(""));
    REQUIRE(LinkingChallenge::NormalizeWalletAddress("0xABcd") == "0xabcd");
}
