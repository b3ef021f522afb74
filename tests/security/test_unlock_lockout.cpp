#include <catch2/catch_test_macros.hpp>
#include "witnesschain/keystore/secure_key_store.hpp"
#include "witnesschain/keystore/in_memory_key_record_store.hpp"
#include "witnesschain/identity/did_identity.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "helpers/fake_clock.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <string>

using namespace witnesschain::vault;
using namespace witnesschain::vault::keystore;
using witnesschain::vault::crypto::SodiumInterop;
using witnesschain::vault::identity::DidIdentity;
using witnesschain::vault::security::UnlockRateLimiter;
using witnesschain::vault::test_helpers::FakeClock;
using namespace std::chrono_literals;

TEST_CASE("Unlock Security - Brute force is throttled", "[security][rate-limit][critical]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    FakeClock clock;
    auto limiter = std::make_shared<UnlockRateLimiter>(configuration::RateLimitSettings::Default(), clock.AsClock());
    auto backend = std::make_shared<InMemoryKeyRecordStore>();
    SecureKeyStore store(backend, limiter, configuration::KeyDerivationSettings::Default(), clock.AsClock());
    auto identity = DidIdentity::Generate().Unwrap();
    const auto did = identity.GetDid();
    REQUIRE(store.Store(identity.GetSecretKeyHandle(), "correct horse", did).IsOk());

    SECTION("Fifth wrong password starts a one-minute lockout") {
        for (int i = 0; i < 4; ++i) {
            REQUIRE(store.Retrieve(did, "guess").UnwrapErr().type == KeyStoreFailureType::InvalidPassword);
        }
        REQUIRE(store.GetRateLimitStatus(did) == 0);
        REQUIRE(store.Retrieve(did, "guess").UnwrapErr().type == KeyStoreFailureType::InvalidPassword);
        REQUIRE(store.GetRateLimitStatus(did) == 60);

        auto blocked = store.Retrieve(did, "correct horse");
        REQUIRE(blocked.UnwrapErr().type == KeyStoreFailureType::RateLimited);
        REQUIRE(blocked.UnwrapErr().remaining_seconds == 60);
    }

    SECTION("Locked out attempts do not reach decryption or extend the lock") {
        for (int i = 0; i < 5; ++i) {
            (void)store.Retrieve(did, "guess");
        }
        for (int i = 0; i < 20; ++i) {
            REQUIRE(store.Retrieve(did, "guess").UnwrapErr().type == KeyStoreFailureType::RateLimited);
        }
        REQUIRE(limiter->GetState(did)->failed_attempts == 5);
        clock.Advance(30s);
        REQUIRE(store.GetRateLimitStatus(did) == 30);
    }

    SECTION("Backoff doubles and caps at one hour") {
        uint32_t expected = 60;
        for (int i = 0; i < 4; ++i) {
            (void)store.Retrieve(did, "guess");
        }
        for (int round = 0; round < 8; ++round) {
            REQUIRE(store.Retrieve(did, "guess").UnwrapErr().type == KeyStoreFailureType::InvalidPassword);
            REQUIRE(store.GetRateLimitStatus(did) == expected);
            clock.Advance(std::chrono::seconds(expected));
            expected = std::min<uint32_t>(expected * 2, 3600);
        }
        REQUIRE(limiter->LockoutForFailures(limiter->GetState(did)->failed_attempts) == 3600s);
    }

    SECTION("Correct password after the lockout clears all state") {
        for (int i = 0; i < 5; ++i) {
            (void)store.Retrieve(did, "guess");
        }
        clock.Advance(60s);
        REQUIRE(store.Retrieve(did, "correct horse").IsOk());
        REQUIRE_FALSE(limiter->GetState(did).has_value());
        REQUIRE(store.Retrieve(did, "guess").UnwrapErr().type == KeyStoreFailureType::InvalidPassword);
        REQUIRE(store.GetRateLimitStatus(did) == 0);
    }

    SECTION("Lockout applies per DID") {
        auto other = DidIdentity::Generate().Unwrap();
        REQUIRE(store.Store(other.GetSecretKeyHandle(), "other", other.GetDid()).IsOk());
        for (int i = 0; i < 5; ++i) {
            (void)store.Retrieve(did, "guess");
        }
        REQUIRE(store.Retrieve(other.GetDid(), "other").IsOk());
    }

    SECTION("Lockout is checked before the record lookup") {
        for (int i = 0; i < 5; ++i) {
            limiter->RecordFailedAttempt("did:key:zMissing");
        }
        REQUIRE(store.Retrieve("did:key:zMissing", "x").UnwrapErr().type == KeyStoreFailureType::RateLimited);
    }

    SECTION("Unknown DIDs do not accumulate failures") {
        for (int i = 0; i < 10; ++i) {
            REQUIRE(store.Retrieve("did:key:zMissing", "x").UnwrapErr().type == KeyStoreFailureType::KeyNotFound);
        }
        REQUIRE(limiter->GetTrackedCount() == 0);
    }

    SECTION("Tampered record reads as a wrong password and is throttled") {
        auto record = backend->Get(did).Unwrap().value();
        record.ciphertext[0] ^= 0x01;
        REQUIRE(backend->Put(record).IsOk());
        for (int i = 0; i < 5; ++i) {
            REQUIRE(store.Retrieve(did, "correct horse").UnwrapErr().type == KeyStoreFailureType::InvalidPassword);
        }
        REQUIRE(store.GetRateLimitStatus(did) == 60);
    }
}
