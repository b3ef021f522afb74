#include <catch2/catch_test_macros.hpp>
#include "witnesschain/identity/did_identity.hpp"
#include "witnesschain/encryption/hybrid_file_cipher.hpp"
#include "witnesschain/keystore/secure_key_store.hpp"
#include "witnesschain/keystore/file_key_record_store.hpp"
#include "witnesschain/capability/capability_authority.hpp"
#include "witnesschain/session/session_manager.hpp"
#include "witnesschain/session/in_memory_wallet_directory.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "helpers/fake_clock.hpp"
#include "helpers/mock_wallet.hpp"
#include "helpers/recording_registration_client.hpp"
#include "helpers/temp_directory.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace witnesschain::vault;
using namespace witnesschain::vault::capability;
using namespace witnesschain::vault::encryption;
using namespace witnesschain::vault::keystore;
using namespace witnesschain::vault::session;
using witnesschain::vault::crypto::SodiumInterop;
using witnesschain::vault::encoding::AsBytes;
using witnesschain::vault::encoding::Base64;
using witnesschain::vault::identity::DidIdentity;
using witnesschain::vault::security::LinkingNonceRegistry;
using witnesschain::vault::security::UnlockRateLimiter;
using namespace witnesschain::vault::test_helpers;
using namespace std::chrono_literals;

TEST_CASE("End-to-End - Evidence shared between two identities", "[integration][e2e]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    FakeClock clock;
    const TempDirectory temp;
    auto backend = std::shared_ptr<FileKeyRecordStore>(FileKeyRecordStore::Open(temp.Path() / "keys").Unwrap());
    auto limiter = std::make_shared<UnlockRateLimiter>(configuration::RateLimitSettings::Default(), clock.AsClock());
    SecureKeyStore key_store(backend, limiter, configuration::KeyDerivationSettings::Default(), clock.AsClock());
    const CapabilityAuthority authority(configuration::CapabilitySettings::Default(), clock.AsClock());

    auto alice = DidIdentity::Generate().Unwrap();
    auto bob = DidIdentity::Generate().Unwrap();
    REQUIRE(key_store.Store(alice.GetSecretKeyHandle(), "p1", alice.GetDid()).IsOk());

    const std::vector<uint8_t> evidence = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};
    const auto alice_pair = alice.DeriveEncryptionKeyPair().Unwrap();
    const auto upload = HybridFileCipher::EncryptForUpload(
        evidence, Base64::Encode(alice_pair.GetPublicKey()), "text/plain", "evidence.txt").Unwrap();
    const std::string envelope = upload.Serialize();

    SECTION("Alice unlocks her key from disk and opens her own file") {
        auto secret = key_store.Retrieve(alice.GetDid(), "p1").Unwrap();
        auto restored = DidIdentity::FromSecretKey(std::move(secret)).Unwrap();
        REQUIRE(restored.GetDid() == alice.GetDid());

        const auto parsed = EncryptedUpload::Parse(AsBytes(envelope)).Unwrap();
        const auto restored_secret = restored.DeriveEncryptionKeyPair().Unwrap().ExportSecretKey().Unwrap();
        const auto plaintext = HybridFileCipher::Decrypt(
            DecryptionParams::FromPayload(parsed.payload, restored_secret)).Unwrap();
        REQUIRE(plaintext == evidence);
        REQUIRE(HybridFileCipher::VerifyContentHash(plaintext, parsed.payload.content_hash));
        REQUIRE(parsed.file_name == "evidence.txt");
    }

    SECTION("Bob cannot open Alice's file") {
        const auto parsed = EncryptedUpload::Parse(AsBytes(envelope)).Unwrap();
        const auto bob_secret = bob.DeriveEncryptionKeyPair().Unwrap().ExportSecretKey().Unwrap();
        auto result = HybridFileCipher::Decrypt(DecryptionParams::FromPayload(parsed.payload, bob_secret));
        REQUIRE(result.UnwrapErr().Code() == "DECRYPT_KEY_FAILED");
    }

    SECTION("Capabilities gate upload and read") {
        const auto alice_signer = CapabilitySigner::FromIdentity(alice).Unwrap();
        const auto upload_cap = authority.CreateUploadCapability(alice_signer).Unwrap();
        REQUIRE(authority.CanUploadEvidence(upload_cap.token));

        const auto delegation = authority.DelegateCapability(
            alice_signer, bob.GetDid(), CapabilityAction::EvidenceRead, "ev-1", 1h).Unwrap();
        REQUIRE(authority.CheckCapability(delegation.token, CapabilityAction::EvidenceRead, "ev-1", bob.GetDid()).allowed);
        REQUIRE_FALSE(authority.CheckCapability(delegation.token, CapabilityAction::EvidenceRead, "ev-2", bob.GetDid()).allowed);

        clock.Advance(1h + 1s);
        REQUIRE_FALSE(authority.CanUploadEvidence(upload_cap.token));
        REQUIRE(authority.CheckCapability(delegation.token, CapabilityAction::EvidenceRead, "ev-1", bob.GetDid()).reason ==
                "Capability has expired");
    }

    SECTION("Key record survives a restart of the store") {
        auto reopened_backend = std::shared_ptr<FileKeyRecordStore>(
            FileKeyRecordStore::Open(backend->Directory()).Unwrap());
        SecureKeyStore reopened(reopened_backend, std::make_shared<UnlockRateLimiter>());
        REQUIRE(reopened.Exists(alice.GetDid()).Unwrap());
        REQUIRE(reopened.VerifyPassword(alice.GetDid(), "p1").Unwrap());
        REQUIRE_FALSE(reopened.VerifyPassword(alice.GetDid(), "p2").Unwrap());
    }

    SECTION("Delete removes the record from disk") {
        const auto path = backend->PathFor(alice.GetDid());
        REQUIRE(std::filesystem::exists(path));
        REQUIRE(key_store.Delete(alice.GetDid()).IsOk());
        REQUIRE_FALSE(std::filesystem::exists(path));
        REQUIRE(key_store.Retrieve(alice.GetDid(), "p1").UnwrapErr().type == KeyStoreFailureType::KeyNotFound);
    }
}

TEST_CASE("End-to-End - Wallet sign-in to shared evidence", "[integration][e2e][session]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    constexpr std::string_view wallet = "0x52908400098527886E0F7030069857D2E4169EE7";
    FakeClock clock;
    const TempDirectory temp;
    auto limiter = std::make_shared<UnlockRateLimiter>(configuration::RateLimitSettings::Default(), clock.AsClock());
    auto key_store = std::make_shared<SecureKeyStore>(
        std::shared_ptr<FileKeyRecordStore>(FileKeyRecordStore::Open(temp.Path()).Unwrap()),
        limiter, configuration::KeyDerivationSettings::Default(), clock.AsClock());
    auto directory = std::make_shared<InMemoryWalletDirectory>();
    auto server = std::make_shared<LinkingVerifier>(
        std::make_shared<MockWalletSignatureVerifier>(),
        std::make_shared<LinkingNonceRegistry>(10min, clock.AsClock()),
        configuration::SessionSettings::Default(), clock.AsClock());
    auto api = std::make_shared<RecordingRegistrationClient>(server);
    SessionManager sessions(key_store, directory, api, configuration::SessionSettings::Default(), clock.AsClock());
    MockWalletSigner signer{std::string(wallet)};

    const auto first = sessions.Authenticate(wallet, "p1", &signer).Unwrap();
    REQUIRE(first.is_new_user);
    REQUIRE(api->Requests().size() == 1);

    SECTION("Replaying the registration is refused by the server") {
        REQUIRE(server->VerifyRegistration(api->Requests()[0]).UnwrapErr().type == SessionFailureType::ReplayDetected);
    }

    SECTION("File encrypted to the announced key opens after sign-in") {
        const std::vector<uint8_t> evidence(1024, 0x42);
        const auto payload = HybridFileCipher::Encrypt(evidence, first.encryption_public_key).Unwrap();

        sessions.SignOut();
        clock.Advance(2h);
        const auto again = sessions.Authenticate(wallet, "p1").Unwrap();
        REQUIRE_FALSE(again.is_new_user);
        REQUIRE(again.did == first.did);

        auto identity = sessions.UnlockIdentity("p1").Unwrap();
        const auto secret = identity.DeriveEncryptionKeyPair().Unwrap().ExportSecretKey().Unwrap();
        REQUIRE(HybridFileCipher::Decrypt(DecryptionParams::FromPayload(payload, secret)).Unwrap() == evidence);
    }

    SECTION("Removing the user from the device forgets the wallet") {
        REQUIRE(sessions.RemoveUserFromDevice().IsOk());
        REQUIRE_FALSE(sessions.UserExistsForWallet(wallet).Unwrap());
        const auto fresh = sessions.Authenticate(wallet, "p2", &signer).Unwrap();
        REQUIRE(fresh.is_new_user);
        REQUIRE(fresh.did != first.did);
    }
}
