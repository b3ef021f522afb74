/**
 * @file basic_vault_example.cpp
 * @brief Identity, password key store, file encryption and capability delegation
 */

#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/identity/did_identity.hpp"
#include "witnesschain/encryption/hybrid_file_cipher.hpp"
#include "witnesschain/keystore/secure_key_store.hpp"
#include "witnesschain/keystore/in_memory_key_record_store.hpp"
#include "witnesschain/capability/capability_authority.hpp"
#include "witnesschain/core/result.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace witnesschain::vault;
using namespace witnesschain::vault::crypto;
using namespace witnesschain::vault::identity;
using namespace witnesschain::vault::encryption;
using namespace witnesschain::vault::keystore;
using namespace witnesschain::vault::capability;

int main() {
    std::cout << "=== WitnessChain Vault - Basic Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Generating identities for Alice and Bob..." << std::endl;
    auto alice_result = DidIdentity::Generate();
    auto bob_result = DidIdentity::Generate();
    if (alice_result.IsErr() || bob_result.IsErr()) {
        std::cerr << "Failed to generate identities" << std::endl;
        return 1;
    }
    auto alice = std::move(alice_result).Unwrap();
    auto bob = std::move(bob_result).Unwrap();
    std::cout << "   Alice: " << alice.GetDid() << std::endl;
    std::cout << "   Bob:   " << bob.GetDid() << std::endl;
    std::cout << std::endl;

    std::cout << "3. Storing Alice's key under a password..." << std::endl;
    SecureKeyStore key_store(
        std::make_shared<InMemoryKeyRecordStore>(),
        std::make_shared<security::UnlockRateLimiter>());
    if (auto stored = key_store.Store(alice.GetSecretKeyHandle(), "p1", alice.GetDid()); stored.IsErr()) {
        std::cerr << "Failed to store key: " << stored.UnwrapErr().message << std::endl;
        return 1;
    }
    auto unlocked = key_store.Retrieve(alice.GetDid(), "p1");
    if (unlocked.IsErr()) {
        std::cerr << "Failed to unlock key: " << unlocked.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Key stored and unlocked" << std::endl;
    std::cout << std::endl;

    std::cout << "4. Encrypting a file for Alice..." << std::endl;
    const std::string text = "evidence!!";
    const std::vector<uint8_t> file(text.begin(), text.end());
    auto key_pair_result = alice.DeriveEncryptionKeyPair();
    auto recipient_result = alice.GetSecretKeyHandle().WithReadAccess([](std::span<const uint8_t> sk) {
        return DidIdentity::EncryptionPublicKeyBase64(sk);
    });
    if (key_pair_result.IsErr() || recipient_result.IsErr() || recipient_result.Unwrap().IsErr()) {
        std::cerr << "Failed to derive encryption keys" << std::endl;
        return 1;
    }
    const auto& key_pair = key_pair_result.Unwrap();
    auto payload_result = HybridFileCipher::Encrypt(file, recipient_result.Unwrap().Unwrap());
    if (payload_result.IsErr()) {
        std::cerr << "Encryption failed: " << payload_result.UnwrapErr().Code() << std::endl;
        return 1;
    }
    const auto& payload = payload_result.Unwrap();
    std::cout << "   Ciphertext: " << payload.encrypted_data.size() << " bytes" << std::endl;
    std::cout << "   Content hash: " << payload.content_hash << std::endl;

    auto decrypted = key_pair.GetSecretKeyHandle().WithReadAccess([&](std::span<const uint8_t> secret) {
        return HybridFileCipher::Decrypt(DecryptionParams::FromPayload(payload, secret));
    });
    if (decrypted.IsErr() || decrypted.Unwrap().IsErr()) {
        std::cerr << "Decryption failed" << std::endl;
        return 1;
    }
    const bool hash_ok = HybridFileCipher::VerifyContentHash(decrypted.Unwrap().Unwrap(), payload.content_hash);
    std::cout << "   ✓ Decrypted, hash " << (hash_ok ? "matches" : "MISMATCH") << std::endl;
    std::cout << std::endl;

    std::cout << "5. Issuing capabilities..." << std::endl;
    auto signer_result = CapabilitySigner::FromIdentity(alice);
    if (signer_result.IsErr()) {
        std::cerr << "Failed to build signer: " << signer_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& signer = signer_result.Unwrap();
    const CapabilityAuthority authority;

    auto upload = authority.IssueSelfCapability(
        signer, CapabilityAction::EvidenceUpload, std::nullopt, std::chrono::hours(1));
    if (upload.IsErr()) {
        std::cerr << "Failed to issue upload capability: " << upload.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Upload CID: " << upload.Unwrap().cid << std::endl;
    std::cout << "   Can upload: " << std::boolalpha
              << authority.CanUploadEvidence(upload.Unwrap().token) << std::endl;

    auto delegation = authority.DelegateCapability(
        signer, bob.GetDid(), CapabilityAction::EvidenceRead, "ev-1");
    if (delegation.IsErr()) {
        std::cerr << "Failed to delegate: " << delegation.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& token = delegation.Unwrap().token;
    const auto granted = authority.CheckCapability(
        token, CapabilityAction::EvidenceRead, "ev-1", bob.GetDid());
    const auto other = authority.CheckCapability(
        token, CapabilityAction::EvidenceRead, "ev-2", bob.GetDid());
    std::cout << "   Bob reads ev-1: " << granted.allowed << std::endl;
    std::cout << "   Bob reads ev-2: " << other.allowed << " (" << other.reason << ")" << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
