#include "witnesschain/capability/capability_signer.hpp"
#include "witnesschain/identity/did_identity.hpp"
#include "witnesschain/identity/did_key.hpp"
#include "witnesschain/crypto/secure_memory_handle.hpp"
#include "witnesschain/core/constants.hpp"

#include <sodium.h>

namespace witnesschain::vault::capability {

using crypto::SecureMemoryHandle;

CapabilitySigner::CapabilitySigner(std::string did, models::Ed25519KeyPair key_pair)
    : did_(std::move(did))
    , key_pair_(std::move(key_pair)) {
}

Result<CapabilitySigner, CapabilityFailure> CapabilitySigner::FromSecretKey(
    std::span<const uint8_t> secret_key) {
    using SignerResult = Result<CapabilitySigner, CapabilityFailure>;
    if (secret_key.size() != Constants::ED_25519_SECRET_KEY_SIZE &&
        secret_key.size() != Constants::ED_25519_SEED_SIZE) {
        return SignerResult::Err(CapabilityFailure::DelegationFailed(
            "Invalid signing key length: expected 32 or 64, got " + std::to_string(secret_key.size())));
    }
    const auto seed = secret_key.first(Constants::ED_25519_SEED_SIZE);

    auto handle_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (handle_result.IsErr()) {
        return SignerResult::Err(CapabilityFailure::DelegationFailed(handle_result.UnwrapErr().message));
    }
    SecureMemoryHandle signing_key = std::move(handle_result).Unwrap();
    std::vector<uint8_t> public_key(Constants::ED_25519_PUBLIC_KEY_SIZE);
    auto seeded = signing_key.WithWriteAccess([&](std::span<uint8_t> out) {
        return crypto_sign_seed_keypair(public_key.data(), out.data(), seed.data());
    });
    if (seeded.IsErr() || seeded.Unwrap() != SodiumConstants::SUCCESS) {
        return SignerResult::Err(CapabilityFailure::DelegationFailed("Failed to derive signer from seed"));
    }
    auto did_result = identity::DidKey::FromPublicKey(public_key);
    if (did_result.IsErr()) {
        return SignerResult::Err(CapabilityFailure::DelegationFailed(did_result.UnwrapErr().message));
    }
    return SignerResult::Ok(CapabilitySigner(
        std::move(did_result).Unwrap(),
        models::Ed25519KeyPair(std::move(signing_key), std::move(public_key))));
}

Result<CapabilitySigner, CapabilityFailure> CapabilitySigner::FromIdentity(
    const identity::DidIdentity& identity) {
    auto signer = identity.GetSecretKeyHandle().WithReadAccess([](std::span<const uint8_t> sk) {
        return FromSecretKey(sk);
    });
    if (signer.IsErr()) {
        return Result<CapabilitySigner, CapabilityFailure>::Err(
            CapabilityFailure::DelegationFailed(signer.UnwrapErr().message));
    }
    return std::move(signer).Unwrap();
}

Result<std::vector<uint8_t>, CapabilityFailure> CapabilitySigner::Sign(
    std::span<const uint8_t> payload) const {
    using SignatureResult = Result<std::vector<uint8_t>, CapabilityFailure>;
    std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
    auto signed_result = key_pair_.GetSecretKeyHandle().WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto_sign_detached(signature.data(), nullptr, payload.data(), payload.size(), sk.data());
    });
    if (signed_result.IsErr() || signed_result.Unwrap() != SodiumConstants::SUCCESS) {
        return SignatureResult::Err(CapabilityFailure::DelegationFailed("Failed to sign capability"));
    }
    return SignatureResult::Ok(std::move(signature));
}

}
