#include "witnesschain/identity/did_identity.hpp"
#include "witnesschain/identity/did_key.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "witnesschain/core/constants.hpp"
#include "witnesschain/debug/audit_log.hpp"

#include <sodium.h>
#include <exception>
#include <optional>

namespace witnesschain::vault::identity {

using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;

namespace {
std::optional<IdentityFailure> CheckSecretKeyLength(const size_t size) {
    if (size != Constants::ED_25519_SECRET_KEY_SIZE) {
        return IdentityFailure::InvalidKeyLength(
            "Invalid Ed25519 secret key length: expected " +
            std::to_string(Constants::ED_25519_SECRET_KEY_SIZE) + ", got " + std::to_string(size));
    }
    return std::nullopt;
}
}

DidIdentity::DidIdentity(std::string did, models::Ed25519KeyPair key_pair)
    : did_(std::move(did))
    , key_pair_(std::move(key_pair)) {
}

Result<DidIdentity, IdentityFailure> DidIdentity::Generate() {
    auto key_pair_result = SodiumInterop::GenerateEd25519KeyPair();
    if (key_pair_result.IsErr()) {
        return Result<DidIdentity, IdentityFailure>::Err(
            IdentityFailure::KeyGeneration(key_pair_result.UnwrapErr().message));
    }
    auto [secret_key, public_key] = std::move(key_pair_result).Unwrap();
    auto did_result = DidKey::FromPublicKey(public_key);
    if (did_result.IsErr()) {
        return Result<DidIdentity, IdentityFailure>::Err(did_result.UnwrapErr());
    }
    std::string did = std::move(did_result).Unwrap();
    WC_LOG_SUBJECT(debug::Component::Identity, "GENERATED", did);
    return Result<DidIdentity, IdentityFailure>::Ok(DidIdentity(
        std::move(did),
        models::Ed25519KeyPair(std::move(secret_key), std::move(public_key))));
}

Result<DidIdentity, IdentityFailure> DidIdentity::FromSecretKey(SecureMemoryHandle secret_key) {
    if (auto invalid = CheckSecretKeyLength(secret_key.Size())) {
        return Result<DidIdentity, IdentityFailure>::Err(std::move(*invalid));
    }
    auto seed_keypair = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (seed_keypair.IsErr()) {
        return Result<DidIdentity, IdentityFailure>::Err(
            IdentityFailure::FromSodiumFailure(seed_keypair.UnwrapErr()));
    }
    auto rederived_secret = std::move(seed_keypair).Unwrap();
    std::vector<uint8_t> rederived_public(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> stored_public;

    auto consistent = secret_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        stored_public.assign(sk.begin() + Constants::ED_25519_SEED_SIZE, sk.end());
        auto seeded = rederived_secret.WithWriteAccess([&](std::span<uint8_t> out) {
            return crypto_sign_seed_keypair(rederived_public.data(), out.data(), sk.data());
        });
        return seeded.IsOk() && seeded.Unwrap() == SodiumConstants::SUCCESS &&
               SodiumInterop::ConstantTimeEquals(rederived_public, stored_public);
    });
    if (consistent.IsErr()) {
        return Result<DidIdentity, IdentityFailure>::Err(
            IdentityFailure::FromSodiumFailure(consistent.UnwrapErr()));
    }
    if (!consistent.Unwrap()) {
        return Result<DidIdentity, IdentityFailure>::Err(
            IdentityFailure::Derivation("Secret key is corrupted: public key does not match seed"));
    }
    auto did_result = DidKey::FromPublicKey(stored_public);
    if (did_result.IsErr()) {
        return Result<DidIdentity, IdentityFailure>::Err(did_result.UnwrapErr());
    }
    std::string did = std::move(did_result).Unwrap();
    WC_LOG_SUBJECT(debug::Component::Identity, "RESTORED", did);
    return Result<DidIdentity, IdentityFailure>::Ok(DidIdentity(
        std::move(did),
        models::Ed25519KeyPair(std::move(secret_key), std::move(stored_public))));
}

Result<DidIdentity, IdentityFailure> DidIdentity::FromSecretKey(std::span<const uint8_t> secret_key) {
    if (auto invalid = CheckSecretKeyLength(secret_key.size())) {
        return Result<DidIdentity, IdentityFailure>::Err(std::move(*invalid));
    }
    auto handle = SecureMemoryHandle::FromBytes(secret_key);
    if (handle.IsErr()) {
        return Result<DidIdentity, IdentityFailure>::Err(
            IdentityFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return FromSecretKey(std::move(handle).Unwrap());
}

Result<RestoredDid, IdentityFailure> DidIdentity::Restore(std::span<const uint8_t> secret_key) {
    if (auto invalid = CheckSecretKeyLength(secret_key.size())) {
        return Result<RestoredDid, IdentityFailure>::Err(std::move(*invalid));
    }
    std::vector<uint8_t> public_key(
        secret_key.begin() + Constants::ED_25519_SEED_SIZE, secret_key.end());
    return DidKey::FromPublicKey(public_key).Map([&public_key](std::string did) {
        return RestoredDid{std::move(did), std::move(public_key)};
    });
}

Result<std::string, IdentityFailure> DidIdentity::Sign(
    std::span<const uint8_t> secret_key,
    std::span<const uint8_t> message) {
    if (auto invalid = CheckSecretKeyLength(secret_key.size())) {
        return Result<std::string, IdentityFailure>::Err(std::move(*invalid));
    }
    std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
    if (crypto_sign_detached(signature.data(), nullptr, message.data(), message.size(),
                             secret_key.data()) != SodiumConstants::SUCCESS) {
        return Result<std::string, IdentityFailure>::Err(
            IdentityFailure::Signing("Ed25519 signing failed"));
    }
    return Result<std::string, IdentityFailure>::Ok(encoding::Base64::Encode(signature));
}

Result<std::string, IdentityFailure> DidIdentity::Sign(std::span<const uint8_t> message) const {
    auto signed_result = GetSecretKeyHandle().WithReadAccess([&](std::span<const uint8_t> sk) {
        return Sign(sk, message);
    });
    if (signed_result.IsErr()) {
        return Result<std::string, IdentityFailure>::Err(
            IdentityFailure::FromSodiumFailure(signed_result.UnwrapErr()));
    }
    return std::move(signed_result).Unwrap();
}

bool DidIdentity::Verify(
    std::string_view did,
    std::string_view signature_base64,
    std::span<const uint8_t> message) noexcept {
    try {
        auto public_key = DidKey::ToPublicKey(did);
        if (public_key.IsErr()) {
            return false;
        }
        auto signature = encoding::Base64::Decode(signature_base64);
        if (!signature.has_value() || signature->size() != Constants::ED_25519_SIGNATURE_SIZE) {
            return false;
        }
        return crypto_sign_verify_detached(signature->data(), message.data(), message.size(),
                                           public_key.Unwrap().data()) == SodiumConstants::SUCCESS;
    } catch (const std::exception&) {
        return false;
    }
}

Result<models::X25519KeyPair, IdentityFailure> DidIdentity::DeriveEncryptionKeyPair(
    std::span<const uint8_t> signing_secret_key) {
    using PairResult = Result<models::X25519KeyPair, IdentityFailure>;
    if (auto invalid = CheckSecretKeyLength(signing_secret_key.size())) {
        return PairResult::Err(std::move(*invalid));
    }
    auto handle_result = SecureMemoryHandle::Allocate(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (handle_result.IsErr()) {
        return PairResult::Err(IdentityFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto x_secret = std::move(handle_result).Unwrap();
    std::vector<uint8_t> x_public(Constants::X_25519_PUBLIC_KEY_SIZE);

    // SHA-512 of the 32-byte seed, clamped: the same scalar Ed25519 signs with.
    auto derived = x_secret.WithWriteAccess([&](std::span<uint8_t> out) {
        return crypto_sign_ed25519_sk_to_curve25519(out.data(), signing_secret_key.data()) ==
                   SodiumConstants::SUCCESS &&
               crypto_scalarmult_base(x_public.data(), out.data()) == SodiumConstants::SUCCESS;
    });
    if (derived.IsErr()) {
        return PairResult::Err(IdentityFailure::FromSodiumFailure(derived.UnwrapErr()));
    }
    if (!derived.Unwrap()) {
        return PairResult::Err(
            IdentityFailure::Derivation("Failed to derive X25519 key pair from signing key"));
    }
    return PairResult::Ok(models::X25519KeyPair(std::move(x_secret), std::move(x_public)));
}

Result<models::X25519KeyPair, IdentityFailure> DidIdentity::DeriveEncryptionKeyPair() const {
    auto derived = GetSecretKeyHandle().WithReadAccess([](std::span<const uint8_t> sk) {
        return DeriveEncryptionKeyPair(sk);
    });
    if (derived.IsErr()) {
        return Result<models::X25519KeyPair, IdentityFailure>::Err(
            IdentityFailure::FromSodiumFailure(derived.UnwrapErr()));
    }
    return std::move(derived).Unwrap();
}

Result<std::string, IdentityFailure> DidIdentity::EncryptionPublicKeyBase64(
    std::span<const uint8_t> signing_secret_key) {
    return DeriveEncryptionKeyPair(signing_secret_key).Map([](models::X25519KeyPair pair) {
        return encoding::Base64::Encode(pair.GetPublicKey());
    });
}

Result<models::X25519KeyPair, IdentityFailure> DidIdentity::GenerateEncryptionKeyPair() {
    auto generated = SodiumInterop::GenerateX25519KeyPair("encryption");
    if (generated.IsErr()) {
        return Result<models::X25519KeyPair, IdentityFailure>::Err(
            IdentityFailure::KeyGeneration(generated.UnwrapErr().message));
    }
    auto [secret_key, public_key] = std::move(generated).Unwrap();
    return Result<models::X25519KeyPair, IdentityFailure>::Ok(
        models::X25519KeyPair(std::move(secret_key), std::move(public_key)));
}

std::string DidIdentity::GetPublicKeyBase64() const {
    return encoding::Base64::Encode(GetPublicKey());
}

}
