#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/crypto/secure_memory_handle.hpp"
#include "witnesschain/models/key_materials/ed25519_key_pair.hpp"
#include "witnesschain/models/key_materials/x25519_key_pair.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace witnesschain::vault::identity {

struct RestoredDid {
    std::string did;
    std::vector<uint8_t> public_key;
};

/**
 * A did:key identity that owns its Ed25519 signing key.
 *
 * The secret key lives in a SecureMemoryHandle and is wiped when the
 * identity is destroyed. Identities are move-only.
 *
 * The static overloads operate on raw secret-key bytes supplied by the
 * caller, who keeps ownership of them.
 */
class DidIdentity {
public:
    [[nodiscard]] static Result<DidIdentity, IdentityFailure> Generate();

    /// Takes ownership of a 64-byte secret key, checking it is internally consistent.
    [[nodiscard]] static Result<DidIdentity, IdentityFailure> FromSecretKey(
        crypto::SecureMemoryHandle secret_key);

    [[nodiscard]] static Result<DidIdentity, IdentityFailure> FromSecretKey(
        std::span<const uint8_t> secret_key);

    /// Pure: recomputes DID and public key from the public-key suffix of secret_key.
    [[nodiscard]] static Result<RestoredDid, IdentityFailure> Restore(
        std::span<const uint8_t> secret_key);

    /// Detached Ed25519 signature, base64-encoded.
    [[nodiscard]] static Result<std::string, IdentityFailure> Sign(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> message);

    /// Fails closed: any malformed input yields false.
    [[nodiscard]] static bool Verify(
        std::string_view did,
        std::string_view signature_base64,
        std::span<const uint8_t> message) noexcept;

    [[nodiscard]] static Result<models::X25519KeyPair, IdentityFailure> DeriveEncryptionKeyPair(
        std::span<const uint8_t> signing_secret_key);

    [[nodiscard]] static Result<std::string, IdentityFailure> EncryptionPublicKeyBase64(
        std::span<const uint8_t> signing_secret_key);

    /// Random X25519 pair with no relation to any signing key.
    [[nodiscard]] static Result<models::X25519KeyPair, IdentityFailure> GenerateEncryptionKeyPair();

    [[nodiscard]] Result<std::string, IdentityFailure> Sign(std::span<const uint8_t> message) const;

    [[nodiscard]] Result<models::X25519KeyPair, IdentityFailure> DeriveEncryptionKeyPair() const;

    [[nodiscard]] const std::string& GetDid() const noexcept { return did_; }

    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return key_pair_.GetPublicKey();
    }

    [[nodiscard]] std::string GetPublicKeyBase64() const;

    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return key_pair_.GetSecretKeyHandle();
    }

    [[nodiscard]] crypto::SecureMemoryHandle TakeSecretKeyHandle() && {
        return std::move(key_pair_).TakeSecretKeyHandle();
    }

    DidIdentity(DidIdentity&&) noexcept = default;
    DidIdentity& operator=(DidIdentity&&) noexcept = default;
    DidIdentity(const DidIdentity&) = delete;
    DidIdentity& operator=(const DidIdentity&) = delete;

private:
    DidIdentity(std::string did, models::Ed25519KeyPair key_pair);

    std::string did_;
    models::Ed25519KeyPair key_pair_;
};

}
