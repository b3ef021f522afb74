#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace witnesschain::vault::identity {

/**
 * did:key codec for Ed25519 public keys:
 * "did:key:z" + base58btc(0xed 0x01 || public key).
 */
class DidKey {
public:
    static Result<std::string, IdentityFailure> FromPublicKey(std::span<const uint8_t> public_key);

    /// Extracts the 32-byte public key; fails on prefix, alphabet, multicodec or length.
    static Result<std::vector<uint8_t>, IdentityFailure> ToPublicKey(std::string_view did);

    static Result<std::string, IdentityFailure> ToPublicKeyBase64(std::string_view did);

    static bool IsValid(std::string_view candidate) noexcept;

    /// Lower-hex SHA-256 of the DID string; stable and filename-safe.
    static std::string ToIdentifier(std::string_view did);

private:
    DidKey() = delete;
};

}
