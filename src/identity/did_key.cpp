#include "witnesschain/identity/did_key.hpp"
#include "witnesschain/core/constants.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/encoding/text_codecs.hpp"

#include <new>

namespace witnesschain::vault::identity {

using encoding::Base58;

Result<std::string, IdentityFailure> DidKey::FromPublicKey(std::span<const uint8_t> public_key) {
    if (public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return Result<std::string, IdentityFailure>::Err(
            IdentityFailure::InvalidKeyLength(
                "Invalid Ed25519 public key length: expected " +
                std::to_string(Constants::ED_25519_PUBLIC_KEY_SIZE) +
                ", got " + std::to_string(public_key.size())));
    }
    std::vector<uint8_t> multicodec;
    multicodec.reserve(DidConstants::MULTICODEC_PREFIX_SIZE + public_key.size());
    multicodec.push_back(DidConstants::ED_25519_MULTICODEC_0);
    multicodec.push_back(DidConstants::ED_25519_MULTICODEC_1);
    multicodec.insert(multicodec.end(), public_key.begin(), public_key.end());
    return Result<std::string, IdentityFailure>::Ok(
        std::string(DidConstants::DID_KEY_PREFIX) + Base58::Encode(multicodec));
}

Result<std::vector<uint8_t>, IdentityFailure> DidKey::ToPublicKey(std::string_view did) {
    using KeyResult = Result<std::vector<uint8_t>, IdentityFailure>;
    if (!did.starts_with(DidConstants::DID_KEY_PREFIX)) {
        return KeyResult::Err(IdentityFailure::InvalidDid(
            "Invalid DID format: expected did:key:z prefix"));
    }
    const std::string_view identifier = did.substr(DidConstants::DID_KEY_PREFIX.size());
    if (identifier.size() > DidConstants::MAX_IDENTIFIER_LENGTH) {
        return KeyResult::Err(IdentityFailure::InvalidDid(
            "Invalid DID format: identifier is too long"));
    }
    auto decoded = Base58::Decode(identifier);
    if (!decoded.has_value()) {
        return KeyResult::Err(IdentityFailure::InvalidDid(
            "Invalid DID format: identifier is not base58btc"));
    }
    const auto& bytes = *decoded;
    if (bytes.size() != DidConstants::MULTICODEC_PREFIX_SIZE + Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return KeyResult::Err(IdentityFailure::InvalidDid(
            "Invalid DID public key length: expected " +
            std::to_string(Constants::ED_25519_PUBLIC_KEY_SIZE) + ", got " +
            std::to_string(bytes.size() < DidConstants::MULTICODEC_PREFIX_SIZE
                ? 0 : bytes.size() - DidConstants::MULTICODEC_PREFIX_SIZE)));
    }
    if (bytes[0] != DidConstants::ED_25519_MULTICODEC_0 ||
        bytes[1] != DidConstants::ED_25519_MULTICODEC_1) {
        return KeyResult::Err(IdentityFailure::InvalidDid(
            "Invalid DID multicodec: not an Ed25519 public key"));
    }
    return KeyResult::Ok(std::vector<uint8_t>(
        bytes.begin() + DidConstants::MULTICODEC_PREFIX_SIZE, bytes.end()));
}

Result<std::string, IdentityFailure> DidKey::ToPublicKeyBase64(std::string_view did) {
    return ToPublicKey(did).Map([](std::vector<uint8_t> key) {
        return encoding::Base64::Encode(key);
    });
}

bool DidKey::IsValid(std::string_view candidate) noexcept {
    if (candidate.empty()) {
        return false;
    }
    try {
        return ToPublicKey(candidate).IsOk();
    } catch (const std::bad_alloc&) {
        return false;
    }
}

std::string DidKey::ToIdentifier(std::string_view did) {
    return encoding::Hex::Encode(crypto::SodiumInterop::Sha256(encoding::AsBytes(did)));
}

}
