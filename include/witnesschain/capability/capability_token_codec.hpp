#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/capability/capability_types.hpp"
#include "witnesschain/capability/capability_signer.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace witnesschain::vault::capability {

struct EncodedToken {
    std::string token;
    std::string cid;
};

/**
 * Wire form of capability tokens.
 *
 * A token is base64(SignedCapabilityToken{payload, signature}) where payload
 * is a serialized CapabilityPayload and signature is the issuer's Ed25519
 * signature over exactly those bytes. The CID is a CIDv1 (raw codec,
 * sha2-256 multihash) over the decoded token bytes, multibase base32.
 *
 * Decoding verifies the signature before any claim is returned; a token
 * that decodes without a valid signature is never exposed.
 */
class CapabilityTokenCodec {
public:
    [[nodiscard]] static Result<EncodedToken, CapabilityFailure> Encode(
        const CapabilityClaims& claims,
        const CapabilitySigner& signer);

    [[nodiscard]] static Result<CapabilityClaims, CapabilityFailure> DecodeAndVerify(
        std::string_view token);

    [[nodiscard]] static std::string ComputeCid(std::span<const uint8_t> token_bytes);

private:
    CapabilityTokenCodec() = delete;
};

}
