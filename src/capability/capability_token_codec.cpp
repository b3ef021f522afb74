#include "witnesschain/capability/capability_token_codec.hpp"
#include "witnesschain/identity/did_key.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "witnesschain/core/constants.hpp"

#include "capability/capability_token.pb.h"

#include <sodium.h>

namespace witnesschain::vault::capability {

using crypto::SodiumInterop;
using encoding::Base64;

namespace {
using ClaimsResult = Result<CapabilityClaims, CapabilityFailure>;

proto::capability::CapabilityAction ToProto(const CapabilityAction action) {
    switch (action) {
        case CapabilityAction::EvidenceUpload:
            return proto::capability::CAPABILITY_ACTION_EVIDENCE_UPLOAD;
        case CapabilityAction::EvidenceRead:
            return proto::capability::CAPABILITY_ACTION_EVIDENCE_READ;
        case CapabilityAction::EvidenceList:
            return proto::capability::CAPABILITY_ACTION_EVIDENCE_LIST;
        case CapabilityAction::EvidenceDelete:
            return proto::capability::CAPABILITY_ACTION_EVIDENCE_DELETE;
    }
    return proto::capability::CAPABILITY_ACTION_UNSPECIFIED;
}

std::optional<CapabilityAction> FromProto(const proto::capability::CapabilityAction action) {
    switch (action) {
        case proto::capability::CAPABILITY_ACTION_EVIDENCE_UPLOAD:
            return CapabilityAction::EvidenceUpload;
        case proto::capability::CAPABILITY_ACTION_EVIDENCE_READ:
            return CapabilityAction::EvidenceRead;
        case proto::capability::CAPABILITY_ACTION_EVIDENCE_LIST:
            return CapabilityAction::EvidenceList;
        case proto::capability::CAPABILITY_ACTION_EVIDENCE_DELETE:
            return CapabilityAction::EvidenceDelete;
        default:
            return std::nullopt;
    }
}

ClaimsResult Reject(const std::string& detail) {
    return ClaimsResult::Err(CapabilityFailure::ParseFailed(detail));
}
}

Result<EncodedToken, CapabilityFailure> CapabilityTokenCodec::Encode(
    const CapabilityClaims& claims,
    const CapabilitySigner& signer) {
    using EncodeResult = Result<EncodedToken, CapabilityFailure>;
    if (claims.issuer != signer.Did()) {
        return EncodeResult::Err(CapabilityFailure::DelegationFailed("Issuer does not match signer"));
    }
    proto::capability::CapabilityPayload payload;
    payload.set_version(CapabilityConstants::TOKEN_VERSION);
    payload.set_issuer(claims.issuer);
    payload.set_audience(claims.audience);
    for (const auto& grant : claims.capabilities) {
        auto* entry = payload.add_grants();
        entry->set_action(ToProto(grant.action));
        auto* resource = entry->mutable_resource();
        resource->set_owner_did(grant.resource.owner_did);
        if (grant.resource.IsWildcard()) {
            resource->set_wildcard(true);
        } else {
            resource->set_resource_id(*grant.resource.resource_id);
        }
    }
    payload.set_expiration(claims.expiration.value_or(0));
    if (claims.not_before.has_value()) {
        payload.set_not_before(*claims.not_before);
    }
    const auto nonce = SodiumInterop::GetRandomBytes(CapabilityConstants::TOKEN_NONCE_SIZE);
    payload.set_nonce(nonce.data(), nonce.size());

    const std::string payload_bytes = payload.SerializeAsString();
    auto signature = signer.Sign(encoding::AsBytes(payload_bytes));
    if (signature.IsErr()) {
        return EncodeResult::Err(std::move(signature).UnwrapErr());
    }
    proto::capability::SignedCapabilityToken signed_token;
    signed_token.set_payload(payload_bytes);
    const auto& signature_bytes = signature.Unwrap();
    signed_token.set_signature(signature_bytes.data(), signature_bytes.size());

    const std::string token_bytes = signed_token.SerializeAsString();
    return EncodeResult::Ok(EncodedToken{
        Base64::Encode(encoding::AsBytes(token_bytes)),
        ComputeCid(encoding::AsBytes(token_bytes))});
}

ClaimsResult CapabilityTokenCodec::DecodeAndVerify(std::string_view token) {
    if (token.empty()) {
        return Reject("token is empty");
    }
    const auto token_bytes = Base64::Decode(token);
    if (!token_bytes.has_value()) {
        return Reject("token is not valid base64");
    }
    proto::capability::SignedCapabilityToken signed_token;
    if (!signed_token.ParseFromArray(token_bytes->data(), static_cast<int>(token_bytes->size()))) {
        return Reject("token envelope is malformed");
    }
    proto::capability::CapabilityPayload payload;
    if (!payload.ParseFromString(signed_token.payload())) {
        return Reject("token payload is malformed");
    }
    if (payload.version() != CapabilityConstants::TOKEN_VERSION) {
        return Reject("unsupported token version " + std::to_string(payload.version()));
    }

    auto issuer_key = identity::DidKey::ToPublicKey(payload.issuer());
    if (issuer_key.IsErr()) {
        return Reject("issuer is not a valid DID");
    }
    const std::string& signature = signed_token.signature();
    if (signature.size() != Constants::ED_25519_SIGNATURE_SIZE) {
        return Reject("signature has wrong length");
    }
    const std::string& payload_bytes = signed_token.payload();
    if (crypto_sign_verify_detached(
            reinterpret_cast<const unsigned char*>(signature.data()),
            reinterpret_cast<const unsigned char*>(payload_bytes.data()),
            payload_bytes.size(),
            issuer_key.Unwrap().data()) != SodiumConstants::SUCCESS) {
        return Reject("signature verification failed");
    }

    if (!identity::DidKey::IsValid(payload.audience())) {
        return Reject("audience is not a valid DID");
    }

    CapabilityClaims claims;
    claims.issuer = payload.issuer();
    claims.audience = payload.audience();
    claims.capabilities.reserve(static_cast<size_t>(payload.grants_size()));
    for (const auto& grant : payload.grants()) {
        const auto action = FromProto(grant.action());
        if (!action.has_value()) {
            return Reject("grant has unknown action");
        }
        const auto& resource = grant.resource();
        // A principal can only grant over its own namespace.
        if (resource.owner_did() != claims.issuer) {
            return Reject("grant resource is outside the issuer namespace");
        }
        if (resource.wildcard()) {
            if (!resource.resource_id().empty()) {
                return Reject("wildcard grant carries a resource id");
            }
            claims.capabilities.push_back({*action, ResourceDescriptor::Wildcard(resource.owner_did())});
        } else {
            if (!IsValidResourceId(resource.resource_id())) {
                return Reject("grant has invalid resource id");
            }
            claims.capabilities.push_back(
                {*action, ResourceDescriptor::Specific(resource.owner_did(), resource.resource_id())});
        }
    }
    if (payload.expiration() != 0) {
        claims.expiration = payload.expiration();
    }
    if (payload.has_not_before()) {
        claims.not_before = payload.not_before();
    }
    return ClaimsResult::Ok(std::move(claims));
}

std::string CapabilityTokenCodec::ComputeCid(std::span<const uint8_t> token_bytes) {
    std::vector<uint8_t> cid_bytes{
        CapabilityConstants::CID_VERSION,
        CapabilityConstants::CID_RAW_CODEC,
        CapabilityConstants::MULTIHASH_SHA2_256,
        CapabilityConstants::MULTIHASH_SHA2_256_LENGTH};
    const auto digest = SodiumInterop::Sha256(token_bytes);
    cid_bytes.insert(cid_bytes.end(), digest.begin(), digest.end());
    return "b" + encoding::Base32::EncodeLower(cid_bytes);
}

}
