#include "witnesschain/capability/capability_authority.hpp"
#include "witnesschain/capability/capability_token_codec.hpp"
#include "witnesschain/identity/did_key.hpp"
#include "witnesschain/core/format.hpp"
#include "witnesschain/debug/audit_log.hpp"

#include <algorithm>
#include <limits>

namespace witnesschain::vault::capability {

namespace {
using DelegationResult = Result<UcanDelegation, CapabilityFailure>;

constexpr std::string_view kNoExpiration = "Capability has no expiration (required for security)";
constexpr std::string_view kExpired = "Capability has expired";
constexpr std::string_view kNotYetValid = "Capability is not yet valid";
constexpr std::string_view kWrongAudience = "Capability not issued to this requester";

CapabilityCheckResult Denied(std::string reason) {
    debug::LogCapabilityDenied(reason);
    return CapabilityCheckResult::Deny(std::move(reason));
}
}

CapabilityAuthority::CapabilityAuthority(
    configuration::CapabilitySettings settings,
    Clock clock)
    : settings_(settings)
    , clock_(std::move(clock)) {
}

DelegationResult CapabilityAuthority::Issue(
    const CapabilitySigner& signer,
    std::string audience,
    CapabilityGrant grant,
    std::chrono::seconds ttl) const {
    const int64_t now = ToUnixSeconds(clock_());
    const int64_t lifetime = static_cast<int64_t>(ttl.count());
    if ((lifetime > 0 && now > std::numeric_limits<int64_t>::max() - lifetime) ||
        (lifetime < 0 && now < std::numeric_limits<int64_t>::min() - lifetime)) {
        return DelegationResult::Err(CapabilityFailure::DelegationFailed(
            compat::format("Failed to create capability: lifetime of {} seconds is out of range", lifetime)));
    }
    CapabilityClaims claims;
    claims.issuer = signer.Did();
    claims.audience = std::move(audience);
    claims.capabilities.push_back(std::move(grant));
    claims.expiration = now + lifetime;
    claims.not_before = now;

    auto encoded = CapabilityTokenCodec::Encode(claims, signer);
    if (encoded.IsErr()) {
        return DelegationResult::Err(CapabilityFailure::DelegationFailed(
            compat::format("Failed to create capability: {}", encoded.UnwrapErr().message)));
    }
    auto [token, cid] = std::move(encoded).Unwrap();
    debug::LogCapabilityIssued(claims.issuer, claims.audience,
                               ActionToString(claims.capabilities.front().action), *claims.expiration);
    return DelegationResult::Ok(UcanDelegation{
        std::move(token),
        std::move(cid),
        std::move(claims.issuer),
        std::move(claims.audience),
        std::move(claims.capabilities),
        *claims.expiration,
        claims.not_before});
}

DelegationResult CapabilityAuthority::IssueSelfCapability(
    const CapabilitySigner& signer,
    const CapabilityAction action,
    const std::optional<std::string_view> resource_id,
    const std::chrono::seconds ttl) const {
    ResourceDescriptor resource = ResourceDescriptor::Wildcard(signer.Did());
    if (resource_id.has_value()) {
        if (!IsValidResourceId(*resource_id)) {
            return DelegationResult::Err(CapabilityFailure::DelegationFailed(
                compat::format("Invalid resource id \"{}\"", *resource_id)));
        }
        resource = ResourceDescriptor::Specific(signer.Did(), std::string(*resource_id));
    }
    return Issue(signer, signer.Did(), CapabilityGrant{action, std::move(resource)}, ttl);
}

DelegationResult CapabilityAuthority::IssueSelfCapability(
    const CapabilitySigner& signer,
    const CapabilityAction action,
    const std::optional<std::string_view> resource_id) const {
    return IssueSelfCapability(signer, action, resource_id, settings_.default_ttl);
}

DelegationResult CapabilityAuthority::DelegateCapability(
    const CapabilitySigner& signer,
    const std::string_view audience_did,
    const CapabilityAction action,
    const std::string_view resource_id,
    const std::chrono::seconds ttl) const {
    if (!identity::DidKey::IsValid(audience_did)) {
        return DelegationResult::Err(CapabilityFailure::DelegationFailed(
            "Failed to delegate capability: audience is not a valid DID"));
    }
    if (audience_did == signer.Did()) {
        return DelegationResult::Err(CapabilityFailure::DelegationFailed(
            "Failed to delegate capability: audience must differ from issuer"));
    }
    // No wildcard delegation to third parties.
    if (!IsValidResourceId(resource_id)) {
        return DelegationResult::Err(CapabilityFailure::DelegationFailed(
            "Failed to delegate capability: a specific resource id is required"));
    }
    return Issue(
        signer,
        std::string(audience_did),
        CapabilityGrant{action, ResourceDescriptor::Specific(signer.Did(), std::string(resource_id))},
        ttl);
}

DelegationResult CapabilityAuthority::DelegateCapability(
    const CapabilitySigner& signer,
    const std::string_view audience_did,
    const CapabilityAction action,
    const std::string_view resource_id) const {
    return DelegateCapability(signer, audience_did, action, resource_id, settings_.default_ttl);
}

Result<CapabilityClaims, CapabilityFailure> CapabilityAuthority::ParseToken(std::string_view token) {
    return CapabilityTokenCodec::DecodeAndVerify(token);
}

CapabilityCheckResult CapabilityAuthority::CheckCapability(
    const std::string_view token,
    const CapabilityAction required_action,
    const std::optional<std::string_view> resource_id,
    const std::optional<std::string_view> requester_did) const {
    auto parsed = ParseToken(token);
    if (parsed.IsErr()) {
        return Denied(compat::format("Invalid capability token: {}", parsed.UnwrapErr().message));
    }
    const CapabilityClaims& claims = parsed.Unwrap();
    const int64_t now = ToUnixSeconds(clock_());

    if (!claims.expiration.has_value()) {
        return Denied(std::string(kNoExpiration));
    }
    if (*claims.expiration < now) {
        return Denied(std::string(kExpired));
    }
    if (claims.not_before.has_value() && *claims.not_before > now) {
        return Denied(std::string(kNotYetValid));
    }
    if (requester_did.has_value()) {
        const bool is_audience = claims.audience == *requester_did;
        const bool is_self_issued = claims.issuer == claims.audience && claims.issuer == *requester_did;
        if (!is_audience && !is_self_issued) {
            return Denied(std::string(kWrongAudience));
        }
    }
    const bool granted = std::any_of(
        claims.capabilities.begin(), claims.capabilities.end(),
        [&](const CapabilityGrant& grant) {
            return grant.action == required_action && grant.resource.Covers(resource_id);
        });
    if (!granted) {
        return Denied(compat::format("Required capability \"{}\" not granted", ActionToString(required_action)));
    }
    return CapabilityCheckResult::Allow(claims.issuer, claims.audience);
}

DelegationResult CapabilityAuthority::CreateUploadCapability(const CapabilitySigner& signer) const {
    return IssueSelfCapability(signer, CapabilityAction::EvidenceUpload, std::nullopt, settings_.upload_ttl);
}

DelegationResult CapabilityAuthority::CreateReadCapability(
    const CapabilitySigner& signer,
    const std::string_view evidence_id) const {
    return IssueSelfCapability(signer, CapabilityAction::EvidenceRead, evidence_id, settings_.read_ttl);
}

bool CapabilityAuthority::CanUploadEvidence(const std::string_view token) const {
    return CheckCapability(token, CapabilityAction::EvidenceUpload).allowed;
}

bool CapabilityAuthority::CanReadEvidence(
    const std::string_view token,
    const std::string_view evidence_id) const {
    return CheckCapability(token, CapabilityAction::EvidenceRead, evidence_id).allowed;
}

}
