#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/core/clock.hpp"
#include "witnesschain/configuration/vault_config.hpp"
#include "witnesschain/capability/capability_types.hpp"
#include "witnesschain/capability/capability_signer.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace witnesschain::vault::capability {

/**
 * @brief Issues and evaluates capability tokens
 *
 * Self-capabilities name the issuer as audience and may be scoped to all
 * of the issuer's evidence. Delegations name another DID and must name a
 * specific resource.
 *
 * CheckCapability evaluates, stopping at the first failure:
 * 1. token decodes and the issuer signature verifies
 * 2. expiration present and not passed (a missing expiration is expired)
 * 3. not_before reached
 * 4. requester, when given, is the audience
 * 5. some grant has the required action and covers the resource
 *
 * Denial is an ordinary result with a reason, never an error.
 */
class CapabilityAuthority {
public:
    explicit CapabilityAuthority(
        configuration::CapabilitySettings settings = configuration::CapabilitySettings::Default(),
        Clock clock = SystemClock());

    [[nodiscard]] Result<UcanDelegation, CapabilityFailure> IssueSelfCapability(
        const CapabilitySigner& signer,
        CapabilityAction action,
        std::optional<std::string_view> resource_id,
        std::chrono::seconds ttl) const;

    [[nodiscard]] Result<UcanDelegation, CapabilityFailure> IssueSelfCapability(
        const CapabilitySigner& signer,
        CapabilityAction action,
        std::optional<std::string_view> resource_id = std::nullopt) const;

    [[nodiscard]] Result<UcanDelegation, CapabilityFailure> DelegateCapability(
        const CapabilitySigner& signer,
        std::string_view audience_did,
        CapabilityAction action,
        std::string_view resource_id,
        std::chrono::seconds ttl) const;

    [[nodiscard]] Result<UcanDelegation, CapabilityFailure> DelegateCapability(
        const CapabilitySigner& signer,
        std::string_view audience_did,
        CapabilityAction action,
        std::string_view resource_id) const;

    /// Decodes and verifies the issuer's signature. Time is not checked here.
    [[nodiscard]] static Result<CapabilityClaims, CapabilityFailure> ParseToken(std::string_view token);

    [[nodiscard]] CapabilityCheckResult CheckCapability(
        std::string_view token,
        CapabilityAction required_action,
        std::optional<std::string_view> resource_id = std::nullopt,
        std::optional<std::string_view> requester_did = std::nullopt) const;

    /// Wildcard upload capability, one hour by default.
    [[nodiscard]] Result<UcanDelegation, CapabilityFailure> CreateUploadCapability(
        const CapabilitySigner& signer) const;

    /// Read capability for one piece of evidence, 24 hours by default.
    [[nodiscard]] Result<UcanDelegation, CapabilityFailure> CreateReadCapability(
        const CapabilitySigner& signer,
        std::string_view evidence_id) const;

    [[nodiscard]] bool CanUploadEvidence(std::string_view token) const;

    [[nodiscard]] bool CanReadEvidence(std::string_view token, std::string_view evidence_id) const;

    [[nodiscard]] const configuration::CapabilitySettings& Settings() const noexcept { return settings_; }

private:
    Result<UcanDelegation, CapabilityFailure> Issue(
        const CapabilitySigner& signer,
        std::string audience,
        CapabilityGrant grant,
        std::chrono::seconds ttl) const;

    configuration::CapabilitySettings settings_;
    Clock clock_;
};

}
