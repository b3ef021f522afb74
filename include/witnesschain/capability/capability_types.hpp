#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace witnesschain::vault::capability {

enum class CapabilityAction {
    EvidenceUpload,
    EvidenceRead,
    EvidenceList,
    EvidenceDelete
};

/// "witnesschain/evidence/upload" and so on.
std::string_view ActionToString(CapabilityAction action) noexcept;

std::optional<CapabilityAction> ParseAction(std::string_view text) noexcept;

/// Non-empty, at most 128 bytes, no '/' and no '*'.
bool IsValidResourceId(std::string_view resource_id) noexcept;

/**
 * Evidence held under one DID's namespace: either one resource id or, when
 * resource_id is empty, all of them.
 */
struct ResourceDescriptor {
    std::string owner_did;
    std::optional<std::string> resource_id;

    static ResourceDescriptor Wildcard(std::string owner_did);
    static ResourceDescriptor Specific(std::string owner_did, std::string resource_id);

    [[nodiscard]] bool IsWildcard() const noexcept { return !resource_id.has_value(); }

    /// "<owner>:evidence/<id>" or "<owner>:evidence/*".
    [[nodiscard]] std::string ToUri() const;

    /// A request with no resource id is covered by any descriptor.
    [[nodiscard]] bool Covers(std::optional<std::string_view> requested_id) const noexcept;

    bool operator==(const ResourceDescriptor&) const = default;
};

struct CapabilityGrant {
    CapabilityAction action;
    ResourceDescriptor resource;

    bool operator==(const CapabilityGrant&) const = default;
};

/// Verified content of a capability token.
struct CapabilityClaims {
    std::string issuer;
    std::string audience;
    std::vector<CapabilityGrant> capabilities;
    /// Unix seconds; absent means the token can never satisfy a check.
    std::optional<int64_t> expiration;
    std::optional<int64_t> not_before;
};

struct UcanDelegation {
    /// Base64 of the signed token.
    std::string token;
    std::string cid;
    std::string issuer;
    std::string audience;
    std::vector<CapabilityGrant> capabilities;
    int64_t expiration = 0;
    std::optional<int64_t> not_before;
};

struct CapabilityCheckResult {
    bool allowed = false;
    std::string reason;
    std::string issuer;
    std::string audience;

    static CapabilityCheckResult Allow(std::string issuer, std::string audience) {
        return {true, {}, std::move(issuer), std::move(audience)};
    }

    static CapabilityCheckResult Deny(std::string reason) {
        return {false, std::move(reason), {}, {}};
    }
};

}
