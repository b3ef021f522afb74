#include "witnesschain/capability/capability_types.hpp"
#include "witnesschain/core/constants.hpp"

namespace witnesschain::vault::capability {

namespace {
constexpr std::string_view kUpload = "witnesschain/evidence/upload";
constexpr std::string_view kRead = "witnesschain/evidence/read";
constexpr std::string_view kList = "witnesschain/evidence/list";
constexpr std::string_view kDelete = "witnesschain/evidence/delete";
}

std::string_view ActionToString(const CapabilityAction action) noexcept {
    switch (action) {
        case CapabilityAction::EvidenceUpload: return kUpload;
        case CapabilityAction::EvidenceRead: return kRead;
        case CapabilityAction::EvidenceList: return kList;
        case CapabilityAction::EvidenceDelete: return kDelete;
    }
    return kRead;
}

std::optional<CapabilityAction> ParseAction(const std::string_view text) noexcept {
    if (text == kUpload) {
        return CapabilityAction::EvidenceUpload;
    }
    if (text == kRead) {
        return CapabilityAction::EvidenceRead;
    }
    if (text == kList) {
        return CapabilityAction::EvidenceList;
    }
    if (text == kDelete) {
        return CapabilityAction::EvidenceDelete;
    }
    return std::nullopt;
}

bool IsValidResourceId(const std::string_view resource_id) noexcept {
    if (resource_id.empty() || resource_id.size() > CapabilityConstants::MAX_RESOURCE_ID_LENGTH) {
        return false;
    }
    return resource_id.find_first_of("/*") == std::string_view::npos;
}

ResourceDescriptor ResourceDescriptor::Wildcard(std::string owner_did) {
    return ResourceDescriptor{std::move(owner_did), std::nullopt};
}

ResourceDescriptor ResourceDescriptor::Specific(std::string owner_did, std::string resource_id) {
    return ResourceDescriptor{std::move(owner_did), std::move(resource_id)};
}

std::string ResourceDescriptor::ToUri() const {
    std::string uri = owner_did;
    uri += CapabilityConstants::EVIDENCE_NAMESPACE;
    uri += resource_id.has_value() ? std::string_view(*resource_id) : CapabilityConstants::WILDCARD;
    return uri;
}

bool ResourceDescriptor::Covers(const std::optional<std::string_view> requested_id) const noexcept {
    if (!requested_id.has_value()) {
        return true;
    }
    if (!IsValidResourceId(*requested_id)) {
        return false;
    }
    return IsWildcard() || *resource_id == *requested_id;
}

}
