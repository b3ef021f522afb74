#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/models/key_materials/ed25519_key_pair.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace witnesschain::vault::identity {
class DidIdentity;
}

namespace witnesschain::vault::capability {

/**
 * Ed25519 principal that signs capability tokens.
 *
 * Built from the 32-byte seed (the first half of a 64-byte signing key),
 * so the signer's DID always matches the key that produced it.
 */
class CapabilitySigner {
public:
    /// Accepts a 64-byte signing key or its 32-byte seed.
    [[nodiscard]] static Result<CapabilitySigner, CapabilityFailure> FromSecretKey(
        std::span<const uint8_t> secret_key);

    [[nodiscard]] static Result<CapabilitySigner, CapabilityFailure> FromIdentity(
        const identity::DidIdentity& identity);

    [[nodiscard]] const std::string& Did() const noexcept { return did_; }

    [[nodiscard]] Result<std::vector<uint8_t>, CapabilityFailure> Sign(
        std::span<const uint8_t> payload) const;

    CapabilitySigner(CapabilitySigner&&) noexcept = default;
    CapabilitySigner& operator=(CapabilitySigner&&) noexcept = default;
    CapabilitySigner(const CapabilitySigner&) = delete;
    CapabilitySigner& operator=(const CapabilitySigner&) = delete;

private:
    CapabilitySigner(std::string did, models::Ed25519KeyPair key_pair);

    std::string did_;
    models::Ed25519KeyPair key_pair_;
};

}
