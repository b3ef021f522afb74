#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace witnesschain::vault::session {

/// Body of a user registration: a DID, optionally linked to a wallet.
struct RegistrationRequest {
    std::string did;
    /// Base64 Ed25519 public key.
    std::string public_key;
    std::optional<std::string> wallet_address;
    std::optional<std::string> signature;
    /// Unix seconds at which the linking challenge was signed.
    std::optional<int64_t> timestamp;
    std::optional<std::string> nonce;
};

}
