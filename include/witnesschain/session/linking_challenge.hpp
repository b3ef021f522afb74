#pragma once
#include "witnesschain/configuration/vault_config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace witnesschain::vault::session {

/**
 * Text that a wallet signs to bind its address to a DID, and the text
 * signed for individual API requests. Signer and verifier must build
 * byte-identical strings, so both go through this class.
 */
class LinkingChallenge {
public:
    /// Lines joined by '\n'; the wallet address is lower-cased and the Nonce line omitted when nonce is empty.
    static std::string Create(
        std::string_view wallet_address,
        std::string_view did,
        int64_t timestamp,
        std::optional<std::string_view> nonce = std::nullopt);

    static std::string CreateAuthMessage(
        std::string_view method,
        std::string_view path,
        int64_t timestamp,
        std::string_view did);

    /// Random RFC 4122 version 4 UUID, lower-case.
    static std::string GenerateNonce();

    /// Rejects signatures older than signature_max_age or further ahead than signature_max_future_skew.
    static bool IsValidSignatureTimestamp(
        int64_t timestamp,
        int64_t now,
        const configuration::SessionSettings& settings = configuration::SessionSettings::Default()) noexcept;

    static std::string NormalizeWalletAddress(std::string_view wallet_address);

    /// "0x" followed by 40 hex digits of either case.
    static bool IsValidWalletAddress(std::string_view wallet_address) noexcept;

private:
    LinkingChallenge() = delete;
};

}
