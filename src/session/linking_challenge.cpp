#include "witnesschain/session/linking_challenge.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "witnesschain/core/constants.hpp"
#include "witnesschain/core/format.hpp"

#include <algorithm>
#include <cctype>

namespace witnesschain::vault::session {

namespace {
constexpr size_t kUuidBytes = 16;
constexpr uint8_t kUuidVersion4 = 0x40;
constexpr uint8_t kUuidVariantRfc4122 = 0x80;
}

std::string LinkingChallenge::Create(
    std::string_view wallet_address,
    std::string_view did,
    const int64_t timestamp,
    const std::optional<std::string_view> nonce) {
    std::string message = compat::format(
        "WitnessChain Identity Verification\n"
        "\n"
        "This signature links your wallet to your WitnessChain identity.\n"
        "\n"
        "Wallet: {}\n"
        "Identity: {}\n"
        "Timestamp: {}\n",
        NormalizeWalletAddress(wallet_address), did, timestamp);
    if (nonce.has_value() && !nonce->empty()) {
        message += compat::format("Nonce: {}\n", *nonce);
    }
    message += "\nThis request will not trigger a blockchain transaction or cost any gas fees.";
    return message;
}

std::string LinkingChallenge::CreateAuthMessage(
    std::string_view method,
    std::string_view path,
    const int64_t timestamp,
    std::string_view did) {
    return compat::format(
        "WitnessChain API Request\n"
        "\n"
        "Method: {}\n"
        "Path: {}\n"
        "Timestamp: {}\n"
        "Identity: {}\n"
        "\n"
        "This signature authorizes this API request.",
        method, path, timestamp, did);
}

std::string LinkingChallenge::GenerateNonce() {
    auto bytes = crypto::SodiumInterop::GetRandomBytes(kUuidBytes);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | kUuidVersion4);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | kUuidVariantRfc4122);
    const std::string hex = encoding::Hex::Encode(bytes);
    return compat::format("{}-{}-{}-{}-{}",
                          hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4),
                          hex.substr(16, 4), hex.substr(20, 12));
}

bool LinkingChallenge::IsValidSignatureTimestamp(
    const int64_t timestamp,
    const int64_t now,
    const configuration::SessionSettings& settings) noexcept {
    const int64_t age = now - timestamp;
    if (age > settings.signature_max_age.count()) {
        return false;
    }
    return age >= -settings.signature_max_future_skew.count();
}

std::string LinkingChallenge::NormalizeWalletAddress(std::string_view wallet_address) {
    std::string normalized(wallet_address);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

bool LinkingChallenge::IsValidWalletAddress(std::string_view wallet_address) noexcept {
    if (wallet_address.size() != 2 + SessionConstants::WALLET_ADDRESS_HEX_DIGITS ||
        wallet_address.substr(0, 2) != "0x") {
        return false;
    }
    return std::all_of(wallet_address.begin() + 2, wallet_address.end(),
                       [](const char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

}
