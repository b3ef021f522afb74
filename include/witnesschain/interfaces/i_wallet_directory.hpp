#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace witnesschain::vault::interfaces {

/// Public wallet address to DID mapping on this device. Addresses are lower-cased.
class IWalletDirectory {
public:
    virtual ~IWalletDirectory() = default;
    virtual std::optional<std::string> GetDid(std::string_view wallet_address) const = 0;
    virtual void SetDid(std::string_view wallet_address, std::string_view did) = 0;
    virtual void Remove(std::string_view wallet_address) = 0;
};

}
