#pragma once
#include "witnesschain/interfaces/i_wallet_directory.hpp"
#include <map>
#include <mutex>

namespace witnesschain::vault::session {

class InMemoryWalletDirectory final : public interfaces::IWalletDirectory {
public:
    std::optional<std::string> GetDid(std::string_view wallet_address) const override;
    void SetDid(std::string_view wallet_address, std::string_view did) override;
    void Remove(std::string_view wallet_address) override;

private:
    mutable std::mutex lock_;
    std::map<std::string, std::string, std::less<>> entries_;
};

}
