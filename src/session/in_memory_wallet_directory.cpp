#include "witnesschain/session/in_memory_wallet_directory.hpp"
#include "witnesschain/session/linking_challenge.hpp"

namespace witnesschain::vault::session {

std::optional<std::string> InMemoryWalletDirectory::GetDid(std::string_view wallet_address) const {
    const std::string key = LinkingChallenge::NormalizeWalletAddress(wallet_address);
    std::lock_guard guard(lock_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryWalletDirectory::SetDid(std::string_view wallet_address, std::string_view did) {
    std::string key = LinkingChallenge::NormalizeWalletAddress(wallet_address);
    std::lock_guard guard(lock_);
    entries_.insert_or_assign(std::move(key), std::string(did));
}

void InMemoryWalletDirectory::Remove(std::string_view wallet_address) {
    const std::string key = LinkingChallenge::NormalizeWalletAddress(wallet_address);
    std::lock_guard guard(lock_);
    entries_.erase(key);
}

}
