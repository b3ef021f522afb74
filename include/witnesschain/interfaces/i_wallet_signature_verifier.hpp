#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include <string_view>

namespace witnesschain::vault::interfaces {

class IWalletSignatureVerifier {
public:
    virtual ~IWalletSignatureVerifier() = default;

    /// Ok(false) for a well-formed signature by another wallet; Err for a malformed one.
    [[nodiscard]] virtual Result<bool, SessionFailure> Verify(
        std::string_view wallet_address,
        std::string_view message,
        std::string_view signature) = 0;
};

}
