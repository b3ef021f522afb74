#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include <string>
#include <string_view>

namespace witnesschain::vault::interfaces {

/**
 * Wallet that signs a text message on the user's behalf. A user refusing
 * to sign is reported as SessionFailureType::SignatureRejected.
 */
class IWalletSigner {
public:
    virtual ~IWalletSigner() = default;

    [[nodiscard]] virtual Result<std::string, SessionFailure> SignMessage(std::string_view message) = 0;
};

}
