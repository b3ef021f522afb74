#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/core/clock.hpp"
#include "witnesschain/configuration/vault_config.hpp"
#include "witnesschain/interfaces/i_wallet_signature_verifier.hpp"
#include "witnesschain/security/replay/linking_nonce_registry.hpp"
#include "witnesschain/session/registration_request.hpp"
#include <memory>

namespace witnesschain::vault::session {

/**
 * Receiving side of a registration. Accepts a DID on its own, or a DID
 * linked to a wallet when the request carries a fresh, single-use,
 * correctly signed linking challenge.
 *
 * Order of checks: DID and public key, wallet format, presence of the
 * signature fields, timestamp freshness, nonce, then the wallet signature
 * over the reconstructed challenge. A nonce is consumed once it passes
 * the replay check, even if the signature later fails.
 */
class LinkingVerifier {
public:
    LinkingVerifier(
        std::shared_ptr<interfaces::IWalletSignatureVerifier> signature_verifier,
        std::shared_ptr<security::LinkingNonceRegistry> nonce_registry,
        configuration::SessionSettings settings = configuration::SessionSettings::Default(),
        Clock clock = SystemClock());

    [[nodiscard]] Result<Unit, SessionFailure> VerifyRegistration(const RegistrationRequest& request) const;

private:
    std::shared_ptr<interfaces::IWalletSignatureVerifier> signature_verifier_;
    std::shared_ptr<security::LinkingNonceRegistry> nonce_registry_;
    configuration::SessionSettings settings_;
    Clock clock_;
};

}
