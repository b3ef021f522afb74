#include "witnesschain/session/linking_verifier.hpp"
#include "witnesschain/session/linking_challenge.hpp"
#include "witnesschain/identity/did_key.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "witnesschain/core/constants.hpp"
#include "witnesschain/debug/audit_log.hpp"

#include <stdexcept>

namespace witnesschain::vault::session {

namespace {
using VerifyResult = Result<Unit, SessionFailure>;

VerifyResult Rejected(SessionFailure failure) {
    debug::LogFailureCode(debug::Component::Session, "REGISTER", failure.Code());
    return VerifyResult::Err(std::move(failure));
}
}

LinkingVerifier::LinkingVerifier(
    std::shared_ptr<interfaces::IWalletSignatureVerifier> signature_verifier,
    std::shared_ptr<security::LinkingNonceRegistry> nonce_registry,
    configuration::SessionSettings settings,
    Clock clock)
    : signature_verifier_(std::move(signature_verifier))
    , nonce_registry_(std::move(nonce_registry))
    , settings_(settings)
    , clock_(std::move(clock)) {
    if (!signature_verifier_ || !nonce_registry_) {
        throw std::invalid_argument("LinkingVerifier requires a signature verifier and a nonce registry");
    }
}

VerifyResult LinkingVerifier::VerifyRegistration(const RegistrationRequest& request) const {
    if (!identity::DidKey::IsValid(request.did)) {
        return Rejected(SessionFailure::RegistrationFailed("Invalid DID format"));
    }
    const auto claimed_key = encoding::Base64::Decode(request.public_key);
    const auto did_key = identity::DidKey::ToPublicKey(request.did);
    if (!claimed_key.has_value() || did_key.IsErr() ||
        !crypto::SodiumInterop::ConstantTimeEquals(*claimed_key, did_key.Unwrap())) {
        return Rejected(SessionFailure::RegistrationFailed("Public key does not match DID"));
    }
    if (request.nonce.has_value() &&
        (request.nonce->size() < SessionConstants::MIN_NONCE_LENGTH ||
         request.nonce->size() > SessionConstants::MAX_NONCE_LENGTH)) {
        return Rejected(SessionFailure::RegistrationFailed("Nonce must be between 16 and 64 characters"));
    }
    if (!request.wallet_address.has_value()) {
        return VerifyResult::Ok(unit);
    }
    if (!LinkingChallenge::IsValidWalletAddress(*request.wallet_address)) {
        return Rejected(SessionFailure::RegistrationFailed("Invalid wallet address"));
    }
    if (!request.signature.has_value() || request.signature->empty() || !request.timestamp.has_value()) {
        return Rejected(SessionFailure::RegistrationFailed(
            "Wallet registration requires signature verification"));
    }
    if (!LinkingChallenge::IsValidSignatureTimestamp(*request.timestamp, ToUnixSeconds(clock_()), settings_)) {
        return Rejected(SessionFailure::StaleSignature("Signature timestamp expired or invalid"));
    }
    if (!request.nonce.has_value()) {
        return Rejected(SessionFailure::RegistrationFailed("Nonce is required for wallet registration"));
    }
    if (auto fresh = nonce_registry_->CheckAndRecord(*request.nonce); fresh.IsErr()) {
        return Rejected(SessionFailure::ReplayDetected("Nonce already used - possible replay attack"));
    }

    const std::string wallet = LinkingChallenge::NormalizeWalletAddress(*request.wallet_address);
    const std::string challenge = LinkingChallenge::Create(wallet, request.did, *request.timestamp, *request.nonce);
    auto verified = signature_verifier_->Verify(wallet, challenge, *request.signature);
    if (verified.IsErr()) {
        return Rejected(SessionFailure::RegistrationFailed("Invalid signature format"));
    }
    if (!verified.Unwrap()) {
        return Rejected(SessionFailure::SignatureRejected("Invalid wallet signature"));
    }
    WC_LOG_SUBJECT(debug::Component::Session, "WALLET_LINKED", request.did);
    return VerifyResult::Ok(unit);
}

}
