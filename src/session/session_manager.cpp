#include "witnesschain/session/session_manager.hpp"
#include "witnesschain/session/linking_challenge.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "witnesschain/debug/audit_log.hpp"

#include <stdexcept>

namespace witnesschain::vault::session {

using identity::DidIdentity;

namespace {
using AuthOutcome = Result<AuthResult, SessionFailure>;

Result<std::string, SessionFailure> EncryptionPublicKey(const DidIdentity& identity) {
    auto pair = identity.DeriveEncryptionKeyPair();
    if (pair.IsErr()) {
        return Result<std::string, SessionFailure>::Err(SessionFailure::FromIdentityFailure(pair.UnwrapErr()));
    }
    return Result<std::string, SessionFailure>::Ok(encoding::Base64::Encode(pair.Unwrap().GetPublicKey()));
}
}

SessionManager::SessionManager(
    std::shared_ptr<keystore::SecureKeyStore> key_store,
    std::shared_ptr<interfaces::IWalletDirectory> wallet_directory,
    std::shared_ptr<interfaces::IRegistrationClient> registration_client,
    configuration::SessionSettings settings,
    Clock clock)
    : key_store_(std::move(key_store))
    , wallet_directory_(std::move(wallet_directory))
    , registration_client_(std::move(registration_client))
    , settings_(settings)
    , clock_(std::move(clock)) {
    if (!key_store_ || !wallet_directory_) {
        throw std::invalid_argument("SessionManager requires a key store and a wallet directory");
    }
}

AuthOutcome SessionManager::Authenticate(
    std::string_view wallet_address,
    std::string_view password,
    interfaces::IWalletSigner* wallet_signer) {
    if (wallet_address.empty()) {
        return AuthOutcome::Err(SessionFailure::WalletNotConnected("Wallet is not connected"));
    }
    const std::string wallet = LinkingChallenge::NormalizeWalletAddress(wallet_address);
    if (const auto existing_did = wallet_directory_->GetDid(wallet); existing_did.has_value()) {
        return AuthenticateExisting(wallet, *existing_did, password);
    }
    return AuthenticateNew(wallet, password, wallet_signer);
}

AuthOutcome SessionManager::AuthenticateExisting(
    const std::string& wallet,
    const std::string& did,
    std::string_view password) {
    auto secret = key_store_->Retrieve(did, password);
    if (secret.IsErr()) {
        return AuthOutcome::Err(SessionFailure::FromKeyStoreFailure(secret.UnwrapErr()));
    }
    auto identity_result = DidIdentity::FromSecretKey(std::move(secret).Unwrap());
    if (identity_result.IsErr()) {
        return AuthOutcome::Err(SessionFailure::FromIdentityFailure(identity_result.UnwrapErr()));
    }
    const DidIdentity& identity = identity_result.Unwrap();
    if (identity.GetDid() != did) {
        return AuthOutcome::Err(SessionFailure::Identity("Stored key does not belong to the wallet's DID"));
    }
    auto encryption_public_key = EncryptionPublicKey(identity);
    if (encryption_public_key.IsErr()) {
        return AuthOutcome::Err(std::move(encryption_public_key).UnwrapErr());
    }
    StartSession(did, wallet);
    return AuthOutcome::Ok(AuthResult{
        identity.GetDid(),
        identity.GetPublicKeyBase64(),
        std::move(encryption_public_key).Unwrap(),
        false});
}

AuthOutcome SessionManager::AuthenticateNew(
    const std::string& wallet,
    std::string_view password,
    interfaces::IWalletSigner* wallet_signer) {
    auto generated = DidIdentity::Generate();
    if (generated.IsErr()) {
        return AuthOutcome::Err(SessionFailure::FromIdentityFailure(generated.UnwrapErr()));
    }
    const DidIdentity& identity = generated.Unwrap();
    auto encryption_public_key = EncryptionPublicKey(identity);
    if (encryption_public_key.IsErr()) {
        return AuthOutcome::Err(std::move(encryption_public_key).UnwrapErr());
    }

    if (auto stored = key_store_->Store(identity.GetSecretKeyHandle(), password, identity.GetDid());
        stored.IsErr()) {
        return AuthOutcome::Err(SessionFailure::FromKeyStoreFailure(stored.UnwrapErr()));
    }
    wallet_directory_->SetDid(wallet, identity.GetDid());

    if (wallet_signer != nullptr) {
        if (auto linked = LinkWallet(identity, wallet, *wallet_signer); linked.IsErr()) {
            if (auto removed = key_store_->Delete(identity.GetDid()); removed.IsErr()) {
                debug::LogFailureCode(debug::Component::Session, "ROLLBACK", removed.UnwrapErr().message);
            }
            wallet_directory_->Remove(wallet);
            return AuthOutcome::Err(std::move(linked).UnwrapErr());
        }
    }

    StartSession(identity.GetDid(), wallet);
    return AuthOutcome::Ok(AuthResult{
        identity.GetDid(),
        identity.GetPublicKeyBase64(),
        std::move(encryption_public_key).Unwrap(),
        true});
}

Result<Unit, SessionFailure> SessionManager::LinkWallet(
    const DidIdentity& identity,
    const std::string& wallet,
    interfaces::IWalletSigner& wallet_signer) {
    if (!registration_client_) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::RegistrationFailed("No registration client configured"));
    }
    const int64_t timestamp = ToUnixSeconds(clock_());
    std::string nonce = LinkingChallenge::GenerateNonce();
    const std::string challenge = LinkingChallenge::Create(wallet, identity.GetDid(), timestamp, nonce);

    auto signature = wallet_signer.SignMessage(challenge);
    if (signature.IsErr()) {
        return Result<Unit, SessionFailure>::Err(std::move(signature).UnwrapErr());
    }
    RegistrationRequest request{
        identity.GetDid(),
        identity.GetPublicKeyBase64(),
        wallet,
        std::move(signature).Unwrap(),
        timestamp,
        std::move(nonce)};
    return registration_client_->Register(request);
}

void SessionManager::StartSession(std::string did, std::string wallet) {
    const TimePoint now = clock_();
    std::lock_guard guard(session_lock_);
    WC_LOG_SUBJECT(debug::Component::Session, "SESSION_STARTED", did);
    session_ = Session{std::move(did), std::move(wallet), now, now + settings_.session_duration};
}

std::optional<Session> SessionManager::CurrentSessionLocked(const TimePoint now) {
    if (session_.has_value() && now > session_->expires_at) {
        WC_LOG_SUBJECT(debug::Component::Session, "SESSION_EXPIRED", session_->did);
        session_.reset();
    }
    return session_;
}

std::optional<Session> SessionManager::GetSession() {
    const TimePoint now = clock_();
    std::lock_guard guard(session_lock_);
    return CurrentSessionLocked(now);
}

bool SessionManager::RefreshSession() {
    const TimePoint now = clock_();
    std::lock_guard guard(session_lock_);
    if (!CurrentSessionLocked(now).has_value()) {
        return false;
    }
    session_->created_at = now;
    session_->expires_at = now + settings_.session_duration;
    return true;
}

uint32_t SessionManager::GetSessionRemainingSeconds() {
    const TimePoint now = clock_();
    std::lock_guard guard(session_lock_);
    const auto current = CurrentSessionLocked(now);
    if (!current.has_value() || current->expires_at <= now) {
        return 0;
    }
    return static_cast<uint32_t>(std::chrono::ceil<std::chrono::seconds>(current->expires_at - now).count());
}

bool SessionManager::IsSessionExpiringSoon() {
    const uint32_t remaining = GetSessionRemainingSeconds();
    return remaining > 0 && static_cast<int64_t>(remaining) < settings_.expiring_soon_threshold.count();
}

Result<bool, SessionFailure> SessionManager::IsAuthenticated() {
    const auto current = GetSession();
    if (!current.has_value()) {
        return Result<bool, SessionFailure>::Ok(false);
    }
    return key_store_->Exists(current->did).MapErr([](KeyStoreFailure failure) {
        return SessionFailure::FromKeyStoreFailure(failure);
    });
}

Result<bool, SessionFailure> SessionManager::UserExistsForWallet(std::string_view wallet_address) {
    const auto did = wallet_directory_->GetDid(wallet_address);
    if (!did.has_value()) {
        return Result<bool, SessionFailure>::Ok(false);
    }
    return key_store_->Exists(*did).MapErr([](KeyStoreFailure failure) {
        return SessionFailure::FromKeyStoreFailure(failure);
    });
}

Result<DidIdentity, SessionFailure> SessionManager::UnlockIdentity(std::string_view password) {
    const auto current = GetSession();
    if (!current.has_value()) {
        return Result<DidIdentity, SessionFailure>::Err(SessionFailure::NoSession("No active session"));
    }
    auto secret = key_store_->Retrieve(current->did, password);
    if (secret.IsErr()) {
        return Result<DidIdentity, SessionFailure>::Err(SessionFailure::FromKeyStoreFailure(secret.UnwrapErr()));
    }
    return DidIdentity::FromSecretKey(std::move(secret).Unwrap()).MapErr([](IdentityFailure failure) {
        return SessionFailure::FromIdentityFailure(failure);
    });
}

Result<bool, SessionFailure> SessionManager::CheckPassword(std::string_view password) {
    const auto current = GetSession();
    if (!current.has_value()) {
        return Result<bool, SessionFailure>::Ok(false);
    }
    return key_store_->VerifyPassword(current->did, password).MapErr([](KeyStoreFailure failure) {
        return SessionFailure::FromKeyStoreFailure(failure);
    });
}

void SessionManager::SignOut() {
    std::lock_guard guard(session_lock_);
    session_.reset();
}

Result<Unit, SessionFailure> SessionManager::RemoveUserFromDevice() {
    const auto current = GetSession();
    if (!current.has_value()) {
        return Result<Unit, SessionFailure>::Ok(unit);
    }
    if (auto removed = key_store_->Delete(current->did); removed.IsErr()) {
        return Result<Unit, SessionFailure>::Err(SessionFailure::FromKeyStoreFailure(removed.UnwrapErr()));
    }
    wallet_directory_->Remove(current->wallet_address);
    SignOut();
    return Result<Unit, SessionFailure>::Ok(unit);
}

}
