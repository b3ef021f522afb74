#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/core/clock.hpp"
#include "witnesschain/configuration/vault_config.hpp"
#include "witnesschain/identity/did_identity.hpp"
#include "witnesschain/interfaces/i_registration_client.hpp"
#include "witnesschain/interfaces/i_wallet_directory.hpp"
#include "witnesschain/interfaces/i_wallet_signer.hpp"
#include "witnesschain/keystore/secure_key_store.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace witnesschain::vault::session {

/// Who is signed in and until when. Holds no secrets.
struct Session {
    std::string did;
    std::string wallet_address;
    TimePoint created_at;
    TimePoint expires_at;
};

struct AuthResult {
    std::string did;
    /// Base64 Ed25519 public key.
    std::string public_key;
    /// Base64 X25519 public key derived from the signing key.
    std::string encryption_public_key;
    bool is_new_user = false;
};

/**
 * @brief Client-side sign-in flow tying a wallet to a password-protected DID
 *
 * A wallet seen before is unlocked with its password. A new wallet gets a
 * fresh identity whose key is stored under the password; when a wallet
 * signer is supplied the identity is linked by signing a challenge and
 * registering with the API, and any failure there removes the stored key
 * and the wallet mapping again.
 *
 * Sessions last session_duration from sign-in or the latest refresh and
 * are dropped on first access after they expire.
 */
class SessionManager {
public:
    SessionManager(
        std::shared_ptr<keystore::SecureKeyStore> key_store,
        std::shared_ptr<interfaces::IWalletDirectory> wallet_directory,
        std::shared_ptr<interfaces::IRegistrationClient> registration_client,
        configuration::SessionSettings settings = configuration::SessionSettings::Default(),
        Clock clock = SystemClock());

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    [[nodiscard]] Result<AuthResult, SessionFailure> Authenticate(
        std::string_view wallet_address,
        std::string_view password,
        interfaces::IWalletSigner* wallet_signer = nullptr);

    [[nodiscard]] std::optional<Session> GetSession();

    /// Restarts the session clock; false without a live session.
    bool RefreshSession();

    [[nodiscard]] uint32_t GetSessionRemainingSeconds();

    [[nodiscard]] bool IsSessionExpiringSoon();

    /// A live session whose DID still has a stored key.
    [[nodiscard]] Result<bool, SessionFailure> IsAuthenticated();

    [[nodiscard]] Result<bool, SessionFailure> UserExistsForWallet(std::string_view wallet_address);

    /// Decrypts the session's signing key. The identity owns and wipes it.
    [[nodiscard]] Result<identity::DidIdentity, SessionFailure> UnlockIdentity(std::string_view password);

    [[nodiscard]] Result<bool, SessionFailure> CheckPassword(std::string_view password);

    /// Ends the session; the stored key stays.
    void SignOut();

    /// Deletes the stored key and the wallet mapping, then ends the session.
    Result<Unit, SessionFailure> RemoveUserFromDevice();

private:
    Result<AuthResult, SessionFailure> AuthenticateExisting(
        const std::string& wallet,
        const std::string& did,
        std::string_view password);

    Result<AuthResult, SessionFailure> AuthenticateNew(
        const std::string& wallet,
        std::string_view password,
        interfaces::IWalletSigner* wallet_signer);

    Result<Unit, SessionFailure> LinkWallet(
        const identity::DidIdentity& identity,
        const std::string& wallet,
        interfaces::IWalletSigner& wallet_signer);

    void StartSession(std::string did, std::string wallet);

    std::optional<Session> CurrentSessionLocked(TimePoint now);

    std::shared_ptr<keystore::SecureKeyStore> key_store_;
    std::shared_ptr<interfaces::IWalletDirectory> wallet_directory_;
    std::shared_ptr<interfaces::IRegistrationClient> registration_client_;
    configuration::SessionSettings settings_;
    Clock clock_;
    std::mutex session_lock_;
    std::optional<Session> session_;
};

}
