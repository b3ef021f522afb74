#pragma once

#include "witnesschain/c_api/wc_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define WC_API_VERSION_MAJOR 1
#define WC_API_VERSION_MINOR 0
#define WC_API_VERSION_PATCH 0

typedef enum {
    WC_SUCCESS = 0,
    WC_ERROR_GENERIC = 1,
    WC_ERROR_INVALID_INPUT = 2,
    WC_ERROR_KEY_GENERATION = 3,
    WC_ERROR_INVALID_DID = 4,
    WC_ERROR_ENCRYPTION = 5,
    WC_ERROR_DECRYPTION = 6,
    WC_ERROR_ACCESS_DENIED = 7,
    WC_ERROR_DECODE = 8,
    WC_ERROR_BUFFER_TOO_SMALL = 9,
    WC_ERROR_OUT_OF_MEMORY = 10,
    WC_ERROR_SODIUM_FAILURE = 11,
    WC_ERROR_NULL_POINTER = 12,
    WC_ERROR_KEY_NOT_FOUND = 13,
    WC_ERROR_INVALID_PASSWORD = 14,
    WC_ERROR_RATE_LIMITED = 15,
    WC_ERROR_STORAGE = 16,
    WC_ERROR_CAPABILITY = 17
} WcErrorCode;

typedef struct WcIdentityHandle WcIdentityHandle;
typedef struct WcKeyStoreHandle WcKeyStoreHandle;

// Library-allocated bytes. Text outputs (DIDs, signatures, tokens) carry a
// trailing NUL that is not counted in length. Release with wc_buffer_free.
typedef struct WcBuffer {
    uint8_t* data;
    size_t length;
} WcBuffer;

typedef struct WcError {
    WcErrorCode code;
    char* message;
} WcError;

WC_API const char* wc_version(void);

WC_API WcErrorCode wc_init(void);

// ----------------------------------------------------------------------------
// Identity
// ----------------------------------------------------------------------------

WC_API WcErrorCode wc_identity_generate(
    WcIdentityHandle** out_handle,
    WcError* out_error);

// secret_key is a 64-byte Ed25519 signing key; the caller keeps its copy.
WC_API WcErrorCode wc_identity_restore(
    const uint8_t* secret_key,
    size_t secret_key_length,
    WcIdentityHandle** out_handle,
    WcError* out_error);

WC_API WcErrorCode wc_identity_get_did(
    const WcIdentityHandle* handle,
    WcBuffer* out_did,
    WcError* out_error);

WC_API WcErrorCode wc_identity_get_public_key(
    const WcIdentityHandle* handle,
    uint8_t* out_key,
    size_t out_key_length,
    WcError* out_error);

// X25519 public key derived from the signing key (32 raw bytes).
WC_API WcErrorCode wc_identity_get_encryption_public_key(
    const WcIdentityHandle* handle,
    uint8_t* out_key,
    size_t out_key_length,
    WcError* out_error);

// Detached Ed25519 signature, base64 text.
WC_API WcErrorCode wc_identity_sign(
    const WcIdentityHandle* handle,
    const uint8_t* message,
    size_t message_length,
    WcBuffer* out_signature,
    WcError* out_error);

WC_API WcErrorCode wc_identity_verify(
    const char* did,
    const char* signature_base64,
    const uint8_t* message,
    size_t message_length,
    bool* out_valid,
    WcError* out_error);

WC_API bool wc_did_is_valid(const char* did);

WC_API void wc_identity_destroy(WcIdentityHandle* handle);

// ----------------------------------------------------------------------------
// File encryption
// ----------------------------------------------------------------------------

// Produces a serialized envelope holding the ciphertext and its metadata.
// mime_type and file_name may be NULL.
WC_API WcErrorCode wc_file_encrypt(
    const uint8_t* plaintext,
    size_t plaintext_length,
    const uint8_t* recipient_public_key,
    size_t recipient_public_key_length,
    const char* mime_type,
    const char* file_name,
    WcBuffer* out_envelope,
    WcError* out_error);

WC_API WcErrorCode wc_file_decrypt(
    const uint8_t* envelope,
    size_t envelope_length,
    const uint8_t* recipient_secret_key,
    size_t recipient_secret_key_length,
    WcBuffer* out_plaintext,
    WcError* out_error);

WC_API WcErrorCode wc_file_decrypt_with_identity(
    const uint8_t* envelope,
    size_t envelope_length,
    const WcIdentityHandle* identity,
    WcBuffer* out_plaintext,
    WcError* out_error);

WC_API WcErrorCode wc_content_hash_verify(
    const uint8_t* plaintext,
    size_t plaintext_length,
    const char* expected_hash,
    bool* out_matches,
    WcError* out_error);

// ----------------------------------------------------------------------------
// Key store
// ----------------------------------------------------------------------------

// directory == NULL keeps records in memory. kdf_iterations == 0 selects the
// default work factor.
WC_API WcErrorCode wc_keystore_open(
    const char* directory,
    uint32_t kdf_iterations,
    WcKeyStoreHandle** out_handle,
    WcError* out_error);

WC_API WcErrorCode wc_keystore_store(
    WcKeyStoreHandle* handle,
    const WcIdentityHandle* identity,
    const char* password,
    WcError* out_error);

// WC_ERROR_RATE_LIMITED while the DID is locked out; see
// wc_keystore_rate_limit_status for the remaining time.
WC_API WcErrorCode wc_keystore_unlock(
    WcKeyStoreHandle* handle,
    const char* did,
    const char* password,
    WcIdentityHandle** out_identity,
    WcError* out_error);

WC_API WcErrorCode wc_keystore_exists(
    WcKeyStoreHandle* handle,
    const char* did,
    bool* out_exists,
    WcError* out_error);

WC_API WcErrorCode wc_keystore_delete(
    WcKeyStoreHandle* handle,
    const char* did,
    WcError* out_error);

WC_API WcErrorCode wc_keystore_rate_limit_status(
    const WcKeyStoreHandle* handle,
    const char* did,
    uint32_t* out_remaining_seconds,
    WcError* out_error);

WC_API void wc_keystore_close(WcKeyStoreHandle* handle);

// ----------------------------------------------------------------------------
// Capabilities
// ----------------------------------------------------------------------------

WC_API WcErrorCode wc_capability_issue_upload(
    const WcIdentityHandle* issuer,
    WcBuffer* out_token,
    WcError* out_error);

WC_API WcErrorCode wc_capability_issue_read(
    const WcIdentityHandle* issuer,
    const char* evidence_id,
    WcBuffer* out_token,
    WcError* out_error);

// ttl_seconds == 0 selects the read lifetime.
WC_API WcErrorCode wc_capability_delegate_read(
    const WcIdentityHandle* issuer,
    const char* audience_did,
    const char* evidence_id,
    uint64_t ttl_seconds,
    WcBuffer* out_token,
    WcError* out_error);

// action is the string form, e.g. "witnesschain/evidence/read".
// resource_id and requester_did may be NULL. A denial is not an error:
// out_allowed is false and out_reason, when non-NULL, receives the reason.
WC_API WcErrorCode wc_capability_check(
    const char* token,
    const char* action,
    const char* resource_id,
    const char* requester_did,
    bool* out_allowed,
    WcBuffer* out_reason,
    WcError* out_error);

// ----------------------------------------------------------------------------
// Memory & errors
// ----------------------------------------------------------------------------

// Wipes and releases buffer->data; the WcBuffer itself belongs to the caller.
WC_API void wc_buffer_free(WcBuffer* buffer);

WC_API void wc_error_free(WcError* error);

WC_API const char* wc_error_string(WcErrorCode code);

WC_API WcErrorCode wc_secure_wipe(
    uint8_t* data,
    size_t length);

#ifdef __cplusplus
}
#endif
