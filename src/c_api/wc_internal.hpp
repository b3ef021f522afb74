/**
 * @file wc_internal.hpp
 * @brief Internal handle types and helpers for the WitnessChain C API
 *
 * This header is NOT part of the public API.
 */

#ifndef WC_INTERNAL_HPP
#define WC_INTERNAL_HPP

#include "witnesschain/c_api/wc_api.h"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/capability/capability_authority.hpp"
#include "witnesschain/identity/did_identity.hpp"
#include "witnesschain/keystore/secure_key_store.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

/**
 * @brief Opaque handle owning one did:key identity
 */
struct WcIdentityHandle {
    std::unique_ptr<witnesschain::vault::identity::DidIdentity> identity;
};

/**
 * @brief Opaque handle owning a key store and its backend
 */
struct WcKeyStoreHandle {
    std::unique_ptr<witnesschain::vault::keystore::SecureKeyStore> key_store;
};

namespace wc::internal {

using namespace witnesschain::vault;

/**
 * @brief Ensure libsodium is initialized
 * @return WC_SUCCESS if initialized, error code otherwise
 */
WcErrorCode EnsureInitialized();

void fill_error(WcError* out_error, WcErrorCode code, const std::string& message);

WcErrorCode fill_error_from_failure(WcError* out_error, const IdentityFailure& failure);
WcErrorCode fill_error_from_failure(WcError* out_error, const EncryptionFailure& failure);
WcErrorCode fill_error_from_failure(WcError* out_error, const KeyStoreFailure& failure);
WcErrorCode fill_error_from_failure(WcError* out_error, const CapabilityFailure& failure);
WcErrorCode fill_error_from_failure(WcError* out_error, const SodiumFailure& failure);

/**
 * @brief Validate a buffer parameter (data pointer vs length)
 * @return true if valid, false otherwise (fills out_error)
 */
bool validate_buffer_param(const uint8_t* data, size_t length, WcError* out_error);

/**
 * @brief Validate an output pointer is not null
 * @return true if valid, false otherwise (fills out_error)
 */
bool validate_output_handle(const void* handle, WcError* out_error);

/**
 * @brief Validate a NUL-terminated string argument is present and non-empty
 */
bool validate_text_param(const char* text, const char* name, WcError* out_error);

bool validate_identity_handle(const WcIdentityHandle* handle, WcError* out_error);

/**
 * @brief Copy data to an output buffer (allocates memory)
 * @return true on success, false on failure (fills out_error)
 */
bool copy_to_buffer(std::span<const uint8_t> input, WcBuffer* out_buffer, WcError* out_error);

/**
 * @brief Copy text to an output buffer with a trailing NUL not counted in length
 */
bool copy_text_to_buffer(std::string_view text, WcBuffer* out_buffer, WcError* out_error);

/// Authority shared by the capability entry points, on the system clock.
const capability::CapabilityAuthority& DefaultAuthority();

} // namespace wc::internal

#endif // WC_INTERNAL_HPP
