#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/keystore/encrypted_key_record.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace witnesschain::vault::interfaces {

/**
 * Persistence backend for key records: a single collection keyed by DID.
 * Put overwrites. Implementations must be safe to call from several
 * threads; only I/O faults are reported as errors.
 */
class IKeyRecordStore {
public:
    virtual ~IKeyRecordStore() = default;

    [[nodiscard]] virtual Result<std::optional<keystore::EncryptedKeyRecord>, KeyStoreFailure> Get(
        std::string_view did) = 0;

    [[nodiscard]] virtual Result<Unit, KeyStoreFailure> Put(
        const keystore::EncryptedKeyRecord& record) = 0;

    /// Deleting an absent DID is not an error.
    [[nodiscard]] virtual Result<Unit, KeyStoreFailure> Delete(std::string_view did) = 0;

    [[nodiscard]] virtual Result<std::vector<std::string>, KeyStoreFailure> GetAllKeys() = 0;

    [[nodiscard]] virtual Result<Unit, KeyStoreFailure> Clear() = 0;
};

}
