#pragma once
#include "witnesschain/interfaces/i_key_record_store.hpp"
#include <map>
#include <shared_mutex>

namespace witnesschain::vault::keystore {

class InMemoryKeyRecordStore final : public interfaces::IKeyRecordStore {
public:
    InMemoryKeyRecordStore() = default;

    Result<std::optional<EncryptedKeyRecord>, KeyStoreFailure> Get(std::string_view did) override;
    Result<Unit, KeyStoreFailure> Put(const EncryptedKeyRecord& record) override;
    Result<Unit, KeyStoreFailure> Delete(std::string_view did) override;
    Result<std::vector<std::string>, KeyStoreFailure> GetAllKeys() override;
    Result<Unit, KeyStoreFailure> Clear() override;

private:
    mutable std::shared_mutex lock_;
    std::map<std::string, EncryptedKeyRecord, std::less<>> records_;
};

}
