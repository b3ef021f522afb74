#include "witnesschain/keystore/in_memory_key_record_store.hpp"
#include <mutex>

namespace witnesschain::vault::keystore {

Result<std::optional<EncryptedKeyRecord>, KeyStoreFailure> InMemoryKeyRecordStore::Get(std::string_view did) {
    std::shared_lock guard(lock_);
    const auto it = records_.find(did);
    if (it == records_.end()) {
        return Result<std::optional<EncryptedKeyRecord>, KeyStoreFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<EncryptedKeyRecord>, KeyStoreFailure>::Ok(it->second);
}

Result<Unit, KeyStoreFailure> InMemoryKeyRecordStore::Put(const EncryptedKeyRecord& record) {
    std::unique_lock guard(lock_);
    records_.insert_or_assign(record.did, record);
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<Unit, KeyStoreFailure> InMemoryKeyRecordStore::Delete(std::string_view did) {
    std::unique_lock guard(lock_);
    if (const auto it = records_.find(did); it != records_.end()) {
        records_.erase(it);
    }
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<std::vector<std::string>, KeyStoreFailure> InMemoryKeyRecordStore::GetAllKeys() {
    std::shared_lock guard(lock_);
    std::vector<std::string> dids;
    dids.reserve(records_.size());
    for (const auto& [did, record] : records_) {
        dids.push_back(did);
    }
    return Result<std::vector<std::string>, KeyStoreFailure>::Ok(std::move(dids));
}

Result<Unit, KeyStoreFailure> InMemoryKeyRecordStore::Clear() {
    std::unique_lock guard(lock_);
    records_.clear();
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

}
