#pragma once
#include "witnesschain/interfaces/i_key_record_store.hpp"
#include <filesystem>
#include <memory>
#include <shared_mutex>

namespace witnesschain::vault::keystore {

/**
 * One file per DID under a directory, named <hex sha256(did)>.wckey so the
 * DID never appears in a path. Writes go to a temporary file that is then
 * renamed over the target; files are readable by the owner only.
 */
class FileKeyRecordStore final : public interfaces::IKeyRecordStore {
public:
    static Result<std::unique_ptr<FileKeyRecordStore>, KeyStoreFailure> Open(
        std::filesystem::path directory);

    Result<std::optional<EncryptedKeyRecord>, KeyStoreFailure> Get(std::string_view did) override;
    Result<Unit, KeyStoreFailure> Put(const EncryptedKeyRecord& record) override;
    Result<Unit, KeyStoreFailure> Delete(std::string_view did) override;
    Result<std::vector<std::string>, KeyStoreFailure> GetAllKeys() override;
    Result<Unit, KeyStoreFailure> Clear() override;

    [[nodiscard]] const std::filesystem::path& Directory() const noexcept { return directory_; }

    [[nodiscard]] std::filesystem::path PathFor(std::string_view did) const;

private:
    explicit FileKeyRecordStore(std::filesystem::path directory);

    Result<std::optional<EncryptedKeyRecord>, KeyStoreFailure> ReadRecord(
        const std::filesystem::path& path) const;

    std::filesystem::path directory_;
    mutable std::shared_mutex lock_;
};

}
