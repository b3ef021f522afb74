#include "witnesschain/keystore/file_key_record_store.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "witnesschain/encoding/text_codecs.hpp"
#include "witnesschain/core/constants.hpp"
#include "witnesschain/debug/audit_log.hpp"

#include <fstream>
#include <iterator>
#include <mutex>
#include <system_error>

namespace witnesschain::vault::keystore {

namespace fs = std::filesystem;

namespace {
KeyStoreFailure IoFailure(const std::string& operation, const fs::path& path, const std::error_code& ec) {
    return KeyStoreFailure::Storage(operation + " failed for " + path.string() + ": " + ec.message());
}

bool IsRecordFile(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec) &&
           entry.path().extension() == fs::path(KeyStoreConstants::RECORD_FILE_EXTENSION);
}
}

Result<std::unique_ptr<FileKeyRecordStore>, KeyStoreFailure> FileKeyRecordStore::Open(fs::path directory) {
    using OpenResult = Result<std::unique_ptr<FileKeyRecordStore>, KeyStoreFailure>;
    if (directory.empty()) {
        return OpenResult::Err(KeyStoreFailure::InvalidInput("Key store directory must not be empty"));
    }
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return OpenResult::Err(IoFailure("create_directories", directory, ec));
    }
    fs::permissions(directory, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        return OpenResult::Err(IoFailure("permissions", directory, ec));
    }
    return OpenResult::Ok(std::unique_ptr<FileKeyRecordStore>(new FileKeyRecordStore(std::move(directory))));
}

FileKeyRecordStore::FileKeyRecordStore(fs::path directory)
    : directory_(std::move(directory)) {}

fs::path FileKeyRecordStore::PathFor(std::string_view did) const {
    const auto digest = crypto::SodiumInterop::Sha256(encoding::AsBytes(did));
    std::string file_name = encoding::Hex::Encode(digest);
    file_name += KeyStoreConstants::RECORD_FILE_EXTENSION;
    return directory_ / file_name;
}

Result<std::optional<EncryptedKeyRecord>, KeyStoreFailure> FileKeyRecordStore::ReadRecord(
    const fs::path& path) const {
    using ReadResult = Result<std::optional<EncryptedKeyRecord>, KeyStoreFailure>;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return ReadResult::Err(IoFailure("exists", path, ec));
        }
        return ReadResult::Ok(std::nullopt);
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return ReadResult::Err(KeyStoreFailure::Storage("Cannot open key record " + path.string()));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return ReadResult::Err(KeyStoreFailure::Storage("Cannot read key record " + path.string()));
    }
    auto parsed = EncryptedKeyRecord::Parse(bytes);
    if (parsed.IsErr()) {
        return ReadResult::Err(std::move(parsed).UnwrapErr());
    }
    return ReadResult::Ok(std::move(parsed).Unwrap());
}

Result<std::optional<EncryptedKeyRecord>, KeyStoreFailure> FileKeyRecordStore::Get(std::string_view did) {
    std::shared_lock guard(lock_);
    auto result = ReadRecord(PathFor(did));
    if (result.IsOk() && result.Unwrap().has_value() && result.Unwrap()->did != did) {
        return Result<std::optional<EncryptedKeyRecord>, KeyStoreFailure>::Err(
            KeyStoreFailure::Storage("Key record does not belong to the requested DID"));
    }
    return result;
}

Result<Unit, KeyStoreFailure> FileKeyRecordStore::Put(const EncryptedKeyRecord& record) {
    const fs::path target = PathFor(record.did);
    fs::path temp = target;
    temp += KeyStoreConstants::TEMP_FILE_SUFFIX;
    const std::string bytes = record.Serialize();

    std::unique_lock guard(lock_);
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Result<Unit, KeyStoreFailure>::Err(
                KeyStoreFailure::Storage("Cannot create key record " + temp.string()));
        }
        output.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        output.flush();
        if (!output) {
            return Result<Unit, KeyStoreFailure>::Err(
                KeyStoreFailure::Storage("Cannot write key record " + temp.string()));
        }
    }
    std::error_code ec;
    fs::permissions(temp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Result<Unit, KeyStoreFailure>::Err(IoFailure("permissions", temp, ec));
    }
    fs::rename(temp, target, ec);
    if (ec) {
        const std::error_code rename_error = ec;
        fs::remove(temp, ec);
        return Result<Unit, KeyStoreFailure>::Err(IoFailure("rename", target, rename_error));
    }
    WC_LOG_SUBJECT(debug::Component::KeyStore, "PERSISTED", record.did);
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<Unit, KeyStoreFailure> FileKeyRecordStore::Delete(std::string_view did) {
    const fs::path target = PathFor(did);
    std::unique_lock guard(lock_);
    std::error_code ec;
    fs::remove(target, ec);
    if (ec) {
        return Result<Unit, KeyStoreFailure>::Err(IoFailure("remove", target, ec));
    }
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<std::vector<std::string>, KeyStoreFailure> FileKeyRecordStore::GetAllKeys() {
    using ListResult = Result<std::vector<std::string>, KeyStoreFailure>;
    std::shared_lock guard(lock_);
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return ListResult::Err(IoFailure("directory_iterator", directory_, ec));
    }
    std::vector<std::string> dids;
    for (const auto& entry : it) {
        if (!IsRecordFile(entry)) {
            continue;
        }
        auto record = ReadRecord(entry.path());
        if (record.IsErr()) {
            return ListResult::Err(std::move(record).UnwrapErr());
        }
        if (auto& value = record.Unwrap(); value.has_value()) {
            dids.push_back(std::move(value->did));
        }
    }
    return ListResult::Ok(std::move(dids));
}

Result<Unit, KeyStoreFailure> FileKeyRecordStore::Clear() {
    std::unique_lock guard(lock_);
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return Result<Unit, KeyStoreFailure>::Err(IoFailure("directory_iterator", directory_, ec));
    }
    std::vector<fs::path> doomed;
    for (const auto& entry : it) {
        if (IsRecordFile(entry)) {
            doomed.push_back(entry.path());
        }
    }
    for (const auto& path : doomed) {
        fs::remove(path, ec);
        if (ec) {
            return Result<Unit, KeyStoreFailure>::Err(IoFailure("remove", path, ec));
        }
    }
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

}
