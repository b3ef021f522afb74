#include <catch2/catch_test_macros.hpp>
#include "witnesschain/keystore/in_memory_key_record_store.hpp"
#include "witnesschain/keystore/file_key_record_store.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"
#include "helpers/temp_directory.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
using namespace witnesschain::vault;
using namespace witnesschain::vault::keystore;
using witnesschain::vault::crypto::SodiumInterop;
using witnesschain::vault::test_helpers::TempDirectory;
namespace {
EncryptedKeyRecord MakeRecord(const std::string& did, uint8_t fill) {
    EncryptedKeyRecord record;
    record.did = did;
    record.salt.assign(16, fill);
    record.iv.assign(12, fill);
    record.ciphertext.assign(80, fill);
    record.created_at = 1700000000000;
    record.kdf_iterations = 100000;
    return record;
}
void ExerciseBackend(interfaces::IKeyRecordStore& store) {
    REQUIRE_FALSE(store.Get("did:key:zAlice").Unwrap().has_value());
    REQUIRE(store.Put(MakeRecord("did:key:zAlice", 0x01)).IsOk());
    REQUIRE(store.Put(MakeRecord("did:key:zBob", 0x02)).IsOk());
    auto alice = store.Get("did:key:zAlice").Unwrap();
    REQUIRE(alice.has_value());
    REQUIRE(alice->ciphertext == std::vector<uint8_t>(80, 0x01));
    REQUIRE(alice->created_at == 1700000000000);
    REQUIRE(alice->kdf_iterations == 100000);
    REQUIRE(store.Put(MakeRecord("did:key:zAlice", 0x03)).IsOk());
    REQUIRE(store.Get("did:key:zAlice").Unwrap()->salt == std::vector<uint8_t>(16, 0x03));
    auto keys = store.GetAllKeys().Unwrap();
    std::sort(keys.begin(), keys.end());
    REQUIRE(keys == std::vector<std::string>{"did:key:zAlice", "did:key:zBob"});
    REQUIRE(store.Delete("did:key:zAlice").IsOk());
    REQUIRE(store.Delete("did:key:zAlice").IsOk());
    REQUIRE_FALSE(store.Get("did:key:zAlice").Unwrap().has_value());
    REQUIRE(store.Clear().IsOk());
    REQUIRE(store.GetAllKeys().Unwrap().empty());
}
}
TEST_CASE("EncryptedKeyRecord - Serialization", "[keystore]") {
    SECTION("Round trip keeps every field") {
        const auto record = MakeRecord("did:key:zRecord", 0x5A);
        const auto bytes = record.Serialize();
        const auto parsed = EncryptedKeyRecord::Parse(
            std::span(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size())).Unwrap();
        REQUIRE(parsed.version == KeyStoreConstants::RECORD_VERSION);
        REQUIRE(parsed.did == record.did);
        REQUIRE(parsed.salt == record.salt);
        REQUIRE(parsed.iv == record.iv);
        REQUIRE(parsed.ciphertext == record.ciphertext);
    }
    SECTION("Unknown version is rejected") {
        auto record = MakeRecord("did:key:zRecord", 0x5A);
        record.version = 9;
        const auto bytes = record.Serialize();
        auto parsed = EncryptedKeyRecord::Parse(
            std::span(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == KeyStoreFailureType::Storage);
    }
    SECTION("Empty or truncated input is corrupt") {
        REQUIRE(EncryptedKeyRecord::Parse({}).IsErr());
        const std::vector<uint8_t> truncated = {0x12, 0x40, 'd'};
        REQUIRE(EncryptedKeyRecord::Parse(truncated).IsErr());
    }
}
TEST_CASE("InMemoryKeyRecordStore - Record lifecycle", "[keystore]") {
    InMemoryKeyRecordStore store;
    ExerciseBackend(store);
}
TEST_CASE("FileKeyRecordStore - Record lifecycle", "[keystore][filesystem]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const TempDirectory temp;
    auto store = FileKeyRecordStore::Open(temp.Path() / "keys").Unwrap();
    SECTION("Same contract as the in-memory backend") {
        ExerciseBackend(*store);
    }
    SECTION("File names do not reveal the DID") {
        REQUIRE(store->Put(MakeRecord("did:key:zAlice", 0x01)).IsOk());
        const auto path = store->PathFor("did:key:zAlice");
        REQUIRE(std::filesystem::exists(path));
        REQUIRE(path.filename().string().find("zAlice") == std::string::npos);
        REQUIRE(path.extension() == ".wckey");
        REQUIRE(path.filename().string().size() == 64 + 6);
    }
    SECTION("Records are owner-only") {
        REQUIRE(store->Put(MakeRecord("did:key:zAlice", 0x01)).IsOk());
        const auto perms = std::filesystem::status(store->PathFor("did:key:zAlice")).permissions();
        REQUIRE((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all)) ==
                std::filesystem::perms::none);
    }
    SECTION("Records survive reopening the directory") {
        REQUIRE(store->Put(MakeRecord("did:key:zAlice", 0x07)).IsOk());
        auto reopened = FileKeyRecordStore::Open(store->Directory()).Unwrap();
        REQUIRE(reopened->Get("did:key:zAlice").Unwrap()->iv == std::vector<uint8_t>(12, 0x07));
    }
    SECTION("Corrupted file is reported, not ignored") {
        REQUIRE(store->Put(MakeRecord("did:key:zAlice", 0x01)).IsOk());
        {
            std::ofstream output(store->PathFor("did:key:zAlice"), std::ios::binary | std::ios::trunc);
            output << "\xff\xff\xff";
        }
        auto result = store->Get("did:key:zAlice");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == KeyStoreFailureType::Storage);
    }
    SECTION("Unrelated files are left alone") {
        {
            std::ofstream output(store->Directory() / "notes.txt");
            output << "keep me";
        }
        REQUIRE(store->Put(MakeRecord("did:key:zAlice", 0x01)).IsOk());
        REQUIRE(store->GetAllKeys().Unwrap().size() == 1);
        REQUIRE(store->Clear().IsOk());
        REQUIRE(std::filesystem::exists(store->Directory() / "notes.txt"));
    }
    SECTION("Empty directory path is rejected") {
        REQUIRE(FileKeyRecordStore::Open("").IsErr());
    }
}
