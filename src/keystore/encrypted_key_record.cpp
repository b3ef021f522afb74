#include "witnesschain/keystore/encrypted_key_record.hpp"

#include "keystore/key_record.pb.h"

namespace witnesschain::vault::keystore {

std::string EncryptedKeyRecord::Serialize() const {
    proto::keystore::EncryptedKeyRecord message;
    message.set_version(version);
    message.set_did(did);
    message.set_salt(salt.data(), salt.size());
    message.set_iv(iv.data(), iv.size());
    message.set_ciphertext(ciphertext.data(), ciphertext.size());
    message.set_created_at(created_at);
    message.set_kdf_iterations(kdf_iterations);
    return message.SerializeAsString();
}

Result<EncryptedKeyRecord, KeyStoreFailure> EncryptedKeyRecord::Parse(std::span<const uint8_t> bytes) {
    using ParseResult = Result<EncryptedKeyRecord, KeyStoreFailure>;
    proto::keystore::EncryptedKeyRecord message;
    if (bytes.empty() || !message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return ParseResult::Err(KeyStoreFailure::Storage("Key record is corrupted"));
    }
    if (message.version() != KeyStoreConstants::RECORD_VERSION) {
        return ParseResult::Err(KeyStoreFailure::Storage(
            "Unsupported key record version " + std::to_string(message.version())));
    }
    EncryptedKeyRecord record;
    record.version = message.version();
    record.did = message.did();
    record.salt.assign(message.salt().begin(), message.salt().end());
    record.iv.assign(message.iv().begin(), message.iv().end());
    record.ciphertext.assign(message.ciphertext().begin(), message.ciphertext().end());
    record.created_at = message.created_at();
    record.kdf_iterations = message.kdf_iterations();
    return ParseResult::Ok(std::move(record));
}

}
