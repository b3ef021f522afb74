#include "witnesschain/encryption/encrypted_file_payload.hpp"

#include "encryption/file_envelope.pb.h"

namespace witnesschain::vault::encryption {

std::string EncryptedUpload::Serialize() const {
    proto::encryption::EncryptedFileEnvelope envelope;
    envelope.set_encrypted_data(payload.encrypted_data.data(), payload.encrypted_data.size());
    envelope.set_encrypted_key(payload.encrypted_key);
    envelope.set_ephemeral_public_key(payload.ephemeral_public_key);
    envelope.set_file_nonce(payload.file_nonce);
    envelope.set_key_nonce(payload.key_nonce);
    envelope.set_content_hash(payload.content_hash);
    envelope.set_original_size(payload.original_size);
    envelope.set_mime_type(mime_type);
    envelope.set_file_name(file_name);
    return envelope.SerializeAsString();
}

Result<EncryptedUpload, EncryptionFailure> EncryptedUpload::Parse(std::span<const uint8_t> bytes) {
    proto::encryption::EncryptedFileEnvelope envelope;
    if (bytes.empty() || !envelope.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<EncryptedUpload, EncryptionFailure>::Err(
            EncryptionFailure::InvalidFormat("Encrypted file envelope could not be parsed"));
    }
    EncryptedUpload upload;
    const auto& data = envelope.encrypted_data();
    upload.payload.encrypted_data.assign(data.begin(), data.end());
    upload.payload.encrypted_key = envelope.encrypted_key();
    upload.payload.ephemeral_public_key = envelope.ephemeral_public_key();
    upload.payload.file_nonce = envelope.file_nonce();
    upload.payload.key_nonce = envelope.key_nonce();
    upload.payload.content_hash = envelope.content_hash();
    upload.payload.original_size = envelope.original_size();
    upload.mime_type = envelope.mime_type();
    upload.file_name = envelope.file_name();
    return Result<EncryptedUpload, EncryptionFailure>::Ok(std::move(upload));
}

}
