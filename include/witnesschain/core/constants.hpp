#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace witnesschain::vault {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SEED_SIZE = 32;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t SYMMETRIC_KEY_SIZE = 32;
    static constexpr size_t XSALSA20_NONCE_SIZE = 24;
    static constexpr size_t POLY1305_TAG_SIZE = 16;
    static constexpr size_t SHA_256_DIGEST_SIZE = 32;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t PBKDF2_SALT_SIZE = 16;
    static constexpr uint32_t PBKDF2_MIN_ITERATIONS = 100000;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct DidConstants {
    static constexpr std::string_view DID_KEY_PREFIX = "did:key:z";
    static constexpr uint8_t ED_25519_MULTICODEC_0 = 0xED;
    static constexpr uint8_t ED_25519_MULTICODEC_1 = 0x01;
    static constexpr size_t MULTICODEC_PREFIX_SIZE = 2;
    // base58btc of the 34-byte multicodec key never exceeds this.
    static constexpr size_t MAX_IDENTIFIER_LENGTH = 48;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_PBKDF2 = "PBKDF2";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view PARAM_PASSWORD = "pass";
    static constexpr std::string_view PARAM_SALT = "salt";
    static constexpr std::string_view PARAM_ITERATIONS = "iter";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct CapabilityConstants {
    static constexpr uint32_t TOKEN_VERSION = 1;
    static constexpr size_t TOKEN_NONCE_SIZE = 16;
    static constexpr size_t MAX_RESOURCE_ID_LENGTH = 128;
    static constexpr std::string_view EVIDENCE_NAMESPACE = ":evidence/";
    static constexpr std::string_view WILDCARD = "*";
    static constexpr uint8_t CID_VERSION = 0x01;
    static constexpr uint8_t CID_RAW_CODEC = 0x55;
    static constexpr uint8_t MULTIHASH_SHA2_256 = 0x12;
    static constexpr uint8_t MULTIHASH_SHA2_256_LENGTH = 0x20;
};
struct KeyStoreConstants {
    static constexpr uint32_t RECORD_VERSION = 1;
    static constexpr std::string_view RECORD_FILE_EXTENSION = ".wckey";
    static constexpr std::string_view TEMP_FILE_SUFFIX = ".tmp";
    static constexpr size_t ATTEMPT_LOCK_STRIPES = 64;
};
struct SessionConstants {
    static constexpr size_t MIN_NONCE_LENGTH = 16;
    static constexpr size_t MAX_NONCE_LENGTH = 64;
    static constexpr size_t WALLET_ADDRESS_HEX_DIGITS = 40;
};
}
