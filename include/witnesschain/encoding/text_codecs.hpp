#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace witnesschain::vault::encoding {

/**
 * Bitcoin-alphabet base58, as used by multibase 'z'.
 * Decode is strict: no whitespace, no foreign characters, no empty input.
 */
class Base58 {
public:
    static std::string Encode(std::span<const uint8_t> data);
    static std::optional<std::vector<uint8_t>> Decode(std::string_view text);
private:
    Base58() = delete;
};

/**
 * Standard-alphabet, padded base64 (libsodium ORIGINAL variant).
 */
class Base64 {
public:
    static std::string Encode(std::span<const uint8_t> data);
    static std::optional<std::vector<uint8_t>> Decode(std::string_view text);
private:
    Base64() = delete;
};

/**
 * RFC 4648 base32, lower-case, unpadded (multibase 'b').
 */
class Base32 {
public:
    static std::string EncodeLower(std::span<const uint8_t> data);
private:
    Base32() = delete;
};

class Hex {
public:
    static std::string Encode(std::span<const uint8_t> data);
    static std::optional<std::vector<uint8_t>> Decode(std::string_view text);
    static bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept;
private:
    Hex() = delete;
};

inline std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

}
