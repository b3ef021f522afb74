#include "witnesschain/encoding/text_codecs.hpp"

#include <sodium.h>
#include <algorithm>
#include <array>

namespace witnesschain::vault::encoding {

namespace {
constexpr std::string_view kBase58Alphabet =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr std::string_view kBase32Alphabet = "abcdefghijklmnopqrstuvwxyz234567";

constexpr std::array<int8_t, 256> BuildBase58Map() {
    std::array<int8_t, 256> map{};
    for (auto& entry : map) {
        entry = -1;
    }
    for (size_t i = 0; i < kBase58Alphabet.size(); ++i) {
        map[static_cast<uint8_t>(kBase58Alphabet[i])] = static_cast<int8_t>(i);
    }
    return map;
}
constexpr auto kBase58Map = BuildBase58Map();

char ToLowerAscii(const char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}
}

std::string Base58::Encode(std::span<const uint8_t> data) {
    size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }
    // Little-endian base58 digits of the big-endian input.
    std::vector<uint8_t> digits;
    digits.reserve((data.size() - leading_zeros) * 138 / 100 + 1);
    for (size_t i = leading_zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        for (auto& digit : digits) {
            carry += static_cast<uint32_t>(digit) << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }
    std::string result(leading_zeros, kBase58Alphabet[0]);
    result.reserve(leading_zeros + digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result.push_back(kBase58Alphabet[*it]);
    }
    return result;
}

std::optional<std::vector<uint8_t>> Base58::Decode(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    size_t leading_ones = 0;
    while (leading_ones < text.size() && text[leading_ones] == kBase58Alphabet[0]) {
        ++leading_ones;
    }
    // Little-endian base256 bytes.
    std::vector<uint8_t> bytes;
    bytes.reserve((text.size() - leading_ones) * 733 / 1000 + 1);
    for (size_t i = leading_ones; i < text.size(); ++i) {
        const int8_t value = kBase58Map[static_cast<uint8_t>(text[i])];
        if (value < 0) {
            return std::nullopt;
        }
        uint32_t carry = static_cast<uint32_t>(value);
        for (auto& byte : bytes) {
            carry += static_cast<uint32_t>(byte) * 58;
            byte = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }
    std::vector<uint8_t> result(leading_ones, 0x00);
    result.insert(result.end(), bytes.rbegin(), bytes.rend());
    return result;
}

std::string Base64::Encode(std::span<const uint8_t> data) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(encoded.data(), encoded_len, data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    encoded.resize(encoded_len - 1);
    return encoded;
}

std::optional<std::vector<uint8_t>> Base64::Decode(std::string_view text) {
    std::vector<uint8_t> decoded(text.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(), text.data(), text.size(),
                          nullptr, &decoded_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return std::nullopt;
    }
    if (end != text.data() + text.size()) {
        return std::nullopt;
    }
    decoded.resize(decoded_len);
    return decoded;
}

std::string Base32::EncodeLower(std::span<const uint8_t> data) {
    std::string result;
    result.reserve((data.size() * 8 + 4) / 5);
    uint32_t buffer = 0;
    int bits = 0;
    for (const uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            result.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        result.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return result;
}

std::string Hex::Encode(std::span<const uint8_t> data) {
    std::string encoded(data.size() * 2 + 1, '\0');
    sodium_bin2hex(encoded.data(), encoded.size(), data.data(), data.size());
    encoded.resize(data.size() * 2);
    return encoded;
}

std::optional<std::vector<uint8_t>> Hex::Decode(std::string_view text) {
    if (text.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> decoded(text.size() / 2);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(decoded.data(), decoded.size(), text.data(), text.size(),
                       nullptr, &decoded_len, &end) != 0 ||
        end != text.data() + text.size()) {
        return std::nullopt;
    }
    decoded.resize(decoded_len);
    return decoded;
}

bool Hex::EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](const char x, const char y) {
               return ToLowerAscii(x) == ToLowerAscii(y);
           });
}

}
