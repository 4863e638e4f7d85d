#pragma once

/// @file crypto_utils.hpp
/// @brief Internal primitives shared by PasswordHasher, TokenProvider and
///        ResourceIdGenerator: OpenSSL HMAC/PBKDF2/CSPRNG plus Base64URL and
///        hex codecs.

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbs::service::detail {

// =============================================================================
// HMAC-SHA256 (RFC 2104)
// =============================================================================

/// Compute HMAC-SHA256(key, message). Returns the 32-byte raw MAC, or
/// nullopt if OpenSSL could not compute it.
[[nodiscard]] inline std::optional<std::array<uint8_t, 32>> hmacSha256(std::string_view key,
                                                                       const uint8_t* message,
                                                                       std::size_t length) {
    std::array<uint8_t, 32> mac{};
    unsigned int macLen = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), message, length,
             mac.data(), &macLen) == nullptr ||
        macLen != mac.size()) {
        return std::nullopt;
    }
    return mac;
}

[[nodiscard]] inline std::optional<std::array<uint8_t, 32>> hmacSha256(std::string_view key,
                                                                       std::string_view message) {
    return hmacSha256(key, reinterpret_cast<const uint8_t*>(message.data()), message.size());
}

// =============================================================================
// PBKDF2-HMAC-SHA256 (RFC 8018)
// =============================================================================

/// Derive @p outLen bytes from @p password. Returns nullopt if OpenSSL fails.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> pbkdf2Sha256(
    std::string_view password, const std::vector<uint8_t>& salt, uint32_t iterations,
    std::size_t outLen) {
    std::vector<uint8_t> out(outLen);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt.data(),
                          static_cast<int>(salt.size()), static_cast<int>(iterations),
                          EVP_sha256(), static_cast<int>(out.size()), out.data()) != 1) {
        return std::nullopt;
    }
    return out;
}

// =============================================================================
// Secure random generation
// =============================================================================

/// @p numBytes from the OpenSSL CSPRNG, or nullopt if it cannot deliver.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> secureRandomBytes(std::size_t numBytes) {
    std::vector<uint8_t> buf(numBytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return std::nullopt;
    }
    return buf;
}

// =============================================================================
// Base64URL encoding/decoding (RFC 4648 §5, unpadded)
// =============================================================================

[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string result;
    result.reserve((length * 4 + 2) / 3);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        }
    }
    return result;
}

[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/// Strict unpadded base64url decode. Returns nullopt on any character
/// outside the alphabet, on padding, or on an impossible length.
[[nodiscard]] inline std::optional<std::string> base64urlDecode(std::string_view input) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '-') {
            return 62;
        }
        if (c == '_') {
            return 63;
        }
        return -1;
    };

    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string result;
    result.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        int val = decodeChar(c);
        if (val < 0) {
            return std::nullopt;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<char>((buf >> bits) & 0xFF));
        }
    }
    return result;
}

// =============================================================================
// Hex encoding
// =============================================================================

[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

[[nodiscard]] inline std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

/// Lowercase or uppercase hex to bytes; nullopt on odd length or bad digit.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> fromHex(std::string_view hex) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    };

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

// =============================================================================
// Constant-time comparison
// =============================================================================

/// Compare two byte strings without an early exit on the first difference.
[[nodiscard]] inline bool constantTimeEqual(const void* a, const void* b, std::size_t length) {
    return CRYPTO_memcmp(a, b, length) == 0;
}

[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return constantTimeEqual(a.data(), b.data(), a.size());
}

}  // namespace cbs::service::detail
