#pragma once

/**
 * @file crypto.hpp
 * @brief Cryptographic utilities for ghapp
 *
 * Base64URL encoding, RSA key loading, RS256 signatures, HMAC-SHA256 and
 * constant-time comparison, all backed by OpenSSL.
 */

#include "ghapp/ghapp.hpp"

#include <openssl/ossl_typ.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ghapp {
namespace crypto {

/// Shared handle to an OpenSSL key; read-only after loading
using KeyHandle = std::shared_ptr<EVP_PKEY>;

// ==================== Base64 Encoding/Decoding ====================

/// Encode bytes to standard Base64
[[nodiscard]] std::string base64_encode(const std::vector<uint8_t>& data);

/// Encode bytes to Base64URL (RFC 4648, no padding)
[[nodiscard]] std::string base64url_encode(const std::vector<uint8_t>& data);

/// Encode a string's bytes to Base64URL
[[nodiscard]] std::string base64url_encode(std::string_view data);

/// Decode standard Base64 to bytes
[[nodiscard]] std::vector<uint8_t> base64_decode(const std::string& encoded);

/// Decode Base64URL to bytes
[[nodiscard]] std::vector<uint8_t> base64url_decode(const std::string& encoded);

// ==================== Hex ====================

/// Encode bytes as lowercase hex
[[nodiscard]] std::string hex_encode(const std::vector<uint8_t>& data);

/// Decode hex (either case); nullopt on odd length or a non-hex character
[[nodiscard]] std::optional<std::vector<uint8_t>> hex_decode(std::string_view hex);

// ==================== RSA ====================

/**
 * @brief Parse a PEM-encoded RSA private key
 *
 * Accepts PKCS#1 ("BEGIN RSA PRIVATE KEY") and PKCS#8 ("BEGIN PRIVATE KEY").
 *
 * @return The key, or ErrorCode::InvalidKey if it cannot be parsed or is not RSA
 */
[[nodiscard]] Result<KeyHandle> load_rsa_private_key(const std::string& pem);

/// Sign `data` with RSASSA-PKCS1-v1_5 using SHA-256
[[nodiscard]] Result<std::vector<uint8_t>> sign_rs256(const KeyHandle& key, std::string_view data);

/**
 * @brief Verify an RS256 signature
 *
 * The key may be a private key; its public half is used.
 *
 * @return Result<bool> true if valid, false on mismatch, error if the key is unusable
 */
[[nodiscard]] Result<bool> verify_rs256(const KeyHandle& key, std::string_view data,
                                        const std::vector<uint8_t>& signature);

// ==================== HMAC ====================

/// Compute HMAC-SHA256 of `data` keyed with `key` (32 bytes)
[[nodiscard]] Result<std::vector<uint8_t>> hmac_sha256(std::string_view key, std::string_view data);

/**
 * @brief Compare two byte buffers without an early exit
 *
 * Runtime depends only on the length, never on where the buffers differ.
 * Buffers of different length compare unequal.
 */
[[nodiscard]] bool constant_time_equals(const std::vector<uint8_t>& a,
                                        const std::vector<uint8_t>& b) noexcept;

}  // namespace crypto
}  // namespace ghapp
