#pragma once

/**
 * @file jwt.hpp
 * @brief App identity assertions (RS256 JSON Web Tokens)
 *
 * An assertion proves control of the App's private key. It is exchanged for
 * an installation access token and never reused.
 */

#include "ghapp/crypto.hpp"
#include "ghapp/ghapp.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace ghapp {
namespace jwt {

/// Longest assertion lifetime the platform accepts
constexpr std::chrono::seconds MAX_LIFETIME{600};

/**
 * @brief Signs short-lived identity assertions with the App's RSA key
 *
 * Immutable after construction and safe to share between threads.
 */
class AssertionSigner {
  public:
    struct Settings {
        /// Backdating of the issued-at claim to tolerate clock drift
        std::chrono::seconds clock_skew{60};

        /// Validity after now; clamped to MAX_LIFETIME
        std::chrono::seconds lifetime{600};
    };

    /**
     * @brief Create a signer from a PEM-encoded RSA private key
     *
     * @param pem PKCS#1 or PKCS#8 PEM text
     * @param issuer The App ID, used as the "iss" claim
     * The key must produce an assertion that verifies against itself before
     * the signer is handed out.
     *
     * @return The signer, or InvalidKey / MissingParameter / InvalidParameter
     */
    [[nodiscard]] static Result<AssertionSigner> from_pem(const std::string& pem, std::string issuer,
                                                          Settings settings);
    [[nodiscard]] static Result<AssertionSigner> from_pem(const std::string& pem, std::string issuer);

    /// Create a signer from a PEM file on disk
    [[nodiscard]] static Result<AssertionSigner> from_file(const std::string& path, std::string issuer,
                                                           Settings settings);

    /**
     * @brief Sign an assertion valid from `now - clock_skew` to `now + lifetime`
     *
     * @return Compact JWS serialization "header.claims.signature"
     */
    [[nodiscard]] Result<std::string> sign(Timestamp now) const;

    /// The "iss" claim
    [[nodiscard]] const std::string& issuer() const noexcept { return issuer_; }

    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

    /// The key assertions are signed with
    [[nodiscard]] const crypto::KeyHandle& key() const noexcept { return key_; }

  private:
    AssertionSigner(crypto::KeyHandle key, std::string issuer, Settings settings);

    crypto::KeyHandle key_;
    std::string issuer_;
    Settings settings_;
};

/// Decoded parts of a compact JWS
struct DecodedToken {
    std::string header_json;
    std::string claims_json;
    std::vector<uint8_t> signature;
    std::string signing_input;  // "header.claims" as transmitted
};

/// Split and decode a compact JWS; ParseError if it does not have three parts
[[nodiscard]] Result<DecodedToken> decode(const std::string& token);

/**
 * @brief Decode a compact JWS and check its RS256 signature against `key`
 *
 * @return The decoded parts, ParseError for a malformed token, or
 *         SigningFailed when the signature does not verify
 */
[[nodiscard]] Result<DecodedToken> verify(const std::string& token, const crypto::KeyHandle& key);

}  // namespace jwt
}  // namespace ghapp
