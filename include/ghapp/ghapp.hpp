#pragma once

/**
 * @file ghapp.hpp
 * @brief ghapp core types
 *
 * Authenticates a process as an installed GitHub App and verifies inbound
 * webhook deliveries. This header carries the types shared by every module:
 * error codes, the Result type, timestamps, access tokens and configuration.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace ghapp {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Error codes returned by library operations
enum class ErrorCode {
    Success = 0,

    // Network errors
    NetworkError,
    ConnectionTimeout,
    SSLError,

    // Key and assertion errors
    InvalidKey,
    SigningFailed,

    // Credential errors
    CredentialExchangeFailed,
    AuthorizationFailed,

    // Request errors
    ClientRequestFailed,
    RequestFailed,
    MissingParameter,
    InvalidParameter,

    // Webhook errors
    MissingSignature,
    MalformedSignature,
    SignatureMismatch,
    SecretNotConfigured,
    PayloadTooLarge,

    // Parse errors
    ParseError,
    ConfigError,

    // File errors
    FileError,
    FileNotFound,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::NetworkError:
            return "Network error";
        case ErrorCode::ConnectionTimeout:
            return "Connection timeout";
        case ErrorCode::SSLError:
            return "SSL/TLS error";
        case ErrorCode::InvalidKey:
            return "Invalid private key";
        case ErrorCode::SigningFailed:
            return "Signing failed";
        case ErrorCode::CredentialExchangeFailed:
            return "Credential exchange failed";
        case ErrorCode::AuthorizationFailed:
            return "Authorization failed";
        case ErrorCode::ClientRequestFailed:
            return "Client request error";
        case ErrorCode::RequestFailed:
            return "Request failed";
        case ErrorCode::MissingParameter:
            return "Missing required parameter";
        case ErrorCode::InvalidParameter:
            return "Invalid parameter";
        case ErrorCode::MissingSignature:
            return "Missing payload signature";
        case ErrorCode::MalformedSignature:
            return "Malformed payload signature";
        case ErrorCode::SignatureMismatch:
            return "Invalid payload signature";
        case ErrorCode::SecretNotConfigured:
            return "Webhook secret not configured";
        case ErrorCode::PayloadTooLarge:
            return "Payload too large";
        case ErrorCode::ParseError:
            return "Parse error";
        case ErrorCode::ConfigError:
            return "Configuration error";
        case ErrorCode::FileError:
            return "File error";
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for operations that can fail
 *
 * Errors raised by HTTP calls also carry the response status (0 when the
 * request never got a response) and the response body.
 *
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "", int status_code = 0,
                        std::string response_body = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        r.status_code_ = status_code;
        r.response_body_ = std::move(response_body);
        return r;
    }

    /// Re-type an error result, keeping code, message, status and body
    template <typename U> static Result error_from(const Result<U>& other) {
        return error(other.error_code(), other.error_message(), other.status_code(),
                     other.response_body());
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

    /// HTTP status attached to the error (0 if none)
    [[nodiscard]] int status_code() const noexcept { return status_code_; }

    /// HTTP response body attached to the error
    [[nodiscard]] const std::string& response_body() const noexcept { return response_body_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
    int status_code_ = 0;
    std::string response_body_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() {
        Result r;
        r.error_ = ErrorCode::Success;
        return r;
    }

    static Result error(ErrorCode code, std::string message = "", int status_code = 0,
                        std::string response_body = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        r.status_code_ = status_code;
        r.response_body_ = std::move(response_body);
        return r;
    }

    template <typename U> static Result error_from(const Result<U>& other) {
        return error(other.error_code(), other.error_message(), other.status_code(),
                     other.response_body());
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }
    [[nodiscard]] int status_code() const noexcept { return status_code_; }
    [[nodiscard]] const std::string& response_body() const noexcept { return response_body_; }

  private:
    Result() = default;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
    int status_code_ = 0;
    std::string response_body_;
};

/// Timestamp type used throughout the library
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Installation access token issued by the platform
 *
 * Replaced as a whole on renewal, never updated in place.
 */
struct AccessToken {
    std::string token;
    Timestamp expires_at;
    std::uint64_t installation_id = 0;

    /// Seconds left until expiry relative to `now` (negative once expired)
    [[nodiscard]] std::chrono::seconds remaining(Timestamp now) const noexcept {
        return std::chrono::duration_cast<std::chrono::seconds>(expires_at - now);
    }

    [[nodiscard]] bool operator==(const AccessToken& other) const noexcept {
        return token == other.token && expires_at == other.expires_at &&
               installation_id == other.installation_id;
    }
};

/**
 * @brief Configuration for the ghapp client
 */
struct Config {
    /// Base URL of the GitHub REST API
    std::string api_url = "https://api.github.com";

    /// Organization the App is installed to (e.g. "example-org")
    std::string organization;

    /// Numeric App ID shown on the App's settings page (required)
    std::uint64_t app_id = 0;

    /// Installation ID; looked up from the organization when 0
    std::uint64_t installation_id = 0;

    /// Path to the App's PEM private key
    std::string private_key_path;

    /// Inline PEM private key; takes precedence over private_key_path
    std::string private_key_pem;

    /// Shared secret for webhook signature verification
    std::string webhook_secret;

    /// Address and port the host listens on for webhook deliveries
    std::string listen_address = "127.0.0.1";
    int listen_port = 2342;

    /// HTTP request timeout in seconds
    int timeout_seconds = 30;

    /// Enable SSL certificate verification (disable only for testing!)
    bool verify_ssl = true;

    // ========== Retry Settings ==========

    /// Total attempts for transient failures (first try included)
    int max_attempts = 4;

    /// Delay before the first retry in milliseconds
    int initial_backoff_ms = 1000;

    /// Upper bound for a single backoff in milliseconds
    int max_backoff_ms = 60000;

    /// Ceiling for one call including all retries, in seconds
    int max_total_retry_seconds = 300;

    // ========== Token Settings ==========

    /// Backdating of the assertion's issued-at claim in seconds
    int clock_skew_seconds = 60;

    /// Assertion lifetime after now in seconds (at most 600)
    int assertion_lifetime_seconds = 600;

    /// Renew the access token when it expires within this many seconds
    int renewal_margin_seconds = 60;

    /// Maximum accepted webhook payload size in bytes
    std::size_t max_payload_bytes = 256 * 1024;

    /// Log level name ("trace", "debug", "info", "warn", "error", "off")
    std::string log_level = "info";
};

}  // namespace ghapp
