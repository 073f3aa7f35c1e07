#pragma once

/**
 * @file http.hpp
 * @brief HTTP client abstraction for ghapp
 *
 * Provides a clean HTTP client interface using cpp-httplib under the hood.
 * The transport sends exactly one request per call; retries and credential
 * handling live in RequestExecutor.
 */

#include "ghapp/ghapp.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ghapp {
namespace http {

/// HTTP method
enum class Method { GET, POST, PUT, PATCH, DELETE_METHOD, HEAD };

/// Convert method to its wire name
[[nodiscard]] constexpr const char* method_to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::PATCH:
            return "PATCH";
        case Method::DELETE_METHOD:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
    }
    return "GET";
}

/// Case-insensitive ordering for header names
struct HeaderNameLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

/// Header map keyed case-insensitively
using Headers = std::map<std::string, std::string, HeaderNameLess>;

/// HTTP response structure
struct Response {
    int status_code = 0;  // 0 when no response was received
    std::string body;
    Headers headers;
    bool success = false;
    ErrorCode transport_error = ErrorCode::Success;
    std::string error_message;

    /// Look up a response header
    [[nodiscard]] std::optional<std::string> header(const std::string& name) const {
        auto it = headers.find(name);
        if (it == headers.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

/// HTTP request structure
struct Request {
    Method method = Method::GET;
    std::string path;
    std::string body;
    std::string content_type = "application/json";
    Headers headers;
};

/**
 * @brief HTTP client interface
 *
 * Abstract interface for HTTP operations. Can be mocked for testing.
 */
class HttpClientInterface {
  public:
    virtual ~HttpClientInterface() = default;

    /// Send an HTTP request and return the response
    [[nodiscard]] virtual Response send(const Request& request) = 0;

    /// Check if the client is properly configured
    [[nodiscard]] virtual bool is_configured() const = 0;
};

/**
 * @brief HTTP client using cpp-httplib
 *
 * Implements HttpClientInterface using cpp-httplib for actual HTTP communication.
 * Supports HTTPS with SSL certificate verification.
 */
class HttpClient : public HttpClientInterface {
  public:
    /// Configuration for the HTTP client
    struct Config {
        std::string base_url;
        int timeout_seconds = 30;
        bool verify_ssl = true;
        std::string user_agent = std::string("ghapp/") + VERSION;
    };

    /// Construct with configuration
    explicit HttpClient(Config config);

    /// Destructor
    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Movable
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Send an HTTP request
    [[nodiscard]] Response send(const Request& request) override;

    /// Check if properly configured
    [[nodiscard]] bool is_configured() const override;

    /// Get the base URL
    [[nodiscard]] const std::string& base_url() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace http
}  // namespace ghapp
