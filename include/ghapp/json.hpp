#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization utilities for ghapp types
 *
 * Uses nlohmann/json for parsing GitHub API responses and building
 * assertion claims.
 */

#include "ghapp/ghapp.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ghapp {
namespace json {

using nlohmann::json;

// ==================== Timestamp Helpers ====================

/// Convert Timestamp to Unix seconds
[[nodiscard]] inline int64_t to_unix_seconds(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

/// Parse Unix timestamp (seconds) to Timestamp
[[nodiscard]] inline Timestamp parse_unix_timestamp(int64_t unix_ts) {
    return Timestamp(std::chrono::seconds(unix_ts));
}

/// Parse an ISO 8601 UTC timestamp ("2026-01-19T12:00:00Z")
[[nodiscard]] inline std::optional<Timestamp> parse_timestamp(const std::string& str) {
    // Fixed layout YYYY-MM-DDTHH:MM:SS, optionally followed by Z
    constexpr const char* layout = "dddd-dd-ddTdd:dd:dd";
    constexpr std::size_t layout_size = 19;
    if (str.size() != layout_size && !(str.size() == layout_size + 1 && str.back() == 'Z')) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < layout_size; ++i) {
        bool digit = std::isdigit(static_cast<unsigned char>(str[i])) != 0;
        if (layout[i] == 'd' ? !digit : str[i] != layout[i]) {
            return std::nullopt;
        }
    }

    std::tm tm = {};
    std::istringstream ss(str);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        return std::nullopt;
    }

    // The platform always reports UTC; interpret the fields as such
#if defined(_MSC_VER)
    auto time = _mkgmtime(&tm);
#else
    auto time = timegm(&tm);
#endif
    if (time == -1) {
        return std::nullopt;
    }

    return parse_unix_timestamp(static_cast<int64_t>(time));
}

/// Format Timestamp to ISO 8601 string
[[nodiscard]] inline std::string format_timestamp(const Timestamp& ts) {
    auto time = std::chrono::system_clock::to_time_t(ts);
    std::tm tm = {};
#if defined(_MSC_VER)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

// ==================== Assertion Parts ====================

/// JOSE header for an RS256 JWT
[[nodiscard]] inline json build_assertion_header() {
    return json{{"alg", "RS256"}, {"typ", "JWT"}};
}

/// Claims of an App identity assertion
[[nodiscard]] inline json build_assertion_claims(const std::string& issuer, const Timestamp& issued_at,
                                                 const Timestamp& expires_at) {
    json claims;
    claims["iat"] = to_unix_seconds(issued_at);
    claims["exp"] = to_unix_seconds(expires_at);
    claims["iss"] = issuer;
    return claims;
}

// ==================== Installation Parsing ====================

/// Parse the installation ID from GET /orgs/{org}/installation
[[nodiscard]] inline std::optional<uint64_t> parse_installation_id(const json& j) {
    if (j.contains("id") && j["id"].is_number_unsigned()) {
        return j["id"].get<uint64_t>();
    }
    if (j.contains("id") && j["id"].is_number_integer() && j["id"].get<int64_t>() > 0) {
        return static_cast<uint64_t>(j["id"].get<int64_t>());
    }
    return std::nullopt;
}

/// Parse the response of POST /app/installations/{id}/access_tokens
[[nodiscard]] inline std::optional<AccessToken> parse_access_token(const json& j,
                                                                   uint64_t installation_id) {
    if (!j.contains("token") || !j["token"].is_string()) {
        return std::nullopt;
    }
    if (!j.contains("expires_at") || !j["expires_at"].is_string()) {
        return std::nullopt;
    }

    auto expires_at = parse_timestamp(j["expires_at"].get<std::string>());
    if (!expires_at) {
        return std::nullopt;
    }

    AccessToken token;
    token.token = j["token"].get<std::string>();
    token.expires_at = *expires_at;
    token.installation_id = installation_id;

    if (token.token.empty()) {
        return std::nullopt;
    }
    return token;
}

// ==================== Error Parsing ====================

/// API error response structure
struct ApiError {
    std::string message;
    std::string documentation_url;
};

/// Parse error response from JSON
/// Format: {"message": "...", "documentation_url": "..."}
[[nodiscard]] inline ApiError parse_error_response(const json& j) {
    ApiError err;

    if (j.contains("message") && j["message"].is_string()) {
        err.message = j["message"].get<std::string>();
    }
    if (j.contains("documentation_url") && j["documentation_url"].is_string()) {
        err.documentation_url = j["documentation_url"].get<std::string>();
    }

    return err;
}

/// Best-effort error message from a response body; empty if the body has none
[[nodiscard]] inline std::string error_message_from_body(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return "";
    }
    return parse_error_response(j).message;
}

// ==================== Body Decoding ====================

/// Parse a response body; an empty body decodes as an empty object
[[nodiscard]] inline json decode_body(const std::string& body) {
    if (body.empty()) {
        return json::object();
    }
    return json::parse(body);
}

}  // namespace json
}  // namespace ghapp
