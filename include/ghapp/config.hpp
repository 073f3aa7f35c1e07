#pragma once

/**
 * @file config.hpp
 * @brief Loading and validating ghapp::Config from JSON
 *
 * Document layout:
 * @code
 * {
 *   "github_api": { "base_url", "organization", "app_id", "installation_id",
 *                   "private_key_path", "private_key", "webhook_secret" },
 *   "server":     { "address", "port", "max_payload_bytes" },
 *   "http":       { "timeout_seconds", "verify_ssl" },
 *   "retry":      { "max_attempts", "initial_backoff_ms", "max_backoff_ms",
 *                   "max_total_seconds" },
 *   "token":      { "clock_skew_seconds", "lifetime_seconds",
 *                   "renewal_margin_seconds" },
 *   "log_level":  "info"
 * }
 * @endcode
 * Every key is optional; absent keys keep the Config defaults.
 */

#include "ghapp/ghapp.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ghapp {

/// Read and parse a JSON configuration file, then validate it
[[nodiscard]] Result<Config> load_config(const std::string& path);

/// Parse an in-memory document, then validate it
[[nodiscard]] Result<Config> parse_config(const nlohmann::json& document);

/// Check required fields and ranges; ConfigError names the offending field
[[nodiscard]] Result<void> validate_config(const Config& config);

}  // namespace ghapp
