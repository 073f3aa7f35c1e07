#include "ghapp/config.hpp"
#include "ghapp/logger.hpp"

#include <fstream>
#include <limits>

namespace ghapp {

namespace {

using nlohmann::json;

/// Reads typed fields out of one section, remembering the first error
class SectionReader {
  public:
    SectionReader(const json& document, std::string section, std::string& error)
        : section_name_(std::move(section)), error_(error) {
        if (section_name_.empty()) {
            section_ = &document;
        } else if (document.contains(section_name_)) {
            section_ = &document[section_name_];
            if (!section_->is_object()) {
                fail(section_name_ + " must be an object");
                section_ = nullptr;
            }
        }
    }

    void read(const char* key, std::string& target) {
        const json* value = find(key);
        if (!value) {
            return;
        }
        if (!value->is_string()) {
            fail(field(key) + " must be a string");
            return;
        }
        target = value->get<std::string>();
    }

    void read(const char* key, bool& target) {
        const json* value = find(key);
        if (!value) {
            return;
        }
        if (!value->is_boolean()) {
            fail(field(key) + " must be a boolean");
            return;
        }
        target = value->get<bool>();
    }

    void read(const char* key, int& target) {
        const json* value = find(key);
        if (!value) {
            return;
        }
        if (!value->is_number_integer() || value->get<int64_t>() < std::numeric_limits<int>::min() ||
            value->get<int64_t>() > std::numeric_limits<int>::max()) {
            fail(field(key) + " must be an integer");
            return;
        }
        target = value->get<int>();
    }

    void read(const char* key, uint64_t& target) {
        const json* value = find(key);
        if (!value) {
            return;
        }
        if (!value->is_number_unsigned()) {
            fail(field(key) + " must be a non-negative integer");
            return;
        }
        target = value->get<uint64_t>();
    }

  private:
    const json* find(const char* key) const {
        if (!section_ || !error_.empty() || !section_->contains(key)) {
            return nullptr;
        }
        const json& value = (*section_)[key];
        return value.is_null() ? nullptr : &value;
    }

    std::string field(const char* key) const {
        return section_name_.empty() ? key : section_name_ + "." + key;
    }

    void fail(const std::string& message) {
        if (error_.empty()) {
            error_ = message;
        }
    }

    const json* section_ = nullptr;
    std::string section_name_;
    std::string& error_;
};

Result<void> config_error(const std::string& message) {
    return Result<void>::error(ErrorCode::ConfigError, message);
}

}  // namespace

Result<Config> parse_config(const json& document) {
    if (!document.is_object()) {
        return Result<Config>::error(ErrorCode::ConfigError, "Configuration must be a JSON object");
    }

    Config config;
    std::string error;

    SectionReader api(document, "github_api", error);
    api.read("base_url", config.api_url);
    api.read("organization", config.organization);
    api.read("app_id", config.app_id);
    api.read("installation_id", config.installation_id);
    api.read("private_key_path", config.private_key_path);
    api.read("private_key", config.private_key_pem);
    api.read("webhook_secret", config.webhook_secret);

    SectionReader server(document, "server", error);
    server.read("address", config.listen_address);
    server.read("port", config.listen_port);
    uint64_t max_payload_bytes = config.max_payload_bytes;
    server.read("max_payload_bytes", max_payload_bytes);
    config.max_payload_bytes = static_cast<std::size_t>(max_payload_bytes);

    SectionReader http(document, "http", error);
    http.read("timeout_seconds", config.timeout_seconds);
    http.read("verify_ssl", config.verify_ssl);

    SectionReader retry(document, "retry", error);
    retry.read("max_attempts", config.max_attempts);
    retry.read("initial_backoff_ms", config.initial_backoff_ms);
    retry.read("max_backoff_ms", config.max_backoff_ms);
    retry.read("max_total_seconds", config.max_total_retry_seconds);

    SectionReader token(document, "token", error);
    token.read("clock_skew_seconds", config.clock_skew_seconds);
    token.read("lifetime_seconds", config.assertion_lifetime_seconds);
    token.read("renewal_margin_seconds", config.renewal_margin_seconds);

    SectionReader root(document, "", error);
    root.read("log_level", config.log_level);

    if (!error.empty()) {
        return Result<Config>::error(ErrorCode::ConfigError, error);
    }

    auto valid = validate_config(config);
    if (valid.is_error()) {
        return Result<Config>::error_from(valid);
    }
    return Result<Config>::ok(std::move(config));
}

Result<Config> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<Config>::error(ErrorCode::FileNotFound,
                                     "Could not open configuration file: " + path);
    }

    auto document = json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        return Result<Config>::error(ErrorCode::ParseError,
                                     "Configuration file is not valid JSON: " + path);
    }

    return parse_config(document);
}

Result<void> validate_config(const Config& config) {
    if (config.api_url.rfind("https://", 0) != 0 && config.api_url.rfind("http://", 0) != 0) {
        return config_error("github_api.base_url must be an http(s) URL");
    }
    if (config.app_id == 0) {
        return config_error("github_api.app_id is required");
    }
    if (config.organization.empty() && config.installation_id == 0) {
        return config_error("github_api.organization is required when no installation_id is set");
    }
    if (config.private_key_pem.empty() && config.private_key_path.empty()) {
        return config_error("github_api.private_key_path is required");
    }
    if (config.listen_port < 1 || config.listen_port > 65535) {
        return config_error("server.port must be between 1 and 65535");
    }
    if (config.max_payload_bytes == 0) {
        return config_error("server.max_payload_bytes must be positive");
    }
    if (config.timeout_seconds <= 0) {
        return config_error("http.timeout_seconds must be positive");
    }
    if (config.max_attempts < 1) {
        return config_error("retry.max_attempts must be at least 1");
    }
    if (config.initial_backoff_ms < 0) {
        return config_error("retry.initial_backoff_ms must not be negative");
    }
    if (config.max_backoff_ms < config.initial_backoff_ms) {
        return config_error("retry.max_backoff_ms must not be below retry.initial_backoff_ms");
    }
    if (config.max_total_retry_seconds <= 0) {
        return config_error("retry.max_total_seconds must be positive");
    }
    if (config.clock_skew_seconds < 0) {
        return config_error("token.clock_skew_seconds must not be negative");
    }
    if (config.assertion_lifetime_seconds <= 0 || config.assertion_lifetime_seconds > 600) {
        return config_error("token.lifetime_seconds must be between 1 and 600");
    }
    if (config.renewal_margin_seconds < 0) {
        return config_error("token.renewal_margin_seconds must not be negative");
    }
    if (!logger::parse_level(config.log_level)) {
        return config_error("log_level \"" + config.log_level + "\" is not a known level");
    }
    return Result<void>::ok();
}

}  // namespace ghapp
