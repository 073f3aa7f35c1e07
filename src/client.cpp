#include "ghapp/client.hpp"
#include "ghapp/config.hpp"
#include "ghapp/executor.hpp"
#include "ghapp/json.hpp"
#include "ghapp/jwt.hpp"
#include "ghapp/logger.hpp"
#include "ghapp/token_cache.hpp"

namespace ghapp {

namespace {

constexpr const char* ACCEPT_HEADER = "application/vnd.github+json";
constexpr const char* API_VERSION = "2022-11-28";

Result<jwt::AssertionSigner> make_signer(const Config& config) {
    jwt::AssertionSigner::Settings settings;
    settings.clock_skew = std::chrono::seconds(config.clock_skew_seconds);
    settings.lifetime = std::chrono::seconds(config.assertion_lifetime_seconds);

    auto issuer = std::to_string(config.app_id);
    if (!config.private_key_pem.empty()) {
        return jwt::AssertionSigner::from_pem(config.private_key_pem, issuer, settings);
    }
    return jwt::AssertionSigner::from_file(config.private_key_path, issuer, settings);
}

}  // namespace

// PIMPL implementation
class Client::Impl {
  public:
    Impl(Config config, std::shared_ptr<http::HttpClientInterface> http, jwt::AssertionSigner signer)
        : config_(std::move(config)),
          http_(std::move(http)),
          exchanger_(*http_, config_.organization, config_.installation_id),
          tokens_(std::move(signer), exchanger_,
                  TokenCache::Settings{std::chrono::seconds(config_.renewal_margin_seconds)}, system_now,
                  &event_bus_),
          executor_(*http_, tokens_, RetryPolicy::from_config(config_), thread_sleep, system_now,
                    &event_bus_),
          dispatcher_(config_.webhook_secret, config_.max_payload_bytes, &event_bus_) {}

    Result<http::Response> execute(const http::Request& request) { return executor_.execute(request); }

    Result<nlohmann::json> request(http::Method method, const std::string& endpoint,
                                   const std::optional<nlohmann::json>& body) {
        http::Request req;
        req.method = method;
        req.path = endpoint;
        req.headers["Accept"] = ACCEPT_HEADER;
        req.headers["X-GitHub-Api-Version"] = API_VERSION;
        if (body) {
            req.body = body->dump();
        }

        auto response = executor_.execute(req);
        if (response.is_error()) {
            return Result<nlohmann::json>::error_from(response);
        }

        if (method == http::Method::HEAD) {
            return Result<nlohmann::json>::ok(nlohmann::json::object());
        }

        try {
            return Result<nlohmann::json>::ok(json::decode_body(response.value().body));
        } catch (const nlohmann::json::exception& e) {
            return Result<nlohmann::json>::error(
                ErrorCode::ParseError, std::string("Failed to parse response: ") + e.what(),
                response.value().status_code, response.value().body);
        }
    }

    Result<AccessToken> access_token() { return tokens_.acquire(); }

    void invalidate_token() { tokens_.invalidate(); }

    Result<bool> verify_webhook(std::string_view payload, std::string_view signature_header) const {
        return webhook::verify_signature(payload, signature_header, config_.webhook_secret);
    }

    Result<void> dispatch_webhook(const webhook::Envelope& envelope,
                                  const webhook::Handler& handler) const {
        return dispatcher_.dispatch(envelope, handler);
    }

    Subscription on(const std::string& event, EventHandler handler) {
        return event_bus_.on(event, std::move(handler));
    }

    const Config& config() const { return config_; }

  private:
    Config config_;
    EventBus event_bus_;
    std::shared_ptr<http::HttpClientInterface> http_;
    GitHubTokenExchanger exchanger_;
    TokenCache tokens_;
    RequestExecutor executor_;
    webhook::Dispatcher dispatcher_;
};

// ==================== Client Public Interface ====================

Result<Client> Client::create(Config config) {
    http::HttpClient::Config http_config;
    http_config.base_url = config.api_url;
    http_config.timeout_seconds = config.timeout_seconds;
    http_config.verify_ssl = config.verify_ssl;

    return create(std::move(config), std::make_shared<http::HttpClient>(std::move(http_config)));
}

Result<Client> Client::create(Config config, std::shared_ptr<http::HttpClientInterface> http) {
    auto valid = validate_config(config);
    if (valid.is_error()) {
        return Result<Client>::error_from(valid);
    }
    if (!http) {
        return Result<Client>::error(ErrorCode::MissingParameter, "HTTP transport is required");
    }

    // A key that cannot be loaded is fatal at startup, not at first use
    auto signer = make_signer(config);
    if (signer.is_error()) {
        logger::get()->error("could not load App private key: {}", signer.error_message());
        return Result<Client>::error_from(signer);
    }

    if (config.webhook_secret.empty()) {
        logger::get()->warn("no webhook secret configured; every delivery will be rejected");
    }

    logger::get()->info("ghapp {} ready for App {} at {}", VERSION, config.app_id, config.api_url);

    return Result<Client>::ok(Client(
        std::make_unique<Impl>(std::move(config), std::move(http), std::move(signer).value())));
}

Client::Client(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Client::~Client() = default;

Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

Result<http::Response> Client::execute(const http::Request& request) {
    return impl_->execute(request);
}

Result<nlohmann::json> Client::request(http::Method method, const std::string& endpoint,
                                       const std::optional<nlohmann::json>& body) {
    return impl_->request(method, endpoint, body);
}

Result<nlohmann::json> Client::get(const std::string& endpoint) {
    return impl_->request(http::Method::GET, endpoint, std::nullopt);
}

Result<nlohmann::json> Client::post(const std::string& endpoint, const nlohmann::json& body) {
    return impl_->request(http::Method::POST, endpoint, body);
}

Result<nlohmann::json> Client::put(const std::string& endpoint, const nlohmann::json& body) {
    return impl_->request(http::Method::PUT, endpoint, body);
}

Result<nlohmann::json> Client::patch(const std::string& endpoint, const nlohmann::json& body) {
    return impl_->request(http::Method::PATCH, endpoint, body);
}

Result<nlohmann::json> Client::del(const std::string& endpoint) {
    return impl_->request(http::Method::DELETE_METHOD, endpoint, std::nullopt);
}

Result<nlohmann::json> Client::head(const std::string& endpoint) {
    return impl_->request(http::Method::HEAD, endpoint, std::nullopt);
}

Result<AccessToken> Client::access_token() {
    return impl_->access_token();
}

void Client::invalidate_token() {
    impl_->invalidate_token();
}

Result<bool> Client::verify_webhook(std::string_view payload, std::string_view signature_header) const {
    return impl_->verify_webhook(payload, signature_header);
}

Result<void> Client::dispatch_webhook(const webhook::Envelope& envelope,
                                      const webhook::Handler& handler) const {
    return impl_->dispatch_webhook(envelope, handler);
}

Subscription Client::on(const std::string& event, EventHandler handler) {
    return impl_->on(event, std::move(handler));
}

const Config& Client::config() const {
    return impl_->config();
}

}  // namespace ghapp
