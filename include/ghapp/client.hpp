#pragma once

/**
 * @file client.hpp
 * @brief High-level client for GitHub App hosts
 *
 * Ties the assertion signer, token cache, call executor and webhook
 * dispatcher together behind one object.
 *
 * Example usage:
 * @code
 * ghapp::logger::initialize(spdlog::level::info);
 *
 * auto config = ghapp::load_config("/etc/ghapp/config.json");
 * if (config.is_error()) { ... }
 *
 * auto client = ghapp::Client::create(config.value());
 * if (client.is_error()) { ... }
 *
 * auto repos = client.value().get("/orgs/example-org/repos");
 * @endcode
 */

#include "ghapp/events.hpp"
#include "ghapp/ghapp.hpp"
#include "ghapp/http.hpp"
#include "ghapp/webhook.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ghapp {

/**
 * @brief Authenticated GitHub App client
 *
 * Thread Safety: All public methods are thread-safe.
 */
class Client {
  public:
    /**
     * @brief Build a client talking to config.api_url over HTTPS
     *
     * Fails with ConfigError for an invalid configuration and with
     * InvalidKey / FileNotFound when the private key cannot be loaded.
     */
    [[nodiscard]] static Result<Client> create(Config config);

    /// Build a client on top of a caller-supplied transport
    [[nodiscard]] static Result<Client> create(Config config,
                                               std::shared_ptr<http::HttpClientInterface> http);

    ~Client();

    // Non-copyable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Movable
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    // ========== Outbound API Calls ==========

    /// Send a prepared request with authorization and retry
    [[nodiscard]] Result<http::Response> execute(const http::Request& request);

    /**
     * @brief Call a REST endpoint and decode the JSON response
     *
     * @param endpoint Path relative to the API URL, e.g. "/orgs/example-org/repos"
     * @param body Optional JSON request body
     * @return The decoded body; an empty body decodes as an empty object
     */
    [[nodiscard]] Result<nlohmann::json> request(http::Method method, const std::string& endpoint,
                                                 const std::optional<nlohmann::json>& body = std::nullopt);

    [[nodiscard]] Result<nlohmann::json> get(const std::string& endpoint);
    [[nodiscard]] Result<nlohmann::json> post(const std::string& endpoint, const nlohmann::json& body);
    [[nodiscard]] Result<nlohmann::json> put(const std::string& endpoint, const nlohmann::json& body);
    [[nodiscard]] Result<nlohmann::json> patch(const std::string& endpoint, const nlohmann::json& body);
    [[nodiscard]] Result<nlohmann::json> del(const std::string& endpoint);
    [[nodiscard]] Result<nlohmann::json> head(const std::string& endpoint);

    // ========== Credentials ==========

    /// Current installation access token, renewed if needed
    [[nodiscard]] Result<AccessToken> access_token();

    /// Force renewal on the next call
    void invalidate_token();

    // ========== Webhooks ==========

    /// Verify a payload against the configured webhook secret
    [[nodiscard]] Result<bool> verify_webhook(std::string_view payload,
                                              std::string_view signature_header) const;

    /// Verify a delivery and pass it to `handler` only if it is authentic
    [[nodiscard]] Result<void> dispatch_webhook(const webhook::Envelope& envelope,
                                                const webhook::Handler& handler) const;

    // ========== Events ==========

    /// Subscribe to an event (see events.hpp for names)
    Subscription on(const std::string& event, EventHandler handler);

    // ========== Configuration ==========

    [[nodiscard]] const Config& config() const;

  private:
    class Impl;
    explicit Client(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

}  // namespace ghapp
