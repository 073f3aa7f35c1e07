#pragma once

/**
 * @file token_cache.hpp
 * @brief Installation access token cache with single-flight renewal
 */

#include "ghapp/events.hpp"
#include "ghapp/ghapp.hpp"
#include "ghapp/http.hpp"
#include "ghapp/jwt.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ghapp {

/// Source of the current time; injectable for tests
using Clock = std::function<Timestamp()>;

/// The system clock
[[nodiscard]] inline Timestamp system_now() {
    return std::chrono::system_clock::now();
}

/**
 * @brief Supplies bearer credentials to outbound calls
 *
 * Implemented by TokenCache; can be mocked for testing.
 */
class TokenProviderInterface {
  public:
    virtual ~TokenProviderInterface() = default;

    /// Return a currently valid token, renewing it if needed
    [[nodiscard]] virtual Result<AccessToken> acquire() = 0;

    /// Force the next acquire() to renew
    virtual void invalidate() = 0;

    /// Force renewal only if `rejected_token` is still the cached token
    virtual void invalidate(const std::string& rejected_token) {
        (void)rejected_token;
        invalidate();
    }
};

/**
 * @brief Exchanges an identity assertion for an installation access token
 */
class TokenExchangerInterface {
  public:
    virtual ~TokenExchangerInterface() = default;

    /// Exchange `assertion`; CredentialExchangeFailed on any failure
    [[nodiscard]] virtual Result<AccessToken> exchange(const std::string& assertion) = 0;
};

/**
 * @brief Token exchange against the GitHub REST API
 *
 * Looks up the organization's installation on first use unless an
 * installation ID is configured, then requests an access token for it.
 */
class GitHubTokenExchanger : public TokenExchangerInterface {
  public:
    /// @param http Transport; must outlive the exchanger
    GitHubTokenExchanger(http::HttpClientInterface& http, std::string organization,
                         uint64_t installation_id = 0);

    [[nodiscard]] Result<AccessToken> exchange(const std::string& assertion) override;

    /// Installation ID, once known
    [[nodiscard]] uint64_t installation_id() const;

  private:
    Result<uint64_t> resolve_installation(const std::string& assertion);

    http::HttpClientInterface& http_;
    std::string organization_;
    uint64_t installation_id_;
    mutable std::mutex mutex_;
};

/**
 * @brief Caches the installation access token and renews it before expiry
 *
 * Renewal is single-flighted: while one caller signs an assertion and
 * exchanges it, other callers wait for that outcome instead of starting
 * their own exchange. No lock is held during the exchange itself.
 *
 * Thread Safety: All public methods are thread-safe.
 */
class TokenCache : public TokenProviderInterface {
  public:
    struct Settings {
        /// Renew when the token expires within this margin
        std::chrono::seconds renewal_margin{60};
    };

    /**
     * @param signer Signs a fresh assertion for every exchange
     * @param exchanger Must outlive the cache
     * @param clock Time source
     * @param events Optional bus for token events; must outlive the cache
     */
    TokenCache(jwt::AssertionSigner signer, TokenExchangerInterface& exchanger, Settings settings,
               Clock clock = system_now, EventBus* events = nullptr);

    // Non-copyable, non-movable (waiters hold references to internal state)
    TokenCache(const TokenCache&) = delete;
    TokenCache& operator=(const TokenCache&) = delete;

    [[nodiscard]] Result<AccessToken> acquire() override;

    void invalidate() override;

    void invalidate(const std::string& rejected_token) override;

    /// Currently stored token, without renewing
    [[nodiscard]] std::optional<AccessToken> cached() const;

    /// Number of exchanges attempted so far
    [[nodiscard]] uint64_t exchange_count() const;

  private:
    struct Flight {
        bool done = false;
        std::optional<Result<AccessToken>> result;
    };

    bool is_fresh_locked(Timestamp now) const;
    Result<AccessToken> renew();
    void complete_flight(const std::shared_ptr<Flight>& flight, const Result<AccessToken>& result);

    /// Mark the cached token stale; false if there was nothing to mark
    bool invalidate_locked();
    void notify_invalidated();

    jwt::AssertionSigner signer_;
    TokenExchangerInterface& exchanger_;
    Settings settings_;
    Clock clock_;
    EventBus* events_;

    mutable std::mutex mutex_;
    std::condition_variable renewed_;
    std::optional<AccessToken> token_;
    bool invalidated_ = false;
    std::shared_ptr<Flight> flight_;
    uint64_t exchange_count_ = 0;
};

}  // namespace ghapp
