#pragma once

/**
 * @file executor.hpp
 * @brief Authorized outbound calls with bounded retry and backoff
 *
 * RequestExecutor attaches the installation access token to each call,
 * retries transient failures with exponential backoff, and renews the token
 * once when the API rejects it.
 *
 * Retrying repeats the call. Only idempotent or acceptably repeatable
 * requests should go through the executor; it does not deduplicate side
 * effects.
 */

#include "ghapp/events.hpp"
#include "ghapp/ghapp.hpp"
#include "ghapp/http.hpp"
#include "ghapp/token_cache.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace ghapp {

/// How a response is treated by the executor
enum class ResponseClass {
    Success,      // Return it
    AuthFailure,  // Renew the token and try once more
    Transient,    // Back off and retry
    ClientError   // Fail immediately
};

/// States of a single execute() call
enum class RetryState { Attempting, BackingOff, Succeeded, Exhausted, Failed };

/// Convert state to string (for logging)
[[nodiscard]] constexpr const char* retry_state_to_string(RetryState state) noexcept {
    switch (state) {
        case RetryState::Attempting:
            return "attempting";
        case RetryState::BackingOff:
            return "backing-off";
        case RetryState::Succeeded:
            return "succeeded";
        case RetryState::Exhausted:
            return "exhausted";
        case RetryState::Failed:
            return "failed";
    }
    return "unknown";
}

/// Classification function; replaceable per executor
using Classifier = std::function<ResponseClass(const http::Response&)>;

/**
 * @brief Default classification
 *
 * 2xx succeed, 401/403 are authorization failures, 429, 5xx and transport
 * failures are transient, everything else is a client error.
 */
[[nodiscard]] ResponseClass classify_response(const http::Response& response);

/// Delay requested by a Retry-After header given in seconds
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_retry_after(const http::Response& response);

/// Waits out a backoff delay; injectable for tests
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Block the calling thread for `delay`
void thread_sleep(std::chrono::milliseconds delay);

/**
 * @brief Retry tuning
 */
struct RetryPolicy {
    /// Total attempts for transient failures, first try included
    int max_attempts = 4;

    /// Delay before the first retry
    std::chrono::milliseconds initial_backoff{1000};

    /// Growth factor between consecutive retries
    double multiplier = 2.0;

    /// Upper bound for a single computed delay
    std::chrono::milliseconds max_backoff{60000};

    /// Random extra delay as a fraction of the computed one (0 disables)
    double jitter = 0.1;

    /// Ceiling for one execute() call including all backoff
    std::chrono::seconds max_total_duration{300};

    /// Response classification
    Classifier classify = classify_response;

    /// Build from the retry section of a Config
    [[nodiscard]] static RetryPolicy from_config(const Config& config);

    /// Delay before retry number `retry` (1-based), without jitter
    [[nodiscard]] std::chrono::milliseconds backoff(int retry) const;
};

/**
 * @brief Executes authorized requests with retry
 *
 * Thread Safety: execute() may be called concurrently; the executor holds
 * no mutable state between calls.
 */
class RequestExecutor {
  public:
    /**
     * @param http Transport; must outlive the executor
     * @param tokens Credential source; must outlive the executor
     * @param sleeper Waits out backoff delays
     * @param clock Measures the max_total_duration deadline
     * @param events Optional bus for request events; must outlive the executor
     */
    RequestExecutor(http::HttpClientInterface& http, TokenProviderInterface& tokens,
                    RetryPolicy policy = {}, Sleeper sleeper = thread_sleep, Clock clock = system_now,
                    EventBus* events = nullptr);

    /**
     * @brief Send `request` with a bearer token, retrying as the policy allows
     *
     * The request is copied; the caller's object is not modified.
     *
     * @return The 2xx response, or AuthorizationFailed / ClientRequestFailed /
     *         RequestFailed, or the credential error that stopped the call
     */
    [[nodiscard]] Result<http::Response> execute(const http::Request& request) const;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

  private:
    std::chrono::milliseconds next_delay(int retry, const http::Response* response) const;

    http::HttpClientInterface& http_;
    TokenProviderInterface& tokens_;
    RetryPolicy policy_;
    Sleeper sleeper_;
    Clock clock_;
    EventBus* events_;
};

}  // namespace ghapp
