#include "ghapp/token_cache.hpp"
#include "ghapp/json.hpp"
#include "ghapp/logger.hpp"

namespace ghapp {

namespace {

constexpr const char* ACCEPT_HEADER = "application/vnd.github+json";
constexpr const char* API_VERSION = "2022-11-28";

http::Request build_app_request(http::Method method, std::string path, const std::string& assertion) {
    http::Request request;
    request.method = method;
    request.path = std::move(path);
    request.headers["Authorization"] = "Bearer " + assertion;
    request.headers["Accept"] = ACCEPT_HEADER;
    request.headers["X-GitHub-Api-Version"] = API_VERSION;
    return request;
}

template <typename T>
Result<T> exchange_error(const std::string& what, const http::Response& response) {
    if (response.status_code == 0) {
        return Result<T>::error(ErrorCode::CredentialExchangeFailed,
                                what + ": " + response.error_message);
    }

    std::string message = what + " (status " + std::to_string(response.status_code) + ")";
    auto api_message = json::error_message_from_body(response.body);
    if (!api_message.empty()) {
        message += ": " + api_message;
    }
    return Result<T>::error(ErrorCode::CredentialExchangeFailed, message, response.status_code,
                            response.body);
}

}  // namespace

// ==================== GitHubTokenExchanger ====================

GitHubTokenExchanger::GitHubTokenExchanger(http::HttpClientInterface& http, std::string organization,
                                           uint64_t installation_id)
    : http_(http), organization_(std::move(organization)), installation_id_(installation_id) {}

uint64_t GitHubTokenExchanger::installation_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return installation_id_;
}

Result<uint64_t> GitHubTokenExchanger::resolve_installation(const std::string& assertion) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (installation_id_ != 0) {
            return Result<uint64_t>::ok(installation_id_);
        }
    }

    if (organization_.empty()) {
        return Result<uint64_t>::error(ErrorCode::MissingParameter,
                                       "Organization is required to look up the installation");
    }

    auto response = http_.send(
        build_app_request(http::Method::GET, "/orgs/" + organization_ + "/installation", assertion));
    if (!response.success) {
        return exchange_error<uint64_t>("Could not look up App installation for organization \"" +
                                            organization_ + "\"",
                                        response);
    }

    std::optional<uint64_t> id;
    try {
        id = json::parse_installation_id(json::decode_body(response.body));
    } catch (const nlohmann::json::exception& e) {
        return Result<uint64_t>::error(ErrorCode::CredentialExchangeFailed,
                                       std::string("Failed to parse installation response: ") + e.what(),
                                       response.status_code, response.body);
    }
    if (!id) {
        return Result<uint64_t>::error(ErrorCode::CredentialExchangeFailed,
                                       "Installation response has no id", response.status_code,
                                       response.body);
    }

    logger::get()->info("resolved App installation {} for organization \"{}\"", *id, organization_);

    std::lock_guard<std::mutex> lock(mutex_);
    installation_id_ = *id;
    return Result<uint64_t>::ok(*id);
}

Result<AccessToken> GitHubTokenExchanger::exchange(const std::string& assertion) {
    auto installation = resolve_installation(assertion);
    if (installation.is_error()) {
        return Result<AccessToken>::error_from(installation);
    }
    uint64_t id = installation.value();

    auto response = http_.send(build_app_request(
        http::Method::POST, "/app/installations/" + std::to_string(id) + "/access_tokens", assertion));
    if (!response.success) {
        return exchange_error<AccessToken>("Could not create installation access token", response);
    }

    std::optional<AccessToken> token;
    try {
        token = json::parse_access_token(json::decode_body(response.body), id);
    } catch (const nlohmann::json::exception& e) {
        return Result<AccessToken>::error(
            ErrorCode::CredentialExchangeFailed,
            std::string("Failed to parse access token response: ") + e.what(), response.status_code,
            response.body);
    }
    if (!token) {
        return Result<AccessToken>::error(ErrorCode::CredentialExchangeFailed,
                                          "Access token response lacks token or expires_at",
                                          response.status_code);
    }

    return Result<AccessToken>::ok(std::move(*token));
}

// ==================== TokenCache ====================

TokenCache::TokenCache(jwt::AssertionSigner signer, TokenExchangerInterface& exchanger,
                       Settings settings, Clock clock, EventBus* events)
    : signer_(std::move(signer)),
      exchanger_(exchanger),
      settings_(settings),
      clock_(std::move(clock)),
      events_(events) {}

bool TokenCache::is_fresh_locked(Timestamp now) const {
    if (!token_ || invalidated_) {
        return false;
    }
    return token_->remaining(now) > settings_.renewal_margin;
}

Result<AccessToken> TokenCache::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (is_fresh_locked(clock_())) {
        return Result<AccessToken>::ok(*token_);
    }

    // Another caller is already renewing: share its outcome
    if (flight_) {
        auto flight = flight_;
        renewed_.wait(lock, [&flight]() { return flight->done; });
        return *flight->result;
    }

    auto flight = std::make_shared<Flight>();
    flight_ = flight;
    ++exchange_count_;
    lock.unlock();

    std::optional<Result<AccessToken>> result;
    try {
        result = renew();
    } catch (const std::exception& e) {
        result = Result<AccessToken>::error(ErrorCode::CredentialExchangeFailed,
                                            std::string("Token renewal aborted: ") + e.what());
    } catch (...) {
        // Release the waiters before letting a foreign exception through
        complete_flight(flight, Result<AccessToken>::error(ErrorCode::CredentialExchangeFailed,
                                                           "Token renewal aborted"));
        throw;
    }

    complete_flight(flight, *result);

    if (events_) {
        if (result->is_ok()) {
            events_->emit(events::TOKEN_REFRESHED,
                          EventFields{{"installation_id", std::to_string(result->value().installation_id)},
                                      {"expires_at", json::format_timestamp(result->value().expires_at)}});
        } else {
            events_->emit(events::TOKEN_ERROR, EventFields{{"error", result->error_message()}});
        }
    }

    return *result;
}

void TokenCache::complete_flight(const std::shared_ptr<Flight>& flight, const Result<AccessToken>& result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.is_ok()) {
            token_ = result.value();
            invalidated_ = false;
        }
        flight->result = result;
        flight->done = true;
        flight_.reset();
    }
    renewed_.notify_all();
}

Result<AccessToken> TokenCache::renew() {
    auto log = logger::get();
    log->info("requesting installation access token");

    // A fresh assertion per exchange; never cached
    auto assertion = signer_.sign(clock_());
    if (assertion.is_error()) {
        log->error("could not sign App assertion: {}", assertion.error_message());
        return Result<AccessToken>::error_from(assertion);
    }

    auto token = exchanger_.exchange(assertion.value());
    if (token.is_error()) {
        log->error("could not obtain installation access token: {}", token.error_message());
        return token;
    }

    log->info("obtained installation access token for installation {}, expires {}",
              token.value().installation_id, json::format_timestamp(token.value().expires_at));
    return token;
}

bool TokenCache::invalidate_locked() {
    if (!token_ || invalidated_) {
        return false;
    }
    invalidated_ = true;
    return true;
}

void TokenCache::notify_invalidated() {
    logger::get()->info("installation access token invalidated");
    if (events_) {
        events_->emit(events::TOKEN_INVALIDATED, EventFields{});
    }
}

void TokenCache::invalidate() {
    bool changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = invalidate_locked();
    }
    if (changed) {
        notify_invalidated();
    }
}

void TokenCache::invalidate(const std::string& rejected_token) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Already replaced by a concurrent renewal
        if (token_ && token_->token == rejected_token) {
            changed = invalidate_locked();
        }
    }
    if (changed) {
        notify_invalidated();
    }
}

std::optional<AccessToken> TokenCache::cached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_;
}

uint64_t TokenCache::exchange_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exchange_count_;
}

}  // namespace ghapp
