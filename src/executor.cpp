#include "ghapp/executor.hpp"
#include "ghapp/json.hpp"
#include "ghapp/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>
#include <thread>

namespace ghapp {

namespace {

bool is_transient_status(int status) {
    return status == 0 || status == 429 || status >= 500;
}

std::string describe_failure(const http::Response& response) {
    if (response.status_code == 0) {
        return response.error_message.empty() ? "no response" : response.error_message;
    }
    std::string message = "HTTP " + std::to_string(response.status_code);
    auto api_message = json::error_message_from_body(response.body);
    if (!api_message.empty()) {
        message += ": " + api_message;
    }
    return message;
}

double jitter_factor(double jitter) {
    if (jitter <= 0.0) {
        return 0.0;
    }
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_real_distribution<double> distribution(0.0, jitter);
    return distribution(engine);
}

}  // namespace

ResponseClass classify_response(const http::Response& response) {
    int status = response.status_code;
    if (status >= 200 && status < 300) {
        return ResponseClass::Success;
    }
    if (status == 401 || status == 403) {
        return ResponseClass::AuthFailure;
    }
    if (status == 0) {
        // An unconfigured transport will never succeed
        if (response.transport_error == ErrorCode::MissingParameter) {
            return ResponseClass::ClientError;
        }
        return ResponseClass::Transient;
    }
    if (is_transient_status(status)) {
        return ResponseClass::Transient;
    }
    return ResponseClass::ClientError;
}

std::optional<std::chrono::milliseconds> parse_retry_after(const http::Response& response) {
    auto value = response.header("Retry-After");
    if (!value || value->empty() || value->size() > 9) {
        return std::nullopt;
    }
    if (!std::all_of(value->begin(), value->end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::chrono::seconds(std::stol(*value));
}

void thread_sleep(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

// ==================== RetryPolicy ====================

RetryPolicy RetryPolicy::from_config(const Config& config) {
    RetryPolicy policy;
    policy.max_attempts = config.max_attempts;
    policy.initial_backoff = std::chrono::milliseconds(config.initial_backoff_ms);
    policy.max_backoff = std::chrono::milliseconds(config.max_backoff_ms);
    policy.max_total_duration = std::chrono::seconds(config.max_total_retry_seconds);
    return policy;
}

std::chrono::milliseconds RetryPolicy::backoff(int retry) const {
    double delay = static_cast<double>(initial_backoff.count()) *
                   std::pow(multiplier, static_cast<double>(std::max(retry, 1) - 1));
    double cap = static_cast<double>(max_backoff.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

// ==================== RequestExecutor ====================

RequestExecutor::RequestExecutor(http::HttpClientInterface& http, TokenProviderInterface& tokens,
                                 RetryPolicy policy, Sleeper sleeper, Clock clock, EventBus* events)
    : http_(http),
      tokens_(tokens),
      policy_(std::move(policy)),
      sleeper_(std::move(sleeper)),
      clock_(std::move(clock)),
      events_(events) {
    if (!policy_.classify) {
        policy_.classify = classify_response;
    }
}

std::chrono::milliseconds RequestExecutor::next_delay(int retry, const http::Response* response) const {
    if (response) {
        auto requested = parse_retry_after(*response);
        if (requested) {
            return *requested;
        }
    }
    auto base = policy_.backoff(retry);
    auto extra = static_cast<int64_t>(static_cast<double>(base.count()) * jitter_factor(policy_.jitter));
    return base + std::chrono::milliseconds(extra);
}

Result<http::Response> RequestExecutor::execute(const http::Request& request) const {
    auto log = logger::get();
    const char* method = http::method_to_string(request.method);
    const auto deadline = clock_() + policy_.max_total_duration;

    RetryState state = RetryState::Attempting;
    RetryState ended_in = RetryState::Failed;
    int attempt = 0;
    bool auth_retried = false;
    std::chrono::milliseconds delay{0};

    std::optional<Result<http::Response>> outcome;
    std::string last_message;
    int last_status = 0;
    std::string last_body;

    // Record a transient failure and decide between backing off and giving up
    auto on_transient = [&](const http::Response* response) {
        if (attempt >= policy_.max_attempts) {
            state = RetryState::Exhausted;
            return;
        }
        delay = next_delay(attempt, response);
        if (clock_() + delay > deadline) {
            last_message += " (retry deadline of " +
                            std::to_string(policy_.max_total_duration.count()) + "s reached)";
            state = RetryState::Exhausted;
            return;
        }
        state = RetryState::BackingOff;
    };

    while (true) {
        switch (state) {
            case RetryState::Attempting: {
                ++attempt;

                auto token = tokens_.acquire();
                if (token.is_error()) {
                    bool transient = token.error_code() == ErrorCode::CredentialExchangeFailed &&
                                     is_transient_status(token.status_code());
                    if (!transient) {
                        outcome = Result<http::Response>::error_from(token);
                        state = RetryState::Failed;
                        break;
                    }
                    last_message = token.error_message();
                    last_status = token.status_code();
                    last_body = token.response_body();
                    on_transient(nullptr);
                    break;
                }

                http::Request authorized = request;
                authorized.headers["Authorization"] = "Bearer " + token.value().token;

                auto response = http_.send(authorized);
                switch (policy_.classify(response)) {
                    case ResponseClass::Success:
                        outcome = Result<http::Response>::ok(std::move(response));
                        state = RetryState::Succeeded;
                        break;

                    case ResponseClass::AuthFailure:
                        if (auth_retried) {
                            outcome = Result<http::Response>::error(
                                ErrorCode::AuthorizationFailed,
                                "Authorization failed for " + std::string(method) + " " +
                                    request.path + ": " + describe_failure(response),
                                response.status_code, response.body);
                            state = RetryState::Failed;
                            break;
                        }
                        log->warn("{} {} rejected with HTTP {}, renewing access token", method,
                                  request.path, response.status_code);
                        auth_retried = true;
                        tokens_.invalidate(token.value().token);
                        --attempt;
                        break;

                    case ResponseClass::Transient:
                        last_message = describe_failure(response);
                        last_status = response.status_code;
                        last_body = response.body;
                        on_transient(&response);
                        break;

                    case ResponseClass::ClientError:
                        outcome = Result<http::Response>::error(
                            ErrorCode::ClientRequestFailed,
                            std::string(method) + " " + request.path + " failed: " +
                                describe_failure(response),
                            response.status_code, response.body);
                        state = RetryState::Failed;
                        break;
                }
                break;
            }

            case RetryState::BackingOff:
                log->warn("{} {} attempt {}/{} failed ({}), retrying in {} ms", method, request.path,
                          attempt, policy_.max_attempts, last_message, delay.count());
                if (events_) {
                    events_->emit(events::REQUEST_RETRY,
                                  EventFields{{"method", method},
                                              {"path", request.path},
                                              {"attempt", std::to_string(attempt)},
                                              {"status", std::to_string(last_status)},
                                              {"delay_ms", std::to_string(delay.count())}});
                }
                sleeper_(delay);
                state = RetryState::Attempting;
                break;

            case RetryState::Succeeded:
                return *outcome;

            case RetryState::Exhausted:
                ended_in = RetryState::Exhausted;
                outcome = Result<http::Response>::error(
                    ErrorCode::RequestFailed,
                    std::string(method) + " " + request.path + " failed after " +
                        std::to_string(attempt) + " attempt(s): " + last_message,
                    last_status, last_body);
                state = RetryState::Failed;
                break;

            case RetryState::Failed:
                log->error("{} {} {}: {}", method, request.path, retry_state_to_string(ended_in),
                           outcome->error_message());
                if (events_) {
                    events_->emit(events::REQUEST_FAILED,
                                  EventFields{{"method", method},
                                              {"path", request.path},
                                              {"state", retry_state_to_string(ended_in)},
                                              {"error", error_code_to_string(outcome->error_code())},
                                              {"status", std::to_string(outcome->status_code())}});
                }
                return *outcome;
        }
    }
}

}  // namespace ghapp
