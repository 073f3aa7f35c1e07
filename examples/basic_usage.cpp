/**
 * @file basic_usage.cpp
 * @brief Basic usage example for ghapp
 *
 * This example demonstrates how to:
 * - Load a configuration file and create a client
 * - Subscribe to events
 * - Call the REST API as the App installation
 * - Verify a webhook delivery before acting on it
 * - Handle errors using the Result type
 *
 * Usage: basic_usage <config.json>
 */

#include <ghapp/client.hpp>
#include <ghapp/config.hpp>
#include <ghapp/logger.hpp>

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <config.json>\n";
        return 1;
    }

    auto config = ghapp::load_config(argv[1]);
    if (config.is_error()) {
        std::cerr << "Configuration error: " << config.error_message() << "\n";
        return 1;
    }

    auto level = ghapp::logger::parse_level(config.value().log_level);
    ghapp::logger::initialize(level.value_or(spdlog::level::info));

    auto created = ghapp::Client::create(config.value());
    if (created.is_error()) {
        std::cerr << ghapp::error_code_to_string(created.error_code()) << ": "
                  << created.error_message() << "\n";
        return 1;
    }
    auto client = std::move(created).value();

    // Example 1: Subscribe to events
    std::cout << "\n=== Event Subscription ===\n";
    auto refreshed = client.on(ghapp::events::TOKEN_REFRESHED, [](const std::any& data) {
        const auto* fields = std::any_cast<ghapp::EventFields>(&data);
        if (fields) {
            std::cout << "[Event] Access token renewed, expires " << fields->at("expires_at") << "\n";
        }
    });
    auto retrying = client.on(ghapp::events::REQUEST_RETRY, [](const std::any& /*data*/) {
        std::cout << "[Event] Request failed transiently, retrying.\n";
    });

    // Example 2: Call the REST API
    std::cout << "\n=== API Call ===\n";
    {
        const auto& org = client.config().organization;
        auto repos = client.get("/orgs/" + org + "/repos?per_page=5");

        if (repos.is_ok()) {
            for (const auto& repo : repos.value()) {
                std::cout << "  " << repo.value("full_name", "?") << "\n";
            }
        } else {
            std::cout << "Request failed: " << repos.error_message() << "\n";
            if (repos.status_code() != 0) {
                std::cout << "HTTP status: " << repos.status_code() << "\n";
            }
        }
    }

    // Example 3: Verify a webhook delivery
    std::cout << "\n=== Webhook Verification ===\n";
    {
        ghapp::webhook::Envelope envelope;
        envelope.payload = R"({"action":"created"})";
        auto signature = ghapp::webhook::compute_signature(envelope.payload, client.config().webhook_secret);
        if (signature.is_error()) {
            std::cerr << "Could not sign sample delivery: " << signature.error_message() << "\n";
            return 1;
        }
        envelope.signature = signature.value();
        envelope.event = "repository";

        auto dispatched = client.dispatch_webhook(envelope, [](const ghapp::webhook::Envelope& e) {
            std::cout << "Handling " << e.event << " event: " << e.payload << "\n";
        });
        if (dispatched.is_error()) {
            std::cout << "Rejected: " << dispatched.error_message() << "\n";
        }

        // A tampered payload never reaches the handler
        envelope.payload = R"({"action":"deleted"})";
        auto tampered = client.dispatch_webhook(envelope, [](const ghapp::webhook::Envelope&) {
            std::cout << "This line is never printed\n";
        });
        std::cout << "Tampered payload: " << ghapp::error_code_to_string(tampered.error_code()) << "\n";
    }

    refreshed.cancel();
    retrying.cancel();
    return 0;
}
