#pragma once

/**
 * @file events.hpp
 * @brief Event bus and callback system for ghapp
 *
 * Reports token and webhook life-cycle events to interested hosts.
 * Event payloads never carry token values or secrets.
 */

#include "ghapp/logger.hpp"

#include <algorithm>
#include <any>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ghapp {

/// Event data type - can hold any value
using EventData = std::any;

/// Payload type used by the library's own events
using EventFields = std::map<std::string, std::string>;

/// Event handler callback type
using EventHandler = std::function<void(const EventData&)>;

/**
 * @brief Subscription handle for event unsubscription
 */
class Subscription {
  public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe) : unsubscribe_(std::move(unsubscribe)) {}

    /// Cancel this subscription
    void cancel() {
        if (unsubscribe_) {
            unsubscribe_();
            unsubscribe_ = nullptr;
        }
    }

    /// Check if subscription is active
    [[nodiscard]] bool is_active() const { return unsubscribe_ != nullptr; }

  private:
    std::function<void()> unsubscribe_;
};

/**
 * @brief Event bus for library-wide event handling
 *
 * Supports the following events:
 * - "token:refreshed" - A new access token was obtained
 * - "token:invalidated" - The cached token was discarded
 * - "token:error" - Renewing the access token failed
 * - "request:retry" - An outbound call is backing off before another attempt
 * - "request:failed" - An outbound call failed terminally
 * - "webhook:verified" - An inbound payload passed signature verification
 * - "webhook:rejected" - An inbound payload was rejected
 */
class EventBus {
  public:
    EventBus() = default;
    ~EventBus() = default;

    // Non-copyable
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Not movable (contains mutex)
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    /**
     * @brief Subscribe to an event
     *
     * The bus must outlive the returned subscription if it is cancelled.
     *
     * @param event Event name
     * @param handler Callback function
     * @return Subscription handle to unsubscribe
     */
    Subscription on(const std::string& event, EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto id = next_id_++;
        handlers_[event].push_back({id, std::move(handler)});

        return Subscription([this, event, id]() { this->remove_handler(event, id); });
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * A handler that throws is logged and does not stop delivery to the
     * remaining handlers.
     *
     * @param event Event name
     * @param data Event data (optional)
     */
    void emit(const std::string& event, const EventData& data = {}) {
        std::vector<EventHandler> handlers_copy;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(event);
            if (it != handlers_.end()) {
                for (const auto& entry : it->second) {
                    handlers_copy.push_back(entry.handler);
                }
            }
        }

        // Call handlers outside the lock to prevent deadlocks
        for (const auto& handler : handlers_copy) {
            try {
                handler(data);
            } catch (const std::exception& e) {
                logger::get()->warn("event handler for \"{}\" threw: {}", event, e.what());
            }
        }
    }

    /// Number of handlers subscribed to an event
    [[nodiscard]] size_t handler_count(const std::string& event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event);
        return it == handlers_.end() ? 0 : it->second.size();
    }

    /**
     * @brief Remove all handlers for an event
     *
     * @param event Event name
     */
    void clear(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(event);
    }

    /**
     * @brief Remove all handlers for all events
     */
    void clear_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.clear();
    }

  private:
    struct HandlerEntry {
        uint64_t id;
        EventHandler handler;
    };

    void remove_handler(const std::string& event, uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event);
        if (it != handlers_.end()) {
            auto& vec = it->second;
            vec.erase(std::remove_if(vec.begin(), vec.end(),
                                     [id](const HandlerEntry& e) { return e.id == id; }),
                      vec.end());
        }
    }

    std::unordered_map<std::string, std::vector<HandlerEntry>> handlers_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 0;
};

// Common event names as constants
namespace events {
constexpr const char* TOKEN_REFRESHED = "token:refreshed";
constexpr const char* TOKEN_INVALIDATED = "token:invalidated";
constexpr const char* TOKEN_ERROR = "token:error";
constexpr const char* REQUEST_RETRY = "request:retry";
constexpr const char* REQUEST_FAILED = "request:failed";
constexpr const char* WEBHOOK_VERIFIED = "webhook:verified";
constexpr const char* WEBHOOK_REJECTED = "webhook:rejected";
}  // namespace events

}  // namespace ghapp
