#pragma once

/**
 * @file webhook.hpp
 * @brief Webhook payload signature verification
 *
 * The platform signs every delivery with HMAC-SHA256 keyed by the shared
 * webhook secret and sends the result as "X-Hub-Signature-256: sha256=<hex>".
 * Verification runs over the exact bytes received, before any parsing.
 */

#include "ghapp/events.hpp"
#include "ghapp/ghapp.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace ghapp {
namespace webhook {

/// Header carrying the payload signature
constexpr const char* SIGNATURE_HEADER = "X-Hub-Signature-256";

/// Header carrying the event name
constexpr const char* EVENT_HEADER = "X-GitHub-Event";

/// Header carrying the delivery ID
constexpr const char* DELIVERY_HEADER = "X-GitHub-Delivery";

/// Prefix of the signature header value
constexpr const char* SIGNATURE_PREFIX = "sha256=";

/// Default ceiling on accepted payload size; configurable per Dispatcher
constexpr std::size_t DEFAULT_MAX_PAYLOAD_BYTES = 256 * 1024;

/// An inbound delivery as received by the host
struct Envelope {
    std::string payload;    // raw body bytes
    std::string signature;  // X-Hub-Signature-256 value
    std::string event;
    std::string delivery_id;
};

/**
 * @brief Verify a payload signature
 *
 * @param payload Raw body bytes
 * @param signature_header Value of X-Hub-Signature-256
 * @param secret Shared webhook secret
 * @return true if the signature matches, false if it does not;
 *         SecretNotConfigured, MissingSignature or MalformedSignature otherwise
 */
[[nodiscard]] Result<bool> verify_signature(std::string_view payload, std::string_view signature_header,
                                            std::string_view secret);

/// Signature header value for `payload`: "sha256=<lowercase hex>"
[[nodiscard]] Result<std::string> compute_signature(std::string_view payload, std::string_view secret);

/// Receives verified deliveries
using Handler = std::function<void(const Envelope&)>;

/**
 * @brief Gates deliveries on signature verification
 *
 * A handler is invoked only for deliveries whose signature verified.
 * Rejections are logged and reported; the host answers them with an error
 * status and drops the payload.
 *
 * Thread Safety: dispatch() may be called concurrently.
 */
class Dispatcher {
  public:
    /**
     * @param secret Shared webhook secret
     * @param events Optional bus for webhook events; must outlive the dispatcher
     */
    explicit Dispatcher(std::string secret, std::size_t max_payload_bytes = DEFAULT_MAX_PAYLOAD_BYTES,
                        EventBus* events = nullptr);

    /**
     * @brief Verify `envelope` and hand it to `handler` on success
     *
     * @return ok() after the handler ran; PayloadTooLarge, SecretNotConfigured,
     *         MissingSignature, MalformedSignature or SignatureMismatch otherwise
     */
    [[nodiscard]] Result<void> dispatch(const Envelope& envelope, const Handler& handler) const;

    /// Verify only; same outcomes as dispatch() without a handler
    [[nodiscard]] Result<void> verify(const Envelope& envelope) const;

    [[nodiscard]] std::size_t max_payload_bytes() const noexcept { return max_payload_bytes_; }

  private:
    Result<void> reject(const Envelope& envelope, ErrorCode code, const std::string& message) const;

    std::string secret_;
    std::size_t max_payload_bytes_;
    EventBus* events_;
};

}  // namespace webhook
}  // namespace ghapp
