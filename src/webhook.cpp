#include "ghapp/webhook.hpp"
#include "ghapp/crypto.hpp"
#include "ghapp/logger.hpp"

namespace ghapp {
namespace webhook {

namespace {

constexpr std::size_t DIGEST_HEX_LENGTH = 64;

std::string delivery_label(const Envelope& envelope) {
    std::string label = envelope.event.empty() ? "delivery" : envelope.event;
    if (!envelope.delivery_id.empty()) {
        label += " " + envelope.delivery_id;
    }
    return label;
}

}  // namespace

Result<bool> verify_signature(std::string_view payload, std::string_view signature_header,
                              std::string_view secret) {
    if (secret.empty()) {
        return Result<bool>::error(ErrorCode::SecretNotConfigured,
                                   "Webhook secret is not configured");
    }
    if (signature_header.empty()) {
        return Result<bool>::error(ErrorCode::MissingSignature,
                                   std::string("Missing ") + SIGNATURE_HEADER + " header");
    }

    std::string_view prefix(SIGNATURE_PREFIX);
    if (signature_header.substr(0, prefix.size()) != prefix) {
        return Result<bool>::error(ErrorCode::MalformedSignature,
                                   "Signature must start with \"sha256=\"");
    }

    auto hex = signature_header.substr(prefix.size());
    if (hex.size() != DIGEST_HEX_LENGTH) {
        return Result<bool>::error(ErrorCode::MalformedSignature,
                                   "Signature must carry 64 hex digits");
    }

    auto received = crypto::hex_decode(hex);
    if (!received) {
        return Result<bool>::error(ErrorCode::MalformedSignature,
                                   "Signature contains non-hex characters");
    }

    auto expected = crypto::hmac_sha256(secret, payload);
    if (expected.is_error()) {
        return Result<bool>::error_from(expected);
    }
    return Result<bool>::ok(crypto::constant_time_equals(expected.value(), *received));
}

Result<std::string> compute_signature(std::string_view payload, std::string_view secret) {
    auto mac = crypto::hmac_sha256(secret, payload);
    if (mac.is_error()) {
        return Result<std::string>::error_from(mac);
    }
    return Result<std::string>::ok(SIGNATURE_PREFIX + crypto::hex_encode(mac.value()));
}

// ==================== Dispatcher ====================

Dispatcher::Dispatcher(std::string secret, std::size_t max_payload_bytes, EventBus* events)
    : secret_(std::move(secret)), max_payload_bytes_(max_payload_bytes), events_(events) {}

Result<void> Dispatcher::reject(const Envelope& envelope, ErrorCode code,
                                const std::string& message) const {
    logger::get()->warn("rejected webhook {}: {}", delivery_label(envelope), message);
    if (events_) {
        events_->emit(events::WEBHOOK_REJECTED,
                      EventFields{{"event", envelope.event},
                                  {"delivery_id", envelope.delivery_id},
                                  {"reason", error_code_to_string(code)}});
    }
    return Result<void>::error(code, message);
}

Result<void> Dispatcher::verify(const Envelope& envelope) const {
    if (envelope.payload.size() > max_payload_bytes_) {
        return reject(envelope, ErrorCode::PayloadTooLarge,
                      "Payload of " + std::to_string(envelope.payload.size()) +
                          " bytes exceeds the limit of " + std::to_string(max_payload_bytes_));
    }

    auto verified = verify_signature(envelope.payload, envelope.signature, secret_);
    if (verified.is_error()) {
        return reject(envelope, verified.error_code(), verified.error_message());
    }
    if (!verified.value()) {
        return reject(envelope, ErrorCode::SignatureMismatch, "Payload signature does not match");
    }

    logger::get()->debug("verified webhook {}", delivery_label(envelope));
    if (events_) {
        events_->emit(events::WEBHOOK_VERIFIED,
                      EventFields{{"event", envelope.event}, {"delivery_id", envelope.delivery_id}});
    }
    return Result<void>::ok();
}

Result<void> Dispatcher::dispatch(const Envelope& envelope, const Handler& handler) const {
    auto verified = verify(envelope);
    if (verified.is_error()) {
        return verified;
    }

    if (handler) {
        handler(envelope);
    }
    return Result<void>::ok();
}

}  // namespace webhook
}  // namespace ghapp
