#include "ghapp/jwt.hpp"
#include "ghapp/json.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace ghapp {
namespace jwt {

AssertionSigner::AssertionSigner(crypto::KeyHandle key, std::string issuer, Settings settings)
    : key_(std::move(key)), issuer_(std::move(issuer)), settings_(settings) {}

Result<AssertionSigner> AssertionSigner::from_pem(const std::string& pem, std::string issuer,
                                                  Settings settings) {
    if (issuer.empty()) {
        return Result<AssertionSigner>::error(ErrorCode::MissingParameter,
                                              "Assertion issuer (App ID) is required");
    }
    if (settings.lifetime.count() <= 0) {
        return Result<AssertionSigner>::error(ErrorCode::InvalidParameter,
                                              "Assertion lifetime must be positive");
    }
    if (settings.clock_skew.count() < 0) {
        return Result<AssertionSigner>::error(ErrorCode::InvalidParameter,
                                              "Clock skew must not be negative");
    }
    settings.lifetime = std::min(settings.lifetime, MAX_LIFETIME);

    auto key = crypto::load_rsa_private_key(pem);
    if (key.is_error()) {
        return Result<AssertionSigner>::error_from(key);
    }

    AssertionSigner signer(std::move(key).value(), std::move(issuer), settings);

    auto sample = signer.sign(std::chrono::system_clock::now());
    if (sample.is_error()) {
        return Result<AssertionSigner>::error(ErrorCode::InvalidKey,
                                              "Private key cannot sign assertions: " + sample.error_message());
    }
    auto checked = verify(sample.value(), signer.key());
    if (checked.is_error()) {
        return Result<AssertionSigner>::error(ErrorCode::InvalidKey,
                                              "Private key failed the signing self-check: " +
                                                  checked.error_message());
    }

    return Result<AssertionSigner>::ok(std::move(signer));
}

Result<AssertionSigner> AssertionSigner::from_pem(const std::string& pem, std::string issuer) {
    return from_pem(pem, std::move(issuer), Settings{});
}

Result<AssertionSigner> AssertionSigner::from_file(const std::string& path, std::string issuer,
                                                   Settings settings) {
    if (path.empty()) {
        return Result<AssertionSigner>::error(ErrorCode::MissingParameter,
                                              "Private key path is required");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<AssertionSigner>::error(ErrorCode::FileNotFound,
                                              "Could not open private key file: " + path);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        return Result<AssertionSigner>::error(ErrorCode::FileError,
                                              "Could not read private key file: " + path);
    }

    return from_pem(contents.str(), std::move(issuer), settings);
}

Result<std::string> AssertionSigner::sign(Timestamp now) const {
    auto claims = json::build_assertion_claims(issuer_, now - settings_.clock_skew,
                                               now + settings_.lifetime);

    std::string signing_input = crypto::base64url_encode(json::build_assertion_header().dump()) +
                                "." + crypto::base64url_encode(claims.dump());

    auto signature = crypto::sign_rs256(key_, signing_input);
    if (signature.is_error()) {
        return Result<std::string>::error_from(signature);
    }

    return Result<std::string>::ok(signing_input + "." +
                                   crypto::base64url_encode(signature.value()));
}

Result<DecodedToken> decode(const std::string& token) {
    auto first = token.find('.');
    auto second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
    if (first == std::string::npos || second == std::string::npos ||
        token.find('.', second + 1) != std::string::npos) {
        return Result<DecodedToken>::error(ErrorCode::ParseError,
                                           "Token must have exactly three segments");
    }

    auto header = crypto::base64url_decode(token.substr(0, first));
    auto claims = crypto::base64url_decode(token.substr(first + 1, second - first - 1));

    DecodedToken decoded;
    decoded.header_json.assign(header.begin(), header.end());
    decoded.claims_json.assign(claims.begin(), claims.end());
    decoded.signature = crypto::base64url_decode(token.substr(second + 1));
    decoded.signing_input = token.substr(0, second);

    return Result<DecodedToken>::ok(std::move(decoded));
}

Result<DecodedToken> verify(const std::string& token, const crypto::KeyHandle& key) {
    auto decoded = decode(token);
    if (decoded.is_error()) {
        return decoded;
    }

    auto valid = crypto::verify_rs256(key, decoded.value().signing_input, decoded.value().signature);
    if (valid.is_error()) {
        return Result<DecodedToken>::error_from(valid);
    }
    if (!valid.value()) {
        return Result<DecodedToken>::error(ErrorCode::SigningFailed, "Signature does not verify");
    }
    return decoded;
}

}  // namespace jwt
}  // namespace ghapp
