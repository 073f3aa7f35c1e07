#include "ghapp/crypto.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/pem.h>

#include <algorithm>
#include <limits>
#include <memory>

namespace ghapp {
namespace crypto {

namespace {

std::string last_openssl_error() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "no OpenSSL error reported";
    }
    char err_buf[256];
    ERR_error_string_n(err, err_buf, sizeof(err_buf));
    return err_buf;
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

// ==================== Base64 Encoding/Decoding ====================

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    std::unique_ptr<BIO, decltype(&BIO_free_all)> b64(BIO_new(BIO_f_base64()), BIO_free_all);
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

    BIO* bmem = BIO_new(BIO_s_mem());
    BIO_push(b64.get(), bmem);

    BIO_write(b64.get(), data.data(), static_cast<int>(data.size()));
    (void)BIO_flush(b64.get());

    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64.get(), &bptr);

    return std::string(bptr->data, bptr->length);
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
    std::string encoded = base64_encode(data);

    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');

    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }

    return encoded;
}

std::string base64url_encode(std::string_view data) {
    return base64url_encode(std::vector<uint8_t>(data.begin(), data.end()));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }

    std::string padded = encoded;
    while (padded.size() % 4 != 0) {
        padded += '=';
    }

    std::unique_ptr<BIO, decltype(&BIO_free_all)> b64(BIO_new(BIO_f_base64()), BIO_free_all);
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

    std::unique_ptr<BIO, decltype(&BIO_free)> bmem(
        BIO_new_mem_buf(padded.data(), static_cast<int>(padded.size())), BIO_free);
    BIO_push(b64.get(), bmem.release());

    std::vector<uint8_t> result(padded.size() * 3 / 4 + 1);

    int decoded_len = BIO_read(b64.get(), result.data(), static_cast<int>(result.size()));
    if (decoded_len > 0) {
        result.resize(static_cast<size_t>(decoded_len));
    } else {
        result.clear();
    }

    return result;
}

std::vector<uint8_t> base64url_decode(const std::string& encoded) {
    std::string standard = encoded;
    std::replace(standard.begin(), standard.end(), '-', '+');
    std::replace(standard.begin(), standard.end(), '_', '/');

    return base64_decode(standard);
}

// ==================== Hex ====================

std::string hex_encode(const std::vector<uint8_t>& data) {
    static constexpr char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0f]);
    }
    return out;
}

std::optional<std::vector<uint8_t>> hex_decode(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

// ==================== RSA ====================

Result<KeyHandle> load_rsa_private_key(const std::string& pem) {
    if (pem.empty()) {
        return Result<KeyHandle>::error(ErrorCode::InvalidKey, "Private key is empty");
    }

    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
    if (!bio) {
        return Result<KeyHandle>::error(ErrorCode::Unknown, "Failed to allocate key buffer");
    }

    // PEM_read_bio_PrivateKey handles both PKCS#1 and PKCS#8 encodings
    EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!raw) {
        return Result<KeyHandle>::error(ErrorCode::InvalidKey,
                                        "Failed to parse private key: " + last_openssl_error());
    }
    KeyHandle key(raw, EVP_PKEY_free);

    if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
        return Result<KeyHandle>::error(ErrorCode::InvalidKey,
                                        "Private key is not an RSA key (RS256 required)");
    }

    return Result<KeyHandle>::ok(std::move(key));
}

Result<std::vector<uint8_t>> sign_rs256(const KeyHandle& key, std::string_view data) {
    if (!key) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::InvalidKey, "No signing key");
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::SigningFailed,
                                                   "Failed to create signing context");
    }

    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1) {
        return Result<std::vector<uint8_t>>::error(
            ErrorCode::SigningFailed, "Failed to initialize signing: " + last_openssl_error());
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(data.data());

    size_t sig_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, bytes, data.size()) != 1) {
        return Result<std::vector<uint8_t>>::error(
            ErrorCode::SigningFailed, "Failed to size signature: " + last_openssl_error());
    }

    std::vector<uint8_t> signature(sig_len);
    if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len, bytes, data.size()) != 1) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::SigningFailed,
                                                   "Signing failed: " + last_openssl_error());
    }
    signature.resize(sig_len);

    return Result<std::vector<uint8_t>>::ok(std::move(signature));
}

Result<bool> verify_rs256(const KeyHandle& key, std::string_view data,
                          const std::vector<uint8_t>& signature) {
    if (!key) {
        return Result<bool>::error(ErrorCode::InvalidKey, "No verification key");
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        return Result<bool>::error(ErrorCode::Unknown, "Failed to create verification context");
    }

    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1) {
        return Result<bool>::error(ErrorCode::Unknown,
                                   "Failed to initialize verification: " + last_openssl_error());
    }

    int result = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                  reinterpret_cast<const unsigned char*>(data.data()), data.size());

    if (result == 1) {
        return Result<bool>::ok(true);
    }
    // Mismatch leaves an entry on the error queue; drop it
    ERR_clear_error();
    return Result<bool>::ok(false);
}

// ==================== HMAC ====================

Result<std::vector<uint8_t>> hmac_sha256(std::string_view key, std::string_view data) {
    std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
    unsigned int mac_len = 0;

    // A null key pointer means "reuse the previous key" to OpenSSL
    static const char empty_key = 0;
    const void* key_ptr = key.empty() ? &empty_key : key.data();

    if (key.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::InvalidParameter, "HMAC key is too long");
    }

    if (!HMAC(EVP_sha256(), key_ptr, static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), mac.data(), &mac_len)) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::Unknown,
                                                   "HMAC computation failed: " + last_openssl_error());
    }

    mac.resize(mac_len);
    return Result<std::vector<uint8_t>>::ok(std::move(mac));
}

bool constant_time_equals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace crypto
}  // namespace ghapp
