#include "ghapp/http.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>

// Detect SSL support in cpp-httplib
#if defined(CPPHTTPLIB_OPENSSL_SUPPORT)
#define GHAPP_HTTP_HAS_SSL 1
#else
#define GHAPP_HTTP_HAS_SSL 0
#endif

namespace ghapp {
namespace http {

bool HeaderNameLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](unsigned char a, unsigned char b) {
            return std::tolower(a) < std::tolower(b);
        });
}

namespace {

struct BaseUrl {
    bool https = false;
    std::string scheme_host_port;  // e.g. "https://api.github.com:443"
    std::string path;              // prefix for every request path, no trailing slash
};

BaseUrl parse_base_url(std::string url) {
    BaseUrl parsed;

    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    std::string rest = url;
    if (rest.rfind("https://", 0) == 0) {
        parsed.https = true;
        rest = rest.substr(8);
    } else if (rest.rfind("http://", 0) == 0) {
        rest = rest.substr(7);
    }

    auto slash_pos = rest.find('/');
    std::string authority = rest.substr(0, slash_pos);
    if (slash_pos != std::string::npos) {
        parsed.path = rest.substr(slash_pos);
    }

    // Default port is implied by the scheme when the authority carries none
    parsed.scheme_host_port = (parsed.https ? "https://" : "http://") + authority;
    return parsed;
}

ErrorCode transport_error_code(httplib::Error error) {
    switch (error) {
        case httplib::Error::Connection:
        case httplib::Error::Read:
        case httplib::Error::Write:
            return ErrorCode::NetworkError;
#if GHAPP_HTTP_HAS_SSL
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLLoadingCerts:
        case httplib::Error::SSLServerVerification:
            return ErrorCode::SSLError;
#endif
        default:
            return ErrorCode::NetworkError;
    }
}

}  // namespace

// ==================== HttpClient Implementation ====================

class HttpClient::Impl {
  public:
    explicit Impl(Config config) : config_(std::move(config)), url_(parse_base_url(config_.base_url)) {
        configured_ = !config_.base_url.empty();
    }

    Response send(const Request& request) {
        Response response;

        if (!configured_) {
            response.transport_error = ErrorCode::MissingParameter;
            response.error_message = "HTTP client not configured";
            return response;
        }

#if !GHAPP_HTTP_HAS_SSL
        // If HTTPS was requested but SSL is not available, fail gracefully
        if (url_.https) {
            response.transport_error = ErrorCode::SSLError;
            response.error_message = "HTTPS not supported: cpp-httplib was compiled without SSL support";
            return response;
        }
#endif

        // One client per call so concurrent callers never share a connection
        httplib::Client client(url_.scheme_host_port);
        client.set_connection_timeout(config_.timeout_seconds);
        client.set_read_timeout(config_.timeout_seconds);
        client.set_write_timeout(config_.timeout_seconds);
#if GHAPP_HTTP_HAS_SSL
        if (!config_.verify_ssl) {
            client.enable_server_certificate_verification(false);
        }
#endif

        std::string full_path = url_.path;
        if (request.path.empty() || request.path.front() != '/') {
            full_path += '/';
        }
        full_path += request.path;

        httplib::Headers headers;
        headers.emplace("User-Agent", config_.user_agent);
        for (const auto& [name, value] : request.headers) {
            headers.emplace(name, value);
        }

        httplib::Result result = dispatch(client, request, full_path, headers);

        if (!result) {
            auto error = result.error();
            response.transport_error = transport_error_code(error);
            response.error_message = httplib::to_string(error);
            return response;
        }

        response.status_code = result->status;
        response.body = result->body;
        for (const auto& [name, value] : result->headers) {
            response.headers[name] = value;
        }
        response.success = (result->status >= 200 && result->status < 300);
        return response;
    }

    bool is_configured() const { return configured_; }

    const std::string& base_url() const { return config_.base_url; }

  private:
    static httplib::Result dispatch(httplib::Client& client, const Request& request,
                                    const std::string& path, const httplib::Headers& headers) {
        switch (request.method) {
            case Method::GET:
                return client.Get(path, headers);
            case Method::POST:
                return client.Post(path, headers, request.body, request.content_type);
            case Method::PUT:
                return client.Put(path, headers, request.body, request.content_type);
            case Method::PATCH:
                return client.Patch(path, headers, request.body, request.content_type);
            case Method::DELETE_METHOD:
                if (request.body.empty()) {
                    return client.Delete(path, headers);
                }
                return client.Delete(path, headers, request.body, request.content_type);
            case Method::HEAD:
                return client.Head(path, headers);
        }
        return httplib::Result();
    }

    Config config_;
    BaseUrl url_;
    bool configured_ = false;
};

HttpClient::HttpClient(Config config) : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

Response HttpClient::send(const Request& request) {
    return impl_->send(request);
}

bool HttpClient::is_configured() const {
    return impl_->is_configured();
}

const std::string& HttpClient::base_url() const {
    return impl_->base_url();
}

}  // namespace http
}  // namespace ghapp
