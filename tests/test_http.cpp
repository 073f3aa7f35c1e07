#include <gtest/gtest.h>
#include <ghapp/http.hpp>

namespace ghapp {
namespace http {
namespace {

// ==================== HttpClient Config Tests ====================

TEST(HttpClientConfigTest, DefaultConfig) {
    HttpClient::Config config;

    EXPECT_TRUE(config.base_url.empty());
    EXPECT_EQ(config.timeout_seconds, 30);
    EXPECT_TRUE(config.verify_ssl);
    EXPECT_EQ(config.user_agent, std::string("ghapp/") + VERSION);
}

// ==================== HttpClient Construction Tests ====================

TEST(HttpClientTest, ConstructWithHttpsUrl) {
    HttpClient::Config config;
    config.base_url = "https://api.github.com";

    HttpClient client(config);

    EXPECT_TRUE(client.is_configured());
    EXPECT_EQ(client.base_url(), "https://api.github.com");
}

TEST(HttpClientTest, ConstructWithEnterpriseUrl) {
    HttpClient::Config config;
    config.base_url = "https://github.example.com:8443/api/v3/";

    HttpClient client(config);

    EXPECT_TRUE(client.is_configured());
}

TEST(HttpClientTest, EmptyBaseUrlIsNotConfigured) {
    HttpClient client(HttpClient::Config{});

    EXPECT_FALSE(client.is_configured());

    Request request;
    request.path = "/rate_limit";
    auto response = client.send(request);

    EXPECT_EQ(response.status_code, 0);
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.transport_error, ErrorCode::MissingParameter);
}

TEST(HttpClientTest, CanBeMoved) {
    HttpClient::Config config;
    config.base_url = "https://api.github.com";

    HttpClient client1(config);
    HttpClient client2 = std::move(client1);

    EXPECT_TRUE(client2.is_configured());
}

TEST(HttpClientTest, UnreachableHostIsTransportFailure) {
    HttpClient::Config config;
    config.base_url = "http://127.0.0.1:1";
    config.timeout_seconds = 2;

    HttpClient client(config);
    Request request;
    request.path = "/app";
    auto response = client.send(request);

    EXPECT_EQ(response.status_code, 0);
    EXPECT_FALSE(response.success);
    EXPECT_NE(response.transport_error, ErrorCode::Success);
    EXPECT_FALSE(response.error_message.empty());
}

// ==================== Request Structure Tests ====================

TEST(HttpRequestTest, DefaultValues) {
    Request request;

    EXPECT_EQ(request.method, Method::GET);
    EXPECT_TRUE(request.path.empty());
    EXPECT_TRUE(request.body.empty());
    EXPECT_EQ(request.content_type, "application/json");
    EXPECT_TRUE(request.headers.empty());
}

TEST(HttpMethodTest, WireNames) {
    EXPECT_STREQ(method_to_string(Method::GET), "GET");
    EXPECT_STREQ(method_to_string(Method::POST), "POST");
    EXPECT_STREQ(method_to_string(Method::PUT), "PUT");
    EXPECT_STREQ(method_to_string(Method::PATCH), "PATCH");
    EXPECT_STREQ(method_to_string(Method::DELETE_METHOD), "DELETE");
    EXPECT_STREQ(method_to_string(Method::HEAD), "HEAD");
}

// ==================== Headers Tests ====================

TEST(HeadersTest, NamesAreCaseInsensitive) {
    Headers headers;
    headers["Retry-After"] = "5";
    headers["retry-after"] = "7";

    EXPECT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers.at("RETRY-AFTER"), "7");
}

TEST(HttpResponseTest, HeaderLookup) {
    Response response;
    response.headers["X-GitHub-Request-Id"] = "ABCD:1234";

    EXPECT_EQ(response.header("x-github-request-id").value_or(""), "ABCD:1234");
    EXPECT_FALSE(response.header("Retry-After").has_value());
}

// ==================== Response Structure Tests ====================

TEST(HttpResponseTest, DefaultValues) {
    Response response;

    EXPECT_EQ(response.status_code, 0);
    EXPECT_TRUE(response.body.empty());
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.transport_error, ErrorCode::Success);
    EXPECT_TRUE(response.error_message.empty());
}

}  // namespace
}  // namespace http
}  // namespace ghapp
