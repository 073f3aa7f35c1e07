#include <gtest/gtest.h>
#include <ghapp/client.hpp>

#include "test_helpers.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace ghapp {
namespace {

class ClientTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config_.app_id = 12345;
        config_.installation_id = 99;
        config_.private_key_pem = test::rsa_pem();
        config_.webhook_secret = "s3cr3t";
        // No real waiting between retries
        config_.initial_backoff_ms = 0;
        config_.max_backoff_ms = 0;
        http_ = std::make_shared<test::ScriptedHttpClient>();
    }

    Client make_client() {
        auto client = Client::create(config_, http_);
        if (client.is_error()) {
            throw std::runtime_error(client.error_message());
        }
        return std::move(client).value();
    }

    Config config_;
    std::shared_ptr<test::ScriptedHttpClient> http_;
};

// ==================== Construction Tests ====================

TEST_F(ClientTest, CanBeCreated) {
    auto client = Client::create(config_, http_);

    ASSERT_TRUE(client.is_ok()) << client.error_message();
    EXPECT_EQ(client.value().config().app_id, 12345u);
    EXPECT_EQ(http_->request_count(), 0u);
}

TEST_F(ClientTest, CreateWithDefaultTransport) {
    config_.api_url = "http://127.0.0.1:1";

    auto client = Client::create(config_);

    EXPECT_TRUE(client.is_ok()) << client.error_message();
}

TEST_F(ClientTest, InvalidConfigIsRejected) {
    config_.app_id = 0;

    auto client = Client::create(config_, http_);

    ASSERT_TRUE(client.is_error());
    EXPECT_EQ(client.error_code(), ErrorCode::ConfigError);
}

TEST_F(ClientTest, UnusableKeyIsFatalAtStartup) {
    config_.private_key_pem = test::ed25519_pem();

    auto client = Client::create(config_, http_);

    ASSERT_TRUE(client.is_error());
    EXPECT_EQ(client.error_code(), ErrorCode::InvalidKey);
}

TEST_F(ClientTest, MissingKeyFileIsFatalAtStartup) {
    config_.private_key_pem.clear();
    config_.private_key_path = "/nonexistent/ghapp/key.pem";

    auto client = Client::create(config_, http_);

    ASSERT_TRUE(client.is_error());
    EXPECT_EQ(client.error_code(), ErrorCode::FileNotFound);
}

TEST_F(ClientTest, NullTransportIsRejected) {
    auto client = Client::create(config_, nullptr);

    ASSERT_TRUE(client.is_error());
    EXPECT_EQ(client.error_code(), ErrorCode::MissingParameter);
}

TEST_F(ClientTest, CanBeMoved) {
    auto client1 = make_client();
    Client client2 = std::move(client1);

    EXPECT_EQ(client2.config().installation_id, 99u);
}

// ==================== REST Call Tests ====================

TEST_F(ClientTest, GetAuthorizesAndDecodes) {
    http_->push(test::token_response("ghs_1"));
    http_->push(test::make_response(200, R"([{"full_name":"example-org/repo"}])"));
    auto client = make_client();

    auto repos = client.get("/orgs/example-org/repos");

    ASSERT_TRUE(repos.is_ok()) << repos.error_message();
    EXPECT_EQ(repos.value()[0]["full_name"], "example-org/repo");

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].path, "/app/installations/99/access_tokens");
    EXPECT_EQ(requests[1].method, http::Method::GET);
    EXPECT_EQ(requests[1].path, "/orgs/example-org/repos");
    EXPECT_EQ(requests[1].headers.at("Authorization"), "Bearer ghs_1");
    EXPECT_EQ(requests[1].headers.at("Accept"), "application/vnd.github+json");
    EXPECT_EQ(requests[1].headers.count("X-GitHub-Api-Version"), 1u);
}

TEST_F(ClientTest, TokenIsReusedAcrossCalls) {
    http_->push(test::token_response("ghs_1"));
    http_->push(test::make_response(200, "{}"));
    http_->push(test::make_response(200, "{}"));
    auto client = make_client();

    ASSERT_TRUE(client.get("/a").is_ok());
    ASSERT_TRUE(client.get("/b").is_ok());

    EXPECT_EQ(http_->request_count(), 3u);
}

TEST_F(ClientTest, PostSendsJsonBody) {
    http_->push(test::token_response("ghs_1"));
    http_->push(test::make_response(201, R"({"number":1})"));
    auto client = make_client();

    auto issue = client.post("/repos/example-org/repo/issues", {{"title", "Branch protection missing"}});

    ASSERT_TRUE(issue.is_ok()) << issue.error_message();
    EXPECT_EQ(issue.value()["number"], 1);

    auto sent = http_->requests()[1];
    EXPECT_EQ(sent.method, http::Method::POST);
    EXPECT_EQ(nlohmann::json::parse(sent.body)["title"], "Branch protection missing");
}

TEST_F(ClientTest, PutPatchDeleteUseMatchingMethods) {
    http_->push(test::token_response("ghs_1"));
    http_->set_fallback(test::make_response(200, "{}"));
    auto client = make_client();

    ASSERT_TRUE(client.put("/x", nlohmann::json::object()).is_ok());
    ASSERT_TRUE(client.patch("/x", nlohmann::json::object()).is_ok());
    ASSERT_TRUE(client.del("/x").is_ok());

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 4u);
    EXPECT_EQ(requests[1].method, http::Method::PUT);
    EXPECT_EQ(requests[2].method, http::Method::PATCH);
    EXPECT_EQ(requests[3].method, http::Method::DELETE_METHOD);
    EXPECT_TRUE(requests[3].body.empty());
}

TEST_F(ClientTest, EmptySuccessBodyDecodesAsEmptyObject) {
    http_->push(test::token_response("ghs_1"));
    http_->push(test::make_response(204));
    auto client = make_client();

    auto result = client.put("/repos/example-org/repo/branches/main/protection", nlohmann::json::object());

    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_TRUE(result.value().is_object());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(ClientTest, HeadReturnsEmptyObject) {
    http_->push(test::token_response("ghs_1"));
    http_->push(test::make_response(200));
    auto client = make_client();

    auto result = client.head("/repos/example-org/repo");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
    EXPECT_EQ(http_->requests()[1].method, http::Method::HEAD);
}

TEST_F(ClientTest, RevokedTokenIsRenewedTransparently) {
    http_->push(test::token_response("ghs_1"));
    http_->push(test::make_response(401, R"({"message":"Bad credentials"})"));
    http_->push(test::token_response("ghs_2"));
    http_->push(test::make_response(200, R"({"ok":true})"));
    auto client = make_client();

    auto result = client.get("/installation/repositories");

    ASSERT_TRUE(result.is_ok()) << result.error_message();
    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 4u);
    EXPECT_EQ(requests[3].headers.at("Authorization"), "Bearer ghs_2");
}

TEST_F(ClientTest, TransientFailureIsRetried) {
    http_->push(test::token_response("ghs_1"));
    http_->push(test::make_response(502));
    http_->push(test::make_response(200, "{}"));
    auto client = make_client();

    EXPECT_TRUE(client.get("/rate_limit").is_ok());
    EXPECT_EQ(http_->request_count(), 3u);
}

TEST_F(ClientTest, NotFoundIsClientRequestError) {
    http_->push(test::token_response("ghs_1"));
    http_->push(test::make_response(404, R"({"message":"Not Found"})"));
    auto client = make_client();

    auto result = client.get("/repos/example-org/missing");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::ClientRequestFailed);
    EXPECT_EQ(result.status_code(), 404);
    EXPECT_EQ(http_->request_count(), 2u);
}

TEST_F(ClientTest, UndecodableBodyIsParseError) {
    http_->push(test::token_response("ghs_1"));
    http_->push(test::make_response(200, "<html>"));
    auto client = make_client();

    auto result = client.get("/weird");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::ParseError);
    EXPECT_EQ(result.response_body(), "<html>");
}

TEST_F(ClientTest, CredentialFailureSurfacesFromCall) {
    http_->set_fallback(test::make_response(401, R"({"message":"A JSON web token could not be decoded"})"));
    auto client = make_client();

    auto result = client.get("/orgs/example-org/repos");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::CredentialExchangeFailed);
    EXPECT_EQ(result.status_code(), 401);
}

TEST_F(ClientTest, ExecuteReturnsRawResponse) {
    http_->push(test::token_response("ghs_1"));
    http_->push(test::make_response(200, "plain", {{"X-RateLimit-Remaining", "4999"}}));
    auto client = make_client();

    http::Request request;
    request.path = "/rate_limit";
    auto response = client.execute(request);

    ASSERT_TRUE(response.is_ok());
    EXPECT_EQ(response.value().body, "plain");
    EXPECT_EQ(response.value().header("x-ratelimit-remaining").value_or(""), "4999");
}

// ==================== Credential Tests ====================

TEST_F(ClientTest, AccessTokenAndInvalidate) {
    http_->push(test::token_response("ghs_1"));
    http_->push(test::token_response("ghs_2"));
    auto client = make_client();

    EXPECT_EQ(client.access_token().value().token, "ghs_1");
    EXPECT_EQ(client.access_token().value().token, "ghs_1");

    client.invalidate_token();

    EXPECT_EQ(client.access_token().value().token, "ghs_2");
    EXPECT_EQ(http_->request_count(), 2u);
}

TEST_F(ClientTest, TokenEventsReachSubscribers) {
    http_->push(test::token_response("ghs_1"));
    auto client = make_client();
    int refreshed = 0;
    auto sub = client.on(events::TOKEN_REFRESHED, [&](const EventData&) { ++refreshed; });

    ASSERT_TRUE(client.access_token().is_ok());

    EXPECT_EQ(refreshed, 1);
}

// ==================== Webhook Tests ====================

TEST_F(ClientTest, VerifyWebhook) {
    auto client = make_client();
    const std::string signature = "sha256=5b052f4381f5bf768dc87c3fbced7e96a781d58f2284a440a24c692225f13111";

    auto authentic = client.verify_webhook(R"({"action":"created"})", signature);
    auto tampered = client.verify_webhook(R"({"action":"deleted"})", signature);

    ASSERT_TRUE(authentic.is_ok());
    EXPECT_TRUE(authentic.value());
    ASSERT_TRUE(tampered.is_ok());
    EXPECT_FALSE(tampered.value());
}

TEST_F(ClientTest, DispatchWebhookGatesHandler) {
    auto client = make_client();
    int handled = 0;
    int rejected = 0;
    auto sub = client.on(events::WEBHOOK_REJECTED, [&](const EventData&) { ++rejected; });

    webhook::Envelope envelope;
    envelope.payload = R"({"action":"created"})";
    envelope.signature = webhook::compute_signature(envelope.payload, "s3cr3t").value();
    envelope.event = "repository";

    EXPECT_TRUE(client.dispatch_webhook(envelope, [&](const webhook::Envelope&) { ++handled; }).is_ok());

    envelope.payload = R"({"action":"deleted"})";
    auto result = client.dispatch_webhook(envelope, [&](const webhook::Envelope&) { ++handled; });

    EXPECT_EQ(result.error_code(), ErrorCode::SignatureMismatch);
    EXPECT_EQ(handled, 1);
    EXPECT_EQ(rejected, 1);
    EXPECT_EQ(http_->request_count(), 0u);
}

TEST_F(ClientTest, WebhookWithoutSecretIsRejected) {
    config_.webhook_secret.clear();
    auto client = make_client();

    auto result = client.verify_webhook("{}", webhook::compute_signature("{}", "anything").value());

    EXPECT_EQ(result.error_code(), ErrorCode::SecretNotConfigured);
}

}  // namespace
}  // namespace ghapp
