/**
 * @file test_package_api.cpp
 * @brief Unit tests for the metadata requests
 */

#include <gtest/gtest.h>

#include <kcenon/package_client/client/package_api.h>
#include <kcenon/package_client/core/encoding.h>

#include "support/mock_transport.h"

#include <string>

namespace kcenon::package_client::test {

namespace {

auto decode_payload(const std::string& body) -> nlohmann::json {
    auto raw = encoding::base64_decode(body);
    return nlohmann::json::parse(std::string(raw.begin(), raw.end()));
}

}  // namespace

class PackageApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<mock_transport>();

        client_config config;
        config.domain = "https://api.example.com/";
        config.token = "tok-1234567890";
        session_ = std::make_shared<service_session>(config, transport_);
        api_ = std::make_unique<package_api>(session_);
    }

    auto last() const -> recorded_request { return transport_->requests().back(); }

    std::shared_ptr<mock_transport> transport_;
    std::shared_ptr<service_session> session_;
    std::unique_ptr<package_api> api_;
};

// ============================================================================
// Authentication
// ============================================================================

TEST_F(PackageApiTest, AuthenticateStoresToken) {
    transport_->respond(200, R"({"token": "new-token-abcdef", "id": "a1"})");

    authentication_options options;
    options.application = "package-client";
    options.scopes = {"repos", "api:read"};
    options.max_age = 3600;

    auto token = api_->authenticate("alice", "pa55", options);
    ASSERT_TRUE(token.has_value()) << token.error().message;
    EXPECT_EQ(token.value(), "new-token-abcdef");
    EXPECT_EQ(session_->config().token, "new-token-abcdef");

    auto request = last();
    EXPECT_EQ(request.method, http_method::post);
    EXPECT_EQ(request.url, "https://api.example.com/authentications");
    EXPECT_FALSE(request.header("Authorization").has_value());
    ASSERT_TRUE(request.auth.has_value());
    EXPECT_EQ(request.auth->username, "alice");
    EXPECT_EQ(request.auth->password, "pa55");

    auto payload = decode_payload(request.body);
    EXPECT_EQ(payload["note"], "package-client");
    EXPECT_EQ(payload["scopes"], (nlohmann::json{"repos", "api:read"}));
    EXPECT_EQ(payload["max-age"], 3600);
    EXPECT_EQ(payload["strength"], "strong");
    EXPECT_TRUE(payload["note_url"].is_null());
    EXPECT_TRUE(payload["hostname"].is_string());
}

TEST_F(PackageApiTest, AuthenticatedTokenIsUsedAfterwards) {
    transport_->respond(200, R"({"token": "fresh-token-0001"})").respond(200, R"({"login": "alice"})");

    ASSERT_TRUE(api_->authenticate("alice", "pw", {}).has_value());
    ASSERT_TRUE(api_->user().has_value());
    EXPECT_EQ(last().header("Authorization"), "token fresh-token-0001");
}

TEST_F(PackageApiTest, EmptyScopesAreNull) {
    transport_->respond(200, R"({"token": "t0000000"})");
    ASSERT_TRUE(api_->authenticate("u", "p", {}).has_value());
    EXPECT_TRUE(decode_payload(last().body)["scopes"].is_null());
}

TEST_F(PackageApiTest, AuthenticateWithoutTokenIsMalformed) {
    transport_->respond(200, R"({"id": "a1"})");

    auto token = api_->authenticate("alice", "pw", {});
    ASSERT_FALSE(token.has_value());
    EXPECT_EQ(token.error().code, error_code::malformed_response);
    EXPECT_EQ(session_->config().token, "tok-1234567890");
}

TEST_F(PackageApiTest, BadCredentialsAreUnauthorized) {
    transport_->respond(401);

    auto token = api_->authenticate("alice", "wrong", {});
    ASSERT_FALSE(token.has_value());
    EXPECT_EQ(token.error().code, error_code::unauthorized);
}

TEST_F(PackageApiTest, RemoveAuthenticationExpects201) {
    transport_->respond(201).respond(200);

    EXPECT_TRUE(api_->remove_authentication("a1").has_value());
    EXPECT_EQ(last().method, http_method::del);
    EXPECT_EQ(last().url, "https://api.example.com/authentications/a1");

    auto second = api_->remove_authentication("a2");
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::service_error);
}

TEST_F(PackageApiTest, ListScopesIsAnonymous) {
    transport_->respond(200, R"({"repos": "access repos"})");

    auto scopes = api_->list_scopes();
    ASSERT_TRUE(scopes.has_value());
    EXPECT_EQ(scopes.value()["repos"], "access repos");
    EXPECT_FALSE(last().header("Authorization").has_value());
    EXPECT_EQ(last().header("x-binstar-api-version"), "0.4.2");
}

// ============================================================================
// Users and packages
// ============================================================================

TEST_F(PackageApiTest, UserPaths) {
    transport_->respond(200, "{}").respond(200, "{}").respond(200, "[]").respond(200, "[]");

    ASSERT_TRUE(api_->user().has_value());
    EXPECT_EQ(last().url, "https://api.example.com/user");
    ASSERT_TRUE(api_->user("bob").has_value());
    EXPECT_EQ(last().url, "https://api.example.com/user/bob");
    ASSERT_TRUE(api_->user_packages().has_value());
    EXPECT_EQ(last().url, "https://api.example.com/packages");
    ASSERT_TRUE(api_->user_packages("bob").has_value());
    EXPECT_EQ(last().url, "https://api.example.com/packages/bob");
}

TEST_F(PackageApiTest, PackageNotFound) {
    transport_->respond(404);

    auto pkg = api_->package("owner", "missing");
    ASSERT_FALSE(pkg.has_value());
    EXPECT_EQ(pkg.error().code, error_code::not_found);
    EXPECT_EQ(last().url, "https://api.example.com/package/owner/missing");
}

TEST_F(PackageApiTest, AddPackagePayload) {
    transport_->respond(200, R"({"name": "pkg"})");

    package_options options;
    options.summary = "A package";
    options.license = "BSD";
    options.public_access = false;
    options.attrs = {{"home", "https://example.org"}};

    ASSERT_TRUE(api_->add_package("owner", "pkg", options).has_value());
    EXPECT_EQ(last().url, "https://api.example.com/package/owner/pkg");

    auto payload = decode_payload(last().body);
    EXPECT_EQ(payload["public"], false);
    EXPECT_EQ(payload["publish"], true);
    EXPECT_EQ(payload["public_attrs"]["summary"], "A package");
    EXPECT_EQ(payload["public_attrs"]["license"]["name"], "BSD");
    EXPECT_TRUE(payload["public_attrs"]["license"]["url"].is_null());
    EXPECT_EQ(payload["public_attrs"]["home"], "https://example.org");
}

TEST_F(PackageApiTest, AddPackageRejectsNonObjectAttrs) {
    package_options options;
    options.attrs = "string";

    auto pkg = api_->add_package("owner", "pkg", options);
    ASSERT_FALSE(pkg.has_value());
    EXPECT_EQ(pkg.error().code, error_code::malformed_attributes);
    EXPECT_EQ(transport_->request_count(), 0u);
}

TEST_F(PackageApiTest, Collaborators) {
    transport_->respond(200, "[]").respond(201).respond(201);

    ASSERT_TRUE(api_->package_collaborators("owner", "pkg").has_value());
    EXPECT_EQ(last().url, "https://api.example.com/packages/owner/pkg/collaborators");

    ASSERT_TRUE(api_->package_add_collaborator("owner", "pkg", "carol").has_value());
    EXPECT_EQ(last().method, http_method::put);
    EXPECT_EQ(last().url, "https://api.example.com/packages/owner/pkg/collaborators/carol");

    ASSERT_TRUE(api_->package_remove_collaborator("owner", "pkg", "carol").has_value());
    EXPECT_EQ(last().method, http_method::del);
}

TEST_F(PackageApiTest, AllPackagesQuery) {
    transport_->respond(200, "[]");
    ASSERT_TRUE(api_->all_packages("2024-01-01 00:00").has_value());
    EXPECT_EQ(last().url,
              "https://api.example.com/package_listing?modified_after=2024-01-01%2000%3A00");
}

// ============================================================================
// Releases and distributions
// ============================================================================

TEST_F(PackageApiTest, AddRelease) {
    transport_->respond(200, "{}");

    ASSERT_TRUE(api_->add_release("owner", "pkg", "1.0", nlohmann::json::array(), nullptr,
                                  "first release")
                    .has_value());
    EXPECT_EQ(last().url, "https://api.example.com/release/owner/pkg/1.0");
    auto payload = decode_payload(last().body);
    EXPECT_EQ(payload["description"], "first release");
    EXPECT_TRUE(payload["requirements"].is_array());
}

TEST_F(PackageApiTest, DistributionPathKeepsSubdir) {
    transport_->respond(200, R"({"md5": "abc"})");

    auto dist = api_->distribution({"owner", "pkg", "1.0", "osx-64/pkg-1.0.tar.bz2"});
    ASSERT_TRUE(dist.has_value());
    EXPECT_EQ(last().url, "https://api.example.com/dist/owner/pkg/1.0/osx-64/pkg-1.0.tar.bz2");
}

TEST_F(PackageApiTest, RemoveDistByIdOrBasename) {
    transport_->respond(200, "{}").respond(200, "{}");

    ASSERT_TRUE(api_->remove_dist({"owner", "pkg", "1.0", "f.tar.bz2"}).has_value());
    EXPECT_EQ(last().url, "https://api.example.com/dist/owner/pkg/1.0/f.tar.bz2");
    EXPECT_EQ(last().method, http_method::del);

    ASSERT_TRUE(api_->remove_dist({"owner", "pkg", "1.0", ""}, std::string("d-5")).has_value());
    EXPECT_EQ(last().url, "https://api.example.com/dist/owner/pkg/1.0/-/d-5");

    auto neither = api_->remove_dist({"owner", "pkg", "1.0", ""});
    ASSERT_FALSE(neither.has_value());
    EXPECT_EQ(neither.error().code, error_code::invalid_state);
}

TEST_F(PackageApiTest, SearchQuery) {
    transport_->respond(200, "[]").respond(200, "[]");

    ASSERT_TRUE(api_->search("numpy").has_value());
    EXPECT_EQ(last().url, "https://api.example.com/search?name=numpy");

    ASSERT_TRUE(api_->search("numpy", std::string("conda")).has_value());
    EXPECT_EQ(last().url, "https://api.example.com/search?name=numpy&type=conda");
}

TEST_F(PackageApiTest, InvalidJsonIsMalformed) {
    transport_->respond(200, "<html>");

    auto user = api_->user();
    ASSERT_FALSE(user.has_value());
    EXPECT_EQ(user.error().code, error_code::malformed_response);
}

TEST_F(PackageApiTest, TransportFailurePropagates) {
    transport_->fail(error{error_code::connection_timeout, "timed out"});

    auto user = api_->user();
    ASSERT_FALSE(user.has_value());
    EXPECT_EQ(user.error().code, error_code::connection_timeout);
}

}  // namespace kcenon::package_client::test
