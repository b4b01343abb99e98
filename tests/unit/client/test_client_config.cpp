/**
 * @file test_client_config.cpp
 * @brief Unit tests for client configuration and target paths
 */

#include <gtest/gtest.h>

#include <kcenon/package_client/client/client_config.h>
#include <kcenon/package_client/client/client_types.h>

#include <cstdlib>
#include <string>

namespace kcenon::package_client::test {

// ============================================================================
// client_config
// ============================================================================

class ClientConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        ::unsetenv("PACKAGE_CLIENT_DOMAIN");
        ::unsetenv("PACKAGE_CLIENT_TOKEN");
        ::unsetenv("PACKAGE_CLIENT_STORE_TIMEOUT_SECONDS");
    }
};

TEST_F(ClientConfigTest, DefaultsAreValid) {
    client_config config;
    EXPECT_EQ(config.domain, "https://api.anaconda.org");
    EXPECT_FALSE(config.token.has_value());
    EXPECT_EQ(config.version_header, "x-binstar-api-version");
    EXPECT_EQ(config.client_version, "0.4.2");
    EXPECT_EQ(config.store_timeout, std::chrono::hours(10));
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ClientConfigTest, RejectsNonHttpDomain) {
    client_config config;
    config.domain = "ftp://example.com";
    auto valid = config.validate();
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, error_code::invalid_configuration);
}

TEST_F(ClientConfigTest, RejectsNonPositiveTimeouts) {
    client_config config;
    config.request_timeout = std::chrono::milliseconds(0);
    EXPECT_FALSE(config.validate().has_value());

    config = client_config{};
    config.store_timeout = std::chrono::seconds(-1);
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ClientConfigTest, RejectsChunkSizeOutOfRange) {
    client_config config;
    config.read_chunk_size = 16;
    EXPECT_FALSE(config.validate().has_value());

    config.read_chunk_size = max_read_chunk_size + 1;
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ClientConfigTest, RejectsEmptyToken) {
    client_config config;
    config.token = "";
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ClientConfigTest, UrlStripsTrailingSlashes) {
    client_config config;
    config.domain = "https://api.example.com//";
    EXPECT_EQ(config.url("/user"), "https://api.example.com/user");
}

TEST_F(ClientConfigTest, DefaultHeaders) {
    client_config config;
    auto anonymous = config.default_headers();
    EXPECT_EQ(anonymous.at("x-binstar-api-version"), "0.4.2");
    EXPECT_EQ(anonymous.count("Authorization"), 0u);

    config.token = "abc123";
    auto authed = config.default_headers();
    EXPECT_EQ(authed.at("Authorization"), "token abc123");
}

TEST_F(ClientConfigTest, EnvironmentOverlaysBase) {
    ::setenv("PACKAGE_CLIENT_DOMAIN", "http://localhost:8080", 1);
    ::setenv("PACKAGE_CLIENT_TOKEN", "env-token", 1);
    ::setenv("PACKAGE_CLIENT_STORE_TIMEOUT_SECONDS", "120", 1);

    client_config base;
    base.verify_tls = false;
    auto config = client_config::from_environment(base);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().domain, "http://localhost:8080");
    EXPECT_EQ(config.value().token, "env-token");
    EXPECT_EQ(config.value().store_timeout, std::chrono::seconds(120));
    EXPECT_FALSE(config.value().verify_tls);
}

TEST_F(ClientConfigTest, UnsetEnvironmentKeepsBase) {
    client_config base;
    base.domain = "https://mirror.example.org";
    auto config = client_config::from_environment(base);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().domain, "https://mirror.example.org");
}

TEST_F(ClientConfigTest, InvalidStoreTimeoutInEnvironment) {
    ::setenv("PACKAGE_CLIENT_STORE_TIMEOUT_SECONDS", "ten", 1);
    auto config = client_config::from_environment();
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::invalid_configuration);

    ::setenv("PACKAGE_CLIENT_STORE_TIMEOUT_SECONDS", "0", 1);
    EXPECT_FALSE(client_config::from_environment().has_value());
}

TEST_F(ClientConfigTest, InvalidDomainInEnvironment) {
    ::setenv("PACKAGE_CLIENT_DOMAIN", "api.example.com", 1);
    EXPECT_FALSE(client_config::from_environment().has_value());
}

// ============================================================================
// transfer_target
// ============================================================================

class TransferTargetTest : public ::testing::Test {};

TEST_F(TransferTargetTest, PathKeepsSubdirInBasename) {
    transfer_target target{"owner", "pkg", "1.0", "linux-64/pkg-1.0-0.tar.bz2"};
    EXPECT_EQ(target.path(), "/owner/pkg/1.0/linux-64/pkg-1.0-0.tar.bz2");
    EXPECT_EQ(target.to_string(), "owner/pkg/1.0/linux-64/pkg-1.0-0.tar.bz2");
}

TEST_F(TransferTargetTest, PathEscapesSegments) {
    transfer_target target{"my org", "pkg/x", "1.0+local", "a b.tar.bz2"};
    EXPECT_EQ(target.path(), "/my%20org/pkg%2Fx/1.0%2Blocal/a%20b.tar.bz2");
}

TEST_F(TransferTargetTest, Equality) {
    transfer_target a{"o", "p", "1", "f"};
    transfer_target b{"o", "p", "1", "f"};
    transfer_target c{"o", "p", "2", "f"};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST_F(TransferTargetTest, UploadProgressPercentage) {
    upload_progress progress{{}, 50, 200};
    EXPECT_DOUBLE_EQ(progress.percentage(), 25.0);
    EXPECT_DOUBLE_EQ(upload_progress{}.percentage(), 0.0);
}

}  // namespace kcenon::package_client::test
