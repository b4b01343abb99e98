/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/package_client/core/logging.h>

#include <string>
#include <vector>

namespace kcenon::package_client::test {

// ============================================================================
// Masking Config Tests
// ============================================================================

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultMasksTokensOnly) {
    masking_config config;
    EXPECT_TRUE(config.mask_tokens);
    EXPECT_FALSE(config.mask_paths);
    EXPECT_EQ(config.mask_char, "*");
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedEnablesEverything) {
    auto config = masking_config::all_masked();
    EXPECT_TRUE(config.mask_tokens);
    EXPECT_TRUE(config.mask_paths);
}

TEST_F(MaskingConfigTest, NoneDisablesEverything) {
    auto config = masking_config::none();
    EXPECT_FALSE(config.mask_tokens);
    EXPECT_FALSE(config.mask_paths);
}

// ============================================================================
// Sensitive Info Masker Tests
// ============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {
protected:
    sensitive_info_masker masker_{masking_config::all_masked()};
};

TEST_F(SensitiveInfoMaskerTest, MaskTokenKeepsPrefix) {
    EXPECT_EQ(masker_.mask_token("abcdefghij"), "abcd******");
}

TEST_F(SensitiveInfoMaskerTest, MaskShortTokenHidesEverything) {
    EXPECT_EQ(masker_.mask_token("abc"), "***");
}

TEST_F(SensitiveInfoMaskerTest, MaskAuthorizationHeaderValue) {
    auto masked = masker_.mask("Authorization: token sk-1234567890abcdef");
    EXPECT_EQ(masked, "Authorization: token sk-1***************");
    EXPECT_EQ(masked.find("567890abcdef"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskTokenQueryParameter) {
    auto masked = masker_.mask("GET /user?token=secretvalue99");
    EXPECT_EQ(masked.find("secretvalue99"), std::string::npos);
    EXPECT_NE(masked.find("token=secr"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, ShortTokenLikeWordsAreLeftAlone) {
    EXPECT_EQ(masker_.mask("token abc"), "token abc");
}

TEST_F(SensitiveInfoMaskerTest, MaskPathKeepsFilename) {
    EXPECT_EQ(masker_.mask_path("/home/user/pkg-1.0-0.tar.bz2"),
              "**********/pkg-1.0-0.tar.bz2");
}

TEST_F(SensitiveInfoMaskerTest, MaskPathWithoutSeparatorIsUnchanged) {
    EXPECT_EQ(masker_.mask_path("pkg.tar.bz2"), "pkg.tar.bz2");
}

TEST_F(SensitiveInfoMaskerTest, MaskPathsInsideMessage) {
    auto masked = masker_.mask("reading /tmp/build/pkg.tar.bz2 failed");
    EXPECT_EQ(masked.find("/tmp/build"), std::string::npos);
    EXPECT_NE(masked.find("pkg.tar.bz2 failed"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, NoneConfigLeavesInputUntouched) {
    sensitive_info_masker plain(masking_config::none());
    std::string input = "token abcdefghijkl at /home/user/file";
    EXPECT_EQ(plain.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, SetConfigChangesBehavior) {
    sensitive_info_masker masker;
    EXPECT_EQ(masker.mask_path("/a/b"), "/a/b");
    masker.set_config(masking_config::all_masked());
    EXPECT_TRUE(masker.get_config().mask_paths);
    EXPECT_EQ(masker.mask_path("/a/b"), "**/b");
}

// ============================================================================
// Transfer Log Context Tests
// ============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContextIsEmptyObject) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, FieldsAppearInJson) {
    transfer_log_context ctx;
    ctx.target = "owner/pkg/1.0/pkg.tar.bz2";
    ctx.dist_id = "dist-42";
    ctx.total_bytes = 1024;
    ctx.http_status = 201;

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"target\":\"owner/pkg/1.0/pkg.tar.bz2\""), std::string::npos);
    EXPECT_NE(json.find("\"dist_id\":\"dist-42\""), std::string::npos);
    EXPECT_NE(json.find("\"total_bytes\":1024"), std::string::npos);
    EXPECT_NE(json.find("\"http_status\":201"), std::string::npos);
    EXPECT_EQ(json.find("rate_mbps"), std::string::npos);
}

TEST_F(TransferLogContextTest, RateIsFormattedWithTwoDecimals) {
    transfer_log_context ctx;
    ctx.rate_mbps = 12.3456;
    EXPECT_NE(ctx.to_json().find("\"rate_mbps\":12.35"), std::string::npos);
}

TEST_F(TransferLogContextTest, ErrorMessageIsEscaped) {
    transfer_log_context ctx;
    ctx.error_message = "bad \"quote\"\nline";
    auto json = ctx.to_json();
    EXPECT_NE(json.find("bad \\\"quote\\\"\\nline"), std::string::npos);
}

TEST_F(TransferLogContextTest, UrlIsMaskedWhenMaskerGiven) {
    sensitive_info_masker masker;
    transfer_log_context ctx;
    ctx.url = "https://example.com/x?token=abcdefghijklmnop";

    auto json = ctx.to_json_with_masking(&masker);
    EXPECT_EQ(json.find("ijklmnop"), std::string::npos);
    EXPECT_NE(ctx.to_json().find("ijklmnop"), std::string::npos);
}

// ============================================================================
// Structured Log Entry Tests
// ============================================================================

class StructuredLogEntryTest : public ::testing::Test {};

TEST_F(StructuredLogEntryTest, BasicFields) {
    structured_log_entry entry;
    entry.timestamp = "2024-01-01T00:00:00.000Z";
    entry.level = log_level::warn;
    entry.category = std::string(log_category::store);
    entry.message = "store rejected";

    auto json = entry.to_json();
    EXPECT_NE(json.find("\"level\":\"WARN\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"package_client.store\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"store rejected\""), std::string::npos);
}

TEST_F(StructuredLogEntryTest, ContextIsFlattenedIntoEntry) {
    structured_log_entry entry;
    entry.message = "committed";
    transfer_log_context ctx;
    ctx.dist_id = "abc";
    entry.context = ctx;

    auto json = entry.to_json();
    EXPECT_NE(json.find(",\"dist_id\":\"abc\""), std::string::npos);
    EXPECT_EQ(json.find("{\"dist_id\""), std::string::npos);
}

TEST_F(StructuredLogEntryTest, SourceLocationIsNested) {
    structured_log_entry entry;
    entry.source_file = "transfer_coordinator.cpp";
    entry.source_line = 42;
    entry.function_name = "store";

    auto json = entry.to_json();
    EXPECT_NE(json.find("\"source\":{\"file\":\"transfer_coordinator.cpp\",\"line\":42,"
                        "\"function\":\"store\"}"),
              std::string::npos);
}

// ============================================================================
// Log Level Tests
// ============================================================================

class LogLevelTest : public ::testing::Test {};

TEST_F(LogLevelTest, ToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::debug), "DEBUG");
    EXPECT_EQ(log_level_to_string(log_level::info), "INFO");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::error), "ERROR");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(LogLevelTest, Ordering) {
    EXPECT_LT(static_cast<int>(log_level::debug), static_cast<int>(log_level::info));
    EXPECT_LT(static_cast<int>(log_level::warn), static_cast<int>(log_level::error));
}

// ============================================================================
// Logger Tests
// ============================================================================

struct captured_record {
    log_level level;
    std::string category;
    std::string message;
    bool has_context;
};

class PackageClientLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = get_logger();
        logger.initialize();
        saved_level_ = logger.get_level();
        logger.set_level(log_level::trace);
        logger.set_callback([this](log_level level, std::string_view category,
                                   std::string_view message,
                                   const transfer_log_context* ctx) {
            records_.push_back({level, std::string(category), std::string(message),
                                ctx != nullptr});
        });
    }

    void TearDown() override {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_json_callback(nullptr);
        logger.set_output_format(log_output_format::text);
        logger.set_masking_config(masking_config{});
        logger.set_level(saved_level_);
    }

    std::vector<captured_record> records_;
    log_level saved_level_ = log_level::info;
};

TEST_F(PackageClientLoggerTest, InitializeIsIdempotent) {
    get_logger().initialize();
    get_logger().initialize();
    EXPECT_TRUE(get_logger().is_initialized());
}

TEST_F(PackageClientLoggerTest, CallbackReceivesRecords) {
    PC_LOG_INFO(log_category::stage, "staging owner/pkg");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, log_level::info);
    EXPECT_EQ(records_[0].category, "package_client.stage");
    EXPECT_EQ(records_[0].message, "staging owner/pkg");
    EXPECT_FALSE(records_[0].has_context);
}

TEST_F(PackageClientLoggerTest, LevelFilterDropsLowerRecords) {
    get_logger().set_level(log_level::warn);

    PC_LOG_DEBUG(log_category::http, "dropped");
    PC_LOG_INFO(log_category::http, "dropped too");
    PC_LOG_ERROR(log_category::http, "kept");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "kept");
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::fatal));
}

TEST_F(PackageClientLoggerTest, ContextMacroPassesContext) {
    transfer_log_context ctx;
    ctx.target = "owner/pkg/1.0/file";
    PC_LOG_INFO_CTX(log_category::commit, "committed", ctx);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_TRUE(records_[0].has_context);
}

TEST_F(PackageClientLoggerTest, JsonCallbackReceivesMaskedLine) {
    std::string captured;
    auto& logger = get_logger();
    logger.enable_json_output();
    logger.set_json_callback([&captured](const structured_log_entry&, const std::string& line) {
        captured = line;
    });

    PC_LOG_WARN(log_category::api, "Authorization: token abcdefghijklmnop");

    EXPECT_EQ(logger.get_output_format(), log_output_format::json);
    EXPECT_NE(captured.find("\"level\":\"WARN\""), std::string::npos);
    EXPECT_EQ(captured.find("ijklmnop"), std::string::npos);
    EXPECT_NE(captured.find("\"source\":{"), std::string::npos);
}

TEST_F(PackageClientLoggerTest, MaskingConfigRoundTrips) {
    get_logger().set_masking_config(masking_config::all_masked());
    EXPECT_TRUE(get_logger().get_masking_config().mask_paths);
}

}  // namespace kcenon::package_client::test
