#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <type_traits>
#include <unordered_set>

#include "cbs/foundation/api_error.hpp"
#include "cbs/foundation/api_result.hpp"
#include "cbs/foundation/config_manager.hpp"
#include "cbs/foundation/error_code.hpp"
#include "cbs/foundation/types.hpp"

using namespace cbs::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::AlreadyExists), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::StoreError), "Store");
    EXPECT_EQ(errorSubsystem(ErrorCode::TokenExpired), "Auth");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigurationMissing), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobNotFound), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::ResourceIdExhausted), "Identity");
}

TEST(ErrorCodeTest, AuthenticationFailures) {
    EXPECT_TRUE(isAuthenticationFailure(ErrorCode::TokenMalformed));
    EXPECT_TRUE(isAuthenticationFailure(ErrorCode::TokenSignatureInvalid));
    EXPECT_TRUE(isAuthenticationFailure(ErrorCode::TokenExpired));
    EXPECT_TRUE(isAuthenticationFailure(ErrorCode::InvalidCredentials));
    EXPECT_FALSE(isAuthenticationFailure(ErrorCode::HashingFailed));
    EXPECT_FALSE(isAuthenticationFailure(ErrorCode::InvalidArgument));
}

// --- ApiError tests ---

TEST(ApiErrorTest, DefaultConstruction) {
    ApiError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
}

TEST(ApiErrorTest, CodeAndMessage) {
    ApiError err(ErrorCode::NotFound, "user missing");
    EXPECT_EQ(err.code(), ErrorCode::NotFound);
    EXPECT_EQ(err.message(), "user missing");
    EXPECT_EQ(err.subsystem(), "General");
}

TEST(ApiErrorTest, WithContextPrefixesMessage) {
    ApiError err(ErrorCode::StoreError, "connection reset");
    auto wrapped = err.withContext("allocateRecord");
    EXPECT_EQ(wrapped.code(), ErrorCode::StoreError);
    EXPECT_EQ(wrapped.message(), "allocateRecord: connection reset");
}

// --- ApiResult tests ---

TEST(ApiResultTest, OkValue) {
    auto result = ApiResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);
}

TEST(ApiResultTest, ErrorValue) {
    auto result = ApiResult<int>::err(ApiError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(ApiResultTest, VoidOk) {
    auto result = ApiResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}

// --- StrongId tests ---

TEST(StrongIdTest, DefaultIsInvalid) {
    UserKey key;
    EXPECT_FALSE(key.isValid());
    EXPECT_EQ(key.value(), 0u);
}

TEST(StrongIdTest, ComparisonAndHash) {
    UserKey a(1);
    UserKey b(2);
    EXPECT_LT(a, b);
    EXPECT_EQ(a, UserKey(1));

    std::unordered_set<UserKey> keys{a, b, UserKey(1)};
    EXPECT_EQ(keys.size(), 2u);
}

TEST(StrongIdTest, DistinctKeyTypes) {
    static_assert(!std::is_same_v<UserKey, PostKey>);
    static_assert(!std::is_convertible_v<uint64_t, UserKey>);
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmpDir_ = std::filesystem::temp_directory_path() / "cbs_config_test";
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override { std::filesystem::remove_all(tmpDir_); }

    std::filesystem::path writeYaml(const std::string& name, const std::string& content) {
        auto path = tmpDir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGetNested) {
    auto path = writeYaml("server.yaml", R"(
server:
  addr: "127.0.0.1:8080"
auth:
  expiration_seconds: 3600
)");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto addr = config.get<std::string>("server.addr");
    ASSERT_TRUE(addr.hasValue());
    EXPECT_EQ(addr.value(), "127.0.0.1:8080");

    auto exp = config.get<int>("auth.expiration_seconds");
    ASSERT_TRUE(exp.hasValue());
    EXPECT_EQ(exp.value(), 3600);
}

TEST_F(ConfigManagerTest, MissingFileFails) {
    ConfigManager config;
    auto result = config.load(tmpDir_ / "nope.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, InvalidYamlFails) {
    ConfigManager config;
    auto result = config.loadString("server: [unclosed");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("a: 1").hasValue());
    auto result = config.get<int>("b");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
    EXPECT_FALSE(config.hasKey("b"));
    EXPECT_TRUE(config.hasKey("a"));
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("auth:\n  expiration_seconds: soon\n").hasValue());
    auto result = config.get<int>("auth.expiration_seconds");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, RequireReportsMissingAndEmpty) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("auth:\n  jwt_key: \"\"\n  claim_name:\n").hasValue());

    auto empty = config.require<std::string>("auth.jwt_key");
    ASSERT_TRUE(empty.hasError());
    EXPECT_EQ(empty.error().code(), ErrorCode::ConfigurationMissing);

    auto nullValue = config.require<std::string>("auth.claim_name");
    ASSERT_TRUE(nullValue.hasError());
    EXPECT_EQ(nullValue.error().code(), ErrorCode::ConfigurationMissing);

    auto absent = config.require<std::string>("identity.salt");
    ASSERT_TRUE(absent.hasError());
    EXPECT_EQ(absent.error().code(), ErrorCode::ConfigurationMissing);
}

TEST_F(ConfigManagerTest, GetOrFallsBackOnlyWhenAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("worker:\n  threads: many\n").hasValue());

    auto fallback = config.getOr<int>("server.port", 6666);
    ASSERT_TRUE(fallback.hasValue());
    EXPECT_EQ(fallback.value(), 6666);

    auto mismatch = config.getOr<int>("worker.threads", 4);
    ASSERT_TRUE(mismatch.hasError());
    EXPECT_EQ(mismatch.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, SetOverridesValue) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("server:\n  addr: \"0.0.0.0:6666\"\n").hasValue());
    config.set<std::string>("server.addr", "127.0.0.1:7777");

    auto addr = config.get<std::string>("server.addr");
    ASSERT_TRUE(addr.hasValue());
    EXPECT_EQ(addr.value(), "127.0.0.1:7777");
}
