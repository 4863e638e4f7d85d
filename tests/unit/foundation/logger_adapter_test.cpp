#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "cbs/foundation/api_logger.hpp"
#include "cbs/foundation/error_code.hpp"

#include "../../support/mock_logger.hpp"

using namespace cbs::foundation;
using cbs::testing::MockLogger;
using cbs::testing::ScopedMockLogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::log_level;

class ApiLoggerTest : public ::testing::Test {
protected:
    ScopedMockLogger mock_;
};

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Auth), "Auth");
    EXPECT_EQ(logCategoryName(LogCategory::Token), "Token");
    EXPECT_EQ(logCategoryName(LogCategory::Identity), "Identity");
    EXPECT_EQ(logCategoryName(LogCategory::Store), "Store");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(kLogCategoryCount, 6u);
}

TEST(LogLevelTest, LevelNames) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

// ---------------------------------------------------------------------------
// Levels
// ---------------------------------------------------------------------------

TEST(ApiLoggerBasicTest, DefaultCategoryLevels) {
    ApiLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Auth), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Token), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Identity), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Store), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
}

TEST(ApiLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    ApiLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Auth));
    logger.setCategoryLevel(LogCategory::Auth, LogLevel::Debug);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Auth));

    logger.setCategoryLevel(LogCategory::Auth, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Auth));
}

TEST(ApiLoggerBasicTest, InvalidCategoryReturnsOff) {
    ApiLogger logger;
    auto invalid = static_cast<LogCategory>(42);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST_F(ApiLoggerTest, LogFormatsMessageWithCategory) {
    ApiLogger logger;
    logger.log(LogLevel::Info, LogCategory::Core, "server starting");

    auto records = mock_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Core] server starting");
}

TEST_F(ApiLoggerTest, LogFiltersMessagesBelowLevel) {
    ApiLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Auth, "filtered");
    EXPECT_TRUE(mock_->records().empty());
}

TEST_F(ApiLoggerTest, LogWithContextAppendsFields) {
    ApiLogger logger;
    LogContext ctx;
    ctx.userKey = UserKey(7);
    ctx.userId = "user-abc123";
    logger.logWithContext(LogLevel::Info, LogCategory::Auth, "user logged in", ctx);

    auto records = mock_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Auth] user logged in {user_key=7, user_id=user-abc123}");
}

TEST_F(ApiLoggerTest, EmptyContextOmitsBraces) {
    ApiLogger logger;
    logger.logWithContext(LogLevel::Warning, LogCategory::Store, "slow query", LogContext{});

    auto records = mock_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message, "[Store] slow query");
}

TEST_F(ApiLoggerTest, NamedCategoryLoggerTakesPrecedence) {
    auto tokenLogger = std::make_shared<MockLogger>();
    static_cast<void>(GlobalLoggerRegistry::instance().register_logger("cbs.Token", tokenLogger));

    ApiLogger logger;
    logger.log(LogLevel::Info, LogCategory::Token, "issued");
    logger.log(LogLevel::Info, LogCategory::Core, "tick");

    ASSERT_EQ(tokenLogger->records().size(), 1u);
    EXPECT_EQ(tokenLogger->records()[0].message, "[Token] issued");
    ASSERT_EQ(mock_->records().size(), 1u);
    EXPECT_EQ(mock_->records()[0].message, "[Core] tick");
}

TEST_F(ApiLoggerTest, FlushReachesDefaultLogger) {
    ApiLogger logger;
    EXPECT_TRUE(logger.flush().hasValue());
    EXPECT_TRUE(mock_->wasFlushed());
}

TEST_F(ApiLoggerTest, MacrosUseProcessWideInstance) {
    CBS_LOG_INFO(LogCategory::Config, "loaded");
    CBS_LOG_DEBUG(LogCategory::Config, "hidden");
    EXPECT_TRUE(mock_->contains("[Config] loaded"));
    EXPECT_FALSE(mock_->contains("hidden"));
}

TEST_F(ApiLoggerTest, ConcurrentLogging) {
    ApiLogger logger;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger] {
            for (int i = 0; i < kPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Core, "msg");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(mock_->records().size(), static_cast<std::size_t>(kThreads * kPerThread));
}
