#include <gtest/gtest.h>

#include "cbs/core/result.hpp"
#include "cbs/version.hpp"

#include <string>

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(cbs::Version::major, 0);
    EXPECT_EQ(cbs::Version::minor, 3);
    EXPECT_EQ(cbs::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(cbs::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = cbs::Result<int, std::string>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = cbs::Result<int, std::string>::err("something failed");
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), "something failed");
}

TEST(ResultTest, SameTypeForValueAndError) {
    auto ok = cbs::Result<std::string, std::string>::ok("value");
    auto err = cbs::Result<std::string, std::string>::err("error");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultTest, ValueOr) {
    auto ok = cbs::Result<int, std::string>::ok(10);
    auto err = cbs::Result<int, std::string>::err("fail");
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, BoolConversion) {
    auto ok = cbs::Result<int, std::string>::ok(1);
    auto err = cbs::Result<int, std::string>::err("fail");
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultVoidTest, Ok) {
    auto result = cbs::Result<void, std::string>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = cbs::Result<void, std::string>::err("void error");
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), "void error");
}
