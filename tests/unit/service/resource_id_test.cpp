#include <gtest/gtest.h>

#include "cbs/foundation/error_code.hpp"
#include "cbs/service/resource_id.hpp"

#include <regex>
#include <string>
#include <unordered_set>

using namespace cbs::service;
using cbs::foundation::ErrorCode;

namespace {

ResourceIdGenerator makeGenerator(std::string salt = "test-identity-salt") {
    auto gen = ResourceIdGenerator::create(std::move(salt));
    EXPECT_TRUE(gen.hasValue());
    return std::move(gen).value();
}

}  // namespace

TEST(ResourceIdTest, MissingSaltFailsFast) {
    auto gen = ResourceIdGenerator::create("");
    ASSERT_TRUE(gen.hasError());
    EXPECT_EQ(gen.error().code(), ErrorCode::ConfigurationMissing);
}

TEST(ResourceIdTest, ShapeMatchesPrefixAndCode) {
    auto gen = makeGenerator();
    auto id = gen.newId(ResourceType::User, 42);
    ASSERT_TRUE(id.hasValue());
    EXPECT_TRUE(std::regex_match(id.value(), std::regex("^user-[A-Za-z0-9]{6}$"))) << id.value();
    EXPECT_TRUE(ResourceIdGenerator::matches(ResourceType::User, id.value()));
    EXPECT_FALSE(ResourceIdGenerator::matches(ResourceType::Post, id.value()));
}

TEST(ResourceIdTest, Deterministic) {
    auto a = makeGenerator();
    auto b = makeGenerator();
    EXPECT_EQ(a.newId(ResourceType::User, 42).value(), a.newId(ResourceType::User, 42).value());
    EXPECT_EQ(a.newId(ResourceType::User, 42).value(), b.newId(ResourceType::User, 42).value());
}

TEST(ResourceIdTest, AdjacentCountersDiffer) {
    auto gen = makeGenerator();
    EXPECT_NE(gen.newId(ResourceType::User, 42).value(), gen.newId(ResourceType::User, 43).value());
}

TEST(ResourceIdTest, SaltChangesCodes) {
    auto a = makeGenerator("salt-one");
    auto b = makeGenerator("salt-two");
    EXPECT_NE(a.newId(ResourceType::User, 42).value(), b.newId(ResourceType::User, 42).value());
}

TEST(ResourceIdTest, TypeOnlyChangesPrefix) {
    auto gen = makeGenerator();
    auto user = gen.newId(ResourceType::User, 7).value();
    auto post = gen.newId(ResourceType::Post, 7).value();
    EXPECT_EQ(post.rfind("post-", 0), 0u);
    EXPECT_EQ(user.substr(5), post.substr(5));
}

TEST(ResourceIdTest, NoCollisionsOverRange) {
    auto gen = makeGenerator();
    std::unordered_set<std::string> seen;
    constexpr uint64_t kCount = 20000;
    for (uint64_t i = 0; i < kCount; ++i) {
        auto id = gen.newId(ResourceType::User, i);
        ASSERT_TRUE(id.hasValue());
        EXPECT_TRUE(seen.insert(id.value()).second) << "collision at " << i;
    }
    EXPECT_EQ(seen.size(), kCount);
}

TEST(ResourceIdTest, CodesDoNotLookSequential) {
    auto gen = makeGenerator();
    auto a = gen.newId(ResourceType::User, 1000).value().substr(5);
    auto b = gen.newId(ResourceType::User, 1001).value().substr(5);
    int same = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        same += a[i] == b[i] ? 1 : 0;
    }
    EXPECT_LT(same, 5);
}

TEST(ResourceIdTest, CapacityBoundary) {
    auto gen = makeGenerator();
    EXPECT_TRUE(gen.newId(ResourceType::User, 0).hasValue());
    EXPECT_TRUE(gen.newId(ResourceType::User, ResourceIdGenerator::kCapacity - 1).hasValue());

    auto over = gen.newId(ResourceType::User, ResourceIdGenerator::kCapacity);
    ASSERT_TRUE(over.hasError());
    EXPECT_EQ(over.error().code(), ErrorCode::ResourceIdExhausted);
}

TEST(ResourceIdTest, InvalidType) {
    auto gen = makeGenerator();
    EXPECT_EQ(gen.newId("", 1).error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(gen.newId("User", 1).error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(gen.newId("us-er", 1).error().code(), ErrorCode::InvalidArgument);
}

TEST(ResourceIdTest, MatchesRejectsBadShapes) {
    EXPECT_TRUE(ResourceIdGenerator::matches("user", "user-abC123"));
    EXPECT_FALSE(ResourceIdGenerator::matches("user", "user-abC12"));
    EXPECT_FALSE(ResourceIdGenerator::matches("user", "user-abC1234"));
    EXPECT_FALSE(ResourceIdGenerator::matches("user", "user_abC123"));
    EXPECT_FALSE(ResourceIdGenerator::matches("user", "user-abC-23"));
    EXPECT_FALSE(ResourceIdGenerator::matches("user", "post-abC123"));
    EXPECT_FALSE(ResourceIdGenerator::matches("user", ""));
}
