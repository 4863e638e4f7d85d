/// @file account_flow_integration_test.cpp
/// @brief End-to-end account flows: create, login, gated refresh,
///        gated password change and gated post creation.

#include <gtest/gtest.h>

#include "cbs/foundation/error_code.hpp"
#include "cbs/foundation/worker_pool.hpp"
#include "cbs/service/account_service.hpp"
#include "cbs/service/authn_gate.hpp"
#include "cbs/service/password_hasher.hpp"
#include "cbs/service/post_service.hpp"
#include "cbs/service/post_store.hpp"
#include "cbs/service/resource_id.hpp"
#include "cbs/service/token_provider.hpp"
#include "cbs/service/user_store.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

using namespace cbs::service;
using cbs::foundation::ErrorCode;
using cbs::foundation::WorkerPool;
using namespace std::chrono_literals;

namespace {

class AccountFlowTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto cfg = TokenConfig::create("integration-key");
        ASSERT_TRUE(cfg.hasValue());
        tokens_ = std::make_shared<TokenProvider>(cfg.value(), [this] { return now_; });

        auto ids = ResourceIdGenerator::create("integration-salt");
        ASSERT_TRUE(ids.hasValue());
        auto idGen = std::make_shared<ResourceIdGenerator>(std::move(ids).value());

        auto hasher = std::make_shared<PasswordHasher>(PasswordHasher::kMinIterations);
        pool_ = std::make_shared<WorkerPool>(2);

        auto accounts = AccountService::create(std::make_shared<InMemoryUserStore>(), tokens_,
                                               hasher, idGen, pool_);
        ASSERT_TRUE(accounts.hasValue());
        accounts_ = std::move(accounts).value();
        posts_ = std::make_unique<PostService>(std::make_shared<InMemoryPostStore>(), idGen);
        gate_ = std::make_unique<AuthnGate>(tokens_);
    }

    static HttpRequest bearer(const std::string& method, const std::string& path,
                              const std::string& token) {
        HttpRequest req;
        req.method = method;
        req.path = path;
        req.headers["Authorization"] = "Bearer " + token;
        return req;
    }

    std::string signUpAndLogin() {
        CreateUserRequest req;
        req.username = "writer";
        req.password = "writer-password";
        req.email = "writer@example.com";
        req.phone = "5551234567";
        auto created = accounts_->createUser(req);
        EXPECT_TRUE(created.hasValue());
        userId_ = created.hasValue() ? created.value().userId : std::string{};

        auto session = accounts_->login({"writer", "writer-password"});
        EXPECT_TRUE(session.hasValue());
        return session.hasValue() ? session.value().token : std::string{};
    }

    std::chrono::system_clock::time_point now_{std::chrono::seconds(1'700'000'000)};
    std::shared_ptr<TokenProvider> tokens_;
    std::shared_ptr<WorkerPool> pool_;
    std::unique_ptr<AccountService> accounts_;
    std::unique_ptr<PostService> posts_;
    std::unique_ptr<AuthnGate> gate_;
    std::string userId_;
};

}  // namespace

TEST_F(AccountFlowTest, RefreshThroughGate) {
    auto token = signUpAndLogin();
    ASSERT_FALSE(token.empty());

    auto refreshRoute = gate_->wrap([this](const HttpRequest&, const RequestContext& ctx) {
        auto refreshed = accounts_->refresh(ctx);
        if (!refreshed) {
            return HttpResponse{HttpStatus::InternalServerError,
                                std::string(refreshed.error().message())};
        }
        return HttpResponse{HttpStatus::Ok, refreshed.value().token};
    });

    now_ += 1h;
    auto res = refreshRoute(bearer("PUT", "/refresh-token", token));
    ASSERT_EQ(res.status, HttpStatus::Ok);

    auto claims = tokens_->parse(res.body);
    ASSERT_TRUE(claims.hasValue());
    EXPECT_EQ(claims.value().subject, userId_);
    EXPECT_EQ(claims.value().expiresAt, now_ + 2h);
}

TEST_F(AccountFlowTest, TamperedTokenNeverReachesHandler) {
    auto token = signUpAndLogin();
    ASSERT_FALSE(token.empty());
    auto& sigChar = token[token.size() - 5];
    sigChar = sigChar == 'A' ? 'B' : 'A';

    std::atomic<int> calls{0};
    auto route = gate_->wrap([&calls](const HttpRequest&, const RequestContext&) {
        ++calls;
        return HttpResponse{HttpStatus::Ok, "reached"};
    });

    auto res = route(bearer("PUT", "/refresh-token", token));
    EXPECT_EQ(res.status, HttpStatus::Unauthorized);
    EXPECT_EQ(res.body, AuthnGate::kUnauthorizedBody);
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(AccountFlowTest, ExpiredSessionIsRejected) {
    auto token = signUpAndLogin();
    ASSERT_FALSE(token.empty());

    now_ += 2h;
    auto res = gate_->handle(bearer("PUT", "/refresh-token", token),
                             [](const HttpRequest&, const RequestContext&) {
                                 return HttpResponse{HttpStatus::Ok, "reached"};
                             });
    EXPECT_EQ(res.status, HttpStatus::Unauthorized);
}

TEST_F(AccountFlowTest, ChangePasswordThroughGate) {
    auto token = signUpAndLogin();
    ASSERT_FALSE(token.empty());

    auto route = gate_->wrap([this](const HttpRequest&, const RequestContext& ctx) {
        auto changed = accounts_->changePassword(ctx, {"writer-password", "fresh-password"});
        if (!changed) {
            return HttpResponse{HttpStatus::BadRequest, std::string(changed.error().message())};
        }
        return HttpResponse{HttpStatus::Ok, {}};
    });

    auto res = route(bearer("PUT", "/change-password", token));
    ASSERT_EQ(res.status, HttpStatus::Ok) << res.body;

    EXPECT_EQ(accounts_->login({"writer", "writer-password"}).error().code(),
              ErrorCode::InvalidCredentials);
    EXPECT_TRUE(accounts_->login({"writer", "fresh-password"}).hasValue());

    // The session token stays valid until it expires.
    EXPECT_TRUE(gate_->authenticate(bearer("PUT", "/refresh-token", token)).hasValue());
}

TEST_F(AccountFlowTest, CreatePostThroughGate) {
    auto token = signUpAndLogin();
    ASSERT_FALSE(token.empty());

    auto route = gate_->wrap([this](const HttpRequest& req, const RequestContext& ctx) {
        auto created = posts_->createPost(ctx, {"From the gate", req.body});
        if (!created) {
            return HttpResponse{HttpStatus::BadRequest, std::string(created.error().message())};
        }
        return HttpResponse{HttpStatus::Created, created.value().postId};
    });

    auto req = bearer("POST", "/posts", token);
    req.body = "Posted by an authenticated caller.";
    auto res = route(req);
    ASSERT_EQ(res.status, HttpStatus::Created) << res.body;

    auto post = posts_->getPost(res.body);
    ASSERT_TRUE(post.hasValue());
    EXPECT_EQ(post.value().userId, userId_);
    EXPECT_EQ(post.value().content, "Posted by an authenticated caller.");
}

TEST_F(AccountFlowTest, FailedLoginsAreIndistinguishable) {
    signUpAndLogin();
    auto wrong = accounts_->login({"writer", "not-my-password"});
    auto unknown = accounts_->login({"nobody", "writer-password"});
    ASSERT_TRUE(wrong.hasError());
    ASSERT_TRUE(unknown.hasError());
    EXPECT_EQ(wrong.error().code(), unknown.error().code());
    EXPECT_EQ(wrong.error().message(), unknown.error().message());
}
