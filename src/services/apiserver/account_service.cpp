/// @file account_service.cpp
/// @brief AccountService implementation.

#include "cbs/service/account_service.hpp"

#include "cbs/foundation/api_logger.hpp"
#include "cbs/foundation/worker_pool.hpp"
#include "cbs/service/input_validator.hpp"
#include "cbs/service/password_hasher.hpp"
#include "cbs/service/resource_id.hpp"
#include "cbs/service/token_provider.hpp"
#include "cbs/service/user_store.hpp"

#include <optional>

namespace cbs::service {

using cbs::foundation::ApiError;
using cbs::foundation::ApiResult;
using cbs::foundation::ErrorCode;
using cbs::foundation::LogCategory;
using cbs::foundation::LogContext;
using cbs::foundation::LogLevel;
using cbs::foundation::UserKey;

namespace {

constexpr std::string_view kInvalidCredentials = "invalid username or password";

ApiError invalidCredentials() {
    return ApiError(ErrorCode::InvalidCredentials, std::string(kInvalidCredentials));
}

ApiError invalidArgument(const ValidationResult& result) {
    return ApiError(ErrorCode::InvalidArgument, result.message);
}

TokenResponse toResponse(IssuedToken issued) {
    return TokenResponse{std::move(issued.token), issued.expiresAt};
}

}  // namespace

// -- Construction / destruction -----------------------------------------------

ApiResult<std::unique_ptr<AccountService>> AccountService::create(
    std::shared_ptr<IUserStore> users,
    std::shared_ptr<const TokenProvider> tokens,
    std::shared_ptr<const PasswordHasher> hasher,
    std::shared_ptr<const ResourceIdGenerator> ids,
    std::shared_ptr<cbs::foundation::WorkerPool> workers) {
    using Result = ApiResult<std::unique_ptr<AccountService>>;

    if (!users || !tokens || !hasher || !ids) {
        return Result::err(
            ApiError(ErrorCode::InvalidArgument, "account service collaborator is missing"));
    }

    // Digest that no real password matches, verified for unknown usernames.
    auto dummy = hasher->hash("cbs.unknown-user.placeholder");
    if (!dummy) {
        CBS_LOG_ERROR(LogCategory::Auth,
                      "could not prepare dummy digest: " + std::string(dummy.error().message()));
        return Result::err(dummy.error());
    }

    return Result::ok(std::unique_ptr<AccountService>(
        new AccountService(std::move(users), std::move(tokens), std::move(hasher),
                           std::move(ids), std::move(workers), std::move(dummy.value()))));
}

AccountService::AccountService(std::shared_ptr<IUserStore> users,
                               std::shared_ptr<const TokenProvider> tokens,
                               std::shared_ptr<const PasswordHasher> hasher,
                               std::shared_ptr<const ResourceIdGenerator> ids,
                               std::shared_ptr<cbs::foundation::WorkerPool> workers,
                               std::string dummyDigest)
    : users_(std::move(users)),
      tokens_(std::move(tokens)),
      hasher_(std::move(hasher)),
      ids_(std::move(ids)),
      workers_(std::move(workers)),
      dummyDigest_(std::move(dummyDigest)) {}

AccountService::~AccountService() = default;

// -- Hashing ------------------------------------------------------------------

ApiResult<std::string> AccountService::hashPassword(std::string_view plaintext) {
    if (!workers_) {
        return hasher_->hash(plaintext);
    }
    std::optional<ApiResult<std::string>> result;
    auto ran = workers_->run([&] { result.emplace(hasher_->hash(plaintext)); });
    if (!ran) {
        return ApiResult<std::string>::err(ran.error());
    }
    return std::move(*result);
}

ApiResult<void> AccountService::verifyPassword(std::string_view digest,
                                               std::string_view candidate) {
    if (!workers_) {
        return hasher_->verify(digest, candidate);
    }
    std::optional<ApiResult<void>> result;
    auto ran = workers_->run([&] { result.emplace(hasher_->verify(digest, candidate)); });
    if (!ran) {
        return ran;
    }
    return std::move(*result);
}

// -- Login --------------------------------------------------------------------

ApiResult<TokenResponse> AccountService::login(const LoginRequest& request) {
    auto user = users_->findCredentialByUsername(request.username);
    if (!user) {
        if (user.error().code() != ErrorCode::NotFound) {
            return ApiResult<TokenResponse>::err(user.error());
        }
        // Same cost as a wrong password; the outcome is ignored.
        auto ignored = verifyPassword(dummyDigest_, request.password);
        (void)ignored;
        CBS_LOG_DEBUG(LogCategory::Auth, "login failed: unknown username");
        return ApiResult<TokenResponse>::err(invalidCredentials());
    }

    auto verified = verifyPassword(user.value().passwordDigest, request.password);
    if (!verified) {
        if (verified.error().code() != ErrorCode::PasswordMismatch) {
            return ApiResult<TokenResponse>::err(verified.error());
        }
        LogContext ctx;
        ctx.userId = user.value().userId;
        CBS_LOG_CTX(LogLevel::Debug, LogCategory::Auth, "login failed: wrong password", ctx);
        return ApiResult<TokenResponse>::err(invalidCredentials());
    }

    auto issued = tokens_->issue(user.value().userId);
    if (!issued) {
        return ApiResult<TokenResponse>::err(issued.error());
    }

    LogContext ctx;
    ctx.userKey = user.value().key;
    ctx.userId = user.value().userId;
    CBS_LOG_CTX(LogLevel::Info, LogCategory::Auth, "user logged in", ctx);
    return ApiResult<TokenResponse>::ok(toResponse(std::move(issued.value())));
}

// -- Refresh ------------------------------------------------------------------

ApiResult<TokenResponse> AccountService::refresh(const RequestContext& ctx) {
    auto issued = tokens_->refresh(ctx.token);
    if (!issued) {
        return ApiResult<TokenResponse>::err(issued.error());
    }
    return ApiResult<TokenResponse>::ok(toResponse(std::move(issued.value())));
}

// -- Change password ----------------------------------------------------------

ApiResult<void> AccountService::changePassword(const RequestContext& ctx,
                                               const ChangePasswordRequest& request) {
    auto user = users_->findByUserId(ctx.userId);
    if (!user) {
        return ApiResult<void>::err(user.error());
    }

    auto verified = verifyPassword(user.value().passwordDigest, request.oldPassword);
    if (!verified) {
        if (verified.error().code() == ErrorCode::PasswordMismatch) {
            return ApiResult<void>::err(invalidCredentials());
        }
        return verified;
    }

    if (auto valid = InputValidator::validatePassword(request.newPassword); !valid) {
        return ApiResult<void>::err(invalidArgument(valid));
    }

    auto digest = hashPassword(request.newPassword);
    if (!digest) {
        return ApiResult<void>::err(digest.error());
    }

    auto updated = users_->updateCredential(ctx.userId, std::move(digest.value()));
    if (!updated) {
        return updated;
    }

    LogContext logCtx;
    logCtx.userId = ctx.userId;
    CBS_LOG_CTX(LogLevel::Info, LogCategory::Auth, "password changed", logCtx);
    return ApiResult<void>::ok();
}

// -- Create user --------------------------------------------------------------

ApiResult<CreateUserResponse> AccountService::createUser(const CreateUserRequest& request) {
    using Result = ApiResult<CreateUserResponse>;

    if (auto v = InputValidator::validateUsername(request.username); !v) {
        return Result::err(invalidArgument(v));
    }
    if (auto v = InputValidator::validatePassword(request.password); !v) {
        return Result::err(invalidArgument(v));
    }
    if (request.nickname) {
        if (auto v = InputValidator::validateNickname(*request.nickname); !v) {
            return Result::err(invalidArgument(v));
        }
    }
    if (auto v = InputValidator::validateEmail(request.email); !v) {
        return Result::err(invalidArgument(v));
    }
    if (auto v = InputValidator::validatePhone(request.phone); !v) {
        return Result::err(invalidArgument(v));
    }

    auto existing = users_->findCredentialByUsername(request.username);
    if (existing) {
        return Result::err(ApiError(ErrorCode::AlreadyExists, "username already exists"));
    }
    if (existing.error().code() != ErrorCode::NotFound) {
        return Result::err(existing.error());
    }

    auto digest = hashPassword(request.password);
    if (!digest) {
        return Result::err(digest.error());
    }

    UserRecord record;
    record.username = request.username;
    record.passwordDigest = std::move(digest.value());
    record.nickname = request.nickname.value_or(std::string{});
    record.email = request.email;
    record.phone = request.phone;

    // Phase one.
    auto key = users_->allocateRecord(std::move(record));
    if (!key) {
        return Result::err(key.error());
    }

    // Phase two; on failure the reserved row must not survive.
    auto rollback = [&](const ApiError& cause) {
        auto discarded = users_->discardRecord(key.value());
        if (!discarded) {
            LogContext ctx;
            ctx.userKey = key.value();
            ctx.extra["error"] = std::string(discarded.error().message());
            CBS_LOG_CTX(LogLevel::Error, LogCategory::Store, "failed to discard user row", ctx);
        }
        return Result::err(cause);
    };

    auto userId = ids_->newId(ResourceType::User, key.value().value());
    if (!userId) {
        return rollback(userId.error());
    }
    auto attached = users_->attachPublicIdentifier(key.value(), userId.value());
    if (!attached) {
        return rollback(attached.error());
    }

    LogContext ctx;
    ctx.userKey = key.value();
    ctx.userId = userId.value();
    CBS_LOG_CTX(LogLevel::Info, LogCategory::Auth, "user created", ctx);
    return Result::ok(CreateUserResponse{std::move(userId.value())});
}

}  // namespace cbs::service
