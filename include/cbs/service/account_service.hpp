#pragma once

/// @file account_service.hpp
/// @brief Account flows: login, refresh, change password, create user.
///
/// Orchestrates IUserStore, PasswordHasher, TokenProvider and
/// ResourceIdGenerator. Protected flows take the RequestContext produced by
/// AuthnGate and trust it.

#include "cbs/foundation/api_result.hpp"
#include "cbs/service/auth_types.hpp"
#include "cbs/service/http_types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace cbs::foundation {
class WorkerPool;
}

namespace cbs::service {

class IUserStore;
class PasswordHasher;
class ResourceIdGenerator;
class TokenProvider;

/// Account service.
///
/// Login never tells an unknown username from a wrong password: both
/// return InvalidCredentials with the same message, and an unknown user
/// still pays one verification against a dummy digest. When a WorkerPool
/// is supplied, hashing and verification run on it; otherwise inline.
///
/// Example:
/// @code
///   auto users = std::make_shared<InMemoryUserStore>();
///   auto accounts = AccountService::create(users, tokens, hasher, ids).value();
///
///   auto created = accounts->createUser({"alice", "Secret123", {}, "a@x.io", "+15551234"});
///   auto session = accounts->login({"alice", "Secret123"});
/// @endcode
class AccountService {
public:
    /// Build the service and its dummy digest.
    ///
    /// @return InvalidArgument if a required collaborator is null, or the
    ///         hasher's error (EntropyFailure, HashingFailed) if the dummy
    ///         digest cannot be produced. Both are fatal at start-up.
    [[nodiscard]] static cbs::foundation::ApiResult<std::unique_ptr<AccountService>> create(
        std::shared_ptr<IUserStore> users,
        std::shared_ptr<const TokenProvider> tokens,
        std::shared_ptr<const PasswordHasher> hasher,
        std::shared_ptr<const ResourceIdGenerator> ids,
        std::shared_ptr<cbs::foundation::WorkerPool> workers = nullptr);

    ~AccountService();

    AccountService(const AccountService&) = delete;
    AccountService& operator=(const AccountService&) = delete;

    /// Verify credentials and issue a token with the default lifetime.
    [[nodiscard]] cbs::foundation::ApiResult<TokenResponse> login(const LoginRequest& request);

    /// Re-issue the caller's token.
    [[nodiscard]] cbs::foundation::ApiResult<TokenResponse> refresh(const RequestContext& ctx);

    /// Replace the caller's password after checking the old one.
    ///
    /// @return InvalidCredentials if the old password is wrong,
    ///         InvalidArgument if the new one fails validation.
    [[nodiscard]] cbs::foundation::ApiResult<void> changePassword(
        const RequestContext& ctx, const ChangePasswordRequest& request);

    /// Register a user (no authentication required).
    ///
    /// Two-phase: the row is allocated first, then its public id is derived
    /// from the allocated key and attached. If the second phase fails the
    /// row is discarded and the error returned.
    [[nodiscard]] cbs::foundation::ApiResult<CreateUserResponse> createUser(
        const CreateUserRequest& request);

private:
    AccountService(std::shared_ptr<IUserStore> users,
                   std::shared_ptr<const TokenProvider> tokens,
                   std::shared_ptr<const PasswordHasher> hasher,
                   std::shared_ptr<const ResourceIdGenerator> ids,
                   std::shared_ptr<cbs::foundation::WorkerPool> workers,
                   std::string dummyDigest);

    [[nodiscard]] cbs::foundation::ApiResult<std::string> hashPassword(std::string_view plaintext);
    [[nodiscard]] cbs::foundation::ApiResult<void> verifyPassword(std::string_view digest,
                                                                  std::string_view candidate);

    std::shared_ptr<IUserStore> users_;
    std::shared_ptr<const TokenProvider> tokens_;
    std::shared_ptr<const PasswordHasher> hasher_;
    std::shared_ptr<const ResourceIdGenerator> ids_;
    std::shared_ptr<cbs::foundation::WorkerPool> workers_;
    std::string dummyDigest_;
};

}  // namespace cbs::service
