#pragma once

/// @file auth_types.hpp
/// @brief Records, token structures and configuration of the identity core.

#include "cbs/foundation/api_result.hpp"
#include "cbs/foundation/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cbs::service {

// -- Records ------------------------------------------------------------------

/// Stored user row.
///
/// `key` is the store's auto-increment key and never leaves the process;
/// `userId` is the public identifier attached after allocation. The
/// password is only ever held here as a PasswordHasher digest.
struct UserRecord {
    cbs::foundation::UserKey key;
    std::string userId;
    std::string username;
    std::string passwordDigest;
    std::string nickname;
    std::string email;
    std::string phone;
    std::chrono::system_clock::time_point createdAt{};
    std::chrono::system_clock::time_point updatedAt{};
};

/// Stored blog post row.
struct PostRecord {
    cbs::foundation::PostKey key;
    std::string postId;
    std::string userId;  ///< Public id of the owning user.
    std::string title;
    std::string content;
    std::chrono::system_clock::time_point createdAt{};
    std::chrono::system_clock::time_point updatedAt{};
};

// -- Token structures ---------------------------------------------------------

/// Session claims carried inside a signed token.
struct TokenClaims {
    std::string subject;                                ///< Public user id.
    std::chrono::system_clock::time_point issuedAt{};   ///< "iat".
    std::chrono::system_clock::time_point expiresAt{};  ///< "exp".
};

/// A freshly signed token and the instant it stops being accepted.
struct IssuedToken {
    std::string token;
    std::chrono::system_clock::time_point expiresAt{};
};

// -- Configuration ------------------------------------------------------------

/// Immutable token signing configuration.
///
/// Built once at start-up through create(), which rejects an unusable
/// configuration, then copied into every TokenProvider. There is no way
/// to modify an instance after construction.
class TokenConfig {
public:
    static constexpr std::string_view kDefaultClaimName = "x-user-id";
    static constexpr std::chrono::seconds kDefaultLifetime{7200};  // 2 hours

    /// Validate and build a configuration.
    ///
    /// @return ConfigurationMissing for an empty key or claim name,
    ///         InvalidArgument for a non-positive lifetime.
    [[nodiscard]] static cbs::foundation::ApiResult<TokenConfig> create(
        std::string signingKey,
        std::string claimName = std::string(kDefaultClaimName),
        std::chrono::seconds defaultLifetime = kDefaultLifetime);

    [[nodiscard]] const std::string& signingKey() const noexcept { return signingKey_; }
    [[nodiscard]] const std::string& claimName() const noexcept { return claimName_; }
    [[nodiscard]] std::chrono::seconds defaultLifetime() const noexcept { return defaultLifetime_; }

private:
    TokenConfig(std::string signingKey, std::string claimName, std::chrono::seconds lifetime)
        : signingKey_(std::move(signingKey)),
          claimName_(std::move(claimName)),
          defaultLifetime_(lifetime) {}

    std::string signingKey_;
    std::string claimName_;
    std::chrono::seconds defaultLifetime_;
};

// -- Requests and responses ---------------------------------------------------

struct LoginRequest {
    std::string username;
    std::string password;
};

/// Response of login and refresh.
struct TokenResponse {
    std::string token;
    std::chrono::system_clock::time_point expireAt{};
};

struct ChangePasswordRequest {
    std::string oldPassword;
    std::string newPassword;
};

struct CreateUserRequest {
    std::string username;
    std::string password;
    std::optional<std::string> nickname;
    std::string email;
    std::string phone;
};

struct CreateUserResponse {
    std::string userId;
};

struct CreatePostRequest {
    std::string title;
    std::string content;
};

struct CreatePostResponse {
    std::string postId;
};

}  // namespace cbs::service
