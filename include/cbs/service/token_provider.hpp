#pragma once

/// @file token_provider.hpp
/// @brief Signed session tokens (HS256 JWT): issue, parse and refresh.
///
/// Token format (RFC 7519, compact JWS):
///   base64url(header) . base64url(payload) . base64url(signature)
///
/// Header:  {"alg":"HS256","typ":"JWT"}
/// Payload: {"<claimName>":"<subject>","iat":N,"nbf":N,"exp":N}

#include "cbs/foundation/api_result.hpp"
#include "cbs/service/auth_types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace cbs::service {

/// Token issuer and verifier.
///
/// Holds an immutable TokenConfig and a clock; there is no other state, so
/// one instance may be shared by every request thread. The clock is
/// injectable so that expiry boundaries can be tested without sleeping.
///
/// Example:
/// @code
///   auto config = TokenConfig::create(options.jwtKey);
///   TokenProvider provider(config.value());
///   auto issued = provider.issue("user-w6k2mz");
///   auto claims = provider.parse(issued.value().token);
/// @endcode
class TokenProvider {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit TokenProvider(TokenConfig config, Clock clock = {});

    /// Sign a token for @p subject.
    ///
    /// `iat` is the current time truncated to whole seconds and
    /// `exp = iat + lifetime`, where lifetime is @p lifetime when given and
    /// positive, the configured default otherwise. A lifetime that would
    /// overflow `exp` is InvalidArgument.
    [[nodiscard]] cbs::foundation::ApiResult<IssuedToken> issue(
        std::string_view subject,
        std::optional<std::chrono::seconds> lifetime = std::nullopt) const;

    /// Verify and decode a token.
    ///
    /// Checks run in a fixed order and the first failure is reported:
    /// TokenMalformed (structure, encoding, algorithm, missing claims),
    /// then TokenSignatureInvalid, then TokenExpired (`now >= exp`), then
    /// Unauthorized when `nbf` is still in the future.
    [[nodiscard]] cbs::foundation::ApiResult<TokenClaims> parse(std::string_view token) const;

    /// Re-issue a currently valid token for the same subject with the
    /// default lifetime. Any parse failure is returned unchanged.
    [[nodiscard]] cbs::foundation::ApiResult<IssuedToken> refresh(std::string_view token) const;

    /// Token from an `Authorization` header value of the form
    /// `Bearer <token>` (scheme compared case-insensitively). Returns
    /// nullopt for any other scheme or an empty token.
    [[nodiscard]] static std::optional<std::string_view> extractBearer(std::string_view headerValue);

    [[nodiscard]] const TokenConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::chrono::system_clock::time_point now() const;

    TokenConfig config_;
    Clock clock_;
};

}  // namespace cbs::service
