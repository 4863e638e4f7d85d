#pragma once

/// @file authn_gate.hpp
/// @brief Bearer-token authentication stage for protected operations.

#include "cbs/foundation/api_result.hpp"
#include "cbs/service/http_types.hpp"
#include "cbs/service/token_provider.hpp"

#include <memory>
#include <string_view>

namespace cbs::service {

/// Authentication gate in front of every protected handler.
///
/// Reads the `Authorization: Bearer <token>` header, verifies the token
/// exactly once, and either forwards the request with a RequestContext or
/// answers 401 itself. Every rejection produces the same body; the real
/// cause (missing header, malformed, bad signature, expired) only goes to
/// the debug log.
///
/// Example:
/// @code
///   AuthnGate gate(provider);
///   auto refresh = gate.wrap([&](const HttpRequest&, const RequestContext& ctx) {
///       return toResponse(accounts.refresh(ctx));
///   });
///   HttpResponse res = refresh(request);
/// @endcode
class AuthnGate {
public:
    static constexpr std::string_view kUnauthorizedBody =
        R"({"code":"Unauthorized","message":"authentication required"})";

    explicit AuthnGate(std::shared_ptr<const TokenProvider> provider);

    /// Verify the request's bearer token.
    ///
    /// @return The caller's context, Unauthorized when the header is absent
    ///         or not a Bearer credential, or the TokenProvider::parse error.
    [[nodiscard]] cbs::foundation::ApiResult<RequestContext> authenticate(
        const HttpRequest& request) const;

    /// Run @p handler if the request authenticates, else answer 401.
    [[nodiscard]] HttpResponse handle(const HttpRequest& request,
                                      const AuthenticatedHandler& handler) const;

    /// Bind @p handler behind this gate as a pipeline stage.
    ///
    /// The returned stage shares ownership of the provider, so it may
    /// outlive the gate.
    [[nodiscard]] UnauthenticatedHandler wrap(AuthenticatedHandler handler) const;

    /// The uniform rejection response.
    [[nodiscard]] static HttpResponse unauthorized();

private:
    std::shared_ptr<const TokenProvider> provider_;
};

}  // namespace cbs::service
