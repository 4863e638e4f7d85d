/// @file authn_gate.cpp
/// @brief AuthnGate and HttpRequest header lookup.

#include "cbs/service/authn_gate.hpp"

#include "cbs/foundation/api_logger.hpp"

#include <cctype>

namespace cbs::service {

using cbs::foundation::ApiError;
using cbs::foundation::ApiResult;
using cbs::foundation::ErrorCode;
using cbs::foundation::LogCategory;
using cbs::foundation::LogContext;
using cbs::foundation::LogLevel;

namespace {

constexpr std::string_view kAuthorizationHeader = "authorization";

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string_view HttpRequest::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return {};
}

AuthnGate::AuthnGate(std::shared_ptr<const TokenProvider> provider)
    : provider_(std::move(provider)) {}

ApiResult<RequestContext> AuthnGate::authenticate(const HttpRequest& request) const {
    auto header = request.header(kAuthorizationHeader);
    if (header.empty()) {
        return ApiResult<RequestContext>::err(
            ApiError(ErrorCode::Unauthorized, "missing Authorization header"));
    }

    auto token = TokenProvider::extractBearer(header);
    if (!token) {
        return ApiResult<RequestContext>::err(
            ApiError(ErrorCode::Unauthorized, "Authorization header is not a Bearer credential"));
    }

    auto claims = provider_->parse(*token);
    if (!claims) {
        return ApiResult<RequestContext>::err(claims.error());
    }

    RequestContext ctx;
    ctx.userId = claims.value().subject;
    ctx.claims = std::move(claims.value());
    ctx.token = std::string(*token);
    return ApiResult<RequestContext>::ok(std::move(ctx));
}

HttpResponse AuthnGate::handle(const HttpRequest& request,
                               const AuthenticatedHandler& handler) const {
    auto ctx = authenticate(request);
    if (!ctx) {
        LogContext logCtx;
        logCtx.extra["method"] = request.method;
        logCtx.extra["path"] = request.path;
        logCtx.extra["reason"] = std::string(ctx.error().message());
        CBS_LOG_CTX(LogLevel::Debug, LogCategory::Auth, "request rejected", logCtx);
        return unauthorized();
    }
    return handler(request, ctx.value());
}

UnauthenticatedHandler AuthnGate::wrap(AuthenticatedHandler handler) const {
    return [gate = *this, handler = std::move(handler)](const HttpRequest& request) {
        return gate.handle(request, handler);
    };
}

HttpResponse AuthnGate::unauthorized() {
    return HttpResponse{HttpStatus::Unauthorized, std::string(kUnauthorizedBody)};
}

}  // namespace cbs::service
