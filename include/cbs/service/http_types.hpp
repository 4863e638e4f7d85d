#pragma once

/// @file http_types.hpp
/// @brief Transport-neutral request/response shapes seen by the request
///        pipeline.
///
/// The HTTP server itself is outside the identity core; these structs are
/// what it hands to the pipeline and what it expects back.

#include "cbs/service/auth_types.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace cbs::service {

/// HTTP status codes used by the pipeline.
enum class HttpStatus : uint16_t {
    Ok = 200,
    Created = 201,
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    Conflict = 409,
    InternalServerError = 500,
};

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    std::map<std::string, std::string> params;  ///< Path parameters bound by the route table.

    /// Header value by name (case-insensitive), empty view if absent.
    [[nodiscard]] std::string_view header(std::string_view name) const;

    /// Path parameter by name, empty view if unbound.
    [[nodiscard]] std::string_view param(std::string_view name) const;
};

struct HttpResponse {
    HttpStatus status = HttpStatus::Ok;
    std::string body;
};

/// Identity attached to a request that passed the AuthnGate.
struct RequestContext {
    std::string userId;  ///< Public id taken from the verified token.
    TokenClaims claims;
    std::string token;   ///< The presented bearer token.
};

/// Handler behind the gate; only ever invoked with a verified context.
using AuthenticatedHandler =
    std::function<HttpResponse(const HttpRequest&, const RequestContext&)>;

/// Pipeline stage as seen by the server.
using UnauthenticatedHandler = std::function<HttpResponse(const HttpRequest&)>;

}  // namespace cbs::service
