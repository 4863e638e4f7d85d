#pragma once

/// @file api_routes.hpp
/// @brief Method and path routing for the API server, plus the REST route
///        set of the identity core.
///
/// The table is transport-neutral: an HTTP front end hands it an
/// HttpRequest and writes back the HttpResponse. Protected routes are
/// registered already wrapped by AuthnGate, so the table itself holds no
/// authentication logic.

#include "cbs/foundation/api_error.hpp"
#include "cbs/foundation/error_code.hpp"
#include "cbs/service/http_types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cbs::service {

class AccountService;
class AuthnGate;
class PostService;

/// One registered route as reported by RouteTable::routes().
struct RouteEntry {
    std::string method;
    std::string pattern;  ///< e.g. "/v1/posts/:postID"
};

/// Method and path routing table.
///
/// Patterns are matched segment by segment; a segment starting with `:`
/// binds the request segment to HttpRequest::params under that name.
/// Routes are tried in registration order.
///
/// Example:
/// @code
///   RouteTable routes;
///   routes.addRoute("GET", "/v1/posts/:postID", getPostHandler);
///
///   auto res = routes.dispatch(request);  // 404 body when nothing matches
/// @endcode
class RouteTable {
public:
    /// Body returned when no route matches.
    static constexpr std::string_view kNotFoundBody =
        R"({"code":"NotFound","message":"Page not found"})";

    void addRoute(std::string method, std::string pattern, UnauthenticatedHandler handler);

    /// Run the first matching route, or return 404.
    [[nodiscard]] HttpResponse dispatch(HttpRequest request) const;

    /// Whether a route with exactly this method and pattern is registered.
    [[nodiscard]] bool hasRoute(std::string_view method, std::string_view pattern) const;

    [[nodiscard]] std::vector<RouteEntry> routes() const;

    [[nodiscard]] std::size_t size() const;

private:
    struct Route {
        RouteEntry entry;
        std::vector<std::string> segments;
        UnauthenticatedHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Route> routes_;
};

/// HTTP status for an error returned by the account or post flows.
[[nodiscard]] HttpStatus toHttpStatus(cbs::foundation::ErrorCode code);

/// `{"code":"<ErrorCode>","message":"..."}` with the mapped status.
///
/// Token failures get the gate's uniform 401 body. Internal failures (500)
/// keep their code but not their message.
[[nodiscard]] HttpResponse errorResponse(const cbs::foundation::ApiError& error);

/// Register the REST routes of the identity core.
///
/// Unauthenticated: `POST /login`, `POST /v1/users`, `GET /healthz`.
/// Behind the gate: `PUT /refresh-token`,
/// `PUT /v1/users/:userID/change-password`, `POST /v1/posts`,
/// `GET /v1/posts/:postID`.
void installRoutes(RouteTable& table,
                   std::shared_ptr<AccountService> accounts,
                   std::shared_ptr<PostService> posts,
                   const AuthnGate& gate);

}  // namespace cbs::service
