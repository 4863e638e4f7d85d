/// @file api_routes.cpp
/// @brief RouteTable implementation and the REST route set.

#include "cbs/service/api_routes.hpp"

#include "cbs/foundation/api_logger.hpp"
#include "cbs/service/account_service.hpp"
#include "cbs/service/authn_gate.hpp"
#include "cbs/service/post_service.hpp"

#include "flat_json.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace cbs::service {

using cbs::foundation::ApiError;
using cbs::foundation::ErrorCode;
using cbs::foundation::LogCategory;
using detail::extractJsonString;
using detail::isJsonObject;
using detail::jsonEscape;

namespace {

std::vector<std::string> splitPath(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.emplace_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

/// RFC 3339 UTC timestamp with second precision.
std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &tt);
#else
    gmtime_r(&tt, &utc);
#endif

    char buf[64];
    std::snprintf(buf,
                  sizeof(buf),
                  "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  utc.tm_year + 1900,
                  utc.tm_mon + 1,
                  utc.tm_mday,
                  utc.tm_hour,
                  utc.tm_min,
                  utc.tm_sec);
    return buf;
}

HttpResponse ok(std::string body) {
    return HttpResponse{HttpStatus::Ok, std::move(body)};
}

HttpResponse badBody() {
    return errorResponse(ApiError(ErrorCode::InvalidArgument, "request body is not a JSON object"));
}

std::string field(std::string_view body, std::string_view key) {
    return extractJsonString(body, key).value_or(std::string{});
}

std::string tokenBody(const TokenResponse& token) {
    return "{\"token\":" + jsonEscape(token.token) + ",\"expireAt\":" +
           jsonEscape(formatTimestamp(token.expireAt)) + "}";
}

std::string postBody(const PostRecord& post) {
    return "{\"post\":{\"postID\":" + jsonEscape(post.postId) +
           ",\"userID\":" + jsonEscape(post.userId) + ",\"title\":" + jsonEscape(post.title) +
           ",\"content\":" + jsonEscape(post.content) +
           ",\"createdAt\":" + jsonEscape(formatTimestamp(post.createdAt)) +
           ",\"updatedAt\":" + jsonEscape(formatTimestamp(post.updatedAt)) + "}}";
}

}  // namespace

// -- HttpRequest --------------------------------------------------------------

std::string_view HttpRequest::param(std::string_view name) const {
    auto it = params.find(std::string(name));
    if (it == params.end()) {
        return {};
    }
    return it->second;
}

// -- RouteTable ---------------------------------------------------------------

void RouteTable::addRoute(std::string method, std::string pattern, UnauthenticatedHandler handler) {
    Route route;
    route.segments = splitPath(pattern);
    route.entry = RouteEntry{std::move(method), std::move(pattern)};
    route.handler = std::move(handler);

    std::lock_guard<std::mutex> lock(mutex_);
    routes_.push_back(std::move(route));
}

HttpResponse RouteTable::dispatch(HttpRequest request) const {
    auto segments = splitPath(request.path);

    UnauthenticatedHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& route : routes_) {
            if (route.entry.method != request.method ||
                route.segments.size() != segments.size()) {
                continue;
            }
            std::map<std::string, std::string> params;
            bool matched = true;
            for (std::size_t i = 0; i < segments.size(); ++i) {
                const auto& expected = route.segments[i];
                if (!expected.empty() && expected.front() == ':') {
                    params[expected.substr(1)] = segments[i];
                } else if (expected != segments[i]) {
                    matched = false;
                    break;
                }
            }
            if (matched) {
                request.params = std::move(params);
                handler = route.handler;
                break;
            }
        }
    }

    if (!handler) {
        CBS_LOG_DEBUG(LogCategory::Core, "no route for " + request.method + " " + request.path);
        return HttpResponse{HttpStatus::NotFound, std::string(kNotFoundBody)};
    }
    return handler(request);
}

bool RouteTable::hasRoute(std::string_view method, std::string_view pattern) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& route : routes_) {
        if (route.entry.method == method && route.entry.pattern == pattern) {
            return true;
        }
    }
    return false;
}

std::vector<RouteEntry> RouteTable::routes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RouteEntry> entries;
    entries.reserve(routes_.size());
    for (const auto& route : routes_) {
        entries.push_back(route.entry);
    }
    return entries;
}

std::size_t RouteTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.size();
}

// -- Error mapping ------------------------------------------------------------

HttpStatus toHttpStatus(ErrorCode code) {
    if (cbs::foundation::isAuthenticationFailure(code)) {
        return HttpStatus::Unauthorized;
    }
    switch (code) {
        case ErrorCode::InvalidArgument:
            return HttpStatus::BadRequest;
        case ErrorCode::PermissionDenied:
            return HttpStatus::Forbidden;
        case ErrorCode::NotFound:
        case ErrorCode::RecordNotFound:
            return HttpStatus::NotFound;
        case ErrorCode::AlreadyExists:
            return HttpStatus::Conflict;
        default:
            return HttpStatus::InternalServerError;
    }
}

HttpResponse errorResponse(const ApiError& error) {
    auto code = error.code();
    if (cbs::foundation::isAuthenticationFailure(code) && code != ErrorCode::InvalidCredentials) {
        return AuthnGate::unauthorized();
    }

    auto status = toHttpStatus(code);
    std::string message(error.message());
    if (status == HttpStatus::InternalServerError) {
        CBS_LOG_ERROR(LogCategory::Core, "request failed: " + message);
        message = "internal server error";
    }
    return HttpResponse{status,
                        "{\"code\":" + jsonEscape(cbs::foundation::errorCodeName(code)) +
                            ",\"message\":" + jsonEscape(message) + "}"};
}

// -- REST routes --------------------------------------------------------------

void installRoutes(RouteTable& table,
                   std::shared_ptr<AccountService> accounts,
                   std::shared_ptr<PostService> posts,
                   const AuthnGate& gate) {
    table.addRoute("GET", "/healthz", [](const HttpRequest&) {
        return ok(R"({"status":"ok"})");
    });

    table.addRoute("POST", "/login", [accounts](const HttpRequest& req) {
        if (!isJsonObject(req.body)) {
            return badBody();
        }
        auto session = accounts->login({field(req.body, "username"), field(req.body, "password")});
        if (!session) {
            return errorResponse(session.error());
        }
        return ok(tokenBody(session.value()));
    });

    table.addRoute("PUT", "/refresh-token",
                   gate.wrap([accounts](const HttpRequest&, const RequestContext& ctx) {
                       auto session = accounts->refresh(ctx);
                       if (!session) {
                           return errorResponse(session.error());
                       }
                       return ok(tokenBody(session.value()));
                   }));

    table.addRoute("POST", "/v1/users", [accounts](const HttpRequest& req) {
        if (!isJsonObject(req.body)) {
            return badBody();
        }
        CreateUserRequest request;
        request.username = field(req.body, "username");
        request.password = field(req.body, "password");
        request.nickname = extractJsonString(req.body, "nickname");
        request.email = field(req.body, "email");
        request.phone = field(req.body, "phone");

        auto created = accounts->createUser(request);
        if (!created) {
            return errorResponse(created.error());
        }
        return ok("{\"userID\":" + jsonEscape(created.value().userId) + "}");
    });

    table.addRoute(
        "PUT", "/v1/users/:userID/change-password",
        gate.wrap([accounts](const HttpRequest& req, const RequestContext& ctx) {
            if (req.param("userID") != ctx.userId) {
                return errorResponse(ApiError(ErrorCode::PermissionDenied,
                                              "cannot change another user's password"));
            }
            if (!isJsonObject(req.body)) {
                return badBody();
            }
            auto changed = accounts->changePassword(
                ctx, {field(req.body, "oldPassword"), field(req.body, "newPassword")});
            if (!changed) {
                return errorResponse(changed.error());
            }
            return ok("{}");
        }));

    table.addRoute("POST", "/v1/posts",
                   gate.wrap([posts](const HttpRequest& req, const RequestContext& ctx) {
                       if (!isJsonObject(req.body)) {
                           return badBody();
                       }
                       auto created = posts->createPost(
                           ctx, {field(req.body, "title"), field(req.body, "content")});
                       if (!created) {
                           return errorResponse(created.error());
                       }
                       return ok("{\"postID\":" + jsonEscape(created.value().postId) + "}");
                   }));

    table.addRoute("GET", "/v1/posts/:postID",
                   gate.wrap([posts](const HttpRequest& req, const RequestContext&) {
                       auto post = posts->getPost(req.param("postID"));
                       if (!post) {
                           return errorResponse(post.error());
                       }
                       return ok(postBody(post.value()));
                   }));
}

}  // namespace cbs::service
