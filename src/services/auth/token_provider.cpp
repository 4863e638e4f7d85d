/// @file token_provider.cpp
/// @brief TokenProvider implementation (HS256 JWT, minimal flat-JSON codec).

#include "cbs/service/token_provider.hpp"

#include "cbs/foundation/api_logger.hpp"

#include "crypto_utils.hpp"
#include "flat_json.hpp"

#include <limits>
#include <sstream>
#include <vector>

namespace cbs::service {

using cbs::foundation::ApiError;
using cbs::foundation::ApiResult;
using cbs::foundation::ErrorCode;
using cbs::foundation::LogCategory;
using detail::extractJsonInt;
using detail::extractJsonString;
using detail::isJsonObject;
using detail::jsonEscape;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
namespace {

constexpr std::string_view kHeader = R"({"alg":"HS256","typ":"JWT"})";

int64_t toEpoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpoch(int64_t epoch) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(epoch));
}

/// Split on every delimiter, keeping empty segments.
std::vector<std::string_view> split(std::string_view s, char delim) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

ApiResult<TokenClaims> malformed(std::string message) {
    return ApiResult<TokenClaims>::err(ApiError(ErrorCode::TokenMalformed, std::move(message)));
}

bool iequalsAscii(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        char y = b[i];
        if (x >= 'A' && x <= 'Z') {
            x = static_cast<char>(x - 'A' + 'a');
        }
        if (y >= 'A' && y <= 'Z') {
            y = static_cast<char>(y - 'A' + 'a');
        }
        if (x != y) {
            return false;
        }
    }
    return true;
}

}  // anonymous namespace

// ---------------------------------------------------------------------------
// TokenProvider
// ---------------------------------------------------------------------------

TokenProvider::TokenProvider(TokenConfig config, Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::chrono::system_clock::time_point TokenProvider::now() const {
    return clock_();
}

ApiResult<IssuedToken> TokenProvider::issue(std::string_view subject,
                                            std::optional<std::chrono::seconds> lifetime) const {
    if (subject.empty()) {
        return ApiResult<IssuedToken>::err(
            ApiError(ErrorCode::InvalidArgument, "token subject is empty"));
    }

    auto ttl = config_.defaultLifetime();
    if (lifetime && lifetime->count() > 0) {
        ttl = *lifetime;
    }

    auto iat = toEpoch(now());
    if (iat >= 0 && ttl.count() > std::numeric_limits<int64_t>::max() - iat) {
        return ApiResult<IssuedToken>::err(
            ApiError(ErrorCode::InvalidArgument, "token lifetime is out of range"));
    }
    auto exp = iat + ttl.count();

    std::ostringstream payload;
    payload << "{" << jsonEscape(config_.claimName()) << ":" << jsonEscape(subject)
            << ",\"iat\":" << iat << ",\"nbf\":" << iat << ",\"exp\":" << exp << "}";

    std::string signingInput = detail::base64urlEncode(kHeader) + "." +
                               detail::base64urlEncode(payload.str());

    auto mac = detail::hmacSha256(config_.signingKey(), signingInput);
    if (!mac) {
        CBS_LOG_ERROR(LogCategory::Token, "HMAC computation failed while signing token");
        return ApiResult<IssuedToken>::err(
            ApiError(ErrorCode::HashingFailed, "token signing failed"));
    }

    IssuedToken issued;
    issued.token = signingInput + "." + detail::base64urlEncode(mac->data(), mac->size());
    issued.expiresAt = fromEpoch(exp);
    return ApiResult<IssuedToken>::ok(std::move(issued));
}

ApiResult<TokenClaims> TokenProvider::parse(std::string_view token) const {
    // 1. Structure and encoding.
    auto parts = split(token, '.');
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
        return malformed("expected three non-empty segments");
    }

    auto headerJson = detail::base64urlDecode(parts[0]);
    if (!headerJson) {
        return malformed("header is not base64url");
    }
    auto alg = extractJsonString(*headerJson, "alg");
    if (!alg || *alg != "HS256") {
        return malformed("unsupported or missing algorithm");
    }

    auto payloadJson = detail::base64urlDecode(parts[1]);
    if (!payloadJson) {
        return malformed("payload is not base64url");
    }
    if (!isJsonObject(*payloadJson)) {
        return malformed("payload is not a JSON object");
    }
    auto subject = extractJsonString(*payloadJson, config_.claimName());
    if (!subject || subject->empty()) {
        return malformed("missing identity claim");
    }
    auto iat = extractJsonInt(*payloadJson, "iat");
    auto exp = extractJsonInt(*payloadJson, "exp");
    if (!iat || !exp) {
        return malformed("missing iat or exp");
    }

    // 2. Signature.
    std::string signingInput;
    signingInput.reserve(parts[0].size() + 1 + parts[1].size());
    signingInput.append(parts[0]).append(".").append(parts[1]);

    auto expectedMac = detail::hmacSha256(config_.signingKey(), signingInput);
    if (!expectedMac) {
        CBS_LOG_ERROR(LogCategory::Token, "HMAC computation failed while verifying token");
        return ApiResult<TokenClaims>::err(
            ApiError(ErrorCode::HashingFailed, "token verification failed"));
    }
    auto expectedSig = detail::base64urlEncode(expectedMac->data(), expectedMac->size());
    if (!detail::constantTimeEqual(expectedSig, parts[2])) {
        return ApiResult<TokenClaims>::err(
            ApiError(ErrorCode::TokenSignatureInvalid, "signature does not verify"));
    }

    // 3. Expiry.
    auto current = toEpoch(now());
    if (current >= *exp) {
        return ApiResult<TokenClaims>::err(ApiError(ErrorCode::TokenExpired, "token has expired"));
    }
    if (auto nbf = extractJsonInt(*payloadJson, "nbf"); nbf && current < *nbf) {
        return ApiResult<TokenClaims>::err(
            ApiError(ErrorCode::Unauthorized, "token is not yet valid"));
    }

    TokenClaims claims;
    claims.subject = std::move(*subject);
    claims.issuedAt = fromEpoch(*iat);
    claims.expiresAt = fromEpoch(*exp);
    return ApiResult<TokenClaims>::ok(std::move(claims));
}

ApiResult<IssuedToken> TokenProvider::refresh(std::string_view token) const {
    auto claims = parse(token);
    if (!claims) {
        return ApiResult<IssuedToken>::err(claims.error());
    }
    CBS_LOG_DEBUG(LogCategory::Token, "refreshing token for " + claims.value().subject);
    return issue(claims.value().subject);
}

std::optional<std::string_view> TokenProvider::extractBearer(std::string_view headerValue) {
    constexpr std::string_view scheme = "bearer";
    if (headerValue.size() <= scheme.size() ||
        !iequalsAscii(headerValue.substr(0, scheme.size()), scheme) ||
        headerValue[scheme.size()] != ' ') {
        return std::nullopt;
    }
    auto token = headerValue.substr(scheme.size() + 1);
    while (!token.empty() && token.front() == ' ') {
        token.remove_prefix(1);
    }
    while (!token.empty() && (token.back() == ' ' || token.back() == '\t')) {
        token.remove_suffix(1);
    }
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

}  // namespace cbs::service
