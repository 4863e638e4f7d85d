/// @file auth_types.cpp
/// @brief TokenConfig validation.

#include "cbs/service/auth_types.hpp"

namespace cbs::service {

using cbs::foundation::ApiError;
using cbs::foundation::ApiResult;
using cbs::foundation::ErrorCode;

ApiResult<TokenConfig> TokenConfig::create(std::string signingKey,
                                           std::string claimName,
                                           std::chrono::seconds defaultLifetime) {
    if (signingKey.empty()) {
        return ApiResult<TokenConfig>::err(
            ApiError(ErrorCode::ConfigurationMissing, "token signing key is not configured"));
    }
    if (claimName.empty()) {
        return ApiResult<TokenConfig>::err(
            ApiError(ErrorCode::ConfigurationMissing, "token identity claim name is empty"));
    }
    if (claimName == "iat" || claimName == "nbf" || claimName == "exp") {
        return ApiResult<TokenConfig>::err(
            ApiError(ErrorCode::InvalidArgument, "identity claim name collides with a time claim"));
    }
    if (defaultLifetime.count() <= 0) {
        return ApiResult<TokenConfig>::err(
            ApiError(ErrorCode::InvalidArgument, "token lifetime must be positive"));
    }
    return ApiResult<TokenConfig>::ok(
        TokenConfig(std::move(signingKey), std::move(claimName), defaultLifetime));
}

}  // namespace cbs::service
