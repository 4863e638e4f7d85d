#pragma once

/// @file api_result.hpp
/// @brief ApiResult<T> alias used across the identity and access core.

#include "cbs/core/result.hpp"
#include "cbs/foundation/api_error.hpp"

namespace cbs::foundation {

/// Result specialized with ApiError.
///
/// Example:
/// @code
///   ApiResult<UserKey> allocate(const UserRecord& rec) {
///       if (rec.username.empty()) {
///           return ApiResult<UserKey>::err(
///               ApiError(ErrorCode::InvalidArgument, "username is empty"));
///       }
///       return ApiResult<UserKey>::ok(UserKey(7));
///   }
/// @endcode
template <typename T>
using ApiResult = cbs::Result<T, ApiError>;

}  // namespace cbs::foundation
