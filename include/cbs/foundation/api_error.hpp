#pragma once

/// @file api_error.hpp
/// @brief Error type carried by ApiResult<T>.

#include <string>
#include <string_view>
#include <utility>

#include "cbs/foundation/error_code.hpp"

namespace cbs::foundation {

/// Error code plus a human-readable message.
///
/// Messages are meant for logs and for validation feedback to callers.
/// Authentication failures carry messages that are safe to log but are
/// never returned to clients verbatim (see AuthnGate).
class ApiError {
public:
    ApiError() = default;

    explicit ApiError(ErrorCode code)
        : code_(code) {}

    ApiError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Copy of this error with the message prefixed by @p context.
    [[nodiscard]] ApiError withContext(std::string_view context) const {
        std::string msg(context);
        msg += ": ";
        msg += message_;
        return ApiError(code_, std::move(msg));
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace cbs::foundation
