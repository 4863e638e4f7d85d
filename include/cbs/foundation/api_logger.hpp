#pragma once

/// @file api_logger.hpp
/// @brief ApiLogger wrapping kcenon logger_system for category-based logging.
///
/// Security-relevant events (failed logins, rejected tokens) are logged
/// through the Auth and Token categories. Callers must never pass secrets
/// (passwords, tokens, signing keys, salts) into a log message.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cbs/foundation/api_result.hpp"
#include "cbs/foundation/types.hpp"

namespace cbs::foundation {

/// Log severity levels.
///
/// Maps one-to-one onto kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, each with its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Process lifecycle
    Auth     = 1, ///< Login, password changes, gate decisions
    Token    = 2, ///< Token issuance and verification
    Identity = 3, ///< Public identifier generation
    Store    = 4, ///< Persistence collaborator calls
    Config   = 5  ///< Configuration loading and validation
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Auth", "Token", "Identity", "Store", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.userId = "user-w6k2mz";
///   ctx.extra["reason"] = "TokenExpired";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Auth,
///                         "request rejected", ctx);
/// @endcode
struct LogContext {
    std::optional<UserKey> userKey;
    std::optional<std::string> userId;
    std::optional<std::string> requestId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger over kcenon's GlobalLoggerRegistry.
///
/// Default minimum levels: Debug for Token and Identity, Info otherwise.
/// PIMPL keeps kcenon headers out of the public API.
class ApiLogger {
public:
    ApiLogger();
    ~ApiLogger();

    ApiLogger(const ApiLogger&) = delete;
    ApiLogger& operator=(const ApiLogger&) = delete;
    ApiLogger(ApiLogger&&) noexcept;
    ApiLogger& operator=(ApiLogger&&) noexcept;

    /// Log a message; no-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by " {key=val, ...}".
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    ApiResult<void> flush();

    /// Process-wide logger used by the CBS_LOG macros.
    static ApiLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cbs::foundation

/// @name CBS_LOG Macros
/// Define CBS_MIN_LOG_LEVEL (0=Trace .. 6=Off) before including this header
/// to compile out calls below a threshold.
/// @{

#ifndef CBS_MIN_LOG_LEVEL
    #define CBS_MIN_LOG_LEVEL 0
#endif

#define CBS_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= CBS_MIN_LOG_LEVEL &&                      \
            ::cbs::foundation::ApiLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::cbs::foundation::ApiLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define CBS_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                         \
        if (static_cast<int>(level) >= CBS_MIN_LOG_LEVEL) {                      \
            ::cbs::foundation::ApiLogger::instance().logWithContext(             \
                (level), (cat), (msg), (ctx));                                   \
        }                                                                        \
    } while (0)

#define CBS_LOG_DEBUG(cat, msg) \
    CBS_LOG(::cbs::foundation::LogLevel::Debug, (cat), (msg))

#define CBS_LOG_INFO(cat, msg) \
    CBS_LOG(::cbs::foundation::LogLevel::Info, (cat), (msg))

#define CBS_LOG_WARN(cat, msg) \
    CBS_LOG(::cbs::foundation::LogLevel::Warning, (cat), (msg))

#define CBS_LOG_ERROR(cat, msg) \
    CBS_LOG(::cbs::foundation::LogLevel::Error, (cat), (msg))

/// @}
