#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the blog API server core.

#include <cstdint>
#include <string_view>

namespace cbs::foundation {

/// Error codes grouped by subsystem in 0x100-wide ranges, so the source of
/// an error can be read off its numeric value.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Store (0x0200 - 0x02FF)
    StoreError = 0x0200,
    RecordNotFound = 0x0201,

    // Auth (0x0500 - 0x05FF)
    Unauthorized = 0x0500,
    InvalidCredentials = 0x0501,
    PasswordMismatch = 0x0502,
    TokenMalformed = 0x0503,
    TokenSignatureInvalid = 0x0504,
    TokenExpired = 0x0505,
    HashingFailed = 0x0506,
    EntropyFailure = 0x0507,
    PermissionDenied = 0x0508,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigurationMissing = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Identity (0x0900 - 0x09FF)
    ResourceIdExhausted = 0x0900,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0200: return "Store";
        case 0x0500: return "Auth";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        case 0x0900: return "Identity";
        default: return "Unknown";
    }
}

/// Enumerator name, used as the `code` field of error response bodies.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::StoreError: return "StoreError";
        case ErrorCode::RecordNotFound: return "RecordNotFound";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::InvalidCredentials: return "InvalidCredentials";
        case ErrorCode::PasswordMismatch: return "PasswordMismatch";
        case ErrorCode::TokenMalformed: return "TokenMalformed";
        case ErrorCode::TokenSignatureInvalid: return "TokenSignatureInvalid";
        case ErrorCode::TokenExpired: return "TokenExpired";
        case ErrorCode::HashingFailed: return "HashingFailed";
        case ErrorCode::EntropyFailure: return "EntropyFailure";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::ConfigLoadFailed: return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound: return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::ConfigurationMissing: return "ConfigurationMissing";
        case ErrorCode::ThreadError: return "ThreadError";
        case ErrorCode::JobScheduleFailed: return "JobScheduleFailed";
        case ErrorCode::JobNotFound: return "JobNotFound";
        case ErrorCode::LoggerError: return "LoggerError";
        case ErrorCode::LoggerFlushFailed: return "LoggerFlushFailed";
        case ErrorCode::ResourceIdExhausted: return "ResourceIdExhausted";
    }
    return "Unknown";
}

/// True for the token and credential failures that the API boundary folds
/// into a single Unauthorized outcome.
constexpr bool isAuthenticationFailure(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unauthorized:
        case ErrorCode::InvalidCredentials:
        case ErrorCode::PasswordMismatch:
        case ErrorCode::TokenMalformed:
        case ErrorCode::TokenSignatureInvalid:
        case ErrorCode::TokenExpired:
            return true;
        default:
            return false;
    }
}

} // namespace cbs::foundation
