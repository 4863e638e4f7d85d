/// @file server_options.cpp
/// @brief ServerOptions loading and validation.

#include "cbs/service/server_options.hpp"

#include "cbs/service/password_hasher.hpp"

#include <algorithm>
#include <thread>

namespace cbs::service {

using cbs::foundation::ApiError;
using cbs::foundation::ApiResult;
using cbs::foundation::ConfigManager;
using cbs::foundation::ErrorCode;

namespace {

std::size_t defaultWorkerThreads() {
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

}  // namespace

ApiResult<ServerOptions> ServerOptions::fromConfig(const ConfigManager& config) {
    ServerOptions opts;
    opts.workerThreads = defaultWorkerThreads();

    auto addr = config.getOr<std::string>("server.addr", opts.addr);
    if (!addr) {
        return ApiResult<ServerOptions>::err(addr.error());
    }
    opts.addr = std::move(addr.value());

    auto jwtKey = config.require<std::string>("auth.jwt_key");
    if (!jwtKey) {
        return ApiResult<ServerOptions>::err(jwtKey.error());
    }
    opts.jwtKey = std::move(jwtKey.value());

    auto claimName = config.getOr<std::string>("auth.claim_name", opts.claimName);
    if (!claimName) {
        return ApiResult<ServerOptions>::err(claimName.error());
    }
    opts.claimName = std::move(claimName.value());

    auto expiration = config.getOr<int64_t>("auth.expiration_seconds", opts.expiration.count());
    if (!expiration) {
        return ApiResult<ServerOptions>::err(expiration.error());
    }
    opts.expiration = std::chrono::seconds(expiration.value());

    auto iterations = config.getOr<int64_t>("auth.password_iterations", opts.passwordIterations);
    if (!iterations) {
        return ApiResult<ServerOptions>::err(iterations.error());
    }
    if (iterations.value() < PasswordHasher::kMinIterations || iterations.value() > UINT32_MAX) {
        return ApiResult<ServerOptions>::err(ApiError(
            ErrorCode::InvalidArgument, "auth.password_iterations must be at least " +
                                            std::to_string(PasswordHasher::kMinIterations)));
    }
    opts.passwordIterations = static_cast<uint32_t>(iterations.value());

    auto salt = config.require<std::string>("identity.salt");
    if (!salt) {
        return ApiResult<ServerOptions>::err(salt.error());
    }
    opts.identitySalt = std::move(salt.value());

    auto threads = config.getOr<int64_t>("worker.threads",
                                         static_cast<int64_t>(opts.workerThreads));
    if (!threads) {
        return ApiResult<ServerOptions>::err(threads.error());
    }
    if (threads.value() < 1) {
        return ApiResult<ServerOptions>::err(
            ApiError(ErrorCode::InvalidArgument, "worker.threads must be at least 1"));
    }
    opts.workerThreads = static_cast<std::size_t>(threads.value());

    auto valid = opts.validate();
    if (!valid) {
        return ApiResult<ServerOptions>::err(valid.error());
    }
    return ApiResult<ServerOptions>::ok(std::move(opts));
}

ApiResult<void> ServerOptions::validate() const {
    if (addr.empty() || addr.find(':') == std::string::npos) {
        return ApiResult<void>::err(
            ApiError(ErrorCode::InvalidArgument, "server.addr must be host:port"));
    }
    if (jwtKey.empty()) {
        return ApiResult<void>::err(
            ApiError(ErrorCode::ConfigurationMissing, "auth.jwt_key is not configured"));
    }
    if (identitySalt.empty()) {
        return ApiResult<void>::err(
            ApiError(ErrorCode::ConfigurationMissing, "identity.salt is not configured"));
    }
    if (expiration.count() <= 0) {
        return ApiResult<void>::err(
            ApiError(ErrorCode::InvalidArgument, "auth.expiration_seconds must be positive"));
    }
    if (passwordIterations < PasswordHasher::kMinIterations) {
        return ApiResult<void>::err(
            ApiError(ErrorCode::InvalidArgument, "auth.password_iterations is below minimum"));
    }
    if (workerThreads == 0) {
        return ApiResult<void>::err(
            ApiError(ErrorCode::InvalidArgument, "worker.threads must be at least 1"));
    }
    auto token = tokenConfig();
    if (!token) {
        return ApiResult<void>::err(token.error());
    }
    return ApiResult<void>::ok();
}

ApiResult<TokenConfig> ServerOptions::tokenConfig() const {
    return TokenConfig::create(jwtKey, claimName, expiration);
}

}  // namespace cbs::service
