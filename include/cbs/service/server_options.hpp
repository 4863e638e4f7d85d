#pragma once

/// @file server_options.hpp
/// @brief Start-up options of the API server, read from ConfigManager.

#include "cbs/foundation/api_result.hpp"
#include "cbs/foundation/config_manager.hpp"
#include "cbs/service/auth_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace cbs::service {

/// Resolved server options.
///
/// | key                          | default             |
/// |------------------------------|---------------------|
/// | server.addr                  | 0.0.0.0:6666        |
/// | auth.jwt_key                 | (required)          |
/// | auth.claim_name              | x-user-id           |
/// | auth.expiration_seconds      | 7200                |
/// | auth.password_iterations     | 120000              |
/// | identity.salt                | (required)          |
/// | worker.threads               | hardware threads    |
struct ServerOptions {
    std::string addr = "0.0.0.0:6666";
    std::string jwtKey;
    std::string claimName = std::string(TokenConfig::kDefaultClaimName);
    std::chrono::seconds expiration = TokenConfig::kDefaultLifetime;
    uint32_t passwordIterations = 120000;
    std::string identitySalt;
    std::size_t workerThreads = 1;

    /// Read every key, applying defaults, then validate().
    [[nodiscard]] static cbs::foundation::ApiResult<ServerOptions> fromConfig(
        const cbs::foundation::ConfigManager& config);

    /// ConfigurationMissing for an absent secret, InvalidArgument for an
    /// unusable value.
    [[nodiscard]] cbs::foundation::ApiResult<void> validate() const;

    /// TokenConfig built from jwtKey, claimName and expiration.
    [[nodiscard]] cbs::foundation::ApiResult<TokenConfig> tokenConfig() const;
};

}  // namespace cbs::service
