#pragma once

/// @file service_runner.hpp
/// @brief Entry-point utilities: signal handling, config path resolution.

#include <atomic>
#include <filesystem>

#include "cbs/foundation/api_result.hpp"
#include "cbs/foundation/config_manager.hpp"

namespace cbs::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

inline constexpr const char* kConfigPathEnv = "CBS_CONFIG_PATH";
inline constexpr const char* kDefaultConfigPath = "/etc/cbs/apiserver.yaml";

/// Pick the configuration file.
///
/// Resolved in order: @p cliPath when non-empty, the CBS_CONFIG_PATH
/// environment variable when set and non-empty, then @p defaultPath.
[[nodiscard]] std::filesystem::path
resolveConfigPath(const std::filesystem::path& cliPath,
                  const std::filesystem::path& defaultPath = kDefaultConfigPath);

/// Load the file chosen by resolveConfigPath() into @p config.
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] cbs::foundation::ApiResult<void>
loadConfig(cbs::foundation::ConfigManager& config,
           const std::filesystem::path& cliPath,
           const std::filesystem::path& defaultPath = kDefaultConfigPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

} // namespace cbs::service
