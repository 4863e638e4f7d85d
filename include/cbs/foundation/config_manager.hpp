#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed start-up configuration with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "cbs/foundation/api_result.hpp"

namespace cbs::foundation {

/// Flattened view of a YAML configuration document.
///
/// Keys are addressed with dots ("auth.jwt_key"). The document is read once
/// at start-up; components receive the values they need as plain structs
/// (see ServerOptions) and never hold on to the manager.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous content.
    /// @return Success or ConfigLoadFailed.
    ApiResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    ApiResult<void> loadString(std::string_view yaml);

    /// Typed lookup.
    /// @return The value, ConfigKeyNotFound or ConfigTypeMismatch.
    template <typename T>
    ApiResult<T> get(std::string_view key) const;

    /// Typed lookup of a key the process cannot start without.
    /// A missing key or an empty string value yields ConfigurationMissing.
    template <typename T>
    ApiResult<T> require(std::string_view key) const;

    /// Typed lookup with a fallback for absent keys.
    /// A present key of the wrong type is still reported as an error.
    template <typename T>
    ApiResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key (overrides file content).
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
ApiResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end() || it->second.IsNull()) {
        return ApiResult<T>::err(
            ApiError(ErrorCode::ConfigKeyNotFound,
                     std::string("config key not found: ") + std::string(key)));
    }
    try {
        return ApiResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ApiResult<T>::err(
            ApiError(ErrorCode::ConfigTypeMismatch,
                     std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
ApiResult<T> ConfigManager::require(std::string_view key) const {
    auto result = get<T>(key);
    if (result.hasError()) {
        if (result.error().code() == ErrorCode::ConfigKeyNotFound) {
            return ApiResult<T>::err(
                ApiError(ErrorCode::ConfigurationMissing,
                         std::string("required config key missing: ") + std::string(key)));
        }
        return result;
    }
    if constexpr (std::is_same_v<T, std::string>) {
        if (result.value().empty()) {
            return ApiResult<T>::err(
                ApiError(ErrorCode::ConfigurationMissing,
                         std::string("required config key is empty: ") + std::string(key)));
        }
    }
    return result;
}

template <typename T>
ApiResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasError() && result.error().code() == ErrorCode::ConfigKeyNotFound) {
        return ApiResult<T>::ok(std::move(fallback));
    }
    return result;
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace cbs::foundation
