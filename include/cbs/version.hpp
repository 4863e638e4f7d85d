#pragma once

/// @file version.hpp
/// @brief Project version information for the blog API server core.

#define CBS_VERSION_MAJOR 0
#define CBS_VERSION_MINOR 3
#define CBS_VERSION_PATCH 0
#define CBS_VERSION_STRING "0.3.0"

namespace cbs {

/// Compile-time version of the identity and access core.
struct Version {
    static constexpr int major = CBS_VERSION_MAJOR;
    static constexpr int minor = CBS_VERSION_MINOR;
    static constexpr int patch = CBS_VERSION_PATCH;
    static constexpr const char* string = CBS_VERSION_STRING;
};

} // namespace cbs
