#pragma once

/// @file resource_id.hpp
/// @brief Opaque public identifiers derived from internal record keys.
///
/// A record's auto-increment key is sequential and would leak row counts
/// and neighbours if exposed. Public identifiers have the shape
/// `<type>-<code>` where the 6-character code is a salted, keyed
/// permutation of the key: the same key and salt always give the same code,
/// distinct keys never share a code, and nothing about adjacent keys can be
/// inferred without the salt.

#include "cbs/foundation/api_result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace cbs::service {

/// Resource type prefixes.
namespace ResourceType {
inline constexpr std::string_view User = "user";
inline constexpr std::string_view Post = "post";
}  // namespace ResourceType

/// Deterministic generator of public resource identifiers.
///
/// The code is an 8-round balanced Feistel network over [0, 62^6), split
/// into two base-62^3 halves, with HMAC-SHA256(salt) as the round function.
/// Each round is invertible, so the mapping is a bijection on the code
/// space and uniqueness holds for every key below kCapacity.
///
/// Example:
/// @code
///   auto gen = ResourceIdGenerator::create(config.identitySalt);
///   auto id = gen.value().newId(ResourceType::User, 42);  // "user-Xk3p9a"
/// @endcode
class ResourceIdGenerator {
public:
    static constexpr std::string_view kAlphabet =
        "abcedfghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    static constexpr std::size_t kCodeLength = 6;
    static constexpr uint64_t kHalfSpace = 62ULL * 62ULL * 62ULL;
    static constexpr uint64_t kCapacity = kHalfSpace * kHalfSpace;  // 62^6
    static constexpr unsigned kRounds = 8;

    /// Build a generator keyed by @p salt.
    ///
    /// An empty salt is a start-up configuration error (ConfigurationMissing):
    /// without it the codes would be a public, guessable function of the key.
    [[nodiscard]] static cbs::foundation::ApiResult<ResourceIdGenerator> create(std::string salt);

    /// Identifier for record @p counter of @p resourceType.
    ///
    /// @return `<resourceType>-<code>`, InvalidArgument for a type that is
    ///         empty or not lowercase alphanumeric, ResourceIdExhausted for
    ///         counter >= kCapacity.
    [[nodiscard]] cbs::foundation::ApiResult<std::string> newId(std::string_view resourceType,
                                                                uint64_t counter) const;

    /// Shape check: `^<resourceType>-[A-Za-z0-9]{6}$`.
    [[nodiscard]] static bool matches(std::string_view resourceType, std::string_view id);

private:
    explicit ResourceIdGenerator(std::string salt) : salt_(std::move(salt)) {}

    [[nodiscard]] cbs::foundation::ApiResult<uint64_t> permute(uint64_t counter) const;

    std::string salt_;
};

}  // namespace cbs::service
