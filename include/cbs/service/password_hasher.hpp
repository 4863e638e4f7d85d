#pragma once

/// @file password_hasher.hpp
/// @brief Adaptive one-way password hashing (PBKDF2-HMAC-SHA256).
///
/// Digests are self-describing so that the work factor can be raised
/// without invalidating stored credentials:
///
///   $pbkdf2-sha256$<iterations>$<salt-hex>$<hash-hex>

#include "cbs/foundation/api_result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace cbs::service {

/// Credential hasher.
///
/// hash() draws a fresh 16-byte salt per call, so hashing the same password
/// twice yields different digests; verify() re-derives with the salt and
/// iteration count embedded in the digest and compares in constant time.
///
/// Example:
/// @code
///   PasswordHasher hasher;
///   auto digest = hasher.hash("s3cret-pass");
///   auto ok = hasher.verify(digest.value(), "s3cret-pass");
/// @endcode
class PasswordHasher {
public:
    static constexpr uint32_t kDefaultIterations = 120000;
    static constexpr uint32_t kMinIterations = 1000;
    static constexpr std::size_t kSaltBytes = 16;
    static constexpr std::size_t kHashBytes = 32;

    /// @param iterations Work factor; values below kMinIterations are raised
    ///        to kMinIterations.
    explicit PasswordHasher(uint32_t iterations = kDefaultIterations);

    /// Hash @p plaintext with a new random salt.
    ///
    /// Fails only with EntropyFailure or HashingFailed, both of which mean
    /// the crypto backend is unusable and must not be retried.
    [[nodiscard]] cbs::foundation::ApiResult<std::string> hash(std::string_view plaintext) const;

    /// Check @p candidate against a stored digest.
    ///
    /// @return Success, PasswordMismatch for a wrong password or a digest
    ///         that cannot be parsed, HashingFailed if the backend fails.
    [[nodiscard]] cbs::foundation::ApiResult<void> verify(std::string_view digest,
                                                          std::string_view candidate) const;

    [[nodiscard]] uint32_t iterations() const noexcept { return iterations_; }

private:
    uint32_t iterations_;
};

}  // namespace cbs::service
