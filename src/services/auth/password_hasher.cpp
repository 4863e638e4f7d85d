/// @file password_hasher.cpp
/// @brief PasswordHasher implementation on OpenSSL PKCS5_PBKDF2_HMAC.

#include "cbs/service/password_hasher.hpp"

#include "crypto_utils.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <vector>

namespace cbs::service {

using cbs::foundation::ApiError;
using cbs::foundation::ApiResult;
using cbs::foundation::ErrorCode;

namespace {

constexpr std::string_view kScheme = "$pbkdf2-sha256$";

// Upper bound on a stored work factor, so a forged digest cannot pin a
// worker for minutes.
constexpr uint32_t kMaxIterations = 10'000'000;

struct ParsedDigest {
    uint32_t iterations = 0;
    std::vector<uint8_t> salt;
    std::vector<uint8_t> hash;
};

std::optional<ParsedDigest> parseDigest(std::string_view digest) {
    if (digest.substr(0, kScheme.size()) != kScheme) {
        return std::nullopt;
    }
    auto rest = digest.substr(kScheme.size());

    auto iterEnd = rest.find('$');
    if (iterEnd == std::string_view::npos) {
        return std::nullopt;
    }
    auto saltEnd = rest.find('$', iterEnd + 1);
    if (saltEnd == std::string_view::npos) {
        return std::nullopt;
    }

    ParsedDigest parsed;
    auto iterText = rest.substr(0, iterEnd);
    auto [ptr, ec] =
        std::from_chars(iterText.data(), iterText.data() + iterText.size(), parsed.iterations);
    if (ec != std::errc{} || ptr != iterText.data() + iterText.size() || parsed.iterations == 0 ||
        parsed.iterations > kMaxIterations) {
        return std::nullopt;
    }

    auto salt = detail::fromHex(rest.substr(iterEnd + 1, saltEnd - iterEnd - 1));
    auto hash = detail::fromHex(rest.substr(saltEnd + 1));
    if (!salt || !hash || salt->empty() || hash->empty()) {
        return std::nullopt;
    }
    parsed.salt = std::move(*salt);
    parsed.hash = std::move(*hash);
    return parsed;
}

}  // namespace

PasswordHasher::PasswordHasher(uint32_t iterations)
    : iterations_(std::max(iterations, kMinIterations)) {}

ApiResult<std::string> PasswordHasher::hash(std::string_view plaintext) const {
    auto salt = detail::secureRandomBytes(kSaltBytes);
    if (!salt) {
        return ApiResult<std::string>::err(
            ApiError(ErrorCode::EntropyFailure, "random source failed to produce a salt"));
    }

    auto derived = detail::pbkdf2Sha256(plaintext, *salt, iterations_, kHashBytes);
    if (!derived) {
        return ApiResult<std::string>::err(
            ApiError(ErrorCode::HashingFailed, "PBKDF2 derivation failed"));
    }

    std::string digest(kScheme);
    digest += std::to_string(iterations_);
    digest += '$';
    digest += detail::toHex(*salt);
    digest += '$';
    digest += detail::toHex(*derived);
    return ApiResult<std::string>::ok(std::move(digest));
}

ApiResult<void> PasswordHasher::verify(std::string_view digest,
                                       std::string_view candidate) const {
    auto parsed = parseDigest(digest);
    if (!parsed) {
        return ApiResult<void>::err(
            ApiError(ErrorCode::PasswordMismatch, "stored digest is not recognised"));
    }

    auto derived =
        detail::pbkdf2Sha256(candidate, parsed->salt, parsed->iterations, parsed->hash.size());
    if (!derived) {
        return ApiResult<void>::err(
            ApiError(ErrorCode::HashingFailed, "PBKDF2 derivation failed"));
    }
    if (!detail::constantTimeEqual(derived->data(), parsed->hash.data(), parsed->hash.size())) {
        return ApiResult<void>::err(
            ApiError(ErrorCode::PasswordMismatch, "password does not match"));
    }
    return ApiResult<void>::ok();
}

}  // namespace cbs::service
