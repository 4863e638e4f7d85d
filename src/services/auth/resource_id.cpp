/// @file resource_id.cpp
/// @brief ResourceIdGenerator: keyed Feistel permutation and base-62 rendering.

#include "cbs/service/resource_id.hpp"

#include "crypto_utils.hpp"

#include <array>

namespace cbs::service {

using cbs::foundation::ApiError;
using cbs::foundation::ApiResult;
using cbs::foundation::ErrorCode;

namespace {

bool isValidType(std::string_view type) {
    if (type.empty()) {
        return false;
    }
    for (char c : type) {
        bool lower = c >= 'a' && c <= 'z';
        bool digit = c >= '0' && c <= '9';
        if (!lower && !digit) {
            return false;
        }
    }
    return true;
}

bool isCodeChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

}  // namespace

ApiResult<ResourceIdGenerator> ResourceIdGenerator::create(std::string salt) {
    if (salt.empty()) {
        return ApiResult<ResourceIdGenerator>::err(ApiError(
            ErrorCode::ConfigurationMissing, "resource identifier salt is not configured"));
    }
    return ApiResult<ResourceIdGenerator>::ok(ResourceIdGenerator(std::move(salt)));
}

ApiResult<uint64_t> ResourceIdGenerator::permute(uint64_t counter) const {
    uint64_t left = counter / kHalfSpace;
    uint64_t right = counter % kHalfSpace;

    // Round input: "rid" | round | right half (big-endian).
    std::array<uint8_t, 8> block{'r', 'i', 'd', 0, 0, 0, 0, 0};
    for (unsigned round = 0; round < kRounds; ++round) {
        block[3] = static_cast<uint8_t>(round);
        block[4] = static_cast<uint8_t>((right >> 24) & 0xFF);
        block[5] = static_cast<uint8_t>((right >> 16) & 0xFF);
        block[6] = static_cast<uint8_t>((right >> 8) & 0xFF);
        block[7] = static_cast<uint8_t>(right & 0xFF);

        auto mac = detail::hmacSha256(salt_, block.data(), block.size());
        if (!mac) {
            return ApiResult<uint64_t>::err(
                ApiError(ErrorCode::HashingFailed, "HMAC failed in identifier permutation"));
        }
        uint64_t f = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            f = (f << 8) | (*mac)[i];
        }

        auto next = (left + f % kHalfSpace) % kHalfSpace;
        left = right;
        right = next;
    }
    return ApiResult<uint64_t>::ok(left * kHalfSpace + right);
}

ApiResult<std::string> ResourceIdGenerator::newId(std::string_view resourceType,
                                                  uint64_t counter) const {
    if (!isValidType(resourceType)) {
        return ApiResult<std::string>::err(ApiError(
            ErrorCode::InvalidArgument, "resource type must be lowercase alphanumeric"));
    }
    if (counter >= kCapacity) {
        return ApiResult<std::string>::err(ApiError(
            ErrorCode::ResourceIdExhausted,
            "record key " + std::to_string(counter) + " exceeds identifier capacity"));
    }

    auto permuted = permute(counter);
    if (permuted.hasError()) {
        return ApiResult<std::string>::err(permuted.error());
    }

    std::string code(kCodeLength, kAlphabet[0]);
    auto value = permuted.value();
    for (std::size_t i = kCodeLength; i > 0; --i) {
        code[i - 1] = kAlphabet[value % kAlphabet.size()];
        value /= kAlphabet.size();
    }

    std::string id;
    id.reserve(resourceType.size() + 1 + kCodeLength);
    id.append(resourceType);
    id.push_back('-');
    id.append(code);
    return ApiResult<std::string>::ok(std::move(id));
}

bool ResourceIdGenerator::matches(std::string_view resourceType, std::string_view id) {
    if (id.size() != resourceType.size() + 1 + kCodeLength) {
        return false;
    }
    if (id.substr(0, resourceType.size()) != resourceType || id[resourceType.size()] != '-') {
        return false;
    }
    for (char c : id.substr(resourceType.size() + 1)) {
        if (!isCodeChar(c)) {
            return false;
        }
    }
    return true;
}

}  // namespace cbs::service
