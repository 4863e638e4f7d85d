/// @file user_store.cpp
/// @brief InMemoryUserStore implementation.

#include "cbs/service/user_store.hpp"

#include <chrono>

namespace cbs::service {

using cbs::foundation::ApiError;
using cbs::foundation::ApiResult;
using cbs::foundation::ErrorCode;
using cbs::foundation::UserKey;

namespace {

ApiError notFound(std::string_view what) {
    return ApiError(ErrorCode::NotFound, "user not found: " + std::string(what));
}

}  // namespace

ApiResult<UserRecord> InMemoryUserStore::findCredentialByUsername(
    std::string_view username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, user] : users_) {
        if (user.username == username && !user.userId.empty()) {
            return ApiResult<UserRecord>::ok(user);
        }
    }
    return ApiResult<UserRecord>::err(notFound(username));
}

ApiResult<UserRecord> InMemoryUserStore::findByUserId(std::string_view userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, user] : users_) {
        if (!user.userId.empty() && user.userId == userId) {
            return ApiResult<UserRecord>::ok(user);
        }
    }
    return ApiResult<UserRecord>::err(notFound(userId));
}

ApiResult<void> InMemoryUserStore::updateCredential(std::string_view userId,
                                                    std::string passwordDigest) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, user] : users_) {
        if (!user.userId.empty() && user.userId == userId) {
            user.passwordDigest = std::move(passwordDigest);
            user.updatedAt = std::chrono::system_clock::now();
            return ApiResult<void>::ok();
        }
    }
    return ApiResult<void>::err(notFound(userId));
}

ApiResult<UserKey> InMemoryUserStore::allocateRecord(UserRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, user] : users_) {
        if (user.username == record.username) {
            return ApiResult<UserKey>::err(
                ApiError(ErrorCode::AlreadyExists, "username already exists"));
        }
    }
    UserKey key(nextKey_++);
    record.key = key;
    record.userId.clear();
    auto now = std::chrono::system_clock::now();
    record.createdAt = now;
    record.updatedAt = now;
    users_.emplace(key, std::move(record));
    return ApiResult<UserKey>::ok(key);
}

ApiResult<void> InMemoryUserStore::attachPublicIdentifier(UserKey key, std::string userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(key);
    if (it == users_.end()) {
        return ApiResult<void>::err(ApiError(
            ErrorCode::RecordNotFound, "no user row with key " + std::to_string(key.value())));
    }
    it->second.userId = std::move(userId);
    it->second.updatedAt = std::chrono::system_clock::now();
    return ApiResult<void>::ok();
}

ApiResult<void> InMemoryUserStore::discardRecord(UserKey key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (users_.erase(key) == 0) {
        return ApiResult<void>::err(ApiError(
            ErrorCode::RecordNotFound, "no user row with key " + std::to_string(key.value())));
    }
    return ApiResult<void>::ok();
}

std::size_t InMemoryUserStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.size();
}

}  // namespace cbs::service
