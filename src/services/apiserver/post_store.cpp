/// @file post_store.cpp
/// @brief InMemoryPostStore implementation.

#include "cbs/service/post_store.hpp"

#include <chrono>

namespace cbs::service {

using cbs::foundation::ApiError;
using cbs::foundation::ApiResult;
using cbs::foundation::ErrorCode;
using cbs::foundation::PostKey;

namespace {

ApiError missingRow(PostKey key) {
    return ApiError(ErrorCode::RecordNotFound,
                    "no post row with key " + std::to_string(key.value()));
}

}  // namespace

ApiResult<PostKey> InMemoryPostStore::allocateRecord(PostRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostKey key(nextKey_++);
    record.key = key;
    record.postId.clear();
    auto now = std::chrono::system_clock::now();
    record.createdAt = now;
    record.updatedAt = now;
    posts_.emplace(key, std::move(record));
    return ApiResult<PostKey>::ok(key);
}

ApiResult<void> InMemoryPostStore::attachPublicIdentifier(PostKey key, std::string postId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = posts_.find(key);
    if (it == posts_.end()) {
        return ApiResult<void>::err(missingRow(key));
    }
    it->second.postId = std::move(postId);
    it->second.updatedAt = std::chrono::system_clock::now();
    return ApiResult<void>::ok();
}

ApiResult<void> InMemoryPostStore::discardRecord(PostKey key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (posts_.erase(key) == 0) {
        return ApiResult<void>::err(missingRow(key));
    }
    return ApiResult<void>::ok();
}

ApiResult<PostRecord> InMemoryPostStore::findByPostId(std::string_view postId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, post] : posts_) {
        if (!post.postId.empty() && post.postId == postId) {
            return ApiResult<PostRecord>::ok(post);
        }
    }
    return ApiResult<PostRecord>::err(
        ApiError(ErrorCode::NotFound, "post not found: " + std::string(postId)));
}

std::size_t InMemoryPostStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return posts_.size();
}

}  // namespace cbs::service
