/// @file post_service.cpp
/// @brief PostService implementation.

#include "cbs/service/post_service.hpp"

#include "cbs/foundation/api_logger.hpp"
#include "cbs/service/input_validator.hpp"
#include "cbs/service/post_store.hpp"
#include "cbs/service/resource_id.hpp"

namespace cbs::service {

using cbs::foundation::ApiError;
using cbs::foundation::ApiResult;
using cbs::foundation::ErrorCode;
using cbs::foundation::LogCategory;
using cbs::foundation::LogContext;
using cbs::foundation::LogLevel;

PostService::PostService(std::shared_ptr<IPostStore> posts,
                         std::shared_ptr<const ResourceIdGenerator> ids)
    : posts_(std::move(posts)), ids_(std::move(ids)) {}

ApiResult<CreatePostResponse> PostService::createPost(const RequestContext& ctx,
                                                      const CreatePostRequest& request) {
    if (auto v = InputValidator::validatePostTitle(request.title); !v) {
        return ApiResult<CreatePostResponse>::err(ApiError(ErrorCode::InvalidArgument, v.message));
    }
    if (auto v = InputValidator::validatePostContent(request.content); !v) {
        return ApiResult<CreatePostResponse>::err(ApiError(ErrorCode::InvalidArgument, v.message));
    }

    PostRecord record;
    record.userId = ctx.userId;
    record.title = request.title;
    record.content = request.content;

    auto key = posts_->allocateRecord(std::move(record));
    if (!key) {
        return ApiResult<CreatePostResponse>::err(key.error());
    }

    auto fail = [&](const ApiError& cause) {
        if (auto discarded = posts_->discardRecord(key.value()); !discarded) {
            CBS_LOG_ERROR(LogCategory::Store,
                          "failed to discard post row " + std::to_string(key.value().value()) +
                              ": " + std::string(discarded.error().message()));
        }
        return ApiResult<CreatePostResponse>::err(cause);
    };

    auto postId = ids_->newId(ResourceType::Post, key.value().value());
    if (!postId) {
        return fail(postId.error());
    }
    if (auto attached = posts_->attachPublicIdentifier(key.value(), postId.value()); !attached) {
        return fail(attached.error());
    }

    LogContext logCtx;
    logCtx.userId = ctx.userId;
    logCtx.extra["postId"] = postId.value();
    CBS_LOG_CTX(LogLevel::Info, LogCategory::Core, "post created", logCtx);
    return ApiResult<CreatePostResponse>::ok(CreatePostResponse{std::move(postId.value())});
}

ApiResult<PostRecord> PostService::getPost(std::string_view postId) const {
    if (!ResourceIdGenerator::matches(ResourceType::Post, postId)) {
        return ApiResult<PostRecord>::err(
            ApiError(ErrorCode::InvalidArgument, "malformed post id"));
    }
    return posts_->findByPostId(postId);
}

}  // namespace cbs::service
