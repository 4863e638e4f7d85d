#pragma once

/// @file post_service.hpp
/// @brief Blog post creation behind the authentication gate.

#include "cbs/foundation/api_result.hpp"
#include "cbs/service/auth_types.hpp"
#include "cbs/service/http_types.hpp"

#include <memory>
#include <string_view>

namespace cbs::service {

class IPostStore;
class ResourceIdGenerator;

/// Post service.
///
/// createPost() follows the same two-phase pattern as user creation: the
/// row is allocated, its `post-xxxxxx` id is derived from the allocated key
/// and attached, and the row is discarded if that second phase fails.
class PostService {
public:
    PostService(std::shared_ptr<IPostStore> posts, std::shared_ptr<const ResourceIdGenerator> ids);

    [[nodiscard]] cbs::foundation::ApiResult<CreatePostResponse> createPost(
        const RequestContext& ctx, const CreatePostRequest& request);

    [[nodiscard]] cbs::foundation::ApiResult<PostRecord> getPost(std::string_view postId) const;

private:
    std::shared_ptr<IPostStore> posts_;
    std::shared_ptr<const ResourceIdGenerator> ids_;
};

}  // namespace cbs::service
