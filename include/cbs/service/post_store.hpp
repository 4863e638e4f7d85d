#pragma once

/// @file post_store.hpp
/// @brief Blog post persistence interface and in-memory implementation.

#include "cbs/foundation/api_result.hpp"
#include "cbs/foundation/types.hpp"
#include "cbs/service/auth_types.hpp"

#include <cstddef>
#include <mutex>
#include <string_view>
#include <unordered_map>

namespace cbs::service {

/// Abstract interface for post persistence, two-phase like IUserStore.
class IPostStore {
public:
    virtual ~IPostStore() = default;

    [[nodiscard]] virtual cbs::foundation::ApiResult<cbs::foundation::PostKey> allocateRecord(
        PostRecord record) = 0;

    [[nodiscard]] virtual cbs::foundation::ApiResult<void> attachPublicIdentifier(
        cbs::foundation::PostKey key, std::string postId) = 0;

    [[nodiscard]] virtual cbs::foundation::ApiResult<void> discardRecord(
        cbs::foundation::PostKey key) = 0;

    /// Completed post by public id, NotFound if absent.
    [[nodiscard]] virtual cbs::foundation::ApiResult<PostRecord> findByPostId(
        std::string_view postId) const = 0;
};

/// Thread-safe in-memory post store for tests and development.
class InMemoryPostStore : public IPostStore {
public:
    [[nodiscard]] cbs::foundation::ApiResult<cbs::foundation::PostKey> allocateRecord(
        PostRecord record) override;

    [[nodiscard]] cbs::foundation::ApiResult<void> attachPublicIdentifier(
        cbs::foundation::PostKey key, std::string postId) override;

    [[nodiscard]] cbs::foundation::ApiResult<void> discardRecord(
        cbs::foundation::PostKey key) override;

    [[nodiscard]] cbs::foundation::ApiResult<PostRecord> findByPostId(
        std::string_view postId) const override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<cbs::foundation::PostKey, PostRecord> posts_;
    uint64_t nextKey_ = 1;
};

}  // namespace cbs::service
