#pragma once

/// @file user_store.hpp
/// @brief User persistence interface and in-memory implementation.
///
/// Abstracts user storage so AccountService can work with any backend.
/// Record creation is split in two: allocateRecord() reserves a row and
/// returns its internal key, attachPublicIdentifier() then completes it
/// with the public id derived from that key.

#include "cbs/foundation/api_result.hpp"
#include "cbs/foundation/types.hpp"
#include "cbs/service/auth_types.hpp"

#include <cstddef>
#include <mutex>
#include <string_view>
#include <unordered_map>

namespace cbs::service {

/// Abstract interface for user persistence.
///
/// Implementations must be thread-safe when shared across threads. Every
/// call reports failure through its ApiResult; callers forward these errors
/// and never retry.
class IUserStore {
public:
    virtual ~IUserStore() = default;

    /// Completed record by username (case-sensitive), NotFound if absent.
    [[nodiscard]] virtual cbs::foundation::ApiResult<UserRecord> findCredentialByUsername(
        std::string_view username) const = 0;

    /// Completed record by public id, NotFound if absent.
    [[nodiscard]] virtual cbs::foundation::ApiResult<UserRecord> findByUserId(
        std::string_view userId) const = 0;

    /// Replace the stored password digest of @p userId.
    [[nodiscard]] virtual cbs::foundation::ApiResult<void> updateCredential(
        std::string_view userId, std::string passwordDigest) = 0;

    /// Phase one: reserve a row. AlreadyExists if the username is taken.
    [[nodiscard]] virtual cbs::foundation::ApiResult<cbs::foundation::UserKey> allocateRecord(
        UserRecord record) = 0;

    /// Phase two: attach the public id to an allocated row.
    [[nodiscard]] virtual cbs::foundation::ApiResult<void> attachPublicIdentifier(
        cbs::foundation::UserKey key, std::string userId) = 0;

    /// Drop a row whose phase two failed.
    [[nodiscard]] virtual cbs::foundation::ApiResult<void> discardRecord(
        cbs::foundation::UserKey key) = 0;
};

/// Thread-safe in-memory user store for tests and development.
///
/// Rows without a public id are reserved: they block their username but
/// are invisible to lookups.
class InMemoryUserStore : public IUserStore {
public:
    [[nodiscard]] cbs::foundation::ApiResult<UserRecord> findCredentialByUsername(
        std::string_view username) const override;

    [[nodiscard]] cbs::foundation::ApiResult<UserRecord> findByUserId(
        std::string_view userId) const override;

    [[nodiscard]] cbs::foundation::ApiResult<void> updateCredential(
        std::string_view userId, std::string passwordDigest) override;

    [[nodiscard]] cbs::foundation::ApiResult<cbs::foundation::UserKey> allocateRecord(
        UserRecord record) override;

    [[nodiscard]] cbs::foundation::ApiResult<void> attachPublicIdentifier(
        cbs::foundation::UserKey key, std::string userId) override;

    [[nodiscard]] cbs::foundation::ApiResult<void> discardRecord(
        cbs::foundation::UserKey key) override;

    /// Number of rows, reserved ones included.
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<cbs::foundation::UserKey, UserRecord> users_;
    uint64_t nextKey_ = 1;
};

}  // namespace cbs::service
