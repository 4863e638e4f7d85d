#pragma once

/// @file types.hpp
/// @brief Strongly typed internal record keys.

#include <cstdint>
#include <functional>

namespace cbs::foundation {

/// Tag-based strong typedef over an integral store key.
///
/// Internal keys are sequential and never leave the process; the public
/// face of a record is the identifier produced by ResourceIdGenerator.
/// Keeping the key types distinct stops a post key from being used to
/// attach an identifier to a user row.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct UserKeyTag {};
struct PostKeyTag {};

/// Auto-increment key of a user row.
using UserKey = StrongId<UserKeyTag>;

/// Auto-increment key of a post row.
using PostKey = StrongId<PostKeyTag>;

} // namespace cbs::foundation

template <typename Tag, typename T>
struct std::hash<cbs::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const cbs::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
