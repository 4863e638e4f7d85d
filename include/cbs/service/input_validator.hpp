#pragma once

/// @file input_validator.hpp
/// @brief Request field validation for account and post operations.
///
/// Length limits are counted in bytes. Every check is a pure function of
/// its argument.

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace cbs::service {

/// Result of a validation check.
struct ValidationResult {
    bool valid;
    std::string message;

    explicit operator bool() const noexcept { return valid; }

    static ValidationResult ok() { return {true, {}}; }
    static ValidationResult fail(std::string msg) {
        return {false, std::move(msg)};
    }
};

/// Stateless input validation utilities.
class InputValidator {
public:
    // -- Limits ---------------------------------------------------------------

    static constexpr std::size_t kMinUsernameLength = 4;
    static constexpr std::size_t kMaxUsernameLength = 32;

    static constexpr std::size_t kMinPasswordLength = 8;
    static constexpr std::size_t kMaxPasswordLength = 64;

    static constexpr std::size_t kMaxNicknameLength = 32;

    static constexpr std::size_t kMaxEmailLength = 254;     // RFC 5321
    static constexpr std::size_t kMaxLocalPartLength = 64;  // RFC 5321
    static constexpr std::size_t kMaxDomainLabelLength = 63;

    static constexpr std::size_t kMinPhoneDigits = 5;
    static constexpr std::size_t kMaxPhoneDigits = 15;      // E.164

    static constexpr std::size_t kMaxTitleLength = 256;

    // -- Username -------------------------------------------------------------

    /// 4-32 characters of [A-Za-z0-9_.-].
    [[nodiscard]] static inline ValidationResult validateUsername(
        std::string_view username) {
        if (username.empty()) {
            return ValidationResult::fail("username cannot be empty");
        }
        if (username.size() < kMinUsernameLength ||
            username.size() > kMaxUsernameLength) {
            return ValidationResult::fail(
                "username must be between 4 and 32 characters");
        }
        for (char c : username) {
            if (std::isalnum(static_cast<unsigned char>(c))) continue;
            if (c == '_' || c == '.' || c == '-') continue;
            return ValidationResult::fail(
                "username contains invalid character");
        }
        return ValidationResult::ok();
    }

    // -- Password -------------------------------------------------------------

    /// 8-64 characters; content is not restricted.
    [[nodiscard]] static inline ValidationResult validatePassword(
        std::string_view password) {
        if (password.empty()) {
            return ValidationResult::fail("password cannot be empty");
        }
        if (password.size() < kMinPasswordLength ||
            password.size() > kMaxPasswordLength) {
            return ValidationResult::fail(
                "password must be between 8 and 64 characters");
        }
        return ValidationResult::ok();
    }

    // -- Nickname -------------------------------------------------------------

    /// Optional; when given, at most 32 characters.
    [[nodiscard]] static inline ValidationResult validateNickname(
        std::string_view nickname) {
        if (nickname.size() > kMaxNicknameLength) {
            return ValidationResult::fail(
                "nickname cannot exceed 32 characters");
        }
        return ValidationResult::ok();
    }

    // -- Email ----------------------------------------------------------------

    /// Validate email against an RFC 5322 subset: one '@', dot-atom local
    /// part, dotted domain of alphanumeric/hyphen labels.
    [[nodiscard]] static inline ValidationResult validateEmail(
        std::string_view email) {
        if (email.empty()) {
            return ValidationResult::fail("email cannot be empty");
        }
        if (email.size() > kMaxEmailLength) {
            return ValidationResult::fail("email exceeds maximum length");
        }

        auto atPos = email.find('@');
        if (atPos == std::string_view::npos || atPos == 0 ||
            email.find('@', atPos + 1) != std::string_view::npos) {
            return ValidationResult::fail(
                "email must contain exactly one '@'");
        }

        auto local = email.substr(0, atPos);
        auto domain = email.substr(atPos + 1);

        if (local.size() > kMaxLocalPartLength ||
            local.front() == '.' || local.back() == '.' ||
            local.find("..") != std::string_view::npos) {
            return ValidationResult::fail("email local part is invalid");
        }
        for (char c : local) {
            if (std::isalnum(static_cast<unsigned char>(c))) continue;
            if (isLocalSpecialChar(c)) continue;
            return ValidationResult::fail(
                "email local part contains invalid character");
        }

        if (domain.find('.') == std::string_view::npos) {
            return ValidationResult::fail(
                "email domain must have at least one dot");
        }
        std::size_t labelStart = 0;
        while (labelStart <= domain.size()) {
            auto dotPos = domain.find('.', labelStart);
            auto labelEnd =
                (dotPos == std::string_view::npos) ? domain.size() : dotPos;
            auto label = domain.substr(labelStart, labelEnd - labelStart);

            if (label.empty() || label.size() > kMaxDomainLabelLength ||
                label.front() == '-' || label.back() == '-') {
                return ValidationResult::fail("email domain label is invalid");
            }
            for (char c : label) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
                    return ValidationResult::fail(
                        "email domain contains invalid character");
                }
            }
            if (dotPos == std::string_view::npos) break;
            labelStart = labelEnd + 1;
        }

        return ValidationResult::ok();
    }

    // -- Phone ----------------------------------------------------------------

    /// Digits with an optional leading '+', 5-15 digits.
    [[nodiscard]] static inline ValidationResult validatePhone(
        std::string_view phone) {
        if (phone.empty()) {
            return ValidationResult::fail("phone number cannot be empty");
        }
        auto digits = phone.front() == '+' ? phone.substr(1) : phone;
        if (digits.size() < kMinPhoneDigits || digits.size() > kMaxPhoneDigits) {
            return ValidationResult::fail(
                "phone number must have between 5 and 15 digits");
        }
        for (char c : digits) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return ValidationResult::fail(
                    "phone number contains invalid character");
            }
        }
        return ValidationResult::ok();
    }

    // -- Post -----------------------------------------------------------------

    [[nodiscard]] static inline ValidationResult validatePostTitle(
        std::string_view title) {
        if (title.empty()) {
            return ValidationResult::fail("title cannot be empty");
        }
        if (title.size() > kMaxTitleLength) {
            return ValidationResult::fail("title cannot exceed 256 characters");
        }
        return ValidationResult::ok();
    }

    [[nodiscard]] static inline ValidationResult validatePostContent(
        std::string_view content) {
        if (content.empty()) {
            return ValidationResult::fail("content cannot be empty");
        }
        return ValidationResult::ok();
    }

private:
    /// Characters allowed in the email local part (RFC 5322 atext specials).
    static constexpr bool isLocalSpecialChar(char c) noexcept {
        switch (c) {
            case '.': case '!': case '#': case '$': case '%': case '&':
            case '\'': case '*': case '+': case '/': case '=': case '?':
            case '^': case '_': case '`': case '{': case '|': case '}':
            case '~': case '-':
                return true;
            default:
                return false;
        }
    }
};

} // namespace cbs::service
