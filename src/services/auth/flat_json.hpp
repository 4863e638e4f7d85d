#pragma once

/// @file flat_json.hpp
/// @brief Minimal JSON helpers for flat objects (token payloads and request
///        bodies). Nested objects and arrays are not interpreted.

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cbs::service::detail {

/// Escape a string for JSON output.
inline std::string jsonEscape(std::string_view s) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out.push_back(hexChars[(c >> 4) & 0x0F]);
                    out.push_back(hexChars[c & 0x0F]);
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

/// Position just past `"key":` (and any blanks), or npos.
inline std::size_t findValue(std::string_view json, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return pos;
    }
    pos += needle.size();
    while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\t')) {
        ++pos;
    }
    return pos;
}

/// Extract a JSON string value by key, undoing the escapes jsonEscape emits.
inline std::optional<std::string> extractJsonString(std::string_view json, std::string_view key) {
    auto pos = findValue(json, key);
    if (pos == std::string_view::npos || pos >= json.size() || json[pos] != '"') {
        return std::nullopt;
    }
    std::string out;
    for (++pos; pos < json.size(); ++pos) {
        char c = json[pos];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++pos >= json.size()) {
            return std::nullopt;
        }
        switch (json[pos]) {
            case '"':
                out.push_back('"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '/':
                out.push_back('/');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u': {
                // Only the control-character range is ever produced.
                if (pos + 4 >= json.size() || json.substr(pos + 1, 2) != "00") {
                    return std::nullopt;
                }
                unsigned value = 0;
                auto first = json.data() + pos + 3;
                auto [ptr, ec] = std::from_chars(first, first + 2, value, 16);
                if (ec != std::errc{} || ptr != first + 2) {
                    return std::nullopt;
                }
                out.push_back(static_cast<char>(value));
                pos += 4;
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return std::nullopt;
}

/// Extract a JSON integer value by key.
inline std::optional<int64_t> extractJsonInt(std::string_view json, std::string_view key) {
    auto pos = findValue(json, key);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(json.data() + pos, json.data() + json.size(), result);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return result;
}

/// True when @p json, after surrounding blanks, is a braced object.
inline bool isJsonObject(std::string_view json) {
    auto first = json.find_first_not_of(" \t\r\n");
    auto last = json.find_last_not_of(" \t\r\n");
    return first != std::string_view::npos && json[first] == '{' && json[last] == '}';
}

}  // namespace cbs::service::detail
