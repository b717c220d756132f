#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace uplink {

inline std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

inline std::string Trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

// Splits on `sep`, trims each item and drops empty ones.
inline std::vector<std::string> SplitList(std::string_view s, char sep = ',') {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t next = s.find(sep, pos);
        if (next == std::string_view::npos) next = s.size();
        std::string item = Trim(s.substr(pos, next - pos));
        if (!item.empty()) out.push_back(std::move(item));
        pos = next + 1;
    }
    return out;
}

// Lower-cased extension including the dot ("/a/b.MP4" -> ".mp4"), or empty.
inline std::string FileExtensionLower(std::string_view path) {
    const size_t slash = path.find_last_of('/');
    const size_t dot = path.find_last_of('.');
    if (dot == std::string_view::npos) return {};
    if (slash != std::string_view::npos && dot < slash) return {};
    return ToLower(std::string(path.substr(dot)));
}

// Keeps the first and last four characters of a token for log output.
inline std::string MaskSecret(std::string_view s) {
    if (s.empty()) return "<empty>";
    if (s.size() <= 8) return "****";
    return std::string(s.substr(0, 4)) + "..." + std::string(s.substr(s.size() - 4));
}

// RFC 3986 percent-encoding of everything but unreserved characters.
inline std::string UrlEncode(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0xF]);
            out.push_back(kHex[c & 0xF]);
        }
    }
    return out;
}

inline std::string Join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i != 0) out.append(sep);
        out.append(items[i]);
    }
    return out;
}

} // namespace uplink
