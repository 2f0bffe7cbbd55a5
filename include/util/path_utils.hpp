#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace elemental {

inline bool IsDevPath(std::string_view s) {
    return s.rfind("/dev/", 0) == 0;
}

inline bool HasPrefix(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

inline bool HasSuffix(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

inline std::string TrimSpace(std::string_view s) {
    const auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
    };
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return std::string(s.substr(b, e - b));
}

inline std::vector<std::string> SplitString(std::string_view s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.emplace_back(s.substr(start));
            break;
        }
        out.emplace_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

// Lexical cleanup of a slash separated path: collapses "//", drops "."
// elements and resolves ".." against preceding elements. Rooted paths never
// climb above "/".
inline std::string CleanPath(std::string_view p) {
    if (p.empty()) return ".";
    const bool rooted = p.front() == '/';
    std::vector<std::string> parts;
    for (auto& elem : SplitString(p, '/')) {
        if (elem.empty() || elem == ".") continue;
        if (elem == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!rooted) {
                parts.push_back(elem);
            }
            continue;
        }
        parts.push_back(std::move(elem));
    }
    std::string out = rooted ? "/" : "";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += '/';
        out += parts[i];
    }
    if (out.empty()) return ".";
    return out;
}

inline std::string JoinPath(std::string_view a, std::string_view b) {
    if (a.empty()) return CleanPath(b);
    if (b.empty()) return CleanPath(a);
    return CleanPath(std::string(a) + "/" + std::string(b));
}

template <typename... Rest>
std::string JoinPath(std::string_view a, std::string_view b, Rest&&... rest) {
    return JoinPath(JoinPath(a, b), std::forward<Rest>(rest)...);
}

inline std::string DirName(std::string_view p) {
    const std::string clean = CleanPath(p);
    const size_t pos = clean.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return clean.substr(0, pos);
}

inline std::string BaseName(std::string_view p) {
    const std::string clean = CleanPath(p);
    if (clean == "/") return "/";
    const size_t pos = clean.rfind('/');
    return pos == std::string::npos ? clean : clean.substr(pos + 1);
}

// Normalize tar path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeTarPath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

} // namespace elemental
