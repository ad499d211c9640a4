#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fnmatch.h>
#include <string>
#include <vector>

namespace fileops::util {

// Shell-style match of a single name; '*' and '?' never cross '/'.
inline bool globMatch(const std::string& pattern, const std::string& name) {
    return ::fnmatch(pattern.c_str(), name.c_str(), FNM_PATHNAME) == 0;
}

inline bool anyGlobMatch(const std::vector<std::string>& patterns, const std::string& name) {
    return std::ranges::any_of(patterns, [&](const auto& p) { return globMatch(p, name); });
}

inline std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

inline bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

inline std::string baseName(const std::filesystem::path& p) {
    auto name = p.filename().string();
    if (name.empty()) name = p.parent_path().filename().string();
    return name;
}

// "/a/b/" -> "/a/b", so children produced by walk() have it as their parent_path()
inline std::filesystem::path trimTrailingSeparator(std::filesystem::path p) {
    while (!p.has_filename() && p.has_relative_path()) p = p.parent_path();
    return p;
}

inline bool isHiddenName(const std::string& name) {
    return !name.empty() && name[0] == '.' && name != "." && name != "..";
}

}
