#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace fileops::config {

inline std::chrono::minutes parseMinutesFromDuration(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Duration string cannot be empty");

    const auto unit = str.back();
    if (unit == 'd' || unit == 'D') return std::chrono::minutes(std::stoul(str.substr(0, str.size() - 1)) * 24 * 60);
    if (unit == 'h' || unit == 'H') return std::chrono::minutes(std::stoul(str.substr(0, str.size() - 1)) * 60);
    if (unit == 'm' || unit == 'M') return std::chrono::minutes(std::stoul(str.substr(0, str.size() - 1)));

    // Assume minutes if no suffix
    return std::chrono::minutes(std::stoul(str));
}

inline uintmax_t parseSizeToBytes(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Size string cannot be empty");

    const auto endsWith = [&](const std::string& suffix) {
        return str.size() > suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    if (endsWith("GB") || endsWith("gb")) return std::stoull(str.substr(0, str.size() - 2)) * 1024 * 1024 * 1024;
    if (endsWith("MB") || endsWith("mb")) return std::stoull(str.substr(0, str.size() - 2)) * 1024 * 1024;
    if (endsWith("KB") || endsWith("kb")) return std::stoull(str.substr(0, str.size() - 2)) * 1024;
    if (endsWith("G") || endsWith("g")) return std::stoull(str.substr(0, str.size() - 1)) * 1024 * 1024 * 1024;
    if (endsWith("M") || endsWith("m")) return std::stoull(str.substr(0, str.size() - 1)) * 1024 * 1024;
    if (endsWith("K") || endsWith("k")) return std::stoull(str.substr(0, str.size() - 1)) * 1024;
    if (endsWith("B") || endsWith("b")) return std::stoull(str.substr(0, str.size() - 1));

    // Assume MB if no suffix
    return std::stoull(str) * 1024 * 1024;
}

inline std::string bytesToSizeStr(const uintmax_t bytes) {
    if (bytes != 0 && bytes % (1024 * 1024 * 1024) == 0) return std::to_string(bytes / (1024 * 1024 * 1024)) + "GB";
    if (bytes % (1024 * 1024) == 0) return std::to_string(bytes / (1024 * 1024)) + "MB";
    if (bytes % 1024 == 0) return std::to_string(bytes / 1024) + "KB";
    return std::to_string(bytes) + "B";
}

inline std::string minutesToDurationStr(const std::chrono::minutes& minutes) {
    const auto m = minutes.count();
    if (m != 0 && m % (24 * 60) == 0) return std::to_string(m / (24 * 60)) + "d";
    if (m != 0 && m % 60 == 0) return std::to_string(m / 60) + "h";
    return std::to_string(m) + "m";
}

}
