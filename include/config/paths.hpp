#pragma once

#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace fileops::paths {

inline std::filesystem::path& testLogPathOverride() {
    static std::filesystem::path p;
    return p;
}

inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("FILEOPS_CONFIG"); env && *env) return env;
    if (const char* home = std::getenv("HOME"); home && *home) {
        const auto userConfig = std::filesystem::path(home) / ".fileops" / "config.yaml";
        if (std::filesystem::exists(userConfig)) return userConfig;
    }
    return "/etc/fileops/config.yaml";
}

inline std::filesystem::path getLogPath() {
    if (!testLogPathOverride().empty()) return testLogPathOverride();
    if (const char* env = std::getenv("FILEOPS_LOG_DIR"); env && *env) return env;
    if (::geteuid() != 0)
        if (const char* home = std::getenv("HOME"); home && *home) return std::filesystem::path(home) / ".fileops" / "logs";
    return "/var/log/fileops";
}

inline void setLogPathForTesting() {
    testLogPathOverride() = std::filesystem::temp_directory_path() / "fileops_test_logs";
}

}
