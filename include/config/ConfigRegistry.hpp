#pragma once

#include "config/Config.hpp"
#include "config/paths.hpp"

#include <mutex>

namespace fileops::config {

class ConfigRegistry {
public:
    // First call wins; later calls are no-ops.
    static void init(const std::filesystem::path& path = paths::getConfigPath());
    static void initDefaults();
    static const Config& get();
    static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace fileops::config
