#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace fileops::config {

constexpr static uintmax_t DEFAULT_CHUNK_SIZE_BYTES = 64 * 1024 * 1024; // 64MB

struct PerformanceConfig {
    unsigned int max_workers = 0; // 0 = hardware concurrency
    unsigned int max_concurrent_operations = 4;
    uintmax_t chunk_size_bytes = DEFAULT_CHUNK_SIZE_BYTES;
};

struct OperationsConfig {
    std::string hash_algorithm = "blake2b";
    double duplicate_threshold = 0.99;
    double similarity_threshold = 0.85;
    bool enable_progress_bar = true;
    bool backup_before_delete = false;
    std::vector<std::string> default_exclude_patterns = {".git", ".svn", "node_modules", "__pycache__"};
};

struct ProgressConfig {
    unsigned int speed_samples = 10;
    unsigned int subscriber_buffer = 10;
    std::chrono::milliseconds report_interval{500};
    std::chrono::milliseconds pause_poll_interval{100};
    std::chrono::minutes retention{60};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum fileops    = spdlog::level::info;   // Startup, shutdown, CLI level events
    spdlog::level::level_enum engine     = spdlog::level::info;   // Operation start/finish/failure
    spdlog::level::level_enum progress   = spdlog::level::warn;   // Tracker registry housekeeping
    spdlog::level::level_enum filesystem = spdlog::level::warn;   // Walk and removal failures
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;
    LogLevelsConfig levels;
};

struct Config {
    PerformanceConfig performance;
    OperationsConfig operations;
    ProgressConfig progress;
    LoggingConfig logging;

    // Throws std::invalid_argument on the first offending value.
    void validate() const;

    [[nodiscard]] unsigned int effectiveMaxWorkers() const;
};

Config loadConfig(const std::filesystem::path& path);

bool isSupportedHashAlgorithm(const std::string& name);
const std::vector<std::string>& supportedHashAlgorithms();

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const PerformanceConfig& c);
void from_json(const nlohmann::json& j, PerformanceConfig& c);
void to_json(nlohmann::json& j, const OperationsConfig& c);
void from_json(const nlohmann::json& j, OperationsConfig& c);
void to_json(nlohmann::json& j, const ProgressConfig& c);
void from_json(const nlohmann::json& j, ProgressConfig& c);

} // namespace fileops::config
