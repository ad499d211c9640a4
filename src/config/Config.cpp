#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/util.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace fileops::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) return cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument("Failed to parse config file " + path.string() + ": " + e.what());
    }

    if (!root || root.IsNull()) return cfg;

    if (auto node = root["performance"]) YAML::convert<PerformanceConfig>::decode(node, cfg.performance);
    if (auto node = root["operations"]) YAML::convert<OperationsConfig>::decode(node, cfg.operations);
    if (auto node = root["progress"]) YAML::convert<ProgressConfig>::decode(node, cfg.progress);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    cfg.validate();
    return cfg;
}

const std::vector<std::string>& supportedHashAlgorithms() {
    static const std::vector<std::string> algorithms = {
        "md5", "sha1", "sha256", "sha512", "blake2b", "xxhash64", "crc32"
    };
    return algorithms;
}

bool isSupportedHashAlgorithm(const std::string& name) {
    const auto& algos = supportedHashAlgorithms();
    return std::ranges::find(algos, name) != algos.end();
}

void Config::validate() const {
    if (performance.max_concurrent_operations == 0)
        throw std::invalid_argument("performance.max_concurrent_operations must be greater than zero");
    if (performance.chunk_size_bytes == 0)
        throw std::invalid_argument("performance.chunk_size must be greater than zero");

    if (!isSupportedHashAlgorithm(operations.hash_algorithm))
        throw std::invalid_argument("operations.hash_algorithm '" + operations.hash_algorithm + "' is not supported");
    if (operations.duplicate_threshold < 0.0 || operations.duplicate_threshold > 1.0)
        throw std::invalid_argument("operations.duplicate_threshold must be between 0 and 1");
    if (operations.similarity_threshold < 0.0 || operations.similarity_threshold > 1.0)
        throw std::invalid_argument("operations.similarity_threshold must be between 0 and 1");

    if (progress.speed_samples == 0)
        throw std::invalid_argument("progress.speed_samples must be greater than zero");
    if (progress.subscriber_buffer == 0)
        throw std::invalid_argument("progress.subscriber_buffer must be greater than zero");
    if (progress.report_interval.count() <= 0)
        throw std::invalid_argument("progress.report_interval_ms must be greater than zero");
    if (progress.pause_poll_interval.count() <= 0)
        throw std::invalid_argument("progress.pause_poll_interval_ms must be greater than zero");
}

unsigned int Config::effectiveMaxWorkers() const {
    if (performance.max_workers > 0) return performance.max_workers;
    return std::max(1u, std::thread::hardware_concurrency());
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"performance", c.performance},
        {"operations", c.operations},
        {"progress", c.progress},
        {"logging", {
            {"log_dir", c.logging.log_dir.string()},
            {"console_log_level", spdlog::level::to_string_view(c.logging.levels.console_log_level).data()},
            {"file_log_level", spdlog::level::to_string_view(c.logging.levels.file_log_level).data()}
        }}
    };
}

void to_json(nlohmann::json& j, const PerformanceConfig& c) {
    j = {
        {"max_workers", c.max_workers},
        {"max_concurrent_operations", c.max_concurrent_operations},
        {"chunk_size", bytesToSizeStr(c.chunk_size_bytes)}
    };
}

void from_json(const nlohmann::json& j, PerformanceConfig& c) {
    c.max_workers = j.value("max_workers", 0u);
    c.max_concurrent_operations = j.value("max_concurrent_operations", 4u);
    c.chunk_size_bytes = parseSizeToBytes(j.value("chunk_size", std::string("64MB")));
}

void to_json(nlohmann::json& j, const OperationsConfig& c) {
    j = {
        {"hash_algorithm", c.hash_algorithm},
        {"duplicate_threshold", c.duplicate_threshold},
        {"similarity_threshold", c.similarity_threshold},
        {"enable_progress_bar", c.enable_progress_bar},
        {"backup_before_delete", c.backup_before_delete},
        {"default_exclude_patterns", c.default_exclude_patterns}
    };
}

void from_json(const nlohmann::json& j, OperationsConfig& c) {
    const OperationsConfig defaults;
    c.hash_algorithm = j.value("hash_algorithm", defaults.hash_algorithm);
    c.duplicate_threshold = j.value("duplicate_threshold", defaults.duplicate_threshold);
    c.similarity_threshold = j.value("similarity_threshold", defaults.similarity_threshold);
    c.enable_progress_bar = j.value("enable_progress_bar", defaults.enable_progress_bar);
    c.backup_before_delete = j.value("backup_before_delete", defaults.backup_before_delete);
    c.default_exclude_patterns = j.value("default_exclude_patterns", defaults.default_exclude_patterns);
}

void to_json(nlohmann::json& j, const ProgressConfig& c) {
    j = {
        {"speed_samples", c.speed_samples},
        {"subscriber_buffer", c.subscriber_buffer},
        {"report_interval_ms", c.report_interval.count()},
        {"pause_poll_interval_ms", c.pause_poll_interval.count()},
        {"retention", minutesToDurationStr(c.retention)}
    };
}

void from_json(const nlohmann::json& j, ProgressConfig& c) {
    c.speed_samples = j.value("speed_samples", 10u);
    c.subscriber_buffer = j.value("subscriber_buffer", 10u);
    c.report_interval = std::chrono::milliseconds(j.value("report_interval_ms", 500L));
    c.pause_poll_interval = std::chrono::milliseconds(j.value("pause_poll_interval_ms", 100L));
    c.retention = parseMinutesFromDuration(j.value("retention", std::string("1h")));
}

}
