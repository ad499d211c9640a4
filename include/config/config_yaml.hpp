#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fileops::config;

template<>
struct convert<PerformanceConfig> {
    static Node encode(const PerformanceConfig& rhs) {
        Node node;
        node["max_workers"] = rhs.max_workers;
        node["max_concurrent_operations"] = rhs.max_concurrent_operations;
        node["chunk_size"] = bytesToSizeStr(rhs.chunk_size_bytes);
        return node;
    }

    static bool decode(const Node& node, PerformanceConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_workers = node["max_workers"].as<unsigned int>(0);
        rhs.max_concurrent_operations = node["max_concurrent_operations"].as<unsigned int>(4);
        rhs.chunk_size_bytes = parseSizeToBytes(node["chunk_size"].as<std::string>("64MB"));
        return true;
    }
};

template<>
struct convert<OperationsConfig> {
    static Node encode(const OperationsConfig& rhs) {
        Node node;
        node["hash_algorithm"] = rhs.hash_algorithm;
        node["duplicate_threshold"] = rhs.duplicate_threshold;
        node["similarity_threshold"] = rhs.similarity_threshold;
        node["enable_progress_bar"] = rhs.enable_progress_bar;
        node["backup_before_delete"] = rhs.backup_before_delete;
        node["default_exclude_patterns"] = rhs.default_exclude_patterns;
        return node;
    }

    static bool decode(const Node& node, OperationsConfig& rhs) {
        if (!node.IsMap()) return false;
        const OperationsConfig defaults;
        rhs.hash_algorithm = node["hash_algorithm"].as<std::string>(defaults.hash_algorithm);
        rhs.duplicate_threshold = node["duplicate_threshold"].as<double>(defaults.duplicate_threshold);
        rhs.similarity_threshold = node["similarity_threshold"].as<double>(defaults.similarity_threshold);
        rhs.enable_progress_bar = node["enable_progress_bar"].as<bool>(defaults.enable_progress_bar);
        rhs.backup_before_delete = node["backup_before_delete"].as<bool>(defaults.backup_before_delete);
        if (node["default_exclude_patterns"])
            rhs.default_exclude_patterns = node["default_exclude_patterns"].as<std::vector<std::string>>();
        else rhs.default_exclude_patterns = defaults.default_exclude_patterns;
        return true;
    }
};

template<>
struct convert<ProgressConfig> {
    static Node encode(const ProgressConfig& rhs) {
        Node node;
        node["speed_samples"] = rhs.speed_samples;
        node["subscriber_buffer"] = rhs.subscriber_buffer;
        node["report_interval_ms"] = rhs.report_interval.count();
        node["pause_poll_interval_ms"] = rhs.pause_poll_interval.count();
        node["retention"] = minutesToDurationStr(rhs.retention);
        return node;
    }

    static bool decode(const Node& node, ProgressConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.speed_samples = node["speed_samples"].as<unsigned int>(10);
        rhs.subscriber_buffer = node["subscriber_buffer"].as<unsigned int>(10);
        rhs.report_interval = std::chrono::milliseconds(node["report_interval_ms"].as<long>(500));
        rhs.pause_poll_interval = std::chrono::milliseconds(node["pause_poll_interval_ms"].as<long>(100));
        rhs.retention = parseMinutesFromDuration(node["retention"].as<std::string>("1h"));
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["fileops"]     = to_std_string(spdlog::level::to_string_view(rhs.fileops));
        node["engine"]      = to_std_string(spdlog::level::to_string_view(rhs.engine));
        node["progress"]    = to_std_string(spdlog::level::to_string_view(rhs.progress));
        node["filesystem"]  = to_std_string(spdlog::level::to_string_view(rhs.filesystem));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.fileops = spdlog::level::from_str(node["fileops"].as<std::string>("info"));
        rhs.engine = spdlog::level::from_str(node["engine"].as<std::string>("info"));
        rhs.progress = spdlog::level::from_str(node["progress"].as<std::string>("warn"));
        rhs.filesystem = spdlog::level::from_str(node["filesystem"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        if (!rhs.log_dir.empty()) node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
