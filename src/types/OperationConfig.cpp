#include "types/OperationConfig.hpp"
#include "config/Config.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace fileops::types;

void OperationConfig::validate() const {
    if (parallelism < 0) throw std::invalid_argument("parallelism cannot be negative");

    if (max_file_size > 0 && min_file_size > 0 && min_file_size > max_file_size)
        throw std::invalid_argument("min file size cannot be greater than max file size");

    if (similarity_threshold < 0.0 || similarity_threshold > 1.0)
        throw std::invalid_argument("similarity threshold must be between 0.0 and 1.0");

    if (!hash_algorithm.empty() && !config::isSupportedHashAlgorithm(hash_algorithm))
        throw std::invalid_argument("unsupported hash algorithm: " + hash_algorithm);
}

std::optional<std::string> OperationConfig::setting(const std::string& key) const {
    if (const auto it = custom_settings.find(key); it != custom_settings.end()) return it->second;
    return std::nullopt;
}

void fileops::types::to_json(nlohmann::json& j, const OperationConfig& c) {
    j = {
        {"dry_run", c.dry_run},
        {"recursive", c.recursive},
        {"follow_symlinks", c.follow_symlinks},
        {"exclude_patterns", c.exclude_patterns},
        {"include_patterns", c.include_patterns},
        {"max_depth", c.max_depth},
        {"max_file_size", c.max_file_size},
        {"min_file_size", c.min_file_size},
        {"backup_before_delete", c.backup_before_delete},
        {"backup_directory", c.backup_directory.string()},
        {"parallelism", c.parallelism},
        {"chunk_size", c.chunk_size},
        {"hash_algorithm", c.hash_algorithm},
        {"similarity_threshold", c.similarity_threshold}
    };

    if (!c.extensions.empty()) j["extensions"] = c.extensions;
    if (!c.custom_settings.empty()) j["custom_settings"] = c.custom_settings;
}

void fileops::types::from_json(const nlohmann::json& j, OperationConfig& c) {
    c.dry_run = j.value("dry_run", false);
    c.recursive = j.value("recursive", true);
    c.follow_symlinks = j.value("follow_symlinks", false);
    c.exclude_patterns = j.value("exclude_patterns", std::vector<std::string>{});
    c.include_patterns = j.value("include_patterns", std::vector<std::string>{});
    c.max_depth = j.value("max_depth", 0);
    c.max_file_size = j.value("max_file_size", int64_t{0});
    c.min_file_size = j.value("min_file_size", int64_t{0});
    c.backup_before_delete = j.value("backup_before_delete", false);
    c.backup_directory = j.value("backup_directory", std::string{});
    c.parallelism = j.value("parallelism", 0);
    c.chunk_size = j.value("chunk_size", int64_t{0});
    c.hash_algorithm = j.value("hash_algorithm", std::string{});
    c.similarity_threshold = j.value("similarity_threshold", 0.0);
    c.extensions = j.value("extensions", std::map<std::string, std::string>{});

    c.custom_settings.clear();
    if (j.contains("custom_settings") && j["custom_settings"].is_object()) {
        // Non-string values (uid: 1000) are kept in their JSON text form
        for (const auto& [key, value] : j["custom_settings"].items())
            c.custom_settings[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
}
