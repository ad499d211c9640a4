#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fileops::types {

// Input to a single operation run. Treated as immutable once handed to the engine.
struct OperationConfig {
    bool dry_run{false};
    bool recursive{true};
    bool follow_symlinks{false};
    std::vector<std::string> exclude_patterns{}, include_patterns{};
    int max_depth{0};
    int64_t max_file_size{0}, min_file_size{0};
    bool backup_before_delete{false};
    std::filesystem::path backup_directory{};
    int parallelism{0};
    int64_t chunk_size{0};
    std::string hash_algorithm{};
    double similarity_threshold{0.0};
    std::map<std::string, std::string> extensions{};
    std::map<std::string, std::string> custom_settings{};

    // Checks shared by every operation kind; throws std::invalid_argument.
    void validate() const;

    [[nodiscard]] std::optional<std::string> setting(const std::string& key) const;
};

void to_json(nlohmann::json& j, const OperationConfig& c);
void from_json(const nlohmann::json& j, OperationConfig& c);

}
