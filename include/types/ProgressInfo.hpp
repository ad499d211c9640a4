#pragma once

#include "types/OperationType.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fileops::types {

// Point-in-time copy of a tracker's state. Owns all of its data.
struct ProgressInfo {
    std::string id{};
    OperationType operation_type{OperationType::Cleanup};
    OperationStatus status{OperationStatus::Pending};
    std::chrono::system_clock::time_point start_time{};
    std::optional<std::chrono::system_clock::time_point> end_time{};
    std::string current_step{};
    int steps_completed{0}, total_steps{0};
    int64_t items_processed{0}, total_items{0};
    int64_t bytes_processed{0}, total_bytes{0};
    double speed{0.0}; // items per second
    std::optional<std::chrono::milliseconds> eta{};
    std::string error{};
    std::vector<std::string> errors{};
    nlohmann::json details = nlohmann::json::object();

    [[nodiscard]] double percent() const;
};

void to_json(nlohmann::json& j, const ProgressInfo& p);

}
