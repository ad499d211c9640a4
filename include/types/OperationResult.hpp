#pragma once

#include "types/OperationType.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fileops::types {

struct OperationError {
    std::string file{};
    std::string operation{};
    std::string error{};
    std::chrono::system_clock::time_point timestamp{};
    bool recoverable{true};
};

struct OperationResult {
    std::string id{};
    OperationType operation_type{OperationType::Cleanup};
    OperationStatus status{OperationStatus::Pending};
    std::chrono::system_clock::time_point start_time{}, end_time{};
    std::chrono::milliseconds duration{0};
    int64_t items_processed{0}, bytes_processed{0};
    std::vector<std::string> files_affected{};
    std::string summary{};
    nlohmann::json details = nlohmann::json::object();
    std::vector<OperationError> errors{};
    std::vector<std::string> warnings{};
};

void to_json(nlohmann::json& j, const OperationError& e);
void to_json(nlohmann::json& j, const OperationResult& r);

}
