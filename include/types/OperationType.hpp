#pragma once

#include <string>
#include <vector>

namespace fileops::types {

enum class OperationType { Cleanup, Deduplication, Consolidation, Similarity, Organization, Ownership, Pipeline };

enum class OperationStatus { Pending, Running, Paused, Completed, Failed, Cancelled };

std::string to_string(const OperationType& type);
OperationType operationTypeFromString(const std::string& str);
const std::vector<OperationType>& allOperationTypes();

std::string to_string(const OperationStatus& status);
OperationStatus operationStatusFromString(const std::string& str);

inline bool isTerminal(const OperationStatus s) {
    return s == OperationStatus::Completed || s == OperationStatus::Failed || s == OperationStatus::Cancelled;
}

}
