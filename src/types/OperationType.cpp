#include "types/OperationType.hpp"

#include <stdexcept>

using namespace fileops::types;

std::string fileops::types::to_string(const OperationType& type) {
    switch (type) {
        case OperationType::Cleanup: return "cleanup";
        case OperationType::Deduplication: return "deduplication";
        case OperationType::Consolidation: return "consolidation";
        case OperationType::Similarity: return "similarity";
        case OperationType::Organization: return "organization";
        case OperationType::Ownership: return "ownership";
        case OperationType::Pipeline: return "pipeline";
        default: throw std::invalid_argument("Unknown operation type");
    }
}

OperationType fileops::types::operationTypeFromString(const std::string& str) {
    if (str == "cleanup") return OperationType::Cleanup;
    if (str == "deduplication") return OperationType::Deduplication;
    if (str == "consolidation") return OperationType::Consolidation;
    if (str == "similarity") return OperationType::Similarity;
    if (str == "organization") return OperationType::Organization;
    if (str == "ownership") return OperationType::Ownership;
    if (str == "pipeline") return OperationType::Pipeline;
    throw std::invalid_argument("Unknown operation type: " + str);
}

const std::vector<OperationType>& fileops::types::allOperationTypes() {
    static const std::vector<OperationType> all = {
        OperationType::Cleanup, OperationType::Deduplication, OperationType::Consolidation,
        OperationType::Similarity, OperationType::Organization, OperationType::Ownership,
        OperationType::Pipeline
    };
    return all;
}

std::string fileops::types::to_string(const OperationStatus& status) {
    switch (status) {
        case OperationStatus::Pending: return "pending";
        case OperationStatus::Running: return "running";
        case OperationStatus::Paused: return "paused";
        case OperationStatus::Completed: return "completed";
        case OperationStatus::Failed: return "failed";
        case OperationStatus::Cancelled: return "cancelled";
        default: throw std::invalid_argument("Unknown operation status");
    }
}

OperationStatus fileops::types::operationStatusFromString(const std::string& str) {
    if (str == "pending") return OperationStatus::Pending;
    if (str == "running") return OperationStatus::Running;
    if (str == "paused") return OperationStatus::Paused;
    if (str == "completed") return OperationStatus::Completed;
    if (str == "failed") return OperationStatus::Failed;
    if (str == "cancelled") return OperationStatus::Cancelled;
    throw std::invalid_argument("Unknown operation status: " + str);
}
