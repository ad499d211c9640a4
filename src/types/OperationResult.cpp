#include "types/OperationResult.hpp"

using namespace fileops::types;

void fileops::types::to_json(nlohmann::json& j, const OperationError& e) {
    j = {
        {"file", e.file},
        {"operation", e.operation},
        {"error", e.error},
        {"timestamp", std::chrono::system_clock::to_time_t(e.timestamp)},
        {"recoverable", e.recoverable}
    };
}

void fileops::types::to_json(nlohmann::json& j, const OperationResult& r) {
    j = {
        {"id", r.id},
        {"operation_type", to_string(r.operation_type)},
        {"status", to_string(r.status)},
        {"start_time", std::chrono::system_clock::to_time_t(r.start_time)},
        {"end_time", std::chrono::system_clock::to_time_t(r.end_time)},
        {"duration_ms", r.duration.count()},
        {"items_processed", r.items_processed},
        {"bytes_processed", r.bytes_processed},
        {"files_affected", r.files_affected},
        {"summary", r.summary},
        {"details", r.details},
        {"errors", r.errors}
    };

    if (!r.warnings.empty()) j["warnings"] = r.warnings;
}
