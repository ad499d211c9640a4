#include "types/ProgressInfo.hpp"

#include <algorithm>

using namespace fileops::types;

double ProgressInfo::percent() const {
    if (total_items <= 0) return 0.0;
    return std::clamp(100.0 * static_cast<double>(items_processed) / static_cast<double>(total_items), 0.0, 100.0);
}

void fileops::types::to_json(nlohmann::json& j, const ProgressInfo& p) {
    j = {
        {"id", p.id},
        {"operation_type", to_string(p.operation_type)},
        {"status", to_string(p.status)},
        {"start_time", std::chrono::system_clock::to_time_t(p.start_time)},
        {"current_step", p.current_step},
        {"steps_completed", p.steps_completed},
        {"total_steps", p.total_steps},
        {"items_processed", p.items_processed},
        {"total_items", p.total_items},
        {"bytes_processed", p.bytes_processed},
        {"total_bytes", p.total_bytes},
        {"speed", p.speed}
    };

    if (p.end_time) j["end_time"] = std::chrono::system_clock::to_time_t(*p.end_time);
    if (p.eta) j["estimated_eta_ms"] = p.eta->count();
    if (!p.error.empty()) j["error"] = p.error;
    if (!p.details.empty()) j["details"] = p.details;
}
