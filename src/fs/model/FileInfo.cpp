#include "fs/model/FileInfo.hpp"

#include <nlohmann/json.hpp>

using namespace fileops::fs::model;

void fileops::fs::model::to_json(nlohmann::json& j, const FileInfo& info) {
    j = {
        {"path", info.path.string()},
        {"name", info.name},
        {"size", info.size},
        {"mod_time", std::chrono::system_clock::to_time_t(info.mod_time)},
        {"is_dir", info.is_dir},
        {"mode", info.mode},
        {"uid", info.uid},
        {"gid", info.gid}
    };
}
