#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <sys/types.h>
#include <nlohmann/json_fwd.hpp>

namespace fileops::fs::model {

struct FileInfo {
    std::filesystem::path path{};
    std::string name{};
    uintmax_t size{0};
    std::chrono::system_clock::time_point mod_time{};
    bool is_dir{false};
    mode_t mode{0};
    uid_t uid{0};
    gid_t gid{0};

    [[nodiscard]] bool isHidden() const { return !name.empty() && name[0] == '.' && name != "." && name != ".."; }
};

void to_json(nlohmann::json& j, const FileInfo& info);

}
