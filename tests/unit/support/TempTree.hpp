#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace fileops::test {

// Throwaway directory under the system temp dir, removed on destruction.
class TempTree {
public:
    explicit TempTree(const std::string& prefix = "fileops_test") {
        std::random_device rd;
        root_ = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(rd()));
        std::filesystem::create_directories(root_);
    }

    ~TempTree() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    std::filesystem::path dir(const std::string& rel) const {
        const auto p = root_ / rel;
        std::filesystem::create_directories(p);
        return p;
    }

    std::filesystem::path file(const std::string& rel, const std::string& content = "x") const {
        const auto p = root_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p) << content;
        return p;
    }

    [[nodiscard]] bool exists(const std::string& rel) const { return std::filesystem::exists(root_ / rel); }

private:
    std::filesystem::path root_;
};

}
