#pragma once

#include "fs/LocalFilesystem.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <system_error>

namespace fileops::test {

// LocalFilesystem that counts destructive calls and fails on demand.
class RecordingFilesystem : public fs::LocalFilesystem {
public:
    std::atomic<int> removeCalls{0}, chownCalls{0}, visited{0};

    // Runs before each walk entry reaches the operation
    std::function<void(const std::filesystem::path&)> onVisit;

    void failRemoveOf(const std::filesystem::path& p) {
        std::scoped_lock lock(mu_);
        failRemove_.insert(p);
    }

    void failChownOf(const std::filesystem::path& p) {
        std::scoped_lock lock(mu_);
        failChown_.insert(p);
    }

    void walk(const concurrency::Context& ctx, const std::filesystem::path& root, const Visitor& visit) override {
        LocalFilesystem::walk(ctx, root, [&](const std::filesystem::path& p, const fs::model::FileInfo* info,
                                             const std::error_code& ec) {
            ++visited;
            if (onVisit) onVisit(p);
            visit(p, info, ec);
        });
    }

    void remove(const std::filesystem::path& path) override {
        ++removeCalls;
        if (shouldFail(failRemove_, path))
            throw std::filesystem::filesystem_error("remove", path, std::make_error_code(std::errc::permission_denied));
        LocalFilesystem::remove(path);
    }

    void chown(const std::filesystem::path& path, const uid_t uid, const gid_t gid) override {
        ++chownCalls;
        if (shouldFail(failChown_, path))
            throw std::system_error(std::make_error_code(std::errc::operation_not_permitted), "lchown " + path.string());
        LocalFilesystem::chown(path, uid, gid);
    }

private:
    std::mutex mu_;
    std::set<std::filesystem::path> failRemove_, failChown_;

    bool shouldFail(const std::set<std::filesystem::path>& set, const std::filesystem::path& p) {
        std::scoped_lock lock(mu_);
        return set.contains(p);
    }
};

}
