#pragma once

#include "fs/Filesystem.hpp"
#include "config/Config.hpp"

namespace fileops::fs {

class LocalFilesystem : public Filesystem {
public:
    explicit LocalFilesystem(uintmax_t chunkSize = config::DEFAULT_CHUNK_SIZE_BYTES);

    void walk(const concurrency::Context& ctx, const std::filesystem::path& root, const Visitor& visit) override;

    model::FileInfo stat(const std::filesystem::path& path) override;
    void remove(const std::filesystem::path& path) override;
    void removeAll(const std::filesystem::path& path) override;
    void move(const std::filesystem::path& from, const std::filesystem::path& to) override;
    void copy(const std::filesystem::path& from, const std::filesystem::path& to) override;
    void createDir(const std::filesystem::path& path) override;
    bool isEmpty(const std::filesystem::path& path) override;
    bool exists(const std::filesystem::path& path) override;
    void chown(const std::filesystem::path& path, uid_t uid, gid_t gid) override;
    std::string computeHash(const std::filesystem::path& path, const std::string& algorithm) override;

    [[nodiscard]] uintmax_t chunkSize() const { return chunkSize_; }

private:
    uintmax_t chunkSize_;

    void walkDir(const concurrency::Context& ctx, const std::filesystem::path& dir, const Visitor& visit);
};

}
