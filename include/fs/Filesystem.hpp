#pragma once

#include "fs/model/FileInfo.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <sys/types.h>

namespace fileops::concurrency { class Context; }

namespace fileops::fs {

// Filesystem collaborator consumed by every operation. Failures are reported by
// throwing std::filesystem::filesystem_error (std::system_error for ownership
// changes); walk() hands per-path failures to the visitor instead.
class Filesystem {
public:
    // info is null when ec is set. Throwing from the visitor aborts the walk.
    using Visitor = std::function<void(const std::filesystem::path& path,
                                       const model::FileInfo* info,
                                       const std::error_code& ec)>;

    virtual ~Filesystem() = default;

    // Pre-order, entries of each directory visited in lexical order, symlinks not followed.
    // Throws concurrency::Cancelled once ctx is done.
    virtual void walk(const concurrency::Context& ctx, const std::filesystem::path& root, const Visitor& visit) = 0;

    virtual model::FileInfo stat(const std::filesystem::path& path) = 0;
    virtual void remove(const std::filesystem::path& path) = 0;
    virtual void removeAll(const std::filesystem::path& path) = 0;
    virtual void move(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
    virtual void copy(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
    virtual void createDir(const std::filesystem::path& path) = 0;
    virtual bool isEmpty(const std::filesystem::path& path) = 0;
    virtual bool exists(const std::filesystem::path& path) = 0;
    virtual void chown(const std::filesystem::path& path, uid_t uid, gid_t gid) = 0;
    virtual std::string computeHash(const std::filesystem::path& path, const std::string& algorithm) = 0;
};

}
