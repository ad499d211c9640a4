#include "fs/LocalFilesystem.hpp"
#include "fs/hash.hpp"
#include "concurrency/Context.hpp"

#include <algorithm>
#include <cerrno>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

using namespace fileops::fs;
using namespace fileops::fs::model;
using namespace fileops::concurrency;

namespace {

FileInfo fromStat(const std::filesystem::path& path, const struct stat& st) {
    FileInfo info;
    info.path = path;
    info.name = path.filename().string();
    if (info.name.empty()) info.name = path.string();
    info.size = static_cast<uintmax_t>(st.st_size);
    info.mod_time = std::chrono::system_clock::from_time_t(st.st_mtim.tv_sec) +
                    std::chrono::duration_cast<std::chrono::system_clock::duration>(
                        std::chrono::nanoseconds(st.st_mtim.tv_nsec));
    info.is_dir = S_ISDIR(st.st_mode);
    info.mode = st.st_mode;
    info.uid = st.st_uid;
    info.gid = st.st_gid;
    return info;
}

std::error_code lastError() { return {errno, std::generic_category()}; }

}

LocalFilesystem::LocalFilesystem(const uintmax_t chunkSize)
    : chunkSize_(chunkSize == 0 ? config::DEFAULT_CHUNK_SIZE_BYTES : chunkSize) {}

void LocalFilesystem::walk(const Context& ctx, const std::filesystem::path& root, const Visitor& visit) {
    ctx.throwIfDone();

    struct stat st{};
    if (::lstat(root.c_str(), &st) != 0) {
        const auto ec = lastError();
        visit(root, nullptr, ec);
        return;
    }

    const auto info = fromStat(root, st);
    visit(root, &info, {});
    if (info.is_dir) walkDir(ctx, root, visit);
}

void LocalFilesystem::walkDir(const Context& ctx, const std::filesystem::path& dir, const Visitor& visit) {
    std::error_code ec;
    std::vector<std::filesystem::path> children;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        children.push_back(it->path());

    if (ec) {
        visit(dir, nullptr, ec);
        return;
    }

    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        ctx.throwIfDone();

        struct stat st{};
        if (::lstat(child.c_str(), &st) != 0) {
            const auto err = lastError();
            visit(child, nullptr, err);
            continue;
        }

        const auto info = fromStat(child, st);
        visit(child, &info, {});
        if (info.is_dir) walkDir(ctx, child, visit);
    }
}

FileInfo LocalFilesystem::stat(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
        throw std::filesystem::filesystem_error("stat", path, lastError());
    return fromStat(path, st);
}

void LocalFilesystem::remove(const std::filesystem::path& path) {
    if (!std::filesystem::remove(path))
        throw std::filesystem::filesystem_error("remove", path,
                                                std::make_error_code(std::errc::no_such_file_or_directory));
}

void LocalFilesystem::removeAll(const std::filesystem::path& path) {
    std::filesystem::remove_all(path);
}

void LocalFilesystem::move(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::filesystem::rename(from, to);
}

void LocalFilesystem::copy(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::filesystem::copy(from, to,
                          std::filesystem::copy_options::recursive |
                          std::filesystem::copy_options::overwrite_existing);
}

void LocalFilesystem::createDir(const std::filesystem::path& path) {
    std::filesystem::create_directories(path);
}

bool LocalFilesystem::isEmpty(const std::filesystem::path& path) {
    return std::filesystem::directory_iterator(path) == std::filesystem::directory_iterator{};
}

bool LocalFilesystem::exists(const std::filesystem::path& path) {
    // Anything other than "not found" (e.g. EACCES on a parent) counts as present.
    std::error_code ec;
    const bool found = std::filesystem::exists(path, ec);
    return found || static_cast<bool>(ec);
}

void LocalFilesystem::chown(const std::filesystem::path& path, const uid_t uid, const gid_t gid) {
    if (::lchown(path.c_str(), uid, gid) != 0)
        throw std::system_error(lastError(), "chown " + path.string());
}

std::string LocalFilesystem::computeHash(const std::filesystem::path& path, const std::string& algorithm) {
    return hash::file(path, algorithm, chunkSize_);
}
