#pragma once

#include <sys/types.h>
#include <grp.h>
#include <pwd.h>

#include <charconv>
#include <mutex>
#include <optional>
#include <string>

namespace fileops::util {

namespace detail {
// getpwnam/getgrnam share static buffers, so lookups are serialized.
inline std::mutex& accountsMutex() {
    static std::mutex m;
    return m;
}

inline std::optional<unsigned long> parseId(const std::string& s) {
    unsigned long v{};
    const auto* end = s.data() + s.size();
    if (s.empty() || std::from_chars(s.data(), end, v).ptr != end) return std::nullopt;
    return v;
}
}

// Accepts a user name or a numeric uid.
inline std::optional<uid_t> uid_for_user(const std::string& user) {
    std::scoped_lock lock(detail::accountsMutex());
    if (const passwd* pw = ::getpwnam(user.c_str())) return pw->pw_uid;
    if (const auto id = detail::parseId(user)) return static_cast<uid_t>(*id);
    return std::nullopt;
}

inline std::optional<gid_t> primary_gid_for_user(const std::string& user) {
    std::scoped_lock lock(detail::accountsMutex());
    if (const passwd* pw = ::getpwnam(user.c_str())) return pw->pw_gid;
    if (const auto id = detail::parseId(user); id)
        if (const passwd* pw = ::getpwuid(static_cast<uid_t>(*id))) return pw->pw_gid;
    return std::nullopt;
}

inline std::optional<gid_t> gid_for_group(const std::string& group) {
    std::scoped_lock lock(detail::accountsMutex());
    if (const struct group* gr = ::getgrnam(group.c_str())) return gr->gr_gid;
    if (const auto id = detail::parseId(group)) return static_cast<gid_t>(*id);
    return std::nullopt;
}

}
