#include <gtest/gtest.h>
#include "log/Registry.hpp"
#include "config/paths.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace fileops::log;

namespace {

std::string slurp(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}

TEST(LogRegistryTest, NamedLoggersAreRegistered) {
    ASSERT_TRUE(Registry::isInitialized());
    EXPECT_EQ(Registry::fileops()->name(), "fileops");
    EXPECT_EQ(Registry::engine()->name(), "engine");
    EXPECT_EQ(Registry::progress()->name(), "progress");
    EXPECT_EQ(Registry::fs()->name(), "filesystem");
    EXPECT_THROW(Registry::get("no-such-logger"), std::runtime_error);
}

TEST(LogRegistryTest, AuditLinesGoToAuditLog) {
    Registry::audit()->info("[test] removed /tmp/audit-marker");
    Registry::audit()->flush();

    const auto content = slurp(fileops::paths::getLogPath() / "audit.log");
    EXPECT_NE(content.find("/tmp/audit-marker"), std::string::npos);
}

TEST(LogRegistryTest, ReopenMainLogAfterExternalRotation) {
    const auto dir = fileops::paths::getLogPath();
    const auto main = dir / "fileops.log";
    const auto moved = dir / "fileops.log.moved";

    std::filesystem::remove(moved);
    std::filesystem::rename(main, moved);

    Registry::reopenMainLog();
    Registry::fileops()->warn("[test] after reopen");
    Registry::fileops()->flush();

    ASSERT_TRUE(std::filesystem::exists(main));
    EXPECT_NE(slurp(main).find("after reopen"), std::string::npos);
    std::filesystem::remove(moved);
}
