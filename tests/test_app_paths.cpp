// tests/test_app_paths.cpp

#include <doctest/doctest.h>

#include "core/AppPaths.h"

#include "test_support/TempDir.h"

#include <cstdio>
#include <filesystem>
#include <map>
#include <string>

namespace fs = std::filesystem;
using namespace ghostledger::core;

#if !defined(_WIN32)

namespace {

// Fake environment for ResolveDefaultAppPaths (plain function pointer seam).
std::map<std::string, std::string>& FakeEnv()
{
    static std::map<std::string, std::string> env;
    return env;
}

const char* FakeGetenv(const char* name)
{
    const auto& env = FakeEnv();
    const auto it = env.find(name);
    return it == env.end() ? nullptr : it->second.c_str();
}

} // namespace

TEST_CASE("AppPaths: HOME fallbacks")
{
    FakeEnv() = {{"HOME", "/home/ghost"}};

    const AppPaths p = ResolveDefaultAppPaths(&FakeGetenv);
    CHECK(p.dataDir == fs::path("/home/ghost/.local/share/GhostLedger"));
    CHECK(p.configDir == fs::path("/home/ghost/.config/GhostLedger"));
    CHECK(p.logDir == fs::path("/home/ghost/.local/state/GhostLedger/logs"));
    CHECK(p.settingsFile() == fs::path("/home/ghost/.config/GhostLedger/settings.json"));
    CHECK(p.exportsDir() == fs::path("/home/ghost/.local/share/GhostLedger/exports"));
}

TEST_CASE("AppPaths: XDG variables win over HOME")
{
    FakeEnv() = {{"HOME", "/home/ghost"},
                 {"XDG_DATA_HOME", "/xdg/data"},
                 {"XDG_CONFIG_HOME", "/xdg/config"},
                 {"XDG_STATE_HOME", "/xdg/state"}};

    const AppPaths p = ResolveDefaultAppPaths(&FakeGetenv);
    CHECK(p.dataDir == fs::path("/xdg/data/GhostLedger"));
    CHECK(p.configDir == fs::path("/xdg/config/GhostLedger"));
    CHECK(p.logDir == fs::path("/xdg/state/GhostLedger/logs"));
}

TEST_CASE("AppPaths: relative or empty XDG values are ignored")
{
    FakeEnv() = {{"HOME", "/home/ghost"}, {"XDG_DATA_HOME", "relative/data"}, {"XDG_CONFIG_HOME", ""}};

    const AppPaths p = ResolveDefaultAppPaths(&FakeGetenv);
    CHECK(p.dataDir == fs::path("/home/ghost/.local/share/GhostLedger"));
    CHECK(p.configDir == fs::path("/home/ghost/.config/GhostLedger"));
}

TEST_CASE("AppPaths: no HOME falls back to the working directory")
{
    FakeEnv().clear();

    const AppPaths p = ResolveDefaultAppPaths(&FakeGetenv);
    CHECK(p.dataDir == fs::path("./.local/share/GhostLedger"));
}

#endif

TEST_CASE("AppPaths: EnsureAppDirectories creates every folder")
{
    ghostledger::test::TempDir tmp("paths");

    AppPaths p;
    p.dataDir = tmp.path() / "data" / "GhostLedger";
    p.configDir = tmp.path() / "config" / "GhostLedger";
    p.logDir = tmp.path() / "state" / "GhostLedger" / "logs";

    std::error_code ec;
    REQUIRE(EnsureAppDirectories(p, &ec));
    CHECK_FALSE(ec);
    CHECK(fs::is_directory(p.dataDir));
    CHECK(fs::is_directory(p.configDir));
    CHECK(fs::is_directory(p.logDir));

    // A regular file where a folder should be.
    {
        std::error_code wec;
        fs::create_directories(tmp.path() / "blocked", wec);
    }
    const fs::path file = tmp.path() / "blocked" / "file";
    {
        std::FILE* f = std::fopen(file.c_str(), "wb");
        REQUIRE(f != nullptr);
        std::fclose(f);
    }
    p.dataDir = file / "GhostLedger";
    CHECK_FALSE(EnsureAppDirectories(p, &ec));
    CHECK(ec);
}
