#include "core/AppPaths.h"

#include <cstdlib>

namespace fs = std::filesystem;

namespace ghostledger::core {

namespace {

fs::path EnvPath(EnvLookupFn lookup, const char* name)
{
    const char* v = lookup(name);
    if (!v || !*v)
        return {};

    // XDG: relative paths are invalid and must be ignored.
    fs::path p(v);
    if (!p.is_absolute())
        return {};
    return p;
}

} // namespace

AppPaths ResolveDefaultAppPaths(EnvLookupFn getenvFn)
{
    EnvLookupFn lookup = getenvFn;
    if (!lookup)
        lookup = [](const char* n) -> const char* { return std::getenv(n); };

    AppPaths p;

#if defined(_WIN32)
    fs::path local = EnvPath(lookup, "LOCALAPPDATA");
    fs::path roaming = EnvPath(lookup, "APPDATA");
    if (local.empty()) local = fs::path(".");
    if (roaming.empty()) roaming = local;

    p.dataDir = local / kAppFolderName;
    p.configDir = roaming / kAppFolderName;
    p.logDir = p.dataDir / "logs";
#else
    fs::path home = EnvPath(lookup, "HOME");
    if (home.empty()) home = fs::path(".");

    fs::path data = EnvPath(lookup, "XDG_DATA_HOME");
    fs::path conf = EnvPath(lookup, "XDG_CONFIG_HOME");
    fs::path state = EnvPath(lookup, "XDG_STATE_HOME");

    p.dataDir = (data.empty() ? home / ".local" / "share" : data) / kAppFolderName;
    p.configDir = (conf.empty() ? home / ".config" : conf) / kAppFolderName;
    p.logDir = (state.empty() ? home / ".local" / "state" : state) / kAppFolderName / "logs";
#endif

    return p;
}

bool EnsureAppDirectories(const AppPaths& paths, std::error_code* outEc) noexcept
{
    for (const fs::path* dir : {&paths.dataDir, &paths.configDir, &paths.logDir})
    {
        if (dir->empty())
            continue;

        std::error_code ec;
        fs::create_directories(*dir, ec);
        if (ec)
        {
            if (outEc) *outEc = ec;
            return false;
        }
    }
    if (outEc) outEc->clear();
    return true;
}

} // namespace ghostledger::core
