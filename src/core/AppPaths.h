#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace ghostledger::core {

// Per-user folders. Each one is "<root>/GhostLedger":
//   data   -> $XDG_DATA_HOME   or ~/.local/share
//   config -> $XDG_CONFIG_HOME or ~/.config
//   logs   -> $XDG_STATE_HOME  or ~/.local/state  (plus "/logs")
struct AppPaths
{
    std::filesystem::path dataDir;
    std::filesystem::path configDir;
    std::filesystem::path logDir;

    [[nodiscard]] std::filesystem::path settingsFile() const { return configDir / "settings.json"; }
    [[nodiscard]] std::filesystem::path exportsDir() const { return dataDir / "exports"; }
};

inline constexpr const char* kAppFolderName = "GhostLedger";

// Environment lookup seam (tests pass a fake).
using EnvLookupFn = const char* (*)(const char* name);

[[nodiscard]] AppPaths ResolveDefaultAppPaths(EnvLookupFn getenvFn = nullptr);

// Best-effort mkdir -p for all three. Returns false on the first failure.
[[nodiscard]] bool EnsureAppDirectories(const AppPaths& paths, std::error_code* outEc = nullptr) noexcept;

} // namespace ghostledger::core
