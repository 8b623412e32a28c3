#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ghostledger::app {

// Parsed command-line arguments for the ghostledger executable.
//
// Notes:
//   - Option names are case-insensitive; values (paths, run names) are not.
//   - Both "--flag=value" and "--flag value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;       // --help / -h / -?
    bool resetSettings = false;  // --reset-settings
    bool summaryOnly = false;    // --summary (print totals, no window)

    std::optional<std::string> dataDir;    // --data-dir <path>
    std::optional<std::string> configDir;  // --config-dir <path>
    std::optional<std::string> logDir;     // --log-dir <path>
    std::optional<std::string> logLevel;   // --log-level <trace|debug|info|warn|error>
    std::optional<std::string> newRunName; // --new-run <name>

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

// Human-readable help text for stdout / logs.
[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace ghostledger::app
