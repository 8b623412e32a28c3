#include "app/CommandLineArgs.h"

#include <cctype>
#include <sstream>
#include <string_view>

namespace ghostledger::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (const char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

// Split "--opt=value" into name and value. Only the name is lowered.
void SplitOption(std::string_view raw, std::string& outName, std::optional<std::string>& outValue)
{
    const std::size_t eq = raw.find('=');
    if (eq == std::string_view::npos || raw.size() < 2 || raw[0] != '-')
    {
        outName = ToLower(raw);
        outValue.reset();
        return;
    }
    outName = ToLower(raw.substr(0, eq));
    outValue = std::string(raw.substr(eq + 1));
}

[[nodiscard]] bool IsLogLevelName(const std::string& v)
{
    return v == "trace" || v == "debug" || v == "info" || v == "warn" || v == "error";
}

} // namespace

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    CommandLineArgs out;
    if (argc <= 1 || !argv)
        return out;

    for (int i = 1; i < argc; ++i)
    {
        if (!argv[i])
            continue;
        const std::string_view raw(argv[i]);
        if (raw.empty())
            continue;

        std::string arg;
        std::optional<std::string> inlineValue;
        SplitOption(raw, arg, inlineValue);

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        // Simple flags (an inline value makes them unknown)
        if (!inlineValue)
        {
            if (arg == "--reset-settings" || arg == "--reset-config") { out.resetSettings = true; continue; }
            if (arg == "--summary") { out.summaryOnly = true; continue; }
        }

        // Options with values
        const auto takeValue = [&](std::optional<std::string>& dst) {
            if (inlineValue) {
                if (inlineValue->empty()) {
                    out.unknown.emplace_back(raw);
                    return;
                }
                dst = *inlineValue;
                return;
            }
            if (i + 1 >= argc || !argv[i + 1]) {
                out.unknown.emplace_back(raw);
                return;
            }
            dst = std::string(argv[i + 1]);
            ++i;
        };

        if (arg == "--data-dir") { takeValue(out.dataDir); continue; }
        if (arg == "--config-dir") { takeValue(out.configDir); continue; }
        if (arg == "--log-dir") { takeValue(out.logDir); continue; }
        if (arg == "--new-run") { takeValue(out.newRunName); continue; }

        if (arg == "--log-level")
        {
            std::optional<std::string> level;
            takeValue(level);
            if (level)
            {
                std::string lowered = ToLower(*level);
                if (lowered == "warning")
                    lowered = "warn";
                if (IsLogLevelName(lowered))
                    out.logLevel = std::move(lowered);
                else
                    out.unknown.emplace_back(raw);
            }
            continue;
        }

        out.unknown.emplace_back(raw);
    }

    return out;
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream ss;
    ss << "GhostLedger command line options:\n\n";
    ss << "  --help, -h                 Show this help.\n";
    ss << "  --data-dir <path>          Folder holding ledger.json and sessions/.\n";
    ss << "  --config-dir <path>        Folder holding settings.json.\n";
    ss << "  --log-dir <path>           Folder for ghostledger.log.\n";
    ss << "  --log-level <level>        trace | debug | info | warn | error.\n";
    ss << "  --reset-settings           Rewrite settings.json with defaults.\n";
    ss << "  --new-run <name>           Start a new run before opening.\n";
    ss << "  --summary                  Print the active run's totals and exit.\n\n";
    ss << "Options accept either \"--opt value\" or \"--opt=value\".\n";
    return ss.str();
}

} // namespace ghostledger::app
