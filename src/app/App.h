#pragma once

#include "app/CommandLineArgs.h"
#include "core/AppPaths.h"
#include "core/AppSettings.h"

#include <cstdint>

namespace ghostledger::ledger { class LedgerStore; }

namespace ghostledger::app {

enum ExitCode : int
{
    kExitOk = 0,
    kExitFailure = 1,
    kExitUsage = 2,
};

class App
{
public:
    App() = default;

    // Parse args, resolve folders/settings/logging, then either print the
    // summary or open the window. Returns the process exit code.
    int run(int argc, const char* const* argv);

private:
    bool configure(const CommandLineArgs& args);
    int runSummary(ledger::LedgerStore& store);
    int runWindow(ledger::LedgerStore& store, const CommandLineArgs& args);

    core::AppPaths m_paths;
    core::AppSettings m_settings;
};

} // namespace ghostledger::app
