#include "app/App.h"

#include "ghostledger/form/FormController.hpp"
#include "ghostledger/ledger/ExpenseCalculator.hpp"
#include "ghostledger/ledger/LedgerStore.hpp"
#include "logging/Log.h"
#include "util/PathUtf8.h"

#if defined(GHOSTLEDGER_WITH_IMGUI)
  #include "ui/ImGuiLayer.h"
  #include "ui/LedgerWindow.h"
  #include "ui/SDLDetect.h"
#endif

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <string>

namespace ghostledger::app {

namespace {

void PrintUsageError(const CommandLineArgs& args)
{
    for (const auto& u : args.unknown)
        std::fprintf(stderr, "ghostledger: unrecognized or incomplete option '%s'\n", u.c_str());
    std::fprintf(stderr, "\n%s", BuildCommandLineHelpText().c_str());
}

} // namespace

int App::run(int argc, const char* const* argv)
{
    const CommandLineArgs args = ParseCommandLineArgs(argc, argv);

    if (!args.unknown.empty())
    {
        PrintUsageError(args);
        return kExitUsage;
    }
    if (args.showHelp)
    {
        std::fputs(BuildCommandLineHelpText().c_str(), stdout);
        return kExitOk;
    }

    if (!configure(args))
        return kExitFailure;

    ledger::LedgerStore store(m_paths.dataDir);

    if (args.newRunName)
    {
        ledger::StorageError err;
        if (!store.load(&err))
            spdlog::warn("app: {}", err.describe());
        if (!store.newRun(*args.newRunName, &err))
        {
            spdlog::error("app: could not start run '{}': {}", *args.newRunName, err.describe());
            std::fprintf(stderr, "ghostledger: could not start a new run: %s\n", err.describe().c_str());
            logsys::Shutdown();
            return kExitFailure;
        }
    }

    const int code = args.summaryOnly ? runSummary(store) : runWindow(store, args);

    spdlog::info("app: exit {}", code);
    logsys::Shutdown();
    return code;
}

bool App::configure(const CommandLineArgs& args)
{
    m_paths = core::ResolveDefaultAppPaths();
    if (args.dataDir) m_paths.dataDir = *args.dataDir;
    if (args.configDir) m_paths.configDir = *args.configDir;
    if (args.logDir) m_paths.logDir = *args.logDir;

    std::error_code dirEc;
    const bool dirsOk = core::EnsureAppDirectories(m_paths, &dirEc);

    // Settings: defaults first, then whatever the file provides.
    bool settingsLoaded = false;
    bool settingsWritten = false;
    std::error_code saveEc;
    if (!args.resetSettings)
        settingsLoaded = core::LoadAppSettings(m_paths.settingsFile(), m_settings);
    if (!settingsLoaded)
        settingsWritten = core::SaveAppSettings(m_paths.settingsFile(), m_settings, &saveEc);

    spdlog::level::level_enum level = spdlog::level::info;
    (void)logsys::ParseLevel(m_settings.logLevel, level);
    if (args.logLevel)
        (void)logsys::ParseLevel(*args.logLevel, level);

    logsys::Init(m_paths.logDir, level);

    if (!dirsOk)
        spdlog::warn("app: could not create user folders: {}", dirEc.message());

    spdlog::info("app: data   {}", util::PathToUtf8String(m_paths.dataDir));
    spdlog::info("app: config {}", util::PathToUtf8String(m_paths.configDir));
    spdlog::debug("app: logs   {}", util::PathToUtf8String(m_paths.logDir));

    if (args.resetSettings)
        spdlog::info("app: settings reset to defaults");
    if (!settingsLoaded && !settingsWritten)
        spdlog::warn("app: could not write {}: {}", util::PathToUtf8String(m_paths.settingsFile()), saveEc.message());

    return true;
}

int App::runSummary(ledger::LedgerStore& store)
{
    ledger::StorageError err;
    if (!store.load(&err))
    {
        std::fprintf(stderr, "ghostledger: %s\n", err.describe().c_str());
        return kExitFailure;
    }

    const ledger::Session& s = store.session();
    const ledger::Aggregate agg = ledger::Summarize(s);
    const std::string& cur = m_settings.currency;

    std::printf("%s (%s)\n", s.name.c_str(), s.id.c_str());
    std::printf("Entries: %zu\n", s.size());
    std::printf("Total: %s  EMF %d\n", ledger::FormatMoney(agg.total, cur).c_str(), ledger::EmfLevelFromTotal(agg.total));
    for (const auto& [category, subtotal] : agg.byCategory)
        std::printf("  %-12s %s\n", category.c_str(), ledger::FormatMoney(subtotal, cur).c_str());

    return kExitOk;
}

#if defined(GHOSTLEDGER_WITH_IMGUI)

int App::runWindow(ledger::LedgerStore& store, const CommandLineArgs&)
{
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
    {
        spdlog::error("app: SDL_Init failed: {}", SDL_GetError());
        return kExitFailure;
    }

    SDL_SetHint(SDL_HINT_IME_SHOW_UI, "1");

    SDL_Window* window = SDL_CreateWindow("GhostLedger",
                                          SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                          static_cast<int>(m_settings.windowWidth),
                                          static_cast<int>(m_settings.windowHeight),
                                          SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window)
    {
        spdlog::error("app: SDL_CreateWindow failed: {}", SDL_GetError());
        SDL_Quit();
        return kExitFailure;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_PRESENTVSYNC | SDL_RENDERER_ACCELERATED);
    if (!renderer)
    {
        spdlog::error("app: SDL_CreateRenderer failed: {}", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return kExitFailure;
    }

    ui::ImGuiLayer imgui;
    if (!imgui.initialize(window, renderer, m_paths.configDir, m_settings.fontScale))
    {
        spdlog::error("app: Dear ImGui init failed");
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return kExitFailure;
    }

    ui::LedgerWindow ledgerWindow(m_settings.currency, m_settings.showCategoryBreakdown);

    form::FormControllerOptions options;
    options.currency = m_settings.currency;
    options.exportDir = m_paths.exportsDir();
    form::FormController controller(store, [&](const form::DisplayMessage& msg) { ledgerWindow.onDisplay(msg); },
                                    options);
    controller.start();

    using clock = std::chrono::steady_clock;
    auto last = clock::now();

    bool running = true;
    while (running)
    {
        SDL_Event event;
        while (SDL_PollEvent(&event))
        {
            (void)imgui.processEvent(event);
            if (event.type == SDL_QUIT)
                running = false;
            if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_CLOSE &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        const auto now = clock::now();
        const float dt = std::chrono::duration<float>(now - last).count();
        last = now;

        imgui.newFrame();
        ledgerWindow.draw(dt);
        imgui.render();

        for (auto& msg : ledgerWindow.takeOutbox())
            controller.post(std::move(msg));
    }

    // Remember the window size for next time.
    int w = 0;
    int h = 0;
    SDL_GetWindowSize(window, &w, &h);
    if (w > 0 && h > 0)
    {
        m_settings.windowWidth = static_cast<std::uint32_t>(w);
        m_settings.windowHeight = static_cast<std::uint32_t>(h);
        std::error_code ec;
        if (!core::SaveAppSettings(m_paths.settingsFile(), m_settings, &ec))
            spdlog::warn("app: could not save settings: {}", ec.message());
    }

    imgui.shutdown();
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return kExitOk;
}

#else

int App::runWindow(ledger::LedgerStore&, const CommandLineArgs&)
{
    spdlog::error("app: built without GHOSTLEDGER_BUILD_GUI; only --summary is available");
    std::fputs("ghostledger: this build has no window; use --summary\n", stderr);
    return kExitFailure;
}

#endif // GHOSTLEDGER_WITH_IMGUI

} // namespace ghostledger::app
