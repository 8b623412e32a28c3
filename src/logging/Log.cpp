#include "logging/Log.h"

#include "util/PathUtf8.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace ghostledger::logsys {

namespace {

constexpr const char* kLoggerName = "ghostledger";
constexpr std::size_t kMaxFileBytes = 1u << 20; // 1 MiB
constexpr std::size_t kMaxFiles = 4;

std::shared_ptr<spdlog::logger> g_logger;

} // namespace

void Init(const fs::path& logDir, spdlog::level::level_enum level)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string fileProblem;
    if (!logDir.empty())
    {
        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec)
        {
            fileProblem = "cannot create " + util::PathToUtf8String(logDir) + ": " + ec.message();
        }
        else
        {
            const fs::path file = logDir / "ghostledger.log";
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    util::PathToUtf8String(file), kMaxFileBytes, kMaxFiles));
            }
            catch (const spdlog::spdlog_ex& ex)
            {
                fileProblem = ex.what();
            }
        }
    }

    if (g_logger)
        spdlog::drop(kLoggerName);

    g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    g_logger->set_level(level);
    g_logger->flush_on(spdlog::level::warn);
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(g_logger);

    if (!fileProblem.empty())
        spdlog::warn("log: file sink disabled ({})", fileProblem);
    spdlog::info("Logging started");
}

bool ParseLevel(std::string_view name, spdlog::level::level_enum& out)
{
    std::string lower;
    lower.reserve(name.size());
    for (const char c : name)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    // from_str maps anything it does not know to "off".
    const spdlog::level::level_enum level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off")
        return false;

    out = level;
    return true;
}

std::shared_ptr<spdlog::logger> Get() { return g_logger; }

void Shutdown()
{
    if (g_logger)
    {
        g_logger->flush();
        spdlog::drop(kLoggerName);
        g_logger.reset();
    }
    spdlog::shutdown();
}

} // namespace ghostledger::logsys
