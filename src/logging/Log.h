#pragma once
#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace ghostledger::logsys {
    // Rotating file in `logDir` (ghostledger.log, 1 MiB * 4) plus a colored
    // stderr sink. Falls back to stderr only if the folder can't be opened.
    // Installs the result as spdlog's default logger.
    void Init(const std::filesystem::path& logDir, spdlog::level::level_enum level = spdlog::level::info);

    // "info", "warn", ... Unknown names leave `out` untouched and return false.
    [[nodiscard]] bool ParseLevel(std::string_view name, spdlog::level::level_enum& out);

    std::shared_ptr<spdlog::logger> Get();  // "ghostledger"
    void Shutdown();
}
