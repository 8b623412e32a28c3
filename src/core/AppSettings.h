#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace ghostledger::core {

// -----------------------------------------------------------------------------
// Window sizing guardrails
// -----------------------------------------------------------------------------
inline constexpr std::uint32_t kMinWindowWidth  = 640;
inline constexpr std::uint32_t kMinWindowHeight = 360;

// 8K desktop-ish upper bounds (guard against accidental huge values).
inline constexpr std::uint32_t kMaxWindowWidth  = 7680;
inline constexpr std::uint32_t kMaxWindowHeight = 4320;

inline constexpr float kMinFontScale = 0.5f;
inline constexpr float kMaxFontScale = 3.0f;

// Longest currency symbol we accept (bytes of UTF-8).
inline constexpr std::size_t kMaxCurrencyBytes = 8;

// Persisted per-user preferences.
//
// Stored in:
//   <config dir>/settings.json
struct AppSettings
{
    // Prefix shown before amounts and accepted by the amount field.
    std::string currency = "\xC2\xA3"; // "£"

    std::uint32_t windowWidth = 1280;
    std::uint32_t windowHeight = 720;

    bool showCategoryBreakdown = true;
    float fontScale = 1.0f;

    // spdlog level name: trace|debug|info|warn|error
    std::string logLevel = "info";
};

// Returns true if a settings file existed and was successfully parsed.
// On failure, `out` is left unchanged (callers should initialize defaults first).
// Unknown or out-of-range keys fall back to the value already in `out`.
[[nodiscard]] bool LoadAppSettings(const std::filesystem::path& file, AppSettings& out) noexcept;

// Parse settings text (already read from disk). Same rules as LoadAppSettings.
[[nodiscard]] bool ParseAppSettings(std::string text, AppSettings& out) noexcept;

[[nodiscard]] std::string SerializeAppSettings(const AppSettings& settings);

// Returns true on success. Written atomically.
[[nodiscard]] bool SaveAppSettings(const std::filesystem::path& file,
                                   const AppSettings& settings,
                                   std::error_code* outEc = nullptr) noexcept;

} // namespace ghostledger::core
