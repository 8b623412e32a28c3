#include "core/AppSettings.h"

#include "io/AtomicFile.h"
#include "util/TextEncoding.h"

#include <algorithm>
#include <cmath>
#include <new>
#include <string>

#include <nlohmann/json.hpp>

namespace ghostledger::core {

namespace {
    // Settings JSON schema version.
    //
    // NOTE: SaveAppSettings always writes the latest schema version. Files with
    // a newer version are still read for the keys we understand.
    constexpr int kAppSettingsSchemaVersion = 1;

    constexpr std::size_t kMaxSettingsBytes = 1u * 1024u * 1024u; // 1 MiB guardrail

    std::uint32_t ClampWindowWidth(std::int64_t v) noexcept
    {
        if (v < kMinWindowWidth) return kMinWindowWidth;
        if (v > kMaxWindowWidth) return kMaxWindowWidth;
        return static_cast<std::uint32_t>(v);
    }

    std::uint32_t ClampWindowHeight(std::int64_t v) noexcept
    {
        if (v < kMinWindowHeight) return kMinWindowHeight;
        if (v > kMaxWindowHeight) return kMaxWindowHeight;
        return static_cast<std::uint32_t>(v);
    }

    float ClampFontScale(double v, float fallback) noexcept
    {
        if (!std::isfinite(v))
            return fallback;
        return static_cast<float>(std::clamp(v, static_cast<double>(kMinFontScale), static_cast<double>(kMaxFontScale)));
    }

    bool IsKnownLogLevel(const std::string& s) noexcept
    {
        return s == "trace" || s == "debug" || s == "info" || s == "warn" || s == "error";
    }

    bool IsAcceptableCurrency(const std::string& s) noexcept
    {
        if (s.size() > kMaxCurrencyBytes)
            return false;
        // Digits, signs and separators would make amounts ambiguous.
        for (const char c : s)
        {
            if ((c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.' || c == ',' || c == ' ')
                return false;
            if (static_cast<unsigned char>(c) < 0x20u)
                return false;
        }
        return true;
    }

} // namespace

bool ParseAppSettings(std::string text, AppSettings& out) noexcept
{
    // Treat empty files as "no settings".
    if (text.empty())
        return false;

    if (!util::NormalizeTextToUtf8(text))
        return false;

    try
    {
        // Allow // comments, and avoid exceptions.
        nlohmann::json j = nlohmann::json::parse(text, nullptr, false, /*ignore_comments*/ true);
        if (j.is_discarded() || !j.is_object())
            return false;

        AppSettings tmp = out;

        if (auto c = j.find("currency"); c != j.end() && c->is_string())
        {
            const std::string s = c->get<std::string>();
            if (IsAcceptableCurrency(s))
                tmp.currency = s;
        }

        if (const auto it = j.find("window"); it != j.end() && it->is_object())
        {
            if (auto w = it->find("width"); w != it->end() && w->is_number_integer())
                tmp.windowWidth = ClampWindowWidth(w->get<std::int64_t>());
            if (auto h = it->find("height"); h != it->end() && h->is_number_integer())
                tmp.windowHeight = ClampWindowHeight(h->get<std::int64_t>());
        }

        if (const auto it = j.find("ui"); it != j.end() && it->is_object())
        {
            if (auto b = it->find("showCategoryBreakdown"); b != it->end() && b->is_boolean())
                tmp.showCategoryBreakdown = b->get<bool>();
            if (auto f = it->find("fontScale"); f != it->end() && f->is_number())
                tmp.fontScale = ClampFontScale(f->get<double>(), tmp.fontScale);
        }

        if (const auto it = j.find("log"); it != j.end() && it->is_object())
        {
            if (auto l = it->find("level"); l != it->end() && l->is_string())
            {
                const std::string s = l->get<std::string>();
                if (IsKnownLogLevel(s))
                    tmp.logLevel = s;
            }
        }

        out = std::move(tmp);
        return true;
    }
    catch (const std::bad_alloc&)
    {
        return false;
    }
    catch (const nlohmann::json::exception&)
    {
        return false;
    }
}

bool LoadAppSettings(const std::filesystem::path& file, AppSettings& out) noexcept
{
    std::string text;
    std::error_code ec;
    if (!io::ReadFileToString(file, text, &ec, kMaxSettingsBytes))
        return false;

    return ParseAppSettings(std::move(text), out);
}

std::string SerializeAppSettings(const AppSettings& settings)
{
    nlohmann::json j;
    j["version"] = kAppSettingsSchemaVersion;
    j["currency"] = IsAcceptableCurrency(settings.currency) ? settings.currency : AppSettings{}.currency;
    j["window"] = {
        {"width", ClampWindowWidth(settings.windowWidth)},
        {"height", ClampWindowHeight(settings.windowHeight)},
    };
    j["ui"] = {
        {"showCategoryBreakdown", settings.showCategoryBreakdown},
        {"fontScale", ClampFontScale(settings.fontScale, 1.0f)},
    };
    j["log"] = {
        {"level", IsKnownLogLevel(settings.logLevel) ? settings.logLevel : std::string("info")},
    };

    std::string payload = j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
    payload.push_back('\n');
    return payload;
}

bool SaveAppSettings(const std::filesystem::path& file, const AppSettings& settings, std::error_code* outEc) noexcept
{
    std::string payload;
    try
    {
        payload = SerializeAppSettings(settings);
    }
    catch (const std::bad_alloc&)
    {
        if (outEc) *outEc = std::make_error_code(std::errc::not_enough_memory);
        return false;
    }

    return io::AtomicWriteFile(file, payload, outEc);
}

} // namespace ghostledger::core
