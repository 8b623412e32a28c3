#pragma once

// util/PathUtf8.h
// ---------------
// std::filesystem::path -> UTF-8 std::string for logs and ImGui labels.
// In C++20 path::u8string() yields std::u8string, which neither spdlog nor
// ImGui accept directly.

#include <filesystem>
#include <string>

namespace ghostledger::util {

[[nodiscard]] inline std::string PathToUtf8String(const std::filesystem::path& p)
{
#if defined(__cpp_char8_t) && (__cpp_char8_t >= 201811L)
    const std::u8string u8 = p.u8string();
    return std::string(u8.begin(), u8.end());
#else
    return p.u8string();
#endif
}

} // namespace ghostledger::util
