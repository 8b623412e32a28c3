#pragma once

// util/TextEncoding.h
// -------------------
// Normalizes hand-edited text files (settings.json, run files) before parsing.
//
//   - A UTF-8 BOM (EF BB BF) is stripped; strict JSON parsers reject it.
//   - UTF-16 (either BOM) is rejected: GhostLedger only writes UTF-8, and a
//     UTF-16 file in the data folder was produced by some other tool.

#include <cstddef>
#include <string>
#include <string_view>

namespace ghostledger::util {

// Returns false if `bytes` is not something we can treat as UTF-8.
inline bool NormalizeTextToUtf8(std::string& bytes) noexcept
{
    const auto at = [&](std::size_t i) { return static_cast<unsigned char>(bytes[i]); };

    if (bytes.size() >= 3 && at(0) == 0xEFu && at(1) == 0xBBu && at(2) == 0xBFu)
    {
        bytes.erase(0, 3);
        return true;
    }

    if (bytes.size() >= 2 && ((at(0) == 0xFFu && at(1) == 0xFEu) || (at(0) == 0xFEu && at(1) == 0xFFu)))
        return false;

    return true;
}

// Well-formed UTF-8: no overlongs, no surrogates, nothing past U+10FFFF.
// The JSON writer would otherwise replace bad bytes with U+FFFD.
inline bool IsValidUtf8(std::string_view s) noexcept
{
    std::size_t i = 0;
    while (i < s.size())
    {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80u)
        {
            ++i;
            continue;
        }

        std::size_t len = 0;
        unsigned char lo = 0x80u;
        unsigned char hi = 0xBFu;
        if (c >= 0xC2u && c <= 0xDFu)      len = 2;
        else if (c == 0xE0u)               { len = 3; lo = 0xA0u; }
        else if (c == 0xEDu)               { len = 3; hi = 0x9Fu; }
        else if (c >= 0xE1u && c <= 0xEFu) len = 3;
        else if (c == 0xF0u)               { len = 4; lo = 0x90u; }
        else if (c >= 0xF1u && c <= 0xF3u) len = 4;
        else if (c == 0xF4u)               { len = 4; hi = 0x8Fu; }
        else
            return false;

        if (i + len > s.size())
            return false;

        // Only the second byte has the narrowed range.
        const auto b1 = static_cast<unsigned char>(s[i + 1]);
        if (b1 < lo || b1 > hi)
            return false;
        for (std::size_t k = 2; k < len; ++k)
        {
            const auto b = static_cast<unsigned char>(s[i + k]);
            if (b < 0x80u || b > 0xBFu)
                return false;
        }
        i += len;
    }
    return true;
}

} // namespace ghostledger::util
