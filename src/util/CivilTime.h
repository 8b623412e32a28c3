#pragma once

// util/CivilTime.h
// ----------------
// UTC calendar <-> Unix seconds without touching the C locale or time zone
// database (gmtime/timegm are not portable and mktime is local time).
// Days-from-civil arithmetic on the proleptic Gregorian calendar.

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace ghostledger::util {

struct CivilDate
{
    int year = 1970;
    int month = 1; // 1..12
    int day = 1;   // 1..31
};

[[nodiscard]] constexpr bool IsLeapYear(int y) noexcept
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

[[nodiscard]] constexpr int DaysInMonth(int y, int m) noexcept
{
    constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12)
        return 0;
    return (m == 2 && IsLeapYear(y)) ? 29 : kDays[m - 1];
}

[[nodiscard]] constexpr std::int64_t DaysFromCivil(int y, int m, int d) noexcept
{
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

[[nodiscard]] constexpr CivilDate CivilFromDays(std::int64_t z) noexcept
{
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    const int y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
    return CivilDate{y, m, d};
}

[[nodiscard]] constexpr CivilDate CivilFromUnixSeconds(std::int64_t secs) noexcept
{
    std::int64_t days = secs / 86400;
    if (secs % 86400 < 0)
        --days;
    return CivilFromDays(days);
}

[[nodiscard]] constexpr std::int64_t UnixSecondsFromCivil(const CivilDate& d) noexcept
{
    return DaysFromCivil(d.year, d.month, d.day) * 86400;
}

// Strict "YYYY-MM-DD" (no surrounding whitespace, real calendar day).
[[nodiscard]] inline std::optional<CivilDate> ParseIsoDate(std::string_view s) noexcept
{
    if (s.size() != 10 || s[4] != '-' || s[7] != '-')
        return std::nullopt;

    auto digits = [&](std::size_t from, std::size_t count, int& out) {
        int v = 0;
        for (std::size_t i = from; i < from + count; ++i)
        {
            if (s[i] < '0' || s[i] > '9')
                return false;
            v = v * 10 + (s[i] - '0');
        }
        out = v;
        return true;
    };

    CivilDate d;
    if (!digits(0, 4, d.year) || !digits(5, 2, d.month) || !digits(8, 2, d.day))
        return std::nullopt;
    if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > DaysInMonth(d.year, d.month))
        return std::nullopt;
    return d;
}

[[nodiscard]] inline std::string FormatIsoDate(const CivilDate& d)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    return buf;
}

} // namespace ghostledger::util
