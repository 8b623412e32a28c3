// tests/test_civil_time.cpp

#include <doctest/doctest.h>

#include "util/CivilTime.h"

using namespace ghostledger::util;

static_assert(DaysFromCivil(1970, 1, 1) == 0);
static_assert(CivilFromDays(0).year == 1970);
static_assert(DaysInMonth(2024, 2) == 29);
static_assert(DaysInMonth(2100, 2) == 28);
static_assert(DaysInMonth(2000, 2) == 29);

TEST_CASE("CivilTime: known Unix timestamps")
{
    CHECK(UnixSecondsFromCivil({2025, 10, 18}) == 1760745600);
    CHECK(UnixSecondsFromCivil({2024, 2, 29}) == 1709164800);
    CHECK(UnixSecondsFromCivil({1969, 12, 31}) == -86400);

    const CivilDate d = CivilFromUnixSeconds(1761955199); // 2025-10-31 23:59:59
    CHECK(d.year == 2025);
    CHECK(d.month == 10);
    CHECK(d.day == 31);

    const CivilDate before = CivilFromUnixSeconds(-1);
    CHECK(before.year == 1969);
    CHECK(before.month == 12);
    CHECK(before.day == 31);
}

TEST_CASE("CivilTime: days round-trip across leap years")
{
    for (std::int64_t day = -800; day < 20000; day += 37)
    {
        const CivilDate c = CivilFromDays(day);
        CHECK(DaysFromCivil(c.year, c.month, c.day) == day);
    }
}

TEST_CASE("CivilTime: ParseIsoDate is strict")
{
    const auto ok = ParseIsoDate("2024-02-29");
    REQUIRE(ok.has_value());
    CHECK(ok->year == 2024);
    CHECK(ok->month == 2);
    CHECK(ok->day == 29);

    for (const char* bad : {"", "2024-2-29", "2023-02-29", "2024-13-01", "2024-00-10", "2024-04-31",
                            "2024/04/01", " 2024-04-01", "2024-04-01T", "abcd-ef-gh"})
    {
        INFO(bad);
        CHECK_FALSE(ParseIsoDate(bad).has_value());
    }
}

TEST_CASE("CivilTime: FormatIsoDate pads fields")
{
    CHECK(FormatIsoDate({2025, 1, 5}) == "2025-01-05");
    CHECK(FormatIsoDate(CivilFromUnixSeconds(1760788800)) == "2025-10-18");
}
