#include "ghostledger/ledger/ExpenseCalculator.hpp"

#include "util/CivilTime.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <set>

namespace ghostledger::ledger {

double Total(const Session& session) noexcept
{
    double sum = 0.0;
    for (const ExpenseEntry& e : session.entries)
        sum += e.amount;
    return sum;
}

CategoryTotals ByCategory(const Session& session)
{
    CategoryTotals out;
    for (const ExpenseEntry& e : session.entries)
        out[e.category] += e.amount;
    return out;
}

double Diff(const Session& a, const Session& b) noexcept
{
    return Total(a) - Total(b);
}

Aggregate Summarize(const Session& session)
{
    Aggregate agg;
    agg.total = Total(session);
    agg.byCategory = ByCategory(session);
    return agg;
}

bool EntryInMonth(const ExpenseEntry& entry, int year, int month) noexcept
{
    if (!entry.timestampUnixSecondsUtc)
        return false;
    const util::CivilDate d = util::CivilFromUnixSeconds(*entry.timestampUnixSecondsUtc);
    return d.year == year && d.month == month;
}

std::vector<std::size_t> EntriesInMonth(const std::vector<ExpenseEntry>& entries, int year, int month)
{
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        if (EntryInMonth(entries[i], year, month))
            out.push_back(i);
    }
    return out;
}

double MonthTotal(const Session& session, int year, int month) noexcept
{
    double sum = 0.0;
    for (const ExpenseEntry& e : session.entries)
    {
        if (EntryInMonth(e, year, month))
            sum += e.amount;
    }
    return sum;
}

std::vector<int> DistinctYears(const Session& session)
{
    std::set<int> years;
    for (const ExpenseEntry& e : session.entries)
    {
        if (e.timestampUnixSecondsUtc)
            years.insert(util::CivilFromUnixSeconds(*e.timestampUnixSecondsUtc).year);
    }
    return {years.begin(), years.end()};
}

std::vector<std::string> KnownCategories(const Session& session)
{
    std::vector<std::string> out(std::begin(kBuiltinCategories), std::end(kBuiltinCategories));
    for (const ExpenseEntry& e : session.entries)
    {
        if (e.category.empty())
            continue;
        if (std::find(out.begin(), out.end(), e.category) == out.end())
            out.push_back(e.category);
    }
    return out;
}

int EmfLevelFromTotal(double total) noexcept
{
    if (total >= 2000.0) return 5;
    if (total >= 1500.0) return 4;
    if (total >= 1000.0) return 3;
    if (total >= 500.0) return 2;
    return 1;
}

std::string FormatMoney(double amount, std::string_view currency)
{
    // Round first so -0.004 prints as "£0.00", not "-£0.00".
    double rounded = std::round(amount * 100.0) / 100.0;
    if (rounded == 0.0)
        rounded = 0.0;

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", std::fabs(rounded));

    std::string out;
    out.reserve(currency.size() + 24);
    if (rounded < 0.0)
        out += '-';
    out += currency;
    out += buf;
    return out;
}

} // namespace ghostledger::ledger
