#pragma once

#include "ghostledger/ledger/ExpenseEntry.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ghostledger::ledger {

// category -> subtotal. Ordered so the breakdown renders deterministically.
using CategoryTotals = std::map<std::string, double>;

// Derived view of a run. Never persisted; always recomputed from the entries.
struct Aggregate
{
    double total = 0.0;
    CategoryTotals byCategory;
};

// Categories offered in the form before the user has invented any.
inline constexpr const char* kBuiltinCategories[] = {
    "Equipment",
    "Consumable",
    "Contract",
    "Upgrade",
    "Other",
};

inline constexpr const char* kDefaultCategory = "Other";

// All functions below are pure: no side effects, inputs untouched.

[[nodiscard]] double Total(const Session& session) noexcept;

// Categories without entries are absent, never zero-valued.
[[nodiscard]] CategoryTotals ByCategory(const Session& session);

// Total(a) - Total(b); used for run-to-run comparison.
[[nodiscard]] double Diff(const Session& a, const Session& b) noexcept;

[[nodiscard]] Aggregate Summarize(const Session& session);

// Positions in `entries` of those whose timestamp falls inside the given UTC
// month, in order. Entries without a timestamp belong to no month.
[[nodiscard]] bool EntryInMonth(const ExpenseEntry& entry, int year, int month) noexcept;
[[nodiscard]] std::vector<std::size_t> EntriesInMonth(const std::vector<ExpenseEntry>& entries, int year, int month);
[[nodiscard]] double MonthTotal(const Session& session, int year, int month) noexcept;

// Years (UTC) that have at least one timestamped entry, ascending.
[[nodiscard]] std::vector<int> DistinctYears(const Session& session);

// Built-in categories first, then any other category used in the run in
// first-seen order.
[[nodiscard]] std::vector<std::string> KnownCategories(const Session& session);

// 1..5 "EMF" spend indicator shown next to the total.
[[nodiscard]] int EmfLevelFromTotal(double total) noexcept;

// "-£20.00" / "£100.00". Two decimals, sign before the currency symbol.
[[nodiscard]] std::string FormatMoney(double amount, std::string_view currency);

} // namespace ghostledger::ledger
