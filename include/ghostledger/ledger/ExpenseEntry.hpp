#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ghostledger::ledger {

// One recorded expense (or income, when amount > 0).
//
// Entries are immutable once appended to a run; the only mutation a run
// supports afterwards is deleting an entry.
struct ExpenseEntry
{
    std::string label;
    double amount = 0.0;
    std::string category;

    // When the entry was created (Unix seconds, UTC). Empty if unknown.
    std::optional<std::int64_t> timestampUnixSecondsUtc;

    friend bool operator==(const ExpenseEntry&, const ExpenseEntry&) = default;
};

// A run: one chronological list of entries tracked together.
struct Session
{
    // Filesystem-safe, sortable by creation (e.g. "run-20261018-153000").
    std::string id;
    std::string name;
    std::int64_t createdUnixSecondsUtc = 0;

    std::vector<ExpenseEntry> entries;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }

    friend bool operator==(const Session&, const Session&) = default;
};

// Cheap listing row for the run selector.
struct SessionSummary
{
    std::string id;
    std::string name;
    std::int64_t createdUnixSecondsUtc = 0;
    std::size_t entryCount = 0;
    double total = 0.0;
};

} // namespace ghostledger::ledger
