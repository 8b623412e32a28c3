#pragma once

#include "ghostledger/ledger/ExpenseEntry.hpp"
#include "ghostledger/ledger/LedgerErrors.hpp"

#include <filesystem>
#include <string>

namespace ghostledger::ledger {

// RFC 4180 CSV of a run:
//
//   Date,Category,Label,Amount
//   2026-10-18,Consumable,Sage,-20.00
//   ...
//   ,,Total,80.00
//
// Amounts carry no currency symbol so spreadsheets read them as numbers.
[[nodiscard]] std::string FormatCsv(const Session& session);

// Writes FormatCsv(session) atomically to `target`.
[[nodiscard]] bool ExportCsv(const Session& session,
                             const std::filesystem::path& target,
                             StorageError* outError = nullptr);

} // namespace ghostledger::ledger
