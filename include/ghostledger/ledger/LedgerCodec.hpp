#pragma once

#include "ghostledger/ledger/ExpenseEntry.hpp"

#include <string>
#include <string_view>

namespace ghostledger::ledger {

// On-disk JSON layout of one run file (sessions/<id>.json):
//
//   {
//     "format": "ghostledger_session",
//     "version": 1,
//     "session": { "id": "...", "name": "...", "createdUnixSecondsUtc": 0 },
//     "entries": [ { "label": "Sage", "amount": -20.0, "category": "Consumable",
//                    "timestamp": 1760745600 }, ... ]
//   }
//
// "timestamp" is omitted for entries without one.
inline constexpr const char* kSessionFormatName = "ghostledger_session";
inline constexpr int kSessionFormatVersion = 1;

// The ledger index (ledger.json) names the active run.
inline constexpr const char* kIndexFormatName = "ghostledger_index";
inline constexpr int kIndexFormatVersion = 1;

[[nodiscard]] std::string EncodeSession(const Session& session);

// Strict decode: any malformed entry rejects the whole file, so a damaged run
// is never half-loaded. `out` is left unchanged on failure.
[[nodiscard]] bool DecodeSession(std::string_view text,
                                 Session& out,
                                 std::string* outError = nullptr) noexcept;

[[nodiscard]] std::string EncodeLedgerIndex(std::string_view activeSessionId);

[[nodiscard]] bool DecodeLedgerIndex(std::string_view text,
                                     std::string& outActiveSessionId,
                                     std::string* outError = nullptr) noexcept;

// Session ids become file names; only [A-Za-z0-9._-] is accepted, no leading dot.
[[nodiscard]] bool IsValidSessionId(std::string_view id) noexcept;

} // namespace ghostledger::ledger
