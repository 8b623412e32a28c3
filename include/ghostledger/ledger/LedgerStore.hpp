#pragma once

#include "ghostledger/ledger/ExpenseEntry.hpp"
#include "ghostledger/ledger/LedgerErrors.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ghostledger::ledger {

namespace fs = std::filesystem;

// Seam for the atomic writer so tests can simulate a full disk.
using AtomicWriteFn = std::function<bool(const fs::path& target, std::string_view bytes, std::error_code* outEc)>;

// Seam for "now" (Unix seconds, UTC).
using ClockFn = std::function<std::int64_t()>;

enum class MutationStatus : std::uint8_t
{
    Ok = 0,
    Invalid,       // ValidationError; nothing touched
    StorageFailed, // StorageError; memory and disk still hold the last good run
};

// Entry rules shared by the store and the form: non-blank label, finite amount.
[[nodiscard]] bool ValidateEntry(const ExpenseEntry& entry, ValidationError* outError = nullptr);

// Owns the data folder and the active run.
//
// Layout under `dataDir`:
//   ledger.json          -> { "active": "<id>" }
//   sessions/<id>.json   -> one file per run
//
// Every mutating call writes the whole run atomically before it returns and only
// then updates the in-memory copy, so memory never runs ahead of disk.
class LedgerStore
{
public:
    explicit LedgerStore(fs::path dataDir);
    LedgerStore(fs::path dataDir, AtomicWriteFn writer, ClockFn clock);

    [[nodiscard]] const fs::path& dataDir() const noexcept { return m_dataDir; }
    [[nodiscard]] fs::path sessionsDir() const { return m_dataDir / "sessions"; }
    [[nodiscard]] fs::path indexPath() const { return m_dataDir / "ledger.json"; }
    [[nodiscard]] fs::path sessionPath(std::string_view id) const;

    // Read the active run from disk.
    //
    //  - Nothing on disk yet: a fresh empty run, returns true.
    //  - Unreadable/corrupt: returns false with `outError`; the store then holds a
    //    fresh empty run under a new id so the damaged file is never overwritten.
    [[nodiscard]] bool load(StorageError* outError = nullptr);

    [[nodiscard]] const Session& session() const noexcept { return m_session; }

    [[nodiscard]] MutationStatus append(const ExpenseEntry& entry,
                                        ValidationError* outInvalid = nullptr,
                                        StorageError* outStorage = nullptr);

    [[nodiscard]] MutationStatus removeAt(std::size_t index,
                                          ValidationError* outInvalid = nullptr,
                                          StorageError* outStorage = nullptr);

    // Empty the active run and persist it. Idempotent.
    [[nodiscard]] bool clear(StorageError* outError = nullptr);

    // Start a new empty run and make it active. Blank name -> "Run <n>".
    [[nodiscard]] bool newRun(std::string name, StorageError* outError = nullptr);

    // Make an existing run the active one (reopen an older run).
    [[nodiscard]] bool activate(std::string_view id, StorageError* outError = nullptr);

    // All runs on disk, newest first. Files that fail to decode are skipped and
    // reported through `outSkipped`.
    [[nodiscard]] bool listSessions(std::vector<SessionSummary>& out,
                                    std::vector<StorageError>* outSkipped = nullptr) const;

    // Read any run by id (the active one is served from memory).
    [[nodiscard]] bool loadSession(std::string_view id, Session& out, StorageError* outError = nullptr) const;

private:
    [[nodiscard]] bool readSessionFile(const fs::path& path, Session& out, StorageError* outError) const;
    [[nodiscard]] bool persist(const Session& candidate, StorageError* outError);
    void writeIndexIfStale(const std::string& activeId);

    [[nodiscard]] Session makeFreshSession(std::string name) const;
    [[nodiscard]] std::string makeUniqueId(std::int64_t nowUtc) const;
    [[nodiscard]] std::vector<std::string> sessionIdsOnDisk() const;

    fs::path m_dataDir;
    AtomicWriteFn m_writer;
    ClockFn m_clock;

    Session m_session;

    // Active id last written to ledger.json ("" = unknown / not yet written).
    std::string m_indexedId;
};

} // namespace ghostledger::ledger
