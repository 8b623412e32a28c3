#include "ghostledger/ledger/LedgerStore.hpp"

#include "ghostledger/ledger/ExpenseCalculator.hpp"
#include "ghostledger/ledger/LedgerCodec.hpp"
#include "io/AtomicFile.h"
#include "util/CivilTime.h"
#include "util/PathUtf8.h"
#include "util/TextEncoding.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <utility>

#include <spdlog/spdlog.h>

namespace ghostledger::ledger {

namespace {

constexpr std::size_t kMaxSessionFileBytes = 8u * 1024u * 1024u;
constexpr std::size_t kMaxIndexFileBytes = 64u * 1024u;

[[nodiscard]] bool IsBlank(std::string_view s) noexcept
{
    return std::all_of(s.begin(), s.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    });
}

[[nodiscard]] std::int64_t SystemNowUtc()
{
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

[[nodiscard]] StorageError MakeStorageError(StorageErrorKind kind,
                                            const fs::path& path,
                                            std::string message,
                                            std::error_code ec = {})
{
    StorageError e;
    e.kind = kind;
    e.path = path;
    e.message = std::move(message);
    e.ec = ec;
    return e;
}

void Report(StorageError* out, StorageError e)
{
    spdlog::warn("ledger: {}", e.describe());
    if (out)
        *out = std::move(e);
}

[[nodiscard]] bool IsDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

// Orders ids with digit runs compared as numbers, so "run-...-10" follows
// "run-...-9" and a bare "run-..." precedes its "-2" sibling.
[[nodiscard]] bool NaturalLess(std::string_view a, std::string_view b) noexcept
{
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() && j < b.size())
    {
        if (IsDigit(a[i]) && IsDigit(b[j]))
        {
            while (i < a.size() && a[i] == '0') ++i;
            while (j < b.size() && b[j] == '0') ++j;
            const std::size_t ai = i;
            const std::size_t bj = j;
            while (i < a.size() && IsDigit(a[i])) ++i;
            while (j < b.size() && IsDigit(b[j])) ++j;

            const std::string_view na = a.substr(ai, i - ai);
            const std::string_view nb = b.substr(bj, j - bj);
            if (na.size() != nb.size())
                return na.size() < nb.size();
            if (na != nb)
                return na < nb;
            continue;
        }

        if (a[i] != b[j])
            return a[i] < b[j];
        ++i;
        ++j;
    }
    return (a.size() - i) < (b.size() - j);
}

} // namespace

bool ValidateEntry(const ExpenseEntry& entry, ValidationError* outError)
{
    if (IsBlank(entry.label))
    {
        if (outError)
            *outError = ValidationError{ValidationField::Label, "Label is required."};
        return false;
    }

    if (!util::IsValidUtf8(entry.label))
    {
        if (outError)
            *outError = ValidationError{ValidationField::Label, "Label is not valid text."};
        return false;
    }

    if (!util::IsValidUtf8(entry.category))
    {
        if (outError)
            *outError = ValidationError{ValidationField::Category, "Category is not valid text."};
        return false;
    }

    if (!std::isfinite(entry.amount))
    {
        if (outError)
            *outError = ValidationError{ValidationField::Amount, "Amount must be a finite number."};
        return false;
    }

    return true;
}

LedgerStore::LedgerStore(fs::path dataDir)
    : LedgerStore(std::move(dataDir), AtomicWriteFn{}, ClockFn{})
{
}

LedgerStore::LedgerStore(fs::path dataDir, AtomicWriteFn writer, ClockFn clock)
    : m_dataDir(std::move(dataDir))
    , m_writer(std::move(writer))
    , m_clock(std::move(clock))
{
    if (!m_writer)
    {
        m_writer = [](const fs::path& target, std::string_view bytes, std::error_code* outEc) {
            return io::AtomicWriteFile(target, bytes, outEc);
        };
    }
    if (!m_clock)
        m_clock = &SystemNowUtc;

    m_session = makeFreshSession({});
}

fs::path LedgerStore::sessionPath(std::string_view id) const
{
    return sessionsDir() / (std::string(id) + ".json");
}

std::vector<std::string> LedgerStore::sessionIdsOnDisk() const
{
    std::vector<std::string> ids;

    std::error_code ec;
    fs::directory_iterator it(sessionsDir(), ec);
    if (ec)
        return ids;

    for (const fs::directory_entry& de : it)
    {
        std::error_code fec;
        if (!de.is_regular_file(fec) || de.path().extension() != ".json")
            continue;

        // Temp files from an interrupted write start with '.', which IsValidSessionId rejects.
        std::string id = de.path().stem().string();
        if (IsValidSessionId(id))
            ids.push_back(std::move(id));
    }

    // Newest first.
    std::sort(ids.begin(), ids.end(), [](const std::string& a, const std::string& b) { return NaturalLess(b, a); });
    return ids;
}

std::string LedgerStore::makeUniqueId(std::int64_t nowUtc) const
{
    const util::CivilDate d = util::CivilFromUnixSeconds(nowUtc);
    std::int64_t secOfDay = nowUtc % 86400;
    if (secOfDay < 0)
        secOfDay += 86400;

    char buf[48];
    std::snprintf(buf, sizeof(buf), "run-%04d%02d%02d-%02d%02d%02d",
                  d.year, d.month, d.day,
                  static_cast<int>(secOfDay / 3600),
                  static_cast<int>((secOfDay / 60) % 60),
                  static_cast<int>(secOfDay % 60));

    const std::string base = buf;
    const std::vector<std::string> taken = sessionIdsOnDisk();

    auto isFree = [&](const std::string& id) {
        return id != m_session.id && std::find(taken.begin(), taken.end(), id) == taken.end();
    };

    if (isFree(base))
        return base;

    for (int n = 2; n < 10000; ++n)
    {
        std::string candidate = base + "-" + std::to_string(n);
        if (isFree(candidate))
            return candidate;
    }

    // Same second, ten thousand runs: fall back to the raw clock.
    return base + "-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
}

Session LedgerStore::makeFreshSession(std::string name) const
{
    Session s;
    s.createdUnixSecondsUtc = m_clock();
    s.id = makeUniqueId(s.createdUnixSecondsUtc);

    if (IsBlank(name))
        name = "Run " + std::to_string(sessionIdsOnDisk().size() + 1);
    s.name = std::move(name);
    return s;
}

bool LedgerStore::readSessionFile(const fs::path& path, Session& out, StorageError* outError) const
{
    std::string text;
    std::error_code ec;
    if (!io::ReadFileToString(path, text, &ec, kMaxSessionFileBytes))
    {
        const StorageErrorKind kind = (ec == std::errc::no_such_file_or_directory)
            ? StorageErrorKind::NotFound
            : StorageErrorKind::ReadFailed;
        if (outError)
            *outError = MakeStorageError(kind, path, "cannot read run file", ec);
        return false;
    }

    if (!util::NormalizeTextToUtf8(text))
    {
        if (outError)
            *outError = MakeStorageError(StorageErrorKind::Corrupt, path, "not UTF-8 text");
        return false;
    }

    std::string err;
    Session s;
    if (!DecodeSession(text, s, &err))
    {
        if (outError)
            *outError = MakeStorageError(StorageErrorKind::Corrupt, path, err);
        return false;
    }

    if (path.stem().string() != s.id)
    {
        if (outError)
            *outError = MakeStorageError(StorageErrorKind::Corrupt, path,
                                         "run id \"" + s.id + "\" does not match file name");
        return false;
    }

    out = std::move(s);
    return true;
}

bool LedgerStore::load(StorageError* outError)
{
    m_indexedId.clear();

    // 1) Which run is active? A missing or damaged index only costs us the pointer:
    //    fall back to the newest run on disk.
    std::string activeId;
    {
        std::string text;
        std::error_code ec;
        if (io::ReadFileToString(indexPath(), text, &ec, kMaxIndexFileBytes))
        {
            std::string err;
            if (!util::NormalizeTextToUtf8(text) || !DecodeLedgerIndex(text, activeId, &err))
            {
                spdlog::warn("ledger: ignoring damaged index {} ({})",
                             util::PathToUtf8String(indexPath()), err.empty() ? "not UTF-8" : err);
                activeId.clear();
            }
        }
        else if (ec != std::errc::no_such_file_or_directory)
        {
            spdlog::warn("ledger: cannot read index {} ({})",
                         util::PathToUtf8String(indexPath()), ec.message());
        }
    }

    const std::vector<std::string> ids = sessionIdsOnDisk();
    const bool activeOnDisk = !activeId.empty() && std::find(ids.begin(), ids.end(), activeId) != ids.end();
    if (!activeId.empty() && !activeOnDisk)
    {
        spdlog::warn("ledger: active run '{}' is missing; using newest run", activeId);
        activeId.clear();
    }

    const std::string indexed = activeId;
    if (activeId.empty() && !ids.empty())
        activeId = ids.front();

    // 2) First run: nothing to read.
    if (activeId.empty())
    {
        m_session = makeFreshSession({});
        spdlog::info("ledger: no runs in {}, starting '{}'",
                     util::PathToUtf8String(m_dataDir), m_session.id);
        return true;
    }

    // 3) Read it. On failure, leave the damaged file alone and start over in memory.
    Session loaded;
    StorageError err;
    if (!readSessionFile(sessionPath(activeId), loaded, &err))
    {
        Report(outError, std::move(err));
        m_session = makeFreshSession({});
        return false;
    }

    m_session = std::move(loaded);
    m_indexedId = indexed;
    spdlog::info("ledger: loaded run '{}' ({} entries)", m_session.id, m_session.entries.size());
    return true;
}

void LedgerStore::writeIndexIfStale(const std::string& activeId)
{
    if (m_indexedId == activeId)
        return;

    std::error_code ec;
    if (!m_writer(indexPath(), EncodeLedgerIndex(activeId), &ec))
    {
        // The run itself is safe on disk; retry the pointer on the next write.
        spdlog::warn("ledger: could not update {} ({})", util::PathToUtf8String(indexPath()), ec.message());
        return;
    }
    m_indexedId = activeId;
}

bool LedgerStore::persist(const Session& candidate, StorageError* outError)
{
    const fs::path path = sessionPath(candidate.id);

    std::error_code ec;
    if (!m_writer(path, EncodeSession(candidate), &ec))
    {
        Report(outError, MakeStorageError(StorageErrorKind::WriteFailed, path, "atomic write failed", ec));
        return false;
    }

    writeIndexIfStale(candidate.id);
    return true;
}

MutationStatus LedgerStore::append(const ExpenseEntry& entry, ValidationError* outInvalid, StorageError* outStorage)
{
    if (!ValidateEntry(entry, outInvalid))
        return MutationStatus::Invalid;

    Session next = m_session;
    next.entries.push_back(entry);

    if (!persist(next, outStorage))
        return MutationStatus::StorageFailed;

    m_session = std::move(next);
    spdlog::debug("ledger: appended '{}' {} [{}] to '{}'", entry.label, entry.amount, entry.category, m_session.id);
    return MutationStatus::Ok;
}

MutationStatus LedgerStore::removeAt(std::size_t index, ValidationError* outInvalid, StorageError* outStorage)
{
    if (index >= m_session.entries.size())
    {
        if (outInvalid)
            *outInvalid = ValidationError{ValidationField::Index, "No entry #" + std::to_string(index + 1) + "."};
        return MutationStatus::Invalid;
    }

    Session next = m_session;
    next.entries.erase(next.entries.begin() + static_cast<std::ptrdiff_t>(index));

    if (!persist(next, outStorage))
        return MutationStatus::StorageFailed;

    m_session = std::move(next);
    spdlog::debug("ledger: removed entry {} from '{}'", index, m_session.id);
    return MutationStatus::Ok;
}

bool LedgerStore::clear(StorageError* outError)
{
    Session next = m_session;
    next.entries.clear();

    if (!persist(next, outError))
        return false;

    m_session = std::move(next);
    spdlog::debug("ledger: cleared '{}'", m_session.id);
    return true;
}

bool LedgerStore::newRun(std::string name, StorageError* outError)
{
    Session next = makeFreshSession(std::move(name));

    if (!persist(next, outError))
        return false;

    m_session = std::move(next);
    spdlog::info("ledger: started run '{}' ({})", m_session.name, m_session.id);
    return true;
}

bool LedgerStore::activate(std::string_view id, StorageError* outError)
{
    if (id == m_session.id)
        return true;

    Session s;
    StorageError err;
    if (!loadSession(id, s, &err))
    {
        Report(outError, std::move(err));
        return false;
    }

    // Unlike a run write, switching runs is only real once the pointer is on disk.
    std::error_code ec;
    if (!m_writer(indexPath(), EncodeLedgerIndex(s.id), &ec))
    {
        Report(outError, MakeStorageError(StorageErrorKind::WriteFailed, indexPath(), "atomic write failed", ec));
        return false;
    }

    m_indexedId = s.id;
    m_session = std::move(s);
    spdlog::info("ledger: reopened run '{}' ({})", m_session.name, m_session.id);
    return true;
}

bool LedgerStore::listSessions(std::vector<SessionSummary>& out, std::vector<StorageError>* outSkipped) const
{
    out.clear();

    std::error_code ec;
    if (!fs::exists(sessionsDir(), ec) && ec)
        return false;

    auto summarize = [](const Session& s) {
        SessionSummary row;
        row.id = s.id;
        row.name = s.name;
        row.createdUnixSecondsUtc = s.createdUnixSecondsUtc;
        row.entryCount = s.entries.size();
        row.total = Total(s);
        return row;
    };

    bool sawActive = false;
    for (const std::string& id : sessionIdsOnDisk())
    {
        if (id == m_session.id)
        {
            out.push_back(summarize(m_session));
            sawActive = true;
            continue;
        }

        Session s;
        StorageError err;
        if (!readSessionFile(sessionPath(id), s, &err))
        {
            spdlog::warn("ledger: skipping run '{}': {}", id, err.describe());
            if (outSkipped)
                outSkipped->push_back(std::move(err));
            continue;
        }
        out.push_back(summarize(s));
    }

    // The active run may not have been written yet.
    if (!sawActive)
        out.push_back(summarize(m_session));

    std::stable_sort(out.begin(), out.end(), [](const SessionSummary& a, const SessionSummary& b) {
        if (a.createdUnixSecondsUtc != b.createdUnixSecondsUtc)
            return a.createdUnixSecondsUtc > b.createdUnixSecondsUtc;
        return a.id > b.id;
    });
    return true;
}

bool LedgerStore::loadSession(std::string_view id, Session& out, StorageError* outError) const
{
    if (id == m_session.id)
    {
        out = m_session;
        return true;
    }

    if (!IsValidSessionId(id))
    {
        if (outError)
            *outError = MakeStorageError(StorageErrorKind::NotFound, sessionsDir(),
                                         "invalid run id \"" + std::string(id) + "\"");
        return false;
    }

    return readSessionFile(sessionPath(id), out, outError);
}

} // namespace ghostledger::ledger
