// tests/test_ledger_store.cpp
//
// LedgerStore against a real temp folder. A wrapping writer lets tests make
// individual writes fail as if the disk were full.

#include <doctest/doctest.h>

#include "ghostledger/ledger/ExpenseCalculator.hpp"
#include "ghostledger/ledger/LedgerCodec.hpp"
#include "ghostledger/ledger/LedgerStore.hpp"
#include "io/AtomicFile.h"

#include "test_support/TempDir.h"

#include <cmath>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ghostledger::ledger;
using ghostledger::test::TempDir;

namespace {

constexpr std::int64_t kNoon = 1760788800; // 2025-10-18 12:00:00 UTC

// Real atomic writes, with switches to fail them.
struct FlakyDisk
{
    bool failAll = false;
    bool failIndex = false;
    int writes = 0;

    AtomicWriteFn writer()
    {
        return [this](const fs::path& target, std::string_view bytes, std::error_code* ec) {
            ++writes;
            if (failAll || (failIndex && target.filename() == "ledger.json"))
            {
                if (ec) *ec = std::make_error_code(std::errc::no_space_on_device);
                return false;
            }
            return ghostledger::io::AtomicWriteFile(target, bytes, ec);
        };
    }
};

struct Clock
{
    std::int64_t now = kNoon;
    ClockFn fn() { return [this] { return now; }; }
};

std::string ReadText(const fs::path& p)
{
    std::string out;
    REQUIRE(ghostledger::io::ReadFileToString(p, out));
    return out;
}

ExpenseEntry Sage() { return {"Sage", -20.0, "Consumable", kNoon}; }
ExpenseEntry Sale() { return {"Sale", 100.0, "Contract", kNoon}; }

} // namespace

TEST_CASE("LedgerStore: first load on an empty folder starts a fresh run without writing")
{
    TempDir tmp("store");
    FlakyDisk disk;
    Clock clock;
    LedgerStore store(tmp.path(), disk.writer(), clock.fn());

    StorageError err;
    REQUIRE(store.load(&err));
    CHECK(store.session().empty());
    CHECK(store.session().id == "run-20251018-120000");
    CHECK(store.session().name == "Run 1");
    CHECK(store.session().createdUnixSecondsUtc == kNoon);
    CHECK(disk.writes == 0);
    CHECK_FALSE(fs::exists(store.indexPath()));
}

TEST_CASE("LedgerStore: Sage and Sale total 80 and survive a reload")
{
    TempDir tmp("store");
    Clock clock;

    Session saved;
    {
        LedgerStore store(tmp.path(), {}, clock.fn());
        REQUIRE(store.load());
        REQUIRE(store.append(Sage()) == MutationStatus::Ok);
        REQUIRE(store.append(Sale()) == MutationStatus::Ok);

        CHECK(Total(store.session()) == doctest::Approx(80.0));
        const CategoryTotals by = ByCategory(store.session());
        REQUIRE(by.size() == 2);
        CHECK(by.at("Consumable") == doctest::Approx(-20.0));
        CHECK(by.at("Contract") == doctest::Approx(100.0));

        saved = store.session();
        CHECK(fs::exists(store.sessionPath(saved.id)));
        CHECK(fs::exists(store.indexPath()));
    }

    LedgerStore reopened(tmp.path(), {}, clock.fn());
    REQUIRE(reopened.load());
    CHECK(reopened.session() == saved);
    REQUIRE(reopened.session().entries.size() == 2);
    CHECK(reopened.session().entries[0].label == "Sage");
    CHECK(reopened.session().entries[1].label == "Sale");
}

TEST_CASE("LedgerStore: clear twice is the same as clearing once")
{
    TempDir tmp("store");
    Clock clock;
    LedgerStore store(tmp.path(), {}, clock.fn());
    REQUIRE(store.load());
    REQUIRE(store.append(Sage()) == MutationStatus::Ok);

    REQUIRE(store.clear());
    const Session once = store.session();
    const std::string onceOnDisk = ReadText(store.sessionPath(once.id));

    REQUIRE(store.clear());
    CHECK(store.session() == once);
    CHECK(ReadText(store.sessionPath(once.id)) == onceOnDisk);
    CHECK(store.session().empty());

    LedgerStore reopened(tmp.path(), {}, clock.fn());
    REQUIRE(reopened.load());
    CHECK(reopened.session() == once);
}

TEST_CASE("LedgerStore: invalid entries are refused without touching disk")
{
    TempDir tmp("store");
    FlakyDisk disk;
    Clock clock;
    LedgerStore store(tmp.path(), disk.writer(), clock.fn());
    REQUIRE(store.load());

    ValidationError invalid;
    CHECK(store.append({"   ", 5.0, "Other", std::nullopt}, &invalid) == MutationStatus::Invalid);
    CHECK(invalid.field == ValidationField::Label);

    CHECK(store.append({"Ghost", std::numeric_limits<double>::quiet_NaN(), "Other", std::nullopt}, &invalid)
          == MutationStatus::Invalid);
    CHECK(invalid.field == ValidationField::Amount);

    CHECK(store.append({"Ghost", std::numeric_limits<double>::infinity(), "Other", std::nullopt}, &invalid)
          == MutationStatus::Invalid);

    CHECK(store.session().empty());
    CHECK(disk.writes == 0);
}

TEST_CASE("LedgerStore: text that is not UTF-8 is refused so memory and disk agree")
{
    TempDir tmp("store");
    FlakyDisk disk;
    Clock clock;
    LedgerStore store(tmp.path(), disk.writer(), clock.fn());
    REQUIRE(store.load());
    REQUIRE(store.append(Sage()) == MutationStatus::Ok);

    const Session before = store.session();
    const std::string beforeOnDisk = ReadText(store.sessionPath(before.id));
    const int writesBefore = disk.writes;

    ValidationError invalid;
    CHECK(store.append({"Sage\xff", -20.0, "Consumable", kNoon}, &invalid) == MutationStatus::Invalid);
    CHECK(invalid.field == ValidationField::Label);

    CHECK(store.append({"Salt", -5.0, "Consum\xc3", kNoon}, &invalid) == MutationStatus::Invalid);
    CHECK(invalid.field == ValidationField::Category);

    CHECK(store.session() == before);
    CHECK(disk.writes == writesBefore);
    CHECK(ReadText(store.sessionPath(before.id)) == beforeOnDisk);

    // Multi-byte UTF-8 is fine and reads back byte for byte.
    REQUIRE(store.append({"Crucifix \xE2\x80\x93 T2", -30.0, "\xC3\x89quipement", kNoon}) == MutationStatus::Ok);
    LedgerStore reopened(tmp.path(), {}, clock.fn());
    REQUIRE(reopened.load());
    CHECK(reopened.session() == store.session());
}

TEST_CASE("LedgerStore: a failed write keeps memory and the file at the last good run")
{
    TempDir tmp("store");
    FlakyDisk disk;
    Clock clock;
    LedgerStore store(tmp.path(), disk.writer(), clock.fn());
    REQUIRE(store.load());
    REQUIRE(store.append(Sage()) == MutationStatus::Ok);

    const Session before = store.session();
    const fs::path file = store.sessionPath(before.id);
    const std::string bytesBefore = ReadText(file);

    disk.failAll = true;

    StorageError err;
    CHECK(store.append(Sale(), nullptr, &err) == MutationStatus::StorageFailed);
    CHECK(err.kind == StorageErrorKind::WriteFailed);
    CHECK(err.ec == std::errc::no_space_on_device);
    CHECK(err.path == file);
    CHECK_FALSE(err.describe().empty());

    CHECK(store.session() == before);
    CHECK(ReadText(file) == bytesBefore);

    Session onDisk;
    REQUIRE(DecodeSession(ReadText(file), onDisk));
    CHECK(onDisk == before);

    CHECK_FALSE(store.clear(&err));
    CHECK(store.session() == before);
    CHECK(store.removeAt(0, nullptr, &err) == MutationStatus::StorageFailed);
    CHECK(store.session() == before);

    // Disk recovers: the next write goes through.
    disk.failAll = false;
    CHECK(store.append(Sale()) == MutationStatus::Ok);
    CHECK(store.session().entries.size() == 2);
}

TEST_CASE("LedgerStore: a damaged active run is left alone and a fresh run is used")
{
    TempDir tmp("store");
    Clock clock;

    const std::string damagedId = "run-20251018-110000";
    const fs::path sessions = tmp.path() / "sessions";
    const fs::path damaged = sessions / (damagedId + ".json");
    REQUIRE(ghostledger::io::AtomicWriteFile(damaged, "{ \"format\": \"ghostledger_session\", \"entr"));
    REQUIRE(ghostledger::io::AtomicWriteFile(tmp.path() / "ledger.json", EncodeLedgerIndex(damagedId)));
    const std::string damagedBytes = ReadText(damaged);

    LedgerStore store(tmp.path(), {}, clock.fn());
    StorageError err;
    CHECK_FALSE(store.load(&err));
    CHECK(err.kind == StorageErrorKind::Corrupt);
    CHECK(err.path == damaged);

    CHECK(store.session().empty());
    CHECK(store.session().id != damagedId);

    REQUIRE(store.append(Sage()) == MutationStatus::Ok);
    CHECK(ReadText(damaged) == damagedBytes);

    std::vector<SessionSummary> runs;
    std::vector<StorageError> skipped;
    REQUIRE(store.listSessions(runs, &skipped));
    REQUIRE(runs.size() == 1);
    CHECK(runs[0].id == store.session().id);
    REQUIRE(skipped.size() == 1);
    CHECK(skipped[0].path == damaged);

    // The index now points at the healthy run.
    LedgerStore reopened(tmp.path(), {}, clock.fn());
    REQUIRE(reopened.load());
    CHECK(reopened.session() == store.session());
}

TEST_CASE("LedgerStore: a run file whose id does not match its name is corrupt")
{
    TempDir tmp("store");
    Clock clock;

    Session s;
    s.id = "run-other";
    s.name = "Imposter";
    REQUIRE(ghostledger::io::AtomicWriteFile(tmp.path() / "sessions" / "run-20251018-100000.json", EncodeSession(s)));

    LedgerStore store(tmp.path(), {}, clock.fn());
    StorageError err;
    CHECK_FALSE(store.load(&err));
    CHECK(err.kind == StorageErrorKind::Corrupt);
}

TEST_CASE("LedgerStore: a missing or damaged index falls back to the newest run")
{
    TempDir tmp("store");
    Clock clock;

    std::string newestId;
    {
        LedgerStore store(tmp.path(), {}, clock.fn());
        REQUIRE(store.load());
        REQUIRE(store.append(Sage()) == MutationStatus::Ok);
        clock.now += 3600;
        REQUIRE(store.newRun("Second"));
        REQUIRE(store.append(Sale()) == MutationStatus::Ok);
        newestId = store.session().id;
    }

    SUBCASE("index removed")
    {
        fs::remove(tmp.path() / "ledger.json");
    }
    SUBCASE("index garbage")
    {
        REQUIRE(ghostledger::io::AtomicWriteFile(tmp.path() / "ledger.json", "\x01\x02 nope"));
    }
    SUBCASE("index points at a deleted run")
    {
        REQUIRE(ghostledger::io::AtomicWriteFile(tmp.path() / "ledger.json", EncodeLedgerIndex("run-gone")));
    }

    LedgerStore reopened(tmp.path(), {}, clock.fn());
    REQUIRE(reopened.load());
    CHECK(reopened.session().id == newestId);
    CHECK(reopened.session().name == "Second");
}

TEST_CASE("LedgerStore: runs started in the same second order by their numeric suffix")
{
    TempDir tmp("store");
    Clock clock;

    std::string newestId;
    {
        LedgerStore store(tmp.path(), {}, clock.fn());
        REQUIRE(store.load());
        REQUIRE(store.append(Sage()) == MutationStatus::Ok);
        for (int i = 0; i < 9; ++i)
            REQUIRE(store.newRun({}));
        newestId = store.session().id;
    }
    CHECK(newestId == "run-20251018-120000-10");

    LedgerStore reopened(tmp.path(), {}, clock.fn());
    std::vector<SessionSummary> runs;
    REQUIRE(reopened.listSessions(runs));
    REQUIRE(runs.size() == 10);
    CHECK(runs[0].id == "run-20251018-120000-10");
    CHECK(runs[1].id == "run-20251018-120000-9");
    CHECK(runs[8].id == "run-20251018-120000-2");
    CHECK(runs[9].id == "run-20251018-120000");

    fs::remove(tmp.path() / "ledger.json");
    REQUIRE(reopened.load());
    CHECK(reopened.session().id == newestId);
}

TEST_CASE("LedgerStore: an index write failure is not fatal and is retried")
{
    TempDir tmp("store");
    FlakyDisk disk;
    Clock clock;
    LedgerStore store(tmp.path(), disk.writer(), clock.fn());
    REQUIRE(store.load());

    disk.failIndex = true;
    REQUIRE(store.append(Sage()) == MutationStatus::Ok);
    CHECK(fs::exists(store.sessionPath(store.session().id)));
    CHECK_FALSE(fs::exists(store.indexPath()));

    disk.failIndex = false;
    REQUIRE(store.append(Sale()) == MutationStatus::Ok);
    REQUIRE(fs::exists(store.indexPath()));

    std::string active;
    REQUIRE(DecodeLedgerIndex(ReadText(store.indexPath()), active));
    CHECK(active == store.session().id);
}

TEST_CASE("LedgerStore: runs can be started, listed and reopened")
{
    TempDir tmp("store");
    Clock clock;
    LedgerStore store(tmp.path(), {}, clock.fn());
    REQUIRE(store.load());
    REQUIRE(store.append(Sage()) == MutationStatus::Ok);
    const std::string firstId = store.session().id;

    // Same second: the id gets a suffix.
    REQUIRE(store.newRun("  "));
    CHECK(store.session().id == firstId + "-2");
    CHECK(store.session().name == "Run 2");
    CHECK(store.session().empty());

    clock.now += 60;
    REQUIRE(store.newRun("Prison"));
    REQUIRE(store.append(Sale()) == MutationStatus::Ok);
    const std::string prisonId = store.session().id;
    CHECK(prisonId == "run-20251018-120100");

    std::vector<SessionSummary> runs;
    REQUIRE(store.listSessions(runs));
    REQUIRE(runs.size() == 3);
    CHECK(runs[0].id == prisonId);
    CHECK(runs[0].entryCount == 1);
    CHECK(runs[0].total == doctest::Approx(100.0));
    CHECK(runs[2].createdUnixSecondsUtc <= runs[1].createdUnixSecondsUtc);

    Session first;
    REQUIRE(store.loadSession(firstId, first));
    CHECK(Total(first) == doctest::Approx(-20.0));
    CHECK(store.session().id == prisonId);

    REQUIRE(store.activate(firstId));
    CHECK(store.session() == first);

    LedgerStore reopened(tmp.path(), {}, clock.fn());
    REQUIRE(reopened.load());
    CHECK(reopened.session().id == firstId);
}

TEST_CASE("LedgerStore: activate and loadSession refuse unknown or unsafe ids")
{
    TempDir tmp("store");
    Clock clock;
    LedgerStore store(tmp.path(), {}, clock.fn());
    REQUIRE(store.load());
    const Session before = store.session();

    StorageError err;
    Session out;
    CHECK_FALSE(store.loadSession("../../etc/passwd", out, &err));
    CHECK(err.kind == StorageErrorKind::NotFound);

    CHECK_FALSE(store.activate("run-19990101-000000", &err));
    CHECK(err.kind == StorageErrorKind::NotFound);
    CHECK(store.session() == before);
}

TEST_CASE("LedgerStore: removeAt deletes one entry and rejects bad indices")
{
    TempDir tmp("store");
    Clock clock;
    LedgerStore store(tmp.path(), {}, clock.fn());
    REQUIRE(store.load());
    REQUIRE(store.append(Sage()) == MutationStatus::Ok);
    REQUIRE(store.append(Sale()) == MutationStatus::Ok);

    ValidationError invalid;
    CHECK(store.removeAt(2, &invalid) == MutationStatus::Invalid);
    CHECK(invalid.field == ValidationField::Index);
    CHECK(store.session().entries.size() == 2);

    REQUIRE(store.removeAt(0) == MutationStatus::Ok);
    REQUIRE(store.session().entries.size() == 1);
    CHECK(store.session().entries[0].label == "Sale");

    LedgerStore reopened(tmp.path(), {}, clock.fn());
    REQUIRE(reopened.load());
    CHECK(reopened.session() == store.session());
}
