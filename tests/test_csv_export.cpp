// tests/test_csv_export.cpp

#include <doctest/doctest.h>

#include "ghostledger/ledger/CsvExport.hpp"
#include "io/AtomicFile.h"

#include "test_support/TempDir.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace ghostledger::ledger;
using ghostledger::test::TempDir;

TEST_CASE("CsvExport: header, rows and total")
{
    Session s;
    s.id = "run-a";
    s.entries.push_back({"Sage", -20.0, "Consumable", 1760745600});
    s.entries.push_back({"Sale", 100.0, "Contract", std::nullopt});

    CHECK(FormatCsv(s) ==
          "Date,Category,Label,Amount\r\n"
          "2025-10-18,Consumable,Sage,-20.00\r\n"
          ",Contract,Sale,100.00\r\n"
          ",,Total,80.00\r\n");
}

TEST_CASE("CsvExport: empty run still has a total row")
{
    CHECK(FormatCsv(Session{}) == "Date,Category,Label,Amount\r\n,,Total,0.00\r\n");
}

TEST_CASE("CsvExport: fields with separators or quotes are quoted")
{
    Session s;
    s.entries.push_back({"EMF reader, \"K2\"", 45.5, "Equip\nment", std::nullopt});

    const std::string csv = FormatCsv(s);
    CHECK(csv.find(",\"Equip\nment\",\"EMF reader, \"\"K2\"\"\",45.50\r\n") != std::string::npos);
}

TEST_CASE("CsvExport: ExportCsv writes the file and reports failures")
{
    TempDir tmp("csv");
    Session s;
    s.entries.push_back({"Salt", 3.0, "Consumable", std::nullopt});

    const fs::path target = tmp.path() / "exports" / "run-a.csv";
    StorageError err;
    REQUIRE(ExportCsv(s, target, &err));

    std::string written;
    REQUIRE(ghostledger::io::ReadFileToString(target, written));
    CHECK(written == FormatCsv(s));

    // A directory in the way of the target.
    const fs::path blocked = tmp.path() / "blocked.csv";
    fs::create_directories(blocked);
    CHECK_FALSE(ExportCsv(s, blocked, &err));
    CHECK(err.kind == StorageErrorKind::WriteFailed);
    CHECK(err.path == blocked);
}
