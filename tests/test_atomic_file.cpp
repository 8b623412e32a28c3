// tests/test_atomic_file.cpp
//
// Regression coverage for ghostledger::io::AtomicWriteFile/ReadFileToString.
// These back every run, index and settings write.

#include <doctest/doctest.h>

#include "io/AtomicFile.h"

#include "test_support/TempDir.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using ghostledger::test::TempDir;

namespace {

std::size_t CountTempLeftovers(const fs::path& dir, const fs::path& target)
{
    const std::string prefix = ghostledger::io::TempPrefixFor(target);
    std::size_t n = 0;
    std::error_code ec;
    for (const auto& de : fs::directory_iterator(dir, ec))
    {
        if (de.path().filename().string().rfind(prefix, 0) == 0)
            ++n;
    }
    return n;
}

} // namespace

TEST_CASE("io::AtomicWriteFile round-trips bytes and replaces the old file")
{
    TempDir tmp("io");
    const fs::path p = tmp.path() / "roundtrip.json";

    std::error_code ec;
    REQUIRE(ghostledger::io::AtomicWriteFile(p, "hello\n", &ec));
    CHECK_FALSE(ec);

    std::string read;
    REQUIRE(ghostledger::io::ReadFileToString(p, read, &ec));
    CHECK(read == "hello\n");

    REQUIRE(ghostledger::io::AtomicWriteFile(p, "world", &ec));
    REQUIRE(ghostledger::io::ReadFileToString(p, read, &ec));
    CHECK(read == "world");

    CHECK(CountTempLeftovers(tmp.path(), p) == 0);
}

TEST_CASE("io::AtomicWriteFile creates missing parent folders")
{
    TempDir tmp("io");
    const fs::path p = tmp.path() / "a" / "b" / "c.txt";

    std::error_code ec;
    REQUIRE(ghostledger::io::AtomicWriteFile(p, "x", &ec));
    CHECK(fs::exists(p));
}

TEST_CASE("io::AtomicWriteFile keeps binary content intact")
{
    TempDir tmp("io");
    const fs::path p = tmp.path() / "bin.dat";

    const std::string bytes("a\0b\r\n\xFF", 6);
    REQUIRE(ghostledger::io::AtomicWriteFile(p, bytes));

    std::string read;
    REQUIRE(ghostledger::io::ReadFileToString(p, read));
    CHECK(read == bytes);
}

TEST_CASE("io::AtomicWriteFile fails cleanly when the target is a directory")
{
    TempDir tmp("io");
    const fs::path p = tmp.path() / "occupied";
    fs::create_directories(p);

    std::error_code ec;
    CHECK_FALSE(ghostledger::io::AtomicWriteFile(p, "nope", &ec));
    CHECK(ec);
    CHECK(fs::is_directory(p));
    CHECK(CountTempLeftovers(tmp.path(), p) == 0);
}

TEST_CASE("io::ReadFileToString reports missing files and size limits")
{
    TempDir tmp("io");

    std::string out = "stale";
    std::error_code ec;
    CHECK_FALSE(ghostledger::io::ReadFileToString(tmp.path() / "missing.json", out, &ec));
    CHECK(ec == std::errc::no_such_file_or_directory);

    const fs::path big = tmp.path() / "big.txt";
    REQUIRE(ghostledger::io::AtomicWriteFile(big, std::string(64, 'x')));
    CHECK_FALSE(ghostledger::io::ReadFileToString(big, out, &ec, /*max_bytes=*/16));
    CHECK(ec == std::errc::file_too_large);

    CHECK(ghostledger::io::ReadFileToString(big, out, &ec, /*max_bytes=*/64));
    CHECK(out.size() == 64);
}

TEST_CASE("io::TempPrefixFor hides temp files")
{
    const std::string prefix = ghostledger::io::TempPrefixFor(fs::path("/data/sessions/run-1.json"));
    CHECK(prefix == ".run-1.json.tmp.");
}
