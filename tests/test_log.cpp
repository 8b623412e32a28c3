// tests/test_log.cpp

#include <doctest/doctest.h>

#include "logging/Log.h"

#include "test_support/TempDir.h"

#include <filesystem>

namespace fs = std::filesystem;
using namespace ghostledger;

TEST_CASE("logsys: ParseLevel accepts spdlog and short names")
{
    spdlog::level::level_enum lvl = spdlog::level::info;

    CHECK(logsys::ParseLevel("debug", lvl));
    CHECK(lvl == spdlog::level::debug);
    CHECK(logsys::ParseLevel("WARN", lvl));
    CHECK(lvl == spdlog::level::warn);
    CHECK(logsys::ParseLevel("warning", lvl));
    CHECK(lvl == spdlog::level::warn);
    CHECK(logsys::ParseLevel("off", lvl));
    CHECK(lvl == spdlog::level::off);
    CHECK(logsys::ParseLevel("Error", lvl));
    CHECK(lvl == spdlog::level::err);
    CHECK(logsys::ParseLevel("err", lvl));
    CHECK(lvl == spdlog::level::err);
    CHECK(logsys::ParseLevel("critical", lvl));
    CHECK(lvl == spdlog::level::critical);

    lvl = spdlog::level::err;
    CHECK_FALSE(logsys::ParseLevel("verbose", lvl));
    CHECK_FALSE(logsys::ParseLevel("", lvl));
    CHECK(lvl == spdlog::level::err);
}

TEST_CASE("logsys: Init writes to ghostledger.log in the log folder")
{
    const auto previous = spdlog::default_logger();

    test::TempDir tmp("log");
    const fs::path dir = tmp.path() / "state" / "logs";

    logsys::Init(dir, spdlog::level::err);
    REQUIRE(logsys::Get() != nullptr);
    CHECK(logsys::Get()->name() == "ghostledger");
    CHECK(spdlog::default_logger() == logsys::Get());
    CHECK(logsys::Get()->level() == spdlog::level::err);

    spdlog::error("log test line");
    logsys::Get()->flush();

    CHECK(fs::is_directory(dir));
    CHECK(fs::exists(dir / "ghostledger.log"));
    CHECK(fs::file_size(dir / "ghostledger.log") > 0);

    // Hand the default back so later suites keep their quiet logger.
    spdlog::drop("ghostledger");
    spdlog::set_default_logger(previous);
}
