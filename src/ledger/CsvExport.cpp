#include "ghostledger/ledger/CsvExport.hpp"

#include "ghostledger/ledger/ExpenseCalculator.hpp"
#include "io/AtomicFile.h"
#include "util/CivilTime.h"
#include "util/PathUtf8.h"

#include <cstdio>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>

namespace ghostledger::ledger {

namespace {

void AppendField(std::string& out, std::string_view field)
{
    const bool needsQuotes = field.find_first_of(",\"\r\n") != std::string_view::npos;
    if (!needsQuotes)
    {
        out += field;
        return;
    }

    out += '"';
    for (const char c : field)
    {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
}

void AppendAmount(std::string& out, double amount)
{
    // FormatMoney with no symbol keeps the "-0.00" -> "0.00" rule in one place.
    out += FormatMoney(amount, {});
}

} // namespace

std::string FormatCsv(const Session& session)
{
    std::string out = "Date,Category,Label,Amount\r\n";

    for (const ExpenseEntry& e : session.entries)
    {
        if (e.timestampUnixSecondsUtc)
            out += util::FormatIsoDate(util::CivilFromUnixSeconds(*e.timestampUnixSecondsUtc));
        out += ',';
        AppendField(out, e.category);
        out += ',';
        AppendField(out, e.label);
        out += ',';
        AppendAmount(out, e.amount);
        out += "\r\n";
    }

    out += ",,Total,";
    AppendAmount(out, Total(session));
    out += "\r\n";
    return out;
}

bool ExportCsv(const Session& session, const std::filesystem::path& target, StorageError* outError)
{
    std::error_code ec;
    if (!io::AtomicWriteFile(target, FormatCsv(session), &ec))
    {
        spdlog::warn("export: cannot write {} ({})", util::PathToUtf8String(target), ec.message());
        if (outError)
        {
            outError->kind = StorageErrorKind::WriteFailed;
            outError->path = target;
            outError->message = "CSV export failed";
            outError->ec = ec;
        }
        return false;
    }

    spdlog::info("export: wrote {} rows to {}", session.entries.size(), util::PathToUtf8String(target));
    return true;
}

} // namespace ghostledger::ledger
