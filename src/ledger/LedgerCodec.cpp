#include "ghostledger/ledger/LedgerCodec.hpp"

#include <cmath>
#include <exception>
#include <limits>
#include <utility>

#include <nlohmann/json.hpp>

namespace ghostledger::ledger {

namespace {

using json = nlohmann::json;

void SetError(std::string* outError, std::string msg)
{
    if (outError)
        *outError = std::move(msg);
}

[[nodiscard]] bool ReadHeader(const json& j,
                              const char* expectedFormat,
                              int maxVersion,
                              std::string* outError)
{
    if (!j.is_object())
    {
        SetError(outError, "top-level value is not an object");
        return false;
    }

    auto fmt = j.find("format");
    if (fmt == j.end() || !fmt->is_string() || fmt->get<std::string>() != expectedFormat)
    {
        SetError(outError, std::string("unsupported format (expected \"") + expectedFormat + "\")");
        return false;
    }

    auto ver = j.find("version");
    if (ver == j.end() || !ver->is_number_integer())
    {
        SetError(outError, "missing version");
        return false;
    }

    const int v = ver->get<int>();
    if (v < 1 || v > maxVersion)
    {
        SetError(outError, "unsupported version " + std::to_string(v));
        return false;
    }

    return true;
}

[[nodiscard]] bool DecodeEntry(const json& e, std::size_t index, ExpenseEntry& out, std::string* outError)
{
    const std::string where = "entry " + std::to_string(index) + ": ";

    if (!e.is_object())
    {
        SetError(outError, where + "not an object");
        return false;
    }

    auto label = e.find("label");
    if (label == e.end() || !label->is_string() || label->get_ref<const std::string&>().empty())
    {
        SetError(outError, where + "label missing or empty");
        return false;
    }

    auto amount = e.find("amount");
    if (amount == e.end() || !amount->is_number())
    {
        SetError(outError, where + "amount missing or not a number");
        return false;
    }
    const double a = amount->get<double>();
    if (!std::isfinite(a))
    {
        SetError(outError, where + "amount is not finite");
        return false;
    }

    auto category = e.find("category");
    if (category == e.end() || !category->is_string())
    {
        SetError(outError, where + "category missing");
        return false;
    }

    ExpenseEntry entry;
    entry.label = label->get<std::string>();
    entry.amount = a;
    entry.category = category->get<std::string>();

    auto ts = e.find("timestamp");
    if (ts != e.end() && !ts->is_null())
    {
        if (!ts->is_number_integer())
        {
            SetError(outError, where + "timestamp is not an integer");
            return false;
        }
        entry.timestampUnixSecondsUtc = ts->get<std::int64_t>();
    }

    out = std::move(entry);
    return true;
}

} // namespace

bool IsValidSessionId(std::string_view id) noexcept
{
    if (id.empty() || id.size() > 64 || id.front() == '.')
        return false;

    for (const char c : id)
    {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                        || c == '-' || c == '_' || c == '.';
        if (!ok)
            return false;
    }
    return true;
}

std::string EncodeSession(const Session& session)
{
    json j;
    j["format"] = kSessionFormatName;
    j["version"] = kSessionFormatVersion;
    j["session"] = {
        {"id", session.id},
        {"name", session.name},
        {"createdUnixSecondsUtc", session.createdUnixSecondsUtc},
    };

    json entries = json::array();
    for (const ExpenseEntry& e : session.entries)
    {
        json je = {
            {"label", e.label},
            {"amount", e.amount},
            {"category", e.category},
        };
        if (e.timestampUnixSecondsUtc)
            je["timestamp"] = *e.timestampUnixSecondsUtc;
        entries.push_back(std::move(je));
    }
    j["entries"] = std::move(entries);

    // Labels come from a UTF-8 text field; replace rather than throw on stray bytes.
    return j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

bool DecodeSession(std::string_view text, Session& out, std::string* outError) noexcept
{
    try
    {
        const json j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded())
        {
            SetError(outError, "JSON parse failed");
            return false;
        }

        if (!ReadHeader(j, kSessionFormatName, kSessionFormatVersion, outError))
            return false;

        auto meta = j.find("session");
        if (meta == j.end() || !meta->is_object())
        {
            SetError(outError, "missing session object");
            return false;
        }

        Session s;

        auto id = meta->find("id");
        if (id == meta->end() || !id->is_string() || !IsValidSessionId(id->get_ref<const std::string&>()))
        {
            SetError(outError, "missing or invalid session id");
            return false;
        }
        s.id = id->get<std::string>();

        if (auto name = meta->find("name"); name != meta->end() && name->is_string())
            s.name = name->get<std::string>();

        if (auto created = meta->find("createdUnixSecondsUtc"); created != meta->end() && created->is_number_integer())
            s.createdUnixSecondsUtc = created->get<std::int64_t>();

        auto entries = j.find("entries");
        if (entries == j.end() || !entries->is_array())
        {
            SetError(outError, "missing entries array");
            return false;
        }

        s.entries.reserve(entries->size());
        std::size_t index = 0;
        for (const json& e : *entries)
        {
            ExpenseEntry entry;
            if (!DecodeEntry(e, index, entry, outError))
                return false;
            s.entries.push_back(std::move(entry));
            ++index;
        }

        out = std::move(s);
        return true;
    }
    catch (const std::exception& ex)
    {
        SetError(outError, std::string("decode failed: ") + ex.what());
        return false;
    }
}

std::string EncodeLedgerIndex(std::string_view activeSessionId)
{
    json j;
    j["format"] = kIndexFormatName;
    j["version"] = kIndexFormatVersion;
    j["active"] = std::string(activeSessionId);
    return j.dump(2) + "\n";
}

bool DecodeLedgerIndex(std::string_view text, std::string& outActiveSessionId, std::string* outError) noexcept
{
    try
    {
        const json j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded())
        {
            SetError(outError, "JSON parse failed");
            return false;
        }

        if (!ReadHeader(j, kIndexFormatName, kIndexFormatVersion, outError))
            return false;

        auto active = j.find("active");
        if (active == j.end() || !active->is_string() || !IsValidSessionId(active->get_ref<const std::string&>()))
        {
            SetError(outError, "missing or invalid active session id");
            return false;
        }

        outActiveSessionId = active->get<std::string>();
        return true;
    }
    catch (const std::exception& ex)
    {
        SetError(outError, std::string("decode failed: ") + ex.what());
        return false;
    }
}

} // namespace ghostledger::ledger
