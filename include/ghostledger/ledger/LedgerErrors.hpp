#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace ghostledger::ledger {

// Which user-facing field a validation failure belongs to.
enum class ValidationField : std::uint8_t
{
    None = 0,
    Label,
    Amount,
    Category,
    Date,
    Index,
};

[[nodiscard]] inline const char* ValidationFieldName(ValidationField f) noexcept
{
    switch (f)
    {
    case ValidationField::None: return "none";
    case ValidationField::Label: return "label";
    case ValidationField::Amount: return "amount";
    case ValidationField::Category: return "category";
    case ValidationField::Date: return "date";
    case ValidationField::Index: return "index";
    }
    return "?";
}

// Malformed user input. Never mutates state; reported inline next to the field.
struct ValidationError
{
    ValidationField field = ValidationField::None;
    std::string message;
};

enum class StorageErrorKind : std::uint8_t
{
    ReadFailed = 0,
    Corrupt,
    WriteFailed,
    NotFound,
};

[[nodiscard]] inline const char* StorageErrorKindName(StorageErrorKind k) noexcept
{
    switch (k)
    {
    case StorageErrorKind::ReadFailed: return "read failed";
    case StorageErrorKind::Corrupt: return "corrupt data";
    case StorageErrorKind::WriteFailed: return "write failed";
    case StorageErrorKind::NotFound: return "not found";
    }
    return "?";
}

// The data folder could not be read or written. Never fatal: reads fall back to
// an empty run, writes leave both memory and disk at the last good state.
struct StorageError
{
    StorageErrorKind kind = StorageErrorKind::ReadFailed;
    std::filesystem::path path;
    std::string message;
    std::error_code ec;

    // "write failed: /home/u/.local/share/GhostLedger/sessions/run-1.json (No space left on device)"
    [[nodiscard]] std::string describe() const
    {
        std::string out = StorageErrorKindName(kind);
        out += ": ";
        out += path.string();
        if (!message.empty())
        {
            out += " (";
            out += message;
            if (ec)
            {
                out += ": ";
                out += ec.message();
            }
            out += ")";
        }
        else if (ec)
        {
            out += " (";
            out += ec.message();
            out += ")";
        }
        return out;
    }
};

} // namespace ghostledger::ledger
