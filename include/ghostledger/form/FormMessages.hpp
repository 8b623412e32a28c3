#pragma once

#include "ghostledger/ledger/ExpenseCalculator.hpp"
#include "ghostledger/ledger/ExpenseEntry.hpp"
#include "ghostledger/ledger/LedgerErrors.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ghostledger::form {

enum class FormState : std::uint8_t
{
    Idle = 0,
    Editing,
    Submitting,
};

[[nodiscard]] inline const char* FormStateName(FormState s) noexcept
{
    switch (s)
    {
    case FormState::Idle: return "Idle";
    case FormState::Editing: return "Editing";
    case FormState::Submitting: return "Submitting";
    }
    return "?";
}

enum class Field : std::uint8_t
{
    Label = 0,
    Amount,
    Category,
    Date,
};

// Raw text as typed; nothing here is validated yet.
struct FormFields
{
    std::string label;
    std::string amount;
    std::string category;
    std::string date; // "YYYY-MM-DD" or empty for "now"
};

struct YearMonth
{
    int year = 1970;
    int month = 1;

    friend bool operator==(const YearMonth&, const YearMonth&) = default;
};

// -----------------------------------------------------------------------------
// Input messages (GUI -> controller)
// -----------------------------------------------------------------------------

struct FieldEdited { Field field; std::string text; };
struct SubmitRequested {};
struct EditCancelled {};
struct ClearRunRequested {};
struct NewRunRequested { std::string name; };
struct OpenRunRequested { std::string sessionId; };
struct DeleteEntryRequested { std::size_t index = 0; };
struct CompareRequested { std::string otherSessionId; }; // empty = stop comparing
struct MonthFilterChanged { std::optional<YearMonth> month; };
struct ExportRequested {};
struct RefreshRunsRequested {};

using InputMessage = std::variant<FieldEdited,
                                  SubmitRequested,
                                  EditCancelled,
                                  ClearRunRequested,
                                  NewRunRequested,
                                  OpenRunRequested,
                                  DeleteEntryRequested,
                                  CompareRequested,
                                  MonthFilterChanged,
                                  ExportRequested,
                                  RefreshRunsRequested>;

// -----------------------------------------------------------------------------
// Display messages (controller -> GUI)
// -----------------------------------------------------------------------------

// Everything the totals header, entries table and breakdown need.
struct LedgerView
{
    std::string sessionId;
    std::string sessionName;
    std::vector<ledger::ExpenseEntry> entries;
    ledger::Aggregate aggregate;
    int emfLevel = 1;

    std::vector<std::string> categories;
    std::vector<int> years;

    std::optional<YearMonth> monthFilter;
    double monthTotal = 0.0;
};

struct AggregateChanged { LedgerView view; };
struct StateChanged { FormState state; };
struct FieldErrorShown { Field field; std::string message; };
struct FieldErrorsCleared {};
struct FieldsReset { FormFields fields; };
struct RunsListed { std::vector<ledger::SessionSummary> runs; };

struct ComparisonChanged
{
    // Empty id = comparison off.
    std::string otherSessionId;
    std::string otherSessionName;
    double otherTotal = 0.0;
    double diff = 0.0; // active total - other total
};

struct WarningRaised { std::string text; };
struct InfoRaised { std::string text; };

using DisplayMessage = std::variant<AggregateChanged,
                                    StateChanged,
                                    FieldErrorShown,
                                    FieldErrorsCleared,
                                    FieldsReset,
                                    RunsListed,
                                    ComparisonChanged,
                                    WarningRaised,
                                    InfoRaised>;

using DisplaySink = std::function<void(const DisplayMessage&)>;

} // namespace ghostledger::form
