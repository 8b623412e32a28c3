#pragma once

#include "ghostledger/form/FormMessages.hpp"
#include "ghostledger/ledger/LedgerStore.hpp"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ghostledger::form {

// Strict number parse for the amount field: optional sign, optional currency
// prefix, decimal digits. Rejects inf/nan and trailing junk.
[[nodiscard]] bool ParseAmount(std::string_view text, std::string_view currency, double& out) noexcept;

// Validate raw fields into an entry. Appends one error per bad field.
// `nowUtc` stamps entries whose date field is empty.
[[nodiscard]] bool BuildEntry(const FormFields& fields,
                              std::string_view currency,
                              std::int64_t nowUtc,
                              ledger::ExpenseEntry& out,
                              std::vector<std::pair<Field, std::string>>* outErrors);

struct FormControllerOptions
{
    std::string currency = "\xC2\xA3"; // "£"
    std::filesystem::path exportDir;   // empty = <data>/exports
    ledger::ClockFn clock;             // empty = system clock
};

// Drives the entry form: Idle -> Editing -> Submitting -> Idle.
//
// The GUI never calls the store. It posts InputMessages and renders the
// DisplayMessages that come back through the sink. Everything runs on the
// UI thread; the sink is invoked synchronously from post().
//
// A SubmitRequested that arrives while a submission is in flight (e.g. posted
// from inside the sink) is dropped. Any other message that arrives then is
// queued and handled once the controller is back to Idle/Editing.
class FormController
{
public:
    FormController(ledger::LedgerStore& store, DisplaySink sink, FormControllerOptions options = {});

    // Load the active run and publish the first view. A damaged run is reported
    // as a warning and the form continues on an empty run.
    void start();

    void post(InputMessage msg);

    [[nodiscard]] FormState state() const noexcept { return m_state; }
    [[nodiscard]] const FormFields& fields() const noexcept { return m_fields; }
    [[nodiscard]] const std::string& currency() const noexcept { return m_options.currency; }

    // Last view published through AggregateChanged.
    [[nodiscard]] LedgerView currentView() const;

private:
    void dispatch(const InputMessage& msg);
    void drainPending();

    void onFieldEdited(const FieldEdited& m);
    void onSubmit();
    void onEditCancelled();
    void onClearRun();
    void onNewRun(const NewRunRequested& m);
    void onOpenRun(const OpenRunRequested& m);
    void onDeleteEntry(const DeleteEntryRequested& m);
    void onCompare(const CompareRequested& m);
    void onMonthFilter(const MonthFilterChanged& m);
    void onExport();

    void setState(FormState s);
    void emit(DisplayMessage msg);
    void warn(std::string text);
    void publishAggregate();
    void publishRuns(bool reportSkipped = false);
    void publishComparison();

    [[nodiscard]] std::int64_t now() const;

    ledger::LedgerStore& m_store;
    DisplaySink m_sink;
    FormControllerOptions m_options;

    FormState m_state = FormState::Idle;
    FormFields m_fields;

    std::optional<YearMonth> m_monthFilter;
    std::string m_compareId;

    bool m_dispatching = false;
    std::deque<InputMessage> m_pending;
};

} // namespace ghostledger::form
