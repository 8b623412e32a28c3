#include "ghostledger/form/FormController.hpp"

#include "ghostledger/ledger/CsvExport.hpp"
#include "ghostledger/ledger/ExpenseCalculator.hpp"
#include "util/CivilTime.h"
#include "util/PathUtf8.h"

#include <charconv>
#include <chrono>
#include <cmath>
#include <system_error>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

namespace ghostledger::form {

namespace {

[[nodiscard]] std::string_view Trim(std::string_view sv) noexcept
{
    auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; };
    while (!sv.empty() && isSpace(sv.front()))
        sv.remove_prefix(1);
    while (!sv.empty() && isSpace(sv.back()))
        sv.remove_suffix(1);
    return sv;
}

[[nodiscard]] bool ConsumePrefix(std::string_view& sv, std::string_view prefix) noexcept
{
    if (prefix.empty() || sv.substr(0, prefix.size()) != prefix)
        return false;
    sv.remove_prefix(prefix.size());
    return true;
}

[[nodiscard]] Field ToFormField(ledger::ValidationField f) noexcept
{
    switch (f)
    {
    case ledger::ValidationField::Amount: return Field::Amount;
    case ledger::ValidationField::Category: return Field::Category;
    case ledger::ValidationField::Date: return Field::Date;
    default: return Field::Label;
    }
}

[[nodiscard]] std::int64_t SystemNowUtc()
{
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

bool ParseAmount(std::string_view text, std::string_view currency, double& out) noexcept
{
    std::string_view sv = Trim(text);

    // Accept "£-20", "-£20", "-20" and "+20".
    const bool hadCurrency = ConsumePrefix(sv, currency);
    bool negative = false;
    if (!sv.empty() && (sv.front() == '-' || sv.front() == '+'))
    {
        negative = sv.front() == '-';
        sv.remove_prefix(1);
    }
    if (!hadCurrency)
        (void)ConsumePrefix(sv, currency);

    sv = Trim(sv);
    if (sv.empty())
        return false;

    // from_chars would also take "inf", "nan" and a second sign.
    const char first = sv.front();
    if (!((first >= '0' && first <= '9') || first == '.'))
        return false;

    double v = 0.0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v, std::chars_format::fixed);
    if (ec != std::errc{} || ptr != end || !std::isfinite(v))
        return false;

    out = negative ? -v : v;
    return true;
}

bool BuildEntry(const FormFields& fields,
                std::string_view currency,
                std::int64_t nowUtc,
                ledger::ExpenseEntry& out,
                std::vector<std::pair<Field, std::string>>* outErrors)
{
    bool ok = true;
    auto fail = [&](Field f, std::string msg) {
        ok = false;
        if (outErrors)
            outErrors->emplace_back(f, std::move(msg));
    };

    ledger::ExpenseEntry e;

    e.label = std::string(Trim(fields.label));
    if (e.label.empty())
        fail(Field::Label, "Label is required.");

    const std::string_view amount = Trim(fields.amount);
    if (amount.empty())
        fail(Field::Amount, "Amount is required.");
    else if (!ParseAmount(amount, currency, e.amount))
        fail(Field::Amount, "Amount must be a number.");

    e.category = std::string(Trim(fields.category));
    if (e.category.empty())
        e.category = ledger::kDefaultCategory;

    const std::string_view date = Trim(fields.date);
    if (date.empty())
    {
        e.timestampUnixSecondsUtc = nowUtc;
    }
    else if (const auto d = util::ParseIsoDate(date))
    {
        e.timestampUnixSecondsUtc = util::UnixSecondsFromCivil(*d);
    }
    else
    {
        fail(Field::Date, "Date must be YYYY-MM-DD.");
    }

    if (ok)
        out = std::move(e);
    return ok;
}

FormController::FormController(ledger::LedgerStore& store, DisplaySink sink, FormControllerOptions options)
    : m_store(store)
    , m_sink(std::move(sink))
    , m_options(std::move(options))
{
    if (m_options.exportDir.empty())
        m_options.exportDir = m_store.dataDir() / "exports";
}

std::int64_t FormController::now() const
{
    return m_options.clock ? m_options.clock() : SystemNowUtc();
}

void FormController::emit(DisplayMessage msg)
{
    if (m_sink)
        m_sink(msg);
}

void FormController::warn(std::string text)
{
    spdlog::warn("form: {}", text);
    emit(WarningRaised{std::move(text)});
}

void FormController::setState(FormState s)
{
    if (m_state == s)
        return;
    m_state = s;
    emit(StateChanged{s});
}

void FormController::start()
{
    ledger::StorageError err;
    if (!m_store.load(&err))
        warn("Could not read the saved run (" + err.describe() + "). Started an empty run instead.");

    m_fields = {};
    m_fields.category = ledger::kDefaultCategory;

    emit(StateChanged{m_state});
    emit(FieldsReset{m_fields});
    publishAggregate();
    publishRuns(/*reportSkipped=*/true);
}

void FormController::post(InputMessage msg)
{
    if (m_dispatching)
    {
        if (m_state == FormState::Submitting && std::holds_alternative<SubmitRequested>(msg))
        {
            spdlog::debug("form: submit ignored, previous submission still in flight");
            return;
        }
        m_pending.push_back(std::move(msg));
        return;
    }

    m_dispatching = true;
    dispatch(msg);
    m_dispatching = false;

    drainPending();
}

void FormController::drainPending()
{
    while (!m_pending.empty())
    {
        InputMessage next = std::move(m_pending.front());
        m_pending.pop_front();
        post(std::move(next));
    }
}

void FormController::dispatch(const InputMessage& msg)
{
    std::visit([this](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, FieldEdited>) onFieldEdited(m);
        else if constexpr (std::is_same_v<T, SubmitRequested>) onSubmit();
        else if constexpr (std::is_same_v<T, EditCancelled>) onEditCancelled();
        else if constexpr (std::is_same_v<T, ClearRunRequested>) onClearRun();
        else if constexpr (std::is_same_v<T, NewRunRequested>) onNewRun(m);
        else if constexpr (std::is_same_v<T, OpenRunRequested>) onOpenRun(m);
        else if constexpr (std::is_same_v<T, DeleteEntryRequested>) onDeleteEntry(m);
        else if constexpr (std::is_same_v<T, CompareRequested>) onCompare(m);
        else if constexpr (std::is_same_v<T, MonthFilterChanged>) onMonthFilter(m);
        else if constexpr (std::is_same_v<T, ExportRequested>) onExport();
        else if constexpr (std::is_same_v<T, RefreshRunsRequested>) publishRuns(/*reportSkipped=*/true);
    }, msg);
}

void FormController::onFieldEdited(const FieldEdited& m)
{
    switch (m.field)
    {
    case Field::Label: m_fields.label = m.text; break;
    case Field::Amount: m_fields.amount = m.text; break;
    case Field::Category: m_fields.category = m.text; break;
    case Field::Date: m_fields.date = m.text; break;
    }

    if (m_state == FormState::Idle)
        setState(FormState::Editing);
}

void FormController::onSubmit()
{
    if (m_state == FormState::Submitting)
        return;

    setState(FormState::Submitting);

    std::vector<std::pair<Field, std::string>> errors;
    ledger::ExpenseEntry entry;
    if (!BuildEntry(m_fields, m_options.currency, now(), entry, &errors))
    {
        // Fields fixed since the last submit must lose their old error.
        emit(FieldErrorsCleared{});
        for (auto& [field, message] : errors)
        {
            spdlog::debug("form: invalid field: {}", message);
            emit(FieldErrorShown{field, std::move(message)});
        }
        setState(FormState::Editing);
        return;
    }

    emit(FieldErrorsCleared{});

    ledger::ValidationError invalid;
    ledger::StorageError storage;
    switch (m_store.append(entry, &invalid, &storage))
    {
    case ledger::MutationStatus::Invalid:
        emit(FieldErrorShown{ToFormField(invalid.field), invalid.message});
        setState(FormState::Editing);
        return;

    case ledger::MutationStatus::StorageFailed:
        // Keep what the user typed so they can retry.
        warn("Entry not saved (" + storage.describe() + ").");
        setState(FormState::Editing);
        return;

    case ledger::MutationStatus::Ok:
        break;
    }

    m_fields.label.clear();
    m_fields.amount.clear();
    m_fields.date.clear();
    emit(FieldsReset{m_fields});

    publishAggregate();
    publishComparison();
    publishRuns();
    setState(FormState::Idle);
}

void FormController::onEditCancelled()
{
    m_fields.label.clear();
    m_fields.amount.clear();
    m_fields.date.clear();
    emit(FieldErrorsCleared{});
    emit(FieldsReset{m_fields});
    setState(FormState::Idle);
}

void FormController::onClearRun()
{
    ledger::StorageError err;
    if (!m_store.clear(&err))
    {
        warn("Run not cleared (" + err.describe() + ").");
        return;
    }

    publishAggregate();
    publishComparison();
    publishRuns();
}

void FormController::onNewRun(const NewRunRequested& m)
{
    ledger::StorageError err;
    if (!m_store.newRun(m.name, &err))
    {
        warn("Could not start a new run (" + err.describe() + ").");
        return;
    }

    emit(InfoRaised{"Started " + m_store.session().name + "."});
    publishAggregate();
    publishComparison();
    publishRuns();
}

void FormController::onOpenRun(const OpenRunRequested& m)
{
    ledger::StorageError err;
    if (!m_store.activate(m.sessionId, &err))
    {
        warn("Could not open run (" + err.describe() + ").");
        return;
    }

    if (m_compareId == m_store.session().id)
        m_compareId.clear();

    publishAggregate();
    publishComparison();
    publishRuns();
}

void FormController::onDeleteEntry(const DeleteEntryRequested& m)
{
    ledger::ValidationError invalid;
    ledger::StorageError storage;
    switch (m_store.removeAt(m.index, &invalid, &storage))
    {
    case ledger::MutationStatus::Invalid:
        warn(invalid.message);
        return;
    case ledger::MutationStatus::StorageFailed:
        warn("Entry not deleted (" + storage.describe() + ").");
        return;
    case ledger::MutationStatus::Ok:
        break;
    }

    publishAggregate();
    publishComparison();
    publishRuns();
}

void FormController::onCompare(const CompareRequested& m)
{
    m_compareId = m.otherSessionId;
    publishComparison();
}

void FormController::onMonthFilter(const MonthFilterChanged& m)
{
    m_monthFilter = m.month;
    publishAggregate();
}

void FormController::onExport()
{
    const ledger::Session& s = m_store.session();
    const std::filesystem::path target = m_options.exportDir / (s.id + ".csv");

    ledger::StorageError err;
    if (!ledger::ExportCsv(s, target, &err))
    {
        warn("Export failed (" + err.describe() + ").");
        return;
    }

    emit(InfoRaised{"Exported to " + util::PathToUtf8String(target)});
}

LedgerView FormController::currentView() const
{
    const ledger::Session& s = m_store.session();

    LedgerView v;
    v.sessionId = s.id;
    v.sessionName = s.name;
    v.entries = s.entries;
    v.aggregate = ledger::Summarize(s);
    v.emfLevel = ledger::EmfLevelFromTotal(v.aggregate.total);
    v.categories = ledger::KnownCategories(s);
    v.years = ledger::DistinctYears(s);
    v.monthFilter = m_monthFilter;
    if (m_monthFilter)
        v.monthTotal = ledger::MonthTotal(s, m_monthFilter->year, m_monthFilter->month);
    return v;
}

void FormController::publishAggregate()
{
    emit(AggregateChanged{currentView()});
}

void FormController::publishRuns(bool reportSkipped)
{
    std::vector<ledger::SessionSummary> runs;
    std::vector<ledger::StorageError> skipped;
    if (!m_store.listSessions(runs, &skipped))
    {
        warn("Could not list runs in " + util::PathToUtf8String(m_store.sessionsDir()) + ".");
        return;
    }

    if (reportSkipped)
    {
        for (const ledger::StorageError& e : skipped)
            emit(WarningRaised{"Skipped unreadable run: " + e.describe()});
    }

    emit(RunsListed{std::move(runs)});
}

void FormController::publishComparison()
{
    if (m_compareId.empty())
    {
        emit(ComparisonChanged{});
        return;
    }

    ledger::Session other;
    ledger::StorageError err;
    if (!m_store.loadSession(m_compareId, other, &err))
    {
        m_compareId.clear();
        warn("Could not open run for comparison (" + err.describe() + ").");
        emit(ComparisonChanged{});
        return;
    }

    ComparisonChanged c;
    c.otherSessionId = other.id;
    c.otherSessionName = other.name;
    c.otherTotal = ledger::Total(other);
    c.diff = ledger::Diff(m_store.session(), other);
    emit(std::move(c));
}

} // namespace ghostledger::form
