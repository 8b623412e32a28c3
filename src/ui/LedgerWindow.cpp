#include "ui/LedgerWindow.h"

#include "ghostledger/ledger/ExpenseCalculator.hpp"
#include "util/CivilTime.h"

#include <imgui.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <numeric>
#include <utility>
#include <vector>

namespace ghostledger::ui {

namespace {

constexpr const char* kMonthNames[] = {"All months", "Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                       "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// EMF 1..5: blue, green, yellow, orange, red.
ImU32 EmfColor(int level)
{
    switch (level)
    {
    case 2: return IM_COL32(0x36, 0xb2, 0x4a, 255);
    case 3: return IM_COL32(0xff, 0xd8, 0x4a, 255);
    case 4: return IM_COL32(0xff, 0x8f, 0x2b, 255);
    case 5: return IM_COL32(0xff, 0x37, 0x37, 255);
    default: return IM_COL32(0x6e, 0xb6, 0xff, 255);
    }
}

template <std::size_t N>
void CopyToBuffer(std::array<char, N>& dst, const std::string& src)
{
    const std::size_t n = std::min(src.size(), N - 1);
    std::memcpy(dst.data(), src.data(), n);
    dst[n] = '\0';
}

void FieldErrorText(const std::string& error)
{
    if (error.empty())
        return;
    ImGui::PushStyleColor(ImGuiCol_Text, IM_COL32(255, 140, 140, 255));
    ImGui::TextUnformatted(error.c_str());
    ImGui::PopStyleColor();
}

} // namespace

LedgerWindow::LedgerWindow(std::string currency, bool showCategoryBreakdown)
    : m_currency(std::move(currency))
    , m_showBreakdown(showCategoryBreakdown)
{
}

void LedgerWindow::onDisplay(const form::DisplayMessage& msg)
{
    m_model.apply(msg, m_clockSeconds);
}

std::vector<form::InputMessage> LedgerWindow::takeOutbox()
{
    std::vector<form::InputMessage> out;
    out.swap(m_outbox);
    return out;
}

void LedgerWindow::send(form::InputMessage msg)
{
    m_outbox.push_back(std::move(msg));
}

std::string LedgerWindow::money(double amount) const
{
    return ledger::FormatMoney(amount, m_currency);
}

void LedgerWindow::syncBuffersFromModel()
{
    if (m_syncedGeneration == m_model.fieldsGeneration())
        return;
    m_syncedGeneration = m_model.fieldsGeneration();

    const form::FormFields& f = m_model.fields();
    CopyToBuffer(m_label, f.label);
    CopyToBuffer(m_amount, f.amount);
    CopyToBuffer(m_category, f.category);
    CopyToBuffer(m_date, f.date);
}

void LedgerWindow::editField(form::Field field, const char* text)
{
    send(form::FieldEdited{field, std::string(text)});
}

void LedgerWindow::draw(float dtSeconds)
{
    if (dtSeconds > 0.0f)
    {
        m_clockSeconds += dtSeconds;
        m_model.notices().tick(dtSeconds);
    }

    syncBuffersFromModel();

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus;

    if (ImGui::Begin("GhostLedger", nullptr, flags))
    {
        drawHeader();
        ImGui::Separator();
        drawRunBar();
        ImGui::Separator();
        drawForm();
        ImGui::Separator();
        drawMonthFilter();
        drawEntries();
        if (m_showBreakdown)
            drawBreakdown();
    }
    ImGui::End();

    drawToasts();
}

void LedgerWindow::drawHeader()
{
    const form::LedgerView& v = m_model.view();

    ImGui::Text("%s", v.sessionName.empty() ? "(no run)" : v.sessionName.c_str());
    ImGui::SameLine();
    ImGui::TextDisabled("%s", v.sessionId.c_str());

    const std::string total = "Total: " + money(v.aggregate.total);
    ImGui::TextUnformatted(total.c_str());
    ImGui::SameLine();

    // EMF indicator dot.
    const float r = ImGui::GetTextLineHeight() * 0.4f;
    const ImVec2 p = ImGui::GetCursorScreenPos();
    ImDrawList* dl = ImGui::GetWindowDrawList();
    dl->AddCircleFilled(ImVec2(p.x + r, p.y + ImGui::GetTextLineHeight() * 0.5f), r, EmfColor(v.emfLevel));
    dl->AddCircle(ImVec2(p.x + r, p.y + ImGui::GetTextLineHeight() * 0.5f), r, IM_COL32(0x2a, 0x2a, 0x2a, 255));
    ImGui::Dummy(ImVec2(r * 2.0f, ImGui::GetTextLineHeight()));
    ImGui::SameLine();
    ImGui::Text("EMF %d", v.emfLevel);

    ImGui::SameLine();
    ImGui::TextDisabled("[%s]", form::FormStateName(m_model.state()));

    if (m_model.comparing())
    {
        const form::ComparisonChanged& c = m_model.comparison();
        const std::string line = "vs " + c.otherSessionName + ": " + money(c.otherTotal) +
                                 "  (diff " + money(c.diff) + ")";
        ImGui::TextUnformatted(line.c_str());
    }
}

void LedgerWindow::drawRunBar()
{
    const form::LedgerView& v = m_model.view();
    const auto& runs = m_model.runs();

    // Open another run.
    ImGui::SetNextItemWidth(260.0f);
    if (ImGui::BeginCombo("Run", v.sessionName.c_str()))
    {
        for (const auto& r : runs)
        {
            char label[256];
            std::snprintf(label, sizeof(label), "%s (%zu)##open_%s", r.name.c_str(), r.entryCount, r.id.c_str());
            if (ImGui::Selectable(label, r.id == v.sessionId) && r.id != v.sessionId)
                send(form::OpenRunRequested{r.id});
        }
        ImGui::EndCombo();
    }

    ImGui::SameLine();
    ImGui::SetNextItemWidth(260.0f);
    const char* comparePreview = m_model.comparing() ? m_model.comparison().otherSessionName.c_str() : "(none)";
    if (ImGui::BeginCombo("Compare", comparePreview))
    {
        if (ImGui::Selectable("(none)", !m_model.comparing()))
            send(form::CompareRequested{});
        for (const auto& r : runs)
        {
            if (r.id == v.sessionId)
                continue;
            char label[256];
            std::snprintf(label, sizeof(label), "%s##cmp_%s", r.name.c_str(), r.id.c_str());
            if (ImGui::Selectable(label, r.id == m_model.comparison().otherSessionId))
                send(form::CompareRequested{r.id});
        }
        ImGui::EndCombo();
    }

    ImGui::SetNextItemWidth(260.0f);
    ImGui::InputTextWithHint("##new_run", "New run name", m_newRunName.data(), m_newRunName.size());
    ImGui::SameLine();
    if (ImGui::Button("New run"))
    {
        send(form::NewRunRequested{std::string(m_newRunName.data())});
        m_newRunName[0] = '\0';
    }
    ImGui::SameLine();
    if (ImGui::Button("Refresh"))
        send(form::RefreshRunsRequested{});
    ImGui::SameLine();
    if (ImGui::Button("Export CSV"))
        send(form::ExportRequested{});
    ImGui::SameLine();
    if (ImGui::Button("Clear run"))
        ImGui::OpenPopup("Clear run?");

    if (ImGui::BeginPopupModal("Clear run?", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        ImGui::TextUnformatted("Delete every entry in this run?");
        if (ImGui::Button("Clear"))
        {
            send(form::ClearRunRequested{});
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel"))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
}

void LedgerWindow::drawForm()
{
    const bool busy = m_model.state() == form::FormState::Submitting;
    if (busy)
        ImGui::BeginDisabled();

    ImGui::SetNextItemWidth(260.0f);
    if (ImGui::InputText("Label", m_label.data(), m_label.size()))
        editField(form::Field::Label, m_label.data());
    FieldErrorText(m_model.fieldError(form::Field::Label));

    ImGui::SetNextItemWidth(140.0f);
    bool submit = ImGui::InputText("Amount", m_amount.data(), m_amount.size(), ImGuiInputTextFlags_EnterReturnsTrue);
    if (ImGui::IsItemEdited())
        editField(form::Field::Amount, m_amount.data());
    FieldErrorText(m_model.fieldError(form::Field::Amount));

    // Category: pick a known one or type a new one.
    ImGui::SetNextItemWidth(180.0f);
    if (ImGui::InputText("##category_text", m_category.data(), m_category.size()))
        editField(form::Field::Category, m_category.data());
    ImGui::SameLine();
    if (ImGui::BeginCombo("Category", nullptr, ImGuiComboFlags_NoPreview))
    {
        for (const auto& c : m_model.view().categories)
        {
            if (ImGui::Selectable(c.c_str(), c == m_category.data()))
            {
                CopyToBuffer(m_category, c);
                editField(form::Field::Category, m_category.data());
            }
        }
        ImGui::EndCombo();
    }
    FieldErrorText(m_model.fieldError(form::Field::Category));

    ImGui::SetNextItemWidth(140.0f);
    if (ImGui::InputTextWithHint("Date", "YYYY-MM-DD", m_date.data(), m_date.size()))
        editField(form::Field::Date, m_date.data());
    FieldErrorText(m_model.fieldError(form::Field::Date));

    submit |= ImGui::Button("Add entry");
    ImGui::SameLine();
    if (ImGui::Button("Cancel"))
        send(form::EditCancelled{});

    if (busy)
        ImGui::EndDisabled();

    if (submit && !busy)
        send(form::SubmitRequested{});
}

void LedgerWindow::drawMonthFilter()
{
    const form::LedgerView& v = m_model.view();

    std::string yearPreview = m_filterYear == 0 ? std::string("All years") : std::to_string(m_filterYear);
    ImGui::SetNextItemWidth(120.0f);
    bool changed = false;
    if (ImGui::BeginCombo("##year", yearPreview.c_str()))
    {
        if (ImGui::Selectable("All years", m_filterYear == 0))
        {
            m_filterYear = 0;
            m_filterMonth = 0;
            changed = true;
        }
        for (const int y : v.years)
        {
            const std::string label = std::to_string(y);
            if (ImGui::Selectable(label.c_str(), y == m_filterYear))
            {
                m_filterYear = y;
                changed = true;
            }
        }
        ImGui::EndCombo();
    }

    ImGui::SameLine();
    if (m_filterYear == 0)
        ImGui::BeginDisabled();
    ImGui::SetNextItemWidth(120.0f);
    if (ImGui::Combo("Month", &m_filterMonth, kMonthNames, IM_ARRAYSIZE(kMonthNames)))
        changed = true;
    if (m_filterYear == 0)
        ImGui::EndDisabled();

    if (changed)
    {
        if (m_filterYear != 0 && m_filterMonth != 0)
            send(form::MonthFilterChanged{form::YearMonth{m_filterYear, m_filterMonth}});
        else
            send(form::MonthFilterChanged{});
    }

    if (v.monthFilter)
    {
        ImGui::SameLine();
        const std::string line = "Month total: " + money(v.monthTotal);
        ImGui::TextUnformatted(line.c_str());
    }
}

void LedgerWindow::drawEntries()
{
    const form::LedgerView& v = m_model.view();

    const ImGuiTableFlags flags = ImGuiTableFlags_RowBg | ImGuiTableFlags_Borders |
                                  ImGuiTableFlags_ScrollY | ImGuiTableFlags_SizingStretchProp;
    const float tableH = m_showBreakdown ? ImGui::GetContentRegionAvail().y * 0.6f : 0.0f;

    if (!ImGui::BeginTable("entries_table", 5, flags, ImVec2(0, tableH)))
        return;

    ImGui::TableSetupScrollFreeze(0, 1);
    ImGui::TableSetupColumn("Date", ImGuiTableColumnFlags_WidthFixed, 100.0f);
    ImGui::TableSetupColumn("Category");
    ImGui::TableSetupColumn("Label");
    ImGui::TableSetupColumn("Amount");
    ImGui::TableSetupColumn("", ImGuiTableColumnFlags_WidthFixed, 60.0f);
    ImGui::TableHeadersRow();

    std::vector<std::size_t> rows;
    if (v.monthFilter)
    {
        rows = ledger::EntriesInMonth(v.entries, v.monthFilter->year, v.monthFilter->month);
    }
    else
    {
        rows.resize(v.entries.size());
        std::iota(rows.begin(), rows.end(), std::size_t{0});
    }

    for (const std::size_t i : rows)
    {
        const ledger::ExpenseEntry& e = v.entries[i];

        ImGui::TableNextRow();

        ImGui::TableNextColumn();
        if (e.timestampUnixSecondsUtc)
            ImGui::TextUnformatted(util::FormatIsoDate(util::CivilFromUnixSeconds(*e.timestampUnixSecondsUtc)).c_str());
        else
            ImGui::TextDisabled("-");

        ImGui::TableNextColumn();
        ImGui::TextUnformatted(e.category.c_str());

        ImGui::TableNextColumn();
        ImGui::TextUnformatted(e.label.c_str());

        ImGui::TableNextColumn();
        ImGui::TextUnformatted(money(e.amount).c_str());

        ImGui::TableNextColumn();
        char delId[32];
        std::snprintf(delId, sizeof(delId), "Delete##%zu", i);
        if (ImGui::SmallButton(delId))
            send(form::DeleteEntryRequested{i});
    }

    ImGui::EndTable();
}

void LedgerWindow::drawBreakdown()
{
    const form::LedgerView& v = m_model.view();
    if (v.aggregate.byCategory.empty())
        return;

    ImGui::SeparatorText("By category");
    if (!ImGui::BeginTable("breakdown_table", 2, ImGuiTableFlags_RowBg))
        return;

    ImGui::TableSetupColumn("Category");
    ImGui::TableSetupColumn("Subtotal");
    for (const auto& [category, subtotal] : v.aggregate.byCategory)
    {
        ImGui::TableNextRow();
        ImGui::TableNextColumn();
        ImGui::TextUnformatted(category.c_str());
        ImGui::TableNextColumn();
        ImGui::TextUnformatted(money(subtotal).c_str());
    }
    ImGui::EndTable();
}

void LedgerWindow::drawToasts()
{
    const auto& toasts = m_model.notices().toasts();
    if (toasts.empty())
        return;

    ImDrawList* dl = ImGui::GetForegroundDrawList();
    const ImGuiViewport* viewport = ImGui::GetMainViewport();

    float y = viewport->WorkPos.y + viewport->WorkSize.y - 12.0f;

    // Newest at the bottom.
    for (auto it = toasts.rbegin(); it != toasts.rend(); ++it)
    {
        const util::Toast& t = *it;

        float a = 1.0f;
        if (t.ttlSeconds < 0.5f)
            a = std::clamp(t.ttlSeconds / 0.5f, 0.0f, 1.0f);

        ImU32 textCol = IM_COL32(255, 255, 255, static_cast<int>(220 * a));
        if (t.notice.severity == util::NoticeSeverity::Warning)
            textCol = IM_COL32(255, 210, 120, static_cast<int>(230 * a));
        const ImU32 bgCol = IM_COL32(0, 0, 0, static_cast<int>(170 * a));

        char line[512] = {};
        (void)std::snprintf(line, sizeof(line), "[%s] %s",
                            util::NoticeSeverityName(t.notice.severity), t.notice.text.c_str());

        const ImVec2 sz = ImGui::CalcTextSize(line);
        y -= sz.y + 6.0f;
        const ImVec2 pos = {viewport->WorkPos.x + 12.0f, y};

        dl->AddRectFilled({pos.x - 4.f, pos.y - 2.f}, {pos.x + sz.x + 4.f, pos.y + sz.y + 2.f}, bgCol, 4.0f);
        dl->AddText(pos, textCol, line);
    }
}

} // namespace ghostledger::ui
