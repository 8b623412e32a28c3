#pragma once

#include "ghostledger/form/FormMessages.hpp"
#include "ui/LedgerViewModel.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace ghostledger::ui {

// The single GhostLedger window.
//
// Widgets never call the controller directly: anything the user does during
// draw() is queued and handed out through takeOutbox() after the frame, so
// the view model is never mutated while it is being drawn.
class LedgerWindow
{
public:
    LedgerWindow(std::string currency, bool showCategoryBreakdown);

    // DisplaySink target.
    void onDisplay(const form::DisplayMessage& msg);

    void draw(float dtSeconds);

    [[nodiscard]] std::vector<form::InputMessage> takeOutbox();

    [[nodiscard]] const LedgerViewModel& model() const noexcept { return m_model; }

private:
    void drawHeader();
    void drawRunBar();
    void drawForm();
    void drawEntries();
    void drawBreakdown();
    void drawMonthFilter();
    void drawToasts();

    void syncBuffersFromModel();
    void editField(form::Field field, const char* text);
    void send(form::InputMessage msg);

    [[nodiscard]] std::string money(double amount) const;

    std::string m_currency;
    bool m_showBreakdown = true;

    LedgerViewModel m_model;
    double m_clockSeconds = 0.0;

    std::uint64_t m_syncedGeneration = 0;
    std::array<char, 128> m_label{};
    std::array<char, 32> m_amount{};
    std::array<char, 64> m_category{};
    std::array<char, 16> m_date{};
    std::array<char, 64> m_newRunName{};

    int m_filterYear = 0;  // 0 = all
    int m_filterMonth = 0; // 0 = all

    std::vector<form::InputMessage> m_outbox;
};

} // namespace ghostledger::ui
