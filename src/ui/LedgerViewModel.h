#pragma once

#include "ghostledger/form/FormMessages.hpp"
#include "util/NotificationLog.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace ghostledger::ui {

inline constexpr float kWarningToastSeconds = 6.0f;
inline constexpr float kInfoToastSeconds = 3.0f;

// What the ledger window shows, rebuilt only from DisplayMessages.
// Has no ImGui dependency so it can be driven from tests.
class LedgerViewModel
{
public:
    void apply(const form::DisplayMessage& msg, double nowSeconds);

    [[nodiscard]] bool hasView() const noexcept { return m_hasView; }
    [[nodiscard]] const form::LedgerView& view() const noexcept { return m_view; }
    [[nodiscard]] form::FormState state() const noexcept { return m_state; }

    // Last field values pushed by the controller. `fieldsGeneration` bumps on
    // every FieldsReset so the window knows to re-sync its edit buffers.
    [[nodiscard]] const form::FormFields& fields() const noexcept { return m_fields; }
    [[nodiscard]] std::uint64_t fieldsGeneration() const noexcept { return m_fieldsGeneration; }

    // "" when the field has no error.
    [[nodiscard]] const std::string& fieldError(form::Field f) const noexcept;
    [[nodiscard]] bool hasFieldErrors() const noexcept;

    [[nodiscard]] const std::vector<ledger::SessionSummary>& runs() const noexcept { return m_runs; }
    [[nodiscard]] const form::ComparisonChanged& comparison() const noexcept { return m_comparison; }
    [[nodiscard]] bool comparing() const noexcept { return !m_comparison.otherSessionId.empty(); }

    [[nodiscard]] util::NotificationLog& notices() noexcept { return m_notices; }
    [[nodiscard]] const util::NotificationLog& notices() const noexcept { return m_notices; }

private:
    bool m_hasView = false;
    form::LedgerView m_view;
    form::FormState m_state = form::FormState::Idle;

    form::FormFields m_fields;
    std::uint64_t m_fieldsGeneration = 0;
    std::array<std::string, 4> m_fieldErrors;

    std::vector<ledger::SessionSummary> m_runs;
    form::ComparisonChanged m_comparison;

    util::NotificationLog m_notices;
};

} // namespace ghostledger::ui
