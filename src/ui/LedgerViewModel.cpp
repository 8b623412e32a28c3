#include "ui/LedgerViewModel.h"

#include <type_traits>
#include <variant>

namespace ghostledger::ui {

void LedgerViewModel::apply(const form::DisplayMessage& msg, double nowSeconds)
{
    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, form::AggregateChanged>)
        {
            m_view = m.view;
            m_hasView = true;
        }
        else if constexpr (std::is_same_v<T, form::StateChanged>)
        {
            m_state = m.state;
        }
        else if constexpr (std::is_same_v<T, form::FieldErrorShown>)
        {
            m_fieldErrors[static_cast<std::size_t>(m.field)] = m.message;
        }
        else if constexpr (std::is_same_v<T, form::FieldErrorsCleared>)
        {
            for (auto& e : m_fieldErrors)
                e.clear();
        }
        else if constexpr (std::is_same_v<T, form::FieldsReset>)
        {
            m_fields = m.fields;
            ++m_fieldsGeneration;
        }
        else if constexpr (std::is_same_v<T, form::RunsListed>)
        {
            m_runs = m.runs;
        }
        else if constexpr (std::is_same_v<T, form::ComparisonChanged>)
        {
            m_comparison = m;
        }
        else if constexpr (std::is_same_v<T, form::WarningRaised>)
        {
            m_notices.push(m.text, util::NoticeSeverity::Warning, nowSeconds, kWarningToastSeconds);
        }
        else if constexpr (std::is_same_v<T, form::InfoRaised>)
        {
            m_notices.push(m.text, util::NoticeSeverity::Info, nowSeconds, kInfoToastSeconds);
        }
    }, msg);
}

const std::string& LedgerViewModel::fieldError(form::Field f) const noexcept
{
    return m_fieldErrors[static_cast<std::size_t>(f)];
}

bool LedgerViewModel::hasFieldErrors() const noexcept
{
    for (const auto& e : m_fieldErrors)
    {
        if (!e.empty())
            return true;
    }
    return false;
}

} // namespace ghostledger::ui
