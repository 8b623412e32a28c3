#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ghostledger::util {

enum class NoticeSeverity : std::uint8_t
{
    Info = 0,
    Warning,
};

[[nodiscard]] inline const char* NoticeSeverityName(NoticeSeverity s) noexcept
{
    switch (s)
    {
    case NoticeSeverity::Info: return "INFO";
    case NoticeSeverity::Warning: return "WARN";
    }
    return "?";
}

struct Notice
{
    double timeSeconds = 0.0;
    NoticeSeverity severity = NoticeSeverity::Info;
    std::string text;
};

struct Toast
{
    Notice notice;
    float ttlSeconds = 0.0f;
};

// Bounded history of controller warnings/infos plus expiring toasts for the
// ledger window.
//
//  - The history drops its oldest entry on overflow.
//  - Toasts are bounded too and expire by TTL.
//  - Pushing the same text twice in a row refreshes the existing toast
//    instead of stacking a duplicate.
class NotificationLog
{
public:
    [[nodiscard]] std::size_t maxHistory() const noexcept { return m_maxHistory; }
    void setMaxHistory(std::size_t n) noexcept
    {
        m_maxHistory = std::max<std::size_t>(1u, n);
        trimHistory();
    }

    [[nodiscard]] std::size_t maxToasts() const noexcept { return m_maxToasts; }
    void setMaxToasts(std::size_t n) noexcept
    {
        m_maxToasts = std::max<std::size_t>(1u, n);
        trimToasts();
    }

    void clear() noexcept
    {
        m_history.clear();
        m_toasts.clear();
    }

    [[nodiscard]] const std::vector<Notice>& history() const noexcept { return m_history; }
    [[nodiscard]] const std::vector<Toast>& toasts() const noexcept { return m_toasts; }

    void push(std::string text, NoticeSeverity severity, double timeSeconds, float toastTtlSeconds)
    {
        Notice n{};
        n.timeSeconds = timeSeconds;
        n.severity = severity;
        n.text = std::move(text);

        m_history.push_back(n);
        trimHistory();

        if (!(toastTtlSeconds > 0.0f))
            return;

        if (!m_toasts.empty() && m_toasts.back().notice.text == n.text && m_toasts.back().notice.severity == severity)
        {
            m_toasts.back().notice.timeSeconds = timeSeconds;
            m_toasts.back().ttlSeconds = toastTtlSeconds;
            return;
        }

        m_toasts.push_back(Toast{std::move(n), toastTtlSeconds});
        trimToasts();
    }

    // Advance toast timers and delete expired ones.
    void tick(float dtSeconds) noexcept
    {
        if (!(dtSeconds > 0.0f))
            return;

        for (auto& t : m_toasts)
            t.ttlSeconds -= dtSeconds;

        m_toasts.erase(std::remove_if(m_toasts.begin(), m_toasts.end(),
                                      [](const Toast& t) { return t.ttlSeconds <= 0.0f; }),
                       m_toasts.end());
    }

private:
    void trimHistory() noexcept
    {
        if (m_history.size() <= m_maxHistory)
            return;
        const std::size_t drop = m_history.size() - m_maxHistory;
        m_history.erase(m_history.begin(), m_history.begin() + static_cast<std::ptrdiff_t>(drop));
    }

    void trimToasts() noexcept
    {
        if (m_toasts.size() <= m_maxToasts)
            return;
        const std::size_t drop = m_toasts.size() - m_maxToasts;
        m_toasts.erase(m_toasts.begin(), m_toasts.begin() + static_cast<std::ptrdiff_t>(drop));
    }

    std::size_t m_maxHistory = 100;
    std::size_t m_maxToasts = 4;

    std::vector<Notice> m_history;
    std::vector<Toast> m_toasts;
};

} // namespace ghostledger::util
