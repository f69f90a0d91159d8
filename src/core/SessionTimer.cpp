#include "codetyper/core/SessionTimer.hpp"
#include <algorithm>

namespace codetyper::core
{

SessionTimer::SessionTimer(Duration duration) noexcept
{
    restart(duration);
}

void SessionTimer::restart(Duration duration) noexcept
{
    m_duration = std::max(duration, Duration{ 0 });
    m_elapsed = 0;
    m_remaining = m_duration.count();
}

void SessionTimer::tick() noexcept
{
    if (isExpired())
    {
        return;
    }
    --m_remaining;
    ++m_elapsed;
}

bool SessionTimer::isExpired() const noexcept
{
    return m_remaining <= 0;
}

SessionTimer::Duration SessionTimer::duration() const noexcept
{
    return m_duration;
}

std::int64_t SessionTimer::elapsedSeconds() const noexcept
{
    return m_elapsed;
}

std::int64_t SessionTimer::remainingSeconds() const noexcept
{
    return m_remaining;
}

} // namespace codetyper::core
