#include "codetyper/core/PracticeSession.hpp"
#include <algorithm>
#include <utility>

namespace codetyper::core
{

PracticeSession::PracticeSession()
{
    m_matcher.subscribe(*this);
}

PracticeSession::~PracticeSession()
{
    m_matcher.unsubscribe(*this);
}

void PracticeSession::start(std::u32string target, SessionTimer::Duration duration)
{
    m_timer.restart(duration);
    m_matcher.setTarget(std::move(target));
    m_state = SessionState::Running;

    if (m_matcher.state() == MatcherState::Complete)
    {
        finish(SessionState::Completed);
    }
}

MatchResult PracticeSession::handleInput(const KeyInput& input)
{
    if (m_state != SessionState::Running)
    {
        if (normalize(input).has_value())
        {
            return MatchResult{ InputDisposition::Ignored, std::nullopt };
        }
        return MatchResult{ InputDisposition::PassThrough, std::nullopt };
    }
    return m_matcher.handleInput(input);
}

bool PracticeSession::tick()
{
    if (m_state != SessionState::Running)
    {
        return false;
    }

    m_timer.tick();
    if (m_timer.isExpired())
    {
        finish(SessionState::TimedOut);
        return true;
    }
    return false;
}

void PracticeSession::addSessionObserver(ISessionObserver& observer)
{
    if (std::find(m_observers.begin(), m_observers.end(), &observer) == m_observers.end())
    {
        m_observers.push_back(&observer);
    }
}

SessionState PracticeSession::state() const noexcept
{
    return m_state;
}

bool PracticeSession::isRunning() const noexcept
{
    return m_state == SessionState::Running;
}

SessionSummary PracticeSession::summary() const noexcept
{
    SessionSummary out{};
    out.state = m_state;
    out.accuracy = m_matcher.accuracyPercentage();
    out.wordsPerMinute = m_matcher.wordsPerMinute(m_timer.elapsedSeconds());
    out.progress = m_matcher.progressPercentage();
    out.elapsedSeconds = m_timer.elapsedSeconds();
    out.remainingSeconds = m_timer.remainingSeconds();
    out.errorCount = m_matcher.errorCount();
    out.totalKeystrokes = m_matcher.totalKeystrokes();
    return out;
}

TypingMatcher& PracticeSession::matcher() noexcept
{
    return m_matcher;
}

const TypingMatcher& PracticeSession::matcher() const noexcept
{
    return m_matcher;
}

const SessionTimer& PracticeSession::timer() const noexcept
{
    return m_timer;
}

void PracticeSession::onKeystroke(const KeystrokeOutcome& /*outcome*/)
{
}

void PracticeSession::onComplete()
{
    if (m_state == SessionState::Running)
    {
        finish(SessionState::Completed);
    }
}

void PracticeSession::finish(SessionState state)
{
    m_state = state;
    const auto result{ summary() };
    const auto observers{ m_observers };
    for (auto* observer : observers)
    {
        observer->onSessionEnded(result);
    }
}

const char* toString(SessionState state) noexcept
{
    switch (state)
    {
    case SessionState::NotStarted:
        return "not started";
    case SessionState::Running:
        return "running";
    case SessionState::Completed:
        return "completed";
    case SessionState::TimedOut:
        return "timed out";
    }
    return "unknown";
}

} // namespace codetyper::core
