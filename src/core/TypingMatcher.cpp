#include "codetyper/core/TypingMatcher.hpp"
#include "codetyper/core/TypingMetrics.hpp"
#include <algorithm>
#include <utility>

namespace codetyper::core
{

void TypingMatcher::subscribe(ITypingObserver& observer)
{
    if (std::find(m_observers.begin(), m_observers.end(), &observer) == m_observers.end())
    {
        m_observers.push_back(&observer);
    }
}

void TypingMatcher::unsubscribe(ITypingObserver& observer) noexcept
{
    m_observers.erase(std::remove(m_observers.begin(), m_observers.end(), &observer), m_observers.end());
}

void TypingMatcher::setTarget(std::u32string text)
{
    m_buffer.setTarget(std::move(text));
    m_errorCount = 0;
    m_totalKeystrokes = 0;
    m_state = m_buffer.isComplete() ? MatcherState::Complete : MatcherState::InProgress;
}

void TypingMatcher::reset() noexcept
{
    m_buffer = TargetBuffer{};
    m_errorCount = 0;
    m_totalKeystrokes = 0;
    m_state = MatcherState::Idle;
}

MatchResult TypingMatcher::handleInput(const KeyInput& input)
{
    const auto logical{ normalize(input) };
    if (!logical.has_value())
    {
        return MatchResult{ InputDisposition::PassThrough, std::nullopt };
    }

    auto outcome{ handleCharacter(*logical) };
    if (!outcome.has_value())
    {
        return MatchResult{ InputDisposition::Ignored, std::nullopt };
    }
    return MatchResult{ InputDisposition::Evaluated, outcome };
}

std::optional<KeystrokeOutcome> TypingMatcher::handleCharacter(char32_t c)
{
    if (m_state != MatcherState::InProgress)
    {
        return std::nullopt;
    }

    const char32_t expected{ m_buffer.expectedChar() };
    ++m_totalKeystrokes;

    const KeystrokeOutcome outcome{ m_buffer.position(), c == expected };
    if (!outcome.correct)
    {
        ++m_errorCount;
    }

    notifyKeystroke(outcome);

    if (outcome.correct)
    {
        m_buffer.advance();
        if (m_buffer.isComplete())
        {
            m_state = MatcherState::Complete;
            notifyComplete();
        }
    }

    return outcome;
}

MatcherState TypingMatcher::state() const noexcept
{
    return m_state;
}

const TargetBuffer& TypingMatcher::buffer() const noexcept
{
    return m_buffer;
}

std::size_t TypingMatcher::position() const noexcept
{
    return m_buffer.position();
}

std::size_t TypingMatcher::errorCount() const noexcept
{
    return m_errorCount;
}

std::size_t TypingMatcher::totalKeystrokes() const noexcept
{
    return m_totalKeystrokes;
}

double TypingMatcher::progressPercentage() const noexcept
{
    return core::progressPercentage(m_buffer.position(), m_buffer.length());
}

double TypingMatcher::accuracyPercentage() const noexcept
{
    return core::accuracyPercentage(m_errorCount, m_totalKeystrokes);
}

double TypingMatcher::wordsPerMinute(std::int64_t elapsedSeconds) const noexcept
{
    return core::wordsPerMinute(m_buffer.position(), elapsedSeconds);
}

void TypingMatcher::notifyKeystroke(const KeystrokeOutcome& outcome)
{
    // Copy: an observer may unsubscribe itself from inside the callback.
    const auto observers{ m_observers };
    for (auto* observer : observers)
    {
        observer->onKeystroke(outcome);
    }
}

void TypingMatcher::notifyComplete()
{
    const auto observers{ m_observers };
    for (auto* observer : observers)
    {
        observer->onComplete();
    }
}

} // namespace codetyper::core
