#ifndef INCLUDE_CODETYPER_CORE_PRACTICESESSION_HPP
#define INCLUDE_CODETYPER_CORE_PRACTICESESSION_HPP

#include "codetyper/core/KeyInput.hpp"
#include "codetyper/core/SessionTimer.hpp"
#include "codetyper/core/TypingMatcher.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace codetyper::core
{

enum class SessionState : std::uint8_t
{
    NotStarted,
    Running,
    Completed,
    TimedOut,
};

struct SessionSummary final
{
    SessionState state{ SessionState::NotStarted };
    double accuracy{ 0.0 };
    double wordsPerMinute{ 0.0 };
    double progress{ 0.0 };
    std::int64_t elapsedSeconds{ 0 };
    std::int64_t remainingSeconds{ 0 };
    std::size_t errorCount{ 0 };
    std::size_t totalKeystrokes{ 0 };
};

class ISessionObserver
{
public:
    ISessionObserver() = default;
    ISessionObserver(const ISessionObserver&) = delete;
    ISessionObserver& operator=(const ISessionObserver&) = delete;
    ISessionObserver(ISessionObserver&&) = delete;
    ISessionObserver& operator=(ISessionObserver&&) = delete;
    virtual ~ISessionObserver() = default;

    virtual void onSessionEnded(const SessionSummary& summary) = 0;
};

class PracticeSession final : private ITypingObserver
{
public:
    PracticeSession();

    PracticeSession(const PracticeSession&) = delete;
    PracticeSession& operator=(const PracticeSession&) = delete;
    PracticeSession(PracticeSession&&) = delete;
    PracticeSession& operator=(PracticeSession&&) = delete;
    ~PracticeSession() override;

    void start(std::u32string target, SessionTimer::Duration duration);

    MatchResult handleInput(const KeyInput& input);

    // Returns true when this tick ended the session.
    bool tick();

    void addSessionObserver(ISessionObserver& observer);

    [[nodiscard]] SessionState state() const noexcept;
    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] SessionSummary summary() const noexcept;

    [[nodiscard]] TypingMatcher& matcher() noexcept;
    [[nodiscard]] const TypingMatcher& matcher() const noexcept;
    [[nodiscard]] const SessionTimer& timer() const noexcept;

private:
    void onKeystroke(const KeystrokeOutcome& outcome) override;
    void onComplete() override;

    void finish(SessionState state);

    TypingMatcher m_matcher;
    SessionTimer m_timer;
    SessionState m_state{ SessionState::NotStarted };
    std::vector<ISessionObserver*> m_observers;
};

[[nodiscard]] const char* toString(SessionState state) noexcept;

} // namespace codetyper::core

#endif // INCLUDE_CODETYPER_CORE_PRACTICESESSION_HPP
