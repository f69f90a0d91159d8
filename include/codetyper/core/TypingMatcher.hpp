#ifndef INCLUDE_CODETYPER_CORE_TYPINGMATCHER_HPP
#define INCLUDE_CODETYPER_CORE_TYPINGMATCHER_HPP

#include "codetyper/core/KeyInput.hpp"
#include "codetyper/core/TargetBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codetyper::core
{

enum class MatcherState : std::uint8_t
{
    Idle,
    InProgress,
    Complete,
};

enum class InputDisposition : std::uint8_t
{
    // Not a logical character; the caller should handle the key itself.
    PassThrough,
    // A logical character arrived while Idle or Complete.
    Ignored,
    Evaluated,
};

struct KeystrokeOutcome final
{
    std::size_t position{ 0 };
    bool correct{ false };
};

struct MatchResult final
{
    InputDisposition disposition{ InputDisposition::PassThrough };
    std::optional<KeystrokeOutcome> outcome;
};

class ITypingObserver
{
public:
    ITypingObserver() = default;
    ITypingObserver(const ITypingObserver&) = delete;
    ITypingObserver& operator=(const ITypingObserver&) = delete;
    ITypingObserver(ITypingObserver&&) = delete;
    ITypingObserver& operator=(ITypingObserver&&) = delete;
    virtual ~ITypingObserver() = default;

    // Called for every evaluated keystroke, correct or not.
    virtual void onKeystroke(const KeystrokeOutcome& outcome) = 0;

    // Called once when the caret reaches the end of the target.
    virtual void onComplete() = 0;
};

class TypingMatcher final
{
public:
    TypingMatcher() = default;

    // Observers are not owned and must outlive their subscription.
    void subscribe(ITypingObserver& observer);
    void unsubscribe(ITypingObserver& observer) noexcept;

    // Resets every counter. An empty target is Complete straight away.
    void setTarget(std::u32string text);
    void reset() noexcept;

    MatchResult handleInput(const KeyInput& input);
    std::optional<KeystrokeOutcome> handleCharacter(char32_t c);

    [[nodiscard]] MatcherState state() const noexcept;
    [[nodiscard]] const TargetBuffer& buffer() const noexcept;
    [[nodiscard]] std::size_t position() const noexcept;
    [[nodiscard]] std::size_t errorCount() const noexcept;
    [[nodiscard]] std::size_t totalKeystrokes() const noexcept;

    [[nodiscard]] double progressPercentage() const noexcept;
    [[nodiscard]] double accuracyPercentage() const noexcept;
    [[nodiscard]] double wordsPerMinute(std::int64_t elapsedSeconds) const noexcept;

private:
    void notifyKeystroke(const KeystrokeOutcome& outcome);
    void notifyComplete();

    TargetBuffer m_buffer;
    MatcherState m_state{ MatcherState::Idle };
    std::size_t m_errorCount{ 0 };
    std::size_t m_totalKeystrokes{ 0 };
    std::vector<ITypingObserver*> m_observers;
};

} // namespace codetyper::core

#endif // INCLUDE_CODETYPER_CORE_TYPINGMATCHER_HPP
