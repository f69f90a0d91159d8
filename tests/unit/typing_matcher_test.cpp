#include "test_utils/TestUtils.hpp"
#include "codetyper/core/TypingMatcher.hpp"

#include <gtest/gtest.h>

using namespace codetyper::core;
using codetyper::test_utils::RecordingObserver;

namespace
{

class TypingMatcherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_matcher.subscribe(m_observer);
    }

    TypingMatcher m_matcher;       // NOLINT
    RecordingObserver m_observer;  // NOLINT
};

void expectCountersConsistent(const TypingMatcher& matcher)
{
    EXPECT_LE(matcher.position(), matcher.buffer().length());
    EXPECT_LE(matcher.errorCount(), matcher.totalKeystrokes());
}

} // namespace

TEST_F(TypingMatcherTest, StartsIdleAndIgnoresInput)
{
    EXPECT_EQ(m_matcher.state(), MatcherState::Idle);

    const auto result{ m_matcher.handleInput(characterKey(U'a')) };
    EXPECT_EQ(result.disposition, InputDisposition::Ignored);
    EXPECT_FALSE(result.outcome.has_value());
    EXPECT_EQ(m_matcher.totalKeystrokes(), 0U);
    EXPECT_TRUE(m_observer.keystrokes.empty());
}

TEST_F(TypingMatcherTest, MistakeThenCorrectKeystrokes)
{
    m_matcher.setTarget(U"ab");

    auto result{ m_matcher.handleInput(characterKey(U'x')) };
    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(result.outcome->position, 0U);
    EXPECT_FALSE(result.outcome->correct);
    EXPECT_EQ(m_matcher.position(), 0U);
    EXPECT_EQ(m_matcher.errorCount(), 1U);
    EXPECT_EQ(m_matcher.totalKeystrokes(), 1U);

    result = m_matcher.handleInput(characterKey(U'a'));
    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(result.outcome->position, 0U);
    EXPECT_TRUE(result.outcome->correct);
    EXPECT_EQ(m_matcher.position(), 1U);

    result = m_matcher.handleInput(characterKey(U'b'));
    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(result.outcome->position, 1U);
    EXPECT_TRUE(result.outcome->correct);

    EXPECT_EQ(m_matcher.position(), 2U);
    EXPECT_EQ(m_matcher.state(), MatcherState::Complete);
    EXPECT_EQ(m_matcher.errorCount(), 1U);
    EXPECT_EQ(m_matcher.totalKeystrokes(), 3U);
    EXPECT_NEAR(m_matcher.accuracyPercentage(), 66.6667, 1e-3);
    EXPECT_DOUBLE_EQ(m_matcher.progressPercentage(), 100.0);

    ASSERT_EQ(m_observer.keystrokes.size(), 3U);
    EXPECT_FALSE(m_observer.keystrokes[0].correct);
    EXPECT_TRUE(m_observer.keystrokes[1].correct);
    EXPECT_TRUE(m_observer.keystrokes[2].correct);
    EXPECT_EQ(m_observer.completions, 1U);
}

TEST_F(TypingMatcherTest, EnterMatchesNewline)
{
    m_matcher.setTarget(U"a\nb");

    EXPECT_EQ(m_matcher.handleInput(characterKey(U'a')).disposition, InputDisposition::Evaluated);
    const auto enter{ m_matcher.handleInput(enterKey()) };
    ASSERT_TRUE(enter.outcome.has_value());
    EXPECT_EQ(enter.outcome->position, 1U);
    EXPECT_TRUE(enter.outcome->correct);
    EXPECT_EQ(m_matcher.handleInput(characterKey(U'b')).disposition, InputDisposition::Evaluated);

    EXPECT_EQ(m_matcher.state(), MatcherState::Complete);
    EXPECT_EQ(m_matcher.errorCount(), 0U);
    EXPECT_EQ(m_matcher.totalKeystrokes(), 3U);
    EXPECT_DOUBLE_EQ(m_matcher.accuracyPercentage(), 100.0);
}

TEST_F(TypingMatcherTest, MistakeMidTargetIsReportedAtCaret)
{
    m_matcher.setTarget(U"ab");

    auto result{ m_matcher.handleInput(characterKey(U'a')) };
    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(result.outcome->position, 0U);
    EXPECT_TRUE(result.outcome->correct);
    EXPECT_EQ(m_matcher.position(), 1U);

    result = m_matcher.handleInput(characterKey(U'x'));
    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(result.outcome->position, 1U);
    EXPECT_FALSE(result.outcome->correct);
    EXPECT_EQ(m_matcher.position(), 1U);
    EXPECT_EQ(m_matcher.errorCount(), 1U);
    EXPECT_EQ(m_matcher.totalKeystrokes(), 2U);
    EXPECT_EQ(m_matcher.state(), MatcherState::InProgress);
    EXPECT_EQ(m_observer.completions, 0U);

    result = m_matcher.handleInput(characterKey(U'b'));
    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(result.outcome->position, 1U);
    EXPECT_TRUE(result.outcome->correct);

    EXPECT_EQ(m_matcher.position(), 2U);
    EXPECT_EQ(m_matcher.state(), MatcherState::Complete);
    EXPECT_EQ(m_matcher.errorCount(), 1U);
    EXPECT_EQ(m_matcher.totalKeystrokes(), 3U);
    EXPECT_EQ(m_observer.completions, 1U);

    ASSERT_EQ(m_observer.keystrokes.size(), 3U);
    EXPECT_EQ(m_observer.keystrokes[1].position, 1U);
    EXPECT_FALSE(m_observer.keystrokes[1].correct);
}

TEST_F(TypingMatcherTest, LetterWhereNewlineExpectedIsAnError)
{
    m_matcher.setTarget(U"a\nb");
    (void)m_matcher.handleInput(characterKey(U'a'));

    const auto result{ m_matcher.handleInput(characterKey(U'b')) };
    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(result.outcome->position, 1U);
    EXPECT_FALSE(result.outcome->correct);
    EXPECT_EQ(m_matcher.position(), 1U);
    EXPECT_EQ(m_matcher.errorCount(), 1U);
    EXPECT_EQ(m_matcher.totalKeystrokes(), 2U);
    EXPECT_EQ(m_matcher.state(), MatcherState::InProgress);
}

TEST_F(TypingMatcherTest, EnterWhereCharacterExpectedIsAnError)
{
    m_matcher.setTarget(U"ab");
    const auto result{ m_matcher.handleInput(enterKey()) };
    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_FALSE(result.outcome->correct);
    EXPECT_EQ(m_matcher.errorCount(), 1U);
}

TEST_F(TypingMatcherTest, EmptyTargetIsCompleteWithoutEvents)
{
    m_matcher.setTarget(U"");

    EXPECT_EQ(m_matcher.state(), MatcherState::Complete);
    EXPECT_EQ(m_observer.completions, 0U);
    EXPECT_DOUBLE_EQ(m_matcher.progressPercentage(), 0.0);
    EXPECT_DOUBLE_EQ(m_matcher.accuracyPercentage(), 100.0);

    EXPECT_EQ(m_matcher.handleInput(characterKey(U'a')).disposition, InputDisposition::Ignored);
    EXPECT_EQ(m_matcher.totalKeystrokes(), 0U);
}

TEST_F(TypingMatcherTest, InputAfterCompletionIsIgnored)
{
    m_matcher.setTarget(U"a");
    (void)m_matcher.handleInput(characterKey(U'a'));
    ASSERT_EQ(m_matcher.state(), MatcherState::Complete);

    const auto result{ m_matcher.handleInput(characterKey(U'z')) };
    EXPECT_EQ(result.disposition, InputDisposition::Ignored);
    EXPECT_EQ(m_matcher.totalKeystrokes(), 1U);
    EXPECT_EQ(m_matcher.errorCount(), 0U);
    EXPECT_EQ(m_observer.keystrokes.size(), 1U);
    EXPECT_EQ(m_observer.completions, 1U);
}

TEST_F(TypingMatcherTest, NonCharacterKeysPassThrough)
{
    m_matcher.setTarget(U"ab");

    EXPECT_EQ(m_matcher.handleInput(otherKey()).disposition, InputDisposition::PassThrough);
    EXPECT_EQ(m_matcher.handleInput(characterKey(U'\b')).disposition, InputDisposition::PassThrough);
    EXPECT_EQ(m_matcher.totalKeystrokes(), 0U);
    EXPECT_TRUE(m_observer.keystrokes.empty());
}

TEST_F(TypingMatcherTest, SetTargetResetsCountersFromAnyState)
{
    m_matcher.setTarget(U"ab");
    (void)m_matcher.handleInput(characterKey(U'x'));
    (void)m_matcher.handleInput(characterKey(U'a'));

    m_matcher.setTarget(U"cd");
    EXPECT_EQ(m_matcher.state(), MatcherState::InProgress);
    EXPECT_EQ(m_matcher.position(), 0U);
    EXPECT_EQ(m_matcher.errorCount(), 0U);
    EXPECT_EQ(m_matcher.totalKeystrokes(), 0U);
}

TEST_F(TypingMatcherTest, ResetReturnsToIdle)
{
    m_matcher.setTarget(U"ab");
    (void)m_matcher.handleInput(characterKey(U'a'));

    m_matcher.reset();
    EXPECT_EQ(m_matcher.state(), MatcherState::Idle);
    EXPECT_EQ(m_matcher.position(), 0U);
    EXPECT_EQ(m_matcher.handleInput(characterKey(U'b')).disposition, InputDisposition::Ignored);
}

TEST_F(TypingMatcherTest, CountersStayConsistentOverMixedInput)
{
    m_matcher.setTarget(U"int x;\n");
    const std::u32string typed{ U"inr t x;;\n" };
    std::size_t lastPosition{ 0 };
    for (const char32_t c : typed)
    {
        (void)m_matcher.handleCharacter(c);
        EXPECT_GE(m_matcher.position(), lastPosition);
        lastPosition = m_matcher.position();
        expectCountersConsistent(m_matcher);
    }
    EXPECT_EQ(m_matcher.totalKeystrokes(), typed.size());
}

TEST_F(TypingMatcherTest, UnsubscribedObserverReceivesNothing)
{
    m_matcher.unsubscribe(m_observer);
    m_matcher.setTarget(U"a");
    (void)m_matcher.handleInput(characterKey(U'a'));

    EXPECT_TRUE(m_observer.keystrokes.empty());
    EXPECT_EQ(m_observer.completions, 0U);
}

TEST_F(TypingMatcherTest, SubscribingTwiceNotifiesOnce)
{
    m_matcher.subscribe(m_observer);
    m_matcher.setTarget(U"a");
    (void)m_matcher.handleInput(characterKey(U'b'));

    EXPECT_EQ(m_observer.keystrokes.size(), 1U);
}

TEST_F(TypingMatcherTest, WordsPerMinuteUsesCorrectCharacters)
{
    m_matcher.setTarget(U"aaaaabbbbb");
    for (int i{ 0 }; i < 10; ++i)
    {
        (void)m_matcher.handleCharacter(i < 5 ? U'a' : U'b');
    }
    (void)m_matcher.handleCharacter(U'z');

    EXPECT_DOUBLE_EQ(m_matcher.wordsPerMinute(0), 0.0);
    EXPECT_DOUBLE_EQ(m_matcher.wordsPerMinute(60), 2.0);
}
