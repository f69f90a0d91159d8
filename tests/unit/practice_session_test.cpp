#include "codetyper/core/PracticeSession.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace codetyper::core;

namespace
{

class EndRecorder final : public ISessionObserver
{
public:
    void onSessionEnded(const SessionSummary& summary) override
    {
        ended.push_back(summary);
    }

    std::vector<SessionSummary> ended; // NOLINT
};

class PracticeSessionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_session.addSessionObserver(m_recorder);
    }

    void type(std::u32string_view text)
    {
        for (const char32_t c : text)
        {
            (void)m_session.handleInput(c == U'\n' ? enterKey() : characterKey(c));
        }
    }

    PracticeSession m_session; // NOLINT
    EndRecorder m_recorder;    // NOLINT
};

} // namespace

TEST_F(PracticeSessionTest, NotStartedIgnoresCharacters)
{
    EXPECT_EQ(m_session.state(), SessionState::NotStarted);
    EXPECT_EQ(m_session.handleInput(characterKey(U'a')).disposition, InputDisposition::Ignored);
    EXPECT_EQ(m_session.handleInput(otherKey()).disposition, InputDisposition::PassThrough);
    EXPECT_FALSE(m_session.tick());
}

TEST_F(PracticeSessionTest, CompletingTargetEndsSession)
{
    m_session.start(U"a\nb", SessionTimer::Duration{ 60 });
    ASSERT_TRUE(m_session.isRunning());

    EXPECT_FALSE(m_session.tick());
    type(U"a\nb");

    EXPECT_EQ(m_session.state(), SessionState::Completed);
    ASSERT_EQ(m_recorder.ended.size(), 1U);

    const auto& summary{ m_recorder.ended.front() };
    EXPECT_EQ(summary.state, SessionState::Completed);
    EXPECT_DOUBLE_EQ(summary.accuracy, 100.0);
    EXPECT_DOUBLE_EQ(summary.progress, 100.0);
    EXPECT_EQ(summary.elapsedSeconds, 1);
    EXPECT_EQ(summary.remainingSeconds, 59);
    EXPECT_EQ(summary.totalKeystrokes, 3U);
    EXPECT_EQ(summary.errorCount, 0U);
    EXPECT_DOUBLE_EQ(summary.wordsPerMinute, (3.0 / 5.0) / (1.0 / 60.0));
}

TEST_F(PracticeSessionTest, TimerExpiryEndsSessionAsTimedOut)
{
    m_session.start(U"abcdef", SessionTimer::Duration{ 2 });
    type(U"ax");

    EXPECT_FALSE(m_session.tick());
    EXPECT_TRUE(m_session.tick());

    EXPECT_EQ(m_session.state(), SessionState::TimedOut);
    ASSERT_EQ(m_recorder.ended.size(), 1U);
    EXPECT_EQ(m_recorder.ended.front().state, SessionState::TimedOut);
    EXPECT_EQ(m_recorder.ended.front().remainingSeconds, 0);
    EXPECT_EQ(m_recorder.ended.front().errorCount, 1U);
}

TEST_F(PracticeSessionTest, InputAfterEndIsIgnored)
{
    m_session.start(U"abc", SessionTimer::Duration{ 1 });
    (void)m_session.tick();
    ASSERT_EQ(m_session.state(), SessionState::TimedOut);

    EXPECT_EQ(m_session.handleInput(characterKey(U'a')).disposition, InputDisposition::Ignored);
    EXPECT_EQ(m_session.matcher().position(), 0U);
    EXPECT_FALSE(m_session.tick());
    EXPECT_EQ(m_recorder.ended.size(), 1U);
}

TEST_F(PracticeSessionTest, EmptyTargetCompletesImmediately)
{
    m_session.start(U"", SessionTimer::Duration{ 30 });

    EXPECT_EQ(m_session.state(), SessionState::Completed);
    ASSERT_EQ(m_recorder.ended.size(), 1U);
    EXPECT_DOUBLE_EQ(m_recorder.ended.front().progress, 0.0);
    EXPECT_DOUBLE_EQ(m_recorder.ended.front().accuracy, 100.0);
    EXPECT_DOUBLE_EQ(m_recorder.ended.front().wordsPerMinute, 0.0);
}

TEST_F(PracticeSessionTest, RestartBeginsFreshRun)
{
    m_session.start(U"ab", SessionTimer::Duration{ 30 });
    type(U"xab");
    ASSERT_EQ(m_session.state(), SessionState::Completed);

    m_session.start(U"cd", SessionTimer::Duration{ 30 });
    EXPECT_TRUE(m_session.isRunning());

    const auto summary{ m_session.summary() };
    EXPECT_EQ(summary.totalKeystrokes, 0U);
    EXPECT_EQ(summary.errorCount, 0U);
    EXPECT_EQ(summary.elapsedSeconds, 0);
    EXPECT_EQ(summary.remainingSeconds, 30);
}

TEST(SessionStateNames, AreReadable)
{
    EXPECT_STREQ(toString(SessionState::Completed), "completed");
    EXPECT_STREQ(toString(SessionState::TimedOut), "timed out");
}
