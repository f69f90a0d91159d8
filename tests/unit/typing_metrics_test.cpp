#include "codetyper/core/TypingMetrics.hpp"

#include <gtest/gtest.h>

using namespace codetyper::core;

TEST(TypingMetrics, ProgressOfEmptyTargetIsZero)
{
    EXPECT_DOUBLE_EQ(progressPercentage(0, 0), 0.0);
}

TEST(TypingMetrics, ProgressIsShareOfTarget)
{
    EXPECT_DOUBLE_EQ(progressPercentage(1, 4), 25.0);
    EXPECT_DOUBLE_EQ(progressPercentage(4, 4), 100.0);
    EXPECT_DOUBLE_EQ(progressPercentage(0, 7), 0.0);
}

TEST(TypingMetrics, AccuracyWithoutKeystrokesIsPerfect)
{
    EXPECT_DOUBLE_EQ(accuracyPercentage(0, 0), 100.0);
}

TEST(TypingMetrics, AccuracyCountsErrors)
{
    EXPECT_NEAR(accuracyPercentage(1, 3), 66.6667, 1e-3);
    EXPECT_DOUBLE_EQ(accuracyPercentage(0, 10), 100.0);
    EXPECT_DOUBLE_EQ(accuracyPercentage(5, 5), 0.0);
}

TEST(TypingMetrics, WordsPerMinuteWithoutElapsedTimeIsZero)
{
    EXPECT_DOUBLE_EQ(wordsPerMinute(50, 0), 0.0);
    EXPECT_DOUBLE_EQ(wordsPerMinute(50, -3), 0.0);
}

TEST(TypingMetrics, WordsPerMinuteUsesFiveCharacterWords)
{
    EXPECT_DOUBLE_EQ(wordsPerMinute(300, 60), 60.0);
    EXPECT_DOUBLE_EQ(wordsPerMinute(50, 30), 20.0);
    EXPECT_DOUBLE_EQ(wordsPerMinute(0, 45), 0.0);
}
