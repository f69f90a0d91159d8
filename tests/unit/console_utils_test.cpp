#include "ConsoleUtils.hpp"
#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>

#include <unistd.h>

using namespace codetyper::ui::cli;

namespace
{

// Replaces stdin with the read end of a pipe for the lifetime of the object.
class StdinPipe
{
public:
    StdinPipe() : m_savedStdin(::dup(STDIN_FILENO))
    {
        int fds[2]{ -1, -1 };
        if (::pipe(fds) == 0)
        {
            m_writeEnd = fds[1];
            ::dup2(fds[0], STDIN_FILENO);
            ::close(fds[0]);
        }
    }

    ~StdinPipe()
    {
        closeWriter();
        if (m_savedStdin >= 0)
        {
            ::dup2(m_savedStdin, STDIN_FILENO);
            ::close(m_savedStdin);
        }
    }

    StdinPipe(const StdinPipe&) = delete;
    StdinPipe& operator=(const StdinPipe&) = delete;

    [[nodiscard]] bool ready() const noexcept
    {
        return m_writeEnd >= 0 && m_savedStdin >= 0;
    }

    void write(const char* data, std::size_t size) const
    {
        ASSERT_EQ(::write(m_writeEnd, data, size), static_cast<ssize_t>(size));
    }

    void closeWriter()
    {
        if (m_writeEnd >= 0)
        {
            ::close(m_writeEnd);
            m_writeEnd = -1;
        }
    }

private:
    int m_savedStdin{ -1 };
    int m_writeEnd{ -1 };
};

} // namespace

TEST(ConsoleUtilsTest, RawModeIsInactiveWithoutTerminal)
{
    StdinPipe pipe{};
    ASSERT_TRUE(pipe.ready());

    EXPECT_FALSE(stdinIsTerminal());
    RawModeGuard guard{};
    EXPECT_FALSE(guard.active());
}

TEST(ConsoleUtilsTest, ReadsBytesInOrder)
{
    StdinPipe pipe{};
    ASSERT_TRUE(pipe.ready());
    pipe.write("ok", 2);

    auto first{ readStdinByte(std::chrono::milliseconds{ 100 }) };
    EXPECT_EQ(first.status, ReadStatus::Byte);
    EXPECT_EQ(first.byte, 'o');

    auto second{ readStdinByte(std::chrono::milliseconds{ 100 }) };
    EXPECT_EQ(second.status, ReadStatus::Byte);
    EXPECT_EQ(second.byte, 'k');
}

TEST(ConsoleUtilsTest, TimesOutWhenNothingIsPending)
{
    StdinPipe pipe{};
    ASSERT_TRUE(pipe.ready());

    EXPECT_EQ(readStdinByte(std::chrono::milliseconds{ 10 }).status, ReadStatus::Timeout);
}

TEST(ConsoleUtilsTest, ClosedInputReportsEnd)
{
    StdinPipe pipe{};
    ASSERT_TRUE(pipe.ready());
    pipe.closeWriter();

    EXPECT_EQ(readStdinByte(std::chrono::milliseconds{ 100 }).status, ReadStatus::EndOfInput);
}
