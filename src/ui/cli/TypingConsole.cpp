#include "TypingConsole.hpp"
#include "codetyper/core/Utf8.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace codetyper::ui::cli
{
namespace
{

constexpr std::chrono::milliseconds g_pollInterval{ 100 };
constexpr char g_ctrlC{ '\x03' };
constexpr char g_ctrlD{ '\x04' };
constexpr char g_bell{ '\a' };

} // namespace

TypingConsole::TypingConsole(std::ostream& out, ByteReader reader, NowProvider nowProvider)
    : m_out(out), m_reader(std::move(reader)), m_now(std::move(nowProvider))
{
}

codetyper::core::SessionSummary TypingConsole::run(const std::u32string& target,
                                                   codetyper::core::SessionTimer::Duration duration)
{
    m_aborted = false;
    m_ticksDelivered = 0;
    m_decoder.reset();

    m_out << codetyper::core::encodeUtf8(target) << "\n";
    m_out << "----------------------------------------\n";
    m_out << "Time: " << formatClock(duration.count()) << "  (Ctrl-C to stop)\n" << std::flush;

    m_session.start(target, duration);
    m_startedAt = m_now();

    while (m_session.isRunning())
    {
        const ReadResult read{ m_reader(g_pollInterval) };
        deliverTicks();
        if (!m_session.isRunning())
        {
            break;
        }

        if (read.status == ReadStatus::EndOfInput)
        {
            m_aborted = true;
            break;
        }
        if (read.status == ReadStatus::Timeout)
        {
            if (const auto key{ m_decoder.flush() })
            {
                processKey(*key);
            }
            continue;
        }

        processByte(read.byte);
        if (m_aborted)
        {
            break;
        }
    }

    m_out << "\n" << std::flush;
    return m_session.summary();
}

bool TypingConsole::aborted() const noexcept
{
    return m_aborted;
}

void TypingConsole::deliverTicks()
{
    const auto elapsed{ std::chrono::duration_cast<std::chrono::seconds>(m_now() - m_startedAt).count() };
    while (m_ticksDelivered < elapsed && m_session.isRunning())
    {
        ++m_ticksDelivered;
        (void)m_session.tick();
    }
}

void TypingConsole::processByte(char byte)
{
    if (byte == g_ctrlC || byte == g_ctrlD)
    {
        m_aborted = true;
        return;
    }

    if (const auto key{ m_decoder.feed(byte) })
    {
        processKey(*key);
    }
}

void TypingConsole::processKey(const codetyper::core::KeyInput& key)
{
    const auto result{ m_session.handleInput(key) };
    if (!result.outcome.has_value())
    {
        return;
    }

    if (result.outcome->correct)
    {
        const char32_t typed{ m_session.matcher().buffer().text()[result.outcome->position] };
        m_out << codetyper::core::encodeUtf8(typed);
    }
    else
    {
        m_out << g_bell;
    }
    m_out << std::flush;
}

void printSummary(std::ostream& out, const codetyper::core::SessionSummary& summary)
{
    switch (summary.state)
    {
    case codetyper::core::SessionState::Completed:
        out << "Congratulations! You completed the typing exercise.\n\n";
        break;
    case codetyper::core::SessionState::TimedOut:
        out << "Time's up!\n\n";
        break;
    default:
        out << "Session stopped.\n\n";
        break;
    }

    const auto flags{ out.flags() };
    const auto precision{ out.precision() };
    out << std::fixed << std::setprecision(1);
    out << "Accuracy: " << summary.accuracy << "%\n";
    out << "Speed: " << summary.wordsPerMinute << " WPM\n";
    out << "Progress: " << summary.progress << "%\n";
    out << "Time: " << formatClock(summary.elapsedSeconds) << " elapsed, " << formatClock(summary.remainingSeconds)
        << " left\n";
    out << "Errors: " << summary.errorCount << " of " << summary.totalKeystrokes << " keystrokes\n";
    out.flags(flags);
    out.precision(precision);
}

std::string formatClock(std::int64_t seconds)
{
    if (seconds < 0)
    {
        seconds = 0;
    }
    std::ostringstream s{};
    s << std::setfill('0') << std::setw(2) << (seconds / 60) << ":" << std::setw(2) << (seconds % 60);
    return s.str();
}

} // namespace codetyper::ui::cli
