#ifndef CODETYPER_UI_CLI_TYPINGCONSOLE_HPP
#define CODETYPER_UI_CLI_TYPINGCONSOLE_HPP

#include "ConsoleUtils.hpp"
#include "KeyDecoder.hpp"
#include "codetyper/core/PracticeSession.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

namespace codetyper::ui::cli
{

// In tests: replays a scripted byte sequence.
using ByteReader = std::function<ReadResult(std::chrono::milliseconds)>;

class TypingConsole final
{
public:
    using Clock = std::chrono::steady_clock;
    using NowProvider = std::function<Clock::time_point()>;

    TypingConsole(std::ostream& out, ByteReader reader, NowProvider nowProvider = Clock::now);

    // Runs one practice session until it completes, times out, or the user aborts (Ctrl-C / EOF).
    codetyper::core::SessionSummary run(const std::u32string& target, codetyper::core::SessionTimer::Duration duration);

    [[nodiscard]] bool aborted() const noexcept;

private:
    void deliverTicks();
    void processByte(char byte);
    void processKey(const codetyper::core::KeyInput& key);

    std::ostream& m_out;
    ByteReader m_reader;
    NowProvider m_now;

    codetyper::core::PracticeSession m_session;
    KeyDecoder m_decoder;
    Clock::time_point m_startedAt{};
    std::int64_t m_ticksDelivered{ 0 };
    bool m_aborted{ false };
};

void printSummary(std::ostream& out, const codetyper::core::SessionSummary& summary);

[[nodiscard]] std::string formatClock(std::int64_t seconds);

} // namespace codetyper::ui::cli

#endif // CODETYPER_UI_CLI_TYPINGCONSOLE_HPP
