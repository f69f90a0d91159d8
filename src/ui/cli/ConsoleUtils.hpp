#ifndef CODETYPER_UI_CLI_CONSOLEUTILS_HPP
#define CODETYPER_UI_CLI_CONSOLEUTILS_HPP

#include <chrono>
#include <cstdint>
#include <memory>

namespace codetyper::ui::cli
{

enum class ReadStatus : std::uint8_t
{
    Byte,
    Timeout,
    EndOfInput,
};

struct ReadResult final
{
    ReadStatus status{ ReadStatus::EndOfInput };
    char byte{ '\0' };
};

// Puts stdin into non-canonical, no-echo mode for the lifetime of the guard.
class RawModeGuard final
{
public:
    RawModeGuard();
    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;
    RawModeGuard(RawModeGuard&&) = delete;
    RawModeGuard& operator=(RawModeGuard&&) = delete;
    ~RawModeGuard() noexcept;

    [[nodiscard]] bool active() const noexcept;

private:
    struct Saved;
    std::unique_ptr<Saved> m_saved;
};

[[nodiscard]] bool stdinIsTerminal() noexcept;

// Waits up to timeout for one byte on stdin.
[[nodiscard]] ReadResult readStdinByte(std::chrono::milliseconds timeout);

} // namespace codetyper::ui::cli

#endif // CODETYPER_UI_CLI_CONSOLEUTILS_HPP
