#include "ConsoleUtils.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#if defined(__linux__) || defined(__APPLE__)
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace codetyper::ui::cli
{

struct RawModeGuard::Saved
{
    termios original{};
};

RawModeGuard::RawModeGuard()
{
    if (isatty(STDIN_FILENO) == 0)
    {
        return;
    }

    termios tty{};
    if (tcgetattr(STDIN_FILENO, &tty) != 0)
    {
        throw std::system_error(errno, std::generic_category(), "tcgetattr");
    }

    auto saved{ std::make_unique<Saved>() };
    saved->original = tty;

    tty.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG);
    tty.c_iflag &= ~static_cast<tcflag_t>(IXON | ICRNL);
    tty.c_cc[VMIN] = 1;
    tty.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &tty) != 0)
    {
        throw std::system_error(errno, std::generic_category(), "tcsetattr");
    }
    m_saved = std::move(saved);
}

RawModeGuard::~RawModeGuard() noexcept
{
    if (m_saved == nullptr)
    {
        return;
    }
    (void)tcsetattr(STDIN_FILENO, TCSANOW, &m_saved->original);
}

bool RawModeGuard::active() const noexcept
{
    return m_saved != nullptr;
}

bool stdinIsTerminal() noexcept
{
    return isatty(STDIN_FILENO) != 0;
}

ReadResult readStdinByte(std::chrono::milliseconds timeout)
{
    pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;

    const int ready{ ::poll(&pfd, 1, static_cast<int>(timeout.count())) };
    if (ready < 0)
    {
        if (errno == EINTR)
        {
            return ReadResult{ ReadStatus::Timeout, '\0' };
        }
        throw std::system_error(errno, std::generic_category(), "poll");
    }
    if (ready == 0)
    {
        return ReadResult{ ReadStatus::Timeout, '\0' };
    }

    char c{ '\0' };
    const auto n{ ::read(STDIN_FILENO, &c, 1) };
    if (n == 1)
    {
        return ReadResult{ ReadStatus::Byte, c };
    }
    if (n < 0 && errno == EINTR)
    {
        return ReadResult{ ReadStatus::Timeout, '\0' };
    }
    if (n < 0)
    {
        throw std::system_error(errno, std::generic_category(), "read");
    }
    return ReadResult{ ReadStatus::EndOfInput, '\0' };
}

} // namespace codetyper::ui::cli
