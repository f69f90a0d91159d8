#ifndef INCLUDE_CODETYPER_CORE_SESSIONTIMER_HPP
#define INCLUDE_CODETYPER_CORE_SESSIONTIMER_HPP

#include <array>
#include <chrono>
#include <cstdint>

namespace codetyper::core
{

class SessionTimer final
{
public:
    using Duration = std::chrono::seconds;

    SessionTimer() = default;
    explicit SessionTimer(Duration duration) noexcept;

    void restart(Duration duration) noexcept;

    // One fixed-period tick. Does nothing once expired.
    void tick() noexcept;

    [[nodiscard]] bool isExpired() const noexcept;
    [[nodiscard]] Duration duration() const noexcept;
    [[nodiscard]] std::int64_t elapsedSeconds() const noexcept;
    [[nodiscard]] std::int64_t remainingSeconds() const noexcept;

private:
    Duration m_duration{};
    std::int64_t m_elapsed{ 0 };
    std::int64_t m_remaining{ 0 };
};

constexpr std::array<SessionTimer::Duration, 4> g_durationPresets{
    SessionTimer::Duration{ 30 },
    SessionTimer::Duration{ 60 },
    SessionTimer::Duration{ 120 },
    SessionTimer::Duration{ 180 },
};

} // namespace codetyper::core

#endif // INCLUDE_CODETYPER_CORE_SESSIONTIMER_HPP
