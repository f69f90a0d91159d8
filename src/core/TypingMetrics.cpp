#include "codetyper/core/TypingMetrics.hpp"

namespace codetyper::core
{

double progressPercentage(std::size_t position, std::size_t length) noexcept
{
    if (length == 0U)
    {
        return 0.0;
    }
    return 100.0 * static_cast<double>(position) / static_cast<double>(length);
}

double accuracyPercentage(std::size_t errorCount, std::size_t totalKeystrokes) noexcept
{
    if (totalKeystrokes == 0U)
    {
        return 100.0;
    }
    return 100.0 - (100.0 * static_cast<double>(errorCount) / static_cast<double>(totalKeystrokes));
}

double wordsPerMinute(std::size_t position, std::int64_t elapsedSeconds) noexcept
{
    if (elapsedSeconds <= 0)
    {
        return 0.0;
    }

    const double words{ static_cast<double>(position) / g_charsPerWord };
    const double minutes{ static_cast<double>(elapsedSeconds) / g_secondsPerMinute };
    return words / minutes;
}

} // namespace codetyper::core
