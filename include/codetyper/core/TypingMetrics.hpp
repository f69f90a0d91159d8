#ifndef INCLUDE_CODETYPER_CORE_TYPINGMETRICS_HPP
#define INCLUDE_CODETYPER_CORE_TYPINGMETRICS_HPP

#include <cstddef>
#include <cstdint>

namespace codetyper::core
{

constexpr double g_charsPerWord{ 5.0 };
constexpr double g_secondsPerMinute{ 60.0 };

[[nodiscard]] double progressPercentage(std::size_t position, std::size_t length) noexcept;

[[nodiscard]] double accuracyPercentage(std::size_t errorCount, std::size_t totalKeystrokes) noexcept;

// Counts correctly typed characters, not raw keystrokes.
[[nodiscard]] double wordsPerMinute(std::size_t position, std::int64_t elapsedSeconds) noexcept;

} // namespace codetyper::core

#endif // INCLUDE_CODETYPER_CORE_TYPINGMETRICS_HPP
