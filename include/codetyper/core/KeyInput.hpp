#ifndef INCLUDE_CODETYPER_CORE_KEYINPUT_HPP
#define INCLUDE_CODETYPER_CORE_KEYINPUT_HPP

#include <cstdint>
#include <optional>

namespace codetyper::core
{

enum class KeyKind : std::uint8_t
{
    Character,
    Enter,
    Other,
};

struct KeyInput final
{
    KeyKind kind{ KeyKind::Other };
    char32_t character{ U'\0' };
};

[[nodiscard]] constexpr KeyInput characterKey(char32_t c) noexcept
{
    return KeyInput{ KeyKind::Character, c };
}

[[nodiscard]] constexpr KeyInput enterKey() noexcept
{
    return KeyInput{ KeyKind::Enter, U'\n' };
}

[[nodiscard]] constexpr KeyInput otherKey() noexcept
{
    return KeyInput{ KeyKind::Other, U'\0' };
}

// Maps a key event to the logical character compared against the target.
// Enter becomes '\n'. Modifier-only keys and control codes (except tab) are not evaluated.
[[nodiscard]] std::optional<char32_t> normalize(const KeyInput& input) noexcept;

} // namespace codetyper::core

#endif // INCLUDE_CODETYPER_CORE_KEYINPUT_HPP
