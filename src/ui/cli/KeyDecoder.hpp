#ifndef CODETYPER_UI_CLI_KEYDECODER_HPP
#define CODETYPER_UI_CLI_KEYDECODER_HPP

#include "codetyper/core/KeyInput.hpp"
#include <cstddef>
#include <optional>

namespace codetyper::ui::cli
{

// Turns raw terminal bytes into key events: UTF-8 sequences become one character,
// CR/LF become Enter and ANSI escape sequences collapse into a single non-evaluated key.
class KeyDecoder
{
public:
    [[nodiscard]] std::optional<codetyper::core::KeyInput> feed(char byte);

    // Called when input goes quiet. A pending lone Escape becomes one non-character key,
    // any other partial sequence is dropped.
    [[nodiscard]] std::optional<codetyper::core::KeyInput> flush() noexcept;

    void reset() noexcept;

private:
    enum class Mode
    {
        Ground,
        Escape,
        Csi,
        Utf8
    };

    std::optional<codetyper::core::KeyInput> handleGround(unsigned char b);
    std::optional<codetyper::core::KeyInput> handleEscape(unsigned char b);
    std::optional<codetyper::core::KeyInput> handleCsi(unsigned char b);
    std::optional<codetyper::core::KeyInput> handleUtf8(unsigned char b);

    Mode m_mode{ Mode::Ground };
    char32_t m_pending{ 0 };
    std::size_t m_remaining{ 0 };
    std::size_t m_length{ 0 };
};

} // namespace codetyper::ui::cli

#endif // CODETYPER_UI_CLI_KEYDECODER_HPP
