#include "KeyDecoder.hpp"
#include "codetyper/core/Utf8.hpp"

namespace codetyper::ui::cli
{
namespace
{

constexpr unsigned char g_escape{ 0x1BU };
constexpr unsigned char g_csiIntroducer{ '[' };
constexpr unsigned char g_ss3Introducer{ 'O' };
constexpr unsigned char g_csiParameterFirst{ 0x20U };
constexpr unsigned char g_csiFinalFirst{ 0x40U };
constexpr unsigned char g_csiFinalLast{ 0x7EU };
constexpr unsigned char g_payloadMask{ 0x3FU };
constexpr unsigned char g_continuationMask{ 0xC0U };
constexpr unsigned char g_continuationTag{ 0x80U };
constexpr char32_t g_maxCodePoint{ 0x10FFFF };
constexpr char32_t g_surrogateFirst{ 0xD800 };
constexpr char32_t g_surrogateLast{ 0xDFFF };

} // namespace

std::optional<codetyper::core::KeyInput> KeyDecoder::feed(char byte)
{
    const auto b{ static_cast<unsigned char>(byte) };
    switch (m_mode)
    {
    case Mode::Escape:
        return handleEscape(b);
    case Mode::Csi:
        return handleCsi(b);
    case Mode::Utf8:
        return handleUtf8(b);
    case Mode::Ground:
        break;
    }
    return handleGround(b);
}

std::optional<codetyper::core::KeyInput> KeyDecoder::flush() noexcept
{
    const bool pendingEscape{ m_mode == Mode::Escape };
    reset();
    if (pendingEscape)
    {
        return codetyper::core::otherKey();
    }
    return std::nullopt;
}

void KeyDecoder::reset() noexcept
{
    m_mode = Mode::Ground;
    m_pending = 0;
    m_remaining = 0;
    m_length = 0;
}

std::optional<codetyper::core::KeyInput> KeyDecoder::handleGround(unsigned char b)
{
    if (b == '\r' || b == '\n')
    {
        return codetyper::core::enterKey();
    }
    if (b == g_escape)
    {
        m_mode = Mode::Escape;
        return std::nullopt;
    }

    const std::size_t length{ codetyper::core::utf8SequenceLength(b) };
    if (length == 1)
    {
        return codetyper::core::characterKey(static_cast<char32_t>(b));
    }
    if (length == 0)
    {
        return codetyper::core::characterKey(codetyper::core::g_replacementChar);
    }

    constexpr unsigned char kLeadMasks[]{ 0x00U, 0x7FU, 0x1FU, 0x0FU, 0x07U };
    m_pending = static_cast<char32_t>(b & kLeadMasks[length]);
    m_length = length;
    m_remaining = length - 1;
    m_mode = Mode::Utf8;
    return std::nullopt;
}

std::optional<codetyper::core::KeyInput> KeyDecoder::handleEscape(unsigned char b)
{
    if (b == g_csiIntroducer || b == g_ss3Introducer)
    {
        m_mode = Mode::Csi;
        return std::nullopt;
    }
    // Alt+key or a lone Escape press: swallow as one non-character key.
    m_mode = Mode::Ground;
    return codetyper::core::otherKey();
}

std::optional<codetyper::core::KeyInput> KeyDecoder::handleCsi(unsigned char b)
{
    if (b >= g_csiFinalFirst && b <= g_csiFinalLast)
    {
        m_mode = Mode::Ground;
        return codetyper::core::otherKey();
    }
    if (b < g_csiParameterFirst || b > g_csiFinalLast)
    {
        // Not part of any escape sequence: abandon it and decode the byte on its own.
        m_mode = Mode::Ground;
        return handleGround(b);
    }
    return std::nullopt;
}

std::optional<codetyper::core::KeyInput> KeyDecoder::handleUtf8(unsigned char b)
{
    if ((b & g_continuationMask) != g_continuationTag)
    {
        // Truncated sequence: drop it and start over with this byte.
        reset();
        return handleGround(b);
    }

    m_pending = (m_pending << 6U) | static_cast<char32_t>(b & g_payloadMask);
    if (--m_remaining > 0)
    {
        return std::nullopt;
    }

    const char32_t cp{ m_pending };
    const std::size_t length{ m_length };
    reset();

    constexpr char32_t kMinimum[]{ 0, 0, 0x80, 0x800, 0x10000 };
    if (cp < kMinimum[length] || cp > g_maxCodePoint || (cp >= g_surrogateFirst && cp <= g_surrogateLast))
    {
        return codetyper::core::characterKey(codetyper::core::g_replacementChar);
    }
    return codetyper::core::characterKey(cp);
}

} // namespace codetyper::ui::cli
