#include "codetyper/core/Utf8.hpp"
#include <array>
#include <cstdint>

namespace codetyper::core
{
namespace
{

constexpr std::uint32_t g_maxCodePoint{ 0x10FFFFU };
constexpr std::uint32_t g_surrogateFirst{ 0xD800U };
constexpr std::uint32_t g_surrogateLast{ 0xDFFFU };
constexpr unsigned char g_continuationMask{ 0xC0U };
constexpr unsigned char g_continuationTag{ 0x80U };
constexpr unsigned char g_payloadMask{ 0x3FU };
constexpr unsigned g_payloadBits{ 6U };

bool isContinuation(unsigned char b) noexcept
{
    return (b & g_continuationMask) == g_continuationTag;
}

// Smallest code point that needs a sequence of the given length.
std::uint32_t minimumFor(std::size_t length) noexcept
{
    switch (length)
    {
    case 2:
        return 0x80U;
    case 3:
        return 0x800U;
    case 4:
        return 0x10000U;
    default:
        return 0U;
    }
}

} // namespace

std::size_t utf8SequenceLength(unsigned char lead) noexcept
{
    if (lead < 0x80U)
    {
        return 1;
    }
    if ((lead & 0xE0U) == 0xC0U)
    {
        return 2;
    }
    if ((lead & 0xF0U) == 0xE0U)
    {
        return 3;
    }
    if ((lead & 0xF8U) == 0xF0U)
    {
        return 4;
    }
    return 0;
}

std::u32string decodeUtf8(std::string_view in)
{
    std::u32string out{};
    out.reserve(in.size());

    std::size_t i{ 0 };
    while (i < in.size())
    {
        const auto lead{ static_cast<unsigned char>(in[i]) };
        const std::size_t length{ utf8SequenceLength(lead) };
        if (length == 0 || i + length > in.size())
        {
            out.push_back(g_replacementChar);
            ++i;
            continue;
        }
        if (length == 1)
        {
            out.push_back(static_cast<char32_t>(lead));
            ++i;
            continue;
        }

        constexpr std::array<unsigned char, 5> kLeadMasks{ 0x00U, 0x7FU, 0x1FU, 0x0FU, 0x07U };
        std::uint32_t cp{ static_cast<std::uint32_t>(lead & kLeadMasks[length]) };
        bool valid{ true };
        for (std::size_t k{ 1 }; k < length; ++k)
        {
            const auto b{ static_cast<unsigned char>(in[i + k]) };
            if (!isContinuation(b))
            {
                valid = false;
                break;
            }
            cp = (cp << g_payloadBits) | static_cast<std::uint32_t>(b & g_payloadMask);
        }

        if (!valid || cp < minimumFor(length) || cp > g_maxCodePoint ||
            (cp >= g_surrogateFirst && cp <= g_surrogateLast))
        {
            out.push_back(g_replacementChar);
            ++i;
            continue;
        }

        out.push_back(static_cast<char32_t>(cp));
        i += length;
    }
    return out;
}

std::string encodeUtf8(char32_t c)
{
    auto cp{ static_cast<std::uint32_t>(c) };
    if (cp > g_maxCodePoint || (cp >= g_surrogateFirst && cp <= g_surrogateLast))
    {
        cp = static_cast<std::uint32_t>(g_replacementChar);
    }

    std::string out{};
    if (cp < 0x80U)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800U)
    {
        out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
        out.push_back(static_cast<char>(g_continuationTag | (cp & g_payloadMask)));
    }
    else if (cp < 0x10000U)
    {
        out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
        out.push_back(static_cast<char>(g_continuationTag | ((cp >> 6U) & g_payloadMask)));
        out.push_back(static_cast<char>(g_continuationTag | (cp & g_payloadMask)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
        out.push_back(static_cast<char>(g_continuationTag | ((cp >> 12U) & g_payloadMask)));
        out.push_back(static_cast<char>(g_continuationTag | ((cp >> 6U) & g_payloadMask)));
        out.push_back(static_cast<char>(g_continuationTag | (cp & g_payloadMask)));
    }
    return out;
}

std::string encodeUtf8(std::u32string_view in)
{
    std::string out{};
    out.reserve(in.size());
    for (const char32_t c : in)
    {
        out += encodeUtf8(c);
    }
    return out;
}

} // namespace codetyper::core
