#include "codetyper/core/KeyInput.hpp"

namespace codetyper::core
{
namespace
{

constexpr char32_t g_firstPrintable{ U' ' };
constexpr char32_t g_delete{ U'\x7F' };
constexpr char32_t g_c1First{ U'\x80' };
constexpr char32_t g_c1Last{ U'\x9F' };

bool isControl(char32_t c) noexcept
{
    return c < g_firstPrintable || c == g_delete || (c >= g_c1First && c <= g_c1Last);
}

} // namespace

std::optional<char32_t> normalize(const KeyInput& input) noexcept
{
    switch (input.kind)
    {
    case KeyKind::Enter:
        return U'\n';
    case KeyKind::Character:
        if (input.character == U'\n' || input.character == U'\r')
        {
            return U'\n';
        }
        if (input.character == U'\t')
        {
            return U'\t';
        }
        if (isControl(input.character))
        {
            return std::nullopt;
        }
        return input.character;
    case KeyKind::Other:
        break;
    }
    return std::nullopt;
}

} // namespace codetyper::core
