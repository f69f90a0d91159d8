#include "codetyper/generation/Language.hpp"
#include <algorithm>
#include <cctype>

namespace codetyper::generation
{
namespace
{

struct LanguageInfo final
{
    Language language;
    std::string_view id;
    std::string_view displayName;
};

constexpr std::array<LanguageInfo, 5> g_languageTable{ {
    { Language::Python, "py", "Python" },
    { Language::Cpp, "cpp", "C++" },
    { Language::Java, "java", "Java" },
    { Language::Rust, "rust", "Rust" },
    { Language::JavaScript, "javascript", "JavaScript" },
} };

const LanguageInfo& infoFor(Language language) noexcept
{
    for (const auto& info : g_languageTable)
    {
        if (info.language == language)
        {
            return info;
        }
    }
    return g_languageTable.front();
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(),
                                              [](char x, char y)
                                              {
                                                  return std::tolower(static_cast<unsigned char>(x)) ==
                                                         std::tolower(static_cast<unsigned char>(y));
                                              });
}

} // namespace

std::string_view languageId(Language language) noexcept
{
    return infoFor(language).id;
}

std::string_view displayName(Language language) noexcept
{
    return infoFor(language).displayName;
}

std::optional<Language> parseLanguage(std::string_view text) noexcept
{
    for (const auto& info : g_languageTable)
    {
        if (equalsIgnoreCase(text, info.id) || equalsIgnoreCase(text, info.displayName))
        {
            return info.language;
        }
    }
    return std::nullopt;
}

} // namespace codetyper::generation
