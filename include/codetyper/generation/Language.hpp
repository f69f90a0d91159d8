#ifndef INCLUDE_CODETYPER_GENERATION_LANGUAGE_HPP
#define INCLUDE_CODETYPER_GENERATION_LANGUAGE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace codetyper::generation
{

enum class Language : std::uint8_t
{
    Python,
    Cpp,
    Java,
    Rust,
    JavaScript,
};

constexpr std::array<Language, 5> g_allLanguages{
    Language::Python, Language::Cpp, Language::Java, Language::Rust, Language::JavaScript,
};

constexpr Language g_defaultLanguage{ Language::Python };

// Short id used by the generator prompt and the CLI ("py", "cpp", ...).
[[nodiscard]] std::string_view languageId(Language language) noexcept;

[[nodiscard]] std::string_view displayName(Language language) noexcept;

// Accepts an id or a display name, case-insensitively.
[[nodiscard]] std::optional<Language> parseLanguage(std::string_view text) noexcept;

} // namespace codetyper::generation

#endif // INCLUDE_CODETYPER_GENERATION_LANGUAGE_HPP
