#ifndef INCLUDE_CODETYPER_GENERATION_CODESOURCESERVICE_HPP
#define INCLUDE_CODETYPER_GENERATION_CODESOURCESERVICE_HPP

#include "codetyper/generation/ICodeProvider.hpp"
#include "codetyper/generation/Language.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace codetyper::generation
{

struct LengthBand final
{
    std::size_t minLines{ 175 };
    std::size_t maxLines{ 200 };
};

enum class SnippetOrigin : std::uint8_t
{
    Generated,
    Truncated,
    FallbackTooShort,
    FallbackProviderFailed,
};

struct SnippetResult final
{
    std::string text;
    SnippetOrigin origin{ SnippetOrigin::Generated };
    // Set only when the user should hear about the fallback.
    std::optional<std::string> warning;
};

class CodeSourceService final
{
public:
    explicit CodeSourceService(ICodeProvider& provider, LengthBand band = {}) noexcept;

    // Fetches once and applies the length band; never retries and never throws provider errors.
    [[nodiscard]] SnippetResult acquireSnippet(Language language);

    [[nodiscard]] const LengthBand& band() const noexcept;

private:
    ICodeProvider* m_provider{ nullptr };
    LengthBand m_band{};
};

[[nodiscard]] std::size_t countLines(std::string_view text) noexcept;

// Keeps the first maxLines lines, joined by '\n' without a trailing newline.
[[nodiscard]] std::string truncateLines(std::string_view text, std::size_t maxLines);

[[nodiscard]] std::string_view toString(SnippetOrigin origin) noexcept;

} // namespace codetyper::generation

#endif // INCLUDE_CODETYPER_GENERATION_CODESOURCESERVICE_HPP
