#include "codetyper/generation/CodeSourceService.hpp"
#include "codetyper/generation/GenerationErrors.hpp"
#include "codetyper/generation/SampleSnippets.hpp"
#include <exception>
#include <string>
#include <utility>

namespace codetyper::generation
{
namespace
{

std::string normalizeLineEndings(std::string_view text)
{
    std::string out{};
    out.reserve(text.size());
    for (std::size_t i{ 0 }; i < text.size(); ++i)
    {
        const char c{ text[i] };
        if (c == '\r')
        {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n')
            {
                ++i;
            }
            continue;
        }
        out.push_back(c);
    }
    return out;
}

SnippetResult fallback(Language language, SnippetOrigin origin, std::optional<std::string> warning)
{
    return SnippetResult{ std::string{ builtinSnippet(language) }, origin, std::move(warning) };
}

} // namespace

CodeSourceService::CodeSourceService(ICodeProvider& provider, LengthBand band) noexcept
    : m_provider(&provider), m_band(band)
{
}

SnippetResult CodeSourceService::acquireSnippet(Language language)
{
    std::string generated{};
    try
    {
        generated = normalizeLineEndings(m_provider->fetchCode(language));
    }
    catch (const ProviderUnavailable& e)
    {
        return fallback(language, SnippetOrigin::FallbackProviderFailed,
                        std::string{ "Code generator unavailable, using sample code instead: " } + e.what());
    }
    catch (const ProviderError& e)
    {
        return fallback(language, SnippetOrigin::FallbackProviderFailed,
                        std::string{ "Could not generate code, using sample code instead: " } + e.what());
    }
    catch (const std::exception& e)
    {
        return fallback(language, SnippetOrigin::FallbackProviderFailed,
                        std::string{ "Code generator failed unexpectedly, using sample code instead: " } + e.what());
    }

    const std::size_t lines{ countLines(generated) };
    if (lines > m_band.maxLines)
    {
        return SnippetResult{ truncateLines(generated, m_band.maxLines), SnippetOrigin::Truncated, std::nullopt };
    }
    if (lines < m_band.minLines)
    {
        return fallback(language, SnippetOrigin::FallbackTooShort, std::nullopt);
    }
    return SnippetResult{ std::move(generated), SnippetOrigin::Generated, std::nullopt };
}

const LengthBand& CodeSourceService::band() const noexcept
{
    return m_band;
}

std::size_t countLines(std::string_view text) noexcept
{
    if (text.empty())
    {
        return 0;
    }

    std::size_t lines{ 0 };
    for (const char c : text)
    {
        if (c == '\n')
        {
            ++lines;
        }
    }
    if (text.back() != '\n')
    {
        ++lines;
    }
    return lines;
}

std::string truncateLines(std::string_view text, std::size_t maxLines)
{
    std::size_t kept{ 0 };
    std::size_t end{ 0 };
    while (end < text.size() && kept < maxLines)
    {
        const auto newline{ text.find('\n', end) };
        if (newline == std::string_view::npos)
        {
            end = text.size();
            ++kept;
            break;
        }
        ++kept;
        end = newline + 1;
    }

    std::string out{ text.substr(0, end) };
    if (!out.empty() && out.back() == '\n')
    {
        out.pop_back();
    }
    return out;
}

std::string_view toString(SnippetOrigin origin) noexcept
{
    switch (origin)
    {
    case SnippetOrigin::Generated:
        return "generated";
    case SnippetOrigin::Truncated:
        return "generated (truncated)";
    case SnippetOrigin::FallbackTooShort:
        return "sample (generated code too short)";
    case SnippetOrigin::FallbackProviderFailed:
        return "sample (generator failed)";
    }
    return "unknown";
}

} // namespace codetyper::generation
