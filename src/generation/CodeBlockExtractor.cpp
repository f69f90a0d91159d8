#include "codetyper/generation/CodeBlockExtractor.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <vector>

namespace codetyper::generation
{
namespace
{

constexpr std::string_view g_fence{ "```" };
constexpr std::string_view g_thinkOpen{ "<think>" };
constexpr std::string_view g_thinkClose{ "</think>" };

struct FenceAliases final
{
    Language language;
    std::array<std::string_view, 4> tags;
};

constexpr std::array<FenceAliases, 5> g_fenceAliases{ {
    { Language::Python, { "python", "py", "python3", "" } },
    { Language::Cpp, { "cpp", "c++", "cc", "cxx" } },
    { Language::Java, { "java", "", "", "" } },
    { Language::Rust, { "rust", "rs", "", "" } },
    { Language::JavaScript, { "javascript", "js", "", "" } },
} };

struct FencedBlock final
{
    std::string_view info;
    std::string_view body;
};

std::string toLower(std::string_view s)
{
    std::string out{ s };
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0)
    {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0)
    {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<FencedBlock> fencedBlocks(std::string_view text)
{
    std::vector<FencedBlock> blocks{};
    std::size_t cursor{ 0 };
    while (true)
    {
        const auto open{ text.find(g_fence, cursor) };
        if (open == std::string_view::npos)
        {
            break;
        }
        const auto contentStart{ open + g_fence.size() };
        auto close{ text.find(g_fence, contentStart) };
        const bool closed{ close != std::string_view::npos };
        if (!closed)
        {
            close = text.size();
        }

        const std::string_view content{ text.substr(contentStart, close - contentStart) };
        const auto newline{ content.find('\n') };
        if (newline == std::string_view::npos)
        {
            blocks.push_back(FencedBlock{ content, std::string_view{} });
        }
        else
        {
            blocks.push_back(FencedBlock{ content.substr(0, newline), content.substr(newline + 1) });
        }

        if (!closed)
        {
            break;
        }
        cursor = close + g_fence.size();
    }
    return blocks;
}

bool infoNamesLanguage(std::string_view info, Language language)
{
    const auto tag{ toLower(trim(info)) };
    if (tag.empty())
    {
        return false;
    }
    if (tag == toLower(languageId(language)) || tag == toLower(displayName(language)))
    {
        return true;
    }
    for (const auto& entry : g_fenceAliases)
    {
        if (entry.language != language)
        {
            continue;
        }
        return std::any_of(entry.tags.begin(), entry.tags.end(),
                           [&](std::string_view alias) { return !alias.empty() && tag == alias; });
    }
    return false;
}

} // namespace

std::string stripReasoning(std::string_view response)
{
    std::string out{};
    std::size_t cursor{ 0 };

    // A bare closing tag means the opening one was swallowed upstream.
    const auto firstOpen{ response.find(g_thinkOpen) };
    const auto firstClose{ response.find(g_thinkClose) };
    if (firstClose != std::string_view::npos && (firstOpen == std::string_view::npos || firstClose < firstOpen))
    {
        cursor = firstClose + g_thinkClose.size();
    }

    while (cursor < response.size())
    {
        const auto open{ response.find(g_thinkOpen, cursor) };
        if (open == std::string_view::npos)
        {
            out.append(response.substr(cursor));
            break;
        }
        out.append(response.substr(cursor, open - cursor));

        const auto close{ response.find(g_thinkClose, open + g_thinkOpen.size()) };
        if (close == std::string_view::npos)
        {
            break;
        }
        cursor = close + g_thinkClose.size();
    }
    return out;
}

std::string extractCodeBlock(std::string_view response, Language language)
{
    const std::string cleaned{ stripReasoning(response) };
    const auto blocks{ fencedBlocks(cleaned) };
    if (blocks.empty())
    {
        return cleaned;
    }

    for (const auto& block : blocks)
    {
        if (infoNamesLanguage(block.info, language))
        {
            return std::string{ block.body };
        }
    }
    return std::string{ blocks.front().body };
}

} // namespace codetyper::generation
