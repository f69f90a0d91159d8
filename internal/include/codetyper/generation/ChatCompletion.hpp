#ifndef INTERNAL_INCLUDE_CODETYPER_GENERATION_CHATCOMPLETION_HPP
#define INTERNAL_INCLUDE_CODETYPER_GENERATION_CHATCOMPLETION_HPP

#include "codetyper/generation/CodeSourceService.hpp"
#include "codetyper/generation/Language.hpp"
#include <string>
#include <string_view>

namespace codetyper::generation::detail
{

[[nodiscard]] std::string buildPrompt(Language language, const LengthBand& band);

// OpenAI-style chat completion request with a single user message.
[[nodiscard]] std::string buildChatRequestBody(std::string_view model, std::string_view prompt);

// Returns choices[0].message.content. Throws ProviderError on malformed or error responses.
[[nodiscard]] std::string parseChatResponseContent(std::string_view body);

} // namespace codetyper::generation::detail

#endif // INTERNAL_INCLUDE_CODETYPER_GENERATION_CHATCOMPLETION_HPP
