#ifndef INCLUDE_CODETYPER_GENERATION_CODEBLOCKEXTRACTOR_HPP
#define INCLUDE_CODETYPER_GENERATION_CODEBLOCKEXTRACTOR_HPP

#include "codetyper/generation/Language.hpp"
#include <string>
#include <string_view>

namespace codetyper::generation
{

// Removes <think>...</think> reasoning sections emitted by some models.
[[nodiscard]] std::string stripReasoning(std::string_view response);

// Returns the body of the fenced block tagged with the language, else the first fenced block,
// else the response unchanged. The fence info line is never part of the result.
[[nodiscard]] std::string extractCodeBlock(std::string_view response, Language language);

} // namespace codetyper::generation

#endif // INCLUDE_CODETYPER_GENERATION_CODEBLOCKEXTRACTOR_HPP
