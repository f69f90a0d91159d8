#ifndef INCLUDE_CODETYPER_GENERATION_SAMPLESNIPPETS_HPP
#define INCLUDE_CODETYPER_GENERATION_SAMPLESNIPPETS_HPP

#include "codetyper/generation/Language.hpp"
#include <string_view>

namespace codetyper::generation
{

// Built-in snippet used when generation fails or returns too little code.
[[nodiscard]] std::string_view builtinSnippet(Language language) noexcept;

} // namespace codetyper::generation

#endif // INCLUDE_CODETYPER_GENERATION_SAMPLESNIPPETS_HPP
