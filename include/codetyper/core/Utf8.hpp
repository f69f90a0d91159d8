#ifndef INCLUDE_CODETYPER_CORE_UTF8_HPP
#define INCLUDE_CODETYPER_CORE_UTF8_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace codetyper::core
{

constexpr char32_t g_replacementChar{ U'\uFFFD' };

// Malformed sequences decode to U+FFFD.
[[nodiscard]] std::u32string decodeUtf8(std::string_view in);

[[nodiscard]] std::string encodeUtf8(std::u32string_view in);
[[nodiscard]] std::string encodeUtf8(char32_t c);

// Total length of the sequence introduced by a lead byte, 0 for a continuation or invalid byte.
[[nodiscard]] std::size_t utf8SequenceLength(unsigned char lead) noexcept;

} // namespace codetyper::core

#endif // INCLUDE_CODETYPER_CORE_UTF8_HPP
