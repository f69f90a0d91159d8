#ifndef INCLUDE_CODETYPER_CORE_TARGETBUFFER_HPP
#define INCLUDE_CODETYPER_CORE_TARGETBUFFER_HPP

#include <cstddef>
#include <string>

namespace codetyper::core
{

class TargetBuffer final
{
public:
    TargetBuffer() = default;
    explicit TargetBuffer(std::u32string text);

    // Replaces the text and moves the caret back to the start.
    void setTarget(std::u32string text);

    // Throws InvalidPosition unless position < length().
    [[nodiscard]] char32_t expectedChar(std::size_t position) const;
    [[nodiscard]] char32_t expectedChar() const;

    void advance();

    [[nodiscard]] const std::u32string& text() const noexcept;
    [[nodiscard]] std::size_t length() const noexcept;
    [[nodiscard]] std::size_t position() const noexcept;
    [[nodiscard]] bool isComplete() const noexcept;

private:
    std::u32string m_text;
    std::size_t m_position{ 0 };
};

} // namespace codetyper::core

#endif // INCLUDE_CODETYPER_CORE_TARGETBUFFER_HPP
