#include "codetyper/core/TargetBuffer.hpp"
#include "codetyper/core/CoreErrors.hpp"
#include <string>
#include <utility>

namespace codetyper::core
{

TargetBuffer::TargetBuffer(std::u32string text) : m_text(std::move(text))
{
}

void TargetBuffer::setTarget(std::u32string text)
{
    m_text = std::move(text);
    m_position = 0;
}

char32_t TargetBuffer::expectedChar(std::size_t position) const
{
    if (position >= m_text.size())
    {
        throw InvalidPosition("expectedChar: position " + std::to_string(position) + " outside target of length " +
                              std::to_string(m_text.size()));
    }
    return m_text[position];
}

char32_t TargetBuffer::expectedChar() const
{
    return expectedChar(m_position);
}

void TargetBuffer::advance()
{
    if (isComplete())
    {
        throw InvalidPosition("advance: caret already at end of target");
    }
    ++m_position;
}

const std::u32string& TargetBuffer::text() const noexcept
{
    return m_text;
}

std::size_t TargetBuffer::length() const noexcept
{
    return m_text.size();
}

std::size_t TargetBuffer::position() const noexcept
{
    return m_position;
}

bool TargetBuffer::isComplete() const noexcept
{
    return m_position >= m_text.size();
}

} // namespace codetyper::core
