#include "CodeDisplay.hpp"
#include <QColor>
#include <QFont>
#include <QFontDatabase>
#include <QPalette>
#include <QTextCharFormat>
#include <QTextCursor>
#include <algorithm>

namespace
{
constexpr int g_fontPointSize = 12;
constexpr char32_t g_firstSupplementary = 0x10000;
const QColor g_correctBackground{ "#c8e6c9" };
const QColor g_incorrectBackground{ "#ffcdd2" };
} // namespace

CodeDisplay::CodeDisplay(QWidget* parent) : QPlainTextEdit(parent)
{
    setReadOnly(true);
    setLineWrapMode(QPlainTextEdit::NoWrap);
    setObjectName("CodeDisplay");

    QFont font = QFontDatabase::systemFont(QFontDatabase::FixedFont);
    font.setPointSize(g_fontPointSize);
    setFont(font);

    QPalette pal = palette();
    pal.setColor(QPalette::Base, QColor("#f5f5f5"));
    setPalette(pal);
}

void CodeDisplay::setCode(const QString& code)
{
    m_codePoints = code.toStdU32String();
    setPlainText(code);
}

void CodeDisplay::highlightPosition(std::size_t position, bool correct)
{
    if (position >= m_codePoints.size())
    {
        return;
    }

    QTextCursor cursor(document());
    cursor.setPosition(documentOffset(position));
    cursor.movePosition(QTextCursor::Right, QTextCursor::KeepAnchor);

    QTextCharFormat fmt;
    fmt.setBackground(correct ? g_correctBackground : g_incorrectBackground);
    cursor.mergeCharFormat(fmt);
}

void CodeDisplay::scrollToPosition(std::size_t position)
{
    QTextCursor cursor = textCursor();
    cursor.setPosition(documentOffset(position));
    setTextCursor(cursor);
    ensureCursorVisible();
}

int CodeDisplay::documentOffset(std::size_t position) const
{
    // QTextDocument counts UTF-16 units; supplementary characters take two.
    const std::size_t end = std::min(position, m_codePoints.size());
    std::size_t offset = 0;
    for (std::size_t i = 0; i < end; ++i)
    {
        offset += (m_codePoints[i] >= g_firstSupplementary) ? 2U : 1U;
    }
    return static_cast<int>(offset);
}
