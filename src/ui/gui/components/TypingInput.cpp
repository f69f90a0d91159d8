#include "TypingInput.hpp"
#include "KeyTranslation.hpp"
#include <QColor>
#include <QFont>
#include <QFontDatabase>
#include <QKeySequence>
#include <QPalette>
#include <QString>
#include <QTextCursor>

namespace
{
constexpr int g_fontPointSize = 12;
} // namespace

TypingInput::TypingInput(QWidget* parent) : QPlainTextEdit(parent)
{
    setLineWrapMode(QPlainTextEdit::NoWrap);
    setObjectName("TypingInput");
    setUndoRedoEnabled(false);
    setContextMenuPolicy(Qt::NoContextMenu);

    QFont font = QFontDatabase::systemFont(QFontDatabase::FixedFont);
    font.setPointSize(g_fontPointSize);
    setFont(font);

    QPalette pal = palette();
    pal.setColor(QPalette::Base, QColor("#ffffff"));
    setPalette(pal);
}

TypingInput::~TypingInput()
{
    attachSession(nullptr);
}

void TypingInput::attachSession(codetyper::core::PracticeSession* session)
{
    if (m_session != nullptr)
    {
        m_session->matcher().unsubscribe(*this);
    }

    m_session = session;

    if (m_session != nullptr)
    {
        m_session->matcher().subscribe(*this);
    }
}

void TypingInput::keyPressEvent(QKeyEvent* event)
{
    if (m_session == nullptr)
    {
        event->accept();
        return;
    }

    const auto result = m_session->handleInput(codetyper::ui::toKeyInput(*event));
    if (result.disposition != codetyper::core::InputDisposition::PassThrough)
    {
        event->accept();
        return;
    }

    // Shortcuts that leave the typed text untouched still work.
    if (event->matches(QKeySequence::Copy) || event->matches(QKeySequence::SelectAll))
    {
        QPlainTextEdit::keyPressEvent(event);
        return;
    }

    event->ignore();
}

bool TypingInput::canInsertFromMimeData(const QMimeData* /*source*/) const
{
    return false;
}

void TypingInput::insertFromMimeData(const QMimeData* /*source*/)
{
}

void TypingInput::onKeystroke(const codetyper::core::KeystrokeOutcome& outcome)
{
    if (outcome.correct && m_session != nullptr)
    {
        appendCharacter(m_session->matcher().buffer().expectedChar(outcome.position));
    }
    emit typingProgress(static_cast<int>(outcome.position), outcome.correct);
}

void TypingInput::onComplete()
{
    emit typingComplete();
}

void TypingInput::appendCharacter(char32_t c)
{
    QTextCursor cursor(document());
    cursor.movePosition(QTextCursor::End);
    cursor.insertText(QString::fromUcs4(&c, 1));
    setTextCursor(cursor);
    ensureCursorVisible();
}
