#ifndef SRC_UI_GUI_COMPONENTS_TYPINGINPUT_HPP
#define SRC_UI_GUI_COMPONENTS_TYPINGINPUT_HPP

#include "codetyper/core/PracticeSession.hpp"
#include "codetyper/core/TypingMatcher.hpp"
#include <QKeyEvent>
#include <QMimeData>
#include <QPlainTextEdit>

// Typing area. Key presses go to the session's matcher; only correctly typed
// characters are ever appended to the visible text.
class TypingInput final : public QPlainTextEdit, private codetyper::core::ITypingObserver
{
    Q_OBJECT
public:
    explicit TypingInput(QWidget* parent = nullptr);
    ~TypingInput() override;

    TypingInput(const TypingInput&) = delete;
    TypingInput& operator=(const TypingInput&) = delete;
    TypingInput(TypingInput&&) = delete;
    TypingInput& operator=(TypingInput&&) = delete;

    // The session is not owned and must outlive the widget or be detached first.
    void attachSession(codetyper::core::PracticeSession* session);

signals:
    void typingProgress(int position, bool correct);
    void typingComplete();

protected:
    void keyPressEvent(QKeyEvent* event) override;
    [[nodiscard]] bool canInsertFromMimeData(const QMimeData* source) const override;
    void insertFromMimeData(const QMimeData* source) override;

private:
    void onKeystroke(const codetyper::core::KeystrokeOutcome& outcome) override;
    void onComplete() override;

    void appendCharacter(char32_t c);

    codetyper::core::PracticeSession* m_session{ nullptr };
};

#endif // SRC_UI_GUI_COMPONENTS_TYPINGINPUT_HPP
