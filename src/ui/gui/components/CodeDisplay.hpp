#ifndef SRC_UI_GUI_COMPONENTS_CODEDISPLAY_HPP
#define SRC_UI_GUI_COMPONENTS_CODEDISPLAY_HPP

#include <QPlainTextEdit>
#include <QString>
#include <cstddef>
#include <string>

// Read-only view of the target text with per-character correctness highlighting.
class CodeDisplay final : public QPlainTextEdit
{
    Q_OBJECT
public:
    explicit CodeDisplay(QWidget* parent = nullptr);

    void setCode(const QString& code);

    // Positions are code point indices into the target.
    void highlightPosition(std::size_t position, bool correct);
    void scrollToPosition(std::size_t position);

private:
    [[nodiscard]] int documentOffset(std::size_t position) const;

    std::u32string m_codePoints;
};

#endif // SRC_UI_GUI_COMPONENTS_CODEDISPLAY_HPP
