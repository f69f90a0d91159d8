#include "KeyTranslation.hpp"
#include <QList>
#include <QString>

namespace codetyper::ui
{

codetyper::core::KeyInput toKeyInput(const QKeyEvent& event)
{
    if (event.key() == Qt::Key_Return || event.key() == Qt::Key_Enter)
    {
        return codetyper::core::enterKey();
    }

    const Qt::KeyboardModifiers shortcutModifiers = Qt::ControlModifier | Qt::AltModifier | Qt::MetaModifier;
    if (event.modifiers() & shortcutModifiers)
    {
        return codetyper::core::otherKey();
    }

    const QList<uint> codePoints = event.text().toUcs4();
    if (codePoints.size() != 1)
    {
        return codetyper::core::otherKey();
    }

    return codetyper::core::characterKey(static_cast<char32_t>(codePoints.front()));
}

} // namespace codetyper::ui
