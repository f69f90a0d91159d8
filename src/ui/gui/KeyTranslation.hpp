#ifndef SRC_UI_GUI_KEYTRANSLATION_HPP
#define SRC_UI_GUI_KEYTRANSLATION_HPP

#include "codetyper/core/KeyInput.hpp"
#include <QKeyEvent>

namespace codetyper::ui
{

// Return/Enter become Enter, single printable characters without Ctrl/Alt/Meta become Character,
// everything else is Other.
[[nodiscard]] codetyper::core::KeyInput toKeyInput(const QKeyEvent& event);

} // namespace codetyper::ui

#endif // SRC_UI_GUI_KEYTRANSLATION_HPP
