/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceShortcuts.h"

namespace Workdeck
{

ShortcutMatch matchShortcut(int key, Qt::KeyboardModifiers modifiers)
{
    ShortcutMatch match;

    const Qt::KeyboardModifiers chord = modifiers & ~Qt::KeypadModifier;
    const bool ctrlOnly = chord == Qt::ControlModifier;
    const bool ctrlShift = chord == (Qt::ControlModifier | Qt::ShiftModifier);

    if (ctrlOnly) {
        if (key == Qt::Key_T) {
            match.action = ShortcutAction::NewTab;
        } else if (key == Qt::Key_W) {
            match.action = ShortcutAction::CloseTab;
        } else if (key >= Qt::Key_1 && key <= Qt::Key_9) {
            match.action = ShortcutAction::JumpToTab;
            match.tabIndex = key - Qt::Key_1;
        }
        return match;
    }

    if (ctrlShift) {
        // Shift turns [ ] into { } on most layouts
        if (key == Qt::Key_BracketLeft || key == Qt::Key_BraceLeft) {
            match.action = ShortcutAction::PreviousTab;
            match.requiresShift = true;
        } else if (key == Qt::Key_BracketRight || key == Qt::Key_BraceRight) {
            match.action = ShortcutAction::NextTab;
            match.requiresShift = true;
        }
    }
    return match;
}

bool panelHandlesShortcut(const ShortcutMatch &match, FocusTarget focus)
{
    if (!match.isValid()) {
        return false;
    }

    switch (focus) {
    case FocusTarget::Panel:
        return true;
    case FocusTarget::Terminal:
        return match.requiresShift || match.action == ShortcutAction::JumpToTab;
    }
    return false;
}

} // namespace Workdeck
