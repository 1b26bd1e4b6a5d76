/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACESHORTCUTS_H
#define WORKSPACESHORTCUTS_H

#include "workdeckprivate_export.h"

#include <Qt>

namespace Workdeck
{

enum class ShortcutAction {
    None,
    NewTab, // Ctrl+T
    CloseTab, // Ctrl+W
    JumpToTab, // Ctrl+1..9
    PreviousTab, // Ctrl+Shift+[
    NextTab, // Ctrl+Shift+]
};

struct WORKDECKPRIVATE_EXPORT ShortcutMatch {
    ShortcutAction action = ShortcutAction::None;
    int tabIndex = -1; // JumpToTab only, zero-based
    bool requiresShift = false;

    bool isValid() const
    {
        return action != ShortcutAction::None;
    }
};

/**
 * Which part of the panel holds keyboard focus
 */
enum class FocusTarget {
    Panel,
    Terminal,
};

/**
 * Map a key chord to a panel action. Keypad digits count as digits.
 */
WORKDECKPRIVATE_EXPORT ShortcutMatch matchShortcut(int key, Qt::KeyboardModifiers modifiers);

/**
 * Whether the panel handles @p match given the current focus.
 *
 * A focused terminal keeps Ctrl+<letter> chords without Shift, which are
 * control characters for the shell. Digit and Shift chords always reach the
 * panel.
 */
WORKDECKPRIVATE_EXPORT bool panelHandlesShortcut(const ShortcutMatch &match, FocusTarget focus);

} // namespace Workdeck

#endif // WORKSPACESHORTCUTS_H
