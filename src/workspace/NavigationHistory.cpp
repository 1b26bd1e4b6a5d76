/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "NavigationHistory.h"

namespace Workdeck
{

void NavigationHistory::navigate(const QString &url)
{
    m_guardArmed = false;
    record(url);
}

bool NavigationHistory::addressChanged(const QString &url)
{
    if (m_guardArmed) {
        m_guardArmed = false;
        return false;
    }
    record(url);
    return true;
}

bool NavigationHistory::goBack()
{
    if (!canGoBack()) {
        return false;
    }
    --m_index;
    m_guardArmed = true;
    return true;
}

bool NavigationHistory::goForward()
{
    if (!canGoForward()) {
        return false;
    }
    ++m_index;
    m_guardArmed = true;
    return true;
}

QString NavigationHistory::current() const
{
    if (m_index < 0) {
        return QString();
    }
    return m_entries.at(m_index);
}

void NavigationHistory::record(const QString &url)
{
    if (url.isEmpty()) {
        return;
    }
    if (m_index >= 0 && m_entries.at(m_index) == url) {
        return;
    }

    // Drop forward entries
    while (m_entries.size() > m_index + 1) {
        m_entries.removeLast();
    }
    m_entries.append(url);
    m_index = m_entries.size() - 1;
}

} // namespace Workdeck
