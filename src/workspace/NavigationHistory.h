/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef NAVIGATIONHISTORY_H
#define NAVIGATIONHISTORY_H

#include "workdeckprivate_export.h"

#include <QString>
#include <QStringList>

namespace Workdeck
{

/**
 * Back/forward history of one browser session.
 *
 * goBack()/goForward() move the index and arm a guard: the surface will
 * report the address it moved to, and that report must not be recorded as
 * a new entry. The guard is consumed by the next addressChanged() call, or
 * cleared by the next user navigation.
 */
class WORKDECKPRIVATE_EXPORT NavigationHistory
{
public:
    /**
     * User-initiated navigation. Truncates forward history.
     */
    void navigate(const QString &url);

    /**
     * The surface reports its address.
     *
     * @return true if the address was recorded, false if it was absorbed by
     *         a pending back/forward
     */
    bool addressChanged(const QString &url);

    bool goBack();
    bool goForward();

    bool canGoBack() const
    {
        return m_index > 0;
    }

    bool canGoForward() const
    {
        return m_index >= 0 && m_index < m_entries.size() - 1;
    }

    /**
     * Current entry, empty before the first navigation
     */
    QString current() const;

    int index() const
    {
        return m_index;
    }

    int size() const
    {
        return m_entries.size();
    }

    QStringList entries() const
    {
        return m_entries;
    }

    bool isGuardArmed() const
    {
        return m_guardArmed;
    }

private:
    void record(const QString &url);

    QStringList m_entries;
    int m_index = -1;
    bool m_guardArmed = false;
};

} // namespace Workdeck

#endif // NAVIGATIONHISTORY_H
