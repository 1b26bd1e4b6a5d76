/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PLACEHOLDERTRACKER_H
#define PLACEHOLDERTRACKER_H

#include "workdeckprivate_export.h"

#include <QObject>
#include <QPointer>
#include <QWidget>

namespace Workdeck
{

class OverlaySurfaceCoordinator;

/**
 * Keeps a coordinator's bounds in sync with the widget the native surface
 * is drawn over. Follows the widget's resize, move and show events and the
 * move events of its top-level window.
 */
class WORKDECKPRIVATE_EXPORT PlaceholderTracker : public QObject
{
    Q_OBJECT

public:
    PlaceholderTracker(QWidget *placeholder, OverlaySurfaceCoordinator *coordinator, QObject *parent = nullptr);
    ~PlaceholderTracker() override;

    /**
     * Push the current placeholder geometry to the coordinator
     */
    void sync();

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    QPointer<QWidget> m_placeholder;
    QPointer<QWidget> m_window;
    QPointer<OverlaySurfaceCoordinator> m_coordinator;
};

} // namespace Workdeck

#endif // PLACEHOLDERTRACKER_H
