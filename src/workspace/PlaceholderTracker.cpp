/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PlaceholderTracker.h"

#include "OverlaySurfaceCoordinator.h"

#include <QEvent>

namespace Workdeck
{

PlaceholderTracker::PlaceholderTracker(QWidget *placeholder, OverlaySurfaceCoordinator *coordinator, QObject *parent)
    : QObject(parent)
    , m_placeholder(placeholder)
    , m_coordinator(coordinator)
{
    if (m_placeholder) {
        m_placeholder->installEventFilter(this);
        m_window = m_placeholder->window();
        if (m_window && m_window != m_placeholder) {
            m_window->installEventFilter(this);
        }
    }
}

PlaceholderTracker::~PlaceholderTracker()
{
    if (m_placeholder) {
        m_placeholder->removeEventFilter(this);
    }
    if (m_window) {
        m_window->removeEventFilter(this);
    }
}

void PlaceholderTracker::sync()
{
    if (!m_placeholder || !m_coordinator) {
        return;
    }

    QWidget *window = m_placeholder->window();
    const QPoint topLeft = m_placeholder->mapTo(window, QPoint(0, 0));
    const QRectF rect(topLeft, QSizeF(m_placeholder->size()));
    const qreal scale = window->devicePixelRatioF();
    const QPointF origin = QPointF(window->mapToGlobal(QPoint(0, 0))) * scale;

    m_coordinator->setPlaceholderGeometry(rect, origin, scale);
}

bool PlaceholderTracker::eventFilter(QObject *watched, QEvent *event)
{
    switch (event->type()) {
    case QEvent::Resize:
    case QEvent::Move:
    case QEvent::Show:
        if (watched == m_placeholder || watched == m_window) {
            sync();
        }
        break;
    default:
        break;
    }
    return QObject::eventFilter(watched, event);
}

} // namespace Workdeck

#include "moc_PlaceholderTracker.cpp"
