/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "OutputPoller.h"

#include "HostBridge.h"

#include <QDebug>

namespace Workdeck
{

QSet<QString> OutputPoller::s_liveSessions;

OutputPoller::OutputPoller(HostBridge *host, const QString &sessionId, int intervalMs, QObject *parent)
    : QObject(parent)
    , m_host(host)
    , m_sessionId(sessionId)
{
    m_timer.setInterval(qMax(1, intervalMs));
    connect(&m_timer, &QTimer::timeout, this, &OutputPoller::poll);
}

OutputPoller::~OutputPoller()
{
    cancel();
}

bool OutputPoller::isPolling(const QString &sessionId)
{
    return s_liveSessions.contains(sessionId);
}

bool OutputPoller::start()
{
    if (m_running) {
        return true;
    }
    if (m_cancelled || !m_host) {
        return false;
    }
    if (s_liveSessions.contains(m_sessionId)) {
        qWarning() << "OutputPoller: Session" << m_sessionId << "is already being polled";
        return false;
    }

    s_liveSessions.insert(m_sessionId);
    m_running = true;
    m_timer.start();
    return true;
}

void OutputPoller::cancel()
{
    if (m_cancelled) {
        return;
    }

    m_cancelled = true;
    m_timer.stop();
    if (m_running) {
        s_liveSessions.remove(m_sessionId);
        m_running = false;
    }
}

void OutputPoller::poll()
{
    if (!m_running || m_inFlight) {
        return;
    }
    if (!m_host) {
        qWarning() << "OutputPoller: Host gone, stopping poll for" << m_sessionId;
        cancel();
        return;
    }

    m_inFlight = true;
    QPointer<OutputPoller> guard(this);
    m_host->readTerminal(m_sessionId, [this, guard](const HostReply &reply) {
        if (!guard || m_cancelled) {
            return;
        }
        m_inFlight = false;

        if (!reply.ok) {
            // Retried on the next tick
            qWarning() << "OutputPoller: Read failed for" << m_sessionId << ":" << reply.error;
            return;
        }

        const QByteArray data = HostProtocol::decodeBytes(reply.result);
        if (!data.isEmpty()) {
            Q_EMIT outputReceived(data);
        }
    });
}

} // namespace Workdeck

#include "moc_OutputPoller.cpp"
