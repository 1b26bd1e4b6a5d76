/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef OUTPUTPOLLER_H
#define OUTPUTPOLLER_H

#include "workdeckprivate_export.h"

#include <QObject>
#include <QPointer>
#include <QSet>
#include <QTimer>

namespace Workdeck
{

class HostBridge;

/**
 * OutputPoller periodically asks the host for the output a terminal produced
 * since the last read.
 *
 * At most one read is in flight at a time; a tick that finds one pending is
 * skipped. Only one poller can run per session id in the whole process.
 */
class WORKDECKPRIVATE_EXPORT OutputPoller : public QObject
{
    Q_OBJECT

public:
    OutputPoller(HostBridge *host, const QString &sessionId, int intervalMs, QObject *parent = nullptr);
    ~OutputPoller() override;

    /**
     * Start polling.
     *
     * @return false if another poller is already live for this session id,
     *         or if this poller was cancelled
     */
    bool start();

    /**
     * Stop polling for good. Safe to call repeatedly; replies to reads
     * already sent are dropped.
     */
    void cancel();

    bool isActive() const
    {
        return m_running;
    }

    bool isReadInFlight() const
    {
        return m_inFlight;
    }

    QString sessionId() const
    {
        return m_sessionId;
    }

    int interval() const
    {
        return m_timer.interval();
    }

    /**
     * Whether some poller currently runs for @p sessionId
     */
    static bool isPolling(const QString &sessionId);

Q_SIGNALS:
    void outputReceived(const QByteArray &data);

private Q_SLOTS:
    void poll();

private:
    QPointer<HostBridge> m_host;
    QString m_sessionId;
    QTimer m_timer;
    bool m_running = false;
    bool m_cancelled = false;
    bool m_inFlight = false;

    static QSet<QString> s_liveSessions;
};

} // namespace Workdeck

#endif // OUTPUTPOLLER_H
