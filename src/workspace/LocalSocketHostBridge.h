/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LOCALSOCKETHOSTBRIDGE_H
#define LOCALSOCKETHOSTBRIDGE_H

#include "workdeckprivate_export.h"

#include "HostBridge.h"

#include <QHash>
#include <QLocalSocket>

namespace Workdeck
{

/**
 * HostBridge over a QLocalSocket speaking newline-delimited JSON.
 *
 * Replies are matched to requests by id. There are no client-side timeouts:
 * a call stays pending until the host answers or the connection drops, in
 * which case every pending handler receives a failure reply.
 */
class WORKDECKPRIVATE_EXPORT LocalSocketHostBridge : public HostBridge
{
    Q_OBJECT

public:
    explicit LocalSocketHostBridge(QObject *parent = nullptr);
    ~LocalSocketHostBridge() override;

    /**
     * Default socket path: <runtime dir>/workdeck-host.sock
     */
    static QString defaultSocketPath();

    /**
     * Connect to the host socket, waiting at most @p timeoutMs.
     */
    bool connectToHost(const QString &socketPath, int timeoutMs = 3000);

    void disconnectFromHost();

    void call(const QString &method, const QJsonObject &params, const ReplyHandler &handler) override;
    bool isConnected() const override;

    int pendingCount() const
    {
        return m_pending.size();
    }

private Q_SLOTS:
    void onReadyRead();
    void onDisconnected();

private:
    void failPending(const QString &error);

    QLocalSocket *m_socket = nullptr;
    QHash<quint64, ReplyHandler> m_pending;
    quint64 m_nextId = 1;
};

} // namespace Workdeck

#endif // LOCALSOCKETHOSTBRIDGE_H
