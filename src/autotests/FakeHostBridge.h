/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKEHOSTBRIDGE_H
#define FAKEHOSTBRIDGE_H

#include "../workspace/HostBridge.h"

#include <QByteArray>
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>

namespace Workdeck
{

/**
 * In-process HostBridge for tests.
 *
 * Every call is recorded. Replies are delivered synchronously unless the
 * method is deferred, in which case the test completes them with
 * completeNext(). terminal.create hands out ids term-1, term-2, ... and
 * terminal.read returns output queued with queueOutput().
 */
class FakeHostBridge : public HostBridge
{
    Q_OBJECT

public:
    struct Call {
        QString method;
        QJsonObject params;
    };

    explicit FakeHostBridge(QObject *parent = nullptr);
    ~FakeHostBridge() override;

    void call(const QString &method, const QJsonObject &params, const ReplyHandler &handler) override;

    bool isConnected() const override
    {
        return m_connected;
    }

    void setConnected(bool connected)
    {
        m_connected = connected;
    }

    QList<Call> calls() const
    {
        return m_calls;
    }

    QList<Call> callsTo(const QString &method) const;
    int callCount(const QString &method) const;
    void clearCalls();

    /**
     * Fixed reply for @p method, replacing the built-in behavior
     */
    void setReply(const QString &method, const HostReply &reply);
    void clearReply(const QString &method);

    /**
     * Hold replies for @p method until completeNext()
     */
    void setDeferred(const QString &method, bool deferred);
    int deferredCount(const QString &method) const;

    /**
     * Deliver @p reply to the oldest held call of @p method
     */
    bool completeNext(const QString &method, const HostReply &reply);

    /**
     * Reply a held call with what the bridge would have answered
     */
    bool completeNextWithDefault(const QString &method);

    void queueOutput(const QString &sessionId, const QByteArray &data);

    /**
     * Profiles returned by terminal.listProfiles
     */
    void setProfiles(const QJsonArray &profiles, const QString &defaultId);

    void sendAddressChanged(const QString &sessionId, const QString &url);
    void sendLoadingChanged(const QString &sessionId, bool isLoading);
    void sendEvent(const QString &event, const QJsonObject &params);

private:
    HostReply defaultReply(const QString &method, const QJsonObject &params);

    struct Held {
        QJsonObject params;
        ReplyHandler handler;
    };

    QList<Call> m_calls;
    QHash<QString, HostReply> m_replies;
    QHash<QString, bool> m_deferred;
    QHash<QString, QList<Held>> m_held;
    QHash<QString, QByteArray> m_output;
    QJsonObject m_profiles;
    int m_nextTerminal = 1;
    bool m_connected = true;
};

} // namespace Workdeck

#endif // FAKEHOSTBRIDGE_H
