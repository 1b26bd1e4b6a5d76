/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "FakeHostBridge.h"

#include <QDateTime>
#include <QJsonArray>

namespace Workdeck
{

FakeHostBridge::FakeHostBridge(QObject *parent)
    : HostBridge(parent)
{
    m_profiles[QStringLiteral("profiles")] = QJsonArray();
    m_profiles[QStringLiteral("defaultId")] = QString();
}

FakeHostBridge::~FakeHostBridge() = default;

void FakeHostBridge::call(const QString &method, const QJsonObject &params, const ReplyHandler &handler)
{
    m_calls.append(Call{method, params});

    if (m_deferred.value(method)) {
        m_held[method].append(Held{params, handler});
        return;
    }

    const HostReply reply = m_replies.contains(method) ? m_replies.value(method) : defaultReply(method, params);
    if (handler) {
        handler(reply);
    }
}

QList<FakeHostBridge::Call> FakeHostBridge::callsTo(const QString &method) const
{
    QList<Call> result;
    for (const Call &call : m_calls) {
        if (call.method == method) {
            result.append(call);
        }
    }
    return result;
}

int FakeHostBridge::callCount(const QString &method) const
{
    return callsTo(method).size();
}

void FakeHostBridge::clearCalls()
{
    m_calls.clear();
}

void FakeHostBridge::setReply(const QString &method, const HostReply &reply)
{
    m_replies.insert(method, reply);
}

void FakeHostBridge::clearReply(const QString &method)
{
    m_replies.remove(method);
}

void FakeHostBridge::setDeferred(const QString &method, bool deferred)
{
    m_deferred.insert(method, deferred);
}

int FakeHostBridge::deferredCount(const QString &method) const
{
    return m_held.value(method).size();
}

bool FakeHostBridge::completeNext(const QString &method, const HostReply &reply)
{
    QList<Held> &held = m_held[method];
    if (held.isEmpty()) {
        return false;
    }

    const Held next = held.takeFirst();
    if (next.handler) {
        next.handler(reply);
    }
    return true;
}

bool FakeHostBridge::completeNextWithDefault(const QString &method)
{
    const QList<Held> held = m_held.value(method);
    if (held.isEmpty()) {
        return false;
    }
    return completeNext(method, defaultReply(method, held.first().params));
}

void FakeHostBridge::queueOutput(const QString &sessionId, const QByteArray &data)
{
    m_output[sessionId].append(data);
}

void FakeHostBridge::setProfiles(const QJsonArray &profiles, const QString &defaultId)
{
    m_profiles[QStringLiteral("profiles")] = profiles;
    m_profiles[QStringLiteral("defaultId")] = defaultId;
}

void FakeHostBridge::sendAddressChanged(const QString &sessionId, const QString &url)
{
    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    params[QStringLiteral("url")] = url;
    dispatchEvent(QString::fromLatin1(HostProtocol::EventAddressChanged), params);
}

void FakeHostBridge::sendLoadingChanged(const QString &sessionId, bool isLoading)
{
    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    params[QStringLiteral("isLoading")] = isLoading;
    dispatchEvent(QString::fromLatin1(HostProtocol::EventLoadingChanged), params);
}

void FakeHostBridge::sendEvent(const QString &event, const QJsonObject &params)
{
    dispatchEvent(event, params);
}

HostReply FakeHostBridge::defaultReply(const QString &method, const QJsonObject &params)
{
    if (!m_connected) {
        return HostReply::failure(QStringLiteral("Not connected"));
    }

    if (method == QLatin1String(HostProtocol::TerminalCreate)) {
        QJsonObject terminal;
        terminal[QStringLiteral("id")] = QStringLiteral("term-%1").arg(m_nextTerminal++);
        terminal[QStringLiteral("name")] = params.value(QStringLiteral("name")).toString(QStringLiteral("Terminal"));
        terminal[QStringLiteral("createdAt")] = QDateTime::currentDateTime().toString(Qt::ISODate);
        return HostReply::success(terminal);
    }

    if (method == QLatin1String(HostProtocol::TerminalRead)) {
        const QString sessionId = params.value(QStringLiteral("sessionId")).toString();
        return HostReply::success(HostProtocol::encodeBytes(m_output.take(sessionId)));
    }

    if (method == QLatin1String(HostProtocol::TerminalListProfiles)) {
        return HostReply::success(m_profiles);
    }

    return HostReply::success();
}

} // namespace Workdeck

#include "moc_FakeHostBridge.cpp"
