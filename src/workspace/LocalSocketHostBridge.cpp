/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LocalSocketHostBridge.h"

#include <QDebug>
#include <QDir>
#include <QStandardPaths>
#include <QTimer>

#include <utility>

namespace Workdeck
{

LocalSocketHostBridge::LocalSocketHostBridge(QObject *parent)
    : HostBridge(parent)
    , m_socket(new QLocalSocket(this))
{
    connect(m_socket, &QLocalSocket::readyRead, this, &LocalSocketHostBridge::onReadyRead);
    connect(m_socket, &QLocalSocket::disconnected, this, &LocalSocketHostBridge::onDisconnected);
}

LocalSocketHostBridge::~LocalSocketHostBridge()
{
    // Handlers may capture objects that are already gone; drop them silently
    m_pending.clear();
    m_socket->disconnect(this);
}

QString LocalSocketHostBridge::defaultSocketPath()
{
    QString runtimeDir = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    if (runtimeDir.isEmpty()) {
        runtimeDir = QDir::tempPath();
    }
    return runtimeDir + QStringLiteral("/workdeck-host.sock");
}

bool LocalSocketHostBridge::connectToHost(const QString &socketPath, int timeoutMs)
{
    if (isConnected()) {
        return true;
    }

    m_socket->connectToServer(socketPath);
    if (!m_socket->waitForConnected(timeoutMs)) {
        qWarning() << "LocalSocketHostBridge: Failed to connect to" << socketPath << ":" << m_socket->errorString();
        return false;
    }

    qDebug() << "LocalSocketHostBridge: Connected to" << socketPath;
    return true;
}

void LocalSocketHostBridge::disconnectFromHost()
{
    if (m_socket->state() != QLocalSocket::UnconnectedState) {
        m_socket->disconnectFromServer();
    }
}

bool LocalSocketHostBridge::isConnected() const
{
    return m_socket->state() == QLocalSocket::ConnectedState;
}

void LocalSocketHostBridge::call(const QString &method, const QJsonObject &params, const ReplyHandler &handler)
{
    if (!isConnected()) {
        // Keep the contract asynchronous even when failing early
        if (handler) {
            QTimer::singleShot(0, this, [handler, method]() {
                handler(HostReply::failure(QStringLiteral("Not connected to host (%1)").arg(method)));
            });
        }
        return;
    }

    const quint64 id = m_nextId++;
    if (handler) {
        m_pending.insert(id, handler);
    }
    m_socket->write(HostProtocol::encodeRequest(id, method, params));
}

void LocalSocketHostBridge::onReadyRead()
{
    while (m_socket->canReadLine()) {
        const QByteArray line = m_socket->readLine();
        if (line.trimmed().isEmpty()) {
            continue;
        }

        const HostProtocol::Message message = HostProtocol::decodeMessage(line);
        switch (message.type) {
        case HostProtocol::Message::Reply: {
            const ReplyHandler handler = m_pending.take(message.id);
            if (handler) {
                handler(message.reply);
            }
            break;
        }
        case HostProtocol::Message::Event:
            dispatchEvent(message.name, message.params);
            break;
        case HostProtocol::Message::Request:
            qWarning() << "LocalSocketHostBridge: Host sent a request, ignoring:" << message.name;
            break;
        case HostProtocol::Message::Invalid:
            qWarning() << "LocalSocketHostBridge: Invalid message from host:" << message.parseError;
            break;
        }
    }
}

void LocalSocketHostBridge::onDisconnected()
{
    qWarning() << "LocalSocketHostBridge: Host connection lost," << m_pending.size() << "calls pending";
    failPending(QStringLiteral("Host connection lost"));
    Q_EMIT connectionLost();
}

void LocalSocketHostBridge::failPending(const QString &error)
{
    const QHash<quint64, ReplyHandler> pending = std::exchange(m_pending, {});
    for (const ReplyHandler &handler : pending) {
        handler(HostReply::failure(error));
    }
}

} // namespace Workdeck

#include "moc_LocalSocketHostBridge.cpp"
