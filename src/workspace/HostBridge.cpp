/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HostBridge.h"

#include <QDebug>

namespace Workdeck
{

static void putBounds(QJsonObject &params, const SurfaceBounds &bounds)
{
    params[QStringLiteral("x")] = bounds.x;
    params[QStringLiteral("y")] = bounds.y;
    params[QStringLiteral("width")] = bounds.width;
    params[QStringLiteral("height")] = bounds.height;
}

QJsonObject TerminalSpec::toJson() const
{
    QJsonObject obj;
    if (!name.isEmpty()) {
        obj[QStringLiteral("name")] = name;
    }
    obj[QStringLiteral("cols")] = columns;
    obj[QStringLiteral("rows")] = rows;
    if (!initialCommand.isEmpty()) {
        obj[QStringLiteral("initialCommand")] = initialCommand;
    }
    if (!shellPath.isEmpty()) {
        obj[QStringLiteral("shellPath")] = shellPath;
    }
    return obj;
}

TerminalDescriptor TerminalDescriptor::fromJson(const QJsonValue &value)
{
    TerminalDescriptor descriptor;
    const QJsonObject obj = value.toObject();
    descriptor.id = obj.value(QStringLiteral("id")).toString();
    descriptor.name = obj.value(QStringLiteral("name")).toString();

    const QJsonValue created = obj.value(QStringLiteral("createdAt"));
    if (created.isString()) {
        descriptor.createdAt = QDateTime::fromString(created.toString(), Qt::ISODate);
    } else if (created.isDouble()) {
        descriptor.createdAt = QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(created.toDouble()));
    }
    return descriptor;
}

HostBridge::HostBridge(QObject *parent)
    : QObject(parent)
{
}

HostBridge::~HostBridge() = default;

void HostBridge::createTerminal(const TerminalSpec &spec, const ReplyHandler &handler)
{
    call(QString::fromLatin1(HostProtocol::TerminalCreate), spec.toJson(), handler);
}

void HostBridge::writeTerminal(const QString &sessionId, const QByteArray &data, const ReplyHandler &handler)
{
    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    params[QStringLiteral("data")] = HostProtocol::encodeBytes(data);
    call(QString::fromLatin1(HostProtocol::TerminalWrite), params, handler);
}

void HostBridge::resizeTerminal(const QString &sessionId, int columns, int rows, const ReplyHandler &handler)
{
    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    params[QStringLiteral("cols")] = columns;
    params[QStringLiteral("rows")] = rows;
    call(QString::fromLatin1(HostProtocol::TerminalResize), params, handler);
}

void HostBridge::readTerminal(const QString &sessionId, const ReplyHandler &handler)
{
    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    call(QString::fromLatin1(HostProtocol::TerminalRead), params, handler);
}

void HostBridge::closeTerminal(const QString &sessionId, const ReplyHandler &handler)
{
    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    call(QString::fromLatin1(HostProtocol::TerminalClose), params, handler);
}

void HostBridge::closeAllTerminals(const ReplyHandler &handler)
{
    call(QString::fromLatin1(HostProtocol::TerminalCloseAll), QJsonObject(), handler);
}

void HostBridge::renameTerminal(const QString &sessionId, const QString &name, const ReplyHandler &handler)
{
    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    params[QStringLiteral("name")] = name;
    call(QString::fromLatin1(HostProtocol::TerminalRename), params, handler);
}

void HostBridge::listProfiles(const ReplyHandler &handler)
{
    call(QString::fromLatin1(HostProtocol::TerminalListProfiles), QJsonObject(), handler);
}

void HostBridge::launchExternalTerminal(const QString &terminalType, const QString &workingDirectory, const QString &command, const ReplyHandler &handler)
{
    QJsonObject params;
    params[QStringLiteral("terminalType")] = terminalType;
    if (!workingDirectory.isEmpty()) {
        params[QStringLiteral("workingDirectory")] = workingDirectory;
    }
    if (!command.isEmpty()) {
        params[QStringLiteral("command")] = command;
    }
    call(QString::fromLatin1(HostProtocol::TerminalLaunchExternal), params, handler);
}

void HostBridge::createSurface(const QString &sessionId, const QString &url, const SurfaceBounds &bounds, const ReplyHandler &handler)
{
    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    params[QStringLiteral("url")] = url;
    putBounds(params, bounds);
    call(QString::fromLatin1(HostProtocol::SurfaceCreate), params, handler);
}

void HostBridge::navigateSurface(const QString &sessionId, const QString &url, const ReplyHandler &handler)
{
    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    params[QStringLiteral("url")] = url;
    call(QString::fromLatin1(HostProtocol::SurfaceNavigate), params, handler);
}

void HostBridge::goBack(const QString &sessionId, const ReplyHandler &handler)
{
    surfaceCall(HostProtocol::SurfaceGoBack, sessionId, handler);
}

void HostBridge::goForward(const QString &sessionId, const ReplyHandler &handler)
{
    surfaceCall(HostProtocol::SurfaceGoForward, sessionId, handler);
}

void HostBridge::reloadSurface(const QString &sessionId, const ReplyHandler &handler)
{
    surfaceCall(HostProtocol::SurfaceReload, sessionId, handler);
}

void HostBridge::showSurface(const QString &sessionId, const ReplyHandler &handler)
{
    surfaceCall(HostProtocol::SurfaceShow, sessionId, handler);
}

void HostBridge::hideSurface(const QString &sessionId, const ReplyHandler &handler)
{
    surfaceCall(HostProtocol::SurfaceHide, sessionId, handler);
}

void HostBridge::updateSurfaceBounds(const QString &sessionId, const SurfaceBounds &bounds, const ReplyHandler &handler)
{
    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    putBounds(params, bounds);
    call(QString::fromLatin1(HostProtocol::SurfaceUpdateBounds), params, handler);
}

void HostBridge::closeSurface(const QString &sessionId, const ReplyHandler &handler)
{
    surfaceCall(HostProtocol::SurfaceClose, sessionId, handler);
}

void HostBridge::surfaceCall(const char *method, const QString &sessionId, const ReplyHandler &handler)
{
    QJsonObject params;
    params[QStringLiteral("sessionId")] = sessionId;
    call(QString::fromLatin1(method), params, handler);
}

void HostBridge::dispatchEvent(const QString &event, const QJsonObject &params)
{
    const QString sessionId = params.value(QStringLiteral("sessionId")).toString();
    if (sessionId.isEmpty()) {
        qWarning() << "HostBridge: Event without sessionId:" << event;
        return;
    }

    if (event == QLatin1String(HostProtocol::EventAddressChanged)) {
        Q_EMIT addressChanged(sessionId, params.value(QStringLiteral("url")).toString());
    } else if (event == QLatin1String(HostProtocol::EventLoadingChanged)) {
        Q_EMIT loadingStateChanged(sessionId, params.value(QStringLiteral("isLoading")).toBool());
    } else {
        qDebug() << "HostBridge: Ignoring unknown event:" << event;
    }
}

} // namespace Workdeck

#include "moc_HostBridge.cpp"
