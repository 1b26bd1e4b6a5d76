/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HostProtocol.h"

#include <QJsonDocument>

namespace Workdeck
{
namespace HostProtocol
{

static QByteArray toLine(const QJsonObject &obj)
{
    return QJsonDocument(obj).toJson(QJsonDocument::Compact) + "\n";
}

QByteArray encodeRequest(quint64 id, const QString &method, const QJsonObject &params)
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = static_cast<qint64>(id);
    obj[QStringLiteral("method")] = method;
    obj[QStringLiteral("params")] = params;
    return toLine(obj);
}

QByteArray encodeReply(quint64 id, const HostReply &reply)
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = static_cast<qint64>(id);
    obj[QStringLiteral("ok")] = reply.ok;
    if (reply.ok) {
        obj[QStringLiteral("result")] = reply.result;
    } else {
        obj[QStringLiteral("error")] = reply.error;
    }
    return toLine(obj);
}

QByteArray encodeEvent(const QString &event, const QJsonObject &params)
{
    QJsonObject obj;
    obj[QStringLiteral("event")] = event;
    obj[QStringLiteral("params")] = params;
    return toLine(obj);
}

Message decodeMessage(const QByteArray &line)
{
    Message message;

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(line.trimmed(), &error);
    if (error.error != QJsonParseError::NoError) {
        message.parseError = error.errorString();
        return message;
    }

    if (!doc.isObject()) {
        message.parseError = QStringLiteral("Message is not a JSON object");
        return message;
    }

    const QJsonObject obj = doc.object();

    if (obj.contains(QStringLiteral("event"))) {
        message.type = Message::Event;
        message.name = obj.value(QStringLiteral("event")).toString();
        message.params = obj.value(QStringLiteral("params")).toObject();
        if (message.name.isEmpty()) {
            message.type = Message::Invalid;
            message.parseError = QStringLiteral("Event without a name");
        }
        return message;
    }

    if (!obj.contains(QStringLiteral("id"))) {
        message.parseError = QStringLiteral("Message has neither id nor event");
        return message;
    }

    message.id = static_cast<quint64>(obj.value(QStringLiteral("id")).toInteger());

    if (obj.contains(QStringLiteral("method"))) {
        message.type = Message::Request;
        message.name = obj.value(QStringLiteral("method")).toString();
        message.params = obj.value(QStringLiteral("params")).toObject();
        return message;
    }

    message.type = Message::Reply;
    if (obj.value(QStringLiteral("ok")).toBool()) {
        message.reply = HostReply::success(obj.value(QStringLiteral("result")));
    } else {
        QString errorText = obj.value(QStringLiteral("error")).toString();
        if (errorText.isEmpty()) {
            errorText = QStringLiteral("Host reported an unspecified error");
        }
        message.reply = HostReply::failure(errorText);
    }
    return message;
}

QString encodeBytes(const QByteArray &data)
{
    return QString::fromLatin1(data.toBase64());
}

QByteArray decodeBytes(const QJsonValue &value)
{
    if (!value.isString()) {
        return QByteArray();
    }
    return QByteArray::fromBase64(value.toString().toLatin1());
}

} // namespace HostProtocol
} // namespace Workdeck
