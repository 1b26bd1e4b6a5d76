/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOSTPROTOCOL_H
#define HOSTPROTOCOL_H

#include "workdeckprivate_export.h"

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <functional>

namespace Workdeck
{

/**
 * Result of one host procedure call.
 */
struct WORKDECKPRIVATE_EXPORT HostReply {
    bool ok = false;
    QString error; // Set when !ok
    QJsonValue result; // Procedure-specific, may be null

    static HostReply success(const QJsonValue &result = QJsonValue())
    {
        HostReply reply;
        reply.ok = true;
        reply.result = result;
        return reply;
    }

    static HostReply failure(const QString &error)
    {
        HostReply reply;
        reply.error = error;
        return reply;
    }
};

using ReplyHandler = std::function<void(const HostReply &)>;

/**
 * Wire format spoken with the host process.
 *
 * One compact JSON object per line:
 *   request  {"id": N, "method": "terminal.write", "params": {...}}
 *   reply    {"id": N, "ok": true, "result": ...}
 *            {"id": N, "ok": false, "error": "..."}
 *   event    {"event": "surface.addressChanged", "params": {...}}
 *
 * Raw byte payloads (terminal input/output) travel base64-encoded.
 */
namespace HostProtocol
{

// Terminal procedures
constexpr char TerminalCreate[] = "terminal.create";
constexpr char TerminalWrite[] = "terminal.write";
constexpr char TerminalResize[] = "terminal.resize";
constexpr char TerminalRead[] = "terminal.read";
constexpr char TerminalClose[] = "terminal.close";
constexpr char TerminalCloseAll[] = "terminal.closeAll";
constexpr char TerminalRename[] = "terminal.rename";
constexpr char TerminalListProfiles[] = "terminal.listProfiles";
constexpr char TerminalLaunchExternal[] = "terminal.launchExternal";

// Surface procedures
constexpr char SurfaceCreate[] = "surface.create";
constexpr char SurfaceNavigate[] = "surface.navigate";
constexpr char SurfaceGoBack[] = "surface.goBack";
constexpr char SurfaceGoForward[] = "surface.goForward";
constexpr char SurfaceReload[] = "surface.reload";
constexpr char SurfaceShow[] = "surface.show";
constexpr char SurfaceHide[] = "surface.hide";
constexpr char SurfaceUpdateBounds[] = "surface.updateBounds";
constexpr char SurfaceClose[] = "surface.close";

// Push events
constexpr char EventAddressChanged[] = "surface.addressChanged";
constexpr char EventLoadingChanged[] = "surface.loadingChanged";

/**
 * A decoded line received from the host (or, on the host side, from the client)
 */
struct WORKDECKPRIVATE_EXPORT Message {
    enum Type {
        Invalid,
        Request,
        Reply,
        Event,
    };

    Type type = Invalid;
    quint64 id = 0; // Request and Reply
    QString name; // Method (Request) or event name (Event)
    QJsonObject params; // Request and Event
    HostReply reply; // Reply
    QString parseError; // Invalid
};

WORKDECKPRIVATE_EXPORT QByteArray encodeRequest(quint64 id, const QString &method, const QJsonObject &params);
WORKDECKPRIVATE_EXPORT QByteArray encodeReply(quint64 id, const HostReply &reply);
WORKDECKPRIVATE_EXPORT QByteArray encodeEvent(const QString &event, const QJsonObject &params);

/**
 * Decode a single line (trailing newline optional)
 */
WORKDECKPRIVATE_EXPORT Message decodeMessage(const QByteArray &line);

WORKDECKPRIVATE_EXPORT QString encodeBytes(const QByteArray &data);
WORKDECKPRIVATE_EXPORT QByteArray decodeBytes(const QJsonValue &value);

} // namespace HostProtocol

} // namespace Workdeck

#endif // HOSTPROTOCOL_H
