/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOSTBRIDGE_H
#define HOSTBRIDGE_H

#include "workdeckprivate_export.h"

#include "HostProtocol.h"

#include <QDateTime>
#include <QJsonObject>
#include <QObject>
#include <QString>

namespace Workdeck
{

/**
 * Parameters for a new host shell
 */
struct WORKDECKPRIVATE_EXPORT TerminalSpec {
    QString name; // Empty lets the host pick one
    int columns = 80;
    int rows = 24;
    QString initialCommand;
    QString shellPath; // Empty = host default shell

    QJsonObject toJson() const;
};

/**
 * Shell created by the host
 */
struct WORKDECKPRIVATE_EXPORT TerminalDescriptor {
    QString id;
    QString name;
    QDateTime createdAt;

    static TerminalDescriptor fromJson(const QJsonValue &value);

    bool isValid() const
    {
        return !id.isEmpty();
    }
};

/**
 * Screen-absolute logical rectangle of a native surface
 */
struct WORKDECKPRIVATE_EXPORT SurfaceBounds {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    bool operator==(const SurfaceBounds &other) const
    {
        return qFuzzyCompare(x + 1, other.x + 1) && qFuzzyCompare(y + 1, other.y + 1) && qFuzzyCompare(width + 1, other.width + 1)
            && qFuzzyCompare(height + 1, other.height + 1);
    }

    bool operator!=(const SurfaceBounds &other) const
    {
        return !(*this == other);
    }

    bool isEmpty() const
    {
        return width <= 0 || height <= 0;
    }
};

/**
 * HostBridge is the client side of the host procedure surface.
 *
 * The host process owns the PTYs and the native overlay surfaces. Every call
 * is asynchronous; the handler (optional) runs once with the reply. Push
 * events from the host are re-emitted as signals.
 *
 * Subclasses provide the transport by implementing call().
 */
class WORKDECKPRIVATE_EXPORT HostBridge : public QObject
{
    Q_OBJECT

public:
    explicit HostBridge(QObject *parent = nullptr);
    ~HostBridge() override;

    /**
     * Invoke a host procedure.
     *
     * @param method Procedure name, see HostProtocol
     * @param params Named parameters
     * @param handler Called exactly once with the reply, may be empty
     */
    virtual void call(const QString &method, const QJsonObject &params, const ReplyHandler &handler) = 0;

    virtual bool isConnected() const = 0;

    // ========== Terminals ==========

    /**
     * Reply result is a TerminalDescriptor object
     */
    void createTerminal(const TerminalSpec &spec, const ReplyHandler &handler);
    void writeTerminal(const QString &sessionId, const QByteArray &data, const ReplyHandler &handler = ReplyHandler());
    void resizeTerminal(const QString &sessionId, int columns, int rows, const ReplyHandler &handler = ReplyHandler());

    /**
     * Reply result is the base64 output buffered since the last read
     */
    void readTerminal(const QString &sessionId, const ReplyHandler &handler);
    void closeTerminal(const QString &sessionId, const ReplyHandler &handler = ReplyHandler());
    void closeAllTerminals(const ReplyHandler &handler = ReplyHandler());
    void renameTerminal(const QString &sessionId, const QString &name, const ReplyHandler &handler = ReplyHandler());

    /**
     * Reply result is {"profiles": [...], "defaultId": "..."}
     */
    void listProfiles(const ReplyHandler &handler);

    /**
     * Open a terminal application outside the panel.
     *
     * @param terminalType e.g. "default", "alacritty", "iterm"; the host picks
     *        the platform default for types it does not know
     * @param workingDirectory Empty lets the host use the home directory
     * @param command Empty opens an interactive shell
     */
    void launchExternalTerminal(const QString &terminalType,
                                const QString &workingDirectory,
                                const QString &command,
                                const ReplyHandler &handler = ReplyHandler());

    // ========== Overlay surfaces ==========

    void createSurface(const QString &sessionId, const QString &url, const SurfaceBounds &bounds, const ReplyHandler &handler = ReplyHandler());
    void navigateSurface(const QString &sessionId, const QString &url, const ReplyHandler &handler = ReplyHandler());
    void goBack(const QString &sessionId, const ReplyHandler &handler = ReplyHandler());
    void goForward(const QString &sessionId, const ReplyHandler &handler = ReplyHandler());
    void reloadSurface(const QString &sessionId, const ReplyHandler &handler = ReplyHandler());
    void showSurface(const QString &sessionId, const ReplyHandler &handler = ReplyHandler());
    void hideSurface(const QString &sessionId, const ReplyHandler &handler = ReplyHandler());
    void updateSurfaceBounds(const QString &sessionId, const SurfaceBounds &bounds, const ReplyHandler &handler = ReplyHandler());
    void closeSurface(const QString &sessionId, const ReplyHandler &handler = ReplyHandler());

Q_SIGNALS:
    /**
     * The surface of @p sessionId finished navigating to @p url
     */
    void addressChanged(const QString &sessionId, const QString &url);

    void loadingStateChanged(const QString &sessionId, bool isLoading);

    /**
     * The transport dropped; pending calls have been failed
     */
    void connectionLost();

protected:
    /**
     * Route a push event to the matching signal
     */
    void dispatchEvent(const QString &event, const QJsonObject &params);

private:
    void surfaceCall(const char *method, const QString &sessionId, const ReplyHandler &handler);
};

} // namespace Workdeck

#endif // HOSTBRIDGE_H
