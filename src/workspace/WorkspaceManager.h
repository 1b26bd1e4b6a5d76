/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACEMANAGER_H
#define WORKSPACEMANAGER_H

#include "workdeckprivate_export.h"

#include "ShellProfile.h"
#include "WorkspaceConfig.h"
#include "WorkspaceSession.h"
#include "WorkspaceShortcuts.h"

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QSet>
#include <QStringList>

#include <optional>

class QKeyEvent;

namespace Workdeck
{

class HostBridge;
class OverlaySurfaceCoordinator;
class PtyBridge;
class SessionRegistry;

/**
 * A session asked for from outside the panel (e.g. "open logs for this pod")
 */
struct WORKDECKPRIVATE_EXPORT SessionRequest {
    SessionKind kind = SessionKind::Terminal;
    QString name;

    // Terminal
    QString profileId;
    QString command;

    // Browser
    QString url;

    // Editor
    QString filePath;
    std::optional<QString> content;

    // Logging
    std::optional<QString> query;
    TimeRange timeRange;
};

/**
 * WorkspaceManager ties the session registry to the host.
 *
 * It owns one PtyBridge per terminal session and one
 * OverlaySurfaceCoordinator per browser session, creates them when a session
 * is added, releases them when the registry reports a session closed, and
 * forwards activation changes (previous session first, then the new one).
 *
 * Terminal creation is asynchronous: the record is only added once the
 * host has spawned the shell.
 */
class WORKDECKPRIVATE_EXPORT WorkspaceManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @param host Host connection, not owned
     * @param config Tunables, see WorkspaceSettings::config()
     * @param profileStore Default-profile persistence, not owned, may be null
     */
    WorkspaceManager(HostBridge *host, const WorkspaceConfig &config, ProfileStore *profileStore, QObject *parent = nullptr);
    ~WorkspaceManager() override;

    SessionRegistry *registry() const
    {
        return m_registry;
    }

    WorkspaceConfig config() const
    {
        return m_config;
    }

    // ========== Panel & external requests ==========

    /**
     * Opening an empty panel with nothing pending creates one terminal;
     * otherwise pending requests are processed. The first open fetches the
     * shell profiles and waits for the reply before doing either.
     */
    void setPanelOpen(bool open);

    bool isPanelOpen() const
    {
        return m_panelOpen;
    }

    /**
     * Queue a request. It is turned into a session as soon as the panel is
     * open, then requestConsumed() is emitted and the request is dropped.
     *
     * @return the request id
     */
    QString submitRequest(const SessionRequest &request);

    int pendingRequestCount() const
    {
        return m_pendingRequests.size();
    }

    // ========== Creation ==========

    /**
     * Spawn a shell. sessionCreationFailed() is emitted if the host refuses.
     *
     * @param profileId Empty uses the default profile
     * @param userCommand Run after the cluster-context environment is set
     */
    void createTerminal(const QString &name = QString(), const QString &profileId = QString(), const QString &userCommand = QString());

    /**
     * @return the session id; the surface is created on the first navigation
     */
    QString createBrowser(const QString &url = QString(), const QString &name = QString());

    QString createEditor(const QString &filePath, const std::optional<QString> &content = std::nullopt, const QString &name = QString());

    QString createLogging(const std::optional<QString> &query = std::nullopt, const TimeRange &range = TimeRange(), const QString &name = QString());

    /**
     * Ask the host to open a terminal application of its own, outside the
     * panel. No session is created. externalTerminalFailed() is emitted if
     * the host refuses.
     *
     * @param terminalType Empty means "default"
     */
    void launchExternalTerminal(const QString &terminalType = QString(), const QString &workingDirectory = QString(), const QString &command = QString());

    /**
     * Terminals whose shell is being spawned
     */
    int startingTerminalCount() const
    {
        return m_startingTerminals.size();
    }

    // ========== Session operations ==========

    bool closeSession(const QString &id);
    bool closeOthers(const QString &keepId);
    void closeAll();

    /**
     * Terminals are renamed on the host too
     */
    bool renameSession(const QString &id, const QString &name);

    bool reorderSessions(int fromIndex, int toIndex);

    bool activate(const QString &id);
    bool activateIndex(int index);
    /**
     * Move to the neighbouring tab. No wrap-around: returns false on the
     * last (first) tab.
     */
    bool activateNext();
    bool activatePrevious();

    bool setEditorDirty(const QString &id, bool dirty);

    /**
     * Logical lines of a terminal; @p maxLines < 0 uses the configured limit
     */
    QStringList exportTerminal(const QString &id, int maxLines = -1) const;

    PtyBridge *terminalBridge(const QString &id) const;
    OverlaySurfaceCoordinator *browserCoordinator(const QString &id) const;

    // ========== Keyboard ==========

    /**
     * Handle a panel shortcut.
     *
     * @return true if the chord was consumed
     */
    bool handleKeyPress(int key, Qt::KeyboardModifiers modifiers, FocusTarget focus);
    bool handleKeyPress(const QKeyEvent *event, FocusTarget focus);

    // ========== Profiles & cluster context ==========

    /**
     * Fetch the shell profiles from the host and re-resolve the default
     */
    void refreshProfiles();

    ProfileList profiles() const
    {
        return m_profiles;
    }

    QString defaultProfileId() const
    {
        return m_defaultProfileId;
    }

    /**
     * Make @p id the default profile and persist it
     */
    bool setDefaultProfile(const QString &id);

    void setClusterContext(const ClusterContext &context);

    ClusterContext clusterContext() const
    {
        return m_clusterContext;
    }

    /**
     * Dispose every surface, stop every poller and ask the host once to
     * close all terminals. Called by the destructor; idempotent.
     */
    void shutdown();

Q_SIGNALS:
    void sessionCreationFailed(Workdeck::SessionKind kind, const QString &message);
    void externalTerminalFailed(const QString &terminalType, const QString &message);
    void requestConsumed(const QString &requestId);
    void profilesChanged();
    void defaultProfileChanged(const QString &id);

private Q_SLOTS:
    void onSessionClosed(const QString &id, Workdeck::SessionKind kind);
    void onActiveSessionChanged(const QString &currentId, const QString &previousId);

private:
    struct PendingRequest {
        QString id;
        SessionRequest request;
    };

    void startPanel();
    void processPendingRequests();
    void dispatchRequest(const SessionRequest &request);
    void setSessionActive(const QString &id, bool active);
    void syncBrowserPayload(const QString &id);
    void recordCommand(const QString &id, const QString &command);

    QPointer<HostBridge> m_host;
    WorkspaceConfig m_config;
    ProfileStore *m_profileStore = nullptr;
    SessionRegistry *m_registry = nullptr;

    QHash<QString, PtyBridge *> m_terminals;
    QHash<QString, OverlaySurfaceCoordinator *> m_browsers;
    QSet<PtyBridge *> m_startingTerminals;

    QList<PendingRequest> m_pendingRequests;
    quint64 m_nextRequestId = 1;

    ProfileList m_profiles;
    QString m_defaultProfileId;
    ClusterContext m_clusterContext;

    bool m_panelOpen = false;
    bool m_processingRequests = false;
    bool m_profilesFetched = false;
    bool m_startupPending = false;
    bool m_shutDown = false;
};

} // namespace Workdeck

#endif // WORKSPACEMANAGER_H
