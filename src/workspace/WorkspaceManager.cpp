/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceManager.h"

#include "HostBridge.h"
#include "OverlaySurfaceCoordinator.h"
#include "PtyBridge.h"
#include "ScreenBuffer.h"
#include "SessionRegistry.h"

#include <QDebug>
#include <QKeyEvent>

#include <KLocalizedString>

namespace Workdeck
{

WorkspaceManager::WorkspaceManager(HostBridge *host, const WorkspaceConfig &config, ProfileStore *profileStore, QObject *parent)
    : QObject(parent)
    , m_host(host)
    , m_config(config)
    , m_profileStore(profileStore)
    , m_registry(new SessionRegistry(this))
{
    if (m_profileStore) {
        m_defaultProfileId = m_profileStore->loadDefaultProfileId();
    }

    connect(m_registry, &SessionRegistry::sessionClosed, this, &WorkspaceManager::onSessionClosed);
    connect(m_registry, &SessionRegistry::activeSessionChanged, this, &WorkspaceManager::onActiveSessionChanged);
}

WorkspaceManager::~WorkspaceManager()
{
    shutdown();
}

// ========== Panel & external requests ==========

void WorkspaceManager::setPanelOpen(bool open)
{
    if (m_shutDown || m_panelOpen == open) {
        return;
    }
    m_panelOpen = open;
    if (!open) {
        return;
    }

    // The first terminal needs the host's default shell
    if (!m_profilesFetched && m_host) {
        if (!m_startupPending) {
            m_startupPending = true;
            refreshProfiles();
        }
        return;
    }

    startPanel();
}

void WorkspaceManager::startPanel()
{
    if (!m_panelOpen || m_shutDown || m_startupPending) {
        return;
    }

    if (!m_pendingRequests.isEmpty()) {
        processPendingRequests();
    } else if (m_registry->isEmpty() && m_startingTerminals.isEmpty()) {
        createTerminal();
    }
}

QString WorkspaceManager::submitRequest(const SessionRequest &request)
{
    PendingRequest pending;
    pending.id = QStringLiteral("request-%1").arg(m_nextRequestId++);
    pending.request = request;
    m_pendingRequests.append(pending);

    qDebug() << "WorkspaceManager: Queued" << kindId(request.kind) << "request" << pending.id;

    if (m_panelOpen) {
        processPendingRequests();
    }
    return pending.id;
}

void WorkspaceManager::processPendingRequests()
{
    // A request may open a session that emits signals leading back here
    if (m_processingRequests || m_startupPending) {
        return;
    }
    m_processingRequests = true;

    while (m_panelOpen && !m_shutDown && !m_pendingRequests.isEmpty()) {
        const PendingRequest pending = m_pendingRequests.takeFirst();
        dispatchRequest(pending.request);
        Q_EMIT requestConsumed(pending.id);
    }

    m_processingRequests = false;
}

void WorkspaceManager::dispatchRequest(const SessionRequest &request)
{
    switch (request.kind) {
    case SessionKind::Terminal:
        createTerminal(request.name, request.profileId, request.command);
        break;
    case SessionKind::Browser:
        createBrowser(request.url, request.name);
        break;
    case SessionKind::Editor:
        createEditor(request.filePath, request.content, request.name);
        break;
    case SessionKind::Logging:
        createLogging(request.query, request.timeRange, request.name);
        break;
    }
}

// ========== Creation ==========

void WorkspaceManager::createTerminal(const QString &name, const QString &profileId, const QString &userCommand)
{
    if (m_shutDown) {
        return;
    }
    if (!m_host) {
        Q_EMIT sessionCreationFailed(SessionKind::Terminal, i18n("Not connected to the terminal host"));
        return;
    }

    const QString resolvedProfile = profileId.isEmpty() ? m_defaultProfileId : profileId;
    const std::optional<ShellProfile> profile = m_profiles.find(resolvedProfile);

    TerminalSpec spec;
    spec.name = name.trimmed();
    spec.columns = m_config.defaultColumns;
    spec.rows = m_config.defaultRows;
    spec.shellPath = profile ? profile->path : QString();
    spec.initialCommand = buildInitialCommand(dialectForShell(spec.shellPath), m_clusterContext, userCommand);

    auto buffer = std::make_unique<TerminalScreenBuffer>(spec.columns, spec.rows, m_config.scrollback);
    auto *bridge = new PtyBridge(m_host, std::move(buffer), m_config.pollIntervalMs, this);
    m_startingTerminals.insert(bridge);

    TerminalPayload payload;
    payload.profileId = resolvedProfile;
    const QString displayName = spec.name;

    connect(bridge, &PtyBridge::started, this, [this, bridge, payload, displayName](const QString &hostId) {
        m_startingTerminals.remove(bridge);

        // The record must find its bridge when it becomes active
        const bool known = m_terminals.contains(hostId);
        if (!known) {
            m_terminals.insert(hostId, bridge);
        }
        const QString id = m_registry->create(payload, displayName, hostId);
        if (id.isEmpty()) {
            if (!known) {
                m_terminals.remove(hostId);
            }
            // Closing by id would hit the terminal that already owns it
            bridge->detach();
            bridge->deleteLater();
            Q_EMIT sessionCreationFailed(SessionKind::Terminal, i18n("The host reused terminal id %1", hostId));
            return;
        }

        connect(bridge, &PtyBridge::commandSubmitted, this, [this, id](const QString &command) {
            recordCommand(id, command);
        });
    });

    connect(bridge, &PtyBridge::creationFailed, this, [this, bridge](const QString &message) {
        m_startingTerminals.remove(bridge);
        bridge->deleteLater();
        Q_EMIT sessionCreationFailed(SessionKind::Terminal, message);
    });

    bridge->start(spec);
}

void WorkspaceManager::launchExternalTerminal(const QString &terminalType, const QString &workingDirectory, const QString &command)
{
    const QString type = terminalType.trimmed().isEmpty() ? QStringLiteral("default") : terminalType.trimmed();
    if (m_shutDown) {
        return;
    }
    if (!m_host) {
        Q_EMIT externalTerminalFailed(type, i18n("Not connected to the terminal host"));
        return;
    }

    QPointer<WorkspaceManager> guard(this);
    m_host->launchExternalTerminal(type, workingDirectory, command, [this, guard, type](const HostReply &reply) {
        if (!guard) {
            return;
        }
        if (!reply.ok) {
            qWarning() << "WorkspaceManager: Failed to launch external terminal" << type << ":" << reply.error;
            Q_EMIT externalTerminalFailed(type, reply.error);
            return;
        }
        qDebug() << "WorkspaceManager: Launched external terminal" << type;
    });
}

QString WorkspaceManager::createBrowser(const QString &url, const QString &name)
{
    if (m_shutDown) {
        return QString();
    }

    QString id;
    do {
        id = SessionRegistry::generateSessionId();
    } while (m_registry->contains(id) || m_browsers.contains(id) || m_terminals.contains(id));

    // Must exist before the record so activation reaches it
    auto *coordinator = new OverlaySurfaceCoordinator(m_host, id, this);
    m_browsers.insert(id, coordinator);

    if (m_registry->create(BrowserPayload(), name, id).isEmpty()) {
        m_browsers.remove(id);
        delete coordinator;
        Q_EMIT sessionCreationFailed(SessionKind::Browser, i18n("Could not allocate a session id"));
        return QString();
    }

    connect(coordinator, &OverlaySurfaceCoordinator::navigationStateChanged, this, [this, id]() {
        syncBrowserPayload(id);
    });

    if (!url.trimmed().isEmpty()) {
        coordinator->navigate(url);
    }
    return id;
}

QString WorkspaceManager::createEditor(const QString &filePath, const std::optional<QString> &content, const QString &name)
{
    if (m_shutDown) {
        return QString();
    }

    EditorPayload payload;
    payload.filePath = filePath;
    payload.content = content;

    QString displayName = name;
    if (displayName.trimmed().isEmpty() && !filePath.isEmpty()) {
        displayName = filePath.section(QLatin1Char('/'), -1);
    }
    return m_registry->create(payload, displayName);
}

QString WorkspaceManager::createLogging(const std::optional<QString> &query, const TimeRange &range, const QString &name)
{
    if (m_shutDown) {
        return QString();
    }

    LoggingPayload payload;
    payload.query = query;
    payload.timeRange = range;
    return m_registry->create(payload, name);
}

// ========== Session operations ==========

bool WorkspaceManager::closeSession(const QString &id)
{
    return m_registry->close(id);
}

bool WorkspaceManager::closeOthers(const QString &keepId)
{
    return m_registry->closeOthers(keepId);
}

void WorkspaceManager::closeAll()
{
    m_registry->closeAll();
}

bool WorkspaceManager::renameSession(const QString &id, const QString &name)
{
    if (!m_registry->rename(id, name)) {
        return false;
    }

    PtyBridge *bridge = m_terminals.value(id);
    if (bridge && m_host && bridge->state() == PtyBridge::State::Running) {
        m_host->renameTerminal(id, name.trimmed(), [id](const HostReply &reply) {
            if (!reply.ok) {
                qWarning() << "WorkspaceManager: Host rename failed for" << id << ":" << reply.error;
            }
        });
    }
    return true;
}

bool WorkspaceManager::reorderSessions(int fromIndex, int toIndex)
{
    return m_registry->reorder(fromIndex, toIndex);
}

bool WorkspaceManager::activate(const QString &id)
{
    return m_registry->setActive(id);
}

bool WorkspaceManager::activateIndex(int index)
{
    const QList<WorkspaceSession> sessions = m_registry->sessions();
    if (index < 0 || index >= sessions.size()) {
        return false;
    }
    return m_registry->setActive(sessions.at(index).id);
}

// Cycling stops at the first and last tab
bool WorkspaceManager::activateNext()
{
    const int current = m_registry->indexOf(m_registry->activeId());
    // With no active tab this selects the first one
    if (current + 1 >= m_registry->count()) {
        return false;
    }
    return activateIndex(current + 1);
}

bool WorkspaceManager::activatePrevious()
{
    const int current = m_registry->indexOf(m_registry->activeId());
    if (current <= 0) {
        return false;
    }
    return activateIndex(current - 1);
}

bool WorkspaceManager::setEditorDirty(const QString &id, bool dirty)
{
    const std::optional<WorkspaceSession> session = m_registry->get(id);
    if (!session) {
        return false;
    }

    const EditorPayload *editor = session->as<EditorPayload>();
    if (!editor) {
        return false;
    }
    if (editor->hasUnsavedChanges == dirty) {
        return true;
    }

    EditorPayload updated = *editor;
    updated.hasUnsavedChanges = dirty;
    return m_registry->updatePayload(id, updated);
}

QStringList WorkspaceManager::exportTerminal(const QString &id, int maxLines) const
{
    PtyBridge *bridge = m_terminals.value(id);
    if (!bridge) {
        return QStringList();
    }
    return bridge->exportLines(maxLines < 0 ? m_config.exportLineLimit : maxLines);
}

PtyBridge *WorkspaceManager::terminalBridge(const QString &id) const
{
    return m_terminals.value(id);
}

OverlaySurfaceCoordinator *WorkspaceManager::browserCoordinator(const QString &id) const
{
    return m_browsers.value(id);
}

// ========== Keyboard ==========

bool WorkspaceManager::handleKeyPress(int key, Qt::KeyboardModifiers modifiers, FocusTarget focus)
{
    if (!m_panelOpen || m_shutDown) {
        return false;
    }

    const ShortcutMatch match = matchShortcut(key, modifiers);
    if (!panelHandlesShortcut(match, focus)) {
        return false;
    }

    switch (match.action) {
    case ShortcutAction::NewTab:
        createTerminal();
        return true;
    case ShortcutAction::CloseTab:
        if (!m_registry->activeId().isEmpty()) {
            closeSession(m_registry->activeId());
        }
        return true;
    case ShortcutAction::JumpToTab:
        return activateIndex(match.tabIndex);
    case ShortcutAction::PreviousTab:
        activatePrevious();
        return true;
    case ShortcutAction::NextTab:
        activateNext();
        return true;
    case ShortcutAction::None:
        break;
    }
    return false;
}

bool WorkspaceManager::handleKeyPress(const QKeyEvent *event, FocusTarget focus)
{
    if (!event) {
        return false;
    }
    return handleKeyPress(event->key(), event->modifiers(), focus);
}

// ========== Profiles & cluster context ==========

void WorkspaceManager::refreshProfiles()
{
    if (!m_host || m_shutDown) {
        return;
    }

    QPointer<WorkspaceManager> guard(this);
    m_host->listProfiles([this, guard](const HostReply &reply) {
        if (!guard || m_shutDown) {
            return;
        }

        // A failed fetch is not retried at startup; terminals use the host's default shell
        m_profilesFetched = true;

        if (!reply.ok) {
            qWarning() << "WorkspaceManager: Failed to list shell profiles:" << reply.error;
        } else {
            m_profiles = ProfileList::fromJson(reply.result);
            const QString saved = m_profileStore ? m_profileStore->loadDefaultProfileId() : QString();
            const QString resolved = resolveDefaultProfile(m_profiles, saved);

            qDebug() << "WorkspaceManager: Fetched" << m_profiles.profiles.size() << "shell profiles, default:" << resolved;

            Q_EMIT profilesChanged();
            if (resolved != m_defaultProfileId) {
                m_defaultProfileId = resolved;
                Q_EMIT defaultProfileChanged(resolved);
            }
        }

        if (m_startupPending) {
            m_startupPending = false;
            startPanel();
        }
    });
}

bool WorkspaceManager::setDefaultProfile(const QString &id)
{
    if (id.isEmpty() || (!m_profiles.isEmpty() && !m_profiles.find(id))) {
        qWarning() << "WorkspaceManager: Unknown shell profile:" << id;
        return false;
    }

    if (m_profileStore) {
        m_profileStore->saveDefaultProfileId(id);
    }
    if (m_defaultProfileId != id) {
        m_defaultProfileId = id;
        Q_EMIT defaultProfileChanged(id);
    }
    return true;
}

void WorkspaceManager::setClusterContext(const ClusterContext &context)
{
    m_clusterContext = context;
}

// ========== Lifecycle ==========

void WorkspaceManager::shutdown()
{
    if (m_shutDown) {
        return;
    }
    m_shutDown = true;

    for (OverlaySurfaceCoordinator *coordinator : std::as_const(m_browsers)) {
        coordinator->dispose();
    }
    for (PtyBridge *bridge : std::as_const(m_terminals)) {
        bridge->detach();
    }
    for (PtyBridge *bridge : std::as_const(m_startingTerminals)) {
        bridge->detach();
    }

    if (m_host) {
        m_host->closeAllTerminals([](const HostReply &reply) {
            if (!reply.ok) {
                qWarning() << "WorkspaceManager: Host failed to close terminals:" << reply.error;
            }
        });
    }

    qDebug() << "WorkspaceManager: Shut down" << m_terminals.size() << "terminals," << m_browsers.size() << "browsers";

    qDeleteAll(m_browsers);
    m_browsers.clear();
    qDeleteAll(m_terminals);
    m_terminals.clear();
    qDeleteAll(m_startingTerminals);
    m_startingTerminals.clear();
    m_pendingRequests.clear();
}

void WorkspaceManager::onSessionClosed(const QString &id, Workdeck::SessionKind kind)
{
    if (m_shutDown) {
        return;
    }

    switch (kind) {
    case SessionKind::Terminal:
        if (PtyBridge *bridge = m_terminals.take(id)) {
            bridge->shutdown();
            bridge->deleteLater();
        }
        break;
    case SessionKind::Browser:
        if (OverlaySurfaceCoordinator *coordinator = m_browsers.take(id)) {
            coordinator->dispose();
            coordinator->deleteLater();
        }
        break;
    case SessionKind::Editor:
    case SessionKind::Logging:
        break;
    }
}

void WorkspaceManager::onActiveSessionChanged(const QString &currentId, const QString &previousId)
{
    // Hide/blur the old session before showing the new one
    if (!previousId.isEmpty()) {
        setSessionActive(previousId, false);
    }
    if (!currentId.isEmpty()) {
        setSessionActive(currentId, true);
    }
}

void WorkspaceManager::setSessionActive(const QString &id, bool active)
{
    if (PtyBridge *bridge = m_terminals.value(id)) {
        bridge->setActive(active);
    } else if (OverlaySurfaceCoordinator *coordinator = m_browsers.value(id)) {
        coordinator->setActive(active);
    }
}

void WorkspaceManager::syncBrowserPayload(const QString &id)
{
    OverlaySurfaceCoordinator *coordinator = m_browsers.value(id);
    const std::optional<WorkspaceSession> session = m_registry->get(id);
    if (!coordinator || !session) {
        return;
    }

    std::visit(Overloaded{
                   [&](const BrowserPayload &current) {
                       BrowserPayload payload = current;
                       payload.url = coordinator->currentUrl();
                       payload.historyIndex = coordinator->history().index();
                       payload.isFavorite = coordinator->isFavorite();
                       payload.surfaceCreated = coordinator->isSurfaceCreated();
                       payload.isLoading = coordinator->isLoading();
                       payload.errorMessage = coordinator->errorMessage();
                       m_registry->updatePayload(id, payload);
                   },
                   [](const TerminalPayload &) {},
                   [](const EditorPayload &) {},
                   [](const LoggingPayload &) {},
               },
               session->payload);
}

void WorkspaceManager::recordCommand(const QString &id, const QString &command)
{
    const std::optional<WorkspaceSession> session = m_registry->get(id);
    if (!session) {
        return;
    }

    if (const TerminalPayload *terminal = session->as<TerminalPayload>()) {
        TerminalPayload updated = *terminal;
        updated.lastCommand = command;
        m_registry->updatePayload(id, updated);
    }
}

} // namespace Workdeck

#include "moc_WorkspaceManager.cpp"
