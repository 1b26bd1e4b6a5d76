/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONREGISTRY_H
#define SESSIONREGISTRY_H

#include "workdeckprivate_export.h"

#include "WorkspaceSession.h"

#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>
#include <QString>

#include <optional>

namespace Workdeck
{

/**
 * SessionRegistry is the ordered list of workspace sessions plus the
 * active-session pointer.
 *
 * It performs no I/O. Every mutation is applied completely before any signal
 * is emitted, so observers never see a half-applied create or close:
 * - the active id is empty exactly when the registry is empty
 * - ids are unique for the lifetime of the registry
 *
 * Resources attached to a session (host terminal, native surface) are
 * released by whoever listens to sessionClosed(); every removal path emits it.
 */
class WORKDECKPRIVATE_EXPORT SessionRegistry : public QObject
{
    Q_OBJECT

public:
    explicit SessionRegistry(QObject *parent = nullptr);
    ~SessionRegistry() override;

    /**
     * Generate a session id (8 hex characters)
     */
    static QString generateSessionId();

    /**
     * Append a session and make it active.
     *
     * @param payload Kind-specific data
     * @param name Display name; empty picks "<Kind> N"
     * @param id Id assigned elsewhere (e.g. by the host); empty generates one
     * @return the session id, or an empty string if @p id is already in use
     */
    QString create(const SessionPayload &payload, const QString &name = QString(), const QString &id = QString());

    /**
     * Remove a session. If it was active, activation moves to the session now
     * at the same position (clamped to the last one), or to none.
     *
     * @return false if no session has this id
     */
    bool close(const QString &id);

    /**
     * Remove every session except @p keepId, which becomes active.
     *
     * @return false if @p keepId is unknown (nothing is closed)
     */
    bool closeOthers(const QString &keepId);

    /**
     * Remove every session.
     */
    void closeAll();

    bool rename(const QString &id, const QString &name);

    /**
     * Move the session at @p fromIndex to @p toIndex. The active session is unchanged.
     */
    bool reorder(int fromIndex, int toIndex);

    bool setActive(const QString &id);

    /**
     * Replace the payload of a session. The payload must be of the same kind.
     */
    bool updatePayload(const QString &id, const SessionPayload &payload);

    std::optional<WorkspaceSession> get(const QString &id) const;

    QString activeId() const
    {
        return m_activeId;
    }

    int indexOf(const QString &id) const;

    bool contains(const QString &id) const
    {
        return indexOf(id) >= 0;
    }

    QList<WorkspaceSession> sessions() const
    {
        return m_sessions;
    }

    int count() const
    {
        return m_sessions.size();
    }

    bool isEmpty() const
    {
        return m_sessions.isEmpty();
    }

Q_SIGNALS:
    void sessionCreated(const QString &id);

    /**
     * Emitted once for every removed session, after the removal is complete
     */
    void sessionClosed(const QString &id, Workdeck::SessionKind kind);

    /**
     * Emitted after the active session changed. Either id may be empty.
     */
    void activeSessionChanged(const QString &currentId, const QString &previousId);

    void sessionRenamed(const QString &id, const QString &name);
    void sessionMoved(int fromIndex, int toIndex);
    void sessionUpdated(const QString &id);

private:
    QString defaultName(SessionKind kind);
    void emitActiveChange(const QString &previousId);

    QList<WorkspaceSession> m_sessions;
    QString m_activeId;

    // Every id ever handed out, so a closed id is never reused
    QSet<QString> m_issuedIds;

    // Per-kind counters for default names
    QHash<int, int> m_nameCounters;
};

} // namespace Workdeck

#endif // SESSIONREGISTRY_H
