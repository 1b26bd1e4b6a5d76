/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionRegistry.h"

#include <QDebug>
#include <QRandomGenerator>

namespace Workdeck
{

SessionRegistry::SessionRegistry(QObject *parent)
    : QObject(parent)
{
}

SessionRegistry::~SessionRegistry() = default;

QString SessionRegistry::generateSessionId()
{
    QString id;
    id.reserve(8);
    for (int i = 0; i < 8; ++i) {
        int r = QRandomGenerator::global()->bounded(16);
        id.append(QLatin1Char(r < 10 ? '0' + r : 'a' + (r - 10)));
    }
    return id;
}

QString SessionRegistry::create(const SessionPayload &payload, const QString &name, const QString &id)
{
    QString sessionId = id;
    if (sessionId.isEmpty()) {
        do {
            sessionId = generateSessionId();
        } while (m_issuedIds.contains(sessionId));
    } else if (m_issuedIds.contains(sessionId)) {
        qWarning() << "SessionRegistry: Rejecting duplicate session id:" << sessionId;
        return QString();
    }

    WorkspaceSession session;
    session.id = sessionId;
    session.payload = payload;
    session.name = name.trimmed().isEmpty() ? defaultName(kindOf(payload)) : name.trimmed();
    session.createdAt = QDateTime::currentDateTime();

    m_issuedIds.insert(sessionId);
    m_sessions.append(session);

    const QString previous = m_activeId;
    m_activeId = sessionId;

    qDebug() << "SessionRegistry: Created" << kindId(session.kind()) << "session" << sessionId << session.name;

    Q_EMIT sessionCreated(sessionId);
    emitActiveChange(previous);
    return sessionId;
}

bool SessionRegistry::close(const QString &id)
{
    const int index = indexOf(id);
    if (index < 0) {
        return false;
    }

    const SessionKind kind = m_sessions.at(index).kind();
    m_sessions.removeAt(index);

    const QString previous = m_activeId;
    if (m_activeId == id) {
        if (m_sessions.isEmpty()) {
            m_activeId.clear();
        } else {
            m_activeId = m_sessions.at(qMin(index, m_sessions.size() - 1)).id;
        }
    }

    qDebug() << "SessionRegistry: Closed session" << id << "active now:" << m_activeId;

    Q_EMIT sessionClosed(id, kind);
    emitActiveChange(previous);
    return true;
}

bool SessionRegistry::closeOthers(const QString &keepId)
{
    const int keepIndex = indexOf(keepId);
    if (keepIndex < 0) {
        return false;
    }

    QList<WorkspaceSession> removed;
    for (const WorkspaceSession &session : std::as_const(m_sessions)) {
        if (session.id != keepId) {
            removed.append(session);
        }
    }

    const WorkspaceSession kept = m_sessions.at(keepIndex);
    m_sessions.clear();
    m_sessions.append(kept);
    const QString previous = m_activeId;
    m_activeId = keepId;

    for (const WorkspaceSession &session : removed) {
        Q_EMIT sessionClosed(session.id, session.kind());
    }
    emitActiveChange(previous);
    return true;
}

void SessionRegistry::closeAll()
{
    const QList<WorkspaceSession> removed = m_sessions;
    m_sessions.clear();

    const QString previous = m_activeId;
    m_activeId.clear();

    for (const WorkspaceSession &session : removed) {
        Q_EMIT sessionClosed(session.id, session.kind());
    }
    emitActiveChange(previous);
}

bool SessionRegistry::rename(const QString &id, const QString &name)
{
    const int index = indexOf(id);
    const QString trimmed = name.trimmed();
    if (index < 0 || trimmed.isEmpty()) {
        return false;
    }

    if (m_sessions[index].name == trimmed) {
        return true;
    }

    m_sessions[index].name = trimmed;
    Q_EMIT sessionRenamed(id, trimmed);
    return true;
}

bool SessionRegistry::reorder(int fromIndex, int toIndex)
{
    if (fromIndex < 0 || fromIndex >= m_sessions.size() || toIndex < 0 || toIndex >= m_sessions.size()) {
        return false;
    }
    if (fromIndex == toIndex) {
        return true;
    }

    m_sessions.move(fromIndex, toIndex);
    Q_EMIT sessionMoved(fromIndex, toIndex);
    return true;
}

bool SessionRegistry::setActive(const QString &id)
{
    if (!contains(id)) {
        return false;
    }

    const QString previous = m_activeId;
    m_activeId = id;
    emitActiveChange(previous);
    return true;
}

bool SessionRegistry::updatePayload(const QString &id, const SessionPayload &payload)
{
    const int index = indexOf(id);
    if (index < 0) {
        return false;
    }

    if (m_sessions.at(index).kind() != kindOf(payload)) {
        qWarning() << "SessionRegistry: Refusing payload of kind" << kindId(kindOf(payload)) << "for" << kindId(m_sessions.at(index).kind()) << "session"
                   << id;
        return false;
    }

    m_sessions[index].payload = payload;
    Q_EMIT sessionUpdated(id);
    return true;
}

std::optional<WorkspaceSession> SessionRegistry::get(const QString &id) const
{
    const int index = indexOf(id);
    if (index < 0) {
        return std::nullopt;
    }
    return m_sessions.at(index);
}

int SessionRegistry::indexOf(const QString &id) const
{
    for (int i = 0; i < m_sessions.size(); ++i) {
        if (m_sessions.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

QString SessionRegistry::defaultName(SessionKind kind)
{
    int &counter = m_nameCounters[static_cast<int>(kind)];
    ++counter;
    return QStringLiteral("%1 %2").arg(kindLabel(kind)).arg(counter);
}

void SessionRegistry::emitActiveChange(const QString &previousId)
{
    if (previousId != m_activeId) {
        Q_EMIT activeSessionChanged(m_activeId, previousId);
    }
}

} // namespace Workdeck

#include "moc_SessionRegistry.cpp"
