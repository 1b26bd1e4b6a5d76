/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PtyBridge.h"

#include "OutputPoller.h"
#include "ScreenBuffer.h"

#include <QDebug>

namespace Workdeck
{

PtyBridge::PtyBridge(HostBridge *host, std::unique_ptr<ScreenBuffer> buffer, int pollIntervalMs, QObject *parent)
    : QObject(parent)
    , m_host(host)
    , m_buffer(std::move(buffer))
    , m_pollIntervalMs(pollIntervalMs)
{
}

PtyBridge::~PtyBridge()
{
    stopPolling();
}

void PtyBridge::start(const TerminalSpec &spec)
{
    if (m_state != State::Idle) {
        qWarning() << "PtyBridge: start() called twice";
        return;
    }
    if (!m_host) {
        Q_EMIT creationFailed(QStringLiteral("No host connection"));
        return;
    }

    m_state = State::Starting;
    const QSize requested(spec.columns, spec.rows);

    QPointer<PtyBridge> guard(this);
    m_host->createTerminal(spec, [this, guard, requested](const HostReply &reply) {
        if (!guard) {
            return;
        }

        const TerminalDescriptor descriptor = TerminalDescriptor::fromJson(reply.result);

        if (m_state == State::Closed) {
            // Shut down while the create was in flight; don't leak the shell
            if (reply.ok && descriptor.isValid() && m_host) {
                m_host->closeTerminal(descriptor.id);
            }
            return;
        }

        if (!reply.ok || !descriptor.isValid()) {
            m_state = State::Idle;
            const QString message = reply.ok ? QStringLiteral("Host returned no terminal id") : reply.error;
            qWarning() << "PtyBridge: Failed to create terminal:" << message;
            Q_EMIT creationFailed(message);
            return;
        }

        auto *poller = new OutputPoller(m_host, descriptor.id, m_pollIntervalMs, this);
        if (!poller->start()) {
            // Another bridge already reads this id; closing it would kill that shell
            delete poller;
            m_state = State::Closed;
            const QString message = QStringLiteral("Terminal %1 is already attached").arg(descriptor.id);
            qWarning() << "PtyBridge: Failed to start output polling:" << message;
            Q_EMIT creationFailed(message);
            return;
        }

        m_sessionId = descriptor.id;
        m_hostName = descriptor.name;
        m_lastSentSize = requested;
        m_state = State::Running;

        m_poller = poller;
        connect(m_poller, &OutputPoller::outputReceived, this, [this](const QByteArray &data) {
            m_buffer->write(data);
            Q_EMIT outputReceived(data);
        });

        // Terminal reports (cursor position, device attributes) go back to the shell untracked
        m_buffer->setReplyWriter([this](const QByteArray &data) {
            if (m_state != State::Running || !m_host) {
                return;
            }
            const QString sessionId = m_sessionId;
            m_host->writeTerminal(sessionId, data, [sessionId](const HostReply &reply) {
                if (!reply.ok) {
                    qWarning() << "PtyBridge: Reply write failed for" << sessionId << ":" << reply.error;
                }
            });
        });

        qDebug() << "PtyBridge: Terminal started:" << m_sessionId << m_hostName;
        Q_EMIT started(m_sessionId);

        // A viewport may have been reported while the shell was starting
        if (m_active && m_viewport.isValid()) {
            sendSize(m_buffer->fit(m_viewport));
        }
    });
}

bool PtyBridge::sendInput(const QByteArray &data)
{
    if (m_state != State::Running || !m_host || data.isEmpty()) {
        return false;
    }

    const QString sessionId = m_sessionId;
    m_host->writeTerminal(sessionId, data, [sessionId](const HostReply &reply) {
        if (!reply.ok) {
            qWarning() << "PtyBridge: Write failed for" << sessionId << ":" << reply.error;
        }
    });

    trackInput(data);
    return true;
}

void PtyBridge::trackInput(const QByteArray &data)
{
    if (data == "\r" || data == "\n" || data == "\r\n") {
        const QString command = m_currentLine.trimmed();
        m_currentLine.clear();
        if (!command.isEmpty()) {
            Q_EMIT commandSubmitted(command);
        }
        return;
    }

    if (data == "\x7f") {
        m_currentLine.chop(1);
        return;
    }

    // Only single keystrokes are tracked; pastes and escape sequences are not
    const QString text = QString::fromUtf8(data);
    if (text.size() == 1 && text.at(0).unicode() >= 0x20 && text.at(0).unicode() != 0x7f) {
        m_currentLine.append(text);
    } else if (text.size() == 2 && text.at(0).isHighSurrogate()) {
        m_currentLine.append(text);
    }
}

void PtyBridge::clearCurrentLine()
{
    m_currentLine.clear();
}

void PtyBridge::setActive(bool active)
{
    if (m_active == active) {
        return;
    }
    m_active = active;

    m_buffer->setFocused(active);
    if (active && m_viewport.isValid()) {
        sendSize(m_buffer->fit(m_viewport));
    }
}

void PtyBridge::viewportResized(const QSize &pixels)
{
    m_viewport = pixels;
    if (!m_active) {
        return;
    }
    sendSize(m_buffer->fit(pixels));
}

void PtyBridge::resize(int columns, int rows)
{
    sendSize(QSize(columns, rows));
}

void PtyBridge::sendSize(const QSize &grid)
{
    if (m_state != State::Running || !m_host) {
        return;
    }
    if (grid.width() <= 0 || grid.height() <= 0 || grid == m_lastSentSize) {
        return;
    }

    m_lastSentSize = grid;
    const QString sessionId = m_sessionId;
    m_host->resizeTerminal(sessionId, grid.width(), grid.height(), [sessionId](const HostReply &reply) {
        if (!reply.ok) {
            qWarning() << "PtyBridge: Resize failed for" << sessionId << ":" << reply.error;
        }
    });
}

QStringList PtyBridge::exportLines(int maxLines) const
{
    return m_buffer->exportLines(maxLines);
}

void PtyBridge::shutdown()
{
    if (m_state == State::Closed) {
        return;
    }

    const bool wasRunning = m_state == State::Running;
    m_state = State::Closed;
    stopPolling();

    if (wasRunning && m_host) {
        const QString sessionId = m_sessionId;
        m_host->closeTerminal(sessionId, [sessionId](const HostReply &reply) {
            if (!reply.ok) {
                qWarning() << "PtyBridge: Close failed for" << sessionId << ":" << reply.error;
            }
        });
    }
}

void PtyBridge::detach()
{
    if (m_state == State::Closed) {
        return;
    }
    m_state = State::Closed;
    stopPolling();
}

void PtyBridge::stopPolling()
{
    if (m_poller) {
        m_poller->cancel();
    }
}

} // namespace Workdeck

#include "moc_PtyBridge.cpp"
