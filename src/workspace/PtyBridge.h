/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PTYBRIDGE_H
#define PTYBRIDGE_H

#include "workdeckprivate_export.h"

#include "HostBridge.h"

#include <QObject>
#include <QPointer>
#include <QSize>
#include <QString>
#include <QStringList>

#include <memory>

namespace Workdeck
{

class OutputPoller;
class ScreenBuffer;

/**
 * PtyBridge connects one terminal session to its host-side shell.
 *
 * Lifecycle:
 * 1. start() asks the host for a shell; started() or creationFailed() follows
 * 2. While running, output is polled into the screen buffer and input is
 *    forwarded as it arrives
 * 3. shutdown() stops polling and closes the shell, or detach() stops
 *    polling when the host closes the shell by other means
 */
class WORKDECKPRIVATE_EXPORT PtyBridge : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Starting,
        Running,
        Closed,
    };
    Q_ENUM(State)

    /**
     * @param buffer Screen buffer receiving the output
     */
    PtyBridge(HostBridge *host, std::unique_ptr<ScreenBuffer> buffer, int pollIntervalMs = 10, QObject *parent = nullptr);
    ~PtyBridge() override;

    /**
     * Ask the host to spawn the shell.
     */
    void start(const TerminalSpec &spec);

    /**
     * Forward user input to the shell. Returns false if the shell is not running.
     */
    bool sendInput(const QByteArray &data);

    /**
     * Discard the tracked current input line
     */
    void clearCurrentLine();

    QString currentLine() const
    {
        return m_currentLine;
    }

    /**
     * Tab became visible (focus + refit) or hidden
     */
    void setActive(bool active);

    bool isActive() const
    {
        return m_active;
    }

    /**
     * The terminal viewport changed size. Only applied while active.
     */
    void viewportResized(const QSize &pixels);

    /**
     * Explicit grid size. A size equal to the last one sent is dropped.
     */
    void resize(int columns, int rows);

    QSize lastSentSize() const
    {
        return m_lastSentSize;
    }

    /**
     * Logical lines for export, see ScreenBuffer::exportLines()
     */
    QStringList exportLines(int maxLines = 2000) const;

    /**
     * Stop polling and close the host shell (exactly once)
     */
    void shutdown();

    /**
     * Stop polling without telling the host
     */
    void detach();

    State state() const
    {
        return m_state;
    }

    /**
     * Host-assigned terminal id, empty until started
     */
    QString sessionId() const
    {
        return m_sessionId;
    }

    QString hostName() const
    {
        return m_hostName;
    }

    ScreenBuffer *screenBuffer() const
    {
        return m_buffer.get();
    }

    OutputPoller *poller() const
    {
        return m_poller;
    }

Q_SIGNALS:
    void started(const QString &sessionId);
    void creationFailed(const QString &message);

    /**
     * A non-empty input line was submitted with Enter
     */
    void commandSubmitted(const QString &command);

    void outputReceived(const QByteArray &data);

private:
    void trackInput(const QByteArray &data);
    void sendSize(const QSize &grid);
    void stopPolling();

    QPointer<HostBridge> m_host;
    std::unique_ptr<ScreenBuffer> m_buffer;
    OutputPoller *m_poller = nullptr;
    int m_pollIntervalMs;

    State m_state = State::Idle;
    QString m_sessionId;
    QString m_hostName;
    QString m_currentLine;
    bool m_active = false;
    QSize m_viewport;
    QSize m_lastSentSize;
};

} // namespace Workdeck

#endif // PTYBRIDGE_H
