/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "OverlaySurfaceCoordinator.h"

#include <QDebug>
#include <QUrl>

#include <utility>

namespace Workdeck
{

static const QLatin1String SearchUrlPrefix("https://www.google.com/search?q=");

OverlaySurfaceCoordinator::OverlaySurfaceCoordinator(HostBridge *host, const QString &sessionId, QObject *parent)
    : QObject(parent)
    , m_host(host)
    , m_sessionId(sessionId)
{
    if (m_host) {
        connect(m_host, &HostBridge::addressChanged, this, &OverlaySurfaceCoordinator::onAddressChanged);
        connect(m_host, &HostBridge::loadingStateChanged, this, &OverlaySurfaceCoordinator::onLoadingStateChanged);
    }
}

OverlaySurfaceCoordinator::~OverlaySurfaceCoordinator()
{
    dispose();
}

QString OverlaySurfaceCoordinator::formatAddress(const QString &input)
{
    const QString trimmed = input.trimmed();
    if (trimmed.isEmpty()) {
        return QString();
    }

    if (trimmed.startsWith(QLatin1String("http://"), Qt::CaseInsensitive) || trimmed.startsWith(QLatin1String("https://"), Qt::CaseInsensitive)) {
        return trimmed;
    }

    if (trimmed.contains(QLatin1Char('.')) || trimmed.startsWith(QLatin1String("localhost"), Qt::CaseInsensitive)) {
        return QStringLiteral("https://") + trimmed;
    }

    return SearchUrlPrefix + QString::fromLatin1(QUrl::toPercentEncoding(trimmed));
}

void OverlaySurfaceCoordinator::navigate(const QString &input)
{
    if (m_state == State::Disposed || !m_host) {
        return;
    }

    const QString url = formatAddress(input);
    if (url.isEmpty()) {
        return;
    }

    m_history.navigate(url);
    m_currentUrl = url;
    Q_EMIT navigationStateChanged();

    switch (m_state) {
    case State::Uninitialized:
        createSurface(url);
        break;
    case State::Creating:
        m_queuedUrl = url;
        break;
    case State::Visible:
    case State::Hidden:
        sendNavigate(url);
        break;
    case State::Disposed:
        break;
    }
}

void OverlaySurfaceCoordinator::createSurface(const QString &url)
{
    m_state = State::Creating;
    m_pushedBounds = m_bounds;

    QPointer<OverlaySurfaceCoordinator> guard(this);
    QPointer<HostBridge> host(m_host);
    const QString sessionId = m_sessionId;
    m_host->createSurface(m_sessionId, url, m_bounds, [this, guard, host, sessionId](const HostReply &reply) {
        if (!guard) {
            // Coordinator deleted mid-create, nobody else will close this surface
            if (reply.ok && host) {
                qDebug() << "OverlaySurfaceCoordinator: Closing surface created after deletion for" << sessionId;
                host->closeSurface(sessionId);
            }
            return;
        }

        if (m_state == State::Disposed) {
            if (reply.ok && m_closeWhenCreated && host) {
                m_closeWhenCreated = false;
                host->closeSurface(sessionId);
            }
            return;
        }

        if (!reply.ok) {
            qWarning() << "OverlaySurfaceCoordinator: Failed to create surface for" << m_sessionId << ":" << reply.error;
            m_state = State::Uninitialized;
            m_queuedUrl.clear();
            setError(reply.error);
            return;
        }

        m_surfaceCreated = true;
        clearError();

        if (m_active) {
            m_state = State::Visible;
            pushBounds(false);
        } else {
            m_state = State::Hidden;
            m_host->hideSurface(m_sessionId);
        }

        qDebug() << "OverlaySurfaceCoordinator: Surface created for" << m_sessionId;
        Q_EMIT surfaceCreated();
        Q_EMIT navigationStateChanged();

        if (!m_queuedUrl.isEmpty()) {
            sendNavigate(std::exchange(m_queuedUrl, QString()));
        }
    });
}

void OverlaySurfaceCoordinator::sendNavigate(const QString &url)
{
    QPointer<OverlaySurfaceCoordinator> guard(this);
    m_host->navigateSurface(m_sessionId, url, [this, guard](const HostReply &reply) {
        if (!guard || m_state == State::Disposed) {
            return;
        }
        if (!reply.ok) {
            qWarning() << "OverlaySurfaceCoordinator: Navigation failed for" << m_sessionId << ":" << reply.error;
            setError(reply.error);
            return;
        }
        clearError();
    });
}

bool OverlaySurfaceCoordinator::goBack()
{
    if (!hasSurface() || !m_history.goBack()) {
        return false;
    }

    m_currentUrl = m_history.current();
    m_host->goBack(m_sessionId);
    Q_EMIT navigationStateChanged();
    return true;
}

bool OverlaySurfaceCoordinator::goForward()
{
    if (!hasSurface() || !m_history.goForward()) {
        return false;
    }

    m_currentUrl = m_history.current();
    m_host->goForward(m_sessionId);
    Q_EMIT navigationStateChanged();
    return true;
}

void OverlaySurfaceCoordinator::reload()
{
    if (!hasSurface() || !m_host) {
        return;
    }
    m_host->reloadSurface(m_sessionId);
}

bool OverlaySurfaceCoordinator::toggleFavorite()
{
    setFavorite(!m_isFavorite);
    return m_isFavorite;
}

void OverlaySurfaceCoordinator::setFavorite(bool favorite)
{
    if (m_state == State::Disposed || m_isFavorite == favorite) {
        return;
    }
    m_isFavorite = favorite;
    Q_EMIT navigationStateChanged();
}

void OverlaySurfaceCoordinator::setActive(bool active)
{
    if (m_state == State::Disposed) {
        return;
    }

    m_active = active;
    if (!hasSurface() || !m_host) {
        return;
    }

    if (active) {
        m_state = State::Visible;
        m_host->showSurface(m_sessionId);
        // The layout may have moved while hidden
        pushBounds(true);
    } else if (m_state != State::Hidden) {
        m_state = State::Hidden;
        m_host->hideSurface(m_sessionId);
    }
}

void OverlaySurfaceCoordinator::setPlaceholderGeometry(const QRectF &rectInWindow, const QPointF &windowOrigin, qreal scale)
{
    if (m_state == State::Disposed) {
        return;
    }

    if (scale <= 0) {
        scale = 1.0;
    }

    SurfaceBounds bounds;
    bounds.x = windowOrigin.x() / scale + rectInWindow.x();
    bounds.y = windowOrigin.y() / scale + rectInWindow.y();
    bounds.width = rectInWindow.width();
    bounds.height = rectInWindow.height();
    m_bounds = bounds;

    if (m_state == State::Visible) {
        pushBounds(false);
    }
}

void OverlaySurfaceCoordinator::pushBounds(bool force)
{
    if (m_bounds.isEmpty() || !m_host) {
        return;
    }
    if (!force && m_bounds == m_pushedBounds) {
        return;
    }

    m_pushedBounds = m_bounds;
    const QString sessionId = m_sessionId;
    m_host->updateSurfaceBounds(sessionId, m_bounds, [sessionId](const HostReply &reply) {
        if (!reply.ok) {
            qWarning() << "OverlaySurfaceCoordinator: Bounds update failed for" << sessionId << ":" << reply.error;
        }
    });
}

void OverlaySurfaceCoordinator::dispose()
{
    if (m_state == State::Disposed) {
        return;
    }

    const State previous = m_state;
    m_state = State::Disposed;
    m_queuedUrl.clear();

    if (m_host) {
        disconnect(m_host, nullptr, this, nullptr);
        if (previous == State::Visible || previous == State::Hidden) {
            const QString sessionId = m_sessionId;
            m_host->closeSurface(sessionId, [sessionId](const HostReply &reply) {
                if (!reply.ok) {
                    qWarning() << "OverlaySurfaceCoordinator: Close failed for" << sessionId << ":" << reply.error;
                }
            });
        } else if (previous == State::Creating) {
            m_closeWhenCreated = true;
        }
    }

    qDebug() << "OverlaySurfaceCoordinator: Disposed" << m_sessionId;
}

void OverlaySurfaceCoordinator::onAddressChanged(const QString &sessionId, const QString &url)
{
    if (sessionId != m_sessionId || m_state == State::Disposed || url.isEmpty()) {
        return;
    }

    m_history.addressChanged(url);
    m_currentUrl = url;
    Q_EMIT navigationStateChanged();
}

void OverlaySurfaceCoordinator::onLoadingStateChanged(const QString &sessionId, bool isLoading)
{
    if (sessionId != m_sessionId || m_state == State::Disposed || m_isLoading == isLoading) {
        return;
    }

    m_isLoading = isLoading;
    Q_EMIT navigationStateChanged();
}

void OverlaySurfaceCoordinator::setError(const QString &message)
{
    m_errorMessage = message.isEmpty() ? QStringLiteral("Unknown error") : message;
    Q_EMIT errorOccurred(m_errorMessage);
    Q_EMIT navigationStateChanged();
}

void OverlaySurfaceCoordinator::clearError()
{
    if (m_errorMessage.isEmpty()) {
        return;
    }
    m_errorMessage.clear();
    Q_EMIT navigationStateChanged();
}

} // namespace Workdeck

#include "moc_OverlaySurfaceCoordinator.cpp"
