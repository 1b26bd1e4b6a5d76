/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef OVERLAYSURFACECOORDINATOR_H
#define OVERLAYSURFACECOORDINATOR_H

#include "workdeckprivate_export.h"

#include "HostBridge.h"
#include "NavigationHistory.h"

#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QRectF>
#include <QString>

namespace Workdeck
{

/**
 * OverlaySurfaceCoordinator drives the host-native web surface of one
 * browser session.
 *
 * The surface is created lazily by the first navigate(), positioned over a
 * placeholder region of the panel, shown while the tab is active and hidden
 * otherwise. dispose() closes it; after that every call and every late host
 * reply is ignored.
 */
class WORKDECKPRIVATE_EXPORT OverlaySurfaceCoordinator : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Uninitialized, // No surface yet
        Creating, // surface.create in flight
        Visible,
        Hidden,
        Disposed,
    };
    Q_ENUM(State)

    OverlaySurfaceCoordinator(HostBridge *host, const QString &sessionId, QObject *parent = nullptr);
    ~OverlaySurfaceCoordinator() override;

    /**
     * Turn address-bar input into a URL: http(s) URLs are kept, host-like
     * input gets https://, anything else becomes a web search.
     */
    static QString formatAddress(const QString &input);

    /**
     * Navigate to @p input (normalized with formatAddress()). Creates the
     * surface on first use.
     */
    void navigate(const QString &input);

    bool goBack();
    bool goForward();
    void reload();

    /**
     * @return the new favorite state
     */
    bool toggleFavorite();

    void setFavorite(bool favorite);

    /**
     * Show (true) or hide (false) the surface with its tab
     */
    void setActive(bool active);

    /**
     * Position of the placeholder.
     *
     * @param rectInWindow Placeholder rectangle in window-logical coordinates
     * @param windowOrigin Window position in physical screen pixels
     * @param scale Device pixel ratio of the window
     */
    void setPlaceholderGeometry(const QRectF &rectInWindow, const QPointF &windowOrigin, qreal scale);

    /**
     * Close the surface. Idempotent.
     */
    void dispose();

    QString sessionId() const
    {
        return m_sessionId;
    }

    State state() const
    {
        return m_state;
    }

    bool isSurfaceCreated() const
    {
        return m_surfaceCreated;
    }

    bool isActive() const
    {
        return m_active;
    }

    QString currentUrl() const
    {
        return m_currentUrl;
    }

    const NavigationHistory &history() const
    {
        return m_history;
    }

    bool canGoBack() const
    {
        return m_history.canGoBack();
    }

    bool canGoForward() const
    {
        return m_history.canGoForward();
    }

    bool isLoading() const
    {
        return m_isLoading;
    }

    bool isFavorite() const
    {
        return m_isFavorite;
    }

    QString errorMessage() const
    {
        return m_errorMessage;
    }

    /**
     * Screen-absolute logical bounds last computed from the placeholder
     */
    SurfaceBounds bounds() const
    {
        return m_bounds;
    }

Q_SIGNALS:
    void surfaceCreated();

    /**
     * Address, history, loading, favorite or error state changed
     */
    void navigationStateChanged();

    void errorOccurred(const QString &message);

private Q_SLOTS:
    void onAddressChanged(const QString &sessionId, const QString &url);
    void onLoadingStateChanged(const QString &sessionId, bool isLoading);

private:
    void createSurface(const QString &url);
    void sendNavigate(const QString &url);
    void pushBounds(bool force);
    void setError(const QString &message);
    void clearError();
    bool hasSurface() const
    {
        return m_state == State::Visible || m_state == State::Hidden;
    }

    QPointer<HostBridge> m_host;
    QString m_sessionId;
    State m_state = State::Uninitialized;

    NavigationHistory m_history;
    QString m_currentUrl;
    QString m_queuedUrl; // Latest navigation requested while creating

    bool m_surfaceCreated = false;
    bool m_closeWhenCreated = false; // Disposed while creating
    bool m_active = false;
    bool m_isLoading = false;
    bool m_isFavorite = false;
    QString m_errorMessage;

    SurfaceBounds m_bounds;
    SurfaceBounds m_pushedBounds;
};

} // namespace Workdeck

#endif // OVERLAYSURFACECOORDINATOR_H
