/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACESESSION_H
#define WORKSPACESESSION_H

#include "workdeckprivate_export.h"

#include <QDateTime>
#include <QMetaType>
#include <QString>

#include <optional>
#include <variant>

namespace Workdeck
{

/**
 * Kind of a workspace session. Mirrors the alternatives of SessionPayload.
 */
enum class SessionKind {
    Terminal,
    Browser,
    Editor,
    Logging,
};

/**
 * Terminal session. The shell itself is tracked by the host, keyed by the session id.
 */
struct WORKDECKPRIVATE_EXPORT TerminalPayload {
    QString profileId; // Shell profile used at creation (empty = host default)
    QString lastCommand; // Last non-empty input line submitted to the shell
};

/**
 * Embedded browser session backed by a host-native overlay surface.
 */
struct WORKDECKPRIVATE_EXPORT BrowserPayload {
    QString url; // Last known address
    int historyIndex = -1; // -1 until the first navigation
    bool isFavorite = false;
    bool surfaceCreated = false;
    bool isLoading = false;
    QString errorMessage;
};

/**
 * Text editor session.
 */
struct WORKDECKPRIVATE_EXPORT EditorPayload {
    QString filePath;
    std::optional<QString> content; // Preloaded content, if any
    bool hasUnsavedChanges = false;
};

/**
 * Time bounds of a log query. Invalid QDateTime means unbounded.
 */
struct WORKDECKPRIVATE_EXPORT TimeRange {
    QDateTime from;
    QDateTime to;
};

/**
 * Log-query session.
 */
struct WORKDECKPRIVATE_EXPORT LoggingPayload {
    std::optional<QString> query;
    TimeRange timeRange;
};

using SessionPayload = std::variant<TerminalPayload, BrowserPayload, EditorPayload, LoggingPayload>;

/**
 * Helper for exhaustive std::visit over SessionPayload.
 */
template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/**
 * WorkspaceSession is one tab of the workspace panel.
 *
 * Identity (id, createdAt) never changes after creation; the name and the
 * kind-specific payload are mutated through SessionRegistry.
 */
struct WORKDECKPRIVATE_EXPORT WorkspaceSession {
    QString id;
    QString name;
    QDateTime createdAt;
    SessionPayload payload;

    SessionKind kind() const;

    bool isValid() const
    {
        return !id.isEmpty();
    }

    /**
     * Typed access to the payload; nullptr if the session is of another kind.
     */
    template<typename T>
    const T *as() const
    {
        return std::get_if<T>(&payload);
    }
};

/**
 * Kind of a payload alternative.
 */
WORKDECKPRIVATE_EXPORT SessionKind kindOf(const SessionPayload &payload);

/**
 * Untranslated identifier of a kind ("terminal", "browser", ...), used in logs and requests.
 */
WORKDECKPRIVATE_EXPORT QString kindId(SessionKind kind);

/**
 * Parse a kind identifier. Returns std::nullopt for unknown strings.
 */
WORKDECKPRIVATE_EXPORT std::optional<SessionKind> parseKind(const QString &id);

/**
 * Translated display label for a kind ("Terminal", "Browser", ...).
 */
WORKDECKPRIVATE_EXPORT QString kindLabel(SessionKind kind);

} // namespace Workdeck

Q_DECLARE_METATYPE(Workdeck::SessionKind)

#endif // WORKSPACESESSION_H
