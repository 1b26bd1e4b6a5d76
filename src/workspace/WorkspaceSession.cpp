/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceSession.h"

#include <KLocalizedString>

namespace Workdeck
{

SessionKind WorkspaceSession::kind() const
{
    return kindOf(payload);
}

SessionKind kindOf(const SessionPayload &payload)
{
    return std::visit(Overloaded{
                          [](const TerminalPayload &) {
                              return SessionKind::Terminal;
                          },
                          [](const BrowserPayload &) {
                              return SessionKind::Browser;
                          },
                          [](const EditorPayload &) {
                              return SessionKind::Editor;
                          },
                          [](const LoggingPayload &) {
                              return SessionKind::Logging;
                          },
                      },
                      payload);
}

QString kindId(SessionKind kind)
{
    switch (kind) {
    case SessionKind::Terminal:
        return QStringLiteral("terminal");
    case SessionKind::Browser:
        return QStringLiteral("browser");
    case SessionKind::Editor:
        return QStringLiteral("editor");
    case SessionKind::Logging:
        return QStringLiteral("logging");
    }
    return QString();
}

std::optional<SessionKind> parseKind(const QString &id)
{
    const QString lower = id.trimmed().toLower();
    if (lower == QLatin1String("terminal")) {
        return SessionKind::Terminal;
    }
    if (lower == QLatin1String("browser")) {
        return SessionKind::Browser;
    }
    if (lower == QLatin1String("editor")) {
        return SessionKind::Editor;
    }
    if (lower == QLatin1String("logging") || lower == QLatin1String("logs")) {
        return SessionKind::Logging;
    }
    return std::nullopt;
}

QString kindLabel(SessionKind kind)
{
    switch (kind) {
    case SessionKind::Terminal:
        return i18n("Terminal");
    case SessionKind::Browser:
        return i18n("Browser");
    case SessionKind::Editor:
        return i18n("Editor");
    case SessionKind::Logging:
        return i18n("Logs");
    }
    return QString();
}

} // namespace Workdeck
