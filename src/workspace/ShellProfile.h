/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SHELLPROFILE_H
#define SHELLPROFILE_H

#include "workdeckprivate_export.h"

#include <QJsonValue>
#include <QList>
#include <QString>

#include <optional>

namespace Workdeck
{

/**
 * A shell the host can spawn
 */
struct WORKDECKPRIVATE_EXPORT ShellProfile {
    QString id;
    QString name;
    QString path;
    bool isDefault = false;

    static ShellProfile fromJson(const QJsonValue &value);

    bool isValid() const
    {
        return !id.isEmpty();
    }
};

/**
 * Result of terminal.listProfiles
 */
struct WORKDECKPRIVATE_EXPORT ProfileList {
    QList<ShellProfile> profiles;
    QString defaultId; // Host's own default, may be empty

    static ProfileList fromJson(const QJsonValue &value);

    std::optional<ShellProfile> find(const QString &id) const;

    bool isEmpty() const
    {
        return profiles.isEmpty();
    }
};

/**
 * Pick the profile new terminals use.
 *
 * A saved id that is still offered wins; otherwise the host default
 * (defaultId, then the first profile flagged isDefault); otherwise the first
 * profile. Empty if the list is empty.
 */
WORKDECKPRIVATE_EXPORT QString resolveDefaultProfile(const ProfileList &list, const QString &savedId);

/**
 * Command syntax of a shell
 */
enum class ShellDialect {
    Posix,
    Cmd,
    PowerShell,
};

/**
 * Guess the dialect from a shell path. Empty or unknown paths are POSIX.
 */
WORKDECKPRIVATE_EXPORT ShellDialect dialectForShell(const QString &shellPath);

/**
 * Kubernetes context exported into new terminals
 */
struct WORKDECKPRIVATE_EXPORT ClusterContext {
    QString name;
    QString kubeconfigPath; // Optional

    bool isValid() const
    {
        return !name.isEmpty();
    }
};

/**
 * Single environment assignment in @p dialect syntax, e.g. export N='v'
 */
WORKDECKPRIVATE_EXPORT QString environmentAssignment(ShellDialect dialect, const QString &name, const QString &value);

/**
 * Prefix @p userCommand with the KUBECONFIG / KUBECONTEXT assignments of
 * @p context. Returns @p userCommand unchanged when the context is invalid.
 */
WORKDECKPRIVATE_EXPORT QString buildInitialCommand(ShellDialect dialect, const ClusterContext &context, const QString &userCommand);

} // namespace Workdeck

#endif // SHELLPROFILE_H
