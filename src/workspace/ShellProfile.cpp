/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ShellProfile.h"

#include <QFileInfo>
#include <QJsonArray>
#include <QJsonObject>
#include <QStringList>

namespace Workdeck
{

ShellProfile ShellProfile::fromJson(const QJsonValue &value)
{
    const QJsonObject obj = value.toObject();
    ShellProfile profile;
    profile.id = obj.value(QStringLiteral("id")).toString();
    profile.name = obj.value(QStringLiteral("name")).toString();
    profile.path = obj.value(QStringLiteral("path")).toString();
    profile.isDefault = obj.value(QStringLiteral("isDefault")).toBool();
    if (profile.name.isEmpty()) {
        profile.name = profile.id;
    }
    return profile;
}

ProfileList ProfileList::fromJson(const QJsonValue &value)
{
    ProfileList list;
    const QJsonObject obj = value.toObject();
    const QJsonArray profiles = obj.value(QStringLiteral("profiles")).toArray();
    for (const QJsonValue &entry : profiles) {
        ShellProfile profile = ShellProfile::fromJson(entry);
        if (profile.isValid()) {
            list.profiles.append(profile);
        }
    }
    list.defaultId = obj.value(QStringLiteral("defaultId")).toString();
    return list;
}

std::optional<ShellProfile> ProfileList::find(const QString &id) const
{
    if (id.isEmpty()) {
        return std::nullopt;
    }
    for (const ShellProfile &profile : profiles) {
        if (profile.id == id) {
            return profile;
        }
    }
    return std::nullopt;
}

QString resolveDefaultProfile(const ProfileList &list, const QString &savedId)
{
    if (list.find(savedId)) {
        return savedId;
    }
    if (list.find(list.defaultId)) {
        return list.defaultId;
    }
    for (const ShellProfile &profile : list.profiles) {
        if (profile.isDefault) {
            return profile.id;
        }
    }
    if (!list.profiles.isEmpty()) {
        return list.profiles.first().id;
    }
    return QString();
}

ShellDialect dialectForShell(const QString &shellPath)
{
    // Host paths may come from Windows, so split on both separators
    QString program = shellPath.trimmed().toLower();
    program.replace(QLatin1Char('\\'), QLatin1Char('/'));
    program = QFileInfo(program).fileName();

    if (program.startsWith(QLatin1String("powershell")) || program.startsWith(QLatin1String("pwsh"))) {
        return ShellDialect::PowerShell;
    }
    if (program == QLatin1String("cmd") || program == QLatin1String("cmd.exe")) {
        return ShellDialect::Cmd;
    }
    return ShellDialect::Posix;
}

QString environmentAssignment(ShellDialect dialect, const QString &name, const QString &value)
{
    switch (dialect) {
    case ShellDialect::Posix: {
        QString quoted = value;
        quoted.replace(QLatin1Char('\''), QLatin1String("'\\''"));
        return QStringLiteral("export %1='%2'").arg(name, quoted);
    }
    case ShellDialect::Cmd: {
        // cmd.exe has no escape for a double quote inside set "..."
        QString stripped = value;
        stripped.remove(QLatin1Char('"'));
        return QStringLiteral("set \"%1=%2\"").arg(name, stripped);
    }
    case ShellDialect::PowerShell: {
        QString quoted = value;
        quoted.replace(QLatin1Char('\''), QLatin1String("''"));
        return QStringLiteral("$env:%1 = '%2'").arg(name, quoted);
    }
    }
    return QString();
}

QString buildInitialCommand(ShellDialect dialect, const ClusterContext &context, const QString &userCommand)
{
    const QString command = userCommand.trimmed();
    if (!context.isValid()) {
        return command;
    }

    QStringList parts;
    if (!context.kubeconfigPath.isEmpty()) {
        parts.append(environmentAssignment(dialect, QStringLiteral("KUBECONFIG"), context.kubeconfigPath));
    }
    parts.append(environmentAssignment(dialect, QStringLiteral("KUBECONTEXT"), context.name));
    if (!command.isEmpty()) {
        parts.append(command);
    }

    const QString separator = dialect == ShellDialect::PowerShell ? QStringLiteral("; ") : QStringLiteral(" && ");
    return parts.join(separator);
}

} // namespace Workdeck
