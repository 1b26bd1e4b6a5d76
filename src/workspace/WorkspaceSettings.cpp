/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceSettings.h"

#include "LocalSocketHostBridge.h"

#include <KConfigGroup>

namespace Workdeck
{

static const WorkspaceConfig Defaults;

static int positiveOr(int value, int fallback)
{
    return value > 0 ? value : fallback;
}

WorkspaceSettings::WorkspaceSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    // ~/.config/workdeckrc
    m_config = KSharedConfig::openConfig(configName);
}

WorkspaceSettings::~WorkspaceSettings()
{
    save();
}

WorkspaceConfig WorkspaceSettings::config() const
{
    WorkspaceConfig config;
    config.pollIntervalMs = pollIntervalMs();
    config.exportLineLimit = exportLineLimit();
    config.scrollback = scrollback();
    config.defaultColumns = defaultColumns();
    config.defaultRows = defaultRows();
    config.socketPath = socketPath();
    return config;
}

QString WorkspaceSettings::defaultProfileId() const
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    return group.readEntry("DefaultProfile", QString());
}

void WorkspaceSettings::setDefaultProfileId(const QString &id)
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    group.writeEntry("DefaultProfile", id);
    Q_EMIT settingsChanged();
}

int WorkspaceSettings::pollIntervalMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    return positiveOr(group.readEntry("PollIntervalMs", Defaults.pollIntervalMs), Defaults.pollIntervalMs);
}

void WorkspaceSettings::setPollIntervalMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    group.writeEntry("PollIntervalMs", ms);
    Q_EMIT settingsChanged();
}

int WorkspaceSettings::exportLineLimit() const
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    return positiveOr(group.readEntry("ExportLineLimit", Defaults.exportLineLimit), Defaults.exportLineLimit);
}

void WorkspaceSettings::setExportLineLimit(int lines)
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    group.writeEntry("ExportLineLimit", lines);
    Q_EMIT settingsChanged();
}

int WorkspaceSettings::scrollback() const
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    const int lines = group.readEntry("Scrollback", Defaults.scrollback);
    return lines >= 0 ? lines : Defaults.scrollback;
}

void WorkspaceSettings::setScrollback(int lines)
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    group.writeEntry("Scrollback", lines);
    Q_EMIT settingsChanged();
}

int WorkspaceSettings::defaultColumns() const
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    return positiveOr(group.readEntry("DefaultColumns", Defaults.defaultColumns), Defaults.defaultColumns);
}

int WorkspaceSettings::defaultRows() const
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    return positiveOr(group.readEntry("DefaultRows", Defaults.defaultRows), Defaults.defaultRows);
}

void WorkspaceSettings::setDefaultGeometry(int columns, int rows)
{
    KConfigGroup group(m_config, QStringLiteral("Terminal"));
    group.writeEntry("DefaultColumns", columns);
    group.writeEntry("DefaultRows", rows);
    Q_EMIT settingsChanged();
}

QString WorkspaceSettings::socketPath() const
{
    KConfigGroup group(m_config, QStringLiteral("Host"));
    const QString path = group.readEntry("SocketPath", QString());
    return path.isEmpty() ? LocalSocketHostBridge::defaultSocketPath() : path;
}

void WorkspaceSettings::setSocketPath(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Host"));
    group.writeEntry("SocketPath", path);
    Q_EMIT settingsChanged();
}

QString WorkspaceSettings::loadDefaultProfileId() const
{
    return defaultProfileId();
}

void WorkspaceSettings::saveDefaultProfileId(const QString &id)
{
    setDefaultProfileId(id);
    save();
}

void WorkspaceSettings::save()
{
    m_config->sync();
}

} // namespace Workdeck

#include "moc_WorkspaceSettings.cpp"
